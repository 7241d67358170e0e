#include <covenant/common/critical.hpp>
#include <covenant/schema/primitives.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <iterator>
#include <string_view>

namespace covenant::schema {

namespace {

constexpr auto kHexDigits = std::string_view{"0123456789abcdef"};
constexpr auto kBase64Alphabet = std::string_view{
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

// Reverse table for one alphabet; -1 marks characters outside it.
constexpr std::array<int8_t, 256> make_reverse_table(
    const std::string_view alphabet,
    const bool fold_case) {
  auto table = std::array<int8_t, 256>{};
  table.fill(-1);
  for (std::size_t i = 0; i < alphabet.size(); ++i) {
    auto ch = static_cast<uint8_t>(alphabet[i]);
    table[ch] = static_cast<int8_t>(i);
    if (fold_case && ch >= 'a' && ch <= 'z') {
      table[ch - 'a' + 'A'] = static_cast<int8_t>(i);
    }
  }
  return table;
}

constexpr auto kHexLookup = make_reverse_table(kHexDigits, true);
constexpr auto kBase64Lookup = make_reverse_table(kBase64Alphabet, false);

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    covenant::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    covenant::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(decoded->begin(), decoded->end(), hash.begin());
  return hash;
}

hash32_t make_zero_hash() {
  return {};
}

bool is_null(const account_id_t& account) {
  return std::all_of(std::begin(account), std::end(account),
                     [](const uint8_t value) { return value == 0; });
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHexDigits[byte >> 4u]);
    out.push_back(kHexDigits[byte & 0x0Fu]);
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    auto high = kHexLookup[static_cast<uint8_t>(hex[i])];
    auto low = kHexLookup[static_cast<uint8_t>(hex[i + 1])];
    if (high < 0 || low < 0) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((high << 4) | low));
  }
  return decoded;
}

std::string to_base64(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  // Only the low `bits` bits of the accumulator are pending output.
  auto accumulator = uint32_t{0};
  auto bits = 0u;
  for (const auto byte : bytes) {
    accumulator = (accumulator << 8u) | byte;
    bits += 8;
    while (bits >= 6) {
      bits -= 6;
      out.push_back(kBase64Alphabet[(accumulator >> bits) & 0x3Fu]);
    }
  }
  if (bits > 0) {
    out.push_back(kBase64Alphabet[(accumulator << (6 - bits)) & 0x3Fu]);
  }
  while ((out.size() % 4) != 0) {
    out.push_back('=');
  }
  return out;
}

std::optional<bytes_t> try_from_base64(const std::string_view encoded) {
  auto out = bytes_t{};
  out.reserve((encoded.size() / 4) * 3);

  auto accumulator = uint32_t{0};
  auto bits = 0u;
  auto symbols = std::size_t{0};
  auto padding = std::size_t{0};
  for (const auto ch : encoded) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    ++symbols;
    if (ch == '=') {
      ++padding;
      continue;
    }
    auto value = kBase64Lookup[static_cast<uint8_t>(ch)];
    if (padding > 0 || value < 0) {
      return std::nullopt;
    }
    accumulator = (accumulator << 6u) | static_cast<uint32_t>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<uint8_t>((accumulator >> bits) & 0xFFu));
    }
  }

  if ((symbols % 4) != 0 || padding > 2) {
    return std::nullopt;
  }
  return out;
}

amount_t apply_basis_points(const amount_t& amount, const basis_points_t bps) {
  return (amount * amount_t{bps}) / amount_t{kBasisPointsDenominator};
}

}  // namespace covenant::schema
