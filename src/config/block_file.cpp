#include <covenant/config/block_file.hpp>
#include <sstream>

namespace covenant::config {

std::optional<std::vector<block_input>> read_blocks(std::istream& input,
                                                    std::string& error) {
  auto blocks = std::vector<block_input>{};
  auto line = std::string{};
  auto line_number = size_t{0};
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    auto fields = std::istringstream{line};
    auto height = int64_t{};
    auto block_time = covenant::schema::timestamp_seconds_t{};
    auto encoded = std::string{};
    if (!(fields >> height >> block_time >> encoded) || height <= 0) {
      error = "line " + std::to_string(line_number) +
              ": expected 'height time base64-tx'";
      return std::nullopt;
    }
    auto tx = covenant::schema::try_from_base64(encoded);
    if (!tx) {
      error = "line " + std::to_string(line_number) + ": invalid base64";
      return std::nullopt;
    }

    if (!blocks.empty() && blocks.back().height == height) {
      if (blocks.back().block_time != block_time) {
        error = "line " + std::to_string(line_number) +
                ": block time differs within block";
        return std::nullopt;
      }
      blocks.back().txs.push_back(std::move(*tx));
      continue;
    }
    if (!blocks.empty() && height <= blocks.back().height) {
      error = "line " + std::to_string(line_number) +
              ": heights must increase";
      return std::nullopt;
    }
    blocks.push_back(block_input{
        .height = height, .block_time = block_time, .txs = {std::move(*tx)}});
  }
  return blocks;
}

}  // namespace covenant::config
