#include <covenant/blake3/hash.hpp>

namespace covenant::blake3 {

hasher::hasher() : state_{} {
  blake3_hasher_init(&state_);
}

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const covenant::schema::bytes_view_t& bytes) {
  blake3_hasher_update(&state_, bytes.data(), bytes.size());
  return *this;
}

covenant::schema::hash32_t hasher::finalize() const {
  auto output = covenant::schema::hash32_t{};
  blake3_hasher_finalize(&state_, output.data(), output.size());
  return output;
}

covenant::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

covenant::schema::hash32_t hash(const covenant::schema::bytes_view_t& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace covenant::blake3
