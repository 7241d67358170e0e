#pragma once
#include <blake3.h>
#include <covenant/schema/primitives.hpp>
#include <string_view>

namespace covenant::blake3 {

// Incremental BLAKE3. Feeding pieces through update() yields the same digest
// as hashing their concatenation.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const covenant::schema::bytes_view_t& bytes);
  covenant::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

covenant::schema::hash32_t hash(const std::string_view& str);
covenant::schema::hash32_t hash(const covenant::schema::bytes_view_t& bytes);

}  // namespace covenant::blake3
