#pragma once

#include <covenant/schema/primitives.hpp>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace covenant::config {

struct block_input final {
  int64_t height{};
  covenant::schema::timestamp_seconds_t block_time{};
  std::vector<covenant::schema::bytes_t> txs;
};

/// Read `height time base64-tx` lines. Consecutive lines with the same height
/// form one block; heights must increase and share one time per block. Blank
/// lines and lines starting with '#' are ignored.
std::optional<std::vector<block_input>> read_blocks(std::istream& input,
                                                    std::string& error);

}  // namespace covenant::config
