#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <covenant/config/block_file.hpp>
#include <covenant/config/options.hpp>
#include <covenant/execution/engine.hpp>
#include <covenant/storage/rocksdb/storage.hpp>
#include <fstream>
#include <iostream>
#include <string>

namespace {

void install_logger(const covenant::config::daemon_options& options) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      options.log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "covenant", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  spdlog::set_default_logger(logger);
  spdlog::set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::info);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto error = std::string{};
  auto options = covenant::config::parse_daemon_options(argc, argv, error);
  if (!options) {
    std::cerr << "covenantd: " << error << '\n'
              << covenant::config::make_options_description() << std::endl;
    return 1;
  }
  if (options->help) {
    std::cout << covenant::config::make_options_description() << std::endl;
    return 0;
  }

  install_logger(*options);

  auto encoder = covenant::execution::encoder_t{};
  auto storage =
      covenant::storage::make_storage<covenant::storage::rocksdb_storage_tag>(
          options->db_path);
  auto engine =
      covenant::execution::engine{encoder, storage, options->engine};

  auto info = engine.info();
  spdlog::info("Chain id {}", covenant::schema::to_hex(engine.chain_id()));
  spdlog::info("Last committed height {} state root {}", info.last_block_height,
               covenant::schema::to_hex(info.last_block_state_root));

  if (options->blocks_file.empty()) {
    spdlog::info("No block input given; nothing to execute");
    spdlog::shutdown();
    return 0;
  }

  auto input = std::ifstream{options->blocks_file};
  if (!input) {
    spdlog::error("Cannot open block input {}", options->blocks_file);
    spdlog::shutdown();
    return 1;
  }
  auto blocks = covenant::config::read_blocks(input, error);
  if (!blocks) {
    spdlog::error("Invalid block input {}: {}", options->blocks_file, error);
    spdlog::shutdown();
    return 1;
  }

  for (const auto& block : *blocks) {
    if (block.height <= engine.info().last_block_height) {
      spdlog::warn("Skipping block {}: already committed", block.height);
      continue;
    }
    auto result = engine.finalize_block(block.height, block.block_time,
                                        block.txs);
    for (size_t i = 0; i < result.tx_results.size(); ++i) {
      const auto& tx_result = result.tx_results[i];
      if (tx_result.code == 0) {
        spdlog::info("Block {} tx {}: ok ({} event(s))", block.height, i,
                     tx_result.events.size());
      } else {
        spdlog::info("Block {} tx {}: {} [{}] {}", block.height, i,
                     tx_result.log, tx_result.codespace, tx_result.info);
      }
    }
    auto committed = engine.commit();
    spdlog::info("Block {} committed, state root {}",
                 committed.committed_height,
                 covenant::schema::to_hex(committed.state_root));
  }

  spdlog::shutdown();
  return 0;
}
