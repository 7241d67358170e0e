#pragma once

#include <boost/program_options.hpp>
#include <covenant/execution/engine_options.hpp>
#include <optional>
#include <string>

namespace covenant::config {

/// Settings of the covenantd daemon.
struct daemon_options final {
  std::string db_path{"covenant-data"};
  std::string blocks_file;
  std::string log_file{"covenant.log"};
  bool verbose{false};
  bool help{false};
  covenant::execution::engine_options engine;
};

boost::program_options::options_description make_options_description();

/// Parse the command line and, when `--config` names one, an INI file.
/// Command line values take precedence over the file. Returns std::nullopt
/// and sets `error` on invalid input.
std::optional<daemon_options> parse_daemon_options(int argc,
                                                   const char* const argv[],
                                                   std::string& error);

}  // namespace covenant::config
