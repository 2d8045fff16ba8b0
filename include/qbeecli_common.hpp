#pragma once

#include <boost/program_options.hpp>

#include <algorithm>
#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "common_macros.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace qbeecli {

struct CliParams {
  std::vector<fs::path> config_dirs;
  std::string subcmd;
  std::string verbose;  // info, debug, trace or vvvv
  bool silent = false;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  // Everything the global parser did not know; subcommands parse their own
  // options from here.
  std::vector<std::string> unrecognized;
  CliParams params;

  CliCtx(po::variables_map &&vm, std::vector<std::string> &&positionals,
         std::vector<std::string> &&unrecognized, CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        unrecognized(std::move(unrecognized)), params(std::move(params_)) {}

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty() || params.verbose == "info") {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }
  ~CliCtx() { DEBUG_PRINT("CliCtx destroyed"); }
};

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 4> kKnown{
      "connect", "term", "shell", "broker"};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

// Moves the first known subcommand among the positionals to `subcmd`.
inline void normalize_cli_subcommand(std::string &subcmd,
                                     std::vector<std::string> &positionals) {
  if (is_known_subcommand(subcmd)) {
    return;
  }
  auto it = std::find_if(positionals.begin(), positionals.end(),
                         [](const std::string &p) {
                           return is_known_subcommand(p);
                         });
  if (it != positionals.end()) {
    subcmd = *it;
  }
}

}  // namespace qbeecli
