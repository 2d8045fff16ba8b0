#include <boost/json.hpp>
#include <boost/program_options.hpp>

#include <algorithm>
#include <cstdlib>
#include <iostream>

#include "common_macros.hpp"
#include "conf/config_sources.hpp"
#include "conf/log_config.hpp"
#include "qbee_cli_entry.hpp"
#include "qbeecli_common.hpp"
#include "util/my_logging.hpp"

#ifndef QBEE_CLI_VERSION
#define QBEE_CLI_VERSION "0.0.0-dev"
#endif

namespace po = boost::program_options;

namespace {

void add_unique_path(std::vector<fs::path> &paths, const fs::path &candidate) {
  if (candidate.empty()) {
    return;
  }
  if (std::find(paths.begin(), paths.end(), candidate) == paths.end()) {
    paths.push_back(candidate);
  }
}

void show_usage(const po::options_description &desc) {
  std::cerr << "Usage: qbee-cli <subcommand> [options]" << std::endl
            << desc << std::endl
            << "Subcommands:" << std::endl
            << "  connect        Forward local ports to devices." << std::endl
            << "  term, shell    Open a terminal on a device." << std::endl
            << "  broker         HTTP broker for device web services."
            << std::endl
            << std::endl
            << "Run 'qbee-cli <subcommand> --help' for its options."
            << std::endl;
}

}  // namespace

int RunQbeeCliApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "--version" || arg == "version") {
      std::cout << QBEE_CLI_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("qbee-cli remote access");

    qbeecli::CliParams cli_params;
    std::vector<std::string> config_dirs_args;

    generic_desc.add_options()  //
        ("config-dirs",
         po::value<std::vector<std::string>>(&config_dirs_args)
             ->multitoken()
             ->composing(),
         "paths of the configuration directories.")  //
        ("verbose",
         po::value<std::string>(&cli_params.verbose)->default_value("info"),
         "verbosity level, like info, debug, trace, vvvv.")  //
        ("silent", po::bool_switch(&cli_params.silent)->default_value(false),
         "suppress all console output.")  //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options()  //
        ("positionals",
         po::value<std::vector<std::string>>()->default_value({}, ""),
         "all positional arguments");

    po::options_description cmdline_options("Allowed options");
    cmdline_options.add(generic_desc).add(hidden_desc);

    po::positional_options_description p;
    p.add("positionals", -1);

    po::parsed_options parsed = po::command_line_parser(argc, argv)
                                    .options(cmdline_options)
                                    .positional(p)
                                    .allow_unregistered()
                                    .run();
    po::store(parsed, vm);
    po::notify(vm);

    std::vector<std::string> positionals =
        vm["positionals"].as<std::vector<std::string>>();
    if (!positionals.empty()) {
      cli_params.subcmd = positionals[0];
    }
    std::vector<std::string> unrecognized = po::collect_unrecognized(
        parsed.options, po::collect_unrecognized_mode::include_positional);
    qbeecli::normalize_cli_subcommand(cli_params.subcmd, positionals);

    if (vm.count("help") && !qbeecli::is_known_subcommand(cli_params.subcmd)) {
      show_usage(generic_desc);
      return EXIT_SUCCESS;
    }
    if (cli_params.subcmd.empty()) {
      show_usage(generic_desc);
      return EXIT_FAILURE;
    }

    std::vector<fs::path> ordered_config_dirs;
    for (const auto &dir : qbeecli::ConfigSources::default_paths()) {
      add_unique_path(ordered_config_dirs, dir);
    }
    for (const auto &dir_str : config_dirs_args) {
      fs::path config_dir(dir_str);
      if (!fs::exists(config_dir)) {
        throw std::runtime_error("Config directory does not exist: " +
                                 config_dir.string());
      }
      add_unique_path(ordered_config_dirs, config_dir);
    }
    cli_params.config_dirs = ordered_config_dirs;

    static qbeecli::ConfigSources config_sources(cli_params.config_dirs);
    {
      qbeecli::LoggingConfig logging_config;
      if (auto jv = config_sources.json_content("log_config")) {
        DEBUG_PRINT("log config: " << *jv);
        logging_config = boost::json::value_to<qbeecli::LoggingConfig>(*jv);
      }
      if (auto dir = qbeecli::env_value("QBEE_LOG_DIR")) {
        logging_config.log_dir = *dir;
      }
      init_my_log(logging_config);
    }
    QBEE_VERBOSE_LOG("qbee-cli " << QBEE_CLI_VERSION << " subcommand "
                                 << cli_params.subcmd);

    static qbeecli::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                                   std::move(unrecognized),
                                   std::move(cli_params));

    return qbeecli::launch<qbeecli::type_tags::PosixTag>(config_sources,
                                                         cli_ctx);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunQbeeCliApplication(argc, argv); }
