#include <boost/json.hpp>
#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "conf/datasource_config.hpp"
#include "engine/datasource.hpp"
#include "handlers/datasource_handlers.hpp"
#include "sshprom_common.hpp"
#include "util/my_logging.hpp"

#ifndef SSHPROM_VERSION
#define SSHPROM_VERSION "0.0.0"
#endif

namespace {

fs::path get_env_path(const char *name) {
  if (const char *value = std::getenv(name); value && *value) {
    return fs::path(value);
  }
  return {};
}

void show_usage(const po::options_description &desc) {
  std::cerr << "Usage: sshprom [options] <subcommand> [args]" << std::endl
            << desc << std::endl
            << "Subcommands:" << std::endl;
  for (const auto &sub : sshprom::DatasourceSubcommands()) {
    std::string head = fmt::format("{} {}", sub.name, sub.args);
    if (head.size() > 28) {
      std::cerr << "  " << head << std::endl << fmt::format("  {:<29}", "");
    } else {
      std::cerr << fmt::format("  {:<29}", head);
    }
    std::cerr << sub.summary << std::endl;
  }
  std::cerr << std::endl
            << "SSHPROM_CONFIG names the config file when --config is absent."
            << std::endl;
}

} // namespace

int RunSshpromApplication(int argc, char *argv[]) {
  for (int i = 1; i < argc; ++i) {
    std::string arg(argv[i]);
    if (arg == "-v" || arg == "--version" || arg == "version") {
      std::cout << SSHPROM_VERSION << std::endl;
      return EXIT_SUCCESS;
    }
  }

  try {
    po::variables_map vm;
    po::options_description generic_desc("sshprom options");

    sshprom::CliParams cli_params;
    std::string config_arg;
    std::string log_dir_arg;

    generic_desc.add_options() //
        ("config,c", po::value<std::string>(&config_arg)->value_name("FILE"),
         "datasource config file: {\"jsonData\": {...}, "
         "\"secureJsonData\": {...}}") //
        ("verbose",
         po::value<std::string>(&cli_params.verbose)->default_value("warning"),
         "log level: trace, debug, info, warning, error, fatal.") //
        ("log-dir", po::value<std::string>(&log_dir_arg)->value_name("DIR"),
         "also write rotating log files into DIR.") //
        ("help,h", "Print help");

    po::options_description hidden_desc("Hidden options");
    hidden_desc.add_options() //
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

    if (vm.count("help") || cli_params.subcmd.empty()) {
      show_usage(generic_desc);
      return vm.count("help") ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    cli_params.config_file =
        config_arg.empty() ? get_env_path("SSHPROM_CONFIG") : fs::path(config_arg);
    if (cli_params.config_file.empty()) {
      std::cerr << "No datasource config given; pass --config or set "
                   "SSHPROM_CONFIG."
                << std::endl;
      return EXIT_FAILURE;
    }
    cli_params.log_dir = log_dir_arg;

    sshprom::LoggingConfig logging_config;
    logging_config.level = cli_params.verbose;
    logging_config.log_dir = cli_params.log_dir.string();
    sshprom::init_my_log(logging_config);

    auto config_provider =
        std::make_shared<sshprom::DatasourceConfigProviderFile>(
            cli_params.config_file);

    sshprom::CliCtx cli_ctx(std::move(vm), std::move(positionals),
                            std::move(unrecognized), std::move(cli_params));

    sshprom::Datasource datasource(config_provider);
    auto factory =
        sshprom::MakeDatasourceHandlerFactory(datasource, cli_ctx, std::cout);
    auto handler = factory->create(cli_ctx.params.subcmd);
    if (!handler) {
      std::cerr << "Unknown subcommand '" << cli_ctx.params.subcmd << "'"
                << std::endl;
      show_usage(generic_desc);
      return EXIT_FAILURE;
    }
    const int rc = handler->start();
    datasource.Dispose();
    return rc;
  } catch (const std::exception &e) {
    std::cerr << "error catched on main: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }
}

int main(int argc, char *argv[]) { return RunSshpromApplication(argc, argv); }
