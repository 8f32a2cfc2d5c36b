#include "client_id_entry.hpp"

#include <boost/asio/thread_pool.hpp>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "analytics/analytics_client.hpp"
#include "analytics/analytics_dispatcher.hpp"
#include "clientid_common.hpp"
#include "conf/clientid_config.hpp"
#include "handlers/client_id_handlers.hpp"
#include "identity/client_identity_manager.hpp"
#include "identity/data_dir_resolver.hpp"
#include "util/my_logging.hpp"
#include "version.h"

namespace {

constexpr int kExitUsage = 2;

void show_usage(std::ostream &os) {
  clientid::CliParams params;
  std::string config_dir_arg;
  std::string data_dir_arg;
  os << "Usage: client-id [get|path|version] [options]" << std::endl << std::endl;
  os << clientid::make_generic_options(params, config_dir_arg, data_dir_arg)
     << std::endl;
  os << "Subcommands:" << std::endl
     << "  get   Print the installation identifier, creating it on first run "
        "(default)."
     << std::endl
     << "  path  Print the location of the identifier file." << std::endl
     << "  version  Print the program version." << std::endl
     << std::endl;
}

std::unique_ptr<clientid::IClientIdConfigProvider>
load_config(const fs::path &config_dir) {
  if (config_dir.empty()) {
    return std::make_unique<clientid::ClientIdConfigProviderValue>(
        clientid::ClientIdConfig{});
  }
  return std::make_unique<clientid::ClientIdConfigProviderFile>(config_dir);
}

} // namespace

int RunClientIdApplication(int argc, char *argv[]) {
  std::unique_ptr<clientid::CliCtx> cli_ctx;
  try {
    cli_ctx = std::make_unique<clientid::CliCtx>(
        clientid::parse_cli(argc, argv));
  } catch (const po::error &ex) {
    std::cerr << ex.what() << std::endl;
    show_usage(std::cerr);
    return kExitUsage;
  }

  if (cli_ctx->wants_version()) {
    std::cout << CLIENTID_VERSION << std::endl;
    return EXIT_SUCCESS;
  }
  if (cli_ctx->vm.count("help")) {
    show_usage(std::cout);
    return EXIT_SUCCESS;
  }
  const clientid::CliParams &params = cli_ctx->params;

  std::unique_ptr<clientid::IClientIdConfigProvider> config_provider;
  try {
    config_provider = load_config(params.config_dir);
  } catch (const clientid::ConfigError &ex) {
    std::cerr << "Failed to load configuration: " << ex.what() << std::endl;
    return kExitUsage;
  }
  const clientid::ClientIdConfig &config = config_provider->get();

  clientid::LoggingConfig logging_config = config_provider->logging();
  if (cli_ctx->is_specified_by_user("verbose")) {
    logging_config.level = params.verbose;
  }
  try {
    init_my_log(logging_config);
  } catch (const std::exception &ex) {
    std::cerr << "Failed to initialize logging: " << ex.what() << std::endl;
    return kExitUsage;
  }

  std::unique_ptr<clientid::IDataDirResolver> resolver;
  if (params.data_dir_override) {
    resolver = std::make_unique<clientid::FixedDataDirResolver>(
        *params.data_dir_override);
  } else {
    resolver = clientid::make_data_dir_resolver(config);
  }

  // Runs the detached analytics send; joined below so the process does not
  // exit underneath it.
  boost::asio::thread_pool pool(static_cast<std::size_t>(config.threads_num));

  std::unique_ptr<clientid::analytics::IAnalyticsNotifier> notifier;
  if (params.no_analytics || !config.analytics_enabled) {
    notifier = std::make_unique<clientid::analytics::NullAnalyticsNotifier>();
  } else {
    try {
      notifier = std::make_unique<clientid::analytics::AnalyticsDispatcher>(
          std::make_shared<clientid::analytics::HttpAnalyticsClient>(config),
          pool.get_executor());
    } catch (const clientid::ConfigError &ex) {
      std::cerr << "Failed to load configuration: " << ex.what() << std::endl;
      return kExitUsage;
    }
  }

  clientid::ClientIdentityManager manager(*resolver, *notifier);
  auto handler = clientid::make_handler(params.subcmd, manager);
  if (!handler) {
    std::cerr << "Unknown subcommand '" << params.subcmd << "'" << std::endl;
    show_usage(std::cerr);
    return kExitUsage;
  }

  BOOST_LOG_SEV(app_logger(), trivial::debug)
      << "client-id " << CLIENTID_VERSION << " running '" << handler->command()
      << "'";
  int rc = handler->start();
  pool.join();
  return rc;
}
