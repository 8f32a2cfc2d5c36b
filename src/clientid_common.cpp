#include "clientid_common.hpp"

#include "conf/clientid_config.hpp"

namespace clientid {

po::options_description make_generic_options(CliParams &params,
                                             std::string &config_dir_arg,
                                             std::string &data_dir_arg) {
  po::options_description generic_desc("client-id: per-installation identifier");
  generic_desc.add_options() //
      ("config-dir,c", po::value<std::string>(&config_dir_arg),
       "directory holding application.json and log_config.json.") //
      ("data-dir,d", po::value<std::string>(&data_dir_arg),
       "store client_id.txt here instead of the platform data directory.") //
      ("verbose,v", po::value<std::string>(&params.verbose),
       "log level: trace|debug|info|warning|error|fatal.") //
      ("no-analytics",
       po::bool_switch(&params.no_analytics)->default_value(false),
       "do not report a newly created identifier.") //
      ("version", "Print version") //
      ("help,h", "Print help");
  return generic_desc;
}

CliCtx parse_cli(int argc, const char *const argv[]) {
  CliParams params;
  std::string config_dir_arg;
  std::string data_dir_arg;

  po::options_description generic_desc =
      make_generic_options(params, config_dir_arg, data_dir_arg);
  po::options_description hidden_desc("Hidden options");
  hidden_desc.add_options() //
      ("positionals", po::value<std::vector<std::string>>(),
       "all positional arguments");

  po::options_description cmdline_options("Allowed options");
  cmdline_options.add(generic_desc).add(hidden_desc);

  po::positional_options_description p;
  p.add("positionals", -1);

  po::variables_map vm;
  po::store(po::command_line_parser(argc, argv)
                .options(cmdline_options)
                .positional(p)
                .run(),
            vm);
  po::notify(vm);

  std::vector<std::string> positionals;
  if (vm.count("positionals")) {
    positionals = vm["positionals"].as<std::vector<std::string>>();
  }
  if (!positionals.empty()) {
    params.subcmd = positionals.front();
  }
  params.config_dir = config_dir_arg.empty() ? resolve_default_config_dir()
                                             : fs::path(config_dir_arg);
  if (!data_dir_arg.empty()) {
    params.data_dir_override = fs::path(data_dir_arg);
  }

  return CliCtx(std::move(vm), std::move(positionals), std::move(params));
}

} // namespace clientid
