#pragma once

#include <boost/program_options.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace clientid {

struct CliParams {
  fs::path config_dir;
  std::optional<fs::path> data_dir_override;
  std::string subcmd{"get"};
  std::string verbose; // trace|debug|info|warning|error|fatal
  bool no_analytics = false;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  clientid::CliParams params;

  CliCtx(po::variables_map &&vm,                 //
         std::vector<std::string> &&positionals, //
         clientid::CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        params(std::move(params_)) {}

  // `--version` or a leading `version` subcommand.
  bool wants_version() const {
    return vm.count("version") > 0 || params.subcmd == "version";
  }

  // True iff the option was given explicitly rather than defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }
};

// Option descriptions shared by the executable and its tests.
po::options_description make_generic_options(CliParams &params,
                                             std::string &config_dir_arg,
                                             std::string &data_dir_arg);

// Parses argv into a CliCtx. Throws po::error on malformed input.
// A help request is reported through CliCtx::vm ("help").
CliCtx parse_cli(int argc, const char *const argv[]);

} // namespace clientid
