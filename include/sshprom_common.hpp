#pragma once

#include <boost/program_options.hpp>

#include <algorithm>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace sshprom {

struct CliParams {
  fs::path config_file;
  std::string subcmd;
  std::string verbose{"warning"};
  fs::path log_dir;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  std::vector<std::string> unrecognized;
  CliParams params;
  CliCtx(po::variables_map &&vm,                  //
         std::vector<std::string> &&positionals,  //
         std::vector<std::string> &&unrecognized, //
         CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        unrecognized(std::move(unrecognized)), params(std::move(params_)) {}

  // True iff the option exists in variables_map and was not defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }

  // Tokens left over by the global parser (positionals included), with the
  // first occurrence of each dropped token removed. Subcommands parse their
  // own options from these.
  std::vector<std::string>
  subcommand_tokens(const std::vector<std::string> &drop) const {
    std::vector<std::string> out = unrecognized;
    for (const auto &token : drop) {
      if (auto it = std::find(out.begin(), out.end(), token); it != out.end()) {
        out.erase(it);
      }
    }
    return out;
  }
};

} // namespace sshprom
