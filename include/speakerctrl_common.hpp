#pragma once

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <boost/program_options.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace fs = std::filesystem;
namespace po = boost::program_options;

namespace speakerctrl {

struct CliParams {
  std::vector<fs::path> config_dirs;
  std::vector<std::string> profiles;
  fs::path runtime_dir;
  std::string subcmd;
  std::string verbose; // vvvv
  bool silent = false;
  std::optional<std::string> url_base_override;
};

struct CliCtx {
  po::variables_map vm;
  std::vector<std::string> positionals;
  std::vector<std::string> unrecognized;
  speakerctrl::CliParams params;
  CliCtx(po::variables_map &&vm,                  //
         std::vector<std::string> &&positionals,  //
         std::vector<std::string> &&unrecognized, //
         speakerctrl::CliParams &&params_)
      : vm(std::move(vm)), positionals(std::move(positionals)),
        unrecognized(std::move(unrecognized)), params(std::move(params_)) {}

  // True iff the option was given explicitly rather than defaulted.
  bool is_specified_by_user(const std::string &opt_name) const {
    auto it = vm.find(opt_name);
    if (it == vm.end()) {
      return false;
    }
    return !it->second.defaulted();
  }
  bool positional_contains(const std::string &name) const {
    return std::find(positionals.begin(), positionals.end(), name) !=
           positionals.end();
  }

  // positionals[index], e.g. "migrate 192.168.1.20" -> index 1 is the address
  std::optional<std::string> positional_at(size_t index) const {
    if (index < positionals.size()) {
      return positionals[index];
    }
    return std::nullopt;
  }

  size_t verbosity_level() const {
    if (params.silent) {
      return 0;
    }
    if (params.verbose.empty()) {
      return 3;
    }
    if (params.verbose == "trace") {
      return 5;
    } else if (params.verbose == "debug") {
      return 4;
    } else if (params.verbose == "info") {
      return 3;
    } else if (params.verbose == "warning") {
      return 2;
    } else if (params.verbose == "error") {
      return 1;
    }
    return std::count(params.verbose.begin(), params.verbose.end(), 'v');
  }

  monad::MyResult<std::pair<std::string, std::string>> get_set_kv() {
    size_t set_pos{0};
    for (const auto &p : positionals) {
      if (p == "set") {
        break;
      }
      set_pos++;
    }
    // cmd conf set ssh.user root
    if (set_pos + 2 >= positionals.size()) {
      return monad::MyResult<std::pair<std::string, std::string>>::Err(
          monad::make_error(
              my_errors::GENERAL::SHOW_OPT_DESC,
              "Both key and value must be provided for set operation."));
    }
    return monad::MyResult<std::pair<std::string, std::string>>::Ok(
        {positionals[set_pos + 1], positionals[set_pos + 2]});
  }

  monad::MyResult<std::string> get_get_k() {
    size_t get_pos{0};
    for (const auto &p : positionals) {
      if (p == "get") {
        break;
      }
      get_pos++;
    }
    // cmd conf get base_url
    if (get_pos + 1 >= positionals.size()) {
      return monad::MyResult<std::string>::Err(
          monad::make_error(my_errors::GENERAL::SHOW_OPT_DESC,
                            "Key must be provided for get operation."));
    }
    return monad::MyResult<std::string>::Ok(positionals[get_pos + 1]);
  }

  size_t positional_count() { return positionals.size(); }
};

inline std::string_view
get_unrecognized(const std::vector<std::string> &unrecognized,
                 const std::string &option_name) {
  auto it = std::find(unrecognized.begin(), unrecognized.end(), option_name);
  if (it != unrecognized.end() && ++it != unrecognized.end()) {
    return *it;
  }
  return "";
}

inline bool parse_bool(const std::string &value) {
  std::string val_lower = value;
  std::transform(val_lower.begin(), val_lower.end(), val_lower.begin(),
                 ::tolower);
  return (val_lower == "1" || val_lower == "true" || val_lower == "yes" ||
          val_lower == "on");
}

inline bool is_known_subcommand(std::string_view candidate) {
  static constexpr std::array<std::string_view, 13> kKnown{
      "summary", "migrate",         "revert", "backup",  "trust-ca",
      "reboot",  "remote-services", "test",   "devices", "dns",
      "ca",      "conf",            "resolve"};
  return std::find(kKnown.begin(), kKnown.end(), candidate) != kKnown.end();
}

inline std::optional<size_t>
find_subcommand_index(const std::vector<std::string> &tokens) {
  for (size_t i = 0; i < tokens.size(); ++i) {
    if (is_known_subcommand(tokens[i])) {
      return i;
    }
  }
  return std::nullopt;
}

// Make positionals start with the subcommand. A first positional that is
// really the value of a global option (e.g. "-c dir summary") is skipped.
inline void normalize_cli_subcommand(
    std::string &subcmd, std::vector<std::string> &positionals,
    const std::vector<std::string> &fallback_tokens = {}) {
  auto looks_like_option = [](const std::string &token) {
    return !token.empty() && token[0] == '-';
  };

  auto token_is_option_value = [&](const std::string &token) {
    if (token.empty() || fallback_tokens.empty()) {
      return false;
    }
    for (size_t i = 0; i + 1 < fallback_tokens.size(); ++i) {
      if (!looks_like_option(fallback_tokens[i])) {
        continue;
      }
      const auto &value = fallback_tokens[i + 1];
      if (value.empty() || looks_like_option(value)) {
        continue;
      }
      if (value == token) {
        return true;
      }
    }
    return false;
  };

  auto ensure_prefix = [&]() {
    if (subcmd.empty()) {
      return;
    }
    if (positionals.empty() || positionals.front() != subcmd) {
      positionals.insert(positionals.begin(), subcmd);
    }
  };

  if (!subcmd.empty()) {
    const bool known = is_known_subcommand(subcmd);
    if (!known && token_is_option_value(subcmd)) {
      if (!positionals.empty() && positionals.front() == subcmd) {
        positionals.erase(positionals.begin());
      }
      subcmd.clear();
    } else {
      ensure_prefix();
      return;
    }
  }

  if (!positionals.empty()) {
    if (auto idx = find_subcommand_index(positionals)) {
      subcmd = positionals[*idx];
      if (*idx != 0) {
        auto detected = positionals[*idx];
        positionals.erase(positionals.begin() + *idx);
        positionals.insert(positionals.begin(), std::move(detected));
      }
      ensure_prefix();
      return;
    }
  }

  if (fallback_tokens.empty()) {
    return;
  }

  if (auto idx = find_subcommand_index(fallback_tokens)) {
    subcmd = fallback_tokens[*idx];
    if (positionals.empty()) {
      positionals.push_back(subcmd);
      for (size_t j = *idx + 1; j < fallback_tokens.size(); ++j) {
        const auto &candidate = fallback_tokens[j];
        if (looks_like_option(candidate)) {
          break;
        }
        positionals.push_back(candidate);
      }
    } else {
      ensure_prefix();
    }
  }
}

} // namespace speakerctrl
