#pragma once

#include <boost/json.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "conf/logging_config.hpp"
#include "result_monad.hpp"

namespace speakerctrl {

namespace fs = std::filesystem;
namespace json = boost::json;

// Layered JSON configuration read from one or more config directories.
// For each directory, in order: <name>.json, <name>.<profile>.json for every
// profile, then <name>.override.json. Later files overwrite keys of earlier
// ones (objects are merged recursively).
class ConfigSources {
public:
  ConfigSources(std::vector<fs::path> paths, std::vector<std::string> profiles);

  const std::vector<fs::path> &paths() const { return paths_; }
  const std::vector<std::string> &profiles() const { return profiles_; }

  // Merged object for "<name>*.json"; Err when no layer exists.
  monad::MyResult<json::object> json_content(const std::string &name) const;

  const std::optional<json::object> &application_json() const {
    return application_json_;
  }

  monad::MyResult<LoggingConfig> logging_config() const;

  // Directory receiving *.override.json writes.
  fs::path writable_dir() const;

private:
  std::vector<fs::path> paths_;
  std::vector<std::string> profiles_;
  std::optional<json::object> application_json_;
};

// Recursive object merge; values of `overlay` win.
void merge_json_object(json::object &base, const json::object &overlay);

} // namespace speakerctrl
