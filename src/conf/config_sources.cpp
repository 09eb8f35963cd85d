#include "conf/config_sources.hpp"

#include <fstream>
#include <iterator>

#include "my_error_codes.hpp"

namespace speakerctrl {

namespace {

std::optional<json::object> read_json_object(const fs::path &file,
                                             std::string &error) {
  std::ifstream ifs(file);
  if (!ifs) {
    return std::nullopt;
  }
  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  boost::system::error_code ec;
  auto value = json::parse(content, ec);
  if (ec) {
    error = "Failed to parse " + file.string() + ": " + ec.message();
    return std::nullopt;
  }
  if (!value.is_object()) {
    error = "Configuration file is not a JSON object: " + file.string();
    return std::nullopt;
  }
  return value.as_object();
}

} // namespace

void merge_json_object(json::object &base, const json::object &overlay) {
  for (const auto &[key, value] : overlay) {
    auto *existing = base.if_contains(key);
    if (existing && existing->is_object() && value.is_object()) {
      merge_json_object(existing->as_object(), value.as_object());
    } else {
      base[key] = value;
    }
  }
}

ConfigSources::ConfigSources(std::vector<fs::path> paths,
                             std::vector<std::string> profiles)
    : paths_(std::move(paths)), profiles_(std::move(profiles)) {
  auto app = json_content("application");
  if (app.is_ok()) {
    application_json_ = app.value();
  }
}

monad::MyResult<json::object>
ConfigSources::json_content(const std::string &name) const {
  json::object merged;
  bool found = false;
  std::string error;
  auto apply = [&](const fs::path &file) {
    if (!fs::exists(file)) {
      return;
    }
    if (auto layer = read_json_object(file, error)) {
      merge_json_object(merged, *layer);
      found = true;
    }
  };
  for (const auto &dir : paths_) {
    apply(dir / (name + ".json"));
    for (const auto &profile : profiles_) {
      apply(dir / (name + "." + profile + ".json"));
    }
    apply(dir / (name + ".override.json"));
  }
  if (!error.empty()) {
    return monad::MyResult<json::object>::Err(
        monad::make_error(my_errors::GENERAL::JSON_PARSE_ERROR, error));
  }
  if (!found) {
    return monad::MyResult<json::object>::Err(monad::make_error(
        my_errors::GENERAL::FILE_NOT_FOUND, "No " + name + ".json found"));
  }
  return monad::MyResult<json::object>::Ok(std::move(merged));
}

monad::MyResult<LoggingConfig> ConfigSources::logging_config() const {
  auto content = json_content("log_config");
  if (content.is_err()) {
    return monad::MyResult<LoggingConfig>::Err(content.error());
  }
  try {
    return monad::MyResult<LoggingConfig>::Ok(
        json::value_to<LoggingConfig>(json::value(content.value())));
  } catch (const std::exception &ex) {
    return monad::MyResult<LoggingConfig>::Err(
        monad::make_error(my_errors::GENERAL::JSON_PARSE_ERROR, ex.what()));
  }
}

fs::path ConfigSources::writable_dir() const {
  if (paths_.empty()) {
    return fs::current_path();
  }
  return paths_.back();
}

} // namespace speakerctrl
