#pragma once

#include <boost/json.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace speakerctrl {

namespace json = boost::json;

struct LoggingConfig {
  std::string level{"info"};
  std::string log_dir{};
  std::string log_file{"speakerctrl.log"};
  std::uint64_t rotation_size{10 * 1024 * 1024};

  friend LoggingConfig tag_invoke(const json::value_to_tag<LoggingConfig> &,
                                  const json::value &jv) {
    const auto *jo = jv.if_object();
    if (!jo) {
      throw std::runtime_error("LoggingConfig is not an object");
    }
    LoggingConfig lc{};
    if (auto *p = jo->if_contains("level"))
      lc.level = json::value_to<std::string>(*p);
    if (auto *p = jo->if_contains("log_dir"))
      lc.log_dir = json::value_to<std::string>(*p);
    if (auto *p = jo->if_contains("log_file"))
      lc.log_file = json::value_to<std::string>(*p);
    if (auto *p = jo->if_contains("rotation_size"))
      lc.rotation_size = json::value_to<std::uint64_t>(*p);
    return lc;
  }
};

} // namespace speakerctrl
