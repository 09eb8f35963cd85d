#include "handlers/conf_handler.hpp"

#include <fmt/format.h>

#include <charconv>
#include <sstream>

namespace speakerctrl {

namespace {
constexpr const char *kSupportedKeys = "base_url, https_port, ssh.user";
}

monad::MyVoidResult ConfHandler::start() {
  if (auto setv_r = cli_ctx_.get_set_kv(); setv_r.is_ok()) {
    auto [key, value] = setv_r.value();
    monad::MyVoidResult saved = monad::MyVoidResult::Ok();
    if (key == "base_url") {
      saved = config_provider_.save({{"base_url", value}});
    } else if (key == "https_port") {
      std::uint16_t port = 0;
      auto [ptr, ec] =
          std::from_chars(value.data(), value.data() + value.size(), port);
      if (ec != std::errc{} || ptr != value.data() + value.size() ||
          port == 0) {
        return show_usage(fmt::format("Invalid port: {}", value));
      }
      saved = config_provider_.save({{"https_port", port}});
    } else if (key == "ssh.user") {
      json::object ssh{{"user", value}};
      saved = config_provider_.save({{"ssh", ssh}});
    } else {
      return show_usage(fmt::format(
          "Unknown configuration key: {}, supported keys are: {}", key,
          kSupportedKeys));
    }
    if (saved.is_err()) {
      return saved;
    }
    BOOST_LOG_SEV(lg, trivial::info) << "conf set " << key << "=" << value;
    output_.info() << "Set " << key << " to " << value << std::endl;
  } else if (auto getv_r = cli_ctx_.get_get_k(); getv_r.is_ok()) {
    auto key = getv_r.value();
    const auto &config = config_provider_.get();
    if (key == "base_url") {
      output_.out() << "base_url = " << config.base_url << std::endl;
    } else if (key == "https_port") {
      output_.out() << "https_port = " << config.https_port << std::endl;
    } else if (key == "ssh.user") {
      output_.out() << "ssh.user = " << config.ssh.user << std::endl;
    } else {
      return show_usage(fmt::format(
          "Unknown configuration key: {}, supported keys are: {}", key,
          kSupportedKeys));
    }
  } else {
    return show_usage();
  }
  return monad::MyVoidResult::Ok();
}
} // namespace speakerctrl
