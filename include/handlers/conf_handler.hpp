#pragma once

#include <boost/program_options.hpp>
#include <iostream>
#include <sstream>
#include <string>

#include "conf/speakerctrl_config.hpp"
#include "customio/console_output.hpp"
#include "handlers/i_handler.hpp"
#include "my_error_codes.hpp"
#include "speakerctrl_common.hpp"
#include "util/my_logging.hpp" // IWYU pragma: keep

namespace po = boost::program_options;

namespace speakerctrl {

class ConfHandler : public speakerctrl::IHandler {
  speakerctrl::ISpeakerctrlConfigProvider &config_provider_;
  customio::ConsoleOutput &output_;
  CliCtx &cli_ctx_;
  src::severity_logger<trivial::severity_level> lg;

public:
  ConfHandler(speakerctrl::ISpeakerctrlConfigProvider &config_provider,
              CliCtx &cli_ctx, //
              customio::ConsoleOutput &output)
      : config_provider_(config_provider), output_(output),
        cli_ctx_(cli_ctx) {}

  // IHandler
  std::string command() const override { return "conf"; }

  std::string print_opt_desc() const {
    std::ostringstream oss;
    oss << "Usage: \nspeaker-ctrl conf get <key>\nspeaker-ctrl conf set <key> "
           "<value>\n"
           "keys: base_url, https_port, ssh.user\n"
        << std::endl;
    return oss.str();
  }

  monad::MyVoidResult show_usage(const std::string &msg = "") {
    if (!msg.empty()) {
      output_.error() << msg << std::endl;
    }
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
  }

  monad::MyVoidResult start() override;
};
} // namespace speakerctrl
