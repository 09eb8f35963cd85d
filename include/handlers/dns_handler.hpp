#pragma once

#include <boost/program_options.hpp>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "handlers/handler_options.hpp"
#include "handlers/i_handler.hpp"
#include "speakerctrl_common.hpp"
#include "state/device_store.hpp"

namespace po = boost::program_options;

namespace speakerctrl {

// speaker-ctrl dns get|set [--enabled BOOL] [--bind-addr ADDR]
class DnsHandler : public IHandler {
  IDeviceStore &device_store_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;

  po::options_description opt_desc_;
  po::variables_map vm_;
  std::vector<std::string> args_;
  std::string enabled_;
  std::string bind_addr_;

public:
  DnsHandler(IDeviceStore &device_store, CliCtx &cli_ctx,
             customio::ConsoleOutput &output);

  std::string command() const override { return "dns"; }

  std::string print_opt_desc() const;
  monad::MyVoidResult show_usage(const std::string &msg = "");

  monad::MyVoidResult start() override;
};

} // namespace speakerctrl
