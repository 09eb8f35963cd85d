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

// speaker-ctrl devices list|add|remove
class DevicesHandler : public IHandler {
  IDeviceStore &device_store_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;

  po::options_description opt_desc_;
  po::variables_map vm_;
  std::vector<std::string> args_;
  DeviceRecord record_;

public:
  DevicesHandler(IDeviceStore &device_store, CliCtx &cli_ctx,
                 customio::ConsoleOutput &output);

  std::string command() const override { return "devices"; }

  std::string print_opt_desc() const;
  monad::MyVoidResult show_usage(const std::string &msg = "");

  monad::MyVoidResult start() override;

private:
  monad::MyVoidResult handle_list();
  monad::MyVoidResult handle_add();
  monad::MyVoidResult handle_remove();
};

} // namespace speakerctrl
