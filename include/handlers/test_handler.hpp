#pragma once

#include <boost/program_options.hpp>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "handlers/handler_options.hpp"
#include "handlers/i_handler.hpp"
#include "setup/migration_manager.hpp"
#include "speakerctrl_common.hpp"

namespace po = boost::program_options;

namespace speakerctrl {

// speaker-ctrl test hosts|dns|connection <addr>
class TestHandler : public IHandler {
  setup::MigrationManager &manager_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;

  po::options_description opt_desc_;
  po::variables_map vm_;
  std::vector<std::string> args_;
  TargetOptions target_;
  bool explicit_ca_{false};

public:
  TestHandler(setup::MigrationManager &manager, CliCtx &cli_ctx,
              customio::ConsoleOutput &output);

  std::string command() const override { return "test"; }

  std::string print_opt_desc() const;
  monad::MyVoidResult show_usage(const std::string &msg = "");

  monad::MyVoidResult start() override;
};

} // namespace speakerctrl
