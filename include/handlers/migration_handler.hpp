#pragma once

#include <boost/program_options.hpp>
#include <string>
#include <vector>

#include "customio/console_output.hpp"
#include "handlers/handler_options.hpp"
#include "handlers/i_handler.hpp"
#include "setup/migration_manager.hpp"
#include "speakerctrl_common.hpp"
#include "util/my_logging.hpp" // IWYU pragma: keep

namespace po = boost::program_options;

namespace speakerctrl {

// Speaker-facing subcommands:
//   summary <addr>, migrate <addr>, revert <addr>, backup <addr>,
//   trust-ca <addr>, reboot <addr>, remote-services enable|disable <addr>,
//   resolve <host>
class MigrationHandler : public IHandler {
  setup::MigrationManager &manager_;
  CliCtx &cli_ctx_;
  customio::ConsoleOutput &output_;
  src::severity_logger<trivial::severity_level> lg;

  po::options_description opt_desc_;
  po::variables_map vm_;
  std::vector<std::string> args_;
  TargetOptions target_;
  std::string method_{"xml"};
  bool json_{false};
  bool off_device_{false};

public:
  MigrationHandler(setup::MigrationManager &manager, CliCtx &cli_ctx,
                   customio::ConsoleOutput &output);

  // IHandler
  std::string command() const override { return cli_ctx_.params.subcmd; }

  std::string print_opt_desc() const;

  monad::MyVoidResult show_usage(const std::string &msg = "");

  monad::MyVoidResult start() override;

private:
  monad::MyResult<std::string> device_arg(size_t index);

  // Prints the transcript, then the outcome.
  monad::MyVoidResult report(const std::string &what, const std::string &log,
                             monad::MyVoidResult result);

  monad::MyVoidResult handle_summary();
  monad::MyVoidResult handle_migrate();
  monad::MyVoidResult handle_revert();
  monad::MyVoidResult handle_backup();
  monad::MyVoidResult handle_trust_ca();
  monad::MyVoidResult handle_reboot();
  monad::MyVoidResult handle_remote_services();
  monad::MyVoidResult handle_resolve();
};

} // namespace speakerctrl
