#include "handlers/test_handler.hpp"

#include <fmt/format.h>

#include <sstream>

#include "my_error_codes.hpp"

namespace speakerctrl {

TestHandler::TestHandler(setup::MigrationManager &manager, CliCtx &cli_ctx,
                         customio::ConsoleOutput &output)
    : manager_(manager), cli_ctx_(cli_ctx), output_(output),
      opt_desc_("test subcommand options") {
  target_.add_to(opt_desc_, false);
  opt_desc_.add_options() //
      ("explicit-ca", po::bool_switch(&explicit_ca_)->default_value(false),
       "connection: verify against a temporary copy of the local CA.");
}

std::string TestHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage:\n"
         "speaker-ctrl test hosts <addr> [--target-url U]\n"
         "speaker-ctrl test dns <addr> [--target-url U]\n"
         "speaker-ctrl test connection <addr> [--target-url U] "
         "[--explicit-ca]\n\n"
      << opt_desc_ << std::endl;
  return oss.str();
}

monad::MyVoidResult TestHandler::show_usage(const std::string &msg) {
  if (!msg.empty()) {
    output_.error() << msg << std::endl;
  }
  return monad::MyVoidResult::Err(
      monad::make_error(my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
}

monad::MyVoidResult TestHandler::start() {
  if (auto r = parse_handler_options(cli_ctx_.unrecognized, opt_desc_, vm_,
                                     args_);
      r.is_err()) {
    return show_usage(r.error().what);
  }
  if (args_.size() < 3) {
    return show_usage();
  }
  const std::string &kind = args_[1];
  const std::string &addr = args_[2];

  std::string log;
  monad::MyVoidResult r = monad::MyVoidResult::Ok();
  if (kind == "hosts") {
    r = manager_.test_hosts_redirection(addr, target_.target_url, log);
  } else if (kind == "dns") {
    r = manager_.test_dns_redirection(addr, target_.target_url, log);
  } else if (kind == "connection") {
    r = manager_.test_connection(addr, target_.target_url, explicit_ca_, log);
  } else {
    return show_usage(fmt::format("Unknown test: {}", kind));
  }

  if (!log.empty()) {
    output_.out() << log;
    if (log.back() != '\n') {
      output_.out() << '\n';
    }
  }
  if (r.is_ok()) {
    output_.printer().green(fmt::format("{} test passed.", kind));
  }
  return r;
}

} // namespace speakerctrl
