#include "handlers/dns_handler.hpp"

#include <fmt/format.h>

#include <sstream>

#include "my_error_codes.hpp"

namespace speakerctrl {

DnsHandler::DnsHandler(IDeviceStore &device_store, CliCtx &cli_ctx,
                       customio::ConsoleOutput &output)
    : device_store_(device_store), cli_ctx_(cli_ctx), output_(output),
      opt_desc_("dns subcommand options") {
  opt_desc_.add_options() //
      ("enabled", po::value<std::string>(&enabled_),
       "whether the DNS discovery server is enabled (true/false).") //
      ("bind-addr", po::value<std::string>(&bind_addr_),
       "bind address of the DNS discovery server, e.g. :53.");
}

std::string DnsHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage:\n"
         "speaker-ctrl dns get\n"
         "speaker-ctrl dns set [--enabled true|false] [--bind-addr ADDR]\n\n"
      << opt_desc_ << std::endl;
  return oss.str();
}

monad::MyVoidResult DnsHandler::show_usage(const std::string &msg) {
  if (!msg.empty()) {
    output_.error() << msg << std::endl;
  }
  return monad::MyVoidResult::Err(
      monad::make_error(my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
}

monad::MyVoidResult DnsHandler::start() {
  if (auto r = parse_handler_options(cli_ctx_.unrecognized, opt_desc_, vm_,
                                     args_);
      r.is_err()) {
    return show_usage(r.error().what);
  }
  const std::string action = args_.size() > 1 ? args_[1] : "get";
  auto settings = device_store_.get_dns_settings();

  if (action == "set") {
    if (vm_.count("enabled") == 0 && vm_.count("bind-addr") == 0) {
      return show_usage("Nothing to set; pass --enabled and/or --bind-addr");
    }
    if (vm_.count("enabled")) {
      settings.enabled = parse_bool(enabled_);
    }
    if (vm_.count("bind-addr")) {
      settings.bind_addr = bind_addr_;
    }
    if (auto err = device_store_.save_dns_settings(settings)) {
      return monad::MyVoidResult::Err(
          monad::make_error(my_errors::GENERAL::UPDATE_FAILED, *err));
    }
    if (settings.enabled && !settings.binds_port_53()) {
      output_.warning() << "The resolv migration method requires port 53; "
                        << settings.bind_addr << " will not work for it."
                        << std::endl;
    }
  } else if (action != "get") {
    return show_usage(fmt::format("Unknown dns action: {}", action));
  }

  output_.out() << "enabled = " << (settings.enabled ? "true" : "false")
                << "\nbind_addr = " << settings.bind_addr << std::endl;
  return monad::MyVoidResult::Ok();
}

} // namespace speakerctrl
