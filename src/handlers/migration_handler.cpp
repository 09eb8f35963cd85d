#include "handlers/migration_handler.hpp"

#include <boost/json.hpp>
#include <fmt/format.h>

#include <sstream>

#include "my_error_codes.hpp"
#include "setup/summary_json.hpp"

namespace speakerctrl {

MigrationHandler::MigrationHandler(setup::MigrationManager &manager,
                                   CliCtx &cli_ctx,
                                   customio::ConsoleOutput &output)
    : manager_(manager), cli_ctx_(cli_ctx), output_(output),
      opt_desc_("speaker subcommand options") {
  target_.add_to(opt_desc_, true);
  opt_desc_.add_options() //
      ("method", po::value<std::string>(&method_)->default_value("xml"),
       "migration method: xml, hosts or resolv.") //
      ("json", po::bool_switch(&json_)->default_value(false),
       "print the summary as JSON.") //
      ("off-device", po::bool_switch(&off_device_)->default_value(false),
       "backup: save the config locally instead of next to the original.");
}

std::string MigrationHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage:\n"
         "speaker-ctrl summary <addr> [--target-url U] [--proxy-url P] "
         "[--upstream LIST] [--json]\n"
         "speaker-ctrl migrate <addr> [--method xml|hosts|resolv] "
         "[--target-url U] [--proxy-url P] [--upstream LIST]\n"
         "speaker-ctrl revert <addr>\n"
         "speaker-ctrl backup <addr> [--off-device]\n"
         "speaker-ctrl trust-ca <addr>\n"
         "speaker-ctrl reboot <addr>\n"
         "speaker-ctrl remote-services enable|disable <addr>\n"
         "speaker-ctrl resolve <host>\n\n"
      << opt_desc_ << std::endl;
  return oss.str();
}

monad::MyVoidResult MigrationHandler::show_usage(const std::string &msg) {
  if (!msg.empty()) {
    output_.error() << msg << std::endl;
  }
  return monad::MyVoidResult::Err(
      monad::make_error(my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
}

monad::MyResult<std::string> MigrationHandler::device_arg(size_t index) {
  if (index >= args_.size() || args_[index].empty()) {
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
  }
  return monad::MyResult<std::string>::Ok(args_[index]);
}

monad::MyVoidResult MigrationHandler::report(const std::string &what,
                                             const std::string &log,
                                             monad::MyVoidResult result) {
  if (!log.empty()) {
    output_.out() << log;
    if (log.back() != '\n') {
      output_.out() << '\n';
    }
  }
  if (result.is_ok()) {
    output_.printer().green(what + " succeeded.");
  }
  return result;
}

monad::MyVoidResult MigrationHandler::start() {
  if (auto r = parse_handler_options(cli_ctx_.unrecognized, opt_desc_, vm_,
                                     args_);
      r.is_err()) {
    return show_usage(r.error().what);
  }
  BOOST_LOG_SEV(lg, trivial::debug)
      << "MigrationHandler " << command() << " args=" << args_.size();

  const auto &subcmd = cli_ctx_.params.subcmd;
  if (subcmd == "summary") {
    return handle_summary();
  } else if (subcmd == "migrate") {
    return handle_migrate();
  } else if (subcmd == "revert") {
    return handle_revert();
  } else if (subcmd == "backup") {
    return handle_backup();
  } else if (subcmd == "trust-ca") {
    return handle_trust_ca();
  } else if (subcmd == "reboot") {
    return handle_reboot();
  } else if (subcmd == "remote-services") {
    return handle_remote_services();
  } else if (subcmd == "resolve") {
    return handle_resolve();
  }
  return show_usage(fmt::format("Unknown subcommand: {}", subcmd));
}

monad::MyVoidResult MigrationHandler::handle_summary() {
  auto addr = device_arg(1);
  if (addr.is_err()) {
    return monad::MyVoidResult::Err(addr.error());
  }
  auto options = target_.proxy_options();
  if (options.is_err()) {
    return show_usage(options.error().what);
  }
  auto summary_r = manager_.get_migration_summary(
      addr.value(), target_.target_url, target_.proxy_url, options.value());
  if (summary_r.is_err()) {
    return monad::MyVoidResult::Err(summary_r.error());
  }
  const auto &s = summary_r.value();
  if (json_) {
    output_.out() << boost::json::serialize(boost::json::value_from(s))
                  << std::endl;
    return monad::MyVoidResult::Ok();
  }

  auto &out = output_.out();
  auto yes_no = [](bool b) { return b ? "yes" : "no"; };
  out << "Device:            " << addr.value() << "\n";
  if (!s.device_name.empty()) {
    out << "Name:              " << s.device_name << "\n";
  }
  if (!s.device_model.empty()) {
    out << "Model:             " << s.device_model << "\n";
  }
  if (!s.device_serial.empty()) {
    out << "Serial:            " << s.device_serial << "\n";
  }
  if (!s.firmware_version.empty()) {
    out << "Firmware:          " << s.firmware_version << "\n";
  }
  if (!s.account_id.empty()) {
    out << "Account:           " << s.account_id << "\n";
  }
  out << "Target:            " << s.target_url << "\n";
  out << "SSH reachable:     " << yes_no(s.ssh_success) << "\n";
  out << "Migrated:          " << yes_no(s.is_migrated) << "\n";
  out << "CA trusted:        " << yes_no(s.ca_cert_trusted) << "\n";
  out << "DNS hook:          " << yes_no(s.dns_hook_installed) << "\n";
  out << "Remote services:   " << yes_no(s.remote_services_enabled);
  if (s.remote_services_enabled) {
    out << (s.remote_services_persistent ? " (persistent)" : " (temporary)");
  }
  out << "\n";
  if (!s.server_https_url.empty()) {
    out << "Server health:     " << s.server_https_url << "\n";
  }
  out << "\n--- current config ---\n" << s.current_config << "\n";
  if (!s.original_config.empty()) {
    out << "--- original config ---\n" << s.original_config << "\n";
  }
  out << "--- planned config ---\n" << s.planned_config << "\n";
  if (!s.planned_hosts.empty()) {
    out << "--- planned hosts entries ---\n" << s.planned_hosts << "\n";
  }
  if (!s.planned_resolv.empty()) {
    out << "--- planned resolv ---\n" << s.planned_resolv;
  }
  out.flush();
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult MigrationHandler::handle_migrate() {
  auto addr = device_arg(1);
  if (addr.is_err()) {
    return monad::MyVoidResult::Err(addr.error());
  }
  auto method = setup::parse_migration_method(method_);
  if (method.is_err()) {
    return show_usage(method.error().what);
  }
  auto options = target_.proxy_options();
  if (options.is_err()) {
    return show_usage(options.error().what);
  }
  std::string log;
  auto r = manager_.migrate_speaker(addr.value(), target_.target_url,
                                    target_.proxy_url, options.value(),
                                    method.value(), log);
  if (r.is_ok()) {
    log += "Reboot the speaker (speaker-ctrl reboot <addr>) to apply the "
           "changes.\n";
  }
  return report(fmt::format("Migration via {}", setup::to_string(method.value())),
                log, std::move(r));
}

monad::MyVoidResult MigrationHandler::handle_revert() {
  auto addr = device_arg(1);
  if (addr.is_err()) {
    return monad::MyVoidResult::Err(addr.error());
  }
  std::string log;
  auto r = manager_.revert_migration(addr.value(), log);
  return report("Revert", log, std::move(r));
}

monad::MyVoidResult MigrationHandler::handle_backup() {
  auto addr = device_arg(1);
  if (addr.is_err()) {
    return monad::MyVoidResult::Err(addr.error());
  }
  if (off_device_) {
    auto dir = manager_.backup_config_off_device(addr.value());
    if (dir.is_err()) {
      return monad::MyVoidResult::Err(dir.error());
    }
    return report("Backup",
                  fmt::format("Saved backup to {}\n", dir.value().string()),
                  monad::MyVoidResult::Ok());
  }
  std::string log;
  auto r = manager_.backup_config(addr.value(), log);
  return report("Backup", log, std::move(r));
}

monad::MyVoidResult MigrationHandler::handle_trust_ca() {
  auto addr = device_arg(1);
  if (addr.is_err()) {
    return monad::MyVoidResult::Err(addr.error());
  }
  std::string log;
  auto r = manager_.trust_ca_cert(addr.value(), log);
  return report("CA injection", log, std::move(r));
}

monad::MyVoidResult MigrationHandler::handle_reboot() {
  auto addr = device_arg(1);
  if (addr.is_err()) {
    return monad::MyVoidResult::Err(addr.error());
  }
  std::string log;
  auto r = manager_.reboot(addr.value(), log);
  return report("Reboot", log, std::move(r));
}

monad::MyVoidResult MigrationHandler::handle_remote_services() {
  auto action = device_arg(1);
  auto addr = device_arg(2);
  if (action.is_err() || addr.is_err()) {
    return show_usage();
  }
  std::string log;
  if (action.value() == "enable") {
    auto r = manager_.ensure_remote_services(addr.value(), log);
    return report("Enabling remote services", log, std::move(r));
  } else if (action.value() == "disable") {
    auto r = manager_.remove_remote_services(addr.value(), log);
    return report("Disabling remote services", log, std::move(r));
  }
  return show_usage(
      fmt::format("Unknown remote-services action: {}", action.value()));
}

monad::MyVoidResult MigrationHandler::handle_resolve() {
  auto host = device_arg(1);
  if (host.is_err()) {
    return monad::MyVoidResult::Err(host.error());
  }
  output_.out() << manager_.get_resolved_ip(host.value()) << std::endl;
  return monad::MyVoidResult::Ok();
}

} // namespace speakerctrl
