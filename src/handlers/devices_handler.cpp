#include "handlers/devices_handler.hpp"

#include <fmt/format.h>

#include <sstream>

#include "my_error_codes.hpp"

namespace speakerctrl {

DevicesHandler::DevicesHandler(IDeviceStore &device_store, CliCtx &cli_ctx,
                               customio::ConsoleOutput &output)
    : device_store_(device_store), cli_ctx_(cli_ctx), output_(output),
      opt_desc_("devices subcommand options") {
  opt_desc_.add_options()                                             //
      ("id", po::value<std::string>(&record_.device_id), "device id") //
      ("ip", po::value<std::string>(&record_.ip_address), "ip address") //
      ("name", po::value<std::string>(&record_.name), "display name")   //
      ("model", po::value<std::string>(&record_.product_code),
       "product code")                                               //
      ("serial", po::value<std::string>(&record_.serial_number),
       "serial number")                                              //
      ("account", po::value<std::string>(&record_.account_id),
       "account id")                                                 //
      ("firmware", po::value<std::string>(&record_.firmware_version),
       "firmware version");
}

std::string DevicesHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage:\n"
         "speaker-ctrl devices list\n"
         "speaker-ctrl devices add --id ID --ip ADDR [--name N] [--model M] "
         "[--serial S] [--account A] [--firmware F]\n"
         "speaker-ctrl devices remove --id ID\n\n"
      << opt_desc_ << std::endl;
  return oss.str();
}

monad::MyVoidResult DevicesHandler::show_usage(const std::string &msg) {
  if (!msg.empty()) {
    output_.error() << msg << std::endl;
  }
  return monad::MyVoidResult::Err(
      monad::make_error(my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
}

monad::MyVoidResult DevicesHandler::start() {
  if (auto r = parse_handler_options(cli_ctx_.unrecognized, opt_desc_, vm_,
                                     args_);
      r.is_err()) {
    return show_usage(r.error().what);
  }
  const std::string action = args_.size() > 1 ? args_[1] : "list";
  if (action == "list") {
    return handle_list();
  } else if (action == "add") {
    return handle_add();
  } else if (action == "remove") {
    return handle_remove();
  }
  return show_usage(fmt::format("Unknown devices action: {}", action));
}

monad::MyVoidResult DevicesHandler::handle_list() {
  auto devices = device_store_.list_devices();
  if (devices.is_err()) {
    return monad::MyVoidResult::Err(devices.error());
  }
  if (devices.value().empty()) {
    output_.info() << "No devices stored." << std::endl;
    return monad::MyVoidResult::Ok();
  }
  auto &out = output_.out();
  out << fmt::format("{:<24} {:<16} {:<20} {:<12} {:<16} {}\n", "ID", "IP",
                     "NAME", "MODEL", "SERIAL", "FIRMWARE");
  for (const auto &d : devices.value()) {
    out << fmt::format("{:<24} {:<16} {:<20} {:<12} {:<16} {}\n", d.device_id,
                       d.ip_address, d.name, d.product_code, d.serial_number,
                       d.firmware_version);
  }
  out.flush();
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult DevicesHandler::handle_add() {
  if (record_.device_id.empty() || record_.ip_address.empty()) {
    return show_usage("--id and --ip are required");
  }
  if (auto err = device_store_.save_device(record_)) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::GENERAL::CREATE_FAILED, *err));
  }
  output_.printer().green(
      fmt::format("Saved device {} ({})", record_.device_id,
                  record_.ip_address));
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult DevicesHandler::handle_remove() {
  if (record_.device_id.empty()) {
    return show_usage("--id is required");
  }
  if (auto err = device_store_.remove_device(record_.device_id)) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::GENERAL::DELETE_FAILED, *err));
  }
  output_.printer().green(fmt::format("Removed device {}", record_.device_id));
  return monad::MyVoidResult::Ok();
}

} // namespace speakerctrl
