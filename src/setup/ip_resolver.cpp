#include "setup/ip_resolver.hpp"

#include <boost/asio.hpp>

#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace speakerctrl::setup {

std::string resolve_locally(const std::string &host) {
  boost::asio::io_context ioc;
  boost::asio::ip::tcp::resolver resolver(ioc);
  boost::system::error_code ec;
  auto results = resolver.resolve(host, "", ec);
  if (ec) {
    BOOST_LOG_SEV(app_logger(), trivial::debug)
        << "local resolve of " << host << " failed: " << ec.message();
    return {};
  }
  std::string fallback;
  for (const auto &entry : results) {
    auto addr = entry.endpoint().address();
    if (addr.is_v4()) {
      return addr.to_string();
    }
    if (fallback.empty()) {
      fallback = addr.to_string();
    }
  }
  return fallback;
}

std::string resolve_ip(const std::string &host, remote::IRemoteShell *shell) {
  if (host.empty() || stringutil::is_ip_literal(host)) {
    return host;
  }
  if (shell) {
    // "PING svc (192.168.1.10): 56 data bytes"
    auto ping = shell->run(remote::RemoteCommand::exec({"ping", "-c", "1", host}));
    if (auto inner = stringutil::between_parens(ping.output);
        inner && stringutil::is_ip_literal(*inner)) {
      BOOST_LOG_SEV(app_logger(), trivial::debug)
          << host << " resolved on device to " << *inner;
      return *inner;
    }
  }
  if (auto local = resolve_locally(host); !local.empty()) {
    return local;
  }
  BOOST_LOG_SEV(app_logger(), trivial::warning)
      << "could not resolve " << host << ", using it verbatim";
  return host;
}

} // namespace speakerctrl::setup
