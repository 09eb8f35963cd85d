#include "device/live_device_info.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/xml_text.hpp"

namespace speakerctrl {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

monad::MyResult<LiveDeviceInfo> parse_live_device_info(std::string_view xml) {
  auto device_id = xmltext::attribute(xml, "info", "deviceID");
  if (!device_id) {
    return monad::MyResult<LiveDeviceInfo>::Err(
        monad::make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                          "device info response has no <info> element"));
  }
  LiveDeviceInfo info;
  info.device_id = *device_id;
  info.name = xmltext::element_text(xml, "name").value_or("");
  info.type = xmltext::element_text(xml, "type").value_or("");
  info.account_id = xmltext::element_text(xml, "margeAccountUUID").value_or("");

  std::string packaged_serial;
  for (const auto &component : xmltext::elements(xml, "component")) {
    auto category = xmltext::element_text(component, "componentCategory");
    if (!category) {
      continue;
    }
    if (*category == "SCM") {
      info.firmware_version =
          xmltext::element_text(component, "softwareVersion").value_or("");
      info.serial =
          xmltext::element_text(component, "serialNumber").value_or("");
    } else if (*category == "PackagedProduct") {
      packaged_serial =
          xmltext::element_text(component, "serialNumber").value_or("");
    }
  }
  if (info.serial.empty()) {
    info.serial = packaged_serial;
  }
  return monad::MyResult<LiveDeviceInfo>::Ok(std::move(info));
}

monad::MyResult<LiveDeviceInfo>
BeastLiveDeviceInfoClient::fetch(const std::string &address) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  beast::tcp_stream stream(ioc);
  beast::flat_buffer buffer;
  http::request<http::empty_body> req{http::verb::get, "/info", 11};
  req.set(http::field::host, address);
  req.set(http::field::user_agent, "speaker-ctrl");
  http::response<http::string_body> res;

  beast::error_code failure;
  std::string failed_step;
  bool done = false;
  auto fail = [&](const char *step, const beast::error_code &ec) {
    failed_step = step;
    failure = ec;
  };

  resolver.async_resolve(
      address, std::to_string(kInfoPort),
      [&](const beast::error_code &ec, tcp::resolver::results_type results) {
        if (ec) {
          return fail("resolve", ec);
        }
        stream.expires_after(timeout_);
        stream.async_connect(
            results, [&](const beast::error_code &ec,
                         const tcp::resolver::results_type::endpoint_type &) {
              if (ec) {
                return fail("connect", ec);
              }
              http::async_write(
                  stream, req, [&](const beast::error_code &ec, std::size_t) {
                    if (ec) {
                      return fail("write", ec);
                    }
                    http::async_read(
                        stream, buffer, res,
                        [&](const beast::error_code &ec, std::size_t) {
                          if (ec) {
                            return fail("read", ec);
                          }
                          done = true;
                          beast::error_code ignored;
                          stream.socket().shutdown(tcp::socket::shutdown_both,
                                                   ignored);
                        });
                  });
            });
      });
  // The handlers capture locals by reference; they only ever run inside
  // run_for, and ioc is declared first so it is destroyed after them.
  ioc.run_for(timeout_ + std::chrono::seconds(1));
  ioc.stop();
  if (!done && failed_step.empty()) {
    fail("request", beast::error::timeout);
  }

  if (!failed_step.empty()) {
    BOOST_LOG_SEV(lg, trivial::debug) << "device info " << failed_step
                                      << " failed for " << address << ": "
                                      << failure.message();
    return monad::MyResult<LiveDeviceInfo>::Err(monad::make_error(
        failure == beast::error::timeout ? my_errors::NETWORK::TIMEOUT_ERROR
                                         : my_errors::NETWORK::CONNECT_ERROR,
        fmt::format("{} {}:{}: {}", failed_step, address, kInfoPort,
                    failure.message())));
  }
  if (res.result() != http::status::ok) {
    return monad::MyResult<LiveDeviceInfo>::Err(monad::make_error(
        my_errors::NETWORK::BAD_STATUS,
        fmt::format("device info returned HTTP {}", res.result_int())));
  }
  return parse_live_device_info(res.body());
}

} // namespace speakerctrl
