#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <string>
#include <string_view>

#include "result_monad.hpp"

namespace speakerctrl {

// Identity the speaker reports on its local :8090/info endpoint.
struct LiveDeviceInfo {
  std::string device_id;
  std::string name;
  std::string type;
  std::string account_id;
  std::string firmware_version;
  std::string serial;
};

monad::MyResult<LiveDeviceInfo> parse_live_device_info(std::string_view xml);

class ILiveDeviceInfoClient {
public:
  virtual ~ILiveDeviceInfoClient() = default;

  virtual monad::MyResult<LiveDeviceInfo> fetch(const std::string &address) = 0;
};

class BeastLiveDeviceInfoClient : public ILiveDeviceInfoClient {
public:
  static constexpr unsigned short kInfoPort = 8090;

  explicit BeastLiveDeviceInfoClient(
      std::chrono::seconds timeout = std::chrono::seconds(5))
      : timeout_(timeout) {}

  monad::MyResult<LiveDeviceInfo> fetch(const std::string &address) override;

private:
  std::chrono::seconds timeout_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg;
};

} // namespace speakerctrl
