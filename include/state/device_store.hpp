#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conf/speakerctrl_config.hpp"
#include "result_monad.hpp"

struct sqlite3;
struct sqlite3_stmt;

namespace speakerctrl {

struct DeviceRecord {
  std::string device_id;
  std::string ip_address;
  std::string name;
  std::string product_code;
  std::string serial_number;
  std::string account_id;
  std::string firmware_version;
};

struct DnsSettings {
  bool enabled{false};
  // "host:port", ":port" or just "port"
  std::string bind_addr{":53"};

  bool binds_port_53() const;
};

class IDeviceStore {
public:
  virtual ~IDeviceStore() = default;

  virtual monad::MyResult<std::vector<DeviceRecord>> list_devices() const = 0;
  virtual std::optional<DeviceRecord>
  find_device_by_address(const std::string &address) const = 0;
  virtual std::optional<std::string> save_device(const DeviceRecord &device) = 0;
  virtual std::optional<std::string>
  remove_device(const std::string &device_id) = 0;

  virtual DnsSettings get_dns_settings() const = 0;
  virtual std::optional<std::string>
  save_dns_settings(const DnsSettings &settings) = 0;

  // <data_dir>/<account>/devices/<device>
  virtual std::filesystem::path
  account_device_dir(const std::string &account,
                     const std::string &device) const = 0;
};

class SqliteDeviceStore : public IDeviceStore {
public:
  explicit SqliteDeviceStore(ISpeakerctrlConfigProvider &config_provider);
  ~SqliteDeviceStore() override;

  monad::MyResult<std::vector<DeviceRecord>> list_devices() const override;
  std::optional<DeviceRecord>
  find_device_by_address(const std::string &address) const override;
  std::optional<std::string> save_device(const DeviceRecord &device) override;
  std::optional<std::string>
  remove_device(const std::string &device_id) override;

  DnsSettings get_dns_settings() const override;
  std::optional<std::string>
  save_dns_settings(const DnsSettings &settings) override;

  std::filesystem::path
  account_device_dir(const std::string &account,
                     const std::string &device) const override;

  bool available() const;

private:
  bool ensure_initialized() const;
  void close_db() const;

  std::optional<std::string> get_setting(const std::string &key) const;
  std::optional<std::string> upsert_setting(const std::string &key,
                                            const std::string &value) const;
  std::optional<std::string>
  with_transaction(const std::function<std::optional<std::string>()> &body) const;

  static DeviceRecord read_device_row(sqlite3_stmt *stmt);

  ISpeakerctrlConfigProvider &config_provider_;
  mutable std::mutex mutex_;
  mutable std::filesystem::path db_path_;
  mutable sqlite3 *db_{nullptr};
  mutable bool initialized_{false};
  mutable boost::log::sources::severity_logger<boost::log::trivial::severity_level>
      lg;
};

} // namespace speakerctrl
