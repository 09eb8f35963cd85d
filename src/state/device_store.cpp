#include "state/device_store.hpp"

#include <sqlite3.h>

#include <system_error>

#include "my_error_codes.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace {
constexpr const char kDnsEnabledKey[] = "dns.enabled";
constexpr const char kDnsBindAddrKey[] = "dns.bind_addr";

constexpr const char kCreateDevicesSql[] = R"SQL(
CREATE TABLE IF NOT EXISTS devices (
  device_id TEXT PRIMARY KEY,
  ip_address TEXT NOT NULL,
  name TEXT NOT NULL DEFAULT '',
  product_code TEXT NOT NULL DEFAULT '',
  serial_number TEXT NOT NULL DEFAULT '',
  account_id TEXT NOT NULL DEFAULT '',
  firmware_version TEXT NOT NULL DEFAULT '',
  updated_at INTEGER NOT NULL DEFAULT (strftime('%s','now'))
);
)SQL";

constexpr const char kCreateSettingsSql[] = R"SQL(
CREATE TABLE IF NOT EXISTS settings (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL,
  updated_at INTEGER NOT NULL DEFAULT (strftime('%s','now'))
);
)SQL";

constexpr const char kSelectDevicesSql[] = R"SQL(
SELECT device_id, ip_address, name, product_code, serial_number, account_id,
       firmware_version
FROM devices ORDER BY name, device_id;
)SQL";

constexpr const char kSelectDeviceByAddressSql[] = R"SQL(
SELECT device_id, ip_address, name, product_code, serial_number, account_id,
       firmware_version
FROM devices WHERE ip_address = ?1 OR device_id = ?1 LIMIT 1;
)SQL";

constexpr const char kUpsertDeviceSql[] = R"SQL(
INSERT INTO devices(device_id, ip_address, name, product_code, serial_number,
                    account_id, firmware_version, updated_at)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, strftime('%s','now'))
ON CONFLICT(device_id) DO UPDATE SET
  ip_address = excluded.ip_address,
  name = excluded.name,
  product_code = excluded.product_code,
  serial_number = excluded.serial_number,
  account_id = excluded.account_id,
  firmware_version = excluded.firmware_version,
  updated_at = excluded.updated_at;
)SQL";

constexpr const char kDeleteDeviceSql[] = R"SQL(
DELETE FROM devices WHERE device_id = ?1;
)SQL";

constexpr const char kUpsertSettingSql[] = R"SQL(
INSERT INTO settings(key, value, updated_at)
VALUES(?1, ?2, strftime('%s','now'))
ON CONFLICT(key) DO UPDATE SET
  value = excluded.value,
  updated_at = excluded.updated_at;
)SQL";

constexpr const char kSelectSettingSql[] = R"SQL(
SELECT value FROM settings WHERE key = ?1 LIMIT 1;
)SQL";

std::string column_text(sqlite3_stmt *stmt, int col) {
  const unsigned char *text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char *>(text) : std::string{};
}

// Path component safe for a directory name.
std::string sanitize_component(const std::string &raw) {
  std::string out;
  for (char c : raw) {
    if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' ||
        c == '.') {
      out.push_back(c);
    } else {
      out.push_back('_');
    }
  }
  if (out.empty() || out == "." || out == "..") {
    out = "unknown";
  }
  return out;
}
} // namespace

namespace speakerctrl {

bool DnsSettings::binds_port_53() const {
  auto addr = stringutil::trimmed(bind_addr);
  if (addr == "53") {
    return true;
  }
  return addr.size() >= 3 && addr.compare(addr.size() - 3, 3, ":53") == 0;
}

SqliteDeviceStore::SqliteDeviceStore(
    ISpeakerctrlConfigProvider &config_provider)
    : config_provider_(config_provider) {}

SqliteDeviceStore::~SqliteDeviceStore() {
  std::scoped_lock lock(mutex_);
  close_db();
}

bool SqliteDeviceStore::available() const {
  std::scoped_lock lock(mutex_);
  return ensure_initialized();
}

monad::MyResult<std::vector<DeviceRecord>>
SqliteDeviceStore::list_devices() const {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return monad::MyResult<std::vector<DeviceRecord>>::Err(monad::make_error(
        my_errors::GENERAL::FILE_READ_WRITE, "Device database unavailable"));
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kSelectDevicesSql, -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return monad::MyResult<std::vector<DeviceRecord>>::Err(
        monad::make_error(my_errors::GENERAL::UNEXPECTED_RESULT,
                          "Failed to prepare device query"));
  }
  std::vector<DeviceRecord> devices;
  int rc = SQLITE_OK;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    devices.push_back(read_device_row(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return monad::MyResult<std::vector<DeviceRecord>>::Err(monad::make_error(
        my_errors::GENERAL::UNEXPECTED_RESULT, "Failed to read devices"));
  }
  return monad::MyResult<std::vector<DeviceRecord>>::Ok(std::move(devices));
}

std::optional<DeviceRecord>
SqliteDeviceStore::find_device_by_address(const std::string &address) const {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::nullopt;
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kSelectDeviceByAddressSql, -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, address.c_str(), -1, SQLITE_TRANSIENT);
  std::optional<DeviceRecord> result;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    result = read_device_row(stmt);
  }
  sqlite3_finalize(stmt);
  return result;
}

std::optional<std::string>
SqliteDeviceStore::save_device(const DeviceRecord &device) {
  if (device.device_id.empty()) {
    return std::string{"device_id is required"};
  }
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{"Device database unavailable"};
  }
  return with_transaction([&]() -> std::optional<std::string> {
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kUpsertDeviceSql, -1, &stmt, nullptr) !=
        SQLITE_OK) {
      return std::string{"Failed to prepare device upsert"};
    }
    const std::string *fields[] = {
        &device.device_id,     &device.ip_address, &device.name,
        &device.product_code,  &device.serial_number,
        &device.account_id,    &device.firmware_version};
    for (int i = 0; i < 7; ++i) {
      sqlite3_bind_text(stmt, i + 1, fields[i]->c_str(), -1, SQLITE_TRANSIENT);
    }
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      return std::string{"Failed to save device "} + device.device_id;
    }
    return std::nullopt;
  });
}

std::optional<std::string>
SqliteDeviceStore::remove_device(const std::string &device_id) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{"Device database unavailable"};
  }
  return with_transaction([&]() -> std::optional<std::string> {
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, kDeleteDeviceSql, -1, &stmt, nullptr) !=
        SQLITE_OK) {
      return std::string{"Failed to prepare device delete"};
    }
    sqlite3_bind_text(stmt, 1, device_id.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      return std::string{"Failed to delete device "} + device_id;
    }
    if (sqlite3_changes(db_) == 0) {
      return std::string{"No such device: "} + device_id;
    }
    return std::nullopt;
  });
}

DnsSettings SqliteDeviceStore::get_dns_settings() const {
  std::scoped_lock lock(mutex_);
  DnsSettings settings;
  if (!ensure_initialized()) {
    return settings;
  }
  if (auto enabled = get_setting(kDnsEnabledKey)) {
    settings.enabled = *enabled == "true" || *enabled == "1";
  }
  if (auto bind = get_setting(kDnsBindAddrKey)) {
    settings.bind_addr = *bind;
  }
  return settings;
}

std::optional<std::string>
SqliteDeviceStore::save_dns_settings(const DnsSettings &settings) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{"Device database unavailable"};
  }
  return with_transaction([&]() -> std::optional<std::string> {
    if (auto err =
            upsert_setting(kDnsEnabledKey, settings.enabled ? "true" : "false")) {
      return err;
    }
    return upsert_setting(kDnsBindAddrKey, settings.bind_addr);
  });
}

std::filesystem::path
SqliteDeviceStore::account_device_dir(const std::string &account,
                                      const std::string &device) const {
  const auto &cfg = config_provider_.get();
  std::filesystem::path data_dir = cfg.data_dir;
  if (data_dir.empty()) {
    data_dir = cfg.runtime_dir / "data";
  }
  return data_dir / sanitize_component(account) / "devices" /
         sanitize_component(device);
}

bool SqliteDeviceStore::ensure_initialized() const {
  if (initialized_) {
    return db_ != nullptr;
  }

  const auto runtime_dir = config_provider_.get().runtime_dir;
  if (runtime_dir.empty()) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "DeviceStore disabled: runtime_dir not configured";
    initialized_ = true;
    return false;
  }

  auto state_dir = runtime_dir / "state";
  std::error_code ec;
  std::filesystem::create_directories(state_dir, ec);
  if (ec) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Failed to create state directory '" << state_dir
        << "': " << ec.message();
    initialized_ = true;
    return false;
  }

  db_path_ = state_dir / "speakers.db";
  int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(db_path_.string().c_str(), &db_, flags, nullptr) !=
      SQLITE_OK) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Failed to open speakers.db: " << sqlite3_errmsg(db_);
    close_db();
    initialized_ = true;
    return false;
  }

  sqlite3_busy_timeout(db_, 5000);
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr,
                   &errmsg) != SQLITE_OK) {
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Failed to enable WAL mode: " << (errmsg ? errmsg : "unknown");
    sqlite3_free(errmsg);
    errmsg = nullptr;
  }
  for (const char *sql : {kCreateDevicesSql, kCreateSettingsSql}) {
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
      BOOST_LOG_SEV(lg, trivial::error)
          << "Failed to initialize schema: " << (errmsg ? errmsg : "unknown");
      sqlite3_free(errmsg);
      close_db();
      initialized_ = true;
      return false;
    }
  }

  initialized_ = true;
  return true;
}

void SqliteDeviceStore::close_db() const {
  if (db_) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

std::optional<std::string>
SqliteDeviceStore::get_setting(const std::string &key) const {
  if (!db_) {
    return std::nullopt;
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kSelectSettingSql, -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return std::nullopt;
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  std::optional<std::string> result;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    result = column_text(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return result;
}

std::optional<std::string>
SqliteDeviceStore::upsert_setting(const std::string &key,
                                  const std::string &value) const {
  if (!db_) {
    return std::string{"Device database unavailable"};
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, kUpsertSettingSql, -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return std::string{"Failed to prepare settings upsert"};
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, value.c_str(), -1, SQLITE_TRANSIENT);
  int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return std::string{"Failed to upsert setting "} + key;
  }
  return std::nullopt;
}

std::optional<std::string> SqliteDeviceStore::with_transaction(
    const std::function<std::optional<std::string>()> &body) const {
  if (!db_) {
    return std::string{"Device database unavailable"};
  }
  char *errmsg = nullptr;
  if (sqlite3_exec(db_, "BEGIN IMMEDIATE TRANSACTION;", nullptr, nullptr,
                   &errmsg) != SQLITE_OK) {
    std::string err = errmsg ? errmsg : "Failed to begin transaction";
    sqlite3_free(errmsg);
    return err;
  }

  auto body_err = body();
  if (body_err) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    return body_err;
  }

  if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
    std::string err = errmsg ? errmsg : "Failed to commit transaction";
    sqlite3_free(errmsg);
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    return err;
  }
  return std::nullopt;
}

DeviceRecord SqliteDeviceStore::read_device_row(sqlite3_stmt *stmt) {
  DeviceRecord d;
  d.device_id = column_text(stmt, 0);
  d.ip_address = column_text(stmt, 1);
  d.name = column_text(stmt, 2);
  d.product_code = column_text(stmt, 3);
  d.serial_number = column_text(stmt, 4);
  d.account_id = column_text(stmt, 5);
  d.firmware_version = column_text(stmt, 6);
  return d;
}

} // namespace speakerctrl
