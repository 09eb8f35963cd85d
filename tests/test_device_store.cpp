#include <gtest/gtest.h>

#include <filesystem>
#include <random>

#include "fake_speaker.hpp"
#include "state/device_store.hpp"

namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir(const std::string &prefix) {
  auto base = fs::temp_directory_path();
  std::mt19937_64 rng(std::random_device{}());
  for (int i = 0; i < 16; ++i) {
    auto candidate = base / (prefix + std::to_string(rng()));
    std::error_code ec;
    if (fs::create_directories(candidate, ec)) {
      return candidate;
    }
  }
  throw std::runtime_error("Unable to create temporary directory");
}

class DeviceStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = make_temp_dir("speakerctrl-store-");
    provider_.config.runtime_dir = dir_;
    provider_.config.data_dir = dir_ / "data";
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }

  fs::path dir_;
  testinfra::FakeConfigProvider provider_;
};

speakerctrl::DeviceRecord living_room() {
  speakerctrl::DeviceRecord d;
  d.device_id = "A0F6FD123456";
  d.ip_address = "192.168.1.20";
  d.name = "Living Room";
  d.product_code = "SoundTouch 10";
  d.serial_number = "069231P63364828AE";
  d.account_id = "3230304";
  d.firmware_version = "27.0.6.46330.5043500";
  return d;
}

} // namespace

TEST_F(DeviceStoreTest, SaveFindAndRemove) {
  speakerctrl::SqliteDeviceStore store(provider_);
  ASSERT_TRUE(store.available());
  EXPECT_FALSE(store.save_device(living_room()).has_value());

  auto by_ip = store.find_device_by_address("192.168.1.20");
  ASSERT_TRUE(by_ip.has_value());
  EXPECT_EQ(by_ip->name, "Living Room");
  EXPECT_EQ(by_ip->account_id, "3230304");

  auto by_id = store.find_device_by_address("A0F6FD123456");
  ASSERT_TRUE(by_id.has_value());

  auto list = store.list_devices();
  ASSERT_TRUE(list.is_ok());
  EXPECT_EQ(list.value().size(), 1u);

  EXPECT_FALSE(store.remove_device("A0F6FD123456").has_value());
  EXPECT_FALSE(store.find_device_by_address("192.168.1.20").has_value());
}

TEST_F(DeviceStoreTest, SaveUpdatesExistingRecord) {
  speakerctrl::SqliteDeviceStore store(provider_);
  auto d = living_room();
  ASSERT_FALSE(store.save_device(d).has_value());
  d.ip_address = "192.168.1.21";
  ASSERT_FALSE(store.save_device(d).has_value());

  auto list = store.list_devices();
  ASSERT_TRUE(list.is_ok());
  ASSERT_EQ(list.value().size(), 1u);
  EXPECT_EQ(list.value().front().ip_address, "192.168.1.21");
}

TEST_F(DeviceStoreTest, DeviceIdIsRequired) {
  speakerctrl::SqliteDeviceStore store(provider_);
  speakerctrl::DeviceRecord d;
  d.ip_address = "192.168.1.20";
  EXPECT_TRUE(store.save_device(d).has_value());
}

TEST_F(DeviceStoreTest, DnsSettingsPersistAcrossInstances) {
  {
    speakerctrl::SqliteDeviceStore store(provider_);
    auto defaults = store.get_dns_settings();
    EXPECT_FALSE(defaults.enabled);
    EXPECT_EQ(defaults.bind_addr, ":53");
    EXPECT_FALSE(
        store.save_dns_settings({true, "0.0.0.0:5353"}).has_value());
  }
  speakerctrl::SqliteDeviceStore reopened(provider_);
  auto settings = reopened.get_dns_settings();
  EXPECT_TRUE(settings.enabled);
  EXPECT_EQ(settings.bind_addr, "0.0.0.0:5353");
  EXPECT_FALSE(settings.binds_port_53());
}

TEST_F(DeviceStoreTest, AccountDeviceDirUnderDataDir) {
  speakerctrl::SqliteDeviceStore store(provider_);
  auto dir = store.account_device_dir("3230304", "069231P63364828AE");
  EXPECT_EQ(dir, dir_ / "data" / "3230304" / "devices" / "069231P63364828AE");
}

TEST(DnsSettingsTest, Port53Detection) {
  EXPECT_TRUE((speakerctrl::DnsSettings{true, ":53"}.binds_port_53()));
  EXPECT_TRUE((speakerctrl::DnsSettings{true, "0.0.0.0:53"}.binds_port_53()));
  EXPECT_TRUE((speakerctrl::DnsSettings{true, "53"}.binds_port_53()));
  EXPECT_FALSE((speakerctrl::DnsSettings{true, ":5353"}.binds_port_53()));
  EXPECT_FALSE((speakerctrl::DnsSettings{true, ":153"}.binds_port_53()));
}
