#include <gtest/gtest.h>

#include "fake_speaker.hpp"
#include "setup/migration_types.hpp"
#include "setup/private_config.hpp"

using namespace speakerctrl::setup;

TEST(PrivateConfigTest, PlannedForStripsTrailingSlash) {
  auto pc = PrivateConfig::planned_for("http://192.168.1.50:8000/");
  EXPECT_EQ(pc.marge_server_url, "http://192.168.1.50:8000/marge");
  EXPECT_EQ(pc.stats_server_url, "http://192.168.1.50:8000");
  EXPECT_EQ(pc.sw_update_url, "http://192.168.1.50:8000/updates/soundtouch");
  EXPECT_EQ(pc.bmx_registry_url,
            "http://192.168.1.50:8000/bmx/registry/v1/services");
  EXPECT_TRUE(pc.use_pandora_production_server);
  EXPECT_TRUE(pc.is_zeroconf_enabled);
  EXPECT_FALSE(pc.save_marge_customer_report);
}

TEST(PrivateConfigTest, ParsesStockDevice) {
  auto r = parse_private_config(testinfra::kStockPrivateConfig);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_EQ(r.value().marge_server_url, "https://streaming.bose.com");
  EXPECT_EQ(r.value().bmx_registry_url,
            "https://content.api.bose.io/bmx/registry/v1/services");
  EXPECT_FALSE(r.value().save_marge_customer_report);
}

TEST(PrivateConfigTest, SerializedDocumentParsesBack) {
  auto pc = PrivateConfig::planned_for("http://svc.local:8000");
  pc.marge_server_url = "http://svc.local:8000/marge?a=1&b=2";
  auto xml = serialize_private_config(pc);
  EXPECT_NE(xml.find("&amp;"), std::string::npos);
  EXPECT_EQ(xml.rfind("<?xml", 0), 0u);

  auto back = parse_private_config(xml);
  ASSERT_TRUE(back.is_ok());
  EXPECT_EQ(back.value().marge_server_url, pc.marge_server_url);
  EXPECT_EQ(back.value().sw_update_url, pc.sw_update_url);
}

TEST(PrivateConfigTest, RejectsForeignDocuments) {
  EXPECT_TRUE(parse_private_config("<info deviceID=\"x\"/>").is_err());
  EXPECT_TRUE(parse_private_config("cat: can't open").is_err());
}

TEST(PrivateConfigTest, RejectsNonBooleanFlags) {
  auto r = parse_private_config(
      "<SoundTouchSdkPrivateCfg><isZeroconfEnabled>maybe</isZeroconfEnabled>"
      "</SoundTouchSdkPrivateCfg>");
  ASSERT_TRUE(r.is_err());
  EXPECT_NE(r.error().what.find("isZeroconfEnabled"), std::string::npos);
}

TEST(PrivateConfigTest, WrapThroughProxy) {
  EXPECT_EQ(wrap_through_proxy("http://proxy:8000/", "https://streaming.bose.com"),
            "http://proxy:8000/proxy/https://streaming.bose.com");
}

TEST(MigrationMethodTest, ParseKnownNames) {
  auto hosts = parse_migration_method("hosts");
  ASSERT_TRUE(hosts.is_ok());
  EXPECT_EQ(hosts.value(), MigrationMethod::Hosts);
  EXPECT_EQ(to_string(MigrationMethod::Resolv), "resolv");
  EXPECT_TRUE(parse_migration_method("carrier-pigeon").is_err());
}

TEST(SubsystemRoutingTest, OnlyUpstreamEnablesRouting) {
  ProxyOptions options{{"marge", "upstream"}, {"stats", "direct"}};
  auto routing = SubsystemRouting::from_options(options);
  EXPECT_TRUE(routing.marge);
  EXPECT_FALSE(routing.stats);
  EXPECT_TRUE(routing.any());
  EXPECT_FALSE(SubsystemRouting::from_options({}).any());
}
