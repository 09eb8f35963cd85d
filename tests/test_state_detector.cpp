#include <gtest/gtest.h>

#include "fake_speaker.hpp"
#include "setup/ip_resolver.hpp"
#include "setup/migration_types.hpp"
#include "setup/state_detector.hpp"

using namespace speakerctrl::setup;

namespace {

MigrationSummary reachable_summary() {
  MigrationSummary s;
  s.ssh_success = true;
  s.current_hosts = "127.0.0.1\tlocalhost\n";
  s.current_resolv_conf = "nameserver 192.168.1.1\n";
  return s;
}

} // namespace

TEST(StateDetectorTest, UnreachableIsNeverMigrated) {
  MigrationSummary s;
  s.parsed_current_config = PrivateConfig::planned_for("http://svc:8000");
  s.ca_cert_trusted = true;
  EXPECT_FALSE(is_migrated(s, "svc"));
}

TEST(StateDetectorTest, ConfigPointingAtTarget) {
  auto s = reachable_summary();
  s.parsed_current_config = PrivateConfig::planned_for("http://svc:8000");
  EXPECT_TRUE(is_migrated(s, "svc"));
  EXPECT_FALSE(is_migrated(s, "other-host"));
}

TEST(StateDetectorTest, HostsNeedTrustedCa) {
  auto s = reachable_summary();
  s.current_hosts += "192.168.1.50\tstreaming.bose.com\n";
  EXPECT_FALSE(is_migrated(s, "svc"));
  s.ca_cert_trusted = true;
  EXPECT_TRUE(is_migrated(s, "svc"));
}

TEST(StateDetectorTest, DnsHookWithTrustedCa) {
  auto s = reachable_summary();
  s.ca_cert_trusted = true;
  EXPECT_FALSE(is_migrated(s, "svc"));
  s.dns_hook_installed = true;
  EXPECT_TRUE(is_migrated(s, "svc"));
}

TEST(StateDetectorTest, ResolvConfNamingTarget) {
  auto s = reachable_summary();
  s.ca_cert_trusted = true;
  s.current_resolv_conf = "nameserver 192.168.1.50\n";
  EXPECT_TRUE(is_migrated(s, "192.168.1.50"));
  EXPECT_FALSE(is_migrated(s, ""));
}

TEST(IpResolverTest, LiteralsPassThrough) {
  auto speaker = testinfra::FakeSpeaker::stock();
  EXPECT_EQ(resolve_ip("192.168.1.50", speaker.get()), "192.168.1.50");
  EXPECT_EQ(resolve_ip("", speaker.get()), "");
  EXPECT_TRUE(speaker->commands.empty());
}

TEST(IpResolverTest, DeviceAnswerWins) {
  auto speaker = testinfra::FakeSpeaker::stock();
  speaker->ping_answers["svc.lan"] = "192.168.1.77";
  EXPECT_EQ(resolve_ip("svc.lan", speaker.get()), "192.168.1.77");
  EXPECT_TRUE(speaker->ran("ping -c 1 svc.lan"));
}
