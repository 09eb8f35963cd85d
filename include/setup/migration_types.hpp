#pragma once

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "result_monad.hpp"
#include "setup/private_config.hpp"

namespace speakerctrl::setup {

// On-device locations. The hook and label markers are shared with devices
// prepared by earlier tooling, so they must not change.
namespace paths {
inline constexpr char kPrivateConfig[] =
    "/opt/Bose/etc/SoundTouchSdkPrivateCfg.xml";
inline constexpr char kHosts[] = "/etc/hosts";
inline constexpr char kResolvConf[] = "/etc/resolv.conf";
inline constexpr char kCaBundle[] = "/etc/pki/tls/certs/ca-bundle.crt";
inline constexpr char kPriorityResolv[] = "/mnt/nv/aftertouch.resolv.conf";
inline constexpr char kPersistentDir[] = "/mnt/nv";
inline constexpr char kBootScript[] = "/mnt/nv/rc.local";
inline constexpr char kDhcpDefaultScript[] = "/etc/udhcpc.d/50default";
inline constexpr char kDhcpBoseScript[] = "/opt/Bose/udhcpc.script";
inline constexpr char kTestCa[] = "/tmp/soundtouch-test-ca.crt";
inline constexpr std::array<const char *, 3> kRemoteServices = {
    "/etc/remote_services", "/mnt/nv/remote_services",
    "/tmp/remote_services"};
} // namespace paths

inline constexpr char kOriginalSuffix[] = ".original";
inline constexpr char kCaLabel[] = "# AfterTouch";
inline constexpr char kHookComment[] = "# Aftertouch DNS hook";
inline constexpr char kSelfTestDomain[] = "custom-test-api.bose.fake";
inline constexpr char kDnsProbeDomain[] = "aftertouch.test";

// Cloud endpoints redirected by the hosts and DNS strategies.
inline const std::vector<std::string> &vendor_domains() {
  static const std::vector<std::string> domains = {
      "streaming.bose.com",     "updates.bose.com",
      "stats.bose.com",         "bmx.bose.com",
      "content.api.bose.io",    "events.api.bosecm.com",
      "bose-prod.apigee.net",   "worldwide.bose.com",
      "music.api.bose.com"};
  return domains;
}

inline std::string original_of(const std::string &path) {
  return path + kOriginalSuffix;
}

enum class MigrationMethod { Xml, Hosts, Resolv };

std::string_view to_string(MigrationMethod method);
monad::MyResult<MigrationMethod> parse_migration_method(std::string_view name);

// Subsystem name ("marge", "stats", "sw_update", "bmx") -> "upstream" to
// route that subsystem through the local proxy to its current endpoint.
using ProxyOptions = std::map<std::string, std::string>;

struct SubsystemRouting {
  bool marge{false};
  bool stats{false};
  bool sw_update{false};
  bool bmx{false};

  bool any() const { return marge || stats || sw_update || bmx; }

  static SubsystemRouting from_options(const ProxyOptions &options);
};

struct MigrationSummary {
  bool ssh_success{false};
  // Raw config text, or a diagnostic when the device could not be read.
  std::string current_config;
  std::string original_config;
  std::string planned_config;
  std::optional<PrivateConfig> parsed_current_config;
  std::string planned_hosts;
  std::string planned_resolv;
  bool remote_services_enabled{false};
  bool remote_services_persistent{false};
  std::vector<std::string> remote_services_found;
  std::string device_name;
  std::string device_model;
  std::string device_serial;
  std::string device_id;
  std::string account_id;
  std::string firmware_version;
  bool ca_cert_trusted{false};
  std::string server_https_url;
  std::string current_resolv_conf;
  std::string current_hosts;
  bool dns_hook_installed{false};
  std::string target_url;
  bool is_migrated{false};
};

struct DnsStatus {
  bool running{false};
  std::string bind_addr;
};

} // namespace speakerctrl::setup
