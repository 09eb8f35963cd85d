#include "setup/state_detector.hpp"

#include "setup/hosts_file.hpp"
#include "util/string_util.hpp"

namespace speakerctrl::setup {

bool is_migrated(const MigrationSummary &summary,
                 std::string_view target_host) {
  if (!summary.ssh_success) {
    return false;
  }
  if (!target_host.empty() && summary.parsed_current_config) {
    const auto &cfg = *summary.parsed_current_config;
    for (const auto *url : {&cfg.marge_server_url, &cfg.stats_server_url,
                            &cfg.sw_update_url, &cfg.bmx_registry_url}) {
      if (stringutil::contains(*url, target_host)) {
        return true;
      }
    }
  }

  if (!summary.ca_cert_trusted) {
    return false;
  }

  if (hosts_mentions_any(summary.current_hosts, vendor_domains())) {
    return true;
  }

  if (summary.dns_hook_installed) {
    return true;
  }
  return !target_host.empty() &&
         stringutil::contains(summary.current_resolv_conf, target_host);
}

} // namespace speakerctrl::setup
