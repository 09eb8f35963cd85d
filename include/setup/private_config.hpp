#pragma once

#include <string>
#include <string_view>

#include "result_monad.hpp"

namespace speakerctrl::setup {

// The speaker's cloud endpoint document (SoundTouchSdkPrivateCfg.xml).
struct PrivateConfig {
  std::string marge_server_url;  // account/catalog service
  std::string stats_server_url;  // usage statistics
  std::string sw_update_url;     // software update feed
  std::string bmx_registry_url;  // service registry
  bool use_pandora_production_server{true};
  bool is_zeroconf_enabled{true};
  bool save_marge_customer_report{false};

  bool operator==(const PrivateConfig &) const = default;

  // Endpoints of a self-hosted service rooted at target_url.
  static PrivateConfig planned_for(std::string_view target_url);
};

// Serialized document, including the XML declaration and a trailing newline.
std::string serialize_private_config(const PrivateConfig &config);

monad::MyResult<PrivateConfig> parse_private_config(std::string_view xml);

// "<proxy_url>/proxy/<current_url>", the form the local proxy forwards.
std::string wrap_through_proxy(std::string_view proxy_url,
                               std::string_view current_url);

} // namespace speakerctrl::setup
