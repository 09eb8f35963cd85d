#pragma once

#include <boost/json.hpp>

#include "setup/migration_types.hpp"
#include "setup/private_config.hpp"

namespace speakerctrl::setup {

namespace json = boost::json;

inline void tag_invoke(json::value_from_tag, json::value &v,
                       PrivateConfig const &x) {
  json::object o;
  o["marge_server_url"] = x.marge_server_url;
  o["stats_server_url"] = x.stats_server_url;
  o["sw_update_url"] = x.sw_update_url;
  o["bmx_registry_url"] = x.bmx_registry_url;
  o["use_pandora_production_server"] = x.use_pandora_production_server;
  o["is_zeroconf_enabled"] = x.is_zeroconf_enabled;
  o["save_marge_customer_report"] = x.save_marge_customer_report;
  v = std::move(o);
}

inline void tag_invoke(json::value_from_tag, json::value &v,
                       MigrationSummary const &x) {
  json::object o;
  o["ssh_success"] = x.ssh_success;
  o["current_config"] = x.current_config;
  if (!x.original_config.empty()) o["original_config"] = x.original_config;
  o["planned_config"] = x.planned_config;
  if (x.parsed_current_config) {
    o["parsed_current_config"] = json::value_from(*x.parsed_current_config);
  }
  o["planned_hosts"] = x.planned_hosts;
  o["planned_resolv"] = x.planned_resolv;
  o["remote_services_enabled"] = x.remote_services_enabled;
  o["remote_services_persistent"] = x.remote_services_persistent;
  o["remote_services_found"] = json::value_from(x.remote_services_found);
  o["device_name"] = x.device_name;
  o["device_model"] = x.device_model;
  o["device_serial"] = x.device_serial;
  o["device_id"] = x.device_id;
  o["account_id"] = x.account_id;
  o["firmware_version"] = x.firmware_version;
  o["ca_cert_trusted"] = x.ca_cert_trusted;
  o["server_https_url"] = x.server_https_url;
  o["current_resolv_conf"] = x.current_resolv_conf;
  o["current_hosts"] = x.current_hosts;
  o["dns_hook_installed"] = x.dns_hook_installed;
  o["target_url"] = x.target_url;
  o["is_migrated"] = x.is_migrated;
  v = std::move(o);
}

}  // namespace speakerctrl::setup
