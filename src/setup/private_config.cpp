#include "setup/private_config.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "util/string_util.hpp"
#include "util/xml_text.hpp"

namespace speakerctrl::setup {

namespace {

constexpr char kRootTag[] = "SoundTouchSdkPrivateCfg";

std::string strip_trailing_slash(std::string_view url) {
  std::string out(url);
  while (!out.empty() && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

std::optional<bool> parse_bool(const std::string &text) {
  auto value = stringutil::trimmed(text);
  if (value == "true" || value == "1") {
    return true;
  }
  if (value == "false" || value == "0") {
    return false;
  }
  return std::nullopt;
}

} // namespace

PrivateConfig PrivateConfig::planned_for(std::string_view target_url) {
  auto base = strip_trailing_slash(target_url);
  PrivateConfig pc;
  pc.marge_server_url = base + "/marge";
  pc.stats_server_url = base;
  pc.sw_update_url = base + "/updates/soundtouch";
  pc.bmx_registry_url = base + "/bmx/registry/v1/services";
  return pc;
}

std::string serialize_private_config(const PrivateConfig &config) {
  auto flag = [](bool v) { return v ? "true" : "false"; };
  std::string out = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n";
  out += fmt::format("<{}>\n", kRootTag);
  out += fmt::format("  <margeServerUrl>{}</margeServerUrl>\n",
                     xmltext::escape(config.marge_server_url));
  out += fmt::format("  <statsServerUrl>{}</statsServerUrl>\n",
                     xmltext::escape(config.stats_server_url));
  out += fmt::format("  <swUpdateUrl>{}</swUpdateUrl>\n",
                     xmltext::escape(config.sw_update_url));
  out += fmt::format(
      "  <usePandoraProductionServer>{}</usePandoraProductionServer>\n",
      flag(config.use_pandora_production_server));
  out += fmt::format("  <isZeroconfEnabled>{}</isZeroconfEnabled>\n",
                     flag(config.is_zeroconf_enabled));
  out += fmt::format(
      "  <saveMargeCustomerReport>{}</saveMargeCustomerReport>\n",
      flag(config.save_marge_customer_report));
  out += fmt::format("  <bmxRegistryUrl>{}</bmxRegistryUrl>\n",
                     xmltext::escape(config.bmx_registry_url));
  out += fmt::format("</{}>\n", kRootTag);
  return out;
}

monad::MyResult<PrivateConfig> parse_private_config(std::string_view xml) {
  auto root = xmltext::elements(xml, kRootTag);
  if (root.empty()) {
    return monad::MyResult<PrivateConfig>::Err(monad::make_error(
        my_errors::GENERAL::INVALID_ENTITY,
        fmt::format("document has no <{}> element", kRootTag)));
  }
  const auto &body = root.front();
  PrivateConfig pc;
  auto text = [&](const char *tag) {
    return stringutil::trimmed(xmltext::element_text(body, tag).value_or(""));
  };
  pc.marge_server_url = text("margeServerUrl");
  pc.stats_server_url = text("statsServerUrl");
  pc.sw_update_url = text("swUpdateUrl");
  pc.bmx_registry_url = text("bmxRegistryUrl");

  auto flag = [&](const char *tag, bool &field) -> monad::MyVoidResult {
    auto raw = xmltext::element_text(body, tag);
    if (!raw) {
      return monad::MyVoidResult::Ok();
    }
    auto parsed = parse_bool(*raw);
    if (!parsed) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::GENERAL::TYPE_CONVERT_FAILED,
          fmt::format("<{}> is not a boolean: '{}'", tag, *raw)));
    }
    field = *parsed;
    return monad::MyVoidResult::Ok();
  };
  if (auto r = flag("usePandoraProductionServer",
                    pc.use_pandora_production_server);
      r.is_err()) {
    return monad::MyResult<PrivateConfig>::Err(r.error());
  }
  if (auto r = flag("isZeroconfEnabled", pc.is_zeroconf_enabled); r.is_err()) {
    return monad::MyResult<PrivateConfig>::Err(r.error());
  }
  if (auto r = flag("saveMargeCustomerReport", pc.save_marge_customer_report);
      r.is_err()) {
    return monad::MyResult<PrivateConfig>::Err(r.error());
  }
  return monad::MyResult<PrivateConfig>::Ok(std::move(pc));
}

std::string wrap_through_proxy(std::string_view proxy_url,
                               std::string_view current_url) {
  return fmt::format("{}/proxy/{}", strip_trailing_slash(proxy_url),
                     current_url);
}

} // namespace speakerctrl::setup
