#include "setup/migration_types.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"

namespace speakerctrl::setup {

std::string_view to_string(MigrationMethod method) {
  switch (method) {
  case MigrationMethod::Xml:
    return "xml";
  case MigrationMethod::Hosts:
    return "hosts";
  case MigrationMethod::Resolv:
    return "resolv";
  }
  return "unknown";
}

monad::MyResult<MigrationMethod> parse_migration_method(std::string_view name) {
  if (name.empty() || name == "xml") {
    return monad::MyResult<MigrationMethod>::Ok(MigrationMethod::Xml);
  }
  if (name == "hosts") {
    return monad::MyResult<MigrationMethod>::Ok(MigrationMethod::Hosts);
  }
  if (name == "resolv") {
    return monad::MyResult<MigrationMethod>::Ok(MigrationMethod::Resolv);
  }
  return monad::MyResult<MigrationMethod>::Err(
      monad::make_error(my_errors::MIGRATION::UNKNOWN_METHOD,
                        fmt::format("unknown migration method: {}", name)));
}

SubsystemRouting SubsystemRouting::from_options(const ProxyOptions &options) {
  auto upstream = [&](const char *key) {
    auto it = options.find(key);
    return it != options.end() && it->second == "upstream";
  };
  SubsystemRouting r;
  r.marge = upstream("marge");
  r.stats = upstream("stats");
  r.sw_update = upstream("sw_update");
  r.bmx = upstream("bmx");
  return r;
}

} // namespace speakerctrl::setup
