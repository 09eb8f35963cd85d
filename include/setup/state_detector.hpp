#pragma once

#include <string_view>

#include "setup/migration_types.hpp"

namespace speakerctrl::setup {

// Content-based guess whether a device already points at target_host.
// Always false when the device was unreachable. Otherwise true when
//  - the parsed private config mentions target_host, or
//  - the hosts file redirects a vendor domain and our CA is trusted, or
//  - the DNS hook is installed (or resolv.conf mentions target_host) and
//    our CA is trusted.
bool is_migrated(const MigrationSummary &summary, std::string_view target_host);

} // namespace speakerctrl::setup
