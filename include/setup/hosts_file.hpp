#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace speakerctrl::setup {

// Point every domain in `domains` at `ip`. Existing entries for those
// domains get the new address; blank lines, comments and unrelated entries
// are kept as-is; missing domains are appended. Always newline-terminated.
std::string rewrite_hosts(std::string_view current, std::string_view ip,
                          const std::vector<std::string> &domains);

// "<ip>\t<domain>" lines for a dry-run preview.
std::string planned_hosts(std::string_view ip,
                          const std::vector<std::string> &domains);

// Drop every entry whose hostname is `domain`.
std::string remove_hosts_entry(std::string_view current,
                               std::string_view domain);

// true when any line (outside comments) names one of `domains`.
bool hosts_mentions_any(std::string_view current,
                        const std::vector<std::string> &domains);

} // namespace speakerctrl::setup
