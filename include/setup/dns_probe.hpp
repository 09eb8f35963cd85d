#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace speakerctrl::setup {

// DNS-over-TCP A/IN query for `domain`, 2-byte length prefix included,
// written as `echo -ne` escapes. Label characters stay literal.
std::string dns_query_escape(std::string_view domain,
                             std::uint16_t transaction_id = 0xaaaa);

// "192 168 1 10" as printed by `od -An -tu1` -> "192.168.1.10".
std::optional<std::string> parse_od_ipv4(std::string_view od_output);

// Port of a DNS bind address (":53", "0.0.0.0:5353", "53"). Defaults to 53.
std::string dns_port_of(std::string_view bind_addr);

} // namespace speakerctrl::setup
