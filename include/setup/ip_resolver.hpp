#pragma once

#include <string>

#include "remote/remote_shell.hpp"

namespace speakerctrl::setup {

// Address for `host` as the speaker sees it. Literal IPs are returned as-is.
// Otherwise the device pings the host and the address is taken from the
// reply; failing that the host is resolved locally, IPv4 first. When nothing
// resolves, the host is returned unchanged.
std::string resolve_ip(const std::string &host, remote::IRemoteShell *shell);

// Local resolver lookup only. Empty when the name does not resolve.
std::string resolve_locally(const std::string &host);

} // namespace speakerctrl::setup
