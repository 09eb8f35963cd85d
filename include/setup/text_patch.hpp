#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace speakerctrl::setup {

struct PatchResult {
  std::string text;
  bool changed{false};
};

// True when text is an error message captured from an earlier failed read
// (e.g. "cat: can't open ...") rather than real script content.
bool looks_like_read_error(std::string_view text);

// Body of the priority nameserver file.
std::string priority_resolv_content(std::string_view ip);

// Shell block appended to the boot script. On every boot it re-applies the
// DHCP hooks, which firmware updates may revert.
std::string boot_hook_block();

// Append boot_hook_block() unless the hook comment is already present.
// A stored read error is discarded first; a shebang is ensured.
PatchResult patch_boot_script(std::string_view current);

// Remove the hook block: from the line carrying the hook comment through
// the "fi" closing its outermost if. A stored read error yields "".
PatchResult strip_boot_hook(std::string_view current);

// A DHCP client script and the line the hook goes after.
struct DhcpHook {
  std::string script_path;
  std::string anchor;     // substring identifying the anchor line
  std::string hook_line;  // inserted verbatim after each anchor line
};

const std::vector<DhcpHook> &dhcp_hooks();

// Insert hook.hook_line after every anchor line. Unchanged when the script
// already references the priority nameserver file or has no anchor.
PatchResult patch_dhcp_script(std::string_view current, const DhcpHook &hook);

} // namespace speakerctrl::setup
