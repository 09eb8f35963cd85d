#include "setup/text_patch.hpp"

#include <fmt/format.h>

#include "setup/migration_types.hpp"
#include "util/string_util.hpp"

namespace speakerctrl::setup {

namespace {

// BRE-escape a literal for use inside /.../
std::string sed_regex_escape(std::string_view literal) {
  std::string out;
  for (char c : literal) {
    switch (c) {
    case '$':
    case '/':
    case '.':
    case '*':
    case '[':
    case ']':
    case '^':
    case '\\':
      out.push_back('\\');
      [[fallthrough]];
    default:
      out.push_back(c);
    }
  }
  return out;
}

// sed invocation reproducing patch_dhcp_script() at boot time.
std::string sed_append_command(const DhcpHook &hook) {
  return fmt::format("sed -i '/{}/a \\{}' {}", sed_regex_escape(hook.anchor),
                     hook.hook_line, hook.script_path);
}

bool is_if_line(const std::string &trimmed) {
  return trimmed.rfind("if ", 0) == 0;
}

std::string join_lines(const std::vector<std::string> &lines,
                       bool trailing_newline) {
  auto out = stringutil::join(lines, "\n");
  if (trailing_newline && !lines.empty()) {
    out.push_back('\n');
  }
  return out;
}

} // namespace

bool looks_like_read_error(std::string_view text) {
  auto t = stringutil::trimmed(text);
  return stringutil::contains(t, "cat: can't open") || t.rfind("cat: ", 0) == 0;
}

std::string priority_resolv_content(std::string_view ip) {
  return fmt::format("# Created by Aftertouch/SoundTouch-Service\n"
                     "# Priority nameserver for Bose service redirection\n"
                     "nameserver {}\n",
                     ip);
}

const std::vector<DhcpHook> &dhcp_hooks() {
  static const std::vector<DhcpHook> hooks = {
      {paths::kDhcpDefaultScript, R"(echo "search $domain")",
       fmt::format(R"(        [ -f {0} ] && cat {0} && dns="")",
                   paths::kPriorityResolv)},
      {paths::kDhcpBoseScript,
       R"(echo "search $search_list # $interface" >> $RESOLV_CONF)",
       fmt::format(R"(                [ -f {0} ] && cat {0} >> $RESOLV_CONF && dns="")",
                   paths::kPriorityResolv)},
  };
  return hooks;
}

std::string boot_hook_block() {
  std::string block = fmt::format(
      "{}: re-apply DHCP resolver hooks after firmware resets\n", kHookComment);
  block += fmt::format("if [ -f {} ]; then\n", paths::kPriorityResolv);
  for (const auto &hook : dhcp_hooks()) {
    block += fmt::format(
        "    if [ -f {0} ] && ! grep -q {1} {0}; then\n", hook.script_path,
        paths::kPriorityResolv);
    block += fmt::format("        logger -t speaker-ctrl \"patching {}\"\n",
                         hook.script_path);
    block += "        " + sed_append_command(hook) + "\n";
    block += "    fi\n";
  }
  block += "fi\n";
  return block;
}

PatchResult patch_boot_script(std::string_view current) {
  if (stringutil::contains(current, kHookComment)) {
    return {std::string(current), false};
  }
  std::string base =
      looks_like_read_error(current) ? std::string{} : std::string(current);
  if (base.rfind("#!", 0) != 0) {
    base = "#!/bin/sh\n" + base;
  }
  base = stringutil::ensure_trailing_newline(std::move(base));
  base += "\n";
  base += boot_hook_block();
  return {std::move(base), true};
}

PatchResult strip_boot_hook(std::string_view current) {
  if (looks_like_read_error(current)) {
    return {std::string{}, true};
  }
  if (!stringutil::contains(current, kHookComment)) {
    return {std::string(current), false};
  }
  const bool trailing_newline = !current.empty() && current.back() == '\n';
  auto lines = stringutil::split_lines(current);

  std::vector<std::string> kept;
  kept.reserve(lines.size());
  bool in_block = false;
  bool seen_if = false;
  int depth = 0;
  for (const auto &line : lines) {
    auto t = stringutil::trimmed(line);
    if (!in_block) {
      if (stringutil::contains(line, kHookComment)) {
        in_block = true;
        seen_if = false;
        depth = 0;
        // separator line written together with the block
        if (!kept.empty() && stringutil::trimmed(kept.back()).empty()) {
          kept.pop_back();
        }
        continue;
      }
      kept.push_back(line);
      continue;
    }
    if (is_if_line(t)) {
      ++depth;
      seen_if = true;
    } else if (t == "fi") {
      --depth;
    }
    if (seen_if && depth <= 0) {
      in_block = false;
    }
  }
  return {join_lines(kept, trailing_newline), true};
}

PatchResult patch_dhcp_script(std::string_view current, const DhcpHook &hook) {
  if (stringutil::contains(current, paths::kPriorityResolv)) {
    return {std::string(current), false};
  }
  const bool trailing_newline = !current.empty() && current.back() == '\n';
  auto lines = stringutil::split_lines(current);
  std::vector<std::string> out;
  out.reserve(lines.size() + 2);
  bool changed = false;
  for (auto &line : lines) {
    bool anchor = stringutil::contains(line, hook.anchor);
    out.push_back(std::move(line));
    if (anchor) {
      out.push_back(hook.hook_line);
      changed = true;
    }
  }
  if (!changed) {
    return {std::string(current), false};
  }
  return {join_lines(out, trailing_newline), true};
}

} // namespace speakerctrl::setup
