#include <gtest/gtest.h>

#include "fake_speaker.hpp"
#include "setup/migration_types.hpp"
#include "setup/text_patch.hpp"

using namespace speakerctrl::setup;

TEST(TextPatchTest, ReadErrorsAreRecognized) {
  EXPECT_TRUE(looks_like_read_error(
      "cat: can't open '/mnt/nv/rc.local': No such file or directory\n"));
  EXPECT_FALSE(looks_like_read_error("#!/bin/sh\n"));
}

TEST(TextPatchTest, PriorityResolvNamesTarget) {
  auto text = priority_resolv_content("192.168.1.50");
  EXPECT_NE(text.find("nameserver 192.168.1.50\n"), std::string::npos);
  EXPECT_EQ(text.rfind("# ", 0), 0u);
}

TEST(BootScriptTest, PatchAddsShebangAndHookOnce) {
  auto first = patch_boot_script("");
  ASSERT_TRUE(first.changed);
  EXPECT_EQ(first.text.rfind("#!/bin/sh\n", 0), 0u);
  EXPECT_NE(first.text.find(kHookComment), std::string::npos);
  EXPECT_NE(first.text.find(paths::kDhcpBoseScript), std::string::npos);

  auto second = patch_boot_script(first.text);
  EXPECT_FALSE(second.changed);
  EXPECT_EQ(second.text, first.text);
}

TEST(BootScriptTest, ReadErrorTextIsNotKept) {
  auto patched = patch_boot_script("cat: can't open '/mnt/nv/rc.local'");
  ASSERT_TRUE(patched.changed);
  EXPECT_EQ(patched.text.find("can't open"), std::string::npos);
}

TEST(BootScriptTest, StripRestoresUserContent) {
  const std::string user = "#!/bin/sh\necho hello\n";
  auto patched = patch_boot_script(user);
  ASSERT_TRUE(patched.changed);

  auto stripped = strip_boot_hook(patched.text);
  EXPECT_TRUE(stripped.changed);
  EXPECT_EQ(stripped.text, user);
}

TEST(BootScriptTest, StripKeepsTrailingLines) {
  std::string script = patch_boot_script("#!/bin/sh\n").text;
  script += "echo after\n";
  auto stripped = strip_boot_hook(script);
  EXPECT_EQ(stripped.text, "#!/bin/sh\necho after\n");
}

TEST(BootScriptTest, StripWithoutHookIsNoop) {
  auto stripped = strip_boot_hook("#!/bin/sh\nexit 0\n");
  EXPECT_FALSE(stripped.changed);
  EXPECT_EQ(stripped.text, "#!/bin/sh\nexit 0\n");
}

TEST(DhcpScriptTest, HookFollowsAnchorLine) {
  const auto &hook = dhcp_hooks().front();
  ASSERT_EQ(hook.script_path, paths::kDhcpDefaultScript);

  auto patched = patch_dhcp_script(testinfra::kStockDhcpDefault, hook);
  ASSERT_TRUE(patched.changed);
  auto anchor_pos = patched.text.find("search $domain");
  auto hook_pos = patched.text.find(paths::kPriorityResolv);
  ASSERT_NE(anchor_pos, std::string::npos);
  ASSERT_NE(hook_pos, std::string::npos);
  EXPECT_LT(anchor_pos, hook_pos);
  EXPECT_EQ(patched.text.back(), '\n');

  EXPECT_FALSE(patch_dhcp_script(patched.text, hook).changed);
}

TEST(DhcpScriptTest, MissingAnchorLeavesScriptAlone) {
  const auto &hook = dhcp_hooks().back();
  auto patched = patch_dhcp_script("#!/bin/sh\nexit 0\n", hook);
  EXPECT_FALSE(patched.changed);
}
