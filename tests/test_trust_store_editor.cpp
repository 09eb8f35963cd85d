#include <gtest/gtest.h>

#include "fake_speaker.hpp"
#include "setup/migration_types.hpp"
#include "setup/trust_store_editor.hpp"

using namespace speakerctrl::setup;

namespace {

size_t count_of(const std::string &haystack, const std::string &needle) {
  size_t n = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

} // namespace

TEST(TrustStoreTextTest, BlockReplacesPreviousBlock) {
  auto once = with_labeled_block(testinfra::kStockBundle, kCaLabel,
                                 testinfra::kTestCaPem);
  auto twice = with_labeled_block(once, kCaLabel, testinfra::kTestCaPem);
  EXPECT_EQ(once, twice);
  EXPECT_EQ(count_of(twice, kCaLabel), 2u);
}

TEST(TrustStoreTextTest, StripRestoresBundle) {
  auto with = with_labeled_block(testinfra::kStockBundle, kCaLabel,
                                 testinfra::kTestCaPem);
  EXPECT_EQ(strip_labeled_blocks(with, kCaLabel), testinfra::kStockBundle);
}

TEST(TrustStoreTextTest, FirstBase64LineSkipsArmor) {
  auto line = first_base64_line(testinfra::kTestCaPem);
  ASSERT_TRUE(line.has_value());
  EXPECT_EQ(line->rfind("MIIBszCC", 0), 0u);
  EXPECT_FALSE(first_base64_line("-----BEGIN CERTIFICATE-----\n").has_value());
}

TEST(TrustStoreEditorTest, InjectTwiceKeepsOneBlock) {
  auto speaker = testinfra::FakeSpeaker::stock();
  TrustStoreEditor editor(*speaker, paths::kCaBundle, kCaLabel);
  std::string log;

  EXPECT_FALSE(editor.is_trusted(testinfra::kTestCaPem));
  ASSERT_TRUE(editor.inject(testinfra::kTestCaPem, log).is_ok());
  ASSERT_TRUE(editor.inject(testinfra::kTestCaPem, log).is_ok());

  const auto &bundle = speaker->files[paths::kCaBundle];
  EXPECT_EQ(count_of(bundle, kCaLabel), 2u);
  EXPECT_EQ(count_of(bundle, "speakerctrlTestCaFirstLine"), 1u);
  EXPECT_TRUE(editor.is_trusted(testinfra::kTestCaPem));
  EXPECT_EQ(speaker->files[original_of(paths::kCaBundle)],
            testinfra::kStockBundle);
}

TEST(TrustStoreEditorTest, InjectReplacesStaleCa) {
  auto speaker = testinfra::FakeSpeaker::stock();
  TrustStoreEditor editor(*speaker, paths::kCaBundle, kCaLabel);
  std::string log;

  ASSERT_TRUE(editor.inject(testinfra::kTestCaPem, log).is_ok());
  ASSERT_TRUE(editor.inject(testinfra::kRotatedCaPem, log).is_ok());

  const auto &bundle = speaker->files[paths::kCaBundle];
  EXPECT_EQ(count_of(bundle, kCaLabel), 2u);
  EXPECT_EQ(count_of(bundle, "speakerctrlTestCaFirstLine"), 0u);
  EXPECT_EQ(count_of(bundle, "speakerctrlRotatedCaFirstLine"), 1u);
  EXPECT_EQ(bundle, with_labeled_block(testinfra::kStockBundle, kCaLabel,
                                       testinfra::kRotatedCaPem));
  EXPECT_EQ(speaker->files[original_of(paths::kCaBundle)],
            testinfra::kStockBundle);
}

TEST(TrustStoreEditorTest, UnlabeledCopyStillCountsAsTrusted) {
  auto speaker = testinfra::FakeSpeaker::stock();
  speaker->files[paths::kCaBundle] += testinfra::kTestCaPem;
  TrustStoreEditor editor(*speaker, paths::kCaBundle, kCaLabel);
  EXPECT_TRUE(editor.is_trusted(testinfra::kTestCaPem));
}

TEST(TrustStoreEditorTest, EmptyPemIsRejected) {
  auto speaker = testinfra::FakeSpeaker::stock();
  TrustStoreEditor editor(*speaker, paths::kCaBundle, kCaLabel);
  std::string log;
  auto r = editor.inject("  \n", log);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::TRUST_STORE::CA_UNAVAILABLE);
  EXPECT_TRUE(speaker->uploads.empty());
}

TEST(TrustStoreEditorTest, RemoveWithoutBlockTouchesNothing) {
  auto speaker = testinfra::FakeSpeaker::stock();
  TrustStoreEditor editor(*speaker, paths::kCaBundle, kCaLabel);
  std::string log;
  ASSERT_TRUE(editor.remove(log).is_ok());
  EXPECT_TRUE(speaker->uploads.empty());

  std::string inject_log;
  ASSERT_TRUE(editor.inject(testinfra::kTestCaPem, inject_log).is_ok());
  ASSERT_TRUE(editor.remove(log).is_ok());
  EXPECT_EQ(speaker->files[paths::kCaBundle], testinfra::kStockBundle);
}
