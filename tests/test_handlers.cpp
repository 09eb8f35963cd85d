#include <gtest/gtest.h>

#include <boost/json.hpp>
#include <sstream>

#include "customio/console_output.hpp"
#include "fake_speaker.hpp"
#include "handlers/conf_handler.hpp"
#include "handlers/devices_handler.hpp"
#include "handlers/dns_handler.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/migration_handler.hpp"
#include "handlers/test_handler.hpp"
#include "setup/migration_manager.hpp"

using testinfra::FakeSpeaker;
namespace paths = speakerctrl::setup::paths;

namespace {

constexpr char kSpeaker[] = "192.168.1.20";

// CliCtx as produced for "speaker-ctrl <tokens...>"; every token after the
// global options ends up in `unrecognized`.
speakerctrl::CliCtx make_ctx(std::vector<std::string> tokens) {
  std::vector<std::string> positionals;
  for (const auto &t : tokens) {
    if (!t.empty() && t[0] == '-') {
      break;
    }
    positionals.push_back(t);
  }
  speakerctrl::CliParams params;
  params.subcmd = tokens.empty() ? std::string{} : tokens.front();
  return speakerctrl::CliCtx(po::variables_map{}, std::move(positionals),
                             std::move(tokens), std::move(params));
}

class HandlerTest : public ::testing::Test {
protected:
  void SetUp() override {
    provider_.config.base_url = "http://192.168.1.50:8000";
    speaker_ = FakeSpeaker::stock();
    shells_.speakers[kSpeaker] = speaker_;
    manager_ = std::make_unique<speakerctrl::setup::MigrationManager>(
        provider_, store_, ca_, shells_, live_);
  }

  std::string out() const { return out_.str(); }

  testinfra::FakeConfigProvider provider_;
  testinfra::FakeDeviceStore store_;
  testinfra::FakeCertificateAuthority ca_;
  testinfra::FakeShellFactory shells_;
  testinfra::FakeLiveInfoClient live_;
  std::shared_ptr<FakeSpeaker> speaker_;
  std::unique_ptr<speakerctrl::setup::MigrationManager> manager_;
  std::ostringstream out_;
  std::ostringstream err_;
  customio::ConsoleOutput output_{3, out_, err_};
};

} // namespace

TEST_F(HandlerTest, SummaryAsJson) {
  auto ctx = make_ctx({"summary", kSpeaker, "--json"});
  speakerctrl::MigrationHandler handler(*manager_, ctx, output_);
  auto r = handler.start();
  ASSERT_TRUE(r.is_ok()) << r.error().what;

  auto jv = boost::json::parse(out());
  const auto &obj = jv.as_object();
  EXPECT_TRUE(obj.at("ssh_success").as_bool());
  EXPECT_FALSE(obj.at("is_migrated").as_bool());
  EXPECT_EQ(obj.at("target_url").as_string(), "http://192.168.1.50:8000");
}

TEST_F(HandlerTest, SummaryAsText) {
  auto ctx = make_ctx({"summary", kSpeaker});
  speakerctrl::MigrationHandler handler(*manager_, ctx, output_);
  ASSERT_TRUE(handler.start().is_ok());
  EXPECT_NE(out().find("SSH reachable:     yes"), std::string::npos);
  EXPECT_NE(out().find("--- planned config ---"), std::string::npos);
}

TEST_F(HandlerTest, MigrateWithMethodAndReport) {
  auto ctx = make_ctx({"migrate", kSpeaker, "--method", "hosts"});
  speakerctrl::MigrationHandler handler(*manager_, ctx, output_);
  auto r = handler.start();
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_NE(speaker_->files[paths::kHosts].find("streaming.bose.com"),
            std::string::npos);
  EXPECT_NE(out().find("Migration via hosts succeeded."), std::string::npos);
  EXPECT_NE(out().find("speaker-ctrl reboot"), std::string::npos);
  EXPECT_EQ(speaker_->reboots, 0);
}

TEST_F(HandlerTest, MigrateRejectsUnknownMethod) {
  auto ctx = make_ctx({"migrate", kSpeaker, "--method", "ftp"});
  speakerctrl::MigrationHandler handler(*manager_, ctx, output_);
  auto r = handler.start();
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::SHOW_OPT_DESC);
  EXPECT_TRUE(speaker_->commands.empty());
}

TEST_F(HandlerTest, MigrateNeedsAddress) {
  auto ctx = make_ctx({"migrate"});
  speakerctrl::MigrationHandler handler(*manager_, ctx, output_);
  auto r = handler.start();
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::SHOW_OPT_DESC);
}

TEST_F(HandlerTest, RevertFailurePropagates) {
  auto ctx = make_ctx({"revert", kSpeaker});
  speakerctrl::MigrationHandler handler(*manager_, ctx, output_);
  auto r = handler.start();
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::MIGRATION::BACKUP_MISSING);
  EXPECT_EQ(out().find("succeeded"), std::string::npos);
}

TEST_F(HandlerTest, RemoteServicesEnable) {
  auto ctx = make_ctx({"remote-services", "enable", kSpeaker});
  speakerctrl::MigrationHandler handler(*manager_, ctx, output_);
  ASSERT_TRUE(handler.start().is_ok());
  EXPECT_TRUE(speaker_->has("/etc/remote_services"));
}

TEST_F(HandlerTest, ConnectionSelfTest) {
  speaker_->curl_answers["http://192.168.1.50:8000"] = "{\"ok\":true}";
  auto ctx = make_ctx({"test", "connection", kSpeaker});
  speakerctrl::TestHandler handler(*manager_, ctx, output_);
  auto r = handler.start();
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  EXPECT_NE(out().find("{\"ok\":true}"), std::string::npos);
}

TEST_F(HandlerTest, DevicesAddAndList) {
  {
    auto ctx = make_ctx({"devices", "add", "--id", "A0F6FD123456", "--ip",
                         kSpeaker, "--name", "Kitchen"});
    speakerctrl::DevicesHandler handler(store_, ctx, output_);
    ASSERT_TRUE(handler.start().is_ok());
  }
  ASSERT_EQ(store_.devices.size(), 1u);
  EXPECT_EQ(store_.devices.front().name, "Kitchen");

  auto ctx = make_ctx({"devices", "list"});
  speakerctrl::DevicesHandler handler(store_, ctx, output_);
  ASSERT_TRUE(handler.start().is_ok());
  EXPECT_NE(out().find("A0F6FD123456"), std::string::npos);
}

TEST_F(HandlerTest, DevicesAddNeedsIdAndIp) {
  auto ctx = make_ctx({"devices", "add", "--ip", kSpeaker});
  speakerctrl::DevicesHandler handler(store_, ctx, output_);
  auto r = handler.start();
  ASSERT_TRUE(r.is_err());
  EXPECT_TRUE(store_.devices.empty());
}

TEST_F(HandlerTest, DnsSetWarnsAboutPort) {
  auto ctx = make_ctx({"dns", "set", "--enabled", "true", "--bind-addr",
                       ":5353"});
  speakerctrl::DnsHandler handler(store_, ctx, output_);
  ASSERT_TRUE(handler.start().is_ok());
  EXPECT_TRUE(store_.dns.enabled);
  EXPECT_EQ(store_.dns.bind_addr, ":5353");
  EXPECT_NE(err_.str().find("requires port 53"), std::string::npos);
}

TEST_F(HandlerTest, ConfSetPersistsKey) {
  auto ctx = make_ctx({"conf", "set", "https_port", "9443"});
  speakerctrl::ConfHandler handler(provider_, ctx, output_);
  ASSERT_TRUE(handler.start().is_ok());
  ASSERT_EQ(provider_.saved.size(), 1u);
  EXPECT_EQ(provider_.saved.front().at("https_port").to_number<int>(), 9443);

  auto bad = make_ctx({"conf", "set", "https_port", "http"});
  speakerctrl::ConfHandler bad_handler(provider_, bad, output_);
  EXPECT_TRUE(bad_handler.start().is_err());
}

TEST_F(HandlerTest, DispatcherReportsUnknownSubcommand) {
  speakerctrl::HandlerFactoryImpl factory(
      [](const std::string &subcmd) -> std::shared_ptr<speakerctrl::IHandler> {
        throw std::runtime_error("Unsupported subcommand: " + subcmd);
      });
  speakerctrl::HandlerDispatcher dispatcher(factory);
  auto r = dispatcher.dispatch_run("bogus");
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, my_errors::GENERAL::NOT_FOUND);
}
