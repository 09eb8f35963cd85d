#include <gtest/gtest.h>

#include <boost/json.hpp>
#include <filesystem>
#include <fstream>
#include <random>

#include "conf/config_sources.hpp"
#include "conf/speakerctrl_config.hpp"

namespace fs = std::filesystem;
namespace json = boost::json;

namespace {

fs::path make_temp_dir() {
  auto base = fs::temp_directory_path();
  std::mt19937_64 rng(std::random_device{}());
  for (int i = 0; i < 16; ++i) {
    auto candidate = base / ("speakerctrl-conf-" + std::to_string(rng()));
    std::error_code ec;
    if (fs::create_directories(candidate, ec)) {
      return candidate;
    }
  }
  throw std::runtime_error("Unable to create temporary directory");
}

void write_json(const fs::path &path, const json::object &obj) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  ofs << json::serialize(obj);
}

class ConfigSourcesTest : public ::testing::Test {
protected:
  void SetUp() override { dir_ = make_temp_dir(); }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(dir_, ec);
  }
  fs::path dir_;
};

} // namespace

TEST_F(ConfigSourcesTest, LayersMergeInOrder) {
  write_json(dir_ / "application.json",
             {{"base_url", "http://base:8000"},
              {"https_port", 8443},
              {"ssh", json::object{{"user", "root"}, {"port", 22}}}});
  write_json(dir_ / "application.lab.json",
             {{"ssh", json::object{{"port", 2222}}}});
  write_json(dir_ / "application.override.json",
             {{"base_url", "http://override:8000"}});

  speakerctrl::ConfigSources sources({dir_}, {"lab"});
  ASSERT_TRUE(sources.application_json().has_value());
  const auto &app = *sources.application_json();
  EXPECT_EQ(app.at("base_url").as_string(), "http://override:8000");
  EXPECT_EQ(app.at("ssh").as_object().at("port").as_int64(), 2222);
  EXPECT_EQ(app.at("ssh").as_object().at("user").as_string(), "root");
  EXPECT_EQ(sources.writable_dir(), dir_);
}

TEST_F(ConfigSourcesTest, MissingFileIsAnError) {
  speakerctrl::ConfigSources sources({dir_}, {});
  EXPECT_FALSE(sources.application_json().has_value());
  EXPECT_TRUE(sources.json_content("log_config").is_err());
}

TEST_F(ConfigSourcesTest, ProviderReadsTypedConfig) {
  write_json(dir_ / "application.json",
             {{"url_base", "http://192.168.1.50:8000"},
              {"runtime_dir", (dir_ / "rt").string()},
              {"ssh", json::object{{"user", "admin"},
                                   {"extra_options",
                                    json::array{"-o", "LogLevel=ERROR"}}}}});
  speakerctrl::ConfigSources sources({dir_}, {});
  speakerctrl::SpeakerctrlConfigProviderFile provider(sources);

  const auto &cfg = provider.get();
  EXPECT_EQ(cfg.base_url, "http://192.168.1.50:8000");
  EXPECT_EQ(cfg.https_port, 8443);
  EXPECT_EQ(cfg.data_dir, dir_ / "rt" / "data");
  EXPECT_EQ(cfg.certs_dir, dir_ / "rt" / "certs");
  EXPECT_EQ(cfg.ssh.user, "admin");
  EXPECT_EQ(cfg.ssh.port, 22);
  EXPECT_FALSE(cfg.ssh.reuse_connection);
  ASSERT_EQ(cfg.ssh.extra_options.size(), 2u);
}

TEST_F(ConfigSourcesTest, SaveWritesOverrideFile) {
  write_json(dir_ / "application.json", {{"base_url", "http://base:8000"},
                                         {"runtime_dir", dir_.string()}});
  speakerctrl::ConfigSources sources({dir_}, {});
  speakerctrl::SpeakerctrlConfigProviderFile provider(sources);

  ASSERT_TRUE(provider.save({{"https_port", 9443}}).is_ok());
  EXPECT_TRUE(fs::exists(dir_ / "application.override.json"));

  speakerctrl::ConfigSources reread({dir_}, {});
  speakerctrl::SpeakerctrlConfigProviderFile reloaded(reread);
  EXPECT_EQ(reloaded.get().https_port, 9443);
  EXPECT_EQ(reloaded.get().base_url, "http://base:8000");
}

TEST(MergeJsonObjectTest, NestedObjectsMerge) {
  json::object base{{"a", 1}, {"nested", json::object{{"x", 1}, {"y", 2}}}};
  speakerctrl::merge_json_object(
      base, {{"nested", json::object{{"y", 3}}}, {"b", true}});
  EXPECT_EQ(base.at("nested").as_object().at("x").as_int64(), 1);
  EXPECT_EQ(base.at("nested").as_object().at("y").as_int64(), 3);
  EXPECT_TRUE(base.at("b").as_bool());
}
