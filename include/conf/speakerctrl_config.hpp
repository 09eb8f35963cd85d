#pragma once
#include <boost/json.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "conf/config_sources.hpp"
#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace speakerctrl
{
  namespace fs = std::filesystem;
  namespace json = boost::json;

  struct SshConfig
  {
    std::string user{"root"};
    std::uint16_t port{22};
    std::string binary{"ssh"};
    int connect_timeout_seconds{10};
    int command_timeout_seconds{60};
    // Keep one master connection per device for the commands of an operation.
    bool reuse_connection{false};
    std::vector<std::string> extra_options{};

    std::chrono::seconds command_timeout() const
    {
      return std::chrono::seconds(command_timeout_seconds);
    }

    friend SshConfig tag_invoke(const json::value_to_tag<SshConfig> &,
                                const json::value &jv)
    {
      const auto *jo = jv.if_object();
      if (!jo)
      {
        throw std::runtime_error("SshConfig is not an object");
      }
      SshConfig sc{};
      if (auto *p = jo->if_contains("user"))
        sc.user = json::value_to<std::string>(*p);
      if (auto *p = jo->if_contains("port"))
        sc.port = json::value_to<std::uint16_t>(*p);
      if (auto *p = jo->if_contains("binary"))
        sc.binary = json::value_to<std::string>(*p);
      if (auto *p = jo->if_contains("connect_timeout_seconds"))
        sc.connect_timeout_seconds = json::value_to<int>(*p);
      if (auto *p = jo->if_contains("command_timeout_seconds"))
        sc.command_timeout_seconds = json::value_to<int>(*p);
      if (auto *p = jo->if_contains("reuse_connection"))
        sc.reuse_connection = p->as_bool();
      if (auto *p = jo->if_contains("extra_options"))
        sc.extra_options = json::value_to<std::vector<std::string>>(*p);
      return sc;
    }
  };

  struct SpeakerctrlConfig
  {
    std::string base_url{"http://localhost:8000"};
    std::uint16_t https_port{8443};
    fs::path runtime_dir{};
    fs::path data_dir{};
    fs::path certs_dir{};
    SshConfig ssh{};

    friend SpeakerctrlConfig tag_invoke(
        const json::value_to_tag<SpeakerctrlConfig> &, const json::value &jv)
    {
      try
      {
        if (auto *jo_p = jv.if_object())
        {
          SpeakerctrlConfig sc{};
          if (auto *p = jo_p->if_contains("url_base"))
            sc.base_url = p->as_string().c_str();
          else if (auto *p = jo_p->if_contains("base_url"))
            sc.base_url = p->as_string().c_str();
          else
            std::cerr << "base_url not found, using default " << sc.base_url
                      << std::endl;
          if (auto *p = jo_p->if_contains("https_port"))
            sc.https_port = json::value_to<std::uint16_t>(*p);
          if (auto *p = jo_p->if_contains("runtime_dir"))
            sc.runtime_dir = fs::path(p->as_string().c_str());
          else
            std::cerr << "runtime_dir not found, using default empty path"
                      << std::endl;
          if (auto *p = jo_p->if_contains("data_dir"))
            sc.data_dir = fs::path(p->as_string().c_str());
          else if (!sc.runtime_dir.empty())
            sc.data_dir = sc.runtime_dir / "data";
          if (auto *p = jo_p->if_contains("certs_dir"))
            sc.certs_dir = fs::path(p->as_string().c_str());
          else if (!sc.runtime_dir.empty())
            sc.certs_dir = sc.runtime_dir / "certs";
          if (auto *p = jo_p->if_contains("ssh"))
            sc.ssh = json::value_to<SshConfig>(*p);
          return sc;
        }
        else
        {
          throw std::runtime_error("SpeakerctrlConfig is not an object");
        }
      }
      catch (const std::exception &ex)
      {
        throw std::runtime_error(std::string("error in parsing SpeakerctrlConfig: ") +
                                 ex.what());
      }
    }
  };

  class ISpeakerctrlConfigProvider
  {
  public:
    virtual ~ISpeakerctrlConfigProvider() = default;

    virtual const SpeakerctrlConfig &get() const = 0;
    virtual SpeakerctrlConfig &get() = 0;

    // Persist keys into application.override.json.
    virtual monad::MyVoidResult save(const json::object &content) = 0;
  };

  class SpeakerctrlConfigProviderFile : public ISpeakerctrlConfigProvider
  {
  private:
    SpeakerctrlConfig config_;
    ConfigSources &config_sources_;

  public:
    explicit SpeakerctrlConfigProviderFile(ConfigSources &config_sources)
        : config_sources_(config_sources)
    {
      if (!config_sources.application_json())
      {
        throw std::runtime_error("Failed to load App config.");
      }
      config_ = json::value_to<SpeakerctrlConfig>(
          json::value(*config_sources.application_json()));
    }

    const SpeakerctrlConfig &get() const override { return config_; }
    SpeakerctrlConfig &get() override { return config_; }

    monad::MyVoidResult save(const json::object &content) override;
  };
} // namespace speakerctrl
