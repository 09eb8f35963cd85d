#pragma once

#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <fmt/format.h>

#include "boost/di.hpp"
#include "ca/certificate_authority.hpp"
#include "conf/config_sources.hpp"
#include "conf/speakerctrl_config.hpp"
#include "customio/console_output.hpp"
#include "device/live_device_info.hpp"
#include "handlers/ca_handler.hpp"
#include "handlers/conf_handler.hpp"
#include "handlers/devices_handler.hpp"
#include "handlers/dns_handler.hpp"
#include "handlers/handler_dispatcher.hpp"
#include "handlers/i_handler.hpp"
#include "handlers/migration_handler.hpp"
#include "handlers/test_handler.hpp"
#include "my_error_codes.hpp"
#include "remote/ssh_remote_shell.hpp"
#include "setup/migration_manager.hpp"
#include "speakerctrl_common.hpp"
#include "state/device_store.hpp"
#include "util/my_logging.hpp"

namespace di = boost::di;
namespace speakerctrl {

inline bool is_migration_subcommand(const std::string &subcmd) {
  return subcmd == "summary" || subcmd == "migrate" || subcmd == "revert" ||
         subcmd == "backup" || subcmd == "trust-ca" || subcmd == "reboot" ||
         subcmd == "remote-services" || subcmd == "resolve";
}

class App {
  speakerctrl::CliCtx &cli_ctx_;
  speakerctrl::ConfigSources &config_sources_;
  std::unique_ptr<customio::ConsoleOutput> output_;
  src::severity_logger<trivial::severity_level> lg;

public:
  App(speakerctrl::ConfigSources &config_sources, speakerctrl::CliCtx &cli_ctx)
      : cli_ctx_(cli_ctx), config_sources_(config_sources),
        output_(std::make_unique<customio::ConsoleOutput>(
            cli_ctx.verbosity_level())) {}

  void print_error(const monad::Error &err) {
    if (err.code == my_errors::GENERAL::SHOW_OPT_DESC) {
      std::cerr << err.what << std::endl;
    } else {
      output_->error() << fmt::format("Error ({}): {}", err.code, err.what)
                       << std::endl;
    }
  }

  // Returns the process exit code.
  int start() {
    auto &output = *output_;
    static speakerctrl::BeastLiveDeviceInfoClient live_info_client;

    auto handler_module = []() {
      return di::make_injector(
          di::bind<speakerctrl::MigrationHandler>().in(di::unique),
          di::bind<speakerctrl::TestHandler>().in(di::unique),
          di::bind<speakerctrl::DevicesHandler>().in(di::unique),
          di::bind<speakerctrl::DnsHandler>().in(di::unique),
          di::bind<speakerctrl::CaHandler>().in(di::unique),
          di::bind<speakerctrl::ConfHandler>().in(di::unique),
          di::bind<speakerctrl::IHandlerFactory>().to(
              [](const auto &inj) -> speakerctrl::IHandlerFactory & {
                static speakerctrl::HandlerFactoryImpl factory(
                    [&inj](const std::string &subcmd)
                        -> std::shared_ptr<speakerctrl::IHandler> {
                      if (is_migration_subcommand(subcmd)) {
                        return inj.template create<
                            std::shared_ptr<speakerctrl::MigrationHandler>>();
                      } else if (subcmd == "test") {
                        return inj.template create<
                            std::shared_ptr<speakerctrl::TestHandler>>();
                      } else if (subcmd == "devices") {
                        return inj.template create<
                            std::shared_ptr<speakerctrl::DevicesHandler>>();
                      } else if (subcmd == "dns") {
                        return inj.template create<
                            std::shared_ptr<speakerctrl::DnsHandler>>();
                      } else if (subcmd == "ca") {
                        return inj.template create<
                            std::shared_ptr<speakerctrl::CaHandler>>();
                      } else if (subcmd == "conf") {
                        return inj.template create<
                            std::shared_ptr<speakerctrl::ConfHandler>>();
                      } else {
                        throw std::runtime_error("Unsupported subcommand: " +
                                                 subcmd);
                      }
                    });
                return factory;
              }));
    };

    auto injector = di::make_injector(
        handler_module(),
        di::bind<speakerctrl::ConfigSources>().to(config_sources_),
        di::bind<speakerctrl::ISpeakerctrlConfigProvider>()
            .to<speakerctrl::SpeakerctrlConfigProviderFile>(),
        di::bind<speakerctrl::IDeviceStore>()
            .to<speakerctrl::SqliteDeviceStore>(),
        di::bind<speakerctrl::ICertificateAuthority>()
            .to<speakerctrl::FileCertificateAuthority>(),
        di::bind<speakerctrl::remote::IRemoteShellFactory>()
            .to<speakerctrl::remote::SshRemoteShellFactory>(),
        di::bind<speakerctrl::ILiveDeviceInfoClient>().to(live_info_client),
        di::bind<customio::ConsoleOutput>().to(output),
        di::bind<speakerctrl::CliCtx>().to(cli_ctx_));

    auto &config_provider =
        injector.template create<speakerctrl::ISpeakerctrlConfigProvider &>();
    if (cli_ctx_.params.url_base_override &&
        !cli_ctx_.params.url_base_override->empty()) {
      config_provider.get().base_url = *cli_ctx_.params.url_base_override;
    }

    output.debug() << "Config source directories:" << std::endl;
    for (const auto &source : config_sources_.paths()) {
      output.debug() << " - " << source.string() << std::endl;
    }
    BOOST_LOG_SEV(lg, trivial::info)
        << "speaker-ctrl " << cli_ctx_.params.subcmd << " (base_url "
        << config_provider.get().base_url << ")";

    if (cli_ctx_.params.subcmd.empty()) {
      output.error() << "No subcommand provided. Available: summary, migrate, "
                        "revert, backup, trust-ca, reboot, remote-services, "
                        "resolve, test, devices, dns, ca, conf."
                     << std::endl;
      return EXIT_FAILURE;
    }

    auto &dispatcher =
        injector.template create<speakerctrl::HandlerDispatcher &>();
    auto r = dispatcher.dispatch_run(cli_ctx_.params.subcmd);
    if (r.is_err()) {
      BOOST_LOG_SEV(lg, trivial::error)
          << cli_ctx_.params.subcmd << " failed: " << r.error().what;
      print_error(r.error());
      return EXIT_FAILURE;
    }
    output.debug() << "Handler completed successfully." << std::endl;
    return EXIT_SUCCESS;
  }
};

inline int launch(speakerctrl::ConfigSources &config,
                  speakerctrl::CliCtx &ctx) {
  App app(config, ctx);
  return app.start();
}

} // namespace speakerctrl
