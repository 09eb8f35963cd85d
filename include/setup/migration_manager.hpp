#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "ca/certificate_authority.hpp"
#include "conf/speakerctrl_config.hpp"
#include "device/live_device_info.hpp"
#include "remote/remote_shell.hpp"
#include "result_monad.hpp"
#include "setup/migration_types.hpp"
#include "state/device_store.hpp"

namespace speakerctrl::setup {

// Everything a strategy needs about one migrate call.
struct MigrationRequest {
  std::string device_addr;
  std::string target_url;
  std::string proxy_url;
  ProxyOptions options;
};

// Reconfigures speakers over the remote shell so their cloud traffic goes to
// the local service, and previews, backs up and reverts that change.
//
// Operations that touch the device append a human readable transcript to
// `log`. On Err the transcript holds everything done before the failure;
// nothing already applied is rolled back. Soft failures are recorded as
// "Warning:" lines and the operation carries on.
//
// The manager keeps no per-device state. Calls for different devices may
// run concurrently; calls for the same device must be serialized by the
// caller.
class MigrationManager {
public:
  using DnsStatusProbe = std::function<DnsStatus()>;

  MigrationManager(ISpeakerctrlConfigProvider &config_provider,
                   IDeviceStore &device_store,
                   ICertificateAuthority &certificate_authority,
                   remote::IRemoteShellFactory &shell_factory,
                   ILiveDeviceInfoClient &live_info_client);

  // Live state of the local DNS service, consulted by the resolv strategy
  // preflight when set.
  void set_dns_status_probe(DnsStatusProbe probe) {
    dns_status_probe_ = std::move(probe);
  }

  // Read-only preview. An unreachable device is reported through
  // ssh_success/current_config, not as an error.
  monad::MyResult<MigrationSummary>
  get_migration_summary(const std::string &device_addr,
                        const std::string &target_url,
                        const std::string &proxy_url,
                        const ProxyOptions &options);

  monad::MyVoidResult migrate_speaker(const std::string &device_addr,
                                      const std::string &target_url,
                                      const std::string &proxy_url,
                                      const ProxyOptions &options,
                                      MigrationMethod method, std::string &log);

  // Fails when the private config has no on-device original; every other
  // artifact is restored best-effort.
  monad::MyVoidResult revert_migration(const std::string &device_addr,
                                       std::string &log);

  monad::MyVoidResult ensure_remote_services(const std::string &device_addr,
                                             std::string &log);
  monad::MyVoidResult remove_remote_services(const std::string &device_addr,
                                             std::string &log);

  monad::MyVoidResult trust_ca_cert(const std::string &device_addr,
                                    std::string &log);

  // Copy the private config to its .original sibling; Err if one exists.
  monad::MyVoidResult backup_config(const std::string &device_addr,
                                    std::string &log);

  // Save the private config and hosts file under the store's device
  // directory. Returns that directory.
  monad::MyResult<std::filesystem::path>
  backup_config_off_device(const std::string &device_addr);

  monad::MyVoidResult reboot(const std::string &device_addr, std::string &log);

  monad::MyVoidResult test_hosts_redirection(const std::string &device_addr,
                                             const std::string &target_url,
                                             std::string &log);
  monad::MyVoidResult test_connection(const std::string &device_addr,
                                      const std::string &target_url,
                                      bool use_explicit_ca, std::string &log);
  monad::MyVoidResult test_dns_redirection(const std::string &device_addr,
                                           const std::string &target_url,
                                           std::string &log);

  // Local resolution only; no device is involved.
  std::string get_resolved_ip(const std::string &host);

private:
  std::string effective_target(const std::string &target_url) const;

  // Runs and logs one command at debug level.
  remote::ShellOutput run(remote::IRemoteShell &shell,
                          const remote::RemoteCommand &command);
  bool exists(remote::IRemoteShell &shell, const std::string &path);

  // Hostname of target_url resolved as the device sees it. Err for an empty
  // or localhost hostname.
  monad::MyResult<std::string> target_ip(remote::IRemoteShell &shell,
                                         const std::string &target_url,
                                         std::string &log);

  // Privileged cp to <path>.original, falling back to cat and upload.
  monad::MyVoidResult copy_to_original(remote::IRemoteShell &shell,
                                       const std::string &path,
                                       std::string &log);
  monad::MyVoidResult touch_remote_services(remote::IRemoteShell &shell,
                                            std::string &log);

  // Planned config, with "upstream" subsystems wrapping `current` through
  // proxy_url.
  PrivateConfig planned_config(const std::string &target_url,
                               const std::string &proxy_url,
                               const ProxyOptions &options,
                               const PrivateConfig *current) const;

  bool ca_trusted(remote::IRemoteShell &shell);
  // Inject the CA unless already trusted.
  monad::MyVoidResult ensure_ca_trusted(remote::IRemoteShell &shell,
                                        std::string &log);
  monad::MyVoidResult inject_ca(remote::IRemoteShell &shell, std::string &log);

  // Summary pieces.
  void populate_device_info(MigrationSummary &summary,
                            const std::string &device_addr);
  std::optional<std::string> read_current_config(remote::IRemoteShell &shell,
                                                 MigrationSummary &summary);
  void check_remote_services(remote::IRemoteShell &shell,
                             MigrationSummary &summary);

  // Strategies. Same contract as migrate_speaker().
  monad::MyVoidResult migrate_via_xml(remote::IRemoteShell &shell,
                                      const MigrationRequest &request,
                                      std::string &log);
  monad::MyVoidResult migrate_via_hosts(remote::IRemoteShell &shell,
                                        const MigrationRequest &request,
                                        std::string &log);
  monad::MyVoidResult migrate_via_resolv(remote::IRemoteShell &shell,
                                         const MigrationRequest &request,
                                         std::string &log);
  monad::MyVoidResult check_dns_preflight();
  void install_dhcp_hooks(remote::IRemoteShell &shell, std::string &log);

  // Revert steps. Only the private config can fail.
  monad::MyVoidResult revert_private_config(remote::IRemoteShell &shell,
                                            std::string &log);
  void restore_if_backed_up(remote::IRemoteShell &shell,
                            const std::string &path, std::string &log);
  void revert_dns_hook(remote::IRemoteShell &shell, std::string &log);
  void revert_ca_cert(remote::IRemoteShell &shell, std::string &log);

  // Self-test helpers.
  monad::MyVoidResult add_temporary_host_entry(remote::IRemoteShell &shell,
                                               const std::string &ip,
                                               std::string &log);
  void remove_temporary_host_entry(remote::IRemoteShell &shell,
                                   std::string &log);
  monad::MyVoidResult upload_test_ca(remote::IRemoteShell &shell);

  ISpeakerctrlConfigProvider &config_provider_;
  IDeviceStore &device_store_;
  ICertificateAuthority &certificate_authority_;
  remote::IRemoteShellFactory &shell_factory_;
  ILiveDeviceInfoClient &live_info_client_;
  DnsStatusProbe dns_status_probe_;
  boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>
      lg;
};

} // namespace speakerctrl::setup
