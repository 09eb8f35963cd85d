#include "setup/migration_manager.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <fstream>

#include "my_error_codes.hpp"
#include "setup/hosts_file.hpp"
#include "setup/ip_resolver.hpp"
#include "setup/state_detector.hpp"
#include "setup/text_patch.hpp"
#include "setup/trust_store_editor.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace speakerctrl::setup {

namespace {

std::optional<std::string> write_file(const std::filesystem::path &path,
                                      const std::string &content) {
  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    return fmt::format("cannot open {} for writing", path.string());
  }
  ofs << content;
  if (!ofs) {
    return fmt::format("failed writing {}", path.string());
  }
  return std::nullopt;
}

std::string error_text(const remote::ShellOutput &out) {
  return out.error.value_or("");
}

} // namespace

MigrationManager::MigrationManager(ISpeakerctrlConfigProvider &config_provider,
                                   IDeviceStore &device_store,
                                   ICertificateAuthority &certificate_authority,
                                   remote::IRemoteShellFactory &shell_factory,
                                   ILiveDeviceInfoClient &live_info_client)
    : config_provider_(config_provider), device_store_(device_store),
      certificate_authority_(certificate_authority),
      shell_factory_(shell_factory), live_info_client_(live_info_client) {}

std::string
MigrationManager::effective_target(const std::string &target_url) const {
  return target_url.empty() ? config_provider_.get().base_url : target_url;
}

remote::ShellOutput
MigrationManager::run(remote::IRemoteShell &shell,
                      const remote::RemoteCommand &command) {
  BOOST_LOG_SEV(lg, trivial::debug) << "$ " << command.to_shell_string();
  auto out = shell.run(command);
  if (!out.ok()) {
    BOOST_LOG_SEV(lg, trivial::debug)
        << "  -> " << *out.error << " (output: " << out.output << ")";
  }
  return out;
}

bool MigrationManager::exists(remote::IRemoteShell &shell,
                              const std::string &path) {
  return run(shell, remote::cmd::file_exists(path)).ok();
}

monad::MyResult<std::string>
MigrationManager::target_ip(remote::IRemoteShell &shell,
                            const std::string &target_url, std::string &log) {
  auto host = stringutil::url_hostname(target_url);
  if (host.empty() || host == "localhost") {
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::MIGRATION::INVALID_TARGET,
        fmt::format("target URL must contain a valid IP or hostname (got {})",
                    host)));
  }
  auto ip = resolve_ip(host, &shell);
  log += fmt::format("Resolved {} to {}\n", host, ip);
  return monad::MyResult<std::string>::Ok(std::move(ip));
}

std::string MigrationManager::get_resolved_ip(const std::string &host) {
  return resolve_ip(host, nullptr);
}

PrivateConfig
MigrationManager::planned_config(const std::string &target_url,
                                 const std::string &proxy_url,
                                 const ProxyOptions &options,
                                 const PrivateConfig *current) const {
  auto planned = PrivateConfig::planned_for(target_url);
  auto routing = SubsystemRouting::from_options(options);
  if (!current || !routing.any()) {
    return planned;
  }
  const std::string proxy = proxy_url.empty() ? target_url : proxy_url;
  auto wrap = [&](bool upstream, std::string &planned_url,
                  const std::string &current_url) {
    if (upstream && !current_url.empty()) {
      planned_url = wrap_through_proxy(proxy, current_url);
    }
  };
  wrap(routing.marge, planned.marge_server_url, current->marge_server_url);
  wrap(routing.stats, planned.stats_server_url, current->stats_server_url);
  wrap(routing.sw_update, planned.sw_update_url, current->sw_update_url);
  wrap(routing.bmx, planned.bmx_registry_url, current->bmx_registry_url);
  return planned;
}

void MigrationManager::populate_device_info(MigrationSummary &summary,
                                            const std::string &device_addr) {
  if (auto stored = device_store_.find_device_by_address(device_addr)) {
    summary.device_name = stored->name;
    summary.device_model = stored->product_code;
    summary.device_serial = stored->serial_number;
    summary.device_id = stored->device_id;
    summary.account_id = stored->account_id;
    summary.firmware_version = stored->firmware_version;
  }

  auto live = live_info_client_.fetch(device_addr);
  if (live.is_err()) {
    BOOST_LOG_SEV(lg, trivial::debug)
        << "live info unavailable for " << device_addr << ": "
        << live.error().what;
    return;
  }
  const auto &info = live.value();
  auto take = [](std::string &field, const std::string &value) {
    if (!value.empty()) {
      field = value;
    }
  };
  take(summary.device_name, info.name);
  take(summary.device_model, info.type);
  take(summary.device_serial, info.serial);
  take(summary.firmware_version, info.firmware_version);
  take(summary.device_id, info.device_id);
  take(summary.account_id, info.account_id);
}

std::optional<std::string>
MigrationManager::read_current_config(remote::IRemoteShell &shell,
                                      MigrationSummary &summary) {
  const std::string original = original_of(paths::kPrivateConfig);
  if (exists(shell, original)) {
    auto orig = run(shell, remote::cmd::cat(original));
    if (orig.ok() && !orig.output.empty()) {
      summary.original_config = orig.output;
    }
  }

  auto cfg = run(shell, remote::cmd::cat(paths::kPrivateConfig));
  if (cfg.ok() && !cfg.output.empty()) {
    summary.ssh_success = true;
    return cfg.output;
  }

  // Tell "unreadable config" apart from "unreachable device".
  auto probe = run(shell, remote::cmd::ls("/"));
  if (probe.ok()) {
    summary.ssh_success = true;
    summary.current_config =
        cfg.ok() ? cfg.output
                 : fmt::format("Error reading config: {}", error_text(cfg));
  } else {
    summary.ssh_success = false;
    summary.current_config =
        fmt::format("SSH connection failed: {}", error_text(probe));
  }
  return std::nullopt;
}

void MigrationManager::check_remote_services(remote::IRemoteShell &shell,
                                             MigrationSummary &summary) {
  for (const char *loc : paths::kRemoteServices) {
    if (!run(shell, remote::RemoteCommand::exec({"[", "-e", loc, "]"})).ok()) {
      continue;
    }
    summary.remote_services_found.emplace_back(loc);
    summary.remote_services_enabled = true;
    if (std::string_view(loc) != "/tmp/remote_services") {
      summary.remote_services_persistent = true;
    }
  }
}

monad::MyResult<MigrationSummary>
MigrationManager::get_migration_summary(const std::string &device_addr,
                                        const std::string &target_url,
                                        const std::string &proxy_url,
                                        const ProxyOptions &options) {
  const std::string target = effective_target(target_url);
  const std::string target_host = stringutil::url_hostname(target);

  MigrationSummary summary;
  summary.target_url = target;
  populate_device_info(summary, device_addr);

  auto shell = shell_factory_.open(device_addr);
  if (auto current = read_current_config(*shell, summary)) {
    summary.current_config = *current;
    auto parsed = parse_private_config(*current);
    if (parsed.is_ok()) {
      summary.parsed_current_config = parsed.value();
    } else {
      BOOST_LOG_SEV(lg, trivial::warning)
          << "current config of " << device_addr
          << " does not parse: " << parsed.error().what;
    }
  }

  auto planned = planned_config(
      target, proxy_url, options,
      summary.parsed_current_config ? &*summary.parsed_current_config
                                    : nullptr);
  summary.planned_config = serialize_private_config(planned);
  if (summary.planned_config.empty()) {
    return monad::MyResult<MigrationSummary>::Err(
        monad::make_error(my_errors::MIGRATION::CONFIG_ENCODE,
                          "failed to serialize planned config"));
  }

  if (!target_host.empty() && target_host != "localhost") {
    auto ip = resolve_ip(target_host,
                         summary.ssh_success ? shell.get() : nullptr);
    summary.planned_resolv = priority_resolv_content(ip);
    summary.planned_hosts = planned_hosts(ip, vendor_domains());
  }

  if (summary.ssh_success) {
    check_remote_services(*shell, summary);
    summary.ca_cert_trusted = ca_trusted(*shell);
    if (auto resolv = run(*shell, remote::cmd::cat(paths::kResolvConf));
        resolv.ok()) {
      summary.current_resolv_conf = resolv.output;
    }
    if (auto hosts = run(*shell, remote::cmd::cat(paths::kHosts)); hosts.ok()) {
      summary.current_hosts = hosts.output;
    }
    summary.dns_hook_installed = exists(*shell, paths::kPriorityResolv);
  }

  if (!target_host.empty()) {
    summary.server_https_url =
        fmt::format("https://{}:{}/health", target_host,
                    config_provider_.get().https_port);
  }

  summary.is_migrated = is_migrated(summary, target_host);
  return monad::MyResult<MigrationSummary>::Ok(std::move(summary));
}

monad::MyVoidResult MigrationManager::migrate_speaker(
    const std::string &device_addr, const std::string &target_url,
    const std::string &proxy_url, const ProxyOptions &options,
    MigrationMethod method, std::string &log) {
  MigrationRequest request{device_addr, effective_target(target_url),
                           proxy_url, options};
  BOOST_LOG_SEV(lg, trivial::info)
      << "Migrating " << device_addr << " to " << request.target_url
      << " via " << to_string(method);

  if (auto backup = backup_config_off_device(device_addr); backup.is_err()) {
    log += fmt::format("Warning: Failed to create off-device backup: {}\n",
                       backup.error().what);
    BOOST_LOG_SEV(lg, trivial::warning)
        << "Off-device backup of " << device_addr
        << " failed: " << backup.error().what;
  } else {
    log += "Successfully created off-device backup of current "
           "configuration.\n";
  }

  auto shell = shell_factory_.open(device_addr);
  const auto rw_cmd = remote::cmd::remount_rw();
  auto rw = run(*shell, rw_cmd);
  if (!rw.ok()) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Pre-flight failed on " << device_addr << ": " << error_text(rw);
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::PREFLIGHT_FAILED,
        fmt::format("pre-flight check failed: cannot gain write access (cmd: "
                    "{}, output: {}): {}",
                    rw_cmd.to_shell_string(), rw.output, error_text(rw))));
  }
  log += "Pre-flight: Write access verified.\n";

  monad::MyVoidResult result = monad::MyVoidResult::Ok();
  switch (method) {
  case MigrationMethod::Xml:
    result = migrate_via_xml(*shell, request, log);
    break;
  case MigrationMethod::Hosts:
    result = migrate_via_hosts(*shell, request, log);
    break;
  case MigrationMethod::Resolv:
    result = migrate_via_resolv(*shell, request, log);
    break;
  }
  if (result.is_err()) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Migration of " << device_addr << " failed: " << result.error().what;
  } else {
    BOOST_LOG_SEV(lg, trivial::info) << "Migration of " << device_addr
                                     << " via " << to_string(method) << " done";
  }
  return result;
}

monad::MyVoidResult
MigrationManager::copy_to_original(remote::IRemoteShell &shell,
                                   const std::string &path, std::string &log) {
  const std::string backup = original_of(path);
  auto cp = run(shell, remote::cmd::privileged(remote::cmd::cp(path, backup)));
  if (cp.ok()) {
    log += fmt::format("Copied {} to {}\n", path, backup);
    return monad::MyVoidResult::Ok();
  }
  log += fmt::format("Warning: failed to cp {} to {}: {} (output: {})\n", path,
                     backup, error_text(cp), cp.output);

  auto content = run(shell, remote::cmd::cat(path));
  if (!content.ok() || content.output.empty()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::REMOTE_SHELL::EXEC_FAILED,
        fmt::format("failed to read {}: {}", path, error_text(content))));
  }
  auto rw = run(shell, remote::cmd::remount_rw());
  log += fmt::format("{}: {}\n", remote::cmd::remount_rw().to_shell_string(),
                     rw.output);
  if (auto err = shell.upload(content.output, backup)) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::REMOTE_SHELL::UPLOAD_FAILED,
        fmt::format("failed to upload backup {}: {}", backup, *err)));
  }
  log += fmt::format("Uploaded backup to {} via fallback\n", backup);
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult MigrationManager::backup_config(const std::string &device_addr,
                                                    std::string &log) {
  auto shell = shell_factory_.open(device_addr);
  const std::string backup = original_of(paths::kPrivateConfig);
  if (exists(*shell, backup)) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::MIGRATION::BACKUP_EXISTS,
                          fmt::format("backup already exists at {}", backup)));
  }
  return copy_to_original(*shell, paths::kPrivateConfig, log);
}

monad::MyResult<std::filesystem::path>
MigrationManager::backup_config_off_device(const std::string &device_addr) {
  using R = monad::MyResult<std::filesystem::path>;
  auto info_r = live_info_client_.fetch(device_addr);
  if (info_r.is_err()) {
    return R::Err(monad::make_error(
        info_r.error().code,
        fmt::format("failed to get device info: {}", info_r.error().what)));
  }
  const auto &info = info_r.value();

  std::string account = info.account_id;
  std::string device = !info.serial.empty()      ? info.serial
                       : !info.device_id.empty() ? info.device_id
                                                 : device_addr;
  if (account.empty()) {
    auto devices = device_store_.list_devices();
    if (devices.is_ok()) {
      for (const auto &d : devices.value()) {
        if ((!info.serial.empty() && d.serial_number == info.serial) ||
            (!info.device_id.empty() && d.device_id == info.device_id)) {
          account = d.account_id;
          break;
        }
      }
    }
  }
  if (account.empty()) {
    account = "default";
  }

  auto dir = device_store_.account_device_dir(account, device);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    return R::Err(monad::make_error(
        my_errors::GENERAL::FILE_READ_WRITE,
        fmt::format("failed to create device directory {}: {}", dir.string(),
                    ec.message())));
  }

  auto shell = shell_factory_.open(device_addr);
  auto config = run(*shell, remote::cmd::cat(paths::kPrivateConfig));
  if (config.ok() && !config.output.empty()) {
    if (auto err = write_file(dir / "SoundTouchSdkPrivateCfg.xml.bak",
                              config.output)) {
      return R::Err(monad::make_error(
          my_errors::GENERAL::FILE_READ_WRITE,
          fmt::format("failed to write config backup: {}", *err)));
    }
  }
  auto hosts = run(*shell, remote::cmd::cat(paths::kHosts));
  if (hosts.ok() && !hosts.output.empty()) {
    if (auto err = write_file(dir / "hosts.bak", hosts.output)) {
      return R::Err(monad::make_error(
          my_errors::GENERAL::FILE_READ_WRITE,
          fmt::format("failed to write hosts backup: {}", *err)));
    }
  }
  BOOST_LOG_SEV(lg, trivial::info)
      << "Off-device backup of " << device_addr << " in " << dir.string();
  return R::Ok(std::move(dir));
}

monad::MyVoidResult
MigrationManager::touch_remote_services(remote::IRemoteShell &shell,
                                        std::string &log) {
  for (const char *loc : paths::kRemoteServices) {
    auto with_rw = run(shell, remote::cmd::privileged(remote::cmd::touch(loc)));
    log += fmt::format("touch {} (with rw): {}\n", loc, with_rw.output);
    if (with_rw.ok()) {
      return monad::MyVoidResult::Ok();
    }
    auto plain = run(shell, remote::cmd::touch(loc));
    log += fmt::format("touch {}: {}\n", loc, plain.output);
    if (plain.ok()) {
      return monad::MyVoidResult::Ok();
    }
  }
  return monad::MyVoidResult::Err(monad::make_error(
      my_errors::MIGRATION::REMOTE_SERVICES,
      fmt::format("failed to enable remote services in any of the locations: "
                  "{}",
                  fmt::join(paths::kRemoteServices, ", "))));
}

monad::MyVoidResult
MigrationManager::ensure_remote_services(const std::string &device_addr,
                                         std::string &log) {
  auto shell = shell_factory_.open(device_addr);
  return touch_remote_services(*shell, log);
}

monad::MyVoidResult
MigrationManager::remove_remote_services(const std::string &device_addr,
                                         std::string &log) {
  auto shell = shell_factory_.open(device_addr);
  std::vector<std::string> failures;
  for (const char *loc : paths::kRemoteServices) {
    auto with_rw = run(*shell, remote::cmd::privileged(remote::cmd::rm(loc)));
    log += fmt::format("Removing {}: {}\n", loc, with_rw.output);
    if (with_rw.ok()) {
      continue;
    }
    auto plain = run(*shell, remote::cmd::rm(loc));
    log += fmt::format("Fallback removing {}: {}\n", loc, plain.output);
    if (!plain.ok()) {
      failures.push_back(fmt::format("{}: {}", loc, error_text(plain)));
    }
  }
  if (failures.size() == paths::kRemoteServices.size()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::REMOTE_SERVICES,
        fmt::format("failed to remove remote services from any location: {}",
                    fmt::join(failures, "; "))));
  }
  return monad::MyVoidResult::Ok();
}

bool MigrationManager::ca_trusted(remote::IRemoteShell &shell) {
  auto pem = certificate_authority_.read_ca_cert_pem();
  TrustStoreEditor editor(shell, paths::kCaBundle, kCaLabel);
  return editor.is_trusted(pem.is_ok() ? pem.value() : std::string{});
}

monad::MyVoidResult MigrationManager::inject_ca(remote::IRemoteShell &shell,
                                                std::string &log) {
  if (auto ensured = certificate_authority_.ensure_ca(); ensured.is_err()) {
    return monad::MyVoidResult::Err(ensured.error());
  }
  auto pem = certificate_authority_.read_ca_cert_pem();
  if (pem.is_err()) {
    return monad::MyVoidResult::Err(pem.error());
  }
  TrustStoreEditor editor(shell, paths::kCaBundle, kCaLabel);
  return editor.inject(pem.value(), log);
}

monad::MyVoidResult
MigrationManager::ensure_ca_trusted(remote::IRemoteShell &shell,
                                    std::string &log) {
  if (ca_trusted(shell)) {
    log += "CA certificate already trusted, skipping injection\n";
    return monad::MyVoidResult::Ok();
  }
  log += "Trusting CA:\n";
  return inject_ca(shell, log);
}

monad::MyVoidResult MigrationManager::trust_ca_cert(const std::string &device_addr,
                                                    std::string &log) {
  auto shell = shell_factory_.open(device_addr);
  return inject_ca(*shell, log);
}

monad::MyVoidResult MigrationManager::reboot(const std::string &device_addr,
                                             std::string &log) {
  BOOST_LOG_SEV(lg, trivial::info) << "Rebooting speaker at " << device_addr;
  auto shell = shell_factory_.open(device_addr);
  auto out = run(*shell, remote::cmd::privileged(
                             remote::RemoteCommand::exec({"reboot"})));
  log += out.output;
  if (!out.ok()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::REMOTE_SHELL::EXEC_FAILED,
        fmt::format("failed to reboot speaker: {}", error_text(out))));
  }
  return monad::MyVoidResult::Ok();
}

} // namespace speakerctrl::setup
