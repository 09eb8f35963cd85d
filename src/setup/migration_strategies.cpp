#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "setup/hosts_file.hpp"
#include "setup/migration_manager.hpp"
#include "setup/text_patch.hpp"
#include "util/my_logging.hpp"

namespace speakerctrl::setup {

monad::MyVoidResult
MigrationManager::migrate_via_xml(remote::IRemoteShell &shell,
                                  const MigrationRequest &request,
                                  std::string &log) {
  log += "Ensuring remote services:\n";
  if (auto rs = touch_remote_services(shell, log); rs.is_err()) {
    log += fmt::format("Warning: {}\n", rs.error().what);
    BOOST_LOG_SEV(lg, trivial::warning)
        << "remote services on " << request.device_addr << ": "
        << rs.error().what;
  }

  std::optional<PrivateConfig> current;
  auto current_text = run(shell, remote::cmd::cat(paths::kPrivateConfig));
  if (current_text.ok() && !current_text.output.empty()) {
    log += "Read current configuration\n";
    auto parsed = parse_private_config(current_text.output);
    if (parsed.is_ok()) {
      current = parsed.value();
    } else {
      log += fmt::format("Warning: current configuration not parsed: {}\n",
                         parsed.error().what);
    }
  }

  auto planned = planned_config(request.target_url, request.proxy_url,
                                request.options,
                                current ? &*current : nullptr);
  const std::string document = serialize_private_config(planned);

  const std::string backup = original_of(paths::kPrivateConfig);
  if (exists(shell, backup)) {
    log += "Backup .original already exists\n";
  } else {
    log += fmt::format("Backing up original config to {}\n", backup);
    if (auto r = copy_to_original(shell, paths::kPrivateConfig, log);
        r.is_err()) {
      log += fmt::format("Warning: {}\n", r.error().what);
    }
  }

  auto rw = run(shell, remote::cmd::remount_rw());
  log += fmt::format("{}: {}\n", remote::cmd::remount_rw().to_shell_string(),
                     rw.output);
  if (auto err = shell.upload(document, paths::kPrivateConfig)) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::MIGRATION::STRATEGY_FAILED,
                          fmt::format("failed to upload config: {}", *err)));
  }
  log += fmt::format("Uploaded new configuration to {}\n",
                     paths::kPrivateConfig);
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult
MigrationManager::migrate_via_hosts(remote::IRemoteShell &shell,
                                    const MigrationRequest &request,
                                    std::string &log) {
  auto ip = target_ip(shell, request.target_url, log);
  if (ip.is_err()) {
    return monad::MyVoidResult::Err(ip.error());
  }

  auto hosts = run(shell, remote::cmd::cat(paths::kHosts));
  log += fmt::format("cat {}: {}\n", paths::kHosts, hosts.output);
  if (!hosts.ok()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::STRATEGY_FAILED,
        fmt::format("failed to read {}: {}", paths::kHosts, *hosts.error)));
  }
  const std::string updated =
      rewrite_hosts(hosts.output, ip.value(), vendor_domains());

  auto rw = run(shell, remote::cmd::remount_rw());
  log += fmt::format("{}: {}\n", remote::cmd::remount_rw().to_shell_string(),
                     rw.output);
  if (!exists(shell, original_of(paths::kHosts))) {
    if (auto r = copy_to_original(shell, paths::kHosts, log); r.is_err()) {
      log += fmt::format("Warning: {}\n", r.error().what);
    }
  }

  if (auto err = shell.upload(updated, paths::kHosts)) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::STRATEGY_FAILED,
        fmt::format("failed to update {}: {}", paths::kHosts, *err)));
  }
  log += fmt::format("Uploaded updated {}\n", paths::kHosts);
  BOOST_LOG_SEV(lg, trivial::debug)
      << "hosts of " << request.device_addr << " now:\n" << updated;

  return ensure_ca_trusted(shell, log);
}

monad::MyVoidResult MigrationManager::check_dns_preflight() {
  auto settings = device_store_.get_dns_settings();
  if (!settings.enabled) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::DNS_PREFLIGHT_FAILED,
        "DNS discovery server is not enabled. Enable it (speaker-ctrl dns set "
        "--enabled true) before using the resolv migration method"));
  }
  if (!settings.binds_port_53()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::DNS_PREFLIGHT_FAILED,
        fmt::format("DNS discovery server is bound to {}, but port 53 is "
                    "required for the resolv migration method",
                    settings.bind_addr)));
  }
  if (dns_status_probe_) {
    auto status = dns_status_probe_();
    if (!status.running) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::MIGRATION::DNS_PREFLIGHT_FAILED,
          fmt::format("DNS discovery server is configured but not running on "
                      "{}",
                      status.bind_addr)));
    }
    if (!DnsSettings{true, status.bind_addr}.binds_port_53()) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::MIGRATION::DNS_PREFLIGHT_FAILED,
          fmt::format("DNS discovery server is running on {}, but port 53 is "
                      "required",
                      status.bind_addr)));
    }
  }
  return monad::MyVoidResult::Ok();
}

void MigrationManager::install_dhcp_hooks(remote::IRemoteShell &shell,
                                          std::string &log) {
  for (const auto &hook : dhcp_hooks()) {
    const auto &script = hook.script_path;
    if (!exists(shell, script)) {
      log += fmt::format("{} not present, skipping\n", script);
      continue;
    }
    const std::string backup = original_of(script);
    if (exists(shell, backup)) {
      // start from the pristine script so the hook is applied exactly once
      auto restore = run(shell, remote::cmd::cp(backup, script));
      if (!restore.ok()) {
        log += fmt::format("Warning: failed to restore {} from {}: {}\n",
                           script, backup, *restore.error);
      }
    } else {
      auto cp = run(shell, remote::cmd::cp(script, backup));
      log += fmt::format("cp {} {}: {}\n", script, backup, cp.output);
    }

    auto current = run(shell, remote::cmd::cat(script));
    if (!current.ok()) {
      log += fmt::format("Failed to apply patch immediately to {}: {}\n",
                         script, *current.error);
      continue;
    }
    auto patched = patch_dhcp_script(current.output, hook);
    if (!patched.changed) {
      log += fmt::format("{} needs no patch\n", script);
      continue;
    }
    if (auto err = shell.upload(patched.text, script)) {
      log += fmt::format("Failed to apply patch immediately to {}: {}\n",
                         script, *err);
      BOOST_LOG_SEV(lg, trivial::warning)
          << "patching " << script << " failed: " << *err;
    } else {
      log += fmt::format("Applied patch to {}\n", script);
    }
  }
}

monad::MyVoidResult
MigrationManager::migrate_via_resolv(remote::IRemoteShell &shell,
                                     const MigrationRequest &request,
                                     std::string &log) {
  if (auto pre = check_dns_preflight(); pre.is_err()) {
    return pre;
  }
  auto ip = target_ip(shell, request.target_url, log);
  if (ip.is_err()) {
    return monad::MyVoidResult::Err(ip.error());
  }

  if (auto mk = run(shell, remote::cmd::mkdir_p(paths::kPersistentDir));
      !mk.ok()) {
    log += fmt::format("Warning: mkdir -p {}: {}\n", paths::kPersistentDir,
                       *mk.error);
  }
  if (auto err = shell.upload(priority_resolv_content(ip.value()),
                              paths::kPriorityResolv)) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::STRATEGY_FAILED,
        fmt::format("failed to upload {}: {}", paths::kPriorityResolv, *err)));
  }
  log += fmt::format("Uploaded {}\n", paths::kPriorityResolv);

  auto boot = run(shell, remote::cmd::cat(paths::kBootScript));
  auto patched = patch_boot_script(boot.ok() ? boot.output : std::string{});
  if (patched.changed) {
    if (auto err = shell.upload(patched.text, paths::kBootScript)) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::MIGRATION::STRATEGY_FAILED,
          fmt::format("failed to update {}: {}", paths::kBootScript, *err)));
    }
    log += fmt::format("Updated {} with DNS hook logic\n", paths::kBootScript);
    if (auto chmod = run(shell, remote::cmd::chmod_exec(paths::kBootScript));
        !chmod.ok()) {
      log += fmt::format("Warning: chmod +x {}: {}\n", paths::kBootScript,
                         *chmod.error);
    }
  } else {
    log += fmt::format("{} already contains the DNS hook logic\n",
                       paths::kBootScript);
  }

  auto rw = run(shell, remote::cmd::remount_rw());
  log += fmt::format("{}: {}\n", remote::cmd::remount_rw().to_shell_string(),
                     rw.output);
  install_dhcp_hooks(shell, log);

  return ensure_ca_trusted(shell, log);
}

} // namespace speakerctrl::setup
