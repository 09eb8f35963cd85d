#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "setup/migration_manager.hpp"
#include "setup/text_patch.hpp"
#include "setup/trust_store_editor.hpp"
#include "util/my_logging.hpp"

namespace speakerctrl::setup {

monad::MyVoidResult
MigrationManager::revert_migration(const std::string &device_addr,
                                   std::string &log) {
  BOOST_LOG_SEV(lg, trivial::info) << "Reverting migration of " << device_addr;
  auto shell = shell_factory_.open(device_addr);

  if (auto r = revert_private_config(*shell, log); r.is_err()) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Revert of " << device_addr << " failed: " << r.error().what;
    return r;
  }

  restore_if_backed_up(*shell, paths::kHosts, log);

  // resolv.conf may have been made immutable by earlier tooling
  if (exists(*shell, original_of(paths::kResolvConf))) {
    auto chattr = run(*shell, remote::cmd::privileged(
                                  remote::cmd::chattr_mutable(paths::kResolvConf)));
    if (!chattr.ok()) {
      log += fmt::format("chattr -i {}: {}\n", paths::kResolvConf,
                         chattr.error.value_or(""));
    }
    restore_if_backed_up(*shell, paths::kResolvConf, log);
  }

  revert_dns_hook(*shell, log);
  revert_ca_cert(*shell, log);

  BOOST_LOG_SEV(lg, trivial::info) << "Reverted migration of " << device_addr;
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult
MigrationManager::revert_private_config(remote::IRemoteShell &shell,
                                        std::string &log) {
  const std::string backup = original_of(paths::kPrivateConfig);
  if (!exists(shell, backup)) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::BACKUP_MISSING,
        fmt::format("backup {} not found, cannot revert", backup)));
  }
  auto cp = run(shell, remote::cmd::privileged(
                           remote::cmd::cp(backup, paths::kPrivateConfig)));
  log += fmt::format("Restoring {}: {}\n", paths::kPrivateConfig, cp.output);
  if (!cp.ok()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::REMOTE_SHELL::EXEC_FAILED,
        fmt::format("failed to restore {}: {}", paths::kPrivateConfig,
                    *cp.error)));
  }
  return monad::MyVoidResult::Ok();
}

void MigrationManager::restore_if_backed_up(remote::IRemoteShell &shell,
                                            const std::string &path,
                                            std::string &log) {
  const std::string backup = original_of(path);
  if (!exists(shell, backup)) {
    return;
  }
  auto cp = run(shell, remote::cmd::privileged(remote::cmd::cp(backup, path)));
  log += fmt::format("Restoring {}: {}\n", path, cp.output);
  if (!cp.ok()) {
    log += fmt::format("Warning: failed to restore {}: {}\n", path, *cp.error);
    BOOST_LOG_SEV(lg, trivial::warning)
        << "restoring " << path << " failed: " << *cp.error;
  }
}

void MigrationManager::revert_dns_hook(remote::IRemoteShell &shell,
                                       std::string &log) {
  if (exists(shell, paths::kPriorityResolv)) {
    auto rm = run(shell, remote::cmd::rm(paths::kPriorityResolv));
    log += fmt::format("Removing {}: {}\n", paths::kPriorityResolv,
                       rm.ok() ? rm.output : rm.error.value_or(""));
  }

  if (exists(shell, paths::kBootScript)) {
    auto boot = run(shell, remote::cmd::cat(paths::kBootScript));
    if (!boot.ok() || looks_like_read_error(boot.output)) {
      auto rm = run(shell, remote::cmd::rm(paths::kBootScript));
      log += fmt::format("Removing corrupted {}: {}\n", paths::kBootScript,
                         rm.output);
    } else {
      auto stripped = strip_boot_hook(boot.output);
      if (stripped.changed) {
        if (auto err = shell.upload(stripped.text, paths::kBootScript)) {
          log += fmt::format("Warning: failed to clean {}: {}\n",
                             paths::kBootScript, *err);
        } else {
          log += fmt::format("Removed DNS hook from {}\n", paths::kBootScript);
        }
      }
    }
  }

  restore_if_backed_up(shell, paths::kDhcpDefaultScript, log);
  restore_if_backed_up(shell, paths::kDhcpBoseScript, log);
}

void MigrationManager::revert_ca_cert(remote::IRemoteShell &shell,
                                      std::string &log) {
  TrustStoreEditor editor(shell, paths::kCaBundle, kCaLabel);
  if (auto r = editor.remove(log); r.is_err()) {
    log += fmt::format("Warning: failed to remove CA certificate: {}\n",
                       r.error().what);
    BOOST_LOG_SEV(lg, trivial::warning)
        << "removing CA block failed: " << r.error().what;
  }
}

} // namespace speakerctrl::setup
