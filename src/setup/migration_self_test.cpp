#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "setup/dns_probe.hpp"
#include "setup/hosts_file.hpp"
#include "setup/migration_manager.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace speakerctrl::setup {

namespace {

remote::RemoteCommand curl(const std::string &url,
                           const std::string &ca_path = {}) {
  std::vector<std::string> argv{"curl", "--max-time",        "15",
                                "--connect-timeout", "10", "-v",
                                "-s",   "-L"};
  if (!ca_path.empty()) {
    argv.push_back("--cacert");
    argv.push_back(ca_path);
  }
  argv.push_back(url);
  return remote::RemoteCommand::exec(std::move(argv));
}

// Drops the temporary CA from the device when the probe is done.
class TestCaGuard {
public:
  explicit TestCaGuard(remote::IRemoteShell &shell) : shell_(shell) {}
  ~TestCaGuard() {
    if (armed_) {
      shell_.run(remote::cmd::rm(paths::kTestCa));
    }
  }
  TestCaGuard(const TestCaGuard &) = delete;
  TestCaGuard &operator=(const TestCaGuard &) = delete;

  void arm() { armed_ = true; }

private:
  remote::IRemoteShell &shell_;
  bool armed_{false};
};

} // namespace

monad::MyVoidResult
MigrationManager::upload_test_ca(remote::IRemoteShell &shell) {
  if (auto ensured = certificate_authority_.ensure_ca(); ensured.is_err()) {
    return monad::MyVoidResult::Err(ensured.error());
  }
  auto pem = certificate_authority_.read_ca_cert_pem();
  if (pem.is_err()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TRUST_STORE::CA_UNAVAILABLE,
        fmt::format("failed to read CA cert: {}", pem.error().what)));
  }
  if (auto err = shell.upload(pem.value(), paths::kTestCa)) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::REMOTE_SHELL::UPLOAD_FAILED,
        fmt::format("failed to upload temporary CA: {}", *err)));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult
MigrationManager::add_temporary_host_entry(remote::IRemoteShell &shell,
                                           const std::string &ip,
                                           std::string &log) {
  auto hosts = run(shell, remote::cmd::cat(paths::kHosts));
  if (!hosts.ok()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::SELF_TEST_FAILED,
        fmt::format("failed to read {}: {}", paths::kHosts, *hosts.error)));
  }
  std::string content = remove_hosts_entry(hosts.output, kSelfTestDomain);
  if (!content.empty() && content.back() != '\n') {
    content += '\n';
  }
  content += fmt::format("{}\t{}\n", ip, kSelfTestDomain);

  run(shell, remote::cmd::remount_rw());
  if (auto err = shell.upload(content, paths::kHosts)) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::SELF_TEST_FAILED,
        fmt::format("failed to add test entry to {}: {}", paths::kHosts,
                    *err)));
  }
  log += fmt::format("Added test entry {} -> {} to {}\n", kSelfTestDomain, ip,
                     paths::kHosts);
  return monad::MyVoidResult::Ok();
}

void MigrationManager::remove_temporary_host_entry(remote::IRemoteShell &shell,
                                                   std::string &log) {
  auto hosts = run(shell, remote::cmd::cat(paths::kHosts));
  if (!hosts.ok()) {
    log += fmt::format("Warning: cannot read {} to remove test entry: {}\n",
                       paths::kHosts, *hosts.error);
    return;
  }
  run(shell, remote::cmd::remount_rw());
  if (auto err = shell.upload(remove_hosts_entry(hosts.output, kSelfTestDomain),
                              paths::kHosts)) {
    log += fmt::format("Warning: failed to remove test entry from {}: {}\n",
                       paths::kHosts, *err);
    BOOST_LOG_SEV(lg, trivial::warning)
        << "test entry left in " << paths::kHosts << ": " << *err;
  }
}

monad::MyVoidResult
MigrationManager::test_hosts_redirection(const std::string &device_addr,
                                         const std::string &target_url,
                                         std::string &log) {
  const std::string target = effective_target(target_url);
  auto shell = shell_factory_.open(device_addr);
  auto ip = target_ip(*shell, target, log);
  if (ip.is_err()) {
    return monad::MyVoidResult::Err(ip.error());
  }
  if (auto added = add_temporary_host_entry(*shell, ip.value(), log);
      added.is_err()) {
    return added;
  }

  auto result = [&]() -> monad::MyVoidResult {
    auto port = stringutil::url_port(target);
    const std::string http_url =
        (!port || *port == "80")
            ? fmt::format("http://{}/health", kSelfTestDomain)
            : fmt::format("http://{}:{}/health", kSelfTestDomain, *port);
    auto http = run(*shell, curl(http_url));
    log += http.output;
    if (!http.ok()) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::MIGRATION::SELF_TEST_FAILED,
          fmt::format("hosts redirection HTTP test failed: {}", *http.error)));
    }
    log += "\n---\n";

    const auto https_port = config_provider_.get().https_port;
    const std::string https_url =
        https_port == 443
            ? fmt::format("https://{}/health", kSelfTestDomain)
            : fmt::format("https://{}:{}/health", kSelfTestDomain, https_port);
    TestCaGuard guard(*shell);
    if (auto ca = upload_test_ca(*shell); ca.is_err()) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::MIGRATION::SELF_TEST_FAILED,
          fmt::format("hosts redirection HTTPS test failed: {}",
                      ca.error().what)));
    }
    guard.arm();
    auto https = run(*shell, curl(https_url, paths::kTestCa));
    log += https.output;
    if (!https.ok()) {
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::MIGRATION::SELF_TEST_FAILED,
          fmt::format("hosts redirection HTTPS test failed: {}",
                      *https.error)));
    }
    return monad::MyVoidResult::Ok();
  }();

  remove_temporary_host_entry(*shell, log);
  BOOST_LOG_SEV(lg, trivial::info)
      << "hosts redirection test on " << device_addr << ": "
      << (result.is_ok() ? "ok" : result.error().what);
  return result;
}

monad::MyVoidResult
MigrationManager::test_connection(const std::string &device_addr,
                                  const std::string &target_url,
                                  bool use_explicit_ca, std::string &log) {
  const std::string target = effective_target(target_url);
  auto shell = shell_factory_.open(device_addr);

  TestCaGuard guard(*shell);
  if (use_explicit_ca) {
    if (auto ca = upload_test_ca(*shell); ca.is_err()) {
      return ca;
    }
    guard.arm();
  }
  auto out =
      run(*shell, curl(target, use_explicit_ca ? paths::kTestCa : ""));
  log += out.output;
  if (!out.ok()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::MIGRATION::SELF_TEST_FAILED,
        fmt::format("connection test failed: {}", *out.error)));
  }
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult
MigrationManager::test_dns_redirection(const std::string &device_addr,
                                       const std::string &target_url,
                                       std::string &log) {
  const std::string target = effective_target(target_url);
  auto shell = shell_factory_.open(device_addr);
  auto ip_r = target_ip(*shell, target, log);
  if (ip_r.is_err()) {
    return monad::MyVoidResult::Err(ip_r.error());
  }
  const std::string &ip = ip_r.value();
  const std::string port = dns_port_of(device_store_.get_dns_settings().bind_addr);

  // BusyBox nslookup cannot pick a port, so the first attempt is a raw
  // DNS-over-TCP query through nc.
  auto query = remote::RemoteCommand::exec(
                   {"echo", "-ne", dns_query_escape(kDnsProbeDomain)})
                   .pipe_to(remote::RemoteCommand::exec(
                       {"nc", "-w", "5", ip, port}))
                   .pipe_to(remote::RemoteCommand::exec({"tail", "-c", "4"}))
                   .pipe_to(remote::RemoteCommand::exec({"od", "-An", "-tu1"}));
  auto nc = run(*shell, query);
  if (nc.ok()) {
    if (auto answered = parse_od_ipv4(nc.output)) {
      if (*answered == ip) {
        log += fmt::format(
            "Success: Raw DNS query for {} returned {} via nc to {}:{}",
            kDnsProbeDomain, *answered, ip, port);
        return monad::MyVoidResult::Ok();
      }
      log += nc.output;
      return monad::MyVoidResult::Err(monad::make_error(
          my_errors::MIGRATION::SELF_TEST_FAILED,
          fmt::format("DNS redirection test failed: nc returned {}, expected "
                      "{}",
                      *answered, ip)));
    }
  }

  const std::string server = port == "53" ? ip : fmt::format("{}:{}", ip, port);
  auto ns = run(*shell,
                remote::RemoteCommand::exec({"nslookup", kDnsProbeDomain, server}));
  if (ns.ok() && stringutil::contains(ns.output, ip)) {
    log += ns.output;
    return monad::MyVoidResult::Ok();
  }
  log += fmt::format("nc Output: {} (err: {})\nnslookup Output: {} (err: {})",
                     nc.output, nc.error.value_or("none"), ns.output,
                     ns.error.value_or("none"));
  return monad::MyVoidResult::Err(monad::make_error(
      my_errors::MIGRATION::SELF_TEST_FAILED,
      fmt::format("DNS redirection test failed: both nc and nslookup failed to "
                  "resolve {}",
                  kDnsProbeDomain)));
}

} // namespace speakerctrl::setup
