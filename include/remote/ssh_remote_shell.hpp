#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "conf/speakerctrl_config.hpp"
#include "remote/remote_shell.hpp"

namespace speakerctrl::remote {

// Result of one local process run: exit code plus captured output.
struct ProcessResult {
  int exit_code{-1};
  std::string output;
  bool timed_out{false};
  std::optional<std::string> spawn_error;

  bool success() const {
    return !spawn_error && !timed_out && exit_code == 0;
  }
};

// Run argv, feeding stdin_data on standard input. stdout and stderr are
// captured into one buffer. The child is killed after `timeout`.
ProcessResult run_process(const std::vector<std::string> &argv,
                          std::string_view stdin_data,
                          std::chrono::milliseconds timeout);

// Device shell over the system OpenSSH client. Each run() is one ssh
// invocation; with reuse_connection a control master keeps the TCP/SSH
// session alive between invocations.
class SshRemoteShell : public IRemoteShell {
public:
  SshRemoteShell(std::string host, SshConfig config,
                 std::filesystem::path control_dir);

  ShellOutput run(const RemoteCommand &command) override;

  std::optional<std::string> upload(std::string_view content,
                                    const std::string &remote_path) override;

  // ssh argv up to and including the destination; the remote command
  // string follows.
  std::vector<std::string> ssh_argv() const;

private:
  ShellOutput invoke(const std::string &remote_command,
                     std::string_view stdin_data);

  std::string host_;
  SshConfig config_;
  std::filesystem::path control_dir_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg;
};

class SshRemoteShellFactory : public IRemoteShellFactory {
public:
  explicit SshRemoteShellFactory(ISpeakerctrlConfigProvider &config_provider)
      : config_provider_(config_provider) {}

  std::shared_ptr<IRemoteShell> open(const std::string &host) override;

private:
  ISpeakerctrlConfigProvider &config_provider_;
};

} // namespace speakerctrl::remote
