#include "remote/ssh_remote_shell.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>
#include <system_error>

#include "util/my_logging.hpp"

namespace speakerctrl::remote {

namespace {

// Algorithms the speaker firmware's dropbear still needs.
const std::vector<std::string> kLegacyOptions = {
    "KexAlgorithms=+diffie-hellman-group1-sha1,diffie-hellman-group14-sha1",
    "HostKeyAlgorithms=+ssh-rsa,ssh-dss",
    "PubkeyAcceptedAlgorithms=+ssh-rsa",
    "Ciphers=+aes128-cbc,3des-cbc,aes256-cbc",
};

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

} // namespace

ProcessResult run_process(const std::vector<std::string> &args,
                          std::string_view stdin_data,
                          std::chrono::milliseconds timeout) {
  ProcessResult result;
  if (args.empty()) {
    result.spawn_error = "run_process requires arguments";
    return result;
  }

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  if (pipe(in_pipe) == -1 || pipe(out_pipe) == -1) {
    close_fd(in_pipe[0]);
    close_fd(in_pipe[1]);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    result.spawn_error = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }

  pid_t pid = fork();
  if (pid == -1) {
    close_fd(in_pipe[0]);
    close_fd(in_pipe[1]);
    close_fd(out_pipe[0]);
    close_fd(out_pipe[1]);
    result.spawn_error = std::string("fork failed: ") + std::strerror(errno);
    return result;
  }

  if (pid == 0) {
    // child
    if (dup2(in_pipe[0], STDIN_FILENO) == -1 ||
        dup2(out_pipe[1], STDOUT_FILENO) == -1 ||
        dup2(out_pipe[1], STDERR_FILENO) == -1) {
      _exit(127);
    }
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    ::close(out_pipe[1]);

    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (const auto &arg : args) {
      argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);
    execvp(argv[0], argv.data());
    _exit(127);
  }

  close_fd(in_pipe[0]);
  close_fd(out_pipe[1]);
  ::signal(SIGPIPE, SIG_IGN);

  // stdin and stdout are serviced together so a large upload cannot
  // deadlock against a chatty child
  ::fcntl(in_pipe[1], F_SETFL, ::fcntl(in_pipe[1], F_GETFL) | O_NONBLOCK);
  size_t written = 0;
  if (stdin_data.empty()) {
    close_fd(in_pipe[1]);
  }

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  char buffer[4096];
  while (out_pipe[0] >= 0) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      result.timed_out = true;
      break;
    }
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

    pollfd fds[2];
    nfds_t nfds = 0;
    fds[nfds++] = {out_pipe[0], POLLIN, 0};
    if (in_pipe[1] >= 0) {
      fds[nfds++] = {in_pipe[1], POLLOUT, 0};
    }
    int rc = ::poll(fds, nfds,
                    static_cast<int>(std::min<long long>(remaining.count(), 200)));
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      ssize_t n = ::read(out_pipe[0], buffer, sizeof(buffer));
      if (n > 0) {
        result.output.append(buffer, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        close_fd(out_pipe[0]);
      }
    }
    if (nfds > 1 && (fds[1].revents & (POLLOUT | POLLERR | POLLHUP))) {
      ssize_t n = ::write(in_pipe[1], stdin_data.data() + written,
                          stdin_data.size() - written);
      if (n > 0) {
        written += static_cast<size_t>(n);
      }
      if ((n < 0 && errno != EAGAIN && errno != EINTR) ||
          written >= stdin_data.size()) {
        close_fd(in_pipe[1]);
      }
    }
  }
  close_fd(in_pipe[1]);
  close_fd(out_pipe[0]);

  int status = 0;
  if (result.timed_out) {
    kill(pid, SIGKILL);
    waitpid(pid, &status, 0);
    return result;
  }

  // output closed; give the child the rest of the budget to exit
  while (true) {
    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
      break;
    }
    if (w == -1) {
      result.spawn_error =
          std::string("waitpid failed: ") + std::strerror(errno);
      return result;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      kill(pid, SIGKILL);
      waitpid(pid, &status, 0);
      result.timed_out = true;
      return result;
    }
    usleep(20 * 1000);
  }

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.exit_code = -1;
    result.output.append(
        fmt::format("\nProcess terminated by signal {}", WTERMSIG(status)));
  }
  return result;
}

SshRemoteShell::SshRemoteShell(std::string host, SshConfig config,
                               std::filesystem::path control_dir)
    : host_(std::move(host)), config_(std::move(config)),
      control_dir_(std::move(control_dir)) {}

std::vector<std::string> SshRemoteShell::ssh_argv() const {
  std::vector<std::string> argv{config_.binary,
                                "-p",
                                std::to_string(config_.port),
                                "-o",
                                "BatchMode=yes",
                                "-o",
                                "StrictHostKeyChecking=no",
                                "-o",
                                "UserKnownHostsFile=/dev/null",
                                "-o",
                                "LogLevel=ERROR",
                                "-o",
                                fmt::format("ConnectTimeout={}",
                                            config_.connect_timeout_seconds)};
  for (const auto &opt : kLegacyOptions) {
    argv.push_back("-o");
    argv.push_back(opt);
  }
  if (config_.reuse_connection && !control_dir_.empty()) {
    argv.push_back("-o");
    argv.push_back("ControlMaster=auto");
    argv.push_back("-o");
    argv.push_back("ControlPath=" + (control_dir_ / "%r@%h:%p").string());
    argv.push_back("-o");
    argv.push_back("ControlPersist=30");
  }
  for (const auto &opt : config_.extra_options) {
    argv.push_back("-o");
    argv.push_back(opt);
  }
  argv.push_back(config_.user + "@" + host_);
  return argv;
}

ShellOutput SshRemoteShell::invoke(const std::string &remote_command,
                                   std::string_view stdin_data) {
  auto argv = ssh_argv();
  argv.push_back("--");
  argv.push_back(remote_command);

  BOOST_LOG_SEV(lg, trivial::debug)
      << "ssh " << host_ << ": " << remote_command;

  auto result = run_process(
      argv, stdin_data,
      std::chrono::duration_cast<std::chrono::milliseconds>(
          config_.command_timeout()));

  ShellOutput out;
  out.output = std::move(result.output);
  if (result.spawn_error) {
    out.error = "failed to start ssh: " + *result.spawn_error;
  } else if (result.timed_out) {
    out.error = fmt::format("command timed out after {}s",
                            config_.command_timeout_seconds);
  } else if (result.exit_code == 255) {
    // ssh reserves 255 for its own failures
    out.error = fmt::format("ssh to {} failed: {}", host_, out.output);
  } else if (result.exit_code != 0) {
    out.error = fmt::format("command exited with code {}", result.exit_code);
  }
  if (out.error) {
    BOOST_LOG_SEV(lg, trivial::debug) << "ssh " << host_ << " error: "
                                      << *out.error;
  }
  return out;
}

ShellOutput SshRemoteShell::run(const RemoteCommand &command) {
  return invoke(command.to_shell_string(), {});
}

std::optional<std::string>
SshRemoteShell::upload(std::string_view content,
                       const std::string &remote_path) {
  auto result = invoke("cat > " + shell_quote(remote_path), content);
  if (!result.ok()) {
    return fmt::format("upload to {} failed: {}", remote_path, *result.error);
  }
  return std::nullopt;
}

std::shared_ptr<IRemoteShell>
SshRemoteShellFactory::open(const std::string &host) {
  const auto &cfg = config_provider_.get();
  std::filesystem::path control_dir;
  if (cfg.ssh.reuse_connection && !cfg.runtime_dir.empty()) {
    control_dir = cfg.runtime_dir / "ssh";
    std::error_code ec;
    std::filesystem::create_directories(control_dir, ec);
    if (ec) {
      BOOST_LOG_SEV(app_logger(), trivial::warning)
          << "Cannot create ssh control dir " << control_dir << ": "
          << ec.message() << "; connection reuse disabled";
      control_dir.clear();
    }
  }
  return std::make_shared<SshRemoteShell>(host, cfg.ssh, control_dir);
}

} // namespace speakerctrl::remote
