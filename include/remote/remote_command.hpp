#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace speakerctrl::remote {

// A command line for the device shell, kept as structured arguments until
// the transport needs a string. Simple commands hold an argv; compound
// commands combine two children with "&&", "||" or "|".
class RemoteCommand {
public:
  enum class Kind { Simple, And, Or, Pipe };

  // Simple command from argv; argv[0] is the program.
  explicit RemoteCommand(std::vector<std::string> argv);

  static RemoteCommand exec(std::vector<std::string> argv) {
    return RemoteCommand(std::move(argv));
  }

  // a && b
  RemoteCommand and_then(RemoteCommand next) const;
  // (a || b)
  RemoteCommand or_else(RemoteCommand next) const;
  // a | b
  RemoteCommand pipe_to(RemoteCommand next) const;

  Kind kind() const { return kind_; }
  const std::vector<std::string> &argv() const { return argv_; }
  const RemoteCommand &left() const { return *left_; }
  const RemoteCommand &right() const { return *right_; }

  // POSIX sh rendering; arguments outside the safe character set are
  // single-quoted.
  std::string to_shell_string() const;

private:
  RemoteCommand(Kind kind, RemoteCommand left, RemoteCommand right);

  Kind kind_{Kind::Simple};
  std::vector<std::string> argv_;
  std::shared_ptr<const RemoteCommand> left_;
  std::shared_ptr<const RemoteCommand> right_;
};

std::string shell_quote(std::string_view arg);

namespace cmd {

RemoteCommand cat(const std::string &path);
RemoteCommand cp(const std::string &from, const std::string &to);
RemoteCommand rm(const std::string &path);
RemoteCommand touch(const std::string &path);
RemoteCommand mkdir_p(const std::string &path);
RemoteCommand chmod_exec(const std::string &path);
RemoteCommand chattr_mutable(const std::string &path);
RemoteCommand file_exists(const std::string &path);
RemoteCommand grep_fixed(const std::string &pattern, const std::string &path);
RemoteCommand ls(const std::string &path);
// (rw || mount -o remount,rw /)
RemoteCommand remount_rw();
// remount_rw() && next
RemoteCommand privileged(RemoteCommand next);

} // namespace cmd

} // namespace speakerctrl::remote
