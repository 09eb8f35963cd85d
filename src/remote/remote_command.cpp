#include "remote/remote_command.hpp"

#include <stdexcept>

namespace speakerctrl::remote {

namespace {

bool is_safe_char(char c) {
  if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
      (c >= '0' && c <= '9')) {
    return true;
  }
  switch (c) {
  case '_':
  case '-':
  case '.':
  case '/':
  case ':':
  case ',':
  case '=':
  case '+':
  case '@':
  case '%':
    return true;
  default:
    return false;
  }
}

} // namespace

std::string shell_quote(std::string_view arg) {
  // test(1) brackets are words of their own, never globbed
  if (arg == "[" || arg == "]") {
    return std::string(arg);
  }
  bool safe = !arg.empty();
  for (char c : arg) {
    if (!is_safe_char(c)) {
      safe = false;
      break;
    }
  }
  if (safe) {
    return std::string(arg);
  }
  std::string out;
  out.reserve(arg.size() + 2);
  out.push_back('\'');
  for (char c : arg) {
    if (c == '\'') {
      out.append("'\\''");
    } else {
      out.push_back(c);
    }
  }
  out.push_back('\'');
  return out;
}

RemoteCommand::RemoteCommand(std::vector<std::string> argv)
    : kind_(Kind::Simple), argv_(std::move(argv)) {
  if (argv_.empty()) {
    throw std::invalid_argument("RemoteCommand requires a program name");
  }
}

RemoteCommand::RemoteCommand(Kind kind, RemoteCommand left,
                             RemoteCommand right)
    : kind_(kind),
      left_(std::make_shared<const RemoteCommand>(std::move(left))),
      right_(std::make_shared<const RemoteCommand>(std::move(right))) {}

RemoteCommand RemoteCommand::and_then(RemoteCommand next) const {
  return RemoteCommand(Kind::And, *this, std::move(next));
}

RemoteCommand RemoteCommand::or_else(RemoteCommand next) const {
  return RemoteCommand(Kind::Or, *this, std::move(next));
}

RemoteCommand RemoteCommand::pipe_to(RemoteCommand next) const {
  return RemoteCommand(Kind::Pipe, *this, std::move(next));
}

std::string RemoteCommand::to_shell_string() const {
  switch (kind_) {
  case Kind::Simple: {
    std::string out;
    for (size_t i = 0; i < argv_.size(); ++i) {
      if (i) {
        out.push_back(' ');
      }
      out.append(shell_quote(argv_[i]));
    }
    return out;
  }
  case Kind::And:
    return left_->to_shell_string() + " && " + right_->to_shell_string();
  case Kind::Or:
    return "(" + left_->to_shell_string() + " || " +
           right_->to_shell_string() + ")";
  case Kind::Pipe:
    return left_->to_shell_string() + " | " + right_->to_shell_string();
  }
  return {};
}

namespace cmd {

RemoteCommand cat(const std::string &path) {
  return RemoteCommand::exec({"cat", path});
}

RemoteCommand cp(const std::string &from, const std::string &to) {
  return RemoteCommand::exec({"cp", from, to});
}

RemoteCommand rm(const std::string &path) {
  return RemoteCommand::exec({"rm", "-f", path});
}

RemoteCommand touch(const std::string &path) {
  return RemoteCommand::exec({"touch", path});
}

RemoteCommand mkdir_p(const std::string &path) {
  return RemoteCommand::exec({"mkdir", "-p", path});
}

RemoteCommand chmod_exec(const std::string &path) {
  return RemoteCommand::exec({"chmod", "+x", path});
}

RemoteCommand chattr_mutable(const std::string &path) {
  return RemoteCommand::exec({"chattr", "-i", path});
}

RemoteCommand file_exists(const std::string &path) {
  return RemoteCommand::exec({"[", "-f", path, "]"});
}

RemoteCommand grep_fixed(const std::string &pattern, const std::string &path) {
  return RemoteCommand::exec({"grep", "-F", pattern, path});
}

RemoteCommand ls(const std::string &path) {
  return RemoteCommand::exec({"ls", path});
}

RemoteCommand remount_rw() {
  return RemoteCommand::exec({"rw"}).or_else(
      RemoteCommand::exec({"mount", "-o", "remount,rw", "/"}));
}

RemoteCommand privileged(RemoteCommand next) {
  return remount_rw().and_then(std::move(next));
}

} // namespace cmd

} // namespace speakerctrl::remote
