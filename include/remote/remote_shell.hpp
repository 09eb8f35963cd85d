#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "remote/remote_command.hpp"

namespace speakerctrl::remote {

struct ShellOutput {
  // stdout and stderr, interleaved as the device produced them
  std::string output;
  std::optional<std::string> error;

  bool ok() const { return !error.has_value(); }
};

// Command execution and file upload on one device.
class IRemoteShell {
public:
  virtual ~IRemoteShell() = default;

  virtual ShellOutput run(const RemoteCommand &command) = 0;

  // Replace remote_path with content. Returns an error message on failure.
  virtual std::optional<std::string> upload(std::string_view content,
                                            const std::string &remote_path) = 0;
};

class IRemoteShellFactory {
public:
  virtual ~IRemoteShellFactory() = default;

  virtual std::shared_ptr<IRemoteShell> open(const std::string &host) = 0;
};

} // namespace speakerctrl::remote
