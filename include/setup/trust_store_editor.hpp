#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <optional>
#include <string>
#include <string_view>

#include "remote/remote_shell.hpp"
#include "result_monad.hpp"

namespace speakerctrl::setup {

// Drop every block enclosed by two `label` lines (label lines included).
std::string strip_labeled_blocks(std::string_view bundle,
                                 std::string_view label);

// strip_labeled_blocks() then append "\n<label>\n<pem><label>\n".
std::string with_labeled_block(std::string_view bundle, std::string_view label,
                               std::string_view ca_pem);

// First base64 body line of a PEM certificate; a weak fingerprint for
// bundles whose label was lost.
std::optional<std::string> first_base64_line(std::string_view ca_pem);

// Keeps at most one labeled CA block inside the device trust bundle.
class TrustStoreEditor {
public:
  TrustStoreEditor(remote::IRemoteShell &shell, std::string bundle_path,
                   std::string label);

  bool is_trusted(std::string_view ca_pem);

  // Back up the bundle once, replace any previous block with ca_pem.
  monad::MyVoidResult inject(std::string_view ca_pem, std::string &log);

  // Remove our block if present. Missing bundle or block is not an error.
  monad::MyVoidResult remove(std::string &log);

private:
  remote::IRemoteShell &shell_;
  std::string bundle_path_;
  std::string label_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg;
};

} // namespace speakerctrl::setup
