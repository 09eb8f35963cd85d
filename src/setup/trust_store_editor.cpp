#include "setup/trust_store_editor.hpp"

#include <fmt/format.h>

#include "my_error_codes.hpp"
#include "setup/migration_types.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace speakerctrl::setup {

std::string strip_labeled_blocks(std::string_view bundle,
                                 std::string_view label) {
  if (!stringutil::contains(bundle, label)) {
    return std::string(bundle);
  }
  const bool trailing_newline = !bundle.empty() && bundle.back() == '\n';
  std::vector<std::string> kept;
  bool inside = false;
  for (auto &line : stringutil::split_lines(bundle)) {
    if (stringutil::contains(line, label)) {
      if (!inside && !kept.empty() && stringutil::trimmed(kept.back()).empty()) {
        // separator written in front of the block
        kept.pop_back();
      }
      inside = !inside;
      continue;
    }
    if (!inside) {
      kept.push_back(std::move(line));
    }
  }
  auto out = stringutil::join(kept, "\n");
  if (trailing_newline && !out.empty()) {
    out.push_back('\n');
  }
  return out;
}

std::string with_labeled_block(std::string_view bundle, std::string_view label,
                               std::string_view ca_pem) {
  auto out = stringutil::ensure_trailing_newline(
      strip_labeled_blocks(bundle, label));
  out += fmt::format("\n{}\n{}{}\n", label,
                     stringutil::ensure_trailing_newline(std::string(ca_pem)),
                     label);
  return out;
}

std::optional<std::string> first_base64_line(std::string_view ca_pem) {
  for (const auto &line : stringutil::split_lines(ca_pem)) {
    auto t = stringutil::trimmed(line);
    if (t.empty() || stringutil::contains(t, "BEGIN CERTIFICATE") ||
        stringutil::contains(t, "END CERTIFICATE")) {
      continue;
    }
    return t;
  }
  return std::nullopt;
}

TrustStoreEditor::TrustStoreEditor(remote::IRemoteShell &shell,
                                   std::string bundle_path, std::string label)
    : shell_(shell), bundle_path_(std::move(bundle_path)),
      label_(std::move(label)) {}

bool TrustStoreEditor::is_trusted(std::string_view ca_pem) {
  auto labeled = shell_.run(remote::cmd::grep_fixed(label_, bundle_path_));
  if (labeled.ok() && stringutil::contains(labeled.output, label_)) {
    return true;
  }
  auto snippet = first_base64_line(ca_pem);
  if (!snippet) {
    return false;
  }
  return shell_.run(remote::cmd::grep_fixed(*snippet, bundle_path_)).ok();
}

monad::MyVoidResult TrustStoreEditor::inject(std::string_view ca_pem,
                                             std::string &log) {
  if (stringutil::trimmed(ca_pem).empty()) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TRUST_STORE::CA_UNAVAILABLE, "CA certificate is empty"));
  }
  auto rw = shell_.run(remote::cmd::remount_rw());
  log += fmt::format("{}: {}\n", remote::cmd::remount_rw().to_shell_string(),
                     rw.output);

  const auto backup = original_of(bundle_path_);
  if (!shell_.run(remote::cmd::file_exists(backup)).ok()) {
    auto copy = shell_.run(remote::cmd::cp(bundle_path_, backup));
    log += fmt::format("cp {} {}: {}\n", bundle_path_, backup,
                       copy.ok() ? copy.output : *copy.error);
  }

  auto current = shell_.run(remote::cmd::cat(bundle_path_));
  log += "cat " + bundle_path_ + " (check existing)\n";
  if (!current.ok()) {
    BOOST_LOG_SEV(lg, trivial::error)
        << "Cannot read trust bundle " << bundle_path_ << ": " << *current.error;
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TRUST_STORE::READ_FAILED,
        fmt::format("failed to read bundle: {}", *current.error)));
  }

  auto updated = with_labeled_block(current.output, label_, ca_pem);
  if (auto err = shell_.upload(updated, bundle_path_)) {
    return monad::MyVoidResult::Err(
        monad::make_error(my_errors::TRUST_STORE::WRITE_FAILED,
                          fmt::format("failed to update bundle: {}", *err)));
  }
  log += "Uploaded updated bundle to " + bundle_path_ + "\n";
  BOOST_LOG_SEV(lg, trivial::info) << "CA block written to " << bundle_path_;
  return monad::MyVoidResult::Ok();
}

monad::MyVoidResult TrustStoreEditor::remove(std::string &log) {
  auto current = shell_.run(remote::cmd::cat(bundle_path_));
  if (!current.ok()) {
    log += "Trust bundle not readable, nothing to remove\n";
    return monad::MyVoidResult::Ok();
  }
  if (!stringutil::contains(current.output, label_)) {
    log += "CA certificate not present in trust bundle\n";
    return monad::MyVoidResult::Ok();
  }
  if (auto rw = shell_.run(remote::cmd::remount_rw()); !rw.ok()) {
    log += "Warning: remount failed: " + *rw.error + "\n";
  }
  auto stripped = strip_labeled_blocks(current.output, label_);
  if (auto err = shell_.upload(stripped, bundle_path_)) {
    return monad::MyVoidResult::Err(monad::make_error(
        my_errors::TRUST_STORE::WRITE_FAILED,
        fmt::format("failed to rewrite bundle: {}", *err)));
  }
  log += "Removed CA certificate from " + bundle_path_ + "\n";
  return monad::MyVoidResult::Ok();
}

} // namespace speakerctrl::setup
