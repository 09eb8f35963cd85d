#include "handlers/ca_handler.hpp"

#include <fmt/format.h>

#include <iomanip>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/x509.h>

#include "my_error_codes.hpp"
#include "openssl/openssl_raii.hpp"

namespace speakerctrl {
namespace {

std::string fingerprint_sha256(const X509 *cert) {
  unsigned int len = 0;
  unsigned char md[EVP_MAX_MD_SIZE];
  if (X509_digest(cert, EVP_sha256(), md, &len) != 1) {
    return {};
  }
  std::ostringstream oss;
  for (unsigned int i = 0; i < len; ++i) {
    if (i) {
      oss << ':';
    }
    oss << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(md[i]);
  }
  return oss.str();
}

} // namespace

CaHandler::CaHandler(ICertificateAuthority &certificate_authority,
                     CliCtx &cli_ctx, customio::ConsoleOutput &output)
    : certificate_authority_(certificate_authority), cli_ctx_(cli_ctx),
      output_(output), opt_desc_("ca subcommand options") {}

std::string CaHandler::print_opt_desc() const {
  std::ostringstream oss;
  oss << "Usage:\n"
         "speaker-ctrl ca ensure   create the local CA if it does not exist\n"
         "speaker-ctrl ca show     print the CA certificate details\n"
      << std::endl;
  return oss.str();
}

monad::MyVoidResult CaHandler::show_usage(const std::string &msg) {
  if (!msg.empty()) {
    output_.error() << msg << std::endl;
  }
  return monad::MyVoidResult::Err(
      monad::make_error(my_errors::GENERAL::SHOW_OPT_DESC, print_opt_desc()));
}

monad::MyVoidResult CaHandler::start() {
  if (auto r = parse_handler_options(cli_ctx_.unrecognized, opt_desc_, vm_,
                                     args_);
      r.is_err()) {
    return show_usage(r.error().what);
  }
  const std::string action = args_.size() > 1 ? args_[1] : "show";
  if (action == "ensure") {
    return handle_ensure();
  } else if (action == "show") {
    return handle_show();
  }
  return show_usage(fmt::format("Unknown ca action: {}", action));
}

monad::MyVoidResult CaHandler::handle_ensure() {
  auto created = certificate_authority_.ensure_ca();
  if (created.is_err()) {
    return monad::MyVoidResult::Err(created.error());
  }
  if (created.value()) {
    output_.printer().green(fmt::format(
        "Created CA {}", certificate_authority_.ca_cert_path().string()));
  } else {
    output_.info() << "CA already present at "
                   << certificate_authority_.ca_cert_path().string()
                   << std::endl;
  }
  return handle_show();
}

monad::MyVoidResult CaHandler::handle_show() {
  auto text = certificate_authority_.describe();
  if (text.is_err()) {
    return monad::MyVoidResult::Err(text.error());
  }
  output_.out() << text.value();

  auto pem = certificate_authority_.read_ca_cert_pem();
  if (pem.is_ok()) {
    auto cert = opensslutil::pem_to_x509(pem.value());
    if (cert.is_ok()) {
      output_.out() << "sha256: " << fingerprint_sha256(cert.value().get())
                    << "\n";
    }
  }
  output_.out().flush();
  return monad::MyVoidResult::Ok();
}

} // namespace speakerctrl
