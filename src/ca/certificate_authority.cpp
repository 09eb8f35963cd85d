#include "ca/certificate_authority.hpp"

#include <fmt/format.h>
#include <openssl/bio.h>
#include <openssl/x509.h>

#include <fstream>
#include <sstream>

#include "my_error_codes.hpp"
#include "openssl/openssl_raii.hpp"
#include "util/my_logging.hpp"

namespace speakerctrl {

namespace {

constexpr char kCaCommonName[] = "speaker-ctrl Local CA";
constexpr char kCaOrganization[] = "speaker-ctrl";
constexpr int kCaValidityDays = 3650;

std::string asn1_time_text(const ASN1_TIME *t) {
  cryptutil::BIO_ptr bio(BIO_new(BIO_s_mem()), &BIO_free);
  if (!bio || ASN1_TIME_print(bio.get(), t) != 1) {
    return "?";
  }
  char *data = nullptr;
  long len = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<size_t>(len));
}

} // namespace

FileCertificateAuthority::FileCertificateAuthority(
    ISpeakerctrlConfigProvider &config_provider)
    : config_provider_(config_provider) {}

std::filesystem::path FileCertificateAuthority::ca_cert_path() const {
  return config_provider_.get().certs_dir / "ca.crt";
}

std::filesystem::path FileCertificateAuthority::ca_key_path() const {
  return config_provider_.get().certs_dir / "ca.key";
}

monad::MyResult<std::string> FileCertificateAuthority::read_ca_cert_pem() const {
  auto path = ca_cert_path();
  std::ifstream ifs(path);
  if (!ifs) {
    return monad::MyResult<std::string>::Err(monad::make_error(
        my_errors::TRUST_STORE::CA_UNAVAILABLE,
        fmt::format("CA certificate not found at {}", path.string())));
  }
  std::stringstream ss;
  ss << ifs.rdbuf();
  return monad::MyResult<std::string>::Ok(ss.str());
}

monad::MyResult<bool> FileCertificateAuthority::ensure_ca() {
  std::error_code ec;
  if (std::filesystem::exists(ca_cert_path(), ec) &&
      std::filesystem::exists(ca_key_path(), ec)) {
    return monad::MyResult<bool>::Ok(false);
  }
  std::filesystem::create_directories(config_provider_.get().certs_dir, ec);
  if (ec) {
    return monad::MyResult<bool>::Err(monad::make_error(
        my_errors::GENERAL::FILE_READ_WRITE,
        fmt::format("cannot create {}: {}",
                    config_provider_.get().certs_dir.string(), ec.message())));
  }

  auto key_r = opensslutil::make_rsa_key(2048);
  if (key_r.is_err()) {
    return monad::MyResult<bool>::Err(key_r.error());
  }
  auto key = std::move(key_r.value());
  auto cert_r = opensslutil::make_self_signed_ca(key, "US", kCaOrganization,
                                                 kCaCommonName, kCaValidityDays);
  if (cert_r.is_err()) {
    return monad::MyResult<bool>::Err(cert_r.error());
  }
  auto cert = std::move(cert_r.value());
  if (auto r = opensslutil::write_pem_key_and_cert(
          key, cert, ca_key_path().string(), ca_cert_path().string());
      r.is_err()) {
    return monad::MyResult<bool>::Err(r.error());
  }
  BOOST_LOG_SEV(lg, trivial::info)
      << "Created local CA at " << ca_cert_path().string();
  return monad::MyResult<bool>::Ok(true);
}

monad::MyResult<std::string> FileCertificateAuthority::describe() const {
  auto pem = read_ca_cert_pem();
  if (pem.is_err()) {
    return monad::MyResult<std::string>::Err(pem.error());
  }
  auto cert = opensslutil::pem_to_x509(pem.value());
  if (cert.is_err()) {
    return monad::MyResult<std::string>::Err(cert.error());
  }
  char subject[256] = {0};
  X509_NAME_oneline(X509_get_subject_name(cert.value().get()), subject,
                    sizeof(subject));
  return monad::MyResult<std::string>::Ok(fmt::format(
      "path: {}\nsubject: {}\nnot before: {}\nnot after: {}\n",
      ca_cert_path().string(), subject,
      asn1_time_text(X509_get0_notBefore(cert.value().get())),
      asn1_time_text(X509_get0_notAfter(cert.value().get()))));
}

} // namespace speakerctrl
