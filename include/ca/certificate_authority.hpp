#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>
#include <filesystem>
#include <string>

#include "conf/speakerctrl_config.hpp"
#include "result_monad.hpp"

namespace speakerctrl {

// The local CA whose certificate is pushed into speaker trust bundles.
class ICertificateAuthority {
public:
  virtual ~ICertificateAuthority() = default;

  virtual std::filesystem::path ca_cert_path() const = 0;
  virtual std::filesystem::path ca_key_path() const = 0;
  virtual monad::MyResult<std::string> read_ca_cert_pem() const = 0;

  // Generate the key pair and self-signed certificate unless both exist.
  // Ok(true) when new material was written.
  virtual monad::MyResult<bool> ensure_ca() = 0;

  // Subject and validity of the current certificate.
  virtual monad::MyResult<std::string> describe() const = 0;
};

// ca.crt / ca.key under certs_dir.
class FileCertificateAuthority : public ICertificateAuthority {
public:
  explicit FileCertificateAuthority(
      ISpeakerctrlConfigProvider &config_provider);

  std::filesystem::path ca_cert_path() const override;
  std::filesystem::path ca_key_path() const override;
  monad::MyResult<std::string> read_ca_cert_pem() const override;

  monad::MyResult<bool> ensure_ca() override;

  monad::MyResult<std::string> describe() const override;

private:
  ISpeakerctrlConfigProvider &config_provider_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg;
};

} // namespace speakerctrl
