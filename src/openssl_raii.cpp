#include "openssl/openssl_raii.hpp"

#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <sys/stat.h>

#include <chrono>
#include <cstdint>

namespace speakerctrl {
namespace opensslutil {

namespace {
template <typename T> monad::MyResult<T> openssl_err(const std::string &what) {
  return monad::MyResult<T>::Err(monad::Error{
      .code = my_errors::OPENSSL::UNEXPECTED_RESULT, .what = what});
}
} // namespace

monad::MyResult<cryptutil::EVP_PKEY_ptr> make_rsa_key(int bits) {
  using R = cryptutil::EVP_PKEY_ptr;
  cryptutil::BIGNUM_ptr e(BN_new(), &BN_free);
  if (!e || BN_set_word(e.get(), RSA_F4) != 1)
    return openssl_err<R>("BN_set_word failed");

  cryptutil::EVP_PKEY_CTX_ptr genctx(EVP_PKEY_CTX_new_id(EVP_PKEY_RSA, nullptr),
                                     &EVP_PKEY_CTX_free);
  if (!genctx)
    return openssl_err<R>("EVP_PKEY_CTX_new_id failed");

  if (EVP_PKEY_keygen_init(genctx.get()) != 1) {
    return openssl_err<R>("EVP_PKEY_keygen_init failed");
  }
  if (EVP_PKEY_CTX_set_rsa_keygen_bits(genctx.get(), bits) != 1 ||
      EVP_PKEY_CTX_set1_rsa_keygen_pubexp(genctx.get(), e.get()) != 1) {
    return openssl_err<R>("EVP_PKEY_CTX_set_* failed");
  }

  EVP_PKEY *raw = nullptr;
  if (EVP_PKEY_keygen(genctx.get(), &raw) != 1) {
    return openssl_err<R>("EVP_PKEY_keygen failed");
  }
  return monad::MyResult<R>::Ok(R(raw, &EVP_PKEY_free));
}

monad::MyVoidResult add_ext(cryptutil::X509_ptr &cert, int nid,
                            const std::string &val) {
  X509V3_CTX ctx;
  X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);
  cryptutil::X509_EXTENSION_ptr ex(
      X509V3_EXT_conf_nid(nullptr, &ctx, nid, val.c_str()),
      &X509_EXTENSION_free);
  if (!ex)
    return monad::MyVoidResult::Err(
        monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                     .what = "X509V3_EXT_conf_nid failed"});
  if (X509_add_ext(cert.get(), ex.get(), -1) != 1) {
    return monad::MyVoidResult::Err(
        monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                     .what = "X509_add_ext failed"});
  }
  return monad::MyVoidResult::Ok();
}

monad::MyResult<cryptutil::X509_ptr> make_self_signed_ca(
    const cryptutil::EVP_PKEY_ptr &pkey, const std::string &C,
    const std::string &O, const std::string &CN, int days) {
  using R = cryptutil::X509_ptr;
  R cert(X509_new(), &X509_free);
  if (!cert)
    return openssl_err<R>("X509_new failed");

  if (X509_set_version(cert.get(), 2) != 1)
    return openssl_err<R>("set version failed");

  cryptutil::ASN1_INTEGER_ptr s(ASN1_INTEGER_new(), &ASN1_INTEGER_free);
  if (!s)
    return openssl_err<R>("ASN1_INTEGER_new failed");
  uint64_t ser = static_cast<uint64_t>(
      std::chrono::system_clock::now().time_since_epoch().count());
  ASN1_INTEGER_set_uint64(s.get(), ser);
  if (X509_set_serialNumber(cert.get(), s.get()) != 1)
    return openssl_err<R>("X509_set_serialNumber failed");

  cryptutil::X509_NAME_ptr name(X509_NAME_new(), &X509_NAME_free);
  if (!name)
    return openssl_err<R>("X509_NAME_new failed");

  auto add = [&](const char *fld, const std::string &v) {
    return X509_NAME_add_entry_by_txt(name.get(), fld, MBSTRING_ASC,
                                      (const unsigned char *)v.c_str(), -1, -1,
                                      0) != 1;
  };
  if (add("C", C) || add("O", O) || add("CN", CN)) {
    return openssl_err<R>("X509_NAME_add_entry_by_txt failed");
  }
  if (X509_set_subject_name(cert.get(), name.get()) != 1 ||
      X509_set_issuer_name(cert.get(), name.get()) != 1) {
    return openssl_err<R>("set name failed");
  }

  if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
      !X509_gmtime_adj(X509_getm_notAfter(cert.get()), 60L * 60 * 24 * days))
    return openssl_err<R>("set time failed");

  if (X509_set_pubkey(cert.get(), pkey.get()) != 1)
    return openssl_err<R>("X509_set_pubkey failed");

  auto ext_res1 =
      add_ext(cert, NID_basic_constraints, "critical,CA:TRUE,pathlen:1");
  if (!ext_res1.is_ok())
    return monad::MyResult<R>::Err(ext_res1.error());

  auto ext_res2 = add_ext(cert, NID_key_usage, "critical,keyCertSign,cRLSign");
  if (!ext_res2.is_ok())
    return monad::MyResult<R>::Err(ext_res2.error());

  auto ext_res3 = add_ext(cert, NID_subject_key_identifier, "hash");
  if (!ext_res3.is_ok())
    return monad::MyResult<R>::Err(ext_res3.error());

  if (X509_sign(cert.get(), pkey.get(), EVP_sha256()) == 0)
    return openssl_err<R>("X509_sign failed");
  return monad::MyResult<R>::Ok(std::move(cert));
}

monad::MyResult<std::string> x509_to_pem(const cryptutil::X509_ptr &cert) {
  cryptutil::BIO_ptr bio(BIO_new(BIO_s_mem()), &BIO_free);
  if (!bio || PEM_write_bio_X509(bio.get(), cert.get()) != 1)
    return openssl_err<std::string>("PEM_write_bio_X509 failed");
  char *data = nullptr;
  long len = BIO_get_mem_data(bio.get(), &data);
  return monad::MyResult<std::string>::Ok(
      std::string(data, static_cast<size_t>(len)));
}

monad::MyResult<cryptutil::X509_ptr> pem_to_x509(const std::string &pem) {
  using R = cryptutil::X509_ptr;
  cryptutil::BIO_ptr bio(
      BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), &BIO_free);
  if (!bio)
    return openssl_err<R>("BIO_new_mem_buf failed");
  X509 *raw = PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr);
  if (!raw)
    return openssl_err<R>("PEM_read_bio_X509 failed");
  return monad::MyResult<R>::Ok(R(raw, &X509_free));
}

monad::MyVoidResult write_pem_key_and_cert(const cryptutil::EVP_PKEY_ptr &key,
                                           const cryptutil::X509_ptr &cert,
                                           const std::string &key_path,
                                           const std::string &crt_path) {
  {
    cryptutil::BIO_ptr bio(BIO_new_file(key_path.c_str(), "w"), &BIO_free);
    if (!bio)
      return monad::MyVoidResult::Err(
          monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                       .what = "BIO_new_file key failed"});
    ::chmod(key_path.c_str(), S_IRUSR | S_IWUSR);
    if (PEM_write_bio_PrivateKey(bio.get(), key.get(), nullptr, nullptr, 0,
                                 nullptr, nullptr) != 1)
      return monad::MyVoidResult::Err(
          monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                       .what = "PEM_write_bio_PrivateKey failed"});
  }
  {
    cryptutil::BIO_ptr bio(BIO_new_file(crt_path.c_str(), "w"), &BIO_free);
    if (!bio)
      return monad::MyVoidResult::Err(
          monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                       .what = "BIO_new_file cert failed"});
    if (PEM_write_bio_X509(bio.get(), cert.get()) != 1)
      return monad::MyVoidResult::Err(
          monad::Error{.code = my_errors::OPENSSL::UNEXPECTED_RESULT,
                       .what = "PEM_write_bio_X509 failed"});
  }
  return monad::MyVoidResult::Ok();
}

} // namespace opensslutil
} // namespace speakerctrl
