#pragma once

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/evp.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <memory>
#include <string>

#include "my_error_codes.hpp"
#include "result_monad.hpp"

namespace speakerctrl {
namespace cryptutil {

using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EVP_PKEY_CTX_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using X509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using X509_NAME_ptr = std::unique_ptr<X509_NAME, decltype(&X509_NAME_free)>;
using X509_EXTENSION_ptr =
    std::unique_ptr<X509_EXTENSION, decltype(&X509_EXTENSION_free)>;
using ASN1_INTEGER_ptr =
    std::unique_ptr<ASN1_INTEGER, decltype(&ASN1_INTEGER_free)>;
using BIO_ptr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using BIGNUM_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

} // namespace cryptutil

namespace opensslutil {

monad::MyResult<cryptutil::EVP_PKEY_ptr> make_rsa_key(int bits = 2048);

monad::MyResult<cryptutil::X509_ptr> make_self_signed_ca(
    const cryptutil::EVP_PKEY_ptr &pkey, //
    const std::string &C,                //
    const std::string &O,                //
    const std::string &CN,               //
    int days = 3650);

monad::MyVoidResult add_ext(cryptutil::X509_ptr &cert, int nid,
                            const std::string &val);

// PEM text of a certificate.
monad::MyResult<std::string> x509_to_pem(const cryptutil::X509_ptr &cert);

// Parse the first certificate of a PEM string.
monad::MyResult<cryptutil::X509_ptr> pem_to_x509(const std::string &pem);

// Write key (mode 0600) and certificate as PEM files.
monad::MyVoidResult write_pem_key_and_cert(const cryptutil::EVP_PKEY_ptr &key,
                                           const cryptutil::X509_ptr &cert,
                                           const std::string &key_path,
                                           const std::string &crt_path);

} // namespace opensslutil
} // namespace speakerctrl
