#include "chunkflow/tls.hpp"
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/x509.h>
#include <memory>
#include <stdexcept>

namespace chunkflow {
namespace tls {

namespace {

using EVP_PKEY_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using EVP_PKEY_CTX_ptr = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using X509_ptr = std::unique_ptr<X509, decltype(&X509_free)>;

const long CERTIFICATE_LIFETIME_SECONDS = 365L * 24 * 3600;

EVP_PKEY_ptr generate_key() {
    EVP_PKEY_CTX_ptr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr), &EVP_PKEY_CTX_free);
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1 ||
        EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx.get(), NID_X9_62_prime256v1) != 1) {
        throw std::runtime_error("Failed to set up EC key generation");
    }
    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
        throw std::runtime_error("Failed to generate EC key");
    }
    return EVP_PKEY_ptr(raw, &EVP_PKEY_free);
}

}

void configure_context(ssl::context& context) {
    context.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 | ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use);
    context.set_verify_mode(ssl::verify_none);
}

void use_certificate_files(ssl::context& context, const std::string& cert_file, const std::string& key_file) {
    context.use_certificate_chain_file(cert_file);
    context.use_private_key_file(key_file, ssl::context::pem);
}

void use_self_signed_certificate(ssl::context& context, const std::string& common_name) {
    EVP_PKEY_ptr key = generate_key();
    X509_ptr cert(X509_new(), &X509_free);
    if (!cert) {
        throw std::runtime_error("Failed to allocate certificate");
    }

    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), CERTIFICATE_LIFETIME_SECONDS);
    X509_set_pubkey(cert.get(), key.get());

    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>(common_name.c_str()), -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    if (X509_sign(cert.get(), key.get(), EVP_sha256()) == 0) {
        throw std::runtime_error("Failed to sign certificate");
    }

    // The SSL_CTX takes its own references
    if (SSL_CTX_use_certificate(context.native_handle(), cert.get()) != 1 ||
        SSL_CTX_use_PrivateKey(context.native_handle(), key.get()) != 1) {
        throw std::runtime_error("Failed to install self-signed certificate");
    }
}

} // namespace tls
} // namespace chunkflow
