#pragma once

#include <boost/asio/ssl.hpp>
#include <string>

namespace chunkflow {
namespace tls {

namespace ssl = boost::asio::ssl;

// TLS 1.2+ without peer verification, as the node protocol has always used
void configure_context(ssl::context& context);

// Loads a PEM certificate chain and private key for a listening node
void use_certificate_files(ssl::context& context, const std::string& cert_file, const std::string& key_file);

// Generates an in-memory P-256 key and a self-signed certificate for nodes
// started without certificate files
void use_self_signed_certificate(ssl::context& context, const std::string& common_name);

} // namespace tls
} // namespace chunkflow
