/**
 * @file open_ssl_provider.h
 * @brief OpenSSL headers, library initialization and TLS context construction
 */
#pragma once

#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/verify_context.hpp>
#include <functional>
#include <openssl/bio.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>
#include <string>
#include <string_view>

namespace lanbeam::core {

class OpenSSLProvider {
public:
    using VerifyCallback = std::function<bool(bool, boost::asio::ssl::verify_context&)>;

    /**
     * @brief Initialize the OpenSSL library
     *
     * Safe to call any number of times from any thread; only the first call
     * does work. Throws std::runtime_error when initialization fails.
     */
    static void InitOpenSSL();

    /**
     * @brief Build a client context whose peer check is `verify_callback`
     *
     * Peers present self-signed certificates, so the callback decides on its
     * own and the chain verdict passed to it is only informational.
     */
    static boost::asio::ssl::context BuildClientContext(VerifyCallback verify_callback);

    /**
     * @brief Build a server context from a PEM certificate and private key
     */
    static boost::asio::ssl::context BuildServerContext(std::string_view cert_pem,
                                                        std::string_view key_pem);

    /**
     * @brief Set the SNI hostname of an outgoing connection
     */
    static bool SetHostname(SSL* ssl, std::string_view hostname);

    /**
     * @brief Text of the most recent OpenSSL error on this thread
     */
    static std::string LastError();

private:
    static std::string createSessionId(std::string_view prefix);
};

} // namespace lanbeam::core
