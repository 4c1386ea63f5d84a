#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/security/open_ssl_provider.h>
#include <mutex>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace ssl = boost::asio::ssl;
namespace uuids = boost::uuids;

namespace lanbeam::core {

std::string OpenSSLProvider::createSessionId(std::string_view prefix) {
    uuids::random_generator gen;
    return std::string(prefix) + "_" + uuids::to_string(gen());
}

void OpenSSLProvider::InitOpenSSL() {
    static std::once_flag once;
    std::call_once(once, [] {
        if (OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS | OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                             nullptr)
            == 0) {
            spdlog::error("OPENSSL_init_ssl failed");
            throw std::runtime_error("OpenSSL initialization failed");
        }
    });
}

ssl::context OpenSSLProvider::BuildClientContext(VerifyCallback verify_callback) {
    ssl::context ctx(ssl::context::tlsv12_client);

    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2
                    | ssl::context::no_sslv3);

    SSL_CTX_set_session_cache_mode(ctx.native_handle(), SSL_SESS_CACHE_CLIENT);
    SSL_CTX_sess_set_cache_size(ctx.native_handle(), 128);

    // SSL_CTX_set_session_id_context caps the id at 32 bytes
    std::string session_id_context = createSessionId("lb").substr(0, SSL_MAX_SID_CTX_LENGTH);
    SSL_CTX_set_session_id_context(ctx.native_handle(),
                                   reinterpret_cast<const unsigned char*>(
                                       session_id_context.c_str()),
                                   static_cast<unsigned int>(session_id_context.length()));

    ctx.set_verify_mode(ssl::verify_peer);
    ctx.set_verify_callback(std::move(verify_callback));

    return ctx;
}

ssl::context OpenSSLProvider::BuildServerContext(std::string_view cert_pem,
                                                 std::string_view key_pem) {
    ssl::context ctx(ssl::context::tlsv12_server);

    ctx.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2
                    | ssl::context::no_sslv3 | ssl::context::single_dh_use);

    ctx.use_certificate(boost::asio::buffer(cert_pem.data(), cert_pem.size()), ssl::context::pem);
    ctx.use_private_key(boost::asio::buffer(key_pem.data(), key_pem.size()), ssl::context::pem);

    return ctx;
}

bool OpenSSLProvider::SetHostname(SSL* ssl, std::string_view hostname) {
    std::string name(hostname);
    return ssl != nullptr && SSL_set_tlsext_host_name(ssl, name.c_str());
}

std::string OpenSSLProvider::LastError() {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return "no error";
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

} // namespace lanbeam::core
