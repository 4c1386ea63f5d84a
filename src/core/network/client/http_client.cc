#include <boost/asio/ip/tcp.hpp>
#include <core/network/client/http_client.h>
#include <core/security/certificate_manager.h>
#include <core/security/open_ssl_provider.h>
#include <mutex>
#include <spdlog/spdlog.h>

namespace lanbeam::core {

using tcp = net::ip::tcp;

HttpClient::HttpClient(net::io_context& ioc)
    : ioc_(ioc) {}

HttpClient::HttpClient(net::io_context& ioc, std::string expected_fingerprint)
    : ioc_(ioc)
    , expected_fingerprint_(std::move(expected_fingerprint)) {
    ssl_ctx_.emplace(OpenSSLProvider::BuildClientContext(
        [this](bool, ssl::verify_context& ctx) -> bool {
            X509_STORE_CTX* store = ctx.native_handle();
            // only the leaf carries the announced key
            if (X509_STORE_CTX_get_error_depth(store) > 0) {
                return true;
            }
            X509* cert = X509_STORE_CTX_get_current_cert(store);
            if (!CertificateManager::Verify(*expected_fingerprint_, cert)) {
                verification_failed_ = true;
                return false;
            }
            return true;
        }));
}

HttpClient::~HttpClient() = default;

std::unique_ptr<HttpClient> HttpClient::ForPeer(net::io_context& ioc, const DeviceInfo& peer) {
    if (peer.https) {
        return std::make_unique<HttpClient>(ioc, peer.fingerprint);
    }
    static std::once_flag warned;
    std::call_once(warned, [] {
        spdlog::warn("Sending over plain HTTP: peers are identified by LAN trust only");
    });
    return std::make_unique<HttpClient>(ioc);
}

net::awaitable<bool> HttpClient::Connect(std::string_view host, unsigned short port) {
    try {
        if (IsConnected()) {
            co_await Disconnect();
        }
        verification_failed_ = false;

        tcp::resolver resolver(ioc_);
        auto results = co_await resolver.async_resolve(std::string(host),
                                                       std::to_string(port),
                                                       net::use_awaitable);

        if (ssl_ctx_) {
            tls_ = std::make_unique<beast::ssl_stream<beast::tcp_stream>>(beast::tcp_stream(ioc_),
                                                                          *ssl_ctx_);
            if (!OpenSSLProvider::SetHostname(tls_->native_handle(), host)) {
                throw std::runtime_error("Failed to set SNI Hostname");
            }
        } else {
            plain_ = std::make_unique<beast::tcp_stream>(ioc_);
        }

        lowestLayer().expires_after(transfer::kConnectTimeout);
        co_await lowestLayer().async_connect(results, net::use_awaitable);

        if (tls_) {
            co_await tls_->async_handshake(ssl::stream_base::client, net::use_awaitable);
        }
        lowestLayer().expires_never();

        current_host_ = host;
        current_port_ = port;

        spdlog::debug("Connected to {}:{}", host, port);
        co_return true;
    } catch (const std::exception& e) {
        if (verification_failed_) {
            spdlog::warn("Certificate of {}:{} does not match its fingerprint", host, port);
        } else {
            spdlog::warn("Connection to {}:{} failed: {}", host, port, e.what());
        }
        reset();
        co_return false;
    }
}

net::awaitable<bool> HttpClient::Disconnect() {
    if (!IsConnected()) {
        co_return true;
    }

    beast::error_code ec;
    if (tls_) {
        lowestLayer().expires_after(transfer::kConnectTimeout);
        co_await tls_->async_shutdown(net::redirect_error(net::use_awaitable, ec));
        if (ec && ec != net::error::eof && ec != ssl::error::stream_truncated) {
            spdlog::debug("SSL shutdown notice: {}", ec.message());
        }
    } else {
        plain_->socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    reset();
    spdlog::debug("Disconnected");
    co_return !ec;
}

bool HttpClient::IsConnected() const {
    return plain_ != nullptr || tls_ != nullptr;
}

std::string HttpClient::current_host() const {
    return current_host_;
}

unsigned short HttpClient::current_port() const {
    return current_port_;
}

net::awaitable<ClientResponse> HttpClient::Upload(http::request<http::buffer_body>& req,
                                                  ByteSource& source,
                                                  std::size_t chunk_size,
                                                  const ChunkCallback& on_chunk) {
    if (!IsConnected()) {
        throw std::runtime_error("No active connection");
    }
    if (tls_) {
        co_return co_await upload(*tls_, req, source, chunk_size, on_chunk);
    }
    co_return co_await upload(*plain_, req, source, chunk_size, on_chunk);
}

beast::tcp_stream& HttpClient::lowestLayer() {
    if (tls_) {
        return beast::get_lowest_layer(*tls_);
    }
    return *plain_;
}

void HttpClient::reset() {
    tls_.reset();
    plain_.reset();
    current_host_.clear();
    current_port_ = 0;
}

} // namespace lanbeam::core
