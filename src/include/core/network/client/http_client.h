#pragma once

#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <algorithm>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <core/constant/transfer.h>
#include <core/model/device_info.h>
#include <core/model/error.h>
#include <core/network/client/byte_source.h>
#include <chrono>
#include <cstdint>
#include <fmt/format.h>
#include <functional>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace lanbeam::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;

using ClientResponse = http::response<http::string_body>;

// Called with the bytes written so far before each chunk goes out. Returning
// false abandons the upload.
using ChunkCallback = std::function<bool(uint64_t)>;

// HTTP/1.1 client for one peer. Over TLS the peer certificate is accepted
// only when its public key hashes to the fingerprint the peer announced.
class HttpClient {
public:
    explicit HttpClient(net::io_context& ioc);
    HttpClient(net::io_context& ioc, std::string expected_fingerprint);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Plain or TLS client matching the scheme `peer` announced.
    static std::unique_ptr<HttpClient> ForPeer(net::io_context& ioc, const DeviceInfo& peer);

    net::awaitable<bool> Connect(std::string_view host, unsigned short port);

    net::awaitable<bool> Disconnect();

    bool IsConnected() const;

    bool https() const { return expected_fingerprint_.has_value(); }

    // Set when the last TLS handshake failed on the fingerprint check.
    bool verification_failed() const { return verification_failed_; }

    std::string current_host() const;

    unsigned short current_port() const;

    // `timeout` bounds the whole exchange; the prepare-upload call needs more
    // than transfer::kIoTimeout since the receiver may be waiting on a person.
    template<typename RequestBody>
    net::awaitable<ClientResponse> SendRequest(http::request<RequestBody>& req,
                                               std::chrono::seconds timeout = transfer::kIoTimeout);

    // Streams `source` as the body of `req`, whose content length must
    // already be set.
    net::awaitable<ClientResponse> Upload(http::request<http::buffer_body>& req,
                                          ByteSource& source,
                                          std::size_t chunk_size,
                                          const ChunkCallback& on_chunk);

    template<typename Body>
    http::request<Body> CreateRequest(http::verb method,
                                      const std::string& target,
                                      bool keep_alive = true);

private:
    template<typename Stream, typename RequestBody>
    net::awaitable<ClientResponse> exchange(Stream& stream,
                                            http::request<RequestBody>& req,
                                            std::chrono::seconds timeout);

    template<typename Stream>
    net::awaitable<ClientResponse> upload(Stream& stream,
                                          http::request<http::buffer_body>& req,
                                          ByteSource& source,
                                          std::size_t chunk_size,
                                          const ChunkCallback& on_chunk);

    template<typename Stream>
    net::awaitable<ClientResponse> readResponse(Stream& stream, std::chrono::seconds timeout);

    beast::tcp_stream& lowestLayer();

    void reset();

    net::io_context& ioc_;
    std::optional<std::string> expected_fingerprint_;
    std::optional<ssl::context> ssl_ctx_;
    std::unique_ptr<beast::tcp_stream> plain_;
    std::unique_ptr<beast::ssl_stream<beast::tcp_stream>> tls_;
    std::string current_host_;
    unsigned short current_port_ = 0;
    bool verification_failed_ = false;
};

template<typename RequestBody>
net::awaitable<ClientResponse> HttpClient::SendRequest(http::request<RequestBody>& req,
                                                       std::chrono::seconds timeout) {
    if (!IsConnected()) {
        throw std::runtime_error("No active connection");
    }
    if (tls_) {
        co_return co_await exchange(*tls_, req, timeout);
    }
    co_return co_await exchange(*plain_, req, timeout);
}

template<typename Stream, typename RequestBody>
net::awaitable<ClientResponse> HttpClient::exchange(Stream& stream,
                                                    http::request<RequestBody>& req,
                                                    std::chrono::seconds timeout) {
    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await http::async_write(stream, req, net::use_awaitable);
    co_return co_await readResponse(stream, timeout);
}

template<typename Stream>
net::awaitable<ClientResponse> HttpClient::readResponse(Stream& stream,
                                                        std::chrono::seconds timeout) {
    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(transfer::kMaxJsonBodySize);
    beast::get_lowest_layer(stream).expires_after(timeout);
    co_await http::async_read(stream, buffer, parser, net::use_awaitable);
    beast::get_lowest_layer(stream).expires_never();
    co_return parser.release();
}

template<typename Stream>
net::awaitable<ClientResponse> HttpClient::upload(Stream& stream,
                                                  http::request<http::buffer_body>& req,
                                                  ByteSource& source,
                                                  std::size_t chunk_size,
                                                  const ChunkCallback& on_chunk) {
    http::request_serializer<http::buffer_body> serializer{req};
    req.body().data = nullptr;
    req.body().more = true;

    beast::error_code ec;
    beast::get_lowest_layer(stream).expires_after(transfer::kIoTimeout);
    co_await http::async_write_header(stream, serializer, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        throw boost::system::system_error(ec);
    }

    std::optional<uint64_t> length;
    if (req.has_content_length()) {
        length = std::stoull(std::string(req[http::field::content_length]));
    }

    std::vector<char> chunk(chunk_size);
    uint64_t sent = 0;
    for (;;) {
        if (!on_chunk(sent)) {
            throw ProtocolError(ErrorCode::kCancelledByUser);
        }
        std::size_t want = chunk.size();
        if (length) {
            want = static_cast<std::size_t>(std::min<uint64_t>(want, *length - sent));
        }
        std::size_t n = want == 0 ? 0 : source.Read(chunk.data(), want);
        if (n == 0) {
            break;
        }
        // the last declared chunk goes out only once the source is known to end there
        if (length && sent + n == *length) {
            char extra;
            if (source.Read(&extra, 1) != 0) {
                throw ProtocolError(ErrorCode::kSizeMismatch,
                                    fmt::format("source holds more than the declared {} bytes",
                                                *length));
            }
        }
        req.body().data = chunk.data();
        req.body().size = n;
        req.body().more = true;

        beast::get_lowest_layer(stream).expires_after(transfer::kIoTimeout);
        co_await http::async_write(stream, serializer, net::redirect_error(net::use_awaitable, ec));
        if (ec == http::error::need_buffer) {
            ec = {};
        }
        if (ec) {
            // the receiver may have answered and closed before taking the body
            spdlog::debug("Upload write failed: {}", ec.message());
            try {
                co_return co_await readResponse(stream, transfer::kConnectTimeout);
            } catch (const boost::system::system_error&) {
                throw boost::system::system_error(ec);
            }
        }
        sent += n;
    }
    if (length && sent != *length) {
        throw ProtocolError(ErrorCode::kSizeMismatch,
                            fmt::format("source gave {} of {} bytes", sent, *length));
    }

    req.body().data = nullptr;
    req.body().more = false;
    beast::get_lowest_layer(stream).expires_after(transfer::kIoTimeout);
    co_await http::async_write(stream, serializer, net::redirect_error(net::use_awaitable, ec));
    if (ec && ec != http::error::need_buffer) {
        throw boost::system::system_error(ec);
    }
    co_return co_await readResponse(stream, transfer::kIoTimeout);
}

template<typename Body>
http::request<Body> HttpClient::CreateRequest(http::verb method,
                                              const std::string& target,
                                              bool keep_alive) {
    http::request<Body> req{method, target, 11};

    if (!current_host_.empty()) {
        req.set(http::field::host, current_host_ + ":" + std::to_string(current_port_));
    }

    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if constexpr (std::is_same_v<Body, http::buffer_body>) {
        req.set(http::field::content_type, "application/octet-stream");
    } else {
        req.set(http::field::content_type, "application/json");
    }

    req.keep_alive(keep_alive);

    return req;
}

} // namespace lanbeam::core
