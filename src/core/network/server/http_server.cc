#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <array>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <core/constant/transfer.h>
#include <core/network/server/http_server.h>
#include <core/security/open_ssl_provider.h>
#include <spdlog/spdlog.h>

namespace lanbeam::core {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using net::use_awaitable;

namespace {

template<typename Stream>
class ParserBodyReader : public BodyReader {
public:
    ParserBodyReader(Stream& stream,
                     beast::flat_buffer& buffer,
                     http::request_parser<http::buffer_body>& parser)
        : stream_(stream)
        , buffer_(buffer)
        , parser_(parser) {}

    net::awaitable<std::size_t> ReadSome(char* data, std::size_t size) override {
        while (!parser_.is_done()) {
            auto& body = parser_.get().body();
            body.data = data;
            body.size = size;

            beast::error_code ec;
            beast::get_lowest_layer(stream_).expires_after(transfer::kIoTimeout);
            co_await http::async_read_some(stream_,
                                           buffer_,
                                           parser_,
                                           net::redirect_error(use_awaitable, ec));
            if (ec == http::error::need_buffer) {
                ec = {};
            }
            if (ec) {
                throw boost::system::system_error(ec);
            }
            std::size_t read = size - parser_.get().body().size;
            if (read > 0) {
                co_return read;
            }
        }
        co_return 0;
    }

    bool done() const override { return parser_.is_done(); }

private:
    Stream& stream_;
    beast::flat_buffer& buffer_;
    http::request_parser<http::buffer_body>& parser_;
};

bool isDisconnect(const beast::error_code& ec) {
    return ec == beast::error::timeout || ec == net::error::eof
           || ec == net::error::operation_aborted || ec == net::error::connection_reset
           || ec == http::error::end_of_stream || ec == ssl::error::stream_truncated;
}

} // namespace

HttpServer::HttpServer(net::io_context& io_context)
    : io_context_(io_context)
    , acceptor_(io_context)
    , running_(false)
    , port_(0) {}

HttpServer::HttpServer(net::io_context& io_context, const CertificateManager& cert_manager)
    : io_context_(io_context)
    , ssl_context_(
          OpenSSLProvider::BuildServerContext(cert_manager.security_context().certificate_pem,
                                              cert_manager.security_context().private_key_pem))
    , acceptor_(io_context)
    , running_(false)
    , port_(0) {}

HttpServer::~HttpServer() {
    if (running_) {
        Stop();
    }
}

void HttpServer::AddRoute(const std::string& path,
                          http::verb method,
                          StringRequestHandler&& handler) {
    routes_[path] = {method, RequestType::kString, std::move(handler), nullptr};
    spdlog::debug("Added route: {} {}", std::string(http::to_string(method)), path);
}

void HttpServer::AddRoute(const std::string& path,
                          http::verb method,
                          StreamRequestHandler&& handler) {
    routes_[path] = {method, RequestType::kStream, nullptr, std::move(handler)};
    spdlog::debug("Added route: {} {}", std::string(http::to_string(method)), path);
}

bool HttpServer::Start(uint16_t port) {
    if (running_) {
        spdlog::warn("Server is already running.");
        return true;
    }

    try {
        tcp::endpoint endpoint(tcp::v4(), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(net::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen(net::socket_base::max_listen_connections);
        port_ = acceptor_.local_endpoint().port();
        running_ = true;
        spdlog::info("{} server started on port {}", https() ? "HTTPS" : "HTTP", port_);

        net::co_spawn(io_context_, acceptConnections(), net::detached);
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to start server on port {}: {}", port, e.what());
        running_ = false;
        beast::error_code ignored;
        acceptor_.close(ignored);
        return false;
    }
}

void HttpServer::Stop() {
    if (!running_) {
        return;
    }
    running_ = false;
    beast::error_code ec;
    acceptor_.cancel(ec);
    acceptor_.close(ec);
    spdlog::info("Server stopped.");
}

HttpResponse HttpServer::makeResponse(http::status status,
                                      unsigned int version,
                                      bool keep_alive,
                                      std::string_view content_type,
                                      std::string_view body) {
    HttpResponse res{status, version};
    res.keep_alive(keep_alive);
    if (!body.empty()) {
        res.set(http::field::content_type, content_type);
        res.body() = std::string(body);
    }
    res.prepare_payload();
    return res;
}

HttpResponse HttpServer::Ok(unsigned int version, bool keep_alive, std::string_view body) {
    return makeResponse(http::status::ok, version, keep_alive, "application/json", body);
}

HttpResponse HttpServer::NoContent(unsigned int version, bool keep_alive) {
    return makeResponse(http::status::no_content, version, keep_alive, {}, {});
}

HttpResponse HttpServer::BadRequest(unsigned int version,
                                    bool keep_alive,
                                    std::string_view error_message) {
    return makeResponse(http::status::bad_request, version, keep_alive, "text/plain", error_message);
}

HttpResponse HttpServer::Forbidden(unsigned int version,
                                   bool keep_alive,
                                   std::string_view error_message) {
    return makeResponse(http::status::forbidden, version, keep_alive, "text/plain", error_message);
}

HttpResponse HttpServer::NotFound(unsigned int version,
                                  bool keep_alive,
                                  std::string_view error_message) {
    return makeResponse(http::status::not_found, version, keep_alive, "text/plain", error_message);
}

HttpResponse HttpServer::MethodNotAllowed(unsigned int version,
                                          bool keep_alive,
                                          std::string_view error_message) {
    return makeResponse(http::status::method_not_allowed,
                        version,
                        keep_alive,
                        "text/plain",
                        error_message);
}

HttpResponse HttpServer::Conflict(unsigned int version,
                                  bool keep_alive,
                                  std::string_view error_message) {
    return makeResponse(http::status::conflict, version, keep_alive, "text/plain", error_message);
}

HttpResponse HttpServer::Gone(unsigned int version, bool keep_alive, std::string_view error_message) {
    return makeResponse(http::status::gone, version, keep_alive, "text/plain", error_message);
}

HttpResponse HttpServer::PayloadTooLarge(unsigned int version,
                                         bool keep_alive,
                                         std::string_view error_message) {
    return makeResponse(http::status::payload_too_large,
                        version,
                        keep_alive,
                        "text/plain",
                        error_message);
}

HttpResponse HttpServer::InternalServerError(unsigned int version,
                                             bool keep_alive,
                                             std::string_view error_message) {
    return makeResponse(http::status::internal_server_error,
                        version,
                        keep_alive,
                        "text/plain",
                        error_message);
}

net::awaitable<void> HttpServer::acceptConnections() {
    while (running_) {
        beast::error_code ec;
        tcp::socket socket = co_await acceptor_.async_accept(net::redirect_error(use_awaitable, ec));
        if (ec == net::error::operation_aborted || !running_) {
            break;
        }
        if (ec) {
            spdlog::error("Error accepting connection: {}", ec.message());
            continue;
        }
        net::co_spawn(io_context_, handleConnection(std::move(socket)), net::detached);
    }
    spdlog::debug("Stopped accepting connections.");
}

net::awaitable<void> HttpServer::handleConnection(tcp::socket socket) {
    std::string remote_ip;
    try {
        auto endpoint = socket.remote_endpoint();
        remote_ip = endpoint.address().to_string();
        spdlog::debug("New connection from: {}:{}", remote_ip, endpoint.port());

        beast::tcp_stream tcp_stream(std::move(socket));
        if (!ssl_context_) {
            co_await serveRequests(tcp_stream, remote_ip);
            beast::error_code ec;
            tcp_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
            // drain what the peer still sends so an early response is not lost to a reset
            std::array<char, 4096> sink;
            tcp_stream.expires_after(transfer::kConnectTimeout);
            while (!ec) {
                co_await tcp_stream.async_read_some(net::buffer(sink),
                                                    net::redirect_error(use_awaitable, ec));
            }
            co_return;
        }

        beast::ssl_stream<beast::tcp_stream> stream(std::move(tcp_stream), *ssl_context_);
        beast::get_lowest_layer(stream).expires_after(transfer::kConnectTimeout);
        co_await stream.async_handshake(ssl::stream_base::server, use_awaitable);
        spdlog::debug("TLS handshake with {} completed", remote_ip);

        co_await serveRequests(stream, remote_ip);

        beast::error_code ec;
        beast::get_lowest_layer(stream).expires_after(transfer::kConnectTimeout);
        co_await stream.async_shutdown(net::redirect_error(use_awaitable, ec));
        if (ec && !isDisconnect(ec)) {
            spdlog::debug("Shutdown notice: {}", ec.message());
        }
    } catch (const boost::system::system_error& e) {
        if (isDisconnect(e.code())) {
            spdlog::debug("Connection from {} ended: {}", remote_ip, e.code().message());
        } else {
            spdlog::warn("Connection from {} failed: {}", remote_ip, e.what());
        }
    } catch (const std::exception& e) {
        spdlog::error("Connection from {} failed: {}", remote_ip, e.what());
    }
}

template<typename Stream>
net::awaitable<void> HttpServer::serveRequests(Stream& stream, const std::string& remote_ip) {
    beast::flat_buffer buffer;

    for (;;) {
        beast::get_lowest_layer(stream).expires_after(transfer::kIoTimeout);

        http::request_parser<http::empty_body> header_parser;
        beast::error_code ec;
        co_await http::async_read_header(stream,
                                         buffer,
                                         header_parser,
                                         net::redirect_error(use_awaitable, ec));
        if (ec) {
            if (!isDisconnect(ec)) {
                spdlog::debug("Bad request header from {}: {}", remote_ip, ec.message());
            }
            co_return;
        }

        const auto& header = header_parser.get();
        RequestContext context{header.method(),
                               header.version(),
                               header.keep_alive(),
                               ParseTarget(std::string_view(header.target().data(),
                                                            header.target().size())),
                               remote_ip,
                               std::nullopt};
        if (auto length = header_parser.content_length()) {
            context.content_length = *length;
        }
        bool expect_continue = beast::iequals(header[http::field::expect], "100-continue");
        spdlog::debug("{} {} from {}",
                      std::string(header.method_string()),
                      context.target.path,
                      remote_ip);

        HttpResponse res;
        bool body_consumed = header_parser.is_done();

        auto it = routes_.find(context.target.path);
        if (it == routes_.end()) {
            res = NotFound(context.version, false);
        } else if (it->second.method != context.method) {
            res = MethodNotAllowed(context.version, false);
        } else {
            if (expect_continue && !header_parser.is_done()) {
                http::response<http::empty_body> cont{http::status::continue_, context.version};
                co_await http::async_write(stream, cont, use_awaitable);
            }

            const RouteInfo& route = it->second;
            if (route.type == RequestType::kString) {
                http::request_parser<http::string_body> parser{std::move(header_parser)};
                parser.body_limit(transfer::kMaxJsonBodySize);
                co_await http::async_read(stream,
                                          buffer,
                                          parser,
                                          net::redirect_error(use_awaitable, ec));
                if (ec == http::error::body_limit) {
                    res = PayloadTooLarge(context.version, false);
                } else if (ec) {
                    throw boost::system::system_error(ec);
                } else {
                    body_consumed = true;
                    try {
                        res = co_await route.string_handler(context, parser.release());
                    } catch (const std::exception& e) {
                        spdlog::error("Error executing handler for {}: {}",
                                      context.target.path,
                                      e.what());
                        res = InternalServerError(context.version, context.keep_alive);
                    }
                }
            } else {
                http::request_parser<http::buffer_body> parser{std::move(header_parser)};
                parser.body_limit(boost::none);
                ParserBodyReader<Stream> reader(stream, buffer, parser);
                try {
                    res = co_await route.stream_handler(context, reader);
                } catch (const boost::system::system_error& e) {
                    if (isDisconnect(e.code())) {
                        throw;
                    }
                    spdlog::error("Error executing handler for {}: {}",
                                  context.target.path,
                                  e.what());
                    res = InternalServerError(context.version, false);
                } catch (const std::exception& e) {
                    spdlog::error("Error executing handler for {}: {}",
                                  context.target.path,
                                  e.what());
                    res = InternalServerError(context.version, false);
                }
                body_consumed = parser.is_done();
            }
        }

        // an unread body would be parsed as the next request
        bool keep_alive = context.keep_alive && body_consumed && res.keep_alive();
        res.keep_alive(keep_alive);

        beast::get_lowest_layer(stream).expires_after(transfer::kIoTimeout);
        co_await http::async_write(stream, res, use_awaitable);

        if (!keep_alive) {
            co_return;
        }
    }
}

} // namespace lanbeam::core
