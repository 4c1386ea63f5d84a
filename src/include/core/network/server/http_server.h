#pragma once

#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>
#include <core/security/certificate_manager.h>
#include <core/util/query_string.h>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace lanbeam::core {

using StringRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// What a handler knows about the request besides its body.
struct RequestContext {
    boost::beast::http::verb method;
    unsigned int version;
    bool keep_alive;
    RequestTarget target;
    std::string remote_ip;
    std::optional<std::uint64_t> content_length;
};

// Body of a request that is still arriving. Handlers pull it in pieces so a
// large upload never sits in memory.
class BodyReader {
public:
    virtual ~BodyReader() = default;

    // Reads up to `size` bytes into `data`; returns 0 once the body is over.
    virtual boost::asio::awaitable<std::size_t> ReadSome(char* data, std::size_t size) = 0;

    virtual bool done() const = 0;
};

using StringRequestHandler =
    std::function<boost::asio::awaitable<HttpResponse>(const RequestContext&, StringRequest&&)>;
using StreamRequestHandler =
    std::function<boost::asio::awaitable<HttpResponse>(const RequestContext&, BodyReader&)>;

enum class RequestType {
    kString, // body buffered up to transfer::kMaxJsonBodySize
    kStream, // body handed over as a BodyReader
};

struct RouteInfo {
    boost::beast::http::verb method;
    RequestType type;
    StringRequestHandler string_handler;
    StreamRequestHandler stream_handler;
};

// HTTP/1.1 server, over TLS when built with a CertificateManager.
class HttpServer {
public:
    explicit HttpServer(boost::asio::io_context& io_context);
    HttpServer(boost::asio::io_context& io_context, const CertificateManager& cert_manager);

    ~HttpServer();

    void AddRoute(const std::string& path,
                  boost::beast::http::verb method,
                  StringRequestHandler&& handler);
    void AddRoute(const std::string& path,
                  boost::beast::http::verb method,
                  StreamRequestHandler&& handler);

    // Binds to `port` on all interfaces; port 0 picks a free one.
    bool Start(uint16_t port);

    void Stop();

    bool https() const { return ssl_context_.has_value(); }

    uint16_t port() const { return port_; }

    static HttpResponse Ok(unsigned int version, bool keep_alive, std::string_view body = {});
    static HttpResponse NoContent(unsigned int version, bool keep_alive);
    static HttpResponse BadRequest(unsigned int version,
                                   bool keep_alive,
                                   std::string_view error_message = "Bad Request");
    static HttpResponse Forbidden(unsigned int version,
                                  bool keep_alive,
                                  std::string_view error_message = "Forbidden");
    static HttpResponse NotFound(unsigned int version,
                                 bool keep_alive,
                                 std::string_view error_message = "Not Found");
    static HttpResponse MethodNotAllowed(unsigned int version,
                                         bool keep_alive,
                                         std::string_view error_message = "Method Not Allowed");
    static HttpResponse Conflict(unsigned int version,
                                 bool keep_alive,
                                 std::string_view error_message = "Conflict");
    static HttpResponse Gone(unsigned int version,
                             bool keep_alive,
                             std::string_view error_message = "Gone");
    static HttpResponse PayloadTooLarge(unsigned int version,
                                        bool keep_alive,
                                        std::string_view error_message = "Payload Too Large");
    static HttpResponse InternalServerError(
        unsigned int version,
        bool keep_alive,
        std::string_view error_message = "Internal Server Error");

private:
    boost::asio::awaitable<void> acceptConnections();

    boost::asio::awaitable<void> handleConnection(boost::asio::ip::tcp::socket socket);

    template<typename Stream>
    boost::asio::awaitable<void> serveRequests(Stream& stream, const std::string& remote_ip);

    static HttpResponse makeResponse(boost::beast::http::status status,
                                     unsigned int version,
                                     bool keep_alive,
                                     std::string_view content_type,
                                     std::string_view body);

    boost::asio::io_context& io_context_;
    std::optional<boost::asio::ssl::context> ssl_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    bool running_;
    uint16_t port_;
    std::map<std::string, RouteInfo> routes_;
};

} // namespace lanbeam::core
