#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core/string.hpp>
#include <core/constant/route.h>
#include <core/network/server/controller/receive_controller.h>
#include <core/security/file_hasher.h>
#include <core/util/file_path.h>
#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <vector>

namespace net = boost::asio;
namespace http = boost::beast::http;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace lanbeam::core {

namespace {

HttpResponse errorResponse(const ProtocolError& e, const RequestContext& ctx) {
    switch (e.code()) {
    case ErrorCode::kTokenInvalid:
        return HttpServer::Forbidden(ctx.version, ctx.keep_alive, e.what());
    case ErrorCode::kAlreadyCompleted:
    case ErrorCode::kFileInProgress:
        return HttpServer::Conflict(ctx.version, ctx.keep_alive, e.what());
    case ErrorCode::kCancelledByUser:
        return HttpServer::Gone(ctx.version, ctx.keep_alive, e.what());
    case ErrorCode::kSizeMismatch:
        return HttpServer::PayloadTooLarge(ctx.version, ctx.keep_alive, e.what());
    case ErrorCode::kMalformedPayload:
        return HttpServer::BadRequest(ctx.version, ctx.keep_alive, e.what());
    default:
        return HttpServer::InternalServerError(ctx.version, ctx.keep_alive, e.what());
    }
}

} // namespace

ReceiveController::ReceiveController(net::io_context& ioc,
                                     HttpServer& server,
                                     SessionRegistry& registry,
                                     DecisionProvider& decisions,
                                     ReceiveOptions options,
                                     FeedbackCallback callback)
    : server_(server)
    , registry_(registry)
    , decisions_(decisions)
    , options_(std::move(options))
    , callback_(std::move(callback))
    , io_context_(ioc)
    , sweep_timer_(ioc) {
    installRoutes();
}

ReceiveController::~ReceiveController() {
    Stop();
}

void ReceiveController::Start() {
    if (running_) {
        return;
    }
    running_ = true;
    net::co_spawn(io_context_, sweeper(), net::detached);
}

void ReceiveController::Stop() {
    running_ = false;
    sweep_timer_.cancel();
}

void ReceiveController::SetFeedbackCallback(FeedbackCallback callback) {
    callback_ = std::move(callback);
}

void ReceiveController::SetSaveDirectory(const fs::path& save_dir) {
    options_.save_dir = save_dir;
}

void ReceiveController::feedback(FeedbackType type, json data) {
    if (callback_) {
        callback_(Feedback{type, std::move(data)});
    }
}

void ReceiveController::discard(const fs::path& temp_path) {
    std::error_code ec;
    if (fs::remove(temp_path, ec)) {
        spdlog::debug("Removed unfinished file {}", temp_path.string());
    } else if (ec) {
        spdlog::warn("Failed to remove {}: {}", temp_path.string(), ec.message());
    }
}

void ReceiveController::endSession(const std::string& session_id,
                                   SessionStatus status,
                                   bool cancelled_by_sender,
                                   const std::string& error_message) {
    spdlog::info("Receive session {} ended: {}", session_id, SessionStatusToString(status));
    feedback(FeedbackType::kReceiveSessionEnded,
             feedback::ReceiveSessionEnd{session_id,
                                         std::string(SessionStatusToString(status)),
                                         cancelled_by_sender,
                                         error_message});
}

net::awaitable<HttpResponse> ReceiveController::onPrepareUpload(const RequestContext& ctx,
                                                                StringRequest&& req) {
    PrepareUploadRequestDto request;
    try {
        DeviceInfoDefaults defaults{server_.port(), server_.https()};
        request = ParsePrepareUploadRequest(json::parse(req.body()), defaults);
    } catch (const std::exception& e) {
        spdlog::warn("Malformed prepare-upload from {}: {}", ctx.remote_ip, e.what());
        co_return HttpServer::BadRequest(ctx.version, ctx.keep_alive, "invalid data");
    }
    if (request.files.empty()) {
        co_return HttpServer::BadRequest(ctx.version, ctx.keep_alive, "no files");
    }

    feedback::RequestReceiveFiles offer;
    std::string listing;
    for (const auto& [id, file] : request.files) {
        if (!IsSafeRelativeName(file.file_name) || file.size == 0) {
            spdlog::warn("Rejecting request from {}: unusable file entry \"{}\"",
                         ctx.remote_ip,
                         file.file_name);
            co_return HttpServer::BadRequest(ctx.version, ctx.keep_alive, "invalid file entry");
        }
        offer.files.push_back(file);
        offer.total_size += file.size;
        listing += fmt::format("  {} ({} bytes, {})\n",
                               file.file_name,
                               file.size,
                               FileTypeToString(file.file_type));
    }

    request.info.ip = ctx.remote_ip;
    spdlog::info("{} ({}:{}) wants to send {} file(s):\n{}",
                 request.info.alias,
                 request.info.ip,
                 request.info.port,
                 request.files.size(),
                 listing);
    offer.sender = request.info;
    feedback(FeedbackType::kRequestReceiveFiles, offer);

    ReceiveRequest receive_request{request.info, request.files, options_.save_dir};
    Decision decision = co_await decisions_.Decide(receive_request, options_.decision_timeout);
    if (!decision) {
        spdlog::info("Request from {} declined", request.info.alias);
        co_return HttpServer::Forbidden(ctx.version, ctx.keep_alive, "declined");
    }

    std::map<std::string, FileDto> accepted;
    for (const auto& id : *decision) {
        if (auto it = request.files.find(id); it != request.files.end()) {
            accepted.emplace(id, it->second);
        }
    }
    if (accepted.empty()) {
        spdlog::info("Nothing to receive from {}", request.info.alias);
        co_return HttpServer::NoContent(ctx.version, ctx.keep_alive);
    }

    auto response = registry_.Create(request.info, accepted, options_.save_dir);
    spdlog::info("Accepted {} of {} file(s) from {}, session {}",
                 accepted.size(),
                 request.files.size(),
                 request.info.alias,
                 response.session_id);
    json body = response;
    co_return HttpServer::Ok(ctx.version, ctx.keep_alive, body.dump());
}

net::awaitable<HttpResponse> ReceiveController::onUpload(const RequestContext& ctx,
                                                         BodyReader& body) {
    auto session_id = ctx.target.Param("sessionId");
    auto file_id = ctx.target.Param("fileId");
    auto token = ctx.target.Param("token");
    if (!session_id || !file_id || !token) {
        co_return HttpServer::BadRequest(ctx.version, false, "missing parameters");
    }

    UploadTicket ticket;
    try {
        ticket = registry_.BeginUpload(*session_id, *file_id, *token);
    } catch (const ProtocolError& e) {
        spdlog::warn("Upload of {}/{} from {} refused: {}",
                     *session_id,
                     *file_id,
                     ctx.remote_ip,
                     e.what());
        co_return errorResponse(e, ctx);
    }
    const FileDto& file = ticket.file;

    auto fail = [&](ErrorCode code, const std::string& message) {
        discard(ticket.temp_path);
        if (auto ended = registry_.FailFile(ticket.session_id, file.id)) {
            endSession(ticket.session_id, *ended, false, message);
        }
        return ProtocolError(code, message);
    };

    if (ctx.content_length && *ctx.content_length > file.size) {
        auto error = fail(ErrorCode::kSizeMismatch,
                          fmt::format("body of {} bytes exceeds declared size {}",
                                      *ctx.content_length,
                                      file.size));
        co_return errorResponse(error, ctx);
    }

    std::error_code ec;
    fs::create_directories(ticket.destination, ec);
    std::ofstream out(ticket.temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        auto error = fail(ErrorCode::kTransferIO,
                          "cannot create " + ticket.temp_path.string());
        spdlog::error("Upload of \"{}\" failed: {}", file.file_name, error.what());
        co_return errorResponse(error, ctx);
    }

    std::optional<Sha256> sha;
    if (file.sha256) {
        sha.emplace();
    }

    std::vector<char> buffer(options_.chunk_size);
    uint64_t written = 0;
    std::optional<ProtocolError> error;
    try {
        for (;;) {
            if (ticket.cancel.IsCancelled()) {
                error = ProtocolError(ErrorCode::kCancelledByUser, "session cancelled");
                break;
            }
            std::size_t n = co_await body.ReadSome(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            if (ticket.cancel.IsCancelled()) {
                error = ProtocolError(ErrorCode::kCancelledByUser, "session cancelled");
                break;
            }
            if (written + n > file.size) {
                error = ProtocolError(ErrorCode::kSizeMismatch,
                                      fmt::format("more than the declared {} bytes", file.size));
                break;
            }
            out.write(buffer.data(), static_cast<std::streamsize>(n));
            if (!out) {
                error = ProtocolError(ErrorCode::kTransferIO, "write failed");
                break;
            }
            if (sha) {
                sha->Update(buffer.data(), n);
            }
            written += n;
            registry_.Touch(ticket.session_id);
            feedback(FeedbackType::kFileReceivingProgress,
                     feedback::FileReceivingProgress{ticket.session_id,
                                                     file.file_name,
                                                     written,
                                                     file.size});
        }
    } catch (const std::exception& e) {
        // connection lost mid-body
        out.close();
        if (ticket.cancel.IsCancelled()) {
            discard(ticket.temp_path);
        } else {
            fail(ErrorCode::kTransferIO, e.what());
        }
        spdlog::warn("Upload of \"{}\" interrupted: {}", file.file_name, e.what());
        throw;
    }
    out.close();

    if (!error && written != file.size) {
        error = ProtocolError(ErrorCode::kMalformedPayload,
                              fmt::format("received {} of {} bytes", written, file.size));
    }
    if (!error && out.fail()) {
        error = ProtocolError(ErrorCode::kTransferIO, "write failed");
    }
    if (!error && sha) {
        auto digest = sha->HexDigest();
        if (!boost::beast::iequals(digest, *file.sha256)) {
            error = ProtocolError(ErrorCode::kMalformedPayload, "checksum mismatch");
        }
    }

    if (error) {
        if (error->code() == ErrorCode::kCancelledByUser) {
            discard(ticket.temp_path);
            spdlog::info("Upload of \"{}\" stopped: session cancelled", file.file_name);
            co_return errorResponse(*error, ctx);
        }
        spdlog::error("Upload of \"{}\" failed: {}", file.file_name, error->what());
        co_return errorResponse(fail(error->code(), error->what()), ctx);
    }

    fs::path final_path;
    FileCommit commit;
    try {
        commit = registry_.CommitFile(ticket.session_id, file.id, [&] {
            final_path = UniqueDestination(ticket.destination, file.file_name);
            fs::create_directories(final_path.parent_path());
            fs::rename(ticket.temp_path, final_path);
        });
        if (!commit.committed) {
            discard(ticket.temp_path);
            co_return errorResponse(ProtocolError(ErrorCode::kCancelledByUser), ctx);
        }
    } catch (const std::exception& e) {
        spdlog::error("Failed to store \"{}\": {}", file.file_name, e.what());
        co_return errorResponse(fail(ErrorCode::kTransferIO, "cannot store file"), ctx);
    }

    spdlog::info("Received \"{}\", saved as \"{}\"", file.file_name, final_path.string());
    feedback(FeedbackType::kFileReceivingCompleted,
             feedback::FileReceivingCompleted{ticket.session_id,
                                              file.file_name,
                                              final_path.string()});
    if (commit.ended) {
        endSession(ticket.session_id, *commit.ended, false);
    }
    co_return HttpServer::Ok(ctx.version, ctx.keep_alive);
}

net::awaitable<HttpResponse> ReceiveController::onCancel(const RequestContext& ctx,
                                                         StringRequest&&) {
    auto session_id = ctx.target.Param("sessionId");
    if (!session_id) {
        co_return HttpServer::BadRequest(ctx.version, ctx.keep_alive, "missing sessionId");
    }

    if (auto end = registry_.Cancel(*session_id)) {
        for (const auto& path : end->temp_files) {
            discard(path);
        }
        spdlog::info("Session {} cancelled by {}", *session_id, ctx.remote_ip);
        endSession(*session_id, SessionStatus::kCancelled, true);
    } else {
        spdlog::debug("Cancel for finished or unknown session {}", *session_id);
    }
    co_return HttpServer::Ok(ctx.version, ctx.keep_alive);
}

net::awaitable<void> ReceiveController::sweeper() {
    while (running_) {
        boost::system::error_code ec;
        sweep_timer_.expires_after(transfer::kSessionSweepInterval);
        co_await sweep_timer_.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (ec == net::error::operation_aborted || !running_) {
            break;
        }
        for (auto& end : registry_.Sweep()) {
            for (const auto& path : end.temp_files) {
                discard(path);
            }
            endSession(end.session_id, end.status, false, "timed out");
        }
    }
}

void ReceiveController::installRoutes() {
    server_.AddRoute(std::string(ApiRoute::kPrepareUpload),
                     http::verb::post,
                     StringRequestHandler(std::bind(&ReceiveController::onPrepareUpload,
                                                    this,
                                                    std::placeholders::_1,
                                                    std::placeholders::_2)));
    server_.AddRoute(std::string(ApiRoute::kUpload),
                     http::verb::post,
                     StreamRequestHandler(std::bind(&ReceiveController::onUpload,
                                                    this,
                                                    std::placeholders::_1,
                                                    std::placeholders::_2)));
    server_.AddRoute(std::string(ApiRoute::kCancel),
                     http::verb::post,
                     StringRequestHandler(std::bind(&ReceiveController::onCancel,
                                                    this,
                                                    std::placeholders::_1,
                                                    std::placeholders::_2)));
}

} // namespace lanbeam::core
