#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/constant/route.h>
#include <core/model/error.h>
#include <core/model/file_type.h>
#include <core/network/client/http_client.h>
#include <core/network/client/transfer_executor.h>
#include <core/util/query_string.h>
#include <deque>
#include <exception>
#include <optional>
#include <spdlog/spdlog.h>

namespace lanbeam::core {

void SessionOutcome::Count(TransferEventKind kind) {
    switch (kind) {
    case TransferEventKind::kCompleted:
        ++completed;
        break;
    case TransferEventKind::kFailed:
        ++failed;
        break;
    case TransferEventKind::kCancelled:
        ++cancelled;
        break;
    case TransferEventKind::kRejected:
        ++rejected;
        break;
    case TransferEventKind::kProgress:
        break;
    }
}

TransferExecutor::TransferExecutor(net::io_context& ioc,
                                   ProgressChannel& channel,
                                   TransferOptions options)
    : ioc_(ioc)
    , channel_(channel)
    , options_(options) {
    options_.concurrency = std::max<std::size_t>(options_.concurrency, 1);
    options_.chunk_size = std::max<std::size_t>(options_.chunk_size, 1);
}

net::awaitable<SessionOutcome> TransferExecutor::Run(const SessionHandle& session,
                                                     const SourceProvider& sources,
                                                     CancellationSignal cancel) {
    SessionOutcome outcome;
    outcome.session_id = session.session_id;

    std::deque<const FileDto*> queue;
    for (const auto& [file_id, file] : session.files) {
        if (!session.Accepted(file_id)) {
            TransferEvent event = terminal(session,
                                           file,
                                           TransferEventKind::kRejected,
                                           0,
                                           "not accepted by receiver");
            outcome.Count(event.kind);
            channel_.Push(std::move(event));
            continue;
        }
        queue.push_back(&file);
    }
    if (queue.empty()) {
        co_return outcome;
    }

    auto executor = co_await net::this_coro::executor;
    std::size_t running = std::min(options_.concurrency, queue.size());
    net::steady_timer all_done(executor, net::steady_timer::time_point::max());

    auto worker = [&]() -> net::awaitable<void> {
        while (!queue.empty()) {
            const FileDto* file = queue.front();
            queue.pop_front();
            TransferEvent event = co_await uploadFile(session,
                                                      *file,
                                                      session.tokens.at(file->id),
                                                      sources,
                                                      cancel);
            outcome.Count(event.kind);
            channel_.Push(std::move(event));
        }
    };

    spdlog::debug("Session {}: {} upload task(s) for {} file(s)",
                  session.session_id,
                  running,
                  queue.size());
    for (std::size_t i = running; i > 0; --i) {
        net::co_spawn(executor, worker(), [&](std::exception_ptr error) {
            if (error) {
                try {
                    std::rethrow_exception(error);
                } catch (const std::exception& e) {
                    spdlog::error("Upload task of session {} failed: {}",
                                  session.session_id,
                                  e.what());
                }
            }
            if (--running == 0) {
                all_done.cancel();
            }
        });
    }

    if (running > 0) {
        boost::system::error_code ec;
        co_await all_done.async_wait(net::redirect_error(net::use_awaitable, ec));
    }

    spdlog::info("Session {} finished: {} completed, {} failed, {} cancelled, {} rejected",
                 outcome.session_id,
                 outcome.completed,
                 outcome.failed,
                 outcome.cancelled,
                 outcome.rejected);
    co_return outcome;
}

net::awaitable<TransferEvent> TransferExecutor::uploadFile(const SessionHandle& session,
                                                           const FileDto& file,
                                                           const std::string& token,
                                                           const SourceProvider& sources,
                                                           CancellationSignal cancel) {
    if (cancel.IsCancelled()) {
        co_return terminal(session, file, TransferEventKind::kCancelled, 0, "cancelled");
    }

    std::unique_ptr<ByteSource> source;
    try {
        source = sources.Open(file);
    } catch (const std::exception& e) {
        spdlog::error("Cannot read {}: {}", file.file_name, e.what());
        co_return terminal(session, file, TransferEventKind::kFailed, 0, e.what());
    }

    auto client = HttpClient::ForPeer(ioc_, session.peer);
    if (!co_await client->Connect(session.peer.ip, session.peer.port)) {
        co_return terminal(session,
                           file,
                           TransferEventKind::kFailed,
                           0,
                           client->verification_failed() ? "certificate does not match fingerprint"
                                                         : "connection failed");
    }

    auto req = client->CreateRequest<http::buffer_body>(http::verb::post,
                                                        BuildTarget(ApiRoute::kUpload,
                                                                    {{"sessionId", session.session_id},
                                                                     {"fileId", file.id},
                                                                     {"token", token}}),
                                                        false);
    req.set(http::field::content_type, MimeType(file.file_name));
    req.content_length(file.size);

    uint64_t sent = 0;
    auto on_chunk = [&](uint64_t bytes) {
        if (bytes > sent) {
            sent = bytes;
            channel_.Push(TransferEvent{session.session_id,
                                        file.id,
                                        file.file_name,
                                        TransferEventKind::kProgress,
                                        sent,
                                        file.size,
                                        {}});
        }
        return !cancel.IsCancelled();
    };

    ClientResponse res;
    std::optional<TransferEvent> result;
    try {
        res = co_await client->Upload(req, *source, options_.chunk_size, on_chunk);
    } catch (const ProtocolError& e) {
        auto kind = e.code() == ErrorCode::kCancelledByUser ? TransferEventKind::kCancelled
                                                            : TransferEventKind::kFailed;
        result = terminal(session, file, kind, sent, e.what());
    } catch (const std::exception& e) {
        auto kind = cancel.IsCancelled() ? TransferEventKind::kCancelled
                                         : TransferEventKind::kFailed;
        result = terminal(session, file, kind, sent, e.what());
    }
    co_await client->Disconnect();
    if (result) {
        co_return *result;
    }

    if (http::to_status_class(res.result()) == http::status_class::successful) {
        spdlog::info("Sent {} ({} bytes)", file.file_name, file.size);
        co_return terminal(session, file, TransferEventKind::kCompleted, file.size);
    }
    std::string error = res.body().empty()
                            ? fmt::format("HTTP {}", res.result_int())
                            : fmt::format("HTTP {}: {}", res.result_int(), res.body());
    if (res.result() == http::status::gone) {
        co_return terminal(session, file, TransferEventKind::kCancelled, sent, std::move(error));
    }
    spdlog::warn("Upload of {} refused: {}", file.file_name, error);
    co_return terminal(session, file, TransferEventKind::kFailed, sent, std::move(error));
}

TransferEvent TransferExecutor::terminal(const SessionHandle& session,
                                         const FileDto& file,
                                         TransferEventKind kind,
                                         uint64_t bytes,
                                         std::string error) const {
    return TransferEvent{session.session_id,
                         file.id,
                         file.file_name,
                         kind,
                         bytes,
                         file.size,
                         std::move(error)};
}

} // namespace lanbeam::core
