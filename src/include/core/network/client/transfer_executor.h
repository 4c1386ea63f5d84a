#pragma once

#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <core/model/transfer_event.h>
#include <core/network/client/byte_source.h>
#include <core/network/client/session_negotiator.h>
#include <core/util/cancellation.h>
#include <core/util/progress_channel.h>
#include <cstddef>
#include <string>

namespace lanbeam::core {

// Per-file terminal outcomes of one send, counted.
struct SessionOutcome {
    std::string session_id;
    std::size_t completed{0};
    std::size_t failed{0};
    std::size_t cancelled{0};
    std::size_t rejected{0};

    bool Succeeded() const { return completed > 0 && failed == 0 && cancelled == 0; }

    void Count(TransferEventKind kind);
};

struct TransferOptions {
    std::size_t concurrency;
    std::size_t chunk_size;
};

// Uploads the accepted files of a session with a bounded number of
// concurrent connections. Events go to `channel`; one file failing never
// stops the others.
class TransferExecutor {
public:
    TransferExecutor(boost::asio::io_context& ioc, ProgressChannel& channel, TransferOptions options);

    // Must be awaited on a strand or a single-threaded context; the file tasks
    // it starts share the awaiting coroutine's executor.
    boost::asio::awaitable<SessionOutcome> Run(const SessionHandle& session,
                                               const SourceProvider& sources,
                                               CancellationSignal cancel);

private:
    boost::asio::awaitable<TransferEvent> uploadFile(const SessionHandle& session,
                                                     const FileDto& file,
                                                     const std::string& token,
                                                     const SourceProvider& sources,
                                                     CancellationSignal cancel);

    TransferEvent terminal(const SessionHandle& session,
                           const FileDto& file,
                           TransferEventKind kind,
                           uint64_t bytes,
                           std::string error = {}) const;

    boost::asio::io_context& ioc_;
    ProgressChannel& channel_;
    TransferOptions options_;
};

} // namespace lanbeam::core
