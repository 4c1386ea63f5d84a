#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_future.hpp>
#include <algorithm>
#include <cassert>
#include <cctype>
#include <chrono>
#include <core/constant/route.h>
#include <core/network/client/http_client.h>
#include <core/network/client/send_session_manager.h>
#include <core/network/client/session_negotiator.h>
#include <core/network/client/transfer_executor.h>
#include <core/network/client/transfer_manifest.h>
#include <core/network/server/controller/receive_controller.h>
#include <core/network/server/decision_provider.h>
#include <core/network/server/http_server.h>
#include <core/network/server/session_registry.h>
#include <core/security/file_hasher.h>
#include <core/util/query_string.h>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <thread>
#include <vector>

using namespace lanbeam::core;
namespace fs = std::filesystem;

namespace {

fs::path makeTempDir(const std::string& tag) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    auto dir = fs::temp_directory_path() / ("lanbeam-" + tag + "-" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

void write(const fs::path& path, const std::string& content) {
    std::ofstream(path, std::ios::binary) << content;
}

std::string read(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Receiver on 127.0.0.1 plus the io thread driving both ends.
class Loopback {
public:
    explicit Loopback(DecisionProvider& decisions)
        : save_dir_(makeTempDir("inbox"))
        , server_(ioc_)
        , controller_(ioc_, server_, registry_, decisions, ReceiveOptions{save_dir_}) {
        bool started = server_.Start(0);
        assert(started);
        controller_.Start();
        io_thread_ = std::thread([this] { ioc_.run(); });
    }

    ~Loopback() {
        net::post(ioc_, [this] {
            controller_.Stop();
            server_.Stop();
        });
        work_.reset();
        io_thread_.join();
        fs::remove_all(save_dir_);
    }

    template<typename T>
    T await(net::awaitable<T> op) {
        return net::co_spawn(ioc_, std::move(op), net::use_future).get();
    }

    DeviceInfo peer() const {
        DeviceInfo info;
        info.alias = "Receiver";
        info.fingerprint = "receiver-fp";
        info.ip = "127.0.0.1";
        info.port = server_.port();
        info.https = false;
        return info;
    }

    // Uploads `payload` with an explicit content length, bypassing the executor.
    unsigned rawUpload(const std::string& session_id,
                       const std::string& file_id,
                       const std::string& token,
                       std::string payload,
                       uint64_t content_length) {
        return await(rawUploadTask(BuildTarget(ApiRoute::kUpload,
                                               {{"sessionId", session_id},
                                                {"fileId", file_id},
                                                {"token", token}}),
                                   std::move(payload),
                                   content_length));
    }

    net::io_context& ioc() { return ioc_; }
    SessionRegistry& registry() { return registry_; }
    const fs::path& save_dir() const { return save_dir_; }

private:
    net::awaitable<unsigned> rawUploadTask(std::string target,
                                           std::string payload,
                                           uint64_t content_length) {
        HttpClient client(ioc_);
        bool connected = co_await client.Connect("127.0.0.1", server_.port());
        assert(connected);
        auto req = client.CreateRequest<http::buffer_body>(http::verb::post, target, false);
        req.content_length(content_length);
        MemoryByteSource source(std::move(payload));
        ChunkCallback keep_going = [](uint64_t) { return true; };
        auto res = co_await client.Upload(req, source, 4, keep_going);
        co_await client.Disconnect();
        co_return res.result_int();
    }

    net::io_context ioc_;
    net::executor_work_guard<net::io_context::executor_type> work_{ioc_.get_executor()};
    fs::path save_dir_;
    SessionRegistry registry_;
    HttpServer server_;
    ReceiveController controller_;
    std::thread io_thread_;
};

DeviceInfo sender() {
    DeviceInfo info;
    info.alias = "Sender";
    info.fingerprint = "sender-fp";
    info.port = 40000;
    return info;
}

std::size_t countKind(const std::vector<TransferEvent>& events, TransferEventKind kind) {
    std::size_t count = 0;
    for (const auto& event : events) {
        count += event.kind == kind ? 1 : 0;
    }
    return count;
}

bool waitForStatus(const SessionRegistry& registry,
                   const std::string& session_id,
                   SessionStatus status) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (registry.GetStatus(session_id) != status) {
        if (std::chrono::steady_clock::now() > deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

bool hasPartFiles(const fs::path& dir) {
    for (const auto& entry : fs::recursive_directory_iterator(dir)) {
        if (entry.path().extension() == ".part") {
            return true;
        }
    }
    return false;
}

// Parks the first read at or past `at` bytes until `release` is set.
struct Hold {
    uint64_t at = 0;
    std::promise<void> reached;
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
};

class HeldSource : public ByteSource {
public:
    HeldSource(std::unique_ptr<ByteSource> inner, Hold& hold)
        : inner_(std::move(inner))
        , hold_(hold) {}

    std::size_t Read(char* data, std::size_t size) override {
        if (!held_ && offset_ >= hold_.at) {
            held_ = true;
            hold_.reached.set_value();
            hold_.released.wait_for(std::chrono::seconds(10));
        }
        std::size_t n = inner_->Read(data, size);
        offset_ += n;
        return n;
    }

private:
    std::unique_ptr<ByteSource> inner_;
    Hold& hold_;
    uint64_t offset_{0};
    bool held_{false};
};

// Single-file manifest whose bytes pass through a Hold.
class HeldManifest : public TransferManifest {
public:
    HeldManifest(TransferManifest manifest, Hold& hold)
        : TransferManifest(std::move(manifest))
        , hold_(hold) {}

    std::unique_ptr<ByteSource> Open(const FileDto& file) const override {
        return std::make_unique<HeldSource>(TransferManifest::Open(file), hold_);
    }

private:
    Hold& hold_;
};

void quickSaveReceivesEverything() {
    QuickSaveDecisionProvider decisions;
    Loopback loop(decisions);
    auto outbox = makeTempDir("outbox");
    write(outbox / "notes.txt", "hello lanbeam");
    fs::create_directories(outbox / "album");
    write(outbox / "album" / "cover.jpg", std::string(200000, 'j'));

    auto manifest = TransferManifestBuilder(true)
                        .AddPath(outbox / "notes.txt")
                        .AddPath(outbox / "album")
                        .AddText("ping")
                        .Build();

    SessionNegotiator negotiator(loop.ioc(), sender());
    auto outcome = loop.await(negotiator.Negotiate(loop.peer(), manifest));
    auto& handle = std::get<SessionHandle>(outcome);
    assert(handle.tokens.size() == 3);
    assert(loop.registry().GetStatus(handle.session_id) == SessionStatus::kAccepted);
    assert(loop.registry().GetSender(handle.session_id)->ip == "127.0.0.1");

    ProgressChannel channel(transfer::kProgressChannelCapacity);
    TransferExecutor executor(loop.ioc(), channel, TransferOptions{2, 4096});
    auto result = loop.await(executor.Run(handle, manifest, CancellationSignal{}));
    assert(result.session_id == handle.session_id);
    assert(result.completed == 3);
    assert(result.Succeeded());

    auto events = channel.Drain();
    assert(countKind(events, TransferEventKind::kCompleted) == 3);
    assert(countKind(events, TransferEventKind::kProgress) > 0);

    assert(read(loop.save_dir() / "notes.txt") == "hello lanbeam");
    assert(fs::file_size(loop.save_dir() / "album" / "cover.jpg") == 200000);
    assert(read(loop.save_dir() / (FileHasher::CalculateDataChecksum("ping") + ".txt")) == "ping");
    assert(loop.registry().GetStatus(handle.session_id) == SessionStatus::kCompleted);

    // a consumed token cannot write the file twice
    std::string notes_id;
    for (const auto& [id, file] : manifest.files()) {
        if (file.file_name == "notes.txt") {
            notes_id = id;
        }
    }
    assert(loop.rawUpload(handle.session_id, notes_id, handle.tokens.at(notes_id), "hello lanbeam", 13)
           == 409);
    assert(!fs::exists(loop.save_dir() / "notes (1).txt"));

    fs::remove_all(outbox);
}

void duplicatesAreRejectedPerFile() {
    QuickSaveDecisionProvider decisions;
    Loopback loop(decisions);
    auto outbox = makeTempDir("outbox");
    write(outbox / "old.bin", "already here");
    write(outbox / "new.bin", "fresh bytes");
    write(loop.save_dir() / "old.bin", "already here");

    auto manifest = std::make_shared<const TransferManifest>(
        TransferManifestBuilder().AddFile(outbox / "old.bin").AddFile(outbox / "new.bin").Build());

    ProgressChannel channel(transfer::kProgressChannelCapacity);
    SendSessionManager manager(loop.ioc(), sender(), channel, TransferOptions{4, 1024});
    auto result = loop.await(manager.Send(loop.peer(), manifest));
    auto& outcome = std::get<SessionOutcome>(result);
    assert(outcome.completed == 1);
    assert(outcome.rejected == 1);
    assert(outcome.Succeeded());
    assert(manager.ActiveSessions().empty());

    auto events = channel.Drain();
    assert(countKind(events, TransferEventKind::kRejected) == 1);
    for (const auto& event : events) {
        if (event.kind == TransferEventKind::kRejected) {
            assert(event.file_name == "old.bin");
        }
    }
    assert(read(loop.save_dir() / "new.bin") == "fresh bytes");
    assert(!fs::exists(loop.save_dir() / "old (1).bin"));

    // every file already present: nothing to accept
    auto again = loop.await(manager.Send(loop.peer(), manifest));
    auto& error = std::get<NegotiationError>(again);
    assert(error.kind == NegotiationError::Kind::kRejected);
    assert(error.status == 204u);

    fs::remove_all(outbox);
}

void declinedRequestIsRejected() {
    PromptDecisionProvider decisions;
    decisions.SetPromptCallback([&decisions](const PromptDecisionProvider::PendingRequest& pending) {
        assert(pending.request.sender.alias == "Sender");
        assert(pending.request.files.size() == 1);
        decisions.Resolve(pending.id, std::nullopt);
    });
    Loopback loop(decisions);

    auto manifest = TransferManifestBuilder().AddText("are you there?").Build();
    SessionNegotiator negotiator(loop.ioc(), sender());
    auto outcome = loop.await(negotiator.Negotiate(loop.peer(), manifest));
    auto& error = std::get<NegotiationError>(outcome);
    assert(error.kind == NegotiationError::Kind::kRejected);
    assert(error.status == 403u);
    assert(loop.registry().active_count() == 0);
    assert(decisions.PendingIds().empty());
}

void oversizedBodyIsRefused() {
    QuickSaveDecisionProvider decisions;
    Loopback loop(decisions);
    auto response = loop.registry().Create(sender(),
                                           {{"f1", FileDto{"f1", "small.bin", 5}}},
                                           loop.save_dir());

    assert(loop.rawUpload(response.session_id, "f1", response.files.at("f1"), "0123456789", 10)
           == 413);
    assert(loop.registry().GetStatus(response.session_id) == SessionStatus::kFailed);
    assert(!fs::exists(loop.save_dir() / "small.bin"));

    assert(loop.rawUpload(response.session_id, "f1", "forged", "01234", 5) == 403);
}

void cancelledSessionIsGone() {
    QuickSaveDecisionProvider decisions;
    Loopback loop(decisions);
    auto response = loop.registry().Create(sender(),
                                           {{"f1", FileDto{"f1", "late.bin", 4}}},
                                           loop.save_dir());

    bool delivered = loop.await(SessionNegotiator::SendCancel(loop.ioc(), loop.peer(), response.session_id));
    assert(delivered);
    assert(loop.registry().GetStatus(response.session_id) == SessionStatus::kCancelled);

    assert(loop.rawUpload(response.session_id, "f1", response.files.at("f1"), "late", 4) == 410);
    assert(!fs::exists(loop.save_dir() / "late.bin"));

    // cancelling again is harmless
    assert(loop.await(SessionNegotiator::SendCancel(loop.ioc(), loop.peer(), response.session_id)));
}

void unreachablePeer() {
    QuickSaveDecisionProvider decisions;
    Loopback loop(decisions);
    auto peer = loop.peer();
    {
        // grab a port nobody listens on
        net::ip::tcp::acceptor spare(loop.ioc(), {net::ip::tcp::v4(), 0});
        peer.port = spare.local_endpoint().port();
    }

    auto manifest = TransferManifestBuilder().AddText("anyone?").Build();
    SessionNegotiator negotiator(loop.ioc(), sender());
    auto outcome = loop.await(negotiator.Negotiate(peer, manifest));
    assert(std::get<NegotiationError>(outcome).kind == NegotiationError::Kind::kUnreachable);

    CancellationSignal cancel;
    cancel.Cancel();
    auto cancelled = loop.await(negotiator.Negotiate(loop.peer(), manifest, cancel));
    assert(std::get<NegotiationError>(cancelled).kind == NegotiationError::Kind::kCancelled);
    assert(loop.registry().active_count() == 0);
}

void uppercaseChecksumIsAccepted() {
    QuickSaveDecisionProvider decisions;
    Loopback loop(decisions);
    FileDto file{"f1", "hash.txt", 5};
    std::string digest = FileHasher::CalculateDataChecksum("hello");
    std::transform(digest.begin(), digest.end(), digest.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    file.sha256 = digest;
    auto response = loop.registry().Create(sender(), {{"f1", file}}, loop.save_dir());

    assert(loop.rawUpload(response.session_id, "f1", response.files.at("f1"), "hello", 5) == 200);
    assert(read(loop.save_dir() / "hash.txt") == "hello");
    assert(loop.registry().GetStatus(response.session_id) == SessionStatus::kCompleted);
}

void grownFileIsNotStoredTruncated() {
    QuickSaveDecisionProvider decisions;
    Loopback loop(decisions);
    auto outbox = makeTempDir("outbox");
    write(outbox / "grow.log", "01234");
    auto manifest = TransferManifestBuilder().AddFile(outbox / "grow.log").Build();

    SessionNegotiator negotiator(loop.ioc(), sender());
    auto outcome = loop.await(negotiator.Negotiate(loop.peer(), manifest));
    auto& handle = std::get<SessionHandle>(outcome);

    // appended after the offer went out
    std::ofstream(outbox / "grow.log", std::ios::binary | std::ios::app) << "56789";

    ProgressChannel channel(transfer::kProgressChannelCapacity);
    TransferExecutor executor(loop.ioc(), channel, TransferOptions{1, 4});
    auto result = loop.await(executor.Run(handle, manifest, CancellationSignal{}));
    assert(result.failed == 1);
    assert(result.completed == 0);
    assert(countKind(channel.Drain(), TransferEventKind::kFailed) == 1);

    assert(waitForStatus(loop.registry(), handle.session_id, SessionStatus::kFailed));
    assert(!fs::exists(loop.save_dir() / "grow.log"));
    assert(!hasPartFiles(loop.save_dir()));

    fs::remove_all(outbox);
}

void cancelStopsUploadInFlight() {
    QuickSaveDecisionProvider decisions;
    Loopback loop(decisions);
    auto outbox = makeTempDir("outbox");
    write(outbox / "movie.bin", std::string(256 * 1024, 'm'));
    write(outbox / "other.txt", "unaffected");

    Hold hold;
    hold.at = 64 * 1024;
    auto reached = hold.reached.get_future();
    auto manifest = std::make_shared<const HeldManifest>(
        TransferManifestBuilder().AddFile(outbox / "movie.bin").Build(), hold);

    // a parked read blocks a sender thread, never the receiver's
    net::io_context sender_ioc;
    auto work = net::make_work_guard(sender_ioc);
    std::vector<std::thread> sender_threads;
    for (int i = 0; i < 2; ++i) {
        sender_threads.emplace_back([&sender_ioc] { sender_ioc.run(); });
    }

    ProgressChannel channel(transfer::kProgressChannelCapacity);
    SendSessionManager manager(sender_ioc, sender(), channel, TransferOptions{1, 4096});
    auto sending = net::co_spawn(sender_ioc, manager.Send(loop.peer(), manifest), net::use_future);

    assert(reached.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
    auto active = manager.ActiveSessions();
    assert(active.size() == 1);
    const std::string session_id = active.front();
    assert(waitForStatus(loop.registry(), session_id, SessionStatus::kTransferring));

    // another session on the same receiver is unaffected
    ProgressChannel sibling_channel(transfer::kProgressChannelCapacity);
    SendSessionManager sibling(loop.ioc(), sender(), sibling_channel, TransferOptions{1, 4096});
    auto sibling_manifest = std::make_shared<const TransferManifest>(
        TransferManifestBuilder().AddFile(outbox / "other.txt").Build());
    auto sibling_result = loop.await(sibling.Send(loop.peer(), sibling_manifest));
    auto& sibling_outcome = std::get<SessionOutcome>(sibling_result);
    assert(sibling_outcome.completed == 1);
    assert(loop.registry().GetStatus(sibling_outcome.session_id) == SessionStatus::kCompleted);

    manager.CancelSend(session_id);
    assert(waitForStatus(loop.registry(), session_id, SessionStatus::kCancelled));
    hold.release.set_value();

    auto result = sending.get();
    auto& outcome = std::get<SessionOutcome>(result);
    assert(outcome.cancelled == 1);
    assert(outcome.completed == 0);
    auto events = channel.Drain();
    assert(countKind(events, TransferEventKind::kCancelled) == 1);
    assert(countKind(events, TransferEventKind::kCompleted) == 0);
    assert(events.back().kind == TransferEventKind::kCancelled);
    assert(manager.ActiveSessions().empty());

    work.reset();
    for (auto& thread : sender_threads) {
        thread.join();
    }

    assert(loop.registry().GetStatus(session_id) == SessionStatus::kCancelled);
    assert(!fs::exists(loop.save_dir() / "movie.bin"));
    assert(!hasPartFiles(loop.save_dir()));
    assert(read(loop.save_dir() / "other.txt") == "unaffected");

    fs::remove_all(outbox);
}

} // namespace

int main() {
    quickSaveReceivesEverything();
    duplicatesAreRejectedPerFile();
    declinedRequestIsRejected();
    oversizedBodyIsRefused();
    cancelledSessionIsGone();
    unreachablePeer();
    uppercaseChecksumIsAccepted();
    grownFileIsNotStoredTruncated();
    cancelStopsUploadInFlight();
    return 0;
}
