#include <atomic>
#include <cassert>
#include <core/network/server/session_registry.h>
#include <thread>
#include <vector>

using namespace lanbeam::core;
using namespace std::chrono_literals;

namespace {

DeviceInfo sender() {
    DeviceInfo info;
    info.alias = "Sender";
    info.fingerprint = "5e";
    info.ip = "10.0.0.9";
    return info;
}

std::map<std::string, FileDto> files(std::initializer_list<std::string> ids) {
    std::map<std::string, FileDto> result;
    for (const auto& id : ids) {
        result.emplace(id, FileDto{id, id + ".bin", 10});
    }
    return result;
}

ErrorCode beginError(SessionRegistry& registry,
                     const std::string& session_id,
                     const std::string& file_id,
                     const std::string& token) {
    try {
        registry.BeginUpload(session_id, file_id, token);
    } catch (const ProtocolError& e) {
        return e.code();
    }
    assert(false && "upload should have been refused");
    return ErrorCode::kTransferIO;
}

void tokenIsClaimedExactlyOnce() {
    SessionRegistry registry;
    auto response = registry.Create(sender(), files({"f1"}), "/tmp/lanbeam-in");
    assert(registry.GetStatus(response.session_id) == SessionStatus::kAccepted);
    const auto token = response.files.at("f1");

    std::atomic<int> winners{0};
    std::atomic<int> in_progress{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            try {
                registry.BeginUpload(response.session_id, "f1", token);
                ++winners;
            } catch (const ProtocolError& e) {
                if (e.code() == ErrorCode::kFileInProgress) {
                    ++in_progress;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    assert(winners == 1);
    assert(in_progress == 7);
    assert(registry.GetStatus(response.session_id) == SessionStatus::kTransferring);

    assert(registry.CompleteFile(response.session_id, "f1") == SessionStatus::kCompleted);
    assert(registry.GetFileStatus(response.session_id, "f1") == FileStatus::kCompleted);
    assert(beginError(registry, response.session_id, "f1", token) == ErrorCode::kAlreadyCompleted);
    assert(registry.active_count() == 0);
}

void badCredentialsAreRefused() {
    SessionRegistry registry;
    auto response = registry.Create(sender(), files({"f1", "f2"}), "/tmp/lanbeam-in");
    const auto& id = response.session_id;

    assert(beginError(registry, "no-such-session", "f1", response.files.at("f1"))
           == ErrorCode::kTokenInvalid);
    assert(beginError(registry, id, "f1", "forged") == ErrorCode::kTokenInvalid);
    assert(beginError(registry, id, "f1", response.files.at("f2")) == ErrorCode::kTokenInvalid);
    assert(beginError(registry, id, "f3", response.files.at("f1")) == ErrorCode::kTokenInvalid);
    assert(registry.GetStatus(id) == SessionStatus::kAccepted);
    assert(registry.GetSender(id)->alias == "Sender");
}

void cancelInvalidatesTokensAndReportsTempFiles() {
    SessionRegistry registry;
    auto response = registry.Create(sender(), files({"f1", "f2"}), "/tmp/lanbeam-in");
    const auto& id = response.session_id;

    auto ticket = registry.BeginUpload(id, "f1", response.files.at("f1"));
    assert(ticket.destination == "/tmp/lanbeam-in");
    assert(ticket.temp_path.parent_path() == "/tmp/lanbeam-in");
    assert(!ticket.cancel.IsCancelled());

    auto end = registry.Cancel(id);
    assert(end && end->status == SessionStatus::kCancelled);
    assert(end->temp_files.size() == 1 && end->temp_files.front() == ticket.temp_path);
    assert(ticket.cancel.IsCancelled());
    assert(!registry.Cancel(id));

    assert(beginError(registry, id, "f2", response.files.at("f2")) == ErrorCode::kCancelledByUser);
    bool committed = false;
    assert(!registry.CommitFile(id, "f1", [&committed] { committed = true; }).committed);
    assert(!committed);
    assert(!registry.CompleteFile(id, "f1"));
    assert(registry.GetStatus(id) == SessionStatus::kCancelled);
}

void failedFileFailsTheSession() {
    SessionRegistry registry;
    auto response = registry.Create(sender(), files({"f1", "f2"}), "/tmp/lanbeam-in");
    const auto& id = response.session_id;

    registry.BeginUpload(id, "f1", response.files.at("f1"));
    registry.BeginUpload(id, "f2", response.files.at("f2"));
    assert(!registry.FailFile(id, "f1"));
    assert(registry.GetStatus(id) == SessionStatus::kTransferring);

    bool committed = false;
    auto commit = registry.CommitFile(id, "f2", [&committed] { committed = true; });
    assert(commit.committed && committed);
    assert(commit.ended == SessionStatus::kFailed);
    assert(!registry.CompleteFile(id, "f2"));
    assert(beginError(registry, id, "f1", response.files.at("f1")) == ErrorCode::kTokenInvalid);
}

void committedFileSurvivesLaterCancel() {
    SessionRegistry registry;
    auto response = registry.Create(sender(), files({"f1", "f2"}), "/tmp/lanbeam-in");
    const auto& id = response.session_id;

    registry.BeginUpload(id, "f1", response.files.at("f1"));
    auto second = registry.BeginUpload(id, "f2", response.files.at("f2"));
    auto commit = registry.CommitFile(id, "f1", [] {});
    assert(commit.committed && !commit.ended);
    assert(registry.GetFileStatus(id, "f1") == FileStatus::kCompleted);

    auto end = registry.Cancel(id);
    assert(end && end->status == SessionStatus::kCancelled);
    assert(end->temp_files.size() == 1 && end->temp_files.front() == second.temp_path);
    assert(registry.GetFileStatus(id, "f1") == FileStatus::kCompleted);
    assert(registry.GetFileStatus(id, "f2") == FileStatus::kCancelled);
}

void commitOfLastFileEndsTheSession() {
    SessionRegistry registry;
    auto response = registry.Create(sender(), files({"f1"}), "/tmp/lanbeam-in");
    const auto& id = response.session_id;

    registry.BeginUpload(id, "f1", response.files.at("f1"));
    auto commit = registry.CommitFile(id, "f1", [] {});
    assert(commit.committed && commit.ended == SessionStatus::kCompleted);
    assert(!registry.Cancel(id));
    assert(registry.GetStatus(id) == SessionStatus::kCompleted);
}

void sweepTimesOutIdleSessionsAndPurgesTombstones() {
    SessionRegistry registry(30s);
    auto t0 = SessionRegistry::Clock::now();
    auto idle = registry.Create(sender(), files({"f1"}), "/tmp/lanbeam-in", t0);
    auto busy = registry.Create(sender(), files({"f1"}), "/tmp/lanbeam-in", t0);
    registry.Touch(busy.session_id, t0 + 20s);

    auto ended = registry.Sweep(t0 + 31s);
    assert(ended.size() == 1);
    assert(ended.front().session_id == idle.session_id);
    assert(ended.front().status == SessionStatus::kFailed);
    assert(registry.GetStatus(idle.session_id) == SessionStatus::kFailed);
    assert(registry.GetStatus(busy.session_id) == SessionStatus::kAccepted);

    // the tombstone answers late requests until the next sweep interval
    assert(beginError(registry, idle.session_id, "f1", idle.files.at("f1"))
           == ErrorCode::kTokenInvalid);
    assert(registry.Sweep(t0 + 31s + transfer::kSessionSweepInterval).empty());
    assert(!registry.GetStatus(idle.session_id));
    assert(registry.GetStatus(busy.session_id));
}

} // namespace

int main() {
    tokenIsClaimedExactlyOnce();
    badCredentialsAreRefused();
    cancelInvalidatesTokensAndReportsTempFiles();
    failedFileFailsTheSession();
    committedFileSurvivesLaterCancel();
    commitOfLastFileEndsTheSession();
    sweepTimesOutIdleSessionsAndPurgesTombstones();
    return 0;
}
