#pragma once

#include <chrono>
#include <core/constant/transfer.h>
#include <core/model.h>
#include <core/util/cancellation.h>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace lanbeam::core {

// Handed to the upload task that won the right to write one file.
struct UploadTicket {
    std::string session_id;
    FileDto file;
    std::filesystem::path destination;
    std::filesystem::path temp_path;
    CancellationSignal cancel;
};

// How a session left the active set.
struct SessionEnd {
    std::string session_id;
    SessionStatus status;
    std::vector<std::filesystem::path> temp_files; // left behind by unfinished uploads
};

// Outcome of SessionRegistry::CommitFile.
struct FileCommit {
    bool committed = false;
    std::optional<SessionStatus> ended; // set when this file finished the session
};

// Receiver-side record of accepted sessions and their single-use file tokens.
// Every method is safe to call from any thread. A session that ends stays
// as a tombstone for one sweep interval so late requests get a precise error.
class SessionRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit SessionRegistry(std::chrono::seconds inactivity_timeout
                             = transfer::kDefaultSessionTimeout);

    // Registers an Accepted session with one fresh token per accepted file.
    PrepareUploadResponseDto Create(const DeviceInfo& sender,
                                    const std::map<std::string, FileDto>& accepted,
                                    const std::filesystem::path& destination,
                                    Clock::time_point now = Clock::now());

    // Claims the file for writing. Throws ProtocolError with kTokenInvalid,
    // kCancelledByUser, kAlreadyCompleted or kFileInProgress.
    UploadTicket BeginUpload(const std::string& session_id,
                             const std::string& file_id,
                             const std::string& token,
                             Clock::time_point now = Clock::now());

    void Touch(const std::string& session_id, Clock::time_point now = Clock::now());

    // Runs `commit` (the rename into place) under the registry lock unless
    // the session was cancelled meanwhile, then marks the file Completed in
    // the same critical section. `committed` is false when cancelled; an
    // exception from `commit` propagates and leaves the file claimed.
    FileCommit CommitFile(const std::string& session_id,
                          const std::string& file_id,
                          const std::function<void()>& commit,
                          Clock::time_point now = Clock::now());

    // Marks a claimed file Completed or Failed. Returns the session's final
    // status when this call ended it.
    std::optional<SessionStatus> CompleteFile(const std::string& session_id,
                                              const std::string& file_id,
                                              Clock::time_point now = Clock::now());
    std::optional<SessionStatus> FailFile(const std::string& session_id,
                                          const std::string& file_id,
                                          Clock::time_point now = Clock::now());

    // Cancels a live session, invalidating its tokens. Returns std::nullopt
    // when the session is unknown or already over.
    std::optional<SessionEnd> Cancel(const std::string& session_id,
                                     Clock::time_point now = Clock::now());

    // Fails sessions idle for longer than the inactivity timeout and purges
    // tombstones older than one sweep interval.
    std::vector<SessionEnd> Sweep(Clock::time_point now = Clock::now());

    std::optional<SessionStatus> GetStatus(const std::string& session_id) const;
    std::optional<FileStatus> GetFileStatus(const std::string& session_id,
                                            const std::string& file_id) const;
    std::optional<DeviceInfo> GetSender(const std::string& session_id) const;

    std::size_t active_count() const;

private:
    struct IncomingFile {
        FileDto meta;
        std::string token;
        FileStatus status{FileStatus::kQueued};
        std::filesystem::path temp_path;
    };

    struct IncomingSession {
        DeviceInfo sender;
        SessionStatus status{SessionStatus::kAccepted};
        std::filesystem::path destination;
        std::map<std::string, IncomingFile> files;
        CancellationSignal cancel;
        Clock::time_point last_activity;
        Clock::time_point finished_at;
    };

    IncomingFile& claimedFile(IncomingSession& session,
                              const std::string& session_id,
                              const std::string& file_id);
    std::optional<SessionStatus> settleFile(const std::string& session_id,
                                            const std::string& file_id,
                                            FileStatus outcome,
                                            Clock::time_point now);
    std::optional<SessionStatus> settleLocked(IncomingSession& session,
                                              IncomingFile& file,
                                              FileStatus outcome,
                                              Clock::time_point now);
    void finish(IncomingSession& session, SessionStatus status, Clock::time_point now);
    static std::vector<std::filesystem::path> unfinishedTempFiles(const IncomingSession& session);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, IncomingSession> sessions_;
    std::chrono::seconds inactivity_timeout_;
};

} // namespace lanbeam::core
