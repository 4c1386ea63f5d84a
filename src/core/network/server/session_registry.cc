#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <core/network/server/session_registry.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace lanbeam::core {

namespace {

std::string randomId() {
    thread_local boost::uuids::random_generator generator;
    return boost::uuids::to_string(generator());
}

} // namespace

SessionRegistry::SessionRegistry(std::chrono::seconds inactivity_timeout)
    : inactivity_timeout_(inactivity_timeout) {}

PrepareUploadResponseDto SessionRegistry::Create(const DeviceInfo& sender,
                                                 const std::map<std::string, FileDto>& accepted,
                                                 const fs::path& destination,
                                                 Clock::time_point now) {
    PrepareUploadResponseDto response;
    IncomingSession session;
    session.sender = sender;
    session.destination = destination;
    session.last_activity = now;
    for (const auto& [file_id, file] : accepted) {
        IncomingFile incoming;
        incoming.meta = file;
        incoming.token = randomId();
        // the token never repeats, so it doubles as a collision free temp name
        incoming.temp_path = destination / (".lanbeam-" + incoming.token + ".part");
        response.files.emplace(file_id, incoming.token);
        session.files.emplace(file_id, std::move(incoming));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    do {
        response.session_id = randomId();
    } while (sessions_.contains(response.session_id));
    sessions_.emplace(response.session_id, std::move(session));
    return response;
}

UploadTicket SessionRegistry::BeginUpload(const std::string& session_id,
                                          const std::string& file_id,
                                          const std::string& token,
                                          Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto session_it = sessions_.find(session_id);
    if (session_it == sessions_.end()) {
        throw ProtocolError(ErrorCode::kTokenInvalid, "unknown session");
    }
    auto& session = session_it->second;
    if (session.status == SessionStatus::kCancelled) {
        throw ProtocolError(ErrorCode::kCancelledByUser, "session cancelled");
    }

    auto file_it = session.files.find(file_id);
    if (file_it == session.files.end() || file_it->second.token != token) {
        throw ProtocolError(ErrorCode::kTokenInvalid, "invalid token");
    }
    auto& file = file_it->second;
    switch (file.status) {
    case FileStatus::kCompleted:
        throw ProtocolError(ErrorCode::kAlreadyCompleted, "file already received");
    case FileStatus::kTransferring:
        throw ProtocolError(ErrorCode::kFileInProgress, "file is being received");
    case FileStatus::kQueued:
        break;
    default:
        throw ProtocolError(ErrorCode::kTokenInvalid, "token already used");
    }
    if (IsTerminal(session.status)) {
        throw ProtocolError(ErrorCode::kTokenInvalid, "session is over");
    }

    file.status = FileStatus::kTransferring;
    if (session.status == SessionStatus::kAccepted) {
        session.status = SessionStatus::kTransferring;
    }
    session.last_activity = now;
    return UploadTicket{session_id, file.meta, session.destination, file.temp_path, session.cancel};
}

void SessionRegistry::Touch(const std::string& session_id, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = sessions_.find(session_id); it != sessions_.end()) {
        it->second.last_activity = now;
    }
}

SessionRegistry::IncomingFile& SessionRegistry::claimedFile(IncomingSession& session,
                                                            const std::string& session_id,
                                                            const std::string& file_id) {
    auto it = session.files.find(file_id);
    if (it == session.files.end() || it->second.status != FileStatus::kTransferring) {
        throw std::logic_error("file " + file_id + " of session " + session_id
                               + " is not being received");
    }
    return it->second;
}

FileCommit SessionRegistry::CommitFile(const std::string& session_id,
                                      const std::string& file_id,
                                      const std::function<void()>& commit,
                                      Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second.cancel.IsCancelled()) {
        return {};
    }
    auto& file = claimedFile(it->second, session_id, file_id);
    commit();
    // settled under the same lock so a racing Cancel never sees the file unfinished
    return FileCommit{true, settleLocked(it->second, file, FileStatus::kCompleted, now)};
}

std::optional<SessionStatus> SessionRegistry::CompleteFile(const std::string& session_id,
                                                           const std::string& file_id,
                                                           Clock::time_point now) {
    return settleFile(session_id, file_id, FileStatus::kCompleted, now);
}

std::optional<SessionStatus> SessionRegistry::FailFile(const std::string& session_id,
                                                       const std::string& file_id,
                                                       Clock::time_point now) {
    return settleFile(session_id, file_id, FileStatus::kFailed, now);
}

std::optional<SessionStatus> SessionRegistry::settleFile(const std::string& session_id,
                                                         const std::string& file_id,
                                                         FileStatus outcome,
                                                         Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    auto& session = it->second;
    auto file_it = session.files.find(file_id);
    if (file_it == session.files.end() || IsTerminal(file_it->second.status)) {
        return std::nullopt;
    }
    return settleLocked(session, file_it->second, outcome, now);
}

std::optional<SessionStatus> SessionRegistry::settleLocked(IncomingSession& session,
                                                           IncomingFile& file,
                                                           FileStatus outcome,
                                                           Clock::time_point now) {
    file.status = outcome;
    session.last_activity = now;
    if (IsTerminal(session.status)) {
        return std::nullopt;
    }

    bool all_done = true;
    bool any_failed = false;
    for (const auto& [id, file] : session.files) {
        all_done = all_done && IsTerminal(file.status);
        any_failed = any_failed || file.status == FileStatus::kFailed;
    }
    if (!all_done) {
        return std::nullopt;
    }
    auto status = any_failed ? SessionStatus::kFailed : SessionStatus::kCompleted;
    finish(session, status, now);
    return status;
}

void SessionRegistry::finish(IncomingSession& session, SessionStatus status, Clock::time_point now) {
    if (!CanTransition(session.status, status)) {
        return;
    }
    session.status = status;
    session.finished_at = now;
    if (status != SessionStatus::kCompleted) {
        session.cancel.Cancel();
    }
}

std::vector<fs::path> SessionRegistry::unfinishedTempFiles(const IncomingSession& session) {
    std::vector<fs::path> paths;
    for (const auto& [id, file] : session.files) {
        if (file.status == FileStatus::kTransferring) {
            paths.push_back(file.temp_path);
        }
    }
    return paths;
}

std::optional<SessionEnd> SessionRegistry::Cancel(const std::string& session_id,
                                                  Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || IsTerminal(it->second.status)) {
        return std::nullopt;
    }
    auto& session = it->second;
    SessionEnd end{session_id, SessionStatus::kCancelled, unfinishedTempFiles(session)};
    for (auto& [id, file] : session.files) {
        if (!IsTerminal(file.status)) {
            file.status = FileStatus::kCancelled;
        }
    }
    finish(session, SessionStatus::kCancelled, now);
    return end;
}

std::vector<SessionEnd> SessionRegistry::Sweep(Clock::time_point now) {
    std::vector<SessionEnd> ended;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        auto& session = it->second;
        if (IsTerminal(session.status)) {
            if (now - session.finished_at >= transfer::kSessionSweepInterval) {
                it = sessions_.erase(it);
                continue;
            }
        } else if (now - session.last_activity > inactivity_timeout_) {
            spdlog::info("Session {} timed out after {}s of inactivity",
                         it->first,
                         inactivity_timeout_.count());
            ended.push_back(SessionEnd{it->first, SessionStatus::kFailed, unfinishedTempFiles(session)});
            for (auto& [id, file] : session.files) {
                if (!IsTerminal(file.status)) {
                    file.status = FileStatus::kFailed;
                }
            }
            finish(session, SessionStatus::kFailed, now);
        }
        ++it;
    }
    return ended;
}

std::optional<SessionStatus> SessionRegistry::GetStatus(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.status;
}

std::optional<FileStatus> SessionRegistry::GetFileStatus(const std::string& session_id,
                                                         const std::string& file_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    auto file_it = it->second.files.find(file_id);
    if (file_it == it->second.files.end()) {
        return std::nullopt;
    }
    return file_it->second.status;
}

std::optional<DeviceInfo> SessionRegistry::GetSender(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second.sender;
}

std::size_t SessionRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [id, session] : sessions_) {
        if (!IsTerminal(session.status)) {
            ++count;
        }
    }
    return count;
}

} // namespace lanbeam::core
