#pragma once

#include <utility>  // Boost 1.74's asio/awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <core/model.h>
#include <core/network/server/decision_provider.h>
#include <core/network/server/http_server.h>
#include <core/network/server/session_registry.h>
#include <filesystem>
#include <string>

namespace lanbeam::core {

struct ReceiveOptions {
    std::filesystem::path save_dir;
    std::chrono::seconds decision_timeout{transfer::kDefaultDecisionTimeout};
    std::size_t chunk_size{transfer::kDefaultChunkSize};
};

// Receiver half of the protocol: the prepare-upload, upload and cancel
// endpoints on top of a SessionRegistry.
class ReceiveController {
public:
    ReceiveController(boost::asio::io_context& ioc,
                      HttpServer& server,
                      SessionRegistry& registry,
                      DecisionProvider& decisions,
                      ReceiveOptions options,
                      FeedbackCallback callback = nullptr);
    ~ReceiveController();

    // Spawns the periodic session sweep.
    void Start();
    void Stop();

    void SetFeedbackCallback(FeedbackCallback callback);
    void SetSaveDirectory(const std::filesystem::path& save_dir);

    const ReceiveOptions& options() const { return options_; }

private:
    boost::asio::awaitable<HttpResponse> onPrepareUpload(const RequestContext& ctx,
                                                         StringRequest&& req);

    boost::asio::awaitable<HttpResponse> onUpload(const RequestContext& ctx, BodyReader& body);

    boost::asio::awaitable<HttpResponse> onCancel(const RequestContext& ctx, StringRequest&& req);

    boost::asio::awaitable<void> sweeper();

    void installRoutes();
    void endSession(const std::string& session_id,
                    SessionStatus status,
                    bool cancelled_by_sender,
                    const std::string& error_message = {});
    void discard(const std::filesystem::path& temp_path);
    void feedback(FeedbackType type, nlohmann::json data);

    HttpServer& server_;
    SessionRegistry& registry_;
    DecisionProvider& decisions_;
    ReceiveOptions options_;
    FeedbackCallback callback_;
    boost::asio::io_context& io_context_;
    boost::asio::steady_timer sweep_timer_;
    bool running_{false};
};

} // namespace lanbeam::core
