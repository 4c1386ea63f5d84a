#include <algorithm>
#include <boost/asio/post.hpp>
#include <cli/cli_manager.h>
#include <cli/progress_display.h>
#include <core/constant/transfer.h>
#include <core/network/client/send_session_manager.h>
#include <core/network/client/transfer_manifest.h>
#include <core/network/server/controller/receive_controller.h>
#include <core/network/server/http_server.h>
#include <core/network/server/session_registry.h>
#include <core/security/open_ssl_provider.h>
#include <core/util/progress_channel.h>
#include <core/util/system.h>
#include <csignal>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <variant>

namespace net = boost::asio;

using namespace lanbeam::core;
using namespace std::chrono_literals;

namespace lanbeam::cli {

CliManager::CliManager(Settings settings)
    : settings_(std::move(settings))
    , work_(net::make_work_guard(ioc_))
    , signals_(ioc_, SIGINT, SIGTERM)
    , registry_(settings_.device_ttl) {
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Received signal {}, stopping", signal_number);
            stopping_ = true;
        }
    });
}

CliManager::~CliManager() {
    shutdown();
}

int CliManager::Run(const CliOptions& options) {
    std::string command = options.command.value_or("help");
    if (command == "help") {
        ArgumentParser::ShowHelp();
        return 0;
    }

    if (!initIdentity()) {
        terminal_.PrintError("Failed to set up this device's certificate");
        return 1;
    }

    auto wait = std::chrono::seconds(
        options.wait_seconds.value_or(static_cast<int>(2 * settings_.announce_interval.count())));
    if (command == "receive") {
        return handleReceive();
    }
    if (command == "list") {
        return handleList(wait);
    }
    return handleSend(options, wait);
}

int CliManager::handleReceive() {
    if (!startDiscovery()) {
        terminal_.PrintError("Discovery is unavailable; peers must know this address");
    }

    std::unique_ptr<HttpServer> server = settings_.https
                                             ? std::make_unique<HttpServer>(ioc_, *cert_manager_)
                                             : std::make_unique<HttpServer>(ioc_);
    SessionRegistry sessions(settings_.session_timeout);

    std::unique_ptr<DecisionProvider> decisions;
    PromptDecisionProvider* prompt = nullptr;
    if (settings_.quick_save) {
        decisions = std::make_unique<QuickSaveDecisionProvider>();
    } else {
        auto provider = std::make_unique<PromptDecisionProvider>(
            [this](const PromptDecisionProvider::PendingRequest& request) { onPrompt(request); });
        prompt = provider.get();
        decisions = std::move(provider);
    }

    std::error_code ec;
    std::filesystem::create_directories(settings_.save_dir, ec);
    if (ec) {
        terminal_.PrintError(fmt::format("Cannot create {}: {}", settings_.save_dir.string(), ec.message()));
        return 1;
    }

    ReceiveController controller(ioc_,
                                 *server,
                                 sessions,
                                 *decisions,
                                 ReceiveOptions{settings_.save_dir,
                                                settings_.decision_timeout,
                                                settings_.chunk_size},
                                 [this](const Feedback& feedback) { onFeedback(feedback); });
    if (!server->Start(settings_.port)) {
        terminal_.PrintError(fmt::format("Cannot listen on port {}", settings_.port));
        shutdown([this] {
            if (discovery_) {
                discovery_->Stop();
            }
        });
        return 1;
    }
    controller.Start();
    startIoThread();

    terminal_.PrintInfo(fmt::format("Receiving as \"{}\" on {}://{}:{}, saving to {}",
                                    local_device_.alias,
                                    settings_.https ? "https" : "http",
                                    local_device_.ip,
                                    server->port(),
                                    settings_.save_dir.string()));
    if (!settings_.https) {
        spdlog::warn("HTTPS is off: senders are identified by LAN trust only");
    }
    terminal_.PrintInfo(settings_.quick_save ? "Quick save is on; press Ctrl-C to stop"
                                             : "Answer requests with y/n; press Ctrl-C to stop");

    while (!stopping_) {
        if (prompt != nullptr && terminal_.WaitForInput(200ms)) {
            if (auto line = terminal_.ReadLine()) {
                answerPrompt(*prompt, *line);
            } else {
                spdlog::warn("stdin closed; incoming requests will time out and be declined");
            }
        } else if (prompt == nullptr || terminal_.input_closed()) {
            std::this_thread::sleep_for(200ms);
        }
    }

    shutdown([this, &controller, &server] {
        controller.Stop();
        server->Stop();
        if (discovery_) {
            discovery_->Stop();
        }
    });
    return 0;
}

int CliManager::handleList(std::chrono::seconds wait) {
    if (!startDiscovery()) {
        terminal_.PrintError("Cannot join the discovery group");
        return 1;
    }
    startIoThread();

    auto deadline = std::chrono::steady_clock::now() + wait;
    while (!stopping_ && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(100ms);
    }
    printDeviceList(registry_.GetDevices());

    shutdown([this] { discovery_->Stop(); });
    return 0;
}

int CliManager::handleSend(const CliOptions& options, std::chrono::seconds wait) {
    TransferManifestBuilder builder(options.checksum);
    try {
        if (options.text) {
            std::string text;
            for (const auto& arg : options.command_args) {
                if (!text.empty()) {
                    text += ' ';
                }
                text += arg;
            }
            builder.AddText(std::move(text));
        } else {
            for (const auto& arg : options.command_args) {
                builder.AddPath(arg);
            }
        }
    } catch (const std::exception& e) {
        terminal_.PrintError(e.what());
        return 1;
    }
    auto manifest = std::make_shared<const TransferManifest>(builder.Build());
    if (manifest->empty()) {
        terminal_.PrintError("Nothing to send");
        return 1;
    }

    if (!startDiscovery()) {
        terminal_.PrintError("Cannot join the discovery group");
        return 1;
    }
    startIoThread();

    auto peer = waitForPeer(options.target_alias, wait);
    if (!peer) {
        shutdown([this] { discovery_->Stop(); });
        return 1;
    }
    terminal_.PrintInfo(fmt::format("Sending {} file(s), {} bytes, to {} ({}:{})",
                                    manifest->files().size(),
                                    manifest->total_size(),
                                    peer->alias,
                                    peer->ip,
                                    peer->port));

    ProgressChannel channel(transfer::kProgressChannelCapacity);
    SendSessionManager sender(ioc_,
                              local_device_,
                              channel,
                              TransferOptions{settings_.upload_concurrency, settings_.chunk_size});
    sender.negotiator().set_response_timeout(settings_.decision_timeout + transfer::kIoTimeout);

    std::mutex result_mutex;
    std::optional<SendResult> result;
    std::atomic<bool> done{false};
    net::post(ioc_, [&] {
        sender.SendFiles(*peer, manifest, [&](const SendResult& send_result) {
            {
                std::lock_guard<std::mutex> lock(result_mutex);
                result = send_result;
            }
            done = true;
        });
    });

    ProgressDisplay display(terminal_);
    bool cancel_requested = false;
    while (!done) {
        if (stopping_ && !cancel_requested) {
            cancel_requested = true;
            terminal_.PrintInfo("Cancelling...");
            net::post(ioc_, [&sender] { sender.CancelAll(); });
        }
        if (auto event = channel.WaitPop(200ms)) {
            display.Update(*event);
        }
    }
    for (const auto& event : channel.Drain()) {
        display.Update(event);
    }
    display.Clear();

    shutdown([this] { discovery_->Stop(); });

    std::lock_guard<std::mutex> lock(result_mutex);
    if (!result) {
        terminal_.PrintError("Send ended without a result");
        return 1;
    }
    if (const auto* error = std::get_if<NegotiationError>(&*result)) {
        terminal_.PrintError(fmt::format("{} {}: {}",
                                         peer->alias,
                                         NegotiationErrorKindToString(error->kind),
                                         error->message));
        return 1;
    }
    const auto& outcome = std::get<SessionOutcome>(*result);
    std::string summary = fmt::format("{} completed, {} failed, {} cancelled, {} rejected",
                                      outcome.completed,
                                      outcome.failed,
                                      outcome.cancelled,
                                      outcome.rejected);
    if (outcome.Succeeded()) {
        terminal_.PrintInfo(summary);
        return 0;
    }
    terminal_.PrintError(summary);
    return 1;
}

bool CliManager::initIdentity() {
    try {
        OpenSSLProvider::InitOpenSSL();
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return false;
    }
    cert_manager_ = std::make_unique<CertificateManager>(settings_.certificate_dir);
    if (!cert_manager_->InitSecurityContext()) {
        return false;
    }

    local_device_.alias = settings_.alias.empty() ? system::Hostname() : settings_.alias;
    local_device_.fingerprint = cert_manager_->fingerprint();
    local_device_.device_model = settings_.device_model.empty() ? system::DeviceModel()
                                                                : settings_.device_model;
    local_device_.device_type = settings_.device_type;
    local_device_.port = settings_.port;
    local_device_.https = settings_.https;
    local_device_.download = false;
    local_device_.ip = system::LocalIpv4Address();
    spdlog::info("This device: {} [{}] fingerprint {}",
                 local_device_.alias,
                 system::OperatingSystem(),
                 local_device_.fingerprint);
    return true;
}

bool CliManager::startDiscovery() {
    discovery_ = std::make_unique<DiscoveryManager>(ioc_,
                                                    registry_,
                                                    settings_,
                                                    local_device_,
                                                    [this](const Feedback& feedback) {
                                                        onFeedback(feedback);
                                                    });
    if (!discovery_->Start()) {
        discovery_.reset();
        return false;
    }
    return true;
}

void CliManager::startIoThread() {
    if (io_thread_.joinable()) {
        return;
    }
    io_thread_ = std::thread([this] {
        try {
            ioc_.run();
        } catch (const std::exception& e) {
            spdlog::error("I/O loop stopped: {}", e.what());
            stopping_ = true;
        }
    });
}

void CliManager::shutdown(std::function<void()> stop_components) {
    if (!io_thread_.joinable()) {
        if (stop_components) {
            stop_components();
        }
        return;
    }

    net::post(ioc_, [this, stop = std::move(stop_components)] {
        if (stop) {
            stop();
        }
        boost::system::error_code ignored;
        signals_.cancel(ignored);
    });
    work_.reset();

    // let in-flight notices such as a cancel request finish
    auto deadline = std::chrono::steady_clock::now() + transfer::kConnectTimeout / 2;
    while (!ioc_.stopped() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(50ms);
    }
    ioc_.stop();
    io_thread_.join();
}

std::optional<DeviceInfo> CliManager::waitForPeer(const std::optional<std::string>& alias,
                                                  std::chrono::seconds wait) {
    auto deadline = std::chrono::steady_clock::now() + wait;
    while (!stopping_ && std::chrono::steady_clock::now() < deadline) {
        if (alias) {
            if (auto device = registry_.FindByAlias(*alias)) {
                return device;
            }
        } else {
            auto devices = registry_.GetDevices();
            if (devices.size() == 1) {
                return devices.front();
            }
        }
        std::this_thread::sleep_for(100ms);
    }

    auto devices = registry_.GetDevices();
    if (alias) {
        terminal_.PrintError(fmt::format("No device named \"{}\" found", *alias));
    } else if (devices.empty()) {
        terminal_.PrintError("No devices found");
    } else {
        terminal_.PrintError("Several devices found; choose one with --to");
    }
    if (!devices.empty()) {
        printDeviceList(devices);
    }
    return std::nullopt;
}

void CliManager::onPrompt(const PromptDecisionProvider::PendingRequest& request) {
    {
        std::lock_guard<std::mutex> lock(prompt_mutex_);
        prompts_.push_back(request);
    }
    const auto& sender = request.request.sender;
    terminal_.PrintInfo(fmt::format("{} ({}) wants to send {} file(s):",
                                    sender.alias,
                                    sender.ip,
                                    request.request.files.size()));
    for (const auto& [id, file] : request.request.files) {
        std::string line = fmt::format("  {} ({} bytes)", file.file_name, file.size);
        if (file.preview) {
            line += ": " + *file.preview;
        }
        terminal_.PrintInfo(line);
    }
    terminal_.PrintPrompt("Accept? [y/n] ");
}

void CliManager::answerPrompt(PromptDecisionProvider& prompt, const std::string& answer) {
    std::string normalized = answer;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), ::tolower);
    normalized.erase(std::remove(normalized.begin(), normalized.end(), ' '), normalized.end());

    std::optional<PromptDecisionProvider::PendingRequest> request;
    {
        std::lock_guard<std::mutex> lock(prompt_mutex_);
        if (!prompts_.empty()) {
            request = std::move(prompts_.front());
            prompts_.pop_front();
        }
    }
    if (!request) {
        if (!normalized.empty()) {
            terminal_.PrintInfo("No request is waiting for an answer");
        }
        return;
    }

    Decision decision;
    if (normalized == "y" || normalized == "yes") {
        std::set<std::string> accepted;
        for (const auto& [id, file] : request->request.files) {
            accepted.insert(id);
        }
        decision = std::move(accepted);
    } else if (normalized != "n" && normalized != "no") {
        std::lock_guard<std::mutex> lock(prompt_mutex_);
        prompts_.push_front(std::move(*request));
        terminal_.PrintPrompt("Please answer y or n: ");
        return;
    }

    if (!prompt.Resolve(request->id, std::move(decision))) {
        terminal_.PrintError("That request already expired");
    }
}

void CliManager::onFeedback(const Feedback& event) {
    try {
        switch (event.type) {
        case FeedbackType::kFoundDevice: {
            auto found = event.data.get<feedback::FoundDevice>();
            spdlog::info("{} device {} ({}:{})",
                         found.updated ? "Back:" : "Found",
                         found.device_info.alias,
                         found.device_info.ip,
                         found.device_info.port);
            break;
        }
        case FeedbackType::kLostDevice: {
            auto lost = event.data.get<feedback::LostDevice>();
            spdlog::info("Lost device {}", lost.fingerprint);
            break;
        }
        case FeedbackType::kRequestReceiveFiles: {
            auto request = event.data.get<feedback::RequestReceiveFiles>();
            spdlog::info("{} offers {} file(s), {} bytes in total",
                         request.sender.alias,
                         request.files.size(),
                         request.total_size);
            break;
        }
        case FeedbackType::kFileReceivingProgress: {
            auto progress = event.data.get<feedback::FileReceivingProgress>();
            spdlog::debug("{}: {} / {} bytes",
                          progress.filename,
                          progress.bytes_received,
                          progress.bytes_total);
            break;
        }
        case FeedbackType::kFileReceivingCompleted: {
            auto completed = event.data.get<feedback::FileReceivingCompleted>();
            terminal_.PrintInfo(fmt::format("Received {} -> {}",
                                            completed.filename,
                                            completed.saved_path));
            break;
        }
        case FeedbackType::kReceiveSessionEnded: {
            auto end = event.data.get<feedback::ReceiveSessionEnd>();
            if (end.completed()) {
                terminal_.PrintInfo(fmt::format("Session {} finished", end.session_id));
            } else if (end.cancelled_by_sender) {
                terminal_.PrintError(fmt::format("Session {} cancelled by sender", end.session_id));
            } else {
                terminal_.PrintError(
                    fmt::format("Session {} {}: {}", end.session_id, end.status, end.error));
            }
            break;
        }
        }
    } catch (const std::exception& e) {
        spdlog::warn("Unreadable feedback event: {}", e.what());
    }
}

void CliManager::printDeviceList(const std::vector<DeviceInfo>& devices) {
    if (devices.empty()) {
        terminal_.PrintInfo("No devices found");
        return;
    }
    terminal_.PrintInfo("Devices:");
    for (const auto& device : devices) {
        terminal_.PrintInfo(fmt::format("  {} | {} | {}://{}:{} | {}",
                                        device.alias,
                                        DeviceTypeToString(device.device_type),
                                        device.https ? "https" : "http",
                                        device.ip,
                                        device.port,
                                        device.fingerprint.substr(0, 16)));
    }
}

} // namespace lanbeam::cli
