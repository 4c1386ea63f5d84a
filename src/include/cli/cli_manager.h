#pragma once

#include "argument_parser.h"
#include "terminal.h"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <chrono>
#include <core/model.h>
#include <core/network/discovery/device_registry.h>
#include <core/network/discovery/discovery_manager.h>
#include <core/network/server/decision_provider.h>
#include <core/security/certificate_manager.h>
#include <core/util/config.h>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace lanbeam::cli {

// Runs one command line invocation: owns the io thread, this device's
// identity and the discovery loop, and drives the core components for the
// chosen command.
class CliManager {
public:
    explicit CliManager(core::Settings settings);
    ~CliManager();

    CliManager(const CliManager&) = delete;
    CliManager& operator=(const CliManager&) = delete;

    // Returns the process exit code.
    int Run(const CliOptions& options);

private:
    int handleReceive();
    int handleList(std::chrono::seconds wait);
    int handleSend(const CliOptions& options, std::chrono::seconds wait);

    bool initIdentity();
    bool startDiscovery();
    void startIoThread();
    void shutdown(std::function<void()> stop_components = nullptr);

    std::optional<core::DeviceInfo> waitForPeer(const std::optional<std::string>& alias,
                                                std::chrono::seconds wait);
    void answerPrompt(core::PromptDecisionProvider& prompt, const std::string& answer);
    void onPrompt(const core::PromptDecisionProvider::PendingRequest& request);
    void onFeedback(const core::Feedback& feedback);
    void printDeviceList(const std::vector<core::DeviceInfo>& devices);

    core::Settings settings_;
    boost::asio::io_context ioc_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
    boost::asio::signal_set signals_;
    std::thread io_thread_;
    std::atomic<bool> stopping_{false};

    Terminal terminal_;
    std::unique_ptr<core::CertificateManager> cert_manager_;
    core::DeviceInfo local_device_;
    core::DeviceRegistry registry_;
    std::unique_ptr<core::DiscoveryManager> discovery_;

    std::mutex prompt_mutex_;
    std::deque<core::PromptDecisionProvider::PendingRequest> prompts_;
};

} // namespace lanbeam::cli
