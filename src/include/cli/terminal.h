#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace lanbeam::cli {

// Line oriented console I/O shared by the io thread and the main thread.
class Terminal {
public:
    void PrintInfo(const std::string& message);
    void PrintError(const std::string& message);
    void PrintPrompt(const std::string& prompt = "> ");

    // Writes `text` over the current line without a newline.
    void Overwrite(const std::string& text);

    // True when a line can be read from stdin without blocking, waiting at
    // most `timeout`.
    bool WaitForInput(std::chrono::milliseconds timeout);

    // std::nullopt once stdin is closed.
    std::optional<std::string> ReadLine();

    bool input_closed() const { return input_closed_; }

private:
    std::mutex output_mutex_;
    bool input_closed_ = false;
};

} // namespace lanbeam::cli
