#include <cli/terminal.h>
#include <iostream>
#include <string>
#include <sys/select.h>
#include <unistd.h>

namespace lanbeam::cli {

bool Terminal::WaitForInput(std::chrono::milliseconds timeout) {
    if (input_closed_) {
        return false;
    }

    fd_set set;
    struct timeval tv;

    FD_ZERO(&set);
    FD_SET(STDIN_FILENO, &set);

    tv.tv_sec = static_cast<long>(timeout.count() / 1000);
    tv.tv_usec = static_cast<long>((timeout.count() % 1000) * 1000);

    return select(STDIN_FILENO + 1, &set, nullptr, nullptr, &tv) > 0;
}

std::optional<std::string> Terminal::ReadLine() {
    std::string line;
    if (!std::getline(std::cin, line)) {
        input_closed_ = true;
        return std::nullopt;
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

void Terminal::PrintInfo(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "\033[32m[INFO] " << message << "\033[0m" << std::endl;
}

void Terminal::PrintError(const std::string& message) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cerr << "\033[31m[ERROR] " << message << "\033[0m" << std::endl;
}

void Terminal::PrintPrompt(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << prompt;
    std::cout.flush();
}

void Terminal::Overwrite(const std::string& text) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "\r\033[K" << text << std::flush;
}

} // namespace lanbeam::cli
