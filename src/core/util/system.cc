#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/ip/udp.hpp>
#include <core/util/system.h>
#include <cstdio>
#include <cstring>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <string>
#if defined(__APPLE__) || defined(__MACH__)
#include <errno.h>
#include <sys/sysctl.h>
#endif

namespace lanbeam::core {

namespace system {

namespace {

constexpr auto kArchitecture =
#if defined(__x86_64__) || defined(_M_X64)
    "x86_64";
#elif defined(__i386__) || defined(_M_IX86)
    "x86";
#elif defined(__aarch64__) || defined(__arm64__) || defined(_M_ARM64)
    "aarch64";
#elif defined(__arm__) || defined(_M_ARM)
    "arm";
#else
    "Unknown";
#endif

} // namespace

std::string Hostname() {
    std::string hostname;
    try {
        hostname = boost::asio::ip::host_name();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to read hostname: {}", e.what());
        return "lanbeam";
    }
    for (std::string_view suffix : {".local", ".localdomain", ".domain"}) {
        if (hostname.ends_with(suffix)) {
            hostname.resize(hostname.size() - suffix.size());
            break;
        }
    }
    return hostname;
}

std::string LocalIpv4Address() {
    try {
        namespace net = boost::asio;
        net::io_context io_context;
        net::ip::udp::socket socket(io_context);

        // connecting a datagram socket only selects a route, nothing is sent
        socket.connect(net::ip::udp::endpoint(net::ip::make_address_v4("8.8.8.8"), 53));
        return socket.local_endpoint().address().to_string();
    } catch (const std::exception& e) {
        spdlog::warn("Failed to get local IPv4 address: {}", e.what());
        return "127.0.0.1";
    }
}

std::string OperatingSystem() {
#if defined(__APPLE__) || defined(__MACH__)
    char os_temp[20] = "";
    size_t os_temp_len = sizeof(os_temp);
    if (sysctlbyname("kern.osproductversion", os_temp, &os_temp_len, NULL, 0) == 0) {
        return fmt::format("macOS {} ({})", os_temp, kArchitecture);
    }
    spdlog::error("sysctlbyname failed: {}", strerror(errno));
    return fmt::format("macOS ({})", kArchitecture);
#elif defined(__linux__)
    std::string pretty_name;
    if (FILE* file = std::fopen("/etc/os-release", "r")) {
        char line[256];
        while (std::fgets(line, sizeof(line), file)) {
            if (std::strncmp(line, "PRETTY_NAME=", 12) == 0) {
                pretty_name = line + 12;
                while (!pretty_name.empty()
                       && (pretty_name.back() == '\n' || pretty_name.back() == '"')) {
                    pretty_name.pop_back();
                }
                if (!pretty_name.empty() && pretty_name.front() == '"') {
                    pretty_name.erase(0, 1);
                }
                break;
            }
        }
        std::fclose(file);
    }
    if (pretty_name.empty()) {
        return fmt::format("Linux ({})", kArchitecture);
    }
    return fmt::format("{} ({})", pretty_name, kArchitecture);
#elif defined(_WIN32) || defined(_WIN64)
    return fmt::format("Windows ({})", kArchitecture);
#else
    return fmt::format("Unknown OS ({})", kArchitecture);
#endif
}

std::string DeviceModel() {
#if defined(__APPLE__) || defined(__MACH__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#elif defined(_WIN32) || defined(_WIN64)
    return "Windows";
#elif defined(__FreeBSD__)
    return "FreeBSD";
#else
    return "Unknown";
#endif
}

} // namespace system

} // namespace lanbeam::core
