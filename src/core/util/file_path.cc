#include <charconv>
#include <core/util/file_path.h>
#include <cstdint>
#include <limits>
#include <regex>
#include <string>

namespace fs = std::filesystem;

namespace lanbeam::core {

bool IsSafeRelativeName(std::string_view name) {
    if (name.empty() || name.front() == '/' || name.find('\\') != std::string_view::npos
        || name.find('\0') != std::string_view::npos) {
        return false;
    }
    fs::path path{std::string(name)};
    if (path.is_absolute() || path.has_root_name() || path.has_root_directory()) {
        return false;
    }

    std::string_view rest = name;
    while (true) {
        auto slash = rest.find('/');
        std::string_view component = rest.substr(0, slash);
        if (component.empty() || component == "." || component == "..") {
            return false;
        }
        if (slash == std::string_view::npos) {
            return true;
        }
        rest = rest.substr(slash + 1);
    }
}

fs::path UniqueDestination(const fs::path& dir, std::string_view name) {
    fs::path candidate = dir / fs::path(std::string(name));
    std::error_code ec;
    if (!fs::exists(candidate, ec)) {
        return candidate;
    }

    fs::path parent = candidate.parent_path();
    std::string stem = candidate.stem().string();
    std::string ext = candidate.extension().string();
    uint64_t counter = 1;

    // continue "name (n)" instead of producing "name (n) (1)"
    static const std::regex pattern(R"((.*) \((\d+)\)$)");
    std::smatch matches;
    if (std::regex_match(stem, matches, pattern)) {
        const std::string digits = matches[2].str();
        uint64_t previous = 0;
        auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), previous);
        // an unrepresentable counter stays part of the stem
        if (ec == std::errc() && end == digits.data() + digits.size()
            && previous < std::numeric_limits<uint64_t>::max()) {
            stem = matches[1].str();
            counter = previous + 1;
        }
    }

    do {
        candidate = parent / (stem + " (" + std::to_string(counter) + ")" + ext);
        ++counter;
    } while (fs::exists(candidate, ec));
    return candidate;
}

} // namespace lanbeam::core
