#pragma once

#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lanbeam::core {

// Request target split into its path and percent-decoded query parameters.
struct RequestTarget {
    std::string path;
    std::map<std::string, std::string> params;

    std::optional<std::string> Param(std::string_view name) const;
};

RequestTarget ParseTarget(std::string_view target);

std::string PercentEncode(std::string_view value);
std::string PercentDecode(std::string_view value);

// Builds `path?k1=v1&k2=v2` with every value percent-encoded.
std::string BuildTarget(std::string_view path,
                        std::initializer_list<std::pair<std::string_view, std::string_view>> params);

} // namespace lanbeam::core
