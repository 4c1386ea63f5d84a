#include <cctype>
#include <core/util/query_string.h>

namespace lanbeam::core {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

} // namespace

std::optional<std::string> RequestTarget::Param(std::string_view name) const {
    auto it = params.find(std::string(name));
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string PercentDecode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (std::size_t i = 0; i < value.size(); ++i) {
        char c = value[i];
        if (c == '+') {
            out.push_back(' ');
        } else if (c == '%' && i + 2 < value.size() && hexValue(value[i + 1]) >= 0
                   && hexValue(value[i + 2]) >= 0) {
            out.push_back(static_cast<char>(hexValue(value[i + 1]) * 16 + hexValue(value[i + 2])));
            i += 2;
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string PercentEncode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

RequestTarget ParseTarget(std::string_view target) {
    RequestTarget result;
    auto question = target.find('?');
    result.path = std::string(target.substr(0, question));
    if (question == std::string_view::npos) {
        return result;
    }

    std::string_view query = target.substr(question + 1);
    while (!query.empty()) {
        auto amp = query.find('&');
        std::string_view pair = query.substr(0, amp);
        query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        std::string key = PercentDecode(pair.substr(0, eq));
        std::string value = eq == std::string_view::npos ? std::string{}
                                                         : PercentDecode(pair.substr(eq + 1));
        // first occurrence wins
        result.params.emplace(std::move(key), std::move(value));
    }
    return result;
}

std::string BuildTarget(std::string_view path,
                        std::initializer_list<std::pair<std::string_view, std::string_view>> params) {
    std::string target(path);
    char separator = '?';
    for (const auto& [key, value] : params) {
        target.push_back(separator);
        target += PercentEncode(key);
        target.push_back('=');
        target += PercentEncode(value);
        separator = '&';
    }
    return target;
}

} // namespace lanbeam::core
