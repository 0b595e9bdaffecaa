#include "video_url.hpp"

#include <cmath>
#include <cstdio>
#include <regex>

namespace blossom {

std::optional<std::string> parse_video_url(const std::string& url) {
    static const std::regex patterns[] = {
        std::regex(R"(youtube\.com/watch\?v=([^&]+))"),
        std::regex(R"(youtu\.be/([^?]+))"),
        std::regex(R"(youtube\.com/embed/([^?]+))"),
        std::regex(R"(youtube\.com/v/([^?]+))"),
    };

    for (const auto& pattern : patterns) {
        std::smatch match;
        if (std::regex_search(url, match, pattern) && match[1].length() > 0) {
            return match[1].str();
        }
    }
    return std::nullopt;
}

std::string format_timestamp(double seconds) {
    long long total = seconds > 0 ? static_cast<long long>(std::floor(seconds)) : 0;
    long long hours = total / 3600;
    long long minutes = (total % 3600) / 60;
    long long secs = total % 60;

    char buffer[32];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%lld:%02lld:%02lld", hours, minutes, secs);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%lld:%02lld", minutes, secs);
    }
    return buffer;
}

} // namespace blossom
