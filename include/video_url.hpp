#pragma once

#include <optional>
#include <string>

namespace blossom {

// Extracts the video id from watch, youtu.be, embed and /v/ links.
std::optional<std::string> parse_video_url(const std::string& url);

// M:SS below an hour, H:MM:SS otherwise.
std::string format_timestamp(double seconds);

} // namespace blossom
