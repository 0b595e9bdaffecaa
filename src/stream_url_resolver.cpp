#include "stream_url_resolver.hpp"
#include "errors.hpp"
#include "process_runner.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>

namespace blossom {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

std::string first_line(const std::string& output) {
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        line = trim(line);
        if (!line.empty()) {
            return line;
        }
    }
    return {};
}

} // namespace

std::string to_string(QualityTier tier) {
    switch (tier) {
        case QualityTier::Api:      return "api";
        case QualityTier::Archival: return "archival";
    }
    return "api";
}

std::string format_selector(QualityTier tier) {
    switch (tier) {
        case QualityTier::Api:      return "best[height<=720]";
        case QualityTier::Archival: return "best[height<=1080]";
    }
    return "best[height<=720]";
}

// ------------------------------------------------------------
// StreamUrlCache
// ------------------------------------------------------------

StreamUrlCache::StreamUrlCache(const Clock& clock, std::chrono::seconds ttl)
    : clock_(clock), ttl_(ttl) {}

std::optional<std::string> StreamUrlCache::get(const std::string& video_id, QualityTier tier) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find({video_id, tier});
    if (it == entries_.end() || !(clock_.now() < it->second.expires_at)) {
        return std::nullopt;
    }
    return it->second.url;
}

void StreamUrlCache::put(const std::string& video_id, QualityTier tier, std::string url) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[{video_id, tier}] = StreamUrlCacheEntry{std::move(url), clock_.now() + ttl_};
}

void StreamUrlCache::erase(const std::string& video_id, QualityTier tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase({video_id, tier});
}

size_t StreamUrlCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ------------------------------------------------------------
// StreamUrlResolver
// ------------------------------------------------------------

StreamUrlResolver::StreamUrlResolver(ProcessRunner& runner,
                                     ProgramLocator resolver_program,
                                     const Clock& clock,
                                     std::chrono::seconds ttl,
                                     std::chrono::milliseconds timeout)
    : runner_(runner)
    , resolver_program_(std::move(resolver_program))
    , cache_(clock, ttl)
    , timeout_(timeout) {}

std::string StreamUrlResolver::resolve(const std::string& video_id, QualityTier tier) {
    if (video_id.empty()) {
        throw std::invalid_argument("video id must not be empty");
    }

    if (auto cached = cache_.get(video_id, tier)) {
        return *cached;
    }

    std::string url = resolve_uncached(video_id, tier);
    cache_.put(video_id, tier, url);
    return url;
}

void StreamUrlResolver::invalidate(const std::string& video_id, QualityTier tier) {
    cache_.erase(video_id, tier);
}

std::string StreamUrlResolver::resolve_uncached(const std::string& video_id, QualityTier tier) {
    const std::string program = resolver_program_();
    const std::vector<std::string> argv = {
        program,
        "-g",
        "--no-warnings",
        "--no-playlist",
        "-f", format_selector(tier),
        "https://www.youtube.com/watch?v=" + video_id,
    };

    ProcessResult result;
    try {
        result = runner_.run(argv, timeout_);
    } catch (const ProcessError& e) {
        throw ResolutionError("Failed to get video stream URL: " + std::string(e.what()));
    }

    std::string url = first_line(result.stdout_data);
    if (!result.succeeded() || url.empty()) {
        std::string detail = result.stderr_data.empty()
            ? (result.timed_out ? "timed out" : "Unknown error")
            : result.stderr_data;
        throw ResolutionError("Failed to get video stream URL: " + detail);
    }

    std::cout << "Resolved " << to_string(tier) << " stream for " << video_id << std::endl;
    return url;
}

} // namespace blossom
