#pragma once

#include "clock.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace blossom {

class ProcessRunner;

enum class QualityTier {
    Api,       // capped resolution, small payloads
    Archival   // higher resolution for stored frames
};

std::string to_string(QualityTier tier);

// yt-dlp format selector for a tier.
std::string format_selector(QualityTier tier);

struct StreamUrlCacheEntry {
    std::string url;
    Clock::time_point expires_at;
};

// Signed stream URLs keyed by (video id, tier). Entries are usable while
// now < expires_at. Writers race freely; the last put wins.
class StreamUrlCache {
public:
    StreamUrlCache(const Clock& clock, std::chrono::seconds ttl);

    std::optional<std::string> get(const std::string& video_id, QualityTier tier) const;
    void put(const std::string& video_id, QualityTier tier, std::string url);
    void erase(const std::string& video_id, QualityTier tier);
    size_t size() const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    using Key = std::pair<std::string, QualityTier>;

    const Clock& clock_;
    std::chrono::seconds ttl_;
    mutable std::mutex mutex_;
    std::map<Key, StreamUrlCacheEntry> entries_;
};

class StreamUrlResolver {
public:
    // Returns the resolver program path; called only on cache misses, so the
    // binary is provisioned lazily.
    using ProgramLocator = std::function<std::string()>;

    static constexpr std::chrono::seconds kDefaultTtl = std::chrono::hours(5);

    StreamUrlResolver(ProcessRunner& runner,
                      ProgramLocator resolver_program,
                      const Clock& clock,
                      std::chrono::seconds ttl = kDefaultTtl,
                      std::chrono::milliseconds timeout = std::chrono::seconds(60));

    // Cached URL while fresh; otherwise spawns the resolver. Throws
    // ResolutionError with the resolver's stderr on failure.
    std::string resolve(const std::string& video_id, QualityTier tier);

    // Drops the cached URL so the next resolve() spawns again.
    void invalidate(const std::string& video_id, QualityTier tier);

    const StreamUrlCache& cache() const { return cache_; }

private:
    std::string resolve_uncached(const std::string& video_id, QualityTier tier);

    ProcessRunner& runner_;
    ProgramLocator resolver_program_;
    StreamUrlCache cache_;
    std::chrono::milliseconds timeout_;
};

} // namespace blossom
