#pragma once

#include "media_types.hpp"
#include "stream_url_resolver.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace blossom {

class ProcessRunner;

enum class FrameQuality {
    Api,       // lossy JPEG, small, tunable quality
    Archival   // lossless PNG
};

enum class FailureKind {
    AuthorizationExpired,
    Other
};

using FailureClassifier = std::function<FailureKind(const std::string& stderr_text)>;

// Recognizes the HTTP 401/403 responses ffmpeg prints when a signed stream
// URL has gone stale.
FailureKind classify_failure(const std::string& stderr_text);

std::string to_string(FrameQuality quality);
QualityTier tier_for(FrameQuality quality);
MediaType media_type_for(FrameQuality quality);

struct FrameExtractorConfig {
    // ffmpeg -q:v scale, 2 (best) .. 31 (worst).
    int api_jpeg_quality = 5;
    std::chrono::milliseconds timeout = std::chrono::seconds(60);
    FailureClassifier classify = classify_failure;
};

class FrameExtractor {
public:
    FrameExtractor(ProcessRunner& runner,
                   StreamUrlResolver& resolver,
                   StreamUrlResolver::ProgramLocator transcoder_program,
                   FrameExtractorConfig config = {});
    ~FrameExtractor();

    // Grabs the single frame at timestamp_seconds. A failure classified as
    // authorization expiry invalidates the cached stream URL and retries once
    // with a fresh one; any other failure, or a failed retry, throws
    // ExtractionError carrying the transcoder's stderr.
    ImageBuffer extract_frame(const std::string& video_id,
                              double timestamp_seconds,
                              FrameQuality quality);

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace blossom
