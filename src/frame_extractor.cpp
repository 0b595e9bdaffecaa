#include "frame_extractor.hpp"
#include "errors.hpp"
#include "process_runner.hpp"

#include <cmath>
#include <iomanip>
#include <iostream>
#include <locale>
#include <sstream>
#include <stdexcept>

namespace blossom {

FailureKind classify_failure(const std::string& stderr_text) {
    static const char* const signatures[] = {
        "403 Forbidden",
        "401 Unauthorized",
        "Server returned 403",
        "Server returned 401",
        "HTTP error 403",
        "HTTP error 401",
    };

    for (const char* signature : signatures) {
        if (stderr_text.find(signature) != std::string::npos) {
            return FailureKind::AuthorizationExpired;
        }
    }
    return FailureKind::Other;
}

std::string to_string(FrameQuality quality) {
    switch (quality) {
        case FrameQuality::Api:      return "api";
        case FrameQuality::Archival: return "archival";
    }
    return "api";
}

QualityTier tier_for(FrameQuality quality) {
    switch (quality) {
        case FrameQuality::Api:      return QualityTier::Api;
        case FrameQuality::Archival: return QualityTier::Archival;
    }
    return QualityTier::Api;
}

MediaType media_type_for(FrameQuality quality) {
    switch (quality) {
        case FrameQuality::Api:      return MediaType::Jpeg;
        case FrameQuality::Archival: return MediaType::Png;
    }
    return MediaType::Png;
}

class FrameExtractor::Impl {
public:
    Impl(ProcessRunner& runner,
         StreamUrlResolver& resolver,
         StreamUrlResolver::ProgramLocator transcoder_program,
         FrameExtractorConfig config)
        : runner_(runner)
        , resolver_(resolver)
        , transcoder_program_(std::move(transcoder_program))
        , config_(std::move(config)) {}

    ImageBuffer extract(const std::string& video_id, double timestamp_seconds, FrameQuality quality) {
        if (!std::isfinite(timestamp_seconds) || timestamp_seconds < 0) {
            throw std::invalid_argument("timestamp must be a non-negative number of seconds");
        }

        try {
            return attempt(video_id, timestamp_seconds, quality);
        } catch (const AuthorizationExpiredError&) {
            std::cout << "Stream URL for " << video_id
                      << " was rejected, resolving a fresh one and retrying" << std::endl;
            resolver_.invalidate(video_id, tier_for(quality));
        }

        return attempt(video_id, timestamp_seconds, quality);
    }

private:
    ImageBuffer attempt(const std::string& video_id, double timestamp_seconds, FrameQuality quality) {
        const std::string transcoder = transcoder_program_();
        const std::string stream_url = resolver_.resolve(video_id, tier_for(quality));

        auto argv = build_command(transcoder, stream_url, timestamp_seconds, quality);

        ProcessResult result;
        try {
            result = runner_.run(argv, config_.timeout);
        } catch (const ProcessError& e) {
            throw ExtractionError("Failed to extract frame: " + std::string(e.what()));
        }

        if (result.succeeded() && !result.stdout_data.empty()) {
            return ImageBuffer(result.stdout_data.begin(), result.stdout_data.end());
        }

        std::string detail;
        if (!result.stderr_data.empty()) {
            detail = result.stderr_data;
        } else if (result.timed_out) {
            detail = "timed out";
        } else if (result.exit_code == 0) {
            detail = "transcoder produced no output";
        } else {
            detail = "Unknown error";
        }

        const std::string message = "Failed to extract frame: " + detail;
        if (!result.timed_out && config_.classify(result.stderr_data) == FailureKind::AuthorizationExpired) {
            throw AuthorizationExpiredError(message);
        }
        throw ExtractionError(message);
    }

    // Seeking before -i makes ffmpeg jump on the input side instead of
    // decoding everything up to the timestamp.
    std::vector<std::string> build_command(const std::string& transcoder,
                                           const std::string& stream_url,
                                           double timestamp_seconds,
                                           FrameQuality quality) const {
        std::vector<std::string> argv = {
            transcoder,
            "-hide_banner",
            "-loglevel", "error",
            "-ss", format_seconds(timestamp_seconds),
            "-i", stream_url,
            "-frames:v", "1",
            "-f", "image2pipe",
        };

        switch (quality) {
            case FrameQuality::Archival:
                argv.insert(argv.end(), {"-vcodec", "png"});
                break;
            case FrameQuality::Api:
                argv.insert(argv.end(), {"-vcodec", "mjpeg", "-q:v", std::to_string(config_.api_jpeg_quality)});
                break;
        }

        argv.push_back("-");
        return argv;
    }

    static std::string format_seconds(double seconds) {
        std::ostringstream out;
        out.imbue(std::locale::classic());
        out << std::fixed << std::setprecision(3) << seconds;
        return out.str();
    }

    ProcessRunner& runner_;
    StreamUrlResolver& resolver_;
    StreamUrlResolver::ProgramLocator transcoder_program_;
    FrameExtractorConfig config_;
};

FrameExtractor::FrameExtractor(ProcessRunner& runner,
                               StreamUrlResolver& resolver,
                               StreamUrlResolver::ProgramLocator transcoder_program,
                               FrameExtractorConfig config)
    : pimpl_(std::make_unique<Impl>(runner, resolver, std::move(transcoder_program), std::move(config))) {}

FrameExtractor::~FrameExtractor() = default;

ImageBuffer FrameExtractor::extract_frame(const std::string& video_id,
                                          double timestamp_seconds,
                                          FrameQuality quality) {
    return pimpl_->extract(video_id, timestamp_seconds, quality);
}

} // namespace blossom
