#include "media_toolkit.hpp"
#include "clock.hpp"
#include "downloader.hpp"
#include "frame_store.hpp"
#include "process_runner.hpp"

#include <iostream>

namespace blossom {

namespace {

MediaConfig resolved(MediaConfig config) {
    if (config.data_dir.empty()) {
        config.data_dir = default_data_dir();
    }
    return config;
}

} // namespace

class MediaToolkit::Impl {
public:
    Impl(const MediaConfig& config,
         std::unique_ptr<ProcessRunner> owned_runner,
         std::unique_ptr<Downloader> owned_downloader,
         std::unique_ptr<Clock> owned_clock,
         ProcessRunner& runner,
         Downloader& downloader,
         const Clock& clock,
         PlatformKey platform)
        : config_(resolved(config))
        , owned_runner_(std::move(owned_runner))
        , owned_downloader_(std::move(owned_downloader))
        , owned_clock_(std::move(owned_clock))
        , provisioner_(config_.data_dir, platform, downloader, runner, config_.download_timeout)
        , video_tools_(provisioner_, video_tools)
        , image_library_(provisioner_, native_image_library)
        , resolver_(runner,
                    [this] { return video_tools_.path("yt-dlp").string(); },
                    clock,
                    std::chrono::duration_cast<std::chrono::seconds>(config_.stream_url_ttl),
                    config_.process_timeout)
        , extractor_(runner,
                     resolver_,
                     [this] { return video_tools_.path("ffmpeg").string(); },
                     extractor_config(config_))
        , frame_store_(config_.data_dir, clock) {}

    ProvisionReport provision_all() {
        ProvisionReport report;
        report.video_tools = video_tools_.paths();
        report.native_image_library = image_library_.paths();
        return report;
    }

    std::string resolve_stream_url(const std::string& video_id, QualityTier tier) {
        return resolver_.resolve(video_id, tier);
    }

    FrameCapture capture_frame(const std::string& video_id,
                               double timestamp_seconds,
                               FrameQuality quality,
                               const std::optional<CropRegion>& crop) {
        if (crop) {
            crop->validate();
        }

        FrameCapture capture;
        capture.bytes = extractor_.extract_frame(video_id, timestamp_seconds, quality);
        capture.media_type = media_type_for(quality);

        if (crop) {
            capture.bytes = cropper_.crop(capture.bytes, *crop);
        }
        return capture;
    }

    std::string save_frame(const std::string& video_id,
                           double timestamp_seconds,
                           const std::optional<CropRegion>& crop) {
        auto capture = capture_frame(video_id, timestamp_seconds, FrameQuality::Archival, crop);
        auto filename = frame_store_.save(video_id, timestamp_seconds, capture.bytes);
        std::cout << "Saved frame " << filename << " (" << capture.bytes.size() << " bytes)" << std::endl;
        return filename;
    }

    std::optional<ImageForApi> prepare_image_for_api(const std::filesystem::path& path) {
        return compressor_.prepare_for_api(path, config_.size_limit_bytes);
    }

    CompressionResult compress_file(const std::filesystem::path& path) {
        return compressor_.compress_file(path, config_.size_limit_bytes);
    }

    std::filesystem::path frame_path(const std::string& filename) const {
        return frame_store_.path_for(filename);
    }

    const MediaConfig& config() const { return config_; }

private:
    static FrameExtractorConfig extractor_config(const MediaConfig& config) {
        FrameExtractorConfig result;
        result.api_jpeg_quality = config.api_jpeg_quality;
        result.timeout = config.process_timeout;
        return result;
    }

    MediaConfig config_;
    std::unique_ptr<ProcessRunner> owned_runner_;
    std::unique_ptr<Downloader> owned_downloader_;
    std::unique_ptr<Clock> owned_clock_;

    AssetProvisioner provisioner_;
    ToolLocator video_tools_;
    ToolLocator image_library_;
    StreamUrlResolver resolver_;
    FrameExtractor extractor_;
    RegionCropper cropper_;
    ImageCompressor compressor_;
    FrameStore frame_store_;
};

namespace {

struct SystemServices {
    std::unique_ptr<ProcessRunner> runner = std::make_unique<SubprocessRunner>();
    std::unique_ptr<Downloader> downloader = std::make_unique<CurlDownloader>(*runner);
    std::unique_ptr<Clock> clock = std::make_unique<SystemClock>();
};

} // namespace

MediaToolkit::MediaToolkit(const MediaConfig& config) {
    SystemServices services;
    auto& runner = *services.runner;
    auto& downloader = *services.downloader;
    auto& clock = *services.clock;
    pimpl_ = std::make_unique<Impl>(config,
                                    std::move(services.runner),
                                    std::move(services.downloader),
                                    std::move(services.clock),
                                    runner, downloader, clock,
                                    host_platform());
}

MediaToolkit::MediaToolkit(const MediaConfig& config,
                           ProcessRunner& runner,
                           Downloader& downloader,
                           const Clock& clock,
                           PlatformKey platform)
    : pimpl_(std::make_unique<Impl>(config, nullptr, nullptr, nullptr,
                                    runner, downloader, clock, platform)) {}

MediaToolkit::~MediaToolkit() = default;

ProvisionReport MediaToolkit::provision_all() {
    return pimpl_->provision_all();
}

std::string MediaToolkit::resolve_stream_url(const std::string& video_id, QualityTier tier) {
    return pimpl_->resolve_stream_url(video_id, tier);
}

FrameCapture MediaToolkit::capture_frame(const std::string& video_id,
                                         double timestamp_seconds,
                                         FrameQuality quality,
                                         const std::optional<CropRegion>& crop) {
    return pimpl_->capture_frame(video_id, timestamp_seconds, quality, crop);
}

std::future<FrameCapture> MediaToolkit::capture_frame_async(const std::string& video_id,
                                                            double timestamp_seconds,
                                                            FrameQuality quality,
                                                            std::optional<CropRegion> crop) {
    // The toolkit must outlive the returned future.
    return std::async(std::launch::async, [this, video_id, timestamp_seconds, quality, crop] {
        return pimpl_->capture_frame(video_id, timestamp_seconds, quality, crop);
    });
}

std::string MediaToolkit::save_frame(const std::string& video_id,
                                     double timestamp_seconds,
                                     const std::optional<CropRegion>& crop) {
    return pimpl_->save_frame(video_id, timestamp_seconds, crop);
}

std::optional<ImageForApi> MediaToolkit::prepare_image_for_api(const std::filesystem::path& path) {
    return pimpl_->prepare_image_for_api(path);
}

CompressionResult MediaToolkit::compress_file(const std::filesystem::path& path) {
    return pimpl_->compress_file(path);
}

std::filesystem::path MediaToolkit::frame_path(const std::string& filename) const {
    return pimpl_->frame_path(filename);
}

const MediaConfig& MediaToolkit::config() const {
    return pimpl_->config();
}

} // namespace blossom
