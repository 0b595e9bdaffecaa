#pragma once

#include "asset_provisioner.hpp"
#include "config.hpp"
#include "frame_extractor.hpp"
#include "image_compressor.hpp"
#include "media_types.hpp"
#include "platform.hpp"
#include "region_cropper.hpp"
#include "stream_url_resolver.hpp"

#include <filesystem>
#include <future>
#include <memory>
#include <optional>
#include <string>

namespace blossom {

class Clock;
class Downloader;
class ProcessRunner;

struct FrameCapture {
    ImageBuffer bytes;
    MediaType media_type = MediaType::Png;
};

struct ProvisionReport {
    ToolPaths video_tools;
    ToolPaths native_image_library;
};

// Application-facing entry point: provisions the external tools on demand and
// runs the capture/crop/compress pipeline on top of them.
class MediaToolkit {
public:
    explicit MediaToolkit(const MediaConfig& config = {});

    // Uses the given collaborators instead of real processes, network and time.
    MediaToolkit(const MediaConfig& config,
                 ProcessRunner& runner,
                 Downloader& downloader,
                 const Clock& clock,
                 PlatformKey platform);
    ~MediaToolkit();

    ProvisionReport provision_all();

    std::string resolve_stream_url(const std::string& video_id, QualityTier tier);

    // The crop, when given, is applied to the captured frame and keeps its
    // format: API frames stay JPEG, archival frames stay PNG.
    FrameCapture capture_frame(const std::string& video_id,
                               double timestamp_seconds,
                               FrameQuality quality,
                               const std::optional<CropRegion>& crop = std::nullopt);

    std::future<FrameCapture> capture_frame_async(const std::string& video_id,
                                                  double timestamp_seconds,
                                                  FrameQuality quality,
                                                  std::optional<CropRegion> crop = std::nullopt);

    // Captures a lossless frame into the frame store and returns its filename.
    std::string save_frame(const std::string& video_id,
                           double timestamp_seconds,
                           const std::optional<CropRegion>& crop = std::nullopt);

    std::optional<ImageForApi> prepare_image_for_api(const std::filesystem::path& path);

    CompressionResult compress_file(const std::filesystem::path& path);

    std::filesystem::path frame_path(const std::string& filename) const;

    const MediaConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pimpl_;
};

} // namespace blossom
