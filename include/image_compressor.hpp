#pragma once

#include "media_types.hpp"

#include <opencv2/opencv.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace blossom {

// Upstream API payload budget for a single image.
constexpr size_t kDefaultImageSizeLimit = 2 * 1024 * 1024;

class ImageEncoder {
public:
    virtual ~ImageEncoder() = default;

    // quality is 0-100 and only meaningful for JPEG. PNG is always written at
    // maximum compression.
    virtual ImageBuffer encode(const cv::Mat& image, MediaType format, int quality) = 0;
};

class OpenCvImageEncoder : public ImageEncoder {
public:
    ImageBuffer encode(const cv::Mat& image, MediaType format, int quality) override;
};

struct CompressionAttempt {
    double scale;
    int quality;
};

struct CompressionResult {
    ImageBuffer buffer;
    MediaType media_type = MediaType::Png;
    bool was_compressed = false;
    // Set when even the last-resort encode is larger than the limit; the
    // buffer is still the smallest encoding that was produced.
    bool exceeded_limit = false;
};

struct ImageForApi {
    std::string base64;
    MediaType media_type = MediaType::Png;
    bool was_compressed = false;
    size_t original_size = 0;   // 0 when served from the artifact cache
    size_t final_size = 0;
};

// Shrinks images below a byte budget with a deterministic resize/quality
// search, and caches the result next to the source file.
//
// The artifact cache is keyed by source path only. Sources are assumed to be
// immutable once written (extracted frames carry a unique name); replacing a
// file in place will keep serving the old artifact until it is deleted.
class ImageCompressor {
public:
    ImageCompressor();
    explicit ImageCompressor(std::unique_ptr<ImageEncoder> encoder);

    // Buffers already within the limit come back byte-identical.
    CompressionResult compress(const ImageBuffer& buffer,
                               MediaType media_type,
                               size_t size_limit = kDefaultImageSizeLimit);

    // compress() for a file, consulting and filling the artifact cache.
    CompressionResult compress_file(const std::filesystem::path& source,
                                    size_t size_limit = kDefaultImageSizeLimit);

    // Ready-to-send payload for the upstream API client; nullopt when the
    // source does not exist.
    std::optional<ImageForApi> prepare_for_api(const std::filesystem::path& source,
                                               size_t size_limit = kDefaultImageSizeLimit);

    // <source path>.compressed.<ext>, with <ext> naming the final format.
    static std::filesystem::path compressed_path(const std::filesystem::path& source,
                                                 MediaType final_type);

    // (scale, quality) pairs tried after the initial estimate, in order.
    static const std::vector<CompressionAttempt>& ladder();
    static constexpr CompressionAttempt kLastResort{0.15, 30};

private:
    struct Encoded {
        ImageBuffer buffer;
        MediaType media_type;
    };

    Encoded try_compress(const cv::Mat& image, MediaType media_type,
                         double scale, int quality, size_t size_limit);
    std::optional<CompressionResult> load_cached(const std::filesystem::path& source,
                                                 size_t size_limit) const;
    CompressionResult compress_and_cache(const std::filesystem::path& source,
                                         const ImageBuffer& original,
                                         size_t size_limit);

    std::unique_ptr<ImageEncoder> encoder_;
};

} // namespace blossom
