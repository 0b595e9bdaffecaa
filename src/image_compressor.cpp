#include "image_compressor.hpp"
#include "errors.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <thread>

namespace blossom {

namespace {

// Byte size tracks pixel area, so the side length scales with the square
// root of the size ratio. 0.85 leaves room for encoder overhead.
constexpr double kInitialScaleMargin = 0.85;
constexpr int kInitialQuality = 85;

cv::Mat decode(const ImageBuffer& buffer) {
    cv::Mat raw(1, static_cast<int>(buffer.size()), CV_8UC1, const_cast<unsigned char*>(buffer.data()));
    cv::Mat image = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    if (image.empty()) {
        throw CompressionError("Cannot decode image (" + std::to_string(buffer.size()) + " bytes)");
    }
    return image;
}

// Scales by width, keeping aspect ratio. Never enlarges.
cv::Mat resize_by(const cv::Mat& image, double scale) {
    if (scale >= 1.0) {
        return image;
    }

    int width = std::max(1, static_cast<int>(std::lround(image.cols * scale)));
    int height = std::max(1, static_cast<int>(std::lround(
        static_cast<double>(image.rows) * width / image.cols)));

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(width, height), 0, 0, cv::INTER_AREA);
    return resized;
}

ImageBuffer read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw CompressionError("Cannot read image: " + path.string());
    }
    return ImageBuffer(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Artifacts only ever appear complete: the bytes go to a per-thread temp
// sibling that is renamed into place.
void write_file_atomically(const std::filesystem::path& path, const ImageBuffer& data) {
    std::ostringstream suffix;
    suffix << ".tmp." << std::this_thread::get_id();
    auto tmp = path;
    tmp += suffix.str();

    std::error_code ec;
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        file.close();
        if (!file) {
            std::filesystem::remove(tmp, ec);
            throw CompressionError("Cannot write compressed image: " + tmp.string());
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::string reason = ec.message();
        std::filesystem::remove(tmp, ec);
        throw CompressionError("Cannot store compressed image " + path.string() + ": " + reason);
    }
}

// Formats compress() can hand back for a source of the given type.
std::vector<MediaType> output_types(MediaType source_type) {
    switch (source_type) {
        case MediaType::Jpeg:
        case MediaType::Webp:
            return {MediaType::Jpeg};
        case MediaType::Png:
        case MediaType::Gif:
            return {MediaType::Png, MediaType::Jpeg};
    }
    return {MediaType::Jpeg};
}

size_t kb(size_t bytes) { return bytes / 1024; }

} // namespace

ImageBuffer OpenCvImageEncoder::encode(const cv::Mat& image, MediaType format, int quality) {
    ImageBuffer out;
    bool ok = false;

    switch (format) {
        case MediaType::Jpeg: {
            cv::Mat bgr = image;
            if (bgr.depth() != CV_8U) {
                bgr.convertTo(bgr, CV_8U, bgr.depth() == CV_16U ? 1.0 / 257.0 : 1.0);
            }
            if (bgr.channels() == 4) {
                cv::cvtColor(bgr, bgr, cv::COLOR_BGRA2BGR);
            }
            ok = cv::imencode(".jpg", bgr, out, {cv::IMWRITE_JPEG_QUALITY, quality});
            break;
        }
        case MediaType::Png:
            ok = cv::imencode(".png", image, out, {cv::IMWRITE_PNG_COMPRESSION, 9});
            break;
        case MediaType::Gif:
        case MediaType::Webp:
            throw CompressionError("Cannot encode " + to_mime(format));
    }

    if (!ok || out.empty()) {
        throw CompressionError("Failed to encode image as " + to_mime(format));
    }
    return out;
}

ImageCompressor::ImageCompressor()
    : encoder_(std::make_unique<OpenCvImageEncoder>()) {}

ImageCompressor::ImageCompressor(std::unique_ptr<ImageEncoder> encoder)
    : encoder_(std::move(encoder)) {}

const std::vector<CompressionAttempt>& ImageCompressor::ladder() {
    static const std::vector<CompressionAttempt> attempts = [] {
        const double scales[] = {0.7, 0.5, 0.4, 0.3, 0.2};
        const int qualities[] = {80, 70, 60, 50, 40};

        std::vector<CompressionAttempt> out;
        for (double scale : scales) {
            for (int quality : qualities) {
                out.push_back({scale, quality});
            }
        }
        return out;
    }();
    return attempts;
}

std::filesystem::path ImageCompressor::compressed_path(const std::filesystem::path& source,
                                                       MediaType final_type) {
    auto artifact = source;
    artifact += ".compressed." + extension_for(final_type);
    return artifact;
}

CompressionResult ImageCompressor::compress(const ImageBuffer& buffer,
                                            MediaType media_type,
                                            size_t size_limit) {
    CompressionResult result;
    if (buffer.size() <= size_limit) {
        result.buffer = buffer;
        result.media_type = media_type;
        return result;
    }

    std::cout << "Compressing " << to_mime(media_type) << " image: " << kb(buffer.size())
              << " KB, limit " << kb(size_limit) << " KB" << std::endl;

    const cv::Mat image = decode(buffer);
    result.was_compressed = true;

    const double initial_scale =
        std::sqrt(static_cast<double>(size_limit) / static_cast<double>(buffer.size())) * kInitialScaleMargin;

    Encoded encoded = try_compress(image, media_type, initial_scale, kInitialQuality, size_limit);
    if (encoded.buffer.size() <= size_limit) {
        result.buffer = std::move(encoded.buffer);
        result.media_type = encoded.media_type;
        return result;
    }

    for (const auto& attempt : ladder()) {
        encoded = try_compress(image, media_type, attempt.scale, attempt.quality, size_limit);
        if (encoded.buffer.size() <= size_limit) {
            result.buffer = std::move(encoded.buffer);
            result.media_type = encoded.media_type;
            return result;
        }
    }

    encoded = try_compress(image, media_type, kLastResort.scale, kLastResort.quality, size_limit);
    result.buffer = std::move(encoded.buffer);
    result.media_type = encoded.media_type;
    result.exceeded_limit = result.buffer.size() > size_limit;

    if (result.exceeded_limit) {
        std::cerr << "Warning: image still " << result.buffer.size() << " bytes after maximum compression (limit "
                  << size_limit << ")" << std::endl;
    }
    return result;
}

ImageCompressor::Encoded ImageCompressor::try_compress(const cv::Mat& image,
                                                       MediaType media_type,
                                                       double scale,
                                                       int quality,
                                                       size_t size_limit) {
    const cv::Mat scaled = resize_by(image, scale);

    switch (media_type) {
        case MediaType::Jpeg:
            return {encoder_->encode(scaled, MediaType::Jpeg, quality), MediaType::Jpeg};

        case MediaType::Png:
        case MediaType::Gif: {
            // PNG has no quality knob; GIF is flattened to a still PNG. Both
            // fall back to JPEG when lossless is still too big.
            ImageBuffer png = encoder_->encode(scaled, MediaType::Png, quality);
            if (png.size() <= size_limit) {
                return {std::move(png), MediaType::Png};
            }
            return {encoder_->encode(scaled, MediaType::Jpeg, quality), MediaType::Jpeg};
        }

        case MediaType::Webp:
            break;
    }

    return {encoder_->encode(scaled, MediaType::Jpeg, quality), MediaType::Jpeg};
}

std::optional<CompressionResult> ImageCompressor::load_cached(const std::filesystem::path& source,
                                                              size_t size_limit) const {
    const MediaType source_type = media_type_from_filename(source.filename().string());

    for (MediaType type : output_types(source_type)) {
        const auto candidate = compressed_path(source, type);
        std::error_code ec;
        if (!std::filesystem::is_regular_file(candidate, ec)) {
            continue;
        }

        CompressionResult cached;
        cached.buffer = read_file(candidate);
        cached.media_type = type;
        cached.was_compressed = true;
        cached.exceeded_limit = cached.buffer.size() > size_limit;
        return cached;
    }
    return std::nullopt;
}

CompressionResult ImageCompressor::compress_and_cache(const std::filesystem::path& source,
                                                      const ImageBuffer& original,
                                                      size_t size_limit) {
    const MediaType source_type = media_type_from_filename(source.filename().string());
    CompressionResult result = compress(original, source_type, size_limit);

    if (result.was_compressed) {
        auto artifact = compressed_path(source, result.media_type);
        write_file_atomically(artifact, result.buffer);
        std::cout << "Cached compressed image: " << artifact.string() << " (" << kb(original.size())
                  << " KB -> " << kb(result.buffer.size()) << " KB)" << std::endl;
    }
    return result;
}

CompressionResult ImageCompressor::compress_file(const std::filesystem::path& source, size_t size_limit) {
    if (auto cached = load_cached(source, size_limit)) {
        return *cached;
    }
    return compress_and_cache(source, read_file(source), size_limit);
}

std::optional<ImageForApi> ImageCompressor::prepare_for_api(const std::filesystem::path& source,
                                                            size_t size_limit) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return std::nullopt;
    }

    ImageForApi payload;

    if (auto cached = load_cached(source, size_limit)) {
        payload.base64 = base64_encode(cached->buffer);
        payload.media_type = cached->media_type;
        payload.was_compressed = true;
        payload.original_size = 0;
        payload.final_size = cached->buffer.size();
        return payload;
    }

    const ImageBuffer original = read_file(source);
    CompressionResult result = compress_and_cache(source, original, size_limit);

    payload.base64 = base64_encode(result.buffer);
    payload.media_type = result.media_type;
    payload.was_compressed = result.was_compressed;
    payload.original_size = original.size();
    payload.final_size = result.buffer.size();
    return payload;
}

} // namespace blossom
