#include "frame_store.hpp"

#include <cmath>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace blossom {

FrameStore::FrameStore(std::filesystem::path data_dir, const Clock& clock)
    : frames_dir_(std::move(data_dir) / "frames"), clock_(clock) {}

std::string FrameStore::save(const std::string& video_id, double timestamp_seconds, const ImageBuffer& frame) {
    MediaType type;
    if (!detect_media_type(frame, type) || type != MediaType::Png) {
        throw std::invalid_argument("Stored frames must be PNG images");
    }

    const long long timestamp_ms = std::llround(timestamp_seconds * 1000.0);
    const long long created_at_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_.now().time_since_epoch()).count();

    const std::string filename =
        video_id + "-" + std::to_string(timestamp_ms) + "-" + std::to_string(created_at_ms) + ".png";
    const auto path = path_for(filename);

    std::filesystem::create_directories(frames_dir_);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(frame.data()), static_cast<std::streamsize>(frame.size()));
    if (!file.good()) {
        throw std::runtime_error("Failed to write frame: " + path.string());
    }
    return filename;
}

ImageBuffer FrameStore::load(const std::string& filename) const {
    const auto path = path_for(filename);
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Frame not found: " + filename);
    }
    return ImageBuffer(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::filesystem::path FrameStore::path_for(const std::string& filename) const {
    if (filename.empty() || filename == "." || filename == ".." ||
        filename.find('/') != std::string::npos || filename.find('\\') != std::string::npos) {
        throw std::invalid_argument("Invalid frame filename: " + filename);
    }
    return frames_dir_ / filename;
}

} // namespace blossom
