#pragma once

#include "clock.hpp"
#include "media_types.hpp"

#include <filesystem>
#include <string>

namespace blossom {

// Extracted frames on disk: <data_dir>/frames/<videoId>-<timestampMs>-<createdAtMs>.png.
// Callers keep only the filename; frames are never rewritten in place.
class FrameStore {
public:
    FrameStore(std::filesystem::path data_dir, const Clock& clock);

    // Writes the frame and returns its filename (not the full path).
    std::string save(const std::string& video_id, double timestamp_seconds, const ImageBuffer& frame);

    ImageBuffer load(const std::string& filename) const;

    // Throws std::invalid_argument for names that would escape the frames directory.
    std::filesystem::path path_for(const std::string& filename) const;

    const std::filesystem::path& directory() const { return frames_dir_; }

private:
    std::filesystem::path frames_dir_;
    const Clock& clock_;
};

} // namespace blossom
