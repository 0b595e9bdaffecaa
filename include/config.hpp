#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace blossom {

struct MediaConfig {
    std::filesystem::path data_dir;               // empty = default_data_dir()
    std::chrono::minutes stream_url_ttl{5 * 60};
    std::chrono::seconds process_timeout{60};
    std::chrono::seconds download_timeout{300};
    int api_jpeg_quality = 5;                     // ffmpeg -q:v, 2..31
    size_t size_limit_bytes = 2 * 1024 * 1024;
};

// $BLOSSOM_DATA_DIR, else $HOME/.blossom, else ./.blossom.
std::filesystem::path default_data_dir();

// Reads a JSON object of overrides on top of the defaults. Unknown keys are
// ignored; a malformed file or a wrongly typed value throws std::runtime_error.
MediaConfig load_config(const std::filesystem::path& path);

// Applies environment overrides and fills in the default data directory.
void apply_environment(MediaConfig& config);

} // namespace blossom
