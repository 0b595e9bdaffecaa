#include "config.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace blossom {

namespace {

template <typename T>
bool read_key(const json& doc, const char* key, T& out) {
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return false;
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("Invalid value for '") + key + "': " + e.what());
    }
    return true;
}

void require_positive(long long value, const char* key) {
    if (value <= 0) {
        throw std::runtime_error(std::string("'") + key + "' must be positive");
    }
}

} // namespace

std::filesystem::path default_data_dir() {
    if (const char* dir = std::getenv("BLOSSOM_DATA_DIR"); dir && *dir) {
        return dir;
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::filesystem::path(home) / ".blossom";
    }
    return ".blossom";
}

MediaConfig load_config(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open config file: " + path.string());
    }

    json doc = json::parse(file, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw std::runtime_error("Config file is not a JSON object: " + path.string());
    }

    MediaConfig config;

    std::string data_dir;
    if (read_key(doc, "data_dir", data_dir)) {
        config.data_dir = data_dir;
    }

    long long minutes = 0;
    if (read_key(doc, "stream_url_ttl_minutes", minutes)) {
        require_positive(minutes, "stream_url_ttl_minutes");
        config.stream_url_ttl = std::chrono::minutes(minutes);
    }

    long long seconds = 0;
    if (read_key(doc, "process_timeout_seconds", seconds)) {
        require_positive(seconds, "process_timeout_seconds");
        config.process_timeout = std::chrono::seconds(seconds);
    }
    if (read_key(doc, "download_timeout_seconds", seconds)) {
        require_positive(seconds, "download_timeout_seconds");
        config.download_timeout = std::chrono::seconds(seconds);
    }

    int quality = 0;
    if (read_key(doc, "api_jpeg_quality", quality)) {
        if (quality < 2 || quality > 31) {
            throw std::runtime_error("'api_jpeg_quality' must be between 2 and 31");
        }
        config.api_jpeg_quality = quality;
    }

    long long limit = 0;
    if (read_key(doc, "size_limit_bytes", limit)) {
        require_positive(limit, "size_limit_bytes");
        config.size_limit_bytes = static_cast<size_t>(limit);
    }

    return config;
}

void apply_environment(MediaConfig& config) {
    if (const char* dir = std::getenv("BLOSSOM_DATA_DIR"); dir && *dir) {
        config.data_dir = dir;
    }
    if (config.data_dir.empty()) {
        config.data_dir = default_data_dir();
    }
}

} // namespace blossom
