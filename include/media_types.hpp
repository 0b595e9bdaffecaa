#pragma once

#include <string>
#include <vector>

namespace blossom {

using ImageBuffer = std::vector<unsigned char>;

enum class MediaType {
    Jpeg,
    Png,
    Gif,
    Webp
};

// "image/jpeg", "image/png", ...
std::string to_mime(MediaType type);

// File extension without the dot: "jpeg", "png", "gif", "webp".
std::string extension_for(MediaType type);

// Maps a filename's extension to a media type; unknown extensions are PNG.
MediaType media_type_from_filename(const std::string& filename);

// Parses "image/..." strings. Throws std::invalid_argument on anything else.
MediaType media_type_from_mime(const std::string& mime);

// Sniffs magic bytes. Returns false when the buffer matches no known format.
bool detect_media_type(const ImageBuffer& buffer, MediaType& out);

std::string base64_encode(const ImageBuffer& data);

} // namespace blossom
