#include "media_types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace blossom {

std::string to_mime(MediaType type) {
    return "image/" + extension_for(type);
}

std::string extension_for(MediaType type) {
    switch (type) {
        case MediaType::Jpeg: return "jpeg";
        case MediaType::Png:  return "png";
        case MediaType::Gif:  return "gif";
        case MediaType::Webp: return "webp";
    }
    return "png";
}

MediaType media_type_from_filename(const std::string& filename) {
    auto dot = filename.find_last_of('.');
    if (dot == std::string::npos) {
        return MediaType::Png;
    }

    std::string ext = filename.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (ext == "jpg" || ext == "jpeg") return MediaType::Jpeg;
    if (ext == "gif") return MediaType::Gif;
    if (ext == "webp") return MediaType::Webp;
    return MediaType::Png;
}

MediaType media_type_from_mime(const std::string& mime) {
    if (mime == "image/jpeg" || mime == "image/jpg") return MediaType::Jpeg;
    if (mime == "image/png") return MediaType::Png;
    if (mime == "image/gif") return MediaType::Gif;
    if (mime == "image/webp") return MediaType::Webp;
    throw std::invalid_argument("Unsupported media type: " + mime);
}

bool detect_media_type(const ImageBuffer& buffer, MediaType& out) {
    static const unsigned char png_sig[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    if (buffer.size() >= 8 && std::equal(std::begin(png_sig), std::end(png_sig), buffer.begin())) {
        out = MediaType::Png;
        return true;
    }
    if (buffer.size() >= 3 && buffer[0] == 0xFF && buffer[1] == 0xD8 && buffer[2] == 0xFF) {
        out = MediaType::Jpeg;
        return true;
    }
    if (buffer.size() >= 6 && buffer[0] == 'G' && buffer[1] == 'I' && buffer[2] == 'F' &&
        buffer[3] == '8' && (buffer[4] == '7' || buffer[4] == '9') && buffer[5] == 'a') {
        out = MediaType::Gif;
        return true;
    }
    if (buffer.size() >= 12 && buffer[0] == 'R' && buffer[1] == 'I' && buffer[2] == 'F' &&
        buffer[3] == 'F' && buffer[8] == 'W' && buffer[9] == 'E' && buffer[10] == 'B' &&
        buffer[11] == 'P') {
        out = MediaType::Webp;
        return true;
    }
    return false;
}

std::string base64_encode(const ImageBuffer& data) {
    static const char table[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    std::string out;
    out.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    for (; i + 2 < data.size(); i += 3) {
        unsigned int n = (data[i] << 16) | (data[i + 1] << 8) | data[i + 2];
        out.push_back(table[(n >> 18) & 0x3F]);
        out.push_back(table[(n >> 12) & 0x3F]);
        out.push_back(table[(n >> 6) & 0x3F]);
        out.push_back(table[n & 0x3F]);
    }

    size_t rest = data.size() - i;
    if (rest == 1) {
        unsigned int n = data[i] << 16;
        out.push_back(table[(n >> 18) & 0x3F]);
        out.push_back(table[(n >> 12) & 0x3F]);
        out.append("==");
    } else if (rest == 2) {
        unsigned int n = (data[i] << 16) | (data[i + 1] << 8);
        out.push_back(table[(n >> 18) & 0x3F]);
        out.push_back(table[(n >> 12) & 0x3F]);
        out.push_back(table[(n >> 6) & 0x3F]);
        out.push_back('=');
    }

    return out;
}

} // namespace blossom
