#include "archive.hpp"
#include "errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>

namespace blossom {

namespace {

constexpr size_t kBlockSize = 512;

std::string field_string(const unsigned char* field, size_t length) {
    const auto* begin = reinterpret_cast<const char*>(field);
    const auto* end = static_cast<const char*>(std::memchr(begin, '\0', length));
    return std::string(begin, end ? end : begin + length);
}

size_t parse_octal(const unsigned char* field, size_t length) {
    size_t value = 0;
    for (size_t i = 0; i < length; ++i) {
        unsigned char c = field[i];
        if (c == ' ' || c == '\0') {
            if (value != 0) break;
            continue;
        }
        if (c < '0' || c > '7') {
            throw ProvisioningError("Corrupt tar header: bad size field");
        }
        value = value * 8 + static_cast<size_t>(c - '0');
    }
    return value;
}

std::string normalize_member(std::string name) {
    while (name.compare(0, 2, "./") == 0) {
        name.erase(0, 2);
    }
    return name;
}

// pax extended header: "<len> path=<value>\n" records.
std::string pax_path(const unsigned char* data, size_t size) {
    std::string records(reinterpret_cast<const char*>(data), size);
    size_t pos = 0;
    while (pos < records.size()) {
        size_t space = records.find(' ', pos);
        if (space == std::string::npos) break;
        size_t record_len = std::strtoul(records.c_str() + pos, nullptr, 10);
        if (record_len == 0 || pos + record_len > records.size()) break;

        std::string record = records.substr(space + 1, pos + record_len - space - 2);
        if (record.compare(0, 5, "path=") == 0) {
            return record.substr(5);
        }
        pos += record_len;
    }
    return {};
}

} // namespace

Bytes gunzip(const Bytes& compressed) {
    if (compressed.empty()) {
        throw ProvisioningError("Cannot decompress an empty gzip stream");
    }

    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));
    // 16 + MAX_WBITS selects the gzip wrapper.
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
        throw ProvisioningError("inflateInit2 failed");
    }

    stream.next_in = const_cast<Bytef*>(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());

    Bytes out;
    unsigned char chunk[65536];
    int status = Z_OK;

    while (status != Z_STREAM_END) {
        stream.next_out = chunk;
        stream.avail_out = sizeof(chunk);

        status = inflate(&stream, Z_NO_FLUSH);
        if (status != Z_OK && status != Z_STREAM_END) {
            std::string msg = stream.msg ? std::string(stream.msg) : "error " + std::to_string(status);
            inflateEnd(&stream);
            throw ProvisioningError("Failed to decompress gzip data: " + msg);
        }

        out.insert(out.end(), chunk, chunk + (sizeof(chunk) - stream.avail_out));

        if (status == Z_OK && stream.avail_in == 0 && stream.avail_out != 0) {
            inflateEnd(&stream);
            throw ProvisioningError("Failed to decompress gzip data: truncated stream");
        }
    }

    inflateEnd(&stream);
    return out;
}

Bytes extract_tar_member(const Bytes& tar, const std::string& member_path) {
    const std::string wanted = normalize_member(member_path);
    std::string pending_name;

    size_t offset = 0;
    while (offset + kBlockSize <= tar.size()) {
        const unsigned char* header = tar.data() + offset;

        if (std::all_of(header, header + kBlockSize, [](unsigned char c) { return c == 0; })) {
            break;
        }

        std::string name = field_string(header, 100);
        const std::string magic = field_string(header + 257, 6);
        if (magic == "ustar") {
            std::string prefix = field_string(header + 345, 155);
            if (!prefix.empty()) {
                name = prefix + "/" + name;
            }
        }

        const size_t size = parse_octal(header + 124, 12);
        const char type = static_cast<char>(header[156]);
        const size_t data_offset = offset + kBlockSize;

        if (data_offset + size > tar.size()) {
            throw ProvisioningError("Truncated tar archive while reading " + name);
        }
        const unsigned char* data = tar.data() + data_offset;

        if (type == 'L') {
            pending_name = field_string(data, size);
        } else if (type == 'x') {
            pending_name = pax_path(data, size);
        } else {
            if (!pending_name.empty()) {
                name = pending_name;
                pending_name.clear();
            }
            if ((type == '0' || type == '\0') && normalize_member(name) == wanted) {
                return Bytes(data, data + size);
            }
        }

        offset = data_offset + ((size + kBlockSize - 1) / kBlockSize) * kBlockSize;
    }

    throw ProvisioningError("Member not found in archive: " + member_path);
}

Bytes extract_tgz_member(const Bytes& tgz, const std::string& member_path) {
    return extract_tar_member(gunzip(tgz), member_path);
}

} // namespace blossom
