#pragma once

#include <string>
#include <vector>

namespace blossom {

using Bytes = std::vector<unsigned char>;

// Inflates a gzip stream. Throws ProvisioningError on corrupt input.
Bytes gunzip(const Bytes& compressed);

// Returns the contents of one regular-file member of an uncompressed tar
// archive (ustar, GNU long names and pax path records are understood).
// Throws ProvisioningError when the member is missing or the archive is
// truncated.
Bytes extract_tar_member(const Bytes& tar, const std::string& member_path);

// gunzip + extract_tar_member.
Bytes extract_tgz_member(const Bytes& tgz, const std::string& member_path);

} // namespace blossom
