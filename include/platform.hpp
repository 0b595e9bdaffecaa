#pragma once

#include <string>

namespace blossom {

enum class Os {
    Darwin,
    Linux,
    Win32,
    Unknown
};

enum class Arch {
    X64,
    Arm64,
    Unknown
};

struct PlatformKey {
    Os os = Os::Unknown;
    Arch arch = Arch::Unknown;

    // "darwin-arm64", "linux-x64", ...
    std::string to_string() const;

    bool operator==(const PlatformKey& other) const {
        return os == other.os && arch == other.arch;
    }
};

std::string to_string(Os os);
std::string to_string(Arch arch);

// Platform this binary was compiled for.
PlatformKey host_platform();

} // namespace blossom
