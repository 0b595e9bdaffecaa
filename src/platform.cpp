#include "platform.hpp"

namespace blossom {

std::string to_string(Os os) {
    switch (os) {
        case Os::Darwin:  return "darwin";
        case Os::Linux:   return "linux";
        case Os::Win32:   return "win32";
        case Os::Unknown: return "unknown";
    }
    return "unknown";
}

std::string to_string(Arch arch) {
    switch (arch) {
        case Arch::X64:     return "x64";
        case Arch::Arm64:   return "arm64";
        case Arch::Unknown: return "unknown";
    }
    return "unknown";
}

std::string PlatformKey::to_string() const {
    return blossom::to_string(os) + "-" + blossom::to_string(arch);
}

PlatformKey host_platform() {
    PlatformKey key;

#if defined(__APPLE__)
    key.os = Os::Darwin;
#elif defined(__linux__)
    key.os = Os::Linux;
#elif defined(_WIN32)
    key.os = Os::Win32;
#endif

#if defined(__aarch64__) || defined(_M_ARM64)
    key.arch = Arch::Arm64;
#elif defined(__x86_64__) || defined(_M_X64)
    key.arch = Arch::X64;
#endif

    return key;
}

} // namespace blossom
