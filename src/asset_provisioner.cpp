#include "asset_provisioner.hpp"
#include "archive.hpp"
#include "downloader.hpp"
#include "errors.hpp"
#include "process_runner.hpp"
#include "version_manifest.hpp"

#include <fstream>
#include <iostream>
#include <iterator>

namespace blossom {

namespace {

constexpr const char* kYtDlpVersion = "2024.12.13";
constexpr const char* kFfmpegVersion = "6.1.1";
constexpr const char* kSharpVersion = "0.34.5";
constexpr const char* kLibvipsVersion = "1.1.0";

struct VideoToolArtifacts {
    const char* ytdlp_file;
    const char* ffmpeg_file;
};

std::optional<VideoToolArtifacts> video_tool_artifacts(const PlatformKey& platform) {
    switch (platform.os) {
        case Os::Darwin:
            switch (platform.arch) {
                case Arch::Arm64:   return VideoToolArtifacts{"yt-dlp_macos", "ffmpeg-darwin-arm64.gz"};
                case Arch::X64:     return VideoToolArtifacts{"yt-dlp_macos", "ffmpeg-darwin-x64.gz"};
                case Arch::Unknown: return std::nullopt;
            }
            return std::nullopt;
        case Os::Linux:
            switch (platform.arch) {
                case Arch::X64:     return VideoToolArtifacts{"yt-dlp_linux", "ffmpeg-linux-x64.gz"};
                case Arch::Arm64:   return std::nullopt;
                case Arch::Unknown: return std::nullopt;
            }
            return std::nullopt;
        case Os::Win32:
            switch (platform.arch) {
                case Arch::X64:     return VideoToolArtifacts{"yt-dlp.exe", "ffmpeg-win32-x64.gz"};
                case Arch::Arm64:   return std::nullopt;
                case Arch::Unknown: return std::nullopt;
            }
            return std::nullopt;
        case Os::Unknown:
            return std::nullopt;
    }
    return std::nullopt;
}

// Shared-library filename inside the sharp-libvips package.
std::optional<std::string> libvips_filename(const PlatformKey& platform) {
    bool known_arch = false;
    switch (platform.arch) {
        case Arch::X64:
        case Arch::Arm64:
            known_arch = true;
            break;
        case Arch::Unknown:
            break;
    }
    if (!known_arch) {
        return std::nullopt;
    }

    switch (platform.os) {
        case Os::Darwin:  return std::string("libvips-cpp.8.16.1.dylib");
        case Os::Linux:   return std::string("libvips-cpp.so.8.16.1");
        case Os::Win32:   return std::nullopt;
        case Os::Unknown: return std::nullopt;
    }
    return std::nullopt;
}

[[noreturn]] void unsupported(const PlatformKey& platform) {
    throw ProvisioningError("Unsupported platform: " + platform.to_string());
}

Bytes read_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw ProvisioningError("Cannot read downloaded file: " + path.string());
    }
    return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

// Removes a scratch file on scope exit.
class ScratchFile {
public:
    explicit ScratchFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScratchFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    ScratchFile(const ScratchFile&) = delete;
    ScratchFile& operator=(const ScratchFile&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace

ToolSet video_tools(const PlatformKey& platform) {
    auto artifacts = video_tool_artifacts(platform);
    if (!artifacts) {
        unsupported(platform);
    }

    const bool windows = platform.os == Os::Win32;
    const std::string ytdlp_base = std::string("https://github.com/yt-dlp/yt-dlp/releases/download/") + kYtDlpVersion + "/";
    const std::string ffmpeg_base = std::string("https://github.com/eugeneware/ffmpeg-static/releases/download/b") + kFfmpegVersion + "/";

    ToolSet set;
    set.name = "video tools";
    set.directory = "bin";

    AssetSpec ytdlp;
    ytdlp.name = "yt-dlp";
    ytdlp.version = kYtDlpVersion;
    ytdlp.kind = AssetKind::Executable;
    ytdlp.packaging = Packaging::Raw;
    ytdlp.url = ytdlp_base + artifacts->ytdlp_file;
    ytdlp.install_path = windows ? "yt-dlp.exe" : "yt-dlp";
    set.assets.push_back(ytdlp);

    AssetSpec ffmpeg;
    ffmpeg.name = "ffmpeg";
    ffmpeg.version = kFfmpegVersion;
    ffmpeg.kind = AssetKind::Executable;
    ffmpeg.packaging = Packaging::Gzip;
    ffmpeg.url = ffmpeg_base + artifacts->ffmpeg_file;
    ffmpeg.install_path = windows ? "ffmpeg.exe" : "ffmpeg";
    set.assets.push_back(ffmpeg);

    return set;
}

ToolSet native_image_library(const PlatformKey& platform) {
    auto libvips_file = libvips_filename(platform);
    if (!libvips_file) {
        unsupported(platform);
    }

    const std::string key = platform.to_string();
    const std::string sharp_pkg = "sharp-" + key;
    const std::string libvips_pkg = "sharp-libvips-" + key;
    const std::string registry = "https://registry.npmjs.org/@img/";

    ToolSet set;
    set.name = "native image library";
    set.directory = "native";

    AssetSpec sharp;
    sharp.name = "sharp";
    sharp.version = kSharpVersion;
    sharp.kind = AssetKind::Library;
    sharp.packaging = Packaging::Tarball;
    sharp.url = registry + sharp_pkg + "/-/" + sharp_pkg + "-" + kSharpVersion + ".tgz";
    sharp.archive_member = "package/lib/" + sharp_pkg + ".node";
    sharp.install_path = std::filesystem::path("@img") / sharp_pkg / "lib" / (sharp_pkg + ".node");
    set.assets.push_back(sharp);

    AssetSpec libvips;
    libvips.name = "libvips";
    libvips.version = kLibvipsVersion;
    libvips.kind = AssetKind::Library;
    libvips.packaging = Packaging::Tarball;
    libvips.url = registry + libvips_pkg + "/-/" + libvips_pkg + "-" + kLibvipsVersion + ".tgz";
    libvips.archive_member = "package/lib/" + *libvips_file;
    libvips.install_path = std::filesystem::path("@img") / libvips_pkg / "lib" / *libvips_file;
    set.assets.push_back(libvips);

    return set;
}

AssetProvisioner::AssetProvisioner(std::filesystem::path data_dir,
                                   PlatformKey platform,
                                   Downloader& downloader,
                                   ProcessRunner& runner,
                                   std::chrono::milliseconds download_timeout)
    : data_dir_(std::move(data_dir))
    , platform_(platform)
    , downloader_(downloader)
    , runner_(runner)
    , download_timeout_(download_timeout) {}

ToolPaths AssetProvisioner::expected_paths(const ToolSet& tools) const {
    ToolPaths paths;
    for (const auto& asset : tools.assets) {
        paths[asset.name] = data_dir_ / tools.directory / asset.install_path;
    }
    return paths;
}

std::filesystem::path AssetProvisioner::manifest_path(const ToolSet& tools) const {
    return data_dir_ / tools.directory / "versions.json";
}

bool AssetProvisioner::is_current(const ToolSet& tools) const {
    auto manifest = VersionManifest::load(manifest_path(tools));
    if (!manifest) {
        return false;
    }

    auto paths = expected_paths(tools);
    for (const auto& asset : tools.assets) {
        if (!manifest->records(asset.name, asset.version)) {
            return false;
        }
        std::error_code ec;
        if (!std::filesystem::is_regular_file(paths.at(asset.name), ec)) {
            return false;
        }
    }
    return true;
}

ToolPaths AssetProvisioner::ensure(const ToolSet& tools) {
    auto paths = expected_paths(tools);
    if (is_current(tools)) {
        return paths;
    }

    std::cout << "Downloading " << tools.name << "..." << std::endl;

    VersionManifest manifest;
    for (const auto& asset : tools.assets) {
        std::cout << "  " << asset.name << "..." << std::endl;
        install(asset, paths.at(asset.name));
        manifest.tool_versions[asset.name] = asset.version;
    }

    manifest.save(manifest_path(tools));

    std::cout << "  Done" << std::endl;
    return paths;
}

void AssetProvisioner::install(const AssetSpec& asset, const std::filesystem::path& dest) {
    std::error_code ec;
    std::filesystem::create_directories(dest.parent_path(), ec);
    if (ec) {
        throw ProvisioningError("Cannot create " + dest.parent_path().string() + ": " + ec.message());
    }

    ScratchFile download(std::filesystem::path(dest.string() + ".download"));
    downloader_.download(asset.url, download.path(), download_timeout_);

    Bytes payload = read_file(download.path());
    switch (asset.packaging) {
        case Packaging::Raw:
            break;
        case Packaging::Gzip:
            payload = gunzip(payload);
            break;
        case Packaging::Tarball:
            payload = extract_tgz_member(payload, asset.archive_member);
            break;
    }

    if (payload.empty()) {
        throw ProvisioningError("Downloaded " + asset.name + " is empty: " + asset.url);
    }

    ScratchFile staged(std::filesystem::path(dest.string() + ".part"));
    {
        std::ofstream out(staged.path(), std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(payload.data()),
                  static_cast<std::streamsize>(payload.size()));
        if (!out.good()) {
            throw ProvisioningError("Cannot write " + staged.path().string());
        }
    }

    using std::filesystem::perms;
    std::filesystem::permissions(staged.path(),
                                 perms::owner_all | perms::group_read | perms::group_exec |
                                     perms::others_read | perms::others_exec,
                                 ec);
    if (ec) {
        throw ProvisioningError("Cannot mark " + asset.name + " executable: " + ec.message());
    }

    std::filesystem::rename(staged.path(), dest, ec);
    if (ec) {
        throw ProvisioningError("Cannot install " + dest.string() + ": " + ec.message());
    }

    if (asset.kind == AssetKind::Library && platform_.os == Os::Darwin) {
        codesign(dest);
    }
}

// Ad-hoc signature so the library loads inside a signed host process.
void AssetProvisioner::codesign(const std::filesystem::path& dest) {
    ProcessResult result;
    try {
        result = runner_.run({"codesign", "--force", "--sign", "-", dest.string()}, download_timeout_);
    } catch (const ProcessError& e) {
        throw ProvisioningError("Failed to sign " + dest.string() + ": " + e.what());
    }
    if (!result.succeeded()) {
        throw ProvisioningError("Failed to sign " + dest.string() + ": " +
                                (result.stderr_data.empty() ? "exit code " + std::to_string(result.exit_code)
                                                            : result.stderr_data));
    }
}

ToolLocator::ToolLocator(AssetProvisioner& provisioner, Catalog catalog)
    : provisioner_(provisioner), catalog_(std::move(catalog)) {}

ToolPaths ToolLocator::paths() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!paths_) {
        paths_ = provisioner_.ensure(catalog_(provisioner_.platform()));
    }
    return *paths_;
}

std::filesystem::path ToolLocator::path(const std::string& tool) {
    auto all = paths();
    auto it = all.find(tool);
    if (it == all.end()) {
        throw ProvisioningError("Unknown tool: " + tool);
    }
    return it->second;
}

bool ToolLocator::resolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_.has_value();
}

} // namespace blossom
