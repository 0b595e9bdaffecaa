#pragma once

#include "platform.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace blossom {

class Downloader;
class ProcessRunner;

enum class AssetKind {
    Executable,
    Library
};

enum class Packaging {
    Raw,      // the download is the file itself
    Gzip,     // single gzip-compressed file
    Tarball   // .tgz; one member is extracted
};

struct AssetSpec {
    std::string name;
    std::string version;
    AssetKind kind = AssetKind::Executable;
    Packaging packaging = Packaging::Raw;
    std::string url;
    std::string archive_member;              // Tarball only
    std::filesystem::path install_path;      // relative to the tool set directory
};

// Assets that are provisioned (and versioned) together.
struct ToolSet {
    std::string name;
    std::filesystem::path directory;         // relative to the data directory
    std::vector<AssetSpec> assets;
};

using ToolPaths = std::map<std::string, std::filesystem::path>;

// yt-dlp + ffmpeg under bin/. Throws ProvisioningError for platforms without
// published builds.
ToolSet video_tools(const PlatformKey& platform);

// sharp binding + libvips under native/@img/. Throws ProvisioningError for
// platforms without published builds.
ToolSet native_image_library(const PlatformKey& platform);

class AssetProvisioner {
public:
    AssetProvisioner(std::filesystem::path data_dir,
                     PlatformKey platform,
                     Downloader& downloader,
                     ProcessRunner& runner,
                     std::chrono::milliseconds download_timeout = std::chrono::minutes(5));

    // Makes every asset of the set present at its required version and
    // returns name -> absolute path. Any stale or missing asset causes the
    // whole set to be fetched again; the manifest is written only after all
    // assets landed.
    ToolPaths ensure(const ToolSet& tools);

    ToolPaths expected_paths(const ToolSet& tools) const;
    std::filesystem::path manifest_path(const ToolSet& tools) const;
    bool is_current(const ToolSet& tools) const;

    const PlatformKey& platform() const { return platform_; }
    const std::filesystem::path& data_dir() const { return data_dir_; }

private:
    void install(const AssetSpec& asset, const std::filesystem::path& dest);
    void codesign(const std::filesystem::path& dest);

    std::filesystem::path data_dir_;
    PlatformKey platform_;
    Downloader& downloader_;
    ProcessRunner& runner_;
    std::chrono::milliseconds download_timeout_;
};

// Resolves a tool set once per process. The first path() call runs ensure();
// later calls reuse the validated paths without touching the disk. A failed
// ensure() is not remembered, so the next call tries again.
class ToolLocator {
public:
    using Catalog = std::function<ToolSet(const PlatformKey&)>;

    ToolLocator(AssetProvisioner& provisioner, Catalog catalog);

    std::filesystem::path path(const std::string& tool);
    ToolPaths paths();
    bool resolved() const;

private:
    AssetProvisioner& provisioner_;
    Catalog catalog_;
    mutable std::mutex mutex_;
    std::optional<ToolPaths> paths_;
};

} // namespace blossom
