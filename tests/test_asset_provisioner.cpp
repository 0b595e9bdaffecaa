#include <gtest/gtest.h>
#include "asset_provisioner.hpp"
#include "errors.hpp"
#include "test_fakes.hpp"
#include "version_manifest.hpp"

namespace blossom {

using namespace test_support;

class AssetProvisionerTest : public ::testing::Test {
protected:
    void SetUp() override {
        linux_x64_ = PlatformKey{Os::Linux, Arch::X64};
        tools_ = video_tools(linux_x64_);

        ytdlp_payload_ = to_bytes("#!/usr/bin/env python3\nprint('yt-dlp')\n");
        ffmpeg_payload_ = to_bytes(std::string(4096, 'F'));
        downloader_.serve(tools_.assets[0].url, ytdlp_payload_);
        downloader_.serve(tools_.assets[1].url, gzip_bytes(ffmpeg_payload_));
    }

    AssetProvisioner make_provisioner(PlatformKey platform) {
        return AssetProvisioner(dir_.path(), platform, downloader_, runner_);
    }

    void serve_native_library(const PlatformKey& platform) {
        auto set = native_image_library(platform);
        for (const auto& asset : set.assets) {
            Bytes tar = make_tar({
                {"package/package.json", to_bytes("{\"name\":\"" + asset.name + "\"}")},
                {asset.archive_member, to_bytes(asset.name + " binary")},
            });
            downloader_.serve(asset.url, gzip_bytes(tar));
        }
    }

    TempDir dir_;
    FakeDownloader downloader_;
    FakeRunner runner_;
    PlatformKey linux_x64_;
    ToolSet tools_;
    Bytes ytdlp_payload_;
    Bytes ffmpeg_payload_;
};

TEST_F(AssetProvisionerTest, FirstEnsureInstallsEveryAsset) {
    auto provisioner = make_provisioner(linux_x64_);

    auto paths = provisioner.ensure(tools_);

    EXPECT_EQ(downloader_.downloads(), 2);
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths.at("yt-dlp"), dir_.path() / "bin" / "yt-dlp");
    EXPECT_EQ(paths.at("ffmpeg"), dir_.path() / "bin" / "ffmpeg");

    EXPECT_EQ(read_bytes(paths.at("yt-dlp")), ytdlp_payload_);
    EXPECT_EQ(read_bytes(paths.at("ffmpeg")), ffmpeg_payload_);

    auto perms = std::filesystem::status(paths.at("ffmpeg")).permissions();
    EXPECT_NE(perms & std::filesystem::perms::owner_exec, std::filesystem::perms::none);

    auto manifest = VersionManifest::load(provisioner.manifest_path(tools_));
    ASSERT_TRUE(manifest.has_value());
    EXPECT_TRUE(manifest->records("yt-dlp", "2024.12.13"));
    EXPECT_TRUE(manifest->records("ffmpeg", "6.1.1"));
}

TEST_F(AssetProvisionerTest, SecondEnsureDoesNotDownload) {
    auto provisioner = make_provisioner(linux_x64_);
    auto first = provisioner.ensure(tools_);
    downloader_.reset_counts();

    auto second = provisioner.ensure(tools_);

    EXPECT_EQ(downloader_.downloads(), 0);
    EXPECT_EQ(first, second);
    EXPECT_TRUE(provisioner.is_current(tools_));
}

TEST_F(AssetProvisionerTest, VersionMismatchRefetchesWholeSet) {
    auto provisioner = make_provisioner(linux_x64_);
    provisioner.ensure(tools_);

    VersionManifest stale;
    stale.tool_versions["yt-dlp"] = "2023.01.01";
    stale.tool_versions["ffmpeg"] = "6.1.1";
    stale.save(provisioner.manifest_path(tools_));
    downloader_.reset_counts();

    EXPECT_FALSE(provisioner.is_current(tools_));
    provisioner.ensure(tools_);

    // ffmpeg was already current but is fetched again with the rest of the set
    EXPECT_EQ(downloader_.downloads(), 2);
    auto manifest = VersionManifest::load(provisioner.manifest_path(tools_));
    ASSERT_TRUE(manifest.has_value());
    EXPECT_TRUE(manifest->records("yt-dlp", "2024.12.13"));
}

TEST_F(AssetProvisionerTest, MissingFileRefetchesWholeSet) {
    auto provisioner = make_provisioner(linux_x64_);
    auto paths = provisioner.ensure(tools_);
    std::filesystem::remove(paths.at("ffmpeg"));
    downloader_.reset_counts();

    provisioner.ensure(tools_);

    EXPECT_EQ(downloader_.downloads(), 2);
    EXPECT_TRUE(std::filesystem::exists(paths.at("ffmpeg")));
}

TEST_F(AssetProvisionerTest, CorruptManifestCountsAsNotProvisioned) {
    auto provisioner = make_provisioner(linux_x64_);
    provisioner.ensure(tools_);

    std::ofstream(provisioner.manifest_path(tools_)) << "{ not json";
    downloader_.reset_counts();

    EXPECT_FALSE(provisioner.is_current(tools_));
    provisioner.ensure(tools_);
    EXPECT_EQ(downloader_.downloads(), 2);
}

TEST_F(AssetProvisionerTest, FailedDownloadKeepsPreviousManifest) {
    auto provisioner = make_provisioner(linux_x64_);
    provisioner.ensure(tools_);

    VersionManifest old;
    old.tool_versions["yt-dlp"] = "2023.01.01";
    old.tool_versions["ffmpeg"] = "6.0";
    old.save(provisioner.manifest_path(tools_));

    downloader_.fail(tools_.assets[1].url);
    EXPECT_THROW(provisioner.ensure(tools_), ProvisioningError);

    auto manifest = VersionManifest::load(provisioner.manifest_path(tools_));
    ASSERT_TRUE(manifest.has_value());
    EXPECT_TRUE(manifest->records("yt-dlp", "2023.01.01"));
    EXPECT_TRUE(manifest->records("ffmpeg", "6.0"));

    for (const auto& entry : std::filesystem::directory_iterator(dir_.path() / "bin")) {
        auto ext = entry.path().extension().string();
        EXPECT_NE(ext, ".download") << entry.path();
        EXPECT_NE(ext, ".part") << entry.path();
    }
}

TEST_F(AssetProvisionerTest, CorruptGzipIsRejected) {
    downloader_.serve(tools_.assets[1].url, to_bytes("definitely not gzip"));
    auto provisioner = make_provisioner(linux_x64_);

    EXPECT_THROW(provisioner.ensure(tools_), ProvisioningError);
    EXPECT_FALSE(std::filesystem::exists(provisioner.manifest_path(tools_)));
}

TEST_F(AssetProvisionerTest, UnsupportedPlatformFailsWithoutDownloading) {
    PlatformKey linux_arm{Os::Linux, Arch::Arm64};
    auto provisioner = make_provisioner(linux_arm);
    ToolLocator locator(provisioner, video_tools);

    try {
        locator.path("ffmpeg");
        FAIL() << "expected ProvisioningError";
    } catch (const ProvisioningError& e) {
        EXPECT_NE(std::string(e.what()).find("linux-arm64"), std::string::npos);
    }
    EXPECT_EQ(downloader_.downloads(), 0);
    EXPECT_FALSE(locator.resolved());
}

TEST_F(AssetProvisionerTest, NativeLibraryIsExtractedFromTarballs) {
    serve_native_library(linux_x64_);
    auto provisioner = make_provisioner(linux_x64_);
    auto set = native_image_library(linux_x64_);

    auto paths = provisioner.ensure(set);

    EXPECT_EQ(downloader_.downloads(), 2);
    EXPECT_EQ(paths.at("sharp"),
              dir_.path() / "native" / "@img" / "sharp-linux-x64" / "lib" / "sharp-linux-x64.node");
    EXPECT_EQ(paths.at("libvips"),
              dir_.path() / "native" / "@img" / "sharp-libvips-linux-x64" / "lib" / "libvips-cpp.so.8.16.1");
    EXPECT_EQ(read_bytes(paths.at("sharp")), to_bytes("sharp binary"));
    EXPECT_EQ(read_bytes(paths.at("libvips")), to_bytes("libvips binary"));

    // Only darwin needs signing
    EXPECT_EQ(runner_.count("codesign"), 0u);
}

TEST_F(AssetProvisionerTest, DarwinLibrariesAreSigned) {
    PlatformKey darwin{Os::Darwin, Arch::Arm64};
    serve_native_library(darwin);
    runner_.on("codesign", exited(0));
    auto provisioner = make_provisioner(darwin);

    auto paths = provisioner.ensure(native_image_library(darwin));

    ASSERT_EQ(runner_.count("codesign"), 2u);
    auto calls = runner_.calls();
    EXPECT_EQ(calls[0], (std::vector<std::string>{"codesign", "--force", "--sign", "-",
                                                  paths.at("sharp").string()}));
}

TEST_F(AssetProvisionerTest, SigningFailureAbortsProvisioning) {
    PlatformKey darwin{Os::Darwin, Arch::X64};
    serve_native_library(darwin);
    runner_.on("codesign", exited(1, "", "codesign: invalid signature"));
    auto provisioner = make_provisioner(darwin);
    auto set = native_image_library(darwin);

    try {
        provisioner.ensure(set);
        FAIL() << "expected ProvisioningError";
    } catch (const ProvisioningError& e) {
        EXPECT_NE(std::string(e.what()).find("invalid signature"), std::string::npos);
    }
    EXPECT_FALSE(std::filesystem::exists(provisioner.manifest_path(set)));
}

TEST_F(AssetProvisionerTest, LocatorProvisionsOncePerProcess) {
    auto provisioner = make_provisioner(linux_x64_);
    ToolLocator locator(provisioner, video_tools);

    EXPECT_FALSE(locator.resolved());
    auto ffmpeg = locator.path("ffmpeg");
    auto ytdlp = locator.path("yt-dlp");

    EXPECT_TRUE(locator.resolved());
    EXPECT_EQ(ffmpeg, dir_.path() / "bin" / "ffmpeg");
    EXPECT_EQ(ytdlp, dir_.path() / "bin" / "yt-dlp");
    EXPECT_EQ(downloader_.downloads(), 2);

    // Deleting the file is not noticed once the paths are memoized
    std::filesystem::remove(ffmpeg);
    locator.path("ffmpeg");
    EXPECT_EQ(downloader_.downloads(), 2);

    EXPECT_THROW(locator.path("youtube-dl"), ProvisioningError);
}

TEST_F(AssetProvisionerTest, LocatorRetriesAfterFailure) {
    auto provisioner = make_provisioner(linux_x64_);
    ToolLocator locator(provisioner, video_tools);

    downloader_.fail(tools_.assets[0].url);
    EXPECT_THROW(locator.path("yt-dlp"), ProvisioningError);
    EXPECT_FALSE(locator.resolved());

    downloader_.clear_failures();
    EXPECT_NO_THROW(locator.path("yt-dlp"));
    EXPECT_TRUE(locator.resolved());
}

TEST(ToolCatalogTest, VideoToolsPerPlatform) {
    auto mac_arm = video_tools({Os::Darwin, Arch::Arm64});
    auto mac_x64 = video_tools({Os::Darwin, Arch::X64});
    auto windows = video_tools({Os::Win32, Arch::X64});

    EXPECT_EQ(mac_arm.assets[0].url,
              "https://github.com/yt-dlp/yt-dlp/releases/download/2024.12.13/yt-dlp_macos");
    EXPECT_EQ(mac_arm.assets[1].url,
              "https://github.com/eugeneware/ffmpeg-static/releases/download/b6.1.1/ffmpeg-darwin-arm64.gz");
    EXPECT_NE(mac_arm.assets[1].url, mac_x64.assets[1].url);

    EXPECT_EQ(windows.assets[0].install_path, std::filesystem::path("yt-dlp.exe"));
    EXPECT_EQ(windows.assets[1].install_path, std::filesystem::path("ffmpeg.exe"));
    EXPECT_EQ(windows.assets[1].packaging, Packaging::Gzip);

    EXPECT_THROW(video_tools({Os::Win32, Arch::Arm64}), ProvisioningError);
    EXPECT_THROW(video_tools({Os::Unknown, Arch::X64}), ProvisioningError);
}

TEST(ToolCatalogTest, NativeImageLibraryPerPlatform) {
    auto mac = native_image_library({Os::Darwin, Arch::X64});
    auto linux_arm = native_image_library({Os::Linux, Arch::Arm64});

    EXPECT_EQ(mac.assets[0].url,
              "https://registry.npmjs.org/@img/sharp-darwin-x64/-/sharp-darwin-x64-0.34.5.tgz");
    EXPECT_EQ(mac.assets[1].archive_member, "package/lib/libvips-cpp.8.16.1.dylib");
    EXPECT_EQ(linux_arm.assets[1].url,
              "https://registry.npmjs.org/@img/sharp-libvips-linux-arm64/-/sharp-libvips-linux-arm64-1.1.0.tgz");
    EXPECT_EQ(linux_arm.assets[0].kind, AssetKind::Library);

    EXPECT_THROW(native_image_library({Os::Win32, Arch::X64}), ProvisioningError);
    EXPECT_THROW(native_image_library({Os::Linux, Arch::Unknown}), ProvisioningError);
}

} // namespace blossom
