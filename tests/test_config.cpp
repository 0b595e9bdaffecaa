#include <gtest/gtest.h>
#include "config.hpp"
#include "test_fakes.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>

namespace blossom {

using namespace test_support;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_data_dir_ = read_env("BLOSSOM_DATA_DIR");
        saved_home_ = read_env("HOME");
        ::unsetenv("BLOSSOM_DATA_DIR");
    }

    void TearDown() override {
        restore_env("BLOSSOM_DATA_DIR", saved_data_dir_);
        restore_env("HOME", saved_home_);
    }

    std::filesystem::path write_config(const std::string& contents) {
        auto path = dir_.path() / "blossom.json";
        std::ofstream(path) << contents;
        return path;
    }

    static std::optional<std::string> read_env(const char* name) {
        const char* value = std::getenv(name);
        return value ? std::optional<std::string>(value) : std::nullopt;
    }

    static void restore_env(const char* name, const std::optional<std::string>& value) {
        if (value) {
            ::setenv(name, value->c_str(), 1);
        } else {
            ::unsetenv(name);
        }
    }

    TempDir dir_;
    std::optional<std::string> saved_data_dir_;
    std::optional<std::string> saved_home_;
};

TEST_F(ConfigTest, Defaults) {
    MediaConfig config;

    EXPECT_TRUE(config.data_dir.empty());
    EXPECT_EQ(config.stream_url_ttl, std::chrono::hours(5));
    EXPECT_EQ(config.process_timeout, std::chrono::seconds(60));
    EXPECT_EQ(config.download_timeout, std::chrono::seconds(300));
    EXPECT_EQ(config.api_jpeg_quality, 5);
    EXPECT_EQ(config.size_limit_bytes, 2u * 1024 * 1024);
}

TEST_F(ConfigTest, LoadsOverrides) {
    auto path = write_config(R"({
        "data_dir": "/srv/blossom",
        "stream_url_ttl_minutes": 30,
        "process_timeout_seconds": 15,
        "download_timeout_seconds": 600,
        "api_jpeg_quality": 8,
        "size_limit_bytes": 1048576,
        "unrelated": {"ignored": true}
    })");

    auto config = load_config(path);

    EXPECT_EQ(config.data_dir, std::filesystem::path("/srv/blossom"));
    EXPECT_EQ(config.stream_url_ttl, std::chrono::minutes(30));
    EXPECT_EQ(config.process_timeout, std::chrono::seconds(15));
    EXPECT_EQ(config.download_timeout, std::chrono::seconds(600));
    EXPECT_EQ(config.api_jpeg_quality, 8);
    EXPECT_EQ(config.size_limit_bytes, 1048576u);
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    auto config = load_config(write_config(R"({"api_jpeg_quality": 3})"));

    EXPECT_EQ(config.api_jpeg_quality, 3);
    EXPECT_EQ(config.process_timeout, std::chrono::seconds(60));
    EXPECT_TRUE(config.data_dir.empty());
}

TEST_F(ConfigTest, RejectsBadFiles) {
    EXPECT_THROW(load_config(dir_.path() / "missing.json"), std::runtime_error);
    EXPECT_THROW(load_config(write_config("{ nope")), std::runtime_error);
    EXPECT_THROW(load_config(write_config("[1, 2]")), std::runtime_error);
    EXPECT_THROW(load_config(write_config(R"({"process_timeout_seconds": "60"})")), std::runtime_error);
    EXPECT_THROW(load_config(write_config(R"({"process_timeout_seconds": 0})")), std::runtime_error);
    EXPECT_THROW(load_config(write_config(R"({"api_jpeg_quality": 40})")), std::runtime_error);
}

TEST_F(ConfigTest, EnvironmentSetsDataDir) {
    ::setenv("BLOSSOM_DATA_DIR", "/tmp/blossom-env", 1);
    MediaConfig config;
    config.data_dir = "/from/config";

    apply_environment(config);

    EXPECT_EQ(config.data_dir, std::filesystem::path("/tmp/blossom-env"));
}

TEST_F(ConfigTest, DefaultDataDirUnderHome) {
    ::setenv("HOME", "/home/tester", 1);
    MediaConfig config;

    apply_environment(config);

    EXPECT_EQ(config.data_dir, std::filesystem::path("/home/tester/.blossom"));
    EXPECT_EQ(default_data_dir(), std::filesystem::path("/home/tester/.blossom"));
}

TEST_F(ConfigTest, ConfiguredDataDirSurvivesWithoutEnvironment) {
    MediaConfig config;
    config.data_dir = "/from/config";

    apply_environment(config);

    EXPECT_EQ(config.data_dir, std::filesystem::path("/from/config"));
}

} // namespace blossom
