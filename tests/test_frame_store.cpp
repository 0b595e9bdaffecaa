#include <gtest/gtest.h>
#include "frame_store.hpp"
#include "test_fakes.hpp"

namespace blossom {

using namespace test_support;

class FrameStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        png_ = encode_as(noise_image(32, 18), ".png");
    }

    TempDir dir_;
    FakeClock clock_;
    ImageBuffer png_;
};

TEST_F(FrameStoreTest, SavesUnderFramesDirectory) {
    FrameStore store(dir_.path(), clock_);
    const long long created_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        clock_.now().time_since_epoch()).count();

    auto filename = store.save("abc123", 12.5, png_);

    EXPECT_EQ(filename, "abc123-12500-" + std::to_string(created_ms) + ".png");
    EXPECT_EQ(store.directory(), dir_.path() / "frames");
    EXPECT_EQ(read_bytes(dir_.path() / "frames" / filename), png_);
    EXPECT_EQ(store.load(filename), png_);
}

TEST_F(FrameStoreTest, TimestampIsRoundedToMilliseconds) {
    FrameStore store(dir_.path(), clock_);

    auto filename = store.save("abc123", 1.23456, png_);

    EXPECT_EQ(filename.rfind("abc123-1235-", 0), 0u) << filename;
}

TEST_F(FrameStoreTest, LaterCapturesGetDistinctNames) {
    FrameStore store(dir_.path(), clock_);

    auto first = store.save("abc123", 5, png_);
    clock_.advance(std::chrono::seconds(1));
    auto second = store.save("abc123", 5, png_);

    EXPECT_NE(first, second);
}

TEST_F(FrameStoreTest, OnlyPngIsStored) {
    FrameStore store(dir_.path(), clock_);
    auto jpeg = encode_as(noise_image(32, 18), ".jpg");

    EXPECT_THROW(store.save("abc123", 1, jpeg), std::invalid_argument);
    EXPECT_FALSE(std::filesystem::exists(dir_.path() / "frames"));
}

TEST_F(FrameStoreTest, RejectsPathEscapes) {
    FrameStore store(dir_.path(), clock_);

    EXPECT_THROW(store.path_for("../versions.json"), std::invalid_argument);
    EXPECT_THROW(store.path_for(".."), std::invalid_argument);
    EXPECT_THROW(store.path_for(""), std::invalid_argument);
    EXPECT_THROW(store.path_for("a\\b.png"), std::invalid_argument);
    EXPECT_THROW(store.save("../evil", 1, png_), std::invalid_argument);
}

TEST_F(FrameStoreTest, MissingFrameThrows) {
    FrameStore store(dir_.path(), clock_);

    EXPECT_THROW(store.load("nothing-0-0.png"), std::runtime_error);
}

} // namespace blossom
