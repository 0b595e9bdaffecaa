#include <gtest/gtest.h>
#include "errors.hpp"
#include "frame_extractor.hpp"
#include "test_fakes.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace blossom {

using namespace test_support;

class FrameExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        jpeg_frame_ = encode_as(noise_image(64, 36), ".jpg");
        png_frame_ = encode_as(noise_image(64, 36), ".png");

        runner_.on("yt-dlp", [this](const std::vector<std::string>&) {
            ++resolutions_;
            return exited(0, "https://stream.example/" + std::to_string(resolutions_) + "\n");
        });
        runner_.on("ffmpeg", [this](const std::vector<std::string>& argv) {
            bool png = std::find(argv.begin(), argv.end(), "png") != argv.end();
            const auto& frame = png ? png_frame_ : jpeg_frame_;
            return exited(0, std::string(frame.begin(), frame.end()));
        });

        resolver_ = std::make_unique<StreamUrlResolver>(
            runner_, [] { return std::string("yt-dlp"); }, clock_);
        extractor_ = std::make_unique<FrameExtractor>(
            runner_, *resolver_, [] { return std::string("ffmpeg"); });
    }

    std::vector<std::vector<std::string>> transcoder_calls() const {
        std::vector<std::vector<std::string>> result;
        for (const auto& call : runner_.calls()) {
            if (call[0] == "ffmpeg") result.push_back(call);
        }
        return result;
    }

    FakeRunner runner_;
    FakeClock clock_;
    int resolutions_ = 0;
    ImageBuffer jpeg_frame_;
    ImageBuffer png_frame_;
    std::unique_ptr<StreamUrlResolver> resolver_;
    std::unique_ptr<FrameExtractor> extractor_;
};

TEST_F(FrameExtractorTest, ApiFrameIsJpegFromOneResolution) {
    auto frame = extractor_->extract_frame("abc123", 12.5, FrameQuality::Api);

    EXPECT_EQ(frame, jpeg_frame_);
    MediaType type;
    ASSERT_TRUE(detect_media_type(frame, type));
    EXPECT_EQ(type, MediaType::Jpeg);

    auto calls = transcoder_calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], (std::vector<std::string>{
        "ffmpeg", "-hide_banner", "-loglevel", "error",
        "-ss", "12.500",
        "-i", "https://stream.example/1",
        "-frames:v", "1", "-f", "image2pipe",
        "-vcodec", "mjpeg", "-q:v", "5", "-"}));
    EXPECT_EQ(resolutions_, 1);
}

TEST_F(FrameExtractorTest, ArchivalFrameIsPng) {
    auto frame = extractor_->extract_frame("abc123", 0, FrameQuality::Archival);

    EXPECT_EQ(frame, png_frame_);
    auto calls = transcoder_calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(std::vector<std::string>(calls[0].end() - 3, calls[0].end()),
              (std::vector<std::string>{"-vcodec", "png", "-"}));

    auto resolver_calls = runner_.calls();
    EXPECT_EQ(resolver_calls[0][5], "best[height<=1080]");
}

TEST_F(FrameExtractorTest, SecondCallReusesStreamUrl) {
    extractor_->extract_frame("abc123", 12.5, FrameQuality::Api);
    extractor_->extract_frame("abc123", 30, FrameQuality::Api);

    EXPECT_EQ(resolutions_, 1);
    EXPECT_EQ(transcoder_calls().size(), 2u);
}

TEST_F(FrameExtractorTest, SeekComesBeforeInput) {
    extractor_->extract_frame("abc123", 3661.25, FrameQuality::Api);

    auto argv = transcoder_calls().at(0);
    auto seek = std::find(argv.begin(), argv.end(), "-ss");
    auto input = std::find(argv.begin(), argv.end(), "-i");
    ASSERT_NE(seek, argv.end());
    ASSERT_NE(input, argv.end());
    EXPECT_LT(seek, input);
    EXPECT_EQ(*(seek + 1), "3661.250");
}

TEST_F(FrameExtractorTest, ExpiredUrlIsRefreshedAndRetriedOnce) {
    int attempts = 0;
    runner_.on("ffmpeg", [&](const std::vector<std::string>& argv) {
        ++attempts;
        if (attempts == 1) {
            return exited(1, "", "[https @ 0x1] HTTP error 403 Forbidden\nServer returned 403 Forbidden (access denied)");
        }
        EXPECT_EQ(argv[7], "https://stream.example/2");
        return exited(0, std::string(jpeg_frame_.begin(), jpeg_frame_.end()));
    });

    auto frame = extractor_->extract_frame("abc123", 12.5, FrameQuality::Api);

    EXPECT_EQ(frame, jpeg_frame_);
    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(resolutions_, 2);
}

TEST_F(FrameExtractorTest, FailedRetryReachesCaller) {
    int attempts = 0;
    runner_.on("ffmpeg", [&](const std::vector<std::string>&) {
        ++attempts;
        if (attempts == 1) {
            return exited(1, "", "Server returned 403 Forbidden (access denied)");
        }
        return exited(1, "", "Connection to tcp://stream.example:443 failed: Connection refused");
    });

    try {
        extractor_->extract_frame("abc123", 12.5, FrameQuality::Api);
        FAIL() << "expected ExtractionError";
    } catch (const ExtractionError& e) {
        EXPECT_EQ(std::string(e.what()),
                  "Failed to extract frame: Connection to tcp://stream.example:443 failed: Connection refused");
    }
    EXPECT_EQ(attempts, 2);
    EXPECT_EQ(resolutions_, 2);
}

TEST_F(FrameExtractorTest, OtherFailuresAreNotRetried) {
    runner_.on("ffmpeg", exited(1, "", "Invalid data found when processing input"));

    try {
        extractor_->extract_frame("abc123", 12.5, FrameQuality::Api);
        FAIL() << "expected ExtractionError";
    } catch (const ExtractionError& e) {
        EXPECT_EQ(std::string(e.what()), "Failed to extract frame: Invalid data found when processing input");
    }
    EXPECT_EQ(transcoder_calls().size(), 1u);
    EXPECT_EQ(resolutions_, 1);
}

TEST_F(FrameExtractorTest, EmptyOutputIsAFailure) {
    runner_.on("ffmpeg", exited(0));

    EXPECT_THROW(extractor_->extract_frame("abc123", 9999, FrameQuality::Api), ExtractionError);
    EXPECT_EQ(transcoder_calls().size(), 1u);
}

TEST_F(FrameExtractorTest, TimeoutIsAFailure) {
    ProcessResult hung = exited(-1, "", "");
    hung.timed_out = true;
    runner_.on("ffmpeg", hung);

    try {
        extractor_->extract_frame("abc123", 1, FrameQuality::Api);
        FAIL() << "expected ExtractionError";
    } catch (const ExtractionError& e) {
        EXPECT_EQ(std::string(e.what()), "Failed to extract frame: timed out");
    }
}

TEST_F(FrameExtractorTest, InvalidTimestampsAreRejected) {
    EXPECT_THROW(extractor_->extract_frame("abc123", -1, FrameQuality::Api), std::invalid_argument);
    EXPECT_THROW(extractor_->extract_frame("abc123", std::nan(""), FrameQuality::Api), std::invalid_argument);
    EXPECT_THROW(extractor_->extract_frame("abc123", std::numeric_limits<double>::infinity(),
                                           FrameQuality::Api),
                 std::invalid_argument);
    EXPECT_TRUE(runner_.calls().empty());
}

TEST_F(FrameExtractorTest, ResolutionFailurePropagates) {
    runner_.on("yt-dlp", exited(1, "", "ERROR: Private video"));

    EXPECT_THROW(extractor_->extract_frame("abc123", 1, FrameQuality::Api), ResolutionError);
    EXPECT_TRUE(transcoder_calls().empty());
}

TEST_F(FrameExtractorTest, ClassifierIsPluggable) {
    FrameExtractorConfig config;
    config.api_jpeg_quality = 2;
    config.classify = [](const std::string& text) {
        return text.find("token expired") != std::string::npos ? FailureKind::AuthorizationExpired
                                                               : FailureKind::Other;
    };
    FrameExtractor extractor(runner_, *resolver_, [] { return std::string("ffmpeg"); }, config);

    int attempts = 0;
    runner_.on("ffmpeg", [&](const std::vector<std::string>& argv) {
        EXPECT_EQ(argv[argv.size() - 2], "2");
        return ++attempts == 1 ? exited(1, "", "token expired")
                               : exited(0, std::string(jpeg_frame_.begin(), jpeg_frame_.end()));
    });

    EXPECT_NO_THROW(extractor.extract_frame("abc123", 1, FrameQuality::Api));
    EXPECT_EQ(attempts, 2);
}

TEST(FailureClassifierTest, RecognizesAuthorizationResponses) {
    EXPECT_EQ(classify_failure("HTTP error 403 Forbidden"), FailureKind::AuthorizationExpired);
    EXPECT_EQ(classify_failure("Server returned 401 Unauthorized (authorization failed)"),
              FailureKind::AuthorizationExpired);
    EXPECT_EQ(classify_failure("Connection timed out"), FailureKind::Other);
    EXPECT_EQ(classify_failure(""), FailureKind::Other);
}

} // namespace blossom
