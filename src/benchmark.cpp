#include "image_compressor.hpp"
#include "region_cropper.hpp"
#include <benchmark/benchmark.h>
#include <chrono>
#include <iostream>
#include <opencv2/opencv.hpp>
#include <stdexcept>

namespace blossom {

class CompressionFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        // Noise defeats PNG compression, so a 1080p frame lands well above 2MB
        // and the compressor has to walk its ladder.
        cv::Mat frame(1080, 1920, CV_8UC3);
        cv::randu(frame, cv::Scalar(0, 0, 0), cv::Scalar(255, 255, 255));

        if (!cv::imencode(".png", frame, png_frame_)) {
            throw std::runtime_error("Failed to create benchmark frame");
        }
        if (!cv::imencode(".jpg", frame, jpeg_frame_, {cv::IMWRITE_JPEG_QUALITY, 95})) {
            throw std::runtime_error("Failed to create benchmark frame");
        }
    }

    void TearDown(const ::benchmark::State& /*state*/) override {
        png_frame_.clear();
        jpeg_frame_.clear();
    }

protected:
    ImageBuffer png_frame_;
    ImageBuffer jpeg_frame_;
    ImageCompressor compressor_;
    RegionCropper cropper_;
};

// Oversized lossless frame down to the API budget
BENCHMARK_DEFINE_F(CompressionFixture, CompressPng)(benchmark::State& state) {
    const size_t limit = static_cast<size_t>(state.range(0)) * 1024;

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = compressor_.compress(png_frame_, MediaType::Png, limit);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["input_kb"] = static_cast<double>(png_frame_.size()) / 1024;
        state.counters["output_kb"] = static_cast<double>(result.buffer.size()) / 1024;
        state.counters["exceeded_limit"] = result.exceeded_limit ? 1 : 0;
    }
}

BENCHMARK_DEFINE_F(CompressionFixture, CompressJpeg)(benchmark::State& state) {
    const size_t limit = static_cast<size_t>(state.range(0)) * 1024;

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto result = compressor_.compress(jpeg_frame_, MediaType::Jpeg, limit);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["input_kb"] = static_cast<double>(jpeg_frame_.size()) / 1024;
        state.counters["output_kb"] = static_cast<double>(result.buffer.size()) / 1024;
    }
}

BENCHMARK_DEFINE_F(CompressionFixture, CropHalfRegion)(benchmark::State& state) {
    CropRegion region{0.25, 0.25, 0.5, 0.5};

    for (auto _ : state) {
        auto start = std::chrono::high_resolution_clock::now();

        auto cropped = cropper_.crop(jpeg_frame_, region);

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed_seconds = std::chrono::duration_cast<std::chrono::duration<double>>(
            end - start);

        state.SetIterationTime(elapsed_seconds.count());
        state.counters["output_kb"] = static_cast<double>(cropped.size()) / 1024;
    }
}

BENCHMARK_REGISTER_F(CompressionFixture, CompressPng)
    ->Arg(2048)
    ->Arg(512)
    ->Arg(128)
    ->UseManualTime()
    ->Unit(benchmark::kMillisecond);

BENCHMARK_REGISTER_F(CompressionFixture, CompressJpeg)
    ->Arg(2048)
    ->Arg(256)
    ->UseManualTime()
    ->Unit(benchmark::kMillisecond);

BENCHMARK_REGISTER_F(CompressionFixture, CropHalfRegion)
    ->UseManualTime()
    ->Unit(benchmark::kMillisecond);

} // namespace blossom

int main(int argc, char** argv) {
    std::cout << "Blossom Media Benchmark" << std::endl;
    std::cout << "  OpenCV: " << CV_VERSION << std::endl;
    std::cout << "  Threads: " << cv::getNumThreads() << std::endl;
    std::cout << std::endl;

    ::benchmark::Initialize(&argc, argv);
    if (::benchmark::ReportUnrecognizedArguments(argc, argv)) return 1;
    ::benchmark::RunSpecifiedBenchmarks();

    std::cout << std::endl << "Benchmark completed!" << std::endl;

    return 0;
}
