#include "media_toolkit.hpp"
#include "video_url.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <iterator>
#include <optional>
#include <vector>
#include <chrono>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " COMMAND [OPTIONS] [ARGS]\n"
              << "Commands:\n"
              << "  provision                 Download yt-dlp, ffmpeg and the native image library\n"
              << "  resolve VIDEO             Print the direct stream URL of a video\n"
              << "  frame VIDEO SECONDS       Capture one frame (saved to the frame store unless --output)\n"
              << "  crop IMAGE                Crop a local image (requires --crop and --output)\n"
              << "  compress IMAGE            Shrink an image below the size limit, caching the result\n"
              << "  prepare IMAGE             Base64 payload for the API client\n"
              << "Options:\n"
              << "  --data-dir DIR            Data directory (default: $BLOSSOM_DATA_DIR or ~/.blossom)\n"
              << "  --config FILE             JSON configuration file\n"
              << "  --quality api|archival    Frame quality (default: api)\n"
              << "  --crop X,Y,W,H            Relative crop region, each value in [0,1]\n"
              << "  --limit BYTES             Size limit for compress/prepare (default: 2097152)\n"
              << "  --output FILE             Write the image or JSON result to FILE\n"
              << "  -h, --help                Show this help\n";
}

std::string video_id_from(const std::string& arg) {
    if (auto id = blossom::parse_video_url(arg)) {
        return *id;
    }
    return arg;
}

blossom::FrameQuality parse_quality(const std::string& value) {
    if (value == "api") return blossom::FrameQuality::Api;
    if (value == "archival") return blossom::FrameQuality::Archival;
    throw std::invalid_argument("Unknown quality: " + value);
}

blossom::CropRegion parse_crop(const std::string& value) {
    std::vector<double> parts;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        parts.push_back(std::stod(item));
    }
    if (parts.size() != 4) {
        throw std::invalid_argument("Crop region must be X,Y,W,H: " + value);
    }

    blossom::CropRegion region{parts[0], parts[1], parts[2], parts[3]};
    region.validate();
    return region;
}

void write_file(const std::string& path, const blossom::ImageBuffer& bytes) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!file.good()) {
        throw std::runtime_error("Failed to write " + path);
    }
}

blossom::ImageBuffer read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open image file: " + path);
    }
    return blossom::ImageBuffer(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

json paths_json(const blossom::ToolPaths& paths) {
    json result = json::object();
    for (const auto& [name, path] : paths) {
        result[name] = path.string();
    }
    return result;
}

void emit(const json& output, const std::string& output_file) {
    if (!output_file.empty()) {
        std::ofstream file(output_file);
        file << output.dump(2);
        std::cout << "Results saved to: " << output_file << std::endl;
    } else {
        std::cout << output.dump(2) << std::endl;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command;
    std::vector<std::string> args;
    std::string data_dir;
    std::string config_file;
    std::string quality = "api";
    std::string crop;
    std::string output_file;
    long long limit = 0;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--data-dir") {
                if (++i < argc) data_dir = argv[i];
            } else if (arg == "--config") {
                if (++i < argc) config_file = argv[i];
            } else if (arg == "--quality") {
                if (++i < argc) quality = argv[i];
            } else if (arg == "--crop") {
                if (++i < argc) crop = argv[i];
            } else if (arg == "--limit") {
                if (++i < argc) limit = std::stoll(argv[i]);
            } else if (arg == "--output") {
                if (++i < argc) output_file = argv[i];
            } else if (arg == "-h" || arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (command.empty()) {
                command = arg;
            } else {
                args.push_back(arg);
            }
        }

        blossom::MediaConfig config;
        if (!config_file.empty()) {
            config = blossom::load_config(config_file);
        }
        blossom::apply_environment(config);
        if (!data_dir.empty()) {
            config.data_dir = data_dir;
        }
        if (limit < 0) {
            throw std::invalid_argument("--limit must be positive");
        }
        if (limit > 0) {
            config.size_limit_bytes = static_cast<size_t>(limit);
        }

        auto need_args = [&](size_t count) {
            if (args.size() < count) {
                throw std::invalid_argument("Missing arguments for '" + command + "'");
            }
        };

        blossom::MediaToolkit toolkit(config);
        auto start_time = std::chrono::steady_clock::now();
        json output;

        if (command == "provision") {
            auto report = toolkit.provision_all();
            output["data_dir"] = toolkit.config().data_dir.string();
            output["video_tools"] = paths_json(report.video_tools);
            output["native_image_library"] = paths_json(report.native_image_library);

        } else if (command == "resolve") {
            need_args(1);
            auto video_id = video_id_from(args[0]);
            auto frame_quality = parse_quality(quality);
            output["video_id"] = video_id;
            output["quality"] = blossom::to_string(frame_quality);
            output["url"] = toolkit.resolve_stream_url(video_id, blossom::tier_for(frame_quality));

        } else if (command == "frame") {
            need_args(2);
            auto video_id = video_id_from(args[0]);
            double timestamp = std::stod(args[1]);
            std::optional<blossom::CropRegion> region;
            if (!crop.empty()) {
                region = parse_crop(crop);
            }

            output["video_id"] = video_id;
            output["timestamp"] = blossom::format_timestamp(timestamp);

            if (!output_file.empty()) {
                auto capture = toolkit.capture_frame(video_id, timestamp, parse_quality(quality), region);
                write_file(output_file, capture.bytes);
                output["path"] = output_file;
                output["media_type"] = blossom::to_mime(capture.media_type);
                output["size"] = capture.bytes.size();
                output_file.clear();
            } else {
                auto filename = toolkit.save_frame(video_id, timestamp, region);
                output["filename"] = filename;
                output["path"] = toolkit.frame_path(filename).string();
            }

        } else if (command == "crop") {
            need_args(1);
            if (crop.empty() || output_file.empty()) {
                throw std::invalid_argument("'crop' requires --crop and --output");
            }
            blossom::RegionCropper cropper;
            auto cropped = cropper.crop(read_file(args[0]), parse_crop(crop));
            write_file(output_file, cropped);
            output["path"] = output_file;
            output["size"] = cropped.size();
            output_file.clear();

        } else if (command == "compress") {
            need_args(1);
            auto result = toolkit.compress_file(args[0]);
            output["source"] = args[0];
            output["media_type"] = blossom::to_mime(result.media_type);
            output["was_compressed"] = result.was_compressed;
            output["exceeded_limit"] = result.exceeded_limit;
            output["final_size"] = result.buffer.size();
            if (result.was_compressed) {
                output["path"] = blossom::ImageCompressor::compressed_path(args[0], result.media_type).string();
            }

        } else if (command == "prepare") {
            need_args(1);
            auto image = toolkit.prepare_image_for_api(args[0]);
            if (!image) {
                throw std::runtime_error("Image not found: " + args[0]);
            }
            output["media_type"] = blossom::to_mime(image->media_type);
            output["was_compressed"] = image->was_compressed;
            output["original_size"] = image->original_size;
            output["final_size"] = image->final_size;
            if (!output_file.empty()) {
                output["base64"] = image->base64;
            } else {
                output["base64_length"] = image->base64.size();
            }

        } else {
            std::cerr << "Error: Unknown command '" << command << "'\n";
            print_usage(argv[0]);
            return 1;
        }

        auto end_time = std::chrono::steady_clock::now();
        output["total_time_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            end_time - start_time).count();

        emit(output, output_file);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
