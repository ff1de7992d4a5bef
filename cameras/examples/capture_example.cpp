#include <iostream>
#include <memory>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "../camera_errors.hpp"
#include "../capture_parameters.hpp"
#include "../opencv_camera_device.hpp"
#include "../source_identity.hpp"

// Make sure the output directory exists
bool ensure_directory_exists(const std::string& path) {
    try {
        if (!std::filesystem::exists(path)) {
            return std::filesystem::create_directories(path);
        }
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Cannot create directory: " << e.what() << std::endl;
        return false;
    }
}

void show_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] [source]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -w WIDTH     frame width (default: 640)" << std::endl;
    std::cout << "  -h HEIGHT    frame height (default: 480)" << std::endl;
    std::cout << "  -f FORMAT    jpeg or png (default: jpeg)" << std::endl;
    std::cout << "  -n COUNT     number of frames to capture (default: 1)" << std::endl;
    std::cout << "  -q QUALITY   JPEG quality 1-100 (default: 95)" << std::endl;
    std::cout << "  -o DIR       output directory (default: output)" << std::endl;
    std::cout << "  --help       show this help" << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program_name << " -w 1280 -h 720 -f png /dev/video0" << std::endl;
    std::cout << "  " << program_name << " -n 3 dummy" << std::endl;
}

int main(int argc, char* argv[])
{
    std::string source = "0";
    int width = 640;
    int height = 480;
    image_format format = image_format::jpeg;
    int quality = 95;
    int count = 1;
    std::string output_dir = "output";

    try {
        for (int i = 1; i < argc; ++i) {
            if (strcmp(argv[i], "--help") == 0) {
                show_usage(argv[0]);
                return 0;
            } else if (strcmp(argv[i], "-w") == 0 && i+1 < argc) {
                width = std::stoi(argv[++i]);
            } else if (strcmp(argv[i], "-h") == 0 && i+1 < argc) {
                height = std::stoi(argv[++i]);
            } else if (strcmp(argv[i], "-f") == 0 && i+1 < argc) {
                format = parse_image_format(argv[++i]);
            } else if (strcmp(argv[i], "-n") == 0 && i+1 < argc) {
                count = std::stoi(argv[++i]);
            } else if (strcmp(argv[i], "-q") == 0 && i+1 < argc) {
                quality = std::stoi(argv[++i]);
            } else if (strcmp(argv[i], "-o") == 0 && i+1 < argc) {
                output_dir = argv[++i];
            } else if (argv[i][0] != '-') {
                source = argv[i];
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        show_usage(argv[0]);
        return 1;
    }

    if (width <= 0 || height <= 0 || count <= 0 || quality < 1 || quality > 100) {
        std::cerr << "Width, height and count must be positive, quality within 1-100" << std::endl;
        return 1;
    }

    std::cout << "Capturing " << count << " frame(s) from '" << source << "' ("
              << normalize_camera_source(source) << ") at " << width << "x" << height << std::endl;

    if (!ensure_directory_exists(output_dir)) {
        return 1;
    }

    camera_device_config config;
    config.source = source;
    config.device_index = camera_device_index(source);
    auto camera = std::make_shared<opencv_camera_device>(config);

    try {
        camera->start();
    } catch (const camera_initialization_error& e) {
        std::cerr << "Failed to start camera: " << e.what() << std::endl;
        return 1;
    }

    const std::vector<int> params = format == image_format::jpeg
        ? std::vector<int>{cv::IMWRITE_JPEG_QUALITY, quality}
        : std::vector<int>{};

    int saved = 0;
    for (int i = 0; i < count; ++i) {
        try {
            frame image = camera->capture_fresh_frame({width, height}, format, quality);

            cv::Mat bgr;
            cv::cvtColor(image.image(), bgr, cv::COLOR_RGB2BGR);

            std::stringstream filename;
            filename << output_dir << "/frame_" << std::setfill('0') << std::setw(4) << image.sequence()
                     << "." << image_format_extension(format);

            if (cv::imwrite(filename.str(), bgr, params)) {
                ++saved;
                std::cout << "Saved: " << filename.str() << std::endl;
            } else {
                std::cerr << "Failed to write " << filename.str() << std::endl;
            }
        } catch (const camera_capture_error& e) {
            std::cerr << "Capture failed: " << e.what() << std::endl;
        } catch (const cv::Exception& e) {
            std::cerr << "OpenCV error: " << e.what() << std::endl;
        }
    }

    camera->stop();

    std::cout << "Done, saved " << saved << " of " << count << " frame(s)" << std::endl;

    return saved == count ? 0 : 1;
}
