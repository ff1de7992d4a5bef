#include "image_codec.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include "service_errors.hpp"

std::vector<uint8_t> encode_frame(const frame& image, image_format format, int quality)
{
    if (image.empty()) {
        throw storage_error("Cannot encode an empty frame.");
    }

    std::vector<uint8_t> encoded;
    try {
        // imencode expects BGR
        cv::Mat bgr;
        cv::cvtColor(image.image(), bgr, cv::COLOR_RGB2BGR);

        std::vector<int> params;
        const char* extension = ".png";
        if (format == image_format::jpeg) {
            extension = ".jpg";
            params = {cv::IMWRITE_JPEG_QUALITY, quality, cv::IMWRITE_JPEG_OPTIMIZE, 1};
        }

        if (!cv::imencode(extension, bgr, encoded, params)) {
            throw storage_error(std::string("Failed to encode frame as ") + image_format_name(format) + ".");
        }
    } catch (const cv::Exception& e) {
        throw storage_error(std::string("Failed to encode frame: ") + e.what());
    }
    return encoded;
}
