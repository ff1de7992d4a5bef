#include "capture_parameters.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <stdexcept>

namespace {

std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool parse_dimension(const std::string& text, int& out)
{
    if (text.empty()) {
        return false;
    }
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto result = std::from_chars(first, last, out);
    return result.ec == std::errc() && result.ptr == last;
}

} // namespace

resolution parse_resolution(const std::string& value)
{
    if (value.empty()) {
        throw std::invalid_argument("Resolution value is required.");
    }

    const std::string lowered = to_lower_copy(value);
    const auto separator = lowered.find('x');
    if (separator == std::string::npos || lowered.find('x', separator + 1) != std::string::npos) {
        throw std::invalid_argument("Resolution must be formatted as '<width>x<height>'.");
    }

    resolution parsed{0, 0};
    if (!parse_dimension(lowered.substr(0, separator), parsed.width) ||
        !parse_dimension(lowered.substr(separator + 1), parsed.height)) {
        throw std::invalid_argument("Resolution dimensions must be integers.");
    }

    if (parsed.width <= 0 || parsed.height <= 0) {
        throw std::invalid_argument("Resolution dimensions must be positive integers.");
    }
    return parsed;
}

image_format parse_image_format(const std::string& value)
{
    const std::string lowered = to_lower_copy(value);
    if (lowered == "jpeg") {
        return image_format::jpeg;
    }
    if (lowered == "png") {
        return image_format::png;
    }
    throw std::invalid_argument("Format must be either 'jpeg' or 'png'.");
}

const char* image_format_name(image_format format)
{
    switch (format) {
        case image_format::jpeg:
            return "jpeg";
        case image_format::png:
            return "png";
    }
    return "jpeg";
}

const char* image_format_extension(image_format format)
{
    switch (format) {
        case image_format::jpeg:
            return "jpg";
        case image_format::png:
            return "png";
    }
    return "jpg";
}
