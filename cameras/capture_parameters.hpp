#pragma once

#include <string>

/**
 * @brief Encodings a capture can be stored as
 */
enum class image_format {
    jpeg,
    png,
};

/**
 * @brief Requested frame size in pixels
 */
struct resolution {
    int width;
    int height;
};

inline bool operator==(const resolution& lhs, const resolution& rhs)
{
    return lhs.width == rhs.width && lhs.height == rhs.height;
}

/**
 * @brief Parse "<width>x<height>", the separator is case-insensitive
 *
 * @throws std::invalid_argument if the value is empty, malformed, or either
 *         dimension is not a strictly positive integer
 */
resolution parse_resolution(const std::string& value);

/**
 * @brief Parse "jpeg" or "png" (case-insensitive)
 *
 * @throws std::invalid_argument for any other value
 */
image_format parse_image_format(const std::string& value);

/**
 * @brief "jpeg" or "png"
 */
const char* image_format_name(image_format format);

/**
 * @brief File extension without the dot: "jpg" or "png"
 */
const char* image_format_extension(image_format format);
