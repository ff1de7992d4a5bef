#pragma once

#include <cstdint>
#include <vector>

#include "cameras/capture_parameters.hpp"
#include "cameras/frame.hpp"

/**
 * @brief Encode an RGB frame as JPEG or PNG
 *
 * @param quality JPEG quality in [1, 100], ignored for PNG
 * @throws storage_error if OpenCV cannot encode the frame
 */
std::vector<uint8_t> encode_frame(const frame& image, image_format format, int quality);
