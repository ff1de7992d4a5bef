#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "cameras/camera_device.hpp"
#include "cameras/camera_fleet.hpp"
#include "cameras/capture_parameters.hpp"
#include "image_storage.hpp"

// largest accepted width or height, bounds the frame allocated per request
constexpr int MAX_CAPTURE_DIMENSION = 8192;

/**
 * @brief Body of a capture request, every field optional
 */
struct capture_request {
    std::optional<std::string> resolution;
    std::optional<int> quality;
    std::optional<std::string> format;
    bool use_extra = false;   // fan out to the secondary cameras
};

/**
 * @brief Service defaults applied to missing request fields
 */
struct capture_defaults {
    std::string resolution = "320x320";
    image_format format = image_format::jpeg;
    int quality = 95;
};

/**
 * @brief Effective, validated capture parameters
 */
struct capture_settings {
    resolution size;
    image_format format;
    int quality;
};

/**
 * @brief One stored capture
 */
struct capture_result {
    int index = 0;                   // 0 = main camera, 1.. = secondaries
    std::string image_id;
    std::string image_url_or_path;   // "/api/images/<id>.<ext>"
};

struct capture_outcome {
    capture_result primary;
    std::chrono::system_clock::time_point timestamp;
    std::optional<std::vector<capture_result>> images;   // only with fan-out, primary first
};

/**
 * @brief Merge request and defaults and validate the result
 *
 * @throws validation_error for a malformed resolution, a side larger than
 *         MAX_CAPTURE_DIMENSION, an unsupported format or a quality outside
 *         [1, 100]
 */
capture_settings resolve_capture_settings(const capture_request& request, const capture_defaults& defaults);

/**
 * @brief ISO-8601 UTC with microseconds, e.g. "2024-05-01T12:00:00.000123Z"
 */
std::string format_utc_timestamp(std::chrono::system_clock::time_point time);

/**
 * @brief Runs one capture request against the fleet
 *
 * The main camera is always captured and must succeed. With fan-out every
 * secondary is captured concurrently; a secondary that fails is logged and
 * left out of the response. Each image is stored before the outcome is
 * returned.
 */
class capture_coordinator {
public:
    capture_coordinator(const camera_fleet& fleet, const image_storage& storage, capture_defaults defaults);

    /**
     * @throws validation_error for invalid input
     * @throws camera_capture_error if the main camera fails
     */
    capture_outcome capture(const capture_request& request) const;

    const capture_defaults& defaults() const { return m_defaults; }

private:
    capture_result capture_primary(const capture_settings& settings) const;
    std::optional<capture_result> try_capture_secondary(icamera_device& device, const capture_settings& settings) const;
    capture_result capture_and_store(icamera_device& device, const capture_settings& settings) const;

    const camera_fleet& m_fleet;
    const image_storage& m_storage;
    capture_defaults m_defaults;
};
