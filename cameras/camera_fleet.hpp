#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "camera_device.hpp"

/**
 * @brief Camera sources and capture tuning for the whole fleet
 */
struct fleet_config {
    std::optional<std::string> main_camera_source;    // MAIN_CAMERA_SOURCE
    std::optional<std::string> legacy_camera_source;  // CAMERA_SOURCE, deprecated
    std::string extra_camera_sources;                 // comma separated
    int warmup_frames = 3;
    std::optional<int> buffer_size = 1;
    int read_timeout_ms = 0;
};

/**
 * @brief Outcome of the main source precedence chain
 */
struct primary_source_resolution {
    std::string source;
    bool used_legacy_key;
};

/**
 * @brief Resolve the main camera source
 *
 * MAIN_CAMERA_SOURCE wins; the deprecated CAMERA_SOURCE is only consulted when
 * the main key is missing or blank.
 *
 * @throws camera_configuration_error if neither key yields a source
 */
primary_source_resolution resolve_primary_source(const fleet_config& config);

using camera_device_factory = std::function<std::unique_ptr<icamera_device>(const camera_device_config&)>;

/**
 * @brief Default factory, builds an opencv_camera_device
 */
std::unique_ptr<icamera_device> make_opencv_camera_device(const camera_device_config& config);

/**
 * @brief The started main camera plus the secondaries that came up
 *
 * Built once before the service accepts requests and stopped on shutdown.
 * Secondaries keep their configured order.
 */
class camera_fleet {
public:
    camera_fleet(std::unique_ptr<icamera_device> primary,
                 std::vector<std::unique_ptr<icamera_device>> secondaries);

    /**
     * @brief Destructor, stops every device
     */
    ~camera_fleet();

    camera_fleet(const camera_fleet&) = delete;
    camera_fleet& operator=(const camera_fleet&) = delete;

    /**
     * @brief Build and start the fleet
     *
     * Duplicate sources are rejected before any device is built. The main
     * camera must start; secondaries that fail to start are logged and left
     * out.
     *
     * @throws camera_configuration_error for a missing or duplicated source
     * @throws camera_fleet_startup_error if the main camera cannot start
     */
    static std::unique_ptr<camera_fleet> initialize(const fleet_config& config,
                                                    const camera_device_factory& factory = make_opencv_camera_device);

    icamera_device& primary() const;
    const std::vector<std::unique_ptr<icamera_device>>& secondaries() const;

    /**
     * @brief Stop the main camera and every secondary
     */
    void stop_all();

private:
    std::unique_ptr<icamera_device> m_primary;
    std::vector<std::unique_ptr<icamera_device>> m_secondaries;
};
