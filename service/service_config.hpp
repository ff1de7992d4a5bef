#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "cameras/camera_fleet.hpp"
#include "cameras/capture_parameters.hpp"

/**
 * @brief Process configuration, read from environment variables
 */
struct service_config {
    std::filesystem::path storage_dir = "./data/images";   // CAMERA_STORAGE_DIR
    std::string default_resolution = "320x320";            // CAMERA_DEFAULT_RESOLUTION
    image_format default_format = image_format::jpeg;      // CAMERA_DEFAULT_FORMAT
    int default_quality = 95;                              // CAMERA_DEFAULT_QUALITY
    fleet_config cameras;                                  // sources, warm-up, buffer size, read timeout
    std::chrono::seconds retention{3600};                  // CAMERA_RETENTION_SECONDS
    std::chrono::seconds cleanup_interval{600};            // CAMERA_CLEANUP_INTERVAL_SECONDS
    std::string host = "0.0.0.0";                          // SERVICE_HOST
    int port = 8200;                                       // SERVICE_PORT
    int worker_threads = 8;                                // SERVICE_WORKER_THREADS
    std::string log_file;                                  // CAMERA_LOG_FILE
};

// Returns the value of an environment variable, or nullopt when unset.
using env_lookup = std::function<std::optional<std::string>(const std::string&)>;

std::optional<std::string> process_env(const std::string& name);

/**
 * @brief Build the configuration from the environment
 *
 * Missing variables keep their defaults. The storage directory is created.
 *
 * @throws configuration_error for malformed or out-of-range values
 */
service_config load_service_config(const env_lookup& lookup = process_env);
