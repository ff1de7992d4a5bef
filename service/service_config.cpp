#include "service_config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <system_error>

#include "service_errors.hpp"

namespace {

int read_int(const env_lookup& lookup, const std::string& name, int fallback,
             int min_value, int max_value = std::numeric_limits<int>::max())
{
    std::optional<std::string> raw = lookup(name);
    if (!raw || raw->empty()) {
        return fallback;
    }

    int value = 0;
    try {
        size_t pos = 0;
        value = std::stoi(*raw, &pos);
        if (raw->find_first_not_of(" \t", pos) != std::string::npos) {
            throw std::invalid_argument(*raw);
        }
    } catch (const std::logic_error&) {
        throw configuration_error(name + " must be an integer, got '" + *raw + "'");
    }

    if (value < min_value || value > max_value) {
        throw configuration_error(name + " must be between " + std::to_string(min_value) + " and " +
                                  std::to_string(max_value) + ", got " + std::to_string(value));
    }
    return value;
}

std::string read_string(const env_lookup& lookup, const std::string& name, const std::string& fallback)
{
    std::optional<std::string> raw = lookup(name);
    return raw ? *raw : fallback;
}

} // namespace

std::optional<std::string> process_env(const std::string& name)
{
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

service_config load_service_config(const env_lookup& lookup)
{
    service_config config;

    config.storage_dir = read_string(lookup, "CAMERA_STORAGE_DIR", config.storage_dir.string());
    config.default_resolution = read_string(lookup, "CAMERA_DEFAULT_RESOLUTION", config.default_resolution);

    const std::string format = read_string(lookup, "CAMERA_DEFAULT_FORMAT", "jpeg");
    try {
        config.default_format = parse_image_format(format);
    } catch (const std::invalid_argument&) {
        throw configuration_error("CAMERA_DEFAULT_FORMAT must be either 'jpeg' or 'png', got '" + format + "'");
    }

    config.default_quality = read_int(lookup, "CAMERA_DEFAULT_QUALITY", config.default_quality, 1, 100);

    config.cameras.main_camera_source = lookup("MAIN_CAMERA_SOURCE");
    config.cameras.legacy_camera_source = lookup("CAMERA_SOURCE");
    config.cameras.extra_camera_sources = read_string(lookup, "EXTRA_CAMERA_SOURCES", "");
    config.cameras.warmup_frames = read_int(lookup, "CAMERA_WARMUP_FRAMES", 3, 0);
    config.cameras.buffer_size = read_int(lookup, "CAMERA_BUFFER_SIZE", 1, 1);
    config.cameras.read_timeout_ms = read_int(lookup, "CAMERA_READ_TIMEOUT_MS", 0, 0);

    config.retention = std::chrono::seconds(read_int(lookup, "CAMERA_RETENTION_SECONDS", 3600, 0));
    config.cleanup_interval = std::chrono::seconds(read_int(lookup, "CAMERA_CLEANUP_INTERVAL_SECONDS", 600, 1));

    config.host = read_string(lookup, "SERVICE_HOST", config.host);
    config.port = read_int(lookup, "SERVICE_PORT", config.port, 0, 65535);
    config.worker_threads = read_int(lookup, "SERVICE_WORKER_THREADS", config.worker_threads, 1);
    config.log_file = read_string(lookup, "CAMERA_LOG_FILE", "");

    std::error_code ec;
    std::filesystem::create_directories(config.storage_dir, ec);
    if (ec) {
        throw configuration_error("Cannot create storage directory '" + config.storage_dir.string() +
                                  "': " + ec.message());
    }
    return config;
}
