#include "capture_coordinator.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "cameras/camera_errors.hpp"
#include "image_codec.hpp"
#include "service_errors.hpp"

namespace {

const char* const IMAGE_URL_PREFIX = "/api/images/";

} // namespace

capture_settings resolve_capture_settings(const capture_request& request, const capture_defaults& defaults)
{
    capture_settings settings{};

    const std::string resolution_value = request.resolution ? *request.resolution : defaults.resolution;
    try {
        settings.size = parse_resolution(resolution_value);
    } catch (const std::invalid_argument& e) {
        spdlog::warn("Failed to parse resolution '{}': {}", resolution_value, e.what());
        throw validation_error(e.what());
    }
    if (settings.size.width > MAX_CAPTURE_DIMENSION || settings.size.height > MAX_CAPTURE_DIMENSION) {
        spdlog::warn("Rejected resolution '{}' above {} pixels per side", resolution_value, MAX_CAPTURE_DIMENSION);
        throw validation_error("Resolution dimensions must not exceed " + std::to_string(MAX_CAPTURE_DIMENSION) +
                               " pixels.");
    }

    if (request.format) {
        try {
            settings.format = parse_image_format(*request.format);
        } catch (const std::invalid_argument& e) {
            throw validation_error(e.what());
        }
    } else {
        settings.format = defaults.format;
    }

    settings.quality = request.quality ? *request.quality : defaults.quality;
    if (settings.quality < 1 || settings.quality > 100) {
        throw validation_error("Quality must be between 1 and 100.");
    }
    return settings;
}

std::string format_utc_timestamp(std::chrono::system_clock::time_point time)
{
    const auto since_epoch = time.time_since_epoch();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - seconds).count();
    if (micros < 0) {
        micros = 0;
    }

    std::time_t time_t_value = static_cast<std::time_t>(seconds.count());
    std::tm utc{};
    gmtime_r(&time_t_value, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(6) << micros << 'Z';
    return out.str();
}

capture_coordinator::capture_coordinator(const camera_fleet& fleet, const image_storage& storage,
                                         capture_defaults defaults)
    : m_fleet(fleet),
      m_storage(storage),
      m_defaults(std::move(defaults))
{
}

capture_outcome capture_coordinator::capture(const capture_request& request) const
{
    const capture_settings settings = resolve_capture_settings(request, m_defaults);

    spdlog::info("Processing capture request resolution={}x{} format={} quality={} use_extra={}",
                 settings.size.width, settings.size.height, image_format_name(settings.format),
                 settings.quality, request.use_extra);

    capture_outcome outcome;
    outcome.primary = capture_primary(settings);
    outcome.timestamp = std::chrono::system_clock::now();

    if (!request.use_extra) {
        return outcome;
    }

    // one task per secondary; results are collected in configured order
    std::vector<std::future<std::optional<capture_result>>> pending;
    for (const auto& device : m_fleet.secondaries()) {
        icamera_device* secondary = device.get();
        pending.push_back(std::async(std::launch::async, [this, secondary, &settings] {
            return try_capture_secondary(*secondary, settings);
        }));
    }

    std::vector<capture_result> images{outcome.primary};
    for (auto& task : pending) {
        std::optional<capture_result> result = task.get();
        if (result) {
            result->index = static_cast<int>(images.size());
            images.push_back(std::move(*result));
        }
    }
    outcome.images = std::move(images);
    return outcome;
}

capture_result capture_coordinator::capture_primary(const capture_settings& settings) const
{
    try {
        capture_result result = capture_and_store(m_fleet.primary(), settings);
        result.index = 0;
        return result;
    } catch (const camera_capture_error& e) {
        spdlog::error("Main camera capture failed resolution={}x{} format={} quality={}: {}",
                      settings.size.width, settings.size.height, image_format_name(settings.format),
                      settings.quality, e.what());
        throw;
    }
}

std::optional<capture_result> capture_coordinator::try_capture_secondary(icamera_device& device,
                                                                         const capture_settings& settings) const
{
    try {
        return capture_and_store(device, settings);
    } catch (const camera_capture_error& e) {
        spdlog::warn("Extra camera capture failed; skipping source '{}': {}", device.source(), e.what());
        return std::nullopt;
    }
}

capture_result capture_coordinator::capture_and_store(icamera_device& device, const capture_settings& settings) const
{
    frame image = device.capture_fresh_frame(settings.size, settings.format, settings.quality);
    std::vector<uint8_t> encoded = encode_frame(image, settings.format, settings.quality);

    capture_result result;
    result.image_id = image_storage::new_image_id();
    std::filesystem::path file_path = m_storage.save_image(encoded, result.image_id, settings.format);
    result.image_url_or_path = IMAGE_URL_PREFIX + file_path.filename().string();

    spdlog::info("Stored captured image at {}", file_path.string());
    return result;
}
