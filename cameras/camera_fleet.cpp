#include "camera_fleet.hpp"

#include <algorithm>
#include <iterator>
#include <set>

#include <spdlog/spdlog.h>

#include "camera_errors.hpp"
#include "opencv_camera_device.hpp"
#include "source_identity.hpp"

namespace {

bool is_blank(const std::optional<std::string>& value)
{
    return !value || value->find_first_not_of(" \t\r\n\f\v") == std::string::npos;
}

bool keys_intersect(const std::set<std::string>& lhs, const std::set<std::string>& rhs)
{
    std::vector<std::string> common;
    std::set_intersection(lhs.begin(), lhs.end(), rhs.begin(), rhs.end(), std::back_inserter(common));
    return !common.empty();
}

camera_device_config make_device_config(const std::string& source, const fleet_config& config)
{
    camera_device_config device_config;
    device_config.source = source;
    device_config.device_index = camera_device_index(source);
    device_config.warmup_frames = config.warmup_frames;
    device_config.buffer_size = config.buffer_size;
    device_config.read_timeout_ms = config.read_timeout_ms;
    return device_config;
}

void reject_duplicate_sources(const std::string& primary_source, const std::vector<std::string>& extra_sources)
{
    const std::set<std::string> primary_keys = source_equivalence_keys(primary_source);
    std::vector<std::set<std::string>> seen;

    for (const auto& extra : extra_sources) {
        std::set<std::string> keys = source_equivalence_keys(extra);
        if (keys_intersect(primary_keys, keys)) {
            spdlog::error("Extra camera source '{}' duplicates main camera source '{}' ({})",
                          extra, primary_source, normalize_camera_source(primary_source));
            throw camera_configuration_error("Extra camera source '" + extra +
                                             "' duplicates main camera source '" + primary_source + "'.");
        }
        for (const auto& other : seen) {
            if (keys_intersect(other, keys)) {
                spdlog::error("Extra camera source '{}' is configured more than once", extra);
                throw camera_configuration_error("Extra camera source '" + extra + "' is configured more than once.");
            }
        }
        seen.push_back(std::move(keys));
    }
}

} // namespace

primary_source_resolution resolve_primary_source(const fleet_config& config)
{
    if (!is_blank(config.main_camera_source)) {
        return {*config.main_camera_source, false};
    }
    if (!is_blank(config.legacy_camera_source)) {
        return {*config.legacy_camera_source, true};
    }
    throw camera_configuration_error("Main camera source is not configured; set MAIN_CAMERA_SOURCE.");
}

std::unique_ptr<icamera_device> make_opencv_camera_device(const camera_device_config& config)
{
    return std::make_unique<opencv_camera_device>(config);
}

camera_fleet::camera_fleet(std::unique_ptr<icamera_device> primary,
                           std::vector<std::unique_ptr<icamera_device>> secondaries)
    : m_primary(std::move(primary)),
      m_secondaries(std::move(secondaries))
{
    if (!m_primary) {
        throw std::invalid_argument("camera_fleet requires a main camera");
    }
}

camera_fleet::~camera_fleet()
{
    stop_all();
}

std::unique_ptr<camera_fleet> camera_fleet::initialize(const fleet_config& config,
                                                       const camera_device_factory& factory)
{
    const primary_source_resolution primary = resolve_primary_source(config);
    if (primary.used_legacy_key) {
        spdlog::warn("CAMERA_SOURCE is deprecated; use MAIN_CAMERA_SOURCE instead (source '{}')", primary.source);
    }

    const std::vector<std::string> extra_sources = parse_extra_camera_sources(config.extra_camera_sources);

    // no device may be opened while the configuration claims one twice
    reject_duplicate_sources(primary.source, extra_sources);

    std::unique_ptr<icamera_device> main_device = factory(make_device_config(primary.source, config));
    try {
        main_device->start();
    } catch (const camera_initialization_error& e) {
        spdlog::critical("Failed to initialize main camera source '{}': {}", primary.source, e.what());
        throw camera_fleet_startup_error("Failed to initialize main camera source '" + primary.source +
                                         "': " + e.what());
    }
    spdlog::info("Main camera source '{}' started ({})", primary.source, normalize_camera_source(primary.source));

    std::vector<std::unique_ptr<icamera_device>> secondaries;
    for (const auto& extra : extra_sources) {
        std::unique_ptr<icamera_device> device = factory(make_device_config(extra, config));
        try {
            device->start();
        } catch (const camera_initialization_error& e) {
            spdlog::warn("Failed to initialize extra camera source; ignoring source. source='{}' error='{}'",
                         extra, e.what());
            continue;
        }
        spdlog::info("Extra camera source '{}' started", extra);
        secondaries.push_back(std::move(device));
    }

    return std::make_unique<camera_fleet>(std::move(main_device), std::move(secondaries));
}

icamera_device& camera_fleet::primary() const
{
    return *m_primary;
}

const std::vector<std::unique_ptr<icamera_device>>& camera_fleet::secondaries() const
{
    return m_secondaries;
}

void camera_fleet::stop_all()
{
    m_primary->stop();
    for (auto& device : m_secondaries) {
        device->stop();
    }
}
