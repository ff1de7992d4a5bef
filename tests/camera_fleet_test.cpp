#include <memory>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "cameras/camera_errors.hpp"
#include "cameras/camera_fleet.hpp"
#include "cameras/opencv_camera_device.hpp"
#include "test_support.hpp"

namespace {

fleet_config sources(const std::string& main, const std::string& extra = "")
{
    fleet_config config;
    config.main_camera_source = main;
    config.extra_camera_sources = extra;
    return config;
}

std::vector<std::string> secondary_sources(const camera_fleet& fleet)
{
    std::vector<std::string> result;
    for (const auto& device : fleet.secondaries()) {
        result.push_back(device->source());
    }
    return result;
}

} // namespace

TEST(PrimarySource, MainKeyWins)
{
    fleet_config config;
    config.main_camera_source = "/dev/video1";
    config.legacy_camera_source = "0";

    primary_source_resolution resolved = resolve_primary_source(config);
    EXPECT_EQ(resolved.source, "/dev/video1");
    EXPECT_FALSE(resolved.used_legacy_key);
}

TEST(PrimarySource, FallsBackToLegacyKey)
{
    fleet_config config;
    config.legacy_camera_source = "0";

    primary_source_resolution resolved = resolve_primary_source(config);
    EXPECT_EQ(resolved.source, "0");
    EXPECT_TRUE(resolved.used_legacy_key);
}

TEST(PrimarySource, BlankMainKeyCountsAsUnset)
{
    fleet_config config;
    config.main_camera_source = "   ";
    config.legacy_camera_source = "dummy";

    primary_source_resolution resolved = resolve_primary_source(config);
    EXPECT_EQ(resolved.source, "dummy");
    EXPECT_TRUE(resolved.used_legacy_key);
}

TEST(PrimarySource, MissingEverywhereIsConfigurationError)
{
    fleet_config config;
    EXPECT_THROW(resolve_primary_source(config), camera_configuration_error);

    config.main_camera_source = "";
    config.legacy_camera_source = " ";
    EXPECT_THROW(resolve_primary_source(config), camera_configuration_error);
}

TEST(CameraFleet, LegacyKeyLogsDeprecationWarning)
{
    auto log = std::make_shared<fake_device_log>();
    fleet_config config;
    config.legacy_camera_source = "0";

    log_capture logs;
    auto fleet = camera_fleet::initialize(config, fake_device_factory(log));
    EXPECT_EQ(fleet->primary().source(), "0");
    EXPECT_NE(logs.text().find("CAMERA_SOURCE is deprecated"), std::string::npos);
}

TEST(CameraFleet, DuplicateOfMainFailsBeforeAnyDeviceIsBuilt)
{
    auto log = std::make_shared<fake_device_log>();

    EXPECT_THROW(camera_fleet::initialize(sources("0", "/dev/video0"), fake_device_factory(log)),
                 camera_configuration_error);
    EXPECT_THROW(camera_fleet::initialize(sources("/dev/video2", "1,2"), fake_device_factory(log)),
                 camera_configuration_error);

    EXPECT_TRUE(log->built.empty());
    EXPECT_TRUE(log->started.empty());
}

TEST(CameraFleet, DuplicateAmongSecondariesRejected)
{
    auto log = std::make_shared<fake_device_log>();

    EXPECT_THROW(camera_fleet::initialize(sources("0", "1, /dev/video1"), fake_device_factory(log)),
                 camera_configuration_error);
    EXPECT_TRUE(log->started.empty());
}

TEST(CameraFleet, MainStartFailureIsFatal)
{
    auto log = std::make_shared<fake_device_log>();

    log_capture logs;
    EXPECT_THROW(camera_fleet::initialize(sources("/dev/video0", "1,2"), fake_device_factory(log, {"/dev/video0"})),
                 camera_fleet_startup_error);

    EXPECT_EQ(log->started, (std::vector<std::string>{"/dev/video0"}));
    EXPECT_NE(logs.text().find("Failed to initialize main camera source"), std::string::npos);
}

TEST(CameraFleet, FailedSecondaryIsDroppedInOrder)
{
    auto log = std::make_shared<fake_device_log>();

    log_capture logs;
    auto fleet = camera_fleet::initialize(sources("0", "cam-a, cam-b ,cam-c"),
                                          fake_device_factory(log, {"cam-b"}));

    EXPECT_EQ(fleet->primary().source(), "0");
    EXPECT_TRUE(fleet->primary().is_started());
    EXPECT_EQ(secondary_sources(*fleet), (std::vector<std::string>{"cam-a", "cam-c"}));
    EXPECT_EQ(log->started, (std::vector<std::string>{"0", "cam-a", "cam-b", "cam-c"}));

    const std::string text = logs.text();
    EXPECT_NE(text.find("Failed to initialize extra camera source; ignoring source."), std::string::npos);
    EXPECT_NE(text.find("cam-b"), std::string::npos);
}

TEST(CameraFleet, DeviceConfigCarriesTuning)
{
    auto log = std::make_shared<fake_device_log>();
    fleet_config config = sources("3", "/dev/video4");
    config.warmup_frames = 5;
    config.buffer_size = 2;
    config.read_timeout_ms = 250;

    auto fleet = camera_fleet::initialize(config, fake_device_factory(log));

    ASSERT_EQ(log->configs.size(), 2u);
    EXPECT_EQ(log->configs[0].source, "3");
    EXPECT_EQ(log->configs[0].device_index, 3);
    EXPECT_EQ(log->configs[0].warmup_frames, 5);
    EXPECT_EQ(log->configs[0].buffer_size, std::optional<int>(2));
    EXPECT_EQ(log->configs[0].read_timeout_ms, 250);
    EXPECT_EQ(log->configs[1].source, "/dev/video4");
}

TEST(CameraFleet, StopAllStopsEveryDevice)
{
    auto log = std::make_shared<fake_device_log>();
    auto fleet = camera_fleet::initialize(sources("0", "1,2"), fake_device_factory(log));

    fleet->stop_all();
    EXPECT_FALSE(fleet->primary().is_started());
    for (const auto& device : fleet->secondaries()) {
        EXPECT_FALSE(device->is_started());
    }
    EXPECT_EQ(log->stopped, (std::vector<std::string>{"0", "1", "2"}));
}

TEST(CameraFleet, DestructorStopsDevices)
{
    auto log = std::make_shared<fake_device_log>();
    {
        auto fleet = camera_fleet::initialize(sources("0", "1"), fake_device_factory(log));
    }
    EXPECT_EQ(log->stopped, (std::vector<std::string>{"0", "1"}));
}

TEST(CameraFleet, RejectsMissingMainDevice)
{
    EXPECT_THROW(camera_fleet(nullptr, {}), std::invalid_argument);
}

TEST(CameraFleet, DummySourcesStartWithDefaultFactory)
{
    auto fleet = camera_fleet::initialize(sources("dummy", "simulator"));

    ASSERT_EQ(fleet->secondaries().size(), 1u);
    EXPECT_TRUE(fleet->primary().is_started());
    EXPECT_TRUE(fleet->secondaries()[0]->is_started());

    frame image = fleet->primary().capture_fresh_frame({40, 30}, image_format::jpeg, 95);
    EXPECT_EQ(image.width(), 40);
    EXPECT_EQ(image.height(), 30);
}
