#include <chrono>
#include <filesystem>
#include <memory>
#include <regex>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <opencv2/imgcodecs.hpp>

#include "cameras/camera_errors.hpp"
#include "service/capture_coordinator.hpp"
#include "service/image_storage.hpp"
#include "service/service_errors.hpp"
#include "test_support.hpp"

namespace {

struct fake_fleet {
    fake_camera_device* primary = nullptr;
    std::vector<fake_camera_device*> secondaries;
    std::unique_ptr<camera_fleet> fleet;
};

// secondary sources named "fail*" refuse every capture
fake_fleet make_fleet(bool primary_fails, const std::vector<std::string>& secondary_names)
{
    fake_fleet result;
    auto primary = std::make_unique<fake_camera_device>("main", nullptr, false, primary_fails);
    primary->start();
    result.primary = primary.get();

    std::vector<std::unique_ptr<icamera_device>> secondaries;
    for (const auto& name : secondary_names) {
        auto device = std::make_unique<fake_camera_device>(name, nullptr, false, name.rfind("fail", 0) == 0);
        device->start();
        result.secondaries.push_back(device.get());
        secondaries.push_back(std::move(device));
    }
    result.fleet = std::make_unique<camera_fleet>(std::move(primary), std::move(secondaries));
    return result;
}

std::size_t file_count(const std::filesystem::path& dir)
{
    std::size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            ++count;
        }
    }
    return count;
}

std::string filename_of(const capture_result& result)
{
    return result.image_url_or_path.substr(std::string("/api/images/").size());
}

} // namespace

class CaptureCoordinatorTest : public ::testing::Test {
protected:
    temp_dir dir;
    image_storage storage{dir.path()};
};

TEST_F(CaptureCoordinatorTest, EmptyRequestUsesDefaults)
{
    fake_fleet cameras = make_fleet(false, {"side"});
    capture_coordinator coordinator(*cameras.fleet, storage, capture_defaults{});

    capture_outcome outcome = coordinator.capture(capture_request{});

    EXPECT_EQ(outcome.primary.index, 0);
    EXPECT_TRUE(std::regex_match(outcome.primary.image_id, std::regex("[0-9a-f]{32}")));
    EXPECT_EQ(outcome.primary.image_url_or_path, "/api/images/" + outcome.primary.image_id + ".jpg");
    EXPECT_FALSE(outcome.images.has_value());

    EXPECT_EQ(cameras.primary->captures(), 1);
    EXPECT_EQ(cameras.primary->last_size(), (resolution{320, 320}));
    EXPECT_EQ(cameras.primary->last_quality(), 95);
    EXPECT_EQ(cameras.secondaries[0]->captures(), 0);

    EXPECT_TRUE(std::filesystem::is_regular_file(dir.path() / filename_of(outcome.primary)));
}

TEST_F(CaptureCoordinatorTest, RequestOverridesDefaults)
{
    fake_fleet cameras = make_fleet(false, {});
    capture_coordinator coordinator(*cameras.fleet, storage, capture_defaults{});

    capture_request request;
    request.resolution = "64X48";
    request.format = "PNG";
    request.quality = 50;
    capture_outcome outcome = coordinator.capture(request);

    EXPECT_EQ(cameras.primary->last_size(), (resolution{64, 48}));
    EXPECT_EQ(cameras.primary->last_format(), image_format::png);
    EXPECT_EQ(cameras.primary->last_quality(), 50);

    const std::string url = outcome.primary.image_url_or_path;
    EXPECT_EQ(url.substr(url.size() - 4), ".png");

    cv::Mat decoded = cv::imread((dir.path() / filename_of(outcome.primary)).string());
    EXPECT_EQ(decoded.cols, 64);
    EXPECT_EQ(decoded.rows, 48);
}

TEST_F(CaptureCoordinatorTest, InvalidInputRejectedBeforeAnyCapture)
{
    fake_fleet cameras = make_fleet(false, {"side"});
    capture_coordinator coordinator(*cameras.fleet, storage, capture_defaults{});

    capture_request bad_resolution;
    bad_resolution.resolution = "640-480";
    EXPECT_THROW(coordinator.capture(bad_resolution), validation_error);

    capture_request bad_format;
    bad_format.format = "gif";
    EXPECT_THROW(coordinator.capture(bad_format), validation_error);

    capture_request bad_quality;
    bad_quality.quality = 0;
    EXPECT_THROW(coordinator.capture(bad_quality), validation_error);
    bad_quality.quality = 101;
    EXPECT_THROW(coordinator.capture(bad_quality), validation_error);

    EXPECT_EQ(cameras.primary->captures(), 0);
    EXPECT_EQ(cameras.secondaries[0]->captures(), 0);
    EXPECT_EQ(file_count(dir.path()), 0u);
}

TEST_F(CaptureCoordinatorTest, OversizedResolutionRejectedBeforeCapture)
{
    fake_fleet cameras = make_fleet(false, {});
    capture_coordinator coordinator(*cameras.fleet, storage, capture_defaults{});

    for (const char* value : {"40000x40000", "8193x10", "10x8193", "2147483647x1"}) {
        capture_request request;
        request.resolution = value;
        EXPECT_THROW(coordinator.capture(request), validation_error) << value;
    }
    EXPECT_EQ(cameras.primary->captures(), 0);
    EXPECT_EQ(file_count(dir.path()), 0u);

    capture_request largest;
    largest.resolution = "8192x2";
    coordinator.capture(largest);
    EXPECT_EQ(cameras.primary->last_size(), (resolution{8192, 2}));
}

TEST_F(CaptureCoordinatorTest, InvalidDefaultResolutionSurfacesPerRequest)
{
    fake_fleet cameras = make_fleet(false, {});
    capture_defaults defaults;
    defaults.resolution = "wide";
    capture_coordinator coordinator(*cameras.fleet, storage, defaults);

    EXPECT_THROW(coordinator.capture(capture_request{}), validation_error);

    capture_request explicit_size;
    explicit_size.resolution = "16x16";
    EXPECT_NO_THROW(coordinator.capture(explicit_size));
}

TEST_F(CaptureCoordinatorTest, FanOutListsPrimaryFirst)
{
    fake_fleet cameras = make_fleet(false, {"left", "right"});
    capture_coordinator coordinator(*cameras.fleet, storage, capture_defaults{});

    capture_request request;
    request.use_extra = true;
    capture_outcome outcome = coordinator.capture(request);

    ASSERT_TRUE(outcome.images.has_value());
    const auto& images = *outcome.images;
    ASSERT_EQ(images.size(), 3u);
    for (std::size_t i = 0; i < images.size(); ++i) {
        EXPECT_EQ(images[i].index, static_cast<int>(i));
    }
    EXPECT_EQ(images[0].image_id, outcome.primary.image_id);
    EXPECT_EQ(images[0].image_url_or_path, outcome.primary.image_url_or_path);
    EXPECT_NE(images[1].image_id, images[2].image_id);

    EXPECT_EQ(cameras.secondaries[0]->captures(), 1);
    EXPECT_EQ(cameras.secondaries[1]->captures(), 1);
    EXPECT_EQ(file_count(dir.path()), 3u);
}

TEST_F(CaptureCoordinatorTest, FailingSecondaryIsOmitted)
{
    fake_fleet cameras = make_fleet(false, {"left", "fail-middle", "right"});
    capture_coordinator coordinator(*cameras.fleet, storage, capture_defaults{});

    capture_request request;
    request.use_extra = true;

    log_capture logs;
    capture_outcome outcome = coordinator.capture(request);

    ASSERT_TRUE(outcome.images.has_value());
    ASSERT_EQ(outcome.images->size(), 3u);
    EXPECT_EQ((*outcome.images)[1].index, 1);
    EXPECT_EQ((*outcome.images)[2].index, 2);
    EXPECT_EQ(file_count(dir.path()), 3u);
    EXPECT_NE(logs.text().find("fail-middle"), std::string::npos);
}

TEST_F(CaptureCoordinatorTest, FanOutWithoutSecondariesHoldsOnlyPrimary)
{
    fake_fleet cameras = make_fleet(false, {});
    capture_coordinator coordinator(*cameras.fleet, storage, capture_defaults{});

    capture_request request;
    request.use_extra = true;
    capture_outcome outcome = coordinator.capture(request);

    ASSERT_TRUE(outcome.images.has_value());
    ASSERT_EQ(outcome.images->size(), 1u);
    EXPECT_EQ((*outcome.images)[0].image_id, outcome.primary.image_id);
}

TEST_F(CaptureCoordinatorTest, PrimaryFailurePropagates)
{
    fake_fleet cameras = make_fleet(true, {"side"});
    capture_coordinator coordinator(*cameras.fleet, storage, capture_defaults{});

    capture_request request;
    request.use_extra = true;
    EXPECT_THROW(coordinator.capture(request), camera_capture_error);

    EXPECT_EQ(cameras.secondaries[0]->captures(), 0);
    EXPECT_EQ(file_count(dir.path()), 0u);
}

TEST_F(CaptureCoordinatorTest, DummyFleetStoresDecodableImages)
{
    fleet_config config;
    config.main_camera_source = "dummy";
    config.extra_camera_sources = "placeholder";
    auto fleet = camera_fleet::initialize(config);
    capture_coordinator coordinator(*fleet, storage, capture_defaults{});

    capture_request request;
    request.use_extra = true;
    capture_outcome outcome = coordinator.capture(request);

    ASSERT_TRUE(outcome.images.has_value());
    ASSERT_EQ(outcome.images->size(), 2u);
    for (const auto& image : *outcome.images) {
        cv::Mat decoded = cv::imread((dir.path() / filename_of(image)).string());
        EXPECT_EQ(decoded.cols, 320);
        EXPECT_EQ(decoded.rows, 320);
    }
}

TEST(CaptureSettings, MergesRequestOverDefaults)
{
    capture_defaults defaults;
    defaults.resolution = "100x50";
    defaults.format = image_format::png;
    defaults.quality = 80;

    capture_settings fallback = resolve_capture_settings(capture_request{}, defaults);
    EXPECT_EQ(fallback.size, (resolution{100, 50}));
    EXPECT_EQ(fallback.format, image_format::png);
    EXPECT_EQ(fallback.quality, 80);

    capture_request request;
    request.resolution = "10x20";
    request.format = "jpeg";
    request.quality = 1;
    capture_settings merged = resolve_capture_settings(request, defaults);
    EXPECT_EQ(merged.size, (resolution{10, 20}));
    EXPECT_EQ(merged.format, image_format::jpeg);
    EXPECT_EQ(merged.quality, 1);
}

TEST(CaptureSettings, FormatsUtcTimestampWithMicroseconds)
{
    using namespace std::chrono;
    const system_clock::time_point epoch{};

    EXPECT_EQ(format_utc_timestamp(epoch), "1970-01-01T00:00:00.000000Z");
    EXPECT_EQ(format_utc_timestamp(epoch + milliseconds(1500)), "1970-01-01T00:00:01.500000Z");
    EXPECT_EQ(format_utc_timestamp(epoch + seconds(86400) + microseconds(42)), "1970-01-02T00:00:00.000042Z");
}
