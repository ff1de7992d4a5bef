#include "opencv_camera_device.hpp"

#include <algorithm>
#include <chrono>
#include <random>

#include <opencv2/imgproc.hpp>
#include <spdlog/spdlog.h>

#include "camera_errors.hpp"
#include "source_identity.hpp"

namespace {

std::string trim_copy(const std::string& value)
{
    const auto first = value.find_first_not_of(" \t\r\n\f\v");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = value.find_last_not_of(" \t\r\n\f\v");
    return value.substr(first, last - first + 1);
}

int64_t now_us()
{
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
}

} // namespace

/**
 * @brief Constructor
 */
opencv_camera_device::opencv_camera_device(const camera_device_config& config,
                                           video_source_factory source_factory)
    : m_source(trim_copy(config.source)),
      m_device_index(config.device_index),
      m_warmup_frames(std::max(0, config.warmup_frames)),
      m_buffer_size(config.buffer_size && *config.buffer_size > 0 ? config.buffer_size : std::nullopt),
      m_read_timeout_ms(std::max(0, config.read_timeout_ms)),
      m_dummy_mode(is_dummy_source(config.source)),
      m_source_factory(std::move(source_factory)),
      m_sequence(0)
{
}

/**
 * @brief Destructor
 */
opencv_camera_device::~opencv_camera_device()
{
    stop();
}

/**
 * @brief Open the camera device and apply the buffer settings
 */
void opencv_camera_device::start()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (m_state) {
        return;
    }

    if (m_dummy_mode) {
        spdlog::info("Camera '{}' operating in dummy mode; skipping hardware init.", m_source);
        m_state.emplace(dummy_mode{});
        return;
    }

    capture_source target = resolve_capture_source(m_source);
    spdlog::info("Opening camera device '{}'", m_source);

    std::unique_ptr<ivideo_source> capture = m_source_factory ? m_source_factory() : nullptr;
    if (!capture || !capture->open(target) || !capture->is_opened()) {
        if (capture) {
            capture->release();
        }
        throw camera_initialization_error("Unable to open camera source '" + m_source + "'.");
    }

    if (m_buffer_size && !capture->set(cv::CAP_PROP_BUFFERSIZE, *m_buffer_size)) {
        spdlog::warn("Unable to set camera buffer size {} on '{}'", *m_buffer_size, m_source);
    }

    if (m_read_timeout_ms > 0 && !capture->set(cv::CAP_PROP_READ_TIMEOUT_MSEC, m_read_timeout_ms)) {
        spdlog::warn("Unable to set read timeout {} ms on '{}'", m_read_timeout_ms, m_source);
    }

    m_state.emplace(hardware_mode{std::move(capture)});
    spdlog::info("Camera device '{}' ready", m_source);
}

/**
 * @brief Release the camera device
 */
void opencv_camera_device::stop()
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_state) {
        return;
    }

    if (auto* hardware = std::get_if<hardware_mode>(&*m_state)) {
        if (hardware->capture) {
            spdlog::info("Releasing camera source '{}'", m_source);
            hardware->capture->release();
        }
    }
    m_state.reset();
}

bool opencv_camera_device::is_started() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.has_value();
}

/**
 * @brief Capture a new frame
 *
 * Format and quality only matter when the frame is encoded; the device
 * always returns raw RGB pixels.
 */
frame opencv_camera_device::capture_fresh_frame(const resolution& size, image_format /*format*/, int /*quality*/)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    if (!m_state) {
        throw camera_capture_error("Camera has not been started.");
    }

    cv::Mat image;
    if (auto* hardware = std::get_if<hardware_mode>(&*m_state)) {
        if (!hardware->capture) {
            throw camera_capture_error("Camera capture device is unavailable.");
        }
        image = read_hardware_frame(*hardware->capture, size);
    } else {
        image = generate_placeholder_image(size.width, size.height);
    }

    return frame(std::move(image), now_us(), m_sequence++);
}

/**
 * @brief Flush stale frames, read one, resize and convert to RGB
 *
 * Called with m_mutex held.
 */
cv::Mat opencv_camera_device::read_hardware_frame(ivideo_source& capture, const resolution& size)
{
    cv::Mat raw;

    // cameras often hand out a buffered frame after idling
    for (int i = 0; i < m_warmup_frames; ++i) {
        capture.read(raw);
    }

    if (!capture.read(raw) || raw.empty()) {
        throw camera_capture_error("Failed to read frame from camera '" + m_source + "'.");
    }

    cv::Mat sized;
    cv::Mat rgb;
    try {
        if (raw.cols != size.width || raw.rows != size.height) {
            cv::resize(raw, sized, cv::Size(size.width, size.height));
        } else {
            sized = raw;
        }

        switch (sized.channels()) {
            case 1:
                cv::cvtColor(sized, rgb, cv::COLOR_GRAY2RGB);
                break;
            case 4:
                cv::cvtColor(sized, rgb, cv::COLOR_BGRA2RGB);
                break;
            default:
                cv::cvtColor(sized, rgb, cv::COLOR_BGR2RGB);
                break;
        }
    } catch (const cv::Exception& e) {
        throw camera_capture_error(std::string("Failed to convert camera frame: ") + e.what());
    }
    return rgb;
}

const std::string& opencv_camera_device::source() const
{
    return m_source;
}

int opencv_camera_device::get_camera_id() const
{
    return m_device_index;
}

bool opencv_camera_device::is_dummy() const
{
    return m_dummy_mode;
}

int opencv_camera_device::warmup_frames() const
{
    return m_warmup_frames;
}

std::optional<int> opencv_camera_device::buffer_size() const
{
    return m_buffer_size;
}

cv::Mat generate_placeholder_image(int width, int height)
{
    thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<int> channel(64, 192);

    const cv::Scalar base(channel(engine), channel(engine), channel(engine));
    const cv::Scalar white(255, 255, 255);
    const cv::Scalar black(0, 0, 0);

    cv::Mat image(height, width, CV_8UC3, base);

    const int thickness = std::max(1, width / 80);
    cv::line(image, cv::Point(0, 0), cv::Point(width, height), white, thickness);
    cv::line(image, cv::Point(0, height), cv::Point(width, 0), white, thickness);

    const std::string label = std::to_string(width) + "x" + std::to_string(height);
    int baseline = 0;
    const double font_scale = 0.4;
    cv::Size text_size = cv::getTextSize(label, cv::FONT_HERSHEY_SIMPLEX, font_scale, 1, &baseline);
    // putText anchors at the baseline, shift down so the label's top sits at (w/10, h/10)
    cv::putText(image, label, cv::Point(width / 10, height / 10 + text_size.height),
                cv::FONT_HERSHEY_SIMPLEX, font_scale, black, 1);
    return image;
}
