#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <variant>

#include "camera_device.hpp"
#include "opencv_video_source.hpp"

/**
 * @brief Camera device driven through a video source, or simulated
 *
 * Dummy tokens ("", "dummy", "simulator", "placeholder") never touch
 * hardware: captures return a synthesized placeholder frame. Every other
 * token opens a video source on start(). All operations are serialized by
 * the device mutex, so concurrent captures on one device never share the
 * handle.
 */
class opencv_camera_device : public icamera_device {
public:
    /**
     * @brief Constructor
     *
     * @param config source token and capture tuning
     * @param source_factory creates the hardware handle on start()
     */
    explicit opencv_camera_device(const camera_device_config& config,
                                  video_source_factory source_factory = make_opencv_video_source);

    /**
     * @brief Destructor, releases the device
     */
    ~opencv_camera_device() override;

    opencv_camera_device(const opencv_camera_device&) = delete;
    opencv_camera_device& operator=(const opencv_camera_device&) = delete;

    void start() override;
    void stop() override;
    bool is_started() const override;
    frame capture_fresh_frame(const resolution& size, image_format format, int quality) override;
    const std::string& source() const override;
    int get_camera_id() const override;

    /**
     * @brief true if the device synthesizes frames instead of reading hardware
     */
    bool is_dummy() const;

    int warmup_frames() const;
    std::optional<int> buffer_size() const;

private:
    struct dummy_mode {};
    struct hardware_mode {
        std::unique_ptr<ivideo_source> capture;
    };
    // engaged = started
    using started_state = std::variant<dummy_mode, hardware_mode>;

    cv::Mat read_hardware_frame(ivideo_source& capture, const resolution& size);

    std::string m_source;                    // trimmed source token
    int m_device_index;
    int m_warmup_frames;
    std::optional<int> m_buffer_size;
    int m_read_timeout_ms;
    bool m_dummy_mode;
    video_source_factory m_source_factory;

    std::optional<started_state> m_state;
    uint64_t m_sequence;
    mutable std::mutex m_mutex;
};

/**
 * @brief Synthesize the placeholder image used in dummy mode
 *
 * Random base color, two white diagonals and a "<width>x<height>" label.
 *
 * @return RGB image of exactly height x width x 3
 */
cv::Mat generate_placeholder_image(int width, int height);
