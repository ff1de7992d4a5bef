#pragma once

#include <cstdint>
#include <cstddef>
#include <utility>

#include <opencv2/core.hpp>

/**
 * @brief A decoded RGB frame
 *
 * Holds one height x width x 3, 8-bit RGB image together with the capture
 * timestamp and the per-device sequence number. Every capture produces a new
 * frame; frames are never shared between captures.
 */
class frame {
public:
    /**
     * @brief Default constructor, creates an empty frame
     */
    frame() : m_timestamp(0), m_sequence(0) {}

    /**
     * @brief Wrap an RGB image
     *
     * @param image 8-bit, 3 channel image in RGB order
     * @param timestamp capture time in microseconds (optional)
     * @param sequence capture sequence number (optional)
     */
    explicit frame(cv::Mat image, int64_t timestamp = 0, uint64_t sequence = 0)
        : m_timestamp(timestamp), m_sequence(sequence), m_image(std::move(image)) {}

    /**
     * @brief Pixel data as an OpenCV matrix (RGB order)
     */
    const cv::Mat& image() const { return m_image; }

    int width() const { return m_image.cols; }
    int height() const { return m_image.rows; }
    int channels() const { return m_image.channels(); }
    bool empty() const { return m_image.empty(); }

    /**
     * @brief Size of the pixel data in bytes
     */
    size_t size() const { return m_image.total() * m_image.elemSize(); }

    // move only, a frame owns its pixels
    frame(const frame&) = delete;
    frame& operator=(const frame&) = delete;

    frame(frame&&) = default;
    frame& operator=(frame&&) = default;

    /**
     * @brief Capture time in microseconds since the epoch
     */
    int64_t timestamp() const { return m_timestamp; }
    void set_timestamp(int64_t timestamp) { m_timestamp = timestamp; }

    /**
     * @brief Number of frames the device delivered before this one
     */
    uint64_t sequence() const { return m_sequence; }
    void set_sequence(uint64_t sequence) { m_sequence = sequence; }

protected:
    int64_t m_timestamp;
    uint64_t m_sequence;

private:
    cv::Mat m_image;
};
