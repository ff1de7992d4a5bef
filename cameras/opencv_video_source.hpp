#pragma once

#include <memory>

#include <opencv2/videoio.hpp>

#include "video_source.hpp"

/**
 * @brief Video source backed by cv::VideoCapture
 *
 * Numeric sources are opened by index (V4L2 on Linux), anything else is
 * handed to OpenCV as a path or URL.
 */
class opencv_video_source : public ivideo_source {
public:
    opencv_video_source() = default;
    ~opencv_video_source() override;

    bool open(const capture_source& source) override;
    bool is_opened() const override;
    bool read(cv::Mat& frame) override;
    bool set(int prop_id, double value) override;
    void release() override;

private:
    cv::VideoCapture m_capture;
};

std::unique_ptr<ivideo_source> make_opencv_video_source();
