#include "opencv_video_source.hpp"

#include <spdlog/spdlog.h>

opencv_video_source::~opencv_video_source()
{
    release();
}

/**
 * @brief Open the capture backend
 */
bool opencv_video_source::open(const capture_source& source)
{
    try {
        if (const int* index = std::get_if<int>(&source)) {
            m_capture.open(*index);
        } else {
            m_capture.open(std::get<std::string>(source));
        }
    } catch (const cv::Exception& e) {
        spdlog::error("OpenCV error while opening camera: {}", e.what());
        return false;
    }
    return m_capture.isOpened();
}

bool opencv_video_source::is_opened() const
{
    return m_capture.isOpened();
}

/**
 * @brief Read one frame
 */
bool opencv_video_source::read(cv::Mat& frame)
{
    try {
        return m_capture.read(frame);
    } catch (const cv::Exception& e) {
        spdlog::error("OpenCV error while reading frame: {}", e.what());
        return false;
    }
}

bool opencv_video_source::set(int prop_id, double value)
{
    return m_capture.set(prop_id, value);
}

void opencv_video_source::release()
{
    if (m_capture.isOpened()) {
        m_capture.release();
    }
}

std::unique_ptr<ivideo_source> make_opencv_video_source()
{
    return std::make_unique<opencv_video_source>();
}
