#pragma once

#include <functional>
#include <memory>

#include <opencv2/core.hpp>

#include "source_identity.hpp"

/**
 * @brief Hardware handle of one camera
 *
 * Wraps the video backend so devices can be driven by an in-memory source
 * in tests. Frames are delivered in the backend's native BGR order.
 */
class ivideo_source {
public:
    virtual ~ivideo_source() = default;

    /**
     * @brief Open the backend
     *
     * @param source device index or device path / URL
     * @return true if the backend is open and usable
     */
    virtual bool open(const capture_source& source) = 0;

    virtual bool is_opened() const = 0;

    /**
     * @brief Grab and decode the next frame
     *
     * @param frame receives the BGR image
     * @return false if no frame could be read
     */
    virtual bool read(cv::Mat& frame) = 0;

    /**
     * @brief Set a backend property (cv::CAP_PROP_*)
     *
     * @return false if the backend rejected the value
     */
    virtual bool set(int prop_id, double value) = 0;

    virtual void release() = 0;
};

using video_source_factory = std::function<std::unique_ptr<ivideo_source>()>;
