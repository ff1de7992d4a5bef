#pragma once
#include <optional>
#include <string>

#include "capture_parameters.hpp"
#include "frame.hpp"

/**
 * @brief Settings for one configured camera source
 */
struct camera_device_config {
    std::string source;                  // source token, e.g. "0", "/dev/video0", "dummy"
    int device_index = 0;                // numeric index of the source, 0 if not numeric
    int warmup_frames = 3;               // frames discarded before every capture
    std::optional<int> buffer_size = 1;  // requested backend buffer depth, unset = backend default
    int read_timeout_ms = 0;             // per read timeout, 0 = backend default
};

class icamera_device {
public:
    virtual ~icamera_device() = default;

    // Open the device. No-op if already started.
    // Throws camera_initialization_error if the device cannot be opened.
    virtual void start() = 0;

    // Release the device. Idempotent.
    virtual void stop() = 0;

    virtual bool is_started() const = 0;

    // Capture a new RGB frame of exactly the requested size.
    // Throws camera_capture_error if not started or the read fails.
    virtual frame capture_fresh_frame(const resolution& size, image_format format, int quality) = 0;

    // Configured source token
    virtual const std::string& source() const = 0;

    // Device index of the source
    virtual int get_camera_id() const = 0;
};
