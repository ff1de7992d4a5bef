#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class for failures raised by the service layer
 */
class service_error : public std::runtime_error {
public:
    explicit service_error(const std::string& message) : std::runtime_error(message) {}
};

// invalid environment configuration, fatal at startup
class configuration_error : public service_error {
public:
    explicit configuration_error(const std::string& message) : service_error(message) {}
};

// rejected client input, raised before any camera is touched
class validation_error : public service_error {
public:
    explicit validation_error(const std::string& message) : service_error(message) {}
};

// image reference that escapes the storage directory
class invalid_image_reference_error : public service_error {
public:
    explicit invalid_image_reference_error(const std::string& message) : service_error(message) {}
};

class image_not_found_error : public service_error {
public:
    explicit image_not_found_error(const std::string& message) : service_error(message) {}
};

// encoding or writing an image failed
class storage_error : public service_error {
public:
    explicit storage_error(const std::string& message) : service_error(message) {}
};
