#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every camera related failure
 */
class camera_error : public std::runtime_error {
public:
    explicit camera_error(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The camera device could not be opened or configured
 */
class camera_initialization_error : public camera_error {
public:
    explicit camera_initialization_error(const std::string& message) : camera_error(message) {}
};

/**
 * @brief The camera failed to deliver a fresh frame
 */
class camera_capture_error : public camera_error {
public:
    explicit camera_capture_error(const std::string& message) : camera_error(message) {}
};

/**
 * @brief The configured camera sources are unusable (missing or duplicated)
 */
class camera_configuration_error : public camera_error {
public:
    explicit camera_configuration_error(const std::string& message) : camera_error(message) {}
};

/**
 * @brief The main camera could not be started, the fleet is unusable
 */
class camera_fleet_startup_error : public camera_error {
public:
    explicit camera_fleet_startup_error(const std::string& message) : camera_error(message) {}
};
