#pragma once

#include <set>
#include <string>
#include <variant>
#include <vector>

/**
 * @brief What a video backend is opened with: a device index or a raw string
 */
using capture_source = std::variant<int, std::string>;

/**
 * @brief Canonical form of a camera source token
 *
 * "0" -> "index:0", "/dev/VIDEO0" -> "dev:/dev/video0", anything else ->
 * "raw:<token>". Surrounding whitespace is ignored.
 */
std::string normalize_camera_source(const std::string& source);

/**
 * @brief Keys used for duplicate detection
 *
 * Two tokens name the same physical device iff their key sets intersect.
 * Index and device path notations are expanded in both directions so that
 * "0" and "/dev/video0" collide whichever one was configured first.
 */
std::set<std::string> source_equivalence_keys(const std::string& source);

/**
 * @brief true if the token selects the simulated camera
 *
 * @param source token, compared trimmed and lowercased against
 *               "", "dummy", "simulator" and "placeholder"
 */
bool is_dummy_source(const std::string& source);

/**
 * @brief Split a comma separated source list, trimming and dropping empty pieces
 */
std::vector<std::string> parse_extra_camera_sources(const std::string& raw_sources);

/**
 * @brief Interpret a token for the video backend
 *
 * @return device index if the token is numeric and fits an int, the trimmed
 *         token otherwise
 */
capture_source resolve_capture_source(const std::string& source);

/**
 * @brief Device index of a numeric token, 0 for every other token
 */
int camera_device_index(const std::string& source);
