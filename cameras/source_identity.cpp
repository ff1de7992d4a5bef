#include "source_identity.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace {

const char* const DEVICE_PATH_PREFIX = "/dev/video";

std::string trim_copy(const std::string& value)
{
    const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

std::string to_lower_copy(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_all_digits(const std::string& value)
{
    return !value.empty() &&
           std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// Decimal digits without leading zeros, so "007" and "7" share one key
// whatever their magnitude.
std::string canonical_index(const std::string& digits)
{
    auto first = digits.find_first_not_of('0');
    if (first == std::string::npos) {
        return "0";
    }
    return digits.substr(first);
}

bool starts_with(const std::string& value, const std::string& prefix)
{
    return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

std::string normalize_camera_source(const std::string& source)
{
    const std::string token = trim_copy(source);
    const std::string token_lower = to_lower_copy(token);

    if (is_all_digits(token)) {
        return "index:" + canonical_index(token);
    }
    if (starts_with(token_lower, DEVICE_PATH_PREFIX)) {
        return "dev:" + token_lower;
    }
    return "raw:" + token;
}

std::set<std::string> source_equivalence_keys(const std::string& source)
{
    const std::string token = trim_copy(source);
    const std::string token_lower = to_lower_copy(token);
    std::set<std::string> keys{normalize_camera_source(token)};

    std::string digits;
    if (is_all_digits(token)) {
        digits = token;
    } else if (starts_with(token_lower, DEVICE_PATH_PREFIX)) {
        std::string suffix = token_lower.substr(std::string(DEVICE_PATH_PREFIX).size());
        if (is_all_digits(suffix)) {
            digits = suffix;
        }
    }

    if (!digits.empty()) {
        const std::string index = canonical_index(digits);
        keys.insert("index:" + index);
        keys.insert(std::string("dev:") + DEVICE_PATH_PREFIX + index);
    }
    return keys;
}

bool is_dummy_source(const std::string& source)
{
    static const std::set<std::string> dummy_sources{"", "dummy", "simulator", "placeholder"};
    return dummy_sources.count(to_lower_copy(trim_copy(source))) > 0;
}

std::vector<std::string> parse_extra_camera_sources(const std::string& raw_sources)
{
    std::vector<std::string> sources;
    std::string::size_type start = 0;
    while (start <= raw_sources.size()) {
        auto comma = raw_sources.find(',', start);
        if (comma == std::string::npos) {
            comma = raw_sources.size();
        }
        std::string token = trim_copy(raw_sources.substr(start, comma - start));
        if (!token.empty()) {
            sources.push_back(std::move(token));
        }
        start = comma + 1;
    }
    return sources;
}

capture_source resolve_capture_source(const std::string& source)
{
    const std::string token = trim_copy(source);
    if (is_all_digits(token)) {
        const std::string index = canonical_index(token);
        const std::string max_index = std::to_string(std::numeric_limits<int>::max());
        if (index.size() < max_index.size() ||
            (index.size() == max_index.size() && index <= max_index)) {
            return std::stoi(index);
        }
    }
    return token;
}

int camera_device_index(const std::string& source)
{
    capture_source resolved = resolve_capture_source(source);
    if (const int* index = std::get_if<int>(&resolved)) {
        return *index;
    }
    return 0;
}
