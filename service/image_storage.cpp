#include "image_storage.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <functional>
#include <iterator>
#include <random>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "service_errors.hpp"

image_storage::image_storage(std::filesystem::path base_dir)
    : m_base_dir(std::move(base_dir))
{
    std::error_code ec;
    std::filesystem::create_directories(m_base_dir, ec);
    if (ec) {
        throw storage_error("Cannot create storage directory '" + m_base_dir.string() + "': " + ec.message());
    }
}

std::filesystem::path image_storage::save_image(const std::vector<uint8_t>& bytes,
                                                const std::string& image_id,
                                                image_format format) const
{
    std::filesystem::path file_path = m_base_dir / (image_id + "." + image_format_extension(format));

    // O_EXCL: an existing image is never overwritten
    int fd = ::open(file_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw storage_error("Cannot create '" + file_path.string() + "': " + std::strerror(errno));
    }

    const uint8_t* data = bytes.data();
    size_t remaining = bytes.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::strerror(errno);
            ::close(fd);
            throw storage_error("Failed to write image '" + file_path.string() + "': " + reason);
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::close(fd) != 0) {
        throw storage_error("Failed to write image '" + file_path.string() + "': " + std::strerror(errno));
    }
    return file_path;
}

std::filesystem::path image_storage::resolve_image_path(const std::string& filename) const
{
    std::error_code ec;
    const std::filesystem::path base = std::filesystem::weakly_canonical(m_base_dir, ec);
    if (ec) {
        throw storage_error("Cannot resolve storage directory: " + ec.message());
    }

    const std::filesystem::path candidate = std::filesystem::weakly_canonical(base / filename, ec);
    if (ec) {
        throw invalid_image_reference_error("Invalid image path supplied.");
    }

    // the candidate must be a strict descendant of the base directory
    const std::filesystem::path relative = candidate.lexically_relative(base);
    if (filename.empty() || relative.empty() || relative == "." || *relative.begin() == "..") {
        throw invalid_image_reference_error("Invalid image path supplied.");
    }

    if (!std::filesystem::is_regular_file(candidate, ec)) {
        throw image_not_found_error("Image not found.");
    }
    return candidate;
}

std::string image_storage::load_image(const std::string& filename) const
{
    const std::filesystem::path file_path = resolve_image_path(filename);

    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        throw image_not_found_error("Image not found.");
    }
    std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw storage_error("Failed to read image '" + file_path.string() + "'.");
    }
    return bytes;
}

std::string image_storage::guess_media_type(const std::filesystem::path& file_path)
{
    std::string suffix = file_path.extension().string();
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (suffix == ".jpg" || suffix == ".jpeg") {
        return "image/jpeg";
    }
    if (suffix == ".png") {
        return "image/png";
    }
    return "application/octet-stream";
}

std::string image_storage::new_image_id()
{
    // 256 bits of seed per thread
    thread_local std::mt19937_64 engine = [] {
        std::random_device device;
        std::array<std::random_device::result_type, 8> words;
        std::generate(words.begin(), words.end(), std::ref(device));
        std::seed_seq seed(words.begin(), words.end());
        return std::mt19937_64(seed);
    }();

    uint64_t high = engine();
    uint64_t low = engine();
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;    // RFC 4122 variant

    static const char digits[] = "0123456789abcdef";
    std::string id(32, '0');
    for (int i = 0; i < 16; ++i) {
        id[15 - i] = digits[(high >> (4 * i)) & 0xF];
        id[31 - i] = digits[(low >> (4 * i)) & 0xF];
    }
    return id;
}
