#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "cameras/capture_parameters.hpp"

/**
 * @brief Flat-file image store
 *
 * Images live directly in the base directory as "<image-id>.<ext>". Files
 * are only ever created here; the retention sweeper removes them.
 */
class image_storage {
public:
    /**
     * @brief Constructor, creates the base directory if needed
     */
    explicit image_storage(std::filesystem::path base_dir);

    const std::filesystem::path& base_dir() const { return m_base_dir; }

    /**
     * @brief Write encoded bytes as "<image_id>.<ext>"
     *
     * @return path of the written file
     * @throws storage_error if the file already exists or cannot be written
     */
    std::filesystem::path save_image(const std::vector<uint8_t>& bytes,
                                     const std::string& image_id,
                                     image_format format) const;

    /**
     * @brief Resolve a file name inside the base directory
     *
     * @throws invalid_image_reference_error if the name escapes the directory
     * @throws image_not_found_error if no such image exists
     */
    std::filesystem::path resolve_image_path(const std::string& filename) const;

    /**
     * @brief Read the bytes of a stored image
     *
     * @throws the same errors as resolve_image_path, storage_error on read failure
     */
    std::string load_image(const std::string& filename) const;

    /**
     * @brief MIME type from the file extension
     */
    static std::string guess_media_type(const std::filesystem::path& file_path);

    /**
     * @brief New random image id, 32 lowercase hex digits (UUID version 4)
     */
    static std::string new_image_id();

private:
    std::filesystem::path m_base_dir;
};
