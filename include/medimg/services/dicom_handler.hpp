/**
 * @file dicom_handler.hpp
 * @brief Decode pipeline facade: buffer or file in, metadata and pixels out
 *
 * Ties the element walker and metadata assembler together and adds the
 * file-system edge: reading .dcm files and batch processing in which each
 * file fails on its own without aborting the batch.
 */

#pragma once

#include "medimg/core/dicom_metadata.hpp"
#include "medimg/core/element_walker.hpp"
#include "medimg/core/result.hpp"
#include "medimg/di/ilogger.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace medimg::services {

/**
 * @brief Location and view of the pixel data element value
 *
 * bytes views the buffer given to extract_image_data() and is only valid
 * while that buffer lives.
 */
struct pixel_data_ref {
    std::size_t offset{0};
    std::size_t length{0};
    std::span<const uint8_t> bytes;
};

/**
 * @brief Image geometry taken from the metadata
 */
struct image_properties {
    int64_t width{0};               ///< Columns
    int64_t height{0};              ///< Rows
    int64_t bits_allocated{0};
    int64_t bits_stored{0};
    std::size_t pixel_data_length{0};

    auto operator==(const image_properties&) const -> bool = default;
};

/**
 * @brief Output of extract_image_data()
 */
struct image_data {
    pixel_data_ref pixel_data;
    image_properties image_info;
    core::dicom_metadata metadata;
};

/**
 * @brief Per-file outcome of process_dicom_file()
 */
struct processing_result {
    std::filesystem::path file_path;
    std::size_t file_size{0};
    bool is_valid{false};
    std::optional<core::dicom_metadata> metadata;
    std::optional<image_properties> image;   ///< Absent when the file has no pixel data
    std::string error;                       ///< Empty when is_valid
    int error_code{0};
    std::chrono::system_clock::time_point processed_at;
};

/**
 * @class dicom_handler
 * @brief Stateless decode facade; safe to share across threads
 *
 * @example
 * @code
 * dicom_handler handler(std::make_shared<di::LoggerService>());
 * auto metadata = handler.parse_metadata(bytes);
 * if (metadata.is_ok()) {
 *     std::cout << metadata.value().patient.name << "\n";
 * }
 * auto results = handler.batch_process_dicom_files(paths);
 * @endcode
 */
class dicom_handler {
public:
    explicit dicom_handler(std::shared_ptr<di::ILogger> logger = nullptr,
                           core::walker_options options = {});

    [[nodiscard]] static auto is_valid_dicom(std::span<const uint8_t> buffer) noexcept
        -> bool;

    /**
     * @brief Walk and assemble the buffer's metadata
     *
     * A truncated or undecodable tail keeps the elements read before it.
     *
     * @param source Label written to the audit trail (file path or buffer name)
     * @return The metadata, or malformed_container when the buffer fails the
     *         container pre-check
     */
    [[nodiscard]] auto parse_metadata(std::span<const uint8_t> buffer,
                                      const std::string& source = "buffer") const
        -> Result<core::dicom_metadata>;

    /**
     * @brief Locate the pixel data and pair it with the image geometry
     *
     * @return The image data; malformed_container for a bad container,
     *         missing_pixel_data when no (7FE0,0010) element was found
     */
    [[nodiscard]] auto extract_image_data(std::span<const uint8_t> buffer,
                                          const std::string& source = "buffer") const
        -> Result<image_data>;

    /**
     * @brief Read a whole file and check its container
     *
     * @return The bytes; file_not_found, file_read_error or
     *         malformed_container
     */
    [[nodiscard]] auto read_dicom_file(const std::filesystem::path& path) const
        -> Result<std::vector<uint8_t>>;

    /**
     * @brief Read, decode and extract one file; never fails
     */
    [[nodiscard]] auto process_dicom_file(const std::filesystem::path& path) const
        -> processing_result;

    /**
     * @brief process_dicom_file() for each path, in order; never fails
     */
    [[nodiscard]] auto batch_process_dicom_files(
        std::span<const std::filesystem::path> paths) const -> std::vector<processing_result>;

private:
    auto assemble(std::span<const uint8_t> buffer, const std::string& source) const
        -> Result<core::dicom_metadata>;

    std::shared_ptr<di::ILogger> logger_;
    core::walker_options options_;
};

}  // namespace medimg::services
