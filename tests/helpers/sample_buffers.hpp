/**
 * @file sample_buffers.hpp
 * @brief Explicit VR little endian buffers shared by the test suites
 */

#pragma once

#include "medimg/core/dicom_tag.hpp"
#include "medimg/encoding/element_writer.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace medimg::test {

inline constexpr const char* kStudyUid = "1.2.840.113619.2.55.3.604688119";
inline constexpr const char* kSeriesUid = "1.2.840.113619.2.55.3.604688119.1";
inline constexpr const char* kSopUid = "1.2.840.113619.2.55.3.604688119.1.1";
inline constexpr const char* kCtImageStorage = "1.2.840.10008.5.1.4.1.1.2";
inline constexpr const char* kExplicitVrLittleEndian = "1.2.840.10008.1.2.1";

/**
 * @brief Writer pre-filled with a complete CT study header
 */
inline auto study_writer(const std::string& sop_uid = kSopUid,
                         const std::string& study_date = "20240115")
    -> encoding::element_writer {
    using encoding::vr_type;
    namespace tags = core::tags;

    encoding::element_writer writer;
    writer.add_string(tags::transfer_syntax_uid, vr_type::UI, kExplicitVrLittleEndian)
        .add_string(tags::sop_class_uid, vr_type::UI, kCtImageStorage)
        .add_string(tags::sop_instance_uid, vr_type::UI, sop_uid)
        .add_string(tags::study_date, vr_type::DA, study_date)
        .add_string(tags::study_time, vr_type::TM, "143045")
        .add_string(tags::accession_number, vr_type::SH, "ACC0001")
        .add_string(tags::modality, vr_type::CS, "CT")
        .add_string(tags::study_description, vr_type::LO, "CHEST WITH CONTRAST")
        .add_string(tags::patient_name, vr_type::PN, "DOE^JOHN")
        .add_string(tags::patient_id, vr_type::LO, "PAT001")
        .add_string(tags::patient_birth_date, vr_type::DA, "19800101")
        .add_string(tags::patient_sex, vr_type::CS, "M")
        .add_string(tags::study_instance_uid, vr_type::UI, kStudyUid)
        .add_string(tags::series_instance_uid, vr_type::UI, kSeriesUid)
        .add_string(tags::series_number, vr_type::IS, "1")
        .add_string(tags::instance_number, vr_type::IS, "1");
    return writer;
}

/**
 * @brief Study header followed by a rows x columns 8-bit image
 */
inline auto image_buffer(uint16_t rows = 10, uint16_t columns = 10,
                         const std::string& sop_uid = kSopUid,
                         const std::string& study_date = "20240115") -> std::vector<uint8_t> {
    namespace tags = core::tags;

    std::vector<uint8_t> pixels(static_cast<std::size_t>(rows) * columns);
    for (std::size_t i = 0; i < pixels.size(); ++i) {
        pixels[i] = static_cast<uint8_t>(i & 0xFF);
    }

    auto writer = study_writer(sop_uid, study_date);
    writer.add_uint16(tags::rows, rows)
        .add_uint16(tags::columns, columns)
        .add_uint16(tags::bits_allocated, 8)
        .add_uint16(tags::bits_stored, 8)
        .add_binary(tags::pixel_data, encoding::vr_type::OW, pixels);
    return std::move(writer).take();
}

inline void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
}

/**
 * @brief Fresh directory under the system temp path, removed on destruction
 */
class temp_directory {
public:
    explicit temp_directory(const std::string& name)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    temp_directory(const temp_directory&) = delete;
    temp_directory& operator=(const temp_directory&) = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace medimg::test
