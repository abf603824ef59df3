/**
 * @file dicom_handler.cpp
 * @brief Implementation of the decode pipeline facade
 */

#include "medimg/services/dicom_handler.hpp"
#include "medimg/core/metadata_assembler.hpp"
#include "medimg/integration/logger_adapter.hpp"

#include <bit>
#include <fstream>
#include <system_error>

namespace medimg::services {

using integration::decode_outcome;
using integration::logger_adapter;

namespace {

[[nodiscard]] auto read_file_contents(const std::filesystem::path& path)
    -> Result<std::vector<uint8_t>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return medimg_error<std::vector<uint8_t>>(error_codes::file_not_found,
                                                  "File not found: " + path.string());
    }

    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return medimg_error<std::vector<uint8_t>>(error_codes::file_read_error,
                                                  "Failed to open file: " + path.string());
    }

    const auto size = file.tellg();
    if (size < 0) {
        return medimg_error<std::vector<uint8_t>>(error_codes::file_read_error,
                                                  "Failed to size file: " + path.string());
    }
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()),
                   static_cast<std::streamsize>(size))) {
        return medimg_error<std::vector<uint8_t>>(error_codes::file_read_error,
                                                  "Failed to read file: " + path.string());
    }
    return Result<std::vector<uint8_t>>::ok(std::move(buffer));
}

auto outcome_for(int code) -> decode_outcome {
    switch (code) {
        case error_codes::file_not_found: return decode_outcome::file_not_found;
        case error_codes::file_read_error: return decode_outcome::read_failure;
        case error_codes::missing_pixel_data: return decode_outcome::missing_pixel_data;
        default: return decode_outcome::malformed_container;
    }
}

auto properties_of(const core::dicom_metadata& metadata, std::size_t pixel_length)
    -> image_properties {
    image_properties info;
    info.width = metadata.image.columns;
    info.height = metadata.image.rows;
    info.bits_allocated = metadata.image.bits_allocated;
    info.bits_stored = metadata.image.bits_stored;
    info.pixel_data_length = pixel_length;
    return info;
}

}  // namespace

dicom_handler::dicom_handler(std::shared_ptr<di::ILogger> logger, core::walker_options options)
    : logger_(logger ? std::move(logger) : di::null_logger()), options_(options) {}

auto dicom_handler::is_valid_dicom(std::span<const uint8_t> buffer) noexcept -> bool {
    return core::is_valid_dicom(buffer);
}

auto dicom_handler::assemble(std::span<const uint8_t> buffer, const std::string& source) const
    -> Result<core::dicom_metadata> {
    auto walked = core::collect_elements(buffer, options_);
    if (walked.is_err()) {
        return Result<core::dicom_metadata>::err(walked.error());
    }

    const auto& walk = walked.value();
    for (const auto& failure : walk.decode_errors) {
        logger_->debug_fmt("{}: skipped {} at offset {}: {}", source,
                           failure.tag.to_string(), failure.offset, failure.error.message);
    }
    if (walk.stop_error) {
        logger_->warn_fmt("{}: element walk stopped early ({}): {}", source,
                          core::to_string(walk.stop_reason), walk.stop_error->message);
    }

    return Result<core::dicom_metadata>::ok(core::metadata_assembler::assemble(walk.elements));
}

auto dicom_handler::parse_metadata(std::span<const uint8_t> buffer,
                                   const std::string& source) const
    -> Result<core::dicom_metadata> {
    auto metadata = assemble(buffer, source);
    if (metadata.is_err()) {
        logger_->error_fmt("Failed to parse DICOM metadata from {}: {}", source,
                           metadata.error().message);
        logger_adapter::log_decode(source, "", "", "", decode_outcome::malformed_container);
        return metadata;
    }

    const auto& m = metadata.value();
    logger_->debug_fmt("Parsed DICOM metadata from {} ({} fields)", source,
                       std::popcount(m.present_fields));
    logger_adapter::log_decode(source, m.patient.name, m.study.instance_uid,
                               m.sop_instance_uid, decode_outcome::success);
    return metadata;
}

auto dicom_handler::extract_image_data(std::span<const uint8_t> buffer,
                                       const std::string& source) const
    -> Result<image_data> {
    auto metadata = assemble(buffer, source);
    if (metadata.is_err()) {
        logger_->error_fmt("Failed to extract image data from {}: {}", source,
                           metadata.error().message);
        return Result<image_data>::err(metadata.error());
    }

    const auto& ref = metadata.value().image.pixel_data;
    if (!ref) {
        logger_adapter::log_decode(source, metadata.value().patient.name,
                                   metadata.value().study.instance_uid,
                                   metadata.value().sop_instance_uid,
                                   decode_outcome::missing_pixel_data);
        return medimg_error<image_data>(error_codes::missing_pixel_data,
                                        "No pixel data found in " + source);
    }

    image_data result;
    result.pixel_data.offset = ref->offset;
    result.pixel_data.length = ref->length;
    result.pixel_data.bytes = encoding::bytes_of(buffer, *ref);
    result.image_info = properties_of(metadata.value(), ref->length);
    result.metadata = std::move(metadata.value());

    logger_->debug_fmt("Extracted image from {}: {}x{}, {} pixel bytes", source,
                       result.image_info.width, result.image_info.height,
                       result.pixel_data.length);
    return Result<image_data>::ok(std::move(result));
}

auto dicom_handler::read_dicom_file(const std::filesystem::path& path) const
    -> Result<std::vector<uint8_t>> {
    auto contents = read_file_contents(path);
    if (contents.is_err()) {
        return contents;
    }
    if (!is_valid_dicom(contents.value())) {
        return medimg_error<std::vector<uint8_t>>(
            error_codes::malformed_container,
            "Not a DICOM file (missing DICM marker or too short): " + path.string());
    }
    return contents;
}

auto dicom_handler::process_dicom_file(const std::filesystem::path& path) const
    -> processing_result {
    processing_result result;
    result.file_path = path;

    logger_->info_fmt("Processing DICOM file {}", path.string());

    auto fail = [&](const error_info& err) {
        result.is_valid = false;
        result.error = err.message;
        result.error_code = err.code;
        result.processed_at = std::chrono::system_clock::now();
        logger_->error_fmt("Failed to process DICOM file {}: {}", path.string(), err.message);
        logger_adapter::log_decode(path.string(), "", "", "", outcome_for(err.code));
        return result;
    };

    auto contents = read_dicom_file(path);
    if (contents.is_err()) {
        return fail(contents.error());
    }
    const auto& buffer = contents.value();
    result.file_size = buffer.size();

    auto metadata = parse_metadata(buffer, path.string());
    if (metadata.is_err()) {
        return fail(metadata.error());
    }

    if (const auto& ref = metadata.value().image.pixel_data) {
        result.image = properties_of(metadata.value(), ref->length);
    } else {
        logger_->warn_fmt("{} has no pixel data", path.string());
    }

    result.metadata = std::move(metadata.value());
    result.is_valid = true;
    result.processed_at = std::chrono::system_clock::now();
    return result;
}

auto dicom_handler::batch_process_dicom_files(std::span<const std::filesystem::path> paths) const
    -> std::vector<processing_result> {
    logger_->info_fmt("Starting batch processing of {} files", paths.size());

    std::vector<processing_result> results;
    results.reserve(paths.size());
    std::size_t failed = 0;
    for (const auto& path : paths) {
        results.push_back(process_dicom_file(path));
        if (!results.back().is_valid) {
            ++failed;
        }
    }

    if (failed > 0) {
        logger_->warn_fmt("Batch processing completed: {} of {} files failed", failed,
                          paths.size());
    } else {
        logger_->info_fmt("Batch processing completed: {} files", paths.size());
    }
    return results;
}

}  // namespace medimg::services
