/**
 * @file main.cpp
 * @brief DICOM Inspect - metadata summary with a persistent cache
 *
 * Decodes each DICOM file, prints its patient, study, series and image
 * metadata, and stores the study metadata in the configured cache so a
 * second run answers from the cache.
 *
 * Usage:
 *   dcm_inspect <path> [path2 ...] [options]
 *
 * Example:
 *   dcm_inspect image.dcm --validate
 *   dcm_inspect ./dicom_folder/ --backend sqlite --cache-dir /tmp/medimg
 */

#include "dcm_inspect_config.hpp"

#include "medimg/compat/time.hpp"
#include "medimg/di/ilogger.hpp"
#include "medimg/services/dicom_handler.hpp"
#include "medimg/services/validation/dicom_validator.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace {

using namespace medimg;

void print_usage(const char* program_name) {
    std::cout << R"(
DICOM Inspect - Metadata Summary Utility

Usage: )" << program_name
              << R"( <path> [path2 ...] [options]

Arguments:
  path                 DICOM file(s) or directory to inspect

Options:
  -h, --help           Show this help message
  --validate           Validate the decoded metadata
  --cache-dir <dir>    Cache directory (filesystem and sqlite backends)
  --backend <kind>     Cache backend: memory (default), filesystem, sqlite
  --ttl <seconds>      Cache entry lifetime, 0 for no expiry (default: 3600)
  --max-size <size>    Cache size bound, e.g. 512MB, 2GB (default: 2GB)
  --log-level <level>  trace, debug, info, warn (default), error, fatal, off
  --log-dir <dir>      Write medimg.log and audit.json to this directory

Exit Codes:
  0  Success
  1  Error - Invalid arguments
  2  Error - File not found or invalid DICOM file
)";
}

/// Regular files under each path; directories are scanned recursively
std::vector<std::filesystem::path> collect_files(
    const std::vector<std::filesystem::path>& paths) {
    std::vector<std::filesystem::path> files;
    for (const auto& path : paths) {
        std::error_code ec;
        if (std::filesystem::is_directory(path, ec)) {
            for (const auto& entry :
                 std::filesystem::recursive_directory_iterator(path, ec)) {
                if (entry.is_regular_file()) {
                    files.push_back(entry.path());
                }
            }
            if (ec) {
                std::cerr << "Warning: Could not scan " << path.string() << ": "
                          << ec.message() << "\n";
            }
        } else {
            files.push_back(path);
        }
    }
    return files;
}

std::string format_file_size(std::size_t size) {
    std::ostringstream oss;
    if (size >= 1024 * 1024) {
        oss << std::fixed << std::setprecision(2)
            << static_cast<double>(size) / (1024 * 1024) << " MB";
    } else if (size >= 1024) {
        oss << std::fixed << std::setprecision(2) << static_cast<double>(size) / 1024
            << " KB";
    } else {
        oss << size << " bytes";
    }
    return oss.str();
}

void print_field(const char* label, const std::string& value) {
    std::cout << "  " << std::left << std::setw(20) << label
              << (value.empty() ? "(none)" : value) << "\n";
}

void print_summary(const services::processing_result& result, bool from_cache) {
    const auto& metadata = *result.metadata;

    std::cout << "File: " << result.file_path.string() << " ("
              << format_file_size(result.file_size) << ")"
              << (from_cache ? " [study cached]" : "") << "\n";

    std::cout << "Patient\n";
    print_field("Name", metadata.patient.name);
    print_field("ID", metadata.patient.id);
    print_field("Birth Date", metadata.patient.birth_date);
    print_field("Sex", metadata.patient.sex);

    std::cout << "Study\n";
    print_field("Instance UID", metadata.study.instance_uid);
    print_field("Date", metadata.study.date);
    print_field("Time", metadata.study.time);
    print_field("Description", metadata.study.description);
    print_field("Accession Number", metadata.study.accession_number);

    std::cout << "Series\n";
    print_field("Instance UID", metadata.series.instance_uid);
    print_field("Modality", metadata.series.modality);
    print_field("Number", std::to_string(metadata.series.series_number));
    print_field("Description", metadata.series.description);

    std::cout << "Image\n";
    print_field("SOP Instance UID", metadata.sop_instance_uid);
    print_field("Transfer Syntax", metadata.transfer_syntax_uid);
    if (result.image) {
        print_field("Dimensions", std::to_string(result.image->width) + " x " +
                                      std::to_string(result.image->height));
        print_field("Bits", std::to_string(result.image->bits_stored) + "/" +
                                std::to_string(result.image->bits_allocated));
        print_field("Pixel Data", format_file_size(result.image->pixel_data_length));
    } else {
        print_field("Pixel Data", "");
    }
}

void print_validation(const services::validation::validation_result& result) {
    std::cout << "Validation: " << result.summary() << "\n";
    for (const auto& finding : result.findings) {
        std::cout << "  [" << finding.code << "] " << finding.field << ": "
                  << finding.message << "\n";
    }
}

void print_cache_stats(const services::cache::cache_service& cache) {
    const auto stats = cache.get_stats();
    std::cout << "Cache (" << cache.backend_name() << "): " << stats.item_count
              << " items, " << format_file_size(stats.cache_size) << ", hit rate "
              << std::fixed << std::setprecision(1) << stats.hit_rate * 100.0 << "%\n";
    if (stats.oldest_item) {
        std::cout << "  Oldest entry: " << compat::format_iso8601_utc(*stats.oldest_item)
                  << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = tools::parse_arguments(argc, argv);
    if (parsed.is_err()) {
        std::cerr << "Error: " << parsed.error().message << "\n";
        print_usage(argv[0]);
        return 1;
    }
    const auto& config = parsed.value();
    if (config.show_help) {
        print_usage(argv[0]);
        return 0;
    }

    integration::logger_config log_config;
    log_config.min_level = config.log_level;
    log_config.enable_file = !config.log_directory.empty();
    log_config.enable_audit_log = !config.log_directory.empty();
    if (!config.log_directory.empty()) {
        log_config.log_directory = config.log_directory;
    }
    log_config.async_mode = false;
    integration::logger_adapter::initialize(log_config);

    auto cache = services::cache::cache_service::create(
        config.cache, std::make_shared<di::LoggerService>("cache"));
    if (cache.is_err()) {
        std::cerr << "Error: " << cache.error().message << "\n";
        integration::logger_adapter::shutdown();
        return 1;
    }
    auto& cache_service = *cache.value();

    services::dicom_handler handler(std::make_shared<di::LoggerService>("decode"));
    services::validation::dicom_validator validator;

    const auto files = collect_files(config.paths);
    const auto results = handler.batch_process_dicom_files(files);

    int exit_code = 0;
    bool first = true;
    for (const auto& result : results) {
        if (!first) {
            std::cout << "\n";
        }
        first = false;

        if (!result.is_valid || !result.metadata) {
            std::cerr << "Error: " << result.file_path.string() << ": " << result.error
                      << "\n";
            exit_code = 2;
            continue;
        }

        const auto& study_uid = result.metadata->study.instance_uid;
        const bool cached = !study_uid.empty() &&
                            cache_service.get_cached_study_metadata(study_uid).has_value();
        if (!cached) {
            (void)cache_service.cache_study_metadata(*result.metadata);
        }

        print_summary(result, cached);
        if (config.validate) {
            print_validation(validator.validate_metadata(*result.metadata));
        }
    }

    std::cout << "\n";
    print_cache_stats(cache_service);

    integration::logger_adapter::shutdown();
    return exit_code;
}
