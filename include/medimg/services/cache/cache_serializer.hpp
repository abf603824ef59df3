/**
 * @file cache_serializer.hpp
 * @brief Byte encodings of the value types cache_service stores
 *
 * cache_service::get<T>/set<T> accept any T with a cache_serializer<T>
 * specialization. Encodings are little-endian with u32 length prefixes and a
 * leading type tag, so reading a key as the wrong type fails cleanly with
 * serialization_error instead of yielding garbage.
 */

#pragma once

#include "medimg/core/dicom_metadata.hpp"
#include "medimg/core/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace medimg::services::cache {

/**
 * @brief Primary template; intentionally undefined
 */
template <typename T>
struct cache_serializer;

template <>
struct cache_serializer<std::string> {
    [[nodiscard]] static auto serialize(const std::string& value) -> std::vector<uint8_t>;
    [[nodiscard]] static auto deserialize(std::span<const uint8_t> bytes) -> Result<std::string>;
};

/// Raw bytes (pixel data); stored with a tag byte but otherwise verbatim
template <>
struct cache_serializer<std::vector<uint8_t>> {
    [[nodiscard]] static auto serialize(const std::vector<uint8_t>& value)
        -> std::vector<uint8_t>;
    [[nodiscard]] static auto deserialize(std::span<const uint8_t> bytes)
        -> Result<std::vector<uint8_t>>;
};

/// Search results: an ordered list of strings (typically UIDs)
template <>
struct cache_serializer<std::vector<std::string>> {
    [[nodiscard]] static auto serialize(const std::vector<std::string>& value)
        -> std::vector<uint8_t>;
    [[nodiscard]] static auto deserialize(std::span<const uint8_t> bytes)
        -> Result<std::vector<std::string>>;
};

/**
 * @brief Full dicom_metadata including present_fields and the pixel data
 *        reference
 */
template <>
struct cache_serializer<core::dicom_metadata> {
    [[nodiscard]] static auto serialize(const core::dicom_metadata& value)
        -> std::vector<uint8_t>;
    [[nodiscard]] static auto deserialize(std::span<const uint8_t> bytes)
        -> Result<core::dicom_metadata>;
};

}  // namespace medimg::services::cache
