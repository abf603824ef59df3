/**
 * @file cache_serializer.cpp
 * @brief Implementation of the cache value encodings
 */

#include "medimg/services/cache/cache_serializer.hpp"

#include "medimg/encoding/byte_order.hpp"

#include <optional>

namespace medimg::services::cache {

namespace {

enum class value_tag : uint8_t {
    text = 0x01,
    bytes = 0x02,
    string_list = 0x03,
    metadata = 0x04
};

// Layout version of the metadata record; bump when fields change
constexpr uint8_t kMetadataVersion = 1;

class byte_sink {
public:
    explicit byte_sink(value_tag tag) { buffer_.push_back(static_cast<uint8_t>(tag)); }

    void u8(uint8_t value) { buffer_.push_back(value); }
    void u32(uint32_t value) { encoding::write_le32(buffer_, value); }
    void i64(int64_t value) { encoding::write_le64(buffer_, static_cast<uint64_t>(value)); }
    void u64(uint64_t value) { encoding::write_le64(buffer_, value); }

    void text(std::string_view value) {
        u32(static_cast<uint32_t>(value.size()));
        buffer_.insert(buffer_.end(), value.begin(), value.end());
    }

    void raw(std::span<const uint8_t> value) {
        buffer_.insert(buffer_.end(), value.begin(), value.end());
    }

    [[nodiscard]] auto take() && -> std::vector<uint8_t> { return std::move(buffer_); }

private:
    std::vector<uint8_t> buffer_;
};

/**
 * @brief Bounds-checked reader; every accessor returns nullopt past the end
 */
class byte_source {
public:
    explicit byte_source(std::span<const uint8_t> bytes) : bytes_(bytes) {}

    [[nodiscard]] auto expect(value_tag tag) -> bool {
        auto value = u8();
        return value && *value == static_cast<uint8_t>(tag);
    }

    [[nodiscard]] auto u8() -> std::optional<uint8_t> {
        if (remaining() < 1) {
            return std::nullopt;
        }
        return bytes_[offset_++];
    }

    [[nodiscard]] auto u32() -> std::optional<uint32_t> {
        if (remaining() < 4) {
            return std::nullopt;
        }
        const auto value = encoding::read_le32(bytes_, offset_);
        offset_ += 4;
        return value;
    }

    [[nodiscard]] auto u64() -> std::optional<uint64_t> {
        if (remaining() < 8) {
            return std::nullopt;
        }
        const auto value = encoding::read_le64(bytes_, offset_);
        offset_ += 8;
        return value;
    }

    [[nodiscard]] auto i64() -> std::optional<int64_t> {
        auto value = u64();
        if (!value) {
            return std::nullopt;
        }
        return static_cast<int64_t>(*value);
    }

    [[nodiscard]] auto text() -> std::optional<std::string> {
        auto length = u32();
        if (!length || remaining() < *length) {
            return std::nullopt;
        }
        std::string value(reinterpret_cast<const char*>(bytes_.data() + offset_), *length);
        offset_ += *length;
        return value;
    }

    [[nodiscard]] auto rest() -> std::span<const uint8_t> {
        auto value = bytes_.subspan(offset_);
        offset_ = bytes_.size();
        return value;
    }

    [[nodiscard]] auto remaining() const noexcept -> std::size_t {
        return bytes_.size() - offset_;
    }

private:
    std::span<const uint8_t> bytes_;
    std::size_t offset_{0};
};

template <typename T>
auto corrupt(std::string_view what) -> Result<T> {
    return medimg_error<T>(error_codes::serialization_error,
                           "Cached value is not a valid " + std::string{what});
}

/**
 * @brief Reads a run of fields, remembering whether any read failed
 */
struct field_reader {
    byte_source& source;
    bool failed{false};

    void read(std::string& out) {
        if (auto value = source.text()) {
            out = std::move(*value);
        } else {
            failed = true;
        }
    }

    void read(int64_t& out) {
        if (auto value = source.i64()) {
            out = *value;
        } else {
            failed = true;
        }
    }
};

}  // namespace

// ============================================================================
// std::string
// ============================================================================

auto cache_serializer<std::string>::serialize(const std::string& value)
    -> std::vector<uint8_t> {
    byte_sink sink(value_tag::text);
    sink.text(value);
    return std::move(sink).take();
}

auto cache_serializer<std::string>::deserialize(std::span<const uint8_t> bytes)
    -> Result<std::string> {
    byte_source source(bytes);
    if (!source.expect(value_tag::text)) {
        return corrupt<std::string>("string");
    }
    auto value = source.text();
    if (!value || source.remaining() != 0) {
        return corrupt<std::string>("string");
    }
    return Result<std::string>::ok(std::move(*value));
}

// ============================================================================
// std::vector<uint8_t>
// ============================================================================

auto cache_serializer<std::vector<uint8_t>>::serialize(const std::vector<uint8_t>& value)
    -> std::vector<uint8_t> {
    byte_sink sink(value_tag::bytes);
    sink.raw(value);
    return std::move(sink).take();
}

auto cache_serializer<std::vector<uint8_t>>::deserialize(std::span<const uint8_t> bytes)
    -> Result<std::vector<uint8_t>> {
    byte_source source(bytes);
    if (!source.expect(value_tag::bytes)) {
        return corrupt<std::vector<uint8_t>>("byte buffer");
    }
    auto rest = source.rest();
    return Result<std::vector<uint8_t>>::ok(std::vector<uint8_t>(rest.begin(), rest.end()));
}

// ============================================================================
// std::vector<std::string>
// ============================================================================

auto cache_serializer<std::vector<std::string>>::serialize(
    const std::vector<std::string>& value) -> std::vector<uint8_t> {
    byte_sink sink(value_tag::string_list);
    sink.u32(static_cast<uint32_t>(value.size()));
    for (const auto& item : value) {
        sink.text(item);
    }
    return std::move(sink).take();
}

auto cache_serializer<std::vector<std::string>>::deserialize(std::span<const uint8_t> bytes)
    -> Result<std::vector<std::string>> {
    using result_type = Result<std::vector<std::string>>;
    byte_source source(bytes);
    if (!source.expect(value_tag::string_list)) {
        return corrupt<std::vector<std::string>>("string list");
    }
    auto count = source.u32();
    // Each item carries at least its 4-byte length
    if (!count || *count > source.remaining() / 4) {
        return corrupt<std::vector<std::string>>("string list");
    }

    std::vector<std::string> items;
    items.reserve(*count);
    for (uint32_t i = 0; i < *count; ++i) {
        auto item = source.text();
        if (!item) {
            return corrupt<std::vector<std::string>>("string list");
        }
        items.push_back(std::move(*item));
    }
    if (source.remaining() != 0) {
        return corrupt<std::vector<std::string>>("string list");
    }
    return result_type::ok(std::move(items));
}

// ============================================================================
// core::dicom_metadata
// ============================================================================

auto cache_serializer<core::dicom_metadata>::serialize(const core::dicom_metadata& value)
    -> std::vector<uint8_t> {
    byte_sink sink(value_tag::metadata);
    sink.u8(kMetadataVersion);
    sink.u32(value.present_fields);

    sink.text(value.patient.name);
    sink.text(value.patient.id);
    sink.text(value.patient.birth_date);
    sink.text(value.patient.sex);

    sink.text(value.study.instance_uid);
    sink.text(value.study.date);
    sink.text(value.study.time);
    sink.text(value.study.description);
    sink.text(value.study.accession_number);
    sink.i64(value.study.number_of_series);
    sink.i64(value.study.number_of_instances);

    sink.text(value.series.instance_uid);
    sink.text(value.series.date);
    sink.text(value.series.time);
    sink.text(value.series.description);
    sink.text(value.series.modality);
    sink.i64(value.series.series_number);
    sink.i64(value.series.number_of_instances);

    sink.i64(value.image.instance_number);
    sink.i64(value.image.rows);
    sink.i64(value.image.columns);
    sink.i64(value.image.bits_allocated);
    sink.i64(value.image.bits_stored);
    sink.u8(value.image.pixel_data ? 1 : 0);
    if (value.image.pixel_data) {
        sink.u64(value.image.pixel_data->offset);
        sink.u64(value.image.pixel_data->length);
    }

    sink.text(value.sop_instance_uid);
    sink.text(value.sop_class_uid);
    sink.text(value.transfer_syntax_uid);
    return std::move(sink).take();
}

auto cache_serializer<core::dicom_metadata>::deserialize(std::span<const uint8_t> bytes)
    -> Result<core::dicom_metadata> {
    byte_source source(bytes);
    if (!source.expect(value_tag::metadata)) {
        return corrupt<core::dicom_metadata>("metadata record");
    }
    auto version = source.u8();
    if (!version || *version != kMetadataVersion) {
        return medimg_error<core::dicom_metadata>(error_codes::serialization_error,
                                                  "Unsupported cached metadata version");
    }
    auto present = source.u32();
    if (!present) {
        return corrupt<core::dicom_metadata>("metadata record");
    }

    core::dicom_metadata m;
    m.present_fields = *present;
    field_reader in{source};

    in.read(m.patient.name);
    in.read(m.patient.id);
    in.read(m.patient.birth_date);
    in.read(m.patient.sex);

    in.read(m.study.instance_uid);
    in.read(m.study.date);
    in.read(m.study.time);
    in.read(m.study.description);
    in.read(m.study.accession_number);
    in.read(m.study.number_of_series);
    in.read(m.study.number_of_instances);

    in.read(m.series.instance_uid);
    in.read(m.series.date);
    in.read(m.series.time);
    in.read(m.series.description);
    in.read(m.series.modality);
    in.read(m.series.series_number);
    in.read(m.series.number_of_instances);

    in.read(m.image.instance_number);
    in.read(m.image.rows);
    in.read(m.image.columns);
    in.read(m.image.bits_allocated);
    in.read(m.image.bits_stored);

    auto has_pixels = source.u8();
    if (in.failed || !has_pixels || *has_pixels > 1) {
        return corrupt<core::dicom_metadata>("metadata record");
    }
    if (*has_pixels == 1) {
        auto offset = source.u64();
        auto length = source.u64();
        if (!offset || !length) {
            return corrupt<core::dicom_metadata>("metadata record");
        }
        m.image.pixel_data = encoding::binary_ref{static_cast<std::size_t>(*offset),
                                                  static_cast<std::size_t>(*length)};
    }

    in.read(m.sop_instance_uid);
    in.read(m.sop_class_uid);
    in.read(m.transfer_syntax_uid);
    if (in.failed || source.remaining() != 0) {
        return corrupt<core::dicom_metadata>("metadata record");
    }
    return Result<core::dicom_metadata>::ok(std::move(m));
}

}  // namespace medimg::services::cache
