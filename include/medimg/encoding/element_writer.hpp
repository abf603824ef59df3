/**
 * @file element_writer.hpp
 * @brief Builder for explicit VR little endian Part-10-like buffers
 *
 * The inverse of the element walker: emits the 128-byte preamble, the
 * "DICM" marker and a flat run of elements. Values are padded to even
 * length with the VR's padding character.
 *
 * @example
 * @code
 * auto bytes = element_writer{}
 *     .add_string(tags::patient_name, vr_type::PN, "DOE^JOHN")
 *     .add_uint16(tags::rows, 512)
 *     .add_binary(tags::pixel_data, vr_type::OW, pixels)
 *     .build();
 * @endcode
 */

#pragma once

#include "medimg/core/dicom_tag.hpp"
#include "medimg/encoding/vr_type.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace medimg::encoding {

class element_writer {
public:
    static constexpr std::size_t kPreambleSize = 128;
    static constexpr std::size_t kHeaderSize = kPreambleSize + 4;

    /**
     * @brief Start a buffer, with or without preamble and "DICM"
     */
    explicit element_writer(bool with_preamble = true);

    auto add_string(core::dicom_tag tag, vr_type vr, std::string_view value)
        -> element_writer&;

    auto add_uint16(core::dicom_tag tag, uint16_t value) -> element_writer&;

    auto add_uint32(core::dicom_tag tag, uint32_t value) -> element_writer&;

    auto add_binary(core::dicom_tag tag, vr_type vr, std::span<const uint8_t> value)
        -> element_writer&;

    /**
     * @brief Emit a header that declares declared_length bytes followed by
     *        only the given payload (used to produce truncated tails)
     */
    auto add_header(core::dicom_tag tag, vr_type vr, uint32_t declared_length,
                    std::span<const uint8_t> payload = {}) -> element_writer&;

    /**
     * @brief Append bytes verbatim
     */
    auto add_raw(std::span<const uint8_t> bytes) -> element_writer&;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return buffer_.size(); }

    [[nodiscard]] auto build() const -> std::vector<uint8_t> { return buffer_; }

    [[nodiscard]] auto take() && -> std::vector<uint8_t> { return std::move(buffer_); }

private:
    void write_header(core::dicom_tag tag, vr_type vr, uint32_t length);

    std::vector<uint8_t> buffer_;
};

}  // namespace medimg::encoding
