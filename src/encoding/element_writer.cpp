/**
 * @file element_writer.cpp
 * @brief Explicit VR little endian element encoding
 */

#include "medimg/encoding/element_writer.hpp"
#include "medimg/encoding/byte_order.hpp"

namespace medimg::encoding {

element_writer::element_writer(bool with_preamble) {
    if (with_preamble) {
        buffer_.assign(kPreambleSize, 0);
        buffer_.push_back('D');
        buffer_.push_back('I');
        buffer_.push_back('C');
        buffer_.push_back('M');
    }
}

void element_writer::write_header(core::dicom_tag tag, vr_type vr, uint32_t length) {
    write_le16(buffer_, tag.group());
    write_le16(buffer_, tag.element());

    const auto code = to_string(vr);
    buffer_.push_back(static_cast<uint8_t>(code[0]));
    buffer_.push_back(static_cast<uint8_t>(code[1]));

    if (has_explicit_32bit_length(vr)) {
        write_le16(buffer_, 0x0000);  // reserved
        write_le32(buffer_, length);
    } else {
        write_le16(buffer_, static_cast<uint16_t>(length));
    }
}

auto element_writer::add_string(core::dicom_tag tag, vr_type vr, std::string_view value)
    -> element_writer& {
    const bool needs_pad = value.size() % 2 != 0;
    const auto length = static_cast<uint32_t>(value.size() + (needs_pad ? 1 : 0));

    write_header(tag, vr, length);
    buffer_.insert(buffer_.end(), value.begin(), value.end());
    if (needs_pad) {
        buffer_.push_back(static_cast<uint8_t>(padding_char(vr)));
    }
    return *this;
}

auto element_writer::add_uint16(core::dicom_tag tag, uint16_t value) -> element_writer& {
    write_header(tag, vr_type::US, 2);
    write_le16(buffer_, value);
    return *this;
}

auto element_writer::add_uint32(core::dicom_tag tag, uint32_t value) -> element_writer& {
    write_header(tag, vr_type::UL, 4);
    write_le32(buffer_, value);
    return *this;
}

auto element_writer::add_binary(core::dicom_tag tag, vr_type vr,
                                std::span<const uint8_t> value) -> element_writer& {
    const bool needs_pad = value.size() % 2 != 0;
    const auto length = static_cast<uint32_t>(value.size() + (needs_pad ? 1 : 0));

    write_header(tag, vr, length);
    buffer_.insert(buffer_.end(), value.begin(), value.end());
    if (needs_pad) {
        buffer_.push_back(0);
    }
    return *this;
}

auto element_writer::add_header(core::dicom_tag tag, vr_type vr, uint32_t declared_length,
                                std::span<const uint8_t> payload) -> element_writer& {
    write_header(tag, vr, declared_length);
    buffer_.insert(buffer_.end(), payload.begin(), payload.end());
    return *this;
}

auto element_writer::add_raw(std::span<const uint8_t> bytes) -> element_writer& {
    buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    return *this;
}

}  // namespace medimg::encoding
