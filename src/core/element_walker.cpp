/**
 * @file element_walker.cpp
 * @brief Explicit VR little endian element walk
 */

#include "medimg/core/element_walker.hpp"
#include "medimg/compat/format.hpp"
#include "medimg/encoding/byte_order.hpp"

#include <algorithm>
#include <string>

namespace medimg::core {

namespace {

constexpr std::size_t kShortHeaderSize = 8;
constexpr std::size_t kLongHeaderSize = 12;
constexpr uint32_t kUndefinedLength = 0xFFFFFFFF;

}  // namespace

auto is_valid_dicom(std::span<const uint8_t> buffer) noexcept -> bool {
    if (buffer.size() < kDataSetOffset) {
        return false;
    }
    return buffer[kPreambleSize] == 'D' && buffer[kPreambleSize + 1] == 'I' &&
           buffer[kPreambleSize + 2] == 'C' && buffer[kPreambleSize + 3] == 'M';
}

auto to_string(walk_stop_reason reason) noexcept -> std::string_view {
    switch (reason) {
        case walk_stop_reason::none: return "none";
        case walk_stop_reason::end_of_buffer: return "end_of_buffer";
        case walk_stop_reason::truncated_header: return "truncated_header";
        case walk_stop_reason::truncated_element: return "truncated_element";
        case walk_stop_reason::unknown_vr: return "unknown_vr";
        case walk_stop_reason::undefined_length: return "undefined_length";
        case walk_stop_reason::decode_error: return "decode_error";
    }
    return "unknown";
}

// =============================================================================
// element_walker
// =============================================================================

element_walker::element_walker(std::span<const uint8_t> buffer, std::size_t start_offset,
                               walker_options options)
    : buffer_(buffer), offset_(start_offset), options_(options) {}

auto element_walker::create(std::span<const uint8_t> buffer, std::size_t start_offset,
                            walker_options options) -> Result<element_walker> {
    if (!is_valid_dicom(buffer)) {
        return medimg_error<element_walker>(
            error_codes::malformed_container,
            buffer.size() < kDataSetOffset
                ? compat::format("Buffer of {} bytes is too short for a DICOM file",
                                 buffer.size())
                : std::string{"Missing DICM marker at offset 128"});
    }
    if (start_offset > buffer.size()) {
        return medimg_error<element_walker>(
            error_codes::malformed_container,
            compat::format("Start offset {} is past the end of a {} byte buffer",
                           start_offset, buffer.size()));
    }
    return Result<element_walker>::ok(element_walker{buffer, start_offset, options});
}

void element_walker::reset(std::size_t offset) {
    offset_ = std::min(offset, buffer_.size());
    stop_reason_ = walk_stop_reason::none;
    last_error_.reset();
    decode_errors_.clear();
}

void element_walker::stop(walk_stop_reason reason) {
    stop_reason_ = reason;
}

void element_walker::stop(walk_stop_reason reason, int code, std::string message) {
    stop_reason_ = reason;
    last_error_ = error_info{code, std::move(message), "medimg"};
}

auto element_walker::next() -> std::optional<data_element> {
    while (!finished()) {
        const auto remaining = buffer_.size() - offset_;
        if (remaining == 0) {
            stop(walk_stop_reason::end_of_buffer);
            return std::nullopt;
        }
        if (remaining < kShortHeaderSize) {
            stop(walk_stop_reason::truncated_header, error_codes::truncated_element,
                 compat::format("{} trailing bytes at offset {} cannot hold an element header",
                                remaining, offset_));
            return std::nullopt;
        }

        const dicom_tag tag{encoding::read_le16(buffer_, offset_),
                            encoding::read_le16(buffer_, offset_ + 2)};
        const char vr_chars[2] = {static_cast<char>(buffer_[offset_ + 4]),
                                  static_cast<char>(buffer_[offset_ + 5])};
        const auto vr = encoding::from_string(std::string_view{vr_chars, 2});
        if (!vr) {
            stop(walk_stop_reason::unknown_vr, error_codes::unknown_vr,
                 compat::format("Unknown VR '{}{}' for {} at offset {}", vr_chars[0],
                                vr_chars[1], tag.to_string(), offset_));
            return std::nullopt;
        }

        std::size_t header_size = kShortHeaderSize;
        uint32_t length = 0;
        if (encoding::has_explicit_32bit_length(*vr)) {
            if (remaining < kLongHeaderSize) {
                stop(walk_stop_reason::truncated_header, error_codes::truncated_element,
                     compat::format("{} header at offset {} is cut off", tag.to_string(),
                                    offset_));
                return std::nullopt;
            }
            header_size = kLongHeaderSize;
            length = encoding::read_le32(buffer_, offset_ + 8);
        } else {
            length = encoding::read_le16(buffer_, offset_ + 6);
        }

        if (length == kUndefinedLength) {
            stop(walk_stop_reason::undefined_length, error_codes::truncated_element,
                 compat::format("{} at offset {} has undefined length", tag.to_string(),
                                offset_));
            return std::nullopt;
        }

        const auto value_offset = offset_ + header_size;
        if (length > buffer_.size() - value_offset) {
            stop(walk_stop_reason::truncated_element, error_codes::truncated_element,
                 compat::format("{} declares {} bytes but only {} remain", tag.to_string(),
                                length, buffer_.size() - value_offset));
            return std::nullopt;
        }

        data_element element;
        element.tag = tag;
        element.vr = *vr;
        element.length = length;
        element.offset = offset_;
        element.value_offset = value_offset;
        element.raw_value = buffer_.subspan(value_offset, length);
        element.next_offset = value_offset + length;

        offset_ = element.next_offset;

        if (tag == tags::pixel_data) {
            element.value = encoding::binary_ref{value_offset, length};
            return element;
        }

        auto decoded = encoding::decode(*vr, element.raw_value, value_offset);
        if (decoded.is_ok()) {
            element.value = std::move(decoded.value());
            return element;
        }

        decode_errors_.push_back(element_error{tag, element.offset, decoded.error()});
        if (options_.stop_on_decode_error) {
            stop_reason_ = walk_stop_reason::decode_error;
            last_error_ = decoded.error();
            return std::nullopt;
        }
        // Skip the undecodable element; its boundaries are still sound.
    }
    return std::nullopt;
}

// =============================================================================
// collect_elements
// =============================================================================

auto collect_elements(std::span<const uint8_t> buffer, walker_options options)
    -> Result<walk_result> {
    auto walker = element_walker::create(buffer, kDataSetOffset, options);
    if (walker.is_err()) {
        return Result<walk_result>::err(walker.error());
    }

    walk_result result;
    for (const auto& element : walker.value()) {
        result.elements.push_back(element);
    }
    result.stop_reason = walker.value().stop_reason();
    result.stop_error = walker.value().last_error();
    result.decode_errors = walker.value().decode_errors();
    return Result<walk_result>::ok(std::move(result));
}

}  // namespace medimg::core
