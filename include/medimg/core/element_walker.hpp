/**
 * @file element_walker.hpp
 * @brief Sequential walker over explicit VR little endian data elements
 *
 * The walker reads one element per step from a caller-owned buffer:
 *
 * @code
 *  offset  size  field
 *  0       2     group   (LE)
 *  2       2     element (LE)
 *  4       2     VR      (ASCII)
 *  6       2     length  (LE)                    short form
 *  6       2     reserved, 8: 4-byte length (LE) long form (OB OW SQ UN UT ...)
 * @endcode
 *
 * Iteration stops at the end of the buffer or at the first boundary
 * violation; elements already produced stay valid. The walker never reads
 * past the buffer and never throws on malformed input.
 *
 * @see DICOM PS3.5 Section 7.1.2 - Data Element Structure with Explicit VR
 */

#pragma once

#include "medimg/core/dicom_tag.hpp"
#include "medimg/core/result.hpp"
#include "medimg/encoding/vr_decoder.hpp"
#include "medimg/encoding/vr_type.hpp"

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <span>
#include <vector>

namespace medimg::core {

/// Size of the Part 10 preamble that precedes the "DICM" marker
inline constexpr std::size_t kPreambleSize = 128;

/// Offset of the first data element (preamble + "DICM")
inline constexpr std::size_t kDataSetOffset = kPreambleSize + 4;

/**
 * @brief Container pre-check: at least 132 bytes and "DICM" at offset 128
 *
 * Trailing content is not inspected.
 */
[[nodiscard]] auto is_valid_dicom(std::span<const uint8_t> buffer) noexcept -> bool;

/**
 * @brief One element produced by a walk step
 *
 * raw_value views the caller's buffer and is only valid while that buffer
 * lives. Pixel data (7FE0,0010) is always a binary_ref.
 */
struct data_element {
    dicom_tag tag;
    encoding::vr_type vr{encoding::vr_type::UN};
    uint32_t length{0};               ///< Declared value length
    std::size_t offset{0};            ///< Offset of the element header
    std::size_t value_offset{0};      ///< Offset of the first value byte
    std::span<const uint8_t> raw_value;
    encoding::decoded_value value;
    std::size_t next_offset{0};       ///< offset + header size + length
};

/**
 * @brief Why a walk ended
 */
enum class walk_stop_reason {
    none,               ///< Still walking
    end_of_buffer,      ///< Consumed the buffer exactly
    truncated_header,   ///< Fewer bytes left than an element header needs
    truncated_element,  ///< Declared length exceeds the remaining bytes
    unknown_vr,         ///< VR characters are not a known code
    undefined_length,   ///< 0xFFFFFFFF length (nested sequences are unsupported)
    decode_error,       ///< Payload failed to decode and options asked to stop
};

[[nodiscard]] auto to_string(walk_stop_reason reason) noexcept -> std::string_view;

/**
 * @brief An element whose payload failed to decode
 */
struct element_error {
    dicom_tag tag;
    std::size_t offset{0};
    error_info error;
};

struct walker_options {
    /// Stop the walk on a payload decode error instead of skipping the element
    bool stop_on_decode_error{false};
};

/**
 * @class element_walker
 * @brief Restartable, finite iteration over a buffer's data elements
 *
 * Thread Safety: a walker is a cursor and must not be shared between
 * threads; any number of walkers may read the same buffer concurrently.
 *
 * @example
 * @code
 * auto walker = element_walker::create(bytes);
 * if (walker.is_err()) {
 *     return;  // malformed_container
 * }
 * for (const auto& element : walker.value()) {
 *     use(element.tag, element.value);
 * }
 * @endcode
 */
class element_walker {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = data_element;
        using difference_type = std::ptrdiff_t;
        using pointer = const data_element*;
        using reference = const data_element&;

        iterator() = default;
        explicit iterator(element_walker* walker) : walker_(walker) { advance(); }

        [[nodiscard]] auto operator*() const -> reference { return *current_; }
        [[nodiscard]] auto operator->() const -> pointer { return &*current_; }

        auto operator++() -> iterator& {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        [[nodiscard]] friend auto operator==(const iterator& it, std::default_sentinel_t) noexcept
            -> bool {
            return !it.current_.has_value();
        }

    private:
        void advance() { current_ = walker_ != nullptr ? walker_->next() : std::nullopt; }

        element_walker* walker_{nullptr};
        std::optional<data_element> current_;
    };

    /**
     * @brief Create a walker positioned at start_offset
     *
     * @return The walker, or malformed_container when the buffer fails
     *         is_valid_dicom() or start_offset is outside the buffer
     */
    [[nodiscard]] static auto create(std::span<const uint8_t> buffer,
                                     std::size_t start_offset = kDataSetOffset,
                                     walker_options options = {})
        -> Result<element_walker>;

    /**
     * @brief Produce the next element, or nullopt once the walk has ended
     */
    [[nodiscard]] auto next() -> std::optional<data_element>;

    /**
     * @brief Restart from an offset previously returned as next_offset
     */
    void reset(std::size_t offset);

    [[nodiscard]] auto offset() const noexcept -> std::size_t { return offset_; }

    [[nodiscard]] auto finished() const noexcept -> bool {
        return stop_reason_ != walk_stop_reason::none;
    }

    [[nodiscard]] auto stop_reason() const noexcept -> walk_stop_reason { return stop_reason_; }

    /**
     * @brief Error that ended the walk, if it ended on a violation
     */
    [[nodiscard]] auto last_error() const -> const std::optional<error_info>& {
        return last_error_;
    }

    /**
     * @brief Elements skipped because their payload failed to decode
     */
    [[nodiscard]] auto decode_errors() const noexcept -> const std::vector<element_error>& {
        return decode_errors_;
    }

    [[nodiscard]] auto buffer() const noexcept -> std::span<const uint8_t> { return buffer_; }

    [[nodiscard]] auto begin() -> iterator { return iterator{this}; }
    [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t { return {}; }

private:
    element_walker(std::span<const uint8_t> buffer, std::size_t start_offset,
                   walker_options options);

    void stop(walk_stop_reason reason);
    void stop(walk_stop_reason reason, int code, std::string message);

    std::span<const uint8_t> buffer_;
    std::size_t offset_{0};
    walker_options options_;
    walk_stop_reason stop_reason_{walk_stop_reason::none};
    std::optional<error_info> last_error_;
    std::vector<element_error> decode_errors_;
};

/**
 * @brief Everything one full walk produced
 */
struct walk_result {
    std::vector<data_element> elements;
    walk_stop_reason stop_reason{walk_stop_reason::none};
    std::optional<error_info> stop_error;
    std::vector<element_error> decode_errors;
};

/**
 * @brief Walk a whole buffer from the first data element
 *
 * @return The elements read before the walk ended, or malformed_container
 */
[[nodiscard]] auto collect_elements(std::span<const uint8_t> buffer,
                                    walker_options options = {}) -> Result<walk_result>;

}  // namespace medimg::core
