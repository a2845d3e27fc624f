/**
 * @file utf8.hh
 * @brief UTF-8 decoding utilities.
 *
 * Used in two places: the PSF2 loader decodes the characters of the
 * Unicode mapping table with utf8_decode_one(), and callers that want
 * to draw a UTF-8 string iterate it with utf8_view and look up each
 * scalar value in the font.
 *
 * @section utf8_overview Overview
 *
 * | Bytes | Range | Lead byte |
 * |-------|-------|-----------|
 * | 1 | U+0000 - U+007F | 0xxxxxxx |
 * | 2 | U+0080 - U+07FF | 110xxxxx |
 * | 3 | U+0800 - U+FFFF | 1110xxxx |
 * | 4 | U+10000 - U+10FFFF | 11110xxx |
 *
 * @section utf8_usage Usage
 *
 * @code{.cpp}
 * for (char32_t cp : utf8_view("Привет")) {
 *     if (auto g = font.lookup(cp)) {
 *         blit(*g, pen_x, pen_y);
 *     }
 *     pen_x += font.width();
 * }
 * @endcode
 *
 * @section utf8_errors Error Handling
 *
 * utf8_decode_one() never throws. Malformed, overlong, surrogate and
 * out-of-range sequences are reported through utf8_decode_result::valid
 * with codepoint set to U+FFFD. The iterator yields U+FFFD for them.
 *
 * @author Igor
 * @date 21/12/2025
 */

#pragma once

#include <psf_font/export.h>
#include <cstdint>
#include <cstddef>
#include <span>
#include <string_view>
#include <iterator>

namespace psf_font {
    /**
     * @brief Result of decoding a single UTF-8 codepoint.
     */
    struct PSF_FONT_EXPORT utf8_decode_result {
        /**
         * @brief Decoded Unicode scalar value, or U+FFFD when !valid.
         */
        char32_t codepoint;

        /**
         * @brief Number of bytes consumed from input.
         *
         * - **1-4**: bytes consumed (also for invalid sequences)
         * - **0**: empty input
         */
        int bytes_consumed;

        /**
         * @brief true if the consumed bytes were a well-formed sequence.
         */
        bool valid;
    };

    /**
     * @brief Sequence length announced by a lead byte.
     *
     * Counts the leading one-bits of the byte, with a minimum of 1.
     * Continuation bytes (10xxxxxx) therefore report 1, and bytes
     * 0xF8 and above report 5 to 8; neither decodes successfully.
     *
     * @param lead First byte of the sequence
     * @return Number of bytes the sequence claims to occupy
     */
    PSF_FONT_EXPORT int utf8_sequence_length(std::uint8_t lead) noexcept;

    /**
     * @brief Decode a single UTF-8 codepoint from the beginning of a string.
     *
     * @param str UTF-8 encoded string view
     * @return Decode result. For empty input returns {0xFFFD, 0, false}.
     *
     * @code{.cpp}
     * std::string_view text = "αβγ";
     *
     * while (!text.empty()) {
     *     auto r = utf8_decode_one(text);
     *     std::cout << "U+" << std::hex << r.codepoint << "\n";
     *     text.remove_prefix(r.bytes_consumed);
     * }
     * // Output: U+3b1 U+3b2 U+3b3
     * @endcode
     */
    PSF_FONT_EXPORT utf8_decode_result utf8_decode_one(std::string_view str) noexcept;

    /**
     * @brief Decode a single UTF-8 codepoint from raw bytes.
     * @see utf8_decode_one(std::string_view)
     */
    PSF_FONT_EXPORT utf8_decode_result utf8_decode_one(std::span<const std::uint8_t> bytes) noexcept;

    /**
     * @brief Forward iterator for UTF-8 codepoints.
     *
     * @note Prefer utf8_view for range-based iteration.
     */
    class PSF_FONT_EXPORT utf8_iterator {
    public:
        /// @name Type Aliases (STL Iterator Requirements)
        /// @{
        using value_type = char32_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const char32_t*;
        using reference = char32_t;
        using iterator_category = std::forward_iterator_tag;
        /// @}

        /**
         * @brief Default constructor creates end iterator.
         */
        utf8_iterator() = default;

        /**
         * @brief Construct iterator at beginning of string.
         * @note The string_view must remain valid for the iterator's lifetime.
         */
        explicit utf8_iterator(std::string_view str);

        char32_t operator*() const { return m_current; }

        utf8_iterator& operator++();

        utf8_iterator operator++(int);

        bool operator==(const utf8_iterator& other) const;

        bool operator!=(const utf8_iterator& other) const { return !(*this == other); }

    private:
        std::string_view m_remaining;  ///< Remaining string to decode
        char32_t m_current = 0;        ///< Current decoded codepoint
        bool m_at_end = true;          ///< True if no more codepoints to yield

        void decode_next();
    };

    /**
     * @brief Range wrapper for iterating UTF-8 codepoints.
     *
     * @note The underlying string must remain valid for the view's lifetime.
     */
    class PSF_FONT_EXPORT utf8_view {
    public:
        explicit utf8_view(std::string_view str)
            : m_str(str) {
        }

        [[nodiscard]] utf8_iterator begin() const { return utf8_iterator(m_str); }

        [[nodiscard]] utf8_iterator end() const { return utf8_iterator(); }

    private:
        std::string_view m_str;
    };
} // namespace psf_font
