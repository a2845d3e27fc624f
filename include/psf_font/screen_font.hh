/**
 * @file screen_font.hh
 * @brief PC Screen Font (PSF2) representation and glyph queries.
 *
 * A screen_font is the parsed, immutable form of a PSF2 file: a fixed
 * number of equally sized 1-bit glyphs plus an optional table that maps
 * Unicode scalar values to glyph indices.
 *
 * @section psf2_layout File Layout
 *
 * | Offset | Size | Field |
 * |--------|------|-------|
 * | 0 | 4 | magic 72 B5 4A 86 |
 * | 4 | 4 | version (0) |
 * | 8 | 4 | header size (32) |
 * | 12 | 4 | flags (bit 0: Unicode table present) |
 * | 16 | 4 | glyph count |
 * | 20 | 4 | bytes per glyph |
 * | 24 | 4 | height |
 * | 28 | 4 | width |
 * | header size | count * bytes per glyph | glyph bitmaps |
 * | ... | rest | Unicode table |
 *
 * All integers are little-endian. Each glyph is `height` rows of
 * `ceil(width / 8)` bytes, MSB first.
 *
 * @section unicode_table Unicode Table
 *
 * One entry per glyph, in glyph order. An entry lists the UTF-8
 * encoded characters drawn by the glyph and ends with 0xFF. Multi
 * codepoint spellings follow a 0xFE separator; they are recognised
 * but not mapped, so such sequences cannot be looked up.
 *
 * @code
 *   41 FF               glyph 0 draws 'A'
 *   C3 85 E2 84 AB FF   glyph 1 draws U+00C5 and U+212B
 *   FE 41 CC 8A FF      glyph 2 only has a sequence (skipped)
 * @endcode
 *
 * @section render_example Rendering Example
 *
 * @code{.cpp}
 * auto font = font_factory::load(bytes);
 *
 * int pen_x = 0;
 * for (char32_t ch : utf8_view(text)) {
 *     auto glyph = font.lookup(ch);
 *     if (!glyph) {
 *         glyph = font.lookup(U'?');
 *     }
 *     if (glyph) {
 *         for (std::uint32_t y = 0; y < glyph->height(); ++y) {
 *             for (std::uint32_t x = 0; x < glyph->width(); ++x) {
 *                 if (glyph->get(x, y).value_or(false)) {
 *                     draw_pixel(pen_x + x, y, color);
 *                 }
 *             }
 *         }
 *     }
 *     pen_x += font.width();
 * }
 * @endcode
 *
 * @author Igor
 * @date 02/01/2026
 */

#pragma once

#include <psf_font/export.h>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <psf_font/utils/glyph_storage.hh>

namespace psf_font {
    namespace internal {
        struct psf2_font_loader;
    }

    /**
     * @brief Fields of a PSF2 header.
     *
     * @see font_factory::read_header()
     */
    struct PSF_FONT_EXPORT font_header {
        /// Flag bit announcing a Unicode table after the glyphs
        static constexpr std::uint32_t HAS_UNICODE_TABLE = 0x01;

        std::uint32_t version = 0;          ///< Format version, always 0
        std::uint32_t header_size = 0;      ///< Offset of the glyph table
        std::uint32_t flags = 0;            ///< HAS_UNICODE_TABLE or 0
        std::uint32_t glyph_count = 0;      ///< Number of glyphs
        std::uint32_t bytes_per_glyph = 0;  ///< Size of one glyph bitmap
        std::uint32_t height = 0;           ///< Nominal height in pixels
        std::uint32_t width = 0;            ///< Nominal width in pixels

        /**
         * @brief Bytes per pixel row, ceil(width / 8).
         */
        [[nodiscard]] std::uint32_t line_size() const noexcept;

        /**
         * @brief Whether the flags announce a Unicode table.
         */
        [[nodiscard]] bool has_unicode_table() const noexcept;
    };

    /**
     * @brief Parsed PSF2 font.
     *
     * Owns every glyph bitmap and the character mapping; nothing refers
     * back to the buffer it was loaded from. The object is never modified
     * after loading, so a single instance may be read from several
     * threads at once.
     *
     * @code{.cpp}
     * auto font = font_factory::load(bytes);
     *
     * auto [w, h] = font.bounding_box();
     * if (auto g = font.lookup(U'A')) {
     *     bool ink = g->get(0, 0).value_or(false);
     * }
     * @endcode
     *
     * @see font_factory For loading fonts
     * @see glyph_view For pixel access
     */
    class PSF_FONT_EXPORT screen_font {
        friend struct internal::psf2_font_loader;

    public:
        /**
         * @brief Construct an empty font with no glyphs.
         *
         * Use font_factory to load fonts.
         */
        screen_font();

        /**
         * @brief Nominal glyph width in pixels, as declared in the header.
         */
        [[nodiscard]] std::uint32_t width() const noexcept;

        /**
         * @brief Glyph height in pixels, as declared in the header.
         */
        [[nodiscard]] std::uint32_t height() const noexcept;

        /**
         * @brief Nominal width and height of the font.
         */
        [[nodiscard]] glyph_dimensions bounding_box() const noexcept;

        /**
         * @brief Number of glyphs in the font.
         */
        [[nodiscard]] std::size_t glyph_count() const noexcept;

        /**
         * @brief Glyph by index.
         * @param index Glyph index (0 to glyph_count-1)
         * @throws std::out_of_range if index >= glyph_count()
         */
        [[nodiscard]] glyph_view get_glyph(std::size_t index) const;

        /**
         * @brief Glyph that draws a character.
         *
         * @param ch Unicode scalar value
         * @return The glyph, or std::nullopt if the character is not in
         *         the Unicode table (or the font has none)
         */
        [[nodiscard]] std::optional<glyph_view> lookup(char32_t ch) const;

        /**
         * @brief Index of the glyph that draws a character.
         * @return Glyph index, or std::nullopt if unmapped
         */
        [[nodiscard]] std::optional<std::size_t> index_of(char32_t ch) const;

        /**
         * @brief Whether a Unicode table was loaded.
         */
        [[nodiscard]] bool has_unicode_table() const noexcept;

        /**
         * @brief Number of distinct characters in the Unicode table.
         */
        [[nodiscard]] std::size_t mapping_count() const noexcept;

        /**
         * @brief Header the font was loaded from.
         */
        [[nodiscard]] const font_header& get_header() const noexcept;

    private:
        font_header m_header;                                ///< Parsed header
        bool m_has_unicode = false;                          ///< Table decoded
        glyph_storage m_storage;                             ///< Glyph bitmaps
        std::unordered_map<char32_t, std::size_t> m_unicode; ///< Character -> glyph
    };
}
