/**
 * @file glyph_storage.hh
 * @brief Packed 1-bit glyph bitmap storage for screen fonts.
 *
 * Glyph bitmaps of a font are kept in one contiguous byte blob owned by
 * glyph_storage. Storage is filled once through glyph_builder and read
 * through lightweight glyph_view values.
 *
 * @section storage_overview Overview
 *
 * | Class | Purpose |
 * |-------|---------|
 * | glyph_view | Read-only view into a single glyph's bitmap |
 * | glyph_storage | Immutable container holding all glyphs |
 * | glyph_builder | Mutable builder for constructing storage |
 *
 * @section storage_memory Memory Layout
 *
 * Rows are packed MSB first and padded to a whole byte. A glyph of
 * nominal width 10 therefore occupies 2 bytes per row, and its view
 * reports a width of 16 pixels: the padding bits are addressable and
 * some fonts draw into them on purpose.
 *
 * @code
 *   +--------+--------+--------+--------+
 *   | Glyph0 | Glyph1 | Glyph2 | ...    |  <- m_blob (contiguous bytes)
 *   +--------+--------+--------+--------+
 *
 *   Each glyph (line_size = 2):
 *   +-----------------+-----------------+  <- row 0
 *   | x=0 ........ x=7| x=8 ....... x=15|
 *   +-----------------+-----------------+  <- row 1
 *   ...
 * @endcode
 *
 * @section storage_usage Usage
 *
 * @code{.cpp}
 * glyph_builder builder;
 * builder.reserve_glyphs(256);
 * builder.reserve_bytes(256 * 16);
 *
 * for (std::size_t i = 0; i < 256; ++i) {
 *     (void)builder.add_glyph_packed(1, 16, packed_rows(i));
 * }
 *
 * glyph_storage storage = std::move(builder).build();
 *
 * glyph_view g = storage.view(65);
 * for (std::uint32_t y = 0; y < g.height(); ++y) {
 *     for (std::uint32_t x = 0; x < g.width(); ++x) {
 *         if (g.pixel(x, y)) {
 *             draw_pixel(pen_x + x, pen_y + y, color);
 *         }
 *     }
 * }
 * @endcode
 *
 * @author Igor
 * @date 02/01/2026
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <psf_font/export.h>

namespace psf_font {
    /**
     * @brief Width and height of a glyph or of a font's bounding box.
     */
    struct PSF_FONT_EXPORT glyph_dimensions {
        std::uint32_t width = 0;   ///< Width in pixels
        std::uint32_t height = 0;  ///< Height in pixels

        bool operator==(const glyph_dimensions&) const = default;
    };

    /**
     * @brief Read-only view of a single glyph bitmap.
     *
     * A view does not own its bytes: it stays valid as long as the
     * glyph_storage (or screen_font) it came from is alive.
     */
    class PSF_FONT_EXPORT glyph_view {
    public:
        /**
         * @brief Construct an empty view (0x0 glyph).
         */
        glyph_view();

        /**
         * @brief Width in pixels, including row padding.
         *
         * Always line_size() * 8, which may exceed the nominal width
         * of the font.
         */
        [[nodiscard]] std::uint32_t width() const noexcept;

        /**
         * @brief Height in pixels. Equal to the font's nominal height.
         */
        [[nodiscard]] std::uint32_t height() const noexcept;

        /**
         * @brief Bytes per pixel row.
         */
        [[nodiscard]] std::uint32_t line_size() const noexcept;

        /**
         * @brief All bytes of the glyph, line_size() * height() long.
         */
        [[nodiscard]] std::span<const std::byte> bitmap() const noexcept;

        /**
         * @brief Packed bytes of one pixel row.
         * @param y Row index (0 to height-1)
         * @throws failsafe enforcement error if y is out of range
         */
        [[nodiscard]] std::span<const std::byte> row(std::uint32_t y) const;

        /**
         * @brief Test whether a pixel is set.
         *
         * Pixel (x, y) lives in byte `y * line_size + x / 8`, bit
         * `x % 8` counted from the most significant bit.
         *
         * @return true/false for set/clear, std::nullopt if x >= width()
         *         or y >= height()
         */
        [[nodiscard]] std::optional<bool> get(std::uint32_t x, std::uint32_t y) const noexcept;

        /**
         * @brief Test whether a pixel is set, with coordinates as a precondition.
         * @throws failsafe enforcement error if (x, y) is out of range
         */
        [[nodiscard]] bool pixel(std::uint32_t x, std::uint32_t y) const;

    private:
        friend class glyph_storage;

        glyph_view(std::span<const std::byte> bytes,
                   std::uint32_t line_size,
                   std::uint32_t height) noexcept;

        [[nodiscard]] bool bit(std::uint32_t x, std::uint32_t y) const noexcept;

        std::span<const std::byte> m_data{};
        std::uint32_t m_line_size = 0;
        std::uint32_t m_height = 0;
    };

    /**
     * @brief Immutable storage for all glyph bitmaps of one font.
     *
     * Created by glyph_builder::build(). Copyable and movable; views
     * obtained from a storage object refer to that object's blob.
     */
    class PSF_FONT_EXPORT glyph_storage {
    public:
        glyph_storage();

        /**
         * @brief Number of glyphs in storage.
         */
        [[nodiscard]] std::size_t glyph_count() const noexcept;

        /**
         * @brief Dimensions of one glyph.
         * @throws failsafe enforcement error if glyph_index is out of range
         */
        [[nodiscard]] glyph_dimensions dimensions(std::size_t glyph_index) const;

        /**
         * @brief View of one glyph.
         * @throws failsafe enforcement error if glyph_index is out of range
         */
        [[nodiscard]] glyph_view view(std::size_t glyph_index) const;

        /**
         * @brief The whole byte blob, every glyph back to back.
         */
        [[nodiscard]] std::span<const std::byte> blob_bytes() const noexcept;

    private:
        friend class glyph_builder;

        /// @cond INTERNAL
        struct glyph_internal {
            std::size_t offset = 0;        ///< Byte offset into m_blob
            std::uint32_t line_size = 0;   ///< Bytes per row
            std::uint32_t height = 0;      ///< Glyph height in pixels
        };
        /// @endcond

        std::vector<std::byte> m_blob;
        std::vector<glyph_internal> m_glyphs;
    };

    /**
     * @brief Builder that accumulates packed glyph bitmaps.
     *
     * @code{.cpp}
     * glyph_builder b;
     * auto idx = b.add_glyph_packed(1, 8, rows);  // 8x8 glyph
     * glyph_storage s = std::move(b).build();
     * @endcode
     */
    class PSF_FONT_EXPORT glyph_builder {
    public:
        glyph_builder();

        void reserve_bytes(std::size_t bytes);

        void reserve_glyphs(std::size_t n);

        /**
         * @brief Bytes needed for one row of a glyph of the given width.
         * @return ceil(width / 8)
         */
        static constexpr std::uint32_t line_size_for(std::uint32_t width) noexcept;

        /**
         * @brief Append a glyph from packed rows.
         *
         * @param line_size Bytes per row
         * @param height Number of rows
         * @param rows Exactly line_size * height bytes, copied verbatim
         * @return Index of the added glyph
         * @throws failsafe enforcement error if rows has the wrong size
         */
        [[nodiscard]] std::size_t add_glyph_packed(std::uint32_t line_size,
                                                   std::uint32_t height,
                                                   std::span<const std::byte> rows);

        /**
         * @brief Finalize the builder into immutable storage.
         *
         * The builder is left in a moved-from state.
         */
        [[nodiscard]] glyph_storage build() &&;

    private:
        std::vector<std::byte> m_blob;
        std::vector<glyph_storage::glyph_internal> m_glyphs;
    };

    constexpr std::uint32_t glyph_builder::line_size_for(std::uint32_t width) noexcept {
        return width / 8u + ((width % 8u) != 0u ? 1u : 0u);
    }
}
