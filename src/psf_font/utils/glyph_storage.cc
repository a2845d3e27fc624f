//
// Created by igor on 02/01/2026.
//

#include <utility>
#include <failsafe/enforce.hh>
#include <psf_font/utils/glyph_storage.hh>

namespace psf_font {
    glyph_view::glyph_view() = default;

    std::uint32_t glyph_view::width() const noexcept { return m_line_size * 8u; }

    std::uint32_t glyph_view::height() const noexcept { return m_height; }

    std::uint32_t glyph_view::line_size() const noexcept { return m_line_size; }

    std::span <const std::byte> glyph_view::bitmap() const noexcept { return m_data; }

    std::span <const std::byte> glyph_view::row(std::uint32_t y) const {
        ENFORCE(y < m_height);
        return m_data.subspan(static_cast <std::size_t>(y) * m_line_size, m_line_size);
    }

    std::optional <bool> glyph_view::get(std::uint32_t x, std::uint32_t y) const noexcept {
        if (x >= width() || y >= m_height) {
            return std::nullopt;
        }
        return bit(x, y);
    }

    bool glyph_view::pixel(std::uint32_t x, std::uint32_t y) const {
        ENFORCE(x < width() && y < m_height);
        return bit(x, y);
    }

    bool glyph_view::bit(std::uint32_t x, std::uint32_t y) const noexcept {
        const std::size_t idx = static_cast <std::size_t>(y) * m_line_size + (x >> 3);
        const auto b = std::to_integer <std::uint8_t>(m_data[idx]);
        const auto mask = static_cast <std::uint8_t>(0x80u >> (x & 7u));
        return (b & mask) != 0u;
    }

    glyph_view::glyph_view(std::span <const std::byte> bytes, std::uint32_t line_size,
                           std::uint32_t height) noexcept
        : m_data(bytes), m_line_size(line_size), m_height(height) {
    }

    // =============================================================================
    // Glyph storage
    // =============================================================================
    glyph_storage::glyph_storage() = default;

    std::size_t glyph_storage::glyph_count() const noexcept { return m_glyphs.size(); }

    glyph_dimensions glyph_storage::dimensions(std::size_t glyph_index) const {
        ENFORCE(glyph_index < m_glyphs.size());
        const auto& g = m_glyphs[glyph_index];
        return {g.line_size * 8u, g.height};
    }

    glyph_view glyph_storage::view(std::size_t glyph_index) const {
        ENFORCE(glyph_index < m_glyphs.size());
        const auto& g = m_glyphs[glyph_index];
        const std::size_t bytes = static_cast <std::size_t>(g.line_size) * g.height;
        ENFORCE(g.offset + bytes <= m_blob.size());

        return {
            std::span <const std::byte>(m_blob.data() + g.offset, bytes),
            g.line_size,
            g.height
        };
    }

    std::span <const std::byte> glyph_storage::blob_bytes() const noexcept {
        return {m_blob.data(), m_blob.size()};
    }

    // =================================================================================
    // Glyph builder
    // =================================================================================
    glyph_builder::glyph_builder() = default;

    void glyph_builder::reserve_bytes(std::size_t bytes) { m_blob.reserve(bytes); }

    void glyph_builder::reserve_glyphs(std::size_t n) { m_glyphs.reserve(n); }

    std::size_t glyph_builder::add_glyph_packed(std::uint32_t line_size, std::uint32_t height,
                                                std::span <const std::byte> rows) {
        const std::size_t expected = static_cast <std::size_t>(height) * line_size;
        ENFORCE(rows.size() == expected);

        glyph_storage::glyph_internal gi;
        gi.offset = m_blob.size();
        gi.line_size = line_size;
        gi.height = height;

        m_blob.insert(m_blob.end(), rows.begin(), rows.end());
        m_glyphs.push_back(gi);
        return m_glyphs.size() - 1;
    }

    glyph_storage glyph_builder::build() && {
        glyph_storage s;
        s.m_blob = std::move(m_blob);
        s.m_glyphs = std::move(m_glyphs);
        return s;
    }
}
