//
// Created by igor on 02/01/2026.
//

#include <psf_font/screen_font.hh>
#include <failsafe/exception.hh>

namespace psf_font {
    std::uint32_t font_header::line_size() const noexcept {
        return glyph_builder::line_size_for(width);
    }

    bool font_header::has_unicode_table() const noexcept {
        return (flags & HAS_UNICODE_TABLE) != 0;
    }

    screen_font::screen_font() = default;

    std::uint32_t screen_font::width() const noexcept {
        return m_header.width;
    }

    std::uint32_t screen_font::height() const noexcept {
        return m_header.height;
    }

    glyph_dimensions screen_font::bounding_box() const noexcept {
        return {m_header.width, m_header.height};
    }

    std::size_t screen_font::glyph_count() const noexcept {
        return m_storage.glyph_count();
    }

    glyph_view screen_font::get_glyph(std::size_t index) const {
        if (index >= m_storage.glyph_count()) {
            THROW_OUT_OF_RANGE("Glyph index", index, "is out of range for font with",
                               m_storage.glyph_count(), "glyphs");
        }
        return m_storage.view(index);
    }

    std::optional<glyph_view> screen_font::lookup(char32_t ch) const {
        auto idx = index_of(ch);
        if (!idx) {
            return std::nullopt;
        }
        return m_storage.view(*idx);
    }

    std::optional<std::size_t> screen_font::index_of(char32_t ch) const {
        auto it = m_unicode.find(ch);
        if (it == m_unicode.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool screen_font::has_unicode_table() const noexcept {
        return m_has_unicode;
    }

    std::size_t screen_font::mapping_count() const noexcept {
        return m_unicode.size();
    }

    const font_header& screen_font::get_header() const noexcept {
        return m_header;
    }
}
