//
// Created by igor on 02/01/2026.
//
// Loader for PC Screen Font version 2 (.psf / .psfu)
//

#include "loaders.hh"
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace psf_font::internal {

    namespace {
        bool starts_with(std::span<const uint8_t> data, std::span<const uint8_t> prefix) {
            if (data.size() < prefix.size()) return false;
            return std::equal(prefix.begin(), prefix.end(), data.begin());
        }

        // Little-endian 32 bit field; caller guarantees offset + 4 <= data.size()
        uint32_t read_u32(std::span<const uint8_t> data, std::size_t offset) {
            return static_cast<uint32_t>(data[offset]) |
                   (static_cast<uint32_t>(data[offset + 1]) << 8) |
                   (static_cast<uint32_t>(data[offset + 2]) << 16) |
                   (static_cast<uint32_t>(data[offset + 3]) << 24);
        }
    }

    font_header psf2_header_reader::read(std::span<const uint8_t> data) {
        THROW_IF(data.size() < PSF2_HEADER_SIZE, truncated_header_error,
                 "PSF2 header needs", PSF2_HEADER_SIZE, "bytes, got", data.size());

        THROW_IF(starts_with(data, PSF1_MAGIC), unsupported_version_error,
                 "PSF1 fonts are not supported");
        THROW_IF(!starts_with(data, PSF2_MAGIC), invalid_magic_error,
                 "Not a PSF2 font: bad magic");

        font_header header;
        header.version = read_u32(data, 4);
        header.header_size = read_u32(data, 8);
        header.flags = read_u32(data, 12);
        header.glyph_count = read_u32(data, 16);
        header.bytes_per_glyph = read_u32(data, 20);
        header.height = read_u32(data, 24);
        header.width = read_u32(data, 28);

        THROW_IF(header.version != 0, unsupported_version_error,
                 "Unsupported PSF2 version", header.version);
        THROW_IF(header.header_size < PSF2_HEADER_SIZE, malformed_header_error,
                 "PSF2 header size", header.header_size, "is smaller than", PSF2_HEADER_SIZE);
        THROW_IF(header.header_size > data.size(), truncated_header_error,
                 "PSF2 header size", header.header_size, "exceeds data size", data.size());
        THROW_IF(header.width == 0 || header.height == 0, malformed_header_error,
                 "PSF2 glyphs of", header.width, "x", header.height, "pixels are empty");

        return header;
    }

    glyph_storage psf2_glyph_table::read(std::span<const uint8_t> data, const font_header& header) {
        const uint32_t line_size = header.line_size();
        const uint64_t glyph_bytes = static_cast<uint64_t>(line_size) * header.height;

        THROW_IF(header.bytes_per_glyph != glyph_bytes, inconsistent_geometry_error,
                 "Glyph size of", header.bytes_per_glyph, "bytes does not match",
                 header.width, "x", header.height, "pixels (", glyph_bytes, "bytes)");

        const uint64_t table_size = static_cast<uint64_t>(header.glyph_count) * header.bytes_per_glyph;
        const uint64_t available = data.size() - header.header_size;

        THROW_IF(table_size > available, truncated_glyph_table_error,
                 "Glyph table needs", table_size, "bytes, only", available, "available");

        glyph_builder builder;
        builder.reserve_glyphs(header.glyph_count);
        builder.reserve_bytes(static_cast<std::size_t>(table_size));

        for (std::size_t i = 0; i < header.glyph_count; ++i) {
            auto rows = data.subspan(header.header_size + i * header.bytes_per_glyph,
                                     header.bytes_per_glyph);
            (void)builder.add_glyph_packed(line_size, header.height, std::as_bytes(rows));
        }

        return std::move(builder).build();
    }

    screen_font psf2_font_loader::load(std::span<const uint8_t> data, const load_options& options) {
        const font_header header = psf2_header_reader::read(data);

        THROW_IF(options.require_unicode_table && !header.has_unicode_table(),
                 inconsistent_unicode_table_error, "Font has no Unicode table");

        screen_font result;
        result.m_header = header;
        result.m_storage = psf2_glyph_table::read(data, header);

        if (header.has_unicode_table() && options.load_unicode_table) {
            // Glyph table reader has verified that this offset is within data
            const std::size_t offset = header.header_size +
                                       static_cast<std::size_t>(header.glyph_count) * header.bytes_per_glyph;
            auto mapping = psf2_unicode_table::read(data.subspan(offset), header.glyph_count);

            if (mapping.duplicates > 0) {
                LOG_DEBUG("Ignored", mapping.duplicates, "duplicate Unicode table entries");
            }
            if (mapping.sequences > 0) {
                LOG_DEBUG("Skipped", mapping.sequences, "multi codepoint sequences");
            }

            result.m_unicode = std::move(mapping.chars);
            result.m_has_unicode = true;
        } else if (header.has_unicode_table()) {
            LOG_DEBUG("Unicode table present but not loaded");
        } else {
            LOG_DEBUG("Font has no Unicode table");
        }

        LOG_DEBUG("Loaded PSF2 font:", header.glyph_count, "glyphs of",
                  header.width, "x", header.height, "pixels,",
                  result.m_unicode.size(), "mapped characters");

        return result;
    }

}  // namespace psf_font::internal
