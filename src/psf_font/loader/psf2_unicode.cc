//
// Created by igor on 02/01/2026.
//
// Decoder for the PSF2 Unicode table
//
// The table holds one entry per glyph, in glyph order:
//
//   entry    := char* (SEPARATOR sequence)* TERMINATOR
//   char     := one UTF-8 encoded scalar value
//   sequence := char*   (several codepoints drawn by one glyph)
//
// Single characters are mapped to the glyph. Sequences after a
// SEPARATOR are skipped byte by byte without decoding, so they never
// become lookups.
//

#include "loaders.hh"
#include <psf_font/text/utf8.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace psf_font::internal {

    unicode_mapping psf2_unicode_table::read(std::span<const uint8_t> table, std::size_t glyph_count) {
        unicode_mapping result;
        result.chars.reserve(std::min(glyph_count, table.size()));

        std::size_t pos = 0;
        std::size_t glyph = 0;

        while (pos < table.size()) {
            THROW_IF(glyph >= glyph_count, inconsistent_unicode_table_error,
                     "Unicode table has more entries than the", glyph_count, "glyphs of the font");

            // Single characters up to a separator or terminator
            while (true) {
                THROW_IF(pos >= table.size(), truncated_unicode_table_error,
                         "Unicode table entry for glyph", glyph, "is not terminated");

                const uint8_t lead = table[pos];
                if (lead == PSF2_SEPARATOR || lead == PSF2_TERMINATOR) {
                    break;
                }

                const auto len = static_cast<std::size_t>(utf8_sequence_length(lead));
                THROW_IF(len > table.size() - pos, truncated_unicode_table_error,
                         "Unicode table ends inside a character of glyph", glyph);

                const auto r = utf8_decode_one(table.subspan(pos, len));
                THROW_IF(!r.valid || static_cast<std::size_t>(r.bytes_consumed) != len,
                         invalid_utf8_sequence_error,
                         "Invalid UTF-8 in Unicode table entry for glyph", glyph, "at offset", pos);

                if (!result.chars.emplace(r.codepoint, glyph).second) {
                    ++result.duplicates;
                }
                pos += len;
            }

            // TODO: map multi codepoint sequences once lookup accepts a sequence
            if (table[pos] == PSF2_SEPARATOR) {
                ++result.sequences;
                while (pos < table.size() && table[pos] != PSF2_TERMINATOR) {
                    ++pos;
                }
                THROW_IF(pos >= table.size(), truncated_unicode_table_error,
                         "Unicode table entry for glyph", glyph, "is not terminated");
            }

            ++pos;
            ++glyph;
        }

        THROW_IF(glyph != glyph_count, inconsistent_unicode_table_error,
                 "Unicode table has", glyph, "entries for", glyph_count, "glyphs");

        return result;
    }

}  // namespace psf_font::internal
