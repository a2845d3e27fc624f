//
// Created by igor on 02/01/2026.
//
// Internal PSF2 loader declarations
//

#pragma once

#include <psf_font/screen_font.hh>
#include <psf_font/font_factory.hh>
#include <cstddef>
#include <cstdint>
#include <span>
#include <unordered_map>

namespace psf_font::internal {

    /// PSF2 signature, bytes 0-3
    inline constexpr uint8_t PSF2_MAGIC[] = {0x72, 0xB5, 0x4A, 0x86};
    /// PSF1 signature, bytes 0-1
    inline constexpr uint8_t PSF1_MAGIC[] = {0x36, 0x04};
    /// Size of the fixed part of a PSF2 header
    inline constexpr std::size_t PSF2_HEADER_SIZE = 32;

    /// Unicode table: start of a multi codepoint sequence
    inline constexpr uint8_t PSF2_SEPARATOR = 0xFE;
    /// Unicode table: end of one glyph's entry
    inline constexpr uint8_t PSF2_TERMINATOR = 0xFF;

    /// Read and validate the PSF2 header
    struct psf2_header_reader {
        static font_header read(std::span<const uint8_t> data);
    };

    /// Copy the glyph bitmaps that follow the header
    struct psf2_glyph_table {
        static glyph_storage read(std::span<const uint8_t> data, const font_header& header);
    };

    /// Decoded Unicode table
    struct unicode_mapping {
        std::unordered_map<char32_t, std::size_t> chars;  ///< First glyph for each character
        std::size_t duplicates = 0;                       ///< Entries ignored as already mapped
        std::size_t sequences = 0;                        ///< Entries whose sequences were skipped
    };

    /// Decode the Unicode table that follows the glyph bitmaps
    struct psf2_unicode_table {
        static unicode_mapping read(std::span<const uint8_t> table, std::size_t glyph_count);
    };

    /// Load a complete PSF2 font
    struct psf2_font_loader {
        static screen_font load(std::span<const uint8_t> data, const load_options& options);
    };

}  // namespace psf_font::internal
