/**
 * @file font_factory.hh
 * @brief Format detection and loading of PC Screen Fonts.
 *
 * font_factory turns a byte buffer into a screen_font. It performs no
 * I/O: callers read the file (or embed it at build time) and pass the
 * bytes in. The buffer is only read during the call.
 *
 * @section factory_usage Usage
 *
 * @code{.cpp}
 * std::vector<uint8_t> data = read_file("/usr/share/consolefonts/Lat2-Terminus16.psfu");
 *
 * if (font_factory::detect(data) != container_format::PSF2) {
 *     return;
 * }
 *
 * auto header = font_factory::read_header(data);
 * std::cout << header.glyph_count << " glyphs, "
 *           << header.width << "x" << header.height << "\n";
 *
 * screen_font font = font_factory::load(data);
 * @endcode
 *
 * @section factory_errors Errors
 *
 * Malformed input never yields a partially loaded font. Every failure is
 * thrown as a psf_error subclass; see errors.hh for the list of kinds.
 *
 * @author Igor
 * @date 02/01/2026
 */

#pragma once

#include <span>
#include <string_view>
#include <cstdint>

#include <psf_font/export.h>
#include <psf_font/errors.hh>
#include <psf_font/screen_font.hh>

namespace psf_font {
    /**
     * @brief Options controlling how a PSF2 font is loaded.
     *
     * @code{.cpp}
     * // Glyphs only, addressed by index
     * load_options opts;
     * opts.load_unicode_table = false;
     * auto font = font_factory::load(data, opts);
     *
     * // Reject fonts that cannot be looked up by character
     * auto mapped = font_factory::load(data, load_options::unicode_required());
     * @endcode
     */
    struct PSF_FONT_EXPORT load_options {
        /**
         * @brief Decode the Unicode table if the header announces one.
         *
         * When false the table is ignored and lookup() finds nothing.
         */
        bool load_unicode_table = true;

        /**
         * @brief Fail with inconsistent_unicode_table if the header
         * flags do not announce a Unicode table.
         */
        bool require_unicode_table = false;

        /**
         * @brief Options that refuse fonts without a Unicode table.
         */
        static load_options unicode_required() {
            return {true, true};
        }
    };

    /**
     * @brief Font data format, as recognised from its signature.
     */
    enum class container_format {
        UNKNOWN,  ///< Unrecognized data
        PSF1,     ///< PC Screen Font version 1 (recognised, not loadable)
        PSF2      ///< PC Screen Font version 2
    };

    /**
     * @brief Static entry points for inspecting and loading PSF2 data.
     */
    struct PSF_FONT_EXPORT font_factory {
        /**
         * @brief Identify the format of a buffer from its magic bytes.
         *
         * Only the signature is examined; a PSF2 result does not mean the
         * rest of the data is well formed.
         */
        [[nodiscard]] static container_format detect(std::span<const uint8_t> data) noexcept;

        /**
         * @brief Human readable name of a format ("PSF2", ...).
         */
        [[nodiscard]] static std::string_view format_name(container_format format);

        /**
         * @brief Parse and validate the PSF2 header only.
         *
         * @throws truncated_header_error if fewer than 32 bytes are given,
         *         or the declared header size exceeds the buffer
         * @throws invalid_magic_error if the signature is not PSF2
         * @throws unsupported_version_error for PSF1 data or a version != 0
         * @throws malformed_header_error if the header size is below 32
         */
        [[nodiscard]] static font_header read_header(std::span<const uint8_t> data);

        /**
         * @brief Load a complete PSF2 font.
         *
         * @param data Font file contents
         * @param options Loading options
         * @return Parsed font owning copies of all glyph data
         * @throws psf_error (one of its subclasses) on malformed input
         */
        [[nodiscard]] static screen_font load(std::span<const uint8_t> data,
                                              const load_options& options = {});
    };
}
