/**
 * @file errors.hh
 * @brief Error kinds reported while parsing PC Screen Font data.
 *
 * Every parse failure is thrown as an exception derived from psf_error.
 * Callers can catch the common base and inspect code(), or catch one
 * concrete kind:
 *
 * @code{.cpp}
 * try {
 *     auto font = font_factory::load(data);
 * } catch (const truncated_glyph_table_error& e) {
 *     // file was cut short
 * } catch (const psf_error& e) {
 *     std::cerr << errc_name(e.code()) << ": " << e.what() << "\n";
 * }
 * @endcode
 *
 * Lookups and pixel tests on an already loaded font never throw for
 * missing characters or out of range coordinates; they return
 * std::nullopt instead.
 *
 * @author Igor
 * @date 02/01/2026
 */

#pragma once

#include <psf_font/export.h>
#include <stdexcept>
#include <string>
#include <string_view>

namespace psf_font {
    /**
     * @brief Kind of a parse failure.
     */
    enum class psf_errc {
        truncated_header = 1,       ///< Fewer bytes than the header needs
        invalid_magic,              ///< Not a PSF2 signature
        unsupported_version,        ///< PSF1 data or unknown PSF2 version
        malformed_header,           ///< Header fields contradict the format
        truncated_glyph_table,      ///< Buffer ends inside the glyph bitmaps
        inconsistent_geometry,      ///< bytes_per_glyph != line_size * height
        truncated_unicode_table,    ///< Buffer ends inside a mapping entry
        invalid_utf8_sequence,      ///< Mapping entry holds malformed UTF-8
        inconsistent_unicode_table  ///< Mapping entry count != glyph count
    };

    /**
     * @brief Stable identifier of an error kind.
     * @param code Error kind
     * @return Identifier such as "truncated_header"
     */
    PSF_FONT_EXPORT std::string_view errc_name(psf_errc code);

    /**
     * @brief Base class of all parse errors.
     */
    class PSF_FONT_EXPORT psf_error : public std::runtime_error {
    public:
        psf_error(psf_errc code, const std::string& what);

        /**
         * @brief Kind of this failure.
         */
        [[nodiscard]] psf_errc code() const noexcept;

    private:
        psf_errc m_code;
    };

    /**
     * @brief Concrete error type for a single kind.
     *
     * Constructible from a message alone so it can be raised through
     * failsafe's THROW_IF.
     */
    template<psf_errc Code>
    class PSF_FONT_EXPORT basic_psf_error : public psf_error {
    public:
        explicit basic_psf_error(const std::string& what)
            : psf_error(Code, what) {
        }
    };

    using truncated_header_error = basic_psf_error<psf_errc::truncated_header>;
    using invalid_magic_error = basic_psf_error<psf_errc::invalid_magic>;
    using unsupported_version_error = basic_psf_error<psf_errc::unsupported_version>;
    using malformed_header_error = basic_psf_error<psf_errc::malformed_header>;
    using truncated_glyph_table_error = basic_psf_error<psf_errc::truncated_glyph_table>;
    using inconsistent_geometry_error = basic_psf_error<psf_errc::inconsistent_geometry>;
    using truncated_unicode_table_error = basic_psf_error<psf_errc::truncated_unicode_table>;
    using invalid_utf8_sequence_error = basic_psf_error<psf_errc::invalid_utf8_sequence>;
    using inconsistent_unicode_table_error = basic_psf_error<psf_errc::inconsistent_unicode_table>;

    // Instantiated once in the library, so every kind has a single type_info
    extern template class basic_psf_error<psf_errc::truncated_header>;
    extern template class basic_psf_error<psf_errc::invalid_magic>;
    extern template class basic_psf_error<psf_errc::unsupported_version>;
    extern template class basic_psf_error<psf_errc::malformed_header>;
    extern template class basic_psf_error<psf_errc::truncated_glyph_table>;
    extern template class basic_psf_error<psf_errc::inconsistent_geometry>;
    extern template class basic_psf_error<psf_errc::truncated_unicode_table>;
    extern template class basic_psf_error<psf_errc::invalid_utf8_sequence>;
    extern template class basic_psf_error<psf_errc::inconsistent_unicode_table>;
}
