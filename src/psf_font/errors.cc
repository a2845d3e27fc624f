//
// Created by igor on 02/01/2026.
//

#include <psf_font/errors.hh>

namespace psf_font {
    std::string_view errc_name(psf_errc code) {
        switch (code) {
            case psf_errc::truncated_header: return "truncated_header";
            case psf_errc::invalid_magic: return "invalid_magic";
            case psf_errc::unsupported_version: return "unsupported_version";
            case psf_errc::malformed_header: return "malformed_header";
            case psf_errc::truncated_glyph_table: return "truncated_glyph_table";
            case psf_errc::inconsistent_geometry: return "inconsistent_geometry";
            case psf_errc::truncated_unicode_table: return "truncated_unicode_table";
            case psf_errc::invalid_utf8_sequence: return "invalid_utf8_sequence";
            case psf_errc::inconsistent_unicode_table: return "inconsistent_unicode_table";
            default: return "unknown";
        }
    }

    psf_error::psf_error(psf_errc code, const std::string& what)
        : std::runtime_error(what), m_code(code) {
    }

    psf_errc psf_error::code() const noexcept {
        return m_code;
    }

    template class basic_psf_error<psf_errc::truncated_header>;
    template class basic_psf_error<psf_errc::invalid_magic>;
    template class basic_psf_error<psf_errc::unsupported_version>;
    template class basic_psf_error<psf_errc::malformed_header>;
    template class basic_psf_error<psf_errc::truncated_glyph_table>;
    template class basic_psf_error<psf_errc::inconsistent_geometry>;
    template class basic_psf_error<psf_errc::truncated_unicode_table>;
    template class basic_psf_error<psf_errc::invalid_utf8_sequence>;
    template class basic_psf_error<psf_errc::inconsistent_unicode_table>;
}
