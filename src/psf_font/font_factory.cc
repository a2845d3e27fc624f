//
// Created by igor on 02/01/2026.
//

#include <psf_font/font_factory.hh>
#include <algorithm>

#include "loader/loaders.hh"

namespace psf_font {

    namespace {
        bool starts_with(std::span<const uint8_t> data, std::span<const uint8_t> prefix) {
            if (data.size() < prefix.size()) return false;
            return std::equal(prefix.begin(), prefix.end(), data.begin());
        }
    }

    container_format font_factory::detect(std::span<const uint8_t> data) noexcept {
        if (starts_with(data, internal::PSF2_MAGIC)) {
            return container_format::PSF2;
        }
        if (starts_with(data, internal::PSF1_MAGIC)) {
            return container_format::PSF1;
        }
        return container_format::UNKNOWN;
    }

    std::string_view font_factory::format_name(container_format format) {
        switch (format) {
            case container_format::UNKNOWN: return "Unknown";
            case container_format::PSF1: return "PSF1";
            case container_format::PSF2: return "PSF2";
            default: return "Unknown";
        }
    }

    font_header font_factory::read_header(std::span<const uint8_t> data) {
        return internal::psf2_header_reader::read(data);
    }

    screen_font font_factory::load(std::span<const uint8_t> data, const load_options& options) {
        return internal::psf2_font_loader::load(data, options);
    }

}  // namespace psf_font
