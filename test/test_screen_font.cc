//
// Created by igor on 02/01/2026.
//
// Unit tests for screen_font queries
//

#include <doctest/doctest.h>
#include <psf_font/font_factory.hh>
#include <psf_font/screen_font.hh>
#include <algorithm>
#include <stdexcept>
#include <utility>
#include "test_data.hh"

using namespace psf_font;
using namespace psf_font::test;

TEST_SUITE("screen_font") {

    // Three 8x1 glyphs mapped to 'a', 'b' and 'A'
    std::vector<uint8_t> make_abc_font() {
        return psf2_builder(8, 1)
            .add_glyph({0x11})
            .add_glyph({0x22})
            .add_glyph({0xA5})
            .unicode_entry("a")
            .unicode_entry("b")
            .unicode_entry("A")
            .build();
    }

    TEST_CASE("default constructor creates empty font") {
        screen_font font;

        CHECK(font.width() == 0);
        CHECK(font.height() == 0);
        CHECK(font.glyph_count() == 0);
        CHECK(font.mapping_count() == 0);
        CHECK_FALSE(font.has_unicode_table());
        CHECK_FALSE(font.lookup(U'A').has_value());
    }

    TEST_CASE("bounding box matches the header") {
        const std::pair<uint32_t, uint32_t> sizes[] = {{8, 16}, {5, 7}, {12, 24}, {16, 32}, {1, 1}, {9, 3}};

        for (const auto& size : sizes) {
            const uint32_t w = size.first;
            const uint32_t h = size.second;
            CAPTURE(w);
            CAPTURE(h);
            auto data = psf2_builder(w, h).add_blank_glyphs(2).build();
            auto font = font_factory::load(data);

            CHECK(font.width() == w);
            CHECK(font.height() == h);
            CHECK(font.bounding_box() == glyph_dimensions{w, h});
        }
    }

    TEST_CASE("glyph width is padded to whole bytes") {
        const std::pair<uint32_t, uint32_t> sizes[] = {{8, 16}, {5, 7}, {12, 24}, {16, 32}, {1, 1}, {9, 3}};

        for (const auto& size : sizes) {
            const uint32_t w = size.first;
            const uint32_t h = size.second;
            CAPTURE(w);
            auto data = psf2_builder(w, h).add_blank_glyphs(1).build();
            auto font = font_factory::load(data);
            auto glyph = font.get_glyph(0);

            CHECK(glyph.width() % 8 == 0);
            CHECK(glyph.width() >= font.width());
            CHECK(glyph.width() == glyph.line_size() * 8);
            CHECK(glyph.height() == font.height());
            CHECK(glyph.bitmap().size() == glyph.line_size() * glyph.height());
        }
    }

    TEST_CASE("single row glyph decodes MSB first") {
        auto data = psf2_builder(8, 1).add_glyph({0b10110000}).build();
        auto font = font_factory::load(data);
        auto glyph = font.get_glyph(0);

        CHECK(glyph.get(0, 0) == true);
        CHECK(glyph.get(1, 0) == false);
        CHECK(glyph.get(2, 0) == true);
        CHECK(glyph.get(3, 0) == true);
        for (uint32_t x = 4; x < 8; ++x) {
            CHECK(glyph.get(x, 0) == false);
        }
    }

    TEST_CASE("get is defined inside the glyph and absent outside") {
        auto data = psf2_builder(10, 3)
            .add_glyph({0xFF, 0xFF, 0x00, 0x00, 0xFF, 0xFF})
            .build();
        auto font = font_factory::load(data);
        auto glyph = font.get_glyph(0);

        REQUIRE(glyph.width() == 16);
        REQUIRE(glyph.height() == 3);

        for (uint32_t y = 0; y < glyph.height(); ++y) {
            for (uint32_t x = 0; x < glyph.width(); ++x) {
                CHECK(glyph.get(x, y).has_value());
            }
        }

        CHECK_FALSE(glyph.get(16, 0).has_value());
        CHECK_FALSE(glyph.get(0, 3).has_value());
        CHECK_FALSE(glyph.get(16, 3).has_value());
        CHECK_FALSE(glyph.get(17, 2).has_value());
        CHECK_FALSE(glyph.get(0xFFFFFFFF, 0).has_value());
        CHECK_FALSE(glyph.get(0, 0xFFFFFFFF).has_value());
    }

    TEST_CASE("last pixel of the last row does not spill into the next glyph") {
        auto data = psf2_builder(8, 2)
            .add_glyph({0x00, 0x01})
            .add_glyph({0xFF, 0xFF})
            .build();
        auto font = font_factory::load(data);
        auto glyph = font.get_glyph(0);

        CHECK(glyph.get(7, 1) == true);
        CHECK_FALSE(glyph.get(8, 1).has_value());
        CHECK_FALSE(glyph.get(0, 2).has_value());
    }

    TEST_CASE("multi byte rows") {
        // 12 pixels wide: two bytes per row
        auto data = psf2_builder(12, 2)
            .add_glyph({0x80, 0x10, 0x00, 0x01})
            .build();
        auto font = font_factory::load(data);
        auto glyph = font.get_glyph(0);

        CHECK(glyph.line_size() == 2);
        CHECK(glyph.get(0, 0) == true);
        CHECK(glyph.get(11, 0) == true);
        CHECK(glyph.get(15, 1) == true);
        CHECK(glyph.get(1, 0) == false);
        CHECK(glyph.get(0, 1) == false);
    }

    TEST_CASE("padding bits are visible past the nominal width") {
        // Nominal width 6, but the glyph draws into bit 6 of the row
        auto data = psf2_builder(6, 1).add_glyph({0b11111110}).build();
        auto font = font_factory::load(data);
        auto glyph = font.get_glyph(0);

        CHECK(font.width() == 6);
        CHECK(glyph.width() == 8);
        CHECK(glyph.get(6, 0) == true);
        CHECK(glyph.get(7, 0) == false);
    }

    TEST_CASE("lookup returns the mapped glyph") {
        auto data = make_abc_font();
        auto font = font_factory::load(data);

        auto glyph = font.lookup(U'A');
        REQUIRE(glyph.has_value());
        CHECK(bytes_of(*glyph) == std::vector<uint8_t>{0xA5});
        CHECK(font.index_of(U'A') == std::optional<std::size_t>{2});

        CHECK(font.index_of(U'a') == std::optional<std::size_t>{0});
        CHECK(font.index_of(U'b') == std::optional<std::size_t>{1});
        CHECK(font.mapping_count() == 3);
        CHECK(font.has_unicode_table());
    }

    TEST_CASE("lookup of an unmapped character is absent") {
        auto data = make_abc_font();
        auto font = font_factory::load(data);

        CHECK_FALSE(font.lookup(U'Z').has_value());
        CHECK_FALSE(font.index_of(U'Z').has_value());
        CHECK_FALSE(font.lookup(0x10FFFF).has_value());
    }

    TEST_CASE("lookup uses exact scalar values") {
        auto data = make_abc_font();
        auto font = font_factory::load(data);

        // 'A' is mapped, U+FF21 (fullwidth A) and 'a' are distinct
        CHECK_FALSE(font.lookup(0xFF21).has_value());
        CHECK(font.index_of(U'a') != font.index_of(U'A'));
    }

    TEST_CASE("duplicate characters resolve to the first glyph") {
        auto data = psf2_builder(8, 1)
            .add_glyph({0x01})
            .add_glyph({0x02})
            .add_glyph({0x03})
            .unicode_entry("X")
            .unicode_entry("A")
            .unicode_entry("AX")
            .build();
        auto font = font_factory::load(data);

        CHECK(font.index_of(U'A') == std::optional<std::size_t>{1});
        CHECK(font.index_of(U'X') == std::optional<std::size_t>{0});
        CHECK(font.mapping_count() == 2);
    }

    TEST_CASE("one glyph may draw several characters") {
        // U+00C5 and U+212B (angstrom sign) share a glyph
        auto data = psf2_builder(8, 1)
            .add_glyph({0x18})
            .unicode_entry("\xC3\x85\xE2\x84\xAB")
            .build();
        auto font = font_factory::load(data);

        CHECK(font.index_of(0x00C5) == std::optional<std::size_t>{0});
        CHECK(font.index_of(0x212B) == std::optional<std::size_t>{0});
        CHECK(font.mapping_count() == 2);
    }

    TEST_CASE("four byte characters are mapped") {
        auto data = psf2_builder(8, 1)
            .add_glyph({0x3C})
            .unicode_entry("\xF0\x9F\x98\x80")
            .build();
        auto font = font_factory::load(data);

        auto glyph = font.lookup(0x1F600);
        REQUIRE(glyph.has_value());
        CHECK(bytes_of(*glyph) == std::vector<uint8_t>{0x3C});
    }

    TEST_CASE("get_glyph out of range throws") {
        auto data = make_abc_font();
        auto font = font_factory::load(data);

        CHECK_NOTHROW((void)font.get_glyph(2));
        CHECK_THROWS_AS((void)font.get_glyph(3), std::out_of_range);
    }

    TEST_CASE("pixel and row enforce their bounds") {
        auto data = psf2_builder(8, 2).add_glyph({0x80, 0x01}).build();
        auto font = font_factory::load(data);
        auto glyph = font.get_glyph(0);

        CHECK(glyph.pixel(0, 0));
        CHECK(glyph.pixel(7, 1));
        CHECK_THROWS((void)glyph.pixel(glyph.width(), 0));
        CHECK_THROWS((void)glyph.pixel(0, glyph.height()));

        CHECK(glyph.row(1).size() == glyph.line_size());
        CHECK(std::to_integer<uint8_t>(glyph.row(1)[0]) == 0x01);
        CHECK_THROWS((void)glyph.row(2));
    }

    TEST_CASE("font does not depend on the input buffer") {
        screen_font font;
        {
            auto data = make_abc_font();
            font = font_factory::load(data);
            std::fill(data.begin(), data.end(), uint8_t{0});
        }

        auto glyph = font.lookup(U'A');
        REQUIRE(glyph.has_value());
        CHECK(bytes_of(*glyph) == std::vector<uint8_t>{0xA5});
    }

    TEST_CASE("copies are independent") {
        auto data = make_abc_font();
        auto original = font_factory::load(data);
        screen_font copy = original;
        original = screen_font();

        CHECK(copy.glyph_count() == 3);
        auto glyph = copy.lookup(U'b');
        REQUIRE(glyph.has_value());
        CHECK(bytes_of(*glyph) == std::vector<uint8_t>{0x22});
    }

    TEST_CASE("header is kept") {
        auto data = make_abc_font();
        auto font = font_factory::load(data);
        const auto& header = font.get_header();

        CHECK(header.glyph_count == 3);
        CHECK(header.bytes_per_glyph == 1);
        CHECK(header.width == 8);
        CHECK(header.height == 1);
        CHECK(header.has_unicode_table());
    }
}
