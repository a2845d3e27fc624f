//
// Created by igor on 21/12/2025.
//
// Unit tests for UTF-8 decoding
//

#include <doctest/doctest.h>
#include <psf_font/text/utf8.hh>
#include <vector>

using namespace psf_font;

TEST_SUITE("utf8") {

    TEST_CASE("sequence length from lead byte") {
        CHECK(utf8_sequence_length(0x00) == 1);
        CHECK(utf8_sequence_length('A') == 1);
        CHECK(utf8_sequence_length(0x7F) == 1);
        CHECK(utf8_sequence_length(0x80) == 1);  // continuation byte
        CHECK(utf8_sequence_length(0xBF) == 1);
        CHECK(utf8_sequence_length(0xC3) == 2);
        CHECK(utf8_sequence_length(0xE2) == 3);
        CHECK(utf8_sequence_length(0xF0) == 4);
        CHECK(utf8_sequence_length(0xF8) == 5);
        CHECK(utf8_sequence_length(0xFC) == 6);
    }

    TEST_CASE("decode ASCII") {
        auto r = utf8_decode_one("Hello");
        CHECK(r.codepoint == 'H');
        CHECK(r.bytes_consumed == 1);
        CHECK(r.valid);

        auto r2 = utf8_decode_one(" ");
        CHECK(r2.codepoint == ' ');
        CHECK(r2.bytes_consumed == 1);
    }

    TEST_CASE("decode 2-byte UTF-8") {
        // U+00E9 = C3 A9
        auto r = utf8_decode_one("\xC3\xA9");
        CHECK(r.codepoint == 0x00E9);
        CHECK(r.bytes_consumed == 2);
        CHECK(r.valid);

        // U+00A9 = C2 A9
        auto r2 = utf8_decode_one("\xC2\xA9");
        CHECK(r2.codepoint == 0x00A9);
        CHECK(r2.bytes_consumed == 2);
    }

    TEST_CASE("decode 3-byte UTF-8") {
        // U+20AC = E2 82 AC
        auto r = utf8_decode_one("\xE2\x82\xAC");
        CHECK(r.codepoint == 0x20AC);
        CHECK(r.bytes_consumed == 3);
        CHECK(r.valid);

        // U+2588 (full block) = E2 96 88
        auto r2 = utf8_decode_one("\xE2\x96\x88");
        CHECK(r2.codepoint == 0x2588);
        CHECK(r2.bytes_consumed == 3);
    }

    TEST_CASE("decode 4-byte UTF-8") {
        // U+1F600 = F0 9F 98 80
        auto r = utf8_decode_one("\xF0\x9F\x98\x80");
        CHECK(r.codepoint == 0x1F600);
        CHECK(r.bytes_consumed == 4);
        CHECK(r.valid);

        // U+10FFFF = F4 8F BF BF
        auto r2 = utf8_decode_one("\xF4\x8F\xBF\xBF");
        CHECK(r2.codepoint == 0x10FFFF);
        CHECK(r2.valid);
    }

    TEST_CASE("decode raw bytes") {
        const std::vector<std::uint8_t> bytes = {0xE2, 0x94, 0x80, 0xFF};
        auto r = utf8_decode_one(std::span<const std::uint8_t>(bytes));
        CHECK(r.codepoint == 0x2500);
        CHECK(r.bytes_consumed == 3);
        CHECK(r.valid);
    }

    TEST_CASE("decode empty string") {
        auto r = utf8_decode_one("");
        CHECK(r.codepoint == 0xFFFD);
        CHECK(r.bytes_consumed == 0);
        CHECK_FALSE(r.valid);
    }

    TEST_CASE("invalid UTF-8 is reported") {
        // Invalid start byte
        auto r1 = utf8_decode_one("\xFF\xFE");
        CHECK_FALSE(r1.valid);
        CHECK(r1.codepoint == 0xFFFD);
        CHECK(r1.bytes_consumed == 1);

        // Continuation byte at start
        auto r2 = utf8_decode_one("\x80\x80");
        CHECK_FALSE(r2.valid);
        CHECK(r2.bytes_consumed == 1);

        // Incomplete 2-byte sequence
        auto r3 = utf8_decode_one("\xC3");
        CHECK_FALSE(r3.valid);
        CHECK(r3.bytes_consumed == 1);

        // Incomplete 3-byte sequence
        auto r4 = utf8_decode_one("\xE4\xB8");
        CHECK_FALSE(r4.valid);

        // Incomplete 4-byte sequence
        auto r5 = utf8_decode_one("\xF0\x9F\x98");
        CHECK_FALSE(r5.valid);
    }

    TEST_CASE("literal replacement character is valid") {
        // U+FFFD = EF BF BD
        auto r = utf8_decode_one("\xEF\xBF\xBD");
        CHECK(r.codepoint == 0xFFFD);
        CHECK(r.valid);
    }

    TEST_CASE("overlong encoding rejected") {
        // '/' encoded as C0 AF
        auto r = utf8_decode_one("\xC0\xAF");
        CHECK_FALSE(r.valid);
        CHECK(r.codepoint == 0xFFFD);
        CHECK(r.bytes_consumed == 2);

        // U+0020 encoded in 3 bytes
        CHECK_FALSE(utf8_decode_one("\xE0\x80\xA0").valid);
    }

    TEST_CASE("surrogates rejected") {
        // U+D800 = ED A0 80
        auto r = utf8_decode_one("\xED\xA0\x80");
        CHECK_FALSE(r.valid);
        CHECK(r.codepoint == 0xFFFD);
    }

    TEST_CASE("codepoints beyond U+10FFFF rejected") {
        auto r = utf8_decode_one("\xF4\x90\x80\x80");
        CHECK_FALSE(r.valid);
        CHECK(r.bytes_consumed == 4);
    }

    TEST_CASE("iterate UTF-8 string") {
        std::vector<char32_t> codepoints;
        for (char32_t cp : utf8_view("Hello")) {
            codepoints.push_back(cp);
        }
        REQUIRE(codepoints.size() == 5);
        CHECK(codepoints[0] == 'H');
        CHECK(codepoints[4] == 'o');
    }

    TEST_CASE("iterate mixed script string") {
        std::vector<char32_t> codepoints;
        // 'A', U+4E2D, U+1F600
        for (char32_t cp : utf8_view("A\xE4\xB8\xAD\xF0\x9F\x98\x80")) {
            codepoints.push_back(cp);
        }
        REQUIRE(codepoints.size() == 3);
        CHECK(codepoints[0] == 'A');
        CHECK(codepoints[1] == 0x4E2D);
        CHECK(codepoints[2] == 0x1F600);
    }

    TEST_CASE("iterate invalid bytes yields replacement characters") {
        std::vector<char32_t> codepoints;
        for (char32_t cp : utf8_view("a\xFF" "b")) {
            codepoints.push_back(cp);
        }
        REQUIRE(codepoints.size() == 3);
        CHECK(codepoints[0] == 'a');
        CHECK(codepoints[1] == 0xFFFD);
        CHECK(codepoints[2] == 'b');
    }

    TEST_CASE("iterate empty string") {
        std::vector<char32_t> codepoints;
        for (char32_t cp : utf8_view("")) {
            codepoints.push_back(cp);
        }
        CHECK(codepoints.empty());
    }

    TEST_CASE("iterator equality") {
        utf8_view view("AB");
        auto it1 = view.begin();
        auto it2 = view.begin();
        auto end = view.end();

        CHECK(it1 == it2);
        CHECK(it1 != end);

        ++it1;
        CHECK(it1 != it2);

        ++it2;
        CHECK(it1 == it2);

        ++it1;
        ++it2;
        CHECK(it1 == end);
        CHECK(it2 == end);
    }

    TEST_CASE("iterator post-increment") {
        utf8_view view("AB");
        auto it = view.begin();

        auto old = it++;
        CHECK(*old == 'A');
        CHECK(*it == 'B');
    }
}
