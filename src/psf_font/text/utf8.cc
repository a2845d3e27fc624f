//
// Created by igor on 21/12/2025.
//

#include <psf_font/text/utf8.hh>
#include <bit>

namespace psf_font {

namespace {

// UTF-8 replacement character (used for invalid sequences)
constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

// Check if byte is a UTF-8 continuation byte (10xxxxxx)
constexpr bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

constexpr utf8_decode_result invalid(int bytes) {
    return {REPLACEMENT_CHAR, bytes, false};
}

utf8_decode_result decode(const unsigned char* data, std::size_t len) {
    if (len == 0) {
        return invalid(0);
    }

    unsigned char first = data[0];

    // ASCII (0xxxxxxx)
    if (first < 0x80) {
        return {static_cast<char32_t>(first), 1, true};
    }

    // Invalid: continuation byte at start
    if (is_continuation(first)) {
        return invalid(1);
    }

    // Invalid: starts with 11111xxx
    if (first >= 0xF8) {
        return invalid(1);
    }

    // 2-byte sequence (110xxxxx 10xxxxxx)
    if ((first & 0xE0) == 0xC0) {
        if (len < 2 || !is_continuation(data[1])) {
            return invalid(1);
        }
        char32_t cp = static_cast<char32_t>(((first & 0x1F) << 6) | (data[1] & 0x3F));
        // Overlong encoding
        if (cp < 0x80) {
            return invalid(2);
        }
        return {cp, 2, true};
    }

    // 3-byte sequence (1110xxxx 10xxxxxx 10xxxxxx)
    if ((first & 0xF0) == 0xE0) {
        if (len < 3 || !is_continuation(data[1]) || !is_continuation(data[2])) {
            return invalid(1);
        }
        char32_t cp = static_cast<char32_t>(((first & 0x0F) << 12) |
                      ((data[1] & 0x3F) << 6) |
                      (data[2] & 0x3F));
        // Overlong encoding
        if (cp < 0x800) {
            return invalid(3);
        }
        // Surrogates are not scalar values
        if (cp >= 0xD800 && cp <= 0xDFFF) {
            return invalid(3);
        }
        return {cp, 3, true};
    }

    // 4-byte sequence (11110xxx 10xxxxxx 10xxxxxx 10xxxxxx)
    if (len < 4 || !is_continuation(data[1]) ||
        !is_continuation(data[2]) || !is_continuation(data[3])) {
        return invalid(1);
    }
    char32_t cp = static_cast<char32_t>(((first & 0x07) << 18) |
                  ((data[1] & 0x3F) << 12) |
                  ((data[2] & 0x3F) << 6) |
                  (data[3] & 0x3F));
    // Overlong encoding
    if (cp < 0x10000) {
        return invalid(4);
    }
    // Beyond Unicode range
    if (cp > 0x10FFFF) {
        return invalid(4);
    }
    return {cp, 4, true};
}

} // anonymous namespace

int utf8_sequence_length(std::uint8_t lead) noexcept {
    const int ones = std::countl_one(lead);
    return ones == 0 ? 1 : ones;
}

utf8_decode_result utf8_decode_one(std::string_view str) noexcept {
    return decode(reinterpret_cast<const unsigned char*>(str.data()), str.size());
}

utf8_decode_result utf8_decode_one(std::span<const std::uint8_t> bytes) noexcept {
    return decode(bytes.data(), bytes.size());
}

utf8_iterator::utf8_iterator(std::string_view str)
    : m_remaining(str)
    , m_at_end(str.empty()) {
    if (!m_at_end) {
        auto r = utf8_decode_one(m_remaining);
        m_current = r.codepoint;
        m_remaining.remove_prefix(static_cast<std::size_t>(r.bytes_consumed));
    }
}

void utf8_iterator::decode_next() {
    if (m_remaining.empty()) {
        m_at_end = true;
        m_current = 0;
        return;
    }

    auto r = utf8_decode_one(m_remaining);
    m_current = r.codepoint;
    m_remaining.remove_prefix(static_cast<std::size_t>(r.bytes_consumed));
}

utf8_iterator& utf8_iterator::operator++() {
    decode_next();
    return *this;
}

utf8_iterator utf8_iterator::operator++(int) {
    utf8_iterator tmp = *this;
    ++(*this);
    return tmp;
}

bool utf8_iterator::operator==(const utf8_iterator& other) const {
    if (m_at_end && other.m_at_end) {
        return true;
    }
    if (m_at_end != other.m_at_end) {
        return false;
    }
    return m_remaining.data() == other.m_remaining.data() &&
           m_remaining.size() == other.m_remaining.size();
}

} // namespace psf_font
