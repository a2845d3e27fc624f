//
// PSF2 font inspector
// Prints the header of a PC Screen Font and renders text with it as ASCII art
//
// Usage: psf_dump <font.psf> [text]
//

#include <psf_font/font_factory.hh>
#include <psf_font/screen_font.hh>
#include <psf_font/text/utf8.hh>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace psf_font;

// ============================================================================
// Utility functions
// ============================================================================

std::vector<uint8_t> load_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return {};
    }

    auto size = file.tellg();
    if (size <= 0) {
        return {};
    }

    std::vector<uint8_t> data(static_cast<size_t>(size));
    file.seekg(0);
    file.read(reinterpret_cast<char*>(data.data()), size);
    return data;
}

void print_separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n";
}

void dump_header(const screen_font& font) {
    const auto& h = font.get_header();
    std::cout << "version: " << h.version << "\n";
    std::cout << "header_size: " << h.header_size << "\n";
    std::cout << "flags: 0x" << std::hex << h.flags << std::dec << "\n";
    std::cout << "glyph_count: " << h.glyph_count << "\n";
    std::cout << "bytes_per_glyph: " << h.bytes_per_glyph << "\n";
    std::cout << "width: " << h.width << " (line_size " << h.line_size() << ")\n";
    std::cout << "height: " << h.height << "\n";
    std::cout << "unicode table: " << (font.has_unicode_table() ? "yes" : "no")
              << ", " << font.mapping_count() << " mapping(s)\n";
}

// Render one line of text, one glyph per cell. Characters without a
// glyph are drawn as an empty cell.
void render_text(const screen_font& font, const std::string& text) {
    std::vector<glyph_view> glyphs;
    for (char32_t cp : utf8_view(text)) {
        if (auto g = font.lookup(cp)) {
            glyphs.push_back(*g);
        } else {
            glyphs.emplace_back();
        }
    }

    for (uint32_t y = 0; y < font.height(); ++y) {
        std::string line;
        for (const auto& g : glyphs) {
            for (uint32_t x = 0; x < font.width(); ++x) {
                line += g.get(x, y).value_or(false) ? '#' : ' ';
            }
        }
        std::cout << line << "\n";
    }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <font.psf> [text]\n";
        return 2;
    }

    const std::filesystem::path path = argv[1];
    auto data = load_file(path);
    if (data.empty()) {
        std::cerr << "Cannot read " << path << "\n";
        return 1;
    }

    print_separator(path.filename().string());
    std::cout << "File size: " << data.size() << " bytes\n";
    std::cout << "Format: " << font_factory::format_name(font_factory::detect(data)) << "\n";

    try {
        auto font = font_factory::load(data);
        dump_header(font);

        if (argc > 2) {
            print_separator("Text");
            render_text(font, argv[2]);
        }
    } catch (const psf_error& e) {
        std::cerr << "Error [" << errc_name(e.code()) << "]: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
