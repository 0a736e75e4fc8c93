#include "termbar/format/format_utils.hpp"
#include <spdlog/fmt/fmt.h>

namespace termbar {
namespace format {

namespace {

constexpr const char* REPLACEMENT_GLYPH = "\uFFFD";

bool isContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}

size_t utf8SequenceLength(unsigned char c) {
    if ((c & 0x80) == 0) return 1;
    if ((c & 0xE0) == 0xC0) return 2;
    if ((c & 0xF0) == 0xE0) return 3;
    if ((c & 0xF8) == 0xF0) return 4;
    return 0;
}

std::vector<std::string> splitGlyphs(const std::string& text) {
    std::vector<std::string> glyphs;
    glyphs.reserve(text.size());
    
    for (size_t i = 0; i < text.length(); ) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        size_t utf8_len = utf8SequenceLength(c);
        
        bool valid = utf8_len > 0 && i + utf8_len <= text.length();
        for (size_t j = 1; valid && j < utf8_len; ++j) {
            if (!isContinuationByte(static_cast<unsigned char>(text[i + j]))) {
                valid = false;
            }
        }
        
        if (valid) {
            glyphs.push_back(text.substr(i, utf8_len));
            i += utf8_len;
        } else {
            glyphs.push_back(REPLACEMENT_GLYPH);
            ++i;
        }
    }
    
    return glyphs;
}

size_t glyphCount(const std::string& text) {
    size_t count = 0;
    for (char ch : text) {
        if (!isContinuationByte(static_cast<unsigned char>(ch))) {
            ++count;
        }
    }
    return count;
}

std::string encodeGlyph(char32_t code_point) {
    std::string out;
    if (code_point > 0x10FFFF || (code_point >= 0xD800 && code_point <= 0xDFFF)) {
        return REPLACEMENT_GLYPH;
    }
    
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    return out;
}

char32_t decodeGlyph(const std::string& text) {
    if (text.empty()) {
        return 0xFFFD;
    }
    
    unsigned char lead = static_cast<unsigned char>(text[0]);
    size_t utf8_len = utf8SequenceLength(lead);
    if (utf8_len == 0 || utf8_len > text.length()) {
        return 0xFFFD;
    }
    if (utf8_len == 1) {
        return lead;
    }
    
    char32_t code_point = lead & (0xFF >> (utf8_len + 1));
    for (size_t i = 1; i < utf8_len; ++i) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (!isContinuationByte(c)) {
            return 0xFFFD;
        }
        code_point = (code_point << 6) | (c & 0x3F);
    }
    return code_point;
}

std::string formatBytes(uint64_t bytes) {
    if (bytes < 1024) return fmt::format("{} B", bytes);
    if (bytes < 1024 * 1024) return fmt::format("{:.1f} KB", bytes / 1024.0);
    if (bytes < 1024ULL * 1024 * 1024) return fmt::format("{:.1f} MB", bytes / (1024.0 * 1024.0));
    return fmt::format("{:.1f} GB", bytes / (1024.0 * 1024.0 * 1024.0));
}

}
}
