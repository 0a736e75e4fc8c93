#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace termbar {
namespace format {

// Length of the UTF-8 sequence introduced by lead byte c, 0 if c is not a lead byte.
size_t utf8SequenceLength(unsigned char c);

// Splits text into one string per code point. Invalid bytes become U+FFFD.
std::vector<std::string> splitGlyphs(const std::string& text);

size_t glyphCount(const std::string& text);

std::string encodeGlyph(char32_t code_point);

// Code point of the first glyph in text, U+FFFD if it is not valid UTF-8.
char32_t decodeGlyph(const std::string& text);

std::string formatBytes(uint64_t bytes);

}
}
