#include "termbar/bar/format.hpp"
#include "termbar/format/format_utils.hpp"

namespace termbar {
namespace bar {

BarFormat::BarFormat() {
    glyphs_ = {"[", "=", ">", "-", "]"};
}

BarFormat BarFormat::defaultFormat() {
    return BarFormat();
}

std::optional<BarFormat> BarFormat::parse(const std::string& format) {
    auto glyphs = format::splitGlyphs(format);
    if (glyphs.size() != constants::glyphs::FORMAT_LENGTH) {
        return std::nullopt;
    }
    
    BarFormat result;
    for (size_t i = 0; i < glyphs.size(); ++i) {
        result.glyphs_[i] = glyphs[i];
    }
    return result;
}

std::string BarFormat::toString() const {
    std::string out;
    for (const auto& glyph : glyphs_) {
        out += glyph;
    }
    return out;
}

}
}
