#pragma once

#include "termbar/common/constants.hpp"
#include <array>
#include <string>
#include <optional>

namespace termbar {
namespace bar {

// Five display glyphs, each one UTF-8 encoded code point:
// left cap, fill, tip, empty, right cap.
class BarFormat {
public:
    BarFormat();
    
    static std::optional<BarFormat> parse(const std::string& format);
    static BarFormat defaultFormat();
    
    const std::string& left() const { return glyphs_[constants::glyphs::LEFT]; }
    const std::string& fill() const { return glyphs_[constants::glyphs::FILL]; }
    const std::string& tip() const { return glyphs_[constants::glyphs::TIP]; }
    const std::string& empty() const { return glyphs_[constants::glyphs::EMPTY]; }
    const std::string& right() const { return glyphs_[constants::glyphs::RIGHT]; }
    
    std::string toString() const;
    
    bool operator==(const BarFormat& other) const { return glyphs_ == other.glyphs_; }
    bool operator!=(const BarFormat& other) const { return !(*this == other); }

private:
    std::array<std::string, constants::glyphs::FORMAT_LENGTH> glyphs_;
};

}
}
