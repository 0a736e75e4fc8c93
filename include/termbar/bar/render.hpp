#pragma once

#include "termbar/bar/state.hpp"
#include "termbar/bar/format.hpp"
#include "termbar/bar/width_sync.hpp"
#include <optional>
#include <string>
#include <cstdint>

namespace termbar {
namespace bar {

// Maps current/total onto [0, ratio]. Rounds up unless the distance to the
// next integer is at least 0.6, so 3.4 becomes 3 and 3.5 becomes 4.
int percentage(int64_t total, int64_t current, int ratio);

// Bar body of exactly width glyphs including both caps, or empty when
// width < 2 or total <= 0.
std::string fillBar(int64_t total, int64_t current, int width, 
                    const BarFormat& format, const std::optional<Refill>& refill);

// True when each side has exactly one decorator per WidthSync column.
bool columnsMatch(const State& state, const WidthSync& prepend_ws, const WidthSync& append_ws);

// Renders one line (without terminator) from an immutable snapshot. Returns
// an empty string while columnsMatch() is false. Every column of both
// WidthSyncs is published exactly once per call, even when a decorator
// throws.
std::string draw(const State& state, int term_width, WidthSync& prepend_ws, WidthSync& append_ws);

}
}
