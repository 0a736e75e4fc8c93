#pragma once

#include "termbar/bar/format.hpp"
#include "termbar/bar/width_sync.hpp"
#include "termbar/common/constants.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace termbar {
namespace bar {

using Clock = std::chrono::steady_clock;

struct Statistics {
    int id = 0;
    bool completed = false;
    bool aborted = false;
    int64_t total = 0;
    int64_t current = 0;
    Clock::time_point start_time{};
    std::chrono::nanoseconds time_elapsed{0};
    std::chrono::nanoseconds time_per_item{0};
    
    // Exponential-weighted-moving-average estimate of the remaining time,
    // zero when the total is unknown or reached.
    std::chrono::nanoseconds eta() const {
        if (total <= 0 || current >= total) {
            return std::chrono::nanoseconds(0);
        }
        return (total - current) * time_per_item;
    }
};

nlohmann::json toJson(const Statistics& stats);

// Receives a snapshot and its column slot; returns the text to place before
// or after the bar body. A slot left unpublished is settled with width 0
// once the decorator returns or throws.
using DecoratorFunc = std::function<std::string(const Statistics& stats, WidthSync::Slot& slot)>;

struct Refill {
    std::string glyph;
    int64_t till = 0;
};

class Spinner {
public:
    void advance() {
        index_ = (index_ + 1) % constants::glyphs::SPINNER.size();
    }
    
    char glyph() const { return constants::glyphs::SPINNER[index_]; }

private:
    // First advance() lands on the first glyph.
    size_t index_ = constants::glyphs::SPINNER.size() - 1;
};

struct State {
    int id = 0;
    int width = constants::limits::DEFAULT_BAR_WIDTH;
    BarFormat format;
    double eta_alpha = constants::limits::DEFAULT_ETA_ALPHA;
    int64_t total = 0;
    int64_t current = 0;
    bool trim_left_space = false;
    bool trim_right_space = false;
    bool completed = false;
    bool aborted = false;
    Clock::time_point start_time{};
    Clock::time_point block_start_time{};
    std::chrono::nanoseconds time_elapsed{0};
    std::chrono::nanoseconds time_per_item{0};
    std::vector<DecoratorFunc> prepend_funcs;
    std::vector<DecoratorFunc> append_funcs;
    std::optional<Spinner> spinner;
    std::optional<Refill> refill;
    
    void applyIncrement(int64_t n, Clock::time_point now);
    void updateTimePerItemEstimate(int64_t amount, Clock::time_point now);
    Statistics statistics() const;
};

}
}
