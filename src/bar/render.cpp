#include "termbar/bar/render.hpp"
#include "termbar/format/format_utils.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace termbar {
namespace bar {

int percentage(int64_t total, int64_t current, int ratio) {
    if (total == 0 || current > total) {
        return 0;
    }
    double num = static_cast<double>(ratio) * static_cast<double>(current) / static_cast<double>(total);
    double ceil = std::ceil(num);
    double diff = ceil - num;
    if (diff >= 0.6) {
        return static_cast<int>(num);
    }
    return static_cast<int>(ceil);
}

std::string fillBar(int64_t total, int64_t current, int width, 
                    const BarFormat& format, const std::optional<Refill>& refill) {
    if (width < 2 || total <= 0) {
        return "";
    }
    
    // track between the two caps
    int bar_width = width - 2;
    int completed_width = percentage(total, current, bar_width);
    
    std::vector<const std::string*> cells;
    cells.reserve(bar_width);
    
    if (refill) {
        // overlay never extends past the ordinary fill
        int till = std::min(percentage(total, refill->till, bar_width), completed_width);
        for (int i = 0; i < till; ++i) {
            cells.push_back(&refill->glyph);
        }
        for (int i = till; i < completed_width; ++i) {
            cells.push_back(&format.fill());
        }
    } else {
        for (int i = 0; i < completed_width; ++i) {
            cells.push_back(&format.fill());
        }
    }
    
    if (completed_width < bar_width && completed_width > 0) {
        cells.back() = &format.tip();
    }
    
    for (int i = completed_width; i < bar_width; ++i) {
        cells.push_back(&format.empty());
    }
    
    std::string buf = format.left();
    for (const auto* cell : cells) {
        buf += *cell;
    }
    buf += format.right();
    return buf;
}

namespace {

// Slots of both sides for one draw. Whatever is left unpublished, because a
// decorator skipped its sync, threw, or the draw bailed out on a mismatch, is
// published with width 0 so the other bars of the display never wait on this
// one. Settling walks prepend columns before append columns, the same order
// every healthy draw syncs in.
class DrawSlots {
public:
    DrawSlots(WidthSync& prepend_ws, WidthSync& append_ws) {
        for (size_t i = 0; i < prepend_ws.columns(); ++i) {
            prepend_.emplace_back(prepend_ws.column(i));
        }
        for (size_t i = 0; i < append_ws.columns(); ++i) {
            append_.emplace_back(append_ws.column(i));
        }
    }
    
    ~DrawSlots() {
        settle(prepend_, prepend_.size());
        settle(append_, append_.size());
    }
    
    DrawSlots(const DrawSlots&) = delete;
    DrawSlots& operator=(const DrawSlots&) = delete;
    
    std::vector<WidthSync::Slot>& prepend() { return prepend_; }
    std::vector<WidthSync::Slot>& append() { return append_; }
    
    static void settle(std::vector<WidthSync::Slot>& slots, size_t count) {
        for (size_t i = 0; i < count && i < slots.size(); ++i) {
            if (!slots[i].published()) {
                slots[i].sync(0);
            }
        }
    }

private:
    std::vector<WidthSync::Slot> prepend_;
    std::vector<WidthSync::Slot> append_;
};

std::string runDecorators(const std::vector<DecoratorFunc>& funcs, const Statistics& stats,
                          std::vector<WidthSync::Slot>& slots) {
    std::string block;
    for (size_t i = 0; i < funcs.size(); ++i) {
        block += funcs[i](stats, slots[i]);
        DrawSlots::settle(slots, i + 1);
    }
    return block;
}

}

bool columnsMatch(const State& state, const WidthSync& prepend_ws, const WidthSync& append_ws) {
    return state.prepend_funcs.size() == prepend_ws.columns() && 
           state.append_funcs.size() == append_ws.columns();
}

std::string draw(const State& state, int term_width, WidthSync& prepend_ws, WidthSync& append_ws) {
    DrawSlots slots(prepend_ws, append_ws);
    
    if (!columnsMatch(state, prepend_ws, append_ws)) {
        return "";
    }
    if (term_width <= 0) {
        term_width = state.width;
    }
    
    Statistics stats = state.statistics();
    std::string prepend_block = runDecorators(state.prepend_funcs, stats, slots.prepend());
    std::string append_block = runDecorators(state.append_funcs, stats, slots.append());
    
    int prepend_count = static_cast<int>(format::glyphCount(prepend_block));
    int append_count = static_cast<int>(format::glyphCount(append_block));
    
    std::string left_space;
    std::string right_space;
    if (!state.trim_left_space) {
        ++prepend_count;
        left_space = " ";
    }
    if (!state.trim_right_space) {
        ++append_count;
        right_space = " ";
    }
    
    std::string bar_block;
    if (state.spinner) {
        bar_block = state.format.left() + state.spinner->glyph() + state.format.right();
        return prepend_block + left_space + bar_block + right_space + append_block;
    }
    
    bar_block = fillBar(state.total, state.current, state.width, state.format, state.refill);
    int bar_count = static_cast<int>(format::glyphCount(bar_block));
    if (prepend_count + bar_count + append_count > term_width) {
        int new_width = term_width - prepend_count - append_count;
        bar_block = fillBar(state.total, state.current, new_width, state.format, state.refill);
    }
    
    return prepend_block + left_space + bar_block + right_space + append_block;
}

}
}
