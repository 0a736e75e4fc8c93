#include "termbar/bar/state.hpp"
#include <limits>

namespace termbar {
namespace bar {

nlohmann::json toJson(const Statistics& stats) {
    using std::chrono::duration_cast;
    using std::chrono::milliseconds;
    
    return nlohmann::json{
        {"id", stats.id},
        {"completed", stats.completed},
        {"aborted", stats.aborted},
        {"total", stats.total},
        {"current", stats.current},
        {"time_elapsed_ms", duration_cast<milliseconds>(stats.time_elapsed).count()},
        {"time_per_item_ns", stats.time_per_item.count()},
        {"eta_ms", duration_cast<milliseconds>(stats.eta()).count()}
    };
}

void State::applyIncrement(int64_t n, Clock::time_point now) {
    if (n < 1 || completed) {
        return;
    }
    
    if (current == 0) {
        start_time = now;
        block_start_time = now;
    }
    
    // unknown totals never clamp, so saturate instead of overflowing
    int64_t sum = n > std::numeric_limits<int64_t>::max() - current 
        ? std::numeric_limits<int64_t>::max() 
        : current + n;
    time_elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(now - start_time);
    updateTimePerItemEstimate(n, now);
    
    if (total > 0 && sum >= total) {
        current = total;
        completed = true;
        return;
    }
    
    current = sum;
    block_start_time = now;
}

void State::updateTimePerItemEstimate(int64_t amount, Clock::time_point now) {
    auto last_block_time = std::chrono::duration<double, std::nano>(now - block_start_time);
    double last_item_estimate = last_block_time.count() / static_cast<double>(amount);
    double estimate = eta_alpha * last_item_estimate + 
                      (1.0 - eta_alpha) * static_cast<double>(time_per_item.count());
    time_per_item = std::chrono::nanoseconds(static_cast<int64_t>(estimate));
}

Statistics State::statistics() const {
    Statistics stats;
    stats.id = id;
    stats.completed = completed;
    stats.aborted = aborted;
    stats.total = total;
    stats.current = current;
    stats.start_time = start_time;
    stats.time_elapsed = time_elapsed;
    stats.time_per_item = time_per_item;
    return stats;
}

}
}
