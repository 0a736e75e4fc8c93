#include "termbar/bar/width_sync.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace termbar {
namespace bar {

WidthSync::Column::Column(size_t participants)
    : participants_(std::max<size_t>(participants, 1)) {}

int WidthSync::Column::sync(int width) {
    std::unique_lock<std::mutex> lock(mutex_);
    uint64_t generation = generation_;
    round_max_ = std::max(round_max_, width);
    
    if (++published_ == participants_) {
        result_ = round_max_;
        round_max_ = 0;
        published_ = 0;
        ++generation_;
        cv_.notify_all();
        return result_;
    }
    
    cv_.wait(lock, [this, generation] { return generation_ != generation; });
    return result_;
}

int WidthSync::Column::lastMax() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

int WidthSync::Slot::sync(int width) {
    if (!published_) {
        result_ = column_.sync(width);
        published_ = true;
    }
    return result_;
}

WidthSync::WidthSync(size_t columns, size_t participants) {
    columns_.reserve(columns);
    for (size_t i = 0; i < columns; ++i) {
        columns_.push_back(std::make_unique<Column>(participants));
    }
}

WidthSync::Column& WidthSync::column(size_t index) {
    if (index >= columns_.size()) {
        throw std::out_of_range("WidthSync: column " + std::to_string(index) + 
                                " out of range (" + std::to_string(columns_.size()) + ")");
    }
    return *columns_[index];
}

}
}
