#pragma once

#include <mutex>
#include <condition_variable>
#include <memory>
#include <vector>
#include <cstddef>
#include <cstdint>

namespace termbar {
namespace bar {

// Aligns decorator columns across the bars of one display. Each column is a
// reusable barrier: every participating bar publishes its measured width and
// receives the widest one once all participants have published.
class WidthSync {
public:
    class Column {
    public:
        explicit Column(size_t participants);
        
        // Publishes width and blocks until the current round is complete.
        int sync(int width);
        
        // Result of the last completed round, 0 before the first.
        int lastMax() const;
        
    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        size_t participants_;
        size_t published_ = 0;
        int round_max_ = 0;
        int result_ = 0;
        uint64_t generation_ = 0;
    };
    
    // One bar's view of a column for a single draw. The first sync()
    // publishes, later calls return the same result.
    class Slot {
    public:
        explicit Slot(Column& column) : column_(column) {}
        
        int sync(int width);
        bool published() const { return published_; }
        
    private:
        Column& column_;
        bool published_ = false;
        int result_ = 0;
    };
    
    WidthSync(size_t columns, size_t participants);
    
    size_t columns() const { return columns_.size(); }
    Column& column(size_t index);

private:
    std::vector<std::unique_ptr<Column>> columns_;
};

}
}
