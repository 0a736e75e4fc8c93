#pragma once

#include <mutex>
#include <condition_variable>
#include <functional>
#include <map>
#include <chrono>
#include <cstddef>

namespace termbar {
namespace bar {

// One-shot broadcast latch. Any number of threads may wait on it; fire()
// takes effect once.
class Signal {
public:
    using Callback = std::function<void()>;
    
    Signal() = default;
    Signal(const Signal&) = delete;
    Signal& operator=(const Signal&) = delete;
    
    // Returns true only for the call that actually fired the signal.
    bool fire();
    bool fired() const;
    void wait() const;
    
    template<typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return fired_; });
    }
    
    // Callbacks run on the firing thread while the signal is locked; they must
    // not call back into this signal. Subscribing to a fired signal runs the
    // callback immediately and returns 0.
    size_t subscribe(Callback callback);
    void unsubscribe(size_t token);

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool fired_ = false;
    size_t next_token_ = 1;
    std::map<size_t, Callback> subscribers_;
};

// Counts outstanding bars of a display; wait() returns once every
// registered bar has called done().
class CompletionCounter {
public:
    CompletionCounter() = default;
    CompletionCounter(const CompletionCounter&) = delete;
    CompletionCounter& operator=(const CompletionCounter&) = delete;
    
    void add(int delta = 1);
    void done();
    void wait() const;
    
    template<typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return count_ == 0; });
    }
    
    int count() const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    int count_ = 0;
};

}
}
