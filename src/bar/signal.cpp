#include "termbar/bar/signal.hpp"
#include <stdexcept>

namespace termbar {
namespace bar {

bool Signal::fire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fired_) {
        return false;
    }
    fired_ = true;
    
    auto subscribers = std::move(subscribers_);
    subscribers_.clear();
    for (auto& entry : subscribers) {
        entry.second();
    }
    
    cv_.notify_all();
    return true;
}

bool Signal::fired() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fired_;
}

void Signal::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return fired_; });
}

size_t Signal::subscribe(Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fired_) {
        callback();
        return 0;
    }
    size_t token = next_token_++;
    subscribers_.emplace(token, std::move(callback));
    return token;
}

void Signal::unsubscribe(size_t token) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.erase(token);
}

void CompletionCounter::add(int delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count_ + delta < 0) {
        throw std::logic_error("CompletionCounter: negative count");
    }
    count_ += delta;
    if (count_ == 0) {
        cv_.notify_all();
    }
}

void CompletionCounter::done() {
    add(-1);
}

void CompletionCounter::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return count_ == 0; });
}

int CompletionCounter::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

}
}
