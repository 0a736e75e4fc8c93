#pragma once

#include "termbar/bar/state.hpp"
#include "termbar/bar/signal.hpp"
#include "termbar/bar/width_sync.hpp"
#include "termbar/common/config.hpp"
#include <condition_variable>
#include <functional>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <cstdint>

namespace termbar {
namespace bar {

class ProxyReader;

struct BarOptions {
    int id = 0;
    int width = constants::limits::DEFAULT_BAR_WIDTH;
    BarFormat format;
    double eta_alpha = constants::limits::DEFAULT_ETA_ALPHA;
    bool trim_left_space = false;
    bool trim_right_space = false;
    std::vector<DecoratorFunc> prepend;
    std::vector<DecoratorFunc> append;
    
    static BarOptions fromConfig(const common::BarConfig& config);
};

// A single progress bar. One worker thread owns the State; every operation
// is handed to it through a one-slot rendezvous, so callers block until the
// worker takes the request or has terminated.
//
// The counter and cancel signal, when given, must outlive the bar. The
// counter is incremented on construction and decremented once on
// termination.
class Bar {
public:
    Bar(int64_t total, BarOptions options = BarOptions(), 
        CompletionCounter* counter = nullptr, Signal* cancel = nullptr);
    ~Bar();
    
    Bar(const Bar&) = delete;
    Bar& operator=(const Bar&) = delete;
    
    void increment(int64_t n);
    void resumeFill(char32_t glyph, int64_t till);
    void complete();
    bool inProgress() const;
    
    int getId();
    Statistics statistics();
    size_t numOfAppenders();
    size_t numOfPrependers();
    void removeAllPrependers();
    void removeAllAppenders();
    
    ProxyReader proxyReader(std::istream& stream);
    
    // One line terminated by '\n'. If the snapshot shows a completed bar the
    // worker waits for flushed before finishing, so the caller must fire it
    // once the line has been written.
    std::string render(int term_width, std::shared_ptr<Signal> flushed, 
                       WidthSync& prepend_ws, WidthSync& append_ws);
    
    void wait() const { done_.wait(); }
    const Signal& done() const { return done_; }

private:
    using Operation = std::function<void(State&)>;
    
    bool submit(Operation op);
    
    template<typename T, typename Read>
    T query(Read read) {
        auto result = std::make_shared<std::promise<T>>();
        auto future = result->get_future();
        if (submit([result, read](State& s) { result->set_value(read(s)); })) {
            return future.get();
        }
        return read(final_state_);
    }
    
    void serve(State state);
    void finalize(State state);
    void onCancel();
    
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Operation> pending_;
    uint64_t submitted_ = 0;
    uint64_t taken_ = 0;
    bool complete_requested_ = false;
    bool cancel_pending_ = false;
    bool cancel_observed_ = false;
    bool closed_ = false;
    
    // written once by the worker before closed_ is set
    State final_state_;
    
    CompletionCounter* counter_;
    Signal* cancel_;
    size_t cancel_token_ = 0;
    Signal done_;
    std::thread worker_;
};

}
}
