#include "termbar/bar/bar.hpp"
#include "termbar/bar/proxy_reader.hpp"
#include "termbar/bar/render.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/format/format_utils.hpp"

namespace termbar {
namespace bar {

BarOptions BarOptions::fromConfig(const common::BarConfig& config) {
    BarOptions options;
    options.width = config.width;
    options.eta_alpha = config.eta_alpha;
    options.trim_left_space = config.trim_left_space;
    options.trim_right_space = config.trim_right_space;
    
    auto format = BarFormat::parse(config.format);
    if (format) {
        options.format = *format;
    } else {
        common::Logger::instance().warn("[Bar] Invalid format, using default | format={}", config.format);
    }
    return options;
}

Bar::Bar(int64_t total, BarOptions options, CompletionCounter* counter, Signal* cancel)
    : counter_(counter), cancel_(cancel) {
    State state;
    state.id = options.id;
    state.width = options.width;
    state.format = options.format;
    state.eta_alpha = options.eta_alpha;
    state.total = total;
    state.trim_left_space = options.trim_left_space;
    state.trim_right_space = options.trim_right_space;
    state.prepend_funcs = std::move(options.prepend);
    state.append_funcs = std::move(options.append);
    
    if (total <= 0) {
        state.spinner = Spinner();
    }
    
    final_state_.id = state.id;
    final_state_.width = state.width;
    
    if (counter_) {
        counter_->add(1);
    }
    
    if (cancel_) {
        cancel_token_ = cancel_->subscribe([this]() { onCancel(); });
    }
    
    common::Logger::instance().debug("[Bar] Started | id={} | total={} | width={} | format={} | spinner={}", 
                                    state.id, total, state.width, state.format.toString(), 
                                    state.spinner.has_value());
    
    worker_ = std::thread(&Bar::serve, this, std::move(state));
}

Bar::~Bar() {
    if (cancel_ && cancel_token_ != 0) {
        cancel_->unsubscribe(cancel_token_);
    }
    complete();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void Bar::increment(int64_t n) {
    if (n < 1) {
        return;
    }
    submit([n](State& s) { s.applyIncrement(n, Clock::now()); });
}

void Bar::resumeFill(char32_t glyph, int64_t till) {
    if (till < 1) {
        return;
    }
    Refill refill{format::encodeGlyph(glyph), till};
    submit([refill](State& s) { s.refill = refill; });
}

void Bar::complete() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (complete_requested_) {
        return;
    }
    complete_requested_ = true;
    cv_.notify_all();
}

bool Bar::inProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !complete_requested_;
}

int Bar::getId() {
    return query<int>([](const State& s) { return s.id; });
}

Statistics Bar::statistics() {
    return query<Statistics>([](const State& s) { return s.statistics(); });
}

size_t Bar::numOfAppenders() {
    return query<size_t>([](const State& s) { return s.append_funcs.size(); });
}

size_t Bar::numOfPrependers() {
    return query<size_t>([](const State& s) { return s.prepend_funcs.size(); });
}

void Bar::removeAllPrependers() {
    submit([](State& s) { s.prepend_funcs.clear(); });
}

void Bar::removeAllAppenders() {
    submit([](State& s) { s.append_funcs.clear(); });
}

ProxyReader Bar::proxyReader(std::istream& stream) {
    return ProxyReader(stream, *this);
}

std::string Bar::render(int term_width, std::shared_ptr<Signal> flushed, 
                        WidthSync& prepend_ws, WidthSync& append_ws) {
    auto result = std::make_shared<std::promise<State>>();
    auto future = result->get_future();
    
    bool accepted = submit([this, result, flushed, &prepend_ws, &append_ws](State& s) {
        // a frame skipped on a column mismatch does not consume a glyph
        if (s.spinner && columnsMatch(s, prepend_ws, append_ws)) {
            s.spinner->advance();
        }
        result->set_value(s);
        if (s.completed) {
            if (flushed) {
                flushed->wait();
            }
            complete();
        }
    });
    
    State snapshot = accepted ? future.get() : final_state_;
    
    try {
        return draw(snapshot, term_width, prepend_ws, append_ws) + "\n";
    } catch (const std::exception& e) {
        common::Logger::instance().warn("[Bar] Decorator failed | id={} | error={}", snapshot.id, e.what());
        return fmt::format("{}\n", e.what());
    } catch (...) {
        common::Logger::instance().warn("[Bar] Decorator failed | id={} | error=unknown", snapshot.id);
        return "decorator failed: unknown error\n";
    }
}

bool Bar::submit(Operation op) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !pending_ || closed_; });
    if (closed_) {
        return false;
    }
    
    pending_ = std::move(op);
    uint64_t ticket = ++submitted_;
    cv_.notify_all();
    
    cv_.wait(lock, [this, ticket] { return taken_ >= ticket || closed_; });
    return taken_ >= ticket;
}

void Bar::onCancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancel_observed_ || closed_) {
        return;
    }
    cancel_pending_ = true;
    cv_.notify_all();
}

void Bar::serve(State state) {
    while (true) {
        Operation op;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { 
                return pending_.has_value() || complete_requested_ || cancel_pending_; 
            });
            
            if (cancel_pending_) {
                cancel_pending_ = false;
                cancel_observed_ = true;
                state.aborted = true;
                complete_requested_ = true;
                common::Logger::instance().debug("[Bar] Cancelled | id={} | current={}", 
                                                state.id, state.current);
                continue;
            }
            
            if (complete_requested_) {
                state.completed = true;
                break;
            }
            
            op = std::move(*pending_);
            pending_.reset();
            ++taken_;
            cv_.notify_all();
        }
        
        try {
            op(state);
        } catch (const std::exception& e) {
            common::Logger::instance().error("[Bar] Operation failed | id={} | error={}", state.id, e.what());
        }
    }
    
    finalize(std::move(state));
}

void Bar::finalize(State state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        final_state_ = std::move(state);
        closed_ = true;
        pending_.reset();
        cv_.notify_all();
    }
    
    common::Logger::instance().debug("[Bar] Terminated | id={} | aborted={} | current={} | total={}", 
                                    final_state_.id, final_state_.aborted, 
                                    final_state_.current, final_state_.total);
    
    done_.fire();
    if (counter_) {
        counter_->done();
    }
}

}
}
