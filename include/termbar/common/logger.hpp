#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace termbar {
namespace common {

enum class LogMode {
    DISABLED,
    CONSOLE,
    FILE,
    CAPTURE
};

// Process-wide logger. Until initialize() or captureTo() is called every
// record is dropped, so library code may log unconditionally.
class Logger {
public:
    static Logger& instance();
    
    // Console (stderr) unless global.log_file is set. verbose forces DEBUG.
    void initialize(const GlobalConfig& config, bool verbose = false);
    
    // Sends records to stream with a bare "[level] message" pattern.
    void captureTo(std::ostream& stream, LogLevel level = LogLevel::DEBUG);
    
    void setLevel(LogLevel level);
    void shutdown();
    void flush();
    
    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        if (logger_) logger_->error(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        if (logger_) logger_->warn(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        if (logger_) logger_->info(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        if (logger_) logger_->debug(fmt::runtime(format), std::forward<Args>(args)...);
    }
    
    bool isInitialized() const { return logger_ != nullptr; }
    LogMode mode() const { return mode_; }

private:
    Logger() = default;
    
    void install(LogMode mode, std::vector<spdlog::sink_ptr> sinks, 
                 LogLevel level, const std::string& pattern);
    
    std::shared_ptr<spdlog::logger> logger_;
    LogMode mode_ = LogMode::DISABLED;
};

}}
