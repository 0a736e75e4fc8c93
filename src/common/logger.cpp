#include "termbar/common/logger.hpp"
#include "termbar/common/constants.hpp"
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <unistd.h>

namespace termbar {
namespace common {

namespace {

constexpr const char* TEXT_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr const char* JSON_PATTERN = 
    R"({"timestamp":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"message":"%v"})";
constexpr const char* CAPTURE_PATTERN = "[%l] %v";

// Writes to stderr. On a terminal the line is cleared first so a record
// never lands in the middle of a bar that is being redrawn with '\r'.
class BarAwareConsoleSink : public spdlog::sinks::base_sink<std::mutex> {
public:
    BarAwareConsoleSink() : clear_line_(isatty(STDERR_FILENO) == 1) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);
        if (clear_line_) {
            std::fputs("\r\033[K", stderr);
        }
        std::fwrite(formatted.data(), 1, formatted.size(), stderr);
    }
    
    void flush_() override {
        std::fflush(stderr);
    }

private:
    bool clear_line_;
};

spdlog::level::level_enum toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
    }
    return spdlog::level::info;
}

// bar.log -> bar.json.log
std::string jsonLogPath(const std::string& base_path) {
    std::filesystem::path p(base_path);
    std::string ext = p.extension().string();
    return p.replace_extension(".json" + ext).string();
}

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const GlobalConfig& config, bool verbose) {
    LogLevel level = verbose ? LogLevel::DEBUG : config.log_level;
    const auto& logging = config.logging;
    std::string pattern = logging.format == LogFormat::JSON ? JSON_PATTERN : TEXT_PATTERN;
    
    if (config.log_file.empty()) {
        install(LogMode::CONSOLE, {std::make_shared<BarAwareConsoleSink>()}, level, pattern);
        return;
    }
    
    std::string path = logging.format == LogFormat::JSON ? jsonLogPath(config.log_file) : config.log_file;
    
    try {
        std::filesystem::path log_dir = std::filesystem::path(path).parent_path();
        if (!log_dir.empty()) {
            std::filesystem::create_directories(log_dir);
        }
        
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            path, logging.rotation_size_mb * 1024 * 1024, logging.max_files);
        install(LogMode::FILE, {file_sink}, level, pattern);
        logger_->flush_on(spdlog::level::info);
    } catch (const std::exception& e) {
        std::cerr << "[Logger] Cannot open " << path << ": " << e.what() 
                  << ", logging to stderr" << std::endl;
        install(LogMode::CONSOLE, {std::make_shared<BarAwareConsoleSink>()}, level, TEXT_PATTERN);
    }
}

void Logger::captureTo(std::ostream& stream, LogLevel level) {
    install(LogMode::CAPTURE, {std::make_shared<spdlog::sinks::ostream_sink_mt>(stream, true)}, 
            level, CAPTURE_PATTERN);
}

void Logger::install(LogMode mode, std::vector<spdlog::sink_ptr> sinks, 
                     LogLevel level, const std::string& pattern) {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
    }
    
    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sinks.begin(), sinks.end());
    logger_->set_pattern(pattern);
    logger_->set_level(toSpdlogLevel(level));
    spdlog::register_logger(logger_);
    mode_ = mode;
}

void Logger::setLevel(LogLevel level) {
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(constants::system::LOGGER_NAME);
        logger_.reset();
    }
    mode_ = LogMode::DISABLED;
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

}}
