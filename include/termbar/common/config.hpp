#pragma once

#include <string>
#include <map>
#include <vector>
#include <optional>
#include <cstdint>

namespace termbar {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct BarConfig {
    int width;
    std::string format;
    double eta_alpha;
    int refresh_interval_ms;
    bool trim_left_space;
    bool trim_right_space;
};

struct LoggingConfig {
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct GlobalConfig {
    std::string log_file;
    LogLevel log_level;
    BarConfig bar;
    LoggingConfig logging;
};

std::string to_string(LogLevel level);
std::optional<LogLevel> parseLogLevel(const std::string& level);

class Config {
public:
    static Config& instance();
    
    bool load(const std::string& config_file = "");
    void reset();
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    bool setValue(const std::string& key, const std::string& value);
    std::optional<std::string> getValue(const std::string& key) const;
    std::vector<std::string> keys() const;
    
    std::optional<std::string> findBestConfig() const;
    std::vector<std::string> getConfigSearchPaths() const;
    std::string getConfigPath() const { return current_config_path_; }
    
    static GlobalConfig createDefaultConfig();

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
    std::string getXdgConfigHome() const;
};

}}
