#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <cstdlib>
#include <unistd.h>

namespace termbar {
namespace common {

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::WARN: return "WARN";
        case LogLevel::INFO: return "INFO";
        case LogLevel::DEBUG: return "DEBUG";
    }
    return "INFO";
}

std::optional<LogLevel> parseLogLevel(const std::string& level) {
    if (level == "DEBUG") return LogLevel::DEBUG;
    if (level == "INFO") return LogLevel::INFO;
    if (level == "WARN") return LogLevel::WARN;
    if (level == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.log_level = LogLevel::INFO;
    config.log_file = "";
    
    config.bar.width = BAR_WIDTH;
    config.bar.format = BAR_FORMAT;
    config.bar.eta_alpha = BAR_ETA_ALPHA;
    config.bar.refresh_interval_ms = BAR_REFRESH_INTERVAL_MS;
    config.bar.trim_left_space = BAR_TRIM_LEFT_SPACE;
    config.bar.trim_right_space = BAR_TRIM_RIGHT_SPACE;
    
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;
    
    return config;
}

void Config::reset() {
    global_ = createDefaultConfig();
    current_config_path_.clear();
}

std::string Config::getXdgConfigHome() const {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME")) {
        if (xdg[0] != '\0') {
            return xdg;
        }
    }
    if (const char* home = std::getenv("HOME")) {
        return std::string(home) + "/.config";
    }
    return "";
}

std::vector<std::string> Config::getConfigSearchPaths() const {
    std::vector<std::string> paths;
    
    if (const char* env = std::getenv(constants::system::CONFIG_ENV)) {
        paths.push_back(env);
    }
    
    std::string config_home = getXdgConfigHome();
    if (!config_home.empty()) {
        paths.push_back(config_home + "/termbar/" + constants::system::CONFIG_FILE_NAME);
    }
    
    return paths;
}

std::optional<std::string> Config::findBestConfig() const {
    for (const auto& path : getConfigSearchPaths()) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    
    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            Logger::instance().debug("[Config] No config file found, using defaults");
            current_config_path_.clear();
            return true;
        }
        effective_config_file = *best;
    }
    
    current_config_path_ = effective_config_file;
    return tryLoadTomlFile(effective_config_file);
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().warn("[Config] File not found | path={}", path);
        return false;
    }
    
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().warn("[Config] File not readable | path={}", path);
        return false;
    }
    
    GlobalConfig loaded = global_;
    
    try {
        auto data = toml::parse(path);
        
        if (data.contains("global")) {
            auto global_section = data.at("global");
            
            if (global_section.contains("log_file")) {
                loaded.log_file = toml::find<std::string>(global_section, "log_file");
            }
            if (global_section.contains("log_level")) {
                auto level = parseLogLevel(toml::find<std::string>(global_section, "log_level"));
                if (level) {
                    loaded.log_level = *level;
                }
            }
        }
        
        if (data.contains("bar")) {
            auto bar_section = data.at("bar");
            
            if (bar_section.contains("width")) {
                loaded.bar.width = toml::find<int>(bar_section, "width");
            }
            if (bar_section.contains("format")) {
                loaded.bar.format = toml::find<std::string>(bar_section, "format");
            }
            if (bar_section.contains("eta_alpha")) {
                loaded.bar.eta_alpha = toml::find<double>(bar_section, "eta_alpha");
            }
            if (bar_section.contains("refresh_interval_ms")) {
                loaded.bar.refresh_interval_ms = toml::find<int>(bar_section, "refresh_interval_ms");
            }
            if (bar_section.contains("trim_left_space")) {
                loaded.bar.trim_left_space = toml::find<bool>(bar_section, "trim_left_space");
            }
            if (bar_section.contains("trim_right_space")) {
                loaded.bar.trim_right_space = toml::find<bool>(bar_section, "trim_right_space");
            }
        }
        
        if (data.contains("logging")) {
            auto logging_section = data.at("logging");
            
            if (logging_section.contains("rotation_size_mb")) {
                loaded.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
            }
            if (logging_section.contains("max_files")) {
                loaded.logging.max_files = toml::find<size_t>(logging_section, "max_files");
            }
            if (logging_section.contains("format")) {
                std::string format_str = toml::find<std::string>(logging_section, "format");
                loaded.logging.format = format_str == "json" ? LogFormat::JSON : LogFormat::TEXT;
            }
        }
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", path, e.what());
        return false;
    }
    
    global_ = loaded;
    Logger::instance().info("[Config] Loaded | path={}", path);
    return true;
}

bool Config::setValue(const std::string& key, const std::string& value) {
    try {
        if (key == "global.log_file") {
            global_.log_file = value;
        } else if (key == "global.log_level") {
            auto level = parseLogLevel(value);
            if (!level) return false;
            global_.log_level = *level;
        } else if (key == "bar.width") {
            global_.bar.width = std::stoi(value);
        } else if (key == "bar.format") {
            global_.bar.format = value;
        } else if (key == "bar.eta_alpha") {
            global_.bar.eta_alpha = std::stod(value);
        } else if (key == "bar.refresh_interval_ms") {
            global_.bar.refresh_interval_ms = std::stoi(value);
        } else if (key == "bar.trim_left_space") {
            global_.bar.trim_left_space = (value == "true");
        } else if (key == "bar.trim_right_space") {
            global_.bar.trim_right_space = (value == "true");
        } else if (key == "logging.rotation_size_mb") {
            global_.logging.rotation_size_mb = std::stoul(value);
        } else if (key == "logging.max_files") {
            global_.logging.max_files = std::stoul(value);
        } else if (key == "logging.format") {
            global_.logging.format = (value == "json") ? LogFormat::JSON : LogFormat::TEXT;
        } else {
            Logger::instance().warn("[Config] Unknown key | key={}", key);
            return false;
        }
    } catch (const std::exception& e) {
        Logger::instance().warn("[Config] Invalid value | key={} | value={} | error={}", 
                               key, value, e.what());
        return false;
    }
    return true;
}

std::optional<std::string> Config::getValue(const std::string& key) const {
    if (key == "global.log_file") return global_.log_file;
    if (key == "global.log_level") return to_string(global_.log_level);
    if (key == "bar.width") return std::to_string(global_.bar.width);
    if (key == "bar.format") return global_.bar.format;
    if (key == "bar.eta_alpha") return fmt::format("{}", global_.bar.eta_alpha);
    if (key == "bar.refresh_interval_ms") return std::to_string(global_.bar.refresh_interval_ms);
    if (key == "bar.trim_left_space") return global_.bar.trim_left_space ? "true" : "false";
    if (key == "bar.trim_right_space") return global_.bar.trim_right_space ? "true" : "false";
    if (key == "logging.rotation_size_mb") return std::to_string(global_.logging.rotation_size_mb);
    if (key == "logging.max_files") return std::to_string(global_.logging.max_files);
    if (key == "logging.format") return global_.logging.format == LogFormat::JSON ? "json" : "text";
    return std::nullopt;
}

std::vector<std::string> Config::keys() const {
    return {
        "global.log_file", "global.log_level",
        "bar.width", "bar.format", "bar.eta_alpha", "bar.refresh_interval_ms",
        "bar.trim_left_space", "bar.trim_right_space",
        "logging.rotation_size_mb", "logging.max_files", "logging.format"
    };
}

}}
