#pragma once

#include <string>
#include <array>
#include <cstddef>

namespace termbar {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("termbar v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "termbar";
    constexpr const char* LOGGER_NAME = "termbar";
    constexpr const char* CONFIG_ENV = "TERMBAR_CONFIG";
    constexpr const char* CONFIG_FILE_NAME = "termbar.toml";
}

namespace glyphs {
    constexpr size_t FORMAT_LENGTH = 5;
    constexpr size_t LEFT = 0;
    constexpr size_t FILL = 1;
    constexpr size_t TIP = 2;
    constexpr size_t EMPTY = 3;
    constexpr size_t RIGHT = 4;
    
    constexpr std::array<char, 4> SPINNER = {'-', '\\', '|', '/'};
}

namespace limits {
    constexpr int DEFAULT_BAR_WIDTH = 80;
    constexpr int MIN_BAR_WIDTH = 2;
    constexpr const char* DEFAULT_BAR_FORMAT = "[=>-]";
    constexpr double DEFAULT_ETA_ALPHA = 0.25;
    constexpr int DEFAULT_REFRESH_INTERVAL_MS = 100;
    constexpr int MAX_REFRESH_INTERVAL_MS = 60000;
    
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
    
    constexpr size_t COPY_BUFFER_SIZE = 32 * 1024;
}

namespace config_defaults {
    constexpr int BAR_WIDTH = limits::DEFAULT_BAR_WIDTH;
    constexpr const char* BAR_FORMAT = limits::DEFAULT_BAR_FORMAT;
    constexpr double BAR_ETA_ALPHA = limits::DEFAULT_ETA_ALPHA;
    constexpr int BAR_REFRESH_INTERVAL_MS = limits::DEFAULT_REFRESH_INTERVAL_MS;
    constexpr bool BAR_TRIM_LEFT_SPACE = false;
    constexpr bool BAR_TRIM_RIGHT_SPACE = false;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
