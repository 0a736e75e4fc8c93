#pragma once

#include "../common/error_framework.hpp"
#include <unordered_map>
#include <string>

namespace termbar {
namespace config {

enum class ConfigErrorCode {
    BAR_WIDTH_TOO_SMALL = 100,
    BAR_FORMAT_INVALID = 101,
    BAR_ETA_ALPHA_OUT_OF_RANGE = 102,
    BAR_REFRESH_INTERVAL_INVALID = 103,
    
    LOG_ROTATION_SIZE_INVALID = 200,
    LOG_MAX_FILES_INVALID = 201,
    LOG_DIRECTORY_UNAVAILABLE = 202,
    
    FILE_NOT_FOUND = 300,
    FILE_PARSE_FAILED = 301
};

using ConfigErrorCodeHelper = common::ErrorRegistry<ConfigErrorCode>;

}
}

namespace termbar {
namespace common {

template<>
inline const std::unordered_map<config::ConfigErrorCode, ErrorInfo<config::ConfigErrorCode>>& 
ErrorRegistry<config::ConfigErrorCode>::getInfoMap() {
    static const std::unordered_map<config::ConfigErrorCode, ErrorInfo<config::ConfigErrorCode>> map = {
        {config::ConfigErrorCode::BAR_WIDTH_TOO_SMALL, {
            config::ConfigErrorCode::BAR_WIDTH_TOO_SMALL,
            "BAR_WIDTH_TOO_SMALL",
            "Must be at least 2 columns"
        }},
        {config::ConfigErrorCode::BAR_FORMAT_INVALID, {
            config::ConfigErrorCode::BAR_FORMAT_INVALID,
            "BAR_FORMAT_INVALID",
            "Must contain exactly 5 glyphs (left, fill, tip, empty, right)"
        }},
        {config::ConfigErrorCode::BAR_ETA_ALPHA_OUT_OF_RANGE, {
            config::ConfigErrorCode::BAR_ETA_ALPHA_OUT_OF_RANGE,
            "BAR_ETA_ALPHA_OUT_OF_RANGE",
            "Must be greater than 0 and at most 1"
        }},
        {config::ConfigErrorCode::BAR_REFRESH_INTERVAL_INVALID, {
            config::ConfigErrorCode::BAR_REFRESH_INTERVAL_INVALID,
            "BAR_REFRESH_INTERVAL_INVALID",
            "Must be between 1-60000 milliseconds"
        }},
        {config::ConfigErrorCode::LOG_ROTATION_SIZE_INVALID, {
            config::ConfigErrorCode::LOG_ROTATION_SIZE_INVALID,
            "LOG_ROTATION_SIZE_INVALID",
            "Must be at least 1 MB"
        }},
        {config::ConfigErrorCode::LOG_MAX_FILES_INVALID, {
            config::ConfigErrorCode::LOG_MAX_FILES_INVALID,
            "LOG_MAX_FILES_INVALID",
            "Must keep at least 1 file"
        }},
        {config::ConfigErrorCode::LOG_DIRECTORY_UNAVAILABLE, {
            config::ConfigErrorCode::LOG_DIRECTORY_UNAVAILABLE,
            "LOG_DIRECTORY_UNAVAILABLE",
            "Cannot create parent directory"
        }},
        {config::ConfigErrorCode::FILE_NOT_FOUND, {
            config::ConfigErrorCode::FILE_NOT_FOUND,
            "FILE_NOT_FOUND",
            "Configuration file not found"
        }},
        {config::ConfigErrorCode::FILE_PARSE_FAILED, {
            config::ConfigErrorCode::FILE_PARSE_FAILED,
            "FILE_PARSE_FAILED",
            "Configuration file could not be parsed"
        }}
    };
    return map;
}

}
}
