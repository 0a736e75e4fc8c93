#include "termbar/config/validator.hpp"
#include "termbar/bar/format.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <unistd.h>

namespace termbar {
namespace config {

void ValidationResult::addError(ConfigErrorCode code, const std::string& key) {
    errors.push_back(ConfigErrorCodeHelper::describe(code, key));
    codes.push_back(code);
    is_valid = false;
}

ValidationResult ConfigValidator::validate(const common::GlobalConfig& config) {
    ValidationResult result;
    
    common::Logger::instance().debug("[Validator] Starting validation");
    
    if (!validateWidth(config.bar.width)) {
        result.addError(ConfigErrorCode::BAR_WIDTH_TOO_SMALL, "bar.width");
    }
    
    if (!validateFormat(config.bar.format)) {
        result.addError(ConfigErrorCode::BAR_FORMAT_INVALID, "bar.format");
    }
    
    if (!validateEtaAlpha(config.bar.eta_alpha)) {
        result.addError(ConfigErrorCode::BAR_ETA_ALPHA_OUT_OF_RANGE, "bar.eta_alpha");
    }
    
    if (!validateRefreshInterval(config.bar.refresh_interval_ms)) {
        result.addError(ConfigErrorCode::BAR_REFRESH_INTERVAL_INVALID, "bar.refresh_interval_ms");
    }
    
    if (config.logging.rotation_size_mb < 1) {
        result.addError(ConfigErrorCode::LOG_ROTATION_SIZE_INVALID, "logging.rotation_size_mb");
    }
    
    if (config.logging.max_files < 1) {
        result.addError(ConfigErrorCode::LOG_MAX_FILES_INVALID, "logging.max_files");
    }
    
    if (!config.log_file.empty() && 
        !canCreateDirectory(std::filesystem::path(config.log_file).parent_path().string())) {
        result.addError(ConfigErrorCode::LOG_DIRECTORY_UNAVAILABLE, "global.log_file");
    }
    
    if (config.bar.refresh_interval_ms > 0 && config.bar.refresh_interval_ms < 16) {
        result.warnings.push_back("bar.refresh_interval_ms: Below 16ms, terminal output may flicker");
    }
    
    if (config.log_level == common::LogLevel::DEBUG) {
        result.warnings.push_back("global.log_level: DEBUG logs every bar start and termination");
    }
    
    common::Logger::instance().debug("[Validator] Complete | valid={} | errors={} | warnings={}", 
                                    result.is_valid, result.errors.size(), result.warnings.size());
    
    return result;
}

ValidationResult ConfigValidator::validateFile(const std::string& path) {
    ValidationResult result;
    
    if (!std::filesystem::exists(path)) {
        result.addError(ConfigErrorCode::FILE_NOT_FOUND, path);
        return result;
    }
    
    try {
        auto data = toml::parse(path);
        
        for (const auto& section : {"global", "bar", "logging"}) {
            if (!data.contains(section)) {
                result.warnings.push_back(std::string("Missing section: [") + section + "]");
            }
        }
    } catch (const std::exception& e) {
        common::Logger::instance().debug("[Validator] Parse failed | path={} | error={}", path, e.what());
        result.addError(ConfigErrorCode::FILE_PARSE_FAILED, path);
    }
    
    return result;
}

bool ConfigValidator::validateWidth(int width) {
    return width >= constants::limits::MIN_BAR_WIDTH;
}

bool ConfigValidator::validateFormat(const std::string& format) {
    return bar::BarFormat::parse(format).has_value();
}

bool ConfigValidator::validateEtaAlpha(double alpha) {
    return alpha > 0.0 && alpha <= 1.0;
}

bool ConfigValidator::validateRefreshInterval(int interval_ms) {
    return interval_ms > 0 && interval_ms <= constants::limits::MAX_REFRESH_INTERVAL_MS;
}

bool ConfigValidator::canCreateDirectory(const std::string& path) {
    if (path.empty()) {
        return true;
    }
    
    std::filesystem::path p(path);
    while (!p.empty() && !std::filesystem::exists(p)) {
        p = p.parent_path();
    }
    
    if (p.empty()) {
        return false;
    }
    
    return access(p.c_str(), W_OK) == 0;
}

}}
