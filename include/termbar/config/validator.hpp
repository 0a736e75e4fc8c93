#pragma once

#include "../common/config.hpp"
#include "error_codes.hpp"
#include <string>
#include <vector>

namespace termbar {
namespace config {

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::vector<ConfigErrorCode> codes;
    
    void addError(ConfigErrorCode code, const std::string& key);
};

class ConfigValidator {
public:
    ValidationResult validate(const common::GlobalConfig& config);
    ValidationResult validateFile(const std::string& path);
    
    static bool validateWidth(int width);
    static bool validateFormat(const std::string& format);
    static bool validateEtaAlpha(double alpha);
    static bool validateRefreshInterval(int interval_ms);
    static bool canCreateDirectory(const std::string& path);
};

}}
