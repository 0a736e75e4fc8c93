#include "config_command.hpp"
#include "termbar/common/config.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/config/validator.hpp"
#include <iostream>
#include <iomanip>
#include <unistd.h>

namespace termbar {
namespace cli {

ConfigCommand::ConfigCommand() : was_called_(false) {}

void ConfigCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    subcommand->require_subcommand(1);
    
    show_cmd_ = subcommand->add_subcommand("show", "Show effective configuration");
    show_cmd_->callback([this]() { was_called_ = true; });
    
    get_cmd_ = subcommand->add_subcommand("get", "Get configuration value");
    get_cmd_->add_option("key", get_key_, "Configuration key, e.g. bar.width")->required();
    get_cmd_->callback([this]() { was_called_ = true; });
    
    validate_cmd_ = subcommand->add_subcommand("validate", "Validate configuration");
    validate_cmd_->add_option("-f,--file", validate_file_, "Configuration file to check");
    validate_cmd_->callback([this]() { was_called_ = true; });
}

bool ConfigCommand::wasCalled() const {
    return was_called_;
}

int ConfigCommand::execute() {
    if (show_cmd_->parsed()) {
        return executeShow();
    } else if (get_cmd_->parsed()) {
        return executeGet();
    } else if (validate_cmd_->parsed()) {
        return executeValidate();
    }
    
    std::cout << subcommand_->help() << std::endl;
    return 0;
}

int ConfigCommand::executeShow() {
    auto& config = common::Config::instance();
    
    std::string path = config.getConfigPath();
    std::cout << "# Source: " << (path.empty() ? "(defaults)" : path) << "\n";
    
    for (const auto& key : config.keys()) {
        auto value = config.getValue(key);
        std::cout << std::left << std::setw(28) << key << " = " 
                  << (value && !value->empty() ? *value : "(not set)") << "\n";
    }
    
    return 0;
}

int ConfigCommand::executeGet() {
    auto value = common::Config::instance().getValue(get_key_);
    if (!value) {
        std::cerr << "Error: Unknown key: " << get_key_ << "\n";
        return 1;
    }
    
    std::cout << *value << "\n";
    return 0;
}

int ConfigCommand::executeValidate() {
    config::ConfigValidator validator;
    bool use_colors = isatty(STDOUT_FILENO);
    
    config::ValidationResult result;
    if (!validate_file_.empty()) {
        result = validator.validateFile(validate_file_);
        if (result.is_valid && !common::Config::instance().load(validate_file_)) {
            result.addError(config::ConfigErrorCode::FILE_PARSE_FAILED, validate_file_);
        }
    }
    
    if (result.is_valid) {
        auto values = validator.validate(common::Config::instance().global());
        result.is_valid = values.is_valid;
        result.errors.insert(result.errors.end(), values.errors.begin(), values.errors.end());
        result.warnings.insert(result.warnings.end(), values.warnings.begin(), values.warnings.end());
    }
    
    for (const auto& error : result.errors) {
        if (use_colors) {
            std::cout << "\033[31m✗\033[0m " << error << "\n";
        } else {
            std::cout << "✗ " << error << "\n";
        }
    }
    
    for (const auto& warning : result.warnings) {
        if (use_colors) {
            std::cout << "\033[33m!\033[0m " << warning << "\n";
        } else {
            std::cout << "! " << warning << "\n";
        }
    }
    
    if (result.is_valid) {
        std::cout << "Configuration is valid\n";
        return 0;
    }
    
    common::Logger::instance().warn("[Config] Validation failed | errors={}", result.errors.size());
    return 1;
}

}}
