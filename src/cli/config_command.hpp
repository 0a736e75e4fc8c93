#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace termbar {
namespace cli {

class ConfigCommand : public MainCommand {
public:
    ConfigCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();

private:
    bool was_called_;
    
    CLI::App* show_cmd_ = nullptr;
    CLI::App* get_cmd_ = nullptr;
    CLI::App* validate_cmd_ = nullptr;
    
    std::string get_key_;
    std::string validate_file_;
    
    int executeShow();
    int executeGet();
    int executeValidate();
};

}}
