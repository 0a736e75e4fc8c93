#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>

namespace termbar {
namespace cli {

class CopyCommand : public MainCommand {
public:
    CopyCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    int execute();
    bool validateArguments() const override;

private:
    bool was_called_;
    std::string source_;
    std::string destination_;
    bool json_ = false;
};

}}
