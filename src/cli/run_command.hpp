#pragma once

#include "main_command.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <cstdint>

namespace termbar {
namespace cli {

class RunCommand : public MainCommand {
public:
    RunCommand();
    
    void setup(CLI::App* subcommand);
    bool wasCalled() const;
    bool validateArguments() const override;
    int execute();

private:
    bool was_called_;
    int64_t total_ = 100;
    int64_t step_ = 1;
    int64_t items_ = 50;
    int interval_ms_ = 50;
    int width_ = 0;
    std::string format_;
    std::string name_;
    int64_t resume_till_ = 0;
    std::string resume_glyph_ = "+";
    int cancel_after_ms_ = 0;
    bool json_ = false;
};

}}
