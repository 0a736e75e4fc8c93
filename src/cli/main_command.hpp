#pragma once

#include "termbar/bar/bar.hpp"
#include <CLI/CLI.hpp>
#include <ostream>
#include <string>

namespace termbar {
namespace cli {

class MainCommand {
public:
    MainCommand();
    virtual ~MainCommand();
    
    virtual bool validateArguments() const;
    
    // Validates the loaded configuration before any bar is driven with it.
    // Prints each error to err and returns false when it is unusable.
    bool checkConfiguration(std::ostream& err) const;

protected:
    CLI::App* subcommand_ = nullptr;
    
    // Redraws the bar in place until it terminates, then prints its final
    // line. Returns the final statistics.
    bar::Statistics driveUntilDone(bar::Bar& progress, int interval_ms, 
                                   bar::WidthSync& prepend_ws, bar::WidthSync& append_ws) const;
    
    int getTerminalWidth() const;
};

}}
