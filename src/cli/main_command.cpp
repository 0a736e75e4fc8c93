#include "main_command.hpp"
#include "termbar/common/config.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/config/validator.hpp"
#include <chrono>
#include <iostream>
#include <memory>
#include <sys/ioctl.h>
#include <unistd.h>

namespace termbar {
namespace cli {

MainCommand::MainCommand() = default;
MainCommand::~MainCommand() = default;

bool MainCommand::validateArguments() const {
    return true;
}

bool MainCommand::checkConfiguration(std::ostream& err) const {
    auto& config = common::Config::instance();
    config::ConfigValidator validator;
    auto result = validator.validate(config.global());
    
    if (result.is_valid) {
        return true;
    }
    
    std::string source = config.getConfigPath();
    err << "Configuration validation failed" 
        << (source.empty() ? std::string() : " (" + source + ")") << ":\n";
    for (const auto& error : result.errors) {
        err << "  ERROR: " << error << "\n";
    }
    
    common::Logger::instance().error("[Config] Refusing invalid configuration | errors={}", 
                                    result.errors.size());
    return false;
}

bar::Statistics MainCommand::driveUntilDone(bar::Bar& progress, int interval_ms, 
                                            bar::WidthSync& prepend_ws, bar::WidthSync& append_ws) const {
    bool interactive = isatty(STDOUT_FILENO);
    int frames = 0;
    
    while (!progress.done().fired()) {
        auto flushed = std::make_shared<bar::Signal>();
        std::string line = progress.render(getTerminalWidth(), flushed, prepend_ws, append_ws);
        
        if (interactive && line.size() > 1) {
            line.pop_back();
            std::cout << "\r" << line << "\033[K" << std::flush;
        }
        flushed->fire();
        ++frames;
        
        progress.done().waitFor(std::chrono::milliseconds(interval_ms));
    }
    
    std::string last = progress.render(getTerminalWidth(), nullptr, prepend_ws, append_ws);
    std::cout << (interactive ? "\r" : "") << last << std::flush;
    
    common::Logger::instance().debug("[Display] Finished | frames={}", frames);
    return progress.statistics();
}

int MainCommand::getTerminalWidth() const {
    struct winsize w;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        return w.ws_col;
    }
    return 0;
}

}}
