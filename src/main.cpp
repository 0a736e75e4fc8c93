#include <CLI/CLI.hpp>
#include <iostream>
#include <memory>

#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include "cli/config_command.hpp"
#include "cli/copy_command.hpp"
#include "cli/run_command.hpp"

int main(int argc, char** argv) {
    try {
        CLI::App app{"Progress bar rendering core", termbar::constants::system::APPLICATION_NAME};
        app.set_version_flag("--version,-v", termbar::constants::version::getFullVersion());
        app.require_subcommand(0, 1);
        
        std::string config_file;
        bool verbose = false;
        app.add_option("-c,--config", config_file, "Configuration file path");
        app.add_flag("--verbose", verbose, "Enable debug logging");
        
        auto config_cmd = std::make_unique<termbar::cli::ConfigCommand>();
        auto copy_cmd = std::make_unique<termbar::cli::CopyCommand>();
        auto run_cmd = std::make_unique<termbar::cli::RunCommand>();
        
        config_cmd->setup(app.add_subcommand("config", "Inspect configuration"));
        copy_cmd->setup(app.add_subcommand("copy", "Copy a file with a progress bar"));
        run_cmd->setup(app.add_subcommand("run", "Simulate a producer feeding one bar"));
        
        CLI11_PARSE(app, argc, argv);
        
        auto& config = termbar::common::Config::instance();
        if (!config.load(config_file)) {
            std::cerr << "Warning: Failed to load configuration, using defaults\n";
        }
        
        termbar::common::Logger::instance().initialize(config.global(), verbose);
        
        int result = 0;
        if (config_cmd->wasCalled()) {
            result = config_cmd->execute();
        } else if (copy_cmd->wasCalled()) {
            result = copy_cmd->execute();
        } else if (run_cmd->wasCalled()) {
            result = run_cmd->execute();
        } else {
            std::cout << app.help() << std::endl;
        }
        
        termbar::common::Logger::instance().shutdown();
        return result;
        
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    
    return 0;
}
