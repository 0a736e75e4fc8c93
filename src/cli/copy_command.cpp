#include "copy_command.hpp"
#include "decorators.hpp"
#include "termbar/bar/bar.hpp"
#include "termbar/bar/proxy_reader.hpp"
#include "termbar/common/config.hpp"
#include "termbar/common/constants.hpp"
#include "termbar/common/logger.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <thread>
#include <vector>

namespace termbar {
namespace cli {

CopyCommand::CopyCommand() : was_called_(false) {}

void CopyCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("source", source_, "File to copy")->required();
    subcommand->add_option("destination", destination_, "Target path")->required();
    subcommand->add_flag("--json", json_, "Print final statistics as JSON");
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool CopyCommand::wasCalled() const {
    return was_called_;
}

bool CopyCommand::validateArguments() const {
    std::error_code ec;
    if (std::filesystem::exists(destination_, ec) && 
        std::filesystem::equivalent(source_, destination_, ec)) {
        std::cerr << "Error: Source and destination are the same file\n";
        return false;
    }
    return true;
}

int CopyCommand::execute() {
    if (!checkConfiguration(std::cerr) || !validateArguments()) {
        return 1;
    }
    
    std::error_code ec;
    auto size = std::filesystem::file_size(source_, ec);
    if (ec) {
        std::cerr << "Error: Cannot read " << source_ << ": " << ec.message() << "\n";
        return 1;
    }
    
    std::ifstream input(source_, std::ios::binary);
    if (!input) {
        std::cerr << "Error: Cannot open " << source_ << "\n";
        return 1;
    }
    
    std::ofstream output(destination_, std::ios::binary | std::ios::trunc);
    if (!output) {
        std::cerr << "Error: Cannot create " << destination_ << "\n";
        return 1;
    }
    
    auto& config = common::Config::instance().global();
    auto options = bar::BarOptions::fromConfig(config.bar);
    options.id = 1;
    options.prepend.push_back(nameDecorator(std::filesystem::path(source_).filename().string()));
    options.append.push_back(counterDecorator(true));
    options.append.push_back(etaDecorator());
    
    bar::WidthSync prepend_ws(options.prepend.size(), 1);
    bar::WidthSync append_ws(options.append.size(), 1);
    
    // an empty file has nothing to count, so it is shown as a spinner
    bar::Bar progress(static_cast<int64_t>(size), std::move(options));
    
    common::Logger::instance().info("[Copy] Starting | source={} | destination={} | size={}", 
                                   source_, destination_, size);
    
    std::atomic<bool> write_failed{false};
    std::thread copier([&]() {
        auto reader = progress.proxyReader(input);
        std::vector<char> buffer(constants::limits::COPY_BUFFER_SIZE);
        
        while (reader.good()) {
            auto n = reader.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            if (n <= 0) {
                break;
            }
            if (!output.write(buffer.data(), n)) {
                write_failed = true;
                break;
            }
        }
        
        // covers empty sources, short reads and write errors
        progress.complete();
    });
    
    bar::Statistics stats = driveUntilDone(progress, config.bar.refresh_interval_ms, prepend_ws, append_ws);
    copier.join();
    output.close();
    
    if (write_failed || !output) {
        common::Logger::instance().error("[Copy] Write failed | destination={}", destination_);
        std::cerr << "Error: Failed writing " << destination_ << "\n";
        return 1;
    }
    
    if (json_) {
        std::cout << bar::toJson(stats).dump(2) << std::endl;
    }
    
    common::Logger::instance().info("[Copy] Finished | bytes={}", stats.current);
    return 0;
}

}}
