#include "run_command.hpp"
#include "decorators.hpp"
#include "termbar/bar/bar.hpp"
#include "termbar/common/config.hpp"
#include "termbar/common/logger.hpp"
#include "termbar/format/format_utils.hpp"
#include <chrono>
#include <iostream>
#include <thread>

namespace termbar {
namespace cli {

RunCommand::RunCommand() : was_called_(false) {}

void RunCommand::setup(CLI::App* subcommand) {
    subcommand_ = subcommand;
    
    subcommand->add_option("-t,--total", total_, 
                          "Total amount of work, 0 or less for unknown (spinner)");
    subcommand->add_option("-s,--step", step_, "Amount added per increment");
    subcommand->add_option("--items", items_, 
                          "Increments produced before completing a bar of unknown total");
    subcommand->add_option("-i,--interval-ms", interval_ms_, "Delay between increments");
    subcommand->add_option("-w,--width", width_, "Bar width (default from config)");
    subcommand->add_option("-f,--format", format_, "Five glyphs: left, fill, tip, empty, right");
    subcommand->add_option("-n,--name", name_, "Label shown before the bar");
    subcommand->add_option("--resume-till", resume_till_, "Draw an overlay up to this amount");
    subcommand->add_option("--resume-glyph", resume_glyph_, "Glyph used for the overlay");
    subcommand->add_option("--cancel-after-ms", cancel_after_ms_, "Cancel the bar after this delay");
    subcommand->add_flag("--json", json_, "Print final statistics as JSON");
    
    subcommand->callback([this]() { was_called_ = true; });
}

bool RunCommand::wasCalled() const {
    return was_called_;
}

bool RunCommand::validateArguments() const {
    if (step_ < 1) {
        std::cerr << "Error: --step must be at least 1\n";
        return false;
    }
    if (interval_ms_ < 0 || cancel_after_ms_ < 0) {
        std::cerr << "Error: delays must not be negative\n";
        return false;
    }
    if (format::splitGlyphs(resume_glyph_).size() != 1) {
        std::cerr << "Error: --resume-glyph must be a single glyph\n";
        return false;
    }
    if (!format_.empty() && !bar::BarFormat::parse(format_)) {
        std::cerr << "Error: --format must contain exactly 5 glyphs\n";
        return false;
    }
    return true;
}

int RunCommand::execute() {
    if (!checkConfiguration(std::cerr) || !validateArguments()) {
        return 1;
    }
    
    auto& config = common::Config::instance().global();
    auto options = bar::BarOptions::fromConfig(config.bar);
    options.id = 1;
    if (width_ > 0) {
        options.width = width_;
    }
    if (!format_.empty()) {
        options.format = *bar::BarFormat::parse(format_);
    }
    if (!name_.empty()) {
        options.prepend.push_back(nameDecorator(name_));
    }
    options.append.push_back(counterDecorator(false));
    options.append.push_back(etaDecorator());
    
    bar::WidthSync prepend_ws(options.prepend.size(), 1);
    bar::WidthSync append_ws(options.append.size(), 1);
    
    bar::CompletionCounter counter;
    bar::Signal cancel;
    bar::Bar progress(total_, std::move(options), &counter, &cancel);
    
    if (resume_till_ > 0) {
        char32_t code_point = format::decodeGlyph(format::splitGlyphs(resume_glyph_).front());
        progress.resumeFill(code_point, resume_till_);
    }
    
    common::Logger::instance().info("[Run] Starting | total={} | step={} | interval_ms={}", 
                                   total_, step_, interval_ms_);
    
    std::thread producer([this, &progress]() {
        int64_t produced = 0;
        int64_t target = total_ > 0 ? total_ : items_ * step_;
        auto delay = std::chrono::milliseconds(interval_ms_);
        
        while (progress.inProgress() && produced < target) {
            if (progress.done().waitFor(delay)) {
                return;
            }
            progress.increment(step_);
            produced += step_;
        }
        
        if (total_ <= 0) {
            progress.complete();
        }
    });
    
    std::thread canceller;
    if (cancel_after_ms_ > 0) {
        canceller = std::thread([this, &progress, &cancel]() {
            if (!progress.done().waitFor(std::chrono::milliseconds(cancel_after_ms_))) {
                common::Logger::instance().info("[Run] Cancelling after {}ms", cancel_after_ms_);
                cancel.fire();
            }
        });
    }
    
    int refresh_ms = common::Config::instance().global().bar.refresh_interval_ms;
    bar::Statistics stats = driveUntilDone(progress, refresh_ms, prepend_ws, append_ws);
    
    producer.join();
    if (canceller.joinable()) {
        canceller.join();
    }
    counter.wait();
    
    if (json_) {
        std::cout << bar::toJson(stats).dump(2) << std::endl;
    }
    
    common::Logger::instance().info("[Run] Finished | current={} | total={} | aborted={}", 
                                   stats.current, stats.total, stats.aborted);
    
    return stats.aborted ? 130 : 0;
}

}}
