#include "decorators.hpp"
#include "termbar/format/format_utils.hpp"
#include <spdlog/fmt/fmt.h>
#include <chrono>

namespace termbar {
namespace cli {

namespace {

std::string padRight(const std::string& text, int width) {
    int count = static_cast<int>(format::glyphCount(text));
    if (count >= width) {
        return text;
    }
    return text + std::string(width - count, ' ');
}

std::string padLeft(const std::string& text, int width) {
    int count = static_cast<int>(format::glyphCount(text));
    if (count >= width) {
        return text;
    }
    return std::string(width - count, ' ') + text;
}

}

bar::DecoratorFunc nameDecorator(const std::string& name) {
    return [name](const bar::Statistics&, bar::WidthSync::Slot& slot) {
        int width = slot.sync(static_cast<int>(format::glyphCount(name)));
        return padRight(name, width);
    };
}

bar::DecoratorFunc counterDecorator(bool as_bytes) {
    return [as_bytes](const bar::Statistics& stats, bar::WidthSync::Slot& slot) {
        std::string text;
        if (stats.total <= 0) {
            text = as_bytes ? format::formatBytes(stats.current) : std::to_string(stats.current);
        } else if (as_bytes) {
            text = fmt::format("{} / {}", format::formatBytes(stats.current), format::formatBytes(stats.total));
        } else {
            text = fmt::format("{}/{}", stats.current, stats.total);
        }
        int width = slot.sync(static_cast<int>(format::glyphCount(text)));
        return padLeft(text, width);
    };
}

bar::DecoratorFunc etaDecorator() {
    return [](const bar::Statistics& stats, bar::WidthSync::Slot& slot) {
        std::string text;
        if (stats.aborted) {
            text = "aborted";
        } else if (stats.completed) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(stats.time_elapsed);
            text = fmt::format("done in {:.1f}s", elapsed.count() / 1000.0);
        } else if (stats.total <= 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(stats.time_elapsed);
            text = fmt::format("{}s", elapsed.count());
        } else {
            auto eta = std::chrono::duration_cast<std::chrono::seconds>(stats.eta());
            text = fmt::format("ETA {}s", eta.count());
        }
        int width = slot.sync(static_cast<int>(format::glyphCount(text)));
        return padRight(text, width);
    };
}

}}
