#include "termbar/bar/bar.hpp"
#include "termbar/bar/proxy_reader.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace termbar::bar;
using namespace std::chrono_literals;

namespace {

BarOptions compactOptions(int width) {
    BarOptions options;
    options.width = width;
    options.trim_left_space = true;
    options.trim_right_space = true;
    return options;
}

DecoratorFunc emptyDecorator() {
    return [](const Statistics&, WidthSync::Slot&) { return std::string(); };
}

}

TEST(Bar, InvalidIncrementsAreIgnored) {
    Bar bar(100);
    bar.increment(0);
    bar.increment(-5);
    
    auto stats = bar.statistics();
    EXPECT_EQ(stats.current, 0);
    EXPECT_EQ(stats.time_elapsed.count(), 0);
    EXPECT_FALSE(stats.completed);
}

TEST(Bar, IncrementsReachingTotalComplete) {
    Bar bar(100);
    bar.increment(40);
    bar.increment(60);
    
    auto stats = bar.statistics();
    EXPECT_TRUE(stats.completed);
    EXPECT_EQ(stats.current, 100);
    
    bar.increment(10);
    EXPECT_EQ(bar.statistics().current, 100);
}

TEST(Bar, OvershootIsClamped) {
    Bar bar(100);
    bar.increment(150);
    auto stats = bar.statistics();
    EXPECT_EQ(stats.current, 100);
    EXPECT_TRUE(stats.completed);
}

TEST(Bar, CompleteTwiceTerminatesOnce) {
    CompletionCounter counter;
    {
        Bar bar(10, BarOptions(), &counter);
        EXPECT_EQ(counter.count(), 1);
        EXPECT_TRUE(bar.inProgress());
        
        bar.complete();
        bar.complete();
        EXPECT_FALSE(bar.inProgress());
        ASSERT_TRUE(bar.done().waitFor(2s));
        EXPECT_EQ(counter.count(), 0);
        
        bar.complete();
    }
    EXPECT_EQ(counter.count(), 0);
}

TEST(Bar, QueriesReadFrozenStateAfterTermination) {
    BarOptions options;
    options.id = 7;
    options.append.push_back(emptyDecorator());
    options.append.push_back(emptyDecorator());
    
    Bar bar(50, std::move(options));
    bar.increment(20);
    bar.complete();
    bar.wait();
    
    EXPECT_EQ(bar.getId(), 7);
    EXPECT_EQ(bar.numOfAppenders(), 2u);
    EXPECT_EQ(bar.numOfPrependers(), 0u);
    
    auto stats = bar.statistics();
    EXPECT_TRUE(stats.completed);
    EXPECT_FALSE(stats.aborted);
    EXPECT_EQ(stats.current, 20);
    
    bar.increment(5);
    bar.resumeFill(U'+', 10);
    bar.removeAllAppenders();
    EXPECT_EQ(bar.statistics().current, 20);
    EXPECT_EQ(bar.numOfAppenders(), 2u);
}

TEST(Bar, RemoveDecorators) {
    BarOptions options;
    options.prepend.push_back(emptyDecorator());
    options.append.push_back(emptyDecorator());
    options.append.push_back(emptyDecorator());
    
    Bar bar(10, std::move(options));
    EXPECT_EQ(bar.numOfPrependers(), 1u);
    EXPECT_EQ(bar.numOfAppenders(), 2u);
    
    bar.removeAllAppenders();
    EXPECT_EQ(bar.numOfAppenders(), 0u);
    EXPECT_EQ(bar.numOfPrependers(), 1u);
    
    bar.removeAllPrependers();
    EXPECT_EQ(bar.numOfPrependers(), 0u);
}

TEST(Bar, CancellationAbortsOnce) {
    CompletionCounter counter;
    Signal cancel;
    Bar bar(100, BarOptions(), &counter, &cancel);
    bar.increment(10);
    
    cancel.fire();
    ASSERT_TRUE(bar.done().waitFor(2s));
    EXPECT_FALSE(bar.inProgress());
    
    auto stats = bar.statistics();
    EXPECT_TRUE(stats.aborted);
    EXPECT_TRUE(stats.completed);
    EXPECT_EQ(stats.current, 10);
    EXPECT_EQ(counter.count(), 0);
}

TEST(Bar, CancelledBeforeConstruction) {
    Signal cancel;
    cancel.fire();
    
    Bar bar(100, BarOptions(), nullptr, &cancel);
    ASSERT_TRUE(bar.done().waitFor(2s));
    EXPECT_TRUE(bar.statistics().aborted);
}

TEST(Bar, CancellationRacingNaturalCompletion) {
    for (int round = 0; round < 50; ++round) {
        CompletionCounter counter;
        // held open so a second termination would show up as 0
        counter.add(1);
        Signal cancel;
        {
            Bar bar(10, compactOptions(7), &counter, &cancel);
            WidthSync none(0, 1);
            
            std::thread producer([&]() {
                bar.increment(10);
                auto flushed = std::make_shared<Signal>();
                bar.render(0, flushed, none, none);
                flushed->fire();
            });
            std::thread canceller([&]() { cancel.fire(); });
            producer.join();
            canceller.join();
            
            ASSERT_TRUE(bar.done().waitFor(2s));
            auto stats = bar.statistics();
            EXPECT_TRUE(stats.completed);
            EXPECT_TRUE(stats.aborted || stats.current == 10);
            EXPECT_EQ(counter.count(), 1);
        }
        EXPECT_EQ(counter.count(), 1);
        counter.done();
    }
}

TEST(Bar, SharedCancellationStopsEveryBar) {
    CompletionCounter counter;
    Signal cancel;
    std::vector<std::unique_ptr<Bar>> bars;
    for (int i = 0; i < 4; ++i) {
        BarOptions options;
        options.id = i;
        bars.push_back(std::make_unique<Bar>(100, std::move(options), &counter, &cancel));
    }
    EXPECT_EQ(counter.count(), 4);
    
    cancel.fire();
    ASSERT_TRUE(counter.waitFor(2s));
    for (auto& bar : bars) {
        EXPECT_TRUE(bar->statistics().aborted);
    }
}

TEST(Bar, CancellationRacingCompletion) {
    for (int round = 0; round < 50; ++round) {
        CompletionCounter counter;
        Signal cancel;
        {
            Bar bar(10, BarOptions(), &counter, &cancel);
            std::thread a([&]() { cancel.fire(); });
            std::thread b([&]() { bar.complete(); });
            std::thread c([&]() { bar.complete(); });
            a.join();
            b.join();
            c.join();
            ASSERT_TRUE(bar.done().waitFor(2s));
            EXPECT_TRUE(bar.statistics().completed);
        }
        EXPECT_EQ(counter.count(), 0);
    }
}

TEST(Bar, ConcurrentProducersAreSerialized) {
    Bar bar(100000);
    std::vector<std::thread> producers;
    for (int i = 0; i < 4; ++i) {
        producers.emplace_back([&bar]() {
            for (int j = 0; j < 250; ++j) {
                bar.increment(1);
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    EXPECT_EQ(bar.statistics().current, 1000);
}

TEST(Bar, EtaFollowsTimePerItem) {
    Bar bar(1000);
    bar.increment(1);
    std::this_thread::sleep_for(20ms);
    bar.increment(1);
    
    auto stats = bar.statistics();
    EXPECT_GT(stats.time_per_item.count(), 0);
    EXPECT_GT(stats.time_elapsed.count(), 0);
    EXPECT_EQ(stats.eta(), (stats.total - stats.current) * stats.time_per_item);
}

TEST(Bar, RenderShowsRefillOverlay) {
    Bar bar(100, compactOptions(12));
    bar.increment(60);
    bar.resumeFill(U'+', 0);
    bar.resumeFill(U'+', 30);
    
    WidthSync none(0, 1);
    EXPECT_EQ(bar.render(0, nullptr, none, none), "[+++==>----]\n");
}

TEST(Bar, RenderOfCompletedBarWaitsForFlush) {
    Bar bar(10, compactOptions(7));
    bar.increment(10);
    
    auto flushed = std::make_shared<Signal>();
    WidthSync none(0, 1);
    EXPECT_EQ(bar.render(0, flushed, none, none), "[=====]\n");
    
    EXPECT_FALSE(bar.done().waitFor(50ms));
    flushed->fire();
    ASSERT_TRUE(bar.done().waitFor(2s));
    EXPECT_FALSE(bar.inProgress());
    EXPECT_EQ(bar.render(0, nullptr, none, none), "[=====]\n");
}

TEST(Bar, SpinnerAdvancesOncePerRender) {
    Bar bar(0, compactOptions(20));
    WidthSync none(0, 1);
    
    std::string glyphs;
    for (int i = 0; i < 5; ++i) {
        std::string line = bar.render(80, nullptr, none, none);
        ASSERT_EQ(line.size(), 4u);
        glyphs.push_back(line[1]);
    }
    EXPECT_EQ(glyphs, "-\\|/-");
    
    bar.increment(3);
    EXPECT_EQ(bar.render(80, nullptr, none, none), "[\\]\n");
}

TEST(Bar, SpinnerIsFrozenAfterTermination) {
    Bar bar(0, compactOptions(20));
    WidthSync none(0, 1);
    EXPECT_EQ(bar.render(80, nullptr, none, none), "[-]\n");
    
    bar.complete();
    bar.wait();
    EXPECT_EQ(bar.render(80, nullptr, none, none), "[-]\n");
    EXPECT_EQ(bar.render(80, nullptr, none, none), "[-]\n");
}

TEST(Bar, SkippedSpinnerFrameKeepsGlyph) {
    BarOptions options = compactOptions(20);
    options.append.push_back(emptyDecorator());
    Bar bar(0, std::move(options));
    
    WidthSync none(0, 1);
    WidthSync one(1, 1);
    EXPECT_EQ(bar.render(80, nullptr, none, one), "[-]\n");
    EXPECT_EQ(bar.render(80, nullptr, none, none), "\n");
    EXPECT_EQ(bar.render(80, nullptr, none, none), "\n");
    EXPECT_EQ(bar.render(80, nullptr, none, one), "[\\]\n");
}

TEST(Bar, RenderIsEmptyOnColumnMismatch) {
    BarOptions options = compactOptions(12);
    options.prepend.push_back(emptyDecorator());
    Bar bar(10, std::move(options));
    
    WidthSync none(0, 1);
    EXPECT_EQ(bar.render(80, nullptr, none, none), "\n");
    
    WidthSync one(1, 1);
    EXPECT_EQ(bar.render(80, nullptr, one, none), "[----------]\n");
}

TEST(Bar, DecoratorFailureBecomesDiagnosticLine) {
    BarOptions options = compactOptions(12);
    options.append.push_back([](const Statistics&, WidthSync::Slot&) -> std::string {
        throw std::runtime_error("decorator exploded");
    });
    Bar bar(10, std::move(options));
    
    WidthSync prepend(0, 1);
    WidthSync append(1, 1);
    EXPECT_EQ(bar.render(80, nullptr, prepend, append), "decorator exploded\n");
    
    bar.increment(5);
    EXPECT_EQ(bar.statistics().current, 5);
}

TEST(Bar, DecoratorsCanAlignAcrossBars) {
    auto label = [](std::string text) -> DecoratorFunc {
        return [text](const Statistics&, WidthSync::Slot& slot) {
            int width = slot.sync(static_cast<int>(text.size()));
            return text + std::string(width - text.size(), ' ');
        };
    };
    
    BarOptions first = compactOptions(7);
    first.prepend.push_back(label("ab"));
    BarOptions second = compactOptions(7);
    second.prepend.push_back(label("abcde"));
    
    Bar a(10, std::move(first));
    Bar b(10, std::move(second));
    WidthSync prepend(1, 2);
    WidthSync append(0, 2);
    
    std::string line_a;
    std::string line_b;
    std::thread ta([&]() { line_a = a.render(80, nullptr, prepend, append); });
    std::thread tb([&]() { line_b = b.render(80, nullptr, prepend, append); });
    ta.join();
    tb.join();
    
    EXPECT_EQ(line_a, "ab   [-----]\n");
    EXPECT_EQ(line_b, "abcde[-----]\n");
}

namespace {

DecoratorFunc paddedLabel(std::string text) {
    return [text](const Statistics&, WidthSync::Slot& slot) {
        int width = slot.sync(static_cast<int>(text.size()));
        return text + std::string(width - text.size(), ' ');
    };
}

}

TEST(Bar, FailingDecoratorDoesNotStallOtherBars) {
    BarOptions broken = compactOptions(7);
    broken.prepend.push_back([](const Statistics&, WidthSync::Slot&) -> std::string {
        throw std::runtime_error("boom");
    });
    BarOptions healthy = compactOptions(7);
    healthy.prepend.push_back(paddedLabel("ok"));
    
    Bar a(10, std::move(broken));
    Bar b(10, std::move(healthy));
    WidthSync prepend(1, 2);
    WidthSync append(0, 2);
    
    for (int frame = 0; frame < 3; ++frame) {
        std::string line_a;
        std::string line_b;
        std::thread ta([&]() { line_a = a.render(80, nullptr, prepend, append); });
        std::thread tb([&]() { line_b = b.render(80, nullptr, prepend, append); });
        ta.join();
        tb.join();
        
        EXPECT_EQ(line_a, "boom\n");
        EXPECT_EQ(line_b, "ok[-----]\n");
    }
}

TEST(Bar, MismatchedBarDoesNotStallOtherBars) {
    Bar a(10, compactOptions(7));
    BarOptions healthy = compactOptions(7);
    healthy.prepend.push_back(paddedLabel("ok"));
    Bar b(10, std::move(healthy));
    
    WidthSync prepend(1, 2);
    WidthSync append(0, 2);
    
    for (int frame = 0; frame < 3; ++frame) {
        std::string line_a;
        std::string line_b;
        std::thread ta([&]() { line_a = a.render(80, nullptr, prepend, append); });
        std::thread tb([&]() { line_b = b.render(80, nullptr, prepend, append); });
        ta.join();
        tb.join();
        
        EXPECT_EQ(line_a, "\n");
        EXPECT_EQ(line_b, "ok[-----]\n");
    }
}

TEST(ProxyReader, IncrementsByBytesRead) {
    Bar bar(11);
    std::istringstream input("hello world");
    auto reader = bar.proxyReader(input);
    
    char buffer[4];
    std::string collected;
    std::streamsize n;
    while ((n = reader.read(buffer, sizeof(buffer))) > 0) {
        collected.append(buffer, static_cast<size_t>(n));
    }
    
    EXPECT_EQ(collected, "hello world");
    auto stats = bar.statistics();
    EXPECT_EQ(stats.current, 11);
    EXPECT_TRUE(stats.completed);
}
