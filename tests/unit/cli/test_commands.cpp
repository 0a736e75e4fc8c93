#include "cli/copy_command.hpp"
#include "cli/run_command.hpp"
#include "termbar/common/config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace termbar;

namespace {

class CommandTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / 
               ("termbar-command-test-" + std::to_string(getpid()));
        std::filesystem::create_directories(dir_);
        common::Config::instance().reset();
    }
    
    void TearDown() override {
        common::Config::instance().reset();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }
    
    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path.string();
    }
    
    std::filesystem::path dir_;
};

}

TEST_F(CommandTest, DefaultConfigurationIsAccepted) {
    cli::RunCommand command;
    std::ostringstream err;
    EXPECT_TRUE(command.checkConfiguration(err));
    EXPECT_TRUE(err.str().empty());
}

TEST_F(CommandTest, ZeroRefreshIntervalIsRejected) {
    auto path = writeFile("spin.toml", "[bar]\nrefresh_interval_ms = 0\n");
    ASSERT_TRUE(common::Config::instance().load(path));
    
    cli::RunCommand command;
    std::ostringstream err;
    EXPECT_FALSE(command.checkConfiguration(err));
    EXPECT_NE(err.str().find(path), std::string::npos);
    EXPECT_NE(err.str().find("bar.refresh_interval_ms"), std::string::npos);
    EXPECT_NE(err.str().find("BAR_REFRESH_INTERVAL_INVALID"), std::string::npos);
}

TEST_F(CommandTest, EveryInvalidValueIsListed) {
    auto& config = common::Config::instance();
    ASSERT_TRUE(config.setValue("bar.eta_alpha", "5"));
    ASSERT_TRUE(config.setValue("bar.width", "1"));
    
    cli::RunCommand command;
    std::ostringstream err;
    EXPECT_FALSE(command.checkConfiguration(err));
    EXPECT_NE(err.str().find("BAR_ETA_ALPHA_OUT_OF_RANGE"), std::string::npos);
    EXPECT_NE(err.str().find("BAR_WIDTH_TOO_SMALL"), std::string::npos);
}

TEST_F(CommandTest, RunRefusesInvalidConfiguration) {
    ASSERT_TRUE(common::Config::instance().setValue("bar.refresh_interval_ms", "-5"));
    
    CLI::App app;
    cli::RunCommand command;
    command.setup(app.add_subcommand("run", "run"));
    app.parse("run --total 3 --interval-ms 1", false);
    
    ASSERT_TRUE(command.wasCalled());
    EXPECT_EQ(command.execute(), 1);
}

TEST_F(CommandTest, CopyRefusesInvalidConfigurationBeforeWriting) {
    ASSERT_TRUE(common::Config::instance().setValue("bar.width", "1"));
    auto source = writeFile("source.bin", "payload");
    auto destination = (dir_ / "destination.bin").string();
    
    CLI::App app;
    cli::CopyCommand command;
    command.setup(app.add_subcommand("copy", "copy"));
    app.parse("copy " + source + " " + destination, false);
    
    EXPECT_EQ(command.execute(), 1);
    EXPECT_FALSE(std::filesystem::exists(destination));
}

TEST_F(CommandTest, CopyWithValidConfiguration) {
    ASSERT_TRUE(common::Config::instance().setValue("bar.refresh_interval_ms", "5"));
    auto source = writeFile("source.bin", "payload");
    auto destination = (dir_ / "destination.bin").string();
    
    CLI::App app;
    cli::CopyCommand command;
    command.setup(app.add_subcommand("copy", "copy"));
    app.parse("copy " + source + " " + destination, false);
    
    EXPECT_EQ(command.execute(), 0);
    std::ifstream in(destination, std::ios::binary);
    std::string copied((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(copied, "payload");
}
