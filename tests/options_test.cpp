// SPDX-License-Identifier: GPL-3.0-or-later

#include <gtest/gtest.h>

#include "headers.h"
#include "options.h"

#include <string>
#include <vector>

namespace {

// Holds argument storage alive for the argv pointers handed to parseOptions
class CommandLine {
public:
    explicit CommandLine(std::vector<std::string> args) : args_(std::move(args)) {
        for (auto& arg : args_) {
            argv_.push_back(arg.data());
        }
        argv_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return argv_.data(); }

private:
    std::vector<std::string> args_;
    std::vector<char*> argv_;
};

class OptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("sancmd_options_" + std::to_string(getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    bool parse(std::vector<std::string> args) {
        args.insert(args.begin(), "sancmd");
        CommandLine commandLine(std::move(args));
        return parseOptions(commandLine.argc(), commandLine.argv(), options_, exitCode_);
    }

    fs::path dir_;
    SanitizeOptions options_;
    int exitCode_ = -1;
};

} // namespace

TEST_F(OptionsTest, DefaultsToInteractiveApply) {
    ASSERT_TRUE(parse({dir_.string()}));
    EXPECT_FALSE(options_.headless);
    EXPECT_FALSE(options_.coldRun);
    EXPECT_FALSE(options_.verbose);
    EXPECT_TRUE(options_.color);
    EXPECT_EQ(options_.maxDepth, -1);
    EXPECT_EQ(options_.root, fs::absolute(dir_).lexically_normal());
}

TEST_F(OptionsTest, TrailingSeparatorIsDropped) {
    ASSERT_TRUE(parse({dir_.string() + "/."}));
    EXPECT_EQ(options_.root, fs::absolute(dir_).lexically_normal());
}

TEST_F(OptionsTest, HeadlessModes) {
    ASSERT_TRUE(parse({"-y", dir_.string()}));
    EXPECT_TRUE(options_.headless);
    EXPECT_FALSE(options_.coldRun);

    SanitizeOptions fresh;
    options_ = fresh;
    ASSERT_TRUE(parse({"-c", "-v", "--no-color", dir_.string()}));
    EXPECT_TRUE(options_.headless);
    EXPECT_TRUE(options_.coldRun);
    EXPECT_TRUE(options_.verbose);
    EXPECT_FALSE(options_.color);
}

TEST_F(OptionsTest, ApplyAndColdRunCannotBeMixed) {
    EXPECT_FALSE(parse({"-y", "-c", dir_.string()}));
    EXPECT_EQ(exitCode_, 1);
}

TEST_F(OptionsTest, DepthValues) {
    ASSERT_TRUE(parse({"-d", "2", dir_.string()}));
    EXPECT_EQ(options_.maxDepth, 2);

    ASSERT_TRUE(parse({"-d", "-1", dir_.string()}));
    EXPECT_EQ(options_.maxDepth, -1);

    EXPECT_FALSE(parse({"-d", "two", dir_.string()}));
    EXPECT_EQ(exitCode_, 1);
    EXPECT_FALSE(parse({"-d", "3x", dir_.string()}));
    EXPECT_FALSE(parse({"-d", "-2", dir_.string()}));
    EXPECT_FALSE(parse({"-d"}));
    EXPECT_EQ(exitCode_, 1);
}

TEST_F(OptionsTest, RejectsBadArguments) {
    EXPECT_FALSE(parse({"--bogus", dir_.string()}));
    EXPECT_EQ(exitCode_, 1);

    EXPECT_FALSE(parse({dir_.string(), dir_.string()}));
    EXPECT_EQ(exitCode_, 1);

    EXPECT_FALSE(parse({(dir_ / "missing").string()}));
    EXPECT_EQ(exitCode_, 1);
}

TEST_F(OptionsTest, HelpAndVersionExitCleanly) {
    EXPECT_FALSE(parse({"--help"}));
    EXPECT_EQ(exitCode_, 0);
    EXPECT_FALSE(parse({"--version"}));
    EXPECT_EQ(exitCode_, 0);
}

TEST(RunChoice, ParsesPromptAnswers) {
    EXPECT_EQ(parseRunChoice("Y"), RunChoice::Apply);
    EXPECT_EQ(parseRunChoice("y  "), RunChoice::Apply);
    EXPECT_EQ(parseRunChoice("C"), RunChoice::ColdRun);
    EXPECT_EQ(parseRunChoice("c\t"), RunChoice::ColdRun);
    EXPECT_EQ(parseRunChoice(""), RunChoice::Abort);
    EXPECT_EQ(parseRunChoice("n"), RunChoice::Abort);
    EXPECT_EQ(parseRunChoice("yes"), RunChoice::Abort);
    EXPECT_EQ(parseRunChoice(" y"), RunChoice::Abort);
}

TEST(Terminal, TrimRightAndPaint) {
    EXPECT_EQ(trimRight("abc \t\n"), "abc");
    EXPECT_EQ(trimRight("   "), "");
    EXPECT_EQ(paint("x", color::red, false), "x");
    EXPECT_EQ(paint("x", color::red, true), "\033[91mx\033[0m");
}

TEST(Terminal, PromptInterruptOnlyFlagsTheSignal) {
    setupPromptSignalHandlers();
    EXPECT_NE(rl_signal_event_hook, nullptr);

    // Outside of readline the handler has nothing to clean up and must return
    ASSERT_EQ(raise(SIGINT), 0);

    restoreDefaultSignalHandlers();
    EXPECT_EQ(rl_signal_event_hook, nullptr);
}
