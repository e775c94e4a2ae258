#include <gtest/gtest.h>

#include <regex>
#include <sstream>

#include "utils.hpp"
#include "process.hpp"
#include "test_support.hpp"

using namespace Postinstall;
using namespace Postinstall::Testing;

TEST(LoggerTest, LogFileIsNamedAfterTheRunStamp)
{
    TempDir tmp;
    std::ostringstream console;
    Logger logger((tmp.path() / "logs").string(), console);

    EXPECT_TRUE(std::regex_match(logger.runStamp(), std::regex(R"(\d{8}_\d{6})")));
    EXPECT_EQ(fs::path(logger.path()).filename().string(),
              "postinstall_" + logger.runStamp() + ".log");
    EXPECT_TRUE(fs::exists(logger.path()));
}

TEST(LoggerTest, LinesAreTimestampedInFileAndConsole)
{
    TempDir tmp;
    std::ostringstream console;
    Logger logger(tmp.path().string(), console);

    logger.log("MOTD updated.");
    logger.warn("Failed to install foo.");

    std::string file = readFile(logger.path());
    std::regex line(R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] MOTD updated\.\n)"
                    R"(\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\] Failed to install foo\.\n)");
    EXPECT_TRUE(std::regex_match(file, line)) << file;

    EXPECT_NE(console.str().find("] MOTD updated."), std::string::npos);
    EXPECT_NE(console.str().find("] Failed to install foo."), std::string::npos);
}

TEST(LoggerTest, WarningsAndErrorsShareTheConsoleStream)
{
    TempDir tmp;
    std::ostringstream console;
    Logger logger(tmp.path().string(), console);

    logger.warn("Failed to install foo.");
    logger.error("This program must be run as root.");

    std::string shown = console.str();
    EXPECT_NE(shown.find("[WARN] "), std::string::npos);
    EXPECT_NE(shown.find("[ERROR] "), std::string::npos);
    EXPECT_LT(shown.find("Failed to install foo."), shown.find("must be run as root."));
}

TEST(UtilsTest, TrimRemovesSurroundingWhitespace)
{
    EXPECT_EQ(trim("  curl \t\r\n"), "curl");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(ProcessTest, ExitStatusIsReturned)
{
    EXPECT_EQ(Process::run({"true"}), 0);
    EXPECT_EQ(Process::run({"sh", "-c", "exit 3"}), 3);
    EXPECT_EQ(Process::run({"/nonexistent/binary"}), 127);
}

TEST(ProcessTest, OutputIsAppendedToFile)
{
    TempDir tmp;
    fs::path out = tmp.path() / "out.log";
    writeFile(out, "first\n");

    EXPECT_EQ(Process::run({"sh", "-c", "echo second; echo third >&2"}, out.string()), 0);
    EXPECT_EQ(readFile(out), "first\nsecond\nthird\n");
}

TEST(ProcessTest, CaptureCollectsStdout)
{
    std::string output;
    EXPECT_EQ(Process::capture({"sh", "-c", "printf '%s' \"$DEBIAN_FRONTEND\""}, output), 0);
    EXPECT_EQ(output, "noninteractive");
}
