#include <gtest/gtest.h>
#include <string>
#include "core/CommandLine.h"

TEST(CommandLineTest, ParsesAllFlags) {
    const char* argv[] = {"bedrock-bridge", "--server-path", "/srv/bds", "--auto-start",
                          "--config", "bridge.json", "--debug"};
    CommandLineOptions opts = parseCommandLine(7, argv);
    EXPECT_EQ(opts.serverPath, "/srv/bds");
    EXPECT_EQ(opts.configPath, "bridge.json");
    EXPECT_TRUE(opts.autoStart);
    EXPECT_TRUE(opts.debug);
    EXPECT_FALSE(opts.showHelp);
}

TEST(CommandLineTest, DefaultsWithoutArguments) {
    const char* argv[] = {"bedrock-bridge"};
    CommandLineOptions opts = parseCommandLine(1, argv);
    EXPECT_TRUE(opts.serverPath.empty());
    EXPECT_FALSE(opts.autoStart);

    const char* help[] = {"bedrock-bridge", "-h"};
    EXPECT_TRUE(parseCommandLine(2, help).showHelp);
}

TEST(CommandLineTest, RejectsUnknownAndIncompleteFlags) {
    const char* unknown[] = {"bedrock-bridge", "--port", "25565"};
    EXPECT_THROW(parseCommandLine(3, unknown), CommandLineError);

    const char* missing[] = {"bedrock-bridge", "--server-path"};
    try {
        parseCommandLine(2, missing);
        FAIL() << "expected CommandLineError";
    } catch (const CommandLineError& e) {
        EXPECT_STREQ(e.what(), "Missing value for --server-path");
    }
}

TEST(CommandLineTest, UsageNamesFlagsAndPlatformLimit) {
    std::string usage = usageText();
    EXPECT_NE(usage.find("--server-path"), std::string::npos);
    EXPECT_NE(usage.find("--auto-start"), std::string::npos);
    EXPECT_NE(usage.find("POSIX systems only"), std::string::npos);
    EXPECT_NE(usage.find("Windows"), std::string::npos);
}
