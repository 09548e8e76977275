#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "config/Settings.hpp"


namespace {
int parse(std::vector<std::string> args, Config::Settings& settings) {
    args.insert(args.begin(), "gps-emulator");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return Config::parseCommandLine(static_cast<int>(args.size()), argv.data(), settings);
}

std::string writeTempFile(const std::string& name, const std::string& contents) {
    std::string path = testing::TempDir() + name;
    std::ofstream out(path, std::ios::out | std::ios::trunc);
    out << contents;
    return path;
}
}


TEST(Settings, Defaults) {
    Config::Settings settings;
    EXPECT_EQ(settings.delay, 1);
    EXPECT_TRUE(settings.loop);
    EXPECT_FALSE(settings.verbose);
    EXPECT_EQ(settings.port, "/dev/ttyAMA0");
    EXPECT_EQ(settings.baudrate, 4800);
    EXPECT_EQ(settings.parity, "none");
    EXPECT_EQ(settings.stopbits, 1);
    EXPECT_EQ(settings.time, "now");
    EXPECT_EQ(settings.where, "5220.531,N,00011.797,E");
    EXPECT_EQ(Config::validate(settings), 0);
}

TEST(ParseCommandLine, NoArgumentsKeepsDefaults) {
    Config::Settings settings;
    ASSERT_EQ(parse({}, settings), Config::PARSE_OK);
    EXPECT_EQ(settings.port, "/dev/ttyAMA0");
    EXPECT_TRUE(settings.loop);
}

TEST(ParseCommandLine, LongOptions) {
    Config::Settings settings;
    ASSERT_EQ(parse({"--delay", "5", "--port", "/dev/ttyUSB1", "--verbose", "--time", "12:00:00",
                     "--once", "--baudrate", "9600", "--parity", "even", "--stopbits", "2",
                     "--where", "4807.038,N,01131.000,E"}, settings),
              Config::PARSE_OK);
    EXPECT_EQ(settings.delay, 5);
    EXPECT_EQ(settings.port, "/dev/ttyUSB1");
    EXPECT_TRUE(settings.verbose);
    EXPECT_EQ(settings.time, "12:00:00");
    EXPECT_FALSE(settings.loop);
    EXPECT_EQ(settings.baudrate, 9600);
    EXPECT_EQ(settings.parity, "even");
    EXPECT_EQ(settings.stopbits, 2);
    EXPECT_EQ(settings.where, "4807.038,N,01131.000,E");
    EXPECT_EQ(Config::validate(settings), 0);
}

TEST(ParseCommandLine, ShortOptionsAndLastOneWins) {
    Config::Settings settings;
    ASSERT_EQ(parse({"-d", "0", "-p", "/dev/null", "-v", "-1", "-l", "-b", "115200"}, settings),
              Config::PARSE_OK);
    EXPECT_EQ(settings.delay, 0);
    EXPECT_EQ(settings.port, "/dev/null");
    EXPECT_TRUE(settings.verbose);
    EXPECT_TRUE(settings.loop);
    EXPECT_EQ(settings.baudrate, 115200);
}

TEST(ParseCommandLine, RejectsBadNumbersAndStrayArguments) {
    Config::Settings settings;
    EXPECT_EQ(parse({"--delay", "soon"}, settings), Config::PARSE_ERROR);
    EXPECT_EQ(parse({"--baudrate", "96o0"}, settings), Config::PARSE_ERROR);
    EXPECT_EQ(parse({"--stopbits", ""}, settings), Config::PARSE_ERROR);
    EXPECT_EQ(parse({"--bogus"}, settings), Config::PARSE_ERROR);
    EXPECT_EQ(parse({"extra"}, settings), Config::PARSE_ERROR);
}

TEST(ParseCommandLine, HelpAndVersionExit) {
    Config::Settings settings;
    EXPECT_EQ(parse({"--help"}, settings), Config::PARSE_EXIT);
    EXPECT_EQ(parse({"-V"}, settings), Config::PARSE_EXIT);
}

TEST(ParseCommandLine, CommandLineOverridesConfigFile) {
    std::string path = writeTempFile("gpsemu_override.json",
                                     R"({"delay": 7, "port": "/dev/ttyS3", "verbose": true})");
    Config::Settings settings;
    ASSERT_EQ(parse({"--port", "/dev/ttyUSB0", "--config", path}, settings), Config::PARSE_OK);
    EXPECT_EQ(settings.delay, 7);
    EXPECT_TRUE(settings.verbose);
    EXPECT_EQ(settings.port, "/dev/ttyUSB0");
    EXPECT_EQ(settings.configPath, path);
    std::remove(path.c_str());
}

TEST(ParseCommandLine, MissingConfigFileIsAnError) {
    Config::Settings settings;
    EXPECT_EQ(parse({"--config", testing::TempDir() + "gpsemu_does_not_exist.json"}, settings),
              Config::PARSE_ERROR);
}

TEST(LoadSettingsJson, AppliesEveryKey) {
    Config::Settings settings;
    ASSERT_EQ(Config::loadSettingsJson(R"({
        "delay": 3, "port": "/dev/ttyS0", "verbose": true, "time": "1994-03-23 12:35:19",
        "loop": false, "baudrate": 38400, "parity": "odd", "stopbits": 2,
        "where": "4807.038,N,01131.000,E", "comment": "ignored"
    })", settings), 0);
    EXPECT_EQ(settings.delay, 3);
    EXPECT_EQ(settings.port, "/dev/ttyS0");
    EXPECT_TRUE(settings.verbose);
    EXPECT_EQ(settings.time, "1994-03-23 12:35:19");
    EXPECT_FALSE(settings.loop);
    EXPECT_EQ(settings.baudrate, 38400);
    EXPECT_EQ(settings.parity, "odd");
    EXPECT_EQ(settings.stopbits, 2);
    EXPECT_EQ(settings.where, "4807.038,N,01131.000,E");
    EXPECT_EQ(Config::validate(settings), 0);
}

TEST(LoadSettingsJson, RejectsBadDocuments) {
    Config::Settings settings;
    EXPECT_EQ(Config::loadSettingsJson("{not json", settings), -1);
    EXPECT_EQ(Config::loadSettingsJson("[1, 2]", settings), -1);
    EXPECT_EQ(Config::loadSettingsJson(R"({"delay": "1"})", settings), -1);
    EXPECT_EQ(Config::loadSettingsJson(R"({"loop": 1})", settings), -1);
}

TEST(Validate, RejectsEachBadValue) {
    auto expectInvalid = [](void (*mutate)(Config::Settings&)) {
        Config::Settings settings;
        mutate(settings);
        EXPECT_EQ(Config::validate(settings), -1);
    };

    expectInvalid([](Config::Settings& s) { s.delay = -1; });
    expectInvalid([](Config::Settings& s) { s.port = ""; });
    expectInvalid([](Config::Settings& s) { s.baudrate = 12345; });
    expectInvalid([](Config::Settings& s) { s.parity = "sometimes"; });
    expectInvalid([](Config::Settings& s) { s.stopbits = 3; });
    expectInvalid([](Config::Settings& s) { s.time = "25:00:00"; });
    expectInvalid([](Config::Settings& s) { s.time = "tomorrow"; });
    expectInvalid([](Config::Settings& s) { s.where = "5220.531,N"; });
}

TEST(Validate, AcceptsParityLetters) {
    for (const char* parity : {"N", "e", "O", "m", "S", "Space"}) {
        Config::Settings settings;
        settings.parity = parity;
        EXPECT_EQ(Config::validate(settings), 0) << parity;
    }
}

TEST(LoadSettingsJson, RejectsIntegersOutsideIntRange) {
    Config::Settings settings;
    EXPECT_EQ(Config::loadSettingsJson(R"({"delay": 4294967297})", settings), -1);
    EXPECT_EQ(Config::loadSettingsJson(R"({"baudrate": 4294972096})", settings), -1);
    EXPECT_EQ(Config::loadSettingsJson(R"({"stopbits": -2147483649})", settings), -1);
    EXPECT_EQ(Config::loadSettingsJson(R"({"delay": 18446744073709551615})", settings), -1);

    EXPECT_EQ(Config::loadSettingsJson(R"({"delay": 2147483647})", settings), 0);
    EXPECT_EQ(settings.delay, 2147483647);
}

TEST(ParseCommandLine, QuietOverridesVerboseFromConfigFile) {
    std::string path = writeTempFile("gpsemu_quiet.json", R"({"verbose": true})");

    Config::Settings quiet;
    ASSERT_EQ(parse({"--config", path, "--quiet"}, quiet), Config::PARSE_OK);
    EXPECT_FALSE(quiet.verbose);

    Config::Settings noVerbose;
    ASSERT_EQ(parse({"--no-verbose", "-c", path}, noVerbose), Config::PARSE_OK);
    EXPECT_FALSE(noVerbose.verbose);

    Config::Settings fromFile;
    ASSERT_EQ(parse({"-c", path}, fromFile), Config::PARSE_OK);
    EXPECT_TRUE(fromFile.verbose);
    std::remove(path.c_str());
}
