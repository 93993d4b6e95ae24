#include <gtest/gtest.h>
#include <ticker/core/stock.hpp>
#include <ticker/utils/config.hpp>
#include <ticker/utils/logger.hpp>

#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using ticker::utils::Config;
using ticker::utils::LogLevel;
using ticker::utils::Logger;

// Captures std::cout for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_(std::cout.rdbuf(buffer_.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_); }

    std::string str() const { return buffer_.str(); }

private:
    std::stringstream buffer_;
    std::streambuf* old_;
};

class LoggerTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::set_level(LogLevel::INFO);
    }
};

TEST_F(LoggerTest, BasicLogging) {
    std::string output;
    {
        CoutCapture capture;
        Logger::set_level(LogLevel::INFO);

        Logger::debug() << "Debug message" << Logger::endl;
        Logger::info() << "Info message" << Logger::endl;
        Logger::warn() << "Warning message" << Logger::endl;
        Logger::error() << "Error message" << Logger::endl;

        output = capture.str();
    }

    EXPECT_EQ(output.find("Debug message"), std::string::npos);
    EXPECT_NE(output.find("[INFO] Info message"), std::string::npos);
    EXPECT_NE(output.find("[WARN] Warning message"), std::string::npos);
    EXPECT_NE(output.find("[ERROR] Error message"), std::string::npos);
}

TEST_F(LoggerTest, RejectedUpdateIsLoggedAsWarning) {
    std::string output;
    {
        CoutCapture capture;
        Logger::set_level(LogLevel::WARN);

        ticker::core::Stock goog("GOOG");
        goog.update(ticker::core::make_timestamp(2014, 2, 12), 10);
        goog.update(ticker::core::make_timestamp(2014, 2, 13), -1);

        output = capture.str();
    }

    EXPECT_NE(output.find("[WARN] Rejected update for GOOG"), std::string::npos);
    EXPECT_EQ(output.find("[DEBUG]"), std::string::npos);
}

TEST_F(LoggerTest, AcceptedUpdateIsLoggedAtDebug) {
    std::string output;
    {
        CoutCapture capture;
        Logger::set_level(LogLevel::DEBUG);

        ticker::core::Stock goog("GOOG");
        goog.update(ticker::core::make_timestamp(2014, 2, 12), 10);

        output = capture.str();
    }

    EXPECT_NE(output.find("[DEBUG] GOOG"), std::string::npos);
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(ticker::utils::parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(ticker::utils::parse_log_level("INFO"), LogLevel::INFO);
    EXPECT_EQ(ticker::utils::parse_log_level("Warning"), LogLevel::WARN);
    EXPECT_EQ(ticker::utils::parse_log_level("error"), LogLevel::LOG_ERROR);
    EXPECT_FALSE(ticker::utils::parse_log_level("verbose").has_value());
    EXPECT_STREQ(ticker::utils::log_level_name(LogLevel::LOG_ERROR), "ERROR");
}

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        Logger::set_level(LogLevel::INFO);
    }
};

TEST_F(ConfigTest, ParsesKeyValueLines) {
    std::istringstream in(
        "# ticker settings\n"
        "\n"
        "  log_level = debug  \n"
        "symbol=GOOG\n"
        "threshold = 2.5\n"
        "not a setting\n");

    Config config;
    config.load_from_stream(in);

    EXPECT_TRUE(config.has("log_level"));
    EXPECT_EQ(config.get("log_level", std::string()), "debug");
    EXPECT_EQ(config.get("symbol", std::string()), "GOOG");
    EXPECT_DOUBLE_EQ(config.get("threshold", 0.0), 2.5);
    EXPECT_FALSE(config.has("not a setting"));
}

TEST_F(ConfigTest, DefaultsForMissingOrMalformedValues) {
    Config config;
    config.set("count", "abc");

    EXPECT_EQ(config.get("count", 7), 7);
    EXPECT_EQ(config.get("missing", 3), 3);
    EXPECT_EQ(config.get("missing", std::string("none")), "none");

    config.set("count", 42);
    EXPECT_EQ(config.get("count", 0), 42);
}

TEST_F(ConfigTest, LoadFromFile) {
    const std::string path = ::testing::TempDir() + "ticker_config_test.conf";
    {
        std::ofstream out(path);
        out << "log_level=warn\n";
    }

    Config config;
    ASSERT_TRUE(config.load_from_file(path));
    EXPECT_EQ(config.get("log_level", std::string()), "warn");
    std::remove(path.c_str());

    Logger::set_level(LogLevel::LOG_ERROR);
    EXPECT_FALSE(config.load_from_file(path));
}

TEST_F(ConfigTest, ConfigureLogging) {
    Logger::set_level(LogLevel::INFO);

    Config config;
    EXPECT_TRUE(ticker::utils::configure_logging(config));
    EXPECT_EQ(Logger::level(), LogLevel::INFO);

    config.set("log_level", "error");
    EXPECT_TRUE(ticker::utils::configure_logging(config));
    EXPECT_EQ(Logger::level(), LogLevel::LOG_ERROR);

    config.set("log_level", "loud");
    EXPECT_FALSE(ticker::utils::configure_logging(config));
    EXPECT_EQ(Logger::level(), LogLevel::LOG_ERROR);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
