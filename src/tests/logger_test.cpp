#include <gtest/gtest.h>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <filesystem>
#include <boost/log/core.hpp>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace peerdrop::logging;

class LoggerTest : public ::testing::Test {
protected:
    peerdrop::test::TempDir dir;
    std::filesystem::path log_path;

    void SetUp() override {
        log_path = dir.path() / "peerdrop.log";
        LogConfig config;
        config.min_level = boost::log::trivial::trace;
        config.log_file = log_path.string();
        config.console = false;
        init_logging(config);
    }

    void TearDown() override {
        // Release the file before the directory goes away
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        ::init_logging();
    }

    void reconfigure(severity_level level) {
        LogConfig config;
        config.min_level = level;
        config.log_file = log_path.string();
        config.console = false;
        init_logging(config);
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        std::ifstream file(log_path, std::ios::in | std::ios::binary);
        if (!file.is_open()) {
            return false;
        }
        std::stringstream content;
        content << file.rdbuf();
        return content.str().find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, BasicLogging) {
    BOOST_LOG_TRIVIAL(info) << "Test info message";
    BOOST_LOG_TRIVIAL(error) << "Test error message";

    EXPECT_TRUE(log_contains("Test info message"));
    EXPECT_TRUE(log_contains("Test error message"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, ThreadLogging) {
    std::thread t([]() {
        BOOST_LOG_TRIVIAL(info) << "Message from thread";
    });
    t.join();

    EXPECT_TRUE(log_contains("Message from thread"));
}

TEST_F(LoggerTest, SeverityLevels) {
    BOOST_LOG_TRIVIAL(trace) << "Trace message";
    BOOST_LOG_TRIVIAL(debug) << "Debug message";
    BOOST_LOG_TRIVIAL(info) << "Info message";
    BOOST_LOG_TRIVIAL(warning) << "Warning message";
    BOOST_LOG_TRIVIAL(error) << "Error message";
    BOOST_LOG_TRIVIAL(fatal) << "Fatal message";

    EXPECT_TRUE(log_contains("Trace message"));
    EXPECT_TRUE(log_contains("Debug message"));
    EXPECT_TRUE(log_contains("Info message"));
    EXPECT_TRUE(log_contains("Warning message"));
    EXPECT_TRUE(log_contains("Error message"));
    EXPECT_TRUE(log_contains("Fatal message"));
}

TEST_F(LoggerTest, LogLevelFiltering) {
    reconfigure(boost::log::trivial::warning);

    BOOST_LOG_TRIVIAL(debug) << "Should not appear";
    BOOST_LOG_TRIVIAL(warning) << "Should appear";

    EXPECT_FALSE(log_contains("Should not appear"));
    EXPECT_TRUE(log_contains("Should appear"));
}

TEST_F(LoggerTest, ReinitializingAppendsToFile) {
    BOOST_LOG_TRIVIAL(info) << "First run";
    reconfigure(boost::log::trivial::info);
    BOOST_LOG_TRIVIAL(info) << "Second run";

    EXPECT_TRUE(log_contains("First run"));
    EXPECT_TRUE(log_contains("Second run"));
}

TEST(LogSeverityTest, ParsesNames) {
    EXPECT_EQ(parse_severity("trace"), boost::log::trivial::trace);
    EXPECT_EQ(parse_severity("debug"), boost::log::trivial::debug);
    EXPECT_EQ(parse_severity("info"), boost::log::trivial::info);
    EXPECT_EQ(parse_severity("warning"), boost::log::trivial::warning);
    EXPECT_EQ(parse_severity("error"), boost::log::trivial::error);
    EXPECT_EQ(parse_severity("fatal"), boost::log::trivial::fatal);
    EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
    EXPECT_THROW(parse_severity("INFO"), std::invalid_argument);
}
