#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include "logger/logger.hpp"
#include "test_utils.hpp"

using namespace datastore::logging;

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path log_dir;
    std::filesystem::path log_file;

    void SetUp() override {
        log_dir = make_test_dir("logger_test");
        log_file = log_dir / "datastore-test.log";
        init_logging(log_file.string(), severity_level::trace);
    }

    void TearDown() override {
        boost::log::core::get()->flush();
        boost::log::core::get()->remove_all_sinks();
        enable_logging();
        std::filesystem::remove_all(log_dir);
    }

    bool log_contains(const std::string& text) {
        boost::log::core::get()->flush();
        return read_file(log_file).find(text) != std::string::npos;
    }
};

TEST_F(LoggerTest, WritesToFile) {
    LOG_INFO << "Task store opened";
    LOG_ERROR << "Task store unreachable";

    EXPECT_TRUE(log_contains("Task store opened"));
    EXPECT_TRUE(log_contains("Task store unreachable"));
    EXPECT_TRUE(log_contains("[error]"));
}

TEST_F(LoggerTest, StartupLineNamesLevel) {
    EXPECT_TRUE(log_contains("Logging initialized at level TRACE"));
}

TEST_F(LoggerTest, RecordsFromOtherThreads) {
    std::thread worker([]() {
        LOG_INFO << "Transfer worker message";
    });
    worker.join();

    EXPECT_TRUE(log_contains("Transfer worker message"));
}

TEST_F(LoggerTest, LevelFiltering) {
    set_log_level(severity_level::warning);

    LOG_DEBUG << "Filtered debug line";
    LOG_WARN << "Visible warning line";

    EXPECT_FALSE(log_contains("Filtered debug line"));
    EXPECT_TRUE(log_contains("Visible warning line"));
}

TEST_F(LoggerTest, EnableDisable) {
    disable_logging();
    LOG_INFO << "Suppressed line";

    enable_logging();
    LOG_INFO << "Restored line";

    EXPECT_FALSE(log_contains("Suppressed line"));
    EXPECT_TRUE(log_contains("Restored line"));
}

TEST(LoggerSeverityTest, ParsesKnownNames) {
    EXPECT_EQ(parse_severity("debug"), severity_level::debug);
    EXPECT_EQ(parse_severity("warning"), severity_level::warning);
    EXPECT_STREQ(datastore::logging::to_string(severity_level::error), "ERROR");
    EXPECT_THROW(parse_severity("loud"), std::invalid_argument);
}
