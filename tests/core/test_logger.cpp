#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include "signal_ngin/core/logger.hpp"

using namespace signal_ngin;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Close any handle left by a previous test
        Logger::reset_for_tests();

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());
        original_cerr = std::cerr.rdbuf();
        std::cerr.rdbuf(cerr_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);
        std::cerr.rdbuf(original_cerr);

        Logger::reset_for_tests();

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
            return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
        });
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open())
            return "";
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig plain_config(LogDestination destination) {
        LoggerConfig config;
        config.destination = destination;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::streambuf* original_cerr;
    std::stringstream cout_buffer;
    std::stringstream cerr_buffer;
    const std::string test_log_dir = "signal_ngin_test_logs";
};

TEST_F(LoggerTest, FileHandlesClosedAfterReset) {
    Logger::instance().initialize(plain_config(LogDestination::FILE));
    Logger::reset_for_tests();

    std::error_code ec;
    std::filesystem::remove_all(test_log_dir, ec);
    EXPECT_FALSE(ec) << "Failed to delete directory: " << ec.message();
}

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.log_directory = test_log_dir + "/nested";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
}

TEST_F(LoggerTest, ConsoleSplitsErrorsToStderr) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::instance().log(LogLevel::INFO, "Poll complete");
    Logger::instance().log(LogLevel::ERR, "Analysis failed");

    EXPECT_EQ(cout_buffer.str(), "Poll complete\n");
    EXPECT_EQ(cerr_buffer.str(), "Analysis failed\n");
}

TEST_F(LoggerTest, LogsToBothDestinations) {
    Logger::instance().initialize(plain_config(LogDestination::BOTH));

    Logger::instance().log(LogLevel::INFO, "Both message");

    EXPECT_EQ(cout_buffer.str(), "Both message\n");
    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1);
    EXPECT_EQ(read_file(files[0]), "Both message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::DEBUG, "Debug");
    Logger::instance().log(LogLevel::INFO, "Info");
    Logger::instance().log(LogLevel::WARNING, "Warning");
    Logger::instance().log(LogLevel::ERR, "Error");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content.find("Debug"), std::string::npos);
    EXPECT_EQ(content.find("Info"), std::string::npos);
    EXPECT_NE(content.find("Warning\nError\n"), std::string::npos);
}

TEST_F(LoggerTest, StreamMacrosFormatLevelAndComponent) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.include_level = true;
    Logger::instance().initialize(config);

    Logger::register_component("CandleStore");
    WARN("Skipping stale observation for " << "WBTC" << " at " << 42);
    Logger::register_component("");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content, "[WARNING] [CandleStore] Skipping stale observation for WBTC at 42\n");
}

TEST_F(LoggerTest, ComponentTagIsPerThread) {
    Logger::instance().initialize(plain_config(LogDestination::FILE));

    std::thread worker([]() {
        Logger::register_component("FetchPool");
        INFO("from worker");
    });
    worker.join();
    INFO("from main");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_NE(content.find("[FetchPool] from worker\n"), std::string::npos);
    EXPECT_NE(content.find("\nfrom main\n"), std::string::npos);
}

TEST_F(LoggerTest, FileRotation) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 10;
    config.max_files = 2;
    Logger::instance().initialize(config);

    // "12345678\n" is 9 bytes, the second write crosses the limit
    Logger::instance().log(LogLevel::INFO, "12345678");
    Logger::instance().log(LogLevel::INFO, "12345678");

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2);
}

TEST_F(LoggerTest, MaxFilesEnforced) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 1;
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 3; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2);
}

TEST_F(LoggerTest, LogBeforeInitializationWarnsOnStderr) {
    Logger::instance().log(LogLevel::INFO, "Early");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_NE(cerr_buffer.str().find("Logger not initialized"), std::string::npos);
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, ConfigRoundTrip) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "signal_server";
    config.max_files = 9;

    LoggerConfig restored;
    restored.from_json(config.to_json());
    EXPECT_EQ(restored.min_level, LogLevel::DEBUG);
    EXPECT_EQ(restored.destination, LogDestination::BOTH);
    EXPECT_EQ(restored.filename_prefix, "signal_server");
    EXPECT_EQ(restored.max_files, 9u);

    // Unknown names keep the current value
    restored.from_json({{"min_level", "VERBOSE"}});
    EXPECT_EQ(restored.min_level, LogLevel::DEBUG);
}
