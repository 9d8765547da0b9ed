#include <gtest/gtest.h>
#include <Utils/Logger.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace Quadra;

// ============================================================================
// Logger Tests
// ============================================================================

TEST(LoggerFormatTest, SubstitutesPlaceholdersInOrder) {
    EXPECT_EQ(Logger::format("{}x{} at {}", 320, 240, 1.5), "320x240 at 1.5");
    EXPECT_EQ(Logger::format("texture {}", std::string("sheet")), "texture sheet");
}

TEST(LoggerFormatTest, MissingArgumentsLeavePlaceholders) {
    EXPECT_EQ(Logger::format("{} and {}", 1), "1 and {}");
    EXPECT_EQ(Logger::format("no placeholders"), "no placeholders");
}

TEST(LoggerFormatTest, ExtraArgumentsAreIgnored) {
    EXPECT_EQ(Logger::format("only {}", 1, 2, 3), "only 1");
}

TEST(LoggerLevelTest, ParsesLevelNames) {
    Logger::Level level = Logger::Level::Error;

    ASSERT_TRUE(Logger::parseLevel("debug", level));
    EXPECT_EQ(level, Logger::Level::Debug);
    ASSERT_TRUE(Logger::parseLevel("warning", level));
    EXPECT_EQ(level, Logger::Level::Warning);

    EXPECT_FALSE(Logger::parseLevel("verbose", level));
    EXPECT_EQ(level, Logger::Level::Warning);
}

TEST(LoggerFileTest, WritesFilteredMessagesToFile) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "quadra_logger_test";
    std::filesystem::remove_all(dir);
    std::filesystem::path file = dir / "test.log";

    Logger::Config config;
    config.log_to_console = false;
    config.log_to_file = true;
    config.log_file = file.string();
    config.log_level = Logger::Level::Info;
    config.flush_immediately = true;

    ASSERT_TRUE(Logger::initialize(config));
    EXPECT_TRUE(Logger::isInitialized());

    Logger::debug("hidden {}", 1);
    Logger::info("Batch of {} sprites", 42);
    QUADRA_LOG_WARNING("capacity {} reached", 8191);

    Logger::shutdown();
    EXPECT_FALSE(Logger::isInitialized());

    std::ifstream in(file);
    ASSERT_TRUE(in.is_open());
    std::stringstream contents;
    contents << in.rdbuf();
    std::string text = contents.str();

    EXPECT_NE(text.find("[INFO] Batch of 42 sprites"), std::string::npos);
    EXPECT_NE(text.find("[WARN] capacity 8191 reached"), std::string::npos);
    EXPECT_EQ(text.find("hidden"), std::string::npos);

    in.close();
    std::filesystem::remove_all(dir);
}

TEST(LoggerFileTest, InitializesWithDefaultConfiguration) {
    Logger::Config defaults;
    std::filesystem::path file(defaults.log_file);

    ASSERT_TRUE(Logger::initialize());
    EXPECT_TRUE(Logger::isInitialized());
    EXPECT_EQ(Logger::getLevel(), Logger::Level::Info);

    Logger::shutdown();
    EXPECT_FALSE(Logger::isInitialized());

    EXPECT_TRUE(std::filesystem::exists(file));
    std::filesystem::remove(file);
}

TEST(LoggerFileTest, ConcurrentLoggingWhileChangingLevel) {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "quadra_logger_threads";
    std::filesystem::remove_all(dir);
    std::filesystem::path file = dir / "threads.log";

    Logger::Config config;
    config.log_to_console = false;
    config.log_to_file = true;
    config.log_file = file.string();
    config.log_level = Logger::Level::Warning;

    ASSERT_TRUE(Logger::initialize(config));

    const int thread_count = 4;
    const int messages_per_thread = 200;

    std::vector<std::thread> writers;
    for (int t = 0; t < thread_count; ++t) {
        writers.emplace_back([t, messages_per_thread]() {
            for (int i = 0; i < messages_per_thread; ++i) {
                Logger::warning("writer {} message {}", t, i);
                Logger::debug("writer {} detail {}", t, i);
            }
        });
    }

    std::thread toggler([]() {
        for (int i = 0; i < 100; ++i) {
            Logger::setLevel(i % 2 == 0 ? Logger::Level::Debug : Logger::Level::Warning);
        }
        Logger::setLevel(Logger::Level::Warning);
    });

    for (auto& writer : writers) {
        writer.join();
    }
    toggler.join();

    Logger::shutdown();

    std::ifstream in(file);
    ASSERT_TRUE(in.is_open());

    int warnings = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (line.find("[WARN] writer ") != std::string::npos) {
            warnings++;
        }
    }
    EXPECT_EQ(warnings, thread_count * messages_per_thread);

    in.close();
    std::filesystem::remove_all(dir);
}
