// QuadraRenderer/include/Utils/Logger.hpp
#pragma once

#include <cstdint>
#include <string>
#include <fstream>
#include <mutex>
#include <memory>
#include <sstream>
#include <utility>

namespace Quadra {

/**
 * @brief Thread-safe logger with console and file output
 *
 * Messages logged before initialize() are dropped.
 */
class Logger {
public:
    enum class Level {
        Debug = 0,
        Info = 1,
        Warning = 2,
        Error = 3
    };

    struct Config {
        Level log_level = Level::Info;
        bool log_to_console = true;
        bool log_to_file = true;
        std::string log_file = "quadra.log";
        bool flush_immediately = false;
        size_t max_file_size_mb = 100;
        uint32_t max_backup_files = 5;
    };

public:
    // Singleton access
    static Logger& getInstance();

    // Configuration
    static bool initialize();
    static bool initialize(const Config& config);
    static void shutdown();
    static bool isInitialized();
    static void setLevel(Level level);
    static Level getLevel();
    static bool parseLevel(const std::string& name, Level& level);

    // Logging methods
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);

    // Template logging; each {} is replaced by the next argument
    template<typename... Args>
    static void debug(const std::string& format, Args&&... args) {
        getInstance().log(Level::Debug, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void info(const std::string& format, Args&&... args) {
        getInstance().log(Level::Info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void warning(const std::string& format, Args&&... args) {
        getInstance().log(Level::Warning, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static void error(const std::string& format, Args&&... args) {
        getInstance().log(Level::Error, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    static std::string format(const std::string& pattern, Args&&... args) {
        std::string result;
        size_t position = 0;
        (appendArgument(result, pattern, position, std::forward<Args>(args)), ...);
        result.append(pattern, position, std::string::npos);
        return result;
    }

    // File management
    static void flush();
    static void rotateLogs();

private:
    Logger() = default;
    ~Logger();

    friend std::default_delete<Logger>;

    // Internal logging
    void log(Level level, const std::string& message);

    template<typename... Args>
    void log(Level level, const std::string& format_string, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        log(level, format(format_string, std::forward<Args>(args)...));
    }

    // Copies text up to the next {} and substitutes one argument for it
    template<typename T>
    static void appendArgument(std::string& result, const std::string& pattern,
                               size_t& position, T&& value) {
        size_t placeholder = pattern.find("{}", position);
        if (placeholder == std::string::npos) {
            return;
        }

        result.append(pattern, position, placeholder - position);

        std::ostringstream ss;
        ss << value;
        result += ss.str();

        position = placeholder + 2;
    }

    // Utilities
    bool isEnabled(Level level);
    std::string levelToString(Level level) const;
    std::string getCurrentTimestamp() const;
    void writeToConsole(Level level, const std::string& message);
    void writeToFile(const std::string& message);
    void rotateLocked();

private:
    static std::unique_ptr<Logger> s_instance;
    static std::mutex s_instance_mutex;

    Config m_config;
    std::ofstream m_log_file;
    std::mutex m_log_mutex;
    bool m_initialized = false;
    size_t m_current_file_size = 0;
};

// Convenience macros for common logging patterns
#define QUADRA_LOG_DEBUG(...) Quadra::Logger::debug(__VA_ARGS__)
#define QUADRA_LOG_INFO(...) Quadra::Logger::info(__VA_ARGS__)
#define QUADRA_LOG_WARNING(...) Quadra::Logger::warning(__VA_ARGS__)
#define QUADRA_LOG_ERROR(...) Quadra::Logger::error(__VA_ARGS__)

} // namespace Quadra
