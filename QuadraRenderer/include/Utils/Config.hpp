// QuadraRenderer/include/Utils/Config.hpp
#pragma once

#include <Types.hpp>
#include <Constants.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace Quadra {

/**
 * @brief Configuration for the renderer and the demo application
 */
class Config {
public:
    struct WindowConfig {
        uint32_t width = Defaults::WINDOW_WIDTH;
        uint32_t height = Defaults::WINDOW_HEIGHT;
        std::string title = Defaults::WINDOW_TITLE;
        uint32_t target_fps = Defaults::TARGET_FPS;
        bool vsync = true;
        bool fullscreen = false;
        bool hidden = false;
        bool resizable = true;
    };

    struct RendererConfig {
        uint32_t internal_width = Defaults::INTERNAL_WIDTH;
        uint32_t internal_height = Defaults::INTERNAL_HEIGHT;
        size_t sprite_capacity = Defaults::SPRITE_CAPACITY;
        Color clear_color = Color::rgb(0.392f, 0.584f, 0.929f);
    };

    struct LoggingConfig {
        std::string log_level = "info";
        std::string log_file = Defaults::LOG_FILE;
        bool log_to_console = true;
        bool log_to_file = true;
        size_t max_log_file_size_mb = 10;
        uint32_t max_backup_files = 3;
    };

public:
    Config();
    ~Config() = default;

    // Serialization
    std::string saveToJson() const;

    // Command line parsing
    bool parseCommandLine(int argc, char* argv[]);
    void printUsage(const char* program_name) const;

    // Configuration access
    WindowConfig& window() { return m_window; }
    const WindowConfig& window() const { return m_window; }

    RendererConfig& renderer() { return m_renderer; }
    const RendererConfig& renderer() const { return m_renderer; }

    LoggingConfig& logging() { return m_logging; }
    const LoggingConfig& logging() const { return m_logging; }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

    std::string getConfigSummary() const;

private:
    friend class ConfigBuilder;

    WindowConfig m_window;
    RendererConfig m_renderer;
    LoggingConfig m_logging;

    void setDefaults();

    // Returns true when the option consumed the following value
    bool parseCommandLineArg(const std::string& arg, const std::string& value);
};

/**
 * @brief Builder pattern for easy configuration
 */
class ConfigBuilder {
public:
    ConfigBuilder();

    // Window configuration
    ConfigBuilder& withWindowSize(uint32_t width, uint32_t height);
    ConfigBuilder& withWindowTitle(const std::string& title);
    ConfigBuilder& withTargetFPS(uint32_t fps);
    ConfigBuilder& enableVSync(bool enabled = true);
    ConfigBuilder& enableFullscreen(bool enabled = true);
    ConfigBuilder& enableHiddenWindow(bool enabled = true);
    ConfigBuilder& enableResizable(bool enabled = true);

    // Renderer configuration
    ConfigBuilder& withInternalSize(uint32_t width, uint32_t height);
    ConfigBuilder& withSpriteCapacity(size_t capacity);
    ConfigBuilder& withClearColor(const Color& color);

    // Logging configuration
    ConfigBuilder& withLogLevel(const std::string& level);
    ConfigBuilder& withLogFile(const std::string& filename);
    ConfigBuilder& enableConsoleLogging(bool enabled = true);
    ConfigBuilder& enableFileLogging(bool enabled = true);

    // Build final configuration
    Config build() const;

private:
    Config m_config;
};

} // namespace Quadra
