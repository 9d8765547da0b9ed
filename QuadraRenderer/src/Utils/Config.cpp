// QuadraRenderer/src/Utils/Config.cpp
#include <Utils/Config.hpp>
#include <iostream>
#include <sstream>
#include <algorithm>
#include <stdexcept>

namespace Quadra {

namespace {

const char* boolToJson(bool value) {
    return value ? "true" : "false";
}

std::string escapeJson(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\t': escaped += "\\t"; break;
            default: escaped += c; break;
        }
    }
    return escaped;
}

uint32_t parseUnsigned(const std::string& arg, const std::string& value) {
    int parsed = std::stoi(value);
    if (parsed < 0) {
        throw std::out_of_range(arg + " must not be negative");
    }
    return static_cast<uint32_t>(parsed);
}

} // namespace

Config::Config() {
    setDefaults();
}

void Config::setDefaults() {
    // Window defaults
    m_window.width = Defaults::WINDOW_WIDTH;
    m_window.height = Defaults::WINDOW_HEIGHT;
    m_window.title = Defaults::WINDOW_TITLE;
    m_window.target_fps = Defaults::TARGET_FPS;
    m_window.vsync = true;
    m_window.fullscreen = false;
    m_window.hidden = false;
    m_window.resizable = true;

    // Renderer defaults
    m_renderer.internal_width = Defaults::INTERNAL_WIDTH;
    m_renderer.internal_height = Defaults::INTERNAL_HEIGHT;
    m_renderer.sprite_capacity = Defaults::SPRITE_CAPACITY;
    m_renderer.clear_color = Color::rgb(0.392f, 0.584f, 0.929f);

    // Logging defaults
    m_logging.log_level = "info";
    m_logging.log_file = Defaults::LOG_FILE;
    m_logging.log_to_console = true;
    m_logging.log_to_file = true;
    m_logging.max_log_file_size_mb = 10;
    m_logging.max_backup_files = 3;
}

std::string Config::saveToJson() const {
    std::stringstream ss;
    ss << "{\n";
    ss << "  \"window\": {\n";
    ss << "    \"width\": " << m_window.width << ",\n";
    ss << "    \"height\": " << m_window.height << ",\n";
    ss << "    \"title\": \"" << escapeJson(m_window.title) << "\",\n";
    ss << "    \"target_fps\": " << m_window.target_fps << ",\n";
    ss << "    \"vsync\": " << boolToJson(m_window.vsync) << ",\n";
    ss << "    \"fullscreen\": " << boolToJson(m_window.fullscreen) << ",\n";
    ss << "    \"hidden\": " << boolToJson(m_window.hidden) << ",\n";
    ss << "    \"resizable\": " << boolToJson(m_window.resizable) << "\n";
    ss << "  },\n";
    ss << "  \"renderer\": {\n";
    ss << "    \"internal_width\": " << m_renderer.internal_width << ",\n";
    ss << "    \"internal_height\": " << m_renderer.internal_height << ",\n";
    ss << "    \"sprite_capacity\": " << m_renderer.sprite_capacity << ",\n";
    ss << "    \"clear_color\": [" << m_renderer.clear_color.r << ", " << m_renderer.clear_color.g
       << ", " << m_renderer.clear_color.b << ", " << m_renderer.clear_color.a << "]\n";
    ss << "  },\n";
    ss << "  \"logging\": {\n";
    ss << "    \"log_level\": \"" << escapeJson(m_logging.log_level) << "\",\n";
    ss << "    \"log_file\": \"" << escapeJson(m_logging.log_file) << "\",\n";
    ss << "    \"log_to_console\": " << boolToJson(m_logging.log_to_console) << ",\n";
    ss << "    \"log_to_file\": " << boolToJson(m_logging.log_to_file) << ",\n";
    ss << "    \"max_log_file_size_mb\": " << m_logging.max_log_file_size_mb << ",\n";
    ss << "    \"max_backup_files\": " << m_logging.max_backup_files << "\n";
    ss << "  }\n";
    ss << "}\n";
    return ss.str();
}

bool Config::parseCommandLine(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;

        if (i + 1 < argc) {
            value = argv[i + 1];
        }

        try {
            if (parseCommandLineArg(arg, value)) {
                if (i + 1 >= argc) {
                    std::cerr << "Missing value for option: " << arg << std::endl;
                    return false;
                }
                ++i; // Skip value argument
            }
        } catch (const std::invalid_argument&) {
            std::cerr << "Invalid value for " << arg << ": '" << value << "'" << std::endl;
            return false;
        } catch (const std::out_of_range&) {
            std::cerr << "Value out of range for " << arg << ": '" << value << "'" << std::endl;
            return false;
        } catch (const std::runtime_error& e) {
            std::cerr << e.what() << std::endl;
            return false;
        }
    }

    return validate();
}

bool Config::parseCommandLineArg(const std::string& arg, const std::string& value) {
    if (arg == "--width") {
        m_window.width = parseUnsigned(arg, value);
        return true;
    }
    else if (arg == "--height") {
        m_window.height = parseUnsigned(arg, value);
        return true;
    }
    else if (arg == "--title") {
        m_window.title = value;
        return true;
    }
    else if (arg == "--fps") {
        m_window.target_fps = parseUnsigned(arg, value);
        return true;
    }
    else if (arg == "--internal-width") {
        m_renderer.internal_width = parseUnsigned(arg, value);
        return true;
    }
    else if (arg == "--internal-height") {
        m_renderer.internal_height = parseUnsigned(arg, value);
        return true;
    }
    else if (arg == "--capacity") {
        m_renderer.sprite_capacity = parseUnsigned(arg, value);
        return true;
    }
    else if (arg == "--log-level") {
        m_logging.log_level = value;
        return true;
    }
    else if (arg == "--log-file") {
        m_logging.log_file = value;
        return true;
    }
    // Boolean flags (no value)
    else if (arg == "--fullscreen") {
        m_window.fullscreen = true;
        return false;
    }
    else if (arg == "--hidden") {
        m_window.hidden = true;
        return false;
    }
    else if (arg == "--no-vsync") {
        m_window.vsync = false;
        return false;
    }
    else if (arg == "--fixed-size") {
        m_window.resizable = false;
        return false;
    }
    else if (arg == "--no-log-file") {
        m_logging.log_to_file = false;
        return false;
    }
    else if (arg == "--debug") {
        m_logging.log_level = "debug";
        return false;
    }

    throw std::runtime_error("Unknown option: " + arg);
}

void Config::printUsage(const char* program_name) const {
    std::cout << "Usage: " << program_name << " [options]\n\n";
    std::cout << "Window Options:\n";
    std::cout << "  --width <pixels>            Window width (default: " << Defaults::WINDOW_WIDTH << ")\n";
    std::cout << "  --height <pixels>           Window height (default: " << Defaults::WINDOW_HEIGHT << ")\n";
    std::cout << "  --title <text>              Window title (default: " << Defaults::WINDOW_TITLE << ")\n";
    std::cout << "  --fps <rate>                Target FPS (default: " << Defaults::TARGET_FPS << ")\n";
    std::cout << "  --fullscreen                Start fullscreen\n";
    std::cout << "  --hidden                    Start hidden\n";
    std::cout << "  --no-vsync                  Disable VSync\n";
    std::cout << "  --fixed-size                Disable window resizing\n\n";

    std::cout << "Renderer Options:\n";
    std::cout << "  --internal-width <pixels>   Internal width (default: " << Defaults::INTERNAL_WIDTH << ")\n";
    std::cout << "  --internal-height <pixels>  Internal height (default: " << Defaults::INTERNAL_HEIGHT << ")\n";
    std::cout << "  --capacity <sprites>        Sprites per batch, " << Limits::MIN_SPRITE_CAPACITY
              << ".." << Limits::MAX_SPRITE_CAPACITY << " (default: " << Defaults::SPRITE_CAPACITY << ")\n\n";

    std::cout << "Logging Options:\n";
    std::cout << "  --log-level <level>         Log level (debug|info|warning|error)\n";
    std::cout << "  --log-file <path>           Log file path (default: " << Defaults::LOG_FILE << ")\n";
    std::cout << "  --no-log-file               Disable file logging\n";
    std::cout << "  --debug                     Enable debug logging\n\n";
}

bool Config::validate() const {
    std::vector<std::string> errors = getValidationErrors();

    if (!errors.empty()) {
        std::cerr << "Configuration validation errors:\n";
        for (const auto& error : errors) {
            std::cerr << "  - " << error << "\n";
        }
        return false;
    }

    return true;
}

std::vector<std::string> Config::getValidationErrors() const {
    std::vector<std::string> errors;

    // Window validation
    if (m_window.width == 0 || m_window.height == 0 ||
        m_window.width > Limits::MAX_SURFACE_SIZE || m_window.height > Limits::MAX_SURFACE_SIZE) {
        errors.push_back("Window size must be between 1x1 and " + std::to_string(Limits::MAX_SURFACE_SIZE) +
                         "x" + std::to_string(Limits::MAX_SURFACE_SIZE));
    }

    if (m_window.target_fps < Limits::MIN_FPS || m_window.target_fps > Limits::MAX_FPS) {
        errors.push_back("Target FPS must be between " + std::to_string(Limits::MIN_FPS) +
                        " and " + std::to_string(Limits::MAX_FPS));
    }

    // Renderer validation
    if (m_renderer.internal_width < Limits::MIN_INTERNAL_SIZE ||
        m_renderer.internal_height < Limits::MIN_INTERNAL_SIZE ||
        m_renderer.internal_width > Limits::MAX_SURFACE_SIZE ||
        m_renderer.internal_height > Limits::MAX_SURFACE_SIZE) {
        errors.push_back("Internal resolution must be between 1x1 and " +
                         std::to_string(Limits::MAX_SURFACE_SIZE) + "x" +
                         std::to_string(Limits::MAX_SURFACE_SIZE));
    }

    if (m_renderer.sprite_capacity < Limits::MIN_SPRITE_CAPACITY ||
        m_renderer.sprite_capacity > Limits::MAX_SPRITE_CAPACITY) {
        errors.push_back("Sprite capacity must be between " + std::to_string(Limits::MIN_SPRITE_CAPACITY) +
                         " and " + std::to_string(Limits::MAX_SPRITE_CAPACITY));
    }

    // Logging validation
    std::vector<std::string> valid_levels = {"debug", "info", "warning", "error"};
    if (std::find(valid_levels.begin(), valid_levels.end(), m_logging.log_level) == valid_levels.end()) {
        errors.push_back("Invalid log level: " + m_logging.log_level);
    }

    if (m_logging.log_to_file && m_logging.log_file.empty()) {
        errors.push_back("Log file path must not be empty when file logging is enabled");
    }

    return errors;
}

std::string Config::getConfigSummary() const {
    std::stringstream ss;
    ss << "Configuration Summary:\n";
    ss << "  Window: " << m_window.width << "x" << m_window.height
       << " @ " << m_window.target_fps << "fps"
       << (m_window.fullscreen ? ", fullscreen" : "")
       << (m_window.vsync ? ", vsync" : "") << "\n";
    ss << "  Renderer: " << m_renderer.internal_width << "x" << m_renderer.internal_height
       << " internal, " << m_renderer.sprite_capacity << " sprites per batch\n";
    ss << "  Logging: " << m_logging.log_level;
    if (m_logging.log_to_file) {
        ss << " -> " << m_logging.log_file;
    }
    ss << "\n";
    return ss.str();
}

// ConfigBuilder implementation
ConfigBuilder::ConfigBuilder() = default;

ConfigBuilder& ConfigBuilder::withWindowSize(uint32_t width, uint32_t height) {
    m_config.m_window.width = width;
    m_config.m_window.height = height;
    return *this;
}

ConfigBuilder& ConfigBuilder::withWindowTitle(const std::string& title) {
    m_config.m_window.title = title;
    return *this;
}

ConfigBuilder& ConfigBuilder::withTargetFPS(uint32_t fps) {
    m_config.m_window.target_fps = fps;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableVSync(bool enabled) {
    m_config.m_window.vsync = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableFullscreen(bool enabled) {
    m_config.m_window.fullscreen = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableHiddenWindow(bool enabled) {
    m_config.m_window.hidden = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableResizable(bool enabled) {
    m_config.m_window.resizable = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::withInternalSize(uint32_t width, uint32_t height) {
    m_config.m_renderer.internal_width = width;
    m_config.m_renderer.internal_height = height;
    return *this;
}

ConfigBuilder& ConfigBuilder::withSpriteCapacity(size_t capacity) {
    m_config.m_renderer.sprite_capacity = capacity;
    return *this;
}

ConfigBuilder& ConfigBuilder::withClearColor(const Color& color) {
    m_config.m_renderer.clear_color = color;
    return *this;
}

ConfigBuilder& ConfigBuilder::withLogLevel(const std::string& level) {
    m_config.m_logging.log_level = level;
    return *this;
}

ConfigBuilder& ConfigBuilder::withLogFile(const std::string& filename) {
    m_config.m_logging.log_file = filename;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableConsoleLogging(bool enabled) {
    m_config.m_logging.log_to_console = enabled;
    return *this;
}

ConfigBuilder& ConfigBuilder::enableFileLogging(bool enabled) {
    m_config.m_logging.log_to_file = enabled;
    return *this;
}

Config ConfigBuilder::build() const {
    return m_config;
}

} // namespace Quadra
