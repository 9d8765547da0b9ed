// QuadraRenderer/src/main.cpp
#include <Core/RaylibDevice.hpp>
#include <Core/RenderContext.hpp>
#include <Graphics/Animation.hpp>
#include <Graphics/DrawParams.hpp>
#include <Graphics/Texture.hpp>
#include <Utils/Config.hpp>
#include <Utils/Logger.hpp>
#include <Utils/Timer.hpp>
#include <Constants.hpp>
#include <Types.hpp>

#include <atomic>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

using namespace Quadra;

namespace {

constexpr int TILE_SIZE = 16;
constexpr int TILE_COUNT = 4;

std::atomic<bool> g_stop_requested{false};

void printBanner() {
    std::cout << R"(
===============================================================================
                           QUADRA SPRITE RENDERER
                    Batched 2D drawing with pixel letterboxing
===============================================================================
    )" << std::endl;
}

void printVersion() {
    std::cout << "Quadra Sprite Renderer\n";
    std::cout << "Version: " << QUADRA_VERSION << "\n";
    std::cout << "Build Date: " << __DATE__ << " " << __TIME__ << "\n";

#if defined(__linux__)
    std::cout << "Platform: Linux\n";
#elif defined(__APPLE__)
    std::cout << "Platform: macOS\n";
#elif defined(_WIN32)
    std::cout << "Platform: Windows\n";
#else
    std::cout << "Platform: Unknown\n";
#endif

    std::cout << "Max sprites per batch: " << Limits::MAX_SPRITE_CAPACITY << "\n";
}

void signalHandler(int signal) {
    (void)signal;
    g_stop_requested = true;
}

void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

// Four 16x16 tiles in a row: a ring, a cross, a checker and a diamond,
// each tinted differently so the animation is visible
std::vector<uint8_t> buildSpritesheet() {
    const int width = TILE_SIZE * TILE_COUNT;
    const int height = TILE_SIZE;
    std::vector<uint8_t> pixels(static_cast<size_t>(width * height * 4), 0);

    const uint8_t tints[TILE_COUNT][3] = {
        {255, 214, 102}, {239, 71, 111}, {6, 214, 160}, {17, 138, 178}
    };

    for (int tile = 0; tile < TILE_COUNT; ++tile) {
        for (int y = 0; y < TILE_SIZE; ++y) {
            for (int x = 0; x < TILE_SIZE; ++x) {
                float dx = x - (TILE_SIZE - 1) / 2.0f;
                float dy = y - (TILE_SIZE - 1) / 2.0f;

                bool filled = false;
                switch (tile) {
                    case 0: {
                        float distance = std::sqrt(dx * dx + dy * dy);
                        filled = distance > 4.0f && distance < 7.5f;
                        break;
                    }
                    case 1:
                        filled = std::fabs(dx) < 2.0f || std::fabs(dy) < 2.0f;
                        break;
                    case 2:
                        filled = ((x / 4) + (y / 4)) % 2 == 0;
                        break;
                    default:
                        filled = std::fabs(dx) + std::fabs(dy) < 7.5f;
                        break;
                }

                size_t offset = static_cast<size_t>((y * width + tile * TILE_SIZE + x) * 4);
                if (filled) {
                    pixels[offset + 0] = tints[tile][0];
                    pixels[offset + 1] = tints[tile][1];
                    pixels[offset + 2] = tints[tile][2];
                    pixels[offset + 3] = 255;
                }
            }
        }
    }

    return pixels;
}

Logger::Config makeLoggerConfig(const Config& config) {
    Logger::Config log_config;
    if (!Logger::parseLevel(config.logging().log_level, log_config.log_level)) {
        log_config.log_level = Logger::Level::Info;
    }
    log_config.log_to_console = config.logging().log_to_console;
    log_config.log_to_file = config.logging().log_to_file;
    log_config.log_file = config.logging().log_file;
    log_config.max_file_size_mb = config.logging().max_log_file_size_mb;
    log_config.max_backup_files = config.logging().max_backup_files;
    return log_config;
}

int runDemo(const Config& config) {
    RaylibDevice::Config device_config;
    device_config.window_width = config.window().width;
    device_config.window_height = config.window().height;
    device_config.window_title = config.window().title;
    device_config.enable_vsync = config.window().vsync;
    device_config.fullscreen = config.window().fullscreen;
    device_config.hidden = config.window().hidden;
    device_config.resizable = config.window().resizable;

    RaylibDevice device(device_config);
    if (!device.initialize()) {
        std::cerr << "Failed to initialize graphics device" << std::endl;
        return 1;
    }

    RenderContext::Config context_config;
    context_config.internal_width = static_cast<int>(config.renderer().internal_width);
    context_config.internal_height = static_cast<int>(config.renderer().internal_height);
    context_config.window_width = device.getWindowWidth();
    context_config.window_height = device.getWindowHeight();
    context_config.sprite_capacity = config.renderer().sprite_capacity;

    {
        RenderContext context(device, context_config);

        Texture sheet = Texture::fromPixels(device, TILE_SIZE * TILE_COUNT, TILE_SIZE, buildSpritesheet());

        std::vector<Rectangle> frames = Rectangle::row(0.0f, 0.0f, TILE_SIZE, TILE_SIZE).take(TILE_COUNT);

        Animation animation(sheet, frames, 8);

        const double tick_interval = 1.0 / config.window().target_fps;
        const float internal_width = static_cast<float>(context.getInternalWidth());
        const float internal_height = static_cast<float>(context.getInternalHeight());

        Timer timer;
        timer.start();

        Logger::info("Demo running at {}x{} internal resolution", context.getInternalWidth(),
                     context.getInternalHeight());

        while (!g_stop_requested && !device.shouldClose()) {
            device.pollEvents();

            if (device.isWindowResized()) {
                context.setWindowSize(device.getWindowWidth(), device.getWindowHeight());
            }

            for (uint32_t ticks = timer.consumeTicks(tick_interval); ticks > 0; --ticks) {
                animation.tick();
            }

            context.clear(config.renderer().clear_color);

            // Tile the background with every frame of the sheet
            size_t index = 0;
            for (float y = 0.0f; y < internal_height; y += TILE_SIZE) {
                for (float x = 0.0f; x < internal_width; x += TILE_SIZE) {
                    const Rectangle& frame = frames[index++ % frames.size()];
                    context.draw(sheet, DrawParams::at(x, y)
                                            .setClip(frame)
                                            .setColor(Color::rgba(1.0f, 1.0f, 1.0f, 0.25f)));
                }
            }

            const float half_tile = TILE_SIZE / 2.0f;
            context.draw(animation, DrawParams::at(internal_width / 2.0f, internal_height / 2.0f)
                                        .setOrigin(Vec2(half_tile, half_tile))
                                        .setScale(Vec2(4.0f, 4.0f)));

            // Mirrored copy using a negative scale
            context.draw(animation, DrawParams::at(internal_width / 4.0f, internal_height / 2.0f)
                                        .setOrigin(Vec2(half_tile, half_tile))
                                        .setScale(Vec2(-2.0f, 2.0f)));

            context.present();
        }

        timer.stop();

        Logger::info("Presented {} frames in {} s", context.getFramesPresented(), timer.getElapsedSeconds());
        Logger::info("{}", context.getBatchReport());

        const auto& device_stats = device.getStats();
        Logger::info("Device: {} draw calls, {} buffer uploads, {} swaps, {} live textures, {} live buffers",
                     device_stats.draw_calls_issued, device_stats.buffer_uploads,
                     device_stats.frames_swapped, device_stats.live_textures, device_stats.live_buffers);

        device.deleteTexture(sheet.getHandle());
    }

    device.shutdown();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                Config().printUsage(argv[0]);
                return 0;
            }
            if (arg == "--version" || arg == "-v") {
                printVersion();
                return 0;
            }
        }

        printBanner();

        // Parse command line arguments on top of the defaults
        Config config = ConfigBuilder().build();
        if (!config.parseCommandLine(argc, argv)) {
            config.printUsage(argv[0]);
            return 1;
        }

        if (!Logger::initialize(makeLoggerConfig(config))) {
            std::cerr << "Failed to initialize logging system" << std::endl;
            return 1;
        }

        std::cout << config.getConfigSummary() << std::endl;
        Logger::debug("Effective configuration:\n{}", config.saveToJson());

        setupSignalHandlers();

        Logger::info("Quadra {} starting up", QUADRA_VERSION);
        int result = runDemo(config);
        Logger::info("Quadra stopped with code {}", result);

        Logger::shutdown();
        return result;

    } catch (const std::exception& e) {
        std::cerr << "\nFatal error: " << e.what() << std::endl;
        Logger::error("Fatal error: {}", e.what());
        Logger::shutdown();
        return 1;
    }
}
