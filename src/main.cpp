#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "renderer.hpp"
#include "utils.hpp"
#include "window.hpp"
#include "world.hpp"

namespace {

/**
 * @brief Run-time settings gathered from the command line.
 */
struct RenderSettings {
    std::vector<std::string> scene_files;
    std::size_t width = Constant::WindowWidth;
    std::size_t height = Constant::WindowHeight;
    int frames = Constant::DefaultHeadlessFrames;
    std::string output = "render.ppm";
    bool headless = false;
    unsigned int threads = std::thread::hardware_concurrency();
    std::uint32_t seed = std::mt19937::default_seed;
};

constexpr std::string_view Usage =
    "<scene files...> [--frames N] [--output file.ppm] [--headless] [--threads N] [--seed N] "
    "[--size WxH]";

unsigned long ParseUnsigned(std::string_view flag, const std::string& value) {
    std::size_t consumed = 0;
    unsigned long result = 0;
    try {
        result = std::stoul(value, &consumed);
    } catch (const std::exception&) {
        consumed = 0;
    }
    if (consumed == 0 || consumed != value.size() || value.front() == '-') {
        throw std::runtime_error(std::format("Invalid value '{}' for {}", value, flag));
    }
    return result;
}

RenderSettings ParseArguments(int argc, char* argv[]) {
    RenderSettings settings;
    auto value_of = [&](int& i) -> std::string {
        if (i + 1 >= argc) throw std::runtime_error(std::format("Missing value for {}", argv[i]));
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--frames") {
            settings.frames = static_cast<int>(ParseUnsigned(arg, value_of(i)));
            if (settings.frames <= 0) throw std::runtime_error("--frames must be positive");
        } else if (arg == "--output") {
            settings.output = value_of(i);
        } else if (arg == "--headless") {
            settings.headless = true;
        } else if (arg == "--threads") {
            settings.threads = static_cast<unsigned int>(ParseUnsigned(arg, value_of(i)));
        } else if (arg == "--seed") {
            settings.seed = static_cast<std::uint32_t>(ParseUnsigned(arg, value_of(i)));
        } else if (arg == "--size") {
            std::string size = value_of(i);
            std::size_t x = size.find('x');
            if (x == std::string::npos) {
                throw std::runtime_error(std::format("Invalid value '{}' for --size", size));
            }
            settings.width = ParseUnsigned(arg, size.substr(0, x));
            settings.height = ParseUnsigned(arg, size.substr(x + 1));
            if (settings.width == 0 || settings.height == 0) {
                throw std::runtime_error("--size must be at least 1x1");
            }
        } else if (arg.starts_with("--")) {
            throw std::runtime_error(std::format("Unknown option {}", arg));
        } else {
            settings.scene_files.emplace_back(arg);
        }
    }
    if (settings.scene_files.empty()) throw std::runtime_error("No scene files given");
    return settings;
}

void RunHeadless(World& world, const RenderSettings& settings) {
    Renderer renderer(world, settings.width, settings.height, settings.threads);
    std::mt19937 rng(settings.seed);

    auto start = std::chrono::steady_clock::now();
    for (int frame = 0; frame < settings.frames; ++frame) {
        renderer.render_frame(Renderer::NextFrameInputs(world.camera_, world.light_, rng));
        if ((frame + 1) % 16 == 0 || frame + 1 == settings.frames) {
            std::cout << std::format(
                "[Renderer] {}/{} frames\n", renderer.sample_count(), settings.frames
            );
        }
    }
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    WritePPM(
        settings.output, settings.width, settings.height, renderer.to_argb(Constant::DefaultGamma)
    );
    std::cout << std::format(
        "[Renderer] Wrote {} ({}x{}, {} samples, {:#.3g} s)\n",
        settings.output,
        settings.width,
        settings.height,
        renderer.sample_count(),
        elapsed.count()
    );
}

void RunInteractive(World& world, const RenderSettings& settings) {
    Window window(settings.width, settings.height, "Path Tracer");
    Renderer renderer(world, settings.width, settings.height, settings.threads);
    std::mt19937 rng(settings.seed);
    FloatType gamma = Constant::DefaultGamma;
    Camera& camera = world.camera_;

    // Movement (WASD, Space/C)
    window.register_key(
        {SDL_SCANCODE_W,
         SDL_SCANCODE_S,
         SDL_SCANCODE_A,
         SDL_SCANCODE_D,
         SDL_SCANCODE_SPACE,
         SDL_SCANCODE_C},
        Window::Trigger::ANY_PRESSED,
        [&](const Window::KeyState& ks, float dt) {
            FloatType fwd = (ks[SDL_SCANCODE_W] ? 1.0f : 0.0f) - (ks[SDL_SCANCODE_S] ? 1.0f : 0.0f);
            FloatType right =
                (ks[SDL_SCANCODE_D] ? 1.0f : 0.0f) - (ks[SDL_SCANCODE_A] ? 1.0f : 0.0f);
            FloatType up =
                (ks[SDL_SCANCODE_SPACE] ? 1.0f : 0.0f) - (ks[SDL_SCANCODE_C] ? 1.0f : 0.0f);
            camera.move(
                fwd * Constant::MoveSpeed, right * Constant::MoveSpeed, up * Constant::MoveSpeed, dt
            );
        }
    );

    // Keyboard look (arrow keys)
    window.register_key(
        {SDL_SCANCODE_UP, SDL_SCANCODE_DOWN, SDL_SCANCODE_LEFT, SDL_SCANCODE_RIGHT},
        Window::Trigger::ANY_PRESSED,
        [&](const Window::KeyState& ks, float dt) {
            FloatType dx =
                (ks[SDL_SCANCODE_RIGHT] ? 1.0f : 0.0f) - (ks[SDL_SCANCODE_LEFT] ? 1.0f : 0.0f);
            FloatType dy =
                (ks[SDL_SCANCODE_UP] ? 1.0f : 0.0f) - (ks[SDL_SCANCODE_DOWN] ? 1.0f : 0.0f);
            camera.rotate(dx * Constant::RotateSpeed * dt, dy * Constant::RotateSpeed * dt);
        }
    );

    // Mouse look (left button drag moves the scene with the cursor)
    window.register_mouse(SDL_BUTTON_LEFT, [&](int xrel, int yrel) {
        camera.rotate(
            -static_cast<FloatType>(xrel) * Constant::MouseSensitivity,
            static_cast<FloatType>(yrel) * Constant::MouseSensitivity
        );
    });

    window.register_key(
        {SDL_SCANCODE_G}, Window::Trigger::ANY_JUST_PRESSED, [&](const Window::KeyState&, float) {
            gamma = (gamma == Constant::DefaultGamma) ? 1.0f : Constant::DefaultGamma;
            std::cout << std::format("[Renderer] Gamma: {:.1f}\n", gamma);
        }
    );

    // Screenshot save (Ctrl+S)
    window.register_key(
        {SDL_SCANCODE_LCTRL, SDL_SCANCODE_S},
        Window::Trigger::ALL_JUST_PRESSED,
        [&](const Window::KeyState&, float) {
            try {
                window.save_ppm("screenshot.ppm");
                window.save_bmp("screenshot.bmp");
                std::cout << "[Screenshot] Saved as screenshot.ppm and screenshot.bmp\n";
            } catch (const std::exception& e) {
                std::cerr << std::format("[Screenshot] {}\n", e.what());
            }
        }
    );

    std::uint32_t fps = 0;
    auto last_print = std::chrono::steady_clock::now();
    Camera last_camera = camera;

    while (true) {
        if (!window.process_events()) break;

        // Any pose change invalidates the running average
        if (camera.has_changed_since(last_camera)) {
            renderer.reset_accumulation();
            last_camera = camera;
        }

        renderer.render_frame(Renderer::NextFrameInputs(camera, world.light_, rng));
        for (std::size_t y = 0; y < settings.height; ++y) {
            for (std::size_t x = 0; x < settings.width; ++x) {
                window[{x, y}] = renderer.display_colour(x, y, gamma);
            }
        }
        window.update();

        // FPS counter
        fps++;
        auto now = std::chrono::steady_clock::now();
        std::chrono::duration<double> elapsed = now - last_print;
        if (elapsed >= std::chrono::seconds(1)) {
            std::cout << std::format(
                "[Renderer] FPS: {:#.3g} | Avg Frame Time: {:#.4g} ms | Samples: {}\n",
                static_cast<double>(fps) / elapsed.count(),
                std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count() /
                    static_cast<double>(fps),
                renderer.sample_count()
            );
            fps = 0;
            last_print = now;
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    RenderSettings settings;
    try {
        settings = ParseArguments(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << std::format("[Main] {}\n", e.what());
        std::cerr << "Usage: " << argv[0] << " " << Usage << std::endl;
        return EXIT_FAILURE;
    }

    try {
        // Load world assets from CLI arguments
        World world(settings.scene_files);
        world.camera_.set_aspect_ratio(
            static_cast<double>(settings.width) / static_cast<double>(settings.height)
        );

        if (settings.headless) {
            RunHeadless(world, settings);
        } else {
            RunInteractive(world, settings);
        }
    } catch (const std::exception& e) {
        std::cerr << std::format("[Main] {}\n", e.what());
        return EXIT_FAILURE;
    }
    return EXIT_SUCCESS;
}
