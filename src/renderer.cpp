#include "renderer.hpp"

#include <algorithm>

Colour Renderer::TonemapAndGammaCorrect(const glm::vec3& hdr, FloatType gamma) noexcept {
    FloatType r_ldr = AcesToneMapping(hdr.r * 0.6f);
    FloatType g_ldr = AcesToneMapping(hdr.g * 0.6f);
    FloatType b_ldr = AcesToneMapping(hdr.b * 0.6f);
    FloatType r_out, g_out, b_out;
    if (gamma == 1.0f) {
        r_out = r_ldr;
        g_out = g_ldr;
        b_out = b_ldr;
    } else {
        r_out = std::pow(r_ldr, 1.0f / gamma);
        g_out = std::pow(g_ldr, 1.0f / gamma);
        b_out = std::pow(b_ldr, 1.0f / gamma);
    }
    // NaN samples display as black instead of poisoning the cast
    auto to_byte = [](FloatType v) -> std::uint8_t {
        if (!(v > 0.0f)) return 0;
        return static_cast<std::uint8_t>(std::clamp(v * 255.0f, 0.0f, 255.0f));
    };
    return Colour{.red = to_byte(r_out), .green = to_byte(g_out), .blue = to_byte(b_out)};
}

FrameInputs Renderer::NextFrameInputs(
    const Camera& camera, const DirectionalLight& light, std::mt19937& rng
) {
    std::uniform_real_distribution<FloatType> unit(0.0f, 1.0f);
    FrameInputs frame;
    frame.camera.camera_to_world = camera.camera_to_world();
    frame.camera.inverse_projection = camera.inverse_projection();
    frame.camera.pixel_offset = glm::vec2(unit(rng), unit(rng));
    frame.camera.light = light;
    frame.seed = unit(rng);
    return frame;
}

glm::vec2 Renderer::PixelToUV(
    int x, int y, const glm::vec2& pixel_offset, std::size_t width, std::size_t height
) noexcept {
    glm::vec2 pixel(static_cast<FloatType>(x), static_cast<FloatType>(y));
    glm::vec2 size(static_cast<FloatType>(width), static_cast<FloatType>(height));
    return (pixel + pixel_offset) / size * 2.0f - 1.0f;
}

Renderer::Renderer(
    const World& world, std::size_t width, std::size_t height, unsigned int thread_count
)
    : width_(width),
      height_(height),
      thread_count_(std::max(thread_count, 1u)),
      raytracer_(world),
      frame_image_(width, height, glm::vec4(0.0f)),
      accumulated_image_(width, height, glm::vec4(0.0f)),
      frame_barrier_(static_cast<std::ptrdiff_t>(thread_count_) + 1) {
    // Launch worker threads for tiled rendering; barrier synchronizes frame boundaries
    workers_.reserve(thread_count_);
    for (unsigned int i = 0; i < thread_count_; ++i) {
        workers_.emplace_back([this](std::stop_token st) { this->worker_thread(st); });
    }
}

Renderer::~Renderer() {
    for (auto& w : workers_) {
        w.request_stop();
    }
    frame_barrier_.arrive_and_wait();
}

void Renderer::render_frame(const FrameInputs& frame) noexcept {
    current_frame_ = frame;
    tile_counter_.store(0, std::memory_order_relaxed);

    // Signal workers to start and wait for completion via barrier
    frame_barrier_.arrive_and_wait();  // Start signal
    frame_barrier_.arrive_and_wait();  // Completion wait
    ++sample_count_;
}

void Renderer::reset_accumulation() noexcept {
    accumulated_image_.fill(glm::vec4(0.0f));
    sample_count_ = 0;
}

Colour Renderer::display_colour(std::size_t x, std::size_t y, FloatType gamma) const noexcept {
    return TonemapAndGammaCorrect(glm::vec3(accumulated_image_[{x, y}]), gamma);
}

std::vector<std::uint32_t> Renderer::to_argb(FloatType gamma) const {
    std::vector<std::uint32_t> pixels(width_ * height_);
    for (std::size_t y = 0; y < height_; ++y) {
        for (std::size_t x = 0; x < width_; ++x) {
            pixels[y * width_ + x] = display_colour(x, y, gamma);
        }
    }
    return pixels;
}

void Renderer::process_tile(int tile_x, int tile_y) noexcept {
    const int w = static_cast<int>(width_);
    const int h = static_cast<int>(height_);

    int x0 = tile_x * Constant::TileSize;
    int y0 = tile_y * Constant::TileSize;
    int x1 = std::min(x0 + Constant::TileSize, w);
    int y1 = std::min(y0 + Constant::TileSize, h);

    // Weight of this frame in the running average
    const FloatType weight = 1.0f / static_cast<FloatType>(sample_count_ + 1);

    for (int row = y0; row < y1; ++row) {
        // The kernel counts rows from the bottom so +v points up
        const int y = h - 1 - row;
        for (int x = x0; x < x1; ++x) {
            glm::vec2 uv = PixelToUV(x, y, current_frame_.camera.pixel_offset, width_, height_);
            PixelRandom rng(
                glm::vec2(static_cast<FloatType>(x), static_cast<FloatType>(y)), current_frame_.seed
            );
            glm::vec4 colour = raytracer_.render_pixel(current_frame_.camera, uv, rng);

            std::pair<std::size_t, std::size_t> idx{
                static_cast<std::size_t>(x), static_cast<std::size_t>(row)
            };
            frame_image_[idx] = colour;
            glm::vec4& acc = accumulated_image_[idx];
            acc += (colour - acc) * weight;
        }
    }
}

void Renderer::worker_thread(std::stop_token st) noexcept {
    const int tiles_x = (static_cast<int>(width_) + Constant::TileSize - 1) / Constant::TileSize;
    const int tiles_y = (static_cast<int>(height_) + Constant::TileSize - 1) / Constant::TileSize;
    const int num_tiles = tiles_x * tiles_y;

    while (true) {
        // Wait for frame start signal
        frame_barrier_.arrive_and_wait();
        if (st.stop_requested()) break;

        while (true) {
            int tile_idx = tile_counter_.fetch_add(1, std::memory_order_relaxed);
            if (tile_idx >= num_tiles) break;
            process_tile(tile_idx % tiles_x, tile_idx / tiles_x);
        }

        // Signal frame completion
        frame_barrier_.arrive_and_wait();
    }
}
