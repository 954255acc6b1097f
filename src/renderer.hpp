#pragma once
#include <atomic>
#include <barrier>
#include <random>
#include <stop_token>
#include <thread>
#include <vector>

#include "raytracer.hpp"
#include "world.hpp"

/**
 * @brief Inputs that change from frame to frame.
 */
struct FrameInputs {
    CameraParams camera;
    FloatType seed = 0.5f;  // Starting value of every pixel's random stream
};

/**
 * @brief Runs the path tracing kernel over the image on a worker pool and accumulates frames.
 */
class Renderer {
public:
    /**
     * @brief ACES filmic tone mapping curve (approximation).
     * @param hdr_value Input HDR component.
     * @return Mapped component in [0,1].
     */
    [[nodiscard]] static constexpr FloatType AcesToneMapping(FloatType hdr_value) noexcept {
        const FloatType a = 2.51f;
        const FloatType b = 0.03f;
        const FloatType c = 2.43f;
        const FloatType d = 0.59f;
        const FloatType e = 0.14f;
        FloatType numerator = hdr_value * (a * hdr_value + b);
        FloatType denominator = hdr_value * (c * hdr_value + d) + e;
        return std::clamp(numerator / denominator, 0.0f, 1.0f);
    }

    /**
     * @brief Converts HDR to displayable sRGB using ACES and gamma.
     * @param hdr Linear HDR colour.
     * @param gamma Output gamma (1.0 = none, 2.2 typical sRGB).
     * @return 8-bit colour.
     */
    [[nodiscard]] static Colour TonemapAndGammaCorrect(const glm::vec3& hdr, FloatType gamma) noexcept;

    /**
     * @brief Draws the next frame's seed and sub-pixel jitter.
     * @param camera Host camera providing the matrices.
     * @param light Directional light descriptor passed through to the kernel.
     * @param rng Generator owned by the caller; the sequence is reproducible per seed.
     */
    [[nodiscard]] static FrameInputs NextFrameInputs(
        const Camera& camera, const DirectionalLight& light, std::mt19937& rng
    );

    /**
     * @brief Normalized device coordinate of a pixel.
     * @param x Column.
     * @param y Row counted from the bottom of the image.
     * @param pixel_offset Sub-pixel jitter.
     * @param width Image width.
     * @param height Image height.
     * @return Coordinate in [-1,1]^2.
     */
    [[nodiscard]] static glm::vec2 PixelToUV(
        int x, int y, const glm::vec2& pixel_offset, std::size_t width, std::size_t height
    ) noexcept;

private:
    const std::size_t width_;
    const std::size_t height_;
    const unsigned int thread_count_;

    RayTracer raytracer_;
    ImageBuffer<glm::vec4> frame_image_;
    ImageBuffer<glm::vec4> accumulated_image_;
    int sample_count_ = 0;

    FrameInputs current_frame_;
    std::barrier<> frame_barrier_;
    std::atomic<int> tile_counter_ = 0;
    std::vector<std::jthread> workers_;

public:
    /**
     * @brief Constructs the renderer and launches its workers.
     * @param world Scene data; must outlive the renderer.
     * @param width Image width.
     * @param height Image height.
     * @param thread_count Worker threads (0 = one).
     */
    Renderer(
        const World& world,
        std::size_t width,
        std::size_t height,
        unsigned int thread_count = std::thread::hardware_concurrency()
    );

    ~Renderer();

public:
    [[nodiscard]] std::size_t width() const noexcept { return width_; }
    [[nodiscard]] std::size_t height() const noexcept { return height_; }
    [[nodiscard]] int sample_count() const noexcept { return sample_count_; }
    [[nodiscard]] const RayTracer& raytracer() const noexcept { return raytracer_; }

    /// @brief Kernel output of the most recent frame, row 0 at the top.
    [[nodiscard]] const ImageBuffer<glm::vec4>& frame_image() const noexcept { return frame_image_; }

    /// @brief Running average of every frame since the last reset.
    [[nodiscard]] const ImageBuffer<glm::vec4>& accumulated_image() const noexcept {
        return accumulated_image_;
    }

public:
    /// @brief Evaluates every pixel once and folds the result into the running average.
    void render_frame(const FrameInputs& frame) noexcept;
    void reset_accumulation() noexcept;

    [[nodiscard]] Colour display_colour(std::size_t x, std::size_t y, FloatType gamma) const noexcept;

    /// @brief Tone-mapped accumulated image as packed ARGB, row 0 at the top.
    [[nodiscard]] std::vector<std::uint32_t> to_argb(FloatType gamma) const;

private:
    /**
     * @brief Worker thread function for processing tiles.
     * @param st Stop token to allow cooperative cancellation.
     */
    void worker_thread(std::stop_token st) noexcept;

    void process_tile(int tile_x, int tile_y) noexcept;
};
