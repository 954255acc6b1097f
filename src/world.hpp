#pragma once
#include <cstdint>
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

#include <glm/glm.hpp>

#include "utils.hpp"

/**
 * @brief 8-bit display colour, packed as ARGB.
 */
struct Colour {
    std::uint8_t red;
    std::uint8_t green;
    std::uint8_t blue;

    constexpr operator std::uint32_t() const {
        return (255u << 24) + (static_cast<std::uint32_t>(red) << 16) +
               (static_cast<std::uint32_t>(green) << 8) + blue;
    }
};

/**
 * @brief Row-major 2D image of texels.
 */
template <typename T>
class ImageBuffer {
private:
    std::size_t width_ = 0;
    std::size_t height_ = 0;
    std::vector<T> data_;

public:
    ImageBuffer() = default;
    ImageBuffer(std::size_t width, std::size_t height, T fill = T{})
        : width_(width), height_(height), data_(width * height, fill) {}
    ImageBuffer(std::size_t width, std::size_t height, std::vector<T> data)
        : width_(width), height_(height), data_(std::move(data)) {}

public:
    [[nodiscard]] std::size_t width() const noexcept { return width_; }
    [[nodiscard]] std::size_t height() const noexcept { return height_; }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }
    [[nodiscard]] const std::vector<T>& data() const noexcept { return data_; }

    [[nodiscard]] T& operator[](std::pair<std::size_t, std::size_t> xy) noexcept {
        return data_[xy.second * width_ + xy.first];
    }
    [[nodiscard]] const T& operator[](std::pair<std::size_t, std::size_t> xy) const noexcept {
        return data_[xy.second * width_ + xy.first];
    }

    void fill(const T& value) noexcept { std::fill(data_.begin(), data_.end(), value); }
};

/**
 * @brief Lat-long environment ("skybox") image, sampled bilinearly with wraparound.
 */
class EnvironmentMap {
public:
    /// @brief Builds a 1x1 map that returns the same radiance in every direction.
    [[nodiscard]] static EnvironmentMap Uniform(const glm::vec3& radiance);

private:
    ImageBuffer<glm::vec3> texels_;

public:
    EnvironmentMap() = default;

    /**
     * @brief Constructs a loaded environment map.
     * @param width Width in pixels.
     * @param height Height in pixels.
     * @param data Linear RGB texels, row-major. Row 0 is v = 0, the bottom of the
     *             image; v grows upward, so an upward sky ray reads the last rows.
     */
    EnvironmentMap(std::size_t width, std::size_t height, std::vector<glm::vec3> data);

public:
    [[nodiscard]] bool is_loaded() const noexcept {
        return texels_.width() > 0 && texels_.height() > 0;
    }
    [[nodiscard]] std::size_t width() const noexcept { return texels_.width(); }
    [[nodiscard]] std::size_t height() const noexcept { return texels_.height(); }

    /**
     * @brief Bilinear lookup with wraparound addressing on both axes.
     * @param u Horizontal coordinate; any real value, wrapped into [0,1).
     * @param v Vertical coordinate; any real value, wrapped into [0,1).
     * @return Linear RGB radiance, black when no map is loaded.
     */
    [[nodiscard]] glm::vec3 sample(FloatType u, FloatType v) const noexcept;

private:
    [[nodiscard]] const glm::vec3& texel(long x, long y) const noexcept;
};

struct Sphere {
    glm::vec3 position = glm::vec3(0.0f);
    FloatType radius = 1.0f;
    glm::vec3 albedo = glm::vec3(0.0f);
    glm::vec3 specular = glm::vec3(0.0f);
    FloatType smoothness = 0.0f;
    glm::vec3 emission = glm::vec3(0.0f);
};

/**
 * @brief A transformed window into the shared index array.
 *
 * Each consecutive index triple in [indices_offset, indices_offset + indices_count)
 * names one triangle in the shared vertex array.
 */
struct MeshObject {
    glm::mat4 local_to_world = glm::mat4(1.0f);
    std::uint32_t indices_offset = 0;
    std::uint32_t indices_count = 0;
};

struct Ray {
    glm::vec3 origin;
    glm::vec3 direction;
    glm::vec3 energy = glm::vec3(1.0f);  // Path throughput
};

struct RayHit {
    FloatType distance = std::numeric_limits<FloatType>::infinity();  // Infinity = escaped
    glm::vec3 position = glm::vec3(0.0f);
    glm::vec3 normal = glm::vec3(0.0f);
    glm::vec3 albedo = glm::vec3(0.0f);
    glm::vec3 specular = glm::vec3(0.0f);
    FloatType smoothness = 0.0f;
    glm::vec3 emission = glm::vec3(0.0f);

    [[nodiscard]] bool escaped() const noexcept {
        return distance == std::numeric_limits<FloatType>::infinity();
    }
};

/**
 * @brief Directional light descriptor. Accepted with the frame inputs but not read by shading.
 */
struct DirectionalLight {
    glm::vec3 direction = glm::vec3(0.0f, -1.0f, 0.0f);
    FloatType intensity = 1.0f;
};

/**
 * @brief Per-frame camera inputs to the path tracing kernel.
 */
struct CameraParams {
    glm::mat4 camera_to_world = glm::mat4(1.0f);
    glm::mat4 inverse_projection = glm::mat4(1.0f);
    glm::vec2 pixel_offset = glm::vec2(0.5f);  // Sub-pixel jitter in [0,1)^2
    DirectionalLight light;
};

/**
 * @brief Host-side fly camera that produces the kernel's camera matrices.
 */
class Camera {
public:
    glm::vec3 position_ = {0.0f, 2.0f, 10.0f};
    FloatType yaw_ = 0.0f;    // Horizontal rotation (around world Y axis)
    FloatType pitch_ = 0.0f;  // Vertical rotation (clamped to ±89 degrees)
    FloatType fov_ = Constant::DefaultFov;
    double aspect_ratio_ = 1.0;

public:
    void set_aspect_ratio(double aspect_ratio) noexcept { aspect_ratio_ = aspect_ratio; }
    [[nodiscard]] double aspect_ratio() const noexcept { return aspect_ratio_; }

public:
    /// @brief Columns are right, up and forward.
    [[nodiscard]] glm::mat3 orientation() const noexcept;
    [[nodiscard]] glm::vec3 forward() const noexcept;
    [[nodiscard]] glm::vec3 right() const noexcept;
    [[nodiscard]] glm::vec3 up() const noexcept;

    /// @brief View-to-world transform; the camera looks down its local -Z.
    [[nodiscard]] glm::mat4 camera_to_world() const noexcept;
    [[nodiscard]] glm::mat4 inverse_projection() const noexcept;

    [[nodiscard]] bool has_changed_since(const Camera& other) const noexcept;

    void rotate(FloatType delta_yaw, FloatType delta_pitch) noexcept;
    void move(
        FloatType forward_delta, FloatType right_delta, FloatType up_delta, FloatType dt
    ) noexcept;
};

/**
 * @brief Scene container: the read-only buffers shared by every pixel of a frame.
 */
class World {
public:
    std::vector<Sphere> spheres_;
    std::vector<MeshObject> mesh_objects_;
    std::vector<glm::vec3> vertices_;
    std::vector<std::uint32_t> indices_;
    EnvironmentMap env_map_;
    DirectionalLight light_;
    Camera camera_;

public:
    World() = default;

    /**
     * @brief Loads scene descriptions, OBJ meshes and environment images.
     * @param filenames Files dispatched by extension (.txt, .obj, .hdr/.png/.jpg).
     * @throws std::runtime_error on missing files, bad syntax or invalid buffers.
     */
    explicit World(const std::vector<std::string>& filenames);

public:
    /// @brief Checks buffer consistency; throws std::runtime_error on the first violation.
    void validate() const;

    [[nodiscard]] std::size_t triangle_count() const noexcept;

    /**
     * @brief Appends an OBJ mesh as one MeshObject.
     * @return Index of the new MeshObject.
     */
    std::size_t add_obj_mesh(const std::filesystem::path& path, const glm::mat4& local_to_world);

    /**
     * @brief Scatters non-overlapping spheres on the ground plane.
     * @param seed Seed for the placement and material generator.
     * @param count Maximum number of spheres to place.
     * @param radius_range Min and max radius.
     * @param placement_radius Spheres are centred within this distance of the origin.
     * @return Number of spheres actually placed.
     */
    std::size_t add_sphere_field(
        std::uint32_t seed,
        std::size_t count,
        glm::vec2 radius_range,
        FloatType placement_radius
    );

private:
    /**
     * @brief Parses a text scene description file.
     * @param path Path to the text file.
     * @param include_stack Canonical paths of the files currently being parsed.
     *
     * @note The text file can reference other files using relative paths.
     */
    void parse_txt(
        const std::filesystem::path& path, std::vector<std::filesystem::path>& include_stack
    );

    void load_env_map(const std::filesystem::path& path);
};
