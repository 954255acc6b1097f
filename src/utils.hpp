#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

#include "constants.hpp"

/**
 * @brief Write a PPM (P6 binary) image file.
 * @param path Output file path.
 * @param width Image width in pixels.
 * @param height Image height in pixels.
 * @param pixels Pixel data as ARGB 32-bit values, row-major from the top row.
 * @throws std::runtime_error if the file cannot be written.
 */
inline void WritePPM(
    const std::filesystem::path& path,
    std::size_t width,
    std::size_t height,
    const std::vector<std::uint32_t>& pixels
) {
    if (pixels.size() < width * height)
        throw std::runtime_error("Pixel buffer smaller than image: " + path.string());

    std::ofstream output_stream(path, std::ofstream::out | std::ofstream::binary);
    if (!output_stream.is_open())
        throw std::runtime_error("Could not open PPM file for writing: " + path.string());
    output_stream << "P6\n";
    output_stream << width << " " << height << "\n";
    output_stream << 255 << "\n";

    for (std::size_t i = 0; i < width * height; i++) {
        std::array<char, 3> rgb{
            {static_cast<char>((pixels[i] >> 16) & 0xFF),
             static_cast<char>((pixels[i] >> 8) & 0xFF),
             static_cast<char>((pixels[i] >> 0) & 0xFF)}
        };
        output_stream.write(rgb.data(), 3);
    }
    if (!output_stream)
        throw std::runtime_error("Failed while writing PPM file: " + path.string());
}

/**
 * @brief Computes a triangle face normal from three vertices.
 * @param v0 First vertex in world space.
 * @param v1 Second vertex in world space.
 * @param v2 Third vertex in world space.
 * @return Unit-length geometric normal (right-hand cross).
 */
inline glm::vec3 FaceNormal(
    const glm::vec3& v0, const glm::vec3& v1, const glm::vec3& v2
) noexcept {
    glm::vec3 edge1 = v1 - v0;
    glm::vec3 edge2 = v2 - v0;
    return glm::normalize(glm::cross(edge1, edge2));
}

/**
 * @brief Möller–Trumbore ray–triangle intersection with backface culling.
 *
 * Triangles whose determinant is below Constant::TriangleEpsilon (facing away from
 * the ray, or edge-on) are rejected. The returned distance is not range checked;
 * callers compare it against their current closest hit.
 *
 * @param ray_origin Ray origin in world space.
 * @param ray_dir Ray direction.
 * @param v0 Triangle vertex 0.
 * @param v1 Triangle vertex 1.
 * @param v2 Triangle vertex 2.
 * @param out_t Intersection distance along the ray.
 * @param out_u Barycentric coordinate for v1.
 * @param out_v Barycentric coordinate for v2.
 * @return True if the ray crosses the front face inside the barycentric bounds.
 */
inline bool IntersectRayTriangle(
    const glm::vec3& ray_origin,
    const glm::vec3& ray_dir,
    const glm::vec3& v0,
    const glm::vec3& v1,
    const glm::vec3& v2,
    FloatType& out_t,
    FloatType& out_u,
    FloatType& out_v
) noexcept {
    glm::vec3 edge1 = v1 - v0;
    glm::vec3 edge2 = v2 - v0;
    glm::vec3 pvec = glm::cross(ray_dir, edge2);
    FloatType det = glm::dot(edge1, pvec);
    // Negated form so a NaN determinant is culled as well
    if (!(det >= Constant::TriangleEpsilon)) return false;
    FloatType inv_det = 1.0f / det;
    glm::vec3 tvec = ray_origin - v0;
    FloatType u = glm::dot(tvec, pvec) * inv_det;
    if (u < 0.0f || u > 1.0f) return false;
    glm::vec3 qvec = glm::cross(tvec, edge1);
    FloatType v = glm::dot(ray_dir, qvec) * inv_det;
    if (v < 0.0f || u + v > 1.0f) return false;
    out_t = glm::dot(edge2, qvec) * inv_det;
    out_u = u;
    out_v = v;
    return true;
}

/// @brief Clamps a value to [0,1].
constexpr FloatType Saturate(FloatType value) noexcept { return std::clamp(value, 0.0f, 1.0f); }

/// @brief Mean of the three colour channels.
inline FloatType ChannelAverage(const glm::vec3& rgb) noexcept {
    return (rgb.x + rgb.y + rgb.z) / 3.0f;
}

/**
 * @brief Converts surface smoothness to a Phong lobe exponent.
 * @param smoothness Smoothness in [0,1].
 * @return Exponent 1000^(smoothness^2), in [1,1000].
 */
inline FloatType SmoothnessToPhongAlpha(FloatType smoothness) noexcept {
    return std::pow(Constant::PhongAlphaBase, smoothness * smoothness);
}

/**
 * @brief Deterministic per-pixel random stream.
 *
 * Each value is fract(sin(seed / 100 * dot(pixel, (12.9898, 78.233))) * 43758.5453) and
 * the seed advances by exactly one per draw. The state is a plain value owned by a
 * single pixel evaluation; nothing is shared between pixels.
 */
class PixelRandom {
private:
    glm::vec2 pixel_;
    FloatType seed_;

public:
    PixelRandom(const glm::vec2& pixel, FloatType seed) noexcept : pixel_(pixel), seed_(seed) {}

public:
    [[nodiscard]] const glm::vec2& pixel() const noexcept { return pixel_; }
    [[nodiscard]] FloatType seed() const noexcept { return seed_; }

    /**
     * @brief Draws the next value and advances the seed.
     * @return Pseudo-random float in [0,1).
     */
    FloatType next() noexcept {
        FloatType hash_input =
            seed_ / Constant::RandomSeedDivisor *
            glm::dot(pixel_, glm::vec2(Constant::RandomDotX, Constant::RandomDotY));
        FloatType value = glm::fract(std::sin(hash_input) * Constant::RandomScale);
        seed_ += 1.0f;
        // fract() can round up to exactly 1 for tiny negative inputs
        constexpr FloatType below_one = 1.0f - std::numeric_limits<FloatType>::epsilon() / 2.0f;
        return std::min(value, below_one);
    }
};

/**
 * @brief Builds an orthonormal frame whose third column is the given normal.
 * @param normal Unit normal.
 * @return Matrix with columns (tangent, binormal, normal).
 */
inline glm::mat3 TangentSpace(const glm::vec3& normal) noexcept {
    glm::vec3 helper =
        std::abs(normal.x) > 0.99f ? glm::vec3(0.0f, 0.0f, 1.0f) : glm::vec3(1.0f, 0.0f, 0.0f);
    glm::vec3 tangent = glm::normalize(glm::cross(normal, helper));
    glm::vec3 binormal = glm::normalize(glm::cross(normal, tangent));
    return glm::mat3(tangent, binormal, normal);
}

/**
 * @brief Samples a direction around `normal` with a power-cosine lobe.
 *
 * Draws two values: cos(theta) = u1^(1/(1+alpha)) and phi = 2*pi*u2. alpha = 0 gives a
 * uniform hemisphere, alpha = 1 a cosine-weighted one, larger values a narrower lobe.
 *
 * @param normal Lobe axis (unit length).
 * @param alpha Lobe exponent.
 * @param rng Pixel random stream.
 * @return World-space direction.
 */
inline glm::vec3 SampleHemisphere(
    const glm::vec3& normal, FloatType alpha, PixelRandom& rng
) noexcept {
    FloatType cos_theta = std::pow(rng.next(), 1.0f / (alpha + 1.0f));
    FloatType sin_theta = std::sqrt(std::max(0.0f, 1.0f - cos_theta * cos_theta));
    FloatType phi = 2.0f * std::numbers::pi_v<FloatType> * rng.next();
    glm::vec3 tangent_space_dir(
        std::cos(phi) * sin_theta, std::sin(phi) * sin_theta, cos_theta
    );
    return TangentSpace(normal) * tangent_space_dir;
}
