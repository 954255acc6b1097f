#pragma once
#include "world.hpp"

/**
 * @class RayTracer
 * @brief The per-pixel path tracing kernel.
 *
 * Every operation is a pure function of the read-only scene, the camera inputs and an
 * explicit PixelRandom state, so pixels can be evaluated in any order and on any number
 * of threads. The kernel supports:
 * - An infinite ground plane at y = 0
 * - Spheres with diffuse, specular, smoothness and emissive parameters
 * - Indexed triangle meshes with flat normals and a fixed mirror-like material
 * - A lat-long environment map for escaped rays
 * - Russian roulette selection between specular and diffuse bounces
 */
class RayTracer {
public:
    /**
     * @brief State handed from one bounce to the next.
     */
    struct Bounce {
        Ray ray;             ///< Ray for the next iteration; zero energy terminates the path.
        glm::vec3 emission;  ///< Radiance emitted at the current hit (or environment sample).
    };

public:
    /**
     * @brief Builds the primary ray for a normalized device coordinate.
     * @param camera Camera matrices.
     * @param uv Coordinate in [-1,1]^2.
     * @return Ray from the camera origin with unit energy.
     */
    [[nodiscard]] static Ray CreateCameraRay(const CameraParams& camera, const glm::vec2& uv) noexcept;

    /// @brief Tests the y = 0 plane; updates `best` when strictly closer.
    static void IntersectGroundPlane(const Ray& ray, RayHit& best) noexcept;

    /// @brief Tests one sphere; updates `best` when strictly closer.
    static void IntersectSphere(const Ray& ray, RayHit& best, const Sphere& sphere) noexcept;

    /**
     * @brief Maps a direction to lat-long environment coordinates.
     * @param direction Unit direction.
     * @return (phi, theta) with theta = acos(y) / -pi and phi = 0.5 * atan2(x, -z) / pi.
     */
    [[nodiscard]] static glm::vec2 DirectionToSpherical(const glm::vec3& direction) noexcept;

private:
    const World& world_;

public:
    explicit RayTracer(const World& world) noexcept;

public:
    /**
     * @brief Finds the closest hit among the ground plane, spheres and mesh triangles.
     * @param ray Ray to test.
     * @return Closest hit; distance is infinity when the ray escapes.
     */
    [[nodiscard]] RayHit trace(const Ray& ray) const noexcept;

    /// @brief Tests every triangle of one mesh object; updates `best` when strictly closer.
    void intersect_mesh_object(const Ray& ray, RayHit& best, const MeshObject& mesh) const noexcept;

    /**
     * @brief Evaluates the surface (or sky) at a hit and chooses the next bounce.
     *
     * The returned ray carries the updated energy; the caller weights the returned
     * emission by the energy the ray had before this call.
     *
     * @param ray Incoming ray.
     * @param hit Closest hit of `ray`.
     * @param rng Pixel random stream.
     * @return Next ray and emitted radiance.
     */
    [[nodiscard]] Bounce shade(const Ray& ray, const RayHit& hit, PixelRandom& rng) const noexcept;

    /**
     * @brief Integrates radiance for one camera sample over at most Constant::MaxBounces bounces.
     * @param camera Camera matrices.
     * @param uv Normalized device coordinate in [-1,1]^2.
     * @param rng Pixel random stream.
     * @return RGBA colour; RGB unclamped, alpha 1.
     */
    [[nodiscard]] glm::vec4 render_pixel(
        const CameraParams& camera, const glm::vec2& uv, PixelRandom& rng
    ) const noexcept;

    /**
     * @brief Same as render_pixel, starting from an explicit ray.
     * @param ray Primary ray.
     * @param rng Pixel random stream.
     * @param bounces_taken Optional out parameter receiving the loop iteration count.
     */
    [[nodiscard]] glm::vec4 integrate(
        Ray ray, PixelRandom& rng, int* bounces_taken = nullptr
    ) const noexcept;
};
