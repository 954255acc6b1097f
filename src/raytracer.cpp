#include "raytracer.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

RayTracer::RayTracer(const World& world) noexcept : world_(world) {}

Ray RayTracer::CreateCameraRay(const CameraParams& camera, const glm::vec2& uv) noexcept {
    // Camera origin in world space
    glm::vec3 origin = glm::vec3(camera.camera_to_world * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));

    // Unproject the NDC point, then rotate into world space as a direction
    glm::vec3 direction = glm::vec3(camera.inverse_projection * glm::vec4(uv, 0.0f, 1.0f));
    direction = glm::vec3(camera.camera_to_world * glm::vec4(direction, 0.0f));
    direction = glm::normalize(direction);

    return Ray{.origin = origin, .direction = direction, .energy = glm::vec3(1.0f)};
}

void RayTracer::IntersectGroundPlane(const Ray& ray, RayHit& best) noexcept {
    // direction.y == 0 gives +-inf or NaN, both rejected by the comparisons below
    FloatType t = -ray.origin.y / ray.direction.y;
    if (t > 0.0f && t < best.distance) {
        best.distance = t;
        best.position = ray.origin + t * ray.direction;
        best.normal = glm::vec3(0.0f, 1.0f, 0.0f);
        best.albedo = glm::vec3(Constant::GroundAlbedo);
        best.specular = glm::vec3(Constant::GroundSpecular);
        best.smoothness = Constant::GroundSmoothness;
        best.emission = glm::vec3(0.0f);
    }
}

void RayTracer::IntersectSphere(const Ray& ray, RayHit& best, const Sphere& sphere) noexcept {
    glm::vec3 d = ray.origin - sphere.position;
    FloatType p1 = -glm::dot(ray.direction, d);
    FloatType p2sqr = p1 * p1 - glm::dot(d, d) + sphere.radius * sphere.radius;
    if (p2sqr < 0.0f) return;
    FloatType p2 = std::sqrt(p2sqr);
    // Near root when in front of the origin, otherwise the far root (origin inside)
    FloatType t = p1 - p2 > 0.0f ? p1 - p2 : p1 + p2;
    if (t > 0.0f && t < best.distance) {
        best.distance = t;
        best.position = ray.origin + t * ray.direction;
        best.normal = glm::normalize(best.position - sphere.position);
        best.albedo = sphere.albedo;
        best.specular = sphere.specular;
        best.smoothness = sphere.smoothness;
        best.emission = sphere.emission;
    }
}

void RayTracer::intersect_mesh_object(
    const Ray& ray, RayHit& best, const MeshObject& mesh
) const noexcept {
    const std::vector<glm::vec3>& vertices = world_.vertices_;
    const std::vector<std::uint32_t>& indices = world_.indices_;

    std::size_t begin = mesh.indices_offset;
    std::size_t end = begin + mesh.indices_count;
    // Never read past the shared index array, whatever the caller supplied
    end = std::min(end, indices.size());

    for (std::size_t i = begin; i + 2 < end; i += 3) {
        std::uint32_t i0 = indices[i];
        std::uint32_t i1 = indices[i + 1];
        std::uint32_t i2 = indices[i + 2];
        if (i0 >= vertices.size() || i1 >= vertices.size() || i2 >= vertices.size()) continue;

        glm::vec3 v0 = glm::vec3(mesh.local_to_world * glm::vec4(vertices[i0], 1.0f));
        glm::vec3 v1 = glm::vec3(mesh.local_to_world * glm::vec4(vertices[i1], 1.0f));
        glm::vec3 v2 = glm::vec3(mesh.local_to_world * glm::vec4(vertices[i2], 1.0f));

        FloatType t, u, v;
        if (!IntersectRayTriangle(ray.origin, ray.direction, v0, v1, v2, t, u, v)) continue;
        if (t > 0.0f && t < best.distance) {
            best.distance = t;
            best.position = ray.origin + t * ray.direction;
            best.normal = FaceNormal(v0, v1, v2);
            best.albedo = glm::vec3(Constant::MeshAlbedo);
            best.specular = glm::vec3(Constant::MeshSpecular);
            best.smoothness = Constant::MeshSmoothness;
            best.emission = glm::vec3(0.0f);
        }
    }
}

RayHit RayTracer::trace(const Ray& ray) const noexcept {
    RayHit best;
    IntersectGroundPlane(ray, best);
    for (const Sphere& sphere : world_.spheres_) {
        IntersectSphere(ray, best, sphere);
    }
    for (const MeshObject& mesh : world_.mesh_objects_) {
        intersect_mesh_object(ray, best, mesh);
    }
    return best;
}

glm::vec2 RayTracer::DirectionToSpherical(const glm::vec3& direction) noexcept {
    constexpr FloatType pi = std::numbers::pi_v<FloatType>;
    FloatType theta = std::acos(direction.y) / -pi;
    // 0 - z rather than -z: a zero z component becomes +0, so atan2(0, 0) gives phi = 0
    FloatType phi = 0.5f * std::atan2(direction.x, 0.0f - direction.z) / pi;
    return glm::vec2(phi, theta);
}

RayTracer::Bounce RayTracer::shade(
    const Ray& ray, const RayHit& hit, PixelRandom& rng
) const noexcept {
    Ray next = ray;

    // Escaped: the sky is the last contribution of this path
    if (hit.escaped()) {
        next.energy = glm::vec3(0.0f);
        glm::vec2 spherical = DirectionToSpherical(ray.direction);
        glm::vec3 sky = world_.env_map_.sample(spherical.x, spherical.y);
        return Bounce{.ray = next, .emission = sky * Constant::SkyboxIntensity};
    }

    // Diffuse and specular reflectance may not sum above one per channel
    glm::vec3 albedo = glm::min(glm::vec3(1.0f) - hit.specular, hit.albedo);
    FloatType spec_chance = ChannelAverage(hit.specular);
    FloatType diff_chance = ChannelAverage(albedo);

    FloatType roulette = rng.next();
    if (roulette < spec_chance) {
        // Specular: Phong lobe around the mirror direction
        FloatType alpha = SmoothnessToPhongAlpha(hit.smoothness);
        next.origin = hit.position + hit.normal * Constant::RayEpsilon;
        next.direction = SampleHemisphere(glm::reflect(ray.direction, hit.normal), alpha, rng);
        FloatType f = (alpha + 2.0f) / (alpha + 1.0f);
        next.energy *= (1.0f / spec_chance) * hit.specular *
                       Saturate(glm::dot(hit.normal, next.direction) * f);
    } else if (diff_chance > 0.0f && roulette < spec_chance + diff_chance) {
        // Diffuse: cosine-weighted hemisphere around the normal
        next.origin = hit.position + hit.normal * Constant::RayEpsilon;
        next.direction = SampleHemisphere(hit.normal, 1.0f, rng);
        next.energy *= (1.0f / diff_chance) * albedo;
    } else {
        // Absorbed
        next.energy = glm::vec3(0.0f);
    }

    return Bounce{.ray = next, .emission = hit.emission};
}

glm::vec4 RayTracer::integrate(Ray ray, PixelRandom& rng, int* bounces_taken) const noexcept {
    glm::vec3 result(0.0f);
    int bounce = 0;
    while (bounce < Constant::MaxBounces) {
        ++bounce;
        RayHit hit = trace(ray);
        Bounce next = shade(ray, hit, rng);
        result += ray.energy * next.emission;
        ray = next.ray;
        if (ray.energy == glm::vec3(0.0f)) break;
    }
    if (bounces_taken != nullptr) *bounces_taken = bounce;
    return glm::vec4(result, 1.0f);
}

glm::vec4 RayTracer::render_pixel(
    const CameraParams& camera, const glm::vec2& uv, PixelRandom& rng
) const noexcept {
    return integrate(CreateCameraRay(camera, uv), rng);
}
