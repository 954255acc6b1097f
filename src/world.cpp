#include "world.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>

#include <glm/gtc/matrix_transform.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace {

/**
 * @brief Reads every value of a directive or throws with file/line context.
 */
template <typename... Ts>
void ReadDirective(
    std::istringstream& iss,
    const std::filesystem::path& path,
    std::size_t line_number,
    const std::string& directive,
    Ts&... values
) {
    if (!((iss >> values) && ...)) {
        throw std::runtime_error(std::format(
            "{}:{}: malformed '{}' directive", path.string(), line_number, directive
        ));
    }
}

/**
 * @brief Resolves the vertex part of an OBJ face token ("v", "v/vt", "v//vn", "v/vt/vn").
 * @param token Face token.
 * @param vertex_count Vertices defined so far in the file (for negative indices).
 * @return Zero-based vertex index, or -1 when the token has no usable vertex index.
 */
long ParseVertexIndex(const std::string& token, std::size_t vertex_count) {
    std::string head = token.substr(0, token.find('/'));
    if (head.empty()) return -1;
    long index = 0;
    try {
        index = std::stol(head);
    } catch (const std::exception&) {
        return -1;
    }
    if (index > 0) return index - 1;
    if (index < 0) return static_cast<long>(vertex_count) + index;
    return -1;
}

glm::vec3 ClampColour(const glm::vec3& c) noexcept {
    return glm::clamp(c, glm::vec3(0.0f), glm::vec3(1.0f));
}

}  // namespace

EnvironmentMap EnvironmentMap::Uniform(const glm::vec3& radiance) {
    return EnvironmentMap(1, 1, std::vector<glm::vec3>{radiance});
}

EnvironmentMap::EnvironmentMap(std::size_t width, std::size_t height, std::vector<glm::vec3> data)
    : texels_(width, height, std::move(data)) {}

const glm::vec3& EnvironmentMap::texel(long x, long y) const noexcept {
    const long w = static_cast<long>(texels_.width());
    const long h = static_cast<long>(texels_.height());
    std::size_t wx = static_cast<std::size_t>(((x % w) + w) % w);
    std::size_t wy = static_cast<std::size_t>(((y % h) + h) % h);
    return texels_[{wx, wy}];
}

glm::vec3 EnvironmentMap::sample(FloatType u, FloatType v) const noexcept {
    if (!is_loaded()) return glm::vec3(0.0f);
    if (!std::isfinite(u) || !std::isfinite(v)) return glm::vec3(0.0f);

    // Texel centres sit at (i + 0.5) / size
    u = u - std::floor(u);
    v = v - std::floor(v);
    FloatType x = u * static_cast<FloatType>(texels_.width()) - 0.5f;
    FloatType y = v * static_cast<FloatType>(texels_.height()) - 0.5f;
    FloatType x0 = std::floor(x);
    FloatType y0 = std::floor(y);
    FloatType tx = x - x0;
    FloatType ty = y - y0;
    long ix = static_cast<long>(x0);
    long iy = static_cast<long>(y0);

    glm::vec3 top = glm::mix(texel(ix, iy), texel(ix + 1, iy), tx);
    glm::vec3 bottom = glm::mix(texel(ix, iy + 1), texel(ix + 1, iy + 1), tx);
    return glm::mix(top, bottom, ty);
}

glm::mat3 Camera::orientation() const noexcept {
    glm::vec3 f = forward();
    glm::vec3 world_up(0.0f, 1.0f, 0.0f);
    glm::vec3 r = glm::normalize(glm::cross(f, world_up));
    glm::vec3 u = glm::normalize(glm::cross(r, f));
    glm::mat3 o;
    o[0] = r;
    o[1] = u;
    o[2] = f;
    return o;
}

glm::vec3 Camera::forward() const noexcept {
    FloatType cos_pitch = std::cos(pitch_);
    FloatType sin_pitch = std::sin(pitch_);
    FloatType cos_yaw = std::cos(yaw_);
    FloatType sin_yaw = std::sin(yaw_);
    return glm::vec3(sin_yaw * cos_pitch, sin_pitch, -cos_yaw * cos_pitch);
}

glm::vec3 Camera::right() const noexcept { return orientation()[0]; }

glm::vec3 Camera::up() const noexcept { return orientation()[1]; }

glm::mat4 Camera::camera_to_world() const noexcept {
    glm::mat3 o = orientation();
    glm::mat4 m(1.0f);
    m[0] = glm::vec4(o[0], 0.0f);
    m[1] = glm::vec4(o[1], 0.0f);
    m[2] = glm::vec4(-o[2], 0.0f);
    m[3] = glm::vec4(position_, 1.0f);
    return m;
}

glm::mat4 Camera::inverse_projection() const noexcept {
    glm::mat4 projection = glm::perspective(
        glm::radians(fov_),
        static_cast<FloatType>(aspect_ratio_),
        Constant::NearPlane,
        Constant::FarPlane
    );
    return glm::inverse(projection);
}

bool Camera::has_changed_since(const Camera& other) const noexcept {
    return glm::length(position_ - other.position_) > 1e-6f ||
           std::abs(yaw_ - other.yaw_) > 1e-6f || std::abs(pitch_ - other.pitch_) > 1e-6f ||
           fov_ != other.fov_ || aspect_ratio_ != other.aspect_ratio_;
}

void Camera::rotate(FloatType delta_yaw, FloatType delta_pitch) noexcept {
    yaw_ += delta_yaw;
    pitch_ += delta_pitch;
    pitch_ = std::clamp(pitch_, -Constant::MaxPitch, Constant::MaxPitch);
}

void Camera::move(
    FloatType forward_delta, FloatType right_delta, FloatType up_delta, FloatType dt
) noexcept {
    position_ += forward() * (forward_delta * dt);
    position_ += right() * (right_delta * dt);
    position_ += up() * (up_delta * dt);
}

World::World(const std::vector<std::string>& filenames) {
    // Scene ingestion: dispatch each file by extension, then validate the merged buffers
    for (const auto& filename : filenames) {
        std::filesystem::path path(filename);
        if (!std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("File does not exist: " + filename);
        }
        std::string ext = path.extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        if (ext == ".txt") {
            std::vector<std::filesystem::path> include_stack;
            parse_txt(path, include_stack);
        } else if (ext == ".obj") {
            add_obj_mesh(path, glm::mat4(1.0f));
        } else if (ext == ".hdr" || ext == ".png" || ext == ".jpg" || ext == ".jpeg") {
            load_env_map(path);
        } else {
            throw std::runtime_error("Unsupported file format: " + filename);
        }
    }
    validate();

    std::cout << std::format(
        "[World] Scene loaded: Sphere: {} | Mesh Object: {} | Vertex: {} | Triangle: {} | "
        "Environment: {}\n",
        spheres_.size(),
        mesh_objects_.size(),
        vertices_.size(),
        triangle_count(),
        env_map_.is_loaded()
    );
}

void World::validate() const {
    for (std::size_t i = 0; i < spheres_.size(); ++i) {
        if (!(spheres_[i].radius >= 0.0f)) {
            throw std::runtime_error(std::format("Sphere {} has a negative radius", i));
        }
    }
    for (std::size_t i = 0; i < mesh_objects_.size(); ++i) {
        const MeshObject& mesh = mesh_objects_[i];
        std::size_t end = static_cast<std::size_t>(mesh.indices_offset) +
                          static_cast<std::size_t>(mesh.indices_count);
        if (end > indices_.size()) {
            throw std::runtime_error(std::format(
                "Mesh object {} index range [{}, {}) exceeds index buffer of {}",
                i,
                mesh.indices_offset,
                end,
                indices_.size()
            ));
        }
        if (mesh.indices_count % 3 != 0) {
            throw std::runtime_error(std::format(
                "Mesh object {} index count {} is not a multiple of 3", i, mesh.indices_count
            ));
        }
        for (std::size_t k = mesh.indices_offset; k < end; ++k) {
            if (indices_[k] >= vertices_.size()) {
                throw std::runtime_error(std::format(
                    "Mesh object {} references vertex {} of {}", i, indices_[k], vertices_.size()
                ));
            }
        }
    }
}

std::size_t World::triangle_count() const noexcept {
    std::size_t count = 0;
    for (const auto& mesh : mesh_objects_) count += mesh.indices_count / 3;
    return count;
}

std::size_t World::add_obj_mesh(
    const std::filesystem::path& path, const glm::mat4& local_to_world
) {
    std::ifstream file(path);
    if (!file.is_open()) throw std::runtime_error("Could not open file: " + path.string());

    const std::size_t vertex_base = vertices_.size();
    const std::size_t index_base = indices_.size();
    std::size_t local_vertex_count = 0;

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::istringstream iss(line);
        std::string type;
        iss >> type;
        if (type == "v") {
            FloatType x, y, z;
            ReadDirective(iss, path, line_number, type, x, y, z);
            vertices_.emplace_back(x, y, z);
            ++local_vertex_count;
        } else if (type == "f") {
            // Polygon face -- fan-triangulate around the first corner
            std::vector<long> corners;
            std::string token;
            while (iss >> token) {
                long index = ParseVertexIndex(token, local_vertex_count);
                if (index < 0 || static_cast<std::size_t>(index) >= local_vertex_count) {
                    throw std::runtime_error(std::format(
                        "{}:{}: invalid face vertex '{}'", path.string(), line_number, token
                    ));
                }
                corners.push_back(index);
            }
            if (corners.size() < 3) {
                throw std::runtime_error(std::format(
                    "{}:{}: face needs at least 3 vertices", path.string(), line_number
                ));
            }
            for (std::size_t i = 1; i + 1 < corners.size(); ++i) {
                indices_.push_back(static_cast<std::uint32_t>(vertex_base + corners[0]));
                indices_.push_back(static_cast<std::uint32_t>(vertex_base + corners[i]));
                indices_.push_back(static_cast<std::uint32_t>(vertex_base + corners[i + 1]));
            }
        }
        // Normals, texture coordinates, groups and materials do not affect mesh shading
    }

    mesh_objects_.push_back(MeshObject{
        .local_to_world = local_to_world,
        .indices_offset = static_cast<std::uint32_t>(index_base),
        .indices_count = static_cast<std::uint32_t>(indices_.size() - index_base)
    });
    return mesh_objects_.size() - 1;
}

std::size_t World::add_sphere_field(
    std::uint32_t seed, std::size_t count, glm::vec2 radius_range, FloatType placement_radius
) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<FloatType> unit(0.0f, 1.0f);
    auto random_colour = [&]() { return glm::vec3(unit(rng), unit(rng), unit(rng)); };

    const std::size_t first_new = spheres_.size();
    for (std::size_t n = 0; n < count; ++n) {
        for (int attempt = 0; attempt < Constant::SphereFieldPlacementAttempts; ++attempt) {
            Sphere sphere;
            sphere.radius = radius_range.x + unit(rng) * (radius_range.y - radius_range.x);
            // Uniform point in the placement disc
            FloatType r = placement_radius * std::sqrt(unit(rng));
            FloatType angle = 2.0f * std::numbers::pi_v<FloatType> * unit(rng);
            sphere.position =
                glm::vec3(r * std::cos(angle), sphere.radius, r * std::sin(angle));

            bool overlaps = std::any_of(
                spheres_.begin() + static_cast<std::ptrdiff_t>(first_new),
                spheres_.end(),
                [&](const Sphere& other) {
                    FloatType min_dist = sphere.radius + other.radius;
                    glm::vec3 d = sphere.position - other.position;
                    return glm::dot(d, d) < min_dist * min_dist;
                }
            );
            if (overlaps) continue;

            glm::vec3 colour = random_colour();
            if (unit(rng) < Constant::SphereFieldMetalChance) {
                sphere.albedo = glm::vec3(0.0f);
                sphere.specular = colour;
            } else {
                sphere.albedo = colour;
                sphere.specular = glm::vec3(Constant::SphereFieldDielectricSpecular);
            }
            sphere.smoothness = unit(rng);
            if (unit(rng) < Constant::SphereFieldEmissiveChance) {
                sphere.emission = random_colour() * 2.0f;
            }
            spheres_.push_back(sphere);
            break;
        }
    }
    return spheres_.size() - first_new;
}

void World::parse_txt(
    const std::filesystem::path& path, std::vector<std::filesystem::path>& include_stack
) {
    std::ifstream file(path);
    if (!file.is_open()) throw std::runtime_error("Could not open file: " + path.string());
    include_stack.push_back(std::filesystem::weakly_canonical(path));

    const std::filesystem::path base = path.parent_path();
    constexpr std::size_t none = static_cast<std::size_t>(-1);
    std::size_t current_sphere = none;
    std::size_t current_mesh = none;
    glm::vec3 mesh_translate(0.0f);
    FloatType mesh_rotate_y = 0.0f;
    FloatType mesh_scale = 1.0f;

    auto update_mesh_transform = [&]() {
        glm::mat4 m = glm::translate(glm::mat4(1.0f), mesh_translate);
        m = glm::rotate(m, glm::radians(mesh_rotate_y), glm::vec3(0.0f, 1.0f, 0.0f));
        m = glm::scale(m, glm::vec3(mesh_scale));
        mesh_objects_[current_mesh].local_to_world = m;
    };
    auto require_sphere = [&](const std::string& directive, std::size_t line_number) {
        if (current_sphere == none) {
            throw std::runtime_error(std::format(
                "{}:{}: '{}' outside a Sphere block", path.string(), line_number, directive
            ));
        }
    };
    auto require_mesh = [&](const std::string& directive, std::size_t line_number) {
        if (current_mesh == none) {
            throw std::runtime_error(std::format(
                "{}:{}: '{}' outside a Mesh block", path.string(), line_number, directive
            ));
        }
    };

    std::string line;
    std::size_t line_number = 0;
    while (std::getline(file, line)) {
        ++line_number;
        std::istringstream iss(line);
        std::string type;
        if (!(iss >> type) || type[0] == '#') continue;

        if (type == "Environ") {
            std::string image;
            ReadDirective(iss, path, line_number, type, image);
            load_env_map(base / image);
        } else if (type == "Sky") {
            FloatType r, g, b;
            ReadDirective(iss, path, line_number, type, r, g, b);
            env_map_ = EnvironmentMap::Uniform(glm::max(glm::vec3(r, g, b), glm::vec3(0.0f)));
        } else if (type == "Light") {
            FloatType x, y, z, intensity;
            ReadDirective(iss, path, line_number, type, x, y, z, intensity);
            light_.direction = glm::vec3(x, y, z);
            light_.intensity = intensity;
        } else if (type == "Camera") {
            FloatType x, y, z;
            ReadDirective(iss, path, line_number, type, x, y, z);
            camera_.position_ = glm::vec3(x, y, z);
        } else if (type == "Yaw") {
            FloatType degrees;
            ReadDirective(iss, path, line_number, type, degrees);
            camera_.yaw_ = glm::radians(degrees);
        } else if (type == "Pitch") {
            FloatType degrees;
            ReadDirective(iss, path, line_number, type, degrees);
            camera_.pitch_ =
                std::clamp(glm::radians(degrees), -Constant::MaxPitch, Constant::MaxPitch);
        } else if (type == "Fov") {
            FloatType degrees;
            ReadDirective(iss, path, line_number, type, degrees);
            camera_.fov_ = std::clamp(degrees, 1.0f, 179.0f);
        } else if (type == "Sphere") {
            FloatType x, y, z, radius;
            ReadDirective(iss, path, line_number, type, x, y, z, radius);
            spheres_.push_back(Sphere{.position = glm::vec3(x, y, z), .radius = radius});
            current_sphere = spheres_.size() - 1;
        } else if (type == "Albedo") {
            require_sphere(type, line_number);
            FloatType r, g, b;
            ReadDirective(iss, path, line_number, type, r, g, b);
            spheres_[current_sphere].albedo = ClampColour(glm::vec3(r, g, b));
        } else if (type == "Specular") {
            require_sphere(type, line_number);
            FloatType r, g, b;
            ReadDirective(iss, path, line_number, type, r, g, b);
            spheres_[current_sphere].specular = ClampColour(glm::vec3(r, g, b));
        } else if (type == "Smoothness") {
            require_sphere(type, line_number);
            FloatType s;
            ReadDirective(iss, path, line_number, type, s);
            spheres_[current_sphere].smoothness = Saturate(s);
        } else if (type == "Emission") {
            require_sphere(type, line_number);
            FloatType r, g, b;
            ReadDirective(iss, path, line_number, type, r, g, b);
            spheres_[current_sphere].emission = glm::max(glm::vec3(r, g, b), glm::vec3(0.0f));
        } else if (type == "SphereField") {
            // Signed reads: unsigned extraction would wrap "-1" to a huge count
            long long seed, count;
            FloatType radius_min, radius_max, placement_radius;
            ReadDirective(
                iss, path, line_number, type, seed, count, radius_min, radius_max, placement_radius
            );
            if (seed < 0 || seed > std::numeric_limits<std::uint32_t>::max() || count < 0) {
                throw std::runtime_error(std::format(
                    "{}:{}: malformed '{}' directive", path.string(), line_number, type
                ));
            }
            if (radius_min < 0.0f || radius_max < radius_min) {
                throw std::runtime_error(std::format(
                    "{}:{}: SphereField radius range is invalid", path.string(), line_number
                ));
            }
            std::size_t placed = add_sphere_field(
                static_cast<std::uint32_t>(seed),
                static_cast<std::size_t>(count),
                glm::vec2(radius_min, radius_max),
                placement_radius
            );
            current_sphere = none;
            std::cout << std::format("[World] SphereField placed {} of {} spheres\n", placed, count);
        } else if (type == "Mesh") {
            std::string obj;
            ReadDirective(iss, path, line_number, type, obj);
            current_mesh = add_obj_mesh(base / obj, glm::mat4(1.0f));
            mesh_translate = glm::vec3(0.0f);
            mesh_rotate_y = 0.0f;
            mesh_scale = 1.0f;
        } else if (type == "Translate") {
            require_mesh(type, line_number);
            ReadDirective(
                iss, path, line_number, type, mesh_translate.x, mesh_translate.y, mesh_translate.z
            );
            update_mesh_transform();
        } else if (type == "RotateY") {
            require_mesh(type, line_number);
            ReadDirective(iss, path, line_number, type, mesh_rotate_y);
            update_mesh_transform();
        } else if (type == "Scale") {
            require_mesh(type, line_number);
            ReadDirective(iss, path, line_number, type, mesh_scale);
            update_mesh_transform();
        } else if (type == "Include") {
            std::string rel;
            ReadDirective(iss, path, line_number, type, rel);
            std::filesystem::path target = base / rel;
            if (std::filesystem::exists(target) &&
                std::find(
                    include_stack.begin(),
                    include_stack.end(),
                    std::filesystem::weakly_canonical(target)
                ) != include_stack.end()) {
                throw std::runtime_error(std::format(
                    "{}:{}: circular Include of '{}'", path.string(), line_number, rel
                ));
            }
            parse_txt(target, include_stack);
            current_sphere = none;
            current_mesh = none;
        } else {
            throw std::runtime_error(std::format(
                "{}:{}: unknown directive '{}'", path.string(), line_number, type
            ));
        }
    }
    include_stack.pop_back();
}

void World::load_env_map(const std::filesystem::path& path) {
    int width, height, channels;
    float* data = stbi_loadf(path.string().c_str(), &width, &height, &channels, 3);
    if (!data) {
        throw std::runtime_error(
            "Failed to load environment map: " + path.string() + " (" + stbi_failure_reason() + ")"
        );
    }

    // stb_image stores the top row first; the map wants row 0 at v = 0 (the bottom)
    std::vector<glm::vec3> texels;
    texels.reserve(static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
    for (int y = height - 1; y >= 0; --y) {
        for (int x = 0; x < width; ++x) {
            const float* p = data + (static_cast<std::size_t>(y) * width + x) * 3;
            texels.emplace_back(p[0], p[1], p[2]);
        }
    }
    stbi_image_free(data);

    env_map_ = EnvironmentMap(
        static_cast<std::size_t>(width), static_cast<std::size_t>(height), std::move(texels)
    );
}
