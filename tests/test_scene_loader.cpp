/**
 * @file test_scene_loader.cpp
 * @brief Unit tests for scene text files, OBJ meshes and buffer validation
 */

#include <gtest/gtest.h>

#include "raytracer.hpp"
#include "world.hpp"

#include "test_helpers.hpp"

#include <glm/gtc/matrix_transform.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace TestHelpers;

namespace {

const std::string CubeObj =
    "# unit quad and triangle\n"
    "v 0 0 0\n"
    "v 1 0 0\n"
    "v 1 1 0\n"
    "v 0 1 0\n"
    "vn 0 0 1\n"
    "vt 0 0\n"
    "f 1/1/1 2/1/1 3/1/1 4/1/1\n"
    "f -4//1 -3//1 -2//1\n";

}  // namespace

class SceneLoaderTest : public ::testing::Test {
protected:
    SceneLoaderTest() : dir_(::testing::UnitTest::GetInstance()->current_test_info()->name()) {}

    World load(const std::string& filename, const std::string& contents) {
        return World({dir_.write(filename, contents).string()});
    }

    TempDirectory dir_;
};

// =============================================================================
// Scene Directives
// =============================================================================

TEST_F(SceneLoaderTest, SphereBlockWithMaterials) {
    World world = load(
        "spheres.txt",
        "# two spheres\n"
        "Sphere 0 1 -3 1\n"
        "Albedo 0.8 0.2 0.1\n"
        "Specular 0.1 0.1 0.1\n"
        "Smoothness 0.6\n"
        "\n"
        "Sphere 2 0.5 0 0.5\n"
        "Emission 4 3 2\n"
    );

    ASSERT_EQ(world.spheres_.size(), 2u);
    const Sphere& first = world.spheres_[0];
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 1.0f, -3.0f), first.position, 0.0f);
    EXPECT_FLOAT_EQ(first.radius, 1.0f);
    EXPECT_VEC3_NEAR(glm::vec3(0.8f, 0.2f, 0.1f), first.albedo, 1e-6f);
    EXPECT_VEC3_NEAR(glm::vec3(0.1f), first.specular, 1e-6f);
    EXPECT_FLOAT_EQ(first.smoothness, 0.6f);
    EXPECT_VEC3_NEAR(glm::vec3(0.0f), first.emission, 0.0f);

    const Sphere& second = world.spheres_[1];
    EXPECT_FLOAT_EQ(second.radius, 0.5f);
    EXPECT_VEC3_NEAR(glm::vec3(0.0f), second.albedo, 0.0f);
    EXPECT_VEC3_NEAR(glm::vec3(4.0f, 3.0f, 2.0f), second.emission, 0.0f);
}

TEST_F(SceneLoaderTest, MaterialValuesAreClamped) {
    World world = load(
        "clamp.txt",
        "Sphere 0 1 0 1\n"
        "Albedo 1.5 -0.2 0.5\n"
        "Specular 2 2 2\n"
        "Smoothness 3\n"
        "Emission -1 0 1\n"
    );

    const Sphere& sphere = world.spheres_.at(0);
    EXPECT_VEC3_NEAR(glm::vec3(1.0f, 0.0f, 0.5f), sphere.albedo, 0.0f);
    EXPECT_VEC3_NEAR(glm::vec3(1.0f), sphere.specular, 0.0f);
    EXPECT_FLOAT_EQ(sphere.smoothness, 1.0f);
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 0.0f, 1.0f), sphere.emission, 0.0f);
}

TEST_F(SceneLoaderTest, CameraSkyAndLight) {
    World world = load(
        "view.txt",
        "Camera 1 3 7\n"
        "Yaw 90\n"
        "Pitch -10\n"
        "Fov 45\n"
        "Sky 0.5 0.6 0.7\n"
        "Light 0 -1 1 2.5\n"
    );

    EXPECT_VEC3_NEAR(glm::vec3(1.0f, 3.0f, 7.0f), world.camera_.position_, 0.0f);
    EXPECT_NEAR(world.camera_.yaw_, glm::radians(90.0f), 1e-6f);
    EXPECT_NEAR(world.camera_.pitch_, glm::radians(-10.0f), 1e-6f);
    EXPECT_FLOAT_EQ(world.camera_.fov_, 45.0f);
    ASSERT_TRUE(world.env_map_.is_loaded());
    EXPECT_VEC3_NEAR(glm::vec3(0.5f, 0.6f, 0.7f), world.env_map_.sample(0.1f, -0.3f), 1e-6f);
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, -1.0f, 1.0f), world.light_.direction, 0.0f);
    EXPECT_FLOAT_EQ(world.light_.intensity, 2.5f);
}

TEST_F(SceneLoaderTest, MeshBlockComposesTransform) {
    dir_.write("quad.obj", CubeObj);
    World world = load(
        "mesh.txt",
        "Mesh quad.obj\n"
        "Translate 1 2 3\n"
        "RotateY 90\n"
        "Scale 2\n"
    );

    ASSERT_EQ(world.mesh_objects_.size(), 1u);
    glm::mat4 expected = glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 2.0f, 3.0f));
    expected = glm::rotate(expected, glm::radians(90.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    expected = glm::scale(expected, glm::vec3(2.0f));
    for (int c = 0; c < 4; ++c) {
        EXPECT_VEC4_NEAR(expected[c], world.mesh_objects_[0].local_to_world[c], 1e-5f);
    }
    // Vertices are kept in object space
    EXPECT_VEC3_NEAR(glm::vec3(1.0f, 1.0f, 0.0f), world.vertices_[2], 0.0f);
}

TEST_F(SceneLoaderTest, IncludeReadsRelativeFile) {
    dir_.write("inner.txt", "Sphere 0 1 0 1\nAlbedo 0.3 0.3 0.3\n");
    World world = load("outer.txt", "Include inner.txt\nSphere 5 1 0 1\n");

    ASSERT_EQ(world.spheres_.size(), 2u);
    EXPECT_VEC3_NEAR(glm::vec3(0.3f), world.spheres_[0].albedo, 1e-6f);
    EXPECT_VEC3_NEAR(glm::vec3(5.0f, 1.0f, 0.0f), world.spheres_[1].position, 0.0f);
}

TEST_F(SceneLoaderTest, IncludeRejectsSelfReference) {
    try {
        load("loop.txt", "Sphere 0 1 0 1\nInclude loop.txt\n");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("circular Include"), std::string::npos);
        EXPECT_NE(std::string(e.what()).find("loop.txt:2"), std::string::npos);
    }
}

TEST_F(SceneLoaderTest, IncludeRejectsMutualReference) {
    dir_.write("b.txt", "Include a.txt\n");
    EXPECT_THROW(load("a.txt", "Include b.txt\n"), std::runtime_error);
}

TEST_F(SceneLoaderTest, IncludeSameFileTwiceIsNotACycle) {
    dir_.write("ball.txt", "Sphere 0 1 0 1\n");
    World world = load("twice.txt", "Include ball.txt\nInclude ./ball.txt\n");
    EXPECT_EQ(world.spheres_.size(), 2u);
}

TEST_F(SceneLoaderTest, EnvironmentImageIsLoadedLinear) {
    // Radiance RGBE, two flat pixels: (1, 0.5, 0.25) and black
    std::string hdr = "#?RADIANCE\nFORMAT=32-bit_rle_rgbe\n\n-Y 1 +X 2\n";
    for (unsigned char byte : {128, 64, 32, 129, 0, 0, 0, 0}) hdr.push_back(static_cast<char>(byte));
    dir_.write("sky.hdr", hdr);

    World world = load("env.txt", "Environ sky.hdr\n");

    ASSERT_TRUE(world.env_map_.is_loaded());
    EXPECT_EQ(world.env_map_.width(), 2u);
    EXPECT_EQ(world.env_map_.height(), 1u);
    EXPECT_VEC3_NEAR(glm::vec3(1.0f, 0.5f, 0.25f), world.env_map_.sample(0.25f, 0.5f), 1e-5f);
    EXPECT_VEC3_NEAR(glm::vec3(0.0f), world.env_map_.sample(0.75f, 0.5f), 1e-5f);
}

TEST_F(SceneLoaderTest, EnvironmentImageTopRowIsSky) {
    // Radiance RGBE, one column: (1, 0.5, 0.25) on the top row and black below
    std::string hdr = "#?RADIANCE\nFORMAT=32-bit_rle_rgbe\n\n-Y 2 +X 1\n";
    for (unsigned char byte : {128, 64, 32, 129, 0, 0, 0, 0}) hdr.push_back(static_cast<char>(byte));
    dir_.write("sky_column.hdr", hdr);

    World world = load("env_column.txt", "Environ sky_column.hdr\n");
    RayTracer tracer(world);
    PixelRandom rng(glm::vec2(1.0f, 1.0f), 0.5f);

    // 45 degrees above and below the horizon hit the two texel centres
    Ray up{.origin = glm::vec3(0.0f), .direction = glm::normalize(glm::vec3(0.0f, 1.0f, -1.0f))};
    Ray down{.origin = glm::vec3(0.0f), .direction = glm::normalize(glm::vec3(0.0f, -1.0f, -1.0f))};

    EXPECT_VEC3_NEAR(
        glm::vec3(1.0f, 0.5f, 0.25f) * Constant::SkyboxIntensity,
        tracer.shade(up, RayHit{}, rng).emission,
        1e-3f
    );
    EXPECT_VEC3_NEAR(glm::vec3(0.0f), tracer.shade(down, RayHit{}, rng).emission, 1e-3f);
}

// =============================================================================
// OBJ Meshes
// =============================================================================

TEST_F(SceneLoaderTest, ObjFacesAreFanTriangulated) {
    World world = load("quad.obj", CubeObj);

    ASSERT_EQ(world.vertices_.size(), 4u);
    ASSERT_EQ(world.mesh_objects_.size(), 1u);
    EXPECT_EQ(world.mesh_objects_[0].indices_offset, 0u);
    EXPECT_EQ(world.mesh_objects_[0].indices_count, 9u);
    EXPECT_EQ(world.triangle_count(), 3u);

    const std::vector<std::uint32_t> expected = {0, 1, 2, 0, 2, 3, 0, 1, 2};
    EXPECT_EQ(world.indices_, expected);
}

TEST_F(SceneLoaderTest, SecondMeshIsRebased) {
    dir_.write("quad.obj", CubeObj);
    World world = load("two.txt", "Mesh quad.obj\nMesh quad.obj\nTranslate 0 0 -2\n");

    ASSERT_EQ(world.mesh_objects_.size(), 2u);
    EXPECT_EQ(world.vertices_.size(), 8u);
    EXPECT_EQ(world.mesh_objects_[1].indices_offset, 9u);
    EXPECT_EQ(world.mesh_objects_[1].indices_count, 9u);
    EXPECT_EQ(world.indices_[9], 4u);
    EXPECT_EQ(world.indices_[17], 6u);
    // Only the second block was translated
    EXPECT_EQ(world.mesh_objects_[0].local_to_world, glm::mat4(1.0f));
    EXPECT_FLOAT_EQ(world.mesh_objects_[1].local_to_world[3].z, -2.0f);
}

TEST_F(SceneLoaderTest, ObjRejectsOutOfRangeFaceIndex) {
    EXPECT_THROW(load("bad.obj", "v 0 0 0\nv 1 0 0\nv 0 1 0\nf 1 2 4\n"), std::runtime_error);
    EXPECT_THROW(load("zero.obj", "v 0 0 0\nv 1 0 0\nv 0 1 0\nf 0 1 2\n"), std::runtime_error);
    EXPECT_THROW(load("short.obj", "v 0 0 0\nv 1 0 0\nf 1 2\n"), std::runtime_error);
}

// =============================================================================
// Errors
// =============================================================================

TEST_F(SceneLoaderTest, RejectsUnknownDirective) {
    EXPECT_THROW(load("unknown.txt", "Cube 0 0 0 1\n"), std::runtime_error);
}

TEST_F(SceneLoaderTest, RejectsMalformedDirective) {
    EXPECT_THROW(load("malformed.txt", "Sphere 0 1 zero 1\n"), std::runtime_error);
    EXPECT_THROW(load("short.txt", "Camera 1 2\n"), std::runtime_error);
}

TEST_F(SceneLoaderTest, RejectsMaterialOutsideBlock) {
    EXPECT_THROW(load("orphan.txt", "Albedo 1 1 1\n"), std::runtime_error);
    EXPECT_THROW(load("orphan_mesh.txt", "Sphere 0 1 0 1\nTranslate 0 1 0\n"), std::runtime_error);
}

TEST_F(SceneLoaderTest, RejectsNegativeRadius) {
    EXPECT_THROW(load("negative.txt", "Sphere 0 1 0 -1\n"), std::runtime_error);
}

TEST_F(SceneLoaderTest, RejectsMissingAndUnsupportedFiles) {
    EXPECT_THROW(World({(dir_.path() / "missing.txt").string()}), std::runtime_error);
    EXPECT_THROW(load("scene.json", "{}"), std::runtime_error);
    EXPECT_THROW(load("missing_mesh.txt", "Mesh nowhere.obj\n"), std::runtime_error);
    EXPECT_THROW(load("missing_env.txt", "Environ nowhere.hdr\n"), std::runtime_error);
}

TEST_F(SceneLoaderTest, ErrorMessageNamesFileAndLine) {
    try {
        load("located.txt", "Sphere 0 1 0 1\n\nBogus\n");
        FAIL() << "Expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        std::string message = e.what();
        EXPECT_NE(message.find("located.txt:3"), std::string::npos) << message;
    }
}

// =============================================================================
// Buffer Validation
// =============================================================================

class WorldValidationTest : public ::testing::Test {
protected:
    void SetUp() override { AddFrontFacingQuad(world_); }

    World world_;
};

TEST_F(WorldValidationTest, AcceptsConsistentBuffers) {
    EXPECT_NO_THROW(world_.validate());
}

TEST_F(WorldValidationTest, RejectsRangePastIndexBuffer) {
    world_.mesh_objects_[0].indices_offset = 3;
    EXPECT_THROW(world_.validate(), std::runtime_error);
}

TEST_F(WorldValidationTest, RejectsPartialTriangle) {
    world_.mesh_objects_[0].indices_count = 5;
    EXPECT_THROW(world_.validate(), std::runtime_error);
}

TEST_F(WorldValidationTest, RejectsDanglingVertexIndex) {
    world_.indices_[4] = 4;
    EXPECT_THROW(world_.validate(), std::runtime_error);
}

// =============================================================================
// Procedural Sphere Field
// =============================================================================

TEST(SphereFieldTest, SameSeedSameField) {
    World a;
    World b;
    EXPECT_EQ(a.add_sphere_field(7, 20, glm::vec2(0.2f, 0.6f), 10.0f), 20u);
    EXPECT_EQ(b.add_sphere_field(7, 20, glm::vec2(0.2f, 0.6f), 10.0f), 20u);

    ASSERT_EQ(a.spheres_.size(), b.spheres_.size());
    for (std::size_t i = 0; i < a.spheres_.size(); ++i) {
        EXPECT_EQ(a.spheres_[i].position, b.spheres_[i].position);
        EXPECT_EQ(a.spheres_[i].albedo, b.spheres_[i].albedo);
        EXPECT_EQ(a.spheres_[i].specular, b.spheres_[i].specular);
    }
}

TEST(SphereFieldTest, SpheresRestOnGroundWithoutOverlap) {
    World world;
    std::size_t placed = world.add_sphere_field(3, 40, glm::vec2(0.3f, 0.8f), 12.0f);
    ASSERT_GT(placed, 0u);

    for (std::size_t i = 0; i < world.spheres_.size(); ++i) {
        const Sphere& s = world.spheres_[i];
        EXPECT_GE(s.radius, 0.3f);
        EXPECT_LE(s.radius, 0.8f);
        EXPECT_FLOAT_EQ(s.position.y, s.radius);
        EXPECT_LE(glm::length(glm::vec2(s.position.x, s.position.z)), 12.0f + 1e-4f);
        EXPECT_LE(s.albedo.x, 1.0f);
        EXPECT_LE(s.specular.x, 1.0f);
        for (std::size_t j = i + 1; j < world.spheres_.size(); ++j) {
            const Sphere& o = world.spheres_[j];
            EXPECT_GE(glm::length(s.position - o.position), s.radius + o.radius - 1e-4f);
        }
    }
    EXPECT_NO_THROW(world.validate());
}

TEST(SphereFieldTest, CrowdedFieldStopsAtAvailableSpace) {
    World world;
    // Radius 1 spheres cannot fit more than a handful into a radius 1 disc
    std::size_t placed = world.add_sphere_field(11, 50, glm::vec2(1.0f, 1.0f), 1.0f);
    EXPECT_LT(placed, 50u);
    EXPECT_EQ(world.spheres_.size(), placed);
}

TEST_F(SceneLoaderTest, SphereFieldDirective) {
    World world = load("field.txt", "SphereField 5 12 0.2 0.4 8\nSphere 0 1 0 1\n");
    EXPECT_EQ(world.spheres_.size(), 13u);
    EXPECT_VEC3_NEAR(glm::vec3(0.0f, 1.0f, 0.0f), world.spheres_.back().position, 0.0f);
    EXPECT_THROW(load("field_bad.txt", "SphereField 5 12 0.5 0.2 8\n"), std::runtime_error);
}

TEST_F(SceneLoaderTest, SphereFieldRejectsNegativeCountAndSeed) {
    EXPECT_THROW(load("field_count.txt", "SphereField 1 -1 0.2 0.6 14\n"), std::runtime_error);
    EXPECT_THROW(load("field_seed.txt", "SphereField -3 4 0.2 0.6 14\n"), std::runtime_error);
    EXPECT_THROW(
        load("field_seed_range.txt", "SphereField 4294967296 4 0.2 0.6 14\n"), std::runtime_error
    );
}
