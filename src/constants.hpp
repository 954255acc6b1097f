#pragma once
#include <cstddef>
#include <utility>

#include <glm/glm.hpp>

/// @brief Floating-point type used throughout the renderer.
using FloatType = decltype(std::declval<glm::vec3>().x);

/**
 * @brief Centralized constants for the renderer.
 */
namespace Constant {

// Window / Display
inline constexpr std::size_t WindowWidth = 640;
inline constexpr std::size_t WindowHeight = 480;

// Camera
inline constexpr FloatType DefaultFov = 60.0f;  // Vertical, degrees
inline constexpr FloatType NearPlane = 0.3f;
inline constexpr FloatType FarPlane = 1000.0f;
inline constexpr FloatType MaxPitch = 1.553343f;  // glm::radians(89.0f)

// Input
inline constexpr FloatType MoveSpeed = 3.0f;
inline constexpr FloatType MouseSensitivity = 0.002f;
inline constexpr FloatType RotateSpeed = 0.8f;

// Renderer
inline constexpr int TileSize = 32;
inline constexpr int DefaultHeadlessFrames = 64;
inline constexpr FloatType DefaultGamma = 2.2f;

// Path integration
inline constexpr int MaxBounces = 8;
inline constexpr FloatType RayEpsilon = 1e-3f;       // Offset along the normal to avoid self-hits
inline constexpr FloatType TriangleEpsilon = 1e-8f;  // Backface culling determinant threshold
inline constexpr FloatType SkyboxIntensity = 1.2f;
inline constexpr FloatType PhongAlphaBase = 1000.0f;

// Pixel RNG
inline constexpr FloatType RandomDotX = 12.9898f;
inline constexpr FloatType RandomDotY = 78.233f;
inline constexpr FloatType RandomScale = 43758.5453f;
inline constexpr FloatType RandomSeedDivisor = 100.0f;

// Ground plane (y = 0) material
inline constexpr FloatType GroundAlbedo = 0.5f;
inline constexpr FloatType GroundSpecular = 0.03f;
inline constexpr FloatType GroundSmoothness = 0.2f;

// Mesh material, shared by every triangle
inline constexpr FloatType MeshAlbedo = 0.0f;
inline constexpr FloatType MeshSpecular = 0.65f;
inline constexpr FloatType MeshSmoothness = 0.99f;

// Procedural sphere field
inline constexpr int SphereFieldPlacementAttempts = 100;
inline constexpr FloatType SphereFieldMetalChance = 0.5f;
inline constexpr FloatType SphereFieldEmissiveChance = 0.1f;
inline constexpr FloatType SphereFieldDielectricSpecular = 0.04f;

}  // namespace Constant
