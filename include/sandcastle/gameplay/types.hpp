// SandCastle Gameplay
// types.hpp - Shared gameplay types: piece ids, footprints, samples, phases

#pragma once

#include <glm/glm.hpp>

#include <cstdint>
#include <string_view>

namespace sandcastle::gameplay {

// ============================================================================
// Piece Identity
// ============================================================================

using PieceId = uint32_t;
inline constexpr PieceId INVALID_PIECE = 0;

// Ordinal piece category, 1 (base) .. max tier (capstone)
using Tier = int;

// ============================================================================
// Geometry
// ============================================================================

struct Footprint {
    double width = 1.0;
    double height = 1.0;

    [[nodiscard]] double half_width() const { return width * 0.5; }
    [[nodiscard]] double half_height() const { return height * 0.5; }
};

// ============================================================================
// Kinematics
// ============================================================================

struct KinematicSample {
    glm::dvec2 position{0.0};
    glm::dvec2 velocity{0.0};

    // True when no physics body backs the piece; treat as at rest
    bool absent = false;

    // Combined L1 speed |vx| + |vy|
    [[nodiscard]] double speed() const { return glm::abs(velocity.x) + glm::abs(velocity.y); }

    [[nodiscard]] static KinematicSample at_rest(const glm::dvec2& position = glm::dvec2{0.0}) {
        KinematicSample sample;
        sample.position = position;
        sample.absent = true;
        return sample;
    }
};

// ============================================================================
// Stability
// ============================================================================

enum class StabilityLevel : uint8_t { Stable, Warning, Unstable };

[[nodiscard]] constexpr std::string_view to_string(StabilityLevel level) {
    switch (level) {
        case StabilityLevel::Stable:
            return "stable";
        case StabilityLevel::Warning:
            return "warning";
        case StabilityLevel::Unstable:
            return "unstable";
    }
    return "unknown";
}

// ============================================================================
// Piece Lifecycle
// ============================================================================

enum class PiecePhase : uint8_t {
    Spawned,          // Created, not yet moving
    Moving,           // Held and oscillating above the arena
    Falling,          // Released, owned by the physics world
    Settling,         // Touched down, sampled until stable
    ResolvedValid,    // Placement accepted, part of the structure
    ResolvedInvalid,  // Placement rejected, about to be removed
    Removed           // Holds no physics body
};

[[nodiscard]] constexpr std::string_view to_string(PiecePhase phase) {
    switch (phase) {
        case PiecePhase::Spawned:
            return "spawned";
        case PiecePhase::Moving:
            return "moving";
        case PiecePhase::Falling:
            return "falling";
        case PiecePhase::Settling:
            return "settling";
        case PiecePhase::ResolvedValid:
            return "resolved_valid";
        case PiecePhase::ResolvedInvalid:
            return "resolved_invalid";
        case PiecePhase::Removed:
            return "removed";
    }
    return "unknown";
}

[[nodiscard]] constexpr bool is_physics_owned(PiecePhase phase) {
    return phase == PiecePhase::Falling || phase == PiecePhase::Settling;
}

[[nodiscard]] constexpr bool is_resolved(PiecePhase phase) {
    return phase == PiecePhase::ResolvedValid || phase == PiecePhase::ResolvedInvalid;
}

}  // namespace sandcastle::gameplay
