// SandCastle Gameplay
// piece_registry.hpp - Id-indexed piece storage with a physics-body lookup

#pragma once

#include "piece.hpp"

#include <algorithm>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

namespace sandcastle::gameplay {

// Owns every live Piece. Ids are never reused within a registry, so a stale id
// held by a delayed callback can never resolve to a different piece.
class PieceRegistry {
public:
    PieceRegistry() = default;

    // Non-copyable (pieces own physics handles)
    PieceRegistry(const PieceRegistry&) = delete;
    PieceRegistry& operator=(const PieceRegistry&) = delete;

    // Create a piece in phase Spawned and return it
    Piece& spawn(Tier tier, const Footprint& footprint, const glm::dvec2& position, double spawn_time);

    // Create a piece with a specific id (snapshot import). Returns nullptr if the id is taken.
    Piece* spawn_with_id(PieceId id, Tier tier, const Footprint& footprint, const glm::dvec2& position,
                         double spawn_time);

    [[nodiscard]] Piece* get(PieceId id);
    [[nodiscard]] const Piece* get(PieceId id) const;
    [[nodiscard]] bool contains(PieceId id) const;

    // ========================================================================
    // Physics Binding
    // ========================================================================

    // Drop a piece and index its new body
    bool drop(PieceId id, physics::PhysicsWorld& world);

    // Restore a piece's body at a saved pose and index it
    bool restore(PieceId id, physics::PhysicsWorld& world, const glm::dvec2& position, const glm::dvec2& velocity);

    // Piece owning a body, or INVALID_PIECE for the ground, walls and unknown handles
    [[nodiscard]] PieceId find_by_body(physics::RigidBodyHandle handle) const;

    // ========================================================================
    // Removal
    // ========================================================================

    // Destroy the piece's body and erase it. Returns false if the id is unknown.
    bool release(PieceId id, physics::PhysicsWorld& world);
    void clear(physics::PhysicsWorld& world);

    // ========================================================================
    // Iteration
    // ========================================================================

    [[nodiscard]] size_t size() const { return pieces_.size(); }
    [[nodiscard]] bool empty() const { return pieces_.empty(); }
    [[nodiscard]] PieceId peek_next_id() const { return next_id_; }

    // Never hand out ids below `next` (snapshot import)
    void reserve_ids(PieceId next) { next_id_ = std::max(next_id_, next); }

    // Ids in ascending (creation) order
    [[nodiscard]] std::vector<PieceId> ids() const;

    void for_each(const std::function<void(const Piece&)>& fn) const;

private:
    std::unordered_map<PieceId, std::unique_ptr<Piece>> pieces_;
    std::unordered_map<physics::RigidBodyHandle, PieceId> body_index_;
    PieceId next_id_ = 1;
};

}  // namespace sandcastle::gameplay
