// SandCastle Gameplay
// piece_registry.cpp - Piece registry implementation

#include <sandcastle/gameplay/piece_registry.hpp>

#include <algorithm>

namespace sandcastle::gameplay {

Piece& PieceRegistry::spawn(Tier tier, const Footprint& footprint, const glm::dvec2& position, double spawn_time) {
    PieceId id = next_id_++;
    auto piece = std::make_unique<Piece>(id, tier, footprint, position, spawn_time);
    Piece& ref = *piece;
    pieces_.emplace(id, std::move(piece));
    return ref;
}

Piece* PieceRegistry::spawn_with_id(PieceId id, Tier tier, const Footprint& footprint, const glm::dvec2& position,
                                    double spawn_time) {
    if (id == INVALID_PIECE || pieces_.count(id) > 0) {
        return nullptr;
    }
    auto piece = std::make_unique<Piece>(id, tier, footprint, position, spawn_time);
    Piece* ptr = piece.get();
    pieces_.emplace(id, std::move(piece));
    next_id_ = std::max(next_id_, id + 1);
    return ptr;
}

Piece* PieceRegistry::get(PieceId id) {
    auto it = pieces_.find(id);
    return it != pieces_.end() ? it->second.get() : nullptr;
}

const Piece* PieceRegistry::get(PieceId id) const {
    auto it = pieces_.find(id);
    return it != pieces_.end() ? it->second.get() : nullptr;
}

bool PieceRegistry::contains(PieceId id) const {
    return pieces_.count(id) > 0;
}

// ============================================================================
// Physics Binding
// ============================================================================

bool PieceRegistry::drop(PieceId id, physics::PhysicsWorld& world) {
    Piece* piece = get(id);
    if (piece == nullptr || !piece->drop(world)) {
        return false;
    }
    body_index_[piece->get_body()] = id;
    return true;
}

bool PieceRegistry::restore(PieceId id, physics::PhysicsWorld& world, const glm::dvec2& position,
                            const glm::dvec2& velocity) {
    Piece* piece = get(id);
    if (piece == nullptr || !piece->restore(world, position, velocity)) {
        return false;
    }
    body_index_[piece->get_body()] = id;
    return true;
}

PieceId PieceRegistry::find_by_body(physics::RigidBodyHandle handle) const {
    auto it = body_index_.find(handle);
    return it != body_index_.end() ? it->second : INVALID_PIECE;
}

// ============================================================================
// Removal
// ============================================================================

bool PieceRegistry::release(PieceId id, physics::PhysicsWorld& world) {
    auto it = pieces_.find(id);
    if (it == pieces_.end()) {
        return false;
    }

    if (it->second->has_body()) {
        body_index_.erase(it->second->get_body());
    }
    it->second->destroy(world);
    pieces_.erase(it);
    return true;
}

void PieceRegistry::clear(physics::PhysicsWorld& world) {
    for (auto& [id, piece] : pieces_) {
        piece->destroy(world);
    }
    pieces_.clear();
    body_index_.clear();
}

// ============================================================================
// Iteration
// ============================================================================

std::vector<PieceId> PieceRegistry::ids() const {
    std::vector<PieceId> result;
    result.reserve(pieces_.size());
    for (const auto& [id, piece] : pieces_) {
        result.push_back(id);
    }
    std::sort(result.begin(), result.end());
    return result;
}

void PieceRegistry::for_each(const std::function<void(const Piece&)>& fn) const {
    for (PieceId id : ids()) {
        fn(*pieces_.at(id));
    }
}

}  // namespace sandcastle::gameplay
