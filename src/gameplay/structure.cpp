// SandCastle Gameplay
// structure.cpp - Structure membership

#include <sandcastle/gameplay/structure.hpp>

#include <algorithm>

namespace sandcastle::gameplay {

bool Structure::add(const Piece& piece) {
    PiecePhase phase = piece.get_phase();
    if (phase != PiecePhase::Settling && phase != PiecePhase::ResolvedValid) {
        return false;
    }
    if (contains(piece.get_id())) {
        return false;
    }
    members_.push_back(piece.get_id());
    return true;
}

bool Structure::remove(PieceId id) {
    auto it = std::find(members_.begin(), members_.end(), id);
    if (it == members_.end()) {
        return false;
    }
    members_.erase(it);
    return true;
}

bool Structure::contains(PieceId id) const {
    return std::find(members_.begin(), members_.end(), id) != members_.end();
}

}  // namespace sandcastle::gameplay
