// SandCastle Gameplay
// structure.hpp - Ordered collection of placed, non-removed pieces

#pragma once

#include "piece.hpp"

#include <vector>

namespace sandcastle::gameplay {

// Insertion order is drop order. Only pieces in phase Settling or
// ResolvedValid may be members; everything else is refused by add().
class Structure {
public:
    bool add(const Piece& piece);
    bool remove(PieceId id);
    void clear() { members_.clear(); }

    [[nodiscard]] bool contains(PieceId id) const;
    [[nodiscard]] const std::vector<PieceId>& ids() const { return members_; }
    [[nodiscard]] size_t size() const { return members_.size(); }
    [[nodiscard]] bool empty() const { return members_.empty(); }

private:
    std::vector<PieceId> members_;
};

}  // namespace sandcastle::gameplay
