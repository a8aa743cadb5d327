// SandCastle Gameplay
// level.hpp - Level definitions and the static/generated level catalog

#pragma once

#include "types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sandcastle::gameplay {

struct GameRules;

struct Level {
    int id = 1;
    std::string name;
    int target_piece_count = 1;
    std::vector<Tier> allowed_tiers;
    int max_attempts = 3;

    [[nodiscard]] bool allows(Tier tier) const;

    bool operator==(const Level&) const = default;
};

// ============================================================================
// Level Catalog
// ============================================================================

// A fixed list of hand-made levels. Past the end, each level is generated from
// the previous one by repeating the catalog's final target step.
class LevelCatalog {
public:
    // Highest reachable level id; larger ids clamp to it
    static constexpr int MAX_LEVEL = 10000;

    // Reference catalog with tiers [base, max] from the rules
    explicit LevelCatalog(const GameRules& rules);
    explicit LevelCatalog(std::vector<Level> levels);

    // Level by 1-based id; ids past the static catalog are generated
    [[nodiscard]] Level get(int id) const;

    // Deterministic successor of a level
    [[nodiscard]] Level generate_next(const Level& previous) const;

    [[nodiscard]] size_t static_count() const { return levels_.size(); }
    [[nodiscard]] int target_step() const { return target_step_; }

    [[nodiscard]] static std::vector<Level> reference_levels(Tier base_tier, Tier max_tier);

private:
    std::vector<Level> levels_;
    int target_step_ = 5;

    void compute_target_step();
    [[nodiscard]] Level make_generated(const Level& base, int id, int64_t target) const;
};

}  // namespace sandcastle::gameplay
