// SandCastle Gameplay
// level.cpp - Level catalog

#include <sandcastle/gameplay/game_rules.hpp>
#include <sandcastle/gameplay/level.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <utility>

namespace sandcastle::gameplay {

bool Level::allows(Tier tier) const {
    return std::find(allowed_tiers.begin(), allowed_tiers.end(), tier) != allowed_tiers.end();
}

// ============================================================================
// Level Catalog
// ============================================================================

LevelCatalog::LevelCatalog(const GameRules& rules) : levels_(reference_levels(rules.base_tier, rules.max_tier)) {
    compute_target_step();
}

LevelCatalog::LevelCatalog(std::vector<Level> levels) : levels_(std::move(levels)) {
    if (levels_.empty()) {
        levels_ = reference_levels(1, 6);
    }
    compute_target_step();
}

std::vector<Level> LevelCatalog::reference_levels(Tier base_tier, Tier max_tier) {
    std::vector<Tier> tiers;
    for (Tier tier = base_tier; tier <= max_tier; ++tier) {
        tiers.push_back(tier);
    }

    return {
        Level{1, "First Steps", 2, tiers, 3},
        Level{2, "Level Up", 3, tiers, 3},
        Level{3, "Build Strategy", 5, tiers, 3},
        Level{4, "Logistics Challenge", 10, tiers, 3},
        Level{5, "Master Builder", 15, tiers, 3},
    };
}

void LevelCatalog::compute_target_step() {
    if (levels_.size() >= 2) {
        const Level& last = levels_[levels_.size() - 1];
        const Level& before = levels_[levels_.size() - 2];
        target_step_ = std::max(1, last.target_piece_count - before.target_piece_count);
    } else {
        target_step_ = 5;
    }
}

Level LevelCatalog::get(int id) const {
    id = std::clamp(id, 1, MAX_LEVEL);
    if (static_cast<size_t>(id) <= levels_.size()) {
        return levels_[static_cast<size_t>(id - 1)];
    }

    const Level& last = levels_.back();
    const int64_t steps = static_cast<int64_t>(id) - static_cast<int64_t>(levels_.size());
    return make_generated(last, id, static_cast<int64_t>(last.target_piece_count) + steps * target_step_);
}

Level LevelCatalog::generate_next(const Level& previous) const {
    const int id = std::min(previous.id + 1, MAX_LEVEL);
    return make_generated(previous, id, static_cast<int64_t>(previous.target_piece_count) + target_step_);
}

Level LevelCatalog::make_generated(const Level& base, int id, int64_t target) const {
    Level level = base;
    level.id = id;
    level.target_piece_count =
        static_cast<int>(std::clamp<int64_t>(target, 1, std::numeric_limits<int>::max()));
    level.name = fmt::format("Advanced Level {}", id - static_cast<int>(levels_.size()));
    return level;
}

}  // namespace sandcastle::gameplay
