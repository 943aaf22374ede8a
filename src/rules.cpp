#include "engine.h"

#include <optional>

namespace {

bool can_land_on(const Object& o) noexcept {
    return is_empty(o) || is_robot(o);
}

// Where the rock at `pos` goes this tick, judged on `grid` alone.
std::optional<Position> rock_destination(const Grid& grid, Position pos) {
    const Object& rock = grid.at(pos);
    const Position below = pos + kDown;
    const Object& under = grid.at(below);

    if (can_land_on(under)) {
        return below;
    }
    if (rock.rock == RockKind::HigherOrder && is_lambda(under)) {
        return below;
    }
    if (is_rock(under) || is_wall(under)) {
        if (is_empty(grid.at(pos + kRight)) && can_land_on(grid.at(below + kRight))) {
            return below + kRight;
        }
        if (is_empty(grid.at(pos + kLeft)) && can_land_on(grid.at(below + kLeft))) {
            return below + kLeft;
        }
    }
    return std::nullopt;
}

}  // namespace

Grid grow_beards(const Grid& before, int growth) {
    Grid after = before;
    if (growth <= 0) {
        return after;
    }

    const int fresh = growth - 1;
    for (const auto& pos : before.find_all(ObjectType::Beard)) {
        const int timer = before.at(pos).growth_timer;
        if (timer > 0) {
            after.set(pos, Object::beard(timer - 1));
            continue;
        }

        after.set(pos, Object::beard(fresh));
        for (const auto& next : neighbors4(pos)) {
            const Object& o = before.at(next);
            if (is_empty(o) || is_earth(o)) {
                after.set(next, Object::beard(fresh));
            }
        }
    }
    return after;
}

Grid settle_rocks(const Grid& before, Position robot, bool& crushed) {
    Grid after = before;

    for (const auto& pos : before.find_all(ObjectType::Rock)) {
        auto dest = rock_destination(before, pos);
        if (!dest) {
            continue;
        }
        // First rock in scan order to claim a cell keeps it.
        if (after.at(*dest) != before.at(*dest)) {
            continue;
        }

        after.set(pos, Object::empty());
        after.set(*dest, before.at(pos));
        if (*dest == robot) {
            crushed = true;
        }
    }
    return after;
}

bool flood(WorldState& state, int tick_number) {
    const Level& level = *state.level;

    if (level.flooding > 0 && tick_number % level.flooding == 0) {
        state.water++;
    }

    if (state.submerged()) {
        state.air--;
    } else {
        state.air = level.waterproof;
    }
    return state.air < 0;
}
