#include "engine.h"

#include <stdexcept>

namespace {

Position direction_of(Action action) {
    switch (action) {
        case Action::Up:    return kUp;
        case Action::Down:  return kDown;
        case Action::Left:  return kLeft;
        case Action::Right: return kRight;
        case Action::Wait:
        case Action::UseRazor:
        case Action::Abort:
        case Action::Restart:
        case Action::Skip:
            break;
    }
    throw std::invalid_argument("Action has no direction");
}

// The cell the robot leaves becomes empty, except the lift, which it can
// only have entered while open.
void place_robot(WorldState& next, Position from, Position to) {
    next.grid.set(from, from == next.lift ? Object::make_lift(LiftState::Open)
                                          : Object::empty());
    next.grid.set(to, Object::robot());
    next.robot = to;
}

ActionOutcome jump(const WorldState& prev, char trampoline, WorldState& next) {
    auto mapping = prev.level->trampolines.find(trampoline);
    if (mapping == prev.level->trampolines.end()) {
        return {};
    }
    const char target = mapping->second;
    auto target_it = prev.targets.find(target);
    if (target_it == prev.targets.end()) {
        return {};
    }
    const Position landing = target_it->second;

    // Every trampoline of the group is used up along with the target.
    auto sources = prev.target_sources.find(target);
    if (sources != prev.target_sources.end()) {
        for (const auto& pos : sources->second) {
            next.grid.set(pos, Object::empty());
        }
    }
    next.targets.erase(target);
    next.target_sources.erase(target);

    place_robot(next, prev.robot, landing);
    return {true, false};
}

ActionOutcome move(const WorldState& prev, Position dir, WorldState& next) {
    const Position from = prev.robot;
    const Position to = from + dir;
    const Object& dest = prev.grid.at(to);

    switch (dest.type) {
        case ObjectType::Empty:
        case ObjectType::Earth:
            place_robot(next, from, to);
            return {true, false};

        case ObjectType::Lambda:
            place_robot(next, from, to);
            next.lambdas_collected++;
            return {true, false};

        case ObjectType::Razor:
            place_robot(next, from, to);
            next.razors++;
            return {true, false};

        case ObjectType::Rock: {
            if (dest.rock != RockKind::Simple || dir.y != 0) {
                return {};
            }
            const Position beyond = to + dir;
            if (!is_empty(prev.grid.at(beyond))) {
                return {};
            }
            next.grid.set(beyond, dest);
            place_robot(next, from, to);
            return {true, false};
        }

        case ObjectType::Lift:
            // `next` already has the lift opened if the quota is met.
            if (!is_lift_open(next.grid.at(to))) {
                return {};
            }
            place_robot(next, from, to);
            return {true, prev.quota_met()};

        case ObjectType::Trampoline:
            return jump(prev, dest.id, next);

        case ObjectType::Wall:
        case ObjectType::Target:
        case ObjectType::Beard:
        case ObjectType::Robot:
            return {};
    }
    return {};
}

ActionOutcome use_razor(const WorldState& prev, WorldState& next) {
    if (prev.razors <= 0) {
        return {};
    }
    next.razors--;
    for (const auto& pos : neighbors4(prev.robot)) {
        if (is_beard(prev.grid.at(pos))) {
            next.grid.set(pos, Object::empty());
        }
    }
    return {true, false};
}

}  // namespace

ActionOutcome resolve_action(const WorldState& prev, Action action, WorldState& next) {
    if (is_lift_closed(prev.grid.at(prev.lift)) && prev.quota_met()) {
        next.grid.set(prev.lift, Object::make_lift(LiftState::Open));
    }

    switch (action) {
        case Action::Wait:
            return {true, false};
        case Action::UseRazor:
            return use_razor(prev, next);
        case Action::Up:
        case Action::Down:
        case Action::Left:
        case Action::Right:
            return move(prev, direction_of(action), next);
        case Action::Abort:
        case Action::Restart:
        case Action::Skip:
            break;
    }
    throw std::invalid_argument("Meta-actions end the level and are never resolved");
}
