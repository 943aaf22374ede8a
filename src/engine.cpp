#include "engine.h"

#include <stdexcept>
#include <string>
#include <utility>

WorldState initialize(std::shared_ptr<const Level> level) {
    if (!level) {
        throw std::invalid_argument("Cannot initialize a world without a level");
    }

    WorldState state;
    state.grid = level->grid;

    auto robots = state.grid.find_all(ObjectType::Robot);
    auto lifts = state.grid.find_all(ObjectType::Lift);
    if (robots.size() != 1 || lifts.size() != 1) {
        throw std::invalid_argument(
            "Level '" + level->name + "' must hold exactly one robot and one lift");
    }
    state.robot = robots.front();
    state.lift = lifts.front();

    state.water = level->water;
    state.air = level->waterproof;
    state.razors = level->razors;

    for (const auto& pos : state.grid.find_all(ObjectType::Target)) {
        state.targets[state.grid.at(pos).id] = pos;
    }
    for (const auto& pos : state.grid.find_all(ObjectType::Trampoline)) {
        auto it = level->trampolines.find(state.grid.at(pos).id);
        if (it != level->trampolines.end()) {
            state.target_sources[it->second].push_back(pos);
        }
    }

    state.level = std::move(level);
    return state;
}

WorldState initialize(const Level& level) {
    return initialize(std::make_shared<const Level>(level));
}

StepResult step(const WorldState& state, Action action) {
    if (state.verdict.terminal()) {
        throw std::logic_error("Cannot step level '" + state.level->name +
                               "': it has already finished");
    }

    WorldState next = state;
    next.history.push_back(action);

    if (is_meta_action(action)) {
        next.verdict = meta_verdict(action);
        Verdict verdict = next.verdict;
        return {std::move(next), verdict};
    }

    const int tick_number = state.tick + 1;
    TickOutcome outcome;

    next.moves++;
    outcome.reached_lift = resolve_action(state, action, next).reached_lift;
    next.grid = grow_beards(next.grid, state.level->growth);
    next.grid = settle_rocks(next.grid, next.robot, outcome.crushed);
    if (!outcome.crushed) {
        outcome.drowned = flood(next, tick_number);
    }

    next.tick = tick_number;
    next.verdict = evaluate_progress(outcome);
    Verdict verdict = next.verdict;
    return {std::move(next), verdict};
}

// --- Progress ---

Verdict evaluate_progress(const TickOutcome& outcome) noexcept {
    if (outcome.crushed) return {Progress::Loss, LossReason::CrushedByRock};
    if (outcome.drowned) return {Progress::Loss, LossReason::Drowned};
    if (outcome.reached_lift) return {Progress::Win, LossReason::None};
    return {};
}

Verdict meta_verdict(Action action) {
    switch (action) {
        case Action::Abort:   return {Progress::Abort, LossReason::None};
        case Action::Restart: return {Progress::Restart, LossReason::None};
        case Action::Skip:    return {Progress::Skip, LossReason::None};
        case Action::Up:
        case Action::Down:
        case Action::Left:
        case Action::Right:
        case Action::Wait:
        case Action::UseRazor:
            break;
    }
    throw std::invalid_argument("Not a meta-action");
}
