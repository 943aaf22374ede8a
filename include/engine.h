#ifndef ENGINE_H
#define ENGINE_H

#include "world.h"

#include <memory>

/**
 * Result of one call to step(): the next frame and its verdict.
 * `verdict` always equals `state.verdict`.
 */
struct StepResult {
    WorldState state;
    Verdict verdict;
};

/**
 * What happened during one simulated tick, as far as the verdict cares.
 */
struct TickOutcome {
    bool crushed = false;        // a rock landed on the robot
    bool drowned = false;        // air ran out
    bool reached_lift = false;   // robot entered an open lift with the quota met
};

/**
 * What the action resolver did with the player's action.
 */
struct ActionOutcome {
    bool accepted = false;       // false when the move was rejected
    bool reached_lift = false;
};

/**
 * Build the first frame of a level: robot and lift located by scanning the
 * map, target indices built from the trampoline mapping, counters from the
 * level's metadata.
 */
[[nodiscard]] WorldState initialize(std::shared_ptr<const Level> level);
[[nodiscard]] WorldState initialize(const Level& level);

/**
 * Advance a running frame by one action.
 *
 * Meta-actions (Abort, Restart, Skip) only set the verdict. Every other
 * action runs the full tick: action resolution, beard growth, rock
 * physics, water and air, win check.
 *
 * @throws std::logic_error if `state` already carries a terminal verdict
 */
[[nodiscard]] StepResult step(const WorldState& state, Action action);

// --- Tick phases ---
//
// Each phase reads the grid it is given and writes into a separate working
// grid, so every object is judged against the grid as it stood when the
// phase began.

/**
 * Apply the player's action to `next`, reading the map from `prev`.
 * `next` must start as a copy of `prev`.
 */
ActionOutcome resolve_action(const WorldState& prev, Action action, WorldState& next);

/**
 * Spread every beard whose countdown has reached zero into its empty or
 * earth neighbours and count the other beards down.
 * Does nothing when `growth` is not positive.
 */
[[nodiscard]] Grid grow_beards(const Grid& before, int growth);

/**
 * Let every rock fall or slide one cell.
 * @param robot Robot position; a rock landing there sets `crushed`
 */
[[nodiscard]] Grid settle_rocks(const Grid& before, Position robot, bool& crushed);

/**
 * Raise the water on flooding ticks and update the robot's air.
 * @param tick_number 1-based number of the tick being computed
 * @return true if the robot drowned
 */
bool flood(WorldState& state, int tick_number);

// --- Progress ---

/** Verdict for a simulated tick. Crushing beats drowning beats winning. */
[[nodiscard]] Verdict evaluate_progress(const TickOutcome& outcome) noexcept;

/**
 * Verdict for Abort, Restart or Skip.
 * @throws std::invalid_argument for any other action
 */
[[nodiscard]] Verdict meta_verdict(Action action);

#endif // ENGINE_H
