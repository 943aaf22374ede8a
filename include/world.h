#ifndef WORLD_H
#define WORLD_H

#include "grid.h"
#include "level.h"

#include <memory>
#include <string>
#include <vector>

#include <ankerl/unordered_dense.h>

enum class Action {
    Up,
    Down,
    Left,
    Right,
    Wait,
    UseRazor,
    Abort,
    Restart,
    Skip
};

/** Abort, Restart and Skip end the level without simulating a tick. */
inline bool is_meta_action(Action action) noexcept {
    return action == Action::Abort || action == Action::Restart || action == Action::Skip;
}

enum class Progress {
    Running,
    Win,
    Loss,
    Abort,
    Restart,
    Skip
};

enum class LossReason {
    None,
    CrushedByRock,
    Drowned
};

struct Verdict {
    Progress progress = Progress::Running;
    LossReason reason = LossReason::None;

    bool terminal() const noexcept { return progress != Progress::Running; }

    bool operator==(const Verdict& other) const noexcept {
        return progress == other.progress && reason == other.reason;
    }

    bool operator!=(const Verdict& other) const noexcept {
        return !(*this == other);
    }
};

/** Human-readable verdict: "running", "win", "loss (drowned)", ... */
[[nodiscard]] std::string describe(const Verdict& verdict);

/** Target id -> position of the target. */
using TargetIndex = ankerl::unordered_dense::map<char, Position>;

/** Target id -> positions of every trampoline leading to it, in scan order. */
using TargetSources = ankerl::unordered_dense::map<char, std::vector<Position>>;

/**
 * One frame of a running level.
 *
 * The tick engine never modifies a WorldState; it copies it, grid included,
 * and returns the copy. Only the immutable Level is shared between frames.
 */
struct WorldState {
    std::shared_ptr<const Level> level;

    Grid grid;
    Position robot{0, 0};
    Position lift{0, 0};
    int tick = 0;
    int water = 0;            // highest flooded row; 0 = dry
    int air = 0;              // submerged ticks left before drowning

    TargetIndex targets;
    TargetSources target_sources;

    Verdict verdict;
    int lambdas_collected = 0;
    int razors = 0;
    int moves = 0;
    std::vector<Action> history;

    /** True once the robot has collected every lambda the lift asks for. */
    bool quota_met() const noexcept {
        return lambdas_collected >= level->lambdas;
    }

    /** True while the robot's row is at or below the water row. */
    bool submerged() const noexcept {
        return robot.y <= water;
    }
};

#endif // WORLD_H
