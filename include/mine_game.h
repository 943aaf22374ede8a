#ifndef MINE_GAME_H
#define MINE_GAME_H

#include "engine.h"
#include "level.h"
#include "world.h"

#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

/**
 * One level being played.
 *
 * Holds the immutable Level and the current frame, and replaces the frame
 * with the engine's result on every step.
 *
 * Thread safety: Not thread-safe. External synchronization required for concurrent access.
 *
 * Exception safety:
 * - parse()/load(): Strong guarantee (throws on invalid input, no game created)
 * - step()/run(): Strong guarantee (the frame is only replaced once a step succeeds)
 * - write()/format(): Strong guarantee (output failure doesn't affect state)
 */
class MineGame {
public:
    explicit MineGame(Level level);
    explicit MineGame(std::shared_ptr<const Level> level);

    /**
     * Parse a level from a string.
     * @throws LevelError on invalid format
     */
    [[nodiscard]] static MineGame parse(const std::string& input, const std::string& name);

    /**
     * Parse a level from an input stream.
     * @throws LevelError on invalid format
     */
    [[nodiscard]] static MineGame parse(std::istream& input, const std::string& name);

    /**
     * Load a level file.
     * @throws std::runtime_error if the file cannot be opened
     * @throws LevelError on invalid format
     */
    [[nodiscard]] static MineGame load(const std::string& path);

    /**
     * Apply one action.
     * @return The verdict after the action
     * @throws std::logic_error if the level has already finished
     */
    Verdict step(Action action);

    /**
     * Apply actions in order until the level finishes or they run out.
     * Actions after the finishing one are ignored.
     * @return The verdict after the last applied action
     */
    Verdict run(const std::vector<Action>& actions);

    /**
     * Parse a route string and run it.
     * @throws std::invalid_argument on an unknown move character
     */
    Verdict run(std::string_view route);

    /** Go back to the level's first frame. */
    void restart();

    bool finished() const noexcept { return state_.verdict.terminal(); }

    /** Get read-only access to the current frame */
    const WorldState& state() const noexcept { return state_; }

    const Level& level() const noexcept { return *level_; }

    /**
     * Write the current frame as text (see write_map).
     * @param out Output stream
     * @param color If true, wrap objects in ANSI color codes
     */
    void write(std::ostream& out, bool color = false) const;

    /**
     * Format the current frame as text.
     * @return Map text, without color
     */
    std::string format() const;

private:
    std::shared_ptr<const Level> level_;
    WorldState state_;
};

#endif // MINE_GAME_H
