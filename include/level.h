#ifndef LEVEL_H
#define LEVEL_H

#include "grid.h"

#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <ankerl/unordered_dense.h>

/** Trampoline id ('A'-'I') -> Target id ('0'-'9'). Many-to-one. */
using TrampolineMap = ankerl::unordered_dense::map<char, char>;

enum class LevelErrorKind {
    InvalidCharacter,
    InvalidMetadata,
    UnknownMetadata,
    InvalidTrampoline,
    MissingRobot,
    DuplicateRobot,
    MissingLift,
    DuplicateLift,
    EmptyMap
};

/**
 * A level file that could not be turned into a Level.
 * Carries the level name and, where there is one, the offending character
 * and the offending line.
 */
class LevelError : public std::runtime_error {
public:
    LevelError(LevelErrorKind kind, std::string level_name, std::string message,
               char offending = '\0', std::string line = {});

    LevelErrorKind kind() const noexcept { return kind_; }
    const std::string& level_name() const noexcept { return level_name_; }
    char offending() const noexcept { return offending_; }
    const std::string& line() const noexcept { return line_; }

private:
    LevelErrorKind kind_;
    std::string level_name_;
    char offending_;
    std::string line_;
};

/**
 * Check if filename has the level extension (.map).
 * @param filename The filename to check
 * @return true if extension is valid
 */
inline bool has_valid_level_extension(std::string_view filename) noexcept {
    size_t dot_pos = filename.rfind('.');
    if (dot_pos == std::string_view::npos) return false;
    return filename.substr(dot_pos) == ".map";
}

/**
 * Static description of a level, produced once by the loader.
 *
 * Exception safety:
 * - parse(): Strong guarantee (throws LevelError on invalid input, no Level produced)
 */
struct Level {
    static constexpr int kDefaultGrowth = 25;
    static constexpr int kDefaultRazors = 0;
    static constexpr int kDefaultWater = 0;
    static constexpr int kDefaultFlooding = 0;
    static constexpr int kDefaultWaterproof = 10;

    std::string name;
    Grid grid;
    TrampolineMap trampolines;
    int growth = kDefaultGrowth;
    int razors = kDefaultRazors;
    int lambdas = 0;          // lambdas required to open the lift
    int water = kDefaultWater;
    int flooding = kDefaultFlooding;
    int waterproof = kDefaultWaterproof;

    /**
     * Parse a level from a string.
     * @param input Map block, blank line, metadata lines
     * @param name Level name reported in errors
     * @throws LevelError on invalid format
     */
    [[nodiscard]] static Level parse(const std::string& input, const std::string& name);

    /**
     * Parse a level from an input stream.
     * @throws LevelError on invalid format
     */
    [[nodiscard]] static Level parse(std::istream& input, const std::string& name);

    /**
     * Load a level file; the level is named after the file's base name.
     * @throws std::runtime_error if the file cannot be opened
     * @throws LevelError on invalid format
     */
    [[nodiscard]] static Level load(const std::string& path);
};

#endif // LEVEL_H
