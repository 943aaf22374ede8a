#include "renderer.h"

#include <algorithm>
#include <utility>
#include <vector>

namespace {

constexpr const char* kReset = "\x1b[0m";
constexpr const char* kWater = "\x1b[94m";

// ANSI foreground for an object, or nullptr for the terminal default.
const char* ansi_color(const Object& object) noexcept {
    switch (object.type) {
        case ObjectType::Robot:      return "\x1b[34m";
        case ObjectType::Rock:       return "\x1b[91m";
        case ObjectType::Lambda:     return "\x1b[36m";
        case ObjectType::Lift:
            return object.lift == LiftState::Open ? "\x1b[92m" : "\x1b[32m";
        case ObjectType::Trampoline: return "\x1b[95m";
        case ObjectType::Target:     return "\x1b[35m";
        case ObjectType::Empty:
        case ObjectType::Wall:
        case ObjectType::Earth:
        case ObjectType::Beard:
        case ObjectType::Razor:
            return nullptr;
    }
    return nullptr;
}

}  // namespace

void write_map(std::ostream& out, const WorldState& state, bool color) {
    const Level& level = *state.level;

    if (!level.trampolines.empty()) {
        std::vector<std::pair<char, char>> legend(level.trampolines.begin(),
                                                  level.trampolines.end());
        std::sort(legend.begin(), legend.end());
        out << "Trampolines:\n";
        for (const auto& [trampoline, target] : legend) {
            out << trampoline << " -> " << target << "\n";
        }
    }
    if (state.submerged()) {
        out << "Air: " << state.air << "\n";
    }

    const Grid& grid = state.grid;
    std::string line;
    for (int y = grid.height(); y >= 1; y--) {
        line.clear();
        for (int x = 1; x <= grid.width(); x++) {
            const Object& object = grid.at({x, y});
            const char* code = y <= state.water ? kWater : ansi_color(object);
            if (color && code != nullptr) {
                line += code;
                line += object_to_char(object);
                line += kReset;
            } else {
                line += object_to_char(object);
            }
        }
        out << line << "\n";
    }
}

void write_status(std::ostream& out, const WorldState& state) {
    out << "Level: " << state.level->name
        << "  Tick: " << state.tick
        << "  Lambdas: " << state.lambdas_collected << "/" << state.level->lambdas
        << "  Razors: " << state.razors
        << "  Moves: " << state.moves
        << "  Water: " << state.water
        << "  Verdict: " << describe(state.verdict) << "\n";
}
