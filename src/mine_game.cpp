#include "mine_game.h"
#include "input.h"
#include "renderer.h"

#include <sstream>
#include <utility>

// --- Constructors ---

MineGame::MineGame(Level level)
    : MineGame(std::make_shared<const Level>(std::move(level))) {}

MineGame::MineGame(std::shared_ptr<const Level> level)
    : level_(std::move(level)), state_(initialize(level_)) {}

// --- Parsing ---

MineGame MineGame::parse(const std::string& input, const std::string& name) {
    return MineGame(Level::parse(input, name));
}

MineGame MineGame::parse(std::istream& input, const std::string& name) {
    return MineGame(Level::parse(input, name));
}

MineGame MineGame::load(const std::string& path) {
    return MineGame(Level::load(path));
}

// --- Simulation ---

Verdict MineGame::step(Action action) {
    StepResult result = ::step(state_, action);
    state_ = std::move(result.state);
    return result.verdict;
}

Verdict MineGame::run(const std::vector<Action>& actions) {
    for (Action action : actions) {
        if (finished()) {
            break;
        }
        step(action);
    }
    return state_.verdict;
}

Verdict MineGame::run(std::string_view route) {
    return run(parse_moves(route));
}

void MineGame::restart() {
    state_ = initialize(level_);
}

// --- Output ---

void MineGame::write(std::ostream& out, bool color) const {
    write_map(out, state_, color);
}

std::string MineGame::format() const {
    std::ostringstream out;
    write(out);
    return out.str();
}
