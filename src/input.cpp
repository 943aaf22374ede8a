#include "input.h"

#include <cctype>
#include <stdexcept>

Action parse_action(char c) {
    switch (std::toupper(static_cast<unsigned char>(c))) {
        case 'L': return Action::Left;
        case 'R': return Action::Right;
        case 'U': return Action::Up;
        case 'D': return Action::Down;
        case 'W': return Action::Wait;
        case 'S': return Action::UseRazor;
        case 'A': return Action::Abort;
        case 'X': return Action::Restart;
        case 'N': return Action::Skip;
        default:
            break;
    }
    throw std::invalid_argument(
        std::string("Unknown move '") + c +
        "'. Valid moves: L, R, U, D, W, S, A, X (restart), N (skip)");
}

std::vector<Action> parse_moves(std::string_view route) {
    std::vector<Action> actions;
    actions.reserve(route.size());
    for (char c : route) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        actions.push_back(parse_action(c));
    }
    return actions;
}

char action_symbol(Action action) noexcept {
    switch (action) {
        case Action::Left:     return 'L';
        case Action::Right:    return 'R';
        case Action::Up:       return 'U';
        case Action::Down:     return 'D';
        case Action::Wait:     return 'W';
        case Action::UseRazor: return 'S';
        case Action::Abort:    return 'A';
        case Action::Restart:  return 'X';
        case Action::Skip:     return 'N';
    }
    return '?';
}

std::string format_moves(const std::vector<Action>& actions) {
    std::string route;
    route.reserve(actions.size());
    for (Action action : actions) {
        route.push_back(action_symbol(action));
    }
    return route;
}
