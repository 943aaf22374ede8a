#ifndef INPUT_H
#define INPUT_H

#include "world.h"

#include <string>
#include <string_view>
#include <vector>

/**
 * Parse one route character into an Action.
 * Accepts L, R, U, D, W, S (razor), A (abort), X (restart), N (skip),
 * case-insensitive.
 * @throws std::invalid_argument on unrecognized character
 */
[[nodiscard]] Action parse_action(char c);

/**
 * Parse a route string, skipping whitespace.
 * @throws std::invalid_argument on unrecognized character
 */
[[nodiscard]] std::vector<Action> parse_moves(std::string_view route);

/** Route character for an action (inverse of parse_action). */
[[nodiscard]] char action_symbol(Action action) noexcept;

/** Route string for a sequence of actions. */
[[nodiscard]] std::string format_moves(const std::vector<Action>& actions);

#endif // INPUT_H
