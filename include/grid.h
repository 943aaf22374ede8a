#ifndef GRID_H
#define GRID_H

#include "objects.h"

#include <cstddef>
#include <cstdint>
#include <vector>

#include <ankerl/unordered_dense.h>

/**
 * A cell coordinate: column `x` (1 = leftmost) and row `y` (1 = bottom).
 * Rows grow upward.
 */
struct Position {
    int x;
    int y;

    bool operator==(const Position& other) const noexcept {
        return x == other.x && y == other.y;
    }

    bool operator!=(const Position& other) const noexcept {
        return !(*this == other);
    }

    Position operator+(const Position& other) const noexcept {
        return {x + other.x, y + other.y};
    }
};

/**
 * Hash function for Position.
 * Uses a golden ratio derived multiplier for good distribution.
 */
struct PositionHash {
    static constexpr uint64_t kHashMultiplier = 0x9e3779b97f4a7c15ULL;

    using is_avalanching = void;  // Hint for ankerl::unordered_dense

    size_t operator()(const Position& pos) const noexcept {
        uint64_t h = static_cast<uint64_t>(static_cast<uint32_t>(pos.x));
        h ^= static_cast<uint64_t>(static_cast<uint32_t>(pos.y)) * kHashMultiplier;
        h ^= h >> 33;
        h *= 0xff51afd7ed558ccdULL;
        h ^= h >> 33;
        h *= 0xc4ceb9fe1a85ec53ULL;
        h ^= h >> 33;
        return static_cast<size_t>(h);
    }
};

using PositionSet = ankerl::unordered_dense::set<Position, PositionHash>;

// Unit offsets
inline constexpr Position kUp{0, 1};
inline constexpr Position kDown{0, -1};
inline constexpr Position kLeft{-1, 0};
inline constexpr Position kRight{1, 0};

/** The four orthogonal neighbours of `pos`, in scan order. */
inline std::vector<Position> neighbors4(Position pos) {
    return {pos + kDown, pos + kLeft, pos + kRight, pos + kUp};
}

/**
 * Scan order used by every rule that walks the map: ascending row, then
 * ascending column (bottom row first, left to right).
 */
inline bool scan_before(const Position& a, const Position& b) noexcept {
    if (a.y != b.y) return a.y < b.y;
    return a.x < b.x;
}

/**
 * Return `positions` sorted into scan order.
 */
[[nodiscard]] std::vector<Position> scan_order(std::vector<Position> positions);
[[nodiscard]] std::vector<Position> scan_order(const PositionSet& positions);

/**
 * Dense rectangular map of objects, `width` columns by `height` rows, with
 * 1-based coordinates.
 *
 * Reads outside the rectangle answer Wall, so rules that look one cell past
 * the authored border see solid rock. Writes outside the rectangle throw.
 */
class Grid {
public:
    Grid() = default;
    Grid(int width, int height);

    int width() const noexcept { return width_; }
    int height() const noexcept { return height_; }

    bool contains(Position pos) const noexcept {
        return pos.x >= 1 && pos.x <= width_ && pos.y >= 1 && pos.y <= height_;
    }

    /** Object at `pos`, or Wall outside the map. */
    const Object& at(Position pos) const noexcept;

    /**
     * Replace the object at `pos`.
     * @throws std::out_of_range if `pos` is outside the map
     */
    void set(Position pos, const Object& object);

    /** Every position of the map, in scan order. */
    std::vector<Position> positions() const;

    /** Positions holding an object of the given type, in scan order. */
    std::vector<Position> find_all(ObjectType type) const;

    /** Count of cells holding an object of the given type. */
    size_t count(ObjectType type) const noexcept;

    bool operator==(const Grid& other) const noexcept {
        return width_ == other.width_ && height_ == other.height_ && cells_ == other.cells_;
    }

    bool operator!=(const Grid& other) const noexcept {
        return !(*this == other);
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<Object> cells_;

    size_t index(Position pos) const noexcept {
        return static_cast<size_t>(pos.y - 1) * static_cast<size_t>(width_) +
               static_cast<size_t>(pos.x - 1);
    }
};

#endif // GRID_H
