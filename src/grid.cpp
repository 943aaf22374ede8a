#include "grid.h"

#include <algorithm>
#include <stdexcept>
#include <string>

std::vector<Position> scan_order(std::vector<Position> positions) {
    std::sort(positions.begin(), positions.end(), scan_before);
    return positions;
}

std::vector<Position> scan_order(const PositionSet& positions) {
    return scan_order(std::vector<Position>(positions.begin(), positions.end()));
}

Grid::Grid(int width, int height) {
    if (width < 0 || height < 0) {
        throw std::invalid_argument("Grid dimensions must be non-negative");
    }
    width_ = width;
    height_ = height;
    cells_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), Object::empty());
}

const Object& Grid::at(Position pos) const noexcept {
    static const Object kOutside = Object::wall();
    if (!contains(pos)) {
        return kOutside;
    }
    return cells_[index(pos)];
}

void Grid::set(Position pos, const Object& object) {
    if (!contains(pos)) {
        throw std::out_of_range(
            "Position (" + std::to_string(pos.x) + ", " + std::to_string(pos.y) +
            ") is outside the " + std::to_string(width_) + "x" + std::to_string(height_) + " map");
    }
    cells_[index(pos)] = object;
}

// Storage is row-major from the bottom row, so walking it is already scan order.
std::vector<Position> Grid::positions() const {
    std::vector<Position> result;
    result.reserve(cells_.size());
    for (int y = 1; y <= height_; y++) {
        for (int x = 1; x <= width_; x++) {
            result.push_back({x, y});
        }
    }
    return result;
}

std::vector<Position> Grid::find_all(ObjectType type) const {
    std::vector<Position> result;
    for (int y = 1; y <= height_; y++) {
        for (int x = 1; x <= width_; x++) {
            if (cells_[index({x, y})].type == type) {
                result.push_back({x, y});
            }
        }
    }
    return result;
}

size_t Grid::count(ObjectType type) const noexcept {
    return static_cast<size_t>(std::count_if(cells_.begin(), cells_.end(),
        [type](const Object& o) { return o.type == type; }));
}
