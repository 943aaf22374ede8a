#ifndef MINE_RENDERER_H
#define MINE_RENDERER_H

#include "world.h"

#include <cstdint>
#include <ostream>
#include <string>

/**
 * Configuration for rendering world frames to PNG images.
 * Colors are RGBA packed little-endian (0xAABBGGRR).
 */
struct RenderConfig {
    std::string output_dir = ".";   // Directory to save PNG files
    int cell_size = 8;              // Pixels per cell
    int max_width = 4096;           // Maximum image width
    int max_height = 4096;          // Maximum image height
    uint32_t grid_color = 0xFF333333;   // RGBA: dark gray (optional grid lines)
    uint32_t water_color = 0xFFC06020;  // RGBA: blue, blended into flooded rows
    bool show_grid = false;         // Draw grid lines
    int64_t max_pixels = 16 * 1024 * 1024;  // Maximum total pixels (16 megapixels)
};

/** Fill color of an object in PNG frames. */
[[nodiscard]] uint32_t object_color(const Object& object) noexcept;

/** Average two packed colors channel by channel. */
[[nodiscard]] uint32_t blend_colors(uint32_t a, uint32_t b) noexcept;

/**
 * Render a world frame to `<output_dir>/frame_NNNNN.png`.
 * The top row of the map is the top row of the image; rows at or below the
 * water line are tinted with `water_color`.
 *
 * @param state Frame to draw
 * @param config Rendering configuration
 * @param frame_number Frame number (used for filename)
 * @return true if successful, false on error
 */
[[nodiscard]] bool render_frame(const WorldState& state, const RenderConfig& config, int frame_number);

/**
 * Write the map top-down in the level-file alphabet.
 *
 * A "Trampolines:" legend precedes the map when the level has trampolines,
 * and an "Air: N" line while the robot is under water. With `color`, objects
 * and flooded rows are wrapped in ANSI color codes.
 */
void write_map(std::ostream& out, const WorldState& state, bool color = false);

/** One-line summary: level, tick, lambdas, razors, moves, water, verdict. */
void write_status(std::ostream& out, const WorldState& state);

#endif // MINE_RENDERER_H
