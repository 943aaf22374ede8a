#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"
#include "renderer.h"

#include <vector>
#include <algorithm>
#include <cstdio>
#include <string>

uint32_t object_color(const Object& object) noexcept {
    switch (object.type) {
        case ObjectType::Empty:      return 0xFF000000;  // black
        case ObjectType::Wall:       return 0xFF808080;  // gray
        case ObjectType::Earth:      return 0xFF13458B;  // brown
        case ObjectType::Robot:      return 0xFFFF8040;  // blue
        case ObjectType::Rock:
            return object.rock == RockKind::Simple ? 0xFF3030C0   // red
                                                   : 0xFF2060FF;  // orange
        case ObjectType::Lambda:     return 0xFFFFFF00;  // cyan
        case ObjectType::Lift:
            return object.lift == LiftState::Open ? 0xFF00FF00    // bright green
                                                  : 0xFF008000;   // dark green
        case ObjectType::Trampoline: return 0xFFFF00FF;  // magenta
        case ObjectType::Target:     return 0xFF800080;  // dark magenta
        case ObjectType::Beard:      return 0xFF2F6B55;  // olive
        case ObjectType::Razor:      return 0xFFE0E0E0;  // light gray
    }
    return 0xFF000000;
}

uint32_t blend_colors(uint32_t a, uint32_t b) noexcept {
    uint32_t result = 0;
    for (int shift = 0; shift < 32; shift += 8) {
        uint32_t ca = (a >> shift) & 0xFF;
        uint32_t cb = (b >> shift) & 0xFF;
        result |= ((ca + cb) / 2) << shift;
    }
    return result;
}

bool render_frame(const WorldState& state, const RenderConfig& config, int frame_number) {
    const Grid& grid = state.grid;
    const int64_t width_cells = grid.width();
    const int64_t height_cells = grid.height();

    if (width_cells <= 0 || height_cells <= 0 || config.cell_size < 1) {
        return false;
    }

    // Scale down if image would be too large
    int eff_cell_size = config.cell_size;
    auto too_large = [&](int cs) {
        int64_t w = width_cells * cs;
        int64_t h = height_cells * cs;
        return w > config.max_width || h > config.max_height || w * h > config.max_pixels;
    };
    while (too_large(eff_cell_size) && eff_cell_size > 1) {
        eff_cell_size--;
    }
    if (too_large(eff_cell_size)) {
        return false;
    }

    const int img_width = static_cast<int>(width_cells * eff_cell_size);
    const int img_height = static_cast<int>(height_cells * eff_cell_size);

    // Create image buffer (RGBA)
    std::vector<uint32_t> pixels(static_cast<size_t>(img_width) * img_height, 0xFF000000);

    const bool draw_grid = config.show_grid && eff_cell_size > 2;
    const int inset = draw_grid ? 1 : 0;

    for (const auto& pos : grid.positions()) {
        uint32_t color = object_color(grid.at(pos));
        if (pos.y <= state.water) {
            color = blend_colors(color, config.water_color);
        }

        // Image rows run top-down, map rows bottom-up.
        int px_start_x = (pos.x - 1) * eff_cell_size;
        int px_start_y = (grid.height() - pos.y) * eff_cell_size;

        int max_dy = std::min(eff_cell_size, img_height - px_start_y);
        int max_dx = std::min(eff_cell_size, img_width - px_start_x);
        for (int dy = 0; dy < max_dy; dy++) {
            for (int dx = 0; dx < max_dx; dx++) {
                bool on_line = dy < inset || dx < inset;
                pixels[static_cast<size_t>(px_start_y + dy) * img_width + (px_start_x + dx)] =
                    on_line ? config.grid_color : color;
            }
        }
    }

    char frame_str[16];
    snprintf(frame_str, sizeof(frame_str), "%05d", frame_number);
    std::string filename = config.output_dir + "/frame_" + frame_str + ".png";

    // Write PNG (RGBA = 4 channels)
    int result = stbi_write_png(filename.c_str(), img_width, img_height, 4,
                                 pixels.data(), img_width * 4);

    return result != 0;
}
