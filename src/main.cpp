#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <cstdlib>
#include <cerrno>
#include <climits>
#include <chrono>
#include <filesystem>
#include "mine_game.h"
#include "input.h"
#include "renderer.h"

namespace fs = std::filesystem;

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [OPTIONS] LEVEL...\n"
              << "\n"
              << "Plays each LEVEL (.map file) in turn. Win or skip (N) moves on to the\n"
              << "next level, restart (X) reloads the current one, a loss or abort (A)\n"
              << "ends the session.\n"
              << "\n"
              << "Options:\n"
              << "  -m, --moves STR    Apply the moves in STR (default: read moves from stdin)\n"
              << "  -i, --interactive  Read moves line by line, printing the map after each\n"
              << "  --color            Colored text output\n"
              << "  --stats            Print session stats to stderr\n"
              << "  -h, --help         Show this help message\n"
              << "\n"
              << "Moves: L R U D (move), W (wait), S (razor), A (abort), X (restart), N (skip)\n"
              << "\n"
              << "PNG Output:\n"
              << "  --png DIR          Save each tick as PNG to DIR\n"
              << "  --cell-size N      Pixels per cell (default: 8)\n"
              << "  --grid             Show grid lines between cells\n";
}

// Strict integer parsing - rejects trailing garbage, overflow, negative values
bool parse_positive_int(const char* str, int& result) {
    if (str == nullptr || *str == '\0') return false;

    char* end;
    errno = 0;
    long val = std::strtol(str, &end, 10);

    // Check for trailing garbage
    if (*end != '\0') return false;

    // Check for overflow
    if (errno == ERANGE || val < 0 || val > INT_MAX) return false;

    result = static_cast<int>(val);
    return true;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> level_paths;
    std::string moves;
    bool moves_given = false;
    bool interactive = false;
    bool color = false;
    bool show_stats = false;

    // PNG options
    bool render_png = false;
    RenderConfig render_config;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-m" || arg == "--moves") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a move string argument\n";
                return 1;
            }
            moves = argv[++i];
            moves_given = true;
        } else if (arg == "-i" || arg == "--interactive") {
            interactive = true;
        } else if (arg == "--color") {
            color = true;
        } else if (arg == "--stats") {
            show_stats = true;
        } else if (arg == "--png") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a directory argument\n";
                return 1;
            }
            render_config.output_dir = argv[++i];
            render_png = true;
        } else if (arg == "--cell-size") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a number argument\n";
                return 1;
            }
            if (!parse_positive_int(argv[++i], render_config.cell_size) || render_config.cell_size < 1) {
                std::cerr << "Error: Invalid cell size (must be a positive integer)\n";
                return 1;
            }
        } else if (arg == "--grid") {
            render_config.show_grid = true;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Error: Unknown argument '" << arg << "'\n";
            print_usage(argv[0]);
            return 1;
        } else {
            level_paths.push_back(arg);
        }
    }

    if (level_paths.empty()) {
        std::cerr << "Error: No level file given\n";
        print_usage(argv[0]);
        return 1;
    }

    for (const auto& path : level_paths) {
        if (!has_valid_level_extension(path)) {
            std::cerr << "Error: Level file '" << path << "' must have .map extension\n";
            return 1;
        }
    }

    if (interactive && moves_given) {
        std::cerr << "Error: --moves and --interactive cannot be combined\n";
        return 1;
    }

    // Validate PNG output directory
    if (render_png && !fs::is_directory(render_config.output_dir)) {
        std::error_code ec;
        if (!fs::create_directory(render_config.output_dir, ec) && ec) {
            std::cerr << "Error: Cannot create PNG output directory '" << render_config.output_dir << "'\n";
            return 1;
        }
    }

    try {
        auto session_start = std::chrono::high_resolution_clock::now();

        // Batch mode takes the whole route up front; interactive mode refills
        // the queue one line at a time.
        std::vector<Action> queued;
        size_t next_action = 0;
        if (moves_given) {
            queued = parse_moves(moves);
        } else if (!interactive) {
            std::string route((std::istreambuf_iterator<char>(std::cin)),
                              std::istreambuf_iterator<char>());
            queued = parse_moves(route);
        }

        int levels_played = 0;
        int levels_won = 0;
        long total_ticks = 0;
        int frame = 0;
        bool session_over = false;
        size_t level_index = 0;

        auto render = [&](const MineGame& game) {
            if (!render_png) return;
            if (!render_frame(game.state(), render_config, frame)) {
                std::cerr << "Warning: Failed to render frame " << frame << "\n";
            }
            frame++;
        };

        while (!session_over && level_index < level_paths.size()) {
            MineGame game = MineGame::load(level_paths[level_index]);
            levels_played++;
            render(game);

            bool input_exhausted = false;
            while (!game.finished()) {
                if (next_action >= queued.size()) {
                    if (!interactive) {
                        input_exhausted = true;
                        break;
                    }
                    game.write(std::cout, color);
                    write_status(std::cout, game.state());
                    std::cout << "> " << std::flush;

                    std::string line;
                    if (!std::getline(std::cin, line)) {
                        input_exhausted = true;
                        break;
                    }
                    try {
                        queued = parse_moves(line);
                    } catch (const std::invalid_argument& e) {
                        std::cerr << "Error: " << e.what() << "\n";
                        queued.clear();
                    }
                    next_action = 0;
                    continue;
                }

                game.step(queued[next_action++]);
                render(game);
            }

            const WorldState& final_state = game.state();
            total_ticks += final_state.tick;
            game.write(std::cout, color);
            write_status(std::cout, final_state);
            std::cout << "Route: " << format_moves(final_state.history) << "\n";

            if (input_exhausted) {
                break;
            }

            switch (final_state.verdict.progress) {
                case Progress::Win:
                    levels_won++;
                    level_index++;
                    break;
                case Progress::Skip:
                    level_index++;
                    break;
                case Progress::Restart:
                    // Reloaded from its file on the next pass.
                    break;
                case Progress::Loss:
                case Progress::Abort:
                case Progress::Running:
                    session_over = true;
                    break;
            }
        }

        auto session_end = std::chrono::high_resolution_clock::now();

        if (show_stats) {
            auto session_ms = std::chrono::duration_cast<std::chrono::microseconds>(session_end - session_start).count() / 1000.0;

            std::cerr << "⛏️  Mine Session\n";
            std::cerr << "━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
            std::cerr << "🗺️  Levels:     " << levels_played << " played, " << levels_won << " won\n";
            std::cerr << "🔄 Ticks:      " << total_ticks << "\n";
            if (render_png) {
                std::cerr << "🖼️  Frames:     " << frame << " PNG files in " << render_config.output_dir << "/\n";
            }
            std::cerr << "⏱️  Total:      " << session_ms << " ms\n";
            std::cerr << "━━━━━━━━━━━━━━━━━━━━━━━━━━\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
