#include "level.h"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

LevelError::LevelError(LevelErrorKind kind, std::string level_name, std::string message,
                       char offending, std::string line)
    : std::runtime_error("Level '" + level_name + "': " + message),
      kind_(kind),
      level_name_(std::move(level_name)),
      offending_(offending),
      line_(std::move(line)) {}

namespace {

std::vector<std::string> split_words(const std::string& line) {
    std::vector<std::string> words;
    std::istringstream stream(line);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return words;
}

// Strict non-negative integer: the whole word must be digits.
bool parse_count(const std::string& word, int& result) {
    const char* first = word.data();
    const char* last = first + word.size();
    if (first == last || *first == '-' || *first == '+') return false;
    auto [ptr, ec] = std::from_chars(first, last, result);
    return ec == std::errc{} && ptr == last;
}

struct Metadata {
    TrampolineMap trampolines;
    int growth = Level::kDefaultGrowth;
    int razors = Level::kDefaultRazors;
    int water = Level::kDefaultWater;
    int flooding = Level::kDefaultFlooding;
    int waterproof = Level::kDefaultWaterproof;
};

void parse_metadata_line(const std::string& name, const std::string& line, Metadata& meta) {
    std::vector<std::string> words = split_words(line);
    if (words.empty()) {
        return;
    }
    const std::string& key = words[0];

    if (key == "Trampoline") {
        if (words.size() != 4 || words[2] != "targets" ||
            words[1].size() != 1 || words[1][0] < 'A' || words[1][0] > 'I' ||
            words[3].size() != 1 || words[3][0] < '0' || words[3][0] > '9') {
            throw LevelError(LevelErrorKind::InvalidTrampoline, name,
                             "malformed trampoline line '" + line + "'", '\0', line);
        }
        meta.trampolines[words[1][0]] = words[3][0];
        return;
    }

    int* field = nullptr;
    if (key == "Growth") field = &meta.growth;
    else if (key == "Razors") field = &meta.razors;
    else if (key == "Water") field = &meta.water;
    else if (key == "Flooding") field = &meta.flooding;
    else if (key == "Waterproof") field = &meta.waterproof;

    if (field == nullptr) {
        throw LevelError(LevelErrorKind::UnknownMetadata, name,
                         "unknown metadata line '" + line + "'", '\0', line);
    }
    if (words.size() != 2 || !parse_count(words[1], *field)) {
        throw LevelError(LevelErrorKind::InvalidMetadata, name,
                         "malformed metadata value in line '" + line + "'", '\0', line);
    }
}

Grid parse_map(const std::string& name, const std::vector<std::string>& lines, int beard_timer) {
    size_t width = 0;
    for (const auto& line : lines) {
        width = std::max(width, line.size());
    }

    const int height = static_cast<int>(lines.size());
    Grid grid(static_cast<int>(width), height);

    // The last authored line is row 1.
    for (int i = 0; i < height; i++) {
        const std::string& line = lines[static_cast<size_t>(i)];
        const int y = height - i;
        for (size_t j = 0; j < line.size(); j++) {
            auto object = char_to_object(line[j], beard_timer);
            if (!object) {
                throw LevelError(LevelErrorKind::InvalidCharacter, name,
                                 std::string("invalid character '") + line[j] +
                                 "' in map line '" + line + "'",
                                 line[j], line);
            }
            grid.set({static_cast<int>(j) + 1, y}, *object);
        }
    }
    return grid;
}

void validate(const std::string& name, const Grid& grid, const TrampolineMap& trampolines) {
    size_t robots = grid.count(ObjectType::Robot);
    if (robots == 0) {
        throw LevelError(LevelErrorKind::MissingRobot, name, "map has no robot", 'R');
    }
    if (robots > 1) {
        throw LevelError(LevelErrorKind::DuplicateRobot, name, "map has more than one robot", 'R');
    }

    size_t lifts = grid.count(ObjectType::Lift);
    if (lifts == 0) {
        throw LevelError(LevelErrorKind::MissingLift, name, "map has no lift", 'L');
    }
    if (lifts > 1) {
        throw LevelError(LevelErrorKind::DuplicateLift, name, "map has more than one lift", 'L');
    }

    for (const auto& pos : grid.find_all(ObjectType::Trampoline)) {
        char id = grid.at(pos).id;
        auto it = trampolines.find(id);
        if (it == trampolines.end()) {
            throw LevelError(LevelErrorKind::InvalidTrampoline, name,
                             std::string("trampoline '") + id + "' has no target", id);
        }
        bool target_found = false;
        for (const auto& target_pos : grid.find_all(ObjectType::Target)) {
            if (grid.at(target_pos).id == it->second) {
                target_found = true;
                break;
            }
        }
        if (!target_found) {
            throw LevelError(LevelErrorKind::InvalidTrampoline, name,
                             std::string("target '") + it->second + "' of trampoline '" + id +
                             "' is not on the map", it->second);
        }
    }
}

}  // namespace

// --- Parsing ---

Level Level::parse(std::istream& input, const std::string& name) {
    std::vector<std::string> map_lines;
    std::vector<std::string> metadata_lines;
    std::string line;
    bool in_metadata = false;

    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            // Blank lines before the map are skipped; the first one after it
            // separates map from metadata.
            if (!map_lines.empty()) {
                in_metadata = true;
            }
            continue;
        }
        if (in_metadata) {
            metadata_lines.push_back(line);
        } else {
            map_lines.push_back(line);
        }
    }

    if (map_lines.empty()) {
        throw LevelError(LevelErrorKind::EmptyMap, name, "level has no map");
    }

    Metadata meta;
    for (const auto& meta_line : metadata_lines) {
        parse_metadata_line(name, meta_line, meta);
    }

    Grid grid = parse_map(name, map_lines, meta.growth - 1);
    validate(name, grid, meta.trampolines);

    Level level;
    level.name = name;
    level.lambdas = static_cast<int>(grid.count(ObjectType::Lambda));
    level.grid = std::move(grid);
    level.trampolines = std::move(meta.trampolines);
    level.growth = meta.growth;
    level.razors = meta.razors;
    level.water = meta.water;
    level.flooding = meta.flooding;
    level.waterproof = meta.waterproof;
    return level;
}

Level Level::parse(const std::string& input, const std::string& name) {
    std::istringstream stream(input);
    return parse(stream, name);
}

Level Level::load(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open level file '" + path + "'");
    }
    return parse(file, std::filesystem::path(path).filename().string());
}
