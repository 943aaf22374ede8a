#ifndef OBJECTS_H
#define OBJECTS_H

#include <cstdint>
#include <optional>
#include <tuple>

enum class ObjectType : uint8_t {
    Empty,
    Wall,
    Earth,
    Robot,
    Rock,
    Lambda,
    Lift,
    Trampoline,
    Target,
    Beard,
    Razor
};

enum class RockKind : uint8_t {
    Simple,
    HigherOrder
};

enum class LiftState : uint8_t {
    Closed,
    Open
};

/**
 * Content of a single map cell.
 *
 * A tagged value: `type` selects the case, and only the payload field that
 * belongs to that case is meaningful (rock kind, lift state, trampoline or
 * target id, beard countdown). Factories leave every other field at its
 * default so that memberwise comparison equals variant-plus-payload
 * comparison.
 */
struct Object {
    ObjectType type = ObjectType::Empty;
    RockKind rock = RockKind::Simple;
    LiftState lift = LiftState::Closed;
    char id = 0;
    int growth_timer = 0;

    static constexpr Object empty() noexcept { return {}; }
    static constexpr Object wall() noexcept { return of(ObjectType::Wall); }
    static constexpr Object earth() noexcept { return of(ObjectType::Earth); }
    static constexpr Object robot() noexcept { return of(ObjectType::Robot); }
    static constexpr Object lambda() noexcept { return of(ObjectType::Lambda); }
    static constexpr Object razor() noexcept { return of(ObjectType::Razor); }

    static constexpr Object make_rock(RockKind kind) noexcept {
        Object o = of(ObjectType::Rock);
        o.rock = kind;
        return o;
    }

    static constexpr Object make_lift(LiftState state) noexcept {
        Object o = of(ObjectType::Lift);
        o.lift = state;
        return o;
    }

    static constexpr Object trampoline(char id) noexcept {
        Object o = of(ObjectType::Trampoline);
        o.id = id;
        return o;
    }

    static constexpr Object target(char id) noexcept {
        Object o = of(ObjectType::Target);
        o.id = id;
        return o;
    }

    /** A beard that spreads once `ticks_until_growth` more ticks have passed. */
    static constexpr Object beard(int ticks_until_growth) noexcept {
        Object o = of(ObjectType::Beard);
        o.growth_timer = ticks_until_growth;
        return o;
    }

    bool operator==(const Object& other) const noexcept {
        return type == other.type && rock == other.rock && lift == other.lift &&
               id == other.id && growth_timer == other.growth_timer;
    }

    bool operator!=(const Object& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const Object& other) const noexcept {
        return std::tie(type, rock, lift, id, growth_timer) <
               std::tie(other.type, other.rock, other.lift, other.id, other.growth_timer);
    }

private:
    static constexpr Object of(ObjectType type) noexcept {
        Object o;
        o.type = type;
        return o;
    }
};

// --- Predicates ---

inline bool is_empty(const Object& o) noexcept { return o.type == ObjectType::Empty; }
inline bool is_wall(const Object& o) noexcept { return o.type == ObjectType::Wall; }
inline bool is_earth(const Object& o) noexcept { return o.type == ObjectType::Earth; }
inline bool is_robot(const Object& o) noexcept { return o.type == ObjectType::Robot; }
inline bool is_rock(const Object& o) noexcept { return o.type == ObjectType::Rock; }
inline bool is_lambda(const Object& o) noexcept { return o.type == ObjectType::Lambda; }
inline bool is_lift(const Object& o) noexcept { return o.type == ObjectType::Lift; }
inline bool is_trampoline(const Object& o) noexcept { return o.type == ObjectType::Trampoline; }
inline bool is_target(const Object& o) noexcept { return o.type == ObjectType::Target; }
inline bool is_beard(const Object& o) noexcept { return o.type == ObjectType::Beard; }
inline bool is_razor(const Object& o) noexcept { return o.type == ObjectType::Razor; }

inline bool is_simple_rock(const Object& o) noexcept {
    return is_rock(o) && o.rock == RockKind::Simple;
}

inline bool is_higher_order_rock(const Object& o) noexcept {
    return is_rock(o) && o.rock == RockKind::HigherOrder;
}

inline bool is_lift_open(const Object& o) noexcept {
    return is_lift(o) && o.lift == LiftState::Open;
}

inline bool is_lift_closed(const Object& o) noexcept {
    return is_lift(o) && o.lift == LiftState::Closed;
}

// --- Character mapping ---

/**
 * Map-file character for an object ('R', '#', '*', '@', '\\', 'L', 'O',
 * '.', ' ', 'A'-'I', '0'-'9', 'W', '!').
 */
char object_to_char(const Object& o) noexcept;

/**
 * Decode a map-file character.
 * @param c Character from the map block
 * @param beard_timer Initial countdown given to 'W' cells
 * @return The object, or std::nullopt for characters outside the alphabet
 */
std::optional<Object> char_to_object(char c, int beard_timer) noexcept;

#endif // OBJECTS_H
