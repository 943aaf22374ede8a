#include "objects.h"

char object_to_char(const Object& o) noexcept {
    switch (o.type) {
        case ObjectType::Empty:      return ' ';
        case ObjectType::Wall:       return '#';
        case ObjectType::Earth:      return '.';
        case ObjectType::Robot:      return 'R';
        case ObjectType::Rock:       return o.rock == RockKind::Simple ? '*' : '@';
        case ObjectType::Lambda:     return '\\';
        case ObjectType::Lift:       return o.lift == LiftState::Open ? 'O' : 'L';
        case ObjectType::Trampoline: return o.id;
        case ObjectType::Target:     return o.id;
        case ObjectType::Beard:      return 'W';
        case ObjectType::Razor:      return '!';
    }
    return '?';
}

std::optional<Object> char_to_object(char c, int beard_timer) noexcept {
    if (c >= 'A' && c <= 'I') return Object::trampoline(c);
    if (c >= '0' && c <= '9') return Object::target(c);

    switch (c) {
        case 'R':  return Object::robot();
        case '#':  return Object::wall();
        case '*':  return Object::make_rock(RockKind::Simple);
        case '@':  return Object::make_rock(RockKind::HigherOrder);
        case '\\': return Object::lambda();
        case 'L':  return Object::make_lift(LiftState::Closed);
        case 'O':  return Object::make_lift(LiftState::Open);
        case '.':  return Object::earth();
        case ' ':  return Object::empty();
        case 'W':  return Object::beard(beard_timer);
        case '!':  return Object::razor();
        default:   return std::nullopt;
    }
}
