#include "term.hpp"

namespace dice {

Term Term::dieRoll(std::uint32_t count, std::uint32_t sides, int sign) {
    Term term;
    term.kind = Kind::DieRoll;
    term.count = count;
    term.sides = sides;
    term.sign = sign < 0 ? -1 : 1;
    return term;
}

Term Term::modifier(std::uint32_t value, int sign) {
    Term term;
    term.kind = Kind::Modifier;
    term.value = value;
    term.sign = sign < 0 ? -1 : 1;
    return term;
}

// Бросок выводится со знаком только если он отрицательный,
// модификатор — всегда со знаком
std::string Term::toString() const {
    if (isDieRoll()) {
        std::string text = isNegative() ? "-" : "";
        text += std::to_string(count) + "d" + std::to_string(sides);
        return text;
    }
    return (isNegative() ? "-" : "+") + std::to_string(value);
}

bool operator==(const Term& lhs, const Term& rhs) {
    if (lhs.kind != rhs.kind || lhs.sign != rhs.sign) {
        return false;
    }
    if (lhs.isDieRoll()) {
        return lhs.count == rhs.count && lhs.sides == rhs.sides;
    }
    return lhs.value == rhs.value;
}

std::ostream& operator<<(std::ostream& out, const Term& term) {
    return out << term.toString();
}

} // namespace dice
