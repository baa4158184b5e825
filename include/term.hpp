#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace dice {

// Слагаемое выражения броска: бросок костей (NdM) или постоянный модификатор.
// Знак хранится отдельно и применяется к сумме слагаемого целиком.
struct Term {
    enum class Kind {
        DieRoll,
        Modifier
    };

    Kind kind = Kind::Modifier;
    std::uint32_t count = 0; // Количество костей (DieRoll)
    std::uint32_t sides = 0; // Количество граней (DieRoll)
    std::uint32_t value = 0; // Значение модификатора (Modifier)
    int sign = 1;            // +1 или -1

    static Term dieRoll(std::uint32_t count, std::uint32_t sides, int sign = 1);
    static Term modifier(std::uint32_t value, int sign = 1);

    bool isDieRoll() const { return kind == Kind::DieRoll; }
    bool isNegative() const { return sign < 0; }

    // Текстовая форма: "3d6", "-2d4", "+5", "-6"
    std::string toString() const;
};

bool operator==(const Term& lhs, const Term& rhs);

std::ostream& operator<<(std::ostream& out, const Term& term);

} // namespace dice
