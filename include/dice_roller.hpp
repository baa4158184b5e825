#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "random_source.hpp"
#include "roll.hpp"

namespace dice {

// Класс-фасад: разбор выражения, бросок и случайный диапазон
// поверх одного источника случайных чисел.
class DiceRoller {
public:
    // Использует источник по умолчанию текущего потока
    DiceRoller();

    explicit DiceRoller(std::shared_ptr<RandomSource> source);

    // Разбирает и вычисляет выражение, например "3d6 + 4".
    // Выбрасывает ParseError при синтаксических ошибках.
    Roll rollDice(const std::string& expression) const;

    // Выбрасывает RangeError, если low > high
    std::int64_t rollRange(std::int64_t low, std::int64_t high) const;

private:
    std::shared_ptr<RandomSource> source;
};

// Бросок через источник по умолчанию
Roll rollDice(const std::string& expression);

std::int64_t rollRange(std::int64_t low, std::int64_t high);

} // namespace dice
