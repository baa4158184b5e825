#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "dice_roller.hpp"

// Вывод серии из count бросков одного выражения.
// Каждый бросок выводится сразу после вычисления, серия в памяти не накапливается.
void printRolls(std::ostream& out, const dice::DiceRoller& roller,
                const std::string& expression, std::size_t count);
