#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace dice {

// Общий базовый класс ошибок библиотеки
class DiceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Выражение не соответствует грамматике бросков.
// position — индекс проблемного токена в выражении без пробелов.
class ParseError : public DiceError {
public:
    ParseError(const std::string& message, std::size_t position)
        : DiceError(message + " (позиция " + std::to_string(position) + ")"), position_(position) {}

    std::size_t position() const { return position_; }

private:
    std::size_t position_;
};

// Нижняя граница диапазона больше верхней
class RangeError : public DiceError {
public:
    RangeError(std::int64_t low, std::int64_t high)
        : DiceError("Некорректный диапазон [" + std::to_string(low) + ", " + std::to_string(high) +
                    "]: нижняя граница больше верхней"),
          low_(low), high_(high) {}

    std::int64_t low() const { return low_; }
    std::int64_t high() const { return high_; }

private:
    std::int64_t low_;
    std::int64_t high_;
};

// Сумма броска не помещается в 64-битное целое
class OverflowError : public DiceError {
public:
    using DiceError::DiceError;
};

} // namespace dice
