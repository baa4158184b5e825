#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace dice {

// Типы токенов выражения броска
enum class TokenType {
    Number, // Целочисленный литерал
    Die,    // Маркер кости 'd' или 'D'
    Plus,
    Minus,
    End     // Конец входной строки
};

struct Token {
    TokenType type;
    std::uint64_t numericValue; // Значение литерала (только для Number)
    std::string text;           // Исходный текст токена
    std::size_t position;       // Позиция в строке без пробелов
};

} // namespace dice
