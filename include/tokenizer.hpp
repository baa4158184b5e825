#pragma once

#include <string>
#include <vector>

#include "token.hpp"

namespace dice {

// Удаляет из выражения все пробельные символы: "3d6 + 4" -> "3d6+4"
std::string stripWhitespace(const std::string& text);

// Класс лексического анализатора (лексера)
// Преобразует строку выражения броска (уже без пробелов) в последовательность токенов.
class Tokenizer {
public:
    // Конструктор принимает исходную строку выражения
    explicit Tokenizer(std::string sourceText);

    // Возвращает вектор токенов, заканчивающийся токеном End
    // Выбрасывает ParseError при обнаружении посторонних символов
    std::vector<Token> tokenize();

private:
    const std::string source; // Исходная строка
    std::size_t index = 0;    // Текущая позиция чтения

    bool isAtEnd() const;
    char peek() const;
    char advance();

    // Считывает целое число без знака
    Token makeNumber();
};

} // namespace dice
