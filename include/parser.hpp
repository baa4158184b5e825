#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "term.hpp"
#include "token.hpp"

namespace dice {

// Ограничения на числовые литералы, при которых сумма броска
// заведомо помещается в 64-битное целое
constexpr std::uint64_t kMaxDiceCount = 10'000;
constexpr std::uint64_t kMaxDieSides = 1'000'000'000;
constexpr std::uint64_t kMaxModifier = 1'000'000'000;

// Класс синтаксического анализатора (парсера)
// Строит упорядоченный список слагаемых из списка токенов.
//
// Грамматика:
//   Expression -> [ "+" | "-" ] Clause { ("+" | "-") Clause } End
//   Clause     -> Number [ Die Number ]
class Parser {
public:
    // Конструктор принимает список токенов от лексера
    explicit Parser(std::vector<Token> tokens);

    // Возвращает слагаемые в исходном порядке.
    // Выбрасывает ParseError при синтаксических ошибках, частичный результат не возвращается.
    std::vector<Term> parse();

private:
    const std::vector<Token> tokens; // Список токенов
    std::size_t current = 0;         // Индекс текущего токена

    const Token& peek() const;
    bool match(TokenType type);
    const Token& consume(TokenType type, const std::string& errorMessage);
    bool isAtEnd() const;

    // Разбор знака перед слагаемым, +1 если знак опущен
    int parseSign();

    // Разбор одного слагаемого: NdM или целое число
    Term parseClause(int sign);
};

// Полный цикл разбора: удаление пробелов, токенизация, парсинг
std::vector<Term> parseTerms(const std::string& expression);

} // namespace dice
