#include "dice_roller.hpp"

#include "evaluator.hpp"
#include "parser.hpp"
#include "range_roller.hpp"
#include "tokenizer.hpp"

namespace dice {

DiceRoller::DiceRoller() : source(defaultRandomSource()) {}

DiceRoller::DiceRoller(std::shared_ptr<RandomSource> source) : source(std::move(source)) {}

// Полный цикл обработки выражения:
// 1. Удаление пробелов и токенизация
// 2. Парсинг -> список слагаемых
// 3. Бросок костей и суммирование
Roll DiceRoller::rollDice(const std::string& expression) const {
    std::string stripped = stripWhitespace(expression);

    Tokenizer tokenizer(stripped);
    Parser parser(tokenizer.tokenize());
    auto terms = std::make_shared<const std::vector<Term>>(parser.parse());

    RollEvaluator evaluator(source);
    return evaluator.evaluate(std::move(terms), std::move(stripped));
}

std::int64_t DiceRoller::rollRange(std::int64_t low, std::int64_t high) const {
    RangeRoller roller(source);
    return roller.roll(low, high);
}

Roll rollDice(const std::string& expression) {
    return DiceRoller().rollDice(expression);
}

std::int64_t rollRange(std::int64_t low, std::int64_t high) {
    return DiceRoller().rollRange(low, high);
}

} // namespace dice
