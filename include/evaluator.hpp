#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "random_source.hpp"
#include "roll.hpp"
#include "term.hpp"

namespace dice {

// Вычислитель бросков: бросает кости каждого слагаемого и суммирует результат.
class RollEvaluator {
public:
    explicit RollEvaluator(std::shared_ptr<RandomSource> source);

    // Вычисляет уже проверенные слагаемые. expression сохраняется в Roll как есть.
    // Выбрасывает OverflowError, если итог не помещается в 64 бита.
    Roll evaluate(std::shared_ptr<const std::vector<Term>> terms, std::string expression = "") const;

    Roll evaluate(const std::vector<Term>& terms, std::string expression = "") const;

    // Бросок одного слагаемого
    TermOutcome evaluateTerm(const Term& term) const;

private:
    std::shared_ptr<RandomSource> source;
};

} // namespace dice
