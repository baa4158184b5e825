#include "evaluator.hpp"

#include <limits>

#include "errors.hpp"

namespace dice {

namespace {
std::int64_t checkedAdd(std::int64_t lhs, std::int64_t rhs) {
    if ((rhs > 0 && lhs > std::numeric_limits<std::int64_t>::max() - rhs) ||
        (rhs < 0 && lhs < std::numeric_limits<std::int64_t>::min() - rhs)) {
        throw OverflowError("Переполнение суммы броска");
    }
    return lhs + rhs;
}
}

RollEvaluator::RollEvaluator(std::shared_ptr<RandomSource> source) : source(std::move(source)) {}

Roll RollEvaluator::evaluate(std::shared_ptr<const std::vector<Term>> terms, std::string expression) const {
    std::vector<TermOutcome> outcomes;
    outcomes.reserve(terms->size());

    std::int64_t total = 0;
    for (const auto& term : *terms) {
        outcomes.push_back(evaluateTerm(term));
        total = checkedAdd(total, outcomes.back().subtotal);
    }

    return Roll(std::move(expression), std::move(terms), std::move(outcomes), total, source);
}

Roll RollEvaluator::evaluate(const std::vector<Term>& terms, std::string expression) const {
    return evaluate(std::make_shared<const std::vector<Term>>(terms), std::move(expression));
}

// Для броска — count значений из [1, sides], для модификатора — само значение
TermOutcome RollEvaluator::evaluateTerm(const Term& term) const {
    TermOutcome outcome;
    outcome.term = term;

    if (term.isDieRoll()) {
        outcome.values.reserve(term.count);
        std::int64_t sum = 0;
        for (std::uint32_t i = 0; i < term.count; ++i) {
            std::int64_t value = source->uniform(1, term.sides);
            outcome.values.push_back(value);
            sum = checkedAdd(sum, value);
        }
        outcome.subtotal = term.sign * sum;
    } else {
        outcome.values.push_back(term.value);
        outcome.subtotal = term.sign * static_cast<std::int64_t>(term.value);
    }
    return outcome;
}

} // namespace dice
