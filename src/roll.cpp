#include "roll.hpp"

#include "evaluator.hpp"

namespace dice {

Roll::Roll(std::string expression,
           std::shared_ptr<const std::vector<Term>> terms,
           std::vector<TermOutcome> outcomes,
           std::int64_t total,
           std::shared_ptr<RandomSource> source)
    : expression_(std::move(expression)),
      terms_(std::move(terms)),
      outcomes_(std::move(outcomes)),
      total_(total),
      source_(std::move(source)) {}

// Первое слагаемое выводится со знаком только если оно отрицательное,
// последующие — всегда со знаком
std::string Roll::result() const {
    std::string text;
    bool first = true;
    for (const auto& outcome : outcomes_) {
        const Term& term = outcome.term;
        if (term.isDieRoll()) {
            if (!first && !term.isNegative()) {
                text += "+";
            }
            text += term.toString() + "[";
            for (std::size_t i = 0; i < outcome.values.size(); ++i) {
                if (i > 0) {
                    text += ", ";
                }
                text += std::to_string(outcome.values[i]);
            }
            text += "]";
        } else if (first && !term.isNegative()) {
            text += std::to_string(term.value);
        } else {
            text += term.toString();
        }
        first = false;
    }
    return text;
}

std::string Roll::toString() const {
    return result() + " (Total: " + std::to_string(total_) + ")";
}

RollSequence Roll::iterate() const {
    return RollSequence(expression_, terms_, source_);
}

std::ostream& operator<<(std::ostream& out, const Roll& roll) {
    return out << roll.toString();
}

RollSequence::Iterator::Iterator(std::string expression,
                                 std::shared_ptr<const std::vector<Term>> terms,
                                 std::shared_ptr<RandomSource> source)
    : expression(std::move(expression)), terms(std::move(terms)), source(std::move(source)) {
    ++*this;
}

RollSequence::Iterator& RollSequence::Iterator::operator++() {
    RollEvaluator evaluator(source);
    current.emplace(evaluator.evaluate(terms, expression));
    return *this;
}

RollSequence::RollSequence(std::string expression,
                           std::shared_ptr<const std::vector<Term>> terms,
                           std::shared_ptr<RandomSource> source)
    : expression(std::move(expression)), terms(std::move(terms)), source(std::move(source)) {}

Roll RollSequence::next() {
    RollEvaluator evaluator(source);
    return evaluator.evaluate(terms, expression);
}

std::vector<Roll> RollSequence::take(std::size_t count) {
    std::vector<Roll> rolls;
    rolls.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        rolls.push_back(next());
    }
    return rolls;
}

} // namespace dice
