#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "random_source.hpp"
#include "term.hpp"

namespace dice {

class RollSequence;

// Результат одного слагаемого
struct TermOutcome {
    Term term;
    std::vector<std::int64_t> values; // Выпавшие значения костей или значение модификатора
    std::int64_t subtotal = 0;        // Вклад в итог с учётом знака
};

// Результат вычисления выражения броска.
// Неизменяем после создания. Хранит разобранные слагаемые и источник
// случайных чисел, чтобы повторять бросок через iterate().
class Roll {
public:
    Roll(std::string expression,
         std::shared_ptr<const std::vector<Term>> terms,
         std::vector<TermOutcome> outcomes,
         std::int64_t total,
         std::shared_ptr<RandomSource> source);

    // Выражение без пробелов, например "2d6+6"
    const std::string& expression() const { return expression_; }
    const std::vector<Term>& terms() const { return *terms_; }
    const std::vector<TermOutcome>& outcomes() const { return outcomes_; }
    std::int64_t total() const { return total_; }

    // Разбивка по слагаемым: "3d1[1, 1, 1]-2d1[1, 1]-4"
    std::string result() const;

    // Разбивка и итог: "3d1[1, 1, 1]+5 (Total: 8)"
    std::string toString() const;

    // Новая бесконечная последовательность повторных бросков того же выражения.
    // Каждый вызов начинает новую последовательность.
    RollSequence iterate() const;

private:
    std::string expression_;
    std::shared_ptr<const std::vector<Term>> terms_;
    std::vector<TermOutcome> outcomes_;
    std::int64_t total_;
    std::shared_ptr<RandomSource> source_;
};

std::ostream& operator<<(std::ostream& out, const Roll& roll);

// Бесконечная ленивая последовательность бросков одного выражения.
// Каждое значение вычисляется заново, ничего не кэшируется.
// Ограничивать потребление должен вызывающий код, например через std::views::take.
// Итератор владеет копией слагаемых и источника и не зависит от времени жизни последовательности.
class RollSequence {
public:
    class Iterator {
    public:
        using iterator_concept = std::input_iterator_tag;
        using iterator_category = std::input_iterator_tag;
        using value_type = Roll;
        using difference_type = std::ptrdiff_t;
        using reference = const Roll&;
        using pointer = const Roll*;

        Iterator() = default;
        Iterator(std::string expression,
                 std::shared_ptr<const std::vector<Term>> terms,
                 std::shared_ptr<RandomSource> source);

        const Roll& operator*() const { return *current; }
        const Roll* operator->() const { return &*current; }

        Iterator& operator++();
        void operator++(int) { ++*this; }

    private:
        std::string expression;
        std::shared_ptr<const std::vector<Term>> terms;
        std::shared_ptr<RandomSource> source;
        std::optional<Roll> current;
    };

    RollSequence(std::string expression,
                 std::shared_ptr<const std::vector<Term>> terms,
                 std::shared_ptr<RandomSource> source);

    // Следующий независимый бросок
    Roll next();

    // Первые count бросков последовательности
    std::vector<Roll> take(std::size_t count);

    Iterator begin() { return Iterator(expression, terms, source); }
    std::unreachable_sentinel_t end() const { return std::unreachable_sentinel; }

private:
    std::string expression;
    std::shared_ptr<const std::vector<Term>> terms;
    std::shared_ptr<RandomSource> source;
};

} // namespace dice
