#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <stdexcept>
#include <utility>
#include <vector>

#include "random_source.hpp"

namespace dice::testing {

// Всегда возвращает нижнюю или верхнюю границу
class BoundRandomSource final : public RandomSource {
public:
    explicit BoundRandomSource(bool returnHigh) : returnHigh(returnHigh) {}

    std::int64_t uniform(std::int64_t low, std::int64_t high) override {
        ++calls;
        return returnHigh ? high : low;
    }

    std::size_t calls = 0;

private:
    bool returnHigh;
};

// Возвращает заранее заданные значения и запоминает запрошенные диапазоны
class ScriptedRandomSource final : public RandomSource {
public:
    explicit ScriptedRandomSource(std::vector<std::int64_t> script) : values(script.begin(), script.end()) {}

    std::int64_t uniform(std::int64_t low, std::int64_t high) override {
        if (values.empty()) {
            throw std::logic_error("scripted source exhausted");
        }
        requests.emplace_back(low, high);
        std::int64_t value = values.front();
        values.pop_front();
        return value;
    }

    std::vector<std::pair<std::int64_t, std::int64_t>> requests;

private:
    std::deque<std::int64_t> values;
};

} // namespace dice::testing
