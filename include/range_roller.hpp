#pragma once

#include <cstdint>
#include <memory>

#include "random_source.hpp"

namespace dice {

// Случайное целое из замкнутого диапазона
class RangeRoller {
public:
    explicit RangeRoller(std::shared_ptr<RandomSource> source);

    // Выбрасывает RangeError, если low > high
    std::int64_t roll(std::int64_t low, std::int64_t high) const;

private:
    std::shared_ptr<RandomSource> source;
};

} // namespace dice
