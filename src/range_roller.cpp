#include "range_roller.hpp"

#include "errors.hpp"

namespace dice {

RangeRoller::RangeRoller(std::shared_ptr<RandomSource> source) : source(std::move(source)) {}

std::int64_t RangeRoller::roll(std::int64_t low, std::int64_t high) const {
    if (low > high) {
        throw RangeError(low, high);
    }
    return source->uniform(low, high);
}

} // namespace dice
