#include "random_source.hpp"

namespace dice {

namespace {
std::uint64_t entropySeed() {
    std::random_device device;
    // random_device выдаёт 32 бита, склеиваем два значения
    std::uint64_t high = device();
    std::uint64_t low = device();
    return (high << 32) | low;
}
}

MersenneRandomSource::MersenneRandomSource() : generator(entropySeed()) {}

MersenneRandomSource::MersenneRandomSource(std::uint64_t seed) : generator(seed) {}

std::int64_t MersenneRandomSource::uniform(std::int64_t low, std::int64_t high) {
    std::uniform_int_distribution<std::int64_t> distribution(low, high);
    return distribution(generator);
}

std::shared_ptr<RandomSource> defaultRandomSource() {
    thread_local std::shared_ptr<RandomSource> source = std::make_shared<MersenneRandomSource>();
    return source;
}

} // namespace dice
