#pragma once

#include <cstdint>
#include <memory>
#include <random>

namespace dice {

// Источник равномерно распределённых случайных целых чисел.
// Общий для вычислителя бросков и генератора диапазона, чтобы в тестах
// его можно было подменить детерминированной реализацией.
class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Возвращает случайное целое в замкнутом интервале [low, high].
    // Вызывающая сторона гарантирует low <= high.
    virtual std::int64_t uniform(std::int64_t low, std::int64_t high) = 0;
};

// Источник на основе вихря Мерсенна (std::mt19937_64)
class MersenneRandomSource final : public RandomSource {
public:
    // Инициализация из std::random_device
    MersenneRandomSource();

    // Детерминированная инициализация заданным зерном
    explicit MersenneRandomSource(std::uint64_t seed);

    std::int64_t uniform(std::int64_t low, std::int64_t high) override;

private:
    std::mt19937_64 generator;
};

// Общий для потока источник по умолчанию
std::shared_ptr<RandomSource> defaultRandomSource();

} // namespace dice
