#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

// Удаление пробелов и табуляций по краям строки
std::string trim(const std::string& value);

// Безопасный парсинг положительного числа из строки
std::size_t parseNumber(const std::string& value);

// Парсинг целого числа со знаком (границы диапазона, зерно генератора)
std::int64_t parseInteger(const std::string& value);

// Интерактивный ввод выражения броска
std::string askExpression();

// Интерактивный ввод количества бросков (по умолчанию 1)
std::size_t askRollCount();

// Запрос продолжения работы
bool askContinue();
