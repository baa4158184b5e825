#include "user_input.hpp"
#include "console.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>

std::string trim(const std::string& value) {
    std::size_t first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    std::size_t last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

std::size_t parseNumber(const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(),
            [](char c) { return std::isdigit(static_cast<unsigned char>(c)); })) {
        throw std::runtime_error("Некорректное числовое значение: '" + value + "'");
    }

    std::size_t result = 0;
    try {
        result = std::stoul(value);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное числовое значение: '" + value + "'");
    }
    if (result == 0) {
        throw std::runtime_error("Число должно быть положительным");
    }
    return result;
}

std::int64_t parseInteger(const std::string& value) {
    std::size_t consumed = 0;
    long long result = 0;
    try {
        result = std::stoll(value, &consumed);
    }
    catch (const std::exception&) {
        throw std::runtime_error("Некорректное целое число: '" + value + "'");
    }
    if (consumed != value.size()) {
        throw std::runtime_error("Некорректное целое число: '" + value + "'");
    }
    return static_cast<std::int64_t>(result);
}

std::string askExpression() {
    std::cout << Color::BOLD << "Введите выражение броска (например, 3d6+4): " << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        throw std::runtime_error("Ввод завершён");
    }
    return trim(input);
}

std::size_t askRollCount() {
    std::cout << Color::BOLD << "Количество бросков" << Color::RESET
        << " (по умолчанию: " << Color::CYAN << 1 << Color::RESET << "): ";

    std::string input;
    std::getline(std::cin, input);
    input = trim(input);

    if (input.empty()) {
        return 1;
    }
    return parseNumber(input);
}

bool askContinue() {
    std::cout << Color::BOLD << "Бросить еще раз? (y/n): " << Color::RESET;
    std::string input;
    if (!std::getline(std::cin, input)) {
        return false;
    }

    // Приведение к нижнему регистру
    input = trim(input);
    std::transform(input.begin(), input.end(), input.begin(), ::tolower);

    return (input == "y" || input == "yes" || input == "д" || input == "да");
}
