#include <cstddef>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "console.hpp"
#include "dice_roller.hpp"
#include "errors.hpp"
#include "random_source.hpp"
#include "roll_report.hpp"
#include "user_input.hpp"

namespace {

    // Параметры командной строки
    struct Options {
        std::string expression;                  // Пусто -> интерактивный режим
        std::size_t rollCount = 1;               // -n
        std::optional<std::int64_t> rangeLow;    // --range low high
        std::optional<std::int64_t> rangeHigh;
        std::optional<std::uint64_t> seed;       // --seed
        bool showHelp = false;
    };

    void printUsage() {
        std::cerr << "Использование: dice_roller [-n количество] [--seed зерно] [выражение]\n"
            << "               dice_roller [--seed зерно] --range мин макс\n"
            << "Пример: dice_roller -n 6 \"3d6 + 4\"\n";
    }

    Options parseOptions(int argc, char** argv) {
        Options opts;
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "-h" || a == "--help") { opts.showHelp = true; continue; }
            if (a == "-n") {
                if (i + 1 >= argc) throw std::runtime_error("После -n ожидалось количество бросков");
                opts.rollCount = parseNumber(argv[++i]);
                continue;
            }
            if (a == "--seed") {
                if (i + 1 >= argc) throw std::runtime_error("После --seed ожидалось зерно");
                opts.seed = static_cast<std::uint64_t>(parseInteger(argv[++i]));
                continue;
            }
            if (a == "--range") {
                if (i + 2 >= argc) throw std::runtime_error("После --range ожидались две границы");
                opts.rangeLow = parseInteger(argv[++i]);
                opts.rangeHigh = parseInteger(argv[++i]);
                continue;
            }
            // Остальные аргументы склеиваются: dice_roller 3d6 + 4
            if (!opts.expression.empty()) {
                opts.expression += " ";
            }
            opts.expression += a;
        }
        return opts;
    }

    // Интерактивный режим: выражение, количество бросков, продолжение
    void runInteractive(const dice::DiceRoller& roller) {
        printHeader();

        bool continueRolling = true;
        while (continueRolling) {
            try {
                std::string expression = askExpression();
                std::size_t count = askRollCount();
                std::cout << "\n";
                printRolls(std::cout, roller, expression, count);
                std::cout << "\n";
            }
            catch (const std::exception& ex) {
                std::cerr << "\n";
                printError(ex.what());
                std::cerr << "\n";
            }
            continueRolling = askContinue();
            if (continueRolling) {
                std::cout << "\n";
            }
        }

        std::cout << Color::CYAN << "Работа завершена. До свидания!" << Color::RESET << "\n\n";
    }

} // namespace

// Точка входа в программу
int main(int argc, char** argv) {
    Options opts;
    try {
        opts = parseOptions(argc, argv);
    }
    catch (const std::exception& ex) {
        printError(ex.what());
        printUsage();
        return 1;
    }

    if (opts.showHelp) {
        printUsage();
        return 0;
    }

    // Фиксированное зерно даёт воспроизводимые броски
    std::shared_ptr<dice::RandomSource> source = dice::defaultRandomSource();
    if (opts.seed) {
        source = std::make_shared<dice::MersenneRandomSource>(*opts.seed);
    }
    dice::DiceRoller roller(source);

    try {
        if (opts.rangeLow && opts.rangeHigh) {
            std::cout << roller.rollRange(*opts.rangeLow, *opts.rangeHigh) << "\n";
            return 0;
        }
        if (opts.expression.empty()) {
            runInteractive(roller);
            return 0;
        }
        printRolls(std::cout, roller, opts.expression, opts.rollCount);
        return 0;
    }
    catch (const dice::DiceError& ex) {
        printError(ex.what());
    }
    catch (const std::exception& ex) {
        printError(std::string("непредвиденная ошибка: ") + ex.what());
    }
    return 2;
}
