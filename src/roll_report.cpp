#include "roll_report.hpp"
#include "console.hpp"

namespace {

void printRoll(std::ostream& out, const dice::Roll& roll) {
    out << Color::CYAN << roll.expression() << Color::RESET << ": " << roll.result()
        << " (Total: " << Color::BOLD << Color::GREEN << roll.total() << Color::RESET << ")\n";
}

} // namespace

void printRolls(std::ostream& out, const dice::DiceRoller& roller,
                const std::string& expression, std::size_t count) {
    dice::Roll roll = roller.rollDice(expression);
    printRoll(out, roll);

    auto sequence = roll.iterate();
    for (std::size_t i = 1; i < count; ++i) {
        printRoll(out, sequence.next());
        out.flush();
    }
}
