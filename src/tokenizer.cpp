#include "tokenizer.hpp"

#include <cctype>
#include <charconv>

#include "errors.hpp"

namespace dice {

std::string stripWhitespace(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char ch : text) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            result.push_back(ch);
        }
    }
    return result;
}

Tokenizer::Tokenizer(std::string sourceText) : source(std::move(sourceText)) {}

// Основной цикл разбора: проходит по строке и выделяет токены
std::vector<Token> Tokenizer::tokenize() {
    std::vector<Token> tokens;
    while (!isAtEnd()) {
        char ch = peek();
        switch (ch) {
        case '+':
            tokens.push_back({TokenType::Plus, 0, "+", index});
            advance();
            break;
        case '-':
            tokens.push_back({TokenType::Minus, 0, "-", index});
            advance();
            break;
        case 'd':
        case 'D':
            tokens.push_back({TokenType::Die, 0, std::string(1, ch), index});
            advance();
            break;
        default:
            if (std::isdigit(static_cast<unsigned char>(ch))) {
                tokens.push_back(makeNumber());
            } else {
                throw ParseError(std::string("Недопустимый символ '") + ch + "'", index);
            }
            break;
        }
    }

    tokens.push_back({TokenType::End, 0, "", index});
    return tokens;
}

bool Tokenizer::isAtEnd() const {
    return index >= source.size();
}

char Tokenizer::peek() const {
    return source[index];
}

char Tokenizer::advance() {
    return source[index++];
}

// Разбор числового литерала: только цифры, знак задаётся оператором перед слагаемым
Token Tokenizer::makeNumber() {
    std::size_t start = index;
    while (!isAtEnd() && std::isdigit(static_cast<unsigned char>(peek()))) {
        advance();
    }

    std::string text = source.substr(start, index - start);
    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size()) {
        throw ParseError("Некорректное число '" + text + "'", start);
    }
    return {TokenType::Number, value, text, start};
}

} // namespace dice
