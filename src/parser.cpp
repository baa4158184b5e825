#include "parser.hpp"

#include "errors.hpp"
#include "tokenizer.hpp"

namespace dice {

Parser::Parser(std::vector<Token> tokens) : tokens(std::move(tokens)) {}

std::vector<Term> Parser::parse() {
    if (isAtEnd()) {
        throw ParseError("Пустое выражение", peek().position);
    }

    std::vector<Term> terms;
    terms.push_back(parseClause(parseSign()));

    while (!isAtEnd()) {
        const Token& token = peek();
        if (token.type != TokenType::Plus && token.type != TokenType::Minus) {
            throw ParseError("Ожидался оператор '+' или '-' вместо '" + token.text + "'",
                             token.position);
        }
        terms.push_back(parseClause(parseSign()));
    }
    return terms;
}

const Token& Parser::peek() const {
    return tokens[current];
}

bool Parser::match(TokenType type) {
    if (!isAtEnd() && tokens[current].type == type) {
        ++current;
        return true;
    }
    return false;
}

const Token& Parser::consume(TokenType type, const std::string& errorMessage) {
    if (match(type)) {
        return tokens[current - 1];
    }
    throw ParseError(errorMessage, peek().position);
}

bool Parser::isAtEnd() const {
    return peek().type == TokenType::End;
}

int Parser::parseSign() {
    if (match(TokenType::Minus)) {
        return -1;
    }
    match(TokenType::Plus);
    return 1;
}

// Сначала пробуем форму NdM, затем простой модификатор
Term Parser::parseClause(int sign) {
    const Token& first = consume(TokenType::Number, "Ожидалось число или бросок NdM");

    if (match(TokenType::Die)) {
        const Token& sides = consume(TokenType::Number, "Ожидалось количество граней после 'd'");

        if (first.numericValue == 0) {
            throw ParseError("Количество костей должно быть положительным", first.position);
        }
        if (first.numericValue > kMaxDiceCount) {
            throw ParseError("Слишком много костей: " + first.text, first.position);
        }
        if (sides.numericValue == 0) {
            throw ParseError("Количество граней должно быть положительным", sides.position);
        }
        if (sides.numericValue > kMaxDieSides) {
            throw ParseError("Слишком много граней: " + sides.text, sides.position);
        }
        return Term::dieRoll(static_cast<std::uint32_t>(first.numericValue),
                             static_cast<std::uint32_t>(sides.numericValue), sign);
    }

    if (first.numericValue > kMaxModifier) {
        throw ParseError("Слишком большой модификатор: " + first.text, first.position);
    }
    return Term::modifier(static_cast<std::uint32_t>(first.numericValue), sign);
}

std::vector<Term> parseTerms(const std::string& expression) {
    Tokenizer tokenizer(stripWhitespace(expression));
    Parser parser(tokenizer.tokenize());
    return parser.parse();
}

} // namespace dice
