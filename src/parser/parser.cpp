// src/parser/parser.cpp
#include "parser.hpp"

#include <cctype>

#include "SandstepError.hpp"
#include "lexer.hpp"

Parser::Parser(const std::vector<Token>& tokens) : tokens(tokens) {}

// Return current token or EOF token
Token Parser::peek() const {
    if (position < tokens.size()) return tokens[position];
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

Token Parser::peek_next(size_t offset) const {
    if (position + offset < tokens.size()) {
        return tokens[position + offset];
    }
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

// Consume and return the next token or EOF token
Token Parser::consume() {
    if (position < tokens.size()) return tokens[position++];
    return Token{
        TokenType::EOF_TOKEN,
        "",
        TokenLocation("<eof>", 0, 0, 0)};
}

bool Parser::match(TokenType t) {
    if (peek().type == t) {
        consume();
        return true;
    }
    return false;
}

void Parser::fail(const Token& at, const std::string& errMsg) const {
    std::string found = at.type == TokenType::EOF_TOKEN ? "end of input" : "'" + at.value + "'";
    throw SandstepError("SyntaxError", errMsg + " (found " + found + ")", at.loc);
}

void Parser::deeper(const Token& at) {
    if (++depth > kMaxNestingDepth) {
        throw SandstepError("SyntaxError", "Program is nested too deeply", at.loc);
    }
}

Token Parser::expect(TokenType t, const std::string& errMsg) {
    if (peek().type != t) {
        fail(peek(), errMsg);
    }
    return consume();
}

// Keywords are valid property names after '.' and as object literal keys.
bool Parser::is_identifier_name(const Token& t) const {
    if (t.type == TokenType::IDENTIFIER) return true;
    if (t.value.empty()) return false;
    unsigned char first = static_cast<unsigned char>(t.value[0]);
    return std::isalpha(first) || first == '_' || first == '$';
}

std::string Parser::expect_identifier_name(const std::string& errMsg) {
    if (!is_identifier_name(peek())) {
        fail(peek(), errMsg);
    }
    return consume().value;
}

// A statement ends at ';', before '}', at end of input, or at a line break.
void Parser::consume_statement_end() {
    if (match(TokenType::SEMICOLON)) return;
    Token t = peek();
    if (t.type == TokenType::CLOSEBRACE || t.type == TokenType::EOF_TOKEN || t.newline_before) return;
    fail(t, "Expected ';' after statement");
}

std::unique_ptr<ProgramNode> Parser::parse() {
    auto program = std::make_unique<ProgramNode>();
    program->token = peek();
    while (peek().type != TokenType::EOF_TOKEN) {
        program->body.push_back(parse_statement());
    }
    return program;
}

std::unique_ptr<ProgramNode> parse_source(const std::string& source, const std::string& filename) {
    auto mgr = std::make_shared<SourceManager>(filename, source);
    Lexer lexer(source, filename, mgr.get());
    std::vector<Token> tokens = lexer.tokenize();
    Parser parser(tokens);
    std::unique_ptr<ProgramNode> program = parser.parse();
    program->source = mgr;
    return program;
}
