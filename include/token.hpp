#pragma once

#include <string>

#include "SourceManager.hpp"

// Token types (keep in sync with the lexer keyword table and the parser)
enum class TokenType {
    // -----------------------
    // Declarations / statements
    // -----------------------
    VAR,
    LET,
    CONST,
    FUNCTION,
    RETURN,
    IF,
    ELSE,
    FOR,
    IN,
    WHILE,
    DO,
    BREAK,
    CONTINUE,
    NEW,
    THIS,
    THROW,
    TRY,
    CATCH,
    FINALLY,

    // -----------------------
    // Operator keywords
    // -----------------------
    TYPEOF,
    INSTANCEOF,
    DELETE,
    VOID,

    // -----------------------
    // Literals & identifiers
    // -----------------------
    IDENTIFIER,
    NUMBER,
    STRING,
    BOOLEAN,
    NULL_LITERAL,
    UNDEFINED_LITERAL,

    // -----------------------
    // Punctuation
    // -----------------------
    SEMICOLON,
    COMMA,
    OPENPARENTHESIS,
    CLOSEPARENTHESIS,
    OPENBRACE,
    CLOSEBRACE,
    OPENBRACKET,
    CLOSEBRACKET,
    COLON,
    QUESTIONMARK,
    DOT,

    // -----------------------
    // Assignment / file end
    // -----------------------
    ASSIGN,
    EOF_TOKEN,

    // -----------------------
    // Arithmetic
    // -----------------------
    PLUS,
    MINUS,
    STAR,
    SLASH,
    PERCENT,

    // -----------------------
    // Compound assignment / increments
    // -----------------------
    PLUS_ASSIGN,
    MINUS_ASSIGN,
    TIMES_ASSIGN,
    SLASH_ASSIGN,
    PERCENT_ASSIGN,
    INCREMENT,
    DECREMENT,

    // -----------------------
    // Logical
    // -----------------------
    AND,
    OR,
    NOT,

    // -----------------------
    // Comparison
    // -----------------------
    GREATERTHAN,
    GREATEROREQUALTHAN,
    LESSTHAN,
    LESSOREQUALTHAN,
    EQUALITY,
    NOTEQUAL,
    STRICT_EQUALITY,
    STRICT_NOTEQUAL,

    UNKNOWN
};

// Small struct for token location / span in source
struct TokenLocation {
   public:
    std::string filename;  // source filename (or "<script>")
    int line = 1;          // 1-based
    int col = 1;           // 1-based column of token start
    int length = 0;        // token length in characters

    const SourceManager* src_mgr = nullptr;

    TokenLocation() = default;
    TokenLocation(const std::string& fn, int ln, int c, int len = 0, const SourceManager* mgr = nullptr)
        : filename(fn), line(ln), col(c), length(len), src_mgr(mgr) {}

    std::string to_string() const {
        return filename + ":" + std::to_string(line) + ":" + std::to_string(col);
    }
    std::string get_line_trace() const;
};

// Represents a single token with location.
// `newline_before` is set when at least one line break separates this token from
// the previous one; the parser uses it for automatic statement termination.
struct Token {
    TokenType type = TokenType::UNKNOWN;
    std::string value;  // raw text / normalized lexeme
    TokenLocation loc;  // file:line:col and length/span
    bool newline_before = false;

    Token() = default;
    Token(TokenType t, const std::string& v, const TokenLocation& l)
        : type(t), value(v), loc(l) {}

    const std::string& filename() const { return loc.filename; }
    int line() const { return loc.line; }
    int col() const { return loc.col; }
    int length() const { return loc.length; }
};

inline std::string TokenLocation::get_line_trace() const {
    if (!src_mgr) {
        return "(source context unavailable)";
    }
    return src_mgr->format_error_context(line, col);
}
