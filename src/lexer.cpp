#include "lexer.hpp"

#include <cctype>
#include <sstream>
#include <unordered_map>

#include "SandstepError.hpp"

// Constructor
Lexer::Lexer(const std::string& source, const std::string& filename, const SourceManager* mgr)
    : src(source), filename(filename), i(0), line(1), col(1), src_mgr(mgr) {}

bool Lexer::eof() const {
    return i >= src.size();
}
char Lexer::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Lexer::peek_next() const {
    return peek(1);
}

char Lexer::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else {
        col++;
    }
    return c;
}

void Lexer::add_token(std::vector<Token>& out, TokenType type, const std::string& value, int tok_line, int tok_col, int tok_length) {
    int len = tok_length >= 0 ? tok_length : static_cast<int>(value.size());
    TokenLocation loc(filename.empty() ? "<script>" : filename, tok_line, tok_col, len, src_mgr);
    Token t{type, value, loc};
    t.newline_before = saw_newline;
    saw_newline = false;
    out.push_back(std::move(t));
}

void Lexer::fail(const std::string& message, int tok_line, int tok_col) const {
    TokenLocation loc(filename.empty() ? "<script>" : filename, tok_line, tok_col, 1, src_mgr);
    throw SandstepError("SyntaxError", message, loc);
}

void Lexer::skip_line_comment() {
    while (!eof() && peek() != '\n') advance();
}

void Lexer::skip_block_comment(int tok_line, int tok_col) {
    // opening "/*" already consumed
    while (!eof()) {
        if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            return;
        }
        if (advance() == '\n') saw_newline = true;
    }
    fail("Unterminated block comment", tok_line, tok_col);
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;
    while (!eof()) {
        scan_token(out);
    }
    add_token(out, TokenType::EOF_TOKEN, "", line, col, 0);
    return out;
}

void Lexer::scan_token(std::vector<Token>& out) {
    char c = peek();
    int tok_line = line;
    int tok_col = col;
    size_t start_index = i;

    if (c == '\n') {
        advance();
        saw_newline = true;
        return;
    }
    if (std::isspace(static_cast<unsigned char>(c))) {
        advance();
        return;
    }

    // comments
    if (c == '/' && peek_next() == '/') {
        skip_line_comment();
        return;
    }
    if (c == '/' && peek_next() == '*') {
        advance();
        advance();
        skip_block_comment(tok_line, tok_col);
        return;
    }

    if (std::isdigit(static_cast<unsigned char>(c)) || (c == '.' && std::isdigit(static_cast<unsigned char>(peek_next())))) {
        if (c == '0' && (peek_next() == 'x' || peek_next() == 'X')) {
            scan_hex_number(out, tok_line, tok_col, start_index);
        } else {
            scan_number(out, tok_line, tok_col, start_index);
        }
        return;
    }

    if (std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$') {
        scan_identifier_or_keyword(out, tok_line, tok_col, start_index);
        return;
    }

    if (c == '"' || c == '\'') {
        scan_quoted_string(out, tok_line, tok_col, start_index, c);
        return;
    }

    // operators: longest match first
    struct OpEntry {
        const char* text;
        TokenType type;
    };
    static const OpEntry ops[] = {
        {"===", TokenType::STRICT_EQUALITY},
        {"!==", TokenType::STRICT_NOTEQUAL},
        {"==", TokenType::EQUALITY},
        {"!=", TokenType::NOTEQUAL},
        {"<=", TokenType::LESSOREQUALTHAN},
        {">=", TokenType::GREATEROREQUALTHAN},
        {"&&", TokenType::AND},
        {"||", TokenType::OR},
        {"++", TokenType::INCREMENT},
        {"--", TokenType::DECREMENT},
        {"+=", TokenType::PLUS_ASSIGN},
        {"-=", TokenType::MINUS_ASSIGN},
        {"*=", TokenType::TIMES_ASSIGN},
        {"/=", TokenType::SLASH_ASSIGN},
        {"%=", TokenType::PERCENT_ASSIGN},
        {"<", TokenType::LESSTHAN},
        {">", TokenType::GREATERTHAN},
        {"=", TokenType::ASSIGN},
        {"!", TokenType::NOT},
        {"+", TokenType::PLUS},
        {"-", TokenType::MINUS},
        {"*", TokenType::STAR},
        {"/", TokenType::SLASH},
        {"%", TokenType::PERCENT},
        {";", TokenType::SEMICOLON},
        {",", TokenType::COMMA},
        {"(", TokenType::OPENPARENTHESIS},
        {")", TokenType::CLOSEPARENTHESIS},
        {"{", TokenType::OPENBRACE},
        {"}", TokenType::CLOSEBRACE},
        {"[", TokenType::OPENBRACKET},
        {"]", TokenType::CLOSEBRACKET},
        {":", TokenType::COLON},
        {"?", TokenType::QUESTIONMARK},
        {".", TokenType::DOT},
    };

    for (const auto& op : ops) {
        std::string text(op.text);
        if (src.compare(i, text.size(), text) == 0) {
            for (size_t k = 0; k < text.size(); ++k) advance();
            add_token(out, op.type, text, tok_line, tok_col);
            return;
        }
    }

    std::ostringstream ss;
    ss << "Unexpected character '" << c << "'";
    fail(ss.str(), tok_line, tok_col);
}

void Lexer::scan_quoted_string(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index, char quote) {
    // skip opening quote
    advance();
    std::string val;
    bool closed = false;

    while (!eof()) {
        char c = peek();
        if (c == quote) {
            advance();
            closed = true;
            break;
        }
        if (c == '\n') break;

        if (c == '\\') {
            advance();  // consume backslash
            char nxt = advance();
            switch (nxt) {
                case 'n': val.push_back('\n'); break;
                case 't': val.push_back('\t'); break;
                case 'r': val.push_back('\r'); break;
                case 'b': val.push_back('\b'); break;
                case 'f': val.push_back('\f'); break;
                case 'v': val.push_back('\v'); break;
                case '0': val.push_back('\0'); break;
                case '\n': break;  // line continuation
                case 'x': {
                    int hex_value = 0;
                    for (int d = 0; d < 2; ++d) {
                        char hc = peek();
                        if (!std::isxdigit(static_cast<unsigned char>(hc))) {
                            fail("Invalid hexadecimal escape sequence", tok_line, tok_col);
                        }
                        advance();
                        hex_value = hex_value * 16 + (std::isdigit(static_cast<unsigned char>(hc)) ? hc - '0' : (std::tolower(static_cast<unsigned char>(hc)) - 'a' + 10));
                    }
                    val.push_back(static_cast<char>(hex_value));
                    break;
                }
                default:
                    // \' \" \\ and unknown escapes keep the character itself
                    val.push_back(nxt);
                    break;
            }
            continue;
        }
        val.push_back(advance());
    }

    if (!closed) {
        fail("Unterminated string literal", tok_line, tok_col);
    }

    int tok_length = static_cast<int>(i - start_index);
    add_token(out, TokenType::STRING, val, tok_line, tok_col, tok_length);
}

void Lexer::scan_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string val;
    bool seen_dot = false;

    while (!eof()) {
        char c = peek();

        if (std::isdigit(static_cast<unsigned char>(c))) {
            val.push_back(advance());
        }
        // decimal point (only one allowed)
        else if (c == '.' && !seen_dot) {
            seen_dot = true;
            val.push_back(advance());
        }
        // exponent part: 'e' or 'E'
        else if (c == 'e' || c == 'E') {
            size_t save_i = i;
            int save_col = col;
            size_t saved_len = val.size();

            val.push_back(advance());
            if (!eof() && (peek() == '+' || peek() == '-')) {
                val.push_back(advance());
            }

            bool has_exp_digits = false;
            while (!eof() && std::isdigit(static_cast<unsigned char>(peek()))) {
                has_exp_digits = true;
                val.push_back(advance());
            }

            if (!has_exp_digits) {
                i = save_i;
                col = save_col;
                val.resize(saved_len);
                break;
            }
        } else {
            break;
        }
    }

    if (std::isalpha(static_cast<unsigned char>(peek())) || peek() == '_') {
        fail("Identifier starts immediately after numeric literal", tok_line, tok_col);
    }

    int tok_length = static_cast<int>(i - start_index);
    add_token(out, TokenType::NUMBER, val, tok_line, tok_col, tok_length);
}

void Lexer::scan_hex_number(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    advance();  // 0
    advance();  // x
    std::string digits;
    while (!eof() && std::isxdigit(static_cast<unsigned char>(peek()))) {
        digits.push_back(advance());
    }
    if (digits.empty()) {
        fail("Hexadecimal literal has no digits", tok_line, tok_col);
    }
    // normalise to decimal text so the parser only ever sees std::stod-able numbers
    double value = 0;
    for (char h : digits) {
        int d = std::isdigit(static_cast<unsigned char>(h)) ? h - '0' : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10;
        value = value * 16 + d;
    }
    std::ostringstream ss;
    ss.precision(17);
    ss << value;
    int tok_length = static_cast<int>(i - start_index);
    add_token(out, TokenType::NUMBER, ss.str(), tok_line, tok_col, tok_length);
}

void Lexer::scan_identifier_or_keyword(std::vector<Token>& out, int tok_line, int tok_col, size_t start_index) {
    std::string id;
    while (!eof()) {
        char c = peek();
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$')
            id.push_back(advance());
        else
            break;
    }

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"var", TokenType::VAR},
        {"let", TokenType::LET},
        {"const", TokenType::CONST},
        {"function", TokenType::FUNCTION},
        {"return", TokenType::RETURN},

        // control flow
        {"if", TokenType::IF},
        {"else", TokenType::ELSE},
        {"for", TokenType::FOR},
        {"in", TokenType::IN},
        {"while", TokenType::WHILE},
        {"do", TokenType::DO},
        {"break", TokenType::BREAK},
        {"continue", TokenType::CONTINUE},

        // objects
        {"new", TokenType::NEW},
        {"this", TokenType::THIS},

        // errors
        {"throw", TokenType::THROW},
        {"try", TokenType::TRY},
        {"catch", TokenType::CATCH},
        {"finally", TokenType::FINALLY},

        // operator keywords
        {"typeof", TokenType::TYPEOF},
        {"instanceof", TokenType::INSTANCEOF},
        {"delete", TokenType::DELETE},
        {"void", TokenType::VOID},

        // keyword literals
        {"true", TokenType::BOOLEAN},
        {"false", TokenType::BOOLEAN},
        {"null", TokenType::NULL_LITERAL},
        {"undefined", TokenType::UNDEFINED_LITERAL},
    };

    auto it = keywords.find(id);
    int tok_length = static_cast<int>(i - start_index);
    if (it != keywords.end()) {
        add_token(out, it->second, id, tok_line, tok_col, tok_length);
    } else {
        add_token(out, TokenType::IDENTIFIER, id, tok_line, tok_col, tok_length);
    }
}
