#pragma once
#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "token.hpp"

class Parser {
   public:
    Parser(const std::vector<Token>& tokens);
    std::unique_ptr<ProgramNode> parse();

   private:
    std::vector<Token> tokens;
    size_t position = 0;

    // set while parsing a for-statement head so `in` is left for the loop
    bool no_in = false;

    // placement checks for return / break / continue
    int function_depth = 0;
    int loop_depth = 0;
    std::vector<std::string> labels;
    std::vector<std::string> loop_labels;

    // Recursion plus left-leaning operator chains. Bounded so deeply nested
    // source is a SyntaxError rather than native stack exhaustion.
    int depth = 0;
    struct DepthScope {
        explicit DepthScope(Parser& p) : parser(p), saved(p.depth) {}
        ~DepthScope() { parser.depth = saved; }
        DepthScope(const DepthScope&) = delete;
        DepthScope& operator=(const DepthScope&) = delete;
        Parser& parser;
        int saved;
    };
    void deeper(const Token& at);

    Token peek() const;
    Token peek_next(size_t offset = 1) const;

    Token consume();
    bool match(TokenType t);
    Token expect(TokenType t, const std::string& errMsg);
    [[noreturn]] void fail(const Token& at, const std::string& errMsg) const;

    bool is_identifier_name(const Token& t) const;
    std::string expect_identifier_name(const std::string& errMsg);
    void consume_statement_end();

    // expression parsing (precedence chain)
    ExprPtr parse_expression();
    ExprPtr parse_assignment();
    ExprPtr parse_conditional();
    ExprPtr parse_logical_or();
    ExprPtr parse_logical_and();
    ExprPtr parse_equality();
    ExprPtr parse_relational();
    ExprPtr parse_additive();
    ExprPtr parse_multiplicative();
    ExprPtr parse_unary();
    ExprPtr parse_postfix();
    ExprPtr parse_call_member();
    ExprPtr parse_new();
    ExprPtr parse_primary();
    std::vector<ExprPtr> parse_arguments();

    ExprPtr parse_array_literal();
    ExprPtr parse_object_literal();
    std::unique_ptr<FunctionNode> parse_function_rest(const Token& fnTok, bool require_name);

    // statements
    StmtPtr parse_statement();
    std::unique_ptr<VariableDeclarationNode> parse_variable_declaration(bool consume_end);
    StmtPtr parse_function_declaration();
    std::unique_ptr<BlockStatementNode> parse_block();
    StmtPtr parse_return_statement();
    StmtPtr parse_if_statement();
    StmtPtr parse_for_statement();
    StmtPtr parse_while_statement();
    StmtPtr parse_do_while_statement();
    StmtPtr parse_break_statement();
    StmtPtr parse_continue_statement();
    StmtPtr parse_throw_statement();
    StmtPtr parse_try_statement();
    StmtPtr parse_expression_statement();
};

// Lex + parse in one go. The returned program owns a SourceManager for the text
// so error traces can quote it later.
std::unique_ptr<ProgramNode> parse_source(const std::string& source, const std::string& filename = "<script>");
