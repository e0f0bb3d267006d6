#include <algorithm>

#include "parser.hpp"

StmtPtr Parser::parse_statement() {
    Token t = peek();
    DepthScope nesting(*this);
    deeper(t);
    switch (t.type) {
        case TokenType::SEMICOLON: {
            consume();
            auto node = std::make_unique<EmptyStatementNode>();
            node->token = t;
            return node;
        }
        case TokenType::OPENBRACE:
            return parse_block();
        case TokenType::VAR:
        case TokenType::LET:
        case TokenType::CONST:
            return parse_variable_declaration(true);
        case TokenType::FUNCTION:
            return parse_function_declaration();
        case TokenType::RETURN:
            return parse_return_statement();
        case TokenType::IF:
            return parse_if_statement();
        case TokenType::FOR:
            return parse_for_statement();
        case TokenType::WHILE:
            return parse_while_statement();
        case TokenType::DO:
            return parse_do_while_statement();
        case TokenType::BREAK:
            return parse_break_statement();
        case TokenType::CONTINUE:
            return parse_continue_statement();
        case TokenType::THROW:
            return parse_throw_statement();
        case TokenType::TRY:
            return parse_try_statement();
        case TokenType::IDENTIFIER:
            if (peek_next().type == TokenType::COLON) {
                consume();
                consume();  // ':'
                if (std::find(labels.begin(), labels.end(), t.value) != labels.end()) {
                    fail(t, "Label '" + t.value + "' has already been declared");
                }

                // `a: b: for (...)` lets `continue a` target the loop too
                size_t ahead = 0;
                while (peek_next(ahead).type == TokenType::IDENTIFIER && peek_next(ahead + 1).type == TokenType::COLON) {
                    ahead += 2;
                }
                TokenType next = peek_next(ahead).type;
                bool is_loop = next == TokenType::FOR || next == TokenType::WHILE || next == TokenType::DO;
                labels.push_back(t.value);
                if (is_loop) loop_labels.push_back(t.value);

                auto node = std::make_unique<LabeledStatementNode>();
                node->token = t;
                node->label = t.value;
                node->body = parse_statement();

                if (is_loop) loop_labels.pop_back();
                labels.pop_back();
                return node;
            }
            break;
        default:
            break;
    }
    return parse_expression_statement();
}

std::unique_ptr<VariableDeclarationNode> Parser::parse_variable_declaration(bool consume_end) {
    Token kw = consume();  // var / let / const
    auto node = std::make_unique<VariableDeclarationNode>();
    node->token = kw;
    if (kw.type == TokenType::LET)
        node->decl_kind = DeclarationKind::Let;
    else if (kw.type == TokenType::CONST)
        node->decl_kind = DeclarationKind::Const;
    else
        node->decl_kind = DeclarationKind::Var;

    do {
        Token idTok = expect(TokenType::IDENTIFIER, "Expected identifier after '" + kw.value + "'");
        VariableDeclaratorNode decl;
        decl.name = idTok.value;
        decl.token = idTok;
        if (match(TokenType::ASSIGN)) {
            decl.init = parse_assignment();
        } else if (node->decl_kind == DeclarationKind::Const && !(no_in && peek().type == TokenType::IN)) {
            fail(peek(), "Missing initializer in const declaration '" + idTok.value + "'");
        }
        node->declarations.push_back(std::move(decl));
    } while (match(TokenType::COMMA));

    if (consume_end) consume_statement_end();
    return node;
}

StmtPtr Parser::parse_function_declaration() {
    Token fnTok = consume();  // 'function'
    auto node = std::make_unique<FunctionDeclarationNode>();
    node->token = fnTok;
    node->function = parse_function_rest(fnTok, true);
    return node;
}

std::unique_ptr<BlockStatementNode> Parser::parse_block() {
    Token open = expect(TokenType::OPENBRACE, "Expected '{' to start block");
    auto block = std::make_unique<BlockStatementNode>();
    block->token = open;
    while (peek().type != TokenType::CLOSEBRACE) {
        if (peek().type == TokenType::EOF_TOKEN) {
            fail(peek(), "Expected '}' to close block");
        }
        block->body.push_back(parse_statement());
    }
    consume();  // '}'
    return block;
}

StmtPtr Parser::parse_return_statement() {
    Token retTok = consume();
    if (function_depth == 0) {
        fail(retTok, "Illegal return statement outside of a function");
    }
    auto node = std::make_unique<ReturnStatementNode>();
    node->token = retTok;

    Token t = peek();
    if (t.type != TokenType::SEMICOLON && t.type != TokenType::CLOSEBRACE &&
        t.type != TokenType::EOF_TOKEN && !t.newline_before) {
        node->argument = parse_expression();
    }
    consume_statement_end();
    return node;
}

StmtPtr Parser::parse_if_statement() {
    Token ifTok = consume();
    expect(TokenType::OPENPARENTHESIS, "Expected '(' after 'if'");
    auto node = std::make_unique<IfStatementNode>();
    node->token = ifTok;
    node->test = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after if condition");
    node->consequent = parse_statement();
    if (match(TokenType::ELSE)) {
        node->alternate = parse_statement();
    }
    return node;
}

// for (init; test; update) body  |  for (var k in obj) body  |  for (k in obj) body
StmtPtr Parser::parse_for_statement() {
    Token forTok = consume();
    expect(TokenType::OPENPARENTHESIS, "Expected '(' after 'for'");

    StmtPtr init;
    std::unique_ptr<VariableDeclarationNode> in_decl;
    ExprPtr in_target;
    bool is_for_in = false;

    if (peek().type != TokenType::SEMICOLON) {
        no_in = true;
        if (peek().type == TokenType::VAR || peek().type == TokenType::LET || peek().type == TokenType::CONST) {
            auto decl = parse_variable_declaration(false);
            if (peek().type == TokenType::IN) {
                if (decl->declarations.size() != 1 || decl->declarations[0].init) {
                    fail(peek(), "Invalid left-hand side in for-in loop");
                }
                in_decl = std::move(decl);
                is_for_in = true;
            } else {
                init = std::move(decl);
            }
        } else {
            Token exprTok = peek();
            auto expr = parse_expression();
            if (peek().type == TokenType::IN) {
                if (expr->kind != NodeKind::Identifier && expr->kind != NodeKind::Member) {
                    fail(exprTok, "Invalid left-hand side in for-in loop");
                }
                in_target = std::move(expr);
                is_for_in = true;
            } else {
                auto stmt = std::make_unique<ExpressionStatementNode>();
                stmt->token = exprTok;
                stmt->expression = std::move(expr);
                init = std::move(stmt);
            }
        }
        no_in = false;
    }

    if (is_for_in) {
        consume();  // 'in'
        auto node = std::make_unique<ForInStatementNode>();
        node->token = forTok;
        node->declaration = std::move(in_decl);
        node->target = std::move(in_target);
        node->right = parse_expression();
        expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after for-in header");
        loop_depth++;
        node->body = parse_statement();
        loop_depth--;
        return node;
    }

    auto node = std::make_unique<ForStatementNode>();
    node->token = forTok;
    node->init = std::move(init);
    expect(TokenType::SEMICOLON, "Expected ';' after for-loop initializer");
    if (peek().type != TokenType::SEMICOLON) {
        node->test = parse_expression();
    }
    expect(TokenType::SEMICOLON, "Expected ';' after for-loop condition");
    if (peek().type != TokenType::CLOSEPARENTHESIS) {
        node->update = parse_expression();
    }
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after for-loop header");
    loop_depth++;
    node->body = parse_statement();
    loop_depth--;
    return node;
}

StmtPtr Parser::parse_while_statement() {
    Token whileTok = consume();
    expect(TokenType::OPENPARENTHESIS, "Expected '(' after 'while'");
    auto node = std::make_unique<WhileStatementNode>();
    node->token = whileTok;
    node->test = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after while condition");
    loop_depth++;
    node->body = parse_statement();
    loop_depth--;
    return node;
}

StmtPtr Parser::parse_do_while_statement() {
    Token doTok = consume();
    auto node = std::make_unique<DoWhileStatementNode>();
    node->token = doTok;
    loop_depth++;
    node->body = parse_statement();
    loop_depth--;
    expect(TokenType::WHILE, "Expected 'while' after do-loop body");
    expect(TokenType::OPENPARENTHESIS, "Expected '(' after 'while'");
    node->test = parse_expression();
    expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after do-while condition");
    match(TokenType::SEMICOLON);
    return node;
}

StmtPtr Parser::parse_break_statement() {
    Token breakTok = consume();
    auto node = std::make_unique<BreakStatementNode>();
    node->token = breakTok;
    if (peek().type == TokenType::IDENTIFIER && !peek().newline_before) {
        Token label = consume();
        if (std::find(labels.begin(), labels.end(), label.value) == labels.end()) {
            fail(label, "Undefined label '" + label.value + "'");
        }
        node->label = label.value;
    } else if (loop_depth == 0) {
        fail(breakTok, "Illegal break statement");
    }
    consume_statement_end();
    return node;
}

StmtPtr Parser::parse_continue_statement() {
    Token contTok = consume();
    auto node = std::make_unique<ContinueStatementNode>();
    node->token = contTok;
    if (loop_depth == 0) {
        fail(contTok, "Illegal continue statement: no surrounding loop");
    }
    if (peek().type == TokenType::IDENTIFIER && !peek().newline_before) {
        Token label = consume();
        if (std::find(loop_labels.begin(), loop_labels.end(), label.value) == loop_labels.end()) {
            fail(label, "Undefined loop label '" + label.value + "'");
        }
        node->label = label.value;
    }
    consume_statement_end();
    return node;
}

StmtPtr Parser::parse_throw_statement() {
    Token throwTok = consume();
    if (peek().newline_before || peek().type == TokenType::EOF_TOKEN) {
        fail(peek(), "Illegal newline after throw");
    }
    auto node = std::make_unique<ThrowStatementNode>();
    node->token = throwTok;
    node->argument = parse_expression();
    consume_statement_end();
    return node;
}

StmtPtr Parser::parse_try_statement() {
    Token tryTok = consume();
    auto node = std::make_unique<TryStatementNode>();
    node->token = tryTok;
    node->block = parse_block();

    if (match(TokenType::CATCH)) {
        expect(TokenType::OPENPARENTHESIS, "Expected '(' after 'catch'");
        node->catch_param = expect(TokenType::IDENTIFIER, "Expected catch parameter name").value;
        expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after catch parameter");
        node->handler = parse_block();
    }
    if (match(TokenType::FINALLY)) {
        node->finalizer = parse_block();
    }
    if (!node->handler && !node->finalizer) {
        fail(peek(), "Missing catch or finally after try");
    }
    return node;
}

StmtPtr Parser::parse_expression_statement() {
    Token start = peek();
    auto node = std::make_unique<ExpressionStatementNode>();
    node->token = start;
    node->expression = parse_expression();
    consume_statement_end();
    return node;
}
