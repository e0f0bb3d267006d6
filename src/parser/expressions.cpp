#include <string>

#include "parser.hpp"

// ---------- expressions (precedence) ----------
ExprPtr Parser::parse_expression() {
    Token first = peek();
    auto expr = parse_assignment();
    if (peek().type != TokenType::COMMA) {
        return expr;
    }

    auto seq = std::make_unique<SequenceExpressionNode>();
    seq->token = first;
    seq->expressions.push_back(std::move(expr));
    while (match(TokenType::COMMA)) {
        seq->expressions.push_back(parse_assignment());
    }
    return seq;
}

static const char* assignment_operator(TokenType t) {
    switch (t) {
        case TokenType::ASSIGN: return "=";
        case TokenType::PLUS_ASSIGN: return "+=";
        case TokenType::MINUS_ASSIGN: return "-=";
        case TokenType::TIMES_ASSIGN: return "*=";
        case TokenType::SLASH_ASSIGN: return "/=";
        case TokenType::PERCENT_ASSIGN: return "%=";
        default: return nullptr;
    }
}

ExprPtr Parser::parse_assignment() {
    DepthScope nesting(*this);
    deeper(peek());
    auto left = parse_conditional();

    const char* op = assignment_operator(peek().type);
    if (!op) {
        return left;
    }

    Token opTok = consume();
    if (left->kind != NodeKind::Identifier && left->kind != NodeKind::Member) {
        fail(opTok, "Invalid assignment target");
    }

    auto node = std::make_unique<AssignmentExpressionNode>();
    node->token = opTok;
    node->op = op;
    node->target = std::move(left);
    node->value = parse_assignment();  // right-associative
    return node;
}

ExprPtr Parser::parse_conditional() {
    auto cond = parse_logical_or();

    if (peek().type != TokenType::QUESTIONMARK) {
        return cond;
    }

    Token qTok = consume();  // consume '?'

    // `in` is allowed again between '?' and ':'
    bool saved_no_in = no_in;
    no_in = false;
    auto thenExpr = parse_assignment();
    no_in = saved_no_in;

    expect(TokenType::COLON, "Expected ':' after conditional 'then' expression");
    auto elseExpr = parse_assignment();

    auto node = std::make_unique<ConditionalExpressionNode>();
    node->token = qTok;
    node->test = std::move(cond);
    node->consequent = std::move(thenExpr);
    node->alternate = std::move(elseExpr);
    return node;
}

ExprPtr Parser::parse_logical_or() {
    DepthScope nesting(*this);
    auto left = parse_logical_and();
    while (peek().type == TokenType::OR) {
        Token op = consume();
        deeper(op);
        auto right = parse_logical_and();
        auto node = std::make_unique<LogicalExpressionNode>();
        node->op = "||";
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

ExprPtr Parser::parse_logical_and() {
    DepthScope nesting(*this);
    auto left = parse_equality();
    while (peek().type == TokenType::AND) {
        Token op = consume();
        deeper(op);
        auto right = parse_equality();
        auto node = std::make_unique<LogicalExpressionNode>();
        node->op = "&&";
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

ExprPtr Parser::parse_equality() {
    DepthScope nesting(*this);
    auto left = parse_relational();
    while (peek().type == TokenType::EQUALITY ||
        peek().type == TokenType::NOTEQUAL ||
        peek().type == TokenType::STRICT_EQUALITY ||
        peek().type == TokenType::STRICT_NOTEQUAL) {
        Token op = consume();
        deeper(op);
        auto right = parse_relational();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

ExprPtr Parser::parse_relational() {
    DepthScope nesting(*this);
    auto left = parse_additive();
    while (peek().type == TokenType::GREATERTHAN ||
        peek().type == TokenType::GREATEROREQUALTHAN ||
        peek().type == TokenType::LESSTHAN ||
        peek().type == TokenType::LESSOREQUALTHAN ||
        peek().type == TokenType::INSTANCEOF ||
        (peek().type == TokenType::IN && !no_in)) {
        Token op = consume();
        deeper(op);
        auto right = parse_additive();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.value;
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

ExprPtr Parser::parse_additive() {
    DepthScope nesting(*this);
    auto left = parse_multiplicative();
    while (peek().type == TokenType::PLUS || peek().type == TokenType::MINUS) {
        Token op = consume();
        deeper(op);
        auto right = parse_multiplicative();
        auto node = std::make_unique<BinaryExpressionNode>();
        node->op = op.type == TokenType::PLUS ? "+" : "-";
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

ExprPtr Parser::parse_multiplicative() {
    DepthScope nesting(*this);
    auto left = parse_unary();
    while (peek().type == TokenType::STAR || peek().type == TokenType::SLASH || peek().type == TokenType::PERCENT) {
        Token op = consume();
        deeper(op);
        auto right = parse_unary();
        auto node = std::make_unique<BinaryExpressionNode>();
        if (op.type == TokenType::STAR)
            node->op = "*";
        else if (op.type == TokenType::SLASH)
            node->op = "/";
        else
            node->op = "%";
        node->left = std::move(left);
        node->right = std::move(right);
        node->token = op;
        left = std::move(node);
    }
    return left;
}

ExprPtr Parser::parse_unary() {
    Token t = peek();
    DepthScope nesting(*this);
    deeper(t);
    switch (t.type) {
        case TokenType::NOT:
        case TokenType::MINUS:
        case TokenType::PLUS:
        case TokenType::TYPEOF:
        case TokenType::VOID:
        case TokenType::DELETE: {
            consume();
            auto node = std::make_unique<UnaryExpressionNode>();
            node->token = t;
            node->op = t.value;
            node->operand = parse_unary();
            return node;
        }
        case TokenType::INCREMENT:
        case TokenType::DECREMENT: {
            consume();
            auto arg = parse_unary();
            if (arg->kind != NodeKind::Identifier && arg->kind != NodeKind::Member) {
                fail(t, "Invalid operand for prefix " + t.value);
            }
            auto node = std::make_unique<UpdateExpressionNode>();
            node->token = t;
            node->op = t.value;
            node->prefix = true;
            node->argument = std::move(arg);
            return node;
        }
        default:
            return parse_postfix();
    }
}

ExprPtr Parser::parse_postfix() {
    auto expr = parse_call_member();
    Token t = peek();
    if ((t.type == TokenType::INCREMENT || t.type == TokenType::DECREMENT) && !t.newline_before) {
        consume();
        if (expr->kind != NodeKind::Identifier && expr->kind != NodeKind::Member) {
            fail(t, "Invalid operand for postfix " + t.value);
        }
        auto node = std::make_unique<UpdateExpressionNode>();
        node->token = t;
        node->op = t.value;
        node->prefix = false;
        node->argument = std::move(expr);
        return node;
    }
    return expr;
}

std::vector<ExprPtr> Parser::parse_arguments() {
    // '(' already consumed
    std::vector<ExprPtr> args;
    bool saved_no_in = no_in;
    no_in = false;
    if (!match(TokenType::CLOSEPARENTHESIS)) {
        do {
            args.push_back(parse_assignment());
        } while (match(TokenType::COMMA));
        expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after arguments");
    }
    no_in = saved_no_in;
    return args;
}

ExprPtr Parser::parse_call_member() {
    DepthScope nesting(*this);
    ExprPtr expr = peek().type == TokenType::NEW ? parse_new() : parse_primary();

    while (true) {
        Token t = peek();
        if (t.type == TokenType::DOT || t.type == TokenType::OPENBRACKET || t.type == TokenType::OPENPARENTHESIS) {
            deeper(t);
        }
        if (t.type == TokenType::DOT) {
            consume();
            auto node = std::make_unique<MemberExpressionNode>();
            node->token = t;
            node->object = std::move(expr);
            node->property = expect_identifier_name("Expected property name after '.'");
            expr = std::move(node);
        } else if (t.type == TokenType::OPENBRACKET) {
            consume();
            bool saved_no_in = no_in;
            no_in = false;
            auto node = std::make_unique<MemberExpressionNode>();
            node->token = t;
            node->object = std::move(expr);
            node->computed = true;
            node->computed_property = parse_expression();
            no_in = saved_no_in;
            expect(TokenType::CLOSEBRACKET, "Expected ']' after computed property");
            expr = std::move(node);
        } else if (t.type == TokenType::OPENPARENTHESIS) {
            consume();
            auto node = std::make_unique<CallExpressionNode>();
            node->token = t;
            node->callee = std::move(expr);
            node->arguments = parse_arguments();
            expr = std::move(node);
        } else {
            break;
        }
    }
    return expr;
}

// new Callee(args) -- member accesses bind to the callee, the first argument
// list belongs to `new`; anything after is handled by parse_call_member.
ExprPtr Parser::parse_new() {
    Token newTok = expect(TokenType::NEW, "Expected 'new'");
    DepthScope nesting(*this);
    deeper(newTok);

    ExprPtr callee = peek().type == TokenType::NEW ? parse_new() : parse_primary();
    while (true) {
        Token t = peek();
        if (t.type == TokenType::DOT) {
            consume();
            auto node = std::make_unique<MemberExpressionNode>();
            node->token = t;
            node->object = std::move(callee);
            node->property = expect_identifier_name("Expected property name after '.'");
            callee = std::move(node);
        } else if (t.type == TokenType::OPENBRACKET) {
            consume();
            auto node = std::make_unique<MemberExpressionNode>();
            node->token = t;
            node->object = std::move(callee);
            node->computed = true;
            node->computed_property = parse_expression();
            expect(TokenType::CLOSEBRACKET, "Expected ']' after computed property");
            callee = std::move(node);
        } else {
            break;
        }
    }

    auto node = std::make_unique<NewExpressionNode>();
    node->token = newTok;
    node->callee = std::move(callee);
    if (match(TokenType::OPENPARENTHESIS)) {
        node->arguments = parse_arguments();
    }
    return node;
}

ExprPtr Parser::parse_primary() {
    Token t = peek();

    switch (t.type) {
        case TokenType::NUMBER: {
            consume();
            auto node = std::make_unique<LiteralNode>();
            node->token = t;
            node->type = LiteralType::Number;
            try {
                node->number = std::stod(t.value);
            } catch (const std::exception&) {
                fail(t, "Invalid numeric literal");
            }
            return node;
        }
        case TokenType::STRING: {
            consume();
            auto node = std::make_unique<LiteralNode>();
            node->token = t;
            node->type = LiteralType::String;
            node->string = t.value;
            return node;
        }
        case TokenType::BOOLEAN: {
            consume();
            auto node = std::make_unique<LiteralNode>();
            node->token = t;
            node->type = LiteralType::Boolean;
            node->boolean = (t.value == "true");
            return node;
        }
        case TokenType::NULL_LITERAL: {
            consume();
            auto node = std::make_unique<LiteralNode>();
            node->token = t;
            node->type = LiteralType::Null;
            return node;
        }
        case TokenType::UNDEFINED_LITERAL: {
            consume();
            auto node = std::make_unique<LiteralNode>();
            node->token = t;
            node->type = LiteralType::Undefined;
            return node;
        }
        case TokenType::IDENTIFIER: {
            consume();
            auto node = std::make_unique<IdentifierNode>();
            node->token = t;
            node->name = t.value;
            return node;
        }
        case TokenType::THIS: {
            consume();
            auto node = std::make_unique<ThisNode>();
            node->token = t;
            return node;
        }
        case TokenType::OPENPARENTHESIS: {
            consume();
            bool saved_no_in = no_in;
            no_in = false;
            auto inner = parse_expression();
            no_in = saved_no_in;
            expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after expression");
            return inner;
        }
        case TokenType::OPENBRACKET:
            return parse_array_literal();
        case TokenType::OPENBRACE:
            return parse_object_literal();
        case TokenType::FUNCTION: {
            Token fnTok = consume();
            auto node = std::make_unique<FunctionExpressionNode>();
            node->token = fnTok;
            node->function = parse_function_rest(fnTok, false);
            return node;
        }
        default:
            break;
    }

    fail(t, "Unexpected token in expression");
}

ExprPtr Parser::parse_array_literal() {
    Token open = expect(TokenType::OPENBRACKET, "Expected '['");
    auto node = std::make_unique<ArrayLiteralNode>();
    node->token = open;

    bool saved_no_in = no_in;
    no_in = false;
    while (peek().type != TokenType::CLOSEBRACKET) {
        if (peek().type == TokenType::COMMA) {
            consume();
            node->elements.push_back(nullptr);  // hole
            continue;
        }
        node->elements.push_back(parse_assignment());
        if (peek().type != TokenType::CLOSEBRACKET) {
            expect(TokenType::COMMA, "Expected ',' or ']' in array literal");
        }
    }
    no_in = saved_no_in;
    expect(TokenType::CLOSEBRACKET, "Expected ']' to close array literal");
    return node;
}

ExprPtr Parser::parse_object_literal() {
    Token open = expect(TokenType::OPENBRACE, "Expected '{'");
    auto node = std::make_unique<ObjectLiteralNode>();
    node->token = open;

    bool saved_no_in = no_in;
    no_in = false;
    while (peek().type != TokenType::CLOSEBRACE) {
        Token keyTok = peek();
        PropertyNode prop;
        prop.token = keyTok;
        if (keyTok.type == TokenType::STRING || keyTok.type == TokenType::NUMBER) {
            consume();
            prop.key = keyTok.value;
            if (keyTok.type == TokenType::NUMBER) {
                // integral numeric keys use their canonical spelling: {1.0: x} -> "1"
                double d = std::stod(keyTok.value);
                if (d == static_cast<double>(static_cast<long long>(d))) prop.key = std::to_string(static_cast<long long>(d));
            }
        } else {
            prop.key = expect_identifier_name("Expected property name in object literal");
        }
        expect(TokenType::COLON, "Expected ':' after property name");
        prop.value = parse_assignment();
        node->properties.push_back(std::move(prop));

        if (peek().type != TokenType::CLOSEBRACE) {
            expect(TokenType::COMMA, "Expected ',' or '}' in object literal");
        }
    }
    no_in = saved_no_in;
    expect(TokenType::CLOSEBRACE, "Expected '}' to close object literal");
    return node;
}

// Parses `name? (params) { body }` after the `function` keyword.
std::unique_ptr<FunctionNode> Parser::parse_function_rest(const Token& fnTok, bool require_name) {
    auto fn = std::make_unique<FunctionNode>();
    fn->token = fnTok;

    if (peek().type == TokenType::IDENTIFIER) {
        fn->name = consume().value;
    } else if (require_name) {
        fail(peek(), "Expected function name");
    }

    expect(TokenType::OPENPARENTHESIS, "Expected '(' after function name");
    if (!match(TokenType::CLOSEPARENTHESIS)) {
        do {
            Token p = expect(TokenType::IDENTIFIER, "Expected parameter name");
            fn->params.push_back(p.value);
        } while (match(TokenType::COMMA));
        expect(TokenType::CLOSEPARENTHESIS, "Expected ')' after parameters");
    }

    // a function body starts a fresh context: no enclosing loops or labels
    bool saved_no_in = no_in;
    int saved_loop_depth = loop_depth;
    std::vector<std::string> saved_labels;
    std::vector<std::string> saved_loop_labels;
    saved_labels.swap(labels);
    saved_loop_labels.swap(loop_labels);
    no_in = false;
    loop_depth = 0;
    function_depth++;

    expect(TokenType::OPENBRACE, "Expected '{' to start function body");
    while (peek().type != TokenType::CLOSEBRACE) {
        if (peek().type == TokenType::EOF_TOKEN) {
            fail(peek(), "Unterminated function body");
        }
        fn->body.push_back(parse_statement());
    }
    expect(TokenType::CLOSEBRACE, "Expected '}' to close function body");

    function_depth--;
    loop_depth = saved_loop_depth;
    labels.swap(saved_labels);
    loop_labels.swap(saved_loop_labels);
    no_in = saved_no_in;
    return fn;
}
