#pragma once
#include <memory>
#include <string>
#include <vector>

#include "token.hpp"

// Discriminant carried by every node. The evaluator dispatches on it, so the
// set of kinds is the node-shape grammar the engine accepts.
enum class NodeKind {
    // statements
    Program,
    Block,
    Empty,
    ExpressionStatement,
    VariableDeclaration,
    FunctionDeclaration,
    Return,
    If,
    For,
    ForIn,
    While,
    DoWhile,
    Break,
    Continue,
    Labeled,
    Throw,
    Try,

    // expressions
    Identifier,
    Literal,
    This,
    ArrayLiteral,
    ObjectLiteral,
    FunctionExpression,
    Member,
    Call,
    New,
    Unary,
    Update,
    Binary,
    Logical,
    Assignment,
    Conditional,
    Sequence,
};

constexpr size_t kNodeKindCount = static_cast<size_t>(NodeKind::Sequence) + 1;

// Deepest nesting the parser accepts. Scope analysis allows twice this for
// trees built by the host.
constexpr int kMaxNestingDepth = 1024;

const char* node_kind_name(NodeKind kind);

// Base class for all AST nodes
struct Node {
    explicit Node(NodeKind k) : kind(k) {}
    virtual ~Node() = default;

    NodeKind kind;
    Token token;  // filename, line, column for this node (set by the parser)

    virtual std::string to_string() const {
        return node_kind_name(kind);
    }
};

struct ExpressionNode : public Node {
    using Node::Node;
};

struct StatementNode : public Node {
    using Node::Node;
};

using ExprPtr = std::unique_ptr<ExpressionNode>;
using StmtPtr = std::unique_ptr<StatementNode>;

struct FunctionDeclarationNode;

// Names a function or program body declares, collected once before the body
// runs (var hoisting and function-declaration hoisting).
struct ScopeInfo {
    bool analyzed = false;
    std::vector<std::string> var_names;
    std::vector<const FunctionDeclarationNode*> functions;
};

// Shared by declarations and expressions.
struct FunctionNode {
    std::string name;  // empty for anonymous function expressions
    std::vector<std::string> params;
    std::vector<StmtPtr> body;
    Token token;
    ScopeInfo scope;
};

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

struct IdentifierNode : public ExpressionNode {
    IdentifierNode() : ExpressionNode(NodeKind::Identifier) {}
    std::string name;
    std::string to_string() const override {
        return name;
    }
};

enum class LiteralType {
    Number,
    String,
    Boolean,
    Null,
    Undefined
};

struct LiteralNode : public ExpressionNode {
    LiteralNode() : ExpressionNode(NodeKind::Literal) {}
    LiteralType type = LiteralType::Undefined;
    double number = 0;
    std::string string;
    bool boolean = false;

    std::string to_string() const override {
        switch (type) {
            case LiteralType::Number: return token.value;
            case LiteralType::String: return "\"" + string + "\"";
            case LiteralType::Boolean: return boolean ? "true" : "false";
            case LiteralType::Null: return "null";
            case LiteralType::Undefined: return "undefined";
        }
        return "<literal>";
    }
};

struct ThisNode : public ExpressionNode {
    ThisNode() : ExpressionNode(NodeKind::This) {}
    std::string to_string() const override { return "this"; }
};

struct ArrayLiteralNode : public ExpressionNode {
    ArrayLiteralNode() : ExpressionNode(NodeKind::ArrayLiteral) {}
    // nullptr entries are holes: [1, , 3]
    std::vector<ExprPtr> elements;
    std::string to_string() const override { return "[...]"; }
};

struct PropertyNode {
    std::string key;
    ExprPtr value;
    Token token;
};

struct ObjectLiteralNode : public ExpressionNode {
    ObjectLiteralNode() : ExpressionNode(NodeKind::ObjectLiteral) {}
    std::vector<PropertyNode> properties;
    std::string to_string() const override { return "{...}"; }
};

struct FunctionExpressionNode : public ExpressionNode {
    FunctionExpressionNode() : ExpressionNode(NodeKind::FunctionExpression) {}
    std::unique_ptr<FunctionNode> function;
    std::string to_string() const override {
        return "function " + (function ? function->name : std::string()) + "(...)";
    }
};

// obj.prop or obj[expr]
struct MemberExpressionNode : public ExpressionNode {
    MemberExpressionNode() : ExpressionNode(NodeKind::Member) {}
    ExprPtr object;
    std::string property;  // used when !computed
    ExprPtr computed_property;
    bool computed = false;

    std::string to_string() const override {
        std::string o = object ? object->to_string() : "<null>";
        if (computed) return o + "[" + (computed_property ? computed_property->to_string() : "<null>") + "]";
        return o + "." + property;
    }
};

struct CallExpressionNode : public ExpressionNode {
    CallExpressionNode() : ExpressionNode(NodeKind::Call) {}
    ExprPtr callee;
    std::vector<ExprPtr> arguments;

    std::string to_string() const override {
        return (callee ? callee->to_string() : "<null>") + "(...)";
    }
};

struct NewExpressionNode : public ExpressionNode {
    NewExpressionNode() : ExpressionNode(NodeKind::New) {}
    ExprPtr callee;
    std::vector<ExprPtr> arguments;

    std::string to_string() const override {
        return "new " + (callee ? callee->to_string() : "<null>") + "(...)";
    }
};

struct UnaryExpressionNode : public ExpressionNode {
    UnaryExpressionNode() : ExpressionNode(NodeKind::Unary) {}
    std::string op;  // "!", "-", "+", "typeof", "void", "delete"
    ExprPtr operand;
    std::string to_string() const override {
        std::string opnd = operand ? operand->to_string() : "<null>";
        return "(" + op + (op.size() > 1 ? " " : "") + opnd + ")";
    }
};

// ++x, x--, obj.count++
struct UpdateExpressionNode : public ExpressionNode {
    UpdateExpressionNode() : ExpressionNode(NodeKind::Update) {}
    std::string op;  // "++" or "--"
    bool prefix = false;
    ExprPtr argument;  // Identifier or Member
    std::string to_string() const override {
        std::string a = argument ? argument->to_string() : "<null>";
        return prefix ? op + a : a + op;
    }
};

struct BinaryExpressionNode : public ExpressionNode {
    BinaryExpressionNode() : ExpressionNode(NodeKind::Binary) {}
    std::string op;  // e.g. "+", "*", "===", "in", "instanceof"
    ExprPtr left;
    ExprPtr right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + l + " " + op + " " + r + ")";
    }
};

// && and || (short-circuiting, kept apart from BinaryExpressionNode)
struct LogicalExpressionNode : public ExpressionNode {
    LogicalExpressionNode() : ExpressionNode(NodeKind::Logical) {}
    std::string op;
    ExprPtr left;
    ExprPtr right;
    std::string to_string() const override {
        std::string l = left ? left->to_string() : "<null>";
        std::string r = right ? right->to_string() : "<null>";
        return "(" + l + " " + op + " " + r + ")";
    }
};

struct AssignmentExpressionNode : public ExpressionNode {
    AssignmentExpressionNode() : ExpressionNode(NodeKind::Assignment) {}
    std::string op;  // "=", "+=", "-=", "*=", "/=", "%="
    ExprPtr target;  // Identifier or Member
    ExprPtr value;
    std::string to_string() const override {
        return (target ? target->to_string() : "<null>") + " " + op + " " + (value ? value->to_string() : "<null>");
    }
};

struct ConditionalExpressionNode : public ExpressionNode {
    ConditionalExpressionNode() : ExpressionNode(NodeKind::Conditional) {}
    ExprPtr test;
    ExprPtr consequent;
    ExprPtr alternate;
};

struct SequenceExpressionNode : public ExpressionNode {
    SequenceExpressionNode() : ExpressionNode(NodeKind::Sequence) {}
    std::vector<ExprPtr> expressions;
};

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

struct EmptyStatementNode : public StatementNode {
    EmptyStatementNode() : StatementNode(NodeKind::Empty) {}
};

struct ExpressionStatementNode : public StatementNode {
    ExpressionStatementNode() : StatementNode(NodeKind::ExpressionStatement) {}
    ExprPtr expression;
};

struct BlockStatementNode : public StatementNode {
    BlockStatementNode() : StatementNode(NodeKind::Block) {}
    std::vector<StmtPtr> body;
};

enum class DeclarationKind {
    Var,
    Let,
    Const
};

struct VariableDeclaratorNode {
    std::string name;
    ExprPtr init;  // may be null
    Token token;
};

struct VariableDeclarationNode : public StatementNode {
    VariableDeclarationNode() : StatementNode(NodeKind::VariableDeclaration) {}
    DeclarationKind decl_kind = DeclarationKind::Var;
    std::vector<VariableDeclaratorNode> declarations;
};

struct FunctionDeclarationNode : public StatementNode {
    FunctionDeclarationNode() : StatementNode(NodeKind::FunctionDeclaration) {}
    std::unique_ptr<FunctionNode> function;
};

struct ReturnStatementNode : public StatementNode {
    ReturnStatementNode() : StatementNode(NodeKind::Return) {}
    ExprPtr argument;  // may be null
};

struct IfStatementNode : public StatementNode {
    IfStatementNode() : StatementNode(NodeKind::If) {}
    ExprPtr test;
    StmtPtr consequent;
    StmtPtr alternate;  // may be null
};

// for (init; test; update) body -- every header part is optional
struct ForStatementNode : public StatementNode {
    ForStatementNode() : StatementNode(NodeKind::For) {}
    StmtPtr init;  // VariableDeclaration or ExpressionStatement
    ExprPtr test;
    ExprPtr update;
    StmtPtr body;
};

// for (left in right) body
struct ForInStatementNode : public StatementNode {
    ForInStatementNode() : StatementNode(NodeKind::ForIn) {}
    std::unique_ptr<VariableDeclarationNode> declaration;  // `var k` form
    ExprPtr target;                                        // `k` / `obj.k` form
    ExprPtr right;
    StmtPtr body;
};

struct WhileStatementNode : public StatementNode {
    WhileStatementNode() : StatementNode(NodeKind::While) {}
    ExprPtr test;
    StmtPtr body;
};

struct DoWhileStatementNode : public StatementNode {
    DoWhileStatementNode() : StatementNode(NodeKind::DoWhile) {}
    StmtPtr body;
    ExprPtr test;
};

struct BreakStatementNode : public StatementNode {
    BreakStatementNode() : StatementNode(NodeKind::Break) {}
    std::string label;
};

struct ContinueStatementNode : public StatementNode {
    ContinueStatementNode() : StatementNode(NodeKind::Continue) {}
    std::string label;
};

struct LabeledStatementNode : public StatementNode {
    LabeledStatementNode() : StatementNode(NodeKind::Labeled) {}
    std::string label;
    StmtPtr body;
};

struct ThrowStatementNode : public StatementNode {
    ThrowStatementNode() : StatementNode(NodeKind::Throw) {}
    ExprPtr argument;
};

struct TryStatementNode : public StatementNode {
    TryStatementNode() : StatementNode(NodeKind::Try) {}
    std::unique_ptr<BlockStatementNode> block;
    std::string catch_param;  // empty when there is no catch clause
    std::unique_ptr<BlockStatementNode> handler;
    std::unique_ptr<BlockStatementNode> finalizer;
};

struct ProgramNode : public StatementNode {
    ProgramNode() : StatementNode(NodeKind::Program) {}
    std::vector<StmtPtr> body;
    ScopeInfo scope;

    // owner of the text tokens point into (diagnostic traces)
    std::shared_ptr<SourceManager> source;
};
