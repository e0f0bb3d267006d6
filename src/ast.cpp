#include "ast.hpp"

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Program: return "Program";
        case NodeKind::Block: return "Block";
        case NodeKind::Empty: return "Empty";
        case NodeKind::ExpressionStatement: return "ExpressionStatement";
        case NodeKind::VariableDeclaration: return "VariableDeclaration";
        case NodeKind::FunctionDeclaration: return "FunctionDeclaration";
        case NodeKind::Return: return "Return";
        case NodeKind::If: return "If";
        case NodeKind::For: return "For";
        case NodeKind::ForIn: return "ForIn";
        case NodeKind::While: return "While";
        case NodeKind::DoWhile: return "DoWhile";
        case NodeKind::Break: return "Break";
        case NodeKind::Continue: return "Continue";
        case NodeKind::Labeled: return "Labeled";
        case NodeKind::Throw: return "Throw";
        case NodeKind::Try: return "Try";
        case NodeKind::Identifier: return "Identifier";
        case NodeKind::Literal: return "Literal";
        case NodeKind::This: return "This";
        case NodeKind::ArrayLiteral: return "ArrayLiteral";
        case NodeKind::ObjectLiteral: return "ObjectLiteral";
        case NodeKind::FunctionExpression: return "FunctionExpression";
        case NodeKind::Member: return "Member";
        case NodeKind::Call: return "Call";
        case NodeKind::New: return "New";
        case NodeKind::Unary: return "Unary";
        case NodeKind::Update: return "Update";
        case NodeKind::Binary: return "Binary";
        case NodeKind::Logical: return "Logical";
        case NodeKind::Assignment: return "Assignment";
        case NodeKind::Conditional: return "Conditional";
        case NodeKind::Sequence: return "Sequence";
    }
    return "Unknown";
}
