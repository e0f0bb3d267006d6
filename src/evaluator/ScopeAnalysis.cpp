// src/evaluator/ScopeAnalysis.cpp
//
// Runs once at construction: records what each function (and the program)
// hoists, and rejects trees that do not follow the node-shape grammar.
#include <algorithm>

#include "evaluator.hpp"

namespace {

class ScopeAnalyzer {
   public:
    void scope(std::vector<StmtPtr>& body, ScopeInfo& info) {
        ScopeInfo* saved = current_;
        current_ = &info;
        info.var_names.clear();
        info.functions.clear();
        for (auto& st : body) statement(st.get(), nullptr);
        info.analyzed = true;
        current_ = saved;
    }

   private:
    ScopeInfo* current_ = nullptr;
    int depth_ = 0;

    // the walk recurses once per tree level
    class Nesting {
       public:
        Nesting(ScopeAnalyzer& a, const Node* at) : analyzer_(a) {
            if (++analyzer_.depth_ > 2 * kMaxNestingDepth) analyzer_.malformed(at, "program is nested too deeply");
        }
        ~Nesting() { --analyzer_.depth_; }
        Nesting(const Nesting&) = delete;
        Nesting& operator=(const Nesting&) = delete;

       private:
        ScopeAnalyzer& analyzer_;
    };

    [[noreturn]] void malformed(const Node* at, const std::string& what) {
        if (at) throw SandstepError("SyntaxError", what, at->token.loc);
        throw SandstepError("SyntaxError", what);
    }

    void add_var(const std::string& name) {
        auto& names = current_->var_names;
        if (std::find(names.begin(), names.end(), name) == names.end()) names.push_back(name);
    }

    void function(FunctionNode* fn, const Node* owner) {
        if (!fn) malformed(owner, "function node without a body");
        scope(fn->body, fn->scope);
    }

    void required(ExpressionNode* e, const Node* owner, const char* what) {
        if (!e) malformed(owner, std::string(node_kind_name(owner->kind)) + " is missing its " + what);
        expression(e);
    }

    void reference(ExpressionNode* e, const Node* owner) {
        if (!e || (e->kind != NodeKind::Identifier && e->kind != NodeKind::Member)) {
            malformed(owner, "invalid assignment target");
        }
        expression(e);
    }

    void statement(StatementNode* st, const Node* owner) {
        if (!st) malformed(owner, "missing statement");
        Nesting nesting(*this, st);
        switch (st->kind) {
            case NodeKind::Empty:
            case NodeKind::Break:
            case NodeKind::Continue:
                return;
            case NodeKind::Block:
                for (auto& inner : static_cast<BlockStatementNode*>(st)->body) statement(inner.get(), st);
                return;
            case NodeKind::ExpressionStatement:
                required(static_cast<ExpressionStatementNode*>(st)->expression.get(), st, "expression");
                return;
            case NodeKind::VariableDeclaration: {
                auto* decl = static_cast<VariableDeclarationNode*>(st);
                for (auto& d : decl->declarations) {
                    if (d.name.empty()) malformed(st, "declarator without a name");
                    if (decl->decl_kind == DeclarationKind::Var) add_var(d.name);
                    expression(d.init.get());
                }
                return;
            }
            case NodeKind::FunctionDeclaration: {
                auto* fd = static_cast<FunctionDeclarationNode*>(st);
                if (!fd->function || fd->function->name.empty()) malformed(st, "function declaration without a name");
                current_->functions.push_back(fd);
                function(fd->function.get(), st);
                return;
            }
            case NodeKind::Return:
                expression(static_cast<ReturnStatementNode*>(st)->argument.get());
                return;
            case NodeKind::If: {
                auto* n = static_cast<IfStatementNode*>(st);
                required(n->test.get(), st, "test");
                statement(n->consequent.get(), st);
                if (n->alternate) statement(n->alternate.get(), st);
                return;
            }
            case NodeKind::For: {
                auto* n = static_cast<ForStatementNode*>(st);
                if (n->init) statement(n->init.get(), st);
                expression(n->test.get());
                expression(n->update.get());
                statement(n->body.get(), st);
                return;
            }
            case NodeKind::ForIn: {
                auto* n = static_cast<ForInStatementNode*>(st);
                if (n->declaration) {
                    if (n->declaration->declarations.size() != 1) malformed(st, "for-in declares exactly one name");
                    statement(n->declaration.get(), st);
                } else {
                    reference(n->target.get(), st);
                }
                required(n->right.get(), st, "object");
                statement(n->body.get(), st);
                return;
            }
            case NodeKind::While: {
                auto* n = static_cast<WhileStatementNode*>(st);
                required(n->test.get(), st, "test");
                statement(n->body.get(), st);
                return;
            }
            case NodeKind::DoWhile: {
                auto* n = static_cast<DoWhileStatementNode*>(st);
                statement(n->body.get(), st);
                required(n->test.get(), st, "test");
                return;
            }
            case NodeKind::Labeled:
                statement(static_cast<LabeledStatementNode*>(st)->body.get(), st);
                return;
            case NodeKind::Throw:
                required(static_cast<ThrowStatementNode*>(st)->argument.get(), st, "argument");
                return;
            case NodeKind::Try: {
                auto* n = static_cast<TryStatementNode*>(st);
                statement(n->block.get(), st);
                if (!n->handler && !n->finalizer) malformed(st, "try without catch or finally");
                if (n->handler) statement(n->handler.get(), st);
                if (n->finalizer) statement(n->finalizer.get(), st);
                return;
            }
            default:
                malformed(st, std::string("unexpected ") + node_kind_name(st->kind) + " in statement position");
        }
    }

    void expression(ExpressionNode* e) {
        if (!e) return;
        Nesting nesting(*this, e);
        switch (e->kind) {
            case NodeKind::Identifier:
            case NodeKind::Literal:
            case NodeKind::This:
                return;
            case NodeKind::ArrayLiteral:
                for (auto& el : static_cast<ArrayLiteralNode*>(e)->elements) expression(el.get());
                return;
            case NodeKind::ObjectLiteral:
                for (auto& p : static_cast<ObjectLiteralNode*>(e)->properties) required(p.value.get(), e, "property value");
                return;
            case NodeKind::FunctionExpression:
                function(static_cast<FunctionExpressionNode*>(e)->function.get(), e);
                return;
            case NodeKind::Member: {
                auto* n = static_cast<MemberExpressionNode*>(e);
                required(n->object.get(), e, "object");
                if (n->computed) required(n->computed_property.get(), e, "property");
                return;
            }
            case NodeKind::Call: {
                auto* n = static_cast<CallExpressionNode*>(e);
                required(n->callee.get(), e, "callee");
                for (auto& a : n->arguments) required(a.get(), e, "argument");
                return;
            }
            case NodeKind::New: {
                auto* n = static_cast<NewExpressionNode*>(e);
                required(n->callee.get(), e, "callee");
                for (auto& a : n->arguments) required(a.get(), e, "argument");
                return;
            }
            case NodeKind::Unary:
                required(static_cast<UnaryExpressionNode*>(e)->operand.get(), e, "operand");
                return;
            case NodeKind::Update:
                reference(static_cast<UpdateExpressionNode*>(e)->argument.get(), e);
                return;
            case NodeKind::Binary: {
                auto* n = static_cast<BinaryExpressionNode*>(e);
                required(n->left.get(), e, "left operand");
                required(n->right.get(), e, "right operand");
                return;
            }
            case NodeKind::Logical: {
                auto* n = static_cast<LogicalExpressionNode*>(e);
                if (n->op != "&&" && n->op != "||") malformed(e, "unsupported logical operator '" + n->op + "'");
                required(n->left.get(), e, "left operand");
                required(n->right.get(), e, "right operand");
                return;
            }
            case NodeKind::Assignment: {
                auto* n = static_cast<AssignmentExpressionNode*>(e);
                reference(n->target.get(), e);
                required(n->value.get(), e, "value");
                return;
            }
            case NodeKind::Conditional: {
                auto* n = static_cast<ConditionalExpressionNode*>(e);
                required(n->test.get(), e, "test");
                required(n->consequent.get(), e, "consequent");
                required(n->alternate.get(), e, "alternate");
                return;
            }
            case NodeKind::Sequence: {
                auto* n = static_cast<SequenceExpressionNode*>(e);
                if (n->expressions.empty()) malformed(e, "empty sequence expression");
                for (auto& x : n->expressions) required(x.get(), e, "expression");
                return;
            }
            default:
                malformed(e, std::string("unexpected ") + node_kind_name(e->kind) + " in expression position");
        }
    }
};

}  // namespace

void Evaluator::analyze(ProgramNode& program) {
    ScopeAnalyzer analyzer;
    analyzer.scope(program.body, program.scope);
}
