// src/evaluator/StatementEval.cpp
//
// Statement step handlers. Each call advances one statement by one phase;
// children are pushed on the explicit stack and their results arrive in
// EvalState::received.
#include <algorithm>

#include "conversions.hpp"
#include "evaluator.hpp"
#include "object_model.hpp"

namespace {

enum TryPhase {
    kTryStart = 0,
    kTryBlock = 1,
    kTryHandler = 2,
    kTryFinalizer = 3
};

bool targets(const std::vector<std::string>& labels, const std::string& label) {
    return label.empty() || std::find(labels.begin(), labels.end(), label) != labels.end();
}

bool is_loop(NodeKind kind) {
    return kind == NodeKind::For || kind == NodeKind::ForIn || kind == NodeKind::While || kind == NodeKind::DoWhile;
}

// phase a loop restarts from after `continue`
int continue_phase(NodeKind kind) {
    switch (kind) {
        case NodeKind::While: return 0;
        case NodeKind::DoWhile: return 1;
        case NodeKind::For: return 3;
        default: return 2;  // ForIn
    }
}

}  // namespace

// ----------------- completion routing -----------------

bool Evaluator::intercept(EvalState& s, const Completion& c) {
    switch (s.kind) {
        case StateKind::Boundary:
            if (c.type != Completion::Type::Throw) return false;
            s.pending = c;
            s.has_pending = true;
            return true;
        case StateKind::FunctionBody: {
            if (c.type != Completion::Type::Return) return false;
            Value result = c.value;
            if (s.construct && !is_object(result)) result = s.this_value;
            finish(std::move(result));
            return true;
        }
        case StateKind::Task:
            return false;
        case StateKind::Node:
            break;
    }

    NodeKind kind = s.node->kind;
    if (is_loop(kind)) {
        if (c.type == Completion::Type::Break && targets(s.labels, c.label)) {
            finish(Value{});
            return true;
        }
        if (c.type == Completion::Type::Continue && targets(s.labels, c.label)) {
            s.phase = continue_phase(kind);
            s.has_received = false;
            return true;
        }
        return false;
    }

    if (kind == NodeKind::Labeled) {
        auto* n = static_cast<const LabeledStatementNode*>(s.node);
        if (c.type == Completion::Type::Break && c.label == n->label) {
            finish(Value{});
            return true;
        }
        return false;
    }

    if (kind == NodeKind::Try) {
        auto* n = static_cast<const TryStatementNode*>(s.node);
        if (s.phase == kTryBlock && c.type == Completion::Type::Throw && n->handler) {
            auto catch_env = std::make_shared<Environment>(s.env);
            if (!n->catch_param.empty()) catch_env->declare(n->catch_param, c.value);
            s.phase = kTryHandler;
            push_node(n->handler.get(), catch_env);
            return true;
        }
        if ((s.phase == kTryBlock || s.phase == kTryHandler) && n->finalizer) {
            s.pending = c;
            s.has_pending = true;
            s.phase = kTryFinalizer;
            push_node(n->finalizer.get(), s.env);
            return true;
        }
        // an abrupt finalizer replaces whatever was parked
        return false;
    }

    return false;
}

// Pushes the next statement of `body`; true once every statement has run.
bool Evaluator::run_statement_list(EvalState& s, const std::vector<StmtPtr>& body) {
    if (s.index >= body.size()) return true;
    const StatementNode* next = body[s.index++].get();
    s.has_received = false;
    push_node(next, s.env);
    return false;
}

// ----------------- statements -----------------

void Evaluator::step_program(EvalState& s) {
    auto* program = static_cast<const ProgramNode*>(s.node);
    if (s.phase == 0) {
        instantiate_declarations(program->scope, s.env);
        s.phase = 1;
    }
    if (s.has_received && s.index > 0 && program->body[s.index - 1]->kind == NodeKind::ExpressionStatement) {
        last_value_ = s.received;
    }
    if (run_statement_list(s, program->body)) {
        log(LogLevel::Debug, "program finished after " + std::to_string(step_count_) + " steps");
        finish(Value{});
    }
}

void Evaluator::step_block(EvalState& s) {
    auto* n = static_cast<const BlockStatementNode*>(s.node);
    if (s.phase == 0) {
        s.env = std::make_shared<Environment>(s.env);
        s.phase = 1;
    }
    if (run_statement_list(s, n->body)) finish(Value{});
}

void Evaluator::step_empty(EvalState& s) {
    (void)s;
    finish(Value{});
}

void Evaluator::step_expression_statement(EvalState& s) {
    auto* n = static_cast<const ExpressionStatementNode*>(s.node);
    if (s.phase == 0) {
        s.phase = 1;
        push_node(n->expression.get(), s.env);
        return;
    }
    finish(std::move(s.received));
}

void Evaluator::step_variable_declaration(EvalState& s) {
    auto* n = static_cast<const VariableDeclarationNode*>(s.node);

    if (s.phase == 1) {
        s.phase = 0;
        const VariableDeclaratorNode& d = n->declarations[s.index];
        Value v = std::move(s.received);

        // `var f = function () {}` names the function after its binding
        if (auto fn = as_function(v)) {
            if (fn->name.empty() && d.init->kind == NodeKind::FunctionExpression) {
                fn->name = d.name;
                define_property(fn, "name", d.name, false, false, true);
            }
        }

        if (n->decl_kind == DeclarationKind::Var) {
            if (!assign_identifier(d.name, v, s.env, d.token)) return;
        } else {
            s.env->declare(d.name, v, n->decl_kind == DeclarationKind::Const);
        }
        ++s.index;
    }

    while (s.index < n->declarations.size()) {
        const VariableDeclaratorNode& d = n->declarations[s.index];
        if (d.init) {
            s.phase = 1;
            push_node(d.init.get(), s.env);
            return;
        }
        if (n->decl_kind != DeclarationKind::Var) s.env->declare(d.name, Value{});
        ++s.index;
    }
    finish(Value{});
}

// hoisted when the enclosing body started
void Evaluator::step_function_declaration(EvalState& s) {
    (void)s;
    finish(Value{});
}

void Evaluator::step_return(EvalState& s) {
    auto* n = static_cast<const ReturnStatementNode*>(s.node);
    if (s.phase == 0 && n->argument) {
        s.phase = 1;
        push_node(n->argument.get(), s.env);
        return;
    }
    raise(Completion::return_value(n->argument ? std::move(s.received) : Value{}));
}

void Evaluator::step_if(EvalState& s) {
    auto* n = static_cast<const IfStatementNode*>(s.node);
    switch (s.phase) {
        case 0:
            s.phase = 1;
            push_node(n->test.get(), s.env);
            return;
        case 1: {
            const StatementNode* branch = to_boolean(s.received) ? n->consequent.get() : n->alternate.get();
            if (!branch) {
                finish(Value{});
                return;
            }
            s.phase = 2;
            push_node(branch, s.env);
            return;
        }
        default:
            finish(Value{});
    }
}

void Evaluator::step_while(EvalState& s) {
    auto* n = static_cast<const WhileStatementNode*>(s.node);
    switch (s.phase) {
        case 0:
        case 2:
            s.phase = 1;
            push_node(n->test.get(), s.env);
            return;
        default:
            if (!to_boolean(s.received)) {
                finish(Value{});
                return;
            }
            s.phase = 2;
            push_node(n->body.get(), s.env);
    }
}

void Evaluator::step_do_while(EvalState& s) {
    auto* n = static_cast<const DoWhileStatementNode*>(s.node);
    switch (s.phase) {
        case 0:
            s.phase = 1;
            push_node(n->body.get(), s.env);
            return;
        case 1:
            s.phase = 2;
            push_node(n->test.get(), s.env);
            return;
        default:
            if (!to_boolean(s.received)) {
                finish(Value{});
                return;
            }
            s.phase = 1;
            push_node(n->body.get(), s.env);
    }
}

// Phases: 0 init, 1 test, 2 test result, 3 body done, 4 update done.
// let/const loops get a fresh copy of the loop scope per iteration so closures
// made in the body see that iteration's bindings.
void Evaluator::step_for(EvalState& s) {
    auto* n = static_cast<const ForStatementNode*>(s.node);
    bool per_iteration = false;
    if (n->init && n->init->kind == NodeKind::VariableDeclaration) {
        per_iteration = static_cast<const VariableDeclarationNode*>(n->init.get())->decl_kind != DeclarationKind::Var;
    }

    for (;;) {
        switch (s.phase) {
            case 0:
                s.loop_env = per_iteration ? std::make_shared<Environment>(s.env) : s.env;
                s.phase = 1;
                if (n->init) {
                    push_node(n->init.get(), s.loop_env);
                    return;
                }
                continue;
            case 1:
                if (n->test) {
                    s.phase = 2;
                    push_node(n->test.get(), s.loop_env);
                    return;
                }
                s.phase = 3;
                push_node(n->body.get(), s.loop_env);
                return;
            case 2:
                if (!to_boolean(s.received)) {
                    finish(Value{});
                    return;
                }
                s.phase = 3;
                push_node(n->body.get(), s.loop_env);
                return;
            case 3:
                if (per_iteration) {
                    auto next = std::make_shared<Environment>(s.env);
                    next->values = s.loop_env->values;
                    s.loop_env = next;
                }
                if (n->update) {
                    s.phase = 4;
                    push_node(n->update.get(), s.loop_env);
                    return;
                }
                s.phase = 1;
                continue;
            default:
                s.phase = 1;
                continue;
        }
    }
}

// Phases: 0 object, 1 key snapshot, 2 next key, 4/5 member target (object, key).
void Evaluator::step_for_in(EvalState& s) {
    auto* n = static_cast<const ForInStatementNode*>(s.node);
    const Value& key_value = s.this_value;

    auto run_body = [&](const EnvPtr& env) {
        s.phase = 2;
        push_node(n->body.get(), env);
    };

    switch (s.phase) {
        case 0:
            s.phase = 1;
            push_node(n->right.get(), s.env);
            return;
        case 1: {
            Value subject = std::move(s.received);
            if (is_nullish(subject)) {
                finish(Value{});
                return;
            }
            if (auto obj = as_object(subject)) {
                s.object = obj;
                s.keys = enumerate_keys(obj);
            } else if (auto str = std::get_if<std::string>(&subject)) {
                for (size_t i = 0; i < str->size(); ++i) s.keys.push_back(index_key(i));
            }
            s.index = 0;
            s.phase = 2;
        }
            [[fallthrough]];
        case 2: {
            // keys deleted during the loop are skipped
            while (s.index < s.keys.size() && s.object && !has_property(s.object, s.keys[s.index])) ++s.index;
            if (s.index >= s.keys.size()) {
                finish(Value{});
                return;
            }
            s.this_value = s.keys[s.index++];

            if (n->declaration) {
                const auto& d = n->declaration->declarations.front();
                if (n->declaration->decl_kind == DeclarationKind::Var) {
                    if (!assign_identifier(d.name, key_value, s.env, d.token)) return;
                    run_body(s.env);
                } else {
                    auto iteration = std::make_shared<Environment>(s.env);
                    iteration->declare(d.name, key_value, n->declaration->decl_kind == DeclarationKind::Const);
                    run_body(iteration);
                }
                return;
            }
            if (n->target->kind == NodeKind::Identifier) {
                auto* id = static_cast<const IdentifierNode*>(n->target.get());
                if (!assign_identifier(id->name, key_value, s.env, id->token)) return;
                run_body(s.env);
                return;
            }
            s.phase = 4;
            push_node(static_cast<const MemberExpressionNode*>(n->target.get())->object.get(), s.env);
            return;
        }
        case 4: {
            auto* m = static_cast<const MemberExpressionNode*>(n->target.get());
            s.callee = std::move(s.received);
            if (m->computed) {
                s.phase = 5;
                push_node(m->computed_property.get(), s.env);
                return;
            }
            if (!put_value(s.callee, m->property, key_value, m->token)) return;
            run_body(s.env);
            return;
        }
        default: {
            auto* m = static_cast<const MemberExpressionNode*>(n->target.get());
            if (!put_value(s.callee, to_property_key(s.received), key_value, m->token)) return;
            run_body(s.env);
        }
    }
}

void Evaluator::step_break(EvalState& s) {
    raise(Completion::break_to(static_cast<const BreakStatementNode*>(s.node)->label));
}

void Evaluator::step_continue(EvalState& s) {
    raise(Completion::continue_to(static_cast<const ContinueStatementNode*>(s.node)->label));
}

void Evaluator::step_labeled(EvalState& s) {
    auto* n = static_cast<const LabeledStatementNode*>(s.node);
    if (s.phase == 0) {
        std::vector<std::string> labels = s.labels;
        labels.push_back(n->label);
        s.phase = 1;
        push_node(n->body.get(), s.env, std::move(labels));
        return;
    }
    finish(Value{});
}

void Evaluator::step_throw(EvalState& s) {
    auto* n = static_cast<const ThrowStatementNode*>(s.node);
    if (s.phase == 0) {
        s.phase = 1;
        push_node(n->argument.get(), s.env);
        return;
    }
    raise(Completion::throw_value(std::move(s.received), n->token));
}

void Evaluator::step_try(EvalState& s) {
    auto* n = static_cast<const TryStatementNode*>(s.node);
    switch (s.phase) {
        case kTryStart:
            s.phase = kTryBlock;
            push_node(n->block.get(), s.env);
            return;
        case kTryBlock:
        case kTryHandler:
            if (n->finalizer) {
                s.phase = kTryFinalizer;
                push_node(n->finalizer.get(), s.env);
                return;
            }
            finish(Value{});
            return;
        default:
            if (s.has_pending) {
                Completion parked = std::move(s.pending);
                s.has_pending = false;
                raise(std::move(parked));
                return;
            }
            finish(Value{});
    }
}
