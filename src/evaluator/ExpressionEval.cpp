// src/evaluator/ExpressionEval.cpp
//
// Expression step handlers plus the property and operator helpers they share.
#include <algorithm>
#include <cmath>

#include "conversions.hpp"
#include "evaluator.hpp"
#include "object_model.hpp"

namespace {

std::string nullish_name(const Value& v) {
    return is_null(v) ? "null" : "undefined";
}

// `+=` -> `+`
std::string compound_operator(const std::string& op) {
    return op.substr(0, op.size() - 1);
}

void name_anonymous(const Value& v, const ExpressionNode* init, const std::string& name) {
    auto fn = as_function(v);
    if (!fn || !fn->name.empty() || init->kind != NodeKind::FunctionExpression) return;
    fn->name = name;
    define_property(fn, "name", name, false, false, true);
}

}  // namespace

// ----------------- value helpers -----------------

ObjectPtr Evaluator::prototype_for(const Value& v) const {
    if (auto obj = as_object(v)) return obj->prototype;
    if (std::holds_alternative<std::string>(v)) return primordial("String.prototype");
    if (std::holds_alternative<double>(v)) return primordial("Number.prototype");
    if (std::holds_alternative<bool>(v)) return primordial("Boolean.prototype");
    return nullptr;
}

bool Evaluator::get_value(const Value& base, const std::string& key, const Token& at, Value& out) {
    if (is_nullish(base)) {
        throw_error("TypeError", "Cannot read properties of " + nullish_name(base) + " (reading '" + key + "')", at);
        return false;
    }

    if (auto str = std::get_if<std::string>(&base)) {
        if (key == "length") {
            out = static_cast<double>(str->size());
            return true;
        }
        uint32_t index = 0;
        if (parse_array_index(key, &index)) {
            out = index < str->size() ? Value(std::string(1, (*str)[index])) : Value{};
            return true;
        }
    }

    if (key == "__proto__") {
        ObjectPtr proto = prototype_for(base);
        out = proto ? Value(proto) : Value(NullValue{});
        return true;
    }

    ObjectPtr holder = as_object(base);
    if (!holder) holder = prototype_for(base);
    if (!holder) {
        out = Value{};
        return true;
    }
    auto found = ::get_property(holder, key);
    out = found ? *found : Value{};
    return true;
}

bool Evaluator::put_value(const Value& base, const std::string& key, const Value& value, const Token& at) {
    if (is_nullish(base)) {
        throw_error("TypeError", "Cannot set properties of " + nullish_name(base) + " (setting '" + key + "')", at);
        return false;
    }
    ObjectPtr obj = as_object(base);
    if (!obj) return true;  // writes to primitives are dropped

    if (key == "__proto__") {
        if (is_null(value)) {
            set_prototype(obj, nullptr);
        } else if (auto proto = as_object(value)) {
            if (!set_prototype(obj, proto)) {
                throw_error("TypeError", "Cyclic __proto__ value", at);
                return false;
            }
        }
        return true;
    }

    // read-only properties ignore the write
    ::set_property(obj, key, value);
    return true;
}

bool Evaluator::binary_op(const std::string& op, const Value& left, const Value& right, const Token& at, Value& out) {
    if (op == "+") {
        Value l = to_primitive(left);
        Value r = to_primitive(right);
        if (std::holds_alternative<std::string>(l) || std::holds_alternative<std::string>(r)) {
            std::string ls = to_display_string(l);
            std::string rs = to_display_string(r);
            if (rs.size() > kMaxStringLength - std::min(ls.size(), kMaxStringLength)) {
                throw_error("RangeError", "Invalid string length", at);
                return false;
            }
            out = ls + rs;
        } else {
            out = to_number(l) + to_number(r);
        }
        return true;
    }
    if (op == "-") {
        out = to_number(left) - to_number(right);
        return true;
    }
    if (op == "*") {
        out = to_number(left) * to_number(right);
        return true;
    }
    if (op == "/") {
        out = to_number(left) / to_number(right);
        return true;
    }
    if (op == "%") {
        out = std::fmod(to_number(left), to_number(right));
        return true;
    }

    if (op == "<" || op == ">" || op == "<=" || op == ">=") {
        Value l = to_primitive(left);
        Value r = to_primitive(right);
        auto ls = std::get_if<std::string>(&l);
        auto rs = std::get_if<std::string>(&r);
        if (ls && rs) {
            int c = ls->compare(*rs);
            out = op == "<" ? c < 0 : op == ">" ? c > 0 : op == "<=" ? c <= 0 : c >= 0;
            return true;
        }
        double a = to_number(l);
        double b = to_number(r);
        // NaN compares false either way
        if (std::isnan(a) || std::isnan(b)) {
            out = false;
        } else {
            out = op == "<" ? a < b : op == ">" ? a > b : op == "<=" ? a <= b : a >= b;
        }
        return true;
    }

    if (op == "===") {
        out = strict_equals(left, right);
        return true;
    }
    if (op == "!==") {
        out = !strict_equals(left, right);
        return true;
    }
    if (op == "==") {
        out = loose_equals(left, right);
        return true;
    }
    if (op == "!=") {
        out = !loose_equals(left, right);
        return true;
    }

    if (op == "in") {
        auto obj = as_object(right);
        if (!obj) {
            throw_error("TypeError", "Cannot use 'in' operator to search for '" + to_property_key(left) + "' in " + to_display_string(right), at);
            return false;
        }
        out = has_property(obj, to_property_key(left));
        return true;
    }

    if (op == "instanceof") {
        auto fn = as_function(right);
        if (!fn) {
            throw_error("TypeError", "Right-hand side of 'instanceof' is not callable", at);
            return false;
        }
        while (fn->bound_target) fn = fn->bound_target;
        auto obj = as_object(left);
        if (!obj) {
            out = false;
            return true;
        }
        auto proto_value = ::get_property(fn, "prototype");
        auto proto = proto_value ? as_object(*proto_value) : nullptr;
        if (!proto) {
            throw_error("TypeError", "Function has non-object prototype in instanceof check", at);
            return false;
        }
        bool found = false;
        for (ObjectPtr p = obj->prototype; p; p = p->prototype) {
            if (p == proto) {
                found = true;
                break;
            }
        }
        out = found;
        return true;
    }

    throw SandstepError("SyntaxError", "Unsupported binary operator '" + op + "'", at.loc);
}

bool Evaluator::assign_identifier(const std::string& name, const Value& value, const EnvPtr& env, const Token& at) {
    switch (env->assign(name, value)) {
        case Environment::AssignResult::Ok:
            return true;
        case Environment::AssignResult::Constant:
            throw_error("TypeError", "Assignment to constant variable.", at);
            return false;
        case Environment::AssignResult::NotFound:
            break;
    }
    throw_error("ReferenceError", name + " is not defined", at);
    return false;
}

// ----------------- leaves -----------------

void Evaluator::step_identifier(EvalState& s) {
    auto* n = static_cast<const IdentifierNode*>(s.node);
    auto v = s.env->lookup(n->name);
    if (!v) {
        throw_error("ReferenceError", n->name + " is not defined", n->token);
        return;
    }
    finish(std::move(*v));
}

void Evaluator::step_literal(EvalState& s) {
    auto* n = static_cast<const LiteralNode*>(s.node);
    switch (n->type) {
        case LiteralType::Number: finish(n->number); return;
        case LiteralType::String: finish(n->string); return;
        case LiteralType::Boolean: finish(n->boolean); return;
        case LiteralType::Null: finish(NullValue{}); return;
        case LiteralType::Undefined: finish(Value{}); return;
    }
}

void Evaluator::step_this(EvalState& s) {
    (void)s;
    finish(current_this());
}

void Evaluator::step_function_expression(EvalState& s) {
    auto* n = static_cast<const FunctionExpressionNode*>(s.node);
    if (n->function->name.empty()) {
        finish(make_closure(n->function.get(), s.env));
        return;
    }
    // a named function expression sees its own name
    auto self_env = std::make_shared<Environment>(s.env);
    FunctionPtr fn = make_closure(n->function.get(), self_env);
    self_env->declare(n->function->name, fn);
    finish(fn);
}

// ----------------- literals -----------------

void Evaluator::step_array_literal(EvalState& s) {
    auto* n = static_cast<const ArrayLiteralNode*>(s.node);
    if (s.phase == 0) {
        s.object = create_array();
        s.phase = 1;
    }
    if (s.has_received) {
        ::set_property(s.object, index_key(s.index - 1), s.received);
        s.has_received = false;
    }
    while (s.index < n->elements.size()) {
        const ExpressionNode* el = n->elements[s.index++].get();
        if (el) {
            push_node(el, s.env);
            return;
        }
    }
    // trailing holes still count toward length
    if (array_length(s.object) < n->elements.size()) {
        define_property(s.object, "length", static_cast<double>(n->elements.size()), true, false, false);
    }
    finish(s.object);
}

void Evaluator::step_object_literal(EvalState& s) {
    auto* n = static_cast<const ObjectLiteralNode*>(s.node);
    if (s.phase == 0) {
        s.object = create_object();
        s.phase = 1;
    }
    if (s.has_received) {
        const PropertyNode& p = n->properties[s.index - 1];
        name_anonymous(s.received, p.value.get(), p.key);
        if (p.key == "__proto__") {
            if (is_null(s.received)) {
                set_prototype(s.object, nullptr);
            } else if (auto proto = as_object(s.received)) {
                set_prototype(s.object, proto);
            }
        } else {
            ::set_property(s.object, p.key, s.received);
        }
        s.has_received = false;
    }
    if (s.index < n->properties.size()) {
        push_node(n->properties[s.index++].value.get(), s.env);
        return;
    }
    finish(s.object);
}

// ----------------- member access -----------------

void Evaluator::step_member(EvalState& s) {
    auto* n = static_cast<const MemberExpressionNode*>(s.node);
    switch (s.phase) {
        case 0:
            s.phase = 1;
            push_node(n->object.get(), s.env);
            return;
        case 1:
            s.callee = std::move(s.received);
            if (n->computed) {
                s.phase = 2;
                push_node(n->computed_property.get(), s.env);
                return;
            }
            s.key = n->property;
            break;
        default:
            s.key = to_property_key(s.received);
            break;
    }
    Value out;
    if (!get_value(s.callee, s.key, n->token, out)) return;
    finish(std::move(out));
}

// ----------------- calls -----------------

// Phases: 0-3 callee (and receiver), 4/5 arguments, 6 waiting for the result.
void Evaluator::step_call(EvalState& s) {
    auto* n = static_cast<const CallExpressionNode*>(s.node);
    auto* member = n->callee->kind == NodeKind::Member ? static_cast<const MemberExpressionNode*>(n->callee.get()) : nullptr;

    switch (s.phase) {
        case 0:
            if (member) {
                s.phase = 1;
                push_node(member->object.get(), s.env);
            } else {
                s.phase = 3;
                push_node(n->callee.get(), s.env);
            }
            return;
        case 1:
            s.this_value = std::move(s.received);
            if (member->computed) {
                s.phase = 2;
                push_node(member->computed_property.get(), s.env);
                return;
            }
            if (!get_value(s.this_value, member->property, member->token, s.callee)) return;
            s.phase = 4;
            break;
        case 2:
            if (!get_value(s.this_value, to_property_key(s.received), member->token, s.callee)) return;
            s.phase = 4;
            break;
        case 3:
            s.callee = std::move(s.received);
            s.this_value = Value{};
            s.phase = 4;
            break;
        case 5:
            s.values.push_back(std::move(s.received));
            s.phase = 4;
            break;
        case 6:
            finish(std::move(s.received));
            return;
        default:
            break;
    }

    if (s.index < n->arguments.size()) {
        s.phase = 5;
        push_node(n->arguments[s.index++].get(), s.env);
        return;
    }
    if (!as_function(s.callee)) {
        throw_error("TypeError", n->callee->to_string() + " is not a function", n->token);
        return;
    }
    s.phase = 6;
    s.has_received = false;
    begin_call(s, s.callee, s.this_value, std::move(s.values), false, n->token);
}

void Evaluator::step_new(EvalState& s) {
    auto* n = static_cast<const NewExpressionNode*>(s.node);
    switch (s.phase) {
        case 0:
            s.phase = 1;
            push_node(n->callee.get(), s.env);
            return;
        case 1: {
            s.callee = std::move(s.received);
            auto fn = as_function(s.callee);
            if (!fn || !fn->constructible) {
                throw_error("TypeError", n->callee->to_string() + " is not a constructor", n->token);
                return;
            }
            s.phase = 2;
            break;
        }
        case 3:
            s.values.push_back(std::move(s.received));
            s.phase = 2;
            break;
        case 4:
            finish(std::move(s.received));
            return;
        default:
            break;
    }

    if (s.index < n->arguments.size()) {
        s.phase = 3;
        push_node(n->arguments[s.index++].get(), s.env);
        return;
    }
    s.phase = 4;
    s.has_received = false;
    begin_call(s, s.callee, Value{}, std::move(s.values), true, n->token);
}

// ----------------- operators -----------------

// delete uses phases 10-12 (object, key, apply)
void Evaluator::step_unary(EvalState& s) {
    auto* n = static_cast<const UnaryExpressionNode*>(s.node);
    const ExpressionNode* operand = n->operand.get();

    if (s.phase == 0) {
        if (n->op == "typeof" && operand->kind == NodeKind::Identifier) {
            auto v = s.env->lookup(static_cast<const IdentifierNode*>(operand)->name);
            finish(type_of(v ? *v : Value{}));
            return;
        }
        if (n->op == "delete") {
            if (operand->kind == NodeKind::Member) {
                s.phase = 10;
                push_node(static_cast<const MemberExpressionNode*>(operand)->object.get(), s.env);
                return;
            }
            if (operand->kind == NodeKind::Identifier) {
                finish(false);
                return;
            }
        }
        s.phase = 1;
        push_node(operand, s.env);
        return;
    }

    if (s.phase >= 10) {
        auto* m = static_cast<const MemberExpressionNode*>(operand);
        if (s.phase == 10) {
            s.callee = std::move(s.received);
            if (m->computed) {
                s.phase = 11;
                push_node(m->computed_property.get(), s.env);
                return;
            }
            s.key = m->property;
        } else {
            s.key = to_property_key(s.received);
        }
        if (is_nullish(s.callee)) {
            throw_error("TypeError", "Cannot convert undefined or null to object", n->token);
            return;
        }
        auto obj = as_object(s.callee);
        finish(obj ? delete_property(obj, s.key) : true);
        return;
    }

    const Value& v = s.received;
    if (n->op == "!") {
        finish(!to_boolean(v));
    } else if (n->op == "-") {
        finish(-to_number(v));
    } else if (n->op == "+") {
        finish(to_number(v));
    } else if (n->op == "typeof") {
        finish(type_of(v));
    } else if (n->op == "void") {
        finish(Value{});
    } else if (n->op == "delete") {
        finish(true);
    } else {
        throw SandstepError("SyntaxError", "Unsupported unary operator '" + n->op + "'", n->token.loc);
    }
}

void Evaluator::step_update(EvalState& s) {
    auto* n = static_cast<const UpdateExpressionNode*>(s.node);
    double delta = n->op == "++" ? 1.0 : -1.0;

    if (n->argument->kind == NodeKind::Identifier) {
        auto* id = static_cast<const IdentifierNode*>(n->argument.get());
        auto current = s.env->lookup(id->name);
        if (!current) {
            throw_error("ReferenceError", id->name + " is not defined", id->token);
            return;
        }
        double old_value = to_number(*current);
        double new_value = old_value + delta;
        if (!assign_identifier(id->name, new_value, s.env, id->token)) return;
        finish(n->prefix ? new_value : old_value);
        return;
    }

    auto* m = static_cast<const MemberExpressionNode*>(n->argument.get());
    switch (s.phase) {
        case 0:
            s.phase = 1;
            push_node(m->object.get(), s.env);
            return;
        case 1:
            s.callee = std::move(s.received);
            if (m->computed) {
                s.phase = 2;
                push_node(m->computed_property.get(), s.env);
                return;
            }
            s.key = m->property;
            break;
        default:
            s.key = to_property_key(s.received);
            break;
    }
    Value current;
    if (!get_value(s.callee, s.key, m->token, current)) return;
    double old_value = to_number(current);
    double new_value = old_value + delta;
    if (!put_value(s.callee, s.key, new_value, m->token)) return;
    finish(n->prefix ? new_value : old_value);
}

void Evaluator::step_binary(EvalState& s) {
    auto* n = static_cast<const BinaryExpressionNode*>(s.node);
    switch (s.phase) {
        case 0:
            s.phase = 1;
            push_node(n->left.get(), s.env);
            return;
        case 1:
            s.values.push_back(std::move(s.received));
            s.phase = 2;
            push_node(n->right.get(), s.env);
            return;
        default: {
            Value out;
            if (!binary_op(n->op, s.values.front(), s.received, n->token, out)) return;
            finish(std::move(out));
        }
    }
}

void Evaluator::step_logical(EvalState& s) {
    auto* n = static_cast<const LogicalExpressionNode*>(s.node);
    switch (s.phase) {
        case 0:
            s.phase = 1;
            push_node(n->left.get(), s.env);
            return;
        case 1: {
            bool truthy = to_boolean(s.received);
            if ((n->op == "&&") != truthy) {
                finish(std::move(s.received));
                return;
            }
            s.phase = 2;
            push_node(n->right.get(), s.env);
            return;
        }
        default:
            finish(std::move(s.received));
    }
}

// Identifier targets: 0 read (compound), 3 apply.
// Member targets: 0 object, 1/2 key, 4 apply.
void Evaluator::step_assignment(EvalState& s) {
    auto* n = static_cast<const AssignmentExpressionNode*>(s.node);
    bool compound = n->op != "=";

    if (n->target->kind == NodeKind::Identifier) {
        auto* id = static_cast<const IdentifierNode*>(n->target.get());
        if (s.phase == 0) {
            if (compound) {
                auto current = s.env->lookup(id->name);
                if (!current) {
                    throw_error("ReferenceError", id->name + " is not defined", id->token);
                    return;
                }
                s.values.push_back(std::move(*current));
            }
            s.phase = 3;
            push_node(n->value.get(), s.env);
            return;
        }
        Value result = std::move(s.received);
        if (compound) {
            Value rhs = std::move(result);
            if (!binary_op(compound_operator(n->op), s.values.front(), rhs, n->token, result)) return;
        }
        name_anonymous(result, n->value.get(), id->name);
        if (!assign_identifier(id->name, result, s.env, id->token)) return;
        finish(std::move(result));
        return;
    }

    auto* m = static_cast<const MemberExpressionNode*>(n->target.get());
    switch (s.phase) {
        case 0:
            s.phase = 1;
            push_node(m->object.get(), s.env);
            return;
        case 1:
            s.callee = std::move(s.received);
            if (m->computed) {
                s.phase = 2;
                push_node(m->computed_property.get(), s.env);
                return;
            }
            s.key = m->property;
            break;
        case 2:
            s.key = to_property_key(s.received);
            break;
        default: {
            Value result = std::move(s.received);
            if (compound) {
                Value rhs = std::move(result);
                if (!binary_op(compound_operator(n->op), s.values.front(), rhs, n->token, result)) return;
            }
            if (!put_value(s.callee, s.key, result, m->token)) return;
            finish(std::move(result));
            return;
        }
    }

    if (compound) {
        Value current;
        if (!get_value(s.callee, s.key, m->token, current)) return;
        s.values.push_back(std::move(current));
    }
    s.phase = 4;
    push_node(n->value.get(), s.env);
}

void Evaluator::step_conditional(EvalState& s) {
    auto* n = static_cast<const ConditionalExpressionNode*>(s.node);
    switch (s.phase) {
        case 0:
            s.phase = 1;
            push_node(n->test.get(), s.env);
            return;
        case 1:
            s.phase = 2;
            push_node(to_boolean(s.received) ? n->consequent.get() : n->alternate.get(), s.env);
            return;
        default:
            finish(std::move(s.received));
    }
}

void Evaluator::step_sequence(EvalState& s) {
    auto* n = static_cast<const SequenceExpressionNode*>(s.node);
    if (s.index < n->expressions.size()) {
        push_node(n->expressions[s.index++].get(), s.env);
        return;
    }
    finish(std::move(s.received));
}
