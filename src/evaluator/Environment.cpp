// src/evaluator/Environment.cpp
#include "object_model.hpp"
#include "value.hpp"

// ----------------- Environment methods -----------------

bool Environment::has_own(const std::string& name) const {
    if (values.find(name) != values.end()) return true;
    return object_record && has_property(object_record, name);
}

bool Environment::has(const std::string& name) const {
    if (has_own(name)) return true;
    if (parent) return parent->has(name);
    return false;
}

void Environment::declare(const std::string& name, const Value& value, bool is_constant) {
    // function-scoped names in the global scope live on the global object
    if (object_record && !is_constant) {
        auto it = values.find(name);
        if (it == values.end()) {
            set_property(object_record, name, value);
            return;
        }
    }
    values[name] = Variable{value, is_constant};
}

void Environment::declare_var(const std::string& name) {
    if (has_own(name)) return;
    declare(name, std::monostate{});
}

std::optional<Value> Environment::lookup(const std::string& name) const {
    const Environment* env = this;
    while (env) {
        auto it = env->values.find(name);
        if (it != env->values.end()) return it->second.value;
        if (env->object_record) {
            if (auto v = get_property(env->object_record, name)) return v;
        }
        env = env->parent.get();
    }
    return std::nullopt;
}

Environment::AssignResult Environment::assign(const std::string& name, const Value& value) {
    Environment* env = this;
    while (env) {
        auto it = env->values.find(name);
        if (it != env->values.end()) {
            if (it->second.is_constant) return AssignResult::Constant;
            it->second.value = value;
            return AssignResult::Ok;
        }
        if (env->object_record && has_property(env->object_record, name)) {
            set_property(env->object_record, name, value);
            return AssignResult::Ok;
        }
        env = env->parent.get();
    }
    return AssignResult::NotFound;
}
