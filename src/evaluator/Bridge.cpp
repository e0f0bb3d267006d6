// src/evaluator/Bridge.cpp
//
// Host-facing object construction and the NativeCall surface natives use.
#include "bridge.hpp"

#include <cmath>
#include <stdexcept>

#include "conversions.hpp"
#include "evaluator.hpp"
#include "object_model.hpp"

GuestException::GuestException(Value value) : value_(std::move(value)) {
    try {
        message_ = to_display_string(value_);
    } catch (const std::length_error& e) {
        message_ = e.what();
    }
}

NativeCall::NativeCall(Evaluator& engine, Value this_value, std::vector<Value> args, const Token& call_token, bool construct)
    : engine_(engine),
      this_value_(std::move(this_value)),
      args_(std::move(args)),
      call_token_(call_token),
      construct_(construct) {}

Value NativeCall::call(const Value& callee, const Value& this_value, const std::vector<Value>& args) {
    return engine_.call_function(callee, this_value, args, call_token_);
}

void NativeCall::suspend() {
    suspended_ = true;
}

void NativeCall::tail_call(FunctionPtr fn, Value this_value, std::vector<Value> args) {
    tail_fn_ = std::move(fn);
    tail_this_ = std::move(this_value);
    tail_args_ = std::move(args);
}

ObjectPtr NativeCall::create_object() {
    return engine_.create_object();
}

ObjectPtr NativeCall::create_array(const std::vector<Value>& elements) {
    return engine_.create_array(elements);
}

void NativeCall::throw_error(const std::string& kind, const std::string& message) {
    throw GuestException(engine_.create_error(kind, message));
}

std::vector<Value> array_to_vector(const Value& v) {
    auto obj = as_object(v);
    if (!obj) return {};
    if (obj->cls == ObjectClass::Array) return array_elements(obj);

    std::vector<Value> out;
    auto length = get_property(obj, "length");
    double n = length ? to_integer(*length) : 0;
    if (!std::isfinite(n)) n = 0;
    for (size_t i = 0; i < static_cast<size_t>(n > 0 ? n : 0); ++i) {
        auto element = get_property(obj, index_key(i));
        out.push_back(element ? *element : Value{});
    }
    return out;
}

// ----------------- Evaluator object helpers -----------------

ObjectPtr Evaluator::create_object() {
    return create_object(primordial("Object.prototype"));
}

ObjectPtr Evaluator::create_object(const ObjectPtr& proto) {
    auto obj = std::make_shared<ObjectValue>();
    obj->prototype = proto;
    return obj;
}

ObjectPtr Evaluator::create_array(const std::vector<Value>& elements) {
    auto arr = std::make_shared<ObjectValue>(ObjectClass::Array);
    arr->prototype = primordial("Array.prototype");
    define_property(arr, "length", 0.0, true, false, false);
    for (const auto& v : elements) array_push(arr, v);
    return arr;
}

ObjectPtr Evaluator::create_error(const std::string& kind, const std::string& message) {
    auto err = std::make_shared<ObjectValue>(ObjectClass::Error);
    err->prototype = primordial(kind + ".prototype");
    if (!err->prototype) err->prototype = primordial("Error.prototype");
    define_property(err, "message", message, true, false, true);
    return err;
}

FunctionPtr Evaluator::create_native_function(const std::string& name, NativeFunction impl, int arity, bool constructible) {
    auto fn = std::make_shared<FunctionValue>();
    fn->prototype = primordial("Function.prototype");
    fn->name = name;
    fn->is_native = true;
    fn->native_impl = std::move(impl);
    fn->constructible = constructible;
    define_property(fn, "name", name, false, false, true);
    define_property(fn, "length", static_cast<double>(arity), false, false, true);
    return fn;
}

FunctionPtr Evaluator::register_native(const ObjectPtr& target, const std::string& name, NativeFunction impl, int arity) {
    if (!target) {
        throw SandstepError("HostMisuse", "register_native('" + name + "') needs a target object");
    }
    FunctionPtr fn = create_native_function(name, std::move(impl), arity);
    define_property(target, name, fn, true, false, true);
    return fn;
}

bool Evaluator::set_property(const ObjectPtr& obj, const std::string& key, const Value& value) {
    return ::set_property(obj, key, value);
}

std::optional<Value> Evaluator::get_property(const ObjectPtr& obj, const std::string& key) const {
    return ::get_property(obj, key);
}
