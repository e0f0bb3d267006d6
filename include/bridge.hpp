#pragma once

#include <exception>
#include <string>
#include <vector>

#include "token.hpp"
#include "value.hpp"

class Evaluator;

// Guest-level throw crossing native code. Native callbacks throw it to raise a
// guest exception; NativeCall::call throws it when the invoked guest function
// throws. `what()` is the thrown value's string form.
class GuestException : public std::exception {
   public:
    explicit GuestException(Value value);

    const Value& value() const { return value_; }
    const char* what() const noexcept override { return message_.c_str(); }

   private:
    Value value_;
    std::string message_;
};

// Everything a native callback sees about one invocation.
class NativeCall {
   public:
    NativeCall(Evaluator& engine, Value this_value, std::vector<Value> args, const Token& call_token, bool construct);

    Evaluator& engine() { return engine_; }
    const Value& this_value() const { return this_value_; }
    const std::vector<Value>& args() const { return args_; }
    size_t argc() const { return args_.size(); }
    Value arg(size_t i) const { return i < args_.size() ? args_[i] : Value{}; }
    const Token& call_token() const { return call_token_; }
    bool is_construct() const { return construct_; }

    // Runs `callee` to completion before returning (nested evaluation).
    // Throws GuestException when the callee throws.
    Value call(const Value& callee, const Value& this_value, const std::vector<Value>& args);

    // Asks for asynchronous suspension: the engine reports Suspended-Await once
    // this callback returns (its return value is ignored) until the host
    // delivers a result through Evaluator::resume*.
    void suspend();
    bool suspended() const { return suspended_; }

    // The callback's result becomes the result of calling `fn`, which runs on
    // the engine's own stack rather than nested.
    void tail_call(FunctionPtr fn, Value this_value, std::vector<Value> args);
    bool has_tail_call() const { return tail_fn_ != nullptr; }
    const FunctionPtr& tail_function() const { return tail_fn_; }
    const Value& tail_this() const { return tail_this_; }
    std::vector<Value>& tail_args() { return tail_args_; }

    // marshalling helpers
    ObjectPtr create_object();
    ObjectPtr create_array(const std::vector<Value>& elements);

    // Throws GuestException carrying a fresh error object of the given kind.
    [[noreturn]] void throw_error(const std::string& kind, const std::string& message);

   private:
    Evaluator& engine_;
    Value this_value_;
    std::vector<Value> args_;
    Token call_token_;
    bool construct_ = false;

    bool suspended_ = false;
    FunctionPtr tail_fn_;
    Value tail_this_;
    std::vector<Value> tail_args_;
};

// array-like guest object -> host vector (reads `length` and indexed slots)
std::vector<Value> array_to_vector(const Value& v);
