// src/evaluator/FunctionCall.cpp
//
// Function activation. Guest calls push a FunctionBody state and return to the
// step loop; native calls run synchronously inside the step that makes them.
#include <stdexcept>

#include "conversions.hpp"
#include "evaluator.hpp"
#include "object_model.hpp"

namespace {

// keeps a depth counter honest across exceptions
class DepthGuard {
   public:
    explicit DepthGuard(size_t& depth) : depth_(depth) { ++depth_; }
    ~DepthGuard() { --depth_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

   private:
    size_t& depth_;
};

}  // namespace

FunctionPtr Evaluator::make_closure(const FunctionNode* fn, const EnvPtr& env) {
    auto f = std::make_shared<FunctionValue>();
    f->prototype = primordial("Function.prototype");
    f->name = fn->name;
    f->node = fn;
    f->program = program_;
    f->closure = env;
    define_property(f, "name", fn->name, false, false, true);
    define_property(f, "length", static_cast<double>(fn->params.size()), false, false, true);

    auto instance_proto = create_object();
    define_property(instance_proto, "constructor", f, true, false, true);
    define_property(f, "prototype", instance_proto, true, false, false);
    return f;
}

void Evaluator::instantiate_declarations(const ScopeInfo& scope, const EnvPtr& env) {
    for (const auto& name : scope.var_names) {
        env->declare_var(name);
    }
    for (const FunctionDeclarationNode* fd : scope.functions) {
        env->declare(fd->function->name, make_closure(fd->function.get(), env));
    }
}

Value Evaluator::current_this() const {
    if (frames_.empty()) return global_object_;
    return frames_.back().this_value;
}

FunctionPtr Evaluator::unwrap_bound(FunctionPtr fn, Value& this_value, std::vector<Value>& args) {
    while (fn->bound_target) {
        this_value = fn->bound_this;
        std::vector<Value> merged = fn->bound_args;
        merged.insert(merged.end(), args.begin(), args.end());
        args = std::move(merged);
        fn = fn->bound_target;
    }
    return fn;
}

// The callee's result arrives in caller.received, either within this step
// (natives) or when the pushed FunctionBody finishes.
void Evaluator::begin_call(EvalState& caller, const Value& callee, Value this_value, std::vector<Value> args, bool construct, const Token& token) {
    FunctionPtr fn = as_function(callee);
    if (!fn) {
        throw_error("TypeError", to_display_string(callee) + " is not a function", token);
        return;
    }
    fn = unwrap_bound(fn, this_value, args);

    if (construct) {
        if (!fn->constructible) {
            throw_error("TypeError", (fn->name.empty() ? std::string("anonymous") : fn->name) + " is not a constructor", token);
            return;
        }
        auto proto_value = ::get_property(fn, "prototype");
        ObjectPtr proto = proto_value ? as_object(*proto_value) : nullptr;
        this_value = create_object(proto ? proto : primordial("Object.prototype"));
    }

    if (fn->is_native) {
        invoke_native(caller, fn, std::move(this_value), std::move(args), construct, token);
        return;
    }

    EvalState& body = stack_.emplace_back();
    body.kind = StateKind::FunctionBody;
    body.node = caller.node;  // call site, for diagnostics
    body.env = fn->closure;
    body.function = std::move(fn);
    body.this_value = std::move(this_value);
    body.values = std::move(args);
    body.construct = construct;
}

// Natives that call natives never push a guest frame, so their nesting is
// bounded separately; the C++ stack grows with it.
void Evaluator::check_native_depth(const Token& token) {
    if (native_depth_ < options_.max_call_depth) return;
    Value err = create_error("RangeError", "Maximum call stack size exceeded");
    if (!options_.recursion_limit_catchable) fail_fatal(err, token);
    throw GuestException(err);
}

void Evaluator::invoke_native(EvalState& caller, const FunctionPtr& fn, Value this_value, std::vector<Value> args, bool construct, const Token& token) {
    NativeCall call(*this, std::move(this_value), std::move(args), token, construct);
    Value result;
    try {
        check_native_depth(token);
        DepthGuard guard(native_depth_);
        result = fn->native_impl(call);
    } catch (const GuestException& e) {
        raise(Completion::throw_value(e.value(), token));
        return;
    } catch (const SandstepError&) {
        throw;
    } catch (const std::length_error& e) {
        raise(Completion::throw_value(create_error("RangeError", e.what()), token));
        return;
    } catch (const std::exception& e) {
        // host exceptions surface to the guest as plain errors
        raise(Completion::throw_value(create_error("Error", e.what()), token));
        return;
    }

    if (call.suspended()) {
        if (nested_depth_ > 0) {
            throw SandstepError("HostMisuse", "native '" + fn->name + "' asked to suspend inside a nested call", token.loc);
        }
        awaiting_ = true;
        log(LogLevel::Debug, "'" + fn->name + "' is waiting for an external event");
        return;
    }

    if (call.has_tail_call()) {
        begin_call(caller, call.tail_function(), call.tail_this(), std::move(call.tail_args()), false, token);
        return;
    }

    if (construct && !is_object(result)) result = call.this_value();
    caller.received = std::move(result);
    caller.has_received = true;
}

// Phase 0 builds the activation, phase 1 walks the body.
void Evaluator::step_function_body(EvalState& s) {
    const FunctionNode* fn = s.function->node;

    if (s.phase == 0) {
        Token at = s.node ? s.node->token : fn->token;
        if (frames_.size() >= options_.max_call_depth) {
            Value err = create_error("RangeError", "Maximum call stack size exceeded");
            if (!options_.recursion_limit_catchable) fail_fatal(err, at);
            raise(Completion::throw_value(err, at));
            return;
        }

        auto env = std::make_shared<Environment>(s.function->closure);
        for (size_t i = 0; i < fn->params.size(); ++i) {
            env->declare(fn->params[i], i < s.values.size() ? s.values[i] : Value{});
        }
        if (!env->has_own("arguments")) {
            auto arguments = std::make_shared<ObjectValue>(ObjectClass::Arguments);
            arguments->prototype = primordial("Object.prototype");
            for (size_t i = 0; i < s.values.size(); ++i) {
                ::set_property(arguments, index_key(i), s.values[i]);
            }
            define_property(arguments, "length", static_cast<double>(s.values.size()), true, false, true);
            env->declare("arguments", arguments);
        }
        instantiate_declarations(fn->scope, env);

        CallFrame frame;
        frame.function = s.function;
        frame.this_value = s.this_value;
        frame.call_token = at;
        frames_.push_back(std::move(frame));
        s.frame_pushed = true;
        s.env = env;
        s.phase = 1;

        if (log_enabled(LogLevel::Trace)) {
            log(LogLevel::Trace, "enter " + (fn->name.empty() ? std::string("<anonymous>") : fn->name) + " depth " + std::to_string(frames_.size()));
        }
        return;
    }

    if (run_statement_list(s, fn->body)) {
        finish(s.construct ? s.this_value : Value{});
    }
}

// A boundary is consumed by call_function as soon as it receives a result, so
// the step loop never lands on one.
void Evaluator::step_boundary(EvalState& s) {
    (void)s;
    throw SandstepError("InternalError", "step loop reached a nested-call boundary");
}

void Evaluator::step_task(EvalState& s) {
    if (s.phase == 0) {
        s.phase = 1;
        log(LogLevel::Debug, "running queued task '" + s.function->name + "'");
        FunctionPtr fn = s.function;
        begin_call(s, fn, Value{}, std::move(s.values), false, Token());
        return;
    }
    finish(Value{});
}

Value Evaluator::call_function(const Value& callee, const Value& this_value, const std::vector<Value>& args, const Token& token) {
    // a delivered but not yet applied resume belongs to the suspended caller
    require_state(status_ != EngineStatus::Failed && !pending_resume_, "call_function()");

    FunctionPtr fn = as_function(callee);
    if (!fn) {
        throw GuestException(create_error("TypeError", to_display_string(callee) + " is not a function"));
    }
    Value self = this_value;
    std::vector<Value> call_args = args;
    fn = unwrap_bound(fn, self, call_args);

    if (fn->is_native) {
        NativeCall call(*this, self, call_args, token, false);
        Value result;
        {
            check_native_depth(token);
            DepthGuard guard(native_depth_);
            result = fn->native_impl(call);
        }
        if (call.suspended()) {
            throw SandstepError("HostMisuse", "native '" + fn->name + "' asked to suspend inside a nested call", token.loc);
        }
        if (call.has_tail_call()) {
            return call_function(call.tail_function(), call.tail_this(), call.tail_args(), token);
        }
        return result;
    }

    EvalState& boundary = stack_.emplace_back();
    boundary.kind = StateKind::Boundary;
    boundary.env = global_env_;
    try {
        DepthGuard guard(nested_depth_);
        begin_call(boundary, fn, self, std::move(call_args), false, token);
        while (!boundary.has_received && !boundary.has_pending) {
            execute_one();
        }
    } catch (const SandstepError&) {
        if (status_ != EngineStatus::Running) set_status(EngineStatus::Failed);
        throw;
    }

    Value result = std::move(boundary.received);
    bool threw = boundary.has_pending;
    Value thrown = std::move(boundary.pending.value);
    stack_.pop_back();
    if (threw) throw GuestException(std::move(thrown));
    return result;
}
