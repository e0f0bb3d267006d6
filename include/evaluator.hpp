#pragma once

#include <array>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Frame.hpp"
#include "SandstepError.hpp"
#include "ast.hpp"
#include "bridge.hpp"
#include "diagnostics.hpp"
#include "token.hpp"
#include "value.hpp"

enum class EngineStatus {
    Idle,            // constructed, no step taken yet
    Running,         // inside step(); re-entry is host misuse
    SuspendedYield,  // more work remains, the host decides when
    SuspendedAwait,  // a native call is waiting for an external event
    Completed,
    Failed
};

const char* engine_status_name(EngineStatus status);

struct EngineOptions {
    size_t max_call_depth = 256;
    // false: exceeding max_call_depth fails the engine without giving guest
    // try/catch a chance
    bool recursion_limit_catchable = true;
    // true: step() while Suspended-Await throws instead of polling
    bool strict_await_polling = false;
    bool install_standard_globals = true;
    LogLevel log_level = LogLevel::Warn;
    uint64_t random_seed = 0x5eed;
    std::string filename = "<script>";

    // Defaults overlaid with SANDSTEP_MAX_CALL_DEPTH, SANDSTEP_LOG_LEVEL and
    // SANDSTEP_STRICT_AWAIT from the process environment.
    static EngineOptions from_env();
};

// Why a Failed engine stopped.
struct Failure {
    Value value;              // the thrown guest value
    std::string description;  // its string form
    TokenLocation location;   // where it was thrown
    // guest frames active at the throw, innermost first: "at f (file:line:col)"
    std::vector<std::string> stack;
};

// Step-wise, resumable tree-walking evaluator. All evaluation state lives on an
// explicit stack of EvalState cursors, so the engine can stop after any step
// and pick up later, including across host-side asynchronous waits.
class Evaluator {
   public:
    // Called once during construction, before any guest code runs.
    using Bootstrap = std::function<void(Evaluator&, const ObjectPtr& global)>;

    Evaluator(std::shared_ptr<ProgramNode> program, Bootstrap bootstrap = nullptr, EngineOptions options = EngineOptions());

    // Parses `source` first; syntax errors are thrown from here.
    Evaluator(const std::string& source, Bootstrap bootstrap = nullptr, EngineOptions options = EngineOptions());

    ~Evaluator();
    Evaluator(const Evaluator&) = delete;
    Evaluator& operator=(const Evaluator&) = delete;

    // ---- driving ----
    // One unit of work. Returns true while more work remains (including while
    // waiting for an external event).
    bool step();
    // Steps until completion or an asynchronous wait. Returns true when waiting.
    bool run();
    // At most `max_steps` steps; same return value as step().
    bool run_for(size_t max_steps);

    // ---- host events ----
    bool is_suspended_awaiting_external_event() const { return status_ == EngineStatus::SuspendedAwait; }
    void resume(const Value& value);
    void resume_with_error(const Value& error);
    // The waiting native call's result becomes the result of calling `fn`.
    void resume_with_call(const FunctionPtr& fn, std::vector<Value> args = {});
    // Runs `fn` as a top-level task once the current work is done.
    void queue_call(const FunctionPtr& fn, std::vector<Value> args = {});

    // ---- inspection ----
    EngineStatus status() const { return status_; }
    uint64_t step_count() const { return step_count_; }
    size_t call_depth() const { return frames_.size(); }
    size_t stack_depth() const { return stack_.size(); }
    size_t pending_tasks() const { return tasks_.size(); }
    const std::optional<Failure>& failure() const { return failure_; }
    const ObjectPtr& global_object() const { return global_object_; }
    const Value& last_value() const { return last_value_; }
    const EngineOptions& options() const { return options_; }

    // ---- objects and natives ----
    ObjectPtr create_object();
    ObjectPtr create_object(const ObjectPtr& proto);
    ObjectPtr create_array(const std::vector<Value>& elements = {});
    ObjectPtr create_error(const std::string& kind, const std::string& message);
    FunctionPtr create_native_function(const std::string& name, NativeFunction impl, int arity = 0, bool constructible = false);
    // Installs a native function as an own property of `target`.
    FunctionPtr register_native(const ObjectPtr& target, const std::string& name, NativeFunction impl, int arity = 0);
    bool set_property(const ObjectPtr& obj, const std::string& key, const Value& value);
    std::optional<Value> get_property(const ObjectPtr& obj, const std::string& key) const;

    // "Object.prototype", "Array.prototype", "TypeError.prototype", ...
    ObjectPtr primordial(const std::string& name) const;
    void set_primordial(const std::string& name, const ObjectPtr& obj);

    // Synchronous invocation for native code (see NativeCall::call).
    Value call_function(const Value& callee, const Value& this_value, const std::vector<Value>& args, const Token& token);

    void log(LogLevel level, const std::string& text) const;
    bool log_enabled(LogLevel level) const { return level >= options_.log_level && options_.log_level != LogLevel::Off; }

    // engine-seeded generator behind Math.random
    double next_random();

   private:
    typedef void (Evaluator::*StepHandler)(EvalState&);

    struct QueuedTask {
        FunctionPtr fn;
        std::vector<Value> args;
    };

    struct PendingResume {
        enum class Kind {
            Value,
            Error,
            Call
        };
        Kind kind = Kind::Value;
        Value value;
        FunctionPtr fn;
        std::vector<Value> args;
    };

    std::shared_ptr<ProgramNode> program_;
    EngineOptions options_;
    EngineStatus status_ = EngineStatus::Idle;

    EnvPtr global_env_;
    ObjectPtr global_object_;
    std::unordered_map<std::string, ObjectPtr> primordials_;

    std::deque<EvalState> stack_;
    std::vector<CallFrame> frames_;
    std::deque<QueuedTask> tasks_;
    std::optional<PendingResume> pending_resume_;
    bool awaiting_ = false;
    size_t nested_depth_ = 0;
    size_t native_depth_ = 0;

    uint64_t step_count_ = 0;
    std::optional<Failure> failure_;
    Value last_value_;
    uint64_t rng_state_ = 0;

    void initialize(Bootstrap bootstrap);
    void analyze(ProgramNode& program);
    void set_status(EngineStatus next);
    void require_state(bool ok, const std::string& operation) const;

    // ---- explicit stack ----
    void execute_one();
    void apply_resume();
    EvalState& push_node(const Node* node, const EnvPtr& env, std::vector<std::string> labels = {});
    void pop_state();
    void finish(Value v);
    void raise(Completion c);
    void throw_error(const std::string& kind, const std::string& message, const Token& at);
    bool intercept(EvalState& s, const Completion& c);
    [[noreturn]] void fail_fatal(const Value& thrown, const Token& at);
    std::vector<std::string> guest_stack_trace(const TokenLocation& innermost) const;
    void release_object_graph();
    static const std::array<StepHandler, kNodeKindCount>& handlers();

    // ---- calls ----
    void begin_call(EvalState& caller, const Value& callee, Value this_value, std::vector<Value> args, bool construct, const Token& token);
    void check_native_depth(const Token& token);
    void invoke_native(EvalState& caller, const FunctionPtr& fn, Value this_value, std::vector<Value> args, bool construct, const Token& token);
    FunctionPtr make_closure(const FunctionNode* fn, const EnvPtr& env);
    void instantiate_declarations(const ScopeInfo& scope, const EnvPtr& env);
    Value current_this() const;
    static FunctionPtr unwrap_bound(FunctionPtr fn, Value& this_value, std::vector<Value>& args);

    void step_function_body(EvalState& s);
    void step_boundary(EvalState& s);
    void step_task(EvalState& s);

    // ---- values ----
    ObjectPtr prototype_for(const Value& v) const;
    // false when an error was raised instead
    bool get_value(const Value& base, const std::string& key, const Token& at, Value& out);
    bool put_value(const Value& base, const std::string& key, const Value& value, const Token& at);
    bool binary_op(const std::string& op, const Value& left, const Value& right, const Token& at, Value& out);
    bool assign_identifier(const std::string& name, const Value& value, const EnvPtr& env, const Token& at);
    bool run_statement_list(EvalState& s, const std::vector<StmtPtr>& body);

    // ---- statements ----
    void step_program(EvalState& s);
    void step_block(EvalState& s);
    void step_empty(EvalState& s);
    void step_expression_statement(EvalState& s);
    void step_variable_declaration(EvalState& s);
    void step_function_declaration(EvalState& s);
    void step_return(EvalState& s);
    void step_if(EvalState& s);
    void step_for(EvalState& s);
    void step_for_in(EvalState& s);
    void step_while(EvalState& s);
    void step_do_while(EvalState& s);
    void step_break(EvalState& s);
    void step_continue(EvalState& s);
    void step_labeled(EvalState& s);
    void step_throw(EvalState& s);
    void step_try(EvalState& s);

    // ---- expressions ----
    void step_identifier(EvalState& s);
    void step_literal(EvalState& s);
    void step_this(EvalState& s);
    void step_array_literal(EvalState& s);
    void step_object_literal(EvalState& s);
    void step_function_expression(EvalState& s);
    void step_member(EvalState& s);
    void step_call(EvalState& s);
    void step_new(EvalState& s);
    void step_unary(EvalState& s);
    void step_update(EvalState& s);
    void step_binary(EvalState& s);
    void step_logical(EvalState& s);
    void step_assignment(EvalState& s);
    void step_conditional(EvalState& s);
    void step_sequence(EvalState& s);
};
