// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "conversions.hpp"
#include "globals.hpp"
#include "object_model.hpp"
#include "parser.hpp"

const char* engine_status_name(EngineStatus status) {
    switch (status) {
        case EngineStatus::Idle: return "Idle";
        case EngineStatus::Running: return "Running";
        case EngineStatus::SuspendedYield: return "SuspendedYield";
        case EngineStatus::SuspendedAwait: return "SuspendedAwait";
        case EngineStatus::Completed: return "Completed";
        case EngineStatus::Failed: return "Failed";
    }
    return "?";
}

EngineOptions EngineOptions::from_env() {
    EngineOptions opts;
    if (const char* depth = std::getenv("SANDSTEP_MAX_CALL_DEPTH")) {
        char* end = nullptr;
        unsigned long long n = std::strtoull(depth, &end, 10);
        if (end != depth && *end == '\0' && n > 0) opts.max_call_depth = static_cast<size_t>(n);
    }
    if (const char* level = std::getenv("SANDSTEP_LOG_LEVEL")) {
        opts.log_level = parse_log_level(level, opts.log_level);
    }
    if (const char* strict = std::getenv("SANDSTEP_STRICT_AWAIT")) {
        std::string s(strict);
        opts.strict_await_polling = (s == "1" || s == "true" || s == "yes");
    }
    return opts;
}

Evaluator::~Evaluator() {
    release_object_graph();
}

// Guest objects reference each other through shared_ptr in cycles
// (constructor <-> prototype, closure <-> environment <-> global object).
// Everything still reachable from the engine is collected first and then
// emptied, so the last owners drop and the memory is returned. Objects the host
// kept a pointer to survive as empty shells.
void Evaluator::release_object_graph() {
    std::vector<ObjectPtr> objects;
    std::vector<EnvPtr> envs;
    std::unordered_set<const void*> seen;

    auto add_object = [&](const ObjectPtr& obj) {
        if (obj && seen.insert(obj.get()).second) objects.push_back(obj);
    };
    auto add_env = [&](const EnvPtr& env) {
        if (env && seen.insert(env.get()).second) envs.push_back(env);
    };
    auto add_value = [&](const Value& v) {
        if (auto obj = as_object(v)) add_object(obj);
    };

    add_object(global_object_);
    add_env(global_env_);
    for (const auto& entry : primordials_) add_object(entry.second);
    for (const EvalState& s : stack_) {
        add_env(s.env);
        add_env(s.loop_env);
        add_value(s.received);
        add_value(s.callee);
        add_value(s.this_value);
        add_value(s.pending.value);
        add_object(s.object);
        add_object(s.function);
        for (const auto& v : s.values) add_value(v);
    }
    for (const CallFrame& f : frames_) {
        add_object(f.function);
        add_value(f.this_value);
    }
    for (const QueuedTask& t : tasks_) {
        add_object(t.fn);
        for (const auto& v : t.args) add_value(v);
    }
    if (pending_resume_) {
        add_value(pending_resume_->value);
        add_object(pending_resume_->fn);
        for (const auto& v : pending_resume_->args) add_value(v);
    }
    if (failure_) add_value(failure_->value);
    add_value(last_value_);

    // both lists grow while they are walked
    size_t next_object = 0;
    size_t next_env = 0;
    while (next_object < objects.size() || next_env < envs.size()) {
        for (; next_object < objects.size(); ++next_object) {
            ObjectPtr obj = objects[next_object];
            for (const auto& key : obj->properties.keys()) add_value(obj->properties.find(key)->value);
            add_object(obj->prototype);
            add_value(obj->primitive);
            if (obj->cls == ObjectClass::Function) {
                auto fn = std::static_pointer_cast<FunctionValue>(obj);
                add_env(fn->closure);
                add_object(fn->bound_target);
                add_value(fn->bound_this);
                for (const auto& v : fn->bound_args) add_value(v);
            }
        }
        for (; next_env < envs.size(); ++next_env) {
            EnvPtr env = envs[next_env];
            for (const auto& binding : env->values) add_value(binding.second.value);
            add_env(env->parent);
            add_object(env->object_record);
        }
    }

    stack_.clear();
    frames_.clear();
    tasks_.clear();
    pending_resume_.reset();
    last_value_ = Value{};

    for (const auto& obj : objects) {
        obj->properties.clear();
        obj->prototype.reset();
        obj->primitive = Value{};
        if (obj->cls == ObjectClass::Function) {
            auto fn = std::static_pointer_cast<FunctionValue>(obj);
            fn->closure.reset();
            fn->bound_target.reset();
            fn->bound_this = Value{};
            fn->bound_args.clear();
            fn->native_impl = nullptr;
        }
    }
    for (const auto& env : envs) {
        env->values.clear();
        env->parent.reset();
        env->object_record.reset();
    }
}

Evaluator::Evaluator(std::shared_ptr<ProgramNode> program, Bootstrap bootstrap, EngineOptions options)
    : program_(std::move(program)), options_(std::move(options)) {
    if (!program_) {
        throw SandstepError("HostMisuse", "an Evaluator needs a program");
    }
    initialize(std::move(bootstrap));
}

Evaluator::Evaluator(const std::string& source, Bootstrap bootstrap, EngineOptions options)
    : program_(parse_source(source, options.filename)), options_(std::move(options)) {
    initialize(std::move(bootstrap));
}

void Evaluator::initialize(Bootstrap bootstrap) {
    rng_state_ = options_.random_seed ? options_.random_seed : 0x5eed;

    analyze(*program_);

    // ---- primordial prototypes (fixed for the engine's lifetime) ----
    auto object_proto = std::make_shared<ObjectValue>();
    primordials_["Object.prototype"] = object_proto;

    auto function_proto = std::make_shared<FunctionValue>();
    function_proto->prototype = object_proto;
    function_proto->is_native = true;
    function_proto->constructible = false;
    function_proto->native_impl = [](NativeCall&) { return Value{}; };
    primordials_["Function.prototype"] = function_proto;

    auto array_proto = std::make_shared<ObjectValue>(ObjectClass::Array);
    array_proto->prototype = object_proto;
    define_property(array_proto, "length", 0.0, true, false, false);
    primordials_["Array.prototype"] = array_proto;

    auto boxed_proto = [&](const std::string& name, Value primitive) {
        auto proto = std::make_shared<ObjectValue>(ObjectClass::Boxed);
        proto->prototype = object_proto;
        proto->primitive = std::move(primitive);
        primordials_[name + ".prototype"] = proto;
    };
    boxed_proto("String", std::string());
    boxed_proto("Number", 0.0);
    boxed_proto("Boolean", false);

    auto error_proto = std::make_shared<ObjectValue>();
    error_proto->prototype = object_proto;
    define_property(error_proto, "name", std::string("Error"), true, false, true);
    define_property(error_proto, "message", std::string(), true, false, true);
    primordials_["Error.prototype"] = error_proto;
    for (const char* kind : {"TypeError", "ReferenceError", "RangeError", "SyntaxError"}) {
        auto proto = std::make_shared<ObjectValue>();
        proto->prototype = error_proto;
        define_property(proto, "name", std::string(kind), true, false, true);
        define_property(proto, "message", std::string(), true, false, true);
        primordials_[std::string(kind) + ".prototype"] = proto;
    }

    global_object_ = create_object();
    global_env_ = std::make_shared<Environment>(nullptr, global_object_);

    init_globals(*this, options_.install_standard_globals);

    if (bootstrap) {
        bootstrap(*this, global_object_);
    }

    push_node(program_.get(), global_env_);
    log(LogLevel::Debug, "engine ready: " + std::to_string(program_->body.size()) + " top-level statements");
}

ObjectPtr Evaluator::primordial(const std::string& name) const {
    auto it = primordials_.find(name);
    return it == primordials_.end() ? nullptr : it->second;
}

void Evaluator::set_primordial(const std::string& name, const ObjectPtr& obj) {
    primordials_[name] = obj;
}

void Evaluator::log(LogLevel level, const std::string& text) const {
    if (!log_enabled(level)) return;
    log_message(level, options_.filename, text);
}

double Evaluator::next_random() {
    // xorshift64*
    rng_state_ ^= rng_state_ >> 12;
    rng_state_ ^= rng_state_ << 25;
    rng_state_ ^= rng_state_ >> 27;
    uint64_t r = rng_state_ * 2685821657736338717ULL;
    return static_cast<double>(r >> 11) * (1.0 / 9007199254740992.0);
}

void Evaluator::set_status(EngineStatus next) {
    if (next == status_) return;
    if (log_enabled(LogLevel::Debug) && next != EngineStatus::Running && status_ != EngineStatus::Running) {
        log(LogLevel::Debug, std::string("status ") + engine_status_name(status_) + " -> " + engine_status_name(next));
    }
    status_ = next;
}

void Evaluator::require_state(bool ok, const std::string& operation) const {
    if (ok) return;
    throw SandstepError("HostMisuse", operation + " is not allowed while the engine is " + engine_status_name(status_));
}

// ----------------- driving -----------------

bool Evaluator::step() {
    switch (status_) {
        case EngineStatus::Running:
            throw SandstepError("HostMisuse", "step() re-entered while a step is in progress");
        case EngineStatus::Failed:
            throw SandstepError("HostMisuse", "step() on a failed engine; construct a new one");
        case EngineStatus::Completed:
            if (tasks_.empty()) return false;
            break;
        case EngineStatus::SuspendedAwait:
            if (!pending_resume_) {
                if (options_.strict_await_polling) {
                    throw SandstepError("HostMisuse", "step() while waiting for an external event");
                }
                return true;
            }
            break;
        default:
            break;
    }

    EngineStatus before = status_;
    status_ = EngineStatus::Running;
    try {
        execute_one();
    } catch (const std::exception&) {
        status_ = before;
        set_status(EngineStatus::Failed);
        throw;
    }

    if (failure_) {
        status_ = before;
        set_status(EngineStatus::Failed);
        log(LogLevel::Error, "uncaught " + failure_->description + " at " + failure_->location.to_string());
        throw UncaughtGuestError(failure_->description, failure_->location);
    }

    status_ = before;
    if (awaiting_) {
        set_status(EngineStatus::SuspendedAwait);
    } else if (stack_.empty() && tasks_.empty()) {
        set_status(EngineStatus::Completed);
    } else {
        set_status(EngineStatus::SuspendedYield);
    }
    return status_ != EngineStatus::Completed;
}

bool Evaluator::run() {
    while (step()) {
        if (status_ == EngineStatus::SuspendedAwait) return true;
    }
    return false;
}

bool Evaluator::run_for(size_t max_steps) {
    bool more = status_ != EngineStatus::Completed || !tasks_.empty();
    for (size_t i = 0; i < max_steps; ++i) {
        more = step();
        if (!more || status_ == EngineStatus::SuspendedAwait) break;
    }
    return more;
}

// ----------------- host events -----------------

void Evaluator::resume(const Value& value) {
    require_state(status_ == EngineStatus::SuspendedAwait && !pending_resume_, "resume()");
    PendingResume r;
    r.kind = PendingResume::Kind::Value;
    r.value = value;
    pending_resume_ = std::move(r);
    awaiting_ = false;
    set_status(EngineStatus::SuspendedYield);
}

void Evaluator::resume_with_error(const Value& error) {
    require_state(status_ == EngineStatus::SuspendedAwait && !pending_resume_, "resume_with_error()");
    PendingResume r;
    r.kind = PendingResume::Kind::Error;
    r.value = error;
    pending_resume_ = std::move(r);
    awaiting_ = false;
    set_status(EngineStatus::SuspendedYield);
}

void Evaluator::resume_with_call(const FunctionPtr& fn, std::vector<Value> args) {
    require_state(status_ == EngineStatus::SuspendedAwait && !pending_resume_, "resume_with_call()");
    if (!fn) {
        throw SandstepError("HostMisuse", "resume_with_call() needs a function");
    }
    PendingResume r;
    r.kind = PendingResume::Kind::Call;
    r.fn = fn;
    r.args = std::move(args);
    pending_resume_ = std::move(r);
    awaiting_ = false;
    set_status(EngineStatus::SuspendedYield);
}

void Evaluator::queue_call(const FunctionPtr& fn, std::vector<Value> args) {
    require_state(status_ != EngineStatus::Failed, "queue_call()");
    if (!fn) {
        throw SandstepError("HostMisuse", "queue_call() needs a function");
    }
    tasks_.push_back(QueuedTask{fn, std::move(args)});
    if (status_ == EngineStatus::Completed) {
        set_status(EngineStatus::SuspendedYield);
    }
}

// ----------------- explicit stack -----------------

void Evaluator::execute_one() {
    ++step_count_;

    if (pending_resume_) {
        apply_resume();
        return;
    }

    if (stack_.empty()) {
        QueuedTask task = std::move(tasks_.front());
        tasks_.pop_front();
        EvalState& t = stack_.emplace_back();
        t.kind = StateKind::Task;
        t.env = global_env_;
        t.function = std::move(task.fn);
        t.values = std::move(task.args);
        return;
    }

    EvalState& s = stack_.back();
    switch (s.kind) {
        case StateKind::FunctionBody:
            step_function_body(s);
            return;
        case StateKind::Boundary:
            step_boundary(s);
            return;
        case StateKind::Task:
            step_task(s);
            return;
        case StateKind::Node:
            break;
    }

    if (log_enabled(LogLevel::Trace)) {
        log(LogLevel::Trace, std::string(node_kind_name(s.node->kind)) + " phase " + std::to_string(s.phase) + " at " + s.node->token.loc.to_string());
    }
    StepHandler handler = handlers()[static_cast<size_t>(s.node->kind)];
    if (!handler) {
        throw SandstepError("InternalError", std::string("no step handler for ") + node_kind_name(s.node->kind), s.node->token.loc);
    }
    const Node* node = s.node;
    try {
        (this->*handler)(s);
    } catch (const std::length_error& e) {
        // an oversized string or too deeply nested conversion
        throw_error("RangeError", e.what(), node->token);
    }
}

void Evaluator::apply_resume() {
    PendingResume r = std::move(*pending_resume_);
    pending_resume_.reset();

    EvalState& caller = stack_.back();
    Token at = caller.node ? caller.node->token : Token();
    switch (r.kind) {
        case PendingResume::Kind::Value:
            caller.received = std::move(r.value);
            caller.has_received = true;
            break;
        case PendingResume::Kind::Error:
            raise(Completion::throw_value(std::move(r.value), at));
            break;
        case PendingResume::Kind::Call:
            begin_call(caller, r.fn, Value{}, std::move(r.args), false, at);
            break;
    }
}

EvalState& Evaluator::push_node(const Node* node, const EnvPtr& env, std::vector<std::string> labels) {
    EvalState& s = stack_.emplace_back();
    s.node = node;
    s.env = env;
    s.labels = std::move(labels);
    return s;
}

void Evaluator::pop_state() {
    if (stack_.back().frame_pushed) {
        frames_.pop_back();
    }
    stack_.pop_back();
}

// The top state completed normally; hand its value to the parent.
void Evaluator::finish(Value v) {
    pop_state();
    if (stack_.empty()) return;
    EvalState& parent = stack_.back();
    parent.received = std::move(v);
    parent.has_received = true;
}

static std::string trace_line(const FunctionPtr& fn, const TokenLocation& at) {
    std::string name = !fn ? "<top level>" : fn->name.empty() ? "<anonymous>" : fn->name;
    return "at " + name + " (" + at.to_string() + ")";
}

// Failure text for a thrown value; an unprintable value still yields a description.
static std::string describe_thrown(const Value& v) {
    try {
        return to_display_string(v);
    } catch (const std::length_error& e) {
        return std::string("<") + e.what() + ">";
    }
}

// The top state completed abruptly; unwind until some state takes the completion.
// Frames popped on the way are recorded so an uncaught throw keeps its trace.
void Evaluator::raise(Completion c) {
    std::vector<std::string> trace;
    TokenLocation position = c.origin.loc;
    auto unwind = [&]() {
        if (c.type == Completion::Type::Throw && stack_.back().frame_pushed) {
            const CallFrame& frame = frames_.back();
            trace.push_back(trace_line(frame.function, position));
            position = frame.call_token.loc;
        }
        pop_state();
    };

    unwind();
    while (!stack_.empty()) {
        if (intercept(stack_.back(), c)) return;
        unwind();
    }
    if (c.type == Completion::Type::Throw) {
        trace.push_back(trace_line(nullptr, position));
        Failure f;
        f.value = c.value;
        f.description = describe_thrown(c.value);
        f.location = c.origin.loc;
        f.stack = std::move(trace);
        failure_ = std::move(f);
    }
}

std::vector<std::string> Evaluator::guest_stack_trace(const TokenLocation& innermost) const {
    std::vector<std::string> trace;
    TokenLocation position = innermost;
    for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
        trace.push_back(trace_line(it->function, position));
        position = it->call_token.loc;
    }
    trace.push_back(trace_line(nullptr, position));
    return trace;
}

void Evaluator::throw_error(const std::string& kind, const std::string& message, const Token& at) {
    raise(Completion::throw_value(create_error(kind, message), at));
}

void Evaluator::fail_fatal(const Value& thrown, const Token& at) {
    Failure f;
    f.value = thrown;
    f.description = describe_thrown(thrown);
    f.location = at.loc;
    f.stack = guest_stack_trace(at.loc);
    failure_ = f;
    log(LogLevel::Error, "fatal " + f.description + " at " + f.location.to_string());
    throw UncaughtGuestError(f.description, f.location);
}

const std::array<Evaluator::StepHandler, kNodeKindCount>& Evaluator::handlers() {
    static const std::array<StepHandler, kNodeKindCount> table = [] {
        std::array<StepHandler, kNodeKindCount> t{};
        auto at = [&t](NodeKind k) -> StepHandler& { return t[static_cast<size_t>(k)]; };

        // statements
        at(NodeKind::Program) = &Evaluator::step_program;
        at(NodeKind::Block) = &Evaluator::step_block;
        at(NodeKind::Empty) = &Evaluator::step_empty;
        at(NodeKind::ExpressionStatement) = &Evaluator::step_expression_statement;
        at(NodeKind::VariableDeclaration) = &Evaluator::step_variable_declaration;
        at(NodeKind::FunctionDeclaration) = &Evaluator::step_function_declaration;
        at(NodeKind::Return) = &Evaluator::step_return;
        at(NodeKind::If) = &Evaluator::step_if;
        at(NodeKind::For) = &Evaluator::step_for;
        at(NodeKind::ForIn) = &Evaluator::step_for_in;
        at(NodeKind::While) = &Evaluator::step_while;
        at(NodeKind::DoWhile) = &Evaluator::step_do_while;
        at(NodeKind::Break) = &Evaluator::step_break;
        at(NodeKind::Continue) = &Evaluator::step_continue;
        at(NodeKind::Labeled) = &Evaluator::step_labeled;
        at(NodeKind::Throw) = &Evaluator::step_throw;
        at(NodeKind::Try) = &Evaluator::step_try;

        // expressions
        at(NodeKind::Identifier) = &Evaluator::step_identifier;
        at(NodeKind::Literal) = &Evaluator::step_literal;
        at(NodeKind::This) = &Evaluator::step_this;
        at(NodeKind::ArrayLiteral) = &Evaluator::step_array_literal;
        at(NodeKind::ObjectLiteral) = &Evaluator::step_object_literal;
        at(NodeKind::FunctionExpression) = &Evaluator::step_function_expression;
        at(NodeKind::Member) = &Evaluator::step_member;
        at(NodeKind::Call) = &Evaluator::step_call;
        at(NodeKind::New) = &Evaluator::step_new;
        at(NodeKind::Unary) = &Evaluator::step_unary;
        at(NodeKind::Update) = &Evaluator::step_update;
        at(NodeKind::Binary) = &Evaluator::step_binary;
        at(NodeKind::Logical) = &Evaluator::step_logical;
        at(NodeKind::Assignment) = &Evaluator::step_assignment;
        at(NodeKind::Conditional) = &Evaluator::step_conditional;
        at(NodeKind::Sequence) = &Evaluator::step_sequence;
        return t;
    }();
    return table;
}
