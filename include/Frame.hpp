#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ast.hpp"
#include "value.hpp"

// Outcome of evaluating a statement or expression. Exactly one kind at a time.
struct Completion {
    enum class Type {
        Normal,
        Return,
        Break,
        Continue,
        Throw
    };

    Type type = Type::Normal;
    Value value;
    std::string label;  // Break / Continue only
    Token origin;       // where a Throw was raised

    static Completion normal(Value v) {
        Completion c;
        c.value = std::move(v);
        return c;
    }
    static Completion return_value(Value v) {
        Completion c;
        c.type = Type::Return;
        c.value = std::move(v);
        return c;
    }
    static Completion break_to(const std::string& label) {
        Completion c;
        c.type = Type::Break;
        c.label = label;
        return c;
    }
    static Completion continue_to(const std::string& label) {
        Completion c;
        c.type = Type::Continue;
        c.label = label;
        return c;
    }
    static Completion throw_value(Value v, const Token& origin) {
        Completion c;
        c.type = Type::Throw;
        c.value = std::move(v);
        c.origin = origin;
        return c;
    }

    bool is_abrupt() const { return type != Type::Normal; }
};

enum class StateKind {
    Node,          // evaluating a syntax node
    FunctionBody,  // one guest function activation
    Boundary,      // base of a synchronous call made by native code
    Task           // host-queued top-level call
};

// Cursor for one node (or activation) in progress. Lives on the evaluator's
// explicit stack; everything needed to continue the node later is in here.
struct EvalState {
    StateKind kind = StateKind::Node;
    const Node* node = nullptr;
    EnvPtr env;

    int phase = 0;
    size_t index = 0;

    // value handed up by the child that finished last
    Value received;
    bool has_received = false;

    // scratch slots
    std::vector<Value> values;  // evaluated arguments / operands
    Value callee;
    Value this_value;
    ObjectPtr object;
    std::string key;
    std::vector<std::string> keys;  // for-in snapshot
    EnvPtr loop_env;                // per-iteration scope of let/const loops

    // labels that name this statement (loops and labeled statements)
    std::vector<std::string> labels;

    // try/finally: completion parked while the finalizer runs; Boundary: escaped throw
    Completion pending;
    bool has_pending = false;

    // FunctionBody / Task
    FunctionPtr function;
    bool construct = false;
    bool frame_pushed = false;
};

// One in-progress guest function activation. The matching FunctionBody state
// holds the position inside the body and the activation environment.
struct CallFrame {
    FunctionPtr function;
    Value this_value;
    Token call_token;  // where the caller invoked it, for stack traces
};
