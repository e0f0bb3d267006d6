#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "ast.hpp"

// Forward declarations
class Environment;
class NativeCall;

struct ObjectValue;
using ObjectPtr = std::shared_ptr<ObjectValue>;

struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

using EnvPtr = std::shared_ptr<Environment>;

struct NullValue {
    bool operator==(const NullValue&) const { return true; }
};

// Guest values. std::monostate is `undefined`.
using Value = std::variant<
    std::monostate,
    NullValue,
    bool,
    double,
    std::string,
    ObjectPtr>;

inline bool is_undefined(const Value& v) { return std::holds_alternative<std::monostate>(v); }
inline bool is_null(const Value& v) { return std::holds_alternative<NullValue>(v); }
inline bool is_nullish(const Value& v) { return is_undefined(v) || is_null(v); }
inline bool is_object(const Value& v) { return std::holds_alternative<ObjectPtr>(v) && std::get<ObjectPtr>(v) != nullptr; }

inline ObjectPtr as_object(const Value& v) {
    if (auto p = std::get_if<ObjectPtr>(&v)) return *p;
    return nullptr;
}

struct PropertyDescriptor {
    Value value;
    bool writable = true;
    bool enumerable = true;
    bool configurable = true;
};

// Property table that remembers insertion order for enumeration.
class PropertyMap {
   public:
    PropertyDescriptor* find(const std::string& key);
    const PropertyDescriptor* find(const std::string& key) const;
    bool contains(const std::string& key) const { return entries_.count(key) != 0; }

    // Creates the entry at the end of the order if absent, replaces it otherwise.
    PropertyDescriptor& put(const std::string& key, const PropertyDescriptor& desc);
    bool erase(const std::string& key);

    const std::vector<std::string>& keys() const { return order_; }
    size_t size() const { return entries_.size(); }
    void clear() {
        entries_.clear();
        order_.clear();
    }

   private:
    std::unordered_map<std::string, PropertyDescriptor> entries_;
    std::vector<std::string> order_;
};

enum class ObjectClass {
    Plain,
    Array,
    Function,
    Error,
    Arguments,
    Boxed
};

struct ObjectValue {
    explicit ObjectValue(ObjectClass c = ObjectClass::Plain) : cls(c) {}
    virtual ~ObjectValue() = default;

    ObjectClass cls;
    PropertyMap properties;
    ObjectPtr prototype;  // delegation link, nullptr ends the chain

    // wrapped primitive for Boxed objects (new String("x"), new Number(1))
    Value primitive;
};

using NativeFunction = std::function<Value(NativeCall&)>;

// Function value: a guest closure (body + defining environment) or a native callback.
struct FunctionValue : public ObjectValue {
    FunctionValue() : ObjectValue(ObjectClass::Function) {}

    std::string name;

    // guest functions
    const FunctionNode* node = nullptr;
    std::shared_ptr<ProgramNode> program;  // keeps `node` alive
    EnvPtr closure;

    // native functions
    bool is_native = false;
    NativeFunction native_impl;

    bool constructible = true;

    // Function.prototype.bind results
    FunctionPtr bound_target;
    Value bound_this;
    std::vector<Value> bound_args;
};

inline FunctionPtr as_function(const Value& v) {
    auto obj = as_object(v);
    if (!obj || obj->cls != ObjectClass::Function) return nullptr;
    return std::static_pointer_cast<FunctionValue>(obj);
}

// Environment with lexical parent pointer. The global environment is backed by
// the global object: bindings not found in `values` are looked up as properties.
class Environment : public std::enable_shared_from_this<Environment> {
   public:
    explicit Environment(EnvPtr parent = nullptr, ObjectPtr object_record = nullptr)
        : parent(std::move(parent)), object_record(std::move(object_record)) {}

    struct Variable {
        Value value;
        bool is_constant = false;
    };

    enum class AssignResult {
        Ok,
        NotFound,
        Constant
    };

    // map from name -> Variable
    std::unordered_map<std::string, Variable> values;
    EnvPtr parent;
    ObjectPtr object_record;

    // check if name exists in this environment or any parent
    bool has(const std::string& name) const;
    bool has_own(const std::string& name) const;

    // create (or replace) a binding in this environment only
    void declare(const std::string& name, const Value& value, bool is_constant = false);

    // `var` semantics: create as undefined unless this scope already has it
    void declare_var(const std::string& name);

    // walks the chain; nullopt when no scope binds the name
    std::optional<Value> lookup(const std::string& name) const;

    // updates the nearest existing binding, never creates one
    AssignResult assign(const std::string& name, const Value& value);
};
