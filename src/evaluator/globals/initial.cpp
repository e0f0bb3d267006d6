// src/evaluator/globals/initial.cpp
//
// Built-in methods of the primordial prototypes and the standard constructors.
// Nothing here performs I/O.
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <limits>

#include "conversions.hpp"
#include "evaluator.hpp"
#include "globals.hpp"
#include "object_model.hpp"

namespace {

const char* kWhitespace = " \t\n\r\v\f";

std::string trim_string(const std::string& s) {
    size_t start = s.find_first_not_of(kWhitespace);
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(kWhitespace);
    return s.substr(start, end - start + 1);
}

// slice()-style index: negative counts from the end, result clamped to [0, len]
double relative_index(const Value& v, double len, double fallback) {
    if (is_undefined(v)) return fallback;
    double r = to_integer(v);
    if (r < 0) return std::max(len + r, 0.0);
    return std::min(r, len);
}

ObjectPtr require_object(NativeCall& call, const Value& v, const std::string& who) {
    auto obj = as_object(v);
    if (!obj) call.throw_error("TypeError", who + " called on non-object");
    return obj;
}

ObjectPtr this_array(NativeCall& call, const char* method) {
    auto obj = as_object(call.this_value());
    if (!obj || obj->cls != ObjectClass::Array) {
        call.throw_error("TypeError", std::string("Array.prototype.") + method + " called on a non-array");
    }
    return obj;
}

std::string this_string(NativeCall& call, const char* method) {
    const Value& t = call.this_value();
    if (auto s = std::get_if<std::string>(&t)) return *s;
    if (is_nullish(t)) {
        call.throw_error("TypeError", std::string("String.prototype.") + method + " called on null or undefined");
    }
    return to_display_string(t);
}

FunctionPtr this_function(NativeCall& call, const char* method) {
    auto fn = as_function(call.this_value());
    if (!fn) call.throw_error("TypeError", std::string("Function.prototype.") + method + " called on a non-function");
    return fn;
}

constexpr double kMaxArrayLength = 4294967295.0;

// apply() copies its list into an argument vector
constexpr double kMaxApplyArguments = 65536.0;

ObjectPtr box(NativeCall& call, const std::string& proto_name, Value primitive) {
    auto obj = std::make_shared<ObjectValue>(ObjectClass::Boxed);
    obj->prototype = call.engine().primordial(proto_name);
    obj->primitive = std::move(primitive);
    return obj;
}

// Primitive behind `this` for the Number/Boolean/String valueOf family.
Value this_primitive(NativeCall& call, const std::string& type) {
    Value t = call.this_value();
    if (auto obj = as_object(t)) {
        if (obj->cls == ObjectClass::Boxed) t = obj->primitive;
    }
    if (type_of(t) != type) {
        call.throw_error("TypeError", type + " value expected");
    }
    return t;
}

// ----------------- Object -----------------

Value builtin_object(NativeCall& call) {
    Value v = call.arg(0);
    if (is_object(v)) return v;
    return call.create_object();
}

Value builtin_object_keys(NativeCall& call) {
    Value v = call.arg(0);
    if (is_nullish(v)) call.throw_error("TypeError", "Cannot convert undefined or null to object");
    std::vector<Value> keys;
    if (auto obj = as_object(v)) {
        for (auto& k : own_keys(obj, true)) keys.push_back(k);
    } else if (auto s = std::get_if<std::string>(&v)) {
        for (size_t i = 0; i < s->size(); ++i) keys.push_back(index_key(i));
    }
    return call.create_array(keys);
}

Value builtin_object_create(NativeCall& call) {
    Value proto = call.arg(0);
    if (is_null(proto)) return call.engine().create_object(nullptr);
    auto obj = as_object(proto);
    if (!obj) {
        call.throw_error("TypeError", "Object prototype may only be an Object or null: " + to_display_string(proto));
    }
    return call.engine().create_object(obj);
}

Value builtin_object_get_prototype_of(NativeCall& call) {
    Value v = call.arg(0);
    if (is_nullish(v)) call.throw_error("TypeError", "Cannot convert undefined or null to object");
    ObjectPtr proto;
    if (auto obj = as_object(v)) {
        proto = obj->prototype;
    } else if (std::holds_alternative<std::string>(v)) {
        proto = call.engine().primordial("String.prototype");
    } else if (std::holds_alternative<double>(v)) {
        proto = call.engine().primordial("Number.prototype");
    } else {
        proto = call.engine().primordial("Boolean.prototype");
    }
    if (!proto) return NullValue{};
    return proto;
}

Value builtin_object_has_own_property(NativeCall& call) {
    std::string key = to_property_key(call.arg(0));
    const Value& t = call.this_value();
    if (is_nullish(t)) call.throw_error("TypeError", "Cannot convert undefined or null to object");
    if (auto s = std::get_if<std::string>(&t)) {
        uint32_t index = 0;
        return key == "length" || (parse_array_index(key, &index) && index < s->size());
    }
    auto obj = as_object(t);
    return obj ? has_own_property(obj, key) : false;
}

Value builtin_object_to_string(NativeCall& call) {
    const Value& t = call.this_value();
    if (is_undefined(t)) return std::string("[object Undefined]");
    if (is_null(t)) return std::string("[object Null]");
    auto obj = as_object(t);
    if (!obj) return "[object " + std::string(type_of(t) == "string" ? "String" : type_of(t) == "number" ? "Number" : "Boolean") + "]";
    switch (obj->cls) {
        case ObjectClass::Array: return std::string("[object Array]");
        case ObjectClass::Function: return std::string("[object Function]");
        case ObjectClass::Error: return std::string("[object Error]");
        case ObjectClass::Arguments: return std::string("[object Arguments]");
        default: return std::string("[object Object]");
    }
}

Value builtin_object_value_of(NativeCall& call) {
    return call.this_value();
}

// ----------------- Function -----------------

Value builtin_function(NativeCall& call) {
    call.throw_error("TypeError", "Function constructor is not supported");
}

Value builtin_function_call(NativeCall& call) {
    FunctionPtr fn = this_function(call, "call");
    std::vector<Value> rest;
    if (call.argc() > 1) rest.assign(call.args().begin() + 1, call.args().end());
    call.tail_call(fn, call.arg(0), std::move(rest));
    return Value{};
}

Value builtin_function_apply(NativeCall& call) {
    FunctionPtr fn = this_function(call, "apply");
    Value list = call.arg(1);
    if (!is_nullish(list) && !is_object(list)) {
        call.throw_error("TypeError", "CreateListFromArrayLike called on non-object");
    }
    if (auto obj = as_object(list)) {
        auto length = get_property(obj, "length");
        if (length && to_integer(*length) > kMaxApplyArguments) {
            call.throw_error("RangeError", "Too many arguments in function call");
        }
    }
    call.tail_call(fn, call.arg(0), array_to_vector(list));
    return Value{};
}

Value builtin_function_bind(NativeCall& call) {
    FunctionPtr target = this_function(call, "bind");
    auto bound = std::make_shared<FunctionValue>();
    bound->prototype = call.engine().primordial("Function.prototype");
    bound->name = "bound " + target->name;
    bound->constructible = target->constructible;
    bound->bound_target = target;
    bound->bound_this = call.arg(0);
    if (call.argc() > 1) bound->bound_args.assign(call.args().begin() + 1, call.args().end());

    double length = 0;
    if (auto l = get_own_property(target, "length")) length = to_integer(*l);
    length = std::max(0.0, length - static_cast<double>(bound->bound_args.size()));
    define_property(bound, "name", bound->name, false, false, true);
    define_property(bound, "length", length, false, false, true);
    return bound;
}

Value builtin_function_to_string(NativeCall& call) {
    this_function(call, "toString");
    return to_display_string(call.this_value());
}

// ----------------- Array -----------------

Value builtin_array(NativeCall& call) {
    if (call.argc() == 1 && std::holds_alternative<double>(call.arg(0))) {
        double n = std::get<double>(call.arg(0));
        if (n < 0 || n != std::floor(n) || n > kMaxArrayLength) {
            call.throw_error("RangeError", "Invalid array length");
        }
        auto arr = call.create_array({});
        define_property(arr, "length", n, true, false, false);
        return arr;
    }
    return call.create_array(call.args());
}

Value builtin_array_is_array(NativeCall& call) {
    auto obj = as_object(call.arg(0));
    return obj && obj->cls == ObjectClass::Array;
}

Value builtin_array_push(NativeCall& call) {
    auto arr = this_array(call, "push");
    for (const auto& v : call.args()) array_push(arr, v);
    return static_cast<double>(array_length(arr));
}

Value builtin_array_pop(NativeCall& call) {
    auto arr = this_array(call, "pop");
    uint32_t len = array_length(arr);
    if (len == 0) return Value{};
    auto last = get_property(arr, index_key(len - 1));
    set_property(arr, "length", static_cast<double>(len - 1));
    return last ? *last : Value{};
}

Value builtin_array_shift(NativeCall& call) {
    auto arr = this_array(call, "shift");
    uint32_t len = array_length(arr);
    if (len == 0) return Value{};
    auto first = get_own_property(arr, "0");
    std::vector<ArrayEntry> moved;
    for (auto& e : array_entries(arr)) {
        if (e.index > 0) moved.push_back(ArrayEntry{e.index - 1, std::move(e.value)});
    }
    replace_array_entries(arr, moved, len - 1);
    return first ? *first : Value{};
}

Value builtin_array_unshift(NativeCall& call) {
    auto arr = this_array(call, "unshift");
    double len = static_cast<double>(array_length(arr)) + static_cast<double>(call.argc());
    if (len > kMaxArrayLength) call.throw_error("RangeError", "Invalid array length");
    std::vector<ArrayEntry> moved;
    for (size_t i = 0; i < call.argc(); ++i) moved.push_back(ArrayEntry{static_cast<uint32_t>(i), call.arg(i)});
    uint32_t shift = static_cast<uint32_t>(call.argc());
    for (auto& e : array_entries(arr)) moved.push_back(ArrayEntry{e.index + shift, std::move(e.value)});
    replace_array_entries(arr, moved, static_cast<uint32_t>(len));
    return len;
}

Value builtin_array_join(NativeCall& call) {
    auto arr = this_array(call, "join");
    std::string sep = is_undefined(call.arg(0)) ? "," : to_display_string(call.arg(0));
    return join_array(arr, sep);
}

Value builtin_array_slice(NativeCall& call) {
    auto arr = this_array(call, "slice");
    double len = static_cast<double>(array_length(arr));
    double start = relative_index(call.arg(0), len, 0);
    double end = relative_index(call.arg(1), len, len);
    auto out = call.create_array({});
    if (end <= start) return out;
    std::vector<ArrayEntry> picked;
    for (auto& e : array_entries(arr)) {
        if (e.index >= start && e.index < end) {
            picked.push_back(ArrayEntry{e.index - static_cast<uint32_t>(start), std::move(e.value)});
        }
    }
    replace_array_entries(out, picked, static_cast<uint32_t>(end - start));
    return out;
}

// holes are skipped, so searching for undefined never matches one
Value builtin_array_index_of(NativeCall& call) {
    auto arr = this_array(call, "indexOf");
    double len = static_cast<double>(array_length(arr));
    double from = relative_index(call.arg(1), len, 0);
    for (const auto& e : array_entries(arr)) {
        if (e.index >= from && strict_equals(e.value, call.arg(0))) return static_cast<double>(e.index);
    }
    return -1.0;
}

Value builtin_array_concat(NativeCall& call) {
    auto arr = this_array(call, "concat");
    std::vector<ArrayEntry> out = array_entries(arr);
    double len = static_cast<double>(array_length(arr));
    for (const auto& v : call.args()) {
        auto obj = as_object(v);
        if (obj && obj->cls == ObjectClass::Array) {
            double more = static_cast<double>(array_length(obj));
            if (len + more > kMaxArrayLength) call.throw_error("RangeError", "Invalid array length");
            for (auto& e : array_entries(obj)) {
                out.push_back(ArrayEntry{e.index + static_cast<uint32_t>(len), std::move(e.value)});
            }
            len += more;
        } else {
            if (len + 1 > kMaxArrayLength) call.throw_error("RangeError", "Invalid array length");
            out.push_back(ArrayEntry{static_cast<uint32_t>(len), v});
            len += 1;
        }
    }
    auto result = call.create_array({});
    replace_array_entries(result, out, static_cast<uint32_t>(len));
    return result;
}

Value builtin_array_reverse(NativeCall& call) {
    auto arr = this_array(call, "reverse");
    uint32_t len = array_length(arr);
    std::vector<ArrayEntry> entries = array_entries(arr);
    for (auto& e : entries) e.index = len - 1 - e.index;
    replace_array_entries(arr, entries, len);
    return arr;
}

Value builtin_array_to_string(NativeCall& call) {
    return join_array(this_array(call, "toString"), ",");
}

// ----------------- String -----------------

Value builtin_string(NativeCall& call) {
    std::string s = call.argc() == 0 ? std::string() : to_display_string(call.arg(0));
    if (call.is_construct()) return box(call, "String.prototype", s);
    return s;
}

Value builtin_string_char_at(NativeCall& call) {
    std::string s = this_string(call, "charAt");
    double i = to_integer(call.arg(0));
    if (i < 0 || i >= static_cast<double>(s.size())) return std::string();
    return std::string(1, s[static_cast<size_t>(i)]);
}

Value builtin_string_char_code_at(NativeCall& call) {
    std::string s = this_string(call, "charCodeAt");
    double i = to_integer(call.arg(0));
    if (i < 0 || i >= static_cast<double>(s.size())) return std::numeric_limits<double>::quiet_NaN();
    return static_cast<double>(static_cast<unsigned char>(s[static_cast<size_t>(i)]));
}

Value builtin_string_index_of(NativeCall& call) {
    std::string s = this_string(call, "indexOf");
    std::string needle = to_display_string(call.arg(0));
    double from = std::min(std::max(to_integer(call.arg(1)), 0.0), static_cast<double>(s.size()));
    size_t pos = s.find(needle, static_cast<size_t>(from));
    return pos == std::string::npos ? -1.0 : static_cast<double>(pos);
}

Value builtin_string_slice(NativeCall& call) {
    std::string s = this_string(call, "slice");
    double len = static_cast<double>(s.size());
    double start = relative_index(call.arg(0), len, 0);
    double end = relative_index(call.arg(1), len, len);
    if (start >= end) return std::string();
    return s.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
}

Value builtin_string_substring(NativeCall& call) {
    std::string s = this_string(call, "substring");
    double len = static_cast<double>(s.size());
    auto clamp = [len](const Value& v, double fallback) {
        if (is_undefined(v)) return fallback;
        return std::min(std::max(to_integer(v), 0.0), len);
    };
    double start = clamp(call.arg(0), 0);
    double end = clamp(call.arg(1), len);
    if (start > end) std::swap(start, end);
    return s.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
}

Value builtin_string_to_upper_case(NativeCall& call) {
    std::string s = this_string(call, "toUpperCase");
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

Value builtin_string_to_lower_case(NativeCall& call) {
    std::string s = this_string(call, "toLowerCase");
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

Value builtin_string_split(NativeCall& call) {
    std::string s = this_string(call, "split");
    double limit = is_undefined(call.arg(1)) ? 4294967295.0 : to_integer(call.arg(1));
    std::vector<Value> parts;
    auto add = [&](std::string part) {
        if (static_cast<double>(parts.size()) < limit) parts.push_back(std::move(part));
    };

    if (is_undefined(call.arg(0))) {
        add(s);
    } else {
        std::string sep = to_display_string(call.arg(0));
        if (sep.empty()) {
            for (char c : s) add(std::string(1, c));
        } else {
            size_t start = 0;
            for (size_t pos; (pos = s.find(sep, start)) != std::string::npos; start = pos + sep.size()) {
                add(s.substr(start, pos - start));
            }
            add(s.substr(start));
        }
    }
    return call.create_array(parts);
}

Value builtin_string_trim(NativeCall& call) {
    return trim_string(this_string(call, "trim"));
}

Value builtin_string_value_of(NativeCall& call) {
    return this_primitive(call, "string");
}

// ----------------- Number / Boolean -----------------

Value builtin_number(NativeCall& call) {
    double n = call.argc() == 0 ? 0.0 : to_number(call.arg(0));
    if (call.is_construct()) return box(call, "Number.prototype", n);
    return n;
}

Value builtin_number_to_string(NativeCall& call) {
    double n = std::get<double>(this_primitive(call, "number"));
    if (is_undefined(call.arg(0))) return number_to_string(n);
    double radix = to_integer(call.arg(0));
    if (radix < 2 || radix > 36) call.throw_error("RangeError", "toString() radix must be between 2 and 36");
    if (radix == 10 || !std::isfinite(n) || n != std::floor(n)) return number_to_string(n);

    const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
    bool negative = n < 0;
    double rest = std::fabs(n);
    std::string out;
    do {
        double d = std::fmod(rest, radix);
        out.insert(out.begin(), digits[static_cast<int>(d)]);
        rest = std::floor(rest / radix);
    } while (rest > 0);
    if (negative) out.insert(out.begin(), '-');
    return out;
}

Value builtin_number_value_of(NativeCall& call) {
    return this_primitive(call, "number");
}

Value builtin_boolean(NativeCall& call) {
    bool b = to_boolean(call.arg(0));
    if (call.is_construct()) return box(call, "Boolean.prototype", b);
    return b;
}

Value builtin_boolean_to_string(NativeCall& call) {
    return std::string(std::get<bool>(this_primitive(call, "boolean")) ? "true" : "false");
}

Value builtin_boolean_value_of(NativeCall& call) {
    return this_primitive(call, "boolean");
}

// ----------------- Error -----------------

Value builtin_error_to_string(NativeCall& call) {
    auto obj = require_object(call, call.this_value(), "Error.prototype.toString");
    auto name = get_property(obj, "name");
    auto message = get_property(obj, "message");
    std::string n = name && !is_undefined(*name) ? to_display_string(*name) : "Error";
    std::string m = message && !is_undefined(*message) ? to_display_string(*message) : "";
    if (m.empty()) return n;
    if (n.empty()) return m;
    return n + ": " + m;
}

// ----------------- Math and globals -----------------

double number_arg(NativeCall& call, size_t i) {
    return to_number(call.arg(i));
}

Value builtin_math_floor(NativeCall& call) { return std::floor(number_arg(call, 0)); }
Value builtin_math_ceil(NativeCall& call) { return std::ceil(number_arg(call, 0)); }
Value builtin_math_abs(NativeCall& call) { return std::fabs(number_arg(call, 0)); }
Value builtin_math_sqrt(NativeCall& call) { return std::sqrt(number_arg(call, 0)); }
Value builtin_math_pow(NativeCall& call) { return std::pow(number_arg(call, 0), number_arg(call, 1)); }
Value builtin_math_random(NativeCall& call) { return call.engine().next_random(); }

// halves round toward +Infinity; x + 0.5 would lose the low bit first
Value builtin_math_round(NativeCall& call) {
    double x = number_arg(call, 0);
    if (!std::isfinite(x)) return x;
    double down = std::floor(x);
    return x - down >= 0.5 ? down + 1 : down;
}

Value builtin_math_max(NativeCall& call) {
    double best = -std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < call.argc(); ++i) {
        double x = number_arg(call, i);
        if (std::isnan(x)) return x;
        best = std::max(best, x);
    }
    return best;
}

Value builtin_math_min(NativeCall& call) {
    double best = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < call.argc(); ++i) {
        double x = number_arg(call, i);
        if (std::isnan(x)) return x;
        best = std::min(best, x);
    }
    return best;
}

Value builtin_is_nan(NativeCall& call) {
    return std::isnan(number_arg(call, 0));
}

Value builtin_parse_int(NativeCall& call) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    std::string s = trim_string(to_display_string(call.arg(0)));
    size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '+' || s[i] == '-')) negative = s[i++] == '-';

    int radix = static_cast<int>(to_integer(call.arg(1)));
    if (radix != 0 && (radix < 2 || radix > 36)) return nan;
    if ((radix == 0 || radix == 16) && s.size() >= i + 2 && s[i] == '0' && (s[i + 1] == 'x' || s[i + 1] == 'X')) {
        radix = 16;
        i += 2;
    }
    if (radix == 0) radix = 10;

    double result = 0;
    size_t first = i;
    for (; i < s.size(); ++i) {
        int c = std::tolower(static_cast<unsigned char>(s[i]));
        int digit = std::isdigit(c) ? c - '0' : (c >= 'a' && c <= 'z') ? c - 'a' + 10 : 99;
        if (digit >= radix) break;
        result = result * radix + digit;
    }
    if (i == first) return nan;
    return negative ? -result : result;
}

Value builtin_parse_float(NativeCall& call) {
    std::string s = trim_string(to_display_string(call.arg(0)));
    size_t sign = (!s.empty() && (s[0] == '+' || s[0] == '-')) ? 1 : 0;
    if (s.compare(sign, 8, "Infinity") == 0) {
        double inf = std::numeric_limits<double>::infinity();
        return s[0] == '-' ? -inf : inf;
    }
    // strtod alone would also accept hex and "inf"
    size_t end = sign;
    bool digits = false;
    while (end < s.size() && std::isdigit(static_cast<unsigned char>(s[end]))) end++, digits = true;
    if (end < s.size() && s[end] == '.') {
        end++;
        while (end < s.size() && std::isdigit(static_cast<unsigned char>(s[end]))) end++, digits = true;
    }
    if (!digits) return std::numeric_limits<double>::quiet_NaN();
    if (end < s.size() && (s[end] == 'e' || s[end] == 'E')) {
        size_t exp = end + 1;
        if (exp < s.size() && (s[exp] == '+' || s[exp] == '-')) exp++;
        if (exp < s.size() && std::isdigit(static_cast<unsigned char>(s[exp]))) {
            end = exp;
            while (end < s.size() && std::isdigit(static_cast<unsigned char>(s[end]))) end++;
        }
    }
    return std::strtod(s.substr(0, end).c_str(), nullptr);
}

// Links `ctor.prototype` and `proto.constructor` both ways (neither enumerable).
void link_constructor(const FunctionPtr& ctor, const ObjectPtr& proto) {
    define_property(ctor, "prototype", proto, false, false, false);
    define_property(proto, "constructor", ctor, true, false, true);
}

}  // namespace

void init_globals(Evaluator& engine, bool install_bindings) {
    ObjectPtr global = engine.global_object();
    ObjectPtr object_proto = engine.primordial("Object.prototype");
    ObjectPtr function_proto = engine.primordial("Function.prototype");
    ObjectPtr array_proto = engine.primordial("Array.prototype");
    ObjectPtr string_proto = engine.primordial("String.prototype");
    ObjectPtr number_proto = engine.primordial("Number.prototype");
    ObjectPtr boolean_proto = engine.primordial("Boolean.prototype");
    ObjectPtr error_proto = engine.primordial("Error.prototype");

    std::vector<std::pair<std::string, Value>> bindings;
    auto constructor = [&](const std::string& name, NativeFunction impl, int arity, const ObjectPtr& proto) {
        FunctionPtr ctor = engine.create_native_function(name, std::move(impl), arity, true);
        link_constructor(ctor, proto);
        engine.set_primordial(name, ctor);
        bindings.emplace_back(name, ctor);
        return ctor;
    };

    // Object
    {
        FunctionPtr ctor = constructor("Object", builtin_object, 1, object_proto);
        engine.register_native(ctor, "keys", builtin_object_keys, 1);
        engine.register_native(ctor, "create", builtin_object_create, 2);
        engine.register_native(ctor, "getPrototypeOf", builtin_object_get_prototype_of, 1);

        engine.register_native(object_proto, "hasOwnProperty", builtin_object_has_own_property, 1);
        engine.register_native(object_proto, "toString", builtin_object_to_string, 0);
        engine.register_native(object_proto, "valueOf", builtin_object_value_of, 0);
    }

    // Function
    {
        FunctionPtr ctor = constructor("Function", builtin_function, 1, function_proto);
        ctor->constructible = false;
        engine.register_native(function_proto, "call", builtin_function_call, 1);
        engine.register_native(function_proto, "apply", builtin_function_apply, 2);
        engine.register_native(function_proto, "bind", builtin_function_bind, 1);
        engine.register_native(function_proto, "toString", builtin_function_to_string, 0);
    }

    // Array
    {
        FunctionPtr ctor = constructor("Array", builtin_array, 1, array_proto);
        engine.register_native(ctor, "isArray", builtin_array_is_array, 1);

        engine.register_native(array_proto, "push", builtin_array_push, 1);
        engine.register_native(array_proto, "pop", builtin_array_pop, 0);
        engine.register_native(array_proto, "shift", builtin_array_shift, 0);
        engine.register_native(array_proto, "unshift", builtin_array_unshift, 1);
        engine.register_native(array_proto, "join", builtin_array_join, 1);
        engine.register_native(array_proto, "slice", builtin_array_slice, 2);
        engine.register_native(array_proto, "indexOf", builtin_array_index_of, 1);
        engine.register_native(array_proto, "concat", builtin_array_concat, 1);
        engine.register_native(array_proto, "reverse", builtin_array_reverse, 0);
        engine.register_native(array_proto, "toString", builtin_array_to_string, 0);
    }

    // String
    {
        constructor("String", builtin_string, 1, string_proto);
        engine.register_native(string_proto, "charAt", builtin_string_char_at, 1);
        engine.register_native(string_proto, "charCodeAt", builtin_string_char_code_at, 1);
        engine.register_native(string_proto, "indexOf", builtin_string_index_of, 1);
        engine.register_native(string_proto, "slice", builtin_string_slice, 2);
        engine.register_native(string_proto, "substring", builtin_string_substring, 2);
        engine.register_native(string_proto, "toUpperCase", builtin_string_to_upper_case, 0);
        engine.register_native(string_proto, "toLowerCase", builtin_string_to_lower_case, 0);
        engine.register_native(string_proto, "split", builtin_string_split, 2);
        engine.register_native(string_proto, "trim", builtin_string_trim, 0);
        engine.register_native(string_proto, "toString", builtin_string_value_of, 0);
        engine.register_native(string_proto, "valueOf", builtin_string_value_of, 0);
    }

    // Number, Boolean
    {
        FunctionPtr number = constructor("Number", builtin_number, 1, number_proto);
        define_property(number, "NaN", std::numeric_limits<double>::quiet_NaN(), false, false, false);
        define_property(number, "MAX_SAFE_INTEGER", 9007199254740991.0, false, false, false);
        engine.register_native(number_proto, "toString", builtin_number_to_string, 1);
        engine.register_native(number_proto, "valueOf", builtin_number_value_of, 0);

        constructor("Boolean", builtin_boolean, 1, boolean_proto);
        engine.register_native(boolean_proto, "toString", builtin_boolean_to_string, 0);
        engine.register_native(boolean_proto, "valueOf", builtin_boolean_value_of, 0);
    }

    // Error family: callable with or without `new`
    engine.register_native(error_proto, "toString", builtin_error_to_string, 0);
    for (const char* kind : {"Error", "TypeError", "ReferenceError", "RangeError", "SyntaxError"}) {
        std::string name = kind;
        constructor(name, [name](NativeCall& call) -> Value {
            std::string message = is_undefined(call.arg(0)) ? std::string() : to_display_string(call.arg(0));
            return call.engine().create_error(name, message);
        }, 1, engine.primordial(name + ".prototype"));
    }

    // Math
    {
        ObjectPtr math = engine.create_object();
        engine.register_native(math, "floor", builtin_math_floor, 1);
        engine.register_native(math, "ceil", builtin_math_ceil, 1);
        engine.register_native(math, "round", builtin_math_round, 1);
        engine.register_native(math, "abs", builtin_math_abs, 1);
        engine.register_native(math, "max", builtin_math_max, 2);
        engine.register_native(math, "min", builtin_math_min, 2);
        engine.register_native(math, "pow", builtin_math_pow, 2);
        engine.register_native(math, "sqrt", builtin_math_sqrt, 1);
        engine.register_native(math, "random", builtin_math_random, 0);
        define_property(math, "PI", 3.141592653589793, false, false, false);
        define_property(math, "E", 2.718281828459045, false, false, false);
        engine.set_primordial("Math", math);
        bindings.emplace_back("Math", math);
    }

    bindings.emplace_back("isNaN", engine.create_native_function("isNaN", builtin_is_nan, 1));
    bindings.emplace_back("parseInt", engine.create_native_function("parseInt", builtin_parse_int, 2));
    bindings.emplace_back("parseFloat", engine.create_native_function("parseFloat", builtin_parse_float, 1));

    if (!install_bindings) return;

    for (auto& b : bindings) {
        define_property(global, b.first, b.second, true, false, true);
    }
    define_property(global, "NaN", std::numeric_limits<double>::quiet_NaN(), false, false, false);
    define_property(global, "Infinity", std::numeric_limits<double>::infinity(), false, false, false);
    define_property(global, "undefined", Value{}, false, false, false);
    engine.log(LogLevel::Debug, "installed " + std::to_string(bindings.size()) + " standard globals");
}
