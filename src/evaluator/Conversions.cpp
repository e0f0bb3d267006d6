// src/evaluator/Conversions.cpp
#include "conversions.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <unordered_set>

#include "object_model.hpp"

bool to_boolean(const Value& v) {
    if (std::holds_alternative<std::monostate>(v) || std::holds_alternative<NullValue>(v)) return false;
    if (auto b = std::get_if<bool>(&v)) return *b;
    if (auto n = std::get_if<double>(&v)) return !std::isnan(*n) && *n != 0.0;
    if (auto s = std::get_if<std::string>(&v)) return !s->empty();
    return true;
}

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

double string_to_number(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && is_space(s[b])) ++b;
    while (e > b && is_space(s[e - 1])) --e;
    std::string t = s.substr(b, e - b);
    if (t.empty()) return 0.0;

    if (t == "Infinity" || t == "+Infinity") return std::numeric_limits<double>::infinity();
    if (t == "-Infinity") return -std::numeric_limits<double>::infinity();

    if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X')) {
        double value = 0;
        for (size_t i = 2; i < t.size(); ++i) {
            char c = t[i];
            int d;
            if (c >= '0' && c <= '9')
                d = c - '0';
            else if (c >= 'a' && c <= 'f')
                d = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F')
                d = c - 'A' + 10;
            else
                return std::nan("");
            value = value * 16 + d;
        }
        return value;
    }

    // strtod also accepts "inf", "nan" and hex floats; the guest grammar does not
    for (char c : t) {
        bool ok = (c >= '0' && c <= '9') || c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-';
        if (!ok) return std::nan("");
    }
    char* end = nullptr;
    double d = std::strtod(t.c_str(), &end);
    if (end != t.c_str() + t.size()) return std::nan("");
    return d;
}

// Shortest digits that round-trip, laid out the way guest code expects:
// 120, 0.1, 1.5e-7, 1e+21.
std::string number_to_string(double d) {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (d == 0) return "0";
    if (d < 0) return "-" + number_to_string(-d);

    char buf[40];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, d);
        if (std::strtod(buf, nullptr) == d) break;
    }

    // buf is "D.DDDDe+XX" or "De+XX"
    std::string text(buf);
    size_t epos = text.find('e');
    std::string digits;
    for (size_t i = 0; i < epos; ++i) {
        if (text[i] != '.') digits.push_back(text[i]);
    }
    while (digits.size() > 1 && digits.back() == '0') digits.pop_back();
    int exponent = std::atoi(text.c_str() + epos + 1);

    int k = static_cast<int>(digits.size());
    int n = exponent + 1;

    if (k <= n && n <= 21) {
        return digits + std::string(static_cast<size_t>(n - k), '0');
    }
    if (0 < n && n <= 21) {
        return digits.substr(0, static_cast<size_t>(n)) + "." + digits.substr(static_cast<size_t>(n));
    }
    if (-6 < n && n <= 0) {
        return "0." + std::string(static_cast<size_t>(-n), '0') + digits;
    }

    std::string out;
    out.push_back(digits[0]);
    if (k > 1) {
        out.push_back('.');
        out += digits.substr(1);
    }
    int e = n - 1;
    out += e >= 0 ? "e+" : "e-";
    out += std::to_string(e >= 0 ? e : -e);
    return out;
}

static std::string object_to_string(const ObjectPtr& obj, std::unordered_set<const ObjectValue*>& active);

static std::string display(const Value& v, std::unordered_set<const ObjectValue*>& active) {
    if (std::holds_alternative<std::monostate>(v)) return "undefined";
    if (std::holds_alternative<NullValue>(v)) return "null";
    if (auto b = std::get_if<bool>(&v)) return *b ? "true" : "false";
    if (auto n = std::get_if<double>(&v)) return number_to_string(*n);
    if (auto s = std::get_if<std::string>(&v)) return *s;
    return object_to_string(std::get<ObjectPtr>(v), active);
}

static void append_repeated(std::string& out, const std::string& piece, size_t count) {
    if (piece.empty() || count == 0) return;
    if (piece.size() == 1) {
        out.append(count, piece[0]);
        return;
    }
    std::string block = piece;
    while (count > 0) {
        if (count & 1) out += block;
        count >>= 1;
        if (count) {
            std::string doubled = block + block;
            block.swap(doubled);
        }
    }
}

// Walks the stored elements only; gaps between them become bare separators.
static std::string join_entries(const ObjectPtr& arr, const std::string& sep, std::unordered_set<const ObjectValue*>& active) {
    // a cyclic array prints as empty where it recurs
    if (!active.insert(arr.get()).second) return "";
    if (active.size() > kMaxConversionDepth) throw std::length_error("Maximum call stack size exceeded");
    size_t len = array_length(arr);
    if (len > 1 && sep.size() > kMaxStringLength / (len - 1)) throw std::length_error("Invalid string length");

    std::string out;
    size_t separators = 0;
    for (const auto& e : array_entries(arr)) {
        if (e.index >= len) break;
        append_repeated(out, sep, e.index - separators);
        separators = e.index;
        if (!is_nullish(e.value)) out += display(e.value, active);
        if (out.size() > kMaxStringLength) throw std::length_error("Invalid string length");
    }
    if (len > 0) append_repeated(out, sep, len - 1 - separators);
    active.erase(arr.get());
    return out;
}

static std::string object_to_string(const ObjectPtr& obj, std::unordered_set<const ObjectValue*>& active) {
    if (!obj) return "null";
    switch (obj->cls) {
        case ObjectClass::Boxed:
            return display(obj->primitive, active);
        case ObjectClass::Array:
            return join_entries(obj, ",", active);
        case ObjectClass::Function: {
            auto fn = std::static_pointer_cast<FunctionValue>(obj);
            if (fn->is_native || !fn->node) return "function " + fn->name + "() { [native code] }";
            return "function " + fn->name + "() { [code] }";
        }
        case ObjectClass::Error: {
            auto name = get_property(obj, "name");
            auto message = get_property(obj, "message");
            std::string n = name ? display(*name, active) : "Error";
            std::string m = message ? display(*message, active) : "";
            if (m.empty()) return n;
            if (n.empty()) return m;
            return n + ": " + m;
        }
        case ObjectClass::Arguments:
            return "[object Arguments]";
        case ObjectClass::Plain:
            break;
    }
    return "[object Object]";
}

std::string to_display_string(const Value& v) {
    std::unordered_set<const ObjectValue*> active;
    return display(v, active);
}

std::string join_array(const ObjectPtr& arr, const std::string& separator) {
    std::unordered_set<const ObjectValue*> active;
    return join_entries(arr, separator, active);
}

Value to_primitive(const Value& v) {
    auto obj = as_object(v);
    if (!obj) return v;
    if (obj->cls == ObjectClass::Boxed) return obj->primitive;
    return to_display_string(v);
}

double to_number(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return std::nan("");
    if (std::holds_alternative<NullValue>(v)) return 0.0;
    if (auto b = std::get_if<bool>(&v)) return *b ? 1.0 : 0.0;
    if (auto n = std::get_if<double>(&v)) return *n;
    if (auto s = std::get_if<std::string>(&v)) return string_to_number(*s);
    return to_number(to_primitive(v));
}

double to_integer(const Value& v) {
    double n = to_number(v);
    if (std::isnan(n)) return 0;
    if (std::isinf(n)) return n;
    return std::trunc(n);
}

std::string to_property_key(const Value& v) {
    if (auto s = std::get_if<std::string>(&v)) return *s;
    return to_display_string(v);
}

std::string type_of(const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return "undefined";
    if (std::holds_alternative<NullValue>(v)) return "object";
    if (std::holds_alternative<bool>(v)) return "boolean";
    if (std::holds_alternative<double>(v)) return "number";
    if (std::holds_alternative<std::string>(v)) return "string";
    auto obj = std::get<ObjectPtr>(v);
    return obj && obj->cls == ObjectClass::Function ? "function" : "object";
}

bool strict_equals(const Value& a, const Value& b) {
    if (a.index() != b.index()) return false;
    if (auto x = std::get_if<double>(&a)) return *x == std::get<double>(b);  // NaN != NaN
    if (auto x = std::get_if<std::string>(&a)) return *x == std::get<std::string>(b);
    if (auto x = std::get_if<bool>(&a)) return *x == std::get<bool>(b);
    if (auto x = std::get_if<ObjectPtr>(&a)) return *x == std::get<ObjectPtr>(b);
    return true;  // undefined / null
}

bool loose_equals(const Value& a, const Value& b) {
    if (a.index() == b.index()) return strict_equals(a, b);
    if (is_nullish(a) && is_nullish(b)) return true;
    if (is_nullish(a) || is_nullish(b)) return false;

    if (std::holds_alternative<bool>(a)) return loose_equals(to_number(a), b);
    if (std::holds_alternative<bool>(b)) return loose_equals(a, to_number(b));

    bool a_obj = is_object(a);
    bool b_obj = is_object(b);
    if (a_obj && !b_obj) return loose_equals(to_primitive(a), b);
    if (b_obj && !a_obj) return loose_equals(a, to_primitive(b));

    // number vs string
    return to_number(a) == to_number(b);
}
