#pragma once

#include <cstddef>
#include <string>

#include "value.hpp"

// Guest coercion rules. None of these call back into guest code: objects are
// converted with the built-in behaviour of their class.
//
// Conversions that would build a string longer than kMaxStringLength, or nest
// arrays deeper than kMaxConversionDepth, throw std::length_error. The
// evaluator reports it to the guest as a RangeError.

constexpr size_t kMaxStringLength = (size_t(1) << 29) - 24;
constexpr size_t kMaxConversionDepth = 1000;

bool to_boolean(const Value& v);
double to_number(const Value& v);
double string_to_number(const std::string& s);
std::string number_to_string(double d);
std::string to_display_string(const Value& v);
// Array.prototype.join: holes and nullish elements print as empty.
std::string join_array(const ObjectPtr& arr, const std::string& separator);
std::string to_property_key(const Value& v);
double to_integer(const Value& v);

// "undefined", "object", "boolean", "number", "string", "function"
std::string type_of(const Value& v);

bool strict_equals(const Value& a, const Value& b);
bool loose_equals(const Value& a, const Value& b);

// Primitive view of a value for `+` and relational comparison.
Value to_primitive(const Value& v);
