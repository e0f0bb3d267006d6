#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "value.hpp"

// Canonical array index ("0", "1", ... no leading zeros, below 2^32 - 1).
bool parse_array_index(const std::string& key, uint32_t* out = nullptr);
std::string index_key(size_t index);

std::optional<Value> get_own_property(const ObjectPtr& obj, const std::string& key);

// Own properties first, then the prototype chain. nullopt means "not found",
// which is different from a stored undefined.
std::optional<Value> get_property(const ObjectPtr& obj, const std::string& key);

bool has_own_property(const ObjectPtr& obj, const std::string& key);
bool has_property(const ObjectPtr& obj, const std::string& key);

// Writes an own property (never through to a prototype). Returns false when the
// existing own property is read-only. Maintains array length.
bool set_property(const ObjectPtr& obj, const std::string& key, const Value& value);

// Installs a property with explicit flags, replacing any own property of that name.
void define_property(const ObjectPtr& obj, const std::string& key, const Value& value,
    bool writable, bool enumerable, bool configurable);

// Removes an own property if configurable. Missing properties count as deleted.
bool delete_property(const ObjectPtr& obj, const std::string& key);

// Rejects (returns false) when `proto` would make the chain cyclic.
bool set_prototype(const ObjectPtr& obj, const ObjectPtr& proto);

// Own keys in enumeration order; array indexes come first in ascending order.
std::vector<std::string> own_keys(const ObjectPtr& obj, bool enumerable_only);

// for-in order: own enumerable keys, then inherited ones, each key once.
std::vector<std::string> enumerate_keys(const ObjectPtr& obj);

// arrays
uint32_t array_length(const ObjectPtr& arr);
void array_push(const ObjectPtr& arr, const Value& value);

struct ArrayEntry {
    uint32_t index;
    Value value;
};

// Own index properties in ascending order. Holes are simply absent, so the
// cost follows the number of stored elements rather than `length`.
std::vector<ArrayEntry> array_entries(const ObjectPtr& arr);

// Removes every index, stores `entries` below `length`, then sets `length`.
void replace_array_entries(const ObjectPtr& arr, const std::vector<ArrayEntry>& entries, uint32_t length);

// Dense copy with holes as undefined. Allocates `length` slots.
std::vector<Value> array_elements(const ObjectPtr& arr);
