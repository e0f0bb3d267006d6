// src/evaluator/ObjectModel.cpp
#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "object_model.hpp"

// ----------------- PropertyMap -----------------

PropertyDescriptor* PropertyMap::find(const std::string& key) {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

const PropertyDescriptor* PropertyMap::find(const std::string& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

PropertyDescriptor& PropertyMap::put(const std::string& key, const PropertyDescriptor& desc) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second = desc;
        return it->second;
    }
    order_.push_back(key);
    return entries_.emplace(key, desc).first->second;
}

bool PropertyMap::erase(const std::string& key) {
    if (entries_.erase(key) == 0) return false;
    order_.erase(std::find(order_.begin(), order_.end(), key));
    return true;
}

// ----------------- keys -----------------

bool parse_array_index(const std::string& key, uint32_t* out) {
    if (key.empty() || key.size() > 10) return false;
    if (key.size() > 1 && key[0] == '0') return false;
    uint64_t n = 0;
    for (char c : key) {
        if (c < '0' || c > '9') return false;
        n = n * 10 + static_cast<uint64_t>(c - '0');
    }
    if (n >= 4294967295ULL) return false;
    if (out) *out = static_cast<uint32_t>(n);
    return true;
}

std::string index_key(size_t index) {
    return std::to_string(index);
}

// ----------------- lookup -----------------

std::optional<Value> get_own_property(const ObjectPtr& obj, const std::string& key) {
    if (!obj) return std::nullopt;
    if (const PropertyDescriptor* d = obj->properties.find(key)) return d->value;
    return std::nullopt;
}

std::optional<Value> get_property(const ObjectPtr& obj, const std::string& key) {
    const ObjectValue* cur = obj.get();
    while (cur) {
        if (const PropertyDescriptor* d = cur->properties.find(key)) return d->value;
        cur = cur->prototype.get();
    }
    return std::nullopt;
}

bool has_own_property(const ObjectPtr& obj, const std::string& key) {
    return obj && obj->properties.contains(key);
}

bool has_property(const ObjectPtr& obj, const std::string& key) {
    const ObjectValue* cur = obj.get();
    while (cur) {
        if (cur->properties.contains(key)) return true;
        cur = cur->prototype.get();
    }
    return false;
}

// ----------------- arrays -----------------

uint32_t array_length(const ObjectPtr& arr) {
    if (!arr) return 0;
    const PropertyDescriptor* d = arr->properties.find("length");
    if (!d) return 0;
    if (auto n = std::get_if<double>(&d->value)) return static_cast<uint32_t>(*n);
    return 0;
}

static void store_length(const ObjectPtr& arr, uint32_t len) {
    PropertyDescriptor* d = arr->properties.find("length");
    if (d) {
        d->value = static_cast<double>(len);
        return;
    }
    PropertyDescriptor desc;
    desc.value = static_cast<double>(len);
    desc.writable = true;
    desc.enumerable = false;
    desc.configurable = false;
    arr->properties.put("length", desc);
}

// length = highest remaining index + 1
static void recompute_length(const ObjectPtr& arr) {
    uint32_t len = 0;
    for (const auto& key : arr->properties.keys()) {
        uint32_t idx = 0;
        if (parse_array_index(key, &idx) && idx + 1 > len) len = idx + 1;
    }
    store_length(arr, len);
}

// Drops indexes at or above new_len; the stored length is exactly new_len.
static void truncate_array(const ObjectPtr& arr, uint32_t new_len) {
    std::vector<std::string> doomed;
    for (const auto& key : arr->properties.keys()) {
        uint32_t idx = 0;
        if (parse_array_index(key, &idx) && idx >= new_len) doomed.push_back(key);
    }
    for (const auto& key : doomed) arr->properties.erase(key);
    store_length(arr, new_len);
}

void array_push(const ObjectPtr& arr, const Value& value) {
    set_property(arr, index_key(array_length(arr)), value);
}

std::vector<ArrayEntry> array_entries(const ObjectPtr& arr) {
    std::vector<ArrayEntry> out;
    if (!arr) return out;
    for (const auto& key : arr->properties.keys()) {
        uint32_t idx = 0;
        if (parse_array_index(key, &idx)) out.push_back(ArrayEntry{idx, arr->properties.find(key)->value});
    }
    std::sort(out.begin(), out.end(), [](const ArrayEntry& a, const ArrayEntry& b) { return a.index < b.index; });
    return out;
}

void replace_array_entries(const ObjectPtr& arr, const std::vector<ArrayEntry>& entries, uint32_t length) {
    truncate_array(arr, 0);
    for (const auto& e : entries) {
        if (e.index < length) set_property(arr, index_key(e.index), e.value);
    }
    store_length(arr, length);
}

std::vector<Value> array_elements(const ObjectPtr& arr) {
    std::vector<Value> out(array_length(arr));
    for (auto& e : array_entries(arr)) {
        if (e.index < out.size()) out[e.index] = std::move(e.value);
    }
    return out;
}

// ----------------- mutation -----------------

bool set_property(const ObjectPtr& obj, const std::string& key, const Value& value) {
    if (!obj) return false;

    if (obj->cls == ObjectClass::Array && key == "length") {
        double n = 0;
        if (auto d = std::get_if<double>(&value)) n = *d;
        if (std::isnan(n) || n < 0 || n != std::floor(n)) return false;
        if (n > 4294967295.0) return false;
        truncate_array(obj, static_cast<uint32_t>(n));
        return true;
    }

    PropertyDescriptor* existing = obj->properties.find(key);
    if (existing) {
        if (!existing->writable) return false;
        existing->value = value;
    } else {
        PropertyDescriptor desc;
        desc.value = value;
        obj->properties.put(key, desc);
    }

    uint32_t idx = 0;
    if (obj->cls == ObjectClass::Array && parse_array_index(key, &idx) && idx >= array_length(obj)) {
        store_length(obj, idx + 1);
    }
    return true;
}

void define_property(const ObjectPtr& obj, const std::string& key, const Value& value,
    bool writable, bool enumerable, bool configurable) {
    if (!obj) return;
    PropertyDescriptor desc;
    desc.value = value;
    desc.writable = writable;
    desc.enumerable = enumerable;
    desc.configurable = configurable;
    obj->properties.put(key, desc);

    uint32_t idx = 0;
    if (obj->cls == ObjectClass::Array && parse_array_index(key, &idx) && idx >= array_length(obj)) {
        store_length(obj, idx + 1);
    }
}

bool delete_property(const ObjectPtr& obj, const std::string& key) {
    if (!obj) return true;
    const PropertyDescriptor* d = obj->properties.find(key);
    if (!d) return true;
    if (!d->configurable) return false;
    obj->properties.erase(key);

    uint32_t idx = 0;
    if (obj->cls == ObjectClass::Array && parse_array_index(key, &idx) && idx + 1 == array_length(obj)) {
        recompute_length(obj);
    }
    return true;
}

bool set_prototype(const ObjectPtr& obj, const ObjectPtr& proto) {
    if (!obj) return false;
    for (const ObjectValue* p = proto.get(); p; p = p->prototype.get()) {
        if (p == obj.get()) return false;
    }
    obj->prototype = proto;
    return true;
}

// ----------------- enumeration -----------------

std::vector<std::string> own_keys(const ObjectPtr& obj, bool enumerable_only) {
    std::vector<std::string> out;
    if (!obj) return out;

    std::vector<std::pair<uint32_t, std::string>> indexes;
    for (const auto& key : obj->properties.keys()) {
        const PropertyDescriptor* d = obj->properties.find(key);
        if (enumerable_only && !d->enumerable) continue;
        uint32_t idx = 0;
        if (obj->cls == ObjectClass::Array && parse_array_index(key, &idx)) {
            indexes.emplace_back(idx, key);
        } else {
            out.push_back(key);
        }
    }
    if (indexes.empty()) return out;

    std::sort(indexes.begin(), indexes.end());
    std::vector<std::string> ordered;
    ordered.reserve(indexes.size() + out.size());
    for (auto& entry : indexes) ordered.push_back(std::move(entry.second));
    for (auto& key : out) ordered.push_back(std::move(key));
    return ordered;
}

std::vector<std::string> enumerate_keys(const ObjectPtr& obj) {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const ObjectValue* cur = obj.get(); cur; cur = cur->prototype.get()) {
        // own_keys wants a shared pointer; walk the raw chain with the same rules
        std::vector<std::pair<uint32_t, std::string>> indexes;
        std::vector<std::string> named;
        for (const auto& key : cur->properties.keys()) {
            uint32_t idx = 0;
            if (cur->cls == ObjectClass::Array && parse_array_index(key, &idx))
                indexes.emplace_back(idx, key);
            else
                named.push_back(key);
        }
        std::sort(indexes.begin(), indexes.end());

        auto visit = [&](const std::string& key) {
            // shadowed keys are reported once, even when the own copy is hidden
            if (!seen.insert(key).second) return;
            const PropertyDescriptor* d = cur->properties.find(key);
            if (d && d->enumerable) out.push_back(key);
        };
        for (const auto& entry : indexes) visit(entry.second);
        for (const auto& key : named) visit(key);
    }
    return out;
}
