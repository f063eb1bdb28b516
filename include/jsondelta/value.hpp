#pragma once

/// @file value.hpp
/// @brief JsonValue: tagged union over the JSON data model.
///
/// Implementation:
///   - Scalars (null, bool, int64_t, uint64_t, double) stored inline
///   - Strings, arrays and objects owned through a heap pointer
///   - Manual resource management (copy/move/destroy)
///   - Objects keep insertion order; equality ignores key order
///   - Copy construction is a deep clone

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace jsondelta {

class JsonValue {
public:
    JsonValue() noexcept : kind_(Type::Null) { u_.i = 0; }
    JsonValue(std::nullptr_t) noexcept : kind_(Type::Null) { u_.i = 0; }
    JsonValue(bool v) noexcept : kind_(Type::Bool) { u_.i = 0; u_.b = v; }
    JsonValue(int v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    JsonValue(int64_t v) noexcept : kind_(Type::Integer) { u_.i = v; }
    JsonValue(unsigned v) noexcept : kind_(Type::Integer) { u_.i = static_cast<int64_t>(v); }
    JsonValue(uint64_t v) noexcept : kind_(Type::Integer) {
        if (v <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            u_.i = static_cast<int64_t>(v);
        } else {
            kind_ = Type::UInteger;
            u_.u = v;
        }
    }
    JsonValue(double v) noexcept : kind_(Type::Float) { u_.d = v; }
    JsonValue(const char* v) : kind_(Type::Null) {
        u_.i = 0;
        if (JSONDELTA_UNLIKELY(!v)) return;
        u_.str = new std::string(v);
        kind_ = Type::String;
    }
    JsonValue(std::string_view v) : kind_(Type::String) { u_.str = new std::string(v); }
    JsonValue(const std::string& v) : kind_(Type::String) { u_.str = new std::string(v); }
    JsonValue(std::string&& v) : kind_(Type::String) { u_.str = new std::string(std::move(v)); }

    JsonValue(const Array& v) : kind_(Type::Array) { u_.arr = new Array(v); }
    JsonValue(Array&& v) : kind_(Type::Array) { u_.arr = new Array(std::move(v)); }
    JsonValue(const Object& v) : kind_(Type::Object) { u_.obj = new Object(v); }
    JsonValue(Object&& v) : kind_(Type::Object) { u_.obj = new Object(std::move(v)); }

    JsonValue(const JsonValue& o) : kind_(o.kind_) { copy_payload(o); }
    JsonValue(JsonValue&& o) noexcept : kind_(o.kind_), u_(o.u_) {
        o.kind_ = Type::Null;
    }
    JsonValue& operator=(const JsonValue& o) {
        if (this != &o) { JsonValue tmp(o); swap(tmp); }
        return *this;
    }
    JsonValue& operator=(JsonValue&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            u_ = o.u_;
            o.kind_ = Type::Null;
        }
        return *this;
    }
    ~JsonValue() { destroy(); }

    void swap(JsonValue& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(u_, o.u_);
    }

    [[nodiscard]] static JsonValue array() { return JsonValue(Array{}); }
    [[nodiscard]] static JsonValue object() { return JsonValue(Object{}); }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()     const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()     const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_integer()  const noexcept { return kind_ == Type::Integer; }
    [[nodiscard]] bool is_uinteger() const noexcept { return kind_ == Type::UInteger; }
    [[nodiscard]] bool is_float()    const noexcept { return kind_ == Type::Float; }
    [[nodiscard]] bool is_number()   const noexcept { return is_integer() || is_uinteger() || is_float(); }
    [[nodiscard]] bool is_string()   const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()    const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object()   const noexcept { return kind_ == Type::Object; }
    [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

    bool as_bool() const {
        if (JSONDELTA_UNLIKELY(!is_bool()))
            throw TypeError("expected bool, got " + std::string(type_name(type())));
        return u_.b;
    }
    int64_t as_integer() const {
        if (is_integer()) return u_.i;
        throw TypeError("expected integer, got " + std::string(type_name(type())));
    }
    uint64_t as_uinteger() const {
        if (is_uinteger()) return u_.u;
        if (is_integer() && u_.i >= 0) return static_cast<uint64_t>(u_.i);
        throw TypeError("expected uinteger, got " + std::string(type_name(type())));
    }
    double as_float() const {
        if (is_float()) return u_.d;
        if (is_integer()) return static_cast<double>(u_.i);
        if (is_uinteger()) return static_cast<double>(u_.u);
        throw TypeError("expected number, got " + std::string(type_name(type())));
    }

    [[nodiscard]] std::string_view as_string_view() const {
        if (JSONDELTA_UNLIKELY(!is_string()))
            throw TypeError("expected string, got " + std::string(type_name(type())));
        return *u_.str;
    }
    [[nodiscard]] const std::string& as_string() const {
        if (JSONDELTA_UNLIKELY(!is_string()))
            throw TypeError("expected string, got " + std::string(type_name(type())));
        return *u_.str;
    }

    [[nodiscard]] const Array& as_array() const {
        if (JSONDELTA_UNLIKELY(!is_array()))
            throw TypeError("expected array, got " + std::string(type_name(type())));
        return *u_.arr;
    }
    Array& as_array() {
        if (JSONDELTA_UNLIKELY(!is_array()))
            throw TypeError("expected array, got " + std::string(type_name(type())));
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (JSONDELTA_UNLIKELY(!is_object()))
            throw TypeError("expected object, got " + std::string(type_name(type())));
        return *u_.obj;
    }
    Object& as_object() {
        if (JSONDELTA_UNLIKELY(!is_object()))
            throw TypeError("expected object, got " + std::string(type_name(type())));
        return *u_.obj;
    }

    JsonValue& operator[](size_t index) {
        auto& a = as_array();
        if (JSONDELTA_UNLIKELY(index >= a.size()))
            throw OutOfRangeError("array index " + std::to_string(index) +
                                  " out of range (size=" + std::to_string(a.size()) + ")");
        return a[index];
    }
    const JsonValue& operator[](size_t index) const {
        const auto& a = as_array();
        if (JSONDELTA_UNLIKELY(index >= a.size()))
            throw OutOfRangeError("array index " + std::to_string(index) +
                                  " out of range (size=" + std::to_string(a.size()) + ")");
        return a[index];
    }
    JsonValue& operator[](int index) { return operator[](static_cast<size_t>(index)); }
    const JsonValue& operator[](int index) const { return operator[](static_cast<size_t>(index)); }

    JsonValue& operator[](std::string_view key) { return as_object()[key]; }
    const JsonValue& operator[](std::string_view key) const { return as_object().at(key); }
    JsonValue& operator[](const char* key) { return operator[](std::string_view(key)); }
    const JsonValue& operator[](const char* key) const { return operator[](std::string_view(key)); }
    JsonValue& operator[](const std::string& key) { return operator[](std::string_view(key)); }
    const JsonValue& operator[](const std::string& key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }
    [[nodiscard]] const JsonValue* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }
    [[nodiscard]] JsonValue* find(std::string_view key) {
        return is_object() ? u_.obj->find(key) : nullptr;
    }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return u_.arr->size();
        if (is_object()) return u_.obj->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept {
        if (is_null()) return true;
        if (is_array())  return u_.arr->empty();
        if (is_object()) return u_.obj->empty();
        return false;
    }

    void push_back(const JsonValue& v) { as_array().push_back(v); }
    void push_back(JsonValue&& v)      { as_array().push_back(std::move(v)); }

    void insert(std::string key, JsonValue v) {
        as_object().insert(std::move(key), std::move(v));
    }
    bool erase(std::string_view key) { return as_object().erase(key); }

    /// @brief Structural equality. Integers compare exactly, mixed
    /// integer/float pairs compare as double, object key order is ignored.
    [[nodiscard]] bool operator==(const JsonValue& other) const {
        if (kind_ != other.kind_) {
            if (is_number() && other.is_number()) {
                if (is_float() || other.is_float())
                    return as_float() == other.as_float();
                // Integer vs UInteger: UInteger always exceeds INT64_MAX.
                return false;
            }
            return false;
        }
        switch (kind_) {
            case Type::Null:     return true;
            case Type::Bool:     return u_.b == other.u_.b;
            case Type::Integer:  return u_.i == other.u_.i;
            case Type::UInteger: return u_.u == other.u_.u;
            case Type::Float:    return u_.d == other.u_.d;
            case Type::String:   return *u_.str == *other.u_.str;
            case Type::Array:    return *u_.arr == *other.u_.arr;
            case Type::Object:   return *u_.obj == *other.u_.obj;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const JsonValue& other) const { return !(*this == other); }

    /// Defined in serializer.hpp.
    [[nodiscard]] std::string dump(int indent = -1) const;
    [[nodiscard]] std::string dump(const SerializeOptions& opts) const;

private:
    Type kind_;
    union Payload {
        bool b; int64_t i; uint64_t u; double d;
        std::string* str;
        Array* arr;
        Object* obj;
    } u_;

    void copy_payload(const JsonValue& o) {
        switch (o.kind_) {
            case Type::String: u_.str = new std::string(*o.u_.str); break;
            case Type::Array:  u_.arr = new Array(*o.u_.arr); break;
            case Type::Object: u_.obj = new Object(*o.u_.obj); break;
            default:           u_ = o.u_; break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::String: delete u_.str; break;
            case Type::Array:  delete u_.arr; break;
            case Type::Object: delete u_.obj; break;
            default: break;
        }
        kind_ = Type::Null;
    }
};

// ─── Object special member functions ─────────────────────────────────────

inline Object::~Object() = default;
inline Object::Object(const Object& o) : entries(o.entries) {
    if (use_index()) rebuild_index();
}
inline Object::Object(Object&& o) noexcept
    : entries(std::move(o.entries)), index_(std::move(o.index_)) {}
inline Object& Object::operator=(const Object& o) {
    if (this != &o) { entries = o.entries; reindex(); }
    return *this;
}
inline Object& Object::operator=(Object&& o) noexcept {
    if (this != &o) { entries = std::move(o.entries); index_ = std::move(o.index_); }
    return *this;
}
inline Object::Object(std::initializer_list<std::pair<std::string, JsonValue>> init)
    : entries(init.begin(), init.end()) {
    if (use_index()) rebuild_index();
}

inline void Object::rebuild_index() {
    if (!index_) index_ = std::make_unique<index_type>(entries.size() * 2);
    else         index_->clear();
    for (size_type i = 0; i < entries.size(); ++i)
        index_->emplace(std::string_view(entries[i].first), i);
}
inline void Object::reindex() {
    if (use_index()) rebuild_index();
    else             index_.reset();
}
inline JsonValue* Object::find(std::string_view key) noexcept {
    return const_cast<JsonValue*>(static_cast<const Object*>(this)->find(key));
}
inline const JsonValue* Object::find(std::string_view key) const noexcept {
    if (index_) {
        auto it = index_->find(key);
        return it != index_->end() ? &entries[it->second].second : nullptr;
    }
    for (const auto& [k, v] : entries) if (k == key) return &v;
    return nullptr;
}
inline bool Object::contains(std::string_view key) const noexcept { return find(key) != nullptr; }
inline void Object::append(std::string key, JsonValue value) {
    const auto* old_data = entries.data();
    entries.emplace_back(std::move(key), std::move(value));
    if (!index_) {
        if (use_index()) rebuild_index();
        return;
    }
    if (entries.data() != old_data) {
        // Reallocation: every string_view in the index is dangling.
        rebuild_index();
    } else {
        index_->emplace(std::string_view(entries.back().first), entries.size() - 1);
    }
}
inline JsonValue& Object::operator[](std::string_view key) {
    if (auto* p = find(key)) return *p;
    append(std::string(key), JsonValue{});
    return entries.back().second;
}
inline const JsonValue& Object::at(std::string_view key) const {
    const auto* p = find(key);
    if (JSONDELTA_UNLIKELY(!p))
        throw OutOfRangeError("key not found: \"" + std::string(key) + "\"", errc::key_not_found);
    return *p;
}
inline void Object::insert(std::string key, JsonValue value) {
    if (auto* p = find(key)) { *p = std::move(value); return; }
    append(std::move(key), std::move(value));
}
inline bool Object::erase(std::string_view key) {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->first == key) {
            entries.erase(it);
            reindex();
            return true;
        }
    }
    return false;
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    for (const auto& [key, val] : entries) {
        const auto* p = other.find(key);
        if (!p || *p != val) return false;
    }
    return true;
}

} // namespace jsondelta
