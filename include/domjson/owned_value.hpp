#pragma once

/// @file owned_value.hpp
/// @brief OwnedValue: the allocating representation, a 24-byte tagged union.
///
/// Implementation:
///   - Compact 24-byte tagged union
///   - Small String Optimization (SSO) for strings up to 15 characters
///   - Manual resource management (copy/move/destroy)
///   - Independent of any input buffer
///
/// Unsigned integers are stored in the I64 slot by bit reinterpretation:
/// OwnedValue(uint64_t{1} << 63) holds INT64_MIN, and UINT64_MAX holds -1.
/// The magnitude is not preserved for values >= 2^63.

#include "config.hpp"
#include "cow_string.hpp"
#include "fwd.hpp"
#include "number.hpp"
#include "object.hpp"
#include "value_trait.hpp"

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace domjson {

class OwnedValue : public ValueAccess<OwnedValue> {
public:
    using Key    = std::string;
    using Array  = std::vector<OwnedValue>;
    using Object = BasicObject<std::string, OwnedValue>;

    OwnedValue() noexcept : kind_(ValueType::Null), sso_len_(0) { u_.i = 0; }
    OwnedValue(std::nullptr_t) noexcept : OwnedValue() {}
    OwnedValue(bool v) noexcept : kind_(ValueType::Bool), sso_len_(0) { u_.i = 0; u_.b = v; }

    /// Every integer width widens into the I64 slot; see the file comment
    /// for unsigned 64-bit values.
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                               !std::is_same_v<T, char>, int> = 0>
    OwnedValue(T v) noexcept : kind_(ValueType::I64), sso_len_(0) {
        u_.i = static_cast<int64_t>(v);
    }
    OwnedValue(float v) noexcept : kind_(ValueType::F64), sso_len_(0) { u_.d = static_cast<double>(v); }
    OwnedValue(double v) noexcept : kind_(ValueType::F64), sso_len_(0) { u_.d = v; }
    OwnedValue(Number n) noexcept : sso_len_(0) {
        if (n.is_i64()) { kind_ = ValueType::I64; u_.i = n.i64(); }
        else            { kind_ = ValueType::F64; u_.d = n.f64(); }
    }

    OwnedValue(const char* v) : kind_(ValueType::String) {
        init_string(v, v ? std::strlen(v) : 0);
    }
    OwnedValue(std::string_view v) : kind_(ValueType::String) { init_string(v.data(), v.size()); }
    OwnedValue(const std::string& v) : kind_(ValueType::String) { init_string(v.data(), v.size()); }
    OwnedValue(std::string&& v) : kind_(ValueType::String) { init_string_move(std::move(v)); }
    OwnedValue(CowString&& v) : kind_(ValueType::String) {
        if (v.is_owned()) init_string_move(std::move(v).into_string());
        else              init_string(v.data(), v.size());
    }

    OwnedValue(const Array& v) : kind_(ValueType::Array), sso_len_(0) { u_.arr = new Array(v); }
    OwnedValue(Array&& v) : kind_(ValueType::Array), sso_len_(0) { u_.arr = new Array(std::move(v)); }
    OwnedValue(const Object& v) : kind_(ValueType::Object), sso_len_(0) { u_.obj = new Object(v); }
    OwnedValue(Object&& v) : kind_(ValueType::Object), sso_len_(0) { u_.obj = new Object(std::move(v)); }

    OwnedValue(const OwnedValue& o) : kind_(o.kind_), sso_len_(o.sso_len_) {
        copy_payload(o);
    }
    OwnedValue(OwnedValue&& o) noexcept : kind_(o.kind_), sso_len_(o.sso_len_) {
        std::memcpy(pad_, o.pad_, sizeof(pad_));
        std::memcpy(&u_, &o.u_, sizeof(u_));
        o.kind_ = ValueType::Null;  // destroy() is a no-op for Null
    }
    OwnedValue& operator=(const OwnedValue& o) {
        if (this != &o) { OwnedValue tmp(o); swap(tmp); }
        return *this;
    }
    /// @p o may live inside this value (e.g. `v = std::move(*v.get_idx_mut(0))`).
    OwnedValue& operator=(OwnedValue&& o) noexcept {
        if (this != &o) { OwnedValue tmp(std::move(o)); swap(tmp); }
        return *this;
    }
    ~OwnedValue() { destroy(); }

    void swap(OwnedValue& o) noexcept {
        constexpr auto S = sizeof(OwnedValue);
        alignas(alignof(OwnedValue)) char tmp[S];
        auto* a = reinterpret_cast<char*>(this);
        auto* b = reinterpret_cast<char*>(&o);
        std::memcpy(tmp, a, S);
        std::memcpy(a, b, S);
        std::memcpy(b, tmp, S);
    }

    [[nodiscard]] static OwnedValue null() noexcept { return OwnedValue(); }
    [[nodiscard]] static OwnedValue array() { return OwnedValue(Array()); }
    [[nodiscard]] static OwnedValue object() { return OwnedValue(Object()); }

    // ─── Canonical accessors ─────────────────────────────────────────────

    [[nodiscard]] ValueType value_type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null() const noexcept { return kind_ == ValueType::Null; }

    [[nodiscard]] std::optional<bool> as_bool() const noexcept {
        if (kind_ == ValueType::Bool) return u_.b;
        return std::nullopt;
    }
    [[nodiscard]] std::optional<int64_t> as_i64() const noexcept {
        if (kind_ == ValueType::I64) return u_.i;
        return std::nullopt;
    }
    /// Non-negative I64 only. A value built from a u64 >= 2^63 is negative
    /// and therefore yields nothing here.
    [[nodiscard]] std::optional<uint64_t> as_u64() const noexcept {
        if (kind_ == ValueType::I64 && u_.i >= 0) return static_cast<uint64_t>(u_.i);
        return std::nullopt;
    }
    /// F64 only; integers are refused. See cast_f64().
    [[nodiscard]] std::optional<double> as_f64() const noexcept {
        if (kind_ == ValueType::F64) return u_.d;
        return std::nullopt;
    }
    /// F64, or I64 converted to double (lossy above 2^53).
    [[nodiscard]] std::optional<double> cast_f64() const noexcept {
        if (kind_ == ValueType::F64) return u_.d;
        if (kind_ == ValueType::I64) return static_cast<double>(u_.i);
        return std::nullopt;
    }
    [[nodiscard]] std::optional<std::string_view> as_str() const noexcept {
        if (kind_ == ValueType::String) return str_view();
        return std::nullopt;
    }
    [[nodiscard]] const Array* as_array() const noexcept {
        return kind_ == ValueType::Array ? u_.arr : nullptr;
    }
    [[nodiscard]] Array* as_array_mut() noexcept {
        return kind_ == ValueType::Array ? u_.arr : nullptr;
    }
    [[nodiscard]] const Object* as_object() const noexcept {
        return kind_ == ValueType::Object ? u_.obj : nullptr;
    }
    [[nodiscard]] Object* as_object_mut() noexcept {
        return kind_ == ValueType::Object ? u_.obj : nullptr;
    }

    /// Element or member count; 0 for scalars.
    [[nodiscard]] size_t size() const noexcept {
        if (kind_ == ValueType::Array)  return u_.arr->size();
        if (kind_ == ValueType::Object) return u_.obj->size();
        return 0;
    }

private:
    ValueType kind_;
    uint8_t sso_len_;
    uint8_t pad_[6] = {};
    union Payload {
        bool b; int64_t i; double d;
        char sso_buf[16];
        std::string* str_ptr;
        Array* arr;
        Object* obj;
    } u_;

    static constexpr size_t kSsoMax = 15;
    static constexpr uint8_t kHeapTag = 0xFF;

    bool is_sso() const noexcept { return sso_len_ != kHeapTag; }

    std::string_view str_view() const noexcept {
        if (is_sso()) return {u_.sso_buf, sso_len_};
        return {u_.str_ptr->data(), u_.str_ptr->size()};
    }

    void init_string(const char* s, size_t len) {
        if (len <= kSsoMax) {
            sso_len_ = static_cast<uint8_t>(len);
            if (len) std::memcpy(u_.sso_buf, s, len);
            u_.sso_buf[len] = '\0';
        } else {
            sso_len_ = kHeapTag;
            u_.str_ptr = new std::string(s, len);
        }
    }

    void init_string_move(std::string&& s) {
        if (s.size() <= kSsoMax) {
            init_string(s.data(), s.size());
        } else {
            sso_len_ = kHeapTag;
            u_.str_ptr = new std::string(std::move(s));
        }
    }

    void copy_payload(const OwnedValue& o) {
        switch (o.kind_) {
            case ValueType::String:
                if (o.is_sso()) std::memcpy(u_.sso_buf, o.u_.sso_buf, sizeof(u_.sso_buf));
                else            u_.str_ptr = new std::string(*o.u_.str_ptr);
                break;
            case ValueType::Array:
                u_.arr = new Array(*o.u_.arr);
                break;
            case ValueType::Object:
                u_.obj = new Object(*o.u_.obj);
                break;
            default:
                std::memcpy(&u_, &o.u_, sizeof(u_));
                break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case ValueType::String: if (!is_sso()) delete u_.str_ptr; break;
            case ValueType::Array:  delete u_.arr; break;
            case ValueType::Object: delete u_.obj; break;
            default: break;
        }
    }
};

static_assert(sizeof(OwnedValue) == 24, "OwnedValue must be exactly 24 bytes");
static_assert(is_value_v<OwnedValue>, "OwnedValue must implement the value interface");

} // namespace domjson
