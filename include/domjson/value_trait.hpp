#pragma once

/// @file value_trait.hpp
/// @brief The value capability interface shared by OwnedValue and
/// BorrowedValue.
///
/// A representation implements the canonical accessor set:
///
///   ValueType value_type() const;  bool is_null() const;
///   optional<bool> as_bool() const;
///   optional<int64_t> as_i64() const;  optional<uint64_t> as_u64() const;
///   optional<double> as_f64() const;   optional<double> cast_f64() const;
///   optional<string_view> as_str() const;
///   const Array* as_array() const;     Array* as_array_mut();
///   const Object* as_object() const;   Object* as_object_mut();
///
/// and inherits from ValueAccess<Self>, which derives everything else:
/// checked narrowing accessors, is_* predicates, key/index lookup,
/// insert/remove/push/pop, and equality against primitives and against any
/// other representation.

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"

#include <cfloat>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace domjson {

// =====================================================================
// Detection trait
// =====================================================================

namespace detail {

template <typename V, typename = void>
struct is_value : std::false_type {};

template <typename V>
struct is_value<V, std::void_t<
    typename V::Key, typename V::Array, typename V::Object,
    decltype(V::null()), decltype(V::array()), decltype(V::object()),
    decltype(std::declval<const V&>().value_type()),
    decltype(std::declval<const V&>().as_i64()),
    decltype(std::declval<const V&>().as_u64()),
    decltype(std::declval<const V&>().cast_f64()),
    decltype(std::declval<const V&>().as_str()),
    decltype(std::declval<const V&>().as_array()),
    decltype(std::declval<V&>().as_object_mut())>> : std::true_type {};

/// Primitive operands accepted by the comparison operators.
template <typename T>
inline constexpr bool is_comparable_primitive_v =
    std::is_same_v<T, std::nullptr_t> || std::is_same_v<T, bool> ||
    std::is_floating_point_v<T> ||
    (std::is_integral_v<T> && !std::is_same_v<T, char> &&
     !std::is_same_v<T, wchar_t> && !std::is_same_v<T, char16_t> &&
     !std::is_same_v<T, char32_t>);

} // namespace detail

/// True when V implements the capability interface.
template <typename V>
inline constexpr bool is_value_v = detail::is_value<V>::value;

// =====================================================================
// Structural comparison across representations
// =====================================================================

/// @brief Deep equality between two values of any representations.
///
/// Same variant and equal payloads; objects compare without regard to
/// key order. I64 and F64 never compare equal to each other.
template <typename A, typename B>
bool values_equal(const A& a, const B& b) {
    static_assert(is_value_v<A> && is_value_v<B>, "values_equal requires value types");
    const ValueType t = a.value_type();
    if (t != b.value_type()) return false;
    switch (t) {
        case ValueType::Null:   return true;
        case ValueType::Bool:   return *a.as_bool() == *b.as_bool();
        case ValueType::I64:    return *a.as_i64() == *b.as_i64();
        case ValueType::F64:    return *a.as_f64() == *b.as_f64();
        case ValueType::String: return *a.as_str() == *b.as_str();
        case ValueType::Array: {
            const auto& x = *a.as_array();
            const auto& y = *b.as_array();
            if (x.size() != y.size()) return false;
            for (size_t i = 0; i < x.size(); ++i) {
                if (!values_equal(x[i], y[i])) return false;
            }
            return true;
        }
        case ValueType::Object: {
            const auto& x = *a.as_object();
            const auto& y = *b.as_object();
            if (x.size() != y.size()) return false;
            for (const auto& entry : x) {
                const auto* other = y.find(std::string_view(entry.first));
                if (!other || !values_equal(entry.second, *other)) return false;
            }
            return true;
        }
    }
    return false;
}

// =====================================================================
// ValueAccess: derived operations
// =====================================================================

template <typename Derived>
class ValueAccess {
public:
    // ─── Narrowing accessors ─────────────────────────────────────────────

    /// Checked conversion to any integer width; empty when out of range.
    /// Signed targets go through as_i64(), unsigned targets through as_u64().
    template <typename T>
    [[nodiscard]] std::optional<T> as_int() const noexcept {
        static_assert(std::is_integral_v<T> && !std::is_same_v<T, bool>,
                      "as_int requires an integer type");
        if constexpr (std::is_signed_v<T>) {
            const auto v = self().as_i64();
            if (!v || *v < static_cast<int64_t>(std::numeric_limits<T>::min()) ||
                *v > static_cast<int64_t>(std::numeric_limits<T>::max()))
                return std::nullopt;
            return static_cast<T>(*v);
        } else {
            const auto v = self().as_u64();
            if (!v || *v > static_cast<uint64_t>(std::numeric_limits<T>::max()))
                return std::nullopt;
            return static_cast<T>(*v);
        }
    }

    [[nodiscard]] std::optional<int32_t>  as_i32()   const noexcept { return as_int<int32_t>(); }
    [[nodiscard]] std::optional<int16_t>  as_i16()   const noexcept { return as_int<int16_t>(); }
    [[nodiscard]] std::optional<int8_t>   as_i8()    const noexcept { return as_int<int8_t>(); }
    [[nodiscard]] std::optional<size_t>   as_usize() const noexcept { return as_int<size_t>(); }
    [[nodiscard]] std::optional<uint32_t> as_u32()   const noexcept { return as_int<uint32_t>(); }
    [[nodiscard]] std::optional<uint16_t> as_u16()   const noexcept { return as_int<uint16_t>(); }
    [[nodiscard]] std::optional<uint8_t>  as_u8()    const noexcept { return as_int<uint8_t>(); }

    /// F64 within the finite float range. Integers are refused, as for as_f64().
    [[nodiscard]] std::optional<float> as_f32() const noexcept {
        const auto v = self().as_f64();
        if (!v || !(std::fabs(*v) <= static_cast<double>(FLT_MAX))) return std::nullopt;
        return static_cast<float>(*v);
    }

    // ─── Predicates ──────────────────────────────────────────────────────
    [[nodiscard]] bool is_bool()   const noexcept { return self().as_bool().has_value(); }
    [[nodiscard]] bool is_i64()    const noexcept { return self().as_i64().has_value(); }
    [[nodiscard]] bool is_i32()    const noexcept { return as_i32().has_value(); }
    [[nodiscard]] bool is_i16()    const noexcept { return as_i16().has_value(); }
    [[nodiscard]] bool is_i8()     const noexcept { return as_i8().has_value(); }
    [[nodiscard]] bool is_u64()    const noexcept { return self().as_u64().has_value(); }
    [[nodiscard]] bool is_usize()  const noexcept { return as_usize().has_value(); }
    [[nodiscard]] bool is_u32()    const noexcept { return as_u32().has_value(); }
    [[nodiscard]] bool is_u16()    const noexcept { return as_u16().has_value(); }
    [[nodiscard]] bool is_u8()     const noexcept { return as_u8().has_value(); }
    [[nodiscard]] bool is_f64()    const noexcept { return self().as_f64().has_value(); }
    [[nodiscard]] bool is_f64_castable() const noexcept { return self().cast_f64().has_value(); }
    [[nodiscard]] bool is_f32()    const noexcept { return as_f32().has_value(); }
    [[nodiscard]] bool is_str()    const noexcept { return self().as_str().has_value(); }
    [[nodiscard]] bool is_array()  const noexcept { return self().as_array() != nullptr; }
    [[nodiscard]] bool is_object() const noexcept { return self().as_object() != nullptr; }

    // ─── Lookup ──────────────────────────────────────────────────────────

    /// Member lookup; null unless this is an object containing @p key.
    [[nodiscard]] const Derived* get(std::string_view key) const noexcept {
        const auto* obj = self().as_object();
        return obj ? obj->find(key) : nullptr;
    }
    [[nodiscard]] Derived* get_mut(std::string_view key) noexcept {
        auto* obj = self_mut().as_object_mut();
        return obj ? obj->find(key) : nullptr;
    }

    /// Element lookup; null unless this is an array longer than @p index.
    [[nodiscard]] const Derived* get_idx(size_t index) const noexcept {
        const auto* arr = self().as_array();
        return (arr && index < arr->size()) ? &(*arr)[index] : nullptr;
    }
    [[nodiscard]] Derived* get_idx_mut(size_t index) noexcept {
        auto* arr = self_mut().as_array_mut();
        return (arr && index < arr->size()) ? &(*arr)[index] : nullptr;
    }

    // ─── Mutators ────────────────────────────────────────────────────────

    /// Insert or overwrite a member. Returns the previous value, if any.
    /// @throws AccessError(errc::not_an_object)
    template <typename K, typename T>
    std::optional<Derived> insert(K&& key, T&& value) {
        auto* obj = self_mut().as_object_mut();
        if (DOMJSON_UNLIKELY(!obj)) throw AccessError(errc::not_an_object);
        return obj->insert(typename Derived::Key(std::forward<K>(key)),
                           Derived(std::forward<T>(value)));
    }

    /// Remove a member. Returns the removed value, if any.
    /// @throws AccessError(errc::not_an_object)
    std::optional<Derived> remove(std::string_view key) {
        auto* obj = self_mut().as_object_mut();
        if (DOMJSON_UNLIKELY(!obj)) throw AccessError(errc::not_an_object);
        return obj->remove(key);
    }

    /// Append an element.
    /// @throws AccessError(errc::not_an_array)
    template <typename T>
    void push(T&& value) {
        auto* arr = self_mut().as_array_mut();
        if (DOMJSON_UNLIKELY(!arr)) throw AccessError(errc::not_an_array);
        arr->emplace_back(std::forward<T>(value));
    }

    /// Remove the last element. Returns it, or nothing for an empty array.
    /// @throws AccessError(errc::not_an_array)
    std::optional<Derived> pop() {
        auto* arr = self_mut().as_array_mut();
        if (DOMJSON_UNLIKELY(!arr)) throw AccessError(errc::not_an_array);
        if (arr->empty()) return std::nullopt;
        std::optional<Derived> last(std::move(arr->back()));
        arr->pop_back();
        return last;
    }

    // ─── Equality ────────────────────────────────────────────────────────

    /// Deep equality with any representation, including this one.
    template <typename Other, std::enable_if_t<is_value_v<Other>, int> = 0>
    friend bool operator==(const Derived& a, const Other& b) { return values_equal(a, b); }
    template <typename Other, std::enable_if_t<is_value_v<Other>, int> = 0>
    friend bool operator!=(const Derived& a, const Other& b) { return !values_equal(a, b); }

    /// `v == x` holds exactly when the accessor for x's type yields x.
    template <typename T, std::enable_if_t<detail::is_comparable_primitive_v<T>, int> = 0>
    friend bool operator==(const Derived& v, const T& x) noexcept { return v.equals_primitive(x); }
    template <typename T, std::enable_if_t<detail::is_comparable_primitive_v<T>, int> = 0>
    friend bool operator==(const T& x, const Derived& v) noexcept { return v.equals_primitive(x); }
    template <typename T, std::enable_if_t<detail::is_comparable_primitive_v<T>, int> = 0>
    friend bool operator!=(const Derived& v, const T& x) noexcept { return !v.equals_primitive(x); }
    template <typename T, std::enable_if_t<detail::is_comparable_primitive_v<T>, int> = 0>
    friend bool operator!=(const T& x, const Derived& v) noexcept { return !v.equals_primitive(x); }

    friend bool operator==(const Derived& v, std::string_view x) noexcept {
        const auto s = v.as_str();
        return s && *s == x;
    }
    friend bool operator==(std::string_view x, const Derived& v) noexcept { return v == x; }
    friend bool operator!=(const Derived& v, std::string_view x) noexcept { return !(v == x); }
    friend bool operator!=(std::string_view x, const Derived& v) noexcept { return !(v == x); }

protected:
    ValueAccess() = default;
    ~ValueAccess() = default;

private:
    const Derived& self() const noexcept { return static_cast<const Derived&>(*this); }
    Derived& self_mut() noexcept { return static_cast<Derived&>(*this); }

    template <typename T>
    bool equals_primitive(const T& x) const noexcept {
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return self().is_null();
        } else if constexpr (std::is_same_v<T, bool>) {
            const auto b = self().as_bool();
            return b && *b == x;
        } else if constexpr (std::is_same_v<T, float>) {
            const auto f = as_f32();
            return f && *f == x;
        } else if constexpr (std::is_floating_point_v<T>) {
            const auto d = self().as_f64();
            return d && *d == static_cast<double>(x);
        } else {
            const auto i = as_int<T>();
            return i && *i == x;
        }
    }
};

} // namespace domjson
