#pragma once

/// @file serialize.hpp
/// @brief Visitor-protocol implementations for built-in and standard types.
///
/// A type becomes encodable by providing, in its own namespace,
///
///   template <typename S> typename S::Ok serialize(const T& v, S& s);
///
/// which calls exactly one visitor method on @p s. S is any serializer:
/// the value Serializer, or the restricted MapKeySerializer when the value
/// is used as a map key. This header supplies that function for the
/// fundamental types, the common standard library types, Bytes, and the
/// value representations themselves.
///
/// @code
///   struct Point { int x; int y; };
///   DOMJSON_SERIALIZE_STRUCT(Point, x, y)
///
///   domjson::OwnedValue v = domjson::to_value(Point{1, 2});  // {"x":1,"y":2}
/// @endcode

#include "fwd.hpp"
#include "value_trait.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace domjson {

/// @brief Byte sequence encoded through serialize_bytes (an Array of I64).
struct Bytes {
    const uint8_t* data = nullptr;
    size_t size = 0;

    Bytes() = default;
    Bytes(const uint8_t* d, size_t n) noexcept : data(d), size(n) {}
    explicit Bytes(const std::vector<uint8_t>& v) noexcept : data(v.data()), size(v.size()) {}
};

namespace detail {

template <typename T>
inline constexpr bool is_char_v =
    std::is_same_v<T, char> || std::is_same_v<T, wchar_t> ||
    std::is_same_v<T, char16_t> || std::is_same_v<T, char32_t>;

template <typename T>
inline constexpr bool is_serializable_int_v =
    std::is_integral_v<T> && !std::is_same_v<T, bool> && !is_char_v<T>;

} // namespace detail

// =====================================================================
// Scalars
// =====================================================================

template <typename T, typename S, std::enable_if_t<std::is_same_v<T, bool>, int> = 0>
typename S::Ok serialize(T v, S& s) { return s.serialize_bool(v); }

/// Integers dispatch on width and signedness.
template <typename T, typename S, std::enable_if_t<detail::is_serializable_int_v<T>, int> = 0>
typename S::Ok serialize(T v, S& s) {
    if constexpr (std::is_signed_v<T>) {
        if constexpr (sizeof(T) == 1)      return s.serialize_i8(static_cast<int8_t>(v));
        else if constexpr (sizeof(T) == 2) return s.serialize_i16(static_cast<int16_t>(v));
        else if constexpr (sizeof(T) == 4) return s.serialize_i32(static_cast<int32_t>(v));
        else                               return s.serialize_i64(static_cast<int64_t>(v));
    } else {
        if constexpr (sizeof(T) == 1)      return s.serialize_u8(static_cast<uint8_t>(v));
        else if constexpr (sizeof(T) == 2) return s.serialize_u16(static_cast<uint16_t>(v));
        else if constexpr (sizeof(T) == 4) return s.serialize_u32(static_cast<uint32_t>(v));
        else                               return s.serialize_u64(static_cast<uint64_t>(v));
    }
}

template <typename T, typename S, std::enable_if_t<std::is_floating_point_v<T>, int> = 0>
typename S::Ok serialize(T v, S& s) {
    if constexpr (std::is_same_v<T, float>) return s.serialize_f32(v);
    else                                    return s.serialize_f64(static_cast<double>(v));
}

/// Characters become one-character strings. A plain char is a single byte.
template <typename T, typename S, std::enable_if_t<detail::is_char_v<T>, int> = 0>
typename S::Ok serialize(T v, S& s) {
    if constexpr (std::is_same_v<T, char>)
        return s.serialize_char(static_cast<char32_t>(static_cast<unsigned char>(v)));
    else
        return s.serialize_char(static_cast<char32_t>(v));
}

template <typename S>
typename S::Ok serialize(std::string_view v, S& s) { return s.serialize_str(v); }

template <typename S>
typename S::Ok serialize(const std::string& v, S& s) { return s.serialize_str(v); }

template <typename S>
typename S::Ok serialize(const char* v, S& s) {
    return v ? s.serialize_str(v) : s.serialize_none();
}

template <typename S>
typename S::Ok serialize(std::nullptr_t, S& s) { return s.serialize_unit(); }

template <typename S>
typename S::Ok serialize(std::monostate, S& s) { return s.serialize_unit(); }

template <typename S>
typename S::Ok serialize(const Bytes& v, S& s) { return s.serialize_bytes(v.data, v.size); }

// =====================================================================
// Standard containers
// =====================================================================

template <typename T, typename S>
typename S::Ok serialize(const std::optional<T>& v, S& s) {
    if (v.has_value()) return s.serialize_some(*v);
    return s.serialize_none();
}

template <typename T, typename A, typename S>
typename S::Ok serialize(const std::vector<T, A>& v, S& s) {
    auto seq = s.serialize_seq(v.size());
    for (const T& elem : v) seq.element(elem);
    return seq.end();
}

/// Fixed-size arrays are tuples: the length is part of the type.
template <typename T, size_t N, typename S>
typename S::Ok serialize(const std::array<T, N>& v, S& s) {
    auto tup = s.serialize_tuple(N);
    for (const T& elem : v) tup.element(elem);
    return tup.end();
}

template <typename A, typename B, typename S>
typename S::Ok serialize(const std::pair<A, B>& v, S& s) {
    auto tup = s.serialize_tuple(2);
    tup.element(v.first);
    tup.element(v.second);
    return tup.end();
}

template <typename... Ts, typename S>
typename S::Ok serialize(const std::tuple<Ts...>& v, S& s) {
    auto tup = s.serialize_tuple(sizeof...(Ts));
    std::apply([&tup](const auto&... elems) { (tup.element(elems), ...); }, v);
    return tup.end();
}

template <typename K, typename V, typename C, typename A, typename S>
typename S::Ok serialize(const std::map<K, V, C, A>& v, S& s) {
    auto map = s.serialize_map(v.size());
    for (const auto& kv : v) map.entry(kv.first, kv.second);
    return map.end();
}

template <typename K, typename V, typename H, typename E, typename A, typename S>
typename S::Ok serialize(const std::unordered_map<K, V, H, E, A>& v, S& s) {
    auto map = s.serialize_map(v.size());
    for (const auto& kv : v) map.entry(kv.first, kv.second);
    return map.end();
}

// =====================================================================
// Value representations
// =====================================================================

/// Any value tree re-encodes variant by variant, so to_value() of a
/// BorrowedValue yields an equal OwnedValue.
template <typename V, typename S, std::enable_if_t<is_value_v<V>, int> = 0>
typename S::Ok serialize(const V& v, S& s) {
    switch (v.value_type()) {
        case ValueType::Null:   return s.serialize_unit();
        case ValueType::Bool:   return s.serialize_bool(*v.as_bool());
        case ValueType::I64:    return s.serialize_i64(*v.as_i64());
        case ValueType::F64:    return s.serialize_f64(*v.as_f64());
        case ValueType::String: return s.serialize_str(*v.as_str());
        case ValueType::Array: {
            const auto& arr = *v.as_array();
            auto seq = s.serialize_seq(arr.size());
            for (const auto& elem : arr) seq.element(elem);
            return seq.end();
        }
        case ValueType::Object:
        default: {
            const auto& obj = *v.as_object();
            auto map = s.serialize_map(obj.size());
            for (const auto& entry : obj) map.entry(std::string_view(entry.first), entry.second);
            return map.end();
        }
    }
}

} // namespace domjson

// =====================================================================
// Preprocessor FOREACH utilities (support up to 20 fields)
// =====================================================================

// NOLINTBEGIN(cppcoreguidelines-macro-usage)

#define DOMJSON_PP_CAT_I(a, b) a##b
#define DOMJSON_PP_CAT(a, b) DOMJSON_PP_CAT_I(a, b)

#define DOMJSON_PP_NARG(...) \
    DOMJSON_PP_ARG_N(__VA_ARGS__, \
    20,19,18,17,16,15,14,13,12,11,10,9,8,7,6,5,4,3,2,1,0)
#define DOMJSON_PP_ARG_N( \
    _1,_2,_3,_4,_5,_6,_7,_8,_9,_10, \
    _11,_12,_13,_14,_15,_16,_17,_18,_19,_20, N,...) N

#define DOMJSON_PP_FE_1(m,x) m(x)
#define DOMJSON_PP_FE_2(m,x,...) m(x) DOMJSON_PP_FE_1(m,__VA_ARGS__)
#define DOMJSON_PP_FE_3(m,x,...) m(x) DOMJSON_PP_FE_2(m,__VA_ARGS__)
#define DOMJSON_PP_FE_4(m,x,...) m(x) DOMJSON_PP_FE_3(m,__VA_ARGS__)
#define DOMJSON_PP_FE_5(m,x,...) m(x) DOMJSON_PP_FE_4(m,__VA_ARGS__)
#define DOMJSON_PP_FE_6(m,x,...) m(x) DOMJSON_PP_FE_5(m,__VA_ARGS__)
#define DOMJSON_PP_FE_7(m,x,...) m(x) DOMJSON_PP_FE_6(m,__VA_ARGS__)
#define DOMJSON_PP_FE_8(m,x,...) m(x) DOMJSON_PP_FE_7(m,__VA_ARGS__)
#define DOMJSON_PP_FE_9(m,x,...) m(x) DOMJSON_PP_FE_8(m,__VA_ARGS__)
#define DOMJSON_PP_FE_10(m,x,...) m(x) DOMJSON_PP_FE_9(m,__VA_ARGS__)
#define DOMJSON_PP_FE_11(m,x,...) m(x) DOMJSON_PP_FE_10(m,__VA_ARGS__)
#define DOMJSON_PP_FE_12(m,x,...) m(x) DOMJSON_PP_FE_11(m,__VA_ARGS__)
#define DOMJSON_PP_FE_13(m,x,...) m(x) DOMJSON_PP_FE_12(m,__VA_ARGS__)
#define DOMJSON_PP_FE_14(m,x,...) m(x) DOMJSON_PP_FE_13(m,__VA_ARGS__)
#define DOMJSON_PP_FE_15(m,x,...) m(x) DOMJSON_PP_FE_14(m,__VA_ARGS__)
#define DOMJSON_PP_FE_16(m,x,...) m(x) DOMJSON_PP_FE_15(m,__VA_ARGS__)
#define DOMJSON_PP_FE_17(m,x,...) m(x) DOMJSON_PP_FE_16(m,__VA_ARGS__)
#define DOMJSON_PP_FE_18(m,x,...) m(x) DOMJSON_PP_FE_17(m,__VA_ARGS__)
#define DOMJSON_PP_FE_19(m,x,...) m(x) DOMJSON_PP_FE_18(m,__VA_ARGS__)
#define DOMJSON_PP_FE_20(m,x,...) m(x) DOMJSON_PP_FE_19(m,__VA_ARGS__)

#define DOMJSON_PP_FOREACH(m,...) \
    DOMJSON_PP_CAT(DOMJSON_PP_FE_, DOMJSON_PP_NARG(__VA_ARGS__))(m, __VA_ARGS__)

#define DOMJSON_DETAIL_SERIALIZE_FIELD(fld) st.field(#fld, v.fld);

/// Non-intrusive: use in the same namespace as the type. Encodes the listed
/// fields as a struct (an Object keyed by field name).
#define DOMJSON_SERIALIZE_STRUCT(Type, ...) \
    template <typename S> \
    typename S::Ok serialize(const Type& v, S& s) { \
        auto st = s.serialize_struct(#Type, DOMJSON_PP_NARG(__VA_ARGS__)); \
        DOMJSON_PP_FOREACH(DOMJSON_DETAIL_SERIALIZE_FIELD, __VA_ARGS__) \
        return st.end(); \
    }

/// Intrusive: use inside the class/struct body (private fields allowed).
#define DOMJSON_SERIALIZE_STRUCT_INTRUSIVE(Type, ...) \
    template <typename S> \
    friend typename S::Ok serialize(const Type& v, S& s) { \
        auto st = s.serialize_struct(#Type, DOMJSON_PP_NARG(__VA_ARGS__)); \
        DOMJSON_PP_FOREACH(DOMJSON_DETAIL_SERIALIZE_FIELD, __VA_ARGS__) \
        return st.end(); \
    }

// NOLINTEND(cppcoreguidelines-macro-usage)
