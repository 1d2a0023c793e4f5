#pragma once

/// @file encoder.hpp
/// @brief Encode engine: builds an OwnedValue from anything that implements
/// the visitor protocol (see serialize.hpp).
///
/// Serializer is the value-producing implementation of the protocol. Its
/// compound methods return builders (SerializeVec, SerializeMap and the two
/// variant builders) which accept elements or entries and yield the finished
/// value from end(). Map keys go through MapKeySerializer, which accepts only
/// string-like input.
///
/// @code
///   std::map<std::string, std::vector<int>> m{{"a", {1, 2}}};
///   domjson::OwnedValue v = domjson::to_value(m);   // {"a":[1,2]}
/// @endcode

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "options.hpp"
#include "owned_value.hpp"
#include "serialize.hpp"

#include <cstddef>
#include <cstdint>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace domjson {

namespace detail {

/// Single dispatch point: finds serialize() for T by ordinary lookup (the
/// built-ins) and by argument-dependent lookup (user types).
template <typename T, typename S>
typename S::Ok invoke_serialize(const T& value, S& serializer) {
    return serialize(value, serializer);
}

/// Builder for a key serializer: compound keys never get this far, every
/// method fails.
template <typename Ok>
class ImpossibleBuilder {
public:
    template <typename T> [[noreturn]] void element(const T&) { fail(); }
    template <typename K, typename T> [[noreturn]] void entry(const K&, const T&) { fail(); }
    template <typename T> [[noreturn]] void field(std::string_view, const T&) { fail(); }
    [[noreturn]] Ok end() { fail(); }

private:
    [[noreturn]] static void fail() { throw EncodeError(errc::key_must_be_a_string); }
};

} // namespace detail

class SerializeVec;
class SerializeTupleVariant;
class SerializeMap;
class SerializeStructVariant;

// =====================================================================
// MapKeySerializer
// =====================================================================

/// @brief Restricted serializer used for map keys.
///
/// Strings and unit variants (by variant name) are accepted; newtype structs
/// are unwrapped. Everything else, including char, throws
/// EncodeError(errc::key_must_be_a_string).
class MapKeySerializer {
public:
    using Ok = std::string;
    using Impossible = detail::ImpossibleBuilder<std::string>;

    std::string serialize_str(std::string_view v) { return std::string(v); }

    std::string serialize_unit_variant(std::string_view /*name*/, uint32_t /*index*/,
                                       std::string_view variant) {
        return std::string(variant);
    }

    template <typename T>
    std::string serialize_newtype_struct(std::string_view /*name*/, const T& value) {
        return detail::invoke_serialize(value, *this);
    }

    [[noreturn]] std::string serialize_bool(bool) { fail(); }
    [[noreturn]] std::string serialize_i8(int8_t) { fail(); }
    [[noreturn]] std::string serialize_i16(int16_t) { fail(); }
    [[noreturn]] std::string serialize_i32(int32_t) { fail(); }
    [[noreturn]] std::string serialize_i64(int64_t) { fail(); }
    [[noreturn]] std::string serialize_u8(uint8_t) { fail(); }
    [[noreturn]] std::string serialize_u16(uint16_t) { fail(); }
    [[noreturn]] std::string serialize_u32(uint32_t) { fail(); }
    [[noreturn]] std::string serialize_u64(uint64_t) { fail(); }
    [[noreturn]] std::string serialize_f32(float) { fail(); }
    [[noreturn]] std::string serialize_f64(double) { fail(); }
    [[noreturn]] std::string serialize_char(char32_t) { fail(); }
    [[noreturn]] std::string serialize_bytes(const uint8_t*, size_t) { fail(); }
    [[noreturn]] std::string serialize_unit() { fail(); }
    [[noreturn]] std::string serialize_unit_struct(std::string_view) { fail(); }
    [[noreturn]] std::string serialize_none() { fail(); }

    template <typename T>
    [[noreturn]] std::string serialize_some(const T&) { fail(); }

    template <typename T>
    [[noreturn]] std::string serialize_newtype_variant(std::string_view, uint32_t,
                                                       std::string_view, const T&) {
        fail();
    }

    [[noreturn]] Impossible serialize_seq(std::optional<size_t>) { fail(); }
    [[noreturn]] Impossible serialize_tuple(size_t) { fail(); }
    [[noreturn]] Impossible serialize_tuple_struct(std::string_view, size_t) { fail(); }
    [[noreturn]] Impossible serialize_tuple_variant(std::string_view, uint32_t,
                                                    std::string_view, size_t) { fail(); }
    [[noreturn]] Impossible serialize_map(std::optional<size_t>) { fail(); }
    [[noreturn]] Impossible serialize_struct(std::string_view, size_t) { fail(); }
    [[noreturn]] Impossible serialize_struct_variant(std::string_view, uint32_t,
                                                     std::string_view, size_t) { fail(); }

private:
    [[noreturn]] static void fail() { throw EncodeError(errc::key_must_be_a_string); }
};

// =====================================================================
// Serializer
// =====================================================================

/// @brief Visitor-protocol implementation producing an OwnedValue.
///
/// Every container level (array or object, including the outer object of a
/// variant) counts against EncodeOptions::max_depth; exceeding it throws
/// EncodeError(errc::max_depth_exceeded).
class Serializer {
public:
    using Ok = OwnedValue;

    explicit Serializer(const EncodeOptions& opts = {}) noexcept
        : depth_(0), max_depth_(opts.effective_max_depth()) {}

    OwnedValue serialize_bool(bool v) { return OwnedValue(v); }

    OwnedValue serialize_i8(int8_t v) { return OwnedValue(static_cast<int64_t>(v)); }
    OwnedValue serialize_i16(int16_t v) { return OwnedValue(static_cast<int64_t>(v)); }
    OwnedValue serialize_i32(int32_t v) { return OwnedValue(static_cast<int64_t>(v)); }
    OwnedValue serialize_i64(int64_t v) { return OwnedValue(v); }
    OwnedValue serialize_u8(uint8_t v) { return OwnedValue(static_cast<int64_t>(v)); }
    OwnedValue serialize_u16(uint16_t v) { return OwnedValue(static_cast<int64_t>(v)); }
    OwnedValue serialize_u32(uint32_t v) { return OwnedValue(static_cast<int64_t>(v)); }
    /// Values >= 2^63 keep their bit pattern and read back negative.
    OwnedValue serialize_u64(uint64_t v) { return OwnedValue(static_cast<int64_t>(v)); }

    OwnedValue serialize_f32(float v) { return OwnedValue(static_cast<double>(v)); }
    OwnedValue serialize_f64(double v) { return OwnedValue(v); }

    /// One-character UTF-8 string. Surrogates and out-of-range code points
    /// are replaced with U+FFFD.
    OwnedValue serialize_char(char32_t v) {
        std::string s;
        const auto cp = static_cast<uint32_t>(v);
        detail::utf8::encode(detail::utf8::is_scalar_value(cp) ? cp : 0xFFFDu, s);
        return OwnedValue(std::move(s));
    }

    OwnedValue serialize_str(std::string_view v) { return OwnedValue(v); }

    OwnedValue serialize_bytes(const uint8_t* data, size_t size) {
        nested();
        OwnedValue::Array arr;
        arr.reserve(size);
        for (size_t i = 0; i < size; ++i) arr.emplace_back(static_cast<int64_t>(data[i]));
        return OwnedValue(std::move(arr));
    }

    OwnedValue serialize_unit() { return OwnedValue(); }
    OwnedValue serialize_unit_struct(std::string_view /*name*/) { return OwnedValue(); }
    OwnedValue serialize_none() { return OwnedValue(); }

    template <typename T>
    OwnedValue serialize_some(const T& value) { return detail::invoke_serialize(value, *this); }

    template <typename T>
    OwnedValue serialize_newtype_struct(std::string_view /*name*/, const T& value) {
        return detail::invoke_serialize(value, *this);
    }

    OwnedValue serialize_unit_variant(std::string_view /*name*/, uint32_t /*index*/,
                                      std::string_view variant) {
        return OwnedValue(variant);
    }

    /// {variant: payload}
    template <typename T>
    OwnedValue serialize_newtype_variant(std::string_view /*name*/, uint32_t /*index*/,
                                         std::string_view variant, const T& value) {
        Serializer inner = nested();
        OwnedValue::Object obj;
        obj.append_unchecked(std::string(variant), detail::invoke_serialize(value, inner));
        return OwnedValue(std::move(obj));
    }

    SerializeVec serialize_seq(std::optional<size_t> len);
    SerializeVec serialize_tuple(size_t len);
    SerializeVec serialize_tuple_struct(std::string_view name, size_t len);
    SerializeTupleVariant serialize_tuple_variant(std::string_view name, uint32_t index,
                                                  std::string_view variant, size_t len);
    SerializeMap serialize_map(std::optional<size_t> len);
    SerializeMap serialize_struct(std::string_view name, size_t len);
    SerializeStructVariant serialize_struct_variant(std::string_view name, uint32_t index,
                                                    std::string_view variant, size_t len);

    /// Container levels entered above the root.
    [[nodiscard]] size_t depth() const noexcept { return depth_; }

private:
    Serializer(size_t depth, size_t max_depth) noexcept
        : depth_(depth), max_depth_(max_depth) {}

    /// Serializer for the contents of a new container level.
    Serializer nested() const {
        if (DOMJSON_UNLIKELY(depth_ + 1 > max_depth_)) {
            throw EncodeError(errc::max_depth_exceeded,
                              "encode depth exceeds " + std::to_string(max_depth_));
        }
        return Serializer(depth_ + 1, max_depth_);
    }

    size_t depth_;
    size_t max_depth_;
};

// =====================================================================
// Builders
// =====================================================================

/// Sequences, tuples and tuple structs.
class SerializeVec {
public:
    using Ok = OwnedValue;

    template <typename T>
    void element(const T& value) { vec_.emplace_back(detail::invoke_serialize(value, inner_)); }

    OwnedValue end() { return OwnedValue(std::move(vec_)); }

private:
    friend class Serializer;

    SerializeVec(Serializer inner, size_t capacity) : inner_(inner) { vec_.reserve(capacity); }

    Serializer inner_;
    OwnedValue::Array vec_;
};

/// {variant: [elements...]}
class SerializeTupleVariant {
public:
    using Ok = OwnedValue;

    template <typename T>
    void element(const T& value) { vec_.emplace_back(detail::invoke_serialize(value, inner_)); }

    OwnedValue end() {
        OwnedValue::Object obj;
        obj.append_unchecked(std::move(variant_), OwnedValue(std::move(vec_)));
        return OwnedValue(std::move(obj));
    }

private:
    friend class Serializer;

    SerializeTupleVariant(Serializer inner, std::string_view variant, size_t capacity)
        : inner_(inner), variant_(variant) {
        vec_.reserve(capacity);
    }

    Serializer inner_;
    std::string variant_;
    OwnedValue::Array vec_;
};

/// Maps and structs. A repeated key replaces the earlier value.
class SerializeMap {
public:
    using Ok = OwnedValue;

    /// The key is serialized first and must produce a string.
    template <typename K, typename T>
    void entry(const K& key, const T& value) {
        MapKeySerializer keys;
        std::string k = detail::invoke_serialize(key, keys);
        OwnedValue v = detail::invoke_serialize(value, inner_);
        map_.insert(std::move(k), std::move(v));
    }

    template <typename T>
    void field(std::string_view name, const T& value) {
        map_.insert(std::string(name), detail::invoke_serialize(value, inner_));
    }

    OwnedValue end() { return OwnedValue(std::move(map_)); }

private:
    friend class Serializer;

    SerializeMap(Serializer inner, size_t capacity) : inner_(inner) { map_.reserve(capacity); }

    Serializer inner_;
    OwnedValue::Object map_;
};

/// {variant: {fields...}}
class SerializeStructVariant {
public:
    using Ok = OwnedValue;

    template <typename T>
    void field(std::string_view name, const T& value) {
        map_.insert(std::string(name), detail::invoke_serialize(value, inner_));
    }

    OwnedValue end() {
        OwnedValue::Object obj;
        obj.append_unchecked(std::move(variant_), OwnedValue(std::move(map_)));
        return OwnedValue(std::move(obj));
    }

private:
    friend class Serializer;

    SerializeStructVariant(Serializer inner, std::string_view variant, size_t capacity)
        : inner_(inner), variant_(variant) {
        map_.reserve(capacity);
    }

    Serializer inner_;
    std::string variant_;
    OwnedValue::Object map_;
};

// ─── Serializer compound methods ─────────────────────────────────────────────

inline SerializeVec Serializer::serialize_seq(std::optional<size_t> len) {
    return SerializeVec(nested(), len.value_or(0));
}

inline SerializeVec Serializer::serialize_tuple(size_t len) {
    return SerializeVec(nested(), len);
}

inline SerializeVec Serializer::serialize_tuple_struct(std::string_view /*name*/, size_t len) {
    return SerializeVec(nested(), len);
}

// The variant builders sit two levels down: the wrapping object, then the
// payload container.
inline SerializeTupleVariant Serializer::serialize_tuple_variant(std::string_view /*name*/,
                                                                 uint32_t /*index*/,
                                                                 std::string_view variant,
                                                                 size_t len) {
    return SerializeTupleVariant(nested().nested(), variant, len);
}

inline SerializeMap Serializer::serialize_map(std::optional<size_t> len) {
    return SerializeMap(nested(), len.value_or(0));
}

inline SerializeMap Serializer::serialize_struct(std::string_view /*name*/, size_t len) {
    return SerializeMap(nested(), len);
}

inline SerializeStructVariant Serializer::serialize_struct_variant(std::string_view /*name*/,
                                                                   uint32_t /*index*/,
                                                                   std::string_view variant,
                                                                   size_t len) {
    return SerializeStructVariant(nested().nested(), variant, len);
}

// ─── Entry points ────────────────────────────────────────────────────────────

/// @brief Encode @p value into an OwnedValue.
/// @throws EncodeError on a non-string map key or excessive nesting.
template <typename T>
[[nodiscard]] OwnedValue to_value(const T& value, const EncodeOptions& opts = {}) {
    Serializer s(opts);
    return detail::invoke_serialize(value, s);
}

/// @brief Encode without exceptions.
template <typename T>
[[nodiscard]] result<OwnedValue> try_to_value(const T& value,
                                              const EncodeOptions& opts = {}) noexcept {
    try {
        return {to_value(value, opts), {}};
    } catch (const EncodeError& e) {
        return {OwnedValue(), e.code()};
    } catch (const std::bad_alloc&) {
        return {OwnedValue(), std::make_error_code(std::errc::not_enough_memory)};
    }
}

} // namespace domjson
