#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and the ValueType enumeration.

#include <cstdint>

namespace domjson {

// ─── Forward declarations ───────────────────────────────────────────────
class CowString;
class Number;
class OwnedValue;
class BorrowedValue;
class BorrowedDocument;
template <typename Key, typename V> class BasicObject;
namespace detail { class Tokenizer; }

/// JSON value types. Mirrors the discriminant of both representations.
enum class ValueType : uint8_t {
    Null   = 0,
    Bool   = 1,
    I64    = 2,
    F64    = 3,
    String = 4,
    Array  = 5,
    Object = 6
};

/// @brief Returns the string representation of a type.
inline const char* type_name(ValueType t) noexcept {
    switch (t) {
        case ValueType::Null:   return "null";
        case ValueType::Bool:   return "bool";
        case ValueType::I64:    return "i64";
        case ValueType::F64:    return "f64";
        case ValueType::String: return "string";
        case ValueType::Array:  return "array";
        case ValueType::Object: return "object";
    }
    return "unknown";
}

} // namespace domjson
