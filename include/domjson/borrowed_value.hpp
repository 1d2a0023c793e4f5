#pragma once

/// @file borrowed_value.hpp
/// @brief BorrowedValue: the zero-copy representation, and BorrowedDocument,
/// which keeps its input buffer alive.
///
/// A BorrowedValue string is either a view into the decoded input buffer or
/// an owned heap string (produced when escapes had to be unescaped, or when
/// the value was built from a std::string). Object keys are CowString.
///
/// A BorrowedValue obtained from to_borrowed_value() is valid only while the
/// input it was decoded from is alive. BorrowedDocument ties the two
/// together through shared ownership of the buffer.

#include "config.hpp"
#include "cow_string.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "number.hpp"
#include "object.hpp"
#include "options.hpp"
#include "value_trait.hpp"

#include <cstdint>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace domjson {

class BorrowedValue : public ValueAccess<BorrowedValue> {
public:
    using Key    = CowString;
    using Array  = std::vector<BorrowedValue>;
    using Object = BasicObject<CowString, BorrowedValue>;

    BorrowedValue() noexcept : kind_(ValueType::Null), str_owned_(false) { u_.view = {nullptr, 0}; }
    BorrowedValue(std::nullptr_t) noexcept : BorrowedValue() {}
    BorrowedValue(bool v) noexcept : BorrowedValue() { kind_ = ValueType::Bool; u_.b = v; }

    /// Integers widen into the I64 slot; unsigned 64-bit values >= 2^63 are
    /// bit-reinterpreted and come out negative.
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, bool> &&
                               !std::is_same_v<T, char>, int> = 0>
    BorrowedValue(T v) noexcept : BorrowedValue() {
        kind_ = ValueType::I64;
        u_.i = static_cast<int64_t>(v);
    }
    BorrowedValue(float v) noexcept : BorrowedValue() { kind_ = ValueType::F64; u_.d = v; }
    BorrowedValue(double v) noexcept : BorrowedValue() { kind_ = ValueType::F64; u_.d = v; }
    BorrowedValue(Number n) noexcept : BorrowedValue() {
        if (n.is_i64()) { kind_ = ValueType::I64; u_.i = n.i64(); }
        else            { kind_ = ValueType::F64; u_.d = n.f64(); }
    }

    /// Keeps the CowString's ownership: a borrowed view stays a view.
    BorrowedValue(CowString&& v) : BorrowedValue() {
        kind_ = ValueType::String;
        if (v.is_owned()) set_owned(new std::string(std::move(v).into_string()));
        else              u_.view = {v.data(), v.size()};
    }
    /// The remaining string constructors copy; use borrowed() for a view.
    BorrowedValue(std::string v) : BorrowedValue() {
        kind_ = ValueType::String;
        set_owned(new std::string(std::move(v)));
    }
    BorrowedValue(std::string_view v) : BorrowedValue(std::string(v)) {}
    BorrowedValue(const char* v) : BorrowedValue(std::string(v ? v : "")) {}

    BorrowedValue(const Array& v) : BorrowedValue() { kind_ = ValueType::Array; u_.arr = new Array(v); }
    BorrowedValue(Array&& v) : BorrowedValue() { kind_ = ValueType::Array; u_.arr = new Array(std::move(v)); }
    BorrowedValue(const Object& v) : BorrowedValue() { kind_ = ValueType::Object; u_.obj = new Object(v); }
    BorrowedValue(Object&& v) : BorrowedValue() { kind_ = ValueType::Object; u_.obj = new Object(std::move(v)); }

    BorrowedValue(const BorrowedValue& o) : BorrowedValue() { copy_from(o); }
    BorrowedValue(BorrowedValue&& o) noexcept
        : kind_(o.kind_), str_owned_(o.str_owned_), u_(o.u_) {
        o.kind_ = ValueType::Null;
        o.str_owned_ = false;
    }
    BorrowedValue& operator=(const BorrowedValue& o) {
        if (this != &o) { BorrowedValue tmp(o); swap(tmp); }
        return *this;
    }
    /// @p o may live inside this value.
    BorrowedValue& operator=(BorrowedValue&& o) noexcept {
        if (this != &o) { BorrowedValue tmp(std::move(o)); swap(tmp); }
        return *this;
    }
    ~BorrowedValue() { destroy(); }

    void swap(BorrowedValue& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(str_owned_, o.str_owned_);
        std::swap(u_, o.u_);
    }

    [[nodiscard]] static BorrowedValue null() noexcept { return BorrowedValue(); }
    [[nodiscard]] static BorrowedValue array() { return BorrowedValue(Array()); }
    [[nodiscard]] static BorrowedValue object() { return BorrowedValue(Object()); }

    /// String that references @p v without copying. The caller keeps the
    /// referenced bytes alive.
    [[nodiscard]] static BorrowedValue borrowed(std::string_view v) {
        return BorrowedValue(CowString::borrowed(v));
    }

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
    [[nodiscard]] std::optional<uint64_t> as_u64() const noexcept {
        if (kind_ == ValueType::I64 && u_.i >= 0) return static_cast<uint64_t>(u_.i);
        return std::nullopt;
    }
    [[nodiscard]] std::optional<double> as_f64() const noexcept {
        if (kind_ == ValueType::F64) return u_.d;
        return std::nullopt;
    }
    [[nodiscard]] std::optional<double> cast_f64() const noexcept {
        if (kind_ == ValueType::F64) return u_.d;
        if (kind_ == ValueType::I64) return static_cast<double>(u_.i);
        return std::nullopt;
    }
    [[nodiscard]] std::optional<std::string_view> as_str() const noexcept {
        if (kind_ != ValueType::String) return std::nullopt;
        if (str_owned_) return std::string_view(*u_.str_ptr);
        return std::string_view(u_.view.data, u_.view.size);
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

    [[nodiscard]] size_t size() const noexcept {
        if (kind_ == ValueType::Array)  return u_.arr->size();
        if (kind_ == ValueType::Object) return u_.obj->size();
        return 0;
    }

    /// True for a string that references external bytes.
    [[nodiscard]] bool is_borrowed_str() const noexcept {
        return kind_ == ValueType::String && !str_owned_;
    }

private:
    struct View {
        const char* data;
        size_t size;
    };

    ValueType kind_;
    bool str_owned_;
    union Payload {
        bool b; int64_t i; double d;
        View view;
        std::string* str_ptr;
        Array* arr;
        Object* obj;
    } u_;

    void set_owned(std::string* s) noexcept {
        str_owned_ = true;
        u_.str_ptr = s;
    }

    void copy_from(const BorrowedValue& o) {
        switch (o.kind_) {
            case ValueType::String:
                if (o.str_owned_) set_owned(new std::string(*o.u_.str_ptr));
                else              u_.view = o.u_.view;
                break;
            case ValueType::Array:  u_.arr = new Array(*o.u_.arr); break;
            case ValueType::Object: u_.obj = new Object(*o.u_.obj); break;
            default:                u_ = o.u_; break;
        }
        kind_ = o.kind_;
    }

    void destroy() noexcept {
        switch (kind_) {
            case ValueType::String: if (str_owned_) delete u_.str_ptr; break;
            case ValueType::Array:  delete u_.arr; break;
            case ValueType::Object: delete u_.obj; break;
            default: break;
        }
    }
};

static_assert(sizeof(BorrowedValue) == 24, "BorrowedValue must be exactly 24 bytes");
static_assert(is_value_v<BorrowedValue>, "BorrowedValue must implement the value interface");

// ─── BorrowedDocument ────────────────────────────────────────────────────────

/// @brief A borrowed tree together with the buffer it borrows from.
///
/// The buffer is held through a shared_ptr, so copies of the document share
/// it and every view in every copy stays valid.
///
/// @code
///   domjson::BorrowedDocument doc;
///   doc.parse(R"({"a":1,"b":["x","y"]})");
///   assert(*doc.root().get("a") == 1);
///   doc.parse("[1,2,3]");  // replaces buffer and root
/// @endcode
class BorrowedDocument {
public:
    BorrowedDocument() = default;

    /// @brief Take ownership of @p input and decode it into the root.
    /// @throws ParseError on invalid JSON; the document is unchanged.
    void parse(std::string input, const DecodeOptions& opts = {});

    /// @brief Exception-free parse(). On failure the document is unchanged.
    std::error_code try_parse(std::string input, const DecodeOptions& opts = {}) noexcept;

    [[nodiscard]] BorrowedValue& root() noexcept { return root_; }
    [[nodiscard]] const BorrowedValue& root() const noexcept { return root_; }

    /// The bytes the root borrows from (empty before the first parse).
    [[nodiscard]] std::string_view buffer() const noexcept {
        return buffer_ ? std::string_view(*buffer_) : std::string_view();
    }

    /// Drop the root, then the buffer.
    void reset() noexcept {
        root_ = BorrowedValue();
        buffer_.reset();
    }

private:
    std::shared_ptr<const std::string> buffer_;
    BorrowedValue root_;
};

} // namespace domjson
