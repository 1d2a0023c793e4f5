#pragma once

/// @file cow_string.hpp
/// @brief CowString: a copy-on-write string that either borrows from the
/// input buffer or owns an independent allocation.
///
/// The tokenizer returns a borrowed CowString for string tokens without
/// escape sequences (zero-copy) and an owned one when unescaping had to
/// produce new bytes. A borrowed CowString is valid only while the buffer
/// it points into is alive.

#include <string>
#include <string_view>
#include <utility>

namespace domjson {

class CowString {
public:
    CowString() noexcept = default;

    /// Borrow: no allocation, the caller keeps @p v alive.
    [[nodiscard]] static CowString borrowed(std::string_view v) noexcept {
        CowString s;
        s.view_ = v;
        return s;
    }

    /// Own: takes the buffer.
    [[nodiscard]] static CowString owned(std::string v) {
        CowString s;
        s.owned_ = std::move(v);
        s.is_owned_ = true;
        return s;
    }

    explicit CowString(std::string v) : owned_(std::move(v)), is_owned_(true) {}
    explicit CowString(const char* v) : owned_(v), is_owned_(true) {}
    /// Copies; use borrowed() to reference @p v instead.
    explicit CowString(std::string_view v) : owned_(v), is_owned_(true) {}

    [[nodiscard]] bool is_borrowed() const noexcept { return !is_owned_; }
    [[nodiscard]] bool is_owned() const noexcept { return is_owned_; }

    [[nodiscard]] std::string_view view() const noexcept {
        return is_owned_ ? std::string_view(owned_) : view_;
    }
    operator std::string_view() const noexcept { return view(); }

    [[nodiscard]] const char* data() const noexcept { return view().data(); }
    [[nodiscard]] size_t size() const noexcept { return view().size(); }
    [[nodiscard]] bool empty() const noexcept { return view().empty(); }

    /// Copy the contents into an independent std::string.
    [[nodiscard]] std::string to_string() const { return std::string(view()); }

    /// Consume into a std::string, moving the buffer when already owned.
    [[nodiscard]] std::string into_string() && {
        if (is_owned_) return std::move(owned_);
        return std::string(view_);
    }

    /// Detach from the input buffer. No-op when already owned.
    void make_owned() {
        if (!is_owned_) {
            owned_.assign(view_.data(), view_.size());
            view_ = {};
            is_owned_ = true;
        }
    }

    friend bool operator==(const CowString& a, const CowString& b) noexcept {
        return a.view() == b.view();
    }
    friend bool operator!=(const CowString& a, const CowString& b) noexcept {
        return !(a == b);
    }
    friend bool operator==(const CowString& a, std::string_view b) noexcept {
        return a.view() == b;
    }
    friend bool operator!=(const CowString& a, std::string_view b) noexcept {
        return a.view() != b;
    }
    friend bool operator<(const CowString& a, const CowString& b) noexcept {
        return a.view() < b.view();
    }

private:
    std::string_view view_;
    std::string owned_;
    bool is_owned_ = false;
};

} // namespace domjson
