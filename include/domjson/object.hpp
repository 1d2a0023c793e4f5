#pragma once

/// @file object.hpp
/// @brief BasicObject: the string-keyed mapping shared by both value
/// representations.
///
/// Storage is a vector of (key, value) entries plus a lazily built hash
/// index for objects with DOMJSON_OBJECT_LINEAR_THRESHOLD or more entries.
/// Keys are unique; insert() overwrites. Iteration follows insertion order,
/// equality ignores it.
///
/// Key is std::string for OwnedValue and CowString for BorrowedValue. The
/// only requirement on Key is an implicit conversion to std::string_view.

#include "config.hpp"
#include "detail/hash.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace domjson {

template <typename Key, typename V>
class BasicObject {
public:
    using key_type     = Key;
    using mapped_type  = V;
    using value_type   = std::pair<Key, V>;
    using storage_type = std::vector<value_type>;
    using size_type    = size_t;
    using iterator       = typename storage_type::iterator;
    using const_iterator = typename storage_type::const_iterator;

    /// Hash index of string_view keys pointing into entries_[i].first.
    /// Rebuilt whenever entries_ reallocates.
    using index_type = std::unordered_map<std::string_view, size_type,
                                          detail::StringHash,
                                          detail::StringEqual>;

    static constexpr size_type kIndexThreshold = DOMJSON_OBJECT_LINEAR_THRESHOLD;

    BasicObject() = default;
    ~BasicObject() = default;

    BasicObject(const BasicObject& o) : entries_(o.entries_) {}
    BasicObject(BasicObject&& o) noexcept
        : entries_(std::move(o.entries_)), index_(std::move(o.index_)) {}
    BasicObject& operator=(const BasicObject& o) {
        if (this != &o) { entries_ = o.entries_; index_.reset(); }
        return *this;
    }
    BasicObject& operator=(BasicObject&& o) noexcept {
        if (this != &o) { entries_ = std::move(o.entries_); index_ = std::move(o.index_); }
        return *this;
    }

    // ─── Capacity ────────────────────────────────────────────────────────
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] size_type size() const noexcept { return entries_.size(); }
    [[nodiscard]] size_type capacity() const noexcept { return entries_.capacity(); }
    void reserve(size_type n) {
        const auto* old_data = entries_.data();
        entries_.reserve(n);
        if (index_ && entries_.data() != old_data) rebuild_index();
    }

    // ─── Iterators ──────────────────────────────────────────────────────
    iterator begin() noexcept { return entries_.begin(); }
    iterator end()   noexcept { return entries_.end(); }
    const_iterator begin()  const noexcept { return entries_.begin(); }
    const_iterator end()    const noexcept { return entries_.end(); }
    const_iterator cbegin() const noexcept { return entries_.cbegin(); }
    const_iterator cend()   const noexcept { return entries_.cend(); }

    // ─── Lookup ─────────────────────────────────────────────────────────

    /// O(1) key lookup for large objects, linear for small ones.
    [[nodiscard]] V* find(std::string_view key) noexcept {
        const size_type i = position(key);
        return i < entries_.size() ? &entries_[i].second : nullptr;
    }
    [[nodiscard]] const V* find(std::string_view key) const noexcept {
        const size_type i = position(key);
        return i < entries_.size() ? &entries_[i].second : nullptr;
    }
    [[nodiscard]] bool contains(std::string_view key) const noexcept {
        return position(key) < entries_.size();
    }

    // ─── Modification ───────────────────────────────────────────────────

    /// Insert or overwrite. Returns the previous value for @p key, if any.
    std::optional<V> insert(Key key, V value) {
        const size_type i = position(std::string_view(key));
        if (i < entries_.size()) {
            std::optional<V> prev(std::move(entries_[i].second));
            entries_[i].second = std::move(value);
            return prev;
        }
        append_unchecked(std::move(key), std::move(value));
        return std::nullopt;
    }

    /// Remove @p key. Returns the removed value, if any.
    std::optional<V> remove(std::string_view key) {
        const size_type i = position(key);
        if (i >= entries_.size()) return std::nullopt;
        std::optional<V> removed(std::move(entries_[i].second));
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(i));
        // Positions shifted; rebuild lazily on next lookup.
        index_.reset();
        return removed;
    }

    /// Append without checking for an existing key. The decode engine uses
    /// this and calls finalize() once the object is complete.
    void append_unchecked(Key key, V value) {
        const auto* old_data = entries_.data();
        entries_.emplace_back(std::move(key), std::move(value));
        if (index_) update_index_after_push(old_data);
    }

    /// Collapse repeated keys so that the last value of each key wins.
    ///
    /// Large objects: build the index in one forward pass (the last position
    /// of a key overwrites earlier ones), then compact if the index is
    /// smaller than the entry count. Small objects: O(n^2) reverse check.
    void finalize() {
        const size_type n = entries_.size();
        if (n >= kIndexThreshold) {
            rebuild_index();
            if (index_->size() < n) {
                std::vector<bool> keep(n, false);
                for (const auto& slot : *index_) keep[slot.second] = true;
                // Compaction moves keys, so the views must go first.
                index_.reset();
                size_type write = 0;
                for (size_type i = 0; i < n; ++i) {
                    if (!keep[i]) continue;
                    if (write != i) entries_[write] = std::move(entries_[i]);
                    ++write;
                }
                entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(write),
                               entries_.end());
                rebuild_index();
            }
        } else if (n >= 2) {
            for (size_type i = 0; i < entries_.size(); ) {
                bool has_later_dup = false;
                const std::string_view k(entries_[i].first);
                for (size_type j = i + 1; j < entries_.size(); ++j) {
                    if (k == std::string_view(entries_[j].first)) {
                        has_later_dup = true;
                        break;
                    }
                }
                if (DOMJSON_UNLIKELY(has_later_dup)) {
                    entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(i));
                } else {
                    ++i;
                }
            }
        }
    }

    void clear() noexcept {
        entries_.clear();
        index_.reset();
    }

    /// Order-insensitive comparison.
    [[nodiscard]] bool operator==(const BasicObject& other) const {
        if (size() != other.size()) return false;
        for (const auto& entry : entries_) {
            const V* p = other.find(std::string_view(entry.first));
            if (!p || !(*p == entry.second)) return false;
        }
        return true;
    }
    [[nodiscard]] bool operator!=(const BasicObject& other) const { return !(*this == other); }

    [[nodiscard]] const storage_type& storage() const noexcept { return entries_; }

private:
    storage_type entries_;
    mutable std::unique_ptr<index_type> index_;

    bool use_index() const noexcept { return entries_.size() >= kIndexThreshold; }

    /// Position of @p key in entries_, or size() when absent.
    size_type position(std::string_view key) const noexcept {
        if (use_index()) {
            if (!index_) rebuild_index();
            auto it = index_->find(key);
            return it != index_->end() ? it->second : entries_.size();
        }
        for (size_type i = 0; i < entries_.size(); ++i) {
            if (std::string_view(entries_[i].first) == key) return i;
        }
        return entries_.size();
    }

    void rebuild_index() const {
        if (!index_) {
            index_ = std::make_unique<index_type>(entries_.size() * 2);
        } else {
            index_->clear();
        }
        for (size_type i = 0; i < entries_.size(); ++i)
            (*index_)[std::string_view(entries_[i].first)] = i;
    }

    void update_index_after_push(const void* old_data) {
        if (entries_.data() != old_data) {
            // Reallocation moved every key; views are dangling.
            rebuild_index();
        } else {
            (*index_)[std::string_view(entries_.back().first)] = entries_.size() - 1;
        }
    }
};

} // namespace domjson
