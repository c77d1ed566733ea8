#pragma once

/// @file sparse_map.hpp
/// @brief Map from small non-negative integer keys to values.
///
/// SparseMap<V> stores values in a slot vector indexed directly by key, so
/// lookup is O(1) and iteration visits present keys in ascending order.
/// Memory grows with the largest key ever inserted, not with Size().

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace csb::collections {

/// Slot-vector map keyed by std::size_t.
///
/// Memory layout:
/// @code
///   slots_[key] -> std::optional<V>  (empty when the key is absent)
///   count_      -> number of engaged slots
/// @endcode
template <typename V>
class SparseMap {
public:
    static_assert(std::is_move_constructible_v<V>, "Value type must be move-constructible");

    using key_type = std::size_t;
    using mapped_type = V;

    /// Forward iterator over present entries in ascending key order.
    /// Dereferences to a pair of (key, const value&).
    class const_iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<key_type, const V&>;
        using difference_type = std::ptrdiff_t;
        using reference = value_type;
        using pointer = void;

        const_iterator() = default;

        reference operator*() const { return {pos_, *(*slots_)[pos_]}; }

        const_iterator& operator++() {
            ++pos_;
            skipEmpty();
            return *this;
        }

        const_iterator operator++(int) {
            auto tmp = *this;
            ++*this;
            return tmp;
        }

        bool operator==(const const_iterator& other) const noexcept {
            return pos_ == other.pos_;
        }
        bool operator!=(const const_iterator& other) const noexcept {
            return pos_ != other.pos_;
        }

    private:
        friend class SparseMap;

        const_iterator(const std::vector<std::optional<V>>* slots, std::size_t pos)
            : slots_(slots), pos_(pos) {
            skipEmpty();
        }

        void skipEmpty() {
            while (pos_ < slots_->size() && !(*slots_)[pos_].has_value()) {
                ++pos_;
            }
        }

        const std::vector<std::optional<V>>* slots_ = nullptr;
        std::size_t pos_ = 0;
    };

    using iterator = const_iterator;

    // ── Capacity ────────────────────────────────────────────────────────

    /// Number of present keys.
    [[nodiscard]] std::size_t Size() const noexcept { return count_; }

    /// True when no key is present.
    [[nodiscard]] bool Empty() const noexcept { return count_ == 0; }

    /// Number of allocated slots (one past the largest insertable key
    /// without reallocation).
    [[nodiscard]] std::size_t Capacity() const noexcept { return slots_.size(); }

    /// Pre-allocate slots for keys in [0, slots).
    void Reserve(std::size_t slots) {
        if (slots > slots_.size()) {
            slots_.resize(slots);
        }
    }

    /// Drop trailing empty slots.
    void ShrinkToFit() {
        while (!slots_.empty() && !slots_.back().has_value()) {
            slots_.pop_back();
        }
        slots_.shrink_to_fit();
    }

    // ── CRUD ────────────────────────────────────────────────────────────

    /// Insert or overwrite the value at @p key.
    /// @return The previous value, if the key was present.
    /// @throws std::length_error when @p key cannot be addressed by a slot.
    std::optional<V> Insert(key_type key, V value) {
        if (key >= slots_.max_size()) {
            throw std::length_error("SparseMap key exceeds slot capacity");
        }
        if (key >= slots_.size()) {
            slots_.resize(key + 1);
        }
        auto& slot = slots_[key];
        std::optional<V> previous;
        if (slot.has_value()) {
            previous = std::move(slot);
        } else {
            ++count_;
        }
        slot = std::move(value);
        return previous;
    }

    /// Pointer to the value at @p key, or nullptr when absent.
    [[nodiscard]] const V* Get(key_type key) const noexcept {
        if (key < slots_.size() && slots_[key].has_value()) {
            return &*slots_[key];
        }
        return nullptr;
    }

    /// Mutable pointer to the value at @p key, or nullptr when absent.
    [[nodiscard]] V* Get(key_type key) noexcept {
        if (key < slots_.size() && slots_[key].has_value()) {
            return &*slots_[key];
        }
        return nullptr;
    }

    /// Check whether @p key is present.
    [[nodiscard]] bool Has(key_type key) const noexcept {
        return key < slots_.size() && slots_[key].has_value();
    }

    /// Remove the value at @p key.
    /// @return The removed value; empty if the key was absent (no-op).
    std::optional<V> Remove(key_type key) {
        if (!Has(key)) {
            return std::nullopt;
        }
        std::optional<V> removed = std::move(slots_[key]);
        slots_[key].reset();
        --count_;
        return removed;
    }

    /// Remove every entry. Slot capacity is kept.
    void Clear() noexcept {
        for (auto& slot : slots_) {
            slot.reset();
        }
        count_ = 0;
    }

    // ── Iteration ───────────────────────────────────────────────────────

    [[nodiscard]] const_iterator begin() const { return const_iterator(&slots_, 0); }
    [[nodiscard]] const_iterator end() const { return const_iterator(&slots_, slots_.size()); }
    [[nodiscard]] const_iterator cbegin() const { return begin(); }
    [[nodiscard]] const_iterator cend() const { return end(); }

    /// Equal when both hold the same keys mapped to equal values.
    /// Slot capacity does not take part.
    friend bool operator==(const SparseMap& a, const SparseMap& b) {
        if (a.count_ != b.count_) {
            return false;
        }
        for (const auto& [key, val] : a) {
            const V* other = b.Get(key);
            if (other == nullptr || !(*other == val)) {
                return false;
            }
        }
        return true;
    }

    friend bool operator!=(const SparseMap& a, const SparseMap& b) {
        return !(a == b);
    }

private:
    std::vector<std::optional<V>> slots_;  ///< key -> value (or empty).
    std::size_t count_ = 0;                ///< Engaged slot count.
};

}  // namespace csb::collections
