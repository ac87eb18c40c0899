#pragma once

/// @file slot_map.hpp
/// @brief Generational index-based storage for habitat_structures
///
/// SlotMap provides O(1) insertion, removal, and lookup with use-after-free
/// detection through generational indices. Removed slots go on a free list and
/// are reused; the generation bump on removal makes every key that pointed at
/// the old occupant stale.

#include <vector>
#include <optional>
#include <cstdint>
#include <functional>
#include <limits>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace habitat_structures {

// =============================================================================
// SlotKey - Generational Key
// =============================================================================

/// Generational key with use-after-free detection
/// @tparam T Value type (provides compile-time type safety, not stored)
template<typename T>
struct SlotKey {
    std::uint32_t index = std::numeric_limits<std::uint32_t>::max();
    std::uint32_t generation = 0;

    /// Default constructor - creates null key
    constexpr SlotKey() noexcept = default;

    /// Create key with specific index and generation
    constexpr SlotKey(std::uint32_t idx, std::uint32_t gen) noexcept
        : index(idx), generation(gen) {}

    /// Create a null/invalid key
    [[nodiscard]] static constexpr SlotKey null() noexcept {
        return SlotKey{};
    }

    [[nodiscard]] constexpr bool is_null() const noexcept {
        return index == std::numeric_limits<std::uint32_t>::max();
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return !is_null();
    }

    constexpr bool operator==(const SlotKey& other) const noexcept {
        return index == other.index && generation == other.generation;
    }

    constexpr bool operator!=(const SlotKey& other) const noexcept {
        return !(*this == other);
    }

    /// Explicit bool conversion (true if valid)
    explicit constexpr operator bool() const noexcept {
        return is_valid();
    }
};

} // namespace habitat_structures

// =============================================================================
// std::hash specialization for SlotKey
// =============================================================================

namespace std {

template<typename T>
struct hash<habitat_structures::SlotKey<T>> {
    std::size_t operator()(const habitat_structures::SlotKey<T>& key) const noexcept {
        std::size_t h = static_cast<std::size_t>(key.index);
        h ^= static_cast<std::size_t>(key.generation) << 16;
        h ^= static_cast<std::size_t>(key.generation) >> 16;
        return h;
    }
};

} // namespace std

namespace habitat_structures {

// =============================================================================
// SlotMap - Generational Index Storage
// =============================================================================

/// Generational index-based storage with O(1) operations
///
/// Pointers returned by get() are invalidated by the next insert (the slot
/// vector may grow); keys stay valid until their value is removed.
/// @tparam T Stored value type
template<typename T>
class SlotMap {
public:
    using key_type = SlotKey<T>;
    using value_type = T;
    using size_type = std::size_t;

private:
    struct Slot {
        std::uint32_t generation = 0;
        std::optional<T> value;
    };

    std::vector<Slot> slots_;
    std::vector<std::uint32_t> free_list_;
    size_type len_ = 0;

    key_type acquire_slot() {
        if (!free_list_.empty()) {
            std::uint32_t idx = free_list_.back();
            free_list_.pop_back();
            return key_type(idx, slots_[idx].generation);
        }
        auto idx = static_cast<std::uint32_t>(slots_.size());
        slots_.emplace_back();
        return key_type(idx, 0);
    }

public:
    SlotMap() = default;

    explicit SlotMap(size_type capacity) {
        slots_.reserve(capacity);
    }

    // =========================================================================
    // Capacity
    // =========================================================================

    /// Number of live elements
    [[nodiscard]] size_type size() const noexcept { return len_; }

    [[nodiscard]] bool empty() const noexcept { return len_ == 0; }

    /// Number of slots ever allocated (live + free)
    [[nodiscard]] size_type slot_count() const noexcept { return slots_.size(); }

    void reserve(size_type additional) {
        slots_.reserve(slots_.size() + additional);
    }

    // =========================================================================
    // Insertion
    // =========================================================================

    /// Insert a value and return its key (O(1) amortized)
    key_type insert(T value) {
        key_type key = acquire_slot();
        slots_[key.index].value.emplace(std::move(value));
        ++len_;
        return key;
    }

    /// Insert with in-place construction
    template<typename... Args>
    key_type emplace(Args&&... args) {
        key_type key = acquire_slot();
        slots_[key.index].value.emplace(std::forward<Args>(args)...);
        ++len_;
        return key;
    }

    // =========================================================================
    // Removal
    // =========================================================================

    /// Remove value by key
    /// @return The removed value if key was valid
    std::optional<T> remove(key_type key) {
        if (!contains_key(key)) {
            return std::nullopt;
        }

        Slot& slot = slots_[key.index];
        std::optional<T> value = std::move(slot.value);
        slot.value.reset();
        slot.generation++;
        free_list_.push_back(key.index);
        --len_;

        return value;
    }

    /// Remove value by key without returning it
    bool erase(key_type key) {
        return remove(key).has_value();
    }

    /// Remove all elements; every outstanding key becomes stale
    void clear() {
        free_list_.clear();
        for (std::uint32_t i = 0; i < slots_.size(); ++i) {
            Slot& slot = slots_[i];
            if (slot.value) {
                slot.value.reset();
                slot.generation++;
            }
            free_list_.push_back(i);
        }
        len_ = 0;
    }

    // =========================================================================
    // Lookup
    // =========================================================================

    [[nodiscard]] bool contains_key(key_type key) const noexcept {
        if (key.is_null() || key.index >= slots_.size()) {
            return false;
        }
        const Slot& slot = slots_[key.index];
        return slot.value.has_value() && slot.generation == key.generation;
    }

    /// @return Pointer to value or nullptr if key invalid
    [[nodiscard]] const T* get(key_type key) const noexcept {
        if (!contains_key(key)) {
            return nullptr;
        }
        return &*slots_[key.index].value;
    }

    /// @return Pointer to value or nullptr if key invalid
    [[nodiscard]] T* get(key_type key) noexcept {
        if (!contains_key(key)) {
            return nullptr;
        }
        return &*slots_[key.index].value;
    }

    /// Get reference (throws if invalid)
    [[nodiscard]] const T& at(key_type key) const {
        const T* ptr = get(key);
        if (!ptr) {
            throw std::out_of_range("SlotMap: invalid key");
        }
        return *ptr;
    }

    [[nodiscard]] T& at(key_type key) {
        T* ptr = get(key);
        if (!ptr) {
            throw std::out_of_range("SlotMap: invalid key");
        }
        return *ptr;
    }

    // =========================================================================
    // Iterators
    // =========================================================================

    /// Iterator over live slots yielding (key, value&) pairs in slot order
    template<bool IsConst>
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using slot_vec = std::conditional_t<IsConst, const std::vector<Slot>, std::vector<Slot>>;
        using value_ref = std::conditional_t<IsConst, const T&, T&>;
        using pair_type = std::pair<key_type, value_ref>;

    private:
        slot_vec* slots_;
        std::uint32_t index_;

        void skip_empty() {
            while (index_ < slots_->size() && !(*slots_)[index_].value) {
                ++index_;
            }
        }

    public:
        Iterator(slot_vec* slots, std::uint32_t start)
            : slots_(slots), index_(start) {
            skip_empty();
        }

        pair_type operator*() const {
            auto& slot = (*slots_)[index_];
            return {key_type(index_, slot.generation), *slot.value};
        }

        Iterator& operator++() {
            ++index_;
            skip_empty();
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const Iterator& other) const {
            return slots_ == other.slots_ && index_ == other.index_;
        }

        bool operator!=(const Iterator& other) const {
            return !(*this == other);
        }
    };

    using iterator = Iterator<false>;
    using const_iterator = Iterator<true>;

    iterator begin() { return iterator(&slots_, 0); }
    iterator end() { return iterator(&slots_, static_cast<std::uint32_t>(slots_.size())); }
    const_iterator begin() const { return const_iterator(&slots_, 0); }
    const_iterator end() const { return const_iterator(&slots_, static_cast<std::uint32_t>(slots_.size())); }
};

} // namespace habitat_structures
