#pragma once

/// @file id_map.hpp
/// @brief Dense id-keyed storage for idmap_structures
///
/// IdMap hands out the smallest free integer id for every inserted value
/// and supports O(1) insertion, removal and lookup by that id. Values live
/// in a raw buffer indexed by id; the BitSet of occupied ids is the only
/// record of which slots hold a constructed value. Ids are reused once
/// freed, so an IdMap suits entity tables, graph nodes and arenas whose
/// members refer to each other by index.

#include "fwd.hpp"
#include "bitset.hpp"
#include <algorithm>
#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iomanip>
#include <iterator>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace idmap_structures {

// =============================================================================
// Id
// =============================================================================

/// Identifier issued by an IdMap
///
/// Only meaningful for the map that issued it.
struct Id {
    std::size_t value = 0;

    constexpr Id() noexcept = default;

    constexpr explicit Id(std::size_t v) noexcept : value(v) {}

    /// Get the raw index
    [[nodiscard]] constexpr std::size_t get() const noexcept { return value; }

    constexpr bool operator==(const Id& other) const noexcept { return value == other.value; }
    constexpr bool operator!=(const Id& other) const noexcept { return value != other.value; }
    constexpr bool operator<(const Id& other) const noexcept { return value < other.value; }
    constexpr bool operator<=(const Id& other) const noexcept { return value <= other.value; }
    constexpr bool operator>(const Id& other) const noexcept { return value > other.value; }
    constexpr bool operator>=(const Id& other) const noexcept { return value >= other.value; }
};

inline std::ostream& operator<<(std::ostream& os, Id id) {
    return os << id.value;
}

} // namespace idmap_structures

namespace std {

template<>
struct hash<idmap_structures::Id> {
    std::size_t operator()(const idmap_structures::Id& id) const noexcept {
        return std::hash<std::size_t>{}(id.value);
    }
};

} // namespace std

namespace idmap_structures {

namespace detail {

/// Report checked access to an unoccupied id and throw std::out_of_range
[[noreturn]] void throw_missing_id(std::size_t id);

/// Walks occupied slots in increasing id order
///
/// The slot pointer advances by the distance between consecutive ids, i.e.
/// it skips exactly `next - current - 1` absent slots per step (the first
/// step lands `first id` slots past the base). Every yielded slot lies
/// strictly past the previous one, so references handed out during one
/// traversal never alias.
template<typename Slot>
class SlotCursor {
public:
    using size_type = std::size_t;

    SlotCursor() = default;

    SlotCursor(BitSet::Iter ids, Slot* base) noexcept
        : ids_(ids) {
        if (ids_.remaining() > 0) {
            id_ = *ids_;
            slot_ = base + id_;
        }
    }

    [[nodiscard]] Slot* slot() const noexcept { return slot_; }
    [[nodiscard]] size_type id() const noexcept { return id_; }
    [[nodiscard]] size_type remaining() const noexcept { return ids_.remaining(); }

    void step() noexcept {
        ++ids_;
        if (ids_.remaining() > 0) {
            const size_type next = *ids_;
            slot_ += next - id_;
            id_ = next;
        }
    }

    bool operator==(const SlotCursor& other) const noexcept {
        return ids_ == other.ids_;
    }

private:
    BitSet::Iter ids_{};
    Slot* slot_ = nullptr;
    size_type id_ = 0;
};

/// begin/end pair with a known length
template<typename It>
class Range {
public:
    Range(It first, It last) : first_(first), last_(last) {}

    [[nodiscard]] It begin() const { return first_; }
    [[nodiscard]] It end() const { return last_; }
    [[nodiscard]] std::size_t size() const noexcept { return first_.remaining(); }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

private:
    It first_;
    It last_;
};

template<typename T>
void write_debug(std::ostream& os, const T& value) {
    if constexpr (std::is_convertible_v<const T&, std::string_view>) {
        os << std::quoted(std::string_view(value));
    } else if constexpr (std::is_same_v<T, bool>) {
        os << (value ? "true" : "false");
    } else {
        os << value;
    }
}

} // namespace detail

// =============================================================================
// IdMap
// =============================================================================

/// Container assigning the smallest free id to every inserted value
/// @tparam T Stored value type
template<typename T>
class IdMap {
public:
    using key_type = Id;
    using value_type = T;
    using size_type = std::size_t;

private:
    using allocator_type = std::allocator<T>;
    using alloc_traits = std::allocator_traits<allocator_type>;

    BitSet ids_;                 // Occupied ids
    T* data_ = nullptr;          // Slot i is constructed iff ids_.contains(i)
    size_type capacity_ = 0;     // Allocated slots
    size_type bound_ = 0;        // Every occupied id is below this
    size_type space_ = 0;        // Smallest unoccupied id
    allocator_type alloc_;

    template<typename U>
    friend class IntoIter;

    // =========================================================================
    // Slot access
    //
    // The only code touching data_. Callers establish that the slot is
    // occupied (slot, destroy_slot, release) or unoccupied and addressable
    // (construct_slot) before calling.
    // =========================================================================

    [[nodiscard]] T* slot(size_type id) noexcept { return data_ + id; }
    [[nodiscard]] const T* slot(size_type id) const noexcept { return data_ + id; }

    template<typename... Args>
    void construct_slot(size_type id, Args&&... args) {
        alloc_traits::construct(alloc_, data_ + id, std::forward<Args>(args)...);
    }

    void destroy_slot(size_type id) noexcept {
        alloc_traits::destroy(alloc_, data_ + id);
    }

    /// Move the value out and destroy the slot; occupancy is left to the caller
    T take_slot(size_type id) {
        T value(std::move(*slot(id)));
        destroy_slot(id);
        return value;
    }

    /// Move every live value into a buffer of `new_capacity` slots
    /// Strong guarantee: on a throwing move/copy the old buffer is kept.
    void relocate(size_type new_capacity) {
        T* fresh = alloc_traits::allocate(alloc_, new_capacity);
        auto it = ids_.begin();
        try {
            for (; it != ids_.end(); ++it) {
                alloc_traits::construct(alloc_, fresh + *it, std::move_if_noexcept(*slot(*it)));
            }
        } catch (...) {
            for (auto done = ids_.begin(); done != it; ++done) {
                alloc_traits::destroy(alloc_, fresh + *done);
            }
            alloc_traits::deallocate(alloc_, fresh, new_capacity);
            throw;
        }

        for (size_type id : ids_) {
            destroy_slot(id);
        }
        if (data_) {
            alloc_traits::deallocate(alloc_, data_, capacity_);
        }
        data_ = fresh;
        capacity_ = new_capacity;
    }

    /// Free the buffer; no slot may be occupied
    void release_storage() noexcept {
        if (data_) {
            alloc_traits::deallocate(alloc_, data_, capacity_);
        }
        data_ = nullptr;
        capacity_ = 0;
    }

    /// Make slots [0, count) addressable, growing geometrically
    void ensure_slots(size_type count) {
        ids_.reserve(count);
        if (count > capacity_) {
            const size_type doubled = capacity_ == 0 ? size_type(4) : capacity_ * 2;
            relocate(std::max(count, doubled));
        }
    }

    // =========================================================================
    // Free cursor
    //
    // space_ is the smallest unoccupied id. Mutators call lower_cursor after
    // freeing an id and advance_cursor after occupying the id under it.
    // =========================================================================

    void lower_cursor(size_type id) noexcept {
        if (id < space_) {
            space_ = id;
        }
    }

    void advance_cursor() noexcept {
        while (ids_.contains(space_)) {
            ++space_;
        }
    }

    /// Construct a value in an unoccupied slot and mark it
    template<typename... Args>
    T& occupy(size_type id, Args&&... args) {
        ensure_slots(id + 1);
        construct_slot(id, std::forward<Args>(args)...);
        ids_.insert(id);  // Capacity reserved above, cannot throw
        if (id >= bound_) {
            bound_ = id + 1;
        }
        if (id == space_) {
            advance_cursor();
        }
        return *slot(id);
    }

    /// Destroy an occupied value and unmark it
    void release(size_type id) noexcept {
        destroy_slot(id);
        ids_.remove(id);
        lower_cursor(id);
    }

public:
    // =========================================================================
    // Constructors / Destructor
    // =========================================================================

    /// Create empty map
    IdMap() = default;

    /// Create with room for `capacity` values before reallocating
    explicit IdMap(size_type capacity) {
        reserve(capacity);
    }

    /// Create from a range; values get ids 0, 1, 2, ...
    template<std::input_iterator InputIt>
    IdMap(InputIt first, InputIt last) {
        extend(first, last);
    }

    /// Create from a list; values get ids 0, 1, 2, ...
    IdMap(std::initializer_list<T> values) {
        extend(values);
    }

    ~IdMap() {
        clear();
        release_storage();
    }

    /// Deep copy: same ids, copies of every occupied value, storage sized
    /// to the source's bound
    IdMap(const IdMap& other) : IdMap() {
        if (other.bound_ > 0) {
            ids_.reserve(other.bound_);
            relocate(other.bound_);
        }
        for (size_type id : other.ids_) {
            construct_slot(id, *other.slot(id));
            ids_.insert(id);
        }
        bound_ = other.bound_;
        space_ = other.space_;
    }

    IdMap& operator=(const IdMap& other) {
        if (this != &other) {
            IdMap copy(other);
            swap(copy);
        }
        return *this;
    }

    IdMap(IdMap&& other) noexcept
        : ids_(std::move(other.ids_))
        , data_(std::exchange(other.data_, nullptr))
        , capacity_(std::exchange(other.capacity_, 0))
        , bound_(std::exchange(other.bound_, 0))
        , space_(std::exchange(other.space_, 0)) {
        other.ids_.clear();
    }

    IdMap& operator=(IdMap&& other) noexcept {
        if (this != &other) {
            IdMap moved(std::move(other));
            swap(moved);
        }
        return *this;
    }

    void swap(IdMap& other) noexcept {
        using std::swap;
        swap(ids_, other.ids_);
        swap(data_, other.data_);
        swap(capacity_, other.capacity_);
        swap(bound_, other.bound_);
        swap(space_, other.space_);
    }

    // =========================================================================
    // Capacity
    // =========================================================================

    /// Number of occupied ids
    [[nodiscard]] size_type size() const noexcept { return ids_.len(); }

    /// Alias for size()
    [[nodiscard]] size_type len() const noexcept { return ids_.len(); }

    [[nodiscard]] bool empty() const noexcept { return ids_.empty(); }
    [[nodiscard]] bool is_empty() const noexcept { return empty(); }

    /// Slots allocated
    [[nodiscard]] size_type capacity() const noexcept { return capacity_; }

    /// High-water mark of occupied ids (exclusive)
    /// Removal never lowers it; shrink_to_fit() makes it tight again.
    [[nodiscard]] size_type storage_bound() const noexcept { return bound_; }

    /// Id the next insert() will return
    [[nodiscard]] Id next_id() const noexcept { return Id(space_); }

    /// Set of occupied ids
    [[nodiscard]] const BitSet& occupancy() const noexcept { return ids_; }

    /// Make room for `additional` slots past the storage bound
    void reserve(size_type additional) {
        const size_type wanted = bound_ + additional;
        ids_.reserve(wanted);
        if (wanted > capacity_) {
            relocate(wanted);
        }
    }

    /// Shrink the storage bound to the last occupied id and release unused
    /// slots. Ids and values are unchanged.
    void shrink_to_fit() {
        const size_type last = ids_.find_last();
        bound_ = last == BitSet::npos ? 0 : last + 1;
        if (capacity_ > bound_) {
            if (bound_ == 0) {
                release_storage();
            } else {
                relocate(bound_);
            }
        }
        ids_.shrink_to_fit();
    }

    // =========================================================================
    // Insertion
    // =========================================================================

    /// Insert a value at the smallest free id
    /// @return The id now holding the value
    Id insert(T value) {
        const size_type id = space_;
        occupy(id, std::move(value));
        return Id(id);
    }

    /// Construct a value from `args` directly in the slot at the smallest
    /// free id. Arguments must not refer into this map.
    template<typename... Args>
    Id emplace(Args&&... args) {
        const size_type id = space_;
        occupy(id, std::forward<Args>(args)...);
        return Id(id);
    }

    /// Store a value under a caller-chosen id
    /// @return The value previously stored there, if any
    std::optional<T> insert_at(Id id, T value) {
        if (ids_.contains(id.value)) {
            return std::optional<T>(std::exchange(*slot(id.value), std::move(value)));
        }
        occupy(id.value, std::move(value));
        return std::nullopt;
    }

    /// Value under `id`, inserting `value` there first if it is free
    T& get_or_insert(Id id, T value) {
        if (ids_.contains(id.value)) {
            return *slot(id.value);
        }
        return occupy(id.value, std::move(value));
    }

    /// Value under `id`, inserting `producer()` there first if it is free
    /// The producer is only called when the id is free.
    template<typename F>
    T& get_or_insert_with(Id id, F&& producer) {
        if (ids_.contains(id.value)) {
            return *slot(id.value);
        }
        return occupy(id.value, std::invoke(std::forward<F>(producer)));
    }

    /// Insert every value of a range
    template<std::input_iterator InputIt>
    void extend(InputIt first, InputIt last) {
        for (; first != last; ++first) {
            insert(*first);
        }
    }

    void extend(std::initializer_list<T> values) {
        extend(values.begin(), values.end());
    }

    // =========================================================================
    // Removal
    // =========================================================================

    /// Remove the value under `id`
    /// @return The removed value, or nullopt if the id was free
    std::optional<T> remove(Id id) {
        if (!ids_.contains(id.value)) {
            return std::nullopt;
        }
        std::optional<T> value(take_slot(id.value));
        ids_.remove(id.value);
        lower_cursor(id.value);
        return value;
    }

    /// Remove the value under `id` without returning it
    /// @return true if a value was removed
    bool erase(Id id) noexcept {
        if (!ids_.contains(id.value)) {
            return false;
        }
        release(id.value);
        return true;
    }

    /// Remove every occupied id that is a member of `ids`
    /// @return Number of values removed
    size_type remove_set(const BitSet& ids) {
        const BitSet doomed = ids_.intersection(ids);
        if (doomed.empty()) {
            return 0;
        }
        // Traversal is increasing, so the first doomed id is the smallest
        lower_cursor(*doomed.begin());
        for (size_type id : doomed) {
            destroy_slot(id);
        }
        ids_.inplace_difference(ids);
        return doomed.len();
    }

    /// Keep only values for which `pred(Id, T&)` returns true
    ///
    /// Visits each occupied id once, in increasing order. If the predicate
    /// throws, the removals made so far stay committed.
    template<typename Pred>
    void retain(Pred&& pred) {
        for (size_type id = ids_.find_first(); id != BitSet::npos; id = ids_.find_next(id + 1)) {
            if (!std::invoke(pred, Id(id), *slot(id))) {
                release(id);
            }
        }
    }

    /// Destroy every value; capacity is kept
    void clear() noexcept {
        for (size_type id : ids_) {
            destroy_slot(id);
        }
        ids_.clear();
        bound_ = 0;
        space_ = 0;
    }

    // =========================================================================
    // Lookup
    // =========================================================================

    [[nodiscard]] bool contains(Id id) const noexcept {
        return ids_.contains(id.value);
    }

    /// Get immutable pointer to value
    /// @return Pointer to value or nullptr if the id is free
    [[nodiscard]] const T* get(Id id) const noexcept {
        return ids_.contains(id.value) ? slot(id.value) : nullptr;
    }

    /// Get mutable pointer to value
    /// @return Pointer to value or nullptr if the id is free
    [[nodiscard]] T* get(Id id) noexcept {
        return ids_.contains(id.value) ? slot(id.value) : nullptr;
    }

    /// Checked access (throws std::out_of_range if the id is free)
    [[nodiscard]] const T& at(Id id) const {
        if (!ids_.contains(id.value)) {
            detail::throw_missing_id(id.value);
        }
        return *slot(id.value);
    }

    [[nodiscard]] T& at(Id id) {
        if (!ids_.contains(id.value)) {
            detail::throw_missing_id(id.value);
        }
        return *slot(id.value);
    }

    /// Checked access, same contract as at()
    [[nodiscard]] const T& operator[](Id id) const { return at(id); }
    [[nodiscard]] T& operator[](Id id) { return at(id); }

    // =========================================================================
    // Iterators
    // =========================================================================

    /// Yields (Id, value&) pairs in increasing id order
    template<bool IsConst>
    class Iterator {
    public:
        using slot_type = std::conditional_t<IsConst, const T, T>;
        using value_ref = slot_type&;
        using iterator_category = std::input_iterator_tag;
        using iterator_concept = std::forward_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = std::pair<Id, value_ref>;
        using reference = value_type;
        using pointer = void;

        Iterator() = default;
        Iterator(BitSet::Iter ids, slot_type* base) noexcept : cursor_(ids, base) {}

        value_type operator*() const noexcept {
            return {Id(cursor_.id()), *cursor_.slot()};
        }

        Iterator& operator++() noexcept {
            cursor_.step();
            return *this;
        }

        Iterator operator++(int) noexcept {
            Iterator tmp = *this;
            cursor_.step();
            return tmp;
        }

        [[nodiscard]] size_type remaining() const noexcept { return cursor_.remaining(); }

        bool operator==(const Iterator& other) const noexcept { return cursor_ == other.cursor_; }
        bool operator!=(const Iterator& other) const noexcept { return !(*this == other); }

    private:
        detail::SlotCursor<slot_type> cursor_;
    };

    /// Yields value references in increasing id order
    template<bool IsConst>
    class ValueIterator {
    public:
        using slot_type = std::conditional_t<IsConst, const T, T>;
        using iterator_category = std::forward_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = T;
        using reference = slot_type&;
        using pointer = slot_type*;

        ValueIterator() = default;
        ValueIterator(BitSet::Iter ids, slot_type* base) noexcept : cursor_(ids, base) {}

        reference operator*() const noexcept { return *cursor_.slot(); }
        pointer operator->() const noexcept { return cursor_.slot(); }

        ValueIterator& operator++() noexcept {
            cursor_.step();
            return *this;
        }

        ValueIterator operator++(int) noexcept {
            ValueIterator tmp = *this;
            cursor_.step();
            return tmp;
        }

        [[nodiscard]] size_type remaining() const noexcept { return cursor_.remaining(); }

        bool operator==(const ValueIterator& other) const noexcept { return cursor_ == other.cursor_; }
        bool operator!=(const ValueIterator& other) const noexcept { return !(*this == other); }

    private:
        detail::SlotCursor<slot_type> cursor_;
    };

    /// Yields ids in increasing order
    class IdIterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using iterator_concept = std::forward_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = Id;
        using reference = Id;
        using pointer = void;

        IdIterator() = default;
        explicit IdIterator(BitSet::Iter ids) noexcept : ids_(ids) {}

        Id operator*() const noexcept { return Id(*ids_); }

        IdIterator& operator++() noexcept {
            ++ids_;
            return *this;
        }

        IdIterator operator++(int) noexcept {
            IdIterator tmp = *this;
            ++ids_;
            return tmp;
        }

        [[nodiscard]] size_type remaining() const noexcept { return ids_.remaining(); }

        bool operator==(const IdIterator& other) const noexcept { return ids_ == other.ids_; }
        bool operator!=(const IdIterator& other) const noexcept { return !(*this == other); }

    private:
        BitSet::Iter ids_{};
    };

    using iterator = Iterator<false>;
    using const_iterator = Iterator<true>;

    iterator begin() noexcept { return iterator(ids_.begin(), data_); }
    iterator end() noexcept { return iterator(ids_.end(), data_); }
    const_iterator begin() const noexcept { return const_iterator(ids_.begin(), data_); }
    const_iterator end() const noexcept { return const_iterator(ids_.end(), data_); }
    const_iterator cbegin() const noexcept { return begin(); }
    const_iterator cend() const noexcept { return end(); }

    /// Iterate over ids only
    [[nodiscard]] detail::Range<IdIterator> ids() const noexcept {
        return {IdIterator(ids_.begin()), IdIterator(ids_.end())};
    }

    /// Iterate over values only
    [[nodiscard]] detail::Range<ValueIterator<true>> values() const noexcept {
        return {ValueIterator<true>(ids_.begin(), data_), ValueIterator<true>(ids_.end(), data_)};
    }

    /// Iterate over mutable values only
    [[nodiscard]] detail::Range<ValueIterator<false>> values() noexcept {
        return values_mut();
    }

    [[nodiscard]] detail::Range<ValueIterator<false>> values_mut() noexcept {
        return {ValueIterator<false>(ids_.begin(), data_), ValueIterator<false>(ids_.end(), data_)};
    }

    /// Consume the map, yielding (Id, T) pairs in increasing id order
    [[nodiscard]] IntoIter<T> into_iter() &&;

    // =========================================================================
    // Comparison
    // =========================================================================

    /// Equal when both hold the same ids with equal values under each
    bool operator==(const IdMap& other) const {
        if (ids_ != other.ids_) {
            return false;
        }
        for (size_type id : ids_) {
            if (!(*slot(id) == *other.slot(id))) {
                return false;
            }
        }
        return true;
    }

    bool operator!=(const IdMap& other) const {
        return !(*this == other);
    }
};

template<typename T>
void swap(IdMap<T>& a, IdMap<T>& b) noexcept {
    a.swap(b);
}

/// Renders as {id: value, id: value} in increasing id order
template<typename T>
std::ostream& operator<<(std::ostream& os, const IdMap<T>& map) {
    os << '{';
    bool first = true;
    for (auto [id, value] : map) {
        if (!first) {
            os << ", ";
        }
        first = false;
        os << id << ": ";
        detail::write_debug(os, value);
    }
    return os << '}';
}

// =============================================================================
// IntoIter - Consuming traversal
// =============================================================================

/// Owns an IdMap and moves its values out in increasing id order
///
/// Values not yet yielded are destroyed with the IntoIter. Single pass;
/// neither copyable nor movable, so keep it where into_iter() returned it.
template<typename T>
class IntoIter {
public:
    using size_type = std::size_t;
    using item_type = std::pair<Id, T>;

    explicit IntoIter(IdMap<T>&& map)
        : map_(std::move(map))
        , cursor_(map_.ids_.begin(), map_.data_) {}

    ~IntoIter() {
        for (; cursor_.remaining() > 0; cursor_.step()) {
            IdMap<T>::alloc_traits::destroy(map_.alloc_, cursor_.slot());
        }
        // Every slot is now destroyed; keep ~IdMap from touching them again
        map_.ids_.clear();
    }

    IntoIter(const IntoIter&) = delete;
    IntoIter& operator=(const IntoIter&) = delete;
    IntoIter(IntoIter&&) = delete;
    IntoIter& operator=(IntoIter&&) = delete;

    /// Next pair, or nullopt once every value has been yielded
    std::optional<item_type> next() {
        if (cursor_.remaining() == 0) {
            return std::nullopt;
        }
        T* slot = cursor_.slot();
        std::optional<item_type> item(std::in_place, Id(cursor_.id()), std::move(*slot));
        IdMap<T>::alloc_traits::destroy(map_.alloc_, slot);
        cursor_.step();
        return item;
    }

    /// Values not yet yielded
    [[nodiscard]] size_type remaining() const noexcept { return cursor_.remaining(); }

    /// Input iterator over the remaining pairs
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = item_type;
        using reference = item_type&;
        using pointer = item_type*;

        Iterator() = default;

        explicit Iterator(IntoIter* owner) : owner_(owner) {
            advance();
        }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }

        Iterator& operator++() {
            advance();
            return *this;
        }

        bool operator==(const Iterator& other) const noexcept {
            return current_.has_value() == other.current_.has_value();
        }

        bool operator!=(const Iterator& other) const noexcept {
            return !(*this == other);
        }

    private:
        void advance() {
            current_.reset();
            if (auto item = owner_->next()) {
                current_.emplace(std::move(*item));
            }
        }

        IntoIter* owner_ = nullptr;
        mutable std::optional<item_type> current_;
    };

    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

private:
    IdMap<T> map_;
    detail::SlotCursor<T> cursor_;
};

template<typename T>
IntoIter<T> IdMap<T>::into_iter() && {
    return IntoIter<T>(std::move(*this));
}

} // namespace idmap_structures
