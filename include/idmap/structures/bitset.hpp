#pragma once

/// @file bitset.hpp
/// @brief Ordered integer set backed by bit words
///
/// BitSet stores a set of non-negative integers as one bit per value and
/// grows on demand. Membership, insertion and removal are O(1); traversal
/// visits members in strictly increasing order and skips empty words.
/// IdMap uses it as the sole record of which ids hold a value.

#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <bit>
#include <initializer_list>
#include <iterator>
#include <limits>

namespace idmap_structures {

/// Growable ordered set of non-negative integers
class BitSet {
public:
    using word_type = std::uint64_t;
    using size_type = std::size_t;
    using value_type = size_type;

    static constexpr size_type BITS_PER_WORD = 64;

    /// Returned by the find_* queries when no member qualifies
    static constexpr size_type npos = std::numeric_limits<size_type>::max();

private:
    std::vector<word_type> bits_;
    size_type count_ = 0;  // Number of members

    [[nodiscard]] static constexpr size_type words_for_bits(size_type n) noexcept {
        return (n + BITS_PER_WORD - 1) / BITS_PER_WORD;
    }

    [[nodiscard]] static constexpr size_type word_index(size_type bit) noexcept {
        return bit / BITS_PER_WORD;
    }

    [[nodiscard]] static constexpr size_type bit_offset(size_type bit) noexcept {
        return bit % BITS_PER_WORD;
    }

    [[nodiscard]] static constexpr word_type bit_mask(size_type bit) noexcept {
        return word_type(1) << bit_offset(bit);
    }

    /// Drop trailing zero words so equal sets compare equal word by word
    void trim() noexcept {
        while (!bits_.empty() && bits_.back() == 0) {
            bits_.pop_back();
        }
    }

    void recount() noexcept {
        count_ = 0;
        for (word_type word : bits_) {
            count_ += static_cast<size_type>(std::popcount(word));
        }
    }

public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Create empty set
    BitSet() = default;

    /// Create empty set with room for values below `capacity`
    explicit BitSet(size_type capacity) {
        reserve(capacity);
    }

    /// Create from a list of members
    BitSet(std::initializer_list<size_type> members) {
        for (size_type value : members) {
            insert(value);
        }
    }

    /// Create from an iterator range of members
    template<typename InputIt>
    BitSet(InputIt first, InputIt last) {
        for (; first != last; ++first) {
            insert(static_cast<size_type>(*first));
        }
    }

    // =========================================================================
    // Capacity
    // =========================================================================

    /// Number of members
    [[nodiscard]] size_type len() const noexcept { return count_; }

    /// Alias for len()
    [[nodiscard]] size_type size() const noexcept { return count_; }

    [[nodiscard]] bool empty() const noexcept { return count_ == 0; }
    [[nodiscard]] bool is_empty() const noexcept { return empty(); }

    /// Values below this bound can be inserted without allocating
    [[nodiscard]] size_type capacity() const noexcept {
        return bits_.capacity() * BITS_PER_WORD;
    }

    /// Make room for values below `bits`
    void reserve(size_type bits) {
        bits_.reserve(words_for_bits(bits));
    }

    /// Release storage not needed by the current members
    void shrink_to_fit() {
        trim();
        bits_.shrink_to_fit();
    }

    /// Remove all members, keeping storage
    void clear() noexcept {
        bits_.clear();
        count_ = 0;
    }

    // =========================================================================
    // Membership
    // =========================================================================

    [[nodiscard]] bool contains(size_type value) const noexcept {
        const size_type w = word_index(value);
        return w < bits_.size() && (bits_[w] & bit_mask(value)) != 0;
    }

    /// Add a member
    /// @return true if the value was not already present
    bool insert(size_type value) {
        const size_type w = word_index(value);
        if (w >= bits_.size()) {
            bits_.resize(w + 1, 0);
        }
        word_type& word = bits_[w];
        if (word & bit_mask(value)) {
            return false;
        }
        word |= bit_mask(value);
        ++count_;
        return true;
    }

    /// Remove a member
    /// @return true if the value was present
    bool remove(size_type value) noexcept {
        const size_type w = word_index(value);
        if (w >= bits_.size() || (bits_[w] & bit_mask(value)) == 0) {
            return false;
        }
        bits_[w] &= ~bit_mask(value);
        --count_;
        return true;
    }

    // =========================================================================
    // Ordered Queries
    // =========================================================================

    /// Smallest member, or npos
    [[nodiscard]] size_type find_first() const noexcept {
        return find_next(0);
    }

    /// Smallest member >= from, or npos
    [[nodiscard]] size_type find_next(size_type from) const noexcept {
        size_type w = word_index(from);
        if (w >= bits_.size()) {
            return npos;
        }
        word_type word = bits_[w] & (~word_type(0) << bit_offset(from));
        while (word == 0) {
            if (++w == bits_.size()) {
                return npos;
            }
            word = bits_[w];
        }
        return w * BITS_PER_WORD + static_cast<size_type>(std::countr_zero(word));
    }

    /// Largest member, or npos
    [[nodiscard]] size_type find_last() const noexcept {
        for (size_type w = bits_.size(); w-- > 0;) {
            if (bits_[w] != 0) {
                return w * BITS_PER_WORD + (BITS_PER_WORD - 1)
                    - static_cast<size_type>(std::countl_zero(bits_[w]));
            }
        }
        return npos;
    }

    // =========================================================================
    // Set Algebra
    // =========================================================================

    /// Members present in both sets
    [[nodiscard]] BitSet intersection(const BitSet& other) const {
        BitSet result;
        const size_type words = std::min(bits_.size(), other.bits_.size());
        result.bits_.resize(words, 0);
        for (size_type i = 0; i < words; ++i) {
            result.bits_[i] = bits_[i] & other.bits_[i];
        }
        result.trim();
        result.recount();
        return result;
    }

    /// Members of this set absent from `other`
    [[nodiscard]] BitSet difference(const BitSet& other) const {
        BitSet result(*this);
        result.inplace_difference(other);
        return result;
    }

    /// Keep only members also present in `other`
    void inplace_intersection(const BitSet& other) noexcept {
        const size_type words = std::min(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            bits_[i] &= other.bits_[i];
        }
        bits_.resize(words);
        trim();
        recount();
    }

    /// Remove every member of `other`
    void inplace_difference(const BitSet& other) noexcept {
        const size_type words = std::min(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            bits_[i] &= ~other.bits_[i];
        }
        recount();
    }

    /// Add every member of `other`
    void inplace_union(const BitSet& other) {
        if (other.bits_.size() > bits_.size()) {
            bits_.resize(other.bits_.size(), 0);
        }
        for (size_type i = 0; i < other.bits_.size(); ++i) {
            bits_[i] |= other.bits_[i];
        }
        recount();
    }

    // =========================================================================
    // Iterator over members
    // =========================================================================

    /// Yields members in increasing order
    ///
    /// The iterator knows how many members remain, so end() is simply the
    /// state with nothing left. It reads one word at a time: removing a
    /// member that was already visited does not disturb it, any other
    /// mutation of the set invalidates it.
    class Iter {
        const word_type* words_ = nullptr;
        size_type word_ = 0;        // Index of the word holding the current member
        word_type pending_ = 0;     // Unvisited bits of that word, current included
        size_type remaining_ = 0;   // Members left, current included

        void seek_nonzero() noexcept {
            while (pending_ == 0) {
                pending_ = words_[++word_];
            }
        }

    public:
        using iterator_category = std::input_iterator_tag;
        using iterator_concept = std::forward_iterator_tag;
        using value_type = size_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const size_type*;
        using reference = size_type;

        Iter() = default;

        Iter(const word_type* words, size_type count) noexcept
            : words_(words), remaining_(count) {
            if (remaining_ > 0) {
                pending_ = words_[0];
                seek_nonzero();
            }
        }

        size_type operator*() const noexcept {
            return word_ * BITS_PER_WORD + static_cast<size_type>(std::countr_zero(pending_));
        }

        Iter& operator++() noexcept {
            pending_ &= pending_ - 1;
            if (--remaining_ > 0) {
                seek_nonzero();
            }
            return *this;
        }

        Iter operator++(int) noexcept {
            Iter tmp = *this;
            ++(*this);
            return tmp;
        }

        /// Members not yet consumed, the current one included
        [[nodiscard]] size_type remaining() const noexcept { return remaining_; }

        bool operator==(const Iter& other) const noexcept {
            return remaining_ == other.remaining_;
        }

        bool operator!=(const Iter& other) const noexcept {
            return !(*this == other);
        }
    };

    using iterator = Iter;
    using const_iterator = Iter;

    [[nodiscard]] Iter begin() const noexcept { return Iter(bits_.data(), count_); }
    [[nodiscard]] Iter end() const noexcept { return Iter(bits_.data(), 0); }

    // =========================================================================
    // Comparison
    // =========================================================================

    /// Sets are equal when they hold the same members
    bool operator==(const BitSet& other) const noexcept {
        if (count_ != other.count_) return false;
        const size_type common = std::min(bits_.size(), other.bits_.size());
        if (!std::equal(bits_.begin(), bits_.begin() + static_cast<std::ptrdiff_t>(common),
                        other.bits_.begin())) {
            return false;
        }
        const auto& longer = bits_.size() > other.bits_.size() ? bits_ : other.bits_;
        return std::all_of(longer.begin() + static_cast<std::ptrdiff_t>(common), longer.end(),
                           [](word_type w) { return w == 0; });
    }

    bool operator!=(const BitSet& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace idmap_structures
