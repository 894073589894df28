#pragma once

/// @file bitset.hpp
/// @brief Word-packed bit storage for unispace_structures
///
/// BitSet is the storage behind finite subsets and relations: one bit per
/// point of a carrier, with whole-word set algebra and inclusion tests.

#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <bit>
#include <initializer_list>
#include <iterator>

namespace unispace_structures {

/// Dynamic bit-level storage of fixed logical length
class BitSet {
public:
    using word_type = std::uint64_t;
    using size_type = std::size_t;

    static constexpr size_type BITS_PER_WORD = 64;

private:
    std::vector<word_type> bits_;
    size_type len_;  // Length in bits

    [[nodiscard]] static constexpr size_type words_for_bits(size_type n) noexcept {
        return (n + BITS_PER_WORD - 1) / BITS_PER_WORD;
    }

    [[nodiscard]] static constexpr size_type word_index(size_type bit) noexcept {
        return bit / BITS_PER_WORD;
    }

    [[nodiscard]] static constexpr size_type bit_offset(size_type bit) noexcept {
        return bit % BITS_PER_WORD;
    }

    /// Clear bits past len_ in the last word
    void trim_tail() noexcept {
        size_type last_word_bits = len_ % BITS_PER_WORD;
        if (len_ > 0 && last_word_bits > 0) {
            bits_.back() &= (word_type(1) << last_word_bits) - 1;
        }
    }

public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Create an all-zero bitset of given length
    explicit BitSet(size_type length = 0)
        : bits_(words_for_bits(length), 0)
        , len_(length) {}

    /// Create from initializer list of set bit indices
    BitSet(std::initializer_list<size_type> set_bits, size_type length) : BitSet(length) {
        for (size_type bit : set_bits) {
            set(bit);
        }
    }

    // =========================================================================
    // Capacity
    // =========================================================================

    [[nodiscard]] size_type size() const noexcept { return len_; }

    [[nodiscard]] bool empty() const noexcept { return len_ == 0; }

    [[nodiscard]] size_type word_count() const noexcept { return bits_.size(); }

    // =========================================================================
    // Bit Operations
    // =========================================================================

    /// Set bit to 1 (ignored past the end)
    void set(size_type index) {
        if (index >= len_) return;
        bits_[word_index(index)] |= (word_type(1) << bit_offset(index));
    }

    /// Set bit to 0
    void clear(size_type index) {
        if (index >= len_) return;
        bits_[word_index(index)] &= ~(word_type(1) << bit_offset(index));
    }

    void set(size_type index, bool value) {
        if (value) {
            set(index);
        } else {
            clear(index);
        }
    }

    [[nodiscard]] bool get(size_type index) const noexcept {
        if (index >= len_) return false;
        return (bits_[word_index(index)] >> bit_offset(index)) & 1;
    }

    [[nodiscard]] bool test(size_type index) const noexcept {
        return get(index);
    }

    [[nodiscard]] bool operator[](size_type index) const noexcept {
        return get(index);
    }

    // =========================================================================
    // Bulk Operations
    // =========================================================================

    void set_all() {
        std::fill(bits_.begin(), bits_.end(), ~word_type(0));
        trim_tail();
    }

    void clear_all() {
        std::fill(bits_.begin(), bits_.end(), 0);
    }

    // =========================================================================
    // Aggregation
    // =========================================================================

    [[nodiscard]] size_type count_ones() const noexcept {
        size_type count = 0;
        for (word_type word : bits_) {
            count += static_cast<size_type>(std::popcount(word));
        }
        return count;
    }

    [[nodiscard]] bool any() const noexcept {
        for (word_type word : bits_) {
            if (word != 0) return true;
        }
        return false;
    }

    [[nodiscard]] bool all() const noexcept {
        return count_ones() == len_;
    }

    [[nodiscard]] bool none() const noexcept {
        return !any();
    }

    /// Index of the lowest set bit, or size() if none
    [[nodiscard]] size_type first_one() const noexcept {
        for (size_type i = 0; i < bits_.size(); ++i) {
            if (bits_[i] != 0) {
                return i * BITS_PER_WORD + static_cast<size_type>(std::countr_zero(bits_[i]));
            }
        }
        return len_;
    }

    // =========================================================================
    // Inclusion
    // =========================================================================

    /// Every set bit of this is set in other (lengths must agree)
    [[nodiscard]] bool is_subset_of(const BitSet& other) const noexcept {
        size_type words = std::min(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            if ((bits_[i] & ~other.bits_[i]) != 0) return false;
        }
        for (size_type i = words; i < bits_.size(); ++i) {
            if (bits_[i] != 0) return false;
        }
        return true;
    }

    /// Some bit is set in both
    [[nodiscard]] bool intersects(const BitSet& other) const noexcept {
        size_type words = std::min(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            if ((bits_[i] & other.bits_[i]) != 0) return true;
        }
        return false;
    }

    // =========================================================================
    // Bitwise Set Operations
    // =========================================================================

    [[nodiscard]] BitSet operator&(const BitSet& other) const {
        BitSet result(*this);
        result &= other;
        return result;
    }

    [[nodiscard]] BitSet operator|(const BitSet& other) const {
        BitSet result(*this);
        result |= other;
        return result;
    }

    [[nodiscard]] BitSet operator~() const {
        BitSet result(len_);
        for (size_type i = 0; i < bits_.size(); ++i) {
            result.bits_[i] = ~bits_[i];
        }
        result.trim_tail();
        return result;
    }

    BitSet& operator&=(const BitSet& other) {
        size_type words = std::min(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            bits_[i] &= other.bits_[i];
        }
        for (size_type i = words; i < bits_.size(); ++i) {
            bits_[i] = 0;
        }
        return *this;
    }

    BitSet& operator|=(const BitSet& other) {
        size_type words = std::min(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            bits_[i] |= other.bits_[i];
        }
        trim_tail();
        return *this;
    }

    /// Clear every bit that is set in other
    BitSet& subtract(const BitSet& other) {
        size_type words = std::min(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            bits_[i] &= ~other.bits_[i];
        }
        return *this;
    }

    // =========================================================================
    // Iterator over set bits
    // =========================================================================

    /// Iterator that yields indices of set bits
    class SetBitIterator {
        const BitSet* bitset_;
        size_type current_;

        void advance_to_next() {
            while (current_ < bitset_->len_ && !bitset_->get(current_)) {
                ++current_;
            }
        }

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = size_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const size_type*;
        using reference = size_type;

        SetBitIterator(const BitSet* bs, size_type start) : bitset_(bs), current_(start) {
            advance_to_next();
        }

        size_type operator*() const { return current_; }

        SetBitIterator& operator++() {
            ++current_;
            advance_to_next();
            return *this;
        }

        SetBitIterator operator++(int) {
            SetBitIterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const SetBitIterator& other) const {
            return current_ == other.current_;
        }

        bool operator!=(const SetBitIterator& other) const {
            return !(*this == other);
        }
    };

    /// Range for iterating over set bit indices
    class SetBitRange {
        const BitSet* bitset_;
    public:
        explicit SetBitRange(const BitSet* bs) : bitset_(bs) {}
        SetBitIterator begin() const { return SetBitIterator(bitset_, 0); }
        SetBitIterator end() const { return SetBitIterator(bitset_, bitset_->len_); }
    };

    [[nodiscard]] SetBitRange iter_ones() const { return SetBitRange(this); }

    // =========================================================================
    // Direct Access
    // =========================================================================

    [[nodiscard]] const std::vector<word_type>& as_words() const noexcept {
        return bits_;
    }

    // =========================================================================
    // Comparison
    // =========================================================================

    bool operator==(const BitSet& other) const noexcept {
        if (len_ != other.len_) return false;
        return bits_ == other.bits_;
    }

    bool operator!=(const BitSet& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace unispace_structures
