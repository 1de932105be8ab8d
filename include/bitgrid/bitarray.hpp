/**
 * @file bitarray.hpp
 * @brief Growable packed bit sequence.
 *
 * This module provides the one-dimensional bit container used for single
 * scanlines of a BitMatrix and for any bit stream that has to be scanned,
 * reversed or assembled bit by bit.
 *
 * @par Word Packing (Little-Endian Bit Order)
 * Within each 32-bit word:
 * - Bit 0 of the sequence at position 0 of word 0 (least significant)
 * - Bit 31 at position 31 of word 0
 * - Bit 32 at position 0 of word 1
 *
 * @par Padding
 * Bits of the last word at or above size() are kept at zero by every
 * operation, so equality can compare whole words.
 */

#ifndef BITGRID_BITARRAY_HPP
#define BITGRID_BITARRAY_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace bitgrid {

namespace detail {

/**
 * @brief Reverse the order of the 32 bits of a word.
 *
 * Swaps adjacent groups of 1, 2, 4, 8 and 16 bits.
 */
inline word_t reverse_word(word_t x) noexcept {
    x = ((x >> 1) & 0x55555555U) | ((x & 0x55555555U) << 1);
    x = ((x >> 2) & 0x33333333U) | ((x & 0x33333333U) << 2);
    x = ((x >> 4) & 0x0F0F0F0FU) | ((x & 0x0F0F0F0FU) << 4);
    x = ((x >> 8) & 0x00FF00FFU) | ((x & 0x00FF00FFU) << 8);
    x = ((x >> 16) & 0x0000FFFFU) | ((x & 0x0000FFFFU) << 16);
    return x;
}

/**
 * @brief Mask covering bit positions first_bit..last_bit inclusive.
 *
 * @param first_bit Lowest bit position (0-31)
 * @param last_bit Highest bit position (first_bit-31)
 */
inline word_t range_mask(std::size_t first_bit, std::size_t last_bit) noexcept {
    // 2U << 31 wraps to 0, which still yields the right mask
    return (2U << last_bit) - (1U << first_bit);
}

/**
 * @brief Mask of the valid bits in the last word of a @p num_bits sequence.
 */
inline word_t last_word_mask(std::size_t num_bits) noexcept {
    std::size_t used = num_bits & 31U;
    return (used == 0) ? ~word_t{0} : ((word_t{1} << used) - 1U);
}

} // namespace detail

/**
 * @brief Packed bit sequence backed by 32-bit words.
 *
 * Single-bit accessors are unchecked: the caller guarantees i < size().
 * Range, append and combine operations validate their arguments and report
 * failures through Error codes.
 */
class BitArray {
public:
    /**
     * @brief Construct an empty sequence.
     */
    BitArray() = default;

    /**
     * @brief Construct a sequence of @p size cleared bits.
     * @param size Number of bits
     */
    explicit BitArray(std::size_t size) : bits_(words_for_bits(size), 0), size_(size) {}

    /**
     * @brief Get the number of bits.
     */
    [[nodiscard]] std::size_t size() const noexcept { return size_; }

    /**
     * @brief Get the number of bytes needed to hold all bits.
     */
    [[nodiscard]] std::size_t size_in_bytes() const noexcept { return (size_ + 7U) / 8U; }

    /**
     * @brief Get the number of 32-bit storage words.
     */
    [[nodiscard]] std::size_t num_words() const noexcept { return bits_.size(); }

    /**
     * @brief Get bit value at position.
     *
     * @warning Caller must ensure i < size(). Undefined behavior otherwise.
     * @param i Bit position
     * @return true if the bit is set
     */
    [[nodiscard]] inline bool get(std::size_t i) const noexcept {
        return ((bits_[i >> 5] >> (i & 31U)) & 1U) != 0;
    }

    /**
     * @brief Set bit at position.
     *
     * @warning Caller must ensure i < size(). Undefined behavior otherwise.
     * @param i Bit position
     */
    inline void set(std::size_t i) noexcept {
        bits_[i >> 5] |= word_t{1} << (i & 31U);
    }

    /**
     * @brief Toggle bit at position.
     *
     * @warning Caller must ensure i < size(). Undefined behavior otherwise.
     * @param i Bit position
     */
    inline void flip(std::size_t i) noexcept {
        bits_[i >> 5] ^= word_t{1} << (i & 31U);
    }

    /**
     * @brief Find the first set bit at or after @p from.
     *
     * Whole zero words are skipped, so the cost is proportional to the
     * number of words scanned.
     *
     * @param from First position to look at
     * @return Index of the first set bit, or size() if there is none
     */
    [[nodiscard]] std::size_t next_set(std::size_t from) const noexcept;

    /**
     * @brief Find the first unset bit at or after @p from.
     *
     * @param from First position to look at
     * @return Index of the first unset bit, or size() if there is none
     */
    [[nodiscard]] std::size_t next_unset(std::size_t from) const noexcept;

    /**
     * @brief Overwrite a whole storage word.
     *
     * @warning @p i must be a multiple of 32 and below size().
     * @param i First bit of the word
     * @param word New word value (bit 0 of word goes to position i)
     */
    void set_bulk(std::size_t i, word_t word) noexcept;

    /**
     * @brief Set every bit in [start, end).
     *
     * @param start First bit to set
     * @param end One past the last bit to set
     * @return Error::Ok on success, Error::InvalidDimension if end < start
     *         or end > size()
     */
    Error set_range(std::size_t start, std::size_t end) noexcept;

    /**
     * @brief Clear all bits.
     */
    void clear() noexcept;

    /**
     * @brief Check whether every bit in [start, end) equals @p value.
     *
     * An empty range is trivially uniform.
     *
     * @param start First bit to check
     * @param end One past the last bit to check
     * @param value Expected bit value
     * @param[out] result true if all bits in range equal @p value
     * @return Error::Ok on success, Error::InvalidDimension if end < start
     *         or end > size()
     */
    Error is_range(std::size_t start, std::size_t end, bool value, bool& result) const noexcept;

    /**
     * @brief Append one bit, growing storage as needed.
     * @param bit Bit value
     */
    void append_bit(bool bit);

    /**
     * @brief Append the low @p num_bits bits of @p value, most significant first.
     *
     * @param value Value containing bits (right-justified)
     * @param num_bits Number of bits to append (0-32)
     * @return Error::Ok on success, Error::InvalidDimension if num_bits > 32
     */
    Error append_bits(word_t value, std::size_t num_bits);

    /**
     * @brief Append all bits of another sequence in order.
     * @param other Source sequence
     */
    void append_bit_array(const BitArray& other);

    /**
     * @brief XOR in-place with another sequence of the same size.
     *
     * @param other Operand
     * @return Error::Ok on success, Error::DimensionMismatch if sizes differ
     */
    Error xor_with(const BitArray& other) noexcept;

    /**
     * @brief Pack bits into bytes, MSB first within each byte.
     *
     * @warning bit_offset + 8 * num_bytes must not exceed size().
     * @param bit_offset First bit to pack
     * @param bytes Destination byte array
     * @param offset First byte of @p bytes to write
     * @param num_bytes Number of bytes to write
     */
    void to_bytes(std::size_t bit_offset, std::uint8_t* bytes, std::size_t offset,
                  std::size_t num_bytes) const noexcept;

    /**
     * @brief Reverse the bit order end to end.
     */
    void reverse();

    /**
     * @brief Get raw word storage.
     * @return Pointer to num_words() words
     */
    [[nodiscard]] const word_t* data() const noexcept { return bits_.data(); }

    /**
     * @brief Independent deep copy.
     */
    [[nodiscard]] BitArray clone() const { return *this; }

    /**
     * @brief Render as groups of eight, @c X for set and @c . for unset.
     */
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const BitArray& other) const noexcept {
        return size_ == other.size_ && bits_ == other.bits_;
    }

    [[nodiscard]] bool operator!=(const BitArray& other) const noexcept {
        return !(*this == other);
    }

private:
    std::vector<word_t> bits_;
    std::size_t size_ = 0;

    void ensure_capacity(std::size_t num_bits);
};

} // namespace bitgrid

#endif // BITGRID_BITARRAY_HPP
