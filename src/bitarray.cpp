/**
 * @file bitarray.cpp
 * @brief Packed bit sequence implementation.
 */

#include <bitgrid/bitarray.hpp>

namespace bitgrid {

std::size_t BitArray::next_set(std::size_t from) const noexcept {
    if (from >= size_) {
        return size_;
    }

    std::size_t offset = from >> 5;
    word_t current = bits_[offset];
    // Drop bits below 'from'
    current &= ~((word_t{1} << (from & 31U)) - 1U);
    while (current == 0) {
        if (++offset == bits_.size()) {
            return size_;
        }
        current = bits_[offset];
    }

    std::size_t result = (offset << 5) + static_cast<std::size_t>(__builtin_ctz(current));
    return (result > size_) ? size_ : result;
}

std::size_t BitArray::next_unset(std::size_t from) const noexcept {
    if (from >= size_) {
        return size_;
    }

    std::size_t offset = from >> 5;
    word_t current = ~bits_[offset];
    current &= ~((word_t{1} << (from & 31U)) - 1U);
    while (current == 0) {
        if (++offset == bits_.size()) {
            return size_;
        }
        current = ~bits_[offset];
    }

    // Padding bits read as unset, so clamp to size_
    std::size_t result = (offset << 5) + static_cast<std::size_t>(__builtin_ctz(current));
    return (result > size_) ? size_ : result;
}

void BitArray::set_bulk(std::size_t i, word_t word) noexcept {
    std::size_t word_idx = i >> 5;
    if (word_idx + 1 == bits_.size()) {
        word &= detail::last_word_mask(size_);
    }
    bits_[word_idx] = word;
}

Error BitArray::set_range(std::size_t start, std::size_t end) noexcept {
    if (end < start || end > size_) {
        return Error::InvalidDimension;
    }
    if (end == start) {
        return Error::Ok;
    }

    --end; // inclusive from here on
    std::size_t first_word = start >> 5;
    std::size_t last_word = end >> 5;
    for (std::size_t i = first_word; i <= last_word; ++i) {
        std::size_t first_bit = (i > first_word) ? 0 : (start & 31U);
        std::size_t last_bit = (i < last_word) ? 31 : (end & 31U);
        bits_[i] |= detail::range_mask(first_bit, last_bit);
    }

    return Error::Ok;
}

void BitArray::clear() noexcept {
    for (auto& word : bits_) {
        word = 0;
    }
}

Error BitArray::is_range(std::size_t start, std::size_t end, bool value,
                         bool& result) const noexcept {
    if (end < start || end > size_) {
        return Error::InvalidDimension;
    }

    result = true;
    if (end == start) {
        return Error::Ok;
    }

    --end;
    std::size_t first_word = start >> 5;
    std::size_t last_word = end >> 5;
    for (std::size_t i = first_word; i <= last_word; ++i) {
        std::size_t first_bit = (i > first_word) ? 0 : (start & 31U);
        std::size_t last_bit = (i < last_word) ? 31 : (end & 31U);
        word_t mask = detail::range_mask(first_bit, last_bit);

        // Either all ones or all zeros under the mask
        if ((bits_[i] & mask) != (value ? mask : 0U)) {
            result = false;
            return Error::Ok;
        }
    }

    return Error::Ok;
}

void BitArray::ensure_capacity(std::size_t num_bits) {
    std::size_t needed = words_for_bits(num_bits);
    if (needed > bits_.size()) {
        bits_.resize(needed, 0);
    }
}

void BitArray::append_bit(bool bit) {
    ensure_capacity(size_ + 1);
    if (bit) {
        bits_[size_ >> 5] |= word_t{1} << (size_ & 31U);
    }
    ++size_;
}

Error BitArray::append_bits(word_t value, std::size_t num_bits) {
    if (num_bits > BITS_PER_WORD) {
        return Error::InvalidDimension;
    }

    ensure_capacity(size_ + num_bits);
    for (std::size_t left = num_bits; left > 0; --left) {
        append_bit(((value >> (left - 1)) & 1U) == 1U);
    }

    return Error::Ok;
}

void BitArray::append_bit_array(const BitArray& other) {
    std::size_t other_size = other.size_;
    ensure_capacity(size_ + other_size);
    for (std::size_t i = 0; i < other_size; ++i) {
        append_bit(other.get(i));
    }
}

Error BitArray::xor_with(const BitArray& other) noexcept {
    if (size_ != other.size_) {
        return Error::DimensionMismatch;
    }

    for (std::size_t i = 0; i < bits_.size(); ++i) {
        bits_[i] ^= other.bits_[i];
    }

    return Error::Ok;
}

void BitArray::to_bytes(std::size_t bit_offset, std::uint8_t* bytes, std::size_t offset,
                        std::size_t num_bytes) const noexcept {
    for (std::size_t i = 0; i < num_bytes; ++i) {
        unsigned int the_byte = 0;
        for (std::size_t j = 0; j < 8; ++j) {
            if (get(bit_offset)) {
                the_byte |= 1U << (7U - j);
            }
            ++bit_offset;
        }
        bytes[offset + i] = static_cast<std::uint8_t>(the_byte);
    }
}

void BitArray::reverse() {
    if (size_ == 0) {
        return;
    }

    std::size_t num_words = bits_.size();
    std::size_t last = num_words - 1;
    std::vector<word_t> reversed(num_words, 0);

    // Reverse bits within each word and word order
    for (std::size_t i = 0; i < num_words; ++i) {
        reversed[last - i] = detail::reverse_word(bits_[i]);
    }

    // Reversed data now starts at the padding; shift it down into place
    std::size_t padding = num_words * BITS_PER_WORD - size_;
    if (padding != 0) {
        word_t current = reversed[0] >> padding;
        for (std::size_t i = 1; i < num_words; ++i) {
            word_t next = reversed[i];
            current |= next << (BITS_PER_WORD - padding);
            reversed[i - 1] = current;
            current = next >> padding;
        }
        reversed[last] = current;
    }

    bits_.swap(reversed);
}

std::string BitArray::to_string() const {
    std::string result;
    result.reserve(size_ + (size_ / 8) + 1);

    for (std::size_t i = 0; i < size_; ++i) {
        if ((i & 7U) == 0) {
            result.push_back(' ');
        }
        result.push_back(get(i) ? 'X' : '.');
    }

    return result;
}

} // namespace bitgrid
