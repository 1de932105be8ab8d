/**
 * @file words.cpp
 * @brief Bounds-checked bulk operations on word buffers.
 */

#include <bitgrid/words.hpp>

#include <cstring>

namespace bitgrid {

Error copy_words(const word_t* src, std::size_t src_len, std::size_t src_pos, word_t* dest,
                 std::size_t dest_len, std::size_t dest_pos, std::size_t length) noexcept {
    if (src == nullptr || dest == nullptr) {
        return Error::InvalidDimension;
    }

    // Written as subtractions so huge positions cannot wrap around
    if (src_pos > src_len || length > src_len - src_pos) {
        return Error::DimensionMismatch;
    }
    if (dest_pos > dest_len || length > dest_len - dest_pos) {
        return Error::DimensionMismatch;
    }

    if (length > 0) {
        std::memmove(dest + dest_pos, src + src_pos, length * sizeof(word_t));
    }
    return Error::Ok;
}

std::vector<word_t> clone_words(const word_t* src, std::size_t len) {
    if (src == nullptr || len == 0) {
        return {};
    }
    return std::vector<word_t>(src, src + len);
}

} // namespace bitgrid
