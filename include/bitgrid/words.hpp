/**
 * @file words.hpp
 * @brief Bounds-checked bulk operations on word buffers.
 */

#ifndef BITGRID_WORDS_HPP
#define BITGRID_WORDS_HPP

#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace bitgrid {

/**
 * @brief Copy a run of words between two buffers.
 *
 * Both ranges must lie entirely inside their buffers; nothing is copied
 * otherwise. Overlapping ranges in the same buffer are handled.
 *
 * @param src Source buffer
 * @param src_len Number of words in @p src
 * @param src_pos First word to copy from @p src
 * @param dest Destination buffer
 * @param dest_len Number of words in @p dest
 * @param dest_pos First word to write in @p dest
 * @param length Number of words to copy
 * @return Error::Ok on success, Error::InvalidDimension for a null buffer,
 *         Error::DimensionMismatch if either range overruns its buffer
 */
Error copy_words(const word_t* src, std::size_t src_len, std::size_t src_pos, word_t* dest,
                 std::size_t dest_len, std::size_t dest_pos, std::size_t length) noexcept;

/**
 * @brief Deep copy of a word buffer.
 * @param src Source buffer (may be nullptr when @p len is 0)
 * @param len Number of words
 * @return Independent copy of the words
 */
std::vector<word_t> clone_words(const word_t* src, std::size_t len);

} // namespace bitgrid

#endif // BITGRID_WORDS_HPP
