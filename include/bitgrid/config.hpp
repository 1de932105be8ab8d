/**
 * @file config.hpp
 * @brief bitgrid compile-time configuration.
 *
 * Word layout shared by BitArray and BitMatrix: bit @c i of a sequence lives
 * in word <tt>i / 32</tt> at bit position <tt>i % 32</tt> (LSB first).
 */

#ifndef BITGRID_CONFIG_HPP
#define BITGRID_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace bitgrid {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// 32-bit word type for packed bit storage
using word_t = std::uint32_t;
inline constexpr std::size_t BITS_PER_WORD = 32U;

/// Number of words needed to hold @p num_bits bits
inline constexpr std::size_t words_for_bits(std::size_t num_bits) noexcept {
    return (num_bits + BITS_PER_WORD - 1U) / BITS_PER_WORD;
}

/// Default tokens for the text grid format
inline constexpr const char* DEFAULT_SET_TOKEN = "X ";
inline constexpr const char* DEFAULT_UNSET_TOKEN = "  ";
inline constexpr const char* DEFAULT_LINE_SEPARATOR = "\n";

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define BITGRID_NO_EXCEPTIONS=1 to drop the exception wrappers.
 * @{
 */
#ifndef BITGRID_NO_EXCEPTIONS
#define BITGRID_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace bitgrid

#endif // BITGRID_CONFIG_HPP
