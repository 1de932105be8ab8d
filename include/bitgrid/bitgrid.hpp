/**
 * @file bitgrid.hpp
 * @brief Umbrella header for the bitgrid library.
 *
 * Packed bit containers for binarized images: BitArray for single
 * scanlines and bit streams, BitMatrix for whole images, and the
 * LuminanceSource interface they are fed from.
 */

#ifndef BITGRID_HPP
#define BITGRID_HPP

#include "bitarray.hpp"
#include "bitmatrix.hpp"
#include "config.hpp"
#include "error.hpp"
#include "luminance.hpp"
#include "words.hpp"

namespace bitgrid {

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace bitgrid

#endif // BITGRID_HPP
