/**
 * @file bitmatrix.hpp
 * @brief Two-dimensional packed bit grid.
 *
 * A BitMatrix holds a binarized image: one bit per pixel, set for
 * foreground. Rows use the same word packing as BitArray and are stored
 * back to back in a single buffer:
 *
 * @code
 *   bit (x, y)  ->  word  y * row_size() + x / 32,  bit  x % 32
 * @endcode
 *
 * @par Text Format
 * to_string() emits height() lines of width() tokens, each line followed by
 * the separator. parse() accepts the same layout: tokens must match one of
 * the two literals exactly, and any '\n' or '\r' ends a row. Empty lines are
 * ignored.
 */

#ifndef BITGRID_BITMATRIX_HPP
#define BITGRID_BITMATRIX_HPP

#include <string>
#include <string_view>
#include <vector>

#include "bitarray.hpp"
#include "config.hpp"
#include "error.hpp"

namespace bitgrid {

/**
 * @brief Axis-aligned rectangle in matrix coordinates.
 */
struct Rectangle {
    std::size_t left = 0;
    std::size_t top = 0;
    std::size_t width = 0;
    std::size_t height = 0;

    bool operator==(const Rectangle& other) const noexcept {
        return left == other.left && top == other.top && width == other.width &&
               height == other.height;
    }
};

/**
 * @brief Bit coordinate.
 */
struct Point {
    std::size_t x = 0;
    std::size_t y = 0;

    bool operator==(const Point& other) const noexcept {
        return x == other.x && y == other.y;
    }
};

/**
 * @brief Packed 2D bit grid.
 *
 * Matrices are built through the static factories, which validate the
 * dimensions. A default-constructed BitMatrix is an empty 0x0 placeholder
 * meant only as a factory target.
 */
class BitMatrix {
public:
    /**
     * @brief Empty placeholder, see class description.
     */
    BitMatrix() = default;

    /**
     * @brief Create a cleared matrix.
     *
     * @param width Number of columns (> 0)
     * @param height Number of rows (> 0)
     * @param[out] out Receives the new matrix
     * @return Error::Ok on success, Error::InvalidDimension if either
     *         dimension is zero
     */
    static Error create(std::size_t width, std::size_t height, BitMatrix& out);

    /**
     * @brief Create a cleared square matrix.
     */
    static Error create_square(std::size_t dimension, BitMatrix& out);

    /**
     * @brief Build a matrix from a rectangular boolean image.
     *
     * @param image Rows of pixels, true for set
     * @param[out] out Receives the new matrix
     * @return Error::Ok on success, Error::InvalidDimension for an empty
     *         image, Error::DimensionMismatch if rows differ in length
     */
    static Error parse_boolean_grid(const std::vector<std::vector<bool>>& image,
                                    BitMatrix& out);

    /**
     * @brief Parse the text format.
     *
     * @param text Text grid
     * @param set_token Literal for a set bit
     * @param unset_token Literal for an unset bit
     * @param[out] out Receives the new matrix
     * @return Error::Ok on success, Error::ParseError on an unknown token,
     *         rows of different length, empty tokens or an input with no
     *         rows at all
     */
    static Error parse(std::string_view text, std::string_view set_token,
                       std::string_view unset_token, BitMatrix& out);

    [[nodiscard]] std::size_t width() const noexcept { return width_; }
    [[nodiscard]] std::size_t height() const noexcept { return height_; }

    /// Number of 32-bit words per row
    [[nodiscard]] std::size_t row_size() const noexcept { return row_size_; }

    /**
     * @brief Get bit value.
     * @warning Unchecked: x < width() and y < height() are required.
     */
    [[nodiscard]] inline bool get(std::size_t x, std::size_t y) const noexcept {
        return ((bits_[y * row_size_ + (x >> 5)] >> (x & 31U)) & 1U) != 0;
    }

    /**
     * @brief Set bit.
     * @warning Unchecked: x < width() and y < height() are required.
     */
    inline void set(std::size_t x, std::size_t y) noexcept {
        bits_[y * row_size_ + (x >> 5)] |= word_t{1} << (x & 31U);
    }

    /**
     * @brief Clear bit.
     * @warning Unchecked: x < width() and y < height() are required.
     */
    inline void unset(std::size_t x, std::size_t y) noexcept {
        bits_[y * row_size_ + (x >> 5)] &= ~(word_t{1} << (x & 31U));
    }

    /**
     * @brief Toggle bit.
     * @warning Unchecked: x < width() and y < height() are required.
     */
    inline void flip(std::size_t x, std::size_t y) noexcept {
        bits_[y * row_size_ + (x >> 5)] ^= word_t{1} << (x & 31U);
    }

    /**
     * @brief Flip every bit that is set in @p mask.
     *
     * @param mask Matrix of identical dimensions
     * @return Error::Ok on success, Error::DimensionMismatch otherwise
     */
    Error xor_with(const BitMatrix& mask);

    /**
     * @brief Clear all bits.
     */
    void clear() noexcept;

    /**
     * @brief Set every bit of [left, left+width) x [top, top+height).
     *
     * @return Error::Ok on success, Error::InvalidDimension for a zero
     *         width or height, Error::RegionOutOfBounds if the region does
     *         not fit inside the matrix
     */
    Error set_region(std::size_t left, std::size_t top, std::size_t width,
                     std::size_t height) noexcept;

    /**
     * @brief Copy row @p y into a bit sequence.
     *
     * If @p row holds fewer than width() bits it is replaced by a new
     * sequence of exactly width() bits; otherwise it is cleared and reused
     * with its size unchanged.
     *
     * @param y Row index (< height())
     * @param row Reusable destination
     * @return Reference to @p row
     */
    BitArray& get_row(std::size_t y, BitArray& row) const;

    /**
     * @brief Copy row @p y into a fresh sequence of width() bits.
     */
    [[nodiscard]] BitArray get_row(std::size_t y) const;

    /**
     * @brief Overwrite row @p y with the first width() bits of @p row.
     *
     * Bits of @p row beyond width() are ignored. A row shorter than width()
     * is rejected and the matrix is left untouched.
     *
     * @param y Row index (< height())
     * @param row Source bits
     * @return Error::Ok on success, Error::DimensionMismatch if
     *         row.size() < width()
     */
    Error set_row(std::size_t y, const BitArray& row) noexcept;

    /**
     * @brief Rotate the matrix by 180 degrees in place.
     */
    Error rotate180();

    /**
     * @brief Minimal rectangle containing every set bit.
     *
     * @param[out] rect Receives the rectangle, untouched if none
     * @return false if no bit is set
     */
    [[nodiscard]] bool get_enclosing_rectangle(Rectangle& rect) const noexcept;

    /**
     * @brief First set bit in row-major order.
     *
     * @param[out] point Receives the coordinate, untouched if none
     * @return false if no bit is set
     */
    [[nodiscard]] bool get_top_left_on_bit(Point& point) const noexcept;

    /**
     * @brief Last set bit in row-major order.
     *
     * @param[out] point Receives the coordinate, untouched if none
     * @return false if no bit is set
     */
    [[nodiscard]] bool get_bottom_right_on_bit(Point& point) const noexcept;

    /**
     * @brief Read-only view of the row_size() words of row @p y.
     */
    [[nodiscard]] const word_t* row_data(std::size_t y) const noexcept {
        return bits_.data() + y * row_size_;
    }

    /// Render with the default tokens ("X ", "  ") and newlines
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] std::string to_string(std::string_view set_token,
                                        std::string_view unset_token) const;

    [[nodiscard]] std::string to_string(std::string_view set_token, std::string_view unset_token,
                                        std::string_view line_separator) const;

    /**
     * @brief Independent deep copy.
     */
    [[nodiscard]] BitMatrix clone() const { return *this; }

    [[nodiscard]] bool operator==(const BitMatrix& other) const noexcept {
        return width_ == other.width_ && height_ == other.height_ &&
               row_size_ == other.row_size_ && bits_ == other.bits_;
    }

    [[nodiscard]] bool operator!=(const BitMatrix& other) const noexcept {
        return !(*this == other);
    }

private:
    std::size_t width_ = 0;
    std::size_t height_ = 0;
    std::size_t row_size_ = 0;
    std::vector<word_t> bits_;

    BitMatrix(std::size_t width, std::size_t height);

    Error write_row(std::size_t y, const BitArray& row) noexcept;
};

} // namespace bitgrid

#endif // BITGRID_BITMATRIX_HPP
