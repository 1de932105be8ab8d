/**
 * @file bitmatrix.cpp
 * @brief Packed 2D bit grid implementation.
 */

#include <bitgrid/bitmatrix.hpp>
#include <bitgrid/words.hpp>

#include <algorithm>
#include <utility>

namespace bitgrid {

BitMatrix::BitMatrix(std::size_t width, std::size_t height)
    : width_(width), height_(height), row_size_(words_for_bits(width)),
      bits_(row_size_ * height, 0) {}

Error BitMatrix::create(std::size_t width, std::size_t height, BitMatrix& out) {
    if (width == 0 || height == 0) {
        return Error::InvalidDimension;
    }
    out = BitMatrix(width, height);
    return Error::Ok;
}

Error BitMatrix::create_square(std::size_t dimension, BitMatrix& out) {
    return create(dimension, dimension, out);
}

Error BitMatrix::parse_boolean_grid(const std::vector<std::vector<bool>>& image,
                                    BitMatrix& out) {
    if (image.empty() || image[0].empty()) {
        return Error::InvalidDimension;
    }

    std::size_t height = image.size();
    std::size_t width = image[0].size();
    for (const auto& line : image) {
        if (line.size() != width) {
            return Error::DimensionMismatch;
        }
    }

    BitMatrix matrix(width, height);
    for (std::size_t y = 0; y < height; ++y) {
        const auto& line = image[y];
        for (std::size_t x = 0; x < width; ++x) {
            if (line[x]) {
                matrix.set(x, y);
            }
        }
    }

    out = std::move(matrix);
    return Error::Ok;
}

Error BitMatrix::parse(std::string_view text, std::string_view set_token,
                       std::string_view unset_token, BitMatrix& out) {
    if (set_token.empty() || unset_token.empty()) {
        return Error::ParseError;
    }

    std::vector<bool> bits;
    bits.reserve(text.size());

    std::size_t row_start = 0;
    std::size_t row_length = 0;
    std::size_t num_rows = 0;

    // Close the row in progress, if any bits were read since the last one
    auto end_row = [&]() -> bool {
        std::size_t length = bits.size() - row_start;
        if (length == 0) {
            return true;
        }
        if (num_rows == 0) {
            row_length = length;
        } else if (length != row_length) {
            return false;
        }
        row_start = bits.size();
        ++num_rows;
        return true;
    };

    std::size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];
        if (c == '\n' || c == '\r') {
            if (!end_row()) {
                return Error::ParseError;
            }
            ++pos;
        } else if (text.compare(pos, set_token.size(), set_token) == 0) {
            pos += set_token.size();
            bits.push_back(true);
        } else if (text.compare(pos, unset_token.size(), unset_token) == 0) {
            pos += unset_token.size();
            bits.push_back(false);
        } else {
            return Error::ParseError;
        }
    }

    // Last row may lack a terminator
    if (!end_row()) {
        return Error::ParseError;
    }
    if (num_rows == 0) {
        return Error::ParseError;
    }

    BitMatrix matrix(row_length, num_rows);
    for (std::size_t i = 0; i < bits.size(); ++i) {
        if (bits[i]) {
            matrix.set(i % row_length, i / row_length);
        }
    }

    out = std::move(matrix);
    return Error::Ok;
}

Error BitMatrix::xor_with(const BitMatrix& mask) {
    if (width_ != mask.width_ || height_ != mask.height_ || row_size_ != mask.row_size_) {
        return Error::DimensionMismatch;
    }

    BitArray row(width_);
    for (std::size_t y = 0; y < height_; ++y) {
        const word_t* mask_row = mask.get_row(y, row).data();
        word_t* target = bits_.data() + y * row_size_;
        for (std::size_t x = 0; x < row_size_; ++x) {
            target[x] ^= mask_row[x];
        }
    }

    return Error::Ok;
}

void BitMatrix::clear() noexcept {
    std::fill(bits_.begin(), bits_.end(), 0);
}

Error BitMatrix::set_region(std::size_t left, std::size_t top, std::size_t width,
                            std::size_t height) noexcept {
    if (width == 0 || height == 0) {
        return Error::InvalidDimension;
    }
    if (left > width_ || width > width_ - left || top > height_ || height > height_ - top) {
        return Error::RegionOutOfBounds;
    }

    std::size_t right = left + width - 1; // inclusive
    std::size_t bottom = top + height;
    std::size_t first_word = left >> 5;
    std::size_t last_word = right >> 5;

    for (std::size_t y = top; y < bottom; ++y) {
        word_t* row = bits_.data() + y * row_size_;
        for (std::size_t i = first_word; i <= last_word; ++i) {
            std::size_t first_bit = (i > first_word) ? 0 : (left & 31U);
            std::size_t last_bit = (i < last_word) ? 31 : (right & 31U);
            row[i] |= detail::range_mask(first_bit, last_bit);
        }
    }

    return Error::Ok;
}

BitArray& BitMatrix::get_row(std::size_t y, BitArray& row) const {
    if (row.size() < width_) {
        row = BitArray(width_);
    } else {
        row.clear();
    }

    const word_t* src = row_data(y);
    for (std::size_t x = 0; x < row_size_; ++x) {
        row.set_bulk(x << 5, src[x]);
    }

    return row;
}

BitArray BitMatrix::get_row(std::size_t y) const {
    BitArray row(width_);
    get_row(y, row);
    return row;
}

Error BitMatrix::write_row(std::size_t y, const BitArray& row) noexcept {
    word_t* dest = bits_.data() + y * row_size_;
    Error result = copy_words(row.data(), row.num_words(), 0, dest, row_size_, 0, row_size_);
    if (result != Error::Ok) {
        return result;
    }

    // Keep padding of the row clear
    dest[row_size_ - 1] &= detail::last_word_mask(width_);
    return Error::Ok;
}

Error BitMatrix::set_row(std::size_t y, const BitArray& row) noexcept {
    if (row.size() < width_) {
        return Error::DimensionMismatch;
    }
    return write_row(y, row);
}

Error BitMatrix::rotate180() {
    BitArray top_row(width_);
    BitArray bottom_row(width_);

    // The middle row of an odd height pairs with itself
    for (std::size_t i = 0; i < (height_ + 1) / 2; ++i) {
        std::size_t mirror = height_ - 1 - i;
        get_row(i, top_row);
        get_row(mirror, bottom_row);
        top_row.reverse();
        bottom_row.reverse();

        Error result = write_row(i, bottom_row);
        if (result != Error::Ok) {
            return result;
        }
        result = write_row(mirror, top_row);
        if (result != Error::Ok) {
            return result;
        }
    }

    return Error::Ok;
}

bool BitMatrix::get_enclosing_rectangle(Rectangle& rect) const noexcept {
    std::size_t left = width_;
    std::size_t top = height_;
    std::size_t right = 0;
    std::size_t bottom = 0;
    bool found = false;

    for (std::size_t y = 0; y < height_; ++y) {
        const word_t* row = row_data(y);
        for (std::size_t x32 = 0; x32 < row_size_; ++x32) {
            word_t the_bits = row[x32];
            if (the_bits == 0) {
                continue;
            }

            if (y < top) {
                top = y;
            }
            if (y > bottom) {
                bottom = y;
            }

            std::size_t base = x32 << 5;
            if (base < left) {
                std::size_t bit = static_cast<std::size_t>(__builtin_ctz(the_bits));
                if (base + bit < left) {
                    left = base + bit;
                }
            }
            if (base + 31 > right) {
                std::size_t bit = 31U - static_cast<std::size_t>(__builtin_clz(the_bits));
                if (base + bit > right) {
                    right = base + bit;
                }
            }
            found = true;
        }
    }

    if (!found) {
        return false;
    }

    rect.left = left;
    rect.top = top;
    rect.width = right - left + 1;
    rect.height = bottom - top + 1;
    return true;
}

bool BitMatrix::get_top_left_on_bit(Point& point) const noexcept {
    std::size_t offset = 0;
    while (offset < bits_.size() && bits_[offset] == 0) {
        ++offset;
    }
    if (offset == bits_.size()) {
        return false;
    }

    std::size_t bit = static_cast<std::size_t>(__builtin_ctz(bits_[offset]));
    point.x = ((offset % row_size_) << 5) + bit;
    point.y = offset / row_size_;
    return true;
}

bool BitMatrix::get_bottom_right_on_bit(Point& point) const noexcept {
    // One past the word under inspection, so the scan stops cleanly at 0
    std::size_t offset = bits_.size();
    while (offset > 0 && bits_[offset - 1] == 0) {
        --offset;
    }
    if (offset == 0) {
        return false;
    }
    --offset;

    std::size_t bit = 31U - static_cast<std::size_t>(__builtin_clz(bits_[offset]));
    point.x = ((offset % row_size_) << 5) + bit;
    point.y = offset / row_size_;
    return true;
}

std::string BitMatrix::to_string() const {
    return to_string(DEFAULT_SET_TOKEN, DEFAULT_UNSET_TOKEN, DEFAULT_LINE_SEPARATOR);
}

std::string BitMatrix::to_string(std::string_view set_token, std::string_view unset_token) const {
    return to_string(set_token, unset_token, DEFAULT_LINE_SEPARATOR);
}

std::string BitMatrix::to_string(std::string_view set_token, std::string_view unset_token,
                                 std::string_view line_separator) const {
    std::string result;
    std::size_t token_size = std::max(set_token.size(), unset_token.size());
    result.reserve(height_ * (width_ * token_size + line_separator.size()));

    for (std::size_t y = 0; y < height_; ++y) {
        for (std::size_t x = 0; x < width_; ++x) {
            result.append(get(x, y) ? set_token : unset_token);
        }
        result.append(line_separator);
    }

    return result;
}

} // namespace bitgrid
