/**
 * @file luminance.cpp
 * @brief Luminance source implementations.
 */

#include <bitgrid/luminance.hpp>

#include <utility>

namespace bitgrid {

// ============================================================================
// LuminanceSource defaults
// ============================================================================

Error LuminanceSource::crop(std::size_t, std::size_t, std::size_t, std::size_t,
                            LuminanceSourcePtr&) const {
    return Error::Unsupported;
}

Error LuminanceSource::rotate_counter_clockwise(LuminanceSourcePtr&) const {
    return Error::Unsupported;
}

Error LuminanceSource::rotate_counter_clockwise_45(LuminanceSourcePtr&) const {
    return Error::Unsupported;
}

LuminanceSourcePtr LuminanceSource::invert() const {
    return std::make_shared<InvertedLuminanceSource>(shared_from_this());
}

// ============================================================================
// GrayImageSource
// ============================================================================

GrayImageSource::GrayImageSource(std::size_t width, std::size_t height,
                                 std::vector<std::uint8_t> pixels)
    : width_(width), height_(height), pixels_(std::move(pixels)) {}

Error GrayImageSource::create(std::size_t width, std::size_t height,
                              std::vector<std::uint8_t> pixels, LuminanceSourcePtr& out) {
    if (width == 0 || height == 0) {
        return Error::InvalidDimension;
    }
    if (pixels.size() != width * height) {
        return Error::DimensionMismatch;
    }
    out.reset(new GrayImageSource(width, height, std::move(pixels)));
    return Error::Ok;
}

std::vector<std::uint8_t>& GrayImageSource::get_row(std::size_t y,
                                                    std::vector<std::uint8_t>& row) const {
    if (row.size() < width_) {
        row.resize(width_);
    }
    const std::uint8_t* src = pixels_.data() + y * width_;
    for (std::size_t x = 0; x < width_; ++x) {
        row[x] = src[x];
    }
    return row;
}

Error GrayImageSource::crop(std::size_t left, std::size_t top, std::size_t width,
                            std::size_t height, LuminanceSourcePtr& out) const {
    if (width == 0 || height == 0) {
        return Error::InvalidDimension;
    }
    if (left > width_ || width > width_ - left || top > height_ || height > height_ - top) {
        return Error::RegionOutOfBounds;
    }

    std::vector<std::uint8_t> pixels(width * height);
    for (std::size_t y = 0; y < height; ++y) {
        const std::uint8_t* src = pixels_.data() + (top + y) * width_ + left;
        for (std::size_t x = 0; x < width; ++x) {
            pixels[y * width + x] = src[x];
        }
    }

    out.reset(new GrayImageSource(width, height, std::move(pixels)));
    return Error::Ok;
}

Error GrayImageSource::rotate_counter_clockwise(LuminanceSourcePtr& out) const {
    // New image is height_ wide and width_ tall; the old right column becomes the top row
    std::size_t new_width = height_;
    std::size_t new_height = width_;
    std::vector<std::uint8_t> pixels(new_width * new_height);
    for (std::size_t y = 0; y < new_height; ++y) {
        for (std::size_t x = 0; x < new_width; ++x) {
            pixels[y * new_width + x] = pixels_[x * width_ + (width_ - 1 - y)];
        }
    }

    out.reset(new GrayImageSource(new_width, new_height, std::move(pixels)));
    return Error::Ok;
}

// ============================================================================
// InvertedLuminanceSource
// ============================================================================

InvertedLuminanceSource::InvertedLuminanceSource(LuminanceSourcePtr delegate)
    : delegate_(std::move(delegate)) {}

std::vector<std::uint8_t>& InvertedLuminanceSource::get_row(
    std::size_t y, std::vector<std::uint8_t>& row) const {
    delegate_->get_row(y, row);
    std::size_t width = delegate_->width();
    for (std::size_t x = 0; x < width; ++x) {
        row[x] = static_cast<std::uint8_t>(255U - row[x]);
    }
    return row;
}

std::vector<std::uint8_t> InvertedLuminanceSource::get_matrix() const {
    std::vector<std::uint8_t> matrix = delegate_->get_matrix();
    for (auto& value : matrix) {
        value = static_cast<std::uint8_t>(255U - value);
    }
    return matrix;
}

Error InvertedLuminanceSource::crop(std::size_t left, std::size_t top, std::size_t width,
                                    std::size_t height, LuminanceSourcePtr& out) const {
    LuminanceSourcePtr cropped;
    Error result = delegate_->crop(left, top, width, height, cropped);
    if (result != Error::Ok) {
        return result;
    }
    out = std::make_shared<InvertedLuminanceSource>(std::move(cropped));
    return Error::Ok;
}

Error InvertedLuminanceSource::rotate_counter_clockwise(LuminanceSourcePtr& out) const {
    LuminanceSourcePtr rotated;
    Error result = delegate_->rotate_counter_clockwise(rotated);
    if (result != Error::Ok) {
        return result;
    }
    out = std::make_shared<InvertedLuminanceSource>(std::move(rotated));
    return Error::Ok;
}

Error InvertedLuminanceSource::rotate_counter_clockwise_45(LuminanceSourcePtr& out) const {
    LuminanceSourcePtr rotated;
    Error result = delegate_->rotate_counter_clockwise_45(rotated);
    if (result != Error::Ok) {
        return result;
    }
    out = std::make_shared<InvertedLuminanceSource>(std::move(rotated));
    return Error::Ok;
}

} // namespace bitgrid
