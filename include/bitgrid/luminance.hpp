/**
 * @file luminance.hpp
 * @brief Upstream luminance source interface.
 *
 * Gray-level images reach the binarizer through LuminanceSource. Transforms
 * (inversion, cropping, rotation) are expressed by wrapping one source in
 * another that holds a shared reference to it.
 *
 * @par Ownership
 * Sources are shared and immutable once built: always hold them through
 * std::shared_ptr<const LuminanceSource>. invert() relies on this.
 */

#ifndef BITGRID_LUMINANCE_HPP
#define BITGRID_LUMINANCE_HPP

#include <memory>
#include <vector>

#include "config.hpp"
#include "error.hpp"

namespace bitgrid {

class LuminanceSource;

using LuminanceSourcePtr = std::shared_ptr<const LuminanceSource>;

/**
 * @brief Read access to an 8-bit luminance plane (0 = black, 255 = white).
 */
class LuminanceSource : public std::enable_shared_from_this<LuminanceSource> {
public:
    virtual ~LuminanceSource() = default;

    [[nodiscard]] virtual std::size_t width() const noexcept = 0;
    [[nodiscard]] virtual std::size_t height() const noexcept = 0;

    /**
     * @brief Fetch one row of luminance values.
     *
     * @p row is grown to width() if it is smaller, and reused otherwise.
     *
     * @param y Row index (< height())
     * @param row Reusable destination
     * @return Reference to @p row; its first width() entries hold the row
     */
    virtual std::vector<std::uint8_t>& get_row(std::size_t y,
                                               std::vector<std::uint8_t>& row) const = 0;

    /**
     * @brief Fetch the whole plane, row-major, width() * height() values.
     */
    [[nodiscard]] virtual std::vector<std::uint8_t> get_matrix() const = 0;

    [[nodiscard]] virtual bool is_crop_supported() const noexcept { return false; }

    /**
     * @brief Source restricted to a sub-rectangle.
     *
     * @param[out] out Receives the cropped source
     * @return Error::Ok, Error::Unsupported if cropping is not offered,
     *         Error::InvalidDimension for an empty rectangle, or
     *         Error::RegionOutOfBounds for a rectangle outside the source
     */
    virtual Error crop(std::size_t left, std::size_t top, std::size_t width, std::size_t height,
                       LuminanceSourcePtr& out) const;

    [[nodiscard]] virtual bool is_rotate_supported() const noexcept { return false; }

    /**
     * @brief Source rotated 90 degrees counter-clockwise.
     * @return Error::Ok or Error::Unsupported
     */
    virtual Error rotate_counter_clockwise(LuminanceSourcePtr& out) const;

    /**
     * @brief Source rotated 45 degrees counter-clockwise.
     * @return Error::Ok or Error::Unsupported
     */
    virtual Error rotate_counter_clockwise_45(LuminanceSourcePtr& out) const;

    /**
     * @brief Source with every value replaced by 255 - value.
     *
     * Inverting an inverted source yields the original source.
     */
    [[nodiscard]] virtual LuminanceSourcePtr invert() const;
};

/**
 * @brief In-memory luminance plane.
 *
 * Supports cropping and 90 degree rotation; both produce new planes.
 */
class GrayImageSource : public LuminanceSource {
public:
    /**
     * @brief Build a source from row-major pixels.
     *
     * @param width Number of columns (> 0)
     * @param height Number of rows (> 0)
     * @param pixels width * height luminance values
     * @param[out] out Receives the new source
     * @return Error::Ok, Error::InvalidDimension for a zero dimension, or
     *         Error::DimensionMismatch if pixels has the wrong length
     */
    static Error create(std::size_t width, std::size_t height, std::vector<std::uint8_t> pixels,
                        LuminanceSourcePtr& out);

    [[nodiscard]] std::size_t width() const noexcept override { return width_; }
    [[nodiscard]] std::size_t height() const noexcept override { return height_; }

    std::vector<std::uint8_t>& get_row(std::size_t y,
                                       std::vector<std::uint8_t>& row) const override;
    [[nodiscard]] std::vector<std::uint8_t> get_matrix() const override { return pixels_; }

    [[nodiscard]] bool is_crop_supported() const noexcept override { return true; }
    Error crop(std::size_t left, std::size_t top, std::size_t width, std::size_t height,
               LuminanceSourcePtr& out) const override;

    [[nodiscard]] bool is_rotate_supported() const noexcept override { return true; }
    Error rotate_counter_clockwise(LuminanceSourcePtr& out) const override;

private:
    GrayImageSource(std::size_t width, std::size_t height, std::vector<std::uint8_t> pixels);

    std::size_t width_;
    std::size_t height_;
    std::vector<std::uint8_t> pixels_;
};

/**
 * @brief Inverting view over another source.
 *
 * Crop and rotation are delegated and the result wrapped again.
 */
class InvertedLuminanceSource : public LuminanceSource {
public:
    explicit InvertedLuminanceSource(LuminanceSourcePtr delegate);

    [[nodiscard]] std::size_t width() const noexcept override { return delegate_->width(); }
    [[nodiscard]] std::size_t height() const noexcept override { return delegate_->height(); }

    std::vector<std::uint8_t>& get_row(std::size_t y,
                                       std::vector<std::uint8_t>& row) const override;
    [[nodiscard]] std::vector<std::uint8_t> get_matrix() const override;

    [[nodiscard]] bool is_crop_supported() const noexcept override {
        return delegate_->is_crop_supported();
    }
    Error crop(std::size_t left, std::size_t top, std::size_t width, std::size_t height,
               LuminanceSourcePtr& out) const override;

    [[nodiscard]] bool is_rotate_supported() const noexcept override {
        return delegate_->is_rotate_supported();
    }
    Error rotate_counter_clockwise(LuminanceSourcePtr& out) const override;
    Error rotate_counter_clockwise_45(LuminanceSourcePtr& out) const override;

    /// Returns the wrapped source
    [[nodiscard]] LuminanceSourcePtr invert() const override { return delegate_; }

private:
    LuminanceSourcePtr delegate_;
};

} // namespace bitgrid

#endif // BITGRID_LUMINANCE_HPP
