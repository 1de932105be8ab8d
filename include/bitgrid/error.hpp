/**
 * @file error.hpp
 * @brief bitgrid error handling.
 *
 * Operations report failures through Error codes. Exception wrappers are
 * provided on top for callers that prefer them (disabled with
 * BITGRID_NO_EXCEPTIONS=1).
 */

#ifndef BITGRID_ERROR_HPP
#define BITGRID_ERROR_HPP

#include "config.hpp"

#if !BITGRID_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace bitgrid {

/**
 * @brief Error codes returned by fallible operations.
 */
enum class Error {
    Ok = 0,                 ///< Success
    InvalidDimension = -1,  ///< Zero dimension, bad bit count or bad range
    DimensionMismatch = -2, ///< Operands of different shape
    RegionOutOfBounds = -3, ///< Region does not fit inside the matrix
    ParseError = -4,        ///< Malformed text grid
    Unsupported = -5        ///< Operation not offered by this object
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::InvalidDimension:
        return "Invalid dimension";
    case Error::DimensionMismatch:
        return "Dimension mismatch";
    case Error::RegionOutOfBounds:
        return "Region out of bounds";
    case Error::ParseError:
        return "Parse error";
    case Error::Unsupported:
        return "Unsupported operation";
    default:
        return "Unknown error";
    }
}

#if !BITGRID_NO_EXCEPTIONS

/**
 * @brief Base exception for bitgrid errors.
 */
class BitGridException : public std::runtime_error {
public:
    explicit BitGridException(const std::string& message, Error code = Error::InvalidDimension)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid dimensions or ranges.
 */
class InvalidDimensionException : public BitGridException {
public:
    explicit InvalidDimensionException(const std::string& message)
        : BitGridException(message, Error::InvalidDimension) {}
};

/**
 * @brief Exception for mismatched operand shapes.
 */
class DimensionMismatchException : public BitGridException {
public:
    explicit DimensionMismatchException(const std::string& message)
        : BitGridException(message, Error::DimensionMismatch) {}
};

/**
 * @brief Exception for regions outside the matrix.
 */
class RegionOutOfBoundsException : public BitGridException {
public:
    explicit RegionOutOfBoundsException(const std::string& message)
        : BitGridException(message, Error::RegionOutOfBounds) {}
};

/**
 * @brief Exception for malformed text grids.
 */
class ParseErrorException : public BitGridException {
public:
    explicit ParseErrorException(const std::string& message)
        : BitGridException(message, Error::ParseError) {}
};

/**
 * @brief Exception for operations an object does not offer.
 */
class UnsupportedException : public BitGridException {
public:
    explicit UnsupportedException(const std::string& message)
        : BitGridException(message, Error::Unsupported) {}
};

/**
 * @brief Throw the exception matching @p error, if it is not Error::Ok.
 *
 * @param error Error code from a bitgrid operation
 * @param context Prefix for the exception message (may be nullptr)
 */
inline void throw_on_error(Error error, const char* context = nullptr) {
    if (error == Error::Ok) {
        return;
    }

    std::string message = (context != nullptr) ? std::string(context) + ": " : std::string();
    message += error_string(error);

    switch (error) {
    case Error::InvalidDimension:
        throw InvalidDimensionException(message);
    case Error::DimensionMismatch:
        throw DimensionMismatchException(message);
    case Error::RegionOutOfBounds:
        throw RegionOutOfBoundsException(message);
    case Error::ParseError:
        throw ParseErrorException(message);
    case Error::Unsupported:
        throw UnsupportedException(message);
    default:
        throw BitGridException(message, error);
    }
}

#endif // !BITGRID_NO_EXCEPTIONS

} // namespace bitgrid

#endif // BITGRID_ERROR_HPP
