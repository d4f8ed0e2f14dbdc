#pragma once

#include <GeoRaster/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for GeoRaster
 *
 * Every exception carries an ErrorCode so callers can branch on the
 * error kind without a chain of catch clauses.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Geo::Raster {

/**
 * @brief Error kinds reported by the library
 */
enum class ErrorCode {
    Generic,                ///< Unclassified failure
    InvalidArgument,        ///< Parameter outside its valid domain
    InvalidWindow,          ///< Window dimensions non-positive or not odd where required
    DegenerateWindow,       ///< Tile cannot be quantized (maximum is zero)
    UnsupportedProperty,    ///< Texture property name not recognized
    ShapeMismatch,          ///< Array shapes disagree
    OutOfRange,             ///< Index outside the raster
    InsufficientData,       ///< Not enough valid samples
    Cancelled               ///< Computation aborted through a CancelToken
};

/**
 * @brief Base exception class for GeoRaster
 */
class GEORASTER_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message,
                       ErrorCode code = ErrorCode::Generic)
        : std::runtime_error(message), code_(code) {}

    /// Error kind
    ErrorCode Code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/**
 * @brief Invalid argument exception
 */
class GEORASTER_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message, ErrorCode::InvalidArgument) {}

protected:
    InvalidArgumentException(ErrorCode code, const std::string& message)
        : Exception(message, code) {}
};

/**
 * @brief Window descriptor rejected (INVALID_WINDOW)
 */
class GEORASTER_API InvalidWindowException : public InvalidArgumentException {
public:
    explicit InvalidWindowException(const std::string& message)
        : InvalidArgumentException(ErrorCode::InvalidWindow, "Invalid window: " + message) {}
};

/**
 * @brief Tile whose maximum is zero, quantization undefined (DEGENERATE_WINDOW)
 */
class GEORASTER_API DegenerateWindowException : public Exception {
public:
    DegenerateWindowException(const std::string& message,
                              int32_t tileRow, int32_t tileCol)
        : Exception("Degenerate window: " + message, ErrorCode::DegenerateWindow),
          tileRow_(tileRow), tileCol_(tileCol) {}

    /// Row index of the failing tile in the output grid
    int32_t TileRow() const noexcept { return tileRow_; }

    /// Column index of the failing tile in the output grid
    int32_t TileCol() const noexcept { return tileCol_; }

private:
    int32_t tileRow_;
    int32_t tileCol_;
};

/**
 * @brief Out of range exception
 */
class GEORASTER_API OutOfRangeException : public Exception {
public:
    explicit OutOfRangeException(const std::string& message)
        : Exception("Out of range: " + message, ErrorCode::OutOfRange) {}
};

/**
 * @brief Insufficient data for algorithm (e.g., no finite sample to interpolate from)
 */
class GEORASTER_API InsufficientDataException : public Exception {
public:
    explicit InsufficientDataException(const std::string& message)
        : Exception("Insufficient data: " + message, ErrorCode::InsufficientData) {}
};

/**
 * @brief Unsupported operation or option
 */
class GEORASTER_API UnsupportedException : public Exception {
public:
    explicit UnsupportedException(const std::string& message)
        : Exception("Unsupported: " + message, ErrorCode::Generic) {}

protected:
    UnsupportedException(ErrorCode code, const std::string& message)
        : Exception(message, code) {}
};

/**
 * @brief Texture property name not recognized (UNSUPPORTED_PROPERTY)
 */
class GEORASTER_API UnsupportedPropertyException : public UnsupportedException {
public:
    explicit UnsupportedPropertyException(const std::string& message)
        : UnsupportedException(ErrorCode::UnsupportedProperty,
                               "Unsupported property: " + message) {}
};

/**
 * @brief Array shapes disagree (SHAPE_MISMATCH)
 */
class GEORASTER_API ShapeMismatchException : public Exception {
public:
    explicit ShapeMismatchException(const std::string& message)
        : Exception("Shape mismatch: " + message, ErrorCode::ShapeMismatch) {}
};

/**
 * @brief Computation aborted between work units
 */
class GEORASTER_API CancelledException : public Exception {
public:
    explicit CancelledException(const std::string& message)
        : Exception("Cancelled: " + message, ErrorCode::Cancelled) {}
};

} // namespace Geo::Raster
