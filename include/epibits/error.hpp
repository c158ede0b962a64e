/**
 * @file error.hpp
 * @brief epibits error handling.
 *
 * Every error is an input-contract violation: operations fail fast with an
 * exception carrying one of the codes below and never return partial
 * results.
 */

#ifndef EPIBITS_ERROR_HPP
#define EPIBITS_ERROR_HPP

#include "config.hpp"

#include <stdexcept>
#include <string>

namespace epibits {

/**
 * @brief Error codes carried by every epibits exception.
 */
enum class Error {
    Ok = 0,                    ///< Success
    InvalidArg = -1,           ///< Invalid argument
    Overflow = -2,             ///< Value does not fit the target integer
    InvalidWidth = -3,         ///< Value does not fit the declared width
    IncompatibleOperands = -4, ///< Operands have different widths
    IndexOutOfRange = -5,      ///< Collection index outside bounds
    IncompatibleSize = -6      ///< Collections (or matrix) sizes disagree
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
    case Error::InvalidArg:
        return "Invalid argument";
    case Error::Overflow:
        return "Integer overflow";
    case Error::InvalidWidth:
        return "Value does not fit the encoding width";
    case Error::IncompatibleOperands:
        return "Incompatible operands";
    case Error::IndexOutOfRange:
        return "Index out of range";
    case Error::IncompatibleSize:
        return "Incompatible size";
    default:
        return "Unknown error";
    }
}

/**
 * @brief Base exception for epibits errors.
 */
class EpibitsException : public std::runtime_error {
public:
    explicit EpibitsException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgumentException : public EpibitsException {
public:
    explicit InvalidArgumentException(const std::string& message)
        : EpibitsException(message, Error::InvalidArg) {}
};

/**
 * @brief Exception for values that do not fit a native integer.
 */
class OverflowException : public EpibitsException {
public:
    explicit OverflowException(const std::string& message)
        : EpibitsException(message, Error::Overflow) {}
};

/**
 * @brief Exception for a value too large for its declared width.
 */
class InvalidWidthException : public EpibitsException {
public:
    explicit InvalidWidthException(const std::string& message)
        : EpibitsException(message, Error::InvalidWidth) {}
};

/**
 * @brief Exception for binary operations on differently sized encodings.
 */
class IncompatibleOperandsException : public EpibitsException {
public:
    explicit IncompatibleOperandsException(const std::string& message)
        : EpibitsException(message, Error::IncompatibleOperands) {}
};

/**
 * @brief Exception for collection indices outside bounds.
 */
class IndexOutOfRangeException : public EpibitsException {
public:
    explicit IndexOutOfRangeException(const std::string& message)
        : EpibitsException(message, Error::IndexOutOfRange) {}
};

/**
 * @brief Exception for collections of differing sizes.
 */
class IncompatibleSizeException : public EpibitsException {
public:
    explicit IncompatibleSizeException(const std::string& message)
        : EpibitsException(message, Error::IncompatibleSize) {}
};

} // namespace epibits

#endif // EPIBITS_ERROR_HPP
