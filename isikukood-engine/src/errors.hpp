/**
 * @file errors.hpp
 * @brief Error taxonomy for identity code parsing, encoding and generation
 *
 * Hierarchy:
 * - IdentityCodeError
 *   - InputError: the caller supplied bad data
 *     - FormatError: not purely numeric, or wrong number of digits
 *     - RangeError: a numeric field (marker, sequence, year, ...) is out of its domain
 *     - SemanticError: well-formed but invalid (nonexistent date, checksum mismatch)
 *   - InternalConsistencyError: the engine produced output that fails its own validation
 */

#ifndef ISIKUKOOD_ERRORS_HPP
#define ISIKUKOOD_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace isikukood {

/**
 * @brief Base exception for all identity code errors
 */
class IdentityCodeError : public std::runtime_error {
public:
    explicit IdentityCodeError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Base for errors caused by caller-supplied input
 */
class InputError : public IdentityCodeError {
public:
    explicit InputError(const std::string& message)
        : IdentityCodeError(message) {}

    /// Short name of the error kind ("format", "range", "semantic")
    virtual const char* kind() const = 0;
};

/**
 * @brief Raised when input is not purely numeric or has the wrong digit count
 */
class FormatError : public InputError {
public:
    explicit FormatError(const std::string& message)
        : InputError("Format error: " + message) {}

    const char* kind() const override { return "format"; }
};

/**
 * @brief Raised when a numeric field lies outside its permitted domain
 */
class RangeError : public InputError {
public:
    explicit RangeError(const std::string& message)
        : InputError("Range error: " + message) {}

    const char* kind() const override { return "range"; }
};

/**
 * @brief Raised for structurally valid but semantically invalid input
 */
class SemanticError : public InputError {
public:
    explicit SemanticError(const std::string& message)
        : InputError("Semantic error: " + message) {}

    const char* kind() const override { return "semantic"; }
};

/**
 * @brief Raised when a construction or generation routine fails its own re-validation
 *
 * Signals a defect in the engine, not bad input. Callers must not treat it as
 * a rejected input.
 */
class InternalConsistencyError : public IdentityCodeError {
public:
    explicit InternalConsistencyError(const std::string& message)
        : IdentityCodeError("Internal consistency failure: " + message) {}
};

} // namespace isikukood

#endif // ISIKUKOOD_ERRORS_HPP
