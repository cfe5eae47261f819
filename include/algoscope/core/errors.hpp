/**
 * @file errors.hpp
 * @brief Error taxonomy shared by every component
 *
 * Every failing request leaves the engine classified as exactly one
 * ErrorKind, which fixes both the wire name and the status code.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace algoscope {
namespace core {

/**
 * @enum ErrorKind
 * @brief Classification of request failures
 */
enum class ErrorKind {
    VALIDATION_ERROR,      ///< Malformed or missing request fields (400)
    TIMEOUT_ERROR,         ///< Execution or benchmark exceeded its time limit (200, ok:false)
    RUNTIME_FAULT,         ///< User program raised or exhausted a resource (200, ok:false)
    UNSUPPORTED_LANGUAGE,  ///< Language recognised but has no runner (200, ok:false)
    INTERNAL_FAULT         ///< Engine failure unrelated to user input (500)
};

/**
 * @brief Wire name of an error kind ("ValidationError", ...)
 */
std::string ToString(ErrorKind kind);

/**
 * @brief Status code a response with this error kind carries
 */
int HttpStatusFor(ErrorKind kind);

/**
 * @class EngineError
 * @brief Exception carrying an ErrorKind
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {
    }

    ErrorKind Kind() const { return kind_; }

private:
    ErrorKind kind_;
};

} // namespace core
} // namespace algoscope
