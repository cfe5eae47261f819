/**
 * @file types.cpp
 * @brief Name tables for languages and error kinds
 *
 * @date 2025
 */

#include "algoscope/core/types.hpp"
#include "algoscope/core/errors.hpp"

namespace algoscope {
namespace core {

std::string ToString(Language language) {
    switch (language) {
        case Language::JAVASCRIPT: return "javascript";
        case Language::PYTHON:     return "python";
    }
    return "unknown";
}

std::optional<Language> ParseLanguage(const std::string& name) {
    if (name == "javascript") {
        return Language::JAVASCRIPT;
    }
    if (name == "python") {
        return Language::PYTHON;
    }
    return std::nullopt;
}

std::string ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION_ERROR:     return "ValidationError";
        case ErrorKind::TIMEOUT_ERROR:        return "TimeoutError";
        case ErrorKind::RUNTIME_FAULT:        return "RuntimeFault";
        case ErrorKind::UNSUPPORTED_LANGUAGE: return "UnsupportedLanguageError";
        case ErrorKind::INTERNAL_FAULT:       return "InternalFault";
    }
    return "InternalFault";
}

int HttpStatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::VALIDATION_ERROR:
            return 400;
        case ErrorKind::TIMEOUT_ERROR:
        case ErrorKind::RUNTIME_FAULT:
        case ErrorKind::UNSUPPORTED_LANGUAGE:
            return 200;
        case ErrorKind::INTERNAL_FAULT:
            return 500;
    }
    return 500;
}

} // namespace core
} // namespace algoscope
