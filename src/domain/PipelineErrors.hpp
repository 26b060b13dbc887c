/**
 * @file PipelineErrors.hpp
 * @brief Exception taxonomy shared by every pipeline stage.
 */

#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace adaharvest::domain {

/**
 * @enum ErrorKind
 * @brief Category of a pipeline failure, recorded in PipelineState and the run summary.
 */
enum class ErrorKind {
    None,
    TransientFetch,
    PermanentFetch,
    Extraction,
    Validation,
    Storage,
    Cancelled
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::TransientFetch: return "transient-fetch";
        case ErrorKind::PermanentFetch: return "permanent-fetch";
        case ErrorKind::Extraction: return "extraction";
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Storage: return "storage";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "none";
}

inline ErrorKind ErrorKindFromString(const std::string& value) {
    if (value == "transient-fetch") return ErrorKind::TransientFetch;
    if (value == "permanent-fetch") return ErrorKind::PermanentFetch;
    if (value == "extraction") return ErrorKind::Extraction;
    if (value == "validation") return ErrorKind::Validation;
    if (value == "storage") return ErrorKind::Storage;
    if (value == "cancelled") return ErrorKind::Cancelled;
    return ErrorKind::None;
}

/**
 * @class PipelineError
 * @brief Base of every error raised by a stage. Carries its ErrorKind.
 */
class PipelineError : public std::runtime_error {
public:
    PipelineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * @class TransientFetchError
 * @brief Network failure, timeout or rate limiting. Retryable.
 */
class TransientFetchError : public PipelineError {
public:
    explicit TransientFetchError(const std::string& message,
                                 int httpStatus = 0,
                                 std::optional<std::chrono::milliseconds> retryAfter = std::nullopt)
        : PipelineError(ErrorKind::TransientFetch, message),
          m_httpStatus(httpStatus),
          m_retryAfter(retryAfter) {}

    int httpStatus() const { return m_httpStatus; }

    /** @brief Server-provided minimum wait before the next attempt, if any. */
    std::optional<std::chrono::milliseconds> retryAfter() const { return m_retryAfter; }

private:
    int m_httpStatus;
    std::optional<std::chrono::milliseconds> m_retryAfter;
};

/**
 * @class PermanentFetchError
 * @brief Missing decision, gone document or malformed response. Not retryable.
 */
class PermanentFetchError : public PipelineError {
public:
    explicit PermanentFetchError(const std::string& message, int httpStatus = 0)
        : PipelineError(ErrorKind::PermanentFetch, message), m_httpStatus(httpStatus) {}

    int httpStatus() const { return m_httpStatus; }

private:
    int m_httpStatus;
};

/**
 * @class ExtractionError
 * @brief The extraction capability could not produce any text (corrupt or unsupported document).
 */
class ExtractionError : public PipelineError {
public:
    explicit ExtractionError(const std::string& message)
        : PipelineError(ErrorKind::Extraction, message) {}
};

/**
 * @class ValidationError
 * @brief The primary identifier of a record is unusable.
 */
class ValidationError : public PipelineError {
public:
    explicit ValidationError(const std::string& message)
        : PipelineError(ErrorKind::Validation, message) {}
};

/**
 * @class StorageError
 * @brief I/O failure in one of the persistent stores.
 */
class StorageError : public PipelineError {
public:
    explicit StorageError(const std::string& message)
        : PipelineError(ErrorKind::Storage, message) {}
};

/**
 * @class CancelledError
 * @brief Raised from a suspension point when the run-level cancellation signal fires.
 */
class CancelledError : public PipelineError {
public:
    CancelledError() : PipelineError(ErrorKind::Cancelled, "operation cancelled") {}
};

} // namespace adaharvest::domain
