#pragma once

/// @file error.h
/// @brief SkyRCA error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace skyrca {

/// @brief Error codes specific to SkyRCA
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kInternal,
    kUnavailable,
    kDataLoss,

    // SkyRCA-specific error codes
    kDeserializationError,
    kConfigurationError,
    kValidationError,
    kMalformedSnapshot,
};

/// @brief Convert SkyRCA error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Create a configuration error (reported as InvalidArgument)
inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

/// @brief Create an error for a snapshot whose structure cannot be used
inline absl::Status MalformedSnapshotError(std::string_view message) {
    return MakeError(ErrorCode::kMalformedSnapshot, message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define SKYRCA_RETURN_IF_ERROR(expr)                                           \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define SKYRCA_ASSIGN_OR_RETURN(lhs, rhs)                                      \
    SKYRCA_ASSIGN_OR_RETURN_IMPL(                                              \
        SKYRCA_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define SKYRCA_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                       \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define SKYRCA_CONCAT(a, b) SKYRCA_CONCAT_IMPL(a, b)
#define SKYRCA_CONCAT_IMPL(a, b) a##b

}  // namespace skyrca
