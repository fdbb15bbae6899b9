#include "error.h"

namespace skyrca {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
        case ErrorCode::kConfigurationError:
        case ErrorCode::kMalformedSnapshot:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kInternal:
        case ErrorCode::kDeserializationError:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kDataLoss:
            return absl::StatusCode::kDataLoss;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), std::string(message));
}

}  // namespace skyrca
