#include "error.h"

namespace ClipBridge {

const char* ErrorKindName(ErrorKind kind) {
	switch (kind) {
		case ErrorKind::None:            return "None";
		case ErrorKind::AlreadyRunning:  return "AlreadyRunning";
		case ErrorKind::NotRunning:      return "NotRunning";
		case ErrorKind::InvalidConfig:   return "InvalidConfig";
		case ErrorKind::SpawnFailure:    return "SpawnFailure";
		case ErrorKind::DependencyError: return "DependencyError";
		case ErrorKind::StartupTimeout:  return "StartupTimeout";
		case ErrorKind::UnsolicitedExit: return "UnsolicitedExit";
		case ErrorKind::StartCancelled:  return "StartCancelled";
		case ErrorKind::Unknown:         return "Unknown";
	}
	return "Unknown";
}

absl::StatusCode ErrorKindToCode(ErrorKind kind) {
	switch (kind) {
		case ErrorKind::None:            return absl::StatusCode::kOk;
		case ErrorKind::AlreadyRunning:  return absl::StatusCode::kAlreadyExists;
		case ErrorKind::NotRunning:      return absl::StatusCode::kFailedPrecondition;
		case ErrorKind::InvalidConfig:   return absl::StatusCode::kInvalidArgument;
		case ErrorKind::SpawnFailure:    return absl::StatusCode::kUnavailable;
		case ErrorKind::DependencyError: return absl::StatusCode::kAborted;
		case ErrorKind::StartupTimeout:  return absl::StatusCode::kDeadlineExceeded;
		case ErrorKind::UnsolicitedExit: return absl::StatusCode::kInternal;
		case ErrorKind::StartCancelled:  return absl::StatusCode::kCancelled;
		case ErrorKind::Unknown:         return absl::StatusCode::kUnknown;
	}
	return absl::StatusCode::kUnknown;
}

absl::Status MakeError(ErrorKind kind, const std::string& message) {
	return absl::Status(ErrorKindToCode(kind), message);
}

ErrorKind ErrorKindOf(const absl::Status& status) {
	switch (status.code()) {
		case absl::StatusCode::kOk:                 return ErrorKind::None;
		case absl::StatusCode::kAlreadyExists:      return ErrorKind::AlreadyRunning;
		case absl::StatusCode::kFailedPrecondition: return ErrorKind::NotRunning;
		case absl::StatusCode::kInvalidArgument:    return ErrorKind::InvalidConfig;
		case absl::StatusCode::kUnavailable:        return ErrorKind::SpawnFailure;
		case absl::StatusCode::kAborted:            return ErrorKind::DependencyError;
		case absl::StatusCode::kDeadlineExceeded:   return ErrorKind::StartupTimeout;
		case absl::StatusCode::kInternal:           return ErrorKind::UnsolicitedExit;
		case absl::StatusCode::kCancelled:          return ErrorKind::StartCancelled;
		default:                                    return ErrorKind::Unknown;
	}
}

bool IsFatal(ErrorKind kind) {
	switch (kind) {
		case ErrorKind::SpawnFailure:
		case ErrorKind::DependencyError:
		case ErrorKind::StartupTimeout:
		case ErrorKind::UnsolicitedExit:
			return true;
		default:
			return false;
	}
}

} // namespace ClipBridge
