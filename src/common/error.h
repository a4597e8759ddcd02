#ifndef CLIPBRIDGE_COMMON_ERROR_H_
#define CLIPBRIDGE_COMMON_ERROR_H_

#include <string>

#include "absl/status/status.h"

namespace ClipBridge {

/**
 * Failure categories surfaced by the supervisor.
 * Each kind maps to exactly one absl::StatusCode so the kind survives
 * being passed around as a plain absl::Status.
 */
enum class ErrorKind {
	None,
	AlreadyRunning,
	NotRunning,
	InvalidConfig,
	SpawnFailure,
	DependencyError,
	StartupTimeout,
	UnsolicitedExit,
	StartCancelled,
	Unknown
};

const char* ErrorKindName(ErrorKind kind);

absl::StatusCode ErrorKindToCode(ErrorKind kind);

/// Build a status of the given kind with a human readable message.
absl::Status MakeError(ErrorKind kind, const std::string& message);

/// Recover the kind from a status produced by MakeError.
ErrorKind ErrorKindOf(const absl::Status& status);

/// Fatal kinds move the supervisor to Failed; the rest are guard violations.
bool IsFatal(ErrorKind kind);

} // namespace ClipBridge

#endif // CLIPBRIDGE_COMMON_ERROR_H_
