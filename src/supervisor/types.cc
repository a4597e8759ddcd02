#include "types.h"

namespace ClipBridge {

const char* WorkerRoleName(WorkerRole role) {
	switch (role) {
		case WorkerRole::Server: return "server";
		case WorkerRole::Client: return "client";
	}
	return "unknown";
}

const char* WorkerRoleTitle(WorkerRole role) {
	switch (role) {
		case WorkerRole::Server: return "Server";
		case WorkerRole::Client: return "Client";
	}
	return "Unknown";
}

std::optional<WorkerRole> ParseWorkerRole(const std::string& value) {
	if (value == "server") return WorkerRole::Server;
	if (value == "client") return WorkerRole::Client;
	return std::nullopt;
}

const char* ProcessStateName(ProcessState state) {
	switch (state) {
		case ProcessState::Idle:     return "idle";
		case ProcessState::Starting: return "starting";
		case ProcessState::Running:  return "running";
		case ProcessState::Stopping: return "stopping";
		case ProcessState::Stopped:  return "stopped";
		case ProcessState::Failed:   return "failed";
	}
	return "unknown";
}

const char* StreamKindName(StreamKind stream) {
	return stream == StreamKind::Primary ? "stdout" : "stderr";
}

} // namespace ClipBridge
