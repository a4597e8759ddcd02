#ifndef CLIPBRIDGE_SUPERVISOR_TYPES_H_
#define CLIPBRIDGE_SUPERVISOR_TYPES_H_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace ClipBridge {

enum class WorkerRole : uint8_t { Server, Client };

/// Lower-case role name ("server"/"client") used in logs and the CLI.
const char* WorkerRoleName(WorkerRole role);

/// Capitalised role name ("Server"/"Client") used in user-facing messages.
const char* WorkerRoleTitle(WorkerRole role);

/// Parse "server"/"client"; returns nullopt for anything else.
std::optional<WorkerRole> ParseWorkerRole(const std::string& value);

/**
 * Supervisor states.
 * Idle, Stopped and Failed are terminal: a new start is allowed from them.
 */
enum class ProcessState : uint8_t {
	Idle = 0,
	Starting,
	Running,
	Stopping,
	Stopped,
	Failed
};

const char* ProcessStateName(ProcessState state);

inline bool IsTerminalState(ProcessState state) {
	return state == ProcessState::Idle ||
		state == ProcessState::Stopped ||
		state == ProcessState::Failed;
}

/// Coarse "running"/"stopped" view exposed to the UI layer.
inline const char* ExternalStatusName(ProcessState state) {
	return IsTerminalState(state) ? "stopped" : "running";
}

enum class StreamKind : uint8_t {
	Primary,     // worker stdout
	Diagnostic   // worker stderr
};

const char* StreamKindName(StreamKind stream);

struct LogLine {
	StreamKind stream;
	std::string text;
};

// Classified events
struct ReadySignal {};
struct PeerConnected { std::string address; };
struct PeerDisconnected { std::string address; };
struct DependencyError { std::string detail; };
struct GenericError { std::string detail; };
struct InfoLine { std::string text; };

using ClassifiedEvent = std::variant<ReadySignal, PeerConnected, PeerDisconnected,
	DependencyError, GenericError, InfoLine>;

struct ConnectedPeer {
	std::string id;
	std::string address;
	std::string display_name;
	std::chrono::system_clock::time_point connected_at;
};

/// Per-start parameters supplied by the caller.
struct StartConfig {
	int port = 0;
	std::optional<std::string> peer_address;  // required for the client role
	std::string log_level;
};

struct ServiceStatus {
	ProcessState server = ProcessState::Idle;
	ProcessState client = ProcessState::Idle;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_TYPES_H_
