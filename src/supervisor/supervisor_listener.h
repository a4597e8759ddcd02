#ifndef CLIPBRIDGE_SUPERVISOR_SUPERVISOR_LISTENER_H_
#define CLIPBRIDGE_SUPERVISOR_SUPERVISOR_LISTENER_H_

#include <string>

#include "absl/status/status.h"
#include "types.h"

namespace ClipBridge {

/**
 * Event sink for the UI layer. Called on the supervisor's io_context thread;
 * implementations must not block it.
 */
class ISupervisorListener {
public:
	virtual ~ISupervisorListener() = default;

	/// One non-blank worker line, "ERROR: "-prefixed when it reports an error.
	virtual void OnLogLine(WorkerRole role, const std::string& text) = 0;

	virtual void OnStatusChanged(WorkerRole role, ProcessState state) = 0;

	virtual void OnPeerConnected(WorkerRole role, const ConnectedPeer& peer) = 0;

	virtual void OnPeerDisconnected(WorkerRole role, const std::string& peer_id) = 0;

	/// The worker exited without being asked to, after it had become ready.
	/// The status carries the exit description and the diagnostic tail.
	virtual void OnWorkerFailed(WorkerRole role, const absl::Status& error) = 0;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_SUPERVISOR_LISTENER_H_
