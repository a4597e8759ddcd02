#ifndef CLIPBRIDGE_SUPERVISOR_PROCESS_SUPERVISOR_H_
#define CLIPBRIDGE_SUPERVISOR_PROCESS_SUPERVISOR_H_

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "absl/status/statusor.h"
#include "common/configuration.h"
#include "client_registry.h"
#include "line_assembler.h"
#include "log_event_classifier.h"
#include "readiness_resolver.h"
#include "supervisor_listener.h"
#include "types.h"
#include "worker_locator.h"
#include "worker_process.h"

namespace ClipBridge {

/// Timing and probe settings of one supervisor.
struct SupervisorOptions {
	std::chrono::milliseconds startup_timeout{CLIENT_STARTUP_TIMEOUT_MS};
	bool probe_enabled = false;
	std::string probe_host = DEFAULT_PROBE_HOST;
	std::chrono::milliseconds probe_delay{READINESS_PROBE_DELAY_MS};
	std::chrono::milliseconds probe_timeout{READINESS_PROBE_TIMEOUT_MS};
	std::chrono::milliseconds stop_grace_period{STOP_GRACE_PERIOD_MS};

	/// The probe is only meaningful for the server role, which listens.
	static SupervisorOptions ForRole(WorkerRole role, const ClipBridgeConfig& config);
};

/**
 * Owns one worker process of a fixed role and drives its lifecycle:
 *
 *   Idle -> Starting -> Running -> Stopping -> Stopped
 *   Starting -> Failed, Running -> Failed, Starting -> Stopping
 *
 * Worker output is reassembled into lines, classified, and routed to the
 * peer registry, the readiness race and the listener. Idle, Stopped and
 * Failed accept a new Start.
 *
 * Every method must be called on the io_context thread except state(),
 * which may be read from anywhere. The supervisor must outlive any run of
 * the io_context that can still dispatch its handlers.
 */
class ProcessSupervisor {
public:
	/// Completes with the success message or the failure status.
	using ResultCallback = std::function<void(absl::StatusOr<std::string>)>;

	ProcessSupervisor(boost::asio::io_context& io, WorkerRole role, SupervisorOptions options,
			IWorkerLauncher& launcher, const WorkerLocator& locator,
			ISupervisorListener* listener);
	~ProcessSupervisor();

	ProcessSupervisor(const ProcessSupervisor&) = delete;
	ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

	void Start(const StartConfig& config, ResultCallback callback);
	void Stop(ResultCallback callback);

	ProcessState state() const { return state_.load(std::memory_order_acquire); }
	WorkerRole role() const { return role_; }

	std::vector<ConnectedPeer> ListConnectedPeers() const { return registry_.List(); }

	/// Last diagnostic lines, each "STDERR: "-prefixed, oldest first.
	std::vector<std::string> DiagnosticTail() const;

	/// Spawn time of the current or last worker.
	std::optional<std::chrono::system_clock::time_point> started_at() const { return started_at_; }

	/// True while a worker handle is held (including a killed worker whose
	/// exit has not been confirmed yet).
	bool HasWorker() const { return worker_ != nullptr; }

private:
	void OnWorkerData(StreamKind kind, std::string_view chunk);
	void OnWorkerStreamClosed(StreamKind kind);
	void OnWorkerExit(const WorkerExit& exit);
	void OnReadinessResolved(const ReadinessResult& result);
	void OnGracePeriodExpired();

	void HandleLine(const LogLine& line);
	void AppendDiagnostic(const std::string& text);
	std::string TriageOutput() const;

	void FailStart(absl::Status status);
	void KillWorker();
	void EnterTerminal(ProcessState state);
	void SetState(ProcessState state);

	LineAssembler& AssemblerFor(StreamKind kind) {
		return kind == StreamKind::Primary ? stdout_assembler_ : stderr_assembler_;
	}

	boost::asio::io_context& io_;
	const WorkerRole role_;
	const SupervisorOptions options_;
	IWorkerLauncher& launcher_;
	const WorkerLocator& locator_;
	ISupervisorListener* listener_;

	std::atomic<ProcessState> state_{ProcessState::Idle};
	std::shared_ptr<IWorkerProcess> worker_;
	uint64_t generation_ = 0;
	std::optional<std::chrono::system_clock::time_point> started_at_;

	LineAssembler stdout_assembler_{StreamKind::Primary};
	LineAssembler stderr_assembler_{StreamKind::Diagnostic};
	LogEventClassifier classifier_;
	ClientRegistry registry_;
	std::deque<std::string> diagnostic_tail_;

	std::unique_ptr<ReadinessResolver> resolver_;
	ResultCallback start_callback_;

	boost::asio::steady_timer grace_timer_;
	ResultCallback stop_callback_;
	bool stop_forced_ = false;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_PROCESS_SUPERVISOR_H_
