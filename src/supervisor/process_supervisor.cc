#include "process_supervisor.h"

#include <signal.h>

#include <sstream>

#include <glog/logging.h>

#include "common/error.h"

namespace ClipBridge {

SupervisorOptions SupervisorOptions::ForRole(WorkerRole role, const ClipBridgeConfig& config) {
	SupervisorOptions options;
	if (role == WorkerRole::Server) {
		options.startup_timeout = std::chrono::milliseconds(config.timing.server_startup_timeout_ms.get());
		options.probe_enabled = true;
	} else {
		options.startup_timeout = std::chrono::milliseconds(config.timing.client_startup_timeout_ms.get());
		options.probe_enabled = false;
	}
	options.probe_host = config.server.probe_host.get();
	options.probe_delay = std::chrono::milliseconds(config.timing.probe_delay_ms.get());
	options.probe_timeout = std::chrono::milliseconds(config.timing.probe_timeout_ms.get());
	options.stop_grace_period = std::chrono::milliseconds(config.timing.stop_grace_period_ms.get());
	return options;
}

ProcessSupervisor::ProcessSupervisor(boost::asio::io_context& io, WorkerRole role,
		SupervisorOptions options, IWorkerLauncher& launcher, const WorkerLocator& locator,
		ISupervisorListener* listener)
	: io_(io),
	role_(role),
	options_(std::move(options)),
	launcher_(launcher),
	locator_(locator),
	listener_(listener),
	classifier_(ClassifierRules::ForRole(role)),
	grace_timer_(io) {}

ProcessSupervisor::~ProcessSupervisor() {
	if (worker_ && !worker_->exited()) {
		LOG(WARNING) << WorkerRoleTitle(role_) << " supervisor destroyed with a live worker, killing it";
		worker_->Signal(SIGKILL);
	}
}

void ProcessSupervisor::Start(const StartConfig& config, ResultCallback callback) {
	const std::string title = WorkerRoleTitle(role_);

	if (!IsTerminalState(state())) {
		callback(MakeError(ErrorKind::AlreadyRunning, title + " is already running"));
		return;
	}
	if (worker_) {
		// Killed after a failed start, exit not confirmed yet
		callback(MakeError(ErrorKind::AlreadyRunning, title + " is still shutting down"));
		return;
	}

	absl::StatusOr<LaunchSpec> spec = locator_.Locate(role_, config);
	if (!spec.ok()) {
		// Rejected parameters leave the state alone; a missing worker is fatal
		if (!IsFatal(ErrorKindOf(spec.status()))) {
			callback(spec.status());
			return;
		}
		LOG(ERROR) << "Failed to start " << WorkerRoleName(role_) << ": " << spec.status().message();
		EnterTerminal(ProcessState::Failed);
		callback(MakeError(ErrorKindOf(spec.status()),
				"Failed to start " + std::string(WorkerRoleName(role_)) + ": " + std::string(spec.status().message())));
		return;
	}

	// Fresh per-attempt state
	++generation_;
	stdout_assembler_ = LineAssembler(StreamKind::Primary);
	stderr_assembler_ = LineAssembler(StreamKind::Diagnostic);
	diagnostic_tail_.clear();
	registry_.Clear();
	stop_forced_ = false;
	resolver_.reset();

	LOG(INFO) << "Starting " << WorkerRoleName(role_) << " on port " << config.port
		<< (config.peer_address ? " (server " + *config.peer_address + ")" : std::string())
		<< ": " << spec->CommandLine();

	const uint64_t generation = generation_;
	WorkerCallbacks callbacks;
	callbacks.on_data = [this, generation](StreamKind kind, std::string_view chunk) {
		if (generation == generation_) {
			OnWorkerData(kind, chunk);
		}
	};
	callbacks.on_stream_closed = [this, generation](StreamKind kind) {
		if (generation == generation_) {
			OnWorkerStreamClosed(kind);
		}
	};
	callbacks.on_exit = [this, generation](const WorkerExit& exit) {
		if (generation == generation_) {
			OnWorkerExit(exit);
		}
	};

	absl::StatusOr<std::shared_ptr<IWorkerProcess>> worker = launcher_.Launch(*spec, std::move(callbacks));
	if (!worker.ok()) {
		LOG(ERROR) << "Failed to start " << WorkerRoleName(role_) << ": " << worker.status().message();
		EnterTerminal(ProcessState::Failed);
		callback(MakeError(ErrorKind::SpawnFailure,
				"Failed to start " + std::string(WorkerRoleName(role_)) + ": " + std::string(worker.status().message())));
		return;
	}

	worker_ = std::move(*worker);
	started_at_ = std::chrono::system_clock::now();
	start_callback_ = std::move(callback);
	SetState(ProcessState::Starting);

	ReadinessOptions readiness;
	readiness.timeout = options_.startup_timeout;
	readiness.probe_enabled = options_.probe_enabled;
	readiness.probe_host = options_.probe_host;
	readiness.probe_port = config.port;
	readiness.probe_delay = options_.probe_delay;
	readiness.probe_timeout = options_.probe_timeout;

	resolver_ = std::make_unique<ReadinessResolver>(io_, std::move(readiness),
			[this](const ReadinessResult& result) { OnReadinessResolved(result); });
	resolver_->Arm();
}

void ProcessSupervisor::Stop(ResultCallback callback) {
	const std::string title = WorkerRoleTitle(role_);
	ProcessState current = state();

	if (current != ProcessState::Starting && current != ProcessState::Running) {
		callback(MakeError(ErrorKind::NotRunning, title + " is not running"));
		return;
	}

	ResultCallback cancelled_start;
	if (current == ProcessState::Starting) {
		LOG(INFO) << "Stop requested while " << WorkerRoleName(role_) << " is starting, abandoning start";
		if (resolver_) {
			resolver_->Abandon();
		}
		cancelled_start = std::move(start_callback_);
		start_callback_ = nullptr;
	}

	stop_callback_ = std::move(callback);
	stop_forced_ = false;
	SetState(ProcessState::Stopping);

	if (cancelled_start) {
		cancelled_start(MakeError(ErrorKind::StartCancelled, title + " start cancelled by stop"));
	}

	// The worker may have been reaped already with its exit still draining;
	// the exit callback completes the stop either way.
	if (worker_ && !worker_->Signal(SIGTERM)) {
		VLOG(1) << "SIGTERM not delivered to " << WorkerRoleName(role_) << ", waiting for exit";
	}

	grace_timer_.expires_after(options_.stop_grace_period);
	const uint64_t generation = generation_;
	grace_timer_.async_wait([this, generation](const boost::system::error_code& ec) {
		if (ec == boost::asio::error::operation_aborted || generation != generation_) {
			return;
		}
		OnGracePeriodExpired();
	});
}

void ProcessSupervisor::OnGracePeriodExpired() {
	if (state() != ProcessState::Stopping) {
		return;
	}
	LOG(WARNING) << WorkerRoleTitle(role_) << " did not exit within "
		<< options_.stop_grace_period.count() << "ms, sending SIGKILL";
	stop_forced_ = true;
	KillWorker();
}

void ProcessSupervisor::OnWorkerData(StreamKind kind, std::string_view chunk) {
	for (const LogLine& line : AssemblerFor(kind).Feed(chunk)) {
		HandleLine(line);
	}
}

void ProcessSupervisor::OnWorkerStreamClosed(StreamKind kind) {
	VLOG(1) << WorkerRoleTitle(role_) << " " << StreamKindName(kind) << " closed";
	for (const LogLine& line : AssemblerFor(kind).Close()) {
		HandleLine(line);
	}
}

void ProcessSupervisor::HandleLine(const LogLine& line) {
	VLOG(1) << WorkerRoleTitle(role_) << " " << StreamKindName(line.stream) << ": " << line.text;

	if (line.stream == StreamKind::Diagnostic) {
		AppendDiagnostic(line.text);
	}

	ClassifiedEvent event = classifier_.Classify(line);

	std::string forwarded = line.text;
	if (line.stream == StreamKind::Diagnostic &&
			(std::holds_alternative<GenericError>(event) || std::holds_alternative<DependencyError>(event))) {
		forwarded = "ERROR: " + line.text;
	}
	if (listener_) {
		listener_->OnLogLine(role_, forwarded);
	}

	// A killed worker may still log until it is reaped; the registry only
	// follows a live attempt.
	ProcessState current = state();
	bool tracks_peers = role_ == WorkerRole::Server && !IsTerminalState(current);

	if (const auto* connected = std::get_if<PeerConnected>(&event)) {
		if (tracks_peers) {
			std::optional<ConnectedPeer> peer = registry_.UpsertOnConnect(connected->address);
			if (peer && listener_) {
				listener_->OnPeerConnected(role_, *peer);
			}
		}
	} else if (const auto* disconnected = std::get_if<PeerDisconnected>(&event)) {
		if (tracks_peers) {
			std::optional<std::string> id = registry_.RemoveOnDisconnect(disconnected->address);
			if (id && listener_) {
				listener_->OnPeerDisconnected(role_, *id);
			}
		}
	} else if (const auto* dependency = std::get_if<DependencyError>(&event)) {
		LOG(ERROR) << WorkerRoleTitle(role_) << " dependency error: " << dependency->detail;
	} else if (const auto* error = std::get_if<GenericError>(&event)) {
		LOG(WARNING) << WorkerRoleTitle(role_) << " reported: " << error->detail;
	}

	if (current == ProcessState::Starting && resolver_) {
		resolver_->OnEvent(event);
	}
}

void ProcessSupervisor::AppendDiagnostic(const std::string& text) {
	diagnostic_tail_.push_back("STDERR: " + text);
	while (diagnostic_tail_.size() > DIAGNOSTIC_TAIL_LINES) {
		diagnostic_tail_.pop_front();
	}
}

std::vector<std::string> ProcessSupervisor::DiagnosticTail() const {
	return std::vector<std::string>(diagnostic_tail_.begin(), diagnostic_tail_.end());
}

std::string ProcessSupervisor::TriageOutput() const {
	std::stringstream ss;
	for (const auto& line : diagnostic_tail_) {
		ss << line << "\n";
	}
	return ss.str();
}

void ProcessSupervisor::OnReadinessResolved(const ReadinessResult& result) {
	DCHECK(state() == ProcessState::Starting) << "Readiness resolved in state " << ProcessStateName(state());
	const std::string title = WorkerRoleTitle(role_);

	switch (result.outcome) {
		case ReadinessOutcome::Succeeded: {
			std::string message;
			if (result.source == ReadinessSource::Probe) {
				message = title + " started successfully (verified by connection)";
			} else if (role_ == WorkerRole::Server) {
				message = "Server started successfully";
			} else {
				message = "Client connected successfully";
			}
			LOG(INFO) << message;
			SetState(ProcessState::Running);
			ResultCallback callback = std::move(start_callback_);
			start_callback_ = nullptr;
			if (callback) {
				callback(message);
			}
			return;
		}
		case ReadinessOutcome::FailedFatal:
			LOG(ERROR) << title << " cannot start, dependency error: " << result.detail;
			FailStart(MakeError(ErrorKind::DependencyError, "Python dependency error: " + result.detail));
			return;
		case ReadinessOutcome::TimedOut: {
			LOG(ERROR) << title << " did not become ready within " << options_.startup_timeout.count() << "ms";
			std::string message = title + " startup timeout";
			std::string triage = TriageOutput();
			if (!triage.empty()) {
				message += ". Output: " + triage;
			}
			FailStart(MakeError(ErrorKind::StartupTimeout, message));
			return;
		}
	}
}

void ProcessSupervisor::FailStart(absl::Status status) {
	DCHECK(IsFatal(ErrorKindOf(status))) << "Non-fatal start failure: " << status;
	KillWorker();
	EnterTerminal(ProcessState::Failed);
	ResultCallback callback = std::move(start_callback_);
	start_callback_ = nullptr;
	if (callback) {
		callback(std::move(status));
	}
}

void ProcessSupervisor::KillWorker() {
	if (worker_ && !worker_->exited()) {
		worker_->Signal(SIGKILL);
	}
}

void ProcessSupervisor::OnWorkerExit(const WorkerExit& exit) {
	grace_timer_.cancel();
	// The handle is released exactly here; the worker does not call back again
	std::shared_ptr<IWorkerProcess> worker = std::move(worker_);
	worker_.reset();

	const std::string title = WorkerRoleTitle(role_);
	ProcessState current = state();

	if (current == ProcessState::Stopping) {
		std::string message = title + (stop_forced_ ? " stopped (forced)" : " stopped gracefully");
		LOG(INFO) << message << " (" << exit.Describe() << ")";
		EnterTerminal(ProcessState::Stopped);
		ResultCallback callback = std::move(stop_callback_);
		stop_callback_ = nullptr;
		if (callback) {
			callback(message);
		}
		return;
	}

	if (IsTerminalState(current)) {
		VLOG(1) << title << " exit confirmed after failure (" << exit.Describe() << ")";
		return;
	}

	std::string message = title + " " + exit.Describe() + ". Output: " + TriageOutput();
	absl::Status status = MakeError(ErrorKind::UnsolicitedExit, message);

	if (current == ProcessState::Starting) {
		LOG(ERROR) << title << " " << exit.Describe() << " before becoming ready";
		if (resolver_) {
			resolver_->Abandon();
		}
		FailStart(status);
		return;
	}

	// Running
	bool clean = !exit.signaled() && exit.exit_code == 0;
	if (clean) {
		LOG(INFO) << title << " exited on its own with code 0";
	} else {
		LOG(ERROR) << title << " " << exit.Describe() << " while running";
	}
	EnterTerminal(clean ? ProcessState::Stopped : ProcessState::Failed);
	if (listener_) {
		listener_->OnWorkerFailed(role_, status);
	}
}

void ProcessSupervisor::EnterTerminal(ProcessState state) {
	DCHECK(IsTerminalState(state));
	registry_.Clear();
	SetState(state);
}

void ProcessSupervisor::SetState(ProcessState state) {
	ProcessState previous = state_.exchange(state, std::memory_order_acq_rel);
	if (previous == state) {
		return;
	}
	LOG(INFO) << WorkerRoleTitle(role_) << " state: " << ProcessStateName(previous)
		<< " -> " << ProcessStateName(state);
	if (listener_) {
		listener_->OnStatusChanged(role_, state);
	}
}

} // namespace ClipBridge
