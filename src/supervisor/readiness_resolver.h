#ifndef CLIPBRIDGE_SUPERVISOR_READINESS_RESOLVER_H_
#define CLIPBRIDGE_SUPERVISOR_READINESS_RESOLVER_H_

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio.hpp>

#include "tcp_probe.h"
#include "types.h"

namespace ClipBridge {

enum class ReadinessOutcome : uint8_t {
	Succeeded,
	FailedFatal,
	TimedOut
};

const char* ReadinessOutcomeName(ReadinessOutcome outcome);

/// Which signal won the race.
enum class ReadinessSource : uint8_t {
	LogMarker,
	Probe,
	DependencyError,
	Timeout
};

struct ReadinessResult {
	ReadinessOutcome outcome;
	ReadinessSource source;
	std::string detail;  // offending line for FailedFatal
};

/**
 * Single-resolution guard for one start call.
 * Claim() is an atomic check-and-set: only the first caller gets true.
 */
class StartAttempt {
public:
	StartAttempt() : started_at_(std::chrono::steady_clock::now()) {}

	bool Claim() { return !resolved_.exchange(true, std::memory_order_acq_rel); }
	bool resolved() const { return resolved_.load(std::memory_order_acquire); }

	std::chrono::steady_clock::time_point started_at() const { return started_at_; }

private:
	std::atomic<bool> resolved_{false};
	std::chrono::steady_clock::time_point started_at_;
};

struct ReadinessOptions {
	std::chrono::milliseconds timeout{0};
	bool probe_enabled = false;
	std::string probe_host;
	int probe_port = 0;
	std::chrono::milliseconds probe_delay{0};
	std::chrono::milliseconds probe_timeout{0};
};

/**
 * Races the readiness signals of one start attempt and reports exactly one
 * ReadinessResult.
 *
 * Signals: a ReadySignal from either stream, a DependencyError (preempts),
 * one delayed TCP probe (when enabled) and the overall timeout. Once the
 * result is delivered, the timeout, the probe delay and any in-flight probe
 * are cancelled and every later signal is a no-op.
 *
 * Lives on the supervisor's io_context; none of the methods are thread-safe
 * apart from the guard itself.
 */
class ReadinessResolver {
public:
	using Callback = std::function<void(const ReadinessResult&)>;

	ReadinessResolver(boost::asio::io_context& io, ReadinessOptions options, Callback callback);
	~ReadinessResolver();

	ReadinessResolver(const ReadinessResolver&) = delete;
	ReadinessResolver& operator=(const ReadinessResolver&) = delete;

	/// Start the timeout and, if enabled, the probe delay. Call once, right
	/// after the worker has been spawned.
	void Arm();

	/// Feed a classified line. Returns true if this event resolved the attempt.
	bool OnEvent(const ClassifiedEvent& event);

	bool OnReadySignal(ReadinessSource source = ReadinessSource::LogMarker);
	bool OnDependencyError(const std::string& detail);
	bool OnProbeResult(bool reachable);

	/// Give up on the attempt without delivering a result (stop during start,
	/// worker exit). Returns false if it had already resolved.
	bool Abandon();

	bool resolved() const { return attempt_->resolved(); }
	const ReadinessOptions& options() const { return options_; }

private:
	bool Resolve(ReadinessOutcome outcome, ReadinessSource source, std::string detail);
	void CancelPending();
	void LaunchProbe();

	boost::asio::io_context& io_;
	ReadinessOptions options_;
	Callback callback_;
	std::shared_ptr<StartAttempt> attempt_;
	boost::asio::steady_timer timeout_timer_;
	boost::asio::steady_timer probe_timer_;
	std::shared_ptr<TcpProbe> probe_;
	bool armed_ = false;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_READINESS_RESOLVER_H_
