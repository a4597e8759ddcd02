#include "readiness_resolver.h"

#include <glog/logging.h>

namespace ClipBridge {

namespace {

template<class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

} // End of anonymous namespace

const char* ReadinessOutcomeName(ReadinessOutcome outcome) {
	switch (outcome) {
		case ReadinessOutcome::Succeeded: return "succeeded";
		case ReadinessOutcome::FailedFatal: return "failed";
		case ReadinessOutcome::TimedOut: return "timed out";
	}
	return "unknown";
}

ReadinessResolver::ReadinessResolver(boost::asio::io_context& io, ReadinessOptions options,
		Callback callback)
	: io_(io),
	options_(std::move(options)),
	callback_(std::move(callback)),
	attempt_(std::make_shared<StartAttempt>()),
	timeout_timer_(io),
	probe_timer_(io) {}

ReadinessResolver::~ReadinessResolver() {
	Abandon();
}

void ReadinessResolver::Arm() {
	CHECK(!armed_) << "ReadinessResolver armed twice";
	armed_ = true;

	// Handlers hold the attempt, not just this: a handler already queued when
	// the resolver is torn down must see the claimed guard and bail out.
	std::shared_ptr<StartAttempt> attempt = attempt_;

	timeout_timer_.expires_after(options_.timeout);
	timeout_timer_.async_wait([this, attempt](const boost::system::error_code& ec) {
		if (ec == boost::asio::error::operation_aborted || attempt->resolved()) {
			return;
		}
		Resolve(ReadinessOutcome::TimedOut, ReadinessSource::Timeout, "");
	});

	if (options_.probe_enabled) {
		probe_timer_.expires_after(options_.probe_delay);
		probe_timer_.async_wait([this, attempt](const boost::system::error_code& ec) {
			if (ec == boost::asio::error::operation_aborted || attempt->resolved()) {
				return;
			}
			LaunchProbe();
		});
	}
}

void ReadinessResolver::LaunchProbe() {
	std::shared_ptr<StartAttempt> attempt = attempt_;
	probe_ = TcpProbe::Create(io_, options_.probe_host, options_.probe_port, options_.probe_timeout);
	probe_->Start([this, attempt](bool reachable) {
		if (attempt->resolved()) {
			return;
		}
		OnProbeResult(reachable);
	});
}

bool ReadinessResolver::OnEvent(const ClassifiedEvent& event) {
	return std::visit(Overloaded{
		[this](const ReadySignal&) { return OnReadySignal(ReadinessSource::LogMarker); },
		[this](const DependencyError& e) { return OnDependencyError(e.detail); },
		[](const auto&) { return false; }
	}, event);
}

bool ReadinessResolver::OnReadySignal(ReadinessSource source) {
	return Resolve(ReadinessOutcome::Succeeded, source, "");
}

bool ReadinessResolver::OnDependencyError(const std::string& detail) {
	return Resolve(ReadinessOutcome::FailedFatal, ReadinessSource::DependencyError, detail);
}

bool ReadinessResolver::OnProbeResult(bool reachable) {
	if (!reachable) {
		// Not listening yet; the log markers and the timeout still decide.
		LOG(INFO) << "Readiness probe to port " << options_.probe_port
			<< " failed, waiting for log output";
		return false;
	}
	return Resolve(ReadinessOutcome::Succeeded, ReadinessSource::Probe, "");
}

bool ReadinessResolver::Abandon() {
	if (!attempt_->Claim()) {
		return false;
	}
	VLOG(1) << "Start attempt abandoned";
	CancelPending();
	return true;
}

bool ReadinessResolver::Resolve(ReadinessOutcome outcome, ReadinessSource source, std::string detail) {
	if (!attempt_->Claim()) {
		VLOG(2) << "Ignoring late readiness signal (" << ReadinessOutcomeName(outcome) << ")";
		return false;
	}
	CancelPending();

	auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
			std::chrono::steady_clock::now() - attempt_->started_at());
	VLOG(1) << "Start attempt " << ReadinessOutcomeName(outcome) << " after " << elapsed.count() << "ms";

	ReadinessResult result{outcome, source, std::move(detail)};
	if (callback_) {
		callback_(result);
	}
	return true;
}

void ReadinessResolver::CancelPending() {
	timeout_timer_.cancel();
	probe_timer_.cancel();
	if (probe_) {
		probe_->Cancel();
		probe_.reset();
	}
}

} // namespace ClipBridge
