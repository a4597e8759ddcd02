#ifndef CLIPBRIDGE_TEST_SUPERVISOR_FAKE_WORKER_H_
#define CLIPBRIDGE_TEST_SUPERVISOR_FAKE_WORKER_H_

#include <signal.h>

#include <memory>
#include <string>
#include <vector>

#include <boost/asio.hpp>

#include "../../src/common/error.h"
#include "../../src/supervisor/supervisor_listener.h"
#include "../../src/supervisor/worker_process.h"

namespace ClipBridge {

/**
 * Scripted worker: tests push output and exits through it. Signals are
 * recorded; SIGKILL (and SIGTERM when exit_on_term is set) end the worker
 * on the next io_context turn, like a real process would.
 */
class FakeWorkerProcess : public IWorkerProcess,
    public std::enable_shared_from_this<FakeWorkerProcess> {
public:
    FakeWorkerProcess(boost::asio::io_context& io, pid_t pid, WorkerCallbacks callbacks, bool exit_on_term)
        : io_(io), pid_(pid), callbacks_(std::move(callbacks)), exit_on_term_(exit_on_term) {}

    pid_t pid() const override { return pid_; }
    bool exited() const override { return exited_; }

    bool Signal(int signo) override {
        if (exited_) {
            return false;
        }
        signals_.push_back(signo);
        if (signo == SIGKILL || (signo == SIGTERM && exit_on_term_)) {
            auto self = shared_from_this();
            boost::asio::post(io_, [self, signo] {
                if (signo == SIGKILL) {
                    self->Exit(-1, SIGKILL);
                } else {
                    self->Exit(0);
                }
            });
        }
        return true;
    }

    void Stdout(const std::string& data) { Emit(StreamKind::Primary, data); }
    void Stderr(const std::string& data) { Emit(StreamKind::Diagnostic, data); }

    /// Close both streams, then report the exit.
    void Exit(int code, int term_signal = 0) {
        if (exited_) {
            return;
        }
        exited_ = true;
        WorkerCallbacks callbacks = std::move(callbacks_);
        callbacks_ = WorkerCallbacks();
        if (callbacks.on_stream_closed) {
            callbacks.on_stream_closed(StreamKind::Primary);
            callbacks.on_stream_closed(StreamKind::Diagnostic);
        }
        WorkerExit exit;
        exit.exit_code = term_signal ? -1 : code;
        exit.term_signal = term_signal;
        if (callbacks.on_exit) {
            callbacks.on_exit(exit);
        }
    }

    const std::vector<int>& signals() const { return signals_; }
    void set_exit_on_term(bool value) { exit_on_term_ = value; }

private:
    void Emit(StreamKind kind, const std::string& data) {
        if (!exited_ && callbacks_.on_data) {
            callbacks_.on_data(kind, data);
        }
    }

    boost::asio::io_context& io_;
    pid_t pid_;
    WorkerCallbacks callbacks_;
    bool exit_on_term_;
    bool exited_ = false;
    std::vector<int> signals_;
};

class FakeWorkerLauncher : public IWorkerLauncher {
public:
    explicit FakeWorkerLauncher(boost::asio::io_context& io) : io_(io) {}

    absl::StatusOr<std::shared_ptr<IWorkerProcess>> Launch(
            const LaunchSpec& spec, WorkerCallbacks callbacks) override {
        specs_.push_back(spec);
        if (!fail_with_.ok()) {
            return fail_with_;
        }
        auto process = std::make_shared<FakeWorkerProcess>(io_, next_pid_++, std::move(callbacks), exit_on_term_);
        processes_.push_back(process);
        return std::shared_ptr<IWorkerProcess>(process);
    }

    FakeWorkerProcess& last() { return *processes_.back(); }
    size_t launches() const { return specs_.size(); }
    const LaunchSpec& last_spec() const { return specs_.back(); }

    void FailWith(absl::Status status) { fail_with_ = std::move(status); }
    void set_exit_on_term(bool value) { exit_on_term_ = value; }

private:
    boost::asio::io_context& io_;
    std::vector<LaunchSpec> specs_;
    std::vector<std::shared_ptr<FakeWorkerProcess>> processes_;
    absl::Status fail_with_;
    bool exit_on_term_ = true;
    pid_t next_pid_ = 4242;
};

/// Keeps every listener event for inspection.
class RecordingListener : public ISupervisorListener {
public:
    void OnLogLine(WorkerRole role, const std::string& text) override { lines.push_back(text); }
    void OnStatusChanged(WorkerRole role, ProcessState state) override { states.push_back(state); }
    void OnPeerConnected(WorkerRole role, const ConnectedPeer& peer) override { connected.push_back(peer); }
    void OnPeerDisconnected(WorkerRole role, const std::string& peer_id) override { disconnected.push_back(peer_id); }
    void OnWorkerFailed(WorkerRole role, const absl::Status& error) override { failures.push_back(error); }

    std::vector<std::string> lines;
    std::vector<ProcessState> states;
    std::vector<ConnectedPeer> connected;
    std::vector<std::string> disconnected;
    std::vector<absl::Status> failures;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_TEST_SUPERVISOR_FAKE_WORKER_H_
