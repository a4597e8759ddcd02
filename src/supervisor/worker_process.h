#ifndef CLIPBRIDGE_SUPERVISOR_WORKER_PROCESS_H_
#define CLIPBRIDGE_SUPERVISOR_WORKER_PROCESS_H_

#include <sys/types.h>

#include <array>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio.hpp>

#include "absl/status/statusor.h"
#include "common/config.h"
#include "common/scoped_fd.h"
#include "types.h"

namespace ClipBridge {

/// What to execute. env entries are set on top of the inherited environment.
struct LaunchSpec {
	std::string executable;
	std::vector<std::string> args;
	std::map<std::string, std::string> env;
	std::string working_dir;  // empty: inherit

	/// "executable arg1 arg2" for log output
	std::string CommandLine() const;
};

struct WorkerExit {
	int exit_code = -1;    // -1 when terminated by a signal
	int term_signal = 0;   // 0 when exited normally

	bool signaled() const { return term_signal != 0; }
	std::string Describe() const;
};

/**
 * Callbacks from a running worker, all invoked on the io_context.
 * on_exit is invoked last, after both streams were reported closed, and the
 * worker never touches the callbacks again afterwards.
 */
struct WorkerCallbacks {
	std::function<void(StreamKind, std::string_view)> on_data;
	std::function<void(StreamKind)> on_stream_closed;
	std::function<void(const WorkerExit&)> on_exit;
};

/**
 * Handle to one spawned worker process.
 */
class IWorkerProcess {
public:
	virtual ~IWorkerProcess() = default;

	virtual pid_t pid() const = 0;

	/// Deliver a signal to the worker. Returns false if it has already been
	/// reaped or the signal could not be sent.
	virtual bool Signal(int signo) = 0;

	virtual bool exited() const = 0;
};

/**
 * Spawns workers. Launch either returns a live process whose callbacks will
 * start firing on the io_context, or a SpawnFailure status; in the latter
 * case no callback is ever invoked.
 */
class IWorkerLauncher {
public:
	virtual ~IWorkerLauncher() = default;

	virtual absl::StatusOr<std::shared_ptr<IWorkerProcess>> Launch(
			const LaunchSpec& spec, WorkerCallbacks callbacks) = 0;
};

/**
 * fork/exec based worker with stdout/stderr read through asio and exit
 * observed through a pidfd (or waitpid polling where pidfd_open is missing).
 */
class PosixWorkerProcess : public IWorkerProcess,
	public std::enable_shared_from_this<PosixWorkerProcess> {
public:
	PosixWorkerProcess(boost::asio::io_context& io, pid_t pid, ScopedFd stdout_fd,
			ScopedFd stderr_fd, WorkerCallbacks callbacks);
	~PosixWorkerProcess() override;

	/// Begin reading the streams and watching for exit.
	void Start();

	pid_t pid() const override { return pid_; }
	bool Signal(int signo) override;
	bool exited() const override { return reaped_; }

private:
	struct Stream {
		explicit Stream(boost::asio::io_context& io) : descriptor(io) {}
		boost::asio::posix::stream_descriptor descriptor;
		std::array<char, STREAM_READ_CHUNK_SIZE> buffer;
		bool open = false;
	};

	Stream& StreamFor(StreamKind kind) { return kind == StreamKind::Primary ? stdout_ : stderr_; }

	void ReadNext(StreamKind kind);
	void OnStreamClosed(StreamKind kind);
	void WatchExit();
	void PollExit();
	bool TryReap();
	void OnReaped();
	void MaybeFinish();

	boost::asio::io_context& io_;
	pid_t pid_;
	Stream stdout_;
	Stream stderr_;
	boost::asio::posix::stream_descriptor pidfd_;
	boost::asio::steady_timer poll_timer_;
	boost::asio::steady_timer drain_timer_;
	WorkerCallbacks callbacks_;
	WorkerExit exit_;
	bool reaped_ = false;
	bool finished_ = false;
};

class PosixWorkerLauncher : public IWorkerLauncher {
public:
	explicit PosixWorkerLauncher(boost::asio::io_context& io) : io_(io) {}

	absl::StatusOr<std::shared_ptr<IWorkerProcess>> Launch(
			const LaunchSpec& spec, WorkerCallbacks callbacks) override;

private:
	boost::asio::io_context& io_;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_WORKER_PROCESS_H_
