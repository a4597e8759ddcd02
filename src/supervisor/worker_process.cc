#include "worker_process.h"

#include <fcntl.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <sstream>

#include <glog/logging.h>

#include "common/error.h"

extern char** environ;

namespace ClipBridge {

namespace {

bool MakePipe(ScopedPipe& p) {
	int fds[2];
	if (::pipe2(fds, O_CLOEXEC) != 0) {
		return false;
	}
	p.read_end.reset(fds[0]);
	p.write_end.reset(fds[1]);
	return true;
}

// Parent environment with overrides applied, as KEY=VALUE strings
std::vector<std::string> BuildEnvironment(const std::map<std::string, std::string>& overrides) {
	std::vector<std::string> env;
	for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
		std::string_view kv(*entry);
		size_t eq = kv.find('=');
		std::string key(kv.substr(0, eq));
		if (overrides.find(key) == overrides.end()) {
			env.emplace_back(kv);
		}
	}
	for (const auto& [key, value] : overrides) {
		env.push_back(key + "=" + value);
	}
	return env;
}

std::vector<char*> ToCArray(std::vector<std::string>& strings) {
	std::vector<char*> out;
	out.reserve(strings.size() + 1);
	for (auto& s : strings) {
		out.push_back(s.data());
	}
	out.push_back(nullptr);
	return out;
}

// Child side only: report errno to the parent and exit without unwinding.
[[noreturn]] void ReportChildFailure(int status_fd, int err) {
	ssize_t written = ::write(status_fd, &err, sizeof(err));
	(void)written;
	_exit(127);
}

} // End of anonymous namespace

std::string LaunchSpec::CommandLine() const {
	std::stringstream ss;
	ss << executable;
	for (const auto& arg : args) {
		ss << " " << arg;
	}
	return ss.str();
}

std::string WorkerExit::Describe() const {
	std::stringstream ss;
	if (signaled()) {
		ss << "terminated by signal " << term_signal << " (" << strsignal(term_signal) << ")";
	} else {
		ss << "exited with code " << exit_code;
	}
	return ss.str();
}

//----------------------------------------------------------------------------
// PosixWorkerProcess
//----------------------------------------------------------------------------

PosixWorkerProcess::PosixWorkerProcess(boost::asio::io_context& io, pid_t pid,
		ScopedFd stdout_fd, ScopedFd stderr_fd, WorkerCallbacks callbacks)
	: io_(io),
	pid_(pid),
	stdout_(io),
	stderr_(io),
	pidfd_(io),
	poll_timer_(io),
	drain_timer_(io),
	callbacks_(std::move(callbacks)) {
	stdout_.descriptor.assign(stdout_fd.release());
	stdout_.open = true;
	stderr_.descriptor.assign(stderr_fd.release());
	stderr_.open = true;
}

PosixWorkerProcess::~PosixWorkerProcess() {
	if (!reaped_ && pid_ > 0) {
		LOG(WARNING) << "Worker " << pid_ << " still alive when its handle was released, killing it";
		::kill(-pid_, SIGKILL);
		::kill(pid_, SIGKILL);
		while (::waitpid(pid_, nullptr, 0) < 0 && errno == EINTR) {
		}
	}
}

void PosixWorkerProcess::Start() {
	ReadNext(StreamKind::Primary);
	ReadNext(StreamKind::Diagnostic);
	WatchExit();
}

void PosixWorkerProcess::ReadNext(StreamKind kind) {
	Stream& stream = StreamFor(kind);
	auto self = shared_from_this();
	stream.descriptor.async_read_some(boost::asio::buffer(stream.buffer),
			[this, self, kind](const boost::system::error_code& ec, std::size_t n) {
				if (finished_) {
					return;
				}
				if (n > 0) {
					VLOG(2) << "Worker " << pid_ << " " << StreamKindName(kind) << ": " << n << " bytes";
					if (callbacks_.on_data) {
						callbacks_.on_data(kind, std::string_view(StreamFor(kind).buffer.data(), n));
					}
				}
				if (ec) {
					if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
						LOG(WARNING) << "Read from worker " << StreamKindName(kind) << " failed: " << ec.message();
					}
					OnStreamClosed(kind);
					return;
				}
				ReadNext(kind);
			});
}

void PosixWorkerProcess::OnStreamClosed(StreamKind kind) {
	Stream& stream = StreamFor(kind);
	if (!stream.open) {
		return;
	}
	stream.open = false;
	boost::system::error_code ignored;
	stream.descriptor.close(ignored);
	if (callbacks_.on_stream_closed) {
		callbacks_.on_stream_closed(kind);
	}
	MaybeFinish();
}

void PosixWorkerProcess::WatchExit() {
#ifdef SYS_pidfd_open
	int fd = static_cast<int>(::syscall(SYS_pidfd_open, pid_, 0));
	if (fd >= 0) {
		pidfd_.assign(fd);
		auto self = shared_from_this();
		pidfd_.async_wait(boost::asio::posix::stream_descriptor::wait_read,
				[this, self](const boost::system::error_code& ec) {
					if (ec == boost::asio::error::operation_aborted || reaped_) {
						return;
					}
					if (ec) {
						LOG(WARNING) << "pidfd wait failed: " << ec.message() << ", polling instead";
						PollExit();
						return;
					}
					if (TryReap()) {
						OnReaped();
					} else {
						PollExit();
					}
				});
		return;
	}
	VLOG(1) << "pidfd_open unavailable (" << strerror(errno) << "), polling for exit of " << pid_;
#endif
	PollExit();
}

void PosixWorkerProcess::PollExit() {
	auto self = shared_from_this();
	poll_timer_.expires_after(std::chrono::milliseconds(EXIT_POLL_INTERVAL_MS));
	poll_timer_.async_wait([this, self](const boost::system::error_code& ec) {
		if (ec == boost::asio::error::operation_aborted || reaped_) {
			return;
		}
		if (TryReap()) {
			OnReaped();
		} else {
			PollExit();
		}
	});
}

bool PosixWorkerProcess::TryReap() {
	int status = 0;
	pid_t r;
	do {
		r = ::waitpid(pid_, &status, WNOHANG);
	} while (r < 0 && errno == EINTR);

	if (r == 0) {
		return false;
	}
	if (r < 0) {
		LOG(ERROR) << "waitpid(" << pid_ << ") failed: " << strerror(errno);
		exit_.exit_code = -1;
		reaped_ = true;
		return true;
	}
	if (WIFEXITED(status)) {
		exit_.exit_code = WEXITSTATUS(status);
	} else if (WIFSIGNALED(status)) {
		exit_.term_signal = WTERMSIG(status);
	} else {
		// Stopped or continued; not an exit
		return false;
	}
	reaped_ = true;
	return true;
}

void PosixWorkerProcess::OnReaped() {
	LOG(INFO) << "Worker " << pid_ << " " << exit_.Describe();
	boost::system::error_code ignored;
	pidfd_.close(ignored);
	poll_timer_.cancel();

	if (!stdout_.open && !stderr_.open) {
		MaybeFinish();
		return;
	}

	// Buffered output is read to EOF first; a grandchild still holding the
	// pipes only gets a short grace.
	auto self = shared_from_this();
	drain_timer_.expires_after(std::chrono::milliseconds(EXIT_DRAIN_TIMEOUT_MS));
	drain_timer_.async_wait([this, self](const boost::system::error_code& ec) {
		if (ec == boost::asio::error::operation_aborted || finished_) {
			return;
		}
		LOG(WARNING) << "Output of worker " << pid_ << " still open after exit, closing it";
		boost::system::error_code ignored;
		if (stdout_.open) {
			stdout_.descriptor.cancel(ignored);
		}
		if (stderr_.open) {
			stderr_.descriptor.cancel(ignored);
		}
	});
}

void PosixWorkerProcess::MaybeFinish() {
	if (finished_ || !reaped_ || stdout_.open || stderr_.open) {
		return;
	}
	finished_ = true;
	drain_timer_.cancel();

	auto on_exit = std::move(callbacks_.on_exit);
	callbacks_ = WorkerCallbacks();
	if (on_exit) {
		on_exit(exit_);
	}
}

bool PosixWorkerProcess::Signal(int signo) {
	if (reaped_) {
		return false;
	}
	// The worker leads its own process group; signal the group so helpers it
	// spawned go down with it.
	if (::kill(-pid_, signo) == 0) {
		return true;
	}
	if (errno == ESRCH && ::kill(pid_, signo) == 0) {
		return true;
	}
	LOG(ERROR) << "Failed to send signal " << signo << " to worker " << pid_ << ": " << strerror(errno);
	return false;
}

//----------------------------------------------------------------------------
// PosixWorkerLauncher
//----------------------------------------------------------------------------

absl::StatusOr<std::shared_ptr<IWorkerProcess>> PosixWorkerLauncher::Launch(
		const LaunchSpec& spec, WorkerCallbacks callbacks) {
	if (spec.executable.empty()) {
		return MakeError(ErrorKind::SpawnFailure, "no worker executable configured");
	}

	// Everything the child touches is prepared before fork
	std::vector<std::string> argv_storage;
	argv_storage.push_back(spec.executable);
	argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());
	std::vector<char*> argv = ToCArray(argv_storage);

	std::vector<std::string> env_storage = BuildEnvironment(spec.env);
	std::vector<char*> envp = ToCArray(env_storage);

	ScopedPipe out_pipe;
	ScopedPipe err_pipe;
	ScopedPipe status_pipe;
	if (!MakePipe(out_pipe) || !MakePipe(err_pipe) || !MakePipe(status_pipe)) {
		return MakeError(ErrorKind::SpawnFailure, std::string("pipe: ") + strerror(errno));
	}
	ScopedFd dev_null(::open("/dev/null", O_RDONLY | O_CLOEXEC));
	if (!dev_null.valid()) {
		return MakeError(ErrorKind::SpawnFailure, std::string("open /dev/null: ") + strerror(errno));
	}

	pid_t pid = ::fork();
	if (pid < 0) {
		return MakeError(ErrorKind::SpawnFailure, std::string("fork: ") + strerror(errno));
	}

	if (pid == 0) {
		::setpgid(0, 0);
		if (::dup2(dev_null.get(), STDIN_FILENO) < 0 ||
				::dup2(out_pipe.write_end.get(), STDOUT_FILENO) < 0 ||
				::dup2(err_pipe.write_end.get(), STDERR_FILENO) < 0) {
			ReportChildFailure(status_pipe.write_end.get(), errno);
		}
		if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
			ReportChildFailure(status_pipe.write_end.get(), errno);
		}
		::execvpe(argv[0], argv.data(), envp.data());
		ReportChildFailure(status_pipe.write_end.get(), errno);
	}

	// Both sides call setpgid so the group exists whichever runs first
	::setpgid(pid, pid);

	out_pipe.write_end.reset();
	err_pipe.write_end.reset();
	status_pipe.write_end.reset();
	dev_null.reset();

	// The status pipe is close-on-exec: EOF means exec succeeded
	int child_errno = 0;
	ssize_t n;
	do {
		n = ::read(status_pipe.read_end.get(), &child_errno, sizeof(child_errno));
	} while (n < 0 && errno == EINTR);

	if (n == static_cast<ssize_t>(sizeof(child_errno))) {
		while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {
		}
		LOG(ERROR) << "Failed to exec " << spec.CommandLine() << ": " << strerror(child_errno);
		return MakeError(ErrorKind::SpawnFailure, spec.executable + ": " + strerror(child_errno));
	}
	if (n < 0) {
		LOG(WARNING) << "Could not read exec status of worker " << pid << ": " << strerror(errno);
	}

	auto process = std::make_shared<PosixWorkerProcess>(io_, pid,
			std::move(out_pipe.read_end), std::move(err_pipe.read_end), std::move(callbacks));
	process->Start();

	LOG(INFO) << "Spawned worker " << pid << ": " << spec.CommandLine();
	return std::shared_ptr<IWorkerProcess>(std::move(process));
}

} // namespace ClipBridge
