#include <gtest/gtest.h>
#include "../../src/supervisor/process_supervisor.h"
#include "../../src/supervisor/worker_process.h"
#include "fake_worker.h"

#include <chrono>
#include <optional>

using namespace ClipBridge;
using namespace std::chrono_literals;

// Real processes through /bin/sh
class PosixWorkerTest : public ::testing::Test {
protected:
    static LaunchSpec Shell(const std::string& script) {
        LaunchSpec spec;
        spec.executable = "/bin/sh";
        spec.args = {"-c", script};
        return spec;
    }

    std::shared_ptr<IWorkerProcess> Launch(const LaunchSpec& spec) {
        WorkerCallbacks callbacks;
        callbacks.on_data = [this](StreamKind kind, std::string_view chunk) {
            (kind == StreamKind::Primary ? out_ : err_).append(chunk.data(), chunk.size());
        };
        callbacks.on_stream_closed = [this](StreamKind kind) { closed_.push_back(kind); };
        callbacks.on_exit = [this](const WorkerExit& exit) { exit_ = exit; };

        auto worker = launcher_.Launch(spec, std::move(callbacks));
        EXPECT_TRUE(worker.ok()) << worker.status();
        return worker.ok() ? *worker : nullptr;
    }

    boost::asio::io_context io_;
    PosixWorkerLauncher launcher_{io_};
    std::string out_;
    std::string err_;
    std::vector<StreamKind> closed_;
    std::optional<WorkerExit> exit_;
};

TEST_F(PosixWorkerTest, CapturesBothStreamsAndExitCode) {
    auto worker = Launch(Shell("echo hello; echo oops >&2; exit 3"));
    ASSERT_NE(worker, nullptr);
    EXPECT_GT(worker->pid(), 0);

    io_.run_for(5s);

    ASSERT_TRUE(exit_.has_value());
    EXPECT_EQ(exit_->exit_code, 3);
    EXPECT_FALSE(exit_->signaled());
    EXPECT_EQ(out_, "hello\n");
    EXPECT_EQ(err_, "oops\n");
    // Both streams close before the exit is reported
    EXPECT_EQ(closed_.size(), 2u);
    EXPECT_TRUE(worker->exited());
}

TEST_F(PosixWorkerTest, MissingExecutableIsSpawnFailure) {
    LaunchSpec spec;
    spec.executable = "/nonexistent/clipbridge-server";
    auto worker = launcher_.Launch(spec, WorkerCallbacks());

    ASSERT_FALSE(worker.ok());
    EXPECT_EQ(ErrorKindOf(worker.status()), ErrorKind::SpawnFailure);
    EXPECT_NE(std::string(worker.status().message()).find("No such file or directory"), std::string::npos);
}

TEST_F(PosixWorkerTest, EnvironmentOverridesAreVisible) {
    LaunchSpec spec = Shell("echo \"$PORT $LOG_LEVEL\"");
    spec.env["PORT"] = "1234";
    spec.env["LOG_LEVEL"] = "DEBUG";
    Launch(spec);

    io_.run_for(5s);
    EXPECT_EQ(out_, "1234 DEBUG\n");
}

TEST_F(PosixWorkerTest, WorkingDirectoryIsApplied) {
    LaunchSpec spec = Shell("pwd");
    spec.working_dir = "/";
    Launch(spec);

    io_.run_for(5s);
    EXPECT_EQ(out_, "/\n");
}

TEST_F(PosixWorkerTest, SignalReachesWholeProcessGroup) {
    auto worker = Launch(Shell("sleep 30 & wait"));
    ASSERT_NE(worker, nullptr);

    boost::asio::steady_timer timer(io_, 100ms);
    timer.async_wait([&](const boost::system::error_code&) { EXPECT_TRUE(worker->Signal(SIGTERM)); });

    auto begin = std::chrono::steady_clock::now();
    io_.run_for(10s);

    ASSERT_TRUE(exit_.has_value());
    EXPECT_TRUE(exit_->signaled());
    EXPECT_EQ(exit_->term_signal, SIGTERM);
    // The backgrounded sleep held the pipes too; it went down with the group
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    EXPECT_FALSE(worker->Signal(SIGTERM));
}

TEST_F(PosixWorkerTest, ChunkedOutputArrivesInOrder) {
    Launch(Shell("printf 'part'; sleep 0.1; printf 'ial\\nnext\\n'"));
    io_.run_for(5s);
    EXPECT_EQ(out_, "partial\nnext\n");
}

// The supervisor driving real workers
class PosixSupervisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        options_.startup_timeout = 5s;
        options_.probe_enabled = false;
        options_.stop_grace_period = 300ms;
    }

    ProcessSupervisor& Supervisor(const std::string& script) {
        WorkerOverride worker_override;
        worker_override.executable = "/bin/sh";
        worker_override.args = {"-c", script};
        locator_.SetOverride(WorkerRole::Server, worker_override);
        supervisor_ = std::make_unique<ProcessSupervisor>(io_, WorkerRole::Server, options_,
                launcher_, locator_, &listener_);
        return *supervisor_;
    }

    void Start() {
        StartConfig config;
        config.port = 8000;
        supervisor_->Start(config, [this](absl::StatusOr<std::string> result) {
            start_result_ = result;
            io_.stop();
        });
    }

    void Stop() {
        supervisor_->Stop([this](absl::StatusOr<std::string> result) {
            stop_result_ = result;
            io_.stop();
        });
    }

    void Run() {
        io_.restart();
        io_.run_for(10s);
    }

    boost::asio::io_context io_;
    PosixWorkerLauncher launcher_{io_};
    WorkerLocator locator_{ClipBridgeConfig()};
    RecordingListener listener_;
    SupervisorOptions options_;
    std::unique_ptr<ProcessSupervisor> supervisor_;
    std::optional<absl::StatusOr<std::string>> start_result_;
    std::optional<absl::StatusOr<std::string>> stop_result_;
};

TEST_F(PosixSupervisorTest, StartAndStopGracefully) {
    Supervisor("trap 'exit 0' TERM; echo 'Server started successfully'; "
            "while true; do sleep 0.1; done");
    Start();
    Run();
    ASSERT_TRUE(start_result_.has_value());
    ASSERT_TRUE(start_result_->ok()) << start_result_->status();
    EXPECT_EQ(supervisor_->state(), ProcessState::Running);

    Stop();
    Run();
    ASSERT_TRUE(stop_result_.has_value());
    ASSERT_TRUE(stop_result_->ok());
    EXPECT_EQ(**stop_result_, "Server stopped gracefully");
    EXPECT_EQ(supervisor_->state(), ProcessState::Stopped);
}

TEST_F(PosixSupervisorTest, UnresponsiveWorkerIsKilled) {
    Supervisor("trap '' TERM; echo 'Server started successfully'; "
            "while true; do sleep 0.1; done");
    Start();
    Run();
    ASSERT_TRUE(start_result_.has_value());
    ASSERT_TRUE(start_result_->ok());

    Stop();
    Run();
    ASSERT_TRUE(stop_result_.has_value());
    ASSERT_TRUE(stop_result_->ok());
    EXPECT_EQ(**stop_result_, "Server stopped (forced)");
    EXPECT_FALSE(supervisor_->HasWorker());
}

TEST_F(PosixSupervisorTest, DependencyErrorOnStderr) {
    Supervisor("echo \"ModuleNotFoundError: No module named 'websockets'\" >&2; sleep 30");
    Start();
    Run();

    ASSERT_TRUE(start_result_.has_value());
    EXPECT_EQ(ErrorKindOf(start_result_->status()), ErrorKind::DependencyError);
    EXPECT_EQ(supervisor_->state(), ProcessState::Failed);

    // Let the killed worker be reaped
    Run();
    EXPECT_FALSE(supervisor_->HasWorker());
}

TEST_F(PosixSupervisorTest, EarlyExitReportsOutput) {
    Supervisor("echo 'fatal: port in use' >&2; exit 4");
    Start();
    Run();

    ASSERT_TRUE(start_result_.has_value());
    EXPECT_EQ(ErrorKindOf(start_result_->status()), ErrorKind::UnsolicitedExit);
    EXPECT_EQ(start_result_->status().message(),
            "Server exited with code 4. Output: STDERR: fatal: port in use\n");
}

TEST_F(PosixSupervisorTest, TcpProbeDetectsListeningWorker) {
    boost::asio::ip::tcp::acceptor acceptor(io_,
            boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    acceptor.listen();
    int port = acceptor.local_endpoint().port();

    options_.probe_enabled = true;
    options_.probe_host = "127.0.0.1";
    options_.probe_delay = 50ms;
    options_.probe_timeout = 1s;
    // Silent worker: only the probe can prove readiness
    Supervisor("trap 'exit 0' TERM; while true; do sleep 0.1; done");

    StartConfig config;
    config.port = port;
    supervisor_->Start(config, [this](absl::StatusOr<std::string> result) {
        start_result_ = result;
        io_.stop();
    });
    Run();

    ASSERT_TRUE(start_result_.has_value());
    ASSERT_TRUE(start_result_->ok()) << start_result_->status();
    EXPECT_EQ(**start_result_, "Server started successfully (verified by connection)");

    Stop();
    Run();
    ASSERT_TRUE(stop_result_.has_value());
    EXPECT_TRUE(stop_result_->ok());
}
