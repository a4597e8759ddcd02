#include <gtest/gtest.h>
#include "../../src/supervisor/worker_locator.h"
#include "../../src/common/error.h"

#include <sys/stat.h>
#include <unistd.h>

#include <cstdlib>
#include <fstream>

using namespace ClipBridge;

class WorkerLocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        char dir_template[] = "/tmp/clipbridge_locator_XXXXXX";
        char* dir = mkdtemp(dir_template);
        ASSERT_NE(dir, nullptr);
        dir_ = dir;
    }

    void TearDown() override {
        for (const auto& file : files_) {
            unlink(file.c_str());
        }
        rmdir(dir_.c_str());
    }

    std::string MakeExecutable(const std::string& name) {
        std::string path = dir_ + "/" + name;
        std::ofstream(path) << "#!/bin/sh\n";
        chmod(path.c_str(), 0755);
        files_.push_back(path);
        return path;
    }

    static StartConfig ServerStart(int port = 8000) {
        StartConfig start;
        start.port = port;
        start.log_level = "WARNING";
        return start;
    }

    static StartConfig ClientStart(const std::string& peer) {
        StartConfig start;
        start.port = 8000;
        start.peer_address = peer;
        return start;
    }

    std::string dir_;
    std::vector<std::string> files_;
    ClipBridgeConfig config_;
};

TEST_F(WorkerLocatorTest, InterpreterModeUsesRoleScript) {
    WorkerLocator locator(config_);

    auto server = locator.Locate(WorkerRole::Server, ServerStart());
    ASSERT_TRUE(server.ok());
    EXPECT_EQ(server->executable, "python3");
    EXPECT_EQ(server->args, (std::vector<std::string>{"utils/server.py"}));

    auto client = locator.Locate(WorkerRole::Client, ClientStart("10.0.0.2"));
    ASSERT_TRUE(client.ok());
    EXPECT_EQ(client->args, (std::vector<std::string>{"utils/client.py"}));
}

TEST_F(WorkerLocatorTest, ServerEnvironment) {
    WorkerLocator locator(config_);
    auto env = locator.RoleEnvironment(WorkerRole::Server, ServerStart(8100));

    EXPECT_EQ(env.at("PORT"), "8100");
    EXPECT_EQ(env.at("LOG_LEVEL"), "WARNING");
    EXPECT_EQ(env.at("PYTHONUNBUFFERED"), "1");
    EXPECT_EQ(env.count("PYTHONPATH"), 0u);
    EXPECT_EQ(env.count("SERVER_HOST"), 0u);
}

TEST_F(WorkerLocatorTest, ClientEnvironmentDefaultsLogLevel) {
    WorkerLocator locator(config_);
    auto env = locator.RoleEnvironment(WorkerRole::Client, ClientStart("10.0.0.2"));

    EXPECT_EQ(env.at("SERVER_HOST"), "10.0.0.2");
    EXPECT_EQ(env.at("SERVER_PORT"), "8000");
    EXPECT_EQ(env.at("LOG_LEVEL"), "INFO");
    EXPECT_EQ(env.count("PORT"), 0u);
}

TEST_F(WorkerLocatorTest, DevelopmentModeAddsPythonPath) {
    config_.worker.development.set(true);
    config_.worker.python_site_packages.set("venv/site-packages");
    WorkerLocator locator(config_);

    auto env = locator.RoleEnvironment(WorkerRole::Server, ServerStart());
    EXPECT_EQ(env.at("PYTHONPATH"), "venv/site-packages");
}

TEST_F(WorkerLocatorTest, StandaloneExecutableWins) {
    std::string server_path = MakeExecutable("clipbridge-server");
    config_.worker.standalone_dir.set(dir_);
    config_.worker.working_dir.set(dir_);
    WorkerLocator locator(config_);

    auto spec = locator.Locate(WorkerRole::Server, ServerStart());
    ASSERT_TRUE(spec.ok()) << spec.status();
    EXPECT_EQ(spec->executable, server_path);
    EXPECT_TRUE(spec->args.empty());
    EXPECT_EQ(spec->working_dir, dir_);
}

TEST_F(WorkerLocatorTest, MissingStandaloneExecutableIsSpawnFailure) {
    config_.worker.standalone_dir.set(dir_);
    WorkerLocator locator(config_);

    auto spec = locator.Locate(WorkerRole::Client, ClientStart("10.0.0.2"));
    ASSERT_FALSE(spec.ok());
    EXPECT_EQ(ErrorKindOf(spec.status()), ErrorKind::SpawnFailure);
    EXPECT_EQ(spec.status().message(), "Client executable not found at: " + dir_ + "/clipbridge-client");
}

TEST_F(WorkerLocatorTest, OverrideReplacesConfiguredWorker) {
    WorkerLocator locator(config_);
    locator.SetOverride(WorkerRole::Server, WorkerOverride{"/bin/sh", {"-c", "echo hi"}});

    auto spec = locator.Locate(WorkerRole::Server, ServerStart());
    ASSERT_TRUE(spec.ok());
    EXPECT_EQ(spec->executable, "/bin/sh");
    EXPECT_EQ(spec->CommandLine(), "/bin/sh -c echo hi");
    // Role environment still applies
    EXPECT_EQ(spec->env.at("PORT"), "8000");

    // Client role is unaffected
    auto client = locator.Locate(WorkerRole::Client, ClientStart("10.0.0.2"));
    ASSERT_TRUE(client.ok());
    EXPECT_EQ(client->executable, "python3");

    locator.ClearOverride(WorkerRole::Server);
    EXPECT_EQ(locator.Locate(WorkerRole::Server, ServerStart())->executable, "python3");
}

TEST_F(WorkerLocatorTest, InvalidStartParameters) {
    WorkerLocator locator(config_);

    auto bad_port = locator.Locate(WorkerRole::Server, ServerStart(0));
    EXPECT_EQ(ErrorKindOf(bad_port.status()), ErrorKind::InvalidConfig);

    auto no_peer = locator.Locate(WorkerRole::Client, StartConfig{8000, std::nullopt, "INFO"});
    EXPECT_EQ(ErrorKindOf(no_peer.status()), ErrorKind::InvalidConfig);

    auto empty_peer = locator.Locate(WorkerRole::Client, ClientStart(""));
    EXPECT_EQ(ErrorKindOf(empty_peer.status()), ErrorKind::InvalidConfig);
}

TEST(ErrorKindTest, KindSurvivesStatusRoundTrip) {
    for (ErrorKind kind : {ErrorKind::AlreadyRunning, ErrorKind::NotRunning, ErrorKind::InvalidConfig,
            ErrorKind::SpawnFailure, ErrorKind::DependencyError, ErrorKind::StartupTimeout,
            ErrorKind::UnsolicitedExit, ErrorKind::StartCancelled}) {
        absl::Status status = MakeError(kind, "x");
        EXPECT_FALSE(status.ok());
        EXPECT_EQ(ErrorKindOf(status), kind) << ErrorKindName(kind);
    }
    EXPECT_EQ(ErrorKindOf(absl::OkStatus()), ErrorKind::None);
}

TEST(ErrorKindTest, FatalKinds) {
    EXPECT_TRUE(IsFatal(ErrorKind::SpawnFailure));
    EXPECT_TRUE(IsFatal(ErrorKind::DependencyError));
    EXPECT_TRUE(IsFatal(ErrorKind::StartupTimeout));
    EXPECT_TRUE(IsFatal(ErrorKind::UnsolicitedExit));
    EXPECT_FALSE(IsFatal(ErrorKind::AlreadyRunning));
    EXPECT_FALSE(IsFatal(ErrorKind::NotRunning));
    EXPECT_FALSE(IsFatal(ErrorKind::StartCancelled));
}
