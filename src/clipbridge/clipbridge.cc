#include <signal.h>

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

// Third-party libraries
#include <boost/asio.hpp>
#include <cxxopts.hpp>
#include <glog/logging.h>

// Project includes
#include "common/config.h"
#include "common/configuration.h"
#include "common/error.h"
#include "supervisor/service_manager.h"

namespace {

using ClipBridge::ConnectedPeer;
using ClipBridge::ProcessState;
using ClipBridge::WorkerRole;

// Writes every supervisor event to the log and ends the run when the worker
// goes away on its own.
class LoggingListener : public ClipBridge::ISupervisorListener {
	public:
		explicit LoggingListener(boost::asio::io_context& main_io) : main_io_(main_io) {}

		void OnLogLine(WorkerRole role, const std::string& text) override {
			LOG(INFO) << "[" << ClipBridge::WorkerRoleName(role) << "] " << text;
		}

		void OnStatusChanged(WorkerRole role, ProcessState state) override {
			LOG(INFO) << ClipBridge::WorkerRoleTitle(role) << " status: "
				<< ClipBridge::ExternalStatusName(state) << " (" << ClipBridge::ProcessStateName(state) << ")";
		}

		void OnPeerConnected(WorkerRole role, const ConnectedPeer& peer) override {
			LOG(INFO) << peer.display_name << " connected (" << peer.id << ")";
		}

		void OnPeerDisconnected(WorkerRole role, const std::string& peer_id) override {
			LOG(INFO) << "Peer " << peer_id << " disconnected";
		}

		void OnWorkerFailed(WorkerRole role, const absl::Status& error) override {
			LOG(ERROR) << error.message();
			boost::asio::post(main_io_, [this] {
				failed_ = true;
				main_io_.stop();
			});
		}

		bool failed() const { return failed_; }

	private:
		boost::asio::io_context& main_io_;
		bool failed_ = false;
};

} // end of namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("clipbridge_supervisor", "Runs a clipboard sync worker and reports its state");

	options.add_options()
		("c,config", "YAML configuration file", cxxopts::value<std::string>())
		("r,role", "Worker role: server or client", cxxopts::value<std::string>()->default_value("server"))
		("p,port", "Port to serve on (server) or connect to (client)", cxxopts::value<int>())
		("peer", "Server address for the client role", cxxopts::value<std::string>())
		("log_level", "Worker log level", cxxopts::value<std::string>())
		("worker", "Worker executable, replaces the configured one", cxxopts::value<std::string>())
		("worker_arg", "Argument for --worker (repeatable)", cxxopts::value<std::vector<std::string>>())
		("v,verbose", "glog verbosity", cxxopts::value<int>()->default_value("0"))
		("h,help", "Print usage");

	auto arguments = options.parse(argc, argv);

	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["verbose"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	ClipBridge::Configuration& configuration = ClipBridge::Configuration::getInstance();
	if (arguments.count("config")) {
		std::string path = arguments["config"].as<std::string>();
		if (!configuration.loadFromFile(path)) {
			LOG(ERROR) << "Failed to load configuration from " << path;
			return EXIT_FAILURE;
		}
		LOG(INFO) << "Loaded configuration from " << path;
	} else if (!configuration.validate()) {
		return EXIT_FAILURE;
	}
	const ClipBridge::ClipBridgeConfig& config = ClipBridge::GetConfig().config();

	std::optional<WorkerRole> role = ClipBridge::ParseWorkerRole(arguments["role"].as<std::string>());
	if (!role) {
		LOG(ERROR) << "Unknown role '" << arguments["role"].as<std::string>() << "', expected server or client";
		return EXIT_FAILURE;
	}

	ClipBridge::StartConfig start;
	if (*role == WorkerRole::Server) {
		start.port = config.server.port.get();
		start.log_level = config.server.log_level.get();
	} else {
		start.port = config.client.port.get();
		start.log_level = config.client.log_level.get();
		start.peer_address = config.client.server_address.get();
	}
	if (arguments.count("port")) {
		start.port = arguments["port"].as<int>();
	}
	if (arguments.count("peer")) {
		start.peer_address = arguments["peer"].as<std::string>();
	}
	if (arguments.count("log_level")) {
		start.log_level = arguments["log_level"].as<std::string>();
	}

	ClipBridge::WorkerLocator locator(config);
	if (arguments.count("worker")) {
		ClipBridge::WorkerOverride worker_override;
		worker_override.executable = arguments["worker"].as<std::string>();
		if (arguments.count("worker_arg")) {
			worker_override.args = arguments["worker_arg"].as<std::vector<std::string>>();
		}
		locator.SetOverride(*role, std::move(worker_override));
	}

	// *************** Run until signalled or the worker is gone **********************
	boost::asio::io_context main_io;
	LoggingListener listener(main_io);
	ClipBridge::ServiceManager manager(std::move(locator), &listener);

	int exit_code = EXIT_SUCCESS;
	bool stopping = false;

	auto shutdown = [&] {
		if (stopping) {
			return;
		}
		stopping = true;
		manager.StopAll([&main_io, &exit_code](absl::Status status) {
			boost::asio::post(main_io, [&main_io, &exit_code, status] {
				if (!status.ok()) {
					LOG(ERROR) << "Stop failed: " << status.message();
					exit_code = EXIT_FAILURE;
				}
				main_io.stop();
			});
		});
	};

	boost::asio::signal_set signals(main_io, SIGINT, SIGTERM);
	signals.async_wait([&](const boost::system::error_code& ec, int signo) {
		if (ec) {
			return;
		}
		LOG(INFO) << "Received " << strsignal(signo) << ", stopping";
		shutdown();
	});

	manager.Start(*role, start, [&main_io, &exit_code](absl::StatusOr<std::string> result) {
		boost::asio::post(main_io, [&main_io, &exit_code, result] {
			if (!result.ok()) {
				if (ClipBridge::ErrorKindOf(result.status()) == ClipBridge::ErrorKind::StartCancelled) {
					// Interrupted during start; StopAll ends the run
					LOG(INFO) << result.status().message();
					return;
				}
				LOG(ERROR) << result.status().message() << " ["
					<< ClipBridge::ErrorKindName(ClipBridge::ErrorKindOf(result.status())) << "]";
				exit_code = EXIT_FAILURE;
				main_io.stop();
				return;
			}
			LOG(INFO) << *result;
		});
	});

	main_io.run();

	if (listener.failed()) {
		exit_code = EXIT_FAILURE;
	}
	LOG(INFO) << "ClipBridge supervisor terminating";
	return exit_code;
}
