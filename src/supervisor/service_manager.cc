#include "service_manager.h"

#include <glog/logging.h>

namespace ClipBridge {

ServiceManager::ServiceManager(WorkerLocator locator, ISupervisorListener* listener,
		LauncherFactory launcher_factory)
	: work_(boost::asio::make_work_guard(io_)),
	locator_(std::move(locator)) {
	if (launcher_factory) {
		launcher_ = launcher_factory(io_);
	} else {
		launcher_ = std::make_unique<PosixWorkerLauncher>(io_);
	}
	const ClipBridgeConfig& config = locator_.config();
	server_ = std::make_unique<ProcessSupervisor>(io_, WorkerRole::Server,
			SupervisorOptions::ForRole(WorkerRole::Server, config), *launcher_, locator_, listener);
	client_ = std::make_unique<ProcessSupervisor>(io_, WorkerRole::Client,
			SupervisorOptions::ForRole(WorkerRole::Client, config), *launcher_, locator_, listener);

	io_thread_ = std::thread([this] {
		io_.run();
		VLOG(1) << "Service io thread exiting";
	});
}

ServiceManager::~ServiceManager() {
	work_.reset();
	io_.stop();
	if (io_thread_.joinable()) {
		io_thread_.join();
	}
	// Supervisors go before the io_context; they kill any worker still alive
	server_.reset();
	client_.reset();
}

void ServiceManager::Start(WorkerRole role, StartConfig config, ResultCallback callback) {
	boost::asio::post(io_, [this, role, config = std::move(config), callback = std::move(callback)]() mutable {
		SupervisorFor(role).Start(config, std::move(callback));
	});
}

void ServiceManager::Stop(WorkerRole role, ResultCallback callback) {
	boost::asio::post(io_, [this, role, callback = std::move(callback)]() mutable {
		SupervisorFor(role).Stop(std::move(callback));
	});
}

ServiceStatus ServiceManager::Status() const {
	ServiceStatus status;
	status.server = server_->state();
	status.client = client_->state();
	return status;
}

void ServiceManager::ListConnectedPeers(PeersCallback callback) {
	boost::asio::post(io_, [this, callback = std::move(callback)] {
		callback(server_->ListConnectedPeers());
	});
}

void ServiceManager::StopAll(DoneCallback callback) {
	boost::asio::post(io_, [this, callback = std::move(callback)] {
		struct Pending {
			size_t remaining = 0;
			absl::Status first_error;
			DoneCallback done;
		};
		auto pending = std::make_shared<Pending>();
		pending->done = callback;

		std::vector<ProcessSupervisor*> active;
		for (ProcessSupervisor* supervisor : {server_.get(), client_.get()}) {
			ProcessState state = supervisor->state();
			if (state == ProcessState::Starting || state == ProcessState::Running) {
				active.push_back(supervisor);
			}
		}
		if (active.empty()) {
			callback(absl::OkStatus());
			return;
		}

		LOG(INFO) << "Stopping " << active.size() << " worker(s)";
		pending->remaining = active.size();
		for (ProcessSupervisor* supervisor : active) {
			supervisor->Stop([pending](absl::StatusOr<std::string> result) {
				if (!result.ok() && pending->first_error.ok()) {
					pending->first_error = result.status();
				}
				if (--pending->remaining == 0) {
					pending->done(pending->first_error);
				}
			});
		}
	});
}

} // namespace ClipBridge
