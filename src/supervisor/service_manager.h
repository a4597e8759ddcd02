#ifndef CLIPBRIDGE_SUPERVISOR_SERVICE_MANAGER_H_
#define CLIPBRIDGE_SUPERVISOR_SERVICE_MANAGER_H_

#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio.hpp>

#include "absl/status/status.h"
#include "process_supervisor.h"
#include "supervisor_listener.h"
#include "worker_locator.h"
#include "worker_process.h"

namespace ClipBridge {

/**
 * Entry point for the UI layer: one ProcessSupervisor per role on a private
 * io_context thread.
 *
 * All methods may be called from any thread. Requests are posted to the
 * io_context and callbacks, like listener events, run on it.
 */
class ServiceManager {
public:
	using ResultCallback = ProcessSupervisor::ResultCallback;
	using PeersCallback = std::function<void(std::vector<ConnectedPeer>)>;
	using DoneCallback = std::function<void(absl::Status)>;
	using LauncherFactory = std::function<std::unique_ptr<IWorkerLauncher>(boost::asio::io_context&)>;

	/// A null factory selects PosixWorkerLauncher.
	ServiceManager(WorkerLocator locator, ISupervisorListener* listener,
			LauncherFactory launcher_factory = nullptr);
	~ServiceManager();

	ServiceManager(const ServiceManager&) = delete;
	ServiceManager& operator=(const ServiceManager&) = delete;

	void Start(WorkerRole role, StartConfig config, ResultCallback callback);
	void Stop(WorkerRole role, ResultCallback callback);

	/// Snapshot of both roles, readable without going through the io thread.
	ServiceStatus Status() const;

	/// Peers connected to the server worker, in connection order.
	void ListConnectedPeers(PeersCallback callback);

	/// Stop every role that is starting or running. Completes once all of
	/// them have confirmed exit, with the first failure if any.
	void StopAll(DoneCallback callback);

	boost::asio::io_context& io_context() { return io_; }

private:
	ProcessSupervisor& SupervisorFor(WorkerRole role) {
		return role == WorkerRole::Server ? *server_ : *client_;
	}

	boost::asio::io_context io_;
	boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_;
	WorkerLocator locator_;
	std::unique_ptr<IWorkerLauncher> launcher_;
	std::unique_ptr<ProcessSupervisor> server_;
	std::unique_ptr<ProcessSupervisor> client_;
	std::thread io_thread_;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_SERVICE_MANAGER_H_
