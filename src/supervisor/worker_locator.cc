#include "worker_locator.h"

#include <unistd.h>

#include <glog/logging.h>

#include "common/error.h"

namespace ClipBridge {

void WorkerLocator::SetOverride(WorkerRole role, WorkerOverride worker_override) {
	overrides_[role] = std::move(worker_override);
}

void WorkerLocator::ClearOverride(WorkerRole role) {
	overrides_.erase(role);
}

std::map<std::string, std::string> WorkerLocator::RoleEnvironment(WorkerRole role,
		const StartConfig& start) const {
	std::map<std::string, std::string> env;
	std::string log_level = start.log_level.empty() ? std::string(DEFAULT_LOG_LEVEL) : start.log_level;

	if (role == WorkerRole::Server) {
		env["PORT"] = std::to_string(start.port);
	} else {
		env["SERVER_HOST"] = start.peer_address.value_or("");
		env["SERVER_PORT"] = std::to_string(start.port);
	}
	env["LOG_LEVEL"] = log_level;
	// Python block-buffers a pipe otherwise and the markers arrive late
	env["PYTHONUNBUFFERED"] = "1";

	if (config_.worker.development.get()) {
		env["PYTHONPATH"] = config_.worker.python_site_packages.get();
	}
	return env;
}

absl::StatusOr<LaunchSpec> WorkerLocator::Locate(WorkerRole role, const StartConfig& start) const {
	if (start.port < 1 || start.port > 65535) {
		return MakeError(ErrorKind::InvalidConfig, "Invalid port: " + std::to_string(start.port));
	}
	if (role == WorkerRole::Client && (!start.peer_address || start.peer_address->empty())) {
		return MakeError(ErrorKind::InvalidConfig, "Server address is required to start the client");
	}

	LaunchSpec spec;
	spec.env = RoleEnvironment(role, start);
	spec.working_dir = config_.worker.working_dir.get();

	auto it = overrides_.find(role);
	if (it != overrides_.end()) {
		spec.executable = it->second.executable;
		spec.args = it->second.args;
		VLOG(1) << "Using worker override for " << WorkerRoleName(role) << ": " << spec.CommandLine();
		return spec;
	}

	std::string standalone_dir = config_.worker.standalone_dir.get();
	if (!standalone_dir.empty()) {
		std::string name = role == WorkerRole::Server ? STANDALONE_SERVER_NAME : STANDALONE_CLIENT_NAME;
		std::string path = standalone_dir;
		if (path.back() != '/') {
			path += '/';
		}
		path += name;
		if (::access(path.c_str(), X_OK) != 0) {
			LOG(ERROR) << WorkerRoleTitle(role) << " executable not found at: " << path;
			return MakeError(ErrorKind::SpawnFailure,
					std::string(WorkerRoleTitle(role)) + " executable not found at: " + path);
		}
		spec.executable = path;
		return spec;
	}

	spec.executable = config_.worker.python_path.get();
	spec.args.push_back(role == WorkerRole::Server ?
			config_.worker.server_script.get() : config_.worker.client_script.get());
	return spec;
}

} // namespace ClipBridge
