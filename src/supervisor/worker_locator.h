#ifndef CLIPBRIDGE_SUPERVISOR_WORKER_LOCATOR_H_
#define CLIPBRIDGE_SUPERVISOR_WORKER_LOCATOR_H_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "common/configuration.h"
#include "types.h"
#include "worker_process.h"

namespace ClipBridge {

/// Explicit worker command that replaces the configured one.
struct WorkerOverride {
	std::string executable;
	std::vector<std::string> args;
};

/**
 * Turns a role and its start parameters into a LaunchSpec.
 *
 * Lookup order: explicit override, standalone executable in
 * worker.standalone_dir, then <python_path> <role script>.
 */
class WorkerLocator {
public:
	explicit WorkerLocator(ClipBridgeConfig config) : config_(std::move(config)) {}

	void SetOverride(WorkerRole role, WorkerOverride worker_override);
	void ClearOverride(WorkerRole role);

	/// Fails with InvalidConfig for bad start parameters and with
	/// SpawnFailure when a standalone executable is missing.
	absl::StatusOr<LaunchSpec> Locate(WorkerRole role, const StartConfig& start) const;

	/// Variables the worker reads for its role, on top of the inherited ones.
	std::map<std::string, std::string> RoleEnvironment(WorkerRole role, const StartConfig& start) const;

	const ClipBridgeConfig& config() const { return config_; }

private:
	ClipBridgeConfig config_;
	std::map<WorkerRole, WorkerOverride> overrides_;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_WORKER_LOCATOR_H_
