#ifndef CLIPBRIDGE_SUPERVISOR_CLIENT_REGISTRY_H_
#define CLIPBRIDGE_SUPERVISOR_CLIENT_REGISTRY_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "types.h"

namespace ClipBridge {

/**
 * Peers currently connected to a server worker, as inferred from its log.
 *
 * Holds at most one entry per address. Entries keep insertion order.
 * Owned by one ProcessSupervisor and only touched from its io_context, so
 * there is no internal locking.
 */
class ClientRegistry {
public:
	ClientRegistry() = default;

	/// Insert a peer for address. Returns nullopt (no-op) if the address is
	/// already present.
	std::optional<ConnectedPeer> UpsertOnConnect(const std::string& address);

	/// Remove the first peer with this address. Returns its id, or nullopt
	/// when no peer matches.
	std::optional<std::string> RemoveOnDisconnect(const std::string& address);

	std::vector<ConnectedPeer> List() const { return peers_; }

	size_t Size() const { return peers_.size(); }
	bool Empty() const { return peers_.empty(); }

	void Clear();

private:
	std::string GenerateId(const std::string& address,
			std::chrono::system_clock::time_point now);

	std::vector<ConnectedPeer> peers_;
	uint64_t next_sequence_ = 0;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_CLIENT_REGISTRY_H_
