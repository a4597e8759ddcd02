#include "client_registry.h"

#include <algorithm>
#include <sstream>

#include <glog/logging.h>

namespace ClipBridge {

std::optional<ConnectedPeer> ClientRegistry::UpsertOnConnect(const std::string& address) {
	auto it = std::find_if(peers_.begin(), peers_.end(),
			[&address](const ConnectedPeer& peer) { return peer.address == address; });
	if (it != peers_.end()) {
		VLOG(1) << "Peer " << address << " already registered as " << it->id;
		return std::nullopt;
	}

	auto now = std::chrono::system_clock::now();
	ConnectedPeer peer;
	peer.id = GenerateId(address, now);
	peer.address = address;
	peer.display_name = "Client-" + address;
	peer.connected_at = now;
	peers_.push_back(peer);

	LOG(INFO) << "Client connected: " << peer.id << " (" << peers_.size() << " total)";
	return peer;
}

std::optional<std::string> ClientRegistry::RemoveOnDisconnect(const std::string& address) {
	auto it = std::find_if(peers_.begin(), peers_.end(),
			[&address](const ConnectedPeer& peer) { return peer.address == address; });
	if (it == peers_.end()) {
		LOG(WARNING) << "Disconnect for unknown peer " << address;
		return std::nullopt;
	}
	std::string id = it->id;
	peers_.erase(it);
	LOG(INFO) << "Client disconnected: " << id << " (" << peers_.size() << " remaining)";
	return id;
}

void ClientRegistry::Clear() {
	if (!peers_.empty()) {
		LOG(INFO) << "Clearing " << peers_.size() << " connected client(s)";
	}
	peers_.clear();
}

// The address alone is not unique over time (a peer can reconnect), so the
// id combines it with the insertion timestamp and a sequence number.
std::string ClientRegistry::GenerateId(const std::string& address,
		std::chrono::system_clock::time_point now) {
	auto now_ms = std::chrono::time_point_cast<std::chrono::milliseconds>(now);
	long long timestamp = now_ms.time_since_epoch().count();

	std::stringstream ss;
	ss << "client-" << address << "-" << timestamp << "-" << next_sequence_++;
	return ss.str();
}

} // namespace ClipBridge
