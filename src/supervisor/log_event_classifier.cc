#include "log_event_classifier.h"

#include <glog/logging.h>

#include "common/config.h"

namespace ClipBridge {

namespace {

// Four dot-separated numeric groups, not followed by a fifth group.
constexpr char kIPv4Group[] = "(\\d{1,3}\\.\\d{1,3}\\.\\d{1,3}\\.\\d{1,3})(?!\\.?\\d)";

} // end of namespace

ClassifierRules ClassifierRules::ForRole(WorkerRole role) {
	ClassifierRules rules;
	rules.ready_markers = {role == WorkerRole::Server ? SERVER_READY_MARKER : CLIENT_READY_MARKER};
	rules.dependency_markers = {"ImportError", "ModuleNotFoundError"};
	rules.error_markers = {"ERROR:", "CRITICAL:", "Traceback", "Exception"};
	return rules;
}

LogEventClassifier::LogEventClassifier(ClassifierRules rules)
	: rules_(std::move(rules)),
	connected_pattern_(std::string("new (?:websocket )?connection from ") + kIPv4Group,
			std::regex::ECMAScript | std::regex::icase),
	disconnected_pattern_(std::string("client ") + kIPv4Group + " disconnected",
			std::regex::ECMAScript | std::regex::icase) {
}

ClassifiedEvent LogEventClassifier::Classify(const LogLine& line) const {
	const std::string& text = line.text;

	if (auto address = MatchAddress(connected_pattern_, text)) {
		return PeerConnected{*address};
	}
	if (auto address = MatchAddress(disconnected_pattern_, text)) {
		return PeerDisconnected{*address};
	}
	if (ContainsAny(text, rules_.ready_markers)) {
		return ReadySignal{};
	}
	if (ContainsAny(text, rules_.dependency_markers)) {
		return DependencyError{text};
	}
	if (line.stream == StreamKind::Diagnostic && ContainsAny(text, rules_.error_markers)) {
		return GenericError{text};
	}
	return InfoLine{text};
}

bool LogEventClassifier::IsValidIPv4(const std::string& address) {
	int groups = 0;
	size_t pos = 0;
	while (pos <= address.size()) {
		size_t dot = address.find('.', pos);
		std::string part = address.substr(pos, dot == std::string::npos ? std::string::npos : dot - pos);
		if (part.empty() || part.size() > 3) {
			return false;
		}
		int value = 0;
		for (char c : part) {
			if (c < '0' || c > '9') return false;
			value = value * 10 + (c - '0');
		}
		if (value > 255) {
			return false;
		}
		++groups;
		if (dot == std::string::npos) {
			break;
		}
		pos = dot + 1;
	}
	return groups == 4;
}

std::optional<std::string> LogEventClassifier::MatchAddress(const std::regex& pattern,
		const std::string& text) const {
	std::smatch match;
	if (!std::regex_search(text, match, pattern)) {
		return std::nullopt;
	}
	std::string address = match[1].str();
	if (!IsValidIPv4(address)) {
		VLOG(1) << "Ignoring malformed peer address '" << address << "' in: " << text;
		return std::nullopt;
	}
	return address;
}

bool LogEventClassifier::ContainsAny(const std::string& text, const std::vector<std::string>& needles) {
	for (const auto& needle : needles) {
		if (!needle.empty() && text.find(needle) != std::string::npos) {
			return true;
		}
	}
	return false;
}

} // namespace ClipBridge
