#ifndef CLIPBRIDGE_SUPERVISOR_LOG_EVENT_CLASSIFIER_H_
#define CLIPBRIDGE_SUPERVISOR_LOG_EVENT_CLASSIFIER_H_

#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "types.h"

namespace ClipBridge {

/**
 * Substring tables driving classification.
 */
struct ClassifierRules {
	/// Any of these marks the worker as ready
	std::vector<std::string> ready_markers;
	/// Import failures: the worker can never become ready
	std::vector<std::string> dependency_markers;
	/// Error-shaped diagnostic output that does not change state
	std::vector<std::string> error_markers;

	/// Rules matching the clipboard worker's log phrasing for a role.
	static ClassifierRules ForRole(WorkerRole role);
};

/**
 * Turns one worker log line into a ClassifiedEvent.
 *
 * Checks run in a fixed order: peer connect, peer disconnect, readiness
 * marker, dependency error, then (diagnostic stream only) generic error.
 * Anything else is an InfoLine, so no line is dropped.
 */
class LogEventClassifier {
public:
	explicit LogEventClassifier(ClassifierRules rules);

	ClassifiedEvent Classify(const LogLine& line) const;

	const ClassifierRules& rules() const { return rules_; }

	/// Dotted-quad check used on captured addresses (each octet 0..255).
	static bool IsValidIPv4(const std::string& address);

private:
	std::optional<std::string> MatchAddress(const std::regex& pattern, const std::string& text) const;
	static bool ContainsAny(const std::string& text, const std::vector<std::string>& needles);

	ClassifierRules rules_;
	std::regex connected_pattern_;
	std::regex disconnected_pattern_;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_LOG_EVENT_CLASSIFIER_H_
