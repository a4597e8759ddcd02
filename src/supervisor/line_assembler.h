#ifndef CLIPBRIDGE_SUPERVISOR_LINE_ASSEMBLER_H_
#define CLIPBRIDGE_SUPERVISOR_LINE_ASSEMBLER_H_

#include <string>
#include <string_view>
#include <vector>

#include "types.h"

namespace ClipBridge {

/**
 * Reassembles complete lines from raw chunks read off one worker stream.
 *
 * Bytes after the last '\n' are held back until the next chunk completes
 * them. Blank (empty or whitespace-only) lines are dropped, and a trailing
 * '\r' is stripped so CRLF output reads the same as LF output.
 * One instance per stream; not thread-safe.
 */
class LineAssembler {
public:
	explicit LineAssembler(StreamKind stream) : stream_(stream) {}

	/// Append a chunk and return every line it completed, in write order.
	std::vector<LogLine> Feed(std::string_view chunk);

	/// Stream closed: emit the pending fragment (if non-blank) and reset.
	std::vector<LogLine> Close();

	/// Bytes currently held back waiting for a terminator.
	size_t PendingBytes() const { return pending_.size(); }

	StreamKind stream() const { return stream_; }

	static bool IsBlank(std::string_view text);

private:
	void Emit(std::string_view raw, std::vector<LogLine>& out) const;

	StreamKind stream_;
	std::string pending_;
};

} // namespace ClipBridge

#endif // CLIPBRIDGE_SUPERVISOR_LINE_ASSEMBLER_H_
