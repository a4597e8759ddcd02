#include "line_assembler.h"

#include <cctype>

namespace ClipBridge {

std::vector<LogLine> LineAssembler::Feed(std::string_view chunk) {
	std::vector<LogLine> lines;
	if (chunk.empty()) {
		return lines;
	}

	pending_.append(chunk.data(), chunk.size());

	size_t start = 0;
	size_t newline = pending_.find('\n', start);
	while (newline != std::string::npos) {
		Emit(std::string_view(pending_).substr(start, newline - start), lines);
		start = newline + 1;
		newline = pending_.find('\n', start);
	}
	// Keep the unterminated tail (possibly empty) for the next chunk
	pending_.erase(0, start);
	return lines;
}

std::vector<LogLine> LineAssembler::Close() {
	std::vector<LogLine> lines;
	if (!pending_.empty()) {
		Emit(pending_, lines);
		pending_.clear();
	}
	return lines;
}

bool LineAssembler::IsBlank(std::string_view text) {
	for (char c : text) {
		if (!std::isspace(static_cast<unsigned char>(c))) {
			return false;
		}
	}
	return true;
}

void LineAssembler::Emit(std::string_view raw, std::vector<LogLine>& out) const {
	if (!raw.empty() && raw.back() == '\r') {
		raw.remove_suffix(1);
	}
	if (IsBlank(raw)) {
		return;
	}
	out.push_back(LogLine{stream_, std::string(raw)});
}

} // namespace ClipBridge
