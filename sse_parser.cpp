#include "sse_parser.hpp"

#include <trantor/utils/Logger.h>

namespace devproxy {

SseLine parseSseLine(const std::string &line) {
	if (line.empty()) return {SseLineKind::Empty, ""};
	if (line[0] == ':') return {SseLineKind::Comment, ""};

	std::string field;
	std::string value;
	auto colon = line.find(':');
	if (colon == std::string::npos) {
		field = line;
	} else {
		field = line.substr(0, colon);
		value = line.substr(colon + 1);
		if (!value.empty() && value[0] == ' ') value.erase(0, 1);
	}

	if (field == "event") return {SseLineKind::Event, value};
	if (field == "data") return {SseLineKind::Data, value};
	if (field == "id") return {SseLineKind::Id, value};
	if (field == "retry") return {SseLineKind::Retry, value};
	return {SseLineKind::Comment, ""};
}

std::optional<SseEvent> SseEventAssembler::feedLine(const std::string &line) {
	SseLine parsed = parseSseLine(line);
	switch (parsed.kind) {
	case SseLineKind::Event:
		LOG_TRACE << "sse event name: " << parsed.value;
		eventName_ = std::move(parsed.value);
		return std::nullopt;
	case SseLineKind::Data:
		LOG_TRACE << "sse data line: " << parsed.value;
		dataLines_.push_back(std::move(parsed.value));
		return std::nullopt;
	case SseLineKind::Empty: {
		auto event = takeEvent();
		eventName_ = kDefaultEvent;
		return event;
	}
	case SseLineKind::Id:
	case SseLineKind::Retry:
	case SseLineKind::Comment:
		break;
	}
	return std::nullopt;
}

std::optional<SseEvent> SseEventAssembler::flush() {
	auto event = takeEvent();
	eventName_ = kDefaultEvent;
	return event;
}

std::optional<SseEvent> SseEventAssembler::takeEvent() {
	if (dataLines_.empty()) return std::nullopt;
	SseEvent event;
	event.name = eventName_;
	for (size_t i = 0; i < dataLines_.size(); i++) {
		if (i) event.data.push_back('\n');
		event.data.append(dataLines_[i]);
	}
	dataLines_.clear();
	return event;
}

} // namespace devproxy
