#pragma once

#include <optional>
#include <string>
#include <vector>

namespace devproxy {

enum class SseLineKind { Event, Data, Id, Retry, Comment, Empty };

struct SseLine {
	SseLineKind kind{SseLineKind::Empty};
	std::string value;

	bool operator==(const SseLine &other) const { return kind == other.kind && value == other.value; }
};

struct SseEvent {
	std::string name;
	std::string data;
};

// One line of event-stream text, already stripped of its terminator.
// Unknown fields come back as Comment.
SseLine parseSseLine(const std::string &line);

// Builds events from parsed lines: `event:` names the pending event, `data:`
// lines collect until a blank line dispatches them.
class SseEventAssembler {
public:
	static constexpr const char *kDefaultEvent = "message";

	std::optional<SseEvent> feedLine(const std::string &line);
	std::optional<SseEvent> flush();

	bool hasPendingData() const { return !dataLines_.empty(); }
	const std::string &pendingEventName() const { return eventName_; }

private:
	std::optional<SseEvent> takeEvent();

	std::string eventName_{kDefaultEvent};
	std::vector<std::string> dataLines_;
};

} // namespace devproxy
