#include "chat_chunk.hpp"

#include <chrono>

#include <trantor/utils/Logger.h>

namespace devproxy {

void to_json(json &j, const Delta &d) {
	j = json::object();
	if (d.role) j["role"] = *d.role;
	if (d.content) j["content"] = *d.content;
}

void to_json(json &j, const Choice &c) {
	j = json{{"index", c.index}, {"delta", c.delta}};
	if (c.finishReason) j["finish_reason"] = *c.finishReason;
	else j["finish_reason"] = nullptr;
}

void to_json(json &j, const ChatCompletionChunk &chunk) {
	j = json{
		{"id", chunk.id},
		{"object", chunk.object},
		{"created", chunk.created},
		{"model", chunk.model},
		{"choices", chunk.choices}
	};
}

int64_t unixSeconds() {
	return std::chrono::duration_cast<std::chrono::seconds>(
		std::chrono::system_clock::now().time_since_epoch()).count();
}

ChunkFactory::ChunkFactory(std::string requestId, std::string model, Clock clock)
	: requestId_(std::move(requestId)), model_(std::move(model)), clock_(std::move(clock)) {
	if (!clock_) clock_ = unixSeconds;
}

ChatCompletionChunk ChunkFactory::content(const std::string &text) const {
	Delta delta;
	delta.role = kAssistantRole;
	delta.content = text;
	return makeChunk(std::move(delta), std::nullopt);
}

ChatCompletionChunk ChunkFactory::finish(const std::string &reason) const {
	LOG_DEBUG << "final chunk for " << requestId_ << " finish_reason=" << reason;
	return makeChunk(Delta{}, reason);
}

ChatCompletionChunk ChunkFactory::error(const std::string &message) const {
	LOG_WARN << "error chunk for " << requestId_ << ": " << message;
	Delta delta;
	delta.role = kAssistantRole;
	delta.content = std::string(kStreamErrorTag) + message;
	return makeChunk(std::move(delta), std::string("stop"));
}

ChatCompletionChunk ChunkFactory::makeChunk(Delta delta, std::optional<std::string> finishReason) const {
	ChatCompletionChunk chunk;
	chunk.id = requestId_;
	chunk.created = clock_();
	chunk.model = model_;
	Choice choice;
	choice.delta = std::move(delta);
	choice.finishReason = std::move(finishReason);
	chunk.choices.push_back(std::move(choice));
	return chunk;
}

} // namespace devproxy
