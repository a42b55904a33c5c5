#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace devproxy {

using json = nlohmann::json;

struct Delta {
	std::optional<std::string> role;
	std::optional<std::string> content;
};

struct Choice {
	int index{0};
	Delta delta;
	std::optional<std::string> finishReason;
};

struct ChatCompletionChunk {
	std::string id;
	std::string object{"chat.completion.chunk"};
	int64_t created{0};
	std::string model;
	std::vector<Choice> choices;

	bool isTerminal() const { return !choices.empty() && choices[0].finishReason.has_value(); }
};

void to_json(json &j, const Delta &d);
void to_json(json &j, const Choice &c);
void to_json(json &j, const ChatCompletionChunk &chunk);

int64_t unixSeconds();

// Stamps out chunks for one request. `created` is read from the clock for
// every chunk.
class ChunkFactory {
public:
	using Clock = std::function<int64_t()>;

	static constexpr const char *kAssistantRole = "assistant";
	static constexpr const char *kStreamErrorTag = "[STREAM_ERROR]: ";

	ChunkFactory(std::string requestId, std::string model, Clock clock = nullptr);

	ChatCompletionChunk content(const std::string &text) const;
	ChatCompletionChunk finish(const std::string &reason = "stop") const;
	ChatCompletionChunk error(const std::string &message) const;

	const std::string &requestId() const { return requestId_; }
	const std::string &model() const { return model_; }

private:
	ChatCompletionChunk makeChunk(Delta delta, std::optional<std::string> finishReason) const;

	std::string requestId_;
	std::string model_;
	Clock clock_;
};

} // namespace devproxy
