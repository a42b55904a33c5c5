#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chat_chunk.hpp"
#include "sse_parser.hpp"

namespace devproxy {

using json = nlohmann::json;

// Keys a record does not model, kept verbatim.
using ExtraFields = std::map<std::string, json>;

struct DevAction {
	uint32_t type{0};
	ExtraFields extra;
};

struct DevSource {
	std::optional<std::string> title;
	std::optional<std::string> url;
	ExtraFields extra;
};

struct DevGithubSource {
	std::optional<std::string> repo;
	std::optional<std::string> filePath;
	ExtraFields extra;
};

void from_json(const json &j, DevAction &a);
void from_json(const json &j, DevSource &s);
void from_json(const json &j, DevGithubSource &s);
void to_json(json &j, const DevAction &a);
void to_json(json &j, const DevSource &s);
void to_json(json &j, const DevGithubSource &s);

// Everything the backend said during one response. Lives for one stream.
struct Accumulator {
	std::string text;
	std::vector<DevAction> actions;
	std::vector<DevSource> sources;
	std::vector<DevGithubSource> githubSources;
	std::string relatedQuestionsRaw;
	std::vector<std::string> relatedQuestions;

	std::optional<std::string> threadId;
	std::optional<std::string> queryMessageId;
	std::optional<std::string> answerMessageId;
	std::optional<std::string> threadTitle;
	std::optional<std::string> reasoning;

	bool isFinished{false};
	std::optional<std::string> error;

	// Splits relatedQuestionsRaw into trimmed, non-empty questions.
	void deriveRelatedQuestions();
};

void to_json(json &j, const Accumulator &acc);

// Applies one dispatched event to the accumulator and returns the chunk it
// produces, if any. Events arriving after the accumulator finished are
// ignored.
std::optional<ChatCompletionChunk> applyDevEvent(Accumulator &acc, const SseEvent &event, const ChunkFactory &chunks);

} // namespace devproxy
