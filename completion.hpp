#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "chat_chunk.hpp"
#include "dev_client.hpp"
#include "dev_events.hpp"

namespace devproxy {

using json = nlohmann::json;

constexpr const char *kSseDone = "data: [DONE]\n\n";

// Flattens chat messages into the single prompt the backend takes:
// "User: ...\nAssistant: ...". Throws std::invalid_argument on a malformed
// message list.
std::string messagesToContent(const json &messages);

// Backend options for one chat request. Defaults can be overridden through
// an "x_dev" object in the request body.
DevRequestOptions requestOptionsFor(const json &body, const std::string &model);

std::string sseFrame(const ChatCompletionChunk &chunk);

// Buffers a chunk sequence into one chat.completion object.
class CompletionAggregator {
public:
	CompletionAggregator(std::string id, std::string model);

	void add(const ChatCompletionChunk &chunk);
	json result(const Accumulator &acc) const;

	const std::string &content() const { return content_; }

private:
	std::string id_;
	std::string model_;
	int64_t created_{0};
	std::string content_;
	std::optional<std::string> finishReason_;
};

} // namespace devproxy
