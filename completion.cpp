#include "completion.hpp"

#include <stdexcept>

namespace devproxy {

namespace {

static std::string roleLabel(const std::string &role) {
	if (role == "user") return "User";
	if (role == "assistant") return "Assistant";
	if (role == "system") return "System";
	throw std::invalid_argument("unsupported message role '" + role + "'");
}

static std::string contentText(const json &content) {
	if (content.is_string()) return content.get<std::string>();
	if (!content.is_array()) return "[Non-text content]";
	std::string out;
	bool first = true;
	for (const auto &block : content) {
		if (!first) out += " ";
		first = false;
		if (block.is_object() && block.value("type", "") == "text" && block.contains("text") && block["text"].is_string()) {
			out += block["text"].get<std::string>();
		} else {
			out += "[Non-text content]";
		}
	}
	return out;
}

template <typename T>
static void overrideFrom(const json &obj, const char *key, std::optional<T> &target) {
	auto it = obj.find(key);
	if (it == obj.end() || it->is_null()) return;
	target = it->get<T>();
}

} // namespace

std::string messagesToContent(const json &messages) {
	if (!messages.is_array() || messages.empty()) {
		throw std::invalid_argument("messages must be a non-empty array");
	}
	std::string out;
	for (const auto &msg : messages) {
		if (!msg.is_object() || !msg.contains("role") || !msg["role"].is_string()) {
			throw std::invalid_argument("each message needs a string role");
		}
		if (!out.empty()) out += "\n";
		out += roleLabel(msg["role"].get<std::string>());
		out += ": ";
		out += contentText(msg.contains("content") ? msg["content"] : json());
	}
	return out;
}

DevRequestOptions requestOptionsFor(const json &body, const std::string &model) {
	DevRequestOptions options;
	options.model = model;
	options.searchMode = "web";
	options.isExpert = false;
	options.language = "en";

	auto ext = body.find("x_dev");
	if (ext == body.end() || ext->is_null()) return options;
	if (!ext->is_object()) throw std::invalid_argument("x_dev must be an object");
	try {
		overrideFrom(*ext, "sid", options.sid);
		overrideFrom(*ext, "searchMode", options.searchMode);
		overrideFrom(*ext, "isExpert", options.isExpert);
		overrideFrom(*ext, "language", options.language);
		overrideFrom(*ext, "threadId", options.threadId);
		overrideFrom(*ext, "pluginAction", options.pluginAction);
		overrideFrom(*ext, "programmingLanguage", options.programmingLanguage);
	} catch (const json::exception &e) {
		throw std::invalid_argument(std::string("invalid x_dev option: ") + e.what());
	}
	return options;
}

std::string sseFrame(const ChatCompletionChunk &chunk) {
	return "data: " + json(chunk).dump() + "\n\n";
}

CompletionAggregator::CompletionAggregator(std::string id, std::string model)
	: id_(std::move(id)), model_(std::move(model)) {}

void CompletionAggregator::add(const ChatCompletionChunk &chunk) {
	if (created_ == 0) created_ = chunk.created;
	for (const auto &choice : chunk.choices) {
		if (choice.delta.content) content_ += *choice.delta.content;
		if (choice.finishReason) finishReason_ = choice.finishReason;
	}
}

json CompletionAggregator::result(const Accumulator &acc) const {
	json message{{"role", ChunkFactory::kAssistantRole}, {"content", content_}};
	json choice{{"index", 0}, {"message", message}};
	if (finishReason_) choice["finish_reason"] = *finishReason_;
	else choice["finish_reason"] = nullptr;

	return json{
		{"id", id_},
		{"object", "chat.completion"},
		{"created", created_ != 0 ? created_ : unixSeconds()},
		{"model", model_},
		{"choices", json::array({choice})},
		{"usage", {{"prompt_tokens", 0}, {"completion_tokens", 0}, {"total_tokens", 0}}},
		{"x_dev", acc}
	};
}

} // namespace devproxy
