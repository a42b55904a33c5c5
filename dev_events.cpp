#include "dev_events.hpp"

#include <initializer_list>
#include <stdexcept>

#include <trantor/utils/Logger.h>

namespace devproxy {

namespace {

static std::string trimCopy(const std::string &s) {
	auto start = s.find_first_not_of(" \t\r\n\f\v");
	if (start == std::string::npos) return "";
	auto end = s.find_last_not_of(" \t\r\n\f\v");
	return s.substr(start, end - start + 1);
}

static const json &requireObject(const json &j, const char *what) {
	if (!j.is_object()) throw std::invalid_argument(std::string(what) + " must be a json object");
	return j;
}

static std::optional<std::string> optionalString(const json &obj, const char *key) {
	auto it = obj.find(key);
	if (it == obj.end() || it->is_null()) return std::nullopt;
	if (!it->is_string()) throw std::invalid_argument(std::string("field '") + key + "' must be a string");
	return it->get<std::string>();
}

static ExtraFields collectExtra(const json &obj, std::initializer_list<const char *> known) {
	ExtraFields extra;
	for (auto it = obj.begin(); it != obj.end(); ++it) {
		bool isKnown = false;
		for (const char *k : known) {
			if (it.key() == k) { isKnown = true; break; }
		}
		if (!isKnown) extra.emplace(it.key(), it.value());
	}
	return extra;
}

static void mergeExtra(json &j, const ExtraFields &extra) {
	for (const auto &kv : extra) {
		if (!j.contains(kv.first)) j[kv.first] = kv.second;
	}
}

template <typename T>
static std::optional<T> parseEventJson(const std::string &eventName, const std::string &data) {
	try {
		return json::parse(data).get<T>();
	} catch (const std::exception &e) {
		LOG_WARN << "malformed '" << eventName << "' event skipped (" << e.what() << "): " << data;
		return std::nullopt;
	}
}

static void appendReasoning(Accumulator &acc, const std::string &data) {
	if (!acc.reasoning) acc.reasoning = std::string();
	acc.reasoning->append(data);
}

} // namespace

void from_json(const json &j, DevAction &a) {
	requireObject(j, "action");
	auto it = j.find("type");
	if (it == j.end()) throw std::invalid_argument("action is missing 'type'");
	if (!it->is_number_integer()) throw std::invalid_argument("action 'type' must be an integer");
	int64_t type = it->get<int64_t>();
	if (type < 0 || type > static_cast<int64_t>(UINT32_MAX)) throw std::invalid_argument("action 'type' out of range");
	a.type = static_cast<uint32_t>(type);
	a.extra = collectExtra(j, {"type"});
}

void from_json(const json &j, DevSource &s) {
	requireObject(j, "source");
	s.title = optionalString(j, "title");
	s.url = optionalString(j, "url");
	s.extra = collectExtra(j, {"title", "url"});
}

void from_json(const json &j, DevGithubSource &s) {
	requireObject(j, "repo source");
	s.repo = optionalString(j, "repo");
	s.filePath = optionalString(j, "filePath");
	s.extra = collectExtra(j, {"repo", "filePath"});
}

void to_json(json &j, const DevAction &a) {
	j = json{{"type", a.type}};
	mergeExtra(j, a.extra);
}

void to_json(json &j, const DevSource &s) {
	j = json::object();
	if (s.title) j["title"] = *s.title;
	if (s.url) j["url"] = *s.url;
	mergeExtra(j, s.extra);
}

void to_json(json &j, const DevGithubSource &s) {
	j = json::object();
	if (s.repo) j["repo"] = *s.repo;
	if (s.filePath) j["filePath"] = *s.filePath;
	mergeExtra(j, s.extra);
}

void Accumulator::deriveRelatedQuestions() {
	relatedQuestions.clear();
	size_t start = 0;
	while (start <= relatedQuestionsRaw.size()) {
		auto nl = relatedQuestionsRaw.find('\n', start);
		if (nl == std::string::npos) nl = relatedQuestionsRaw.size();
		std::string q = trimCopy(relatedQuestionsRaw.substr(start, nl - start));
		if (!q.empty()) relatedQuestions.push_back(std::move(q));
		start = nl + 1;
	}
}

void to_json(json &j, const Accumulator &acc) {
	auto opt = [](const std::optional<std::string> &v) -> json {
		if (v) return *v;
		return nullptr;
	};
	j = json{
		{"text", acc.text},
		{"actions", acc.actions},
		{"sources", acc.sources},
		{"githubSources", acc.githubSources},
		{"relatedQuestions", acc.relatedQuestions},
		{"threadId", opt(acc.threadId)},
		{"queryMessageId", opt(acc.queryMessageId)},
		{"answerMessageId", opt(acc.answerMessageId)},
		{"threadTitle", opt(acc.threadTitle)},
		{"reasoning", opt(acc.reasoning)},
		{"isFinished", acc.isFinished},
		{"error", opt(acc.error)}
	};
}

std::optional<ChatCompletionChunk> applyDevEvent(Accumulator &acc, const SseEvent &event, const ChunkFactory &chunks) {
	const std::string &name = event.name;
	const std::string &data = event.data;
	if (acc.isFinished) {
		LOG_DEBUG << "dropping '" << name << "' event, stream already finished";
		return std::nullopt;
	}
	LOG_TRACE << "dispatch event '" << name << "' (" << data.size() << " bytes) for " << chunks.requestId();

	if (name == "message" || name == "content" || name == "c") {
		if (data.empty()) return std::nullopt;
		acc.text += data;
		return chunks.content(data);
	}
	if (name == "action") {
		if (auto action = parseEventJson<DevAction>(name, data)) acc.actions.push_back(std::move(*action));
		return std::nullopt;
	}
	if (name == "sources") {
		if (auto sources = parseEventJson<std::vector<DevSource>>(name, data)) acc.sources = std::move(*sources);
		return std::nullopt;
	}
	if (name == "repoSources") {
		if (auto sources = parseEventJson<std::vector<DevGithubSource>>(name, data)) acc.githubSources = std::move(*sources);
		return std::nullopt;
	}
	if (name == "rlq" || name == "q") {
		if (!data.empty()) {
			acc.relatedQuestionsRaw += "\n";
			acc.relatedQuestionsRaw += trimCopy(data);
		}
		return std::nullopt;
	}
	if (name == "r") {
		appendReasoning(acc, data);
		return std::nullopt;
	}
	if (name == "threadId") { acc.threadId = data; return std::nullopt; }
	if (name == "queryMessageId") { acc.queryMessageId = data; return std::nullopt; }
	if (name == "answerMessageId") { acc.answerMessageId = data; return std::nullopt; }
	if (name == "threadTitle") { acc.threadTitle = data; return std::nullopt; }
	if (name == "error") {
		LOG_ERROR << "upstream error event for " << chunks.requestId() << ": " << data;
		acc.error = data;
		acc.isFinished = true;
		return chunks.error(data);
	}
	if (name == "finish") {
		LOG_INFO << "upstream sent explicit finish for " << chunks.requestId();
		return std::nullopt;
	}
	LOG_TRACE << "ignoring unhandled event '" << name << "'";
	return std::nullopt;
}

} // namespace devproxy
