#include <drogon/drogon_test.h>
#include <drogon/drogon.h>

#include <cctype>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "completion.hpp"
#include "dev_client.hpp"
#include "test_server.hpp"

using namespace devproxy;

namespace {

class RecordingSigner : public Signer {
public:
	std::string nonce;
	std::string timestamp;
	std::string deviceId;
	std::string query;
	std::string signature{"c2lnbmF0dXJl"};
	bool fail{false};

	std::string sign(const std::string &n, const std::string &t, const std::string &d, const std::string &q) override {
		if (fail) throw SignError(SignError::Kind::Execution, "module trapped");
		nonce = n;
		timestamp = t;
		deviceId = d;
		query = q;
		return signature;
	}
};

DevClientConfig testConfig() {
	DevClientConfig c;
	c.apiEndpoint = "https://dev.example/api/chat";
	c.deviceId = "device-1";
	c.osType = "3";
	c.sid = "sid-config";
	return c;
}

bool isHex(char c) {
	return std::isxdigit(static_cast<unsigned char>(c)) != 0 && !std::isupper(static_cast<unsigned char>(c));
}

const std::string kEventBody = "event: content\ndata: hello\n\nevent: threadId\ndata: t-1\n\n";
const std::vector<std::string> kSlowPieces{"event: content\n", "data: slow", "ly\n", "\n"};

using Callback = std::function<void(const drogon::HttpResponsePtr &)>;

BuiltRequest localRequest(const std::string &path) {
	BuiltRequest req;
	req.url = devproxy::testing::localUrl(path);
	req.headers = {{"Content-Type", "application/json"}};
	req.body = "{}";
	return req;
}

struct Drained {
	std::string bytes;
	ReadResult last;
	int dataReads{0};
};

Drained drainSource(ByteSource &source) {
	Drained out;
	for (;;) {
		ReadResult r = source.next();
		if (r.status != ReadStatus::Data) {
			out.last = std::move(r);
			return out;
		}
		out.dataReads++;
		out.bytes += r.bytes;
	}
}

}

namespace devproxy {
namespace testing {

void registerRoutes() {
	drogon::app().registerHandler("/upstream/ok", [](const drogon::HttpRequestPtr &, Callback &&cb) {
		auto resp = drogon::HttpResponse::newHttpResponse();
		resp->setContentTypeString("text/event-stream");
		resp->setBody(kEventBody);
		cb(resp);
	}, {drogon::Post});

	drogon::app().registerHandler("/upstream/fail", [](const drogon::HttpRequestPtr &, Callback &&cb) {
		auto resp = drogon::HttpResponse::newHttpResponse();
		resp->setStatusCode(drogon::k500InternalServerError);
		resp->setContentTypeString("text/plain");
		resp->setBody("backend exploded");
		cb(resp);
	}, {drogon::Post});

	drogon::app().registerHandler("/upstream/echo", [](const drogon::HttpRequestPtr &req, Callback &&cb) {
		auto resp = drogon::HttpResponse::newHttpResponse();
		resp->setContentTypeString("text/event-stream");
		resp->setBody("data: sign=" + req->getHeader("sign") + " sid=" + req->getHeader("sid") +
					  " accept=" + req->getHeader("accept") + "\n\ndata: " + std::string(req->getBody()) + "\n\n");
		cb(resp);
	}, {drogon::Post});

	// Keeps the body trickling for longer than the client's idle window.
	drogon::app().registerHandler("/upstream/slow", [](const drogon::HttpRequestPtr &, Callback &&cb) {
		auto resp = drogon::HttpResponse::newAsyncStreamResponse([](drogon::ResponseStreamPtr stream) {
			std::thread([stream = std::move(stream)]() mutable {
				for (const auto &piece : kSlowPieces) {
					std::this_thread::sleep_for(std::chrono::milliseconds(400));
					if (!stream->send(piece)) break;
				}
				stream->close();
			}).detach();
		});
		resp->setContentTypeString("text/event-stream");
		cb(resp);
	}, {drogon::Post});
}

} // namespace testing
} // namespace devproxy

DROGON_TEST(DevClient_SignedHeaders)
{
	auto signer = std::make_shared<RecordingSigner>();
	DevApiClient client(testConfig(), signer);
	auto req = client.buildRequest("User: hi", DevRequestOptions{}, "nonce-1", "1700000000");

	CHECK(req.url == "https://dev.example/api/chat");
	CHECK(signer->nonce == "nonce-1");
	CHECK(signer->timestamp == "1700000000");
	CHECK(signer->deviceId == "device-1");
	CHECK(signer->query == "User: hi");

	CHECK(req.header("Content-Type").value_or("") == "application/json");
	CHECK(req.header("device-id").value_or("") == "device-1");
	CHECK(req.header("os-type").value_or("") == "3");
	CHECK(req.header("nonce").value_or("") == "nonce-1");
	CHECK(req.header("timestamp").value_or("") == "1700000000");
	CHECK(req.header("sign").value_or("") == "c2lnbmF0dXJl");
	CHECK(req.header("sid").value_or("") == "sid-config");
	CHECK(!req.header("authorization"));
}

DROGON_TEST(DevClient_SidOptionOverridesConfig)
{
	auto signer = std::make_shared<RecordingSigner>();
	DevApiClient client(testConfig(), signer);
	DevRequestOptions options;
	options.sid = "sid-request";
	auto req = client.buildRequest("q", options, "n", "1");
	CHECK(req.header("sid").value_or("") == "sid-request");
}

DROGON_TEST(DevClient_GeneratesNonceAndTimestamp)
{
	auto signer = std::make_shared<RecordingSigner>();
	DevApiClient client(testConfig(), signer);
	auto req = client.buildRequest("q", DevRequestOptions{});
	auto nonce = req.header("nonce").value_or("");
	auto timestamp = req.header("timestamp").value_or("");
	CHECK(nonce.size() == 36);
	CHECK(nonce == signer->nonce);
	CHECK(!timestamp.empty());
	bool digits = true;
	for (char c : timestamp) digits = digits && std::isdigit(static_cast<unsigned char>(c));
	CHECK(digits);
	CHECK(std::stoll(timestamp) > 1600000000);
}

DROGON_TEST(DevClient_UuidV4Format)
{
	auto a = generateUuidV4();
	auto b = generateUuidV4();
	CHECK(a != b);
	REQUIRE(a.size() == 36);
	CHECK(a[8] == '-');
	CHECK(a[13] == '-');
	CHECK(a[18] == '-');
	CHECK(a[23] == '-');
	CHECK(a[14] == '4');
	CHECK((a[19] == '8' || a[19] == '9' || a[19] == 'a' || a[19] == 'b'));
	bool hex = true;
	for (size_t i = 0; i < a.size(); i++) {
		if (i == 8 || i == 13 || i == 18 || i == 23) continue;
		hex = hex && isHex(a[i]);
	}
	CHECK(hex);
}

DROGON_TEST(DevClient_BodyOmitsAbsentOptions)
{
	json body = buildRequestBody("hello", DevRequestOptions{});
	CHECK(body["content"] == "hello");
	CHECK(!body.contains("threadId"));
	CHECK(body["extra"] == json{{"pluginFor", "vscode"}});
}

DROGON_TEST(DevClient_BodyCarriesOptions)
{
	DevRequestOptions options;
	options.model = "dev-large";
	options.searchMode = "web";
	options.isExpert = false;
	options.language = "en";
	options.threadId = "t-1";
	options.pluginAction = "explain";
	options.programmingLanguage = "cpp";
	json body = buildRequestBody("hello", options);
	CHECK(body["threadId"] == "t-1");
	const json &extra = body["extra"];
	CHECK(extra["model"] == "dev-large");
	CHECK(extra["searchMode"] == "web");
	CHECK(extra["isExpert"] == false);
	CHECK(extra["language"] == "en");
	CHECK(extra["pluginFor"] == "vscode");
	CHECK(extra["pluginAction"] == "explain");
	CHECK(extra["programmingLanguage"] == "cpp");

	auto signer = std::make_shared<RecordingSigner>();
	DevApiClient client(testConfig(), signer);
	auto req = client.buildRequest("hello", options, "n", "1");
	CHECK(json::parse(req.body) == body);
}

DROGON_TEST(DevClient_SignerErrorPropagates)
{
	auto signer = std::make_shared<RecordingSigner>();
	signer->fail = true;
	DevApiClient client(testConfig(), signer);
	CHECK_THROWS_AS(client.buildRequest("q", DevRequestOptions{}, "n", "1"), SignError);
}

DROGON_TEST(DevClient_RejectsLineBreakInHeader)
{
	auto signer = std::make_shared<RecordingSigner>();
	signer->signature = "abc\r\nX-Injected: 1";
	DevApiClient client(testConfig(), signer);
	CHECK_THROWS_AS(client.buildRequest("q", DevRequestOptions{}, "n", "1"), std::invalid_argument);
}

DROGON_TEST(CurlSource_PassesBodyThrough)
{
	CurlByteSource source(localRequest("/upstream/ok"), 5000, 5000);
	auto drained = drainSource(source);
	CHECK(drained.last.status == ReadStatus::End);
	CHECK(drained.bytes == kEventBody);
	CHECK(source.next().status == ReadStatus::End);
}

DROGON_TEST(CurlSource_ErrorStatusBecomesTransportError)
{
	CurlByteSource source(localRequest("/upstream/fail"), 5000, 5000);
	auto drained = drainSource(source);
	CHECK(drained.dataReads == 0);
	CHECK(drained.bytes.empty());
	REQUIRE(drained.last.status == ReadStatus::Error);
	CHECK(drained.last.error == "Dev API Error (500): backend exploded");
}

DROGON_TEST(CurlSource_ConnectFailureIsTransportError)
{
	BuiltRequest req = localRequest("/upstream/ok");
	req.url = "http://127.0.0.1:1/upstream/ok";
	CurlByteSource source(req, 2000, 2000);
	auto drained = drainSource(source);
	REQUIRE(drained.last.status == ReadStatus::Error);
	CHECK(!drained.last.error.empty());
	CHECK(drained.last.error.rfind("Dev API Error", 0) != 0);
}

DROGON_TEST(CurlSource_SlowStreamOutlivesIdleWindow)
{
	DevClientConfig defaults;
	CHECK(defaults.idleTimeoutMs == 120000);
	CHECK(defaults.connectTimeoutMs > 0);

	auto started = std::chrono::steady_clock::now();
	CurlByteSource source(localRequest("/upstream/slow"), 2000, 1000);
	auto drained = drainSource(source);
	auto elapsed = std::chrono::steady_clock::now() - started;

	CHECK(drained.last.status == ReadStatus::End);
	CHECK(drained.bytes == "event: content\ndata: slowly\n\n");
	CHECK(elapsed > std::chrono::milliseconds(1000));
}

DROGON_TEST(DevClient_OpenStreamSendsSignedRequest)
{
	auto signer = std::make_shared<RecordingSigner>();
	DevClientConfig config = testConfig();
	config.apiEndpoint = devproxy::testing::localUrl("/upstream/echo");
	DevApiClient client(config, signer);

	auto source = client.openStream("User: hi", DevRequestOptions{});
	auto drained = drainSource(*source);
	CHECK(drained.last.status == ReadStatus::End);
	CHECK(drained.bytes.find("sign=c2lnbmF0dXJl sid=sid-config accept=text/event-stream\n\n") != std::string::npos);
	CHECK(drained.bytes.find("\"content\":\"User: hi\"") != std::string::npos);
	CHECK(signer->query == "User: hi");
}

DROGON_TEST(Completion_MessagesToContent)
{
	json messages = json::array({
		{{"role", "system"}, {"content", "Be brief."}},
		{{"role", "user"}, {"content", "Hello"}},
		{{"role", "assistant"}, {"content", "Hi there"}},
		{{"role", "user"}, {"content", json::array({
			{{"type", "text"}, {"text", "Look at"}},
			{{"type", "image_url"}, {"image_url", {{"url", "https://x/y.png"}}}}
		})}}
	});
	CHECK(messagesToContent(messages) ==
		  "System: Be brief.\nUser: Hello\nAssistant: Hi there\nUser: Look at [Non-text content]");
}

DROGON_TEST(Completion_MessagesRejectMalformed)
{
	CHECK_THROWS_AS(messagesToContent(json::array()), std::invalid_argument);
	CHECK_THROWS_AS(messagesToContent(json{{"role", "user"}}), std::invalid_argument);
	CHECK_THROWS_AS(messagesToContent(json::array({{{"content", "x"}}})), std::invalid_argument);
	CHECK_THROWS_AS(messagesToContent(json::array({{{"role", "tool"}, {"content", "x"}}})), std::invalid_argument);
}

DROGON_TEST(Completion_RequestOptionDefaults)
{
	auto options = requestOptionsFor(json::object(), "dev-model");
	CHECK(options.model.value_or("") == "dev-model");
	CHECK(options.searchMode.value_or("") == "web");
	CHECK(options.isExpert.has_value());
	CHECK(!options.isExpert.value_or(true));
	CHECK(options.language.value_or("") == "en");
	CHECK(!options.threadId);
	CHECK(!options.sid);
}

DROGON_TEST(Completion_RequestOptionOverrides)
{
	json body{{"x_dev", {{"threadId", "t-7"}, {"searchMode", "chat"}, {"isExpert", true}, {"programmingLanguage", "rust"}}}};
	auto options = requestOptionsFor(body, "m");
	CHECK(options.threadId.value_or("") == "t-7");
	CHECK(options.searchMode.value_or("") == "chat");
	CHECK(options.isExpert.value_or(false));
	CHECK(options.programmingLanguage.value_or("") == "rust");
	CHECK(options.language.value_or("") == "en");

	CHECK_THROWS_AS(requestOptionsFor(json{{"x_dev", "nope"}}, "m"), std::invalid_argument);
	CHECK_THROWS_AS(requestOptionsFor(json{{"x_dev", {{"isExpert", "yes"}}}}, "m"), std::invalid_argument);
}

DROGON_TEST(Completion_SseFrame)
{
	ChunkFactory chunks("chatcmpl-1", "m", [] { return int64_t{5}; });
	std::string frame = sseFrame(chunks.content("hi"));
	REQUIRE(frame.rfind("data: ", 0) == 0);
	REQUIRE(frame.size() > 8);
	CHECK(frame.substr(frame.size() - 2) == "\n\n");
	json parsed = json::parse(frame.substr(6, frame.size() - 8));
	CHECK(parsed["choices"][0]["delta"]["content"] == "hi");
	CHECK(std::string(kSseDone) == "data: [DONE]\n\n");
}

DROGON_TEST(Completion_AggregatesChunks)
{
	ChunkFactory chunks("chatcmpl-1", "dev-model", [] { return int64_t{1700000000}; });
	CompletionAggregator aggregator("chatcmpl-1", "dev-model");
	aggregator.add(chunks.content("Hello"));
	aggregator.add(chunks.content(", world"));
	aggregator.add(chunks.finish());

	Accumulator acc;
	acc.text = "Hello, world";
	acc.threadId = "t-1";
	acc.relatedQuestions = {"Q1"};
	acc.isFinished = true;

	json out = aggregator.result(acc);
	CHECK(out["id"] == "chatcmpl-1");
	CHECK(out["object"] == "chat.completion");
	CHECK(out["created"] == 1700000000);
	CHECK(out["model"] == "dev-model");
	CHECK(out["choices"][0]["message"]["role"] == "assistant");
	CHECK(out["choices"][0]["message"]["content"] == "Hello, world");
	CHECK(out["choices"][0]["finish_reason"] == "stop");
	CHECK(out["usage"]["total_tokens"] == 0);
	CHECK(out["x_dev"]["threadId"] == "t-1");
	CHECK(out["x_dev"]["relatedQuestions"] == json::array({"Q1"}));
}
