#include "gateway.hpp"

#include <regex>
#include <stdexcept>
#include <thread>

#include <drogon/drogon.h>
#include <json/json.h>
#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>

#include "completion.hpp"

namespace devproxy {

namespace {

json fromJsoncpp(const Json::Value &v) {
	switch (v.type()) {
	case Json::nullValue: return nullptr;
	case Json::intValue: return (int64_t)v.asInt64();
	case Json::uintValue: return (uint64_t)v.asUInt64();
	case Json::realValue: return v.asDouble();
	case Json::stringValue: return v.asString();
	case Json::booleanValue: return v.asBool();
	case Json::arrayValue: {
		json out = json::array();
		for (const auto &item : v) out.push_back(fromJsoncpp(item));
		return out;
	}
	case Json::objectValue: {
		json out = json::object();
		for (auto it = v.begin(); it != v.end(); ++it) out[it.name()] = fromJsoncpp(*it);
		return out;
	}
	}
	return nullptr;
}

Json::Value toJsoncpp(const json &v) {
	if (v.is_boolean()) return Json::Value(v.get<bool>());
	if (v.is_number_integer()) return Json::Value((Json::Int64)v.get<long long>());
	if (v.is_number_unsigned()) return Json::Value((Json::UInt64)v.get<unsigned long long>());
	if (v.is_number_float()) return Json::Value(v.get<double>());
	if (v.is_string()) return Json::Value(v.get<std::string>());
	if (v.is_array()) {
		Json::Value arr(Json::arrayValue);
		for (const auto &item : v) arr.append(toJsoncpp(item));
		return arr;
	}
	if (v.is_object()) {
		Json::Value obj(Json::objectValue);
		for (auto it = v.begin(); it != v.end(); ++it) obj[it.key()] = toJsoncpp(it.value());
		return obj;
	}
	return Json::Value();
}

} // namespace

GatewayServer::GatewayServer(GatewayConfig config, std::shared_ptr<Signer> signer)
	: config_(std::move(config)), signer_(std::move(signer)) {
	client_ = std::make_shared<DevApiClient>(config_.upstream, signer_);

	if (config_.upstream.apiEndpoint.empty()) LOG_WARN << "API_ENDPOINT is not set";
	if (config_.upstream.deviceId.empty()) LOG_WARN << "DEVICE_ID is not set";
	if (config_.upstream.sid.empty()) LOG_WARN << "SID is not set";
	if (config_.jwtSecret.empty()) LOG_INFO << "bearer auth disabled";
	setupRoutes();
}

void GatewayServer::listen() {
	LOG_INFO << "listening on " << config_.host << ":" << config_.port;
	drogon::app().setThreadNum(config_.threads);
	drogon::app().addListener(config_.host, (uint16_t)config_.port);
	drogon::app().run();
}

json GatewayServer::parseRequestBody(const drogon::HttpRequestPtr &req, bool &ok) const {
	ok = true;
	auto payload = req->getJsonObject();
	if (payload) return fromJsoncpp(*payload);
	if (req->getBody().empty()) return json::object();
	ok = false;
	return json();
}

bool GatewayServer::authOK(const drogon::HttpRequestPtr &req, std::string &reason) const {
	if (config_.jwtSecret.empty()) return true;
	if (req->path().rfind("/v1/", 0) != 0) return true;
	auto auth = req->getHeader("authorization");
	std::string token;
	std::regex re("^Bearer\\s+(.+)$", std::regex::icase);
	std::smatch m;
	if (std::regex_match(auth, m, re) && m.size() >= 2) token = m[1].str();
	if (token.empty()) {
		reason = "missing bearer token";
		return false;
	}
	try {
		auto dec = jwt::decode<jwt::traits::nlohmann_json>(token);
		jwt::verify<jwt::traits::nlohmann_json>()
			.allow_algorithm(jwt::algorithm::hs256{config_.jwtSecret})
			.verify(dec);
		return true;
	} catch (const std::exception &e) {
		reason = e.what();
		return false;
	}
}

void GatewayServer::respondJson(const ResponseCallback &cb, const json &j, drogon::HttpStatusCode code) const {
	auto resp = drogon::HttpResponse::newHttpJsonResponse(toJsoncpp(j));
	resp->setStatusCode(code);
	cb(resp);
}

void GatewayServer::respondError(const ResponseCallback &cb, drogon::HttpStatusCode code, const std::string &type, const std::string &message) const {
	respondJson(cb, json{{"error", {{"message", message}, {"type", type}}}}, code);
}

void GatewayServer::respondFailure(const ResponseCallback &cb, const std::exception &e) const {
	if (dynamic_cast<const std::invalid_argument *>(&e)) {
		respondError(cb, drogon::k400BadRequest, "invalid_request_error", e.what());
	} else if (auto *signError = dynamic_cast<const SignError *>(&e)) {
		LOG_ERROR << "signing failed (" << SignError::kindName(signError->kind()) << "): " << e.what();
		respondError(cb, drogon::k502BadGateway, "signing_error", e.what());
	} else {
		LOG_ERROR << "chat completion failed: " << e.what();
		respondError(cb, drogon::k500InternalServerError, "server_error", e.what());
	}
}

void GatewayServer::setupRoutes() {
	drogon::app().registerHandler("/healthz", [this](const drogon::HttpRequestPtr &, ResponseCallback &&cb) {
		respondJson(cb, json{{"ok", true}, {"signerReady", signer_ && signer_->ready()}});
	}, {drogon::Get});

	drogon::app().registerHandler("/v1/chat/completions", [this](const drogon::HttpRequestPtr &req, ResponseCallback &&cb) {
		std::string reason;
		if (!authOK(req, reason)) {
			LOG_WARN << "rejected request to " << req->path() << ": " << reason;
			return respondError(cb, drogon::k401Unauthorized, "authentication_error", reason);
		}
		try {
			handleChatCompletions(req, std::move(cb));
		} catch (const std::exception &e) {
			respondFailure(cb, e);
		}
	}, {drogon::Post});
}

void GatewayServer::handleChatCompletions(const drogon::HttpRequestPtr &req, ResponseCallback &&cb) {
	bool ok = false;
	json body = parseRequestBody(req, ok);
	if (!ok || !body.is_object()) throw std::invalid_argument("request body must be a JSON object");

	std::string model = config_.defaultModel;
	if (body.contains("model") && body["model"].is_string() && !body["model"].get<std::string>().empty()) {
		model = body["model"].get<std::string>();
	}
	bool stream = body.contains("stream") && body["stream"].is_boolean() && body["stream"].get<bool>();
	std::string content = messagesToContent(body.contains("messages") ? body["messages"] : json());
	DevRequestOptions options = requestOptionsFor(body, model);
	std::string id = "chatcmpl-" + generateUuidV4();
	LOG_INFO << "chat completion " << id << " model=" << model << " stream=" << (stream ? "true" : "false");

	// Signing can load the module or wait on the signer lock, so it runs
	// on the worker rather than the event loop.
	std::thread([this, content, options, id, model, stream, cb = std::move(cb)]() {
		std::shared_ptr<StreamTransducer> transducer;
		try {
			transducer = std::make_shared<StreamTransducer>(client_->openStream(content, options), id, model);
		} catch (const std::exception &e) {
			respondFailure(cb, e);
			return;
		}
		if (stream) {
			streamCompletion(transducer, cb);
		} else {
			aggregateCompletion(*transducer, id, model, cb);
		}
	}).detach();
}

void GatewayServer::streamCompletion(const std::shared_ptr<StreamTransducer> &transducer, const ResponseCallback &cb) {
	auto resp = drogon::HttpResponse::newAsyncStreamResponse([transducer](drogon::ResponseStreamPtr stream) {
		std::thread([transducer, stream = std::move(stream)]() mutable {
			try {
				while (auto chunk = transducer->next()) {
					if (!stream->send(sseFrame(*chunk))) {
						LOG_INFO << "client went away, dropping stream";
						stream->close();
						return;
					}
				}
				stream->send(kSseDone);
			} catch (const std::exception &e) {
				LOG_ERROR << "stream worker failed: " << e.what();
			}
			stream->close();
		}).detach();
	});
	resp->setContentTypeString("text/event-stream");
	resp->addHeader("Cache-Control", "no-cache");
	resp->addHeader("X-Accel-Buffering", "no");
	cb(resp);
}

void GatewayServer::aggregateCompletion(StreamTransducer &transducer, const std::string &id,
										const std::string &model, const ResponseCallback &cb) {
	try {
		CompletionAggregator aggregator(id, model);
		while (auto chunk = transducer.next()) aggregator.add(*chunk);
		const Accumulator &acc = transducer.accumulator();
		if (acc.error) {
			respondError(cb, drogon::k502BadGateway, "upstream_error", *acc.error);
			return;
		}
		respondJson(cb, aggregator.result(acc));
	} catch (const std::exception &e) {
		LOG_ERROR << "completion worker failed: " << e.what();
		respondError(cb, drogon::k500InternalServerError, "server_error", e.what());
	}
}

} // namespace devproxy
