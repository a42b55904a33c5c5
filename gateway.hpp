#pragma once

#include <exception>
#include <functional>
#include <memory>
#include <string>

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>

#include "dev_client.hpp"
#include "stream_transducer.hpp"
#include "wasm_signer.hpp"

namespace devproxy {

struct GatewayConfig {
	std::string host{"127.0.0.1"};
	int port{8080};
	int threads{1};
	std::string defaultModel{"unknown-dev-model"};
	// Bearer tokens on /v1/ are only checked when this is set.
	std::string jwtSecret;
	DevClientConfig upstream;
};

// OpenAI-style front end. Handlers are registered with drogon on
// construction; listen() starts serving them.
class GatewayServer {
public:
	using ResponseCallback = std::function<void(const drogon::HttpResponsePtr &)>;

	GatewayServer(GatewayConfig config, std::shared_ptr<Signer> signer);

	GatewayServer(const GatewayServer &) = delete;
	GatewayServer &operator=(const GatewayServer &) = delete;

	void listen();

private:
	json parseRequestBody(const drogon::HttpRequestPtr &req, bool &ok) const;
	bool authOK(const drogon::HttpRequestPtr &req, std::string &reason) const;
	void respondJson(const ResponseCallback &cb, const json &j, drogon::HttpStatusCode code = drogon::k200OK) const;
	void respondError(const ResponseCallback &cb, drogon::HttpStatusCode code, const std::string &type, const std::string &message) const;
	void respondFailure(const ResponseCallback &cb, const std::exception &e) const;

	void setupRoutes();
	void handleChatCompletions(const drogon::HttpRequestPtr &req, ResponseCallback &&cb);
	void streamCompletion(const std::shared_ptr<StreamTransducer> &transducer, const ResponseCallback &cb);
	void aggregateCompletion(StreamTransducer &transducer, const std::string &id, const std::string &model, const ResponseCallback &cb);

	GatewayConfig config_;
	std::shared_ptr<Signer> signer_;
	std::shared_ptr<DevApiClient> client_;
};

} // namespace devproxy
