#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "stream_transducer.hpp"
#include "wasm_signer.hpp"

namespace devproxy {

using json = nlohmann::json;

struct DevClientConfig {
	std::string apiEndpoint;
	std::string deviceId;
	std::string osType{"3"};
	std::string sid;
	long connectTimeoutMs{10000};
	// Longest gap without any response bytes before the transfer is dropped.
	long idleTimeoutMs{120000};
};

struct DevRequestOptions {
	std::optional<std::string> sid;
	std::optional<std::string> model;
	std::optional<std::string> searchMode;
	std::optional<bool> isExpert;
	std::optional<std::string> language;
	std::optional<std::string> threadId;
	std::optional<std::string> pluginAction;
	std::optional<std::string> programmingLanguage;
};

struct BuiltRequest {
	std::string url;
	std::vector<std::pair<std::string, std::string>> headers;
	std::string body;

	std::optional<std::string> header(const std::string &name) const;
};

std::string generateUuidV4();

json buildRequestBody(const std::string &content, const DevRequestOptions &options);

class DevApiClient {
public:
	DevApiClient(DevClientConfig config, std::shared_ptr<Signer> signer);

	BuiltRequest buildRequest(const std::string &content, const DevRequestOptions &options) const;
	BuiltRequest buildRequest(const std::string &content,
							  const DevRequestOptions &options,
							  const std::string &nonce,
							  const std::string &timestamp) const;

	// Sends the signed request and hands back the response body as a
	// pull-based byte source.
	std::unique_ptr<ByteSource> openStream(const std::string &content, const DevRequestOptions &options) const;

	const DevClientConfig &config() const { return config_; }

private:
	DevClientConfig config_;
	std::shared_ptr<Signer> signer_;
};

// libcurl-backed body reader. The transfer is driven from next(), so bytes
// are only pulled while the consumer asks for them.
class CurlByteSource : public ByteSource {
public:
	CurlByteSource(const BuiltRequest &request, long connectTimeoutMs, long idleTimeoutMs);
	~CurlByteSource() override;

	CurlByteSource(const CurlByteSource &) = delete;
	CurlByteSource &operator=(const CurlByteSource &) = delete;

	ReadResult next() override;

private:
	static size_t onWrite(char *ptr, size_t size, size_t nmemb, void *userdata);
	ReadResult completion();

	CURL *easy_{nullptr};
	CURLM *multi_{nullptr};
	curl_slist *headers_{nullptr};
	std::string body_;
	std::string pending_;
	std::string errorBody_;
	long status_{0};
	bool done_{false};
	bool finished_{false};
	CURLcode curlResult_{CURLE_OK};
};

} // namespace devproxy
