#include "dev_client.hpp"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

#include <trantor/utils/Logger.h>

#include "chat_chunk.hpp"

namespace devproxy {

namespace {

static void requireHeaderValue(const std::string &name, const std::string &value) {
	if (value.find_first_of("\r\n") != std::string::npos) {
		throw std::invalid_argument("header '" + name + "' contains a line break");
	}
}

} // namespace

std::optional<std::string> BuiltRequest::header(const std::string &name) const {
	for (const auto &h : headers) {
		if (h.first == name) return h.second;
	}
	return std::nullopt;
}

std::string generateUuidV4() {
	std::random_device rd;
	std::uniform_int_distribution<int> dist(0, 255);
	unsigned char bytes[16];
	for (auto &b : bytes) b = static_cast<unsigned char>(dist(rd));
	bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
	bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

	std::ostringstream oss;
	oss << std::hex << std::setfill('0');
	for (int i = 0; i < 16; i++) {
		if (i == 4 || i == 6 || i == 8 || i == 10) oss << '-';
		oss << std::setw(2) << static_cast<int>(bytes[i]);
	}
	return oss.str();
}

json buildRequestBody(const std::string &content, const DevRequestOptions &options) {
	json extra = json::object();
	if (options.searchMode) extra["searchMode"] = *options.searchMode;
	if (options.model) extra["model"] = *options.model;
	if (options.isExpert) extra["isExpert"] = *options.isExpert;
	extra["pluginFor"] = "vscode";
	if (options.pluginAction) extra["pluginAction"] = *options.pluginAction;
	if (options.language) extra["language"] = *options.language;
	if (options.programmingLanguage) extra["programmingLanguage"] = *options.programmingLanguage;

	json body{{"content", content}};
	if (options.threadId) body["threadId"] = *options.threadId;
	body["extra"] = extra;
	return body;
}

DevApiClient::DevApiClient(DevClientConfig config, std::shared_ptr<Signer> signer)
	: config_(std::move(config)), signer_(std::move(signer)) {
	LOG_INFO << "dev api client: endpoint=" << config_.apiEndpoint << " device=" << config_.deviceId << " os=" << config_.osType;
}

BuiltRequest DevApiClient::buildRequest(const std::string &content, const DevRequestOptions &options) const {
	return buildRequest(content, options, generateUuidV4(), std::to_string(unixSeconds()));
}

BuiltRequest DevApiClient::buildRequest(const std::string &content,
										const DevRequestOptions &options,
										const std::string &nonce,
										const std::string &timestamp) const {
	if (!signer_) throw std::logic_error("dev api client has no signer");
	LOG_DEBUG << "signing request nonce=" << nonce << " timestamp=" << timestamp << " content_len=" << content.size();
	std::string signature = signer_->sign(nonce, timestamp, config_.deviceId, content);

	BuiltRequest req;
	req.url = config_.apiEndpoint;
	req.headers = {
		{"Content-Type", "application/json"},
		{"device-id", config_.deviceId},
		{"os-type", config_.osType},
		{"nonce", nonce},
		{"timestamp", timestamp},
		{"sign", signature},
		{"sid", options.sid.value_or(config_.sid)}
	};
	for (const auto &h : req.headers) requireHeaderValue(h.first, h.second);
	req.body = buildRequestBody(content, options).dump();
	LOG_TRACE << "request body: " << req.body;
	return req;
}

std::unique_ptr<ByteSource> DevApiClient::openStream(const std::string &content, const DevRequestOptions &options) const {
	BuiltRequest req = buildRequest(content, options);
	LOG_DEBUG << "opening upstream stream to " << req.url;
	return std::make_unique<CurlByteSource>(req, config_.connectTimeoutMs, config_.idleTimeoutMs);
}

CurlByteSource::CurlByteSource(const BuiltRequest &request, long connectTimeoutMs, long idleTimeoutMs) : body_(request.body) {
	easy_ = curl_easy_init();
	multi_ = curl_multi_init();
	if (!easy_ || !multi_) {
		if (easy_) curl_easy_cleanup(easy_);
		if (multi_) curl_multi_cleanup(multi_);
		throw std::runtime_error("failed to initialize libcurl handles");
	}
	for (const auto &h : request.headers) {
		headers_ = curl_slist_append(headers_, (h.first + ": " + h.second).c_str());
	}
	headers_ = curl_slist_append(headers_, "Accept: text/event-stream");

	curl_easy_setopt(easy_, CURLOPT_URL, request.url.c_str());
	curl_easy_setopt(easy_, CURLOPT_POST, 1L);
	curl_easy_setopt(easy_, CURLOPT_POSTFIELDS, body_.c_str());
	curl_easy_setopt(easy_, CURLOPT_POSTFIELDSIZE, static_cast<long>(body_.size()));
	curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, headers_);
	curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, &CurlByteSource::onWrite);
	curl_easy_setopt(easy_, CURLOPT_WRITEDATA, this);
	// Total transfer time is unbounded; only a stall below 1 byte/s for the
	// idle window ends the transfer.
	long idleSeconds = std::max(1L, (idleTimeoutMs + 999) / 1000);
	curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT_MS, connectTimeoutMs);
	curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_LIMIT, 1L);
	curl_easy_setopt(easy_, CURLOPT_LOW_SPEED_TIME, idleSeconds);
	curl_easy_setopt(easy_, CURLOPT_NOSIGNAL, 1L);
	curl_multi_add_handle(multi_, easy_);
}

CurlByteSource::~CurlByteSource() {
	curl_multi_remove_handle(multi_, easy_);
	curl_easy_cleanup(easy_);
	curl_multi_cleanup(multi_);
	curl_slist_free_all(headers_);
}

size_t CurlByteSource::onWrite(char *ptr, size_t size, size_t nmemb, void *userdata) {
	auto *self = static_cast<CurlByteSource *>(userdata);
	size_t total = size * nmemb;
	if (self->status_ == 0) curl_easy_getinfo(self->easy_, CURLINFO_RESPONSE_CODE, &self->status_);
	if (self->status_ >= 200 && self->status_ < 300) {
		self->pending_.append(ptr, total);
	} else {
		self->errorBody_.append(ptr, total);
	}
	return total;
}

ReadResult CurlByteSource::next() {
	if (finished_) return ReadResult::end();
	while (pending_.empty() && !done_) {
		int running = 0;
		CURLMcode mc = curl_multi_perform(multi_, &running);
		if (mc != CURLM_OK) {
			finished_ = true;
			return ReadResult::failure(curl_multi_strerror(mc));
		}
		if (running == 0) {
			int queued = 0;
			while (CURLMsg *msg = curl_multi_info_read(multi_, &queued)) {
				if (msg->msg == CURLMSG_DONE) curlResult_ = msg->data.result;
			}
			done_ = true;
			break;
		}
		if (!pending_.empty()) break;
		mc = curl_multi_poll(multi_, nullptr, 0, 1000, nullptr);
		if (mc != CURLM_OK) {
			finished_ = true;
			return ReadResult::failure(curl_multi_strerror(mc));
		}
	}
	if (!pending_.empty()) {
		std::string out;
		out.swap(pending_);
		return ReadResult::data(std::move(out));
	}
	finished_ = true;
	return completion();
}

ReadResult CurlByteSource::completion() {
	if (curlResult_ != CURLE_OK) return ReadResult::failure(curl_easy_strerror(curlResult_));
	long status = 0;
	curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status);
	if (status < 200 || status >= 300) {
		LOG_ERROR << "dev api returned status " << status;
		return ReadResult::failure("Dev API Error (" + std::to_string(status) + "): " + errorBody_);
	}
	return ReadResult::end();
}

} // namespace devproxy
