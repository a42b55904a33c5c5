#include "stream_transducer.hpp"

#include <algorithm>

#include <trantor/utils/Logger.h>

namespace devproxy {

StreamTransducer::StreamTransducer(std::unique_ptr<ByteSource> source,
								   std::string requestId,
								   std::string model,
								   TransducerOptions options)
	: source_(std::move(source)),
	  chunks_(std::move(requestId), std::move(model), std::move(options.clock)),
	  decoder_(options.utf8Mode == Utf8Mode::Incremental) {}

std::optional<ChatCompletionChunk> StreamTransducer::next() {
	while (state_ != State::Terminated) {
		if (auto chunk = drainLines()) return chunk;
		if (state_ == State::Terminated) break;

		ReadResult read = source_->next();
		switch (read.status) {
		case ReadStatus::Data: {
			LOG_TRACE << "received " << read.bytes.size() << " bytes for " << chunks_.requestId();
			std::string error;
			if (!decoder_.decode(read.bytes, buffer_, &error)) {
				LOG_ERROR << "failed to decode upstream bytes for " << chunks_.requestId() << ": " << error;
				return fail("UTF-8 decode error: " + error);
			}
			break;
		}
		case ReadStatus::Error:
			LOG_ERROR << "upstream read failed for " << chunks_.requestId() << ": " << read.error;
			return fail("Stream error: " + read.error);
		case ReadStatus::End:
			return finalize();
		}
	}
	return std::nullopt;
}

std::optional<ChatCompletionChunk> StreamTransducer::drainLines() {
	std::optional<ChatCompletionChunk> out;
	size_t pos = 0;
	while (!out) {
		auto nl = buffer_.find('\n', std::max(pos, scanned_));
		if (nl == std::string::npos) {
			scanned_ = buffer_.size();
			break;
		}
		std::string line = buffer_.substr(pos, nl - pos);
		pos = nl + 1;
		if (!line.empty() && line.back() == '\r') line.pop_back();

		auto event = events_.feedLine(line);
		if (!event) continue;
		state_ = State::Dispatching;
		out = applyDevEvent(acc_, *event, chunks_);
		state_ = acc_.isFinished ? State::Terminated : State::Reading;
		if (state_ == State::Terminated) break;
	}
	if (state_ == State::Terminated) {
		buffer_.clear();
		scanned_ = 0;
		source_.reset();
	} else {
		buffer_.erase(0, pos);
		scanned_ = scanned_ > pos ? scanned_ - pos : 0;
	}
	return out;
}

std::optional<ChatCompletionChunk> StreamTransducer::finalize() {
	state_ = State::Finalizing;
	LOG_TRACE << "upstream body ended for " << chunks_.requestId() << ", flushing " << buffer_.size() << " buffered bytes";

	std::string error;
	if (!decoder_.finish(&error)) {
		LOG_ERROR << "truncated utf-8 at end of stream for " << chunks_.requestId();
		return fail("UTF-8 decode error: " + error);
	}

	// Events completed here only update the accumulator. An upstream error
	// still has to reach the caller, so its chunk becomes the terminal one.
	std::optional<ChatCompletionChunk> terminal;
	auto settle = [this, &terminal](const SseEvent &event) {
		auto chunk = applyDevEvent(acc_, event, chunks_);
		if (!chunk) return;
		if (acc_.isFinished && !terminal) {
			terminal = std::move(chunk);
		} else {
			LOG_DEBUG << "not emitting '" << event.name << "' chunk during finalization";
		}
	};

	if (!buffer_.empty()) {
		std::string line;
		line.swap(buffer_);
		scanned_ = 0;
		if (!line.empty() && line.back() == '\r') line.pop_back();
		if (auto event = events_.feedLine(line)) settle(*event);
	}
	if (auto event = events_.flush()) settle(*event);

	state_ = State::Terminated;
	source_.reset();
	if (terminal) return terminal;
	if (acc_.isFinished) {
		LOG_DEBUG << "stream " << chunks_.requestId() << " already finished, no final chunk";
		return std::nullopt;
	}
	acc_.deriveRelatedQuestions();
	acc_.isFinished = true;
	return chunks_.finish("stop");
}

ChatCompletionChunk StreamTransducer::fail(const std::string &message) {
	state_ = State::Terminated;
	buffer_.clear();
	scanned_ = 0;
	source_.reset();
	if (!acc_.isFinished) {
		acc_.error = message;
		acc_.isFinished = true;
	}
	return chunks_.error(message);
}

} // namespace devproxy
