#pragma once

#include <memory>
#include <optional>
#include <string>

#include "chat_chunk.hpp"
#include "dev_events.hpp"
#include "sse_parser.hpp"
#include "utf8.hpp"

namespace devproxy {

enum class ReadStatus { Data, End, Error };

struct ReadResult {
	ReadStatus status{ReadStatus::End};
	std::string bytes;
	std::string error;

	static ReadResult data(std::string b) { return {ReadStatus::Data, std::move(b), ""}; }
	static ReadResult end() { return {ReadStatus::End, "", ""}; }
	static ReadResult failure(std::string message) { return {ReadStatus::Error, "", std::move(message)}; }
};

// Pull side of an upstream response body. next() blocks until bytes, end of
// body, or a transport failure.
class ByteSource {
public:
	virtual ~ByteSource() = default;
	virtual ReadResult next() = 0;
};

enum class Utf8Mode {
	Strict,      // every byte chunk must decode on its own
	Incremental  // partial trailing sequences carry over to the next chunk
};

struct TransducerOptions {
	Utf8Mode utf8Mode{Utf8Mode::Incremental};
	ChunkFactory::Clock clock;
};

// Turns an upstream event-stream body into chat.completion.chunk values.
// Single consumer: call next() until it returns nullopt.
class StreamTransducer {
public:
	enum class State { Reading, Dispatching, Finalizing, Terminated };

	StreamTransducer(std::unique_ptr<ByteSource> source,
					 std::string requestId,
					 std::string model,
					 TransducerOptions options = {});

	std::optional<ChatCompletionChunk> next();

	State state() const { return state_; }
	const Accumulator &accumulator() const { return acc_; }

private:
	std::optional<ChatCompletionChunk> drainLines();
	std::optional<ChatCompletionChunk> finalize();
	ChatCompletionChunk fail(const std::string &message);

	std::unique_ptr<ByteSource> source_;
	ChunkFactory chunks_;
	Utf8Decoder decoder_;
	SseEventAssembler events_;
	Accumulator acc_;
	std::string buffer_;
	// Prefix of buffer_ already searched for a line break.
	size_t scanned_{0};
	State state_{State::Reading};
};

} // namespace devproxy
