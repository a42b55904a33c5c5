#pragma once

#include <cstddef>
#include <string>

namespace devproxy {

// Returns true when the whole buffer is well-formed UTF-8. On failure, *error
// (if given) describes the first offending byte.
bool isValidUtf8(const std::string &bytes, std::string *error = nullptr);

// Length of an incomplete but so-far valid sequence at the end of the buffer
// (0..3). Bytes before that tail are not inspected.
size_t incompleteUtf8Tail(const std::string &bytes);

// Feeds byte chunks and hands back only complete text. An incomplete
// trailing sequence is held back until the next chunk.
class Utf8Decoder {
public:
	explicit Utf8Decoder(bool carryPartial = true) : carryPartial_(carryPartial) {}

	bool decode(const std::string &chunk, std::string &out, std::string *error = nullptr);
	bool finish(std::string *error = nullptr);
	size_t pending() const { return pending_.size(); }

private:
	bool carryPartial_{true};
	std::string pending_;
};

} // namespace devproxy
