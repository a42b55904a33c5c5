#include "utf8.hpp"

namespace devproxy {

namespace {

// Expected length of a sequence from its lead byte, 0 if it cannot start one.
static size_t sequenceLength(unsigned char lead) {
	if (lead < 0x80) return 1;
	if (lead >= 0xC2 && lead <= 0xDF) return 2;
	if (lead >= 0xE0 && lead <= 0xEF) return 3;
	if (lead >= 0xF0 && lead <= 0xF4) return 4;
	return 0;
}

static bool isContinuation(unsigned char c) {
	return (c & 0xC0) == 0x80;
}

// Second-byte range check for the leads that restrict it (overlongs,
// surrogates, > U+10FFFF).
static bool secondByteOk(unsigned char lead, unsigned char second) {
	if (lead == 0xE0) return second >= 0xA0 && second <= 0xBF;
	if (lead == 0xED) return second >= 0x80 && second <= 0x9F;
	if (lead == 0xF0) return second >= 0x90 && second <= 0xBF;
	if (lead == 0xF4) return second >= 0x80 && second <= 0x8F;
	return isContinuation(second);
}

static std::string describe(size_t offset) {
	return "invalid utf-8 sequence at byte " + std::to_string(offset);
}

} // namespace

bool isValidUtf8(const std::string &bytes, std::string *error) {
	size_t i = 0;
	const size_t n = bytes.size();
	while (i < n) {
		unsigned char lead = static_cast<unsigned char>(bytes[i]);
		size_t len = sequenceLength(lead);
		if (len == 0) {
			if (error) *error = describe(i);
			return false;
		}
		if (len == 1) { i++; continue; }
		if (i + len > n) {
			if (error) *error = "incomplete utf-8 sequence at byte " + std::to_string(i);
			return false;
		}
		if (!secondByteOk(lead, static_cast<unsigned char>(bytes[i + 1]))) {
			if (error) *error = describe(i);
			return false;
		}
		for (size_t k = 2; k < len; k++) {
			if (!isContinuation(static_cast<unsigned char>(bytes[i + k]))) {
				if (error) *error = describe(i);
				return false;
			}
		}
		i += len;
	}
	return true;
}

size_t incompleteUtf8Tail(const std::string &bytes) {
	const size_t n = bytes.size();
	// A lead byte can sit at most 3 bytes back from the end of a partial tail.
	for (size_t back = 1; back <= 3 && back <= n; back++) {
		unsigned char c = static_cast<unsigned char>(bytes[n - back]);
		if (isContinuation(c)) continue;
		size_t len = sequenceLength(c);
		if (len <= back) return 0;
		if (back >= 2 && !secondByteOk(c, static_cast<unsigned char>(bytes[n - back + 1]))) return 0;
		return back;
	}
	return 0;
}

bool Utf8Decoder::decode(const std::string &chunk, std::string &out, std::string *error) {
	std::string bytes;
	if (pending_.empty()) {
		bytes = chunk;
	} else {
		bytes = pending_ + chunk;
		pending_.clear();
	}
	size_t tail = carryPartial_ ? incompleteUtf8Tail(bytes) : 0;
	if (tail > 0) {
		pending_ = bytes.substr(bytes.size() - tail);
		bytes.resize(bytes.size() - tail);
	}
	if (!isValidUtf8(bytes, error)) {
		pending_.clear();
		return false;
	}
	out.append(bytes);
	return true;
}

bool Utf8Decoder::finish(std::string *error) {
	if (pending_.empty()) return true;
	if (error) *error = "incomplete utf-8 sequence at end of stream (" + std::to_string(pending_.size()) + " bytes)";
	pending_.clear();
	return false;
}

} // namespace devproxy
