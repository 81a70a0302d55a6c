// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "text_buffer.hpp"

#include "util.hpp"

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace trispin {

TextBuffer::~TextBuffer() {
	if (mIsDynamic) {
		std::free(mStart);
	}
}

void TextBuffer::Append(const char *str, size_t count) {
	if (count == 0) {
		return;
	}
	Reserve(count);
	std::memcpy(mPos, str, count);
	mPos += count;
}

void TextBuffer::AppendQuoted(std::string_view str) {
	AppendChar('"');
	AppendEscaped(str);
	AppendChar('"');
}

namespace {

const char HexDigit[16] = {'0', '1', '2', '3', '4', '5', '6', '7',
                           '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};

// Return the short escape for an ASCII character, 'x' for a hex escape, or 0
// if the character is copied unchanged.
char EscapeFor(unsigned ch) {
	switch (ch) {
	case '\t':
		return 't';
	case '\n':
		return 'n';
	case '\r':
		return 'r';
	case '"':
		return '"';
	case '\\':
		return '\\';
	default:
		return ch < 32 || ch == 127 ? 'x' : 0;
	}
}

// Return the length of the valid UTF-8 sequence starting at ptr, or 0 if the
// sequence is invalid, overlong, or a surrogate.
std::size_t SequenceLength(const unsigned char *ptr, const unsigned char *end) {
	const unsigned ch = ptr[0];
	std::size_t length;
	unsigned value, minimum;
	if ((ch & 0xe0) == 0xc0) {
		length = 2;
		value = ch & 0x1f;
		minimum = 0x80;
	} else if ((ch & 0xf0) == 0xe0) {
		length = 3;
		value = ch & 0x0f;
		minimum = 0x800;
	} else if ((ch & 0xf8) == 0xf0) {
		length = 4;
		value = ch & 0x07;
		minimum = 0x10000;
	} else {
		return 0;
	}
	if (static_cast<std::size_t>(end - ptr) < length) {
		return 0;
	}
	for (std::size_t i = 1; i < length; i++) {
		if ((ptr[i] & 0xc0) != 0x80) {
			return 0;
		}
		value = (value << 6) | (ptr[i] & 0x3fu);
	}
	if (value < minimum || 0x110000 <= value ||
	    (0xd800 <= value && value < 0xe000)) {
		return 0;
	}
	return length;
}

} // namespace

void TextBuffer::AppendEscaped(std::string_view str) {
	const unsigned char *ptr =
		reinterpret_cast<const unsigned char *>(str.data());
	const unsigned char *end = ptr + str.size();
	while (ptr != end) {
		const unsigned ch = *ptr;
		if (ch < 128) {
			const char escape = EscapeFor(ch);
			if (escape == 0) {
				AppendChar(static_cast<char>(ch));
			} else if (escape != 'x') {
				AppendChar('\\');
				AppendChar(escape);
			} else {
				const char hex[4] = {'\\', 'x', HexDigit[ch >> 4],
				                     HexDigit[ch & 15]};
				Append(hex, sizeof(hex));
			}
			ptr++;
			continue;
		}
		const std::size_t length = SequenceLength(ptr, end);
		if (length == 0) {
			const char hex[4] = {'\\', 'x', HexDigit[ch >> 4],
			                     HexDigit[ch & 15]};
			Append(hex, sizeof(hex));
			ptr++;
			continue;
		}
		Append(reinterpret_cast<const char *>(ptr), length);
		ptr += length;
	}
}

void TextBuffer::AppendNumber(long long value) {
	AppendFunction([value](char *first, char *last) -> char * {
		std::to_chars_result result = std::to_chars(first, last, value);
		return result.ec == std::errc{} ? result.ptr : nullptr;
	});
}

void TextBuffer::AppendNumber(unsigned long long value) {
	AppendFunction([value](char *first, char *last) -> char * {
		std::to_chars_result result = std::to_chars(first, last, value);
		return result.ec == std::errc{} ? result.ptr : nullptr;
	});
}

void TextBuffer::AppendNumber(double value) {
	AppendFunction([value](char *first, char *last) -> char * {
		std::to_chars_result result =
			std::to_chars(first, last, value, std::chars_format::general);
		return result.ec == std::errc{} ? result.ptr : nullptr;
	});
}

void TextBuffer::AppendBool(bool value) {
	if (value) {
		Append("true", 4);
	} else {
		Append("false", 5);
	}
}

void TextBuffer::Grow() {
	std::size_t capacity = mEnd - mStart;
	Reallocate(util::GrowSize(capacity));
}

void TextBuffer::Reserve(std::size_t size) {
	std::size_t capacity = mEnd - mStart;
	std::size_t minimum = (mPos - mStart) + size;
	if (capacity < minimum) {
		Reallocate(util::GrowSizeMinimum(capacity, minimum));
	}
}

void TextBuffer::Reallocate(std::size_t newCapacity) {
	std::ptrdiff_t offset = mPos - mStart;
	char *ptr;
	if (mIsDynamic) {
		ptr = static_cast<char *>(std::realloc(mStart, newCapacity));
		if (ptr == nullptr) {
			std::abort();
		}
	} else {
		ptr = static_cast<char *>(std::malloc(newCapacity));
		if (ptr == nullptr) {
			std::abort();
		}
		if (offset > 0) {
			std::memcpy(ptr, mStart, offset);
		}
	}
	mStart = ptr;
	mPos = ptr + offset;
	mEnd = ptr + newCapacity;
	mIsDynamic = true;
}

} // namespace trispin
