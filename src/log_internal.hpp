// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include "text_buffer.hpp"

#include <cstddef>

namespace trispin {
namespace log {

class Record;

// Local buffer size for constructing log messages.
constexpr std::size_t LogBufferSize = 256;

// Options for formatting a record.
struct LineFormat {
	bool useColor;
	bool useEmoji;
};

// Write a record as a single line.
void WriteLine(TextBuffer &buffer, const Record &record, LineFormat format);

// Return true if log output should be colorized with terminal escape
// sequences. Checks $NO_COLOR and $TERM. The isTerminal flag says whether
// the output is a terminal.
bool ShouldEnableColor(bool isTerminal);

// Sink for writing log messages to standard error.
class StderrWriter {
public:
	// Initialize the log destination. Return true if logging is available.
	static bool Init();

	StderrWriter() : mBuffer{mBufferData} {}

	// Write a record to the log.
	void Log(const Record &record);

	// Fail the program with a given error message.
	[[noreturn]]
	void Fail(const Record &record);

private:
	TextBuffer mBuffer;
	char mBufferData[LogBufferSize];
};

using Writer = StderrWriter;

} // namespace log
} // namespace trispin
