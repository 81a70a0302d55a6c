// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "log_internal.hpp"

#include "log.hpp"
#include "main.hpp"
#include "os_unix.hpp"

#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace trispin {
namespace log {

namespace {

bool IsColorEnabled;

void WriteStderr(const TextBuffer &buffer) {
	// On failure there is nowhere left to report the error.
	static_cast<void>(WriteAll(STDERR_FILENO, buffer.Contents()));
}

} // namespace

bool ShouldEnableColor(bool isTerminal) {
	// If $NO_COLOR is non-empty, no color.
	const char *noColor = std::getenv("NO_COLOR");
	if (noColor != nullptr && *noColor != '\0') {
		return false;
	}

	// If stderr is not a tty, no color.
	if (!isTerminal) {
		return false;
	}

	// Check $TERM.
	const char *term = std::getenv("TERM");
	if (term == nullptr) {
		return false;
	}
	// TERM=dumb used by Xcode.
	if (std::strcmp(term, "dumb") == 0) {
		return false;
	}
	return true;
}

bool StderrWriter::Init() {
	IsColorEnabled = ShouldEnableColor(isatty(STDERR_FILENO) != 0);
	return true;
}

void StderrWriter::Log(const Record &record) {
	mBuffer.Clear();
	WriteLine(mBuffer, record, {IsColorEnabled, IsColorEnabled});
	WriteStderr(mBuffer);
}

[[noreturn]]
void StderrWriter::Fail(const Record &record) {
	mBuffer.Clear();
	WriteLine(mBuffer, record, {IsColorEnabled, IsColorEnabled});
	if (IsColorEnabled) {
		mBuffer.Append("\x1b[31m");
	}
	mBuffer.Append("===== Fatal Error =====");
	if (IsColorEnabled) {
		mBuffer.Append("\x1b[0m");
	}
	mBuffer.AppendChar('\n');
	WriteStderr(mBuffer);
	ExitError();
}

} // namespace log
} // namespace trispin
