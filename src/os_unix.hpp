// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <string>
#include <string_view>

#include <unistd.h>

namespace trispin {
namespace log {
class Record;
}

// A Unix error code from errno.
class UnixError {
public:
	explicit UnixError(int errorCode);
	void AddToRecord(log::Record &record) const;

	static UnixError Get();

private:
	int mError;
	std::string mText;
};

// Write all of the data to a file descriptor, retrying short writes and
// writes interrupted by a signal. Returns false on error, with errno set.
bool WriteAll(int fd, std::string_view data);

// Object for closing a file descriptor.
class FileCloser {
public:
	explicit FileCloser(int fd) : mFile{fd} {}
	FileCloser(const FileCloser &) = delete;
	FileCloser &operator=(const FileCloser &) = delete;
	~FileCloser() { ::close(mFile); }

private:
	int mFile;
};

} // namespace trispin
