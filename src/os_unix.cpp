// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "os_unix.hpp"

#include "log.hpp"

#include <cstring>

#include <errno.h>

namespace trispin {

namespace {

// Get the message for an errno value. Uses the GNU strerror_r, which may
// return a static string instead of filling the buffer.
std::string GetErrorText(int errorCode) {
	char buffer[256];
	buffer[0] = '\0';
#if defined(__GLIBC__) && defined(_GNU_SOURCE)
	const char *text = strerror_r(errorCode, buffer, sizeof(buffer));
	return std::string{text != nullptr ? text : buffer};
#else
	if (strerror_r(errorCode, buffer, sizeof(buffer)) != 0) {
		return std::string{};
	}
	return std::string{buffer};
#endif
}

} // namespace

UnixError::UnixError(int errorCode)
	: mError{errorCode}, mText{GetErrorText(errorCode)} {}

void UnixError::AddToRecord(log::Record &record) const {
	if (mError != 0) {
		record.Add("error", mError);
		if (!mText.empty()) {
			record.Add("description", mText);
		}
	}
}

UnixError UnixError::Get() {
	return UnixError{errno};
}

bool WriteAll(int fd, std::string_view data) {
	const char *ptr = data.data();
	std::size_t remaining = data.size();
	while (remaining > 0) {
		const ssize_t amt = ::write(fd, ptr, remaining);
		if (amt < 0) {
			if (errno == EINTR) {
				continue;
			}
			return false;
		}
		if (amt == 0) {
			errno = EIO;
			return false;
		}
		ptr += amt;
		remaining -= static_cast<std::size_t>(amt);
	}
	return true;
}

} // namespace trispin
