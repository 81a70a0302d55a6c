// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "os_file.hpp"

#include "log.hpp"
#include "os_unix.hpp"
#include "var.hpp"

#include <errno.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace trispin {

namespace {

// Limit on maximum file size when reading files into memory. Shaders are
// tiny, anything this big is a mistake.
constexpr std::size_t MaxFileSize = 1024 * 1024;

} // namespace

void AppendPath(std::string *path, std::string_view view) {
	if (path->empty()) {
		FAIL("Path is empty.");
	}
	if (view.empty() || view.front() == '/') {
		FAIL("Invalid relative path.", log::Attr{"path", view});
	}
	if (path->back() != '/') {
		path->push_back('/');
	}
	path->append(view);
}

bool ReadFile(std::vector<unsigned char> *data, std::string_view fileName) {
	if (var::ProjectPath.get().empty()) {
		FAIL("Project path is not set.");
	}
	std::string path{var::ProjectPath.get()};
	AppendPath(&path, fileName);
	int fd;
	do {
		fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
	} while (fd == -1 && errno == EINTR);
	if (fd == -1) {
		LOG(Error, "Could not open file.", log::Attr{"file", path},
		    UnixError::Get());
		return false;
	}
	FileCloser closer{fd};
	struct stat st;
	if (::fstat(fd, &st) != 0) {
		LOG(Error, "Could not get file information.", log::Attr{"file", path},
		    UnixError::Get());
		return false;
	}
	const off_t osize = st.st_size;
	if (osize > static_cast<off_t>(MaxFileSize)) {
		LOG(Error, "File is too large.", log::Attr{"file", path},
		    log::Attr{"size", osize}, log::Attr{"maxSize", MaxFileSize});
		return false;
	}
	const std::size_t size = static_cast<std::size_t>(osize);
	data->resize(size);
	for (std::size_t pos = 0; pos < size;) {
		ssize_t amt = ::read(fd, data->data() + pos, size - pos);
		if (amt < 0) {
			if (errno == EINTR) {
				continue;
			}
			LOG(Error, "Could not read file.", log::Attr{"file", path},
			    UnixError::Get());
			return false;
		}
		if (amt == 0) {
			LOG(Error, "File changed while reading.", log::Attr{"file", path});
			return false;
		}
		pos += static_cast<std::size_t>(amt);
	}
	return true;
}

} // namespace trispin
