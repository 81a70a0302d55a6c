// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "os_unix.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <thread>

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/time.h>
#include <unistd.h>

namespace trispin {
namespace {

extern "C" void IgnoreAlarm(int) {}

class WriteAllTest : public ::testing::Test {
protected:
	void SetUp() override {
		ASSERT_EQ(pipe(mPipe), 0);
	}

	void TearDown() override {
		CloseWrite();
		if (mPipe[0] >= 0) {
			close(mPipe[0]);
		}
	}

	void CloseWrite() {
		if (mPipe[1] >= 0) {
			close(mPipe[1]);
			mPipe[1] = -1;
		}
	}

	// Read everything from the pipe until the write end is closed.
	std::string ReadAll() {
		std::string data;
		char buffer[4096];
		for (;;) {
			const ssize_t amt = read(mPipe[0], buffer, sizeof(buffer));
			if (amt < 0 && errno == EINTR) {
				continue;
			}
			if (amt <= 0) {
				return data;
			}
			data.append(buffer, static_cast<std::size_t>(amt));
		}
	}

	int mPipe[2] = {-1, -1};
};

TEST_F(WriteAllTest, WritesEverything) {
	const std::string data(100000, 'x');
	std::string received;
	std::thread reader{[&] { received = ReadAll(); }};
	EXPECT_TRUE(WriteAll(mPipe[1], data));
	CloseWrite();
	reader.join();
	EXPECT_EQ(received, data);
}

TEST_F(WriteAllTest, RetriesInterruptedWrite) {
	// Fill the pipe, so the next write blocks until the reader starts.
	const int flags = fcntl(mPipe[1], F_GETFL);
	ASSERT_EQ(fcntl(mPipe[1], F_SETFL, flags | O_NONBLOCK), 0);
	std::size_t filled = 0;
	const std::string block(4096, 'f');
	for (;;) {
		const ssize_t amt = write(mPipe[1], block.data(), block.size());
		if (amt <= 0) {
			break;
		}
		filled += static_cast<std::size_t>(amt);
	}
	ASSERT_EQ(fcntl(mPipe[1], F_SETFL, flags), 0);

	// Without SA_RESTART, the alarm makes the blocked write fail with EINTR.
	struct sigaction action = {};
	struct sigaction oldAction = {};
	action.sa_handler = IgnoreAlarm;
	sigemptyset(&action.sa_mask);
	ASSERT_EQ(sigaction(SIGALRM, &action, &oldAction), 0);

	// The reader thread starts with SIGALRM blocked, so the alarm is
	// delivered to the writing thread.
	sigset_t alarmSet;
	sigemptyset(&alarmSet);
	sigaddset(&alarmSet, SIGALRM);
	pthread_sigmask(SIG_BLOCK, &alarmSet, nullptr);
	std::string received;
	std::thread reader{[&] {
		usleep(300000);
		received = ReadAll();
	}};
	pthread_sigmask(SIG_UNBLOCK, &alarmSet, nullptr);

	struct itimerval timer = {};
	timer.it_value.tv_usec = 50000;
	ASSERT_EQ(setitimer(ITIMER_REAL, &timer, nullptr), 0);

	constexpr std::string_view line = "INFO  Interrupted.\n";
	const bool ok = WriteAll(mPipe[1], line);
	CloseWrite();
	reader.join();
	sigaction(SIGALRM, &oldAction, nullptr);

	EXPECT_TRUE(ok);
	ASSERT_EQ(received.size(), filled + line.size());
	EXPECT_EQ(received.substr(filled), line);
}

TEST_F(WriteAllTest, ClosedPipeFails) {
	close(mPipe[0]);
	mPipe[0] = -1;
	// Writing to a pipe with no reader raises SIGPIPE unless ignored.
	struct sigaction action = {};
	struct sigaction oldAction = {};
	action.sa_handler = SIG_IGN;
	sigemptyset(&action.sa_mask);
	ASSERT_EQ(sigaction(SIGPIPE, &action, &oldAction), 0);
	const bool ok = WriteAll(mPipe[1], "lost\n");
	const int error = errno;
	sigaction(SIGPIPE, &oldAction, nullptr);
	EXPECT_FALSE(ok);
	EXPECT_EQ(error, EPIPE);
}

} // namespace
} // namespace trispin
