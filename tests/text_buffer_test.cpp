// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#include "text_buffer.hpp"

#include <gtest/gtest.h>

#include <string>

namespace trispin {
namespace {

std::string Escape(std::string_view text) {
	TextBuffer buffer;
	buffer.AppendEscaped(text);
	return std::string{buffer.Contents()};
}

TEST(TextBufferTest, GrowsPastInitialStorage) {
	char storage[4];
	TextBuffer buffer{storage};
	buffer.Append("uniform mat4 Matrix;");
	buffer.AppendChar(' ');
	buffer.AppendNumber(36);
	EXPECT_EQ(buffer.Contents(), "uniform mat4 Matrix; 36");
	buffer.Clear();
	EXPECT_EQ(buffer.Size(), 0u);
	buffer.Append("x");
	EXPECT_EQ(buffer.Contents(), "x");
}

TEST(TextBufferTest, Numbers) {
	TextBuffer buffer;
	buffer.AppendNumber(-3);
	buffer.AppendChar(' ');
	buffer.AppendNumber(36u);
	buffer.AppendChar(' ');
	buffer.AppendNumber(0.25);
	buffer.AppendChar(' ');
	buffer.AppendBool(false);
	EXPECT_EQ(buffer.Contents(), "-3 36 0.25 false");
}

TEST(TextBufferTest, EscapesControlCharacters) {
	EXPECT_EQ(Escape("a\tb\r\n"), "a\\tb\\r\\n");
	EXPECT_EQ(Escape(std::string_view{"\x01\x7f", 2}), "\\x01\\x7f");
	EXPECT_EQ(Escape("say \"hi\" \\"), "say \\\"hi\\\" \\\\");
}

TEST(TextBufferTest, PassesValidUtf8) {
	EXPECT_EQ(Escape("caf\xc3\xa9"), "caf\xc3\xa9");
	EXPECT_EQ(Escape("\xe2\x9a\xa0"), "\xe2\x9a\xa0");
	EXPECT_EQ(Escape("\xf0\x9f\x9b\x91"), "\xf0\x9f\x9b\x91");
}

TEST(TextBufferTest, EscapesInvalidUtf8) {
	// Truncated, overlong, and surrogate sequences.
	EXPECT_EQ(Escape("\xc3"), "\\xc3");
	EXPECT_EQ(Escape("\xc0\xaf"), "\\xc0\\xaf");
	EXPECT_EQ(Escape("\xed\xa0\x80"), "\\xed\\xa0\\x80");
	EXPECT_EQ(Escape("\xff"), "\\xff");
}

TEST(TextBufferTest, Quoted) {
	TextBuffer buffer;
	buffer.AppendQuoted("a b");
	EXPECT_EQ(buffer.Contents(), "\"a b\"");
}

} // namespace
} // namespace trispin
