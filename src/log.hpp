// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

// Structured logging. This is modeled after Go's log/slog package.

#include <concepts>
#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

namespace trispin {
namespace log {

// Log message severity level.
enum class Level {
	Debug,
	Info,
	Warn,
	Error,
};

// A kind of value that can be logged.
enum class Kind {
	Null,
	Int,
	Uint,
	Float,
	Bool,
	String,
};

// A value that can be logged as part of a log statement. String values are
// not copied, and must outlive the record.
class Value {
private:
	struct String {
		const char *ptr;
		size_t size;

		constexpr String() = default;
		constexpr String(std::string_view value)
			: ptr{value.data()}, size{value.size()} {}
		constexpr operator std::string_view() const { return {ptr, size}; }
	};

public:
	// Scalars.
	constexpr Value() : mKind{Kind::Null} {}
	constexpr Value(std::nullptr_t) : mKind{Kind::Null} {}
	constexpr Value(int value) : mKind{Kind::Int} { mData.intValue = value; }
	constexpr Value(unsigned value) : mKind{Kind::Uint} {
		mData.uintValue = value;
	}
	constexpr Value(long value) : mKind{Kind::Int} { mData.intValue = value; }
	constexpr Value(unsigned long value) : mKind{Kind::Uint} {
		mData.uintValue = value;
	}
	constexpr Value(long long value) : mKind{Kind::Int} {
		mData.intValue = value;
	}
	constexpr Value(unsigned long long value) : mKind{Kind::Uint} {
		mData.uintValue = value;
	}
	constexpr Value(float value) : mKind{Kind::Float} {
		mData.floatValue = value;
	}
	constexpr Value(double value) : mKind{Kind::Float} {
		mData.floatValue = value;
	}
	constexpr Value(bool value) : mKind{Kind::Bool} { mData.boolValue = value; }

	// Strings.
	constexpr Value(const char *value) : mKind{Kind::String} {
		if (value == nullptr) {
			mKind = Kind::Null;
		} else {
			mData.stringValue = std::string_view{value};
		}
	}
	template <
		typename SV,
		std::enable_if_t<
			std::conjunction_v<
				std::is_convertible<const SV &, std::string_view>,
				std::negation<std::is_convertible<const SV &, const char *>>>,
			bool> = true>
	constexpr Value(const SV &value) : mKind{Kind::String} {
		std::string_view view = value;
		mData.stringValue = view;
	}

	// Getters.
	Kind ValueKind() const { return mKind; }
	long long IntValue() const {
		return mKind == Kind::Int ? mData.intValue : 0ll;
	}
	unsigned long long UintValue() const {
		return mKind == Kind::Uint ? mData.uintValue : 0ull;
	}
	double FloatValue() const {
		return mKind == Kind::Float ? mData.floatValue : 0.0;
	}
	bool BoolValue() const {
		return mKind == Kind::Bool ? mData.boolValue : false;
	}
	std::string_view StringValue() const {
		return mKind == Kind::String ? std::string_view(mData.stringValue)
		                             : std::string_view{};
	}

private:
	Kind mKind;
	union {
		long long intValue;
		unsigned long long uintValue;
		double floatValue;
		bool boolValue;
		String stringValue;
	} mData;
};

class Record;

template <typename T>
concept AttributeProvider = requires(const T &t, Record &r) {
	{ t.AddToRecord(r) };
};

// A key-value pair that can be part of a log message.
class Attr {
public:
	constexpr Attr() = default;
	constexpr Attr(std::string_view name, Value value)
		: mName{name}, mValue{value} {}

	std::string_view name() const { return mName; }
	const Value &value() const { return mValue; }

	inline void AddToRecord(Record &record) const;

private:
	std::string_view mName;
	Value mValue;
};

// Initialize the logging system. Reads the Verbose variable, so this should
// be called after the command line is parsed.
void Init();

// A location in the source code.
struct Location {
	std::string_view file;
	int line;
	std::string_view function;

	static const Location Zero;

	bool is_empty() const { return file.empty(); }
};

// A record of a log message.
class Record {
public:
	Record(Level level, Location location, std::string_view message)
		: mLevel{level}, mLocation{location}, mMessage{message} {}

	Record(Level level, Location location, std::string_view message,
	       const AttributeProvider auto &...attrs)
		: mLevel{level}, mLocation{location}, mMessage{message} {
		// Note: Above, the attrs parameter is const auto& for lifetime
		// extension, since some AttributeProvider instances own data.
		((void)attrs.AddToRecord(*this), ...);
	}

	static Record CheckFailure(Location location, std::string_view condition,
	                           std::same_as<Attr> auto... attrs) {
		return Record(Level::Error, location, "Check failed.",
		              Attr{"condition", condition}, attrs...);
	}

	Level level() const { return mLevel; }
	const Location &location() const { return mLocation; }
	std::string_view message() const { return mMessage; }
	std::span<const Attr> attributes() const { return mAttributes; }

	// Add an attribute to the record.
	void Add(std::string_view name, Value value) {
		mAttributes.emplace_back(name, value);
	}

	// Log this message.
	void Log() const;

	// Show this message and exit the program.
	[[noreturn]]
	void Fail() const;

private:
	Level mLevel;
	Location mLocation;
	std::string_view mMessage;
	std::vector<Attr> mAttributes;
};

inline void Attr::AddToRecord(Record &record) const {
	record.Add(mName, mValue);
}

} // namespace log
} // namespace trispin

#define LOG_LOCATION \
	::trispin::log::Location { \
		__FILE__, __LINE__, __func__ \
	}

/// <summary>
/// Write a message to the log. Takes a message and an optional list of
/// attributes, such as <see cref="trispin::log::Attr"/>.
/// </summary>
/// <example>
/// Log a debug message with the attribute <c>x=5</c>.
/// <code>
/// int x = 5;
/// LOG(Info, "Message.", Attr("x", x));
/// </code>
/// </example>
#define LOG(level, ...) \
	::trispin::log::Record{::trispin::log::Level::level, LOG_LOCATION, \
	                       __VA_ARGS__} \
		.Log()

/// <summary>
/// Check that a condition is true. If not, show an error message and exit the
/// program. This behaves like assert(), but is not disabled in release builds.
/// </summary>
#define CHECK(condition) \
	(void)((!!(condition)) || \
	       (::trispin::log::Record::CheckFailure(LOG_LOCATION, #condition) \
	            .Fail(), \
	        0))

/// <summary>
/// Show an error message and exit the program.
/// </summary>
/// <example>
/// Exit the program with a message about a missing file.
/// <code>
/// std::string filename = "my_file.txt";
/// FAIL("File is missing.", Attr("filename", filename));
/// </code>
/// </example>
#define FAIL(...) \
	::trispin::log::Record{::trispin::log::Level::Error, LOG_LOCATION, \
	                       __VA_ARGS__} \
		.Fail()
