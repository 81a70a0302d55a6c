// Copyright 2025 Dietrich Epp <depp@zdome.net>
// Licensed under the Mozilla Public License Version 2.0.
// SPDX-License-Identifier: MPL-2.0
#pragma once

#include <string>
#include <string_view>

namespace trispin {

namespace var {

// Variable traits, which describe operations on variables of the given type.
template <typename T>
struct VarTraits {
	using Storage = T;
	using Value = T;
};

// A string variable is accessed through a string view.
template <typename T>
struct VarTraits<std::basic_string<T>> {
	using Storage = std::basic_string<T>;
	using Value = std::basic_string_view<T>;
};

// Configurable variable.
template <typename T>
class Var {
public:
	using Traits = VarTraits<T>;
	using Storage = typename Traits::Storage;
	using Value = typename Traits::Value;

	explicit Var(Value initial) : mStorage(initial), mInitial(initial) {}

	Value get() const { return mStorage; }
	void set(Value value) { mStorage = value; }

	// Restore the initial value.
	void reset() { mStorage = mInitial; }

private:
	Storage mStorage;
	Storage mInitial;
};

#define DEFVAR(name, type, initial, description) extern Var<type> name;
#include "var_def.hpp"
#undef DEFVAR

// Restore every variable to its initial value.
void ResetAll();

} // namespace var

// Parse the program's command-line arguments. Each argument has the form
// Name=value.
void ParseCommandArguments(int argCount, char **args);

} // namespace trispin
