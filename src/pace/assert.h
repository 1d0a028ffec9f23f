// Copyright (c) Maia

#pragma once

#include <source_location>
#include <string_view>

namespace pace {

/// \brief Checks an internal invariant of the coordination primitives.
/// \details A failed check is logged at error level with the caller location,
/// the default logger is flushed, and libassert reports and aborts.
/// Caller input never goes through here; argument contract violations are
/// reported through std::expected or exceptions.
void Assert(bool invariant,
            std::string_view what,
            std::source_location sloc = std::source_location::current());

}  // namespace pace
