// Copyright (c) Maia

#pragma once

#include <expected>
#include <string>

#include "pace/console/commands.h"

namespace pace::console {

/// \brief Parses a command line without the program name.
/// \return The command, or the error followed by the usage message.
std::expected<Command, std::string> Parse(const std::string& command);

std::expected<Command, std::string> Parse(int argc, const char* const* argv);

}  // namespace pace::console
