// Copyright (c) Maia

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace pace::console {

/// \brief Runs the demo session.
struct CommandRun {
  std::optional<std::string> config_path;
  int64_t item_count{1000};
  int64_t distinct_rows{250};
  double scroll_offset{0.0};
  int64_t fetch_latency_ms{2};
  std::optional<std::string> log_level;
};

/// \brief Prints the effective configuration as JSON and exits.
struct CommandPrintConfig {
  std::optional<std::string> config_path;
};

/// \brief Help was requested; `text` is the usage message.
struct CommandHelp {
  std::string text;
};

using Command = std::variant<CommandRun, CommandPrintConfig, CommandHelp>;

}  // namespace pace::console
