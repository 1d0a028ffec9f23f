// Copyright (c) Maia

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <expected>
#include <optional>
#include <string>
#include <variant>

#include <fmt/core.h>

#include "pace/application/coordination_config.h"
#include "pace/application/demo_session.h"
#include "pace/console/console.h"
#include "pace/logging.h"

namespace pace {

namespace {

std::expected<CoordinationConfig, std::string> ResolveConfig(
    const std::optional<std::string>& path) {
  if (!path) {
    return CoordinationConfig{};
  }
  return LoadConfig(*path);
}

int RunCommand(const console::CommandHelp& command) {
  fmt::print("{}", command.text);
  return EXIT_SUCCESS;
}

int RunCommand(const console::CommandPrintConfig& command) {
  auto config = ResolveConfig(command.config_path);
  if (!config) {
    fmt::print(stderr, "{}\n", config.error());
    return EXIT_FAILURE;
  }
  fmt::print("{}\n", DumpConfig(*config));
  return EXIT_SUCCESS;
}

int RunCommand(const console::CommandRun& command) {
  auto config = ResolveConfig(command.config_path);
  if (!config) {
    fmt::print(stderr, "{}\n", config.error());
    return EXIT_FAILURE;
  }

  const auto& level = command.log_level.value_or(config->log_level);
  if (!SetLogLevel(level)) {
    fmt::print(stderr, "Unknown log level: {}\n", level);
    return EXIT_FAILURE;
  }

  const DemoOptions options{
      .item_count = command.item_count,
      .distinct_rows = command.distinct_rows,
      .scroll_offset = command.scroll_offset,
      .fetch_latency = std::chrono::milliseconds(command.fetch_latency_ms),
  };
  auto report = RunDemo(*config, options);
  if (!report) {
    LogError("Demo session failed: {}", report.error());
    return EXIT_FAILURE;
  }

  fmt::print(
      "rows: {}\nfetches: {}\ncache hits: {}\njoined requests: {}\n"
      "evictions: {}\nprogress reports: {}\nsearch '{}': {} matches "
      "({} runs)\nrevealed: {}{}\nwindow: {}..{} (offset {:.1f}, "
      "extent {:.1f})\n",
      report->rows_processed,
      report->fetches,
      report->cache_hits,
      report->joined_requests,
      report->evictions,
      report->progress_reports,
      report->last_search,
      report->search_matches,
      report->search_runs,
      report->visible_after_reveal,
      report->has_more_rows ? " (more available)" : "",
      report->window.start_index,
      report->window.end_index,
      report->window.leading_offset,
      report->window.total_extent);
  return EXIT_SUCCESS;
}

}  // namespace

}  // namespace pace

int main(int argc, char** argv) {
  pace::LogInstallFormat();

  auto command = pace::console::Parse(argc, argv);
  if (!command) {
    fmt::print(stderr, "{}\n", command.error());
    return EXIT_FAILURE;
  }

  return std::visit([](const auto& cmd) { return pace::RunCommand(cmd); },
                    *command);
}
