// Copyright (c) Maia

#include "pace/console/console.h"

#include <memory>

#include <fmt/core.h>
#include <CLI/CLI.hpp>

#include "pace/application/coordination_config.h"

namespace pace::console {

namespace {

struct Options {
  std::string config_path;
  int64_t item_count{CommandRun{}.item_count};
  int64_t distinct_rows{CommandRun{}.distinct_rows};
  double scroll_offset{0.0};
  int64_t fetch_latency_ms{CommandRun{}.fetch_latency_ms};
  std::string log_level;
  bool print_config{false};
};

std::unique_ptr<CLI::App> MakeApp(Options& options) {
  auto app = std::make_unique<CLI::App>(
      "Drives the request coordination utilities through one table-view "
      "session.",
      "pace_demo");

  app->add_option("-c,--config", options.config_path, "JSON configuration file")
      ->check(CLI::ExistingFile);
  app->add_option("-n,--items", options.item_count, "Number of rows to resolve")
      ->check(CLI::NonNegativeNumber);
  app->add_option("-d,--distinct",
                  options.distinct_rows,
                  "Number of distinct row ids")
      ->check(CLI::PositiveNumber);
  app->add_option("-s,--scroll", options.scroll_offset, "Scroll offset")
      ->check(CLI::NonNegativeNumber);
  app->add_option("--latency",
                  options.fetch_latency_ms,
                  "Simulated fetch latency in milliseconds")
      ->check(CLI::Range(int64_t{0}, kMaxDurationMs));
  app->add_option("-l,--log-level",
                  options.log_level,
                  "Overrides the configured log level");
  app->add_flag("-p,--print-config",
                options.print_config,
                "Print the effective configuration and exit");
  return app;
}

std::optional<std::string> NonEmpty(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

Command ToCommand(const Options& options) {
  if (options.print_config) {
    return CommandPrintConfig{NonEmpty(options.config_path)};
  }
  return CommandRun{
      .config_path = NonEmpty(options.config_path),
      .item_count = options.item_count,
      .distinct_rows = options.distinct_rows,
      .scroll_offset = options.scroll_offset,
      .fetch_latency_ms = options.fetch_latency_ms,
      .log_level = NonEmpty(options.log_level),
  };
}

template <typename ParseFn>
std::expected<Command, std::string> ParseWith(ParseFn&& parse) {
  Options options;
  auto app = MakeApp(options);
  try {
    parse(*app);
  } catch (const CLI::CallForHelp&) {
    return CommandHelp{app->help()};
  } catch (const CLI::ParseError& e) {
    return std::unexpected(fmt::format("{}\n{}", e.what(), app->help()));
  }
  return ToCommand(options);
}

}  // namespace

std::expected<Command, std::string> Parse(const std::string& command) {
  return ParseWith([&command](CLI::App& app) { app.parse(command); });
}

std::expected<Command, std::string> Parse(int argc, const char* const* argv) {
  return ParseWith([argc, argv](CLI::App& app) { app.parse(argc, argv); });
}

}  // namespace pace::console
