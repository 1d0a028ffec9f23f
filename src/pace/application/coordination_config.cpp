// Copyright (c) Maia

#include "pace/application/coordination_config.h"

#include <chrono>
#include <fstream>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "pace/core/window_calculator.h"
#include "pace/logging.h"

namespace pace {

// clang-format off
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CacheSettings, capacity, default_ttl_ms)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(ThrottleSettings, wait_ms)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(DebounceSettings, delay_ms)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(BatchSettings, batch_size, inter_batch_delay_ms)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(WindowSettings, item_extent, viewport_extent, overscan)
// clang-format on

// max_count is nullable, which the macros cannot express.
void to_json(nlohmann::json& j, const ProgressiveSettings& settings) {
  j = nlohmann::json{{"initial_count", settings.initial_count},
                     {"increment", settings.increment},
                     {"max_count", nullptr}};
  if (settings.max_count) {
    j["max_count"] = *settings.max_count;
  }
}

void from_json(const nlohmann::json& j, ProgressiveSettings& settings) {
  const ProgressiveSettings defaults;
  settings.initial_count = j.value("initial_count", defaults.initial_count);
  settings.increment = j.value("increment", defaults.increment);
  settings.max_count.reset();
  if (j.contains("max_count") && !j.at("max_count").is_null()) {
    settings.max_count = j.at("max_count").get<int64_t>();
  }
}

// clang-format off
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE_WITH_DEFAULT(CoordinationConfig,
                                                log_level,
                                                cache,
                                                throttle,
                                                debounce,
                                                batch,
                                                progressive,
                                                window)
// clang-format on

namespace {

std::expected<void, std::string> CheckDuration(std::string_view field,
                                               int64_t value_ms,
                                               int64_t min_ms) {
  if (value_ms < min_ms || value_ms > kMaxDurationMs) {
    return std::unexpected(
        fmt::format("{}: must be within [{}, {}] ms, got {}",
                    field,
                    min_ms,
                    kMaxDurationMs,
                    value_ms));
  }
  return {};
}

std::expected<void, std::string> Validate(const CoordinationConfig& config) {
  auto fail = [](std::string message) {
    return std::unexpected(std::move(message));
  };

  if (!ParseLogLevel(config.log_level)) {
    return fail(fmt::format("log_level: unknown level '{}'", config.log_level));
  }
  if (config.cache.capacity < 1) {
    return fail(fmt::format("cache.capacity: must be at least 1, got {}",
                            config.cache.capacity));
  }
  if (auto checked = CheckDuration(
          "cache.default_ttl_ms", config.cache.default_ttl_ms, 1);
      !checked) {
    return checked;
  }
  if (auto checked =
          CheckDuration("throttle.wait_ms", config.throttle.wait_ms, 1);
      !checked) {
    return checked;
  }
  if (auto checked =
          CheckDuration("debounce.delay_ms", config.debounce.delay_ms, 0);
      !checked) {
    return checked;
  }
  if (config.batch.batch_size < 1) {
    return fail(fmt::format("batch.batch_size: must be at least 1, got {}",
                            config.batch.batch_size));
  }
  if (auto checked = CheckDuration(
          "batch.inter_batch_delay_ms", config.batch.inter_batch_delay_ms, 0);
      !checked) {
    return checked;
  }
  if (config.progressive.initial_count < 0 ||
      config.progressive.increment < 0 ||
      config.progressive.max_count.value_or(0) < 0) {
    return fail(std::string("progressive: counts must not be negative"));
  }

  const core::WindowRequest geometry{
      .item_extent = config.window.item_extent,
      .viewport_extent = config.window.viewport_extent,
      .overscan = config.window.overscan,
  };
  if (auto window = core::ComputeWindow(geometry); !window) {
    return fail("window: " + window.error());
  }
  return {};
}

}  // namespace

core::IClock::Duration CoordinationConfig::CacheTtl() const {
  return std::chrono::milliseconds(cache.default_ttl_ms);
}

core::IClock::Duration CoordinationConfig::ThrottleWait() const {
  return std::chrono::milliseconds(throttle.wait_ms);
}

core::IClock::Duration CoordinationConfig::DebounceDelay() const {
  return std::chrono::milliseconds(debounce.delay_ms);
}

core::BatchOptions CoordinationConfig::ToBatchOptions() const {
  return core::BatchOptions{
      .batch_size = static_cast<size_t>(batch.batch_size),
      .inter_batch_delay =
          std::chrono::milliseconds(batch.inter_batch_delay_ms)};
}

core::ProgressiveLoadConfig CoordinationConfig::ToProgressiveLoadConfig()
    const {
  core::ProgressiveLoadConfig out{
      .initial_count = static_cast<size_t>(progressive.initial_count),
      .increment = static_cast<size_t>(progressive.increment)};
  if (progressive.max_count) {
    out.max_count = static_cast<size_t>(*progressive.max_count);
  }
  return out;
}

core::WindowGeometry CoordinationConfig::ToWindowGeometry() const {
  return core::WindowGeometry{.item_extent = window.item_extent,
                              .viewport_extent = window.viewport_extent,
                              .overscan = window.overscan};
}

std::expected<CoordinationConfig, std::string> ParseConfig(
    std::string_view text) {
  CoordinationConfig config;
  try {
    auto j = nlohmann::json::parse(text);
    config = j.get<CoordinationConfig>();
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(fmt::format("invalid configuration: {}", e.what()));
  }

  if (auto valid = Validate(config); !valid) {
    return std::unexpected(valid.error());
  }
  return config;
}

std::expected<CoordinationConfig, std::string> LoadConfig(
    const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LogError("Failed to open configuration file: {}", path.string());
    return std::unexpected(
        fmt::format("cannot open configuration file {}", path.string()));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = ParseConfig(buffer.str());
  if (!config) {
    LogError("Rejected configuration {}: {}", path.string(), config.error());
    return config;
  }
  LogInfo("Loaded configuration from {}", path.string());
  return config;
}

std::string DumpConfig(const CoordinationConfig& config) {
  return nlohmann::json(config).dump(2);
}

}  // namespace pace
