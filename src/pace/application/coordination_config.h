// Copyright (c) Maia

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "pace/core/batch_processor.h"
#include "pace/core/clock.h"
#include "pace/core/progressive_loader.h"
#include "pace/core/scroll_window_tracker.h"

namespace pace {

/// \brief Upper bound of every millisecond setting: one year. Keeps deadlines
/// computed as now + delay inside the clock's range.
inline constexpr int64_t kMaxDurationMs = int64_t{365} * 24 * 60 * 60 * 1000;

struct CacheSettings {
  int64_t capacity{200};
  int64_t default_ttl_ms{5 * 60 * 1000};
};

struct ThrottleSettings {
  int64_t wait_ms{100};
};

struct DebounceSettings {
  int64_t delay_ms{300};
};

struct BatchSettings {
  int64_t batch_size{10};
  int64_t inter_batch_delay_ms{0};
};

struct ProgressiveSettings {
  int64_t initial_count{20};
  int64_t increment{20};
  // Unset means "every item".
  std::optional<int64_t> max_count;
};

struct WindowSettings {
  double item_extent{40.0};
  double viewport_extent{600.0};
  int64_t overscan{5};
};

/// \brief Tunables of every coordination utility, loaded from JSON.
/// \details Every field is optional in the file; missing fields keep the
/// defaults above.
struct CoordinationConfig {
  std::string log_level{"info"};
  CacheSettings cache;
  ThrottleSettings throttle;
  DebounceSettings debounce;
  BatchSettings batch;
  ProgressiveSettings progressive;
  WindowSettings window;

  [[nodiscard]] core::IClock::Duration CacheTtl() const;
  [[nodiscard]] core::IClock::Duration ThrottleWait() const;
  [[nodiscard]] core::IClock::Duration DebounceDelay() const;
  [[nodiscard]] core::BatchOptions ToBatchOptions() const;
  [[nodiscard]] core::ProgressiveLoadConfig ToProgressiveLoadConfig() const;
  [[nodiscard]] core::WindowGeometry ToWindowGeometry() const;
};

/// \brief Parses and validates a JSON document.
/// \return The configuration, or a message naming the offending field.
std::expected<CoordinationConfig, std::string> ParseConfig(
    std::string_view text);

/// \brief Reads `path` and parses it with ParseConfig().
std::expected<CoordinationConfig, std::string> LoadConfig(
    const std::filesystem::path& path);

/// \brief Serialises `config` as indented JSON, every field included.
std::string DumpConfig(const CoordinationConfig& config);

}  // namespace pace
