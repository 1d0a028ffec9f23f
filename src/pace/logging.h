// Copyright (c) Maia

#pragma once

#include <optional>
#include <source_location>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace pace {

namespace detail {

inline spdlog::source_loc ToSpdlogLoc(const std::source_location& loc) {
  return spdlog::source_loc{
      loc.file_name(), static_cast<int>(loc.line()), loc.function_name()};
}

template <typename... Args>
struct WithSourceLoc {
  spdlog::format_string_t<Args...> str;
  std::source_location loc;

  // Captures the format string together with the caller location. Invalid
  // format strings for 'Args' fail to compile.
  template <typename FormatStr>
  // NOLINTNEXTLINE(google-explicit-constructor, hicpp-explicit-conversions)
  consteval WithSourceLoc(
      const FormatStr& s,
      std::source_location loc = std::source_location::current())
      : str(s),
        loc(loc) {}
};

template <typename... Args>
void LogAt(spdlog::level::level_enum level,
           const WithSourceLoc<Args...>& fmt_loc,
           Args&&... args) {
  spdlog::default_logger_raw()->log(ToSpdlogLoc(fmt_loc.loc),
                                    level,
                                    fmt_loc.str,
                                    std::forward<Args>(args)...);
}

}  // namespace detail

/// \brief Installs the global pattern: [Time][Level][File:Line]: Message
///
/// \example [14:30:05.123][info][batch_processor.h:88]: Batch 3/7 settled
inline void LogInstallFormat() {
  spdlog::set_pattern("[%H:%M:%S.%e][%^%l%$][%s:%#]: %v");
}

/// \brief Maps a level name ("trace", "debug", "info", "warn", "error",
/// "off") onto a spdlog level.
inline std::optional<spdlog::level::level_enum> ParseLogLevel(
    std::string_view name) {
  const auto level = spdlog::level::from_str(std::string(name));
  // from_str falls back to "off" for unknown names.
  if (level == spdlog::level::off && name != "off") {
    return std::nullopt;
  }
  return level;
}

/// \brief Sets the level of the default logger. Returns false and leaves the
/// level untouched when the name is unknown.
inline bool SetLogLevel(std::string_view name) {
  auto level = ParseLogLevel(name);
  if (!level) {
    return false;
  }
  spdlog::set_level(*level);
  return true;
}

// std::type_identity_t keeps Args deduced from the trailing arguments only.

template <typename... Args>
inline void LogTrace(
    detail::WithSourceLoc<std::type_identity_t<Args>...> fmt_loc,
    Args&&... args) {
  detail::LogAt<Args...>(
      spdlog::level::trace, fmt_loc, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LogDebug(
    detail::WithSourceLoc<std::type_identity_t<Args>...> fmt_loc,
    Args&&... args) {
  detail::LogAt<Args...>(
      spdlog::level::debug, fmt_loc, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LogInfo(
    detail::WithSourceLoc<std::type_identity_t<Args>...> fmt_loc,
    Args&&... args) {
  detail::LogAt<Args...>(
      spdlog::level::info, fmt_loc, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LogWarning(
    detail::WithSourceLoc<std::type_identity_t<Args>...> fmt_loc,
    Args&&... args) {
  detail::LogAt<Args...>(
      spdlog::level::warn, fmt_loc, std::forward<Args>(args)...);
}

template <typename... Args>
inline void LogError(
    detail::WithSourceLoc<std::type_identity_t<Args>...> fmt_loc,
    Args&&... args) {
  detail::LogAt<Args...>(
      spdlog::level::err, fmt_loc, std::forward<Args>(args)...);
}

}  // namespace pace
