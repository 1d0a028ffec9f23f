// Copyright (c) Maia

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>

#include "pace/logging.h"

namespace pace::core {

/// \brief Wraps `fn` so that every call logs its duration at debug level:
/// "[Performance] <name>: 1.23ms". The wrapped result is returned unchanged.
template <typename Fn>
auto Measure(std::string name, Fn fn) {
  return [name = std::move(name), fn = std::move(fn)](auto&&... args) mutable
         -> decltype(auto) {
    struct Stopwatch {
      const std::string& name;
      std::chrono::steady_clock::time_point start =
          std::chrono::steady_clock::now();

      ~Stopwatch() {
        const std::chrono::duration<double, std::milli> elapsed =
            std::chrono::steady_clock::now() - start;
        LogDebug("[Performance] {}: {:.2f}ms", name, elapsed.count());
      }
    };

    Stopwatch stopwatch{name};
    return std::invoke(fn, std::forward<decltype(args)>(args)...);
  };
}

}  // namespace pace::core
