// Copyright (c) Maia

#pragma once

#include <algorithm>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "pace/core/future.h"
#include "pace/logging.h"

namespace pace::core {

/// \brief Raised through the Future returned by ResourceRegistry::Load() for
/// names nobody registered.
class UnknownResourceError : public std::runtime_error {
 public:
  explicit UnknownResourceError(const std::string& name)
      : std::runtime_error("Unknown resource: " + name),
        name_(name) {}

  [[nodiscard]] const std::string& name() const {
    return name_;
  }

 private:
  std::string name_;
};

/// \brief Lookup table from a resource name to the function that loads it.
/// \details New resources are added with Register(); Load() never needs to
/// change. Loader failures are logged with the resource name and handed to
/// the caller unchanged.
template <typename T>
class ResourceRegistry {
 public:
  using Loader = std::function<Future<T>()>;

  /// \return False if `name` is already registered or `loader` is empty.
  bool Register(const std::string& name, Loader loader) {
    if (!loader) {
      LogWarning("Refusing to register an empty loader for '{}'.", name);
      return false;
    }
    auto [it, inserted] = loaders_.try_emplace(name, std::move(loader));
    if (!inserted) {
      LogWarning("Resource '{}' is already registered.", name);
    }
    return inserted;
  }

  [[nodiscard]] bool Contains(const std::string& name) const {
    return loaders_.contains(name);
  }

  /// \brief Registered names in lexicographic order.
  [[nodiscard]] std::vector<std::string> Names() const {
    std::vector<std::string> names;
    names.reserve(loaders_.size());
    for (const auto& [name, loader] : loaders_) {
      names.push_back(name);
    }
    std::ranges::sort(names);
    return names;
  }

  Future<T> Load(const std::string& name) const {
    auto it = loaders_.find(name);
    if (it == loaders_.end()) {
      LogError("Failed to load resource {}: not registered.", name);
      return MakeFailedFuture<T>(
          std::make_exception_ptr(UnknownResourceError(name)));
    }

    Future<T> future;
    try {
      future = it->second();
    } catch (const std::exception& e) {
      LogError("Failed to load resource {}: {}", name, e.what());
      return MakeFailedFuture<T>(std::current_exception());
    }

    future.OnSettled([name](const auto& result) {
      if (result) {
        LogDebug("Loaded resource {}.", name);
        return;
      }
      try {
        std::rethrow_exception(result.error());
      } catch (const std::exception& e) {
        LogError("Failed to load resource {}: {}", name, e.what());
      } catch (...) {
        LogError("Failed to load resource {}: unknown error", name);
      }
    });
    return future;
  }

 private:
  std::unordered_map<std::string, Loader> loaders_;
};

}  // namespace pace::core
