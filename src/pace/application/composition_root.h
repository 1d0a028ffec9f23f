// Copyright (c) Maia

#pragma once

#include <memory>
#include <string>

#include "pace/application/coordination_config.h"
#include "pace/core/clock.h"
#include "pace/core/ttl_cache.h"

namespace pace {

/// \brief String-keyed cache of serialised responses shared by the consumers
/// of one application.
using SharedCache = core::TtlCache<std::string, std::string>;

/// \brief Builds the application's one shared cache from `config`.
/// \details Call once at start-up and pass the instance down; nothing else
/// should construct a process-wide cache. `clock` must outlive the cache.
std::shared_ptr<SharedCache> MakeSharedCache(const CoordinationConfig& config,
                                             const core::IClock& clock);

}  // namespace pace
