// Copyright (c) Maia

#include "pace/application/composition_root.h"

#include "pace/logging.h"

namespace pace {

std::shared_ptr<SharedCache> MakeSharedCache(const CoordinationConfig& config,
                                             const core::IClock& clock) {
  LogDebug("Creating shared cache: capacity {}, default ttl {} ms.",
           config.cache.capacity,
           config.cache.default_ttl_ms);
  return std::make_shared<SharedCache>(
      clock, static_cast<size_t>(config.cache.capacity), config.CacheTtl());
}

}  // namespace pace
