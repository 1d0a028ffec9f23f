// Copyright (c) Maia

#include "pace/assert.h"

#include <libassert/assert.hpp>
#include <spdlog/spdlog.h>

namespace pace {

void Assert(bool invariant, std::string_view what, std::source_location sloc) {
  if (invariant) {
    return;
  }
  spdlog::error("Invariant violated at {}:{} in {}: {}",
                sloc.file_name(),
                sloc.line(),
                sloc.function_name(),
                what);
  spdlog::default_logger_raw()->flush();
  ASSERT(invariant, what, sloc.file_name(), sloc.line());
}

}  // namespace pace
