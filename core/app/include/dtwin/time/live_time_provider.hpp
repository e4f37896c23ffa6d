#pragma once

#include "dtwin/time/i_time_provider.hpp"

namespace dtwin {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Default provider for the engine and the demo binary. Stateless; safe to
// call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace dtwin
