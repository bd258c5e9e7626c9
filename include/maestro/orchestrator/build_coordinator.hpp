#pragma once

#include "maestro/core/error.hpp"
#include "maestro/model/image.hpp"
#include "maestro/orchestrator/connection.hpp"

#include <memory>

namespace maestro {

// Rebuilds an Image on a host. Any container and build the Image currently
// has are removed from the host that owns them first; the build identifier
// and owning connection are replaced only when the new build succeeds.
class BuildCoordinator {
public:
  // Holds the Image's exclusive lock for the whole build.
  [[nodiscard]] static auto build(Image& image,
                                  const std::shared_ptr<Connection>& connection)
      -> Result<void>;

  // Same as build() for a caller that already holds the exclusive lock.
  [[nodiscard]] static auto build_locked(
      Image& image, const std::shared_ptr<Connection>& connection)
      -> Result<void>;
};

}  // namespace maestro
