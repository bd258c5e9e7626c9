#pragma once

#include "maestro/core/error.hpp"
#include "maestro/model/image.hpp"
#include "maestro/orchestrator/connection.hpp"

#include <memory>
#include <stop_token>

namespace maestro {

class RunDispatcher {
public:
  // Queues a run of `image` on `connection`, building it there first when
  // its current build belongs elsewhere or does not exist. The build and the
  // `waiting` mark happen in one critical section, so concurrent calls for
  // the same Image cannot both get through. Blocks until the connection's
  // worker accepts the run. Conflict if the Image is running or queued.
  [[nodiscard]] static auto run(const std::shared_ptr<Image>& image,
                                const std::shared_ptr<Connection>& connection)
      -> Result<void>;

  // Worker side: creates, starts and attaches to the container, then copies
  // its output until the stream ends. Installed as every Connection's
  // RunHandler.
  static auto execute(const std::shared_ptr<Image>& image,
                      Connection& connection, std::stop_token stop) -> void;
};

}  // namespace maestro
