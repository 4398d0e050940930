#pragma once

#include <vector>

#include "internal/model/event.hpp"

namespace eventship::publish {

/*
  Downstream collaborator of the tailing engines.

  Calls are synchronous. Returning false refuses the batch; the engine
  retries the same batch and does not advance its checkpoint until one call
  returns true. Implementations shared between engines must be thread safe.
*/
class Publisher {
 public:
  virtual ~Publisher() = default;

  virtual bool Publish(const std::vector<model::Event>& events) = 0;

  virtual bool PublishDiscontinuity(const model::Discontinuity& marker) = 0;
};

} // namespace eventship::publish
