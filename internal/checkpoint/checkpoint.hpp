#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/result.hpp"

namespace eventship::checkpoint {

/*
  Resume position of one provider's tailing engine.

  last_record_number only has meaning together with log_creation_us: a
  clear or rotation starts a new log lifetime with its own numbering.
*/
struct Checkpoint {
  std::string   provider;
  std::uint32_t last_record_number = 0;
  std::uint64_t log_creation_us    = 0;
};

/*
  Checkpoint persistence keyed by provider name.

  Save replaces the whole checkpoint atomically; readers never observe a
  partially written one.
*/
class CheckpointStore {
 public:
  virtual ~CheckpointStore() = default;

  // Ok with *out empty when the provider has no checkpoint yet. An error
  // means the stored state could not be read; *out is left untouched.
  virtual util::Result Load(std::string_view provider, std::optional<Checkpoint>* out) = 0;

  virtual util::Result Save(const Checkpoint& checkpoint) = 0;
};

} // namespace eventship::checkpoint
