#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include "internal/checkpoint/checkpoint.hpp"

namespace eventship::checkpoint {

class MemoryCheckpointStore final : public CheckpointStore {
 public:
  util::Result Load(std::string_view provider, std::optional<Checkpoint>* out) override;
  util::Result Save(const Checkpoint& checkpoint) override;

 private:
  std::mutex                                  mutex_;
  std::unordered_map<std::string, Checkpoint> checkpoints_;
};

} // namespace eventship::checkpoint
