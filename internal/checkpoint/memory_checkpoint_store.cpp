#include "memory_checkpoint_store.hpp"

namespace eventship::checkpoint {

util::Result MemoryCheckpointStore::Load(std::string_view provider, std::optional<Checkpoint>* out) {
  std::lock_guard lock(mutex_);
  auto            it = checkpoints_.find(std::string(provider));
  if (it == checkpoints_.end()) {
    out->reset();
  } else {
    *out = it->second;
  }
  return util::Result::Ok();
}

util::Result MemoryCheckpointStore::Save(const Checkpoint& checkpoint) {
  if (checkpoint.provider.empty()) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, "checkpoint without provider");
  }
  std::lock_guard lock(mutex_);
  checkpoints_[checkpoint.provider] = checkpoint;
  return util::Result::Ok();
}

} // namespace eventship::checkpoint
