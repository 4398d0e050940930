#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/checkpoint/checkpoint.hpp"

namespace eventship::db::sqlite {
class SqliteDB;
}

namespace eventship::checkpoint {

/*
  Checkpoints in a single sqlite table, one row per provider.

  The database file is created on first use. Writes are single-statement
  upserts, so every Save is atomic.
*/
class SqliteCheckpointStore final : public CheckpointStore {
 public:
  explicit SqliteCheckpointStore(std::shared_ptr<db::sqlite::SqliteDB> db);

  util::Result Load(std::string_view provider, std::optional<Checkpoint>* out) override;
  util::Result Save(const Checkpoint& checkpoint) override;

 private:
  void Migrate();

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  std::mutex                            mutex_;
};

} // namespace eventship::checkpoint
