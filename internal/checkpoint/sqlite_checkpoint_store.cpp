#include "sqlite_checkpoint_store.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace eventship::checkpoint {

using db::sqlite::Statement;
using observability::StringField;

SqliteCheckpointStore::SqliteCheckpointStore(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
  if (!db_) {
    throw std::invalid_argument("SqliteCheckpointStore: null db");
  }
  Migrate();
}

void SqliteCheckpointStore::Migrate() {
  db_->Exec(
      "CREATE TABLE IF NOT EXISTS checkpoints ("
      " provider TEXT PRIMARY KEY,"
      " last_record_number INTEGER NOT NULL,"
      " log_creation_time_us INTEGER NOT NULL,"
      " updated_at_ms INTEGER NOT NULL"
      ");");
}

util::Result SqliteCheckpointStore::Load(std::string_view provider, std::optional<Checkpoint>* out) {
  std::lock_guard lock(mutex_);
  try {
    Statement stmt(*db_, "SELECT last_record_number, log_creation_time_us FROM checkpoints WHERE provider = ?;");
    stmt.BindText(1, provider);
    if (!stmt.Step()) {
      out->reset();
      return util::Result::Ok();
    }

    Checkpoint checkpoint;
    checkpoint.provider           = std::string(provider);
    checkpoint.last_record_number = static_cast<std::uint32_t>(stmt.ColumnInt64(0));
    checkpoint.log_creation_us    = static_cast<std::uint64_t>(stmt.ColumnInt64(1));
    *out                          = std::move(checkpoint);
  } catch (const std::exception& e) {
    EVENTSHIP_LOG_WARN("checkpoint load failed", {StringField("provider", provider), StringField("error", e.what())});
    return util::Result::Err(util::ErrorCode::IOError, e.what());
  }
  return util::Result::Ok();
}

util::Result SqliteCheckpointStore::Save(const Checkpoint& checkpoint) {
  if (checkpoint.provider.empty()) {
    return util::Result::Err(util::ErrorCode::InvalidArgument, "checkpoint without provider");
  }

  std::lock_guard lock(mutex_);
  try {
    Statement stmt(*db_,
                   "INSERT INTO checkpoints (provider, last_record_number, log_creation_time_us, updated_at_ms)"
                   " VALUES (?, ?, ?, ?)"
                   " ON CONFLICT(provider) DO UPDATE SET"
                   " last_record_number = excluded.last_record_number,"
                   " log_creation_time_us = excluded.log_creation_time_us,"
                   " updated_at_ms = excluded.updated_at_ms;");
    stmt.BindText(1, checkpoint.provider);
    stmt.BindInt64(2, static_cast<std::int64_t>(checkpoint.last_record_number));
    stmt.BindInt64(3, static_cast<std::int64_t>(checkpoint.log_creation_us));
    stmt.BindInt64(4, static_cast<std::int64_t>(util::ToUnixMillis(util::Now())));
    stmt.Step();
  } catch (const std::exception& e) {
    return util::Result::Err(util::ErrorCode::IOError, e.what());
  }
  return util::Result::Ok();
}

} // namespace eventship::checkpoint
