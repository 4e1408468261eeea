#pragma once

namespace beatstore::db {

/*
  Unit of work against the catalog.

  Each service call and each synced file gets its own transaction, so a
  failed insert never takes earlier inserts down with it.

  - Writes are invisible to other transactions until Commit()
  - Commit() makes assigned ids and timestamps durable
  - Rollback() discards the write set
  - Destroying an uncommitted transaction rolls it back

  SqliteTransaction holds BEGIN IMMEDIATE on a connection it owns.
  MemoryTransaction works on a snapshot and publishes it on commit.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;
};

} // namespace beatstore::db
