#pragma once

namespace fleetq::db {

/*
  Unit of work against the store.

  Every claim and guarded transition runs inside one. Changes stay private
  to the holder until Commit(); Rollback(), or destruction without a
  commit, discards them. A lost race surfaces from Begin() or Commit() as
  util::TransactionConflict and the whole unit may be rerun, which is what
  RunInTransaction does.

  memory    copy-on-write snapshot, validated against the store at commit
  sqlite    BEGIN IMMEDIATE under the connection's writer mutex
  postgres  pqxx::work; claims lock with FOR UPDATE SKIP LOCKED
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace fleetq::db
