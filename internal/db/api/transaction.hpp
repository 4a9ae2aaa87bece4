#pragma once

namespace jobq::db {

/*
  Unit of work for one queue operation.

  A claim (SelectCandidate + ConditionalClaim + GetJob), an enqueue or a
  sweep runs inside exactly one Transaction. Writes become visible to other
  workers on Commit(); a Transaction destroyed without Commit() rolls back,
  so a claim that throws halfway never leaves a half-locked row.

    sqlite    BEGIN IMMEDIATE; the write lock is taken up front
    postgres  pqxx::work on a pooled connection
    memory    exclusive lock + private copy of the job table
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace jobq::db
