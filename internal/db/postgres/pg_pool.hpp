#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace jobq::db::postgres {

/*
  Bounded pool of libpqxx connections shared by every PgTransaction.

  A claim keeps its connection for the select + conditional update pair,
  so max_connections caps how many workers can claim at the same moment;
  Acquire() blocks beyond that. New connections get the queue's prepared
  statements and application_name=jobq. Connections that come back closed
  are dropped instead of being reused.
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

 private:
  static void                       Setup(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace jobq::db::postgres
