#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace sandbox::db::postgres {

/*
  Bounded pool of libpqxx connections for PgRepository.

  A connection belongs to one transaction at a time and is handed back
  when the last shared_ptr to it drops; connections found closed on the
  way back are discarded. Prepared statements are installed once per
  connection. Acquire() waits up to acquire_timeout for a free slot and
  then fails with a transient StorageError.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  struct Stats {
    std::size_t live = 0;
    std::size_t idle = 0;
  };

  explicit PgPool(std::string conninfo, std::size_t max_connections = 8,
                  std::chrono::milliseconds acquire_timeout = std::chrono::seconds(30));

  std::shared_ptr<pqxx::connection> Acquire();

  // Opens one connection and runs the schema statements on it.
  void Migrate(const std::vector<std::string>& ordered_sql);

  Stats Snapshot() const;

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              GiveBack(pqxx::connection* conn);

  const std::string               conninfo_;
  const std::size_t               max_connections_;
  const std::chrono::milliseconds acquire_timeout_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        available_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_ = 0;
};

} // namespace sandbox::db::postgres
