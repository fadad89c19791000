// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_IPC_RELEASETRACKER_HH
#define TABXFER_IPC_RELEASETRACKER_HH

#include <map>
#include <memory>
#include <mutex>

#include <arrow/result.h>
#include <arrow/table.h>

#include "tabxfer-common/Configuration.hh"
#include "tabxfer-common/InfoInterface.hh"
#include "tabxfer-common/LoggingInterface.hh"
#include "tabxfer-ipc/ResultDescriptor.hh"


namespace tabxfer {

/**
 * @brief Remembers which descriptor produced each fetched table
 *
 * Entries are keyed by the table's address and hold a weak reference to
 * it, so any copy of the shared_ptr finds the same entry and a recycled
 * address is never mistaken for the original table. Released entries are
 * kept while their table lives so a second release can be refused.
 */
class ReleaseTracker
        : public LoggingInterface,
          public InfoInterface {

public:
  explicit ReleaseTracker(const Configuration &config = Configuration());
  ~ReleaseTracker() override;

  void Track(const std::shared_ptr<arrow::Table> &table, const ResultDescriptor &desc);

  arrow::Result<ResultDescriptor> Lookup(const std::shared_ptr<arrow::Table> &table) const;
  arrow::Status MarkReleased(const std::shared_ptr<arrow::Table> &table);

  size_t NumberOfTrackedResults() const;
  size_t PurgeExpired();

  //InfoInterface
  void sstr(std::stringstream &ss, int depth=0, int indent=0) const override;

private:
  struct entry_t {
    std::weak_ptr<arrow::Table> table;
    ResultDescriptor desc;
    bool released = false;
  };

  arrow::Result<const entry_t *> findEntry(const std::shared_ptr<arrow::Table> &table) const;
  size_t purgeExpired_locked();

  mutable std::mutex mtx;
  std::map<const arrow::Table *, entry_t> entries;
};

} // namespace tabxfer

#endif // TABXFER_IPC_RELEASETRACKER_HH
