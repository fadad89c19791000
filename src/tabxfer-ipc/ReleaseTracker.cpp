// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <iomanip>

#include "tabxfer-common/Status.hh"
#include "tabxfer-ipc/ReleaseTracker.hh"

using namespace std;

namespace tabxfer {

ReleaseTracker::ReleaseTracker(const Configuration &config)
  : LoggingInterface("tabxfer.release") {
  ConfigureLogging(config);
}

ReleaseTracker::~ReleaseTracker() {
  lock_guard<std::mutex> lock(mtx);
  purgeExpired_locked();
  size_t num_unreleased=0;
  for(auto &id_entry : entries)
    if(!id_entry.second.released) num_unreleased++;
  if(num_unreleased)
    warn("Shutting down with "+std::to_string(num_unreleased)+" fetched results that were never released");
}

/**
 * @brief Record that a table was decoded from a descriptor
 * @param[in] table The table handed to the caller
 * @param[in] desc The descriptor the server returned for it
 */
void ReleaseTracker::Track(const shared_ptr<arrow::Table> &table, const ResultDescriptor &desc) {
  if(!table) return;
  lock_guard<std::mutex> lock(mtx);
  purgeExpired_locked();
  entry_t e;
  e.table = table;
  e.desc = desc;
  entries[table.get()] = e;
  dbg("Tracking "+desc.str());
}

arrow::Result<const ReleaseTracker::entry_t *> ReleaseTracker::findEntry(const shared_ptr<arrow::Table> &table) const {
  if(!table)
    return MakeError(ErrorCode::NoDescriptor, "Cannot release a null table");
  auto it = entries.find(table.get());
  if((it==entries.end()) || (it->second.table.lock()!=table))
    return MakeError(ErrorCode::NoDescriptor, "Table was not produced by an ipc fetch on this connection");
  if(it->second.released)
    return MakeError(ErrorCode::AlreadyReleased, "Result "+std::to_string(it->second.desc.result_id)+" was already released");
  return &it->second;
}

/**
 * @brief Get the descriptor a table's memory should be released with
 * @retval NoDescriptor The table didn't come from this tracker's fetches
 * @retval AlreadyReleased The descriptor was already deallocated
 */
arrow::Result<ResultDescriptor> ReleaseTracker::Lookup(const shared_ptr<arrow::Table> &table) const {
  lock_guard<std::mutex> lock(mtx);
  ARROW_ASSIGN_OR_RAISE(auto e, findEntry(table));
  return e->desc;
}

/// @brief Note that the server freed this table's descriptor. Later lookups fail with AlreadyReleased
arrow::Status ReleaseTracker::MarkReleased(const shared_ptr<arrow::Table> &table) {
  lock_guard<std::mutex> lock(mtx);
  ARROW_ASSIGN_OR_RAISE(auto e, findEntry(table));
  auto it = entries.find(table.get());
  it->second.released = true;
  dbg("Released "+e->desc.str());
  return arrow::Status::OK();
}

/// @brief Number of live, unreleased results
size_t ReleaseTracker::NumberOfTrackedResults() const {
  lock_guard<std::mutex> lock(mtx);
  size_t count=0;
  for(auto &id_entry : entries) {
    if((!id_entry.second.released) && (!id_entry.second.table.expired()))
      count++;
  }
  return count;
}

/// @brief Drop entries whose tables are gone. Warns about any that were never released
size_t ReleaseTracker::PurgeExpired() {
  lock_guard<std::mutex> lock(mtx);
  return purgeExpired_locked();
}

size_t ReleaseTracker::purgeExpired_locked() {
  size_t num_removed=0;
  for(auto it=entries.begin(); it!=entries.end(); ) {
    if(it->second.table.expired()) {
      if(!it->second.released)
        warn("Table for "+it->second.desc.str()+" was dropped without being released. Server memory is still held");
      it = entries.erase(it);
      num_removed++;
    } else {
      ++it;
    }
  }
  return num_removed;
}

void ReleaseTracker::sstr(stringstream &ss, int depth, int indent) const {
  if(depth<0) return;
  lock_guard<std::mutex> lock(mtx);
  ss << string(indent,' ') << "[ReleaseTracker] Entries: " << entries.size() << endl;
  if(depth>0) {
    for(auto &id_entry : entries) {
      ss << string(indent+2,' ')
         << setw(8) << (id_entry.second.released ? "released" : (id_entry.second.table.expired() ? "expired" : "live"))
         << " " << id_entry.second.desc.str() << endl;
    }
  }
}

} // namespace tabxfer
