// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#include <cerrno>
#include <cstring>
#include <iostream>
#include <random>

#include <sys/ipc.h>
#include <sys/shm.h>

#include "tabxfer-ipc/MemorySegment.hh"

using namespace std;

namespace tabxfer {

namespace {
arrow::Status sysError(const string &what, int64_t key) {
  int e = errno;
  return arrow::Status::IOError(what, " failed for shared memory key ", key, ": ", strerror(e));
}
}

arrow::Result<const uint8_t *> SharedMemoryAttacher::Attach(int64_t key, int64_t size) {

  if(size<=0) return arrow::Status::Invalid("Shared memory segment ", key, " has no data");

  int shmid = shmget(static_cast<key_t>(key), 0, 0);
  if(shmid<0) return sysError("shmget", key);

  struct shmid_ds info;
  if(shmctl(shmid, IPC_STAT, &info)<0) return sysError("shmctl(IPC_STAT)", key);
  if(static_cast<int64_t>(info.shm_segsz) < size) {
    return arrow::Status::IOError("Shared memory segment ", key, " holds ", info.shm_segsz,
                                  " bytes but the result needs ", size);
  }

  void *ptr = shmat(shmid, nullptr, SHM_RDONLY);
  if(ptr==reinterpret_cast<void *>(-1)) return sysError("shmat", key);
  return static_cast<const uint8_t *>(ptr);
}

arrow::Status SharedMemoryAttacher::Detach(const uint8_t *base) {
  if(!base) return arrow::Status::Invalid("Detach of a null shared memory address");
  if(shmdt(base)<0) {
    int e = errno;
    return arrow::Status::IOError("shmdt failed: ", strerror(e));
  }
  return arrow::Status::OK();
}


ScopedAttachment::ScopedAttachment(shared_ptr<SegmentAttacher> attacher, const uint8_t *base,
                                   int64_t num_bytes, detach_error_fn_t on_detach_error)
  : attacher(std::move(attacher)), base(base), num_bytes(num_bytes),
    on_detach_error(std::move(on_detach_error)) {
}

arrow::Result<ScopedAttachment> ScopedAttachment::Attach(shared_ptr<SegmentAttacher> attacher,
                                                         int64_t key, int64_t size,
                                                         detach_error_fn_t on_detach_error) {
  if(!attacher) return arrow::Status::Invalid("No attacher given for segment ", key);
  ARROW_ASSIGN_OR_RAISE(auto base, attacher->Attach(key, size));
  return ScopedAttachment(std::move(attacher), base, size, std::move(on_detach_error));
}

ScopedAttachment::ScopedAttachment(ScopedAttachment &&other) noexcept
  : attacher(std::move(other.attacher)), base(other.base), num_bytes(other.num_bytes),
    on_detach_error(std::move(other.on_detach_error)) {
  other.base = nullptr;
  other.num_bytes = 0;
}

ScopedAttachment &ScopedAttachment::operator=(ScopedAttachment &&other) noexcept {
  if(this!=&other) {
    detachQuietly();
    attacher = std::move(other.attacher);
    base = other.base;
    num_bytes = other.num_bytes;
    on_detach_error = std::move(other.on_detach_error);
    other.base = nullptr;
    other.num_bytes = 0;
  }
  return *this;
}

ScopedAttachment::~ScopedAttachment() {
  detachQuietly();
}

/// @brief Detach now and report the result. Later calls are no-ops
arrow::Status ScopedAttachment::Detach() {
  if(!base) return arrow::Status::OK();
  const uint8_t *b = base;
  base = nullptr;
  num_bytes = 0;
  return attacher->Detach(b);
}

void ScopedAttachment::detachQuietly() {
  auto st = Detach();
  if(!st.ok() && on_detach_error) on_detach_error(st);
}


arrow::Result<unique_ptr<SharedMemorySegment>> SharedMemorySegment::Create(int64_t size) {

  if(size<=0) return arrow::Status::Invalid("Shared memory segments must have a positive size");

  static thread_local mt19937 gen{random_device{}()};
  uniform_int_distribution<int32_t> dist(1, 0x7FFFFFFF);

  int shmid = -1;
  key_t key = 0;
  for(int attempt=0; attempt<100; attempt++) {
    key = static_cast<key_t>(dist(gen));
    shmid = shmget(key, static_cast<size_t>(size), IPC_CREAT | IPC_EXCL | 0600);
    if(shmid>=0) break;
    if(errno!=EEXIST) return sysError("shmget(IPC_CREAT)", key);
  }
  if(shmid<0) return arrow::Status::IOError("Could not find an unused shared memory key");

  void *ptr = shmat(shmid, nullptr, 0);
  if(ptr==reinterpret_cast<void *>(-1)) {
    auto st = sysError("shmat", key);
    if(shmctl(shmid, IPC_RMID, nullptr)<0)
      st = st.WithMessage(st.message(), " (segment could not be removed either)");
    return st;
  }
  return unique_ptr<SharedMemorySegment>(
          new SharedMemorySegment(shmid, key, size, static_cast<uint8_t *>(ptr)));
}

SharedMemorySegment::~SharedMemorySegment() {
  if(removed) return;
  auto st = Remove();
  if(!st.ok()) std::cerr << "SharedMemorySegment: " << st.ToString() << std::endl;
}

/// @brief Detach the creator's mapping and mark the segment for deletion
arrow::Status SharedMemorySegment::Remove() {
  if(removed) return arrow::Status::Invalid("Shared memory segment ", key_, " was already removed");
  if(base) {
    if(shmdt(base)<0) return sysError("shmdt", key_);
    base = nullptr;
  }
  if(shmctl(shmid, IPC_RMID, nullptr)<0) return sysError("shmctl(IPC_RMID)", key_);
  removed = true;
  return arrow::Status::OK();
}

} // namespace tabxfer
