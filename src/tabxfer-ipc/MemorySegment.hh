// Copyright 2023 National Technology & Engineering Solutions of Sandia, LLC
// (NTESS). Under the terms of Contract DE-NA0003525 with NTESS, the U.S.
// Government retains certain rights in this software.

#ifndef TABXFER_IPC_MEMORYSEGMENT_HH
#define TABXFER_IPC_MEMORYSEGMENT_HH

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include <arrow/result.h>
#include <arrow/status.h>


namespace tabxfer {

/**
 * @brief Maps a server-exported memory segment into this process
 *
 * One attacher is registered per device kind. Attach() returns the base of
 * a read-only mapping that holds at least size bytes. Every successful
 * Attach() must be paired with one Detach() of the same base.
 */
class SegmentAttacher {
public:
  virtual ~SegmentAttacher() = default;

  virtual std::string Name() const = 0;
  virtual arrow::Result<const uint8_t *> Attach(int64_t key, int64_t size) = 0;
  virtual arrow::Status Detach(const uint8_t *base) = 0;
};


/**
 * @brief Host attacher for System V shared memory segments (shmget/shmat/shmdt)
 */
class SharedMemoryAttacher : public SegmentAttacher {
public:
  std::string Name() const override { return "sysv-shm"; }
  arrow::Result<const uint8_t *> Attach(int64_t key, int64_t size) override;
  arrow::Status Detach(const uint8_t *base) override;
};


/**
 * @brief An attached segment that is detached when it goes out of scope
 *
 * Detach errors can't propagate out of a destructor, so they are handed to
 * the on_detach_error callback (usually a logger). Call Detach() directly
 * to get the status instead.
 */
class ScopedAttachment {
public:
  using detach_error_fn_t = std::function<void(const arrow::Status &)>;

  static arrow::Result<ScopedAttachment> Attach(std::shared_ptr<SegmentAttacher> attacher,
                                                int64_t key, int64_t size,
                                                detach_error_fn_t on_detach_error = nullptr);

  ScopedAttachment(ScopedAttachment &&other) noexcept;
  ScopedAttachment &operator=(ScopedAttachment &&other) noexcept;
  ScopedAttachment(const ScopedAttachment &) = delete;
  ScopedAttachment &operator=(const ScopedAttachment &) = delete;
  ~ScopedAttachment();

  const uint8_t *data() const { return base; }
  int64_t size() const { return num_bytes; }
  bool Attached() const { return base!=nullptr; }

  arrow::Status Detach();

private:
  ScopedAttachment(std::shared_ptr<SegmentAttacher> attacher, const uint8_t *base,
                   int64_t num_bytes, detach_error_fn_t on_detach_error);
  void detachQuietly();

  std::shared_ptr<SegmentAttacher> attacher;
  const uint8_t *base;
  int64_t num_bytes;
  detach_error_fn_t on_detach_error;
};


/**
 * @brief Server-side owner of a System V segment that results are staged in
 *
 * Create() picks a random unused key. The creator keeps a writable mapping
 * until the object is destroyed. The segment itself lives until Remove()
 * marks it for deletion, so clients can attach after the creator detaches.
 */
class SharedMemorySegment {
public:
  static arrow::Result<std::unique_ptr<SharedMemorySegment>> Create(int64_t size);
  ~SharedMemorySegment();

  SharedMemorySegment(const SharedMemorySegment &) = delete;
  SharedMemorySegment &operator=(const SharedMemorySegment &) = delete;

  uint8_t *data() const { return base; }
  int64_t key() const { return key_; }
  int64_t size() const { return size_; }

  arrow::Status Remove();

private:
  SharedMemorySegment(int shmid, int64_t key, int64_t size, uint8_t *base)
    : shmid(shmid), key_(key), size_(size), base(base) {}

  int shmid;
  int64_t key_;
  int64_t size_;
  uint8_t *base;
  bool removed = false;
};

} // namespace tabxfer

#endif // TABXFER_IPC_MEMORYSEGMENT_HH
