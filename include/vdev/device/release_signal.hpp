#pragma once

#include <cstddef>
#include <istream>
#include <ostream>

namespace vdev::device {

// Synchronous gate between setup and teardown of a batch. Wait() blocks until
// the operator releases the devices; there is no timeout and no other way out
// short of killing the process (which leaks every device of the batch).
class ReleaseSignal {
 public:
  virtual ~ReleaseSignal() = default;
  virtual void Wait(size_t live_devices) = 0;
};

// Prompts on `out` and waits for one line on `in`. End of input also
// releases, so a closed stdin cannot hang the batch forever.
class StreamReleaseSignal final : public ReleaseSignal {
 public:
  StreamReleaseSignal(std::istream& in, std::ostream& out)
      : in_(in), out_(out) {
  }

  void Wait(size_t live_devices) override;

 private:
  std::istream& in_;
  std::ostream& out_;
};

// Already satisfied. Counts how often it was waited on.
class ImmediateReleaseSignal final : public ReleaseSignal {
 public:
  void Wait(size_t live_devices) override {
    ++wait_count_;
    last_live_devices_ = live_devices;
  }

  [[nodiscard]] auto WaitCount() const -> size_t {
    return wait_count_;
  }
  [[nodiscard]] auto LastLiveDevices() const -> size_t {
    return last_live_devices_;
  }

 private:
  size_t wait_count_ = 0;
  size_t last_live_devices_ = 0;
};

}  // namespace vdev::device
