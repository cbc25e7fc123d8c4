#pragma once

namespace execmon::kernel {

/*
  Host capability to cancel whatever code is currently running.

  Delivery is cooperative: the running code observes the request at its
  next checkpoint. Returns false when nothing was running to receive it.
*/
class InterruptHandle {
 public:
  virtual ~InterruptHandle() = default;

  virtual bool InterruptCurrentExecution() = 0;
};

} // namespace execmon::kernel
