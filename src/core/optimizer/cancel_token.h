#pragma once

#include <atomic>

namespace rc {
namespace optimizer {

// Cooperative cancellation flag shared between a batch and its jobs.
// Set from any thread; polled between job boundaries and assembler iterations.
class CancelToken {
  public:
    virtual ~CancelToken() = default;

    void cancel() { m_cancelled.store(true, std::memory_order_release); }
    void reset() { m_cancelled.store(false, std::memory_order_release); }
    virtual bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

  private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace optimizer
} // namespace rc
