#ifndef REDACT_RUN_CONTROL_HPP
#define REDACT_RUN_CONTROL_HPP

#include "PIITypes.hpp"

#include <atomic>
#include <chrono>

namespace redact {

/**
 * @brief Deadline and cancellation flag for one pipeline invocation
 */
class RunControl {
public:
  /**
   * @param timeoutMs Budget in milliseconds from construction; 0 = unbounded
   * @param cancelFlag Optional caller-owned flag; must outlive this object
   */
  explicit RunControl(long timeoutMs = 0,
                      const std::atomic<bool> *cancelFlag = nullptr)
      : m_start(std::chrono::steady_clock::now()), m_timeoutMs(timeoutMs),
        m_cancelFlag(cancelFlag) {}

  /**
   * @brief Cancelled, TimedOut, or None if the run may continue
   */
  ErrorKind check() const {
    if (m_cancelFlag && m_cancelFlag->load()) {
      return ErrorKind::Cancelled;
    }
    if (m_timeoutMs > 0 && elapsedMs() > static_cast<double>(m_timeoutMs)) {
      return ErrorKind::TimedOut;
    }
    return ErrorKind::None;
  }

  double elapsedMs() const {
    return std::chrono::duration<double, std::milli>(
               std::chrono::steady_clock::now() - m_start)
        .count();
  }

private:
  std::chrono::steady_clock::time_point m_start;
  long m_timeoutMs;
  const std::atomic<bool> *m_cancelFlag;
};

} // namespace redact

#endif // REDACT_RUN_CONTROL_HPP
