#pragma once
/**
 * @file clock.hpp
 * @brief Injectable wall clock (epoch milliseconds).
 *
 * Components never read the system time directly; they ask the Clock they were
 * given. Tests use ManualClock to step time deterministically.
 */
#include "zonechat_core_export.h"

#include <atomic>
#include <cstdint>

namespace zonechat::zone
{

class ZONECHAT_CORE_EXPORT Clock
{
  public:
    virtual ~Clock() = default;
    [[nodiscard]] virtual int64_t now_ms() const = 0;
};

/** @brief std::chrono::system_clock in epoch milliseconds. */
class ZONECHAT_CORE_EXPORT SystemClock final : public Clock
{
  public:
    [[nodiscard]] int64_t now_ms() const override;
};

/** @brief Clock that only moves when told to. Thread-safe. */
class ZONECHAT_CORE_EXPORT ManualClock final : public Clock
{
  public:
    explicit ManualClock(int64_t start_ms = 0) : m_now(start_ms) {}

    [[nodiscard]] int64_t now_ms() const override { return m_now.load(std::memory_order_acquire); }
    void set(int64_t now_ms) { m_now.store(now_ms, std::memory_order_release); }
    void advance(int64_t delta_ms) { m_now.fetch_add(delta_ms, std::memory_order_acq_rel); }

  private:
    std::atomic<int64_t> m_now;
};

} // namespace zonechat::zone
