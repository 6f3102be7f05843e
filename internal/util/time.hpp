#pragma once

#include <chrono>
#include <cstdint>

namespace lifebank::util {

/*
  Ledger time: unsigned unix seconds.

  Components read the time through LedgerClock and never own it;
  tests drive a ManualClock.
*/

using Timestamp = std::uint64_t;

constexpr Timestamp kSecondsPerDay = 86400;

class LedgerClock {
 public:
  virtual ~LedgerClock() = default;

  virtual Timestamp Now() const = 0;
};

class SystemClock final : public LedgerClock {
 public:
  Timestamp Now() const override;
};

class ManualClock final : public LedgerClock {
 public:
  explicit ManualClock(Timestamp start = 0) : now_(start) {
  }

  Timestamp Now() const override {
    return now_;
  }

  void Set(Timestamp ts) {
    now_ = ts;
  }

  void Advance(Timestamp seconds) {
    now_ += seconds;
  }

 private:
  Timestamp now_;
};

Timestamp ToUnixSeconds(std::chrono::system_clock::time_point tp);

} // namespace lifebank::util
