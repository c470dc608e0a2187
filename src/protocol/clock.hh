#pragma once

#include "core/types.hh"

namespace slp {

// ============================================================================
// Ledger Clock - authoritative time source for commit stamping and delay checks
// ============================================================================

class LedgerClock {
public:
    virtual ~LedgerClock() = default;
    [[nodiscard]] virtual unix_time_t now() const = 0;
};

class SystemLedgerClock : public LedgerClock {
public:
    [[nodiscard]] unix_time_t now() const override;
};

// Manually advanced clock for simulation and tests
class ManualLedgerClock : public LedgerClock {
public:
    explicit ManualLedgerClock(unix_time_t start = 0) : now_(start) {}

    [[nodiscard]] unix_time_t now() const override { return now_; }

    void set(unix_time_t t) { now_ = t; }
    void advance(std::int64_t seconds) { now_ += seconds; }

private:
    unix_time_t now_;
};

}  // namespace slp
