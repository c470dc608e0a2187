#include "clock.hh"
#include <chrono>

namespace slp {

unix_time_t SystemLedgerClock::now() const {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace slp
