#include "config.hh"
#include "protocol/commit_reveal.hh"

namespace slp {

std::optional<std::string> SimulationConfig::validate() const {
    if (num_transactions == 0) {
        return "transactions must be positive";
    }
    if (!(attack_probability >= 0.0 && attack_probability <= 1.0)) {
        return "attack probability must be within [0, 1]";
    }
    if (min_swap == 0 || min_swap > max_swap) {
        return "swap range must satisfy 0 < min <= max";
    }
    if (min_swap < ProtocolConfig::MIN_AMOUNT) {
        return "minimum swap is below the protocol minimum commitment amount";
    }
    if (initial_liquidity <= MINIMUM_LIQUIDITY) {
        return "initial liquidity too small to seed the pool";
    }
    if (fee_bps > MAX_ADMIN_FEE_BPS) {
        return "fee exceeds the pool maximum";
    }
    if (num_traders == 0) {
        return "at least one trader per population is required";
    }
    if (normal_slippage_bps > BPS_DENOMINATOR) {
        return "normal slippage exceeds 100%";
    }
    if (protected_slippage_bps > ProtocolConfig::MAX_SLIPPAGE_BPS) {
        return "protected slippage exceeds the protocol cap";
    }
    if (reveal_delay_seconds < ProtocolConfig::MIN_DELAY_SECONDS) {
        return "reveal delay is shorter than the protocol minimum";
    }
    return std::nullopt;
}

}  // namespace slp
