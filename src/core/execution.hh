#pragma once

#include "core/errors.hh"
#include "core/types.hh"

namespace slp {

// ============================================================================
// Intent Kind
// ============================================================================

// STAKE moves value A -> B (SOL -> slpSOL), UNSTAKE moves B -> A
enum class IntentKind : std::uint8_t {
    STAKE = 0,
    UNSTAKE = 1,
};

[[nodiscard]] inline std::string_view intent_kind_string(IntentKind kind) {
    switch (kind) {
        case IntentKind::STAKE: return "stake";
        case IntentKind::UNSTAKE: return "unstake";
    }
    return "unknown";
}

[[nodiscard]] inline SwapDirection intent_direction(IntentKind kind) {
    return kind == IntentKind::STAKE ? SwapDirection::A_TO_B : SwapDirection::B_TO_A;
}

// ============================================================================
// Execution Target - venue that moves value when an intent is revealed
// ============================================================================

struct ExecutionQuote {
    lamports_t amount_out = 0;
    lamports_t fee = 0;
    ErrorCode error = ErrorCode::OK;

    [[nodiscard]] bool ok() const { return error == ErrorCode::OK; }
};

class ExecutionTarget {
public:
    virtual ~ExecutionTarget() = default;

    // Output the intent would receive against current state; no mutation
    [[nodiscard]] virtual ExecutionQuote quote(IntentKind kind, lamports_t amount_in) const = 0;

    // Apply the intent. On error the target state is unchanged.
    virtual ExecutionQuote execute(IntentKind kind, lamports_t amount_in) = 0;

    [[nodiscard]] virtual std::string_view venue_name() const = 0;
};

}  // namespace slp
