#pragma once
#include <string>
#include <vector>

/**
 * Per-connection MULTI/EXEC state.
 *
 *   IDLE      → commands run immediately
 *   QUEUING   → commands are validated and appended to `queue`
 *   ABORTED   → a queued command failed validation; EXEC will refuse
 *               to run anything (the failed command still took a slot)
 */
struct TransactionState {
    enum class Phase { IDLE, QUEUING, ABORTED };

    Phase phase = Phase::IDLE;
    std::vector<std::vector<std::string>> queue;
    std::string abort_reason;

    bool active() const { return phase != Phase::IDLE; }

    void reset() {
        phase = Phase::IDLE;
        queue.clear();
        abort_reason.clear();
    }
};
