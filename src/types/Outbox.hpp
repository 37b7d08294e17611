#pragma once
#include <string>
#include <utility>
#include <vector>

#include "ExecResult.hpp"

/**
 * Writes addressed to connections other than the one currently being
 * served: wake-ups of blocked readers, WAIT answers, and the replication
 * stream. The event loop drains it after every dispatch, in push order,
 * which keeps the replication stream in execution order.
 */
class Outbox {
public:
    void push(int fd, std::string payload) {
        if (payload.empty())
            return;
        pending.emplace_back(std::move(payload), false, fd);
    }

    std::vector<ExecResult> drain() {
        std::vector<ExecResult> out;
        out.swap(pending);
        return out;
    }

    bool empty() const { return pending.empty(); }

private:
    std::vector<ExecResult> pending;
};
