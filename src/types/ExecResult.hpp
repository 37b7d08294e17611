#pragma once
#include <string>
#include <utility>

/**
 * Outcome of one dispatched command.
 *
 *   reply      RESP bytes for the caller (empty when nothing is sent now)
 *   blocked    the caller was parked (XREAD BLOCK, WAIT); its answer will
 *              arrive later through the Outbox
 *   target_fd  connection the reply belongs to
 */
struct ExecResult {
    std::string reply;
    bool blocked;
    int target_fd;

    ExecResult(std::string r, bool b, int fd)
        : reply(std::move(r)), blocked(b), target_fd(fd) {}
};
