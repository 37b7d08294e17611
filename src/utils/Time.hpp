#pragma once
#include <chrono>
#include <cstdint>


/*
------------------------------------------------------------------------------
  CLOCKS USED BY THE SERVER
------------------------------------------------------------------------------

1) std::chrono::steady_clock
   - Monotonic, never jumps backwards.
   - Used for blocking deadlines (XREAD BLOCK, WAIT) and periodic timers.

2) std::chrono::system_clock
   - Wall-clock time since the Unix epoch.
   - Used for key expiry (persisted in snapshots as absolute Unix ms)
     and for stream entry IDs.

A deadline of 0 always means "no deadline".
------------------------------------------------------------------------------
*/

/**
 * @brief Returns the current monotonic time in milliseconds.
 *
 * Only differences between two calls are meaningful.
 */
inline uint64_t current_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}


/**
 * @brief Returns the current Unix timestamp in milliseconds.
 *
 * Used for absolute key expiry and for auto-generated stream IDs.
 */
inline uint64_t unix_time_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}
