#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "../db/Stream.hpp"

// A connection parked in XREAD BLOCK.
struct BlockedXReadClient {
    int fd;
    uint64_t deadline_ms;                                   // steady clock, 0 = forever
    std::vector<std::pair<std::string, StreamId>> streams;  // key → exclusive "after" ID
    long long count;                                        // COUNT limit, 0 = unlimited
};

// A connection parked in WAIT.
struct BlockedWaitClient {
    int fd;
    uint64_t deadline_ms;   // steady clock, 0 = forever
    uint64_t target_offset;
    long long num_replicas;
};
