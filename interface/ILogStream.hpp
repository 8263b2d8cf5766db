#pragma once

#include "../lib/Utilities.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ppi {

struct LogNotification {
    std::string signature;
    uint64_t slot{ 0 };
    // Transaction failed on chain
    bool failed{ false };
    std::vector<std::string> logs;
};

/**
 * Push access to program logs.
 */
class ILogStream {
public:
    virtual ~ILogStream() = default;

    /** Connect and wait for the subscription to be confirmed */
    virtual Roe<void> subscribe(const std::string& programId) = 0;

    /** Block until the next notification; an error means the stream is gone */
    virtual Roe<LogNotification> next() = 0;

    /** Safe to call from another thread, unblocks next() */
    virtual void close() = 0;
};

} // namespace ppi
