#pragma once

#include "../lib/Utilities.h"

#include <cstdint>
#include <optional>

namespace ppi {

struct Checkpoint {
    uint64_t lastProcessedSlot{ 0 };
    // Seconds since epoch
    int64_t updatedAt{ 0 };
};

/**
 * Durable high-water mark of processed slots. Never moves backwards.
 */
class ICheckpointStore {
public:
    virtual ~ICheckpointStore() = default;

    // Empty when nothing was ever processed
    virtual Roe<std::optional<Checkpoint>> load() = 0;

    /**
     * Raise the checkpoint to slot.
     * @return true if it moved, false if slot was not above the current value
     */
    virtual Roe<bool> advance(uint64_t slot) = 0;
};

} // namespace ppi
