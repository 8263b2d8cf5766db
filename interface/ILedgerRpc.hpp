#pragma once

#include "../decoder/Event.h"
#include "../lib/Utilities.h"

#include <cstdint>
#include <string>
#include <vector>

namespace ppi {

/**
 * Pull access to the ledger.
 */
class ILedgerRpc {
public:
    struct TransactionBatch {
        std::vector<RawTransaction> transactions;
        // Every program transaction in [startSlot, coveredUpTo] is in transactions
        uint64_t coveredUpTo{ 0 };
    };

    virtual ~ILedgerRpc() = default;

    virtual Roe<uint64_t> getCurrentSlot() = 0;

    /**
     * Successful transactions of the indexed program in [startSlot, endSlot],
     * ascending by slot.
     *
     * When the range holds more than limit transactions the oldest ones are
     * returned, cut at a slot boundary, and coveredUpTo tells where the next
     * request has to start. A single slot holding more than limit transactions
     * is returned whole, so coveredUpTo is never below startSlot.
     */
    virtual Roe<TransactionBatch> getTransactionsInRange(uint64_t startSlot, uint64_t endSlot,
                                                         size_t limit) = 0;

    virtual Roe<RawTransaction> getTransaction(const std::string& signature) = 0;
};

} // namespace ppi
