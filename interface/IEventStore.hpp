#pragma once

#include "../decoder/Event.h"
#include "../lib/Utilities.h"

#include <cstdint>
#include <memory>
#include <string>

namespace ppi {

/**
 * Durable storage of decoded events.
 * Each dedup key is stored at most once; a second store of the same key
 * reports DUPLICATE instead of failing.
 */
class IEventStore {
public:
    enum class StoreResult : uint8_t { INSERTED, DUPLICATE };

    /**
     * One unit of work. Destroying an uncommitted transaction rolls it back.
     * Savepoints nest inside the transaction and let a caller undo part of
     * its work without losing the rest.
     */
    class Transaction {
    public:
        virtual ~Transaction() = default;

        virtual Roe<void> commit() = 0;
        virtual Roe<void> rollback() = 0;

        virtual Roe<void> savepoint(const std::string& name) = 0;
        virtual Roe<void> release(const std::string& name) = 0;
        virtual Roe<void> rollbackTo(const std::string& name) = 0;
    };

    virtual ~IEventStore() = default;

    virtual Roe<std::unique_ptr<Transaction>> begin() = 0;
    virtual Roe<StoreResult> storeEvent(Transaction& tx, const ParsedEvent& event) = 0;

    virtual Roe<uint64_t> countEvents() = 0;
    virtual Roe<bool> hasEvent(const DedupKey& key) = 0;
};

} // namespace ppi
