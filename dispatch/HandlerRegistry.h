#ifndef PP_INDEXER_HANDLER_REGISTRY_H
#define PP_INDEXER_HANDLER_REGISTRY_H

#include "../decoder/Event.h"
#include "../interface/IEventStore.hpp"
#include "../lib/Module.h"

#include <functional>
#include <map>

namespace ppi {

/**
 * Maps each event kind to the domain handler that applies it.
 *
 * Handlers run inside the storage transaction of the event (under a
 * savepoint) so their own writes commit or roll back with it. Handlers are
 * registered before the indexer starts and are not changed afterwards.
 */
class HandlerRegistry : public Module {
public:
  using Handler = std::function<Roe<void>(IEventStore::Transaction &, const ParsedEvent &)>;

  HandlerRegistry();

  /** Replaces any handler already registered for kind */
  void registerHandler(EventKind kind, Handler handler);

  const Handler *find(EventKind kind) const;
  bool has(EventKind kind) const { return find(kind) != nullptr; }
  size_t size() const { return handlers_.size(); }

  /**
   * Run the handler for the event's kind.
   * A kind without handler is logged and treated as handled.
   */
  Roe<void> dispatch(IEventStore::Transaction &tx, const ParsedEvent &event) const;

private:
  std::map<EventKind, Handler> handlers_;
};

} // namespace ppi

#endif // PP_INDEXER_HANDLER_REGISTRY_H
