#include "HandlerRegistry.h"

namespace ppi {

HandlerRegistry::HandlerRegistry() : Module("dispatcher.handlers") {}

void HandlerRegistry::registerHandler(EventKind kind, Handler handler) {
  if (handlers_.count(kind) > 0) {
    log().warning << "Replacing handler for " << getKindKey(kind);
  }
  handlers_[kind] = std::move(handler);
}

const HandlerRegistry::Handler *HandlerRegistry::find(EventKind kind) const {
  auto it = handlers_.find(kind);
  return it == handlers_.end() ? nullptr : &it->second;
}

Roe<void> HandlerRegistry::dispatch(IEventStore::Transaction &tx, const ParsedEvent &event) const {
  const Handler *handler = find(event.kind);
  if (handler == nullptr) {
    log().warning << "No handler for " << getKindKey(event.kind) << " in " << event.signature;
    return {};
  }
  return (*handler)(tx, event);
}

} // namespace ppi
