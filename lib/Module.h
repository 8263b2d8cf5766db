#pragma once

#include "Logger.h"
#include <memory>
#include <string>

namespace ppi {

/**
 * Named pipeline component with its own logger.
 *
 * Components are created with a short name ("source", "dispatcher") and the
 * owner re-parents them under its own logger, so the indexer's components
 * log as "ppi.indexer.source" and so on.
 */
class Module {
public:
  explicit Module(const std::string &name);
  virtual ~Module() = default;

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  /**
   * Attach this module's logger below targetLoggerName.
   * Loggers already created below this one follow it.
   * @throws std::invalid_argument if that would create a cycle
   */
  void redirectLogger(const std::string &targetLoggerName);

  logging::Logger &log() const;

private:
  std::shared_ptr<logging::Logger> spLogger_;
};

} // namespace ppi
