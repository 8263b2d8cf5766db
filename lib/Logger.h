#ifndef PP_INDEXER_LOGGER_H
#define PP_INDEXER_LOGGER_H

#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace ppi {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

/**
 * Parse a level name ("debug", "INFO", ...) as used in config files.
 * @return true if the name was recognized
 */
bool parseLevel(const std::string &name, Level &level);

class Handler {
public:
  virtual ~Handler() = default;
  virtual void emit(Level level, const std::string &loggerName,
                    const std::string &message) = 0;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

protected:
  Level level_ = Level::DEBUG;
};

class ConsoleHandler : public Handler {
public:
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;
};

class FileHandler : public Handler {
public:
  explicit FileHandler(const std::string &filename);
  ~FileHandler() override;
  void emit(Level level, const std::string &loggerName,
            const std::string &message) override;

private:
  std::ofstream file_;
  std::string filename_;
  std::mutex mutex_;
};

// Forward declarations
class Logger;
class LogStream;
class LoggerNode;

class LogProxy {
public:
  LogProxy(Logger *logger, Level level);

  // Stream operator that creates LogStream
  template <typename T> LogStream operator<<(const T &value);

private:
  friend class Logger;

  Logger *logger_;
  Level level_;
};

class LogStream {
public:
  LogStream(Logger *logger, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  LogStream(LogStream &&other) noexcept;
  LogStream &operator=(LogStream &&other) noexcept;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  Logger *logger_;
  Level level_;
  std::ostringstream stream_;
  bool moved_;
};

// LoggerNode - Internal tree node structure
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  explicit LoggerNode(const std::string &name);
  ~LoggerNode() = default;

  void setLevel(Level level) { level_ = level; }
  Level getLevel() const { return level_; }

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level);
  void clearHandlers();

  // Control log propagation to parent
  void setPropagate(bool propagate) { propagate_ = propagate; }
  bool getPropagate() const { return propagate_; }

  void setParent(std::weak_ptr<LoggerNode> parent);
  std::shared_ptr<LoggerNode> getParent() const;
  void addChild(std::shared_ptr<LoggerNode> child);
  void removeChild(LoggerNode *child);

  void log(Level level, const std::string &message);

  // Only the node name, not the full path
  const std::string &getName() const { return name_; }
  // Full hierarchical name, built by walking up to the root
  std::string getFullName() const;

private:
  void logFrom(Level level, const std::string &message,
               const std::string &originName);
  void logToHandlers(Level level, const std::string &message,
                     const std::string &originName);
  static std::string formatMessage(Level level, const std::string &message,
                                   const std::string &originName);

  std::string name_;
  std::weak_ptr<LoggerNode> parent_;
  Level level_{ Level::DEBUG };
  bool propagate_{ true };
  std::vector<std::shared_ptr<LoggerNode>> spChildren_;
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

// Logger - Lightweight wrapper providing access to LoggerNode
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> node);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);
  ~Logger() = default;

  // Stream-style logging as member variables
  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { spNode_->setLevel(level); }
  Level getLevel() const { return spNode_->getLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) { spNode_->addHandler(spHandler); }
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG) {
    spNode_->addFileHandler(filename, level);
  }

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  // Re-parent this logger (and its children) under another logger
  void redirectTo(const std::string &targetLoggerName);

  const std::string &getName() const { return spNode_->getName(); }
  std::string getFullName() const { return spNode_->getFullName(); }

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  friend class LogStream;

  std::shared_ptr<LoggerNode> getNode() const { return spNode_; }
  void log(Level level, const std::string &message) { spNode_->log(level, message); }

  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(logger_, level_);
  stream << value;
  return stream;
}

// Global logger management
Logger getLogger(const std::string &name);
Logger getRootLogger();

// Level of the root logger
Level getLevel();
void setLevel(Level level);

} // namespace logging
} // namespace ppi

#endif // PP_INDEXER_LOGGER_H
