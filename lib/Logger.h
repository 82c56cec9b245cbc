#ifndef SY_LEDGER_LOGGER_H
#define SY_LEDGER_LOGGER_H

#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace sy {
namespace logging {

enum class Level { DEBUG = 0, INFO = 1, WARNING = 2, ERROR = 3, CRITICAL = 4 };

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

class LoggerNode;
class LogStream;

class LogProxy {
public:
  LogProxy(std::shared_ptr<LoggerNode> spNode, Level level);

  template <typename T> LogStream operator<<(const T &value);

private:
  std::shared_ptr<LoggerNode> spNode_;
  Level level_;
};

/**
 * Collects one message and hands it to the logger node on destruction.
 */
class LogStream {
public:
  LogStream(std::shared_ptr<LoggerNode> spNode, Level level);
  ~LogStream();

  LogStream(const LogStream &) = delete;
  LogStream &operator=(const LogStream &) = delete;

  LogStream(LogStream &&other) noexcept;
  LogStream &operator=(LogStream &&other) = delete;

  template <typename T> LogStream &operator<<(const T &value) {
    stream_ << value;
    return *this;
  }

private:
  std::shared_ptr<LoggerNode> spNode_;
  Level level_;
  std::ostringstream stream_;
  bool moved_{ false };
};

// Node in the logger tree, keyed by dot-separated name
class LoggerNode : public std::enable_shared_from_this<LoggerNode> {
public:
  explicit LoggerNode(const std::string &name);

  void setLevel(Level level);
  Level getLevel() const;

  void addHandler(std::shared_ptr<Handler> spHandler);
  void addFileHandler(const std::string &filename, Level level);

  void setPropagate(bool propagate);
  bool getPropagate() const;

  void setParent(std::weak_ptr<LoggerNode> parent);
  std::shared_ptr<LoggerNode> getParent() const;

  void log(Level level, const std::string &message);

  const std::string &getName() const { return name_; }
  std::string getFullName() const;

private:
  void dispatch(Level level, const std::string &fullName,
                const std::string &formatted);

  std::string name_;
  std::weak_ptr<LoggerNode> parent_;
  Level level_{ Level::DEBUG };
  bool isLevelSet_{ false };
  bool propagate_{ true };
  std::vector<std::shared_ptr<Handler>> spHandlers_;
  mutable std::mutex mutex_;
};

/**
 * Lightweight handle to a LoggerNode.
 * Copies refer to the same node.
 */
class Logger {
public:
  explicit Logger(std::shared_ptr<LoggerNode> spNode);
  Logger(const Logger &other);
  Logger &operator=(const Logger &other);

  LogProxy debug;
  LogProxy info;
  LogProxy warning;
  LogProxy error;
  LogProxy critical;

  void setLevel(Level level) { spNode_->setLevel(level); }
  Level getLevel() const { return spNode_->getLevel(); }

  void addHandler(std::shared_ptr<Handler> spHandler) {
    spNode_->addHandler(spHandler);
  }
  void addFileHandler(const std::string &filename, Level level = Level::DEBUG) {
    spNode_->addFileHandler(filename, level);
  }

  void setPropagate(bool propagate) { spNode_->setPropagate(propagate); }
  bool getPropagate() const { return spNode_->getPropagate(); }

  /**
   * Re-parent this logger (and its subtree) under another logger.
   * @throws std::invalid_argument if the move would create a cycle
   */
  void redirectTo(const std::string &targetLoggerName);

  Logger getParent() const;

  const std::string &getName() const { return spNode_->getName(); }
  std::string getFullName() const { return spNode_->getFullName(); }

  bool operator==(const Logger &other) const { return spNode_ == other.spNode_; }
  bool operator!=(const Logger &other) const { return spNode_ != other.spNode_; }

private:
  std::shared_ptr<LoggerNode> spNode_;
};

template <typename T> LogStream LogProxy::operator<<(const T &value) {
  LogStream stream(spNode_, level_);
  stream << value;
  return stream;
}

// Global logger registry
Logger getLogger(const std::string &name);
Logger getRootLogger();

Level parseLevel(const std::string &name, Level fallback = Level::INFO);
std::string levelToString(Level level);

} // namespace logging
} // namespace sy

#endif // SY_LEDGER_LOGGER_H
