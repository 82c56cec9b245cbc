#include "Logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace sy {
namespace logging {

static std::string trimLeadingDot(const std::string &name) {
  if (!name.empty() && name[0] == '.') {
    return name.substr(1);
  }
  return name;
}

static std::mutex &getRegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> &
getLoggerRegistry() {
  static std::unordered_map<std::string, std::shared_ptr<LoggerNode>> registry;
  return registry;
}

static std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tmLocal{};
  localtime_r(&time, &tmLocal);

  std::stringstream ss;
  ss << std::put_time(&tmLocal, "%Y-%m-%d %H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

std::string levelToString(Level level) {
  switch (level) {
  case Level::DEBUG:
    return "DEBUG";
  case Level::INFO:
    return "INFO";
  case Level::WARNING:
    return "WARNING";
  case Level::ERROR:
    return "ERROR";
  case Level::CRITICAL:
    return "CRITICAL";
  default:
    return "UNKNOWN";
  }
}

Level parseLevel(const std::string &name, Level fallback) {
  if (name == "debug" || name == "DEBUG") {
    return Level::DEBUG;
  }
  if (name == "info" || name == "INFO") {
    return Level::INFO;
  }
  if (name == "warning" || name == "WARNING") {
    return Level::WARNING;
  }
  if (name == "error" || name == "ERROR") {
    return Level::ERROR;
  }
  if (name == "critical" || name == "CRITICAL") {
    return Level::CRITICAL;
  }
  return fallback;
}

// ConsoleHandler implementation
void ConsoleHandler::emit(Level level, const std::string &loggerName,
                          const std::string &message) {
  if (level < level_) {
    return;
  }
  if (level >= Level::ERROR) {
    std::cerr << message << std::endl;
  } else {
    std::cout << message << std::endl;
  }
}

// FileHandler implementation
FileHandler::FileHandler(const std::string &filename) : filename_(filename) {
  file_.open(filename_, std::ios::app);
  if (!file_.is_open()) {
    throw std::runtime_error("Failed to open log file: " + filename_);
  }
}

FileHandler::~FileHandler() {
  if (file_.is_open()) {
    file_.close();
  }
}

void FileHandler::emit(Level level, const std::string &loggerName,
                       const std::string &message) {
  if (level < level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_ << message << std::endl;
  }
}

// LogProxy implementation
LogProxy::LogProxy(std::shared_ptr<LoggerNode> spNode, Level level)
    : spNode_(std::move(spNode)), level_(level) {}

// LogStream implementation
LogStream::LogStream(std::shared_ptr<LoggerNode> spNode, Level level)
    : spNode_(std::move(spNode)), level_(level) {}

LogStream::~LogStream() {
  if (!moved_ && spNode_) {
    spNode_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : spNode_(std::move(other.spNode_)), level_(other.level_),
      stream_(std::move(other.stream_)) {
  other.moved_ = true;
}

// ========== LoggerNode Implementation ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

void LoggerNode::setLevel(Level level) {
  std::lock_guard<std::mutex> lock(mutex_);
  level_ = level;
  isLevelSet_ = true;
}

Level LoggerNode::getLevel() const {
  // Unset levels inherit from the nearest ancestor that has one
  std::shared_ptr<const LoggerNode> spCurrent = shared_from_this();
  while (spCurrent) {
    {
      std::lock_guard<std::mutex> lock(spCurrent->mutex_);
      if (spCurrent->isLevelSet_) {
        return spCurrent->level_;
      }
    }
    spCurrent = spCurrent->getParent();
  }
  return Level::DEBUG;
}

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::setPropagate(bool propagate) {
  std::lock_guard<std::mutex> lock(mutex_);
  propagate_ = propagate;
}

bool LoggerNode::getPropagate() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return propagate_;
}

void LoggerNode::setParent(std::weak_ptr<LoggerNode> parent) {
  std::lock_guard<std::mutex> lock(mutex_);
  parent_ = parent;
}

std::shared_ptr<LoggerNode> LoggerNode::getParent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parent_.lock();
}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;
  auto current = shared_from_this();
  while (current && !current->getName().empty()) {
    parts.push_back(current->getName());
    current = current->getParent();
  }

  std::string fullName;
  for (auto it = parts.rbegin(); it != parts.rend(); ++it) {
    if (!fullName.empty()) {
      fullName += ".";
    }
    fullName += *it;
  }
  return fullName;
}

void LoggerNode::log(Level level, const std::string &message) {
  if (level < getLevel()) {
    return;
  }

  std::string fullName = getFullName();
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!fullName.empty()) {
    ss << "[" << fullName << "] ";
  }
  ss << message;
  std::string formatted = ss.str();

  // Walk up the tree, stopping at the first node that does not propagate
  std::shared_ptr<LoggerNode> spCurrent = shared_from_this();
  while (spCurrent) {
    spCurrent->dispatch(level, fullName, formatted);
    if (!spCurrent->getPropagate()) {
      break;
    }
    spCurrent = spCurrent->getParent();
  }
}

void LoggerNode::dispatch(Level level, const std::string &fullName,
                          const std::string &formatted) {
  std::vector<std::shared_ptr<Handler>> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers = spHandlers_;
  }
  for (auto &spHandler : handlers) {
    spHandler->emit(level, fullName, formatted);
  }
}

// ========== Logger Implementation ==========

Logger::Logger(std::shared_ptr<LoggerNode> spNode)
    : debug(spNode, Level::DEBUG), info(spNode, Level::INFO),
      warning(spNode, Level::WARNING), error(spNode, Level::ERROR),
      critical(spNode, Level::CRITICAL), spNode_(spNode) {
  if (!spNode_) {
    throw std::invalid_argument("Logger requires a node");
  }
}

Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  if (this != &other) {
    debug = LogProxy(other.spNode_, Level::DEBUG);
    info = LogProxy(other.spNode_, Level::INFO);
    warning = LogProxy(other.spNode_, Level::WARNING);
    error = LogProxy(other.spNode_, Level::ERROR);
    critical = LogProxy(other.spNode_, Level::CRITICAL);
    spNode_ = other.spNode_;
  }
  return *this;
}

Logger Logger::getParent() const {
  auto spParent = spNode_->getParent();
  if (!spParent) {
    return *this;
  }
  return Logger(spParent);
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  auto target = logging::getLogger(targetLoggerName);
  auto spTarget = target.spNode_;

  if (spTarget == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }
  for (auto spAncestor = spTarget; spAncestor;
       spAncestor = spAncestor->getParent()) {
    if (spAncestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
  }
  spNode_->setParent(spTarget);
}

// ========== Global logger management ==========

static std::shared_ptr<LoggerNode> getOrCreateNode(const std::string &name) {
  auto &registry = getLoggerRegistry();
  auto it = registry.find(name);
  if (it != registry.end()) {
    return it->second;
  }

  if (name.empty()) {
    auto spRoot = std::make_shared<LoggerNode>("");
    spRoot->addHandler(std::make_shared<ConsoleHandler>());
    spRoot->setLevel(Level::INFO);
    registry[name] = spRoot;
    return spRoot;
  }

  std::string nodeName = name;
  std::string parentPath;
  auto lastDot = name.rfind('.');
  if (lastDot != std::string::npos) {
    parentPath = name.substr(0, lastDot);
    nodeName = name.substr(lastDot + 1);
  }

  auto spParent = getOrCreateNode(parentPath);
  auto spNode = std::make_shared<LoggerNode>(nodeName);
  spNode->setParent(spParent);
  registry[name] = spNode;
  return spNode;
}

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNode(trimLeadingDot(name)));
}

Logger getRootLogger() { return getLogger(""); }

} // namespace logging
} // namespace sy
