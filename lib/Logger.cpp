#include "Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <unordered_map>

namespace lw {
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

// Keyed by full hierarchical name, "" is the root
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

  std::tm local{};
  localtime_r(&time, &local);

  std::stringstream ss;
  ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
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

bool parseLevel(const std::string &name, Level &level) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "DEBUG") {
    level = Level::DEBUG;
  } else if (upper == "INFO") {
    level = Level::INFO;
  } else if (upper == "WARNING" || upper == "WARN") {
    level = Level::WARNING;
  } else if (upper == "ERROR") {
    level = Level::ERROR;
  } else if (upper == "CRITICAL") {
    level = Level::CRITICAL;
  } else {
    return false;
  }
  return true;
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
LogProxy::LogProxy(Logger *logger, Level level)
    : logger_(logger), level_(level) {}

// LogStream implementation
LogStream::LogStream(Logger *logger, Level level)
    : logger_(logger), level_(level), moved_(false) {}

LogStream::~LogStream() {
  if (!moved_ && logger_) {
    logger_->log(level_, stream_.str());
  }
}

LogStream::LogStream(LogStream &&other) noexcept
    : logger_(other.logger_), level_(other.level_),
      stream_(std::move(other.stream_)), moved_(false) {
  other.moved_ = true;
}

LogStream &LogStream::operator=(LogStream &&other) noexcept {
  if (this != &other) {
    logger_ = other.logger_;
    level_ = other.level_;
    stream_ = std::move(other.stream_);
    moved_ = false;
    other.moved_ = true;
  }
  return *this;
}

// ========== LoggerNode Implementation ==========

LoggerNode::LoggerNode(const std::string &name) : name_(name) {}

std::string LoggerNode::getFullName() const {
  std::vector<std::string> parts;

  auto current = std::const_pointer_cast<LoggerNode>(shared_from_this());
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

void LoggerNode::addHandler(std::shared_ptr<Handler> spHandler) {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.push_back(spHandler);
}

void LoggerNode::addFileHandler(const std::string &filename, Level level) {
  auto spHandler = std::make_shared<FileHandler>(filename);
  spHandler->setLevel(level);
  addHandler(spHandler);
}

void LoggerNode::clearHandlers() {
  std::lock_guard<std::mutex> lock(mutex_);
  spHandlers_.clear();
}

void LoggerNode::setParent(std::weak_ptr<LoggerNode> parent) {
  std::lock_guard<std::mutex> lock(mutex_);
  parent_ = parent;
}

std::shared_ptr<LoggerNode> LoggerNode::getParent() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parent_.lock();
}

void LoggerNode::addChild(std::shared_ptr<LoggerNode> child) {
  std::lock_guard<std::mutex> lock(mutex_);
  spChildren_.push_back(child);
}

void LoggerNode::removeChild(LoggerNode *child) {
  std::lock_guard<std::mutex> lock(mutex_);
  spChildren_.erase(
      std::remove_if(spChildren_.begin(), spChildren_.end(),
                     [child](const std::shared_ptr<LoggerNode> &spNode) {
                       return spNode.get() == child;
                     }),
      spChildren_.end());
}

std::vector<std::shared_ptr<LoggerNode>> LoggerNode::getChildren() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spChildren_;
}

void LoggerNode::log(Level level, const std::string &message) {
  logFrom(level, message, getFullName());
}

void LoggerNode::logFrom(Level level, const std::string &message,
                         const std::string &originName) {
  // Below this node's threshold: dropped for the whole chain
  if (level < level_) {
    return;
  }
  logToHandlers(level, message, originName);

  if (propagate_) {
    auto parentNode = getParent();
    if (parentNode) {
      parentNode->logFrom(level, message, originName);
    }
  }
}

void LoggerNode::logToHandlers(Level level, const std::string &message,
                               const std::string &originName) {
  std::vector<std::shared_ptr<Handler>> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spHandlers_.empty()) {
      return;
    }
    handlers = spHandlers_;
  }

  std::string formatted = formatMessage(level, message, originName);
  for (auto &spHandler : handlers) {
    spHandler->emit(level, originName, formatted);
  }
}

std::string LoggerNode::formatMessage(Level level, const std::string &message,
                                      const std::string &originName) const {
  std::stringstream ss;
  ss << "[" << getCurrentTimestamp() << "] ";
  ss << "[" << levelToString(level) << "] ";
  if (!originName.empty()) {
    ss << "[" << originName << "] ";
  }
  ss << message;
  return ss.str();
}

// ========== Logger Implementation ==========

Logger::Logger(std::shared_ptr<LoggerNode> node)
    : debug(this, Level::DEBUG), info(this, Level::INFO),
      warning(this, Level::WARNING), error(this, Level::ERROR),
      critical(this, Level::CRITICAL), spNode_(node) {}

// Proxies must point at the new handle, not the copied one
Logger::Logger(const Logger &other) : Logger(other.spNode_) {}

Logger &Logger::operator=(const Logger &other) {
  spNode_ = other.spNode_;
  return *this;
}

Logger Logger::getParent() const {
  return Logger(spNode_ ? spNode_->getParent() : nullptr);
}

std::vector<Logger> Logger::getChildren() const {
  std::vector<Logger> result;
  if (!spNode_) {
    return result;
  }
  for (const auto &spChild : spNode_->getChildren()) {
    result.push_back(Logger(spChild));
  }
  return result;
}

void Logger::redirectTo(const std::string &targetLoggerName) {
  auto target = logging::getLogger(targetLoggerName);
  auto spTarget = target.spNode_;

  if (!spTarget || !spNode_) {
    throw std::invalid_argument("Cannot redirect null logger");
  }
  if (spTarget == spNode_) {
    throw std::invalid_argument("Cannot redirect logger to itself");
  }

  // Reject cycles: the target must not live under this logger
  auto ancestor = spTarget;
  while (ancestor) {
    if (ancestor == spNode_) {
      throw std::invalid_argument("Cannot create circular parent relationship");
    }
    ancestor = ancestor->getParent();
  }

  auto spOldParent = spNode_->getParent();
  if (spOldParent) {
    spOldParent->removeChild(spNode_.get());
  }
  spNode_->setParent(spTarget);
  spTarget->addChild(spNode_);
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
    spRoot->setLevel(Level::INFO);
    spRoot->addHandler(std::make_shared<ConsoleHandler>());
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
  spParent->addChild(spNode);
  registry[name] = spNode;
  return spNode;
}

Logger getLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(getRegistryMutex());
  return Logger(getOrCreateNode(trimLeadingDot(name)));
}

Logger getRootLogger() { return getLogger(""); }

Level getLevel() { return getRootLogger().getLevel(); }

void setLevel(Level level) { getRootLogger().setLevel(level); }

} // namespace logging
} // namespace lw
