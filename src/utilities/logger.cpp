#include "utilities/logger.h"
#include "utilities/json.hpp"
#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <new>

Logger *Logger::s_instance = nullptr;
std::recursive_mutex Logger::s_mutex;
const std::string Logger::CONSOLE_ONLY_OUTPUT = "::CONSOLE::";

void Logger::init(const std::string &logFile, LogLevel level,
                  long long maxFileSizeVal, int maxBackupFilesVal) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  delete s_instance;
  s_instance = nullptr;
  try {
    s_instance = new Logger(logFile, level, maxFileSizeVal, maxBackupFilesVal);
  } catch (const std::bad_alloc &bae) {
    std::cerr << "[Logger::init] CRITICAL: allocation failed: " << bae.what()
              << std::endl;
  }
}

Logger &Logger::getInstance() {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (!s_instance) {
    std::cerr << "CRITICAL_WARNING: Logger::getInstance() called before "
                 "Logger::init(). Falling back to console output."
              << std::endl;
    Logger::init(Logger::CONSOLE_ONLY_OUTPUT, LogLevel::WARN);
    if (!s_instance) {
      throw std::runtime_error("Logger not initialized. Call Logger::init() "
                               "first. Emergency init also failed.");
    }
  }
  return *s_instance;
}

Logger::Logger(const std::string &logFile, LogLevel level,
               long long maxFileSizeVal, int maxBackupFilesVal)
    : currentLogLevel(level), logFilePath(logFile), maxFileSize(maxFileSizeVal),
      maxBackupFiles(maxBackupFilesVal) {
  if (logFile != CONSOLE_ONLY_OUTPUT) {
    logFileStream.open(logFilePath, std::ios::app);
    if (!logFileStream.is_open()) {
      std::cerr << "Error: Could not open log file: " << logFilePath
                << std::endl;
    }
  }
}

Logger::~Logger() {
  if (logFileStream.is_open()) {
    logFileStream.close();
  }
}

LogLevel Logger::parseLevel(const std::string &name) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  if (upper == "TRACE")
    return TRACE;
  if (upper == "DEBUG")
    return DEBUG;
  if (upper == "INFO")
    return INFO;
  if (upper == "WARN" || upper == "WARNING")
    return WARN;
  if (upper == "ERROR")
    return ERROR;
  if (upper == "FATAL")
    return FATAL;
  throw std::invalid_argument("Unknown log level: " + name);
}

std::string Logger::levelToString(LogLevel level) {
  switch (level) {
  case TRACE:
    return "TRACE";
  case DEBUG:
    return "DEBUG";
  case INFO:
    return "INFO";
  case WARN:
    return "WARN";
  case ERROR:
    return "ERROR";
  case FATAL:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  currentLogLevel = level;
}

LogLevel Logger::getLogLevel() const {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  return currentLogLevel;
}

std::string Logger::formatRecord(LogLevel level, const std::string &component,
                                 const std::string &message) {
  JsonValue obj(JsonValueType::Object);
  JsonValue ts(JsonValueType::String);
  ts.string_value = getTimestamp();
  JsonValue lvl(JsonValueType::String);
  lvl.string_value = levelToString(level);
  JsonValue comp(JsonValueType::String);
  comp.string_value = component;
  JsonValue msg(JsonValueType::String);
  msg.string_value = message;
  obj.InsertIntoObject("timestamp", &ts);
  obj.InsertIntoObject("level", &lvl);
  if (!component.empty())
    obj.InsertIntoObject("component", &comp);
  obj.InsertIntoObject("message", &msg);
  return obj.ToString();
}

void Logger::rotateIfNeeded() {
  if (!logFileStream.is_open() || maxFileSize <= 0)
    return;
  logFileStream.clear();
  logFileStream.flush();
  if (logFileStream.tellp() < maxFileSize)
    return;

  logFileStream.close();
  if (maxBackupFiles == 0) {
    std::remove(logFilePath.c_str());
  } else {
    std::string tooOld = logFilePath + "." + std::to_string(maxBackupFiles);
    std::remove(tooOld.c_str());
    for (int i = maxBackupFiles - 1; i >= 1; --i) {
      std::string from = logFilePath + "." + std::to_string(i);
      std::string to = logFilePath + "." + std::to_string(i + 1);
      std::ifstream probe(from.c_str());
      if (probe.good()) {
        probe.close();
        std::rename(from.c_str(), to.c_str());
      }
    }
    std::rename(logFilePath.c_str(), (logFilePath + ".1").c_str());
  }
  logFileStream.open(logFilePath, std::ios::app);
  if (!logFileStream.is_open()) {
    std::cerr << "Error: Could not re-open log file after rotation: "
              << logFilePath << std::endl;
  }
}

void Logger::log(LogLevel level, const std::string &message) {
  log(level, std::string(), message);
}

void Logger::log(LogLevel level, const std::string &component,
                 const std::string &message) {
  std::lock_guard<std::recursive_mutex> lock(s_mutex);
  if (level < currentLogLevel) {
    return;
  }
  const std::string line = formatRecord(level, component, message);

  if (logFilePath == CONSOLE_ONLY_OUTPUT) {
    std::cout << line << std::endl;
    return;
  }
  rotateIfNeeded();
  if (logFileStream.is_open()) {
    logFileStream << line << std::endl;
  }
}

namespace {

void logFormatted(LogLevel level, const char *format, va_list args) {
  char buffer[512];
  vsnprintf(buffer, sizeof(buffer), format, args);
  Logger::getInstance().log(level, buffer);
}

} // namespace

void Logger::debug(const char *format, ...) {
  va_list args;
  va_start(args, format);
  logFormatted(LogLevel::DEBUG, format, args);
  va_end(args);
}

void Logger::info(const char *format, ...) {
  va_list args;
  va_start(args, format);
  logFormatted(LogLevel::INFO, format, args);
  va_end(args);
}

std::string Logger::getTimestamp() {
  std::time_t currentTime = std::time(nullptr);
  std::tm localTime{};
  localtime_r(&currentTime, &localTime);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", &localTime);
  return std::string(timestamp);
}
