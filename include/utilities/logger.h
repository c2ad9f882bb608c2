#pragma once
#ifndef _SHAREDICT_LOGGER_H_
#define _SHAREDICT_LOGGER_H_
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide JSON-lines logger.
 *
 * Every record is written as a single JSON object with the keys
 * "timestamp", "level", "component" (optional) and "message". File output
 * rotates once the file reaches @c maxFileSize, keeping up to
 * @c maxBackupFiles numbered backups (name.1 is the newest).
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  /**
   * @brief Parse a level name such as "debug" or "WARN".
   * @throw std::invalid_argument For unknown names.
   */
  static LogLevel parseLevel(const std::string &name);
  static std::string levelToString(LogLevel level);

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;

  void log(LogLevel level, const std::string &message);
  void log(LogLevel level, const std::string &component,
           const std::string &message);

  /**
   * @brief printf-style convenience wrappers.
   *
   * Each formats into a bounded buffer and forwards to Logger::log, so they
   * are thread-safe as well.
   */
  static void debug(const char *format, ...);
  static void info(const char *format, ...);

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

public:
  ~Logger();

private:
  std::string getTimestamp();
  std::string formatRecord(LogLevel level, const std::string &component,
                           const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::recursive_mutex s_mutex;
};

#endif
