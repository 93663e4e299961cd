#pragma once
#ifndef GUTEX_LOGGER_H
#define GUTEX_LOGGER_H
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace gutex {

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Parse a level name ("debug", "WARN", ...) into a LogLevel.
 * @param name Level name, case-insensitive.
 * @param fallback Returned when @p name is not recognised.
 */
LogLevel logLevelFromString(const std::string &name,
                            LogLevel fallback = LogLevel::INFO);

/**
 * @brief Process-wide structured logger.
 *
 * Each record is written as one JSON object per line with the fields
 * `timestamp`, `level`, `message`. Files are rotated by size.
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  static const std::string CONSOLE_ONLY_OUTPUT; // Special value for console-only logging

  static void init(const std::string &logFile,
                   LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);
  static Logger &getInstance();

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void log(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  std::string getTimestamp();
  static std::string levelToString(LogLevel level);
  std::string formatLine(LogLevel level, const std::string &message);
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::recursive_mutex s_mutex;
};

} // namespace gutex

#endif // GUTEX_LOGGER_H
