#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <mutex>

// AppLogger class for centralized, thread-safe logging.
// The capture thread, the orchestration scheduler and the IO worker all log
// through the same instance.
class AppLogger
{
public:
  enum class Level
  {
    Debug = 0,
    Info,
    Warn,
    Error
  };

  static AppLogger &getInstance();

  bool open(const std::string &filename);

  void setLevel(Level level);
  Level level() const;

  void debug(const std::string &message);

  void info(const std::string &message);

  void warn(const std::string &message);

  void error(const std::string &message);

  static Level levelFromString(const std::string &name, Level fallback);

  ~AppLogger();

private:
  AppLogger();

  AppLogger(const AppLogger &) = delete;
  AppLogger &operator=(const AppLogger &) = delete;

  mutable std::mutex mutex_;
  std::ofstream logFile;
  Level minLevel_ = Level::Info;

  std::string getTimestamp();

  void write(Level level, const char *tag, const std::string &message);
};
