#include "AppLogger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>

AppLogger &AppLogger::getInstance()
{
  static AppLogger instance;
  return instance;
}

AppLogger::AppLogger() = default;

AppLogger::~AppLogger()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (logFile.is_open())
  {
    logFile << "--- Log Ended: " << getTimestamp() << " ---\n";
    logFile.close();
  }
}

bool AppLogger::open(const std::string &filename)
{
  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::path logPath(filename);
  if (logPath.has_parent_path())
  {
    std::error_code ec;
    std::filesystem::create_directories(logPath.parent_path(), ec);
    if (ec)
    {
      std::cerr << "Error: Could not create log directory " << logPath.parent_path() << ": " << ec.message() << std::endl;
      return false;
    }
  }
  if (logFile.is_open())
  {
    logFile.close();
  }
  logFile.open(filename, std::ios_base::app);
  if (!logFile.is_open())
  {
    std::cerr << "Error: Could not open log file: " << filename << std::endl;
    return false;
  }
  logFile << "--- Log Started: " << getTimestamp() << " ---\n";
  return true;
}

void AppLogger::setLevel(Level level)
{
  std::lock_guard<std::mutex> lock(mutex_);
  minLevel_ = level;
}

AppLogger::Level AppLogger::level() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return minLevel_;
}

void AppLogger::debug(const std::string &message)
{
  write(Level::Debug, "[DEBUG] ", message);
}

void AppLogger::info(const std::string &message)
{
  write(Level::Info, "[INFO] ", message);
}

void AppLogger::warn(const std::string &message)
{
  write(Level::Warn, "[WARN] ", message);
}

void AppLogger::error(const std::string &message)
{
  write(Level::Error, "[ERROR] ", message);
}

AppLogger::Level AppLogger::levelFromString(const std::string &name, Level fallback)
{
  if (name == "debug")
    return Level::Debug;
  if (name == "info")
    return Level::Info;
  if (name == "warn" || name == "warning")
    return Level::Warn;
  if (name == "error")
    return Level::Error;
  return fallback;
}

std::string AppLogger::getTimestamp()
{
  auto now = std::chrono::system_clock::now();
  std::time_t now_c = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm local_tm{};
  localtime_r(&now_c, &local_tm);

  char buffer[80];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local_tm);

  std::ostringstream out;
  out << buffer << '.' << std::setw(3) << std::setfill('0') << millis;
  return out.str();
}

void AppLogger::write(Level level, const char *tag, const std::string &message)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (level < minLevel_)
  {
    return;
  }

  const std::string line = getTimestamp() + " " + tag + message + "\n";
  if (level == Level::Error)
  {
    std::cerr << tag << message << "\n";
  }

  if (logFile.is_open())
  {
    logFile << line;
    if (level >= Level::Warn)
    {
      logFile.flush();
    }
  }
  else
  {
    // fallback to std::cout if the log file is not open
    std::cout << line;
  }
}
