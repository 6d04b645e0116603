// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of dnschat, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <queue>
#include <sstream>
#include <string>
#include <thread>

namespace dnschat
{
namespace core
{

namespace detail
{
  /// \brief Extract filename from full path at compile-time
  constexpr const char *basename(const char *path)
  {
    const char *file = path;
    while (*path)
    {
      if (*path == '/' || *path == '\\')
      {
        file = path + 1;
      }
      ++path;
    }
    return file;
  }
} // namespace detail

class LoggerStream;

/// \brief Process-wide logger with level filtering, optional async worker,
/// daily file rotation and retention.
///
/// Without a log file, entries go to stderr so that the client can keep
/// stdout for the conversation itself.
class Logger
{
public:
  enum class Level
  {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
  };

  static void init(Level level = Level::Info, const std::string &filePath = "", bool async = false,
                   int retentionDays = 7, const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);

    data.minLevel = level;
    data.asyncMode = async;
    data.exit = false;
    data.logBasePath = filePath;
    data.retentionDays = retentionDays;
    data.timestampFormat = timeFormat;
    data.currentLogDate.clear();
    data.fileStream.reset();
    rotateLogFileIfNeeded();

    if (data.asyncMode && !data.workerThread.joinable())
    {
      data.workerThread = std::thread(runWorker);
    }
  }

  static void flush()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    drainQueue();
    if (data.fileStream)
    {
      data.fileStream->flush();
    }
  }

  static void shutdown()
  {
    flush();
    auto &data = getData();
    {
      std::lock_guard<std::mutex> lock(data.mutex);
      data.exit = true;
    }
    data.cv.notify_one();

    if (data.workerThread.joinable())
    {
      data.workerThread.join();
    }
    data.asyncMode = false;
  }

  static void setLevel(Level level)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
  }

  static Level getLevel()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.minLevel;
  }

  /// \brief Set the entry layout.
  /// Placeholders: %T timestamp, %t thread id, %L level, %m message,
  /// %F file, %l line, %f function, %% literal percent.
  /// Empty formats are ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
  }

  /// \brief Map a configuration string to a level; unknown strings give Info.
  static Level parseLevel(const std::string &s)
  {
    std::string v;
    v.reserve(s.size());
    for (char c : s)
    {
      v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (v == "trace")
    {
      return Level::Trace;
    }
    if (v == "debug")
    {
      return Level::Debug;
    }
    if (v == "warn" || v == "warning")
    {
      return Level::Warning;
    }
    if (v == "error")
    {
      return Level::Error;
    }
    if (v == "fatal")
    {
      return Level::Fatal;
    }
    return Level::Info;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }
  static void fatal(const std::string &message) { log(Level::Fatal, message); }

  static LoggerStream stream(Level level);

  static void log(Level level, const std::string &message)
  {
    log(level, message, nullptr, 0, nullptr);
  }

  /// \brief Log with source location (used by the DNSCHAT_LOG_* macros).
  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output =
      formatEntry(data.logFormat, data.timestampFormat, level, message, file, line, function);

    if (data.asyncMode)
    {
      data.queue.push(std::move(output));
      lock.unlock();
      data.cv.notify_one();
      return;
    }

    write(output);
  }

  static const char *levelToString(Level level)
  {
    switch (level)
    {
    case Level::Trace:
      return "TRACE";
    case Level::Debug:
      return "DEBUG";
    case Level::Info:
      return "INFO";
    case Level::Warning:
      return "WARN";
    case Level::Error:
      return "ERROR";
    case Level::Fatal:
      return "FATAL";
    default:
      return "UNKNOWN";
    }
  }

  /// \brief Local date used in rotated file names (`<base>.<date>.log`).
  static std::string currentDate()
  {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d");
    return oss.str();
  }

private:
  struct LoggerData
  {
    std::mutex mutex;
    std::condition_variable cv;
    std::queue<std::string> queue;
    std::thread workerThread;
    std::atomic<bool> exit{false};
    bool asyncMode = false;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string logBasePath;
    std::string currentLogDate;
    int retentionDays = 7;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    std::string logFormat = "[%T] [%L] %m";

    ~LoggerData()
    {
      exit = true;
      cv.notify_all();
      if (workerThread.joinable())
      {
        workerThread.join();
      }
    }
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  /// Caller holds data.mutex.
  static void write(const std::string &entry)
  {
    auto &data = getData();
    rotateLogFileIfNeeded();
    if (data.fileStream)
    {
      (*data.fileStream) << entry;
      data.fileStream->flush();
    }
    else
    {
      std::cerr << entry;
    }
  }

  /// Caller holds data.mutex.
  static void drainQueue()
  {
    auto &data = getData();
    while (!data.queue.empty())
    {
      write(data.queue.front());
      data.queue.pop();
    }
  }

  static void runWorker()
  {
    auto &data = getData();
    std::unique_lock<std::mutex> lock(data.mutex);
    while (true)
    {
      data.cv.wait(lock, [&data] { return !data.queue.empty() || data.exit; });
      drainQueue();
      if (data.exit)
      {
        break;
      }
    }
  }

  /// Caller holds data.mutex.
  static void rotateLogFileIfNeeded()
  {
    auto &data = getData();
    if (data.logBasePath.empty())
    {
      return;
    }

    namespace fs = std::filesystem;
    auto logPath = fs::path(data.logBasePath);
    auto logDir = logPath.parent_path();
    if (logDir.empty())
    {
      logDir = fs::current_path();
    }
    std::error_code ec;
    if (!fs::exists(logDir, ec))
    {
      fs::create_directories(logDir, ec);
      if (ec)
      {
        std::cerr << "[Logger] Failed to create log directory: " << logDir << " - " << ec.message()
                  << std::endl;
        return;
      }
    }

    std::string today = currentDate();
    if (today == data.currentLogDate && data.fileStream)
    {
      return;
    }

    data.currentLogDate = today;
    std::string rotatedPath =
      (logDir / (logPath.filename().string() + "." + today + ".log")).string();
    data.fileStream = std::make_unique<std::ofstream>(rotatedPath, std::ios::app);
    if (!data.fileStream->is_open())
    {
      std::cerr << "[Logger] Failed to open log file: " << rotatedPath << std::endl;
      data.fileStream.reset();
      return;
    }
    deleteOldLogFiles(logDir, logPath.filename().string());
  }

  static void deleteOldLogFiles(const std::filesystem::path &logDir, const std::string &baseName)
  {
    auto &data = getData();
    if (data.retentionDays <= 0)
    {
      return;
    }

    namespace fs = std::filesystem;
    auto now = std::chrono::system_clock::now();
    std::string prefix = baseName + ".";

    std::error_code dirEc;
    for (const auto &entry : fs::directory_iterator(logDir, dirEc))
    {
      std::string fname = entry.path().filename().string();
      if (fname.compare(0, prefix.size(), prefix) != 0 || fname.size() < prefix.size() + 10)
      {
        continue;
      }

      // baseName.YYYY-MM-DD.log
      std::tm tm{};
      std::istringstream ss(fname.substr(prefix.size(), 10));
      ss >> std::get_time(&tm, "%Y-%m-%d");
      if (ss.fail())
      {
        continue;
      }
      auto fileTime = std::chrono::system_clock::from_time_t(std::mktime(&tm));
      auto fileDays = std::chrono::duration_cast<std::chrono::hours>(now - fileTime).count() / 24;
      if (fileDays >= data.retentionDays)
      {
        std::error_code ec;
        fs::remove(entry.path(), ec);
        if (ec)
        {
          std::cerr << "[Logger] Failed to delete old log file: " << entry.path() << " - "
                    << ec.message() << std::endl;
        }
      }
    }
    if (dirEc)
    {
      std::cerr << "[Logger] Failed to iterate log directory: " << logDir << " - "
                << dirEc.message() << std::endl;
    }
  }

  static std::string formatEntry(const std::string &format, const std::string &timestampFmt,
                                 Level level, const std::string &message, const char *file,
                                 int line, const char *function)
  {
    std::ostringstream oss;
    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        oss << format[i];
        continue;
      }

      char spec = format[++i];
      switch (spec)
      {
      case 'T':
      {
        auto now = std::chrono::system_clock::now();
        auto t = std::chrono::system_clock::to_time_t(now);
        auto ms =
          std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm{};
        localtime_r(&t, &tm);
        oss << std::put_time(&tm, timestampFmt.c_str());
        if (timestampFmt.find("%S") != std::string::npos)
        {
          oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        }
        break;
      }
      case 't':
        oss << std::hex << std::setfill('0') << std::setw(sizeof(std::size_t) * 2)
            << std::hash<std::thread::id>{}(std::this_thread::get_id()) << std::dec;
        break;
      case 'L':
        oss << levelToString(level);
        break;
      case 'm':
        oss << message;
        break;
      case 'F':
        if (file)
        {
          oss << detail::basename(file);
        }
        break;
      case 'l':
        if (file)
        {
          oss << line;
        }
        break;
      case 'f':
        if (function)
        {
          oss << function;
        }
        break;
      case '%':
        oss << '%';
        break;
      default:
        oss << '%' << spec;
        break;
      }
    }
    oss << '\n';
    return oss.str();
  }
};

/// \brief Stream interface for composing a single log entry.
class LoggerStream
{
public:
  explicit LoggerStream(Logger::Level level) : _level(level) {}

  LoggerStream(LoggerStream &&other) noexcept
      : _level(other._level), _stream(std::move(other._stream))
  {
    other._moved = true;
  }

  template <typename T> LoggerStream &operator<<(const T &value)
  {
    _stream << value;
    return *this;
  }

  ~LoggerStream()
  {
    if (!_moved && !_stream.str().empty())
    {
      Logger::log(_level, _stream.str());
    }
  }

private:
  Logger::Level _level;
  std::ostringstream _stream;
  bool _moved = false;
};

inline LoggerStream Logger::stream(Logger::Level level) { return LoggerStream(level); }

} // namespace core
} // namespace dnschat

#define DNSCHAT_LOG_WITH_LEVEL(level, msg)                                                         \
  do                                                                                               \
  {                                                                                                \
    std::ostringstream _oss;                                                                       \
    _oss << msg;                                                                                   \
    dnschat::core::Logger::log(dnschat::core::Logger::Level::level, _oss.str(), __FILE__,          \
                               __LINE__, __func__);                                                \
  } while (0)

#define DNSCHAT_LOG_TRACE(msg) DNSCHAT_LOG_WITH_LEVEL(Trace, msg)
#define DNSCHAT_LOG_DEBUG(msg) DNSCHAT_LOG_WITH_LEVEL(Debug, msg)
#define DNSCHAT_LOG_INFO(msg) DNSCHAT_LOG_WITH_LEVEL(Info, msg)
#define DNSCHAT_LOG_WARN(msg) DNSCHAT_LOG_WITH_LEVEL(Warning, msg)
#define DNSCHAT_LOG_ERROR(msg) DNSCHAT_LOG_WITH_LEVEL(Error, msg)
#define DNSCHAT_LOG_FATAL(msg) DNSCHAT_LOG_WITH_LEVEL(Fatal, msg)
