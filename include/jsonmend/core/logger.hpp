// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Jsonmend, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace jsonmend
{
namespace core
{

namespace detail
{
  /// \brief Strip the directory part of a __FILE__ path.
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

/// \brief Process-wide synchronous logger.
///
/// Output goes to stderr by default so that repaired documents written to
/// stdout stay clean. A log file or an external handler can take over.
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

  /// \brief Receives the level, the formatted line (no trailing newline) and
  /// the raw message.
  using ExternalHandler = std::function<void(Level level, const std::string &formattedMessage,
                                             const std::string &rawMessage)>;

  /// \brief Configure level and destination. An empty path logs to stderr.
  static void init(Level level = Level::Info, const std::string &filePath = "",
                   const std::string &timeFormat = "%Y-%m-%d %H:%M:%S")
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.minLevel = level;
    data.timestampFormat = timeFormat;
    data.fileStream.reset();
    if (!filePath.empty())
    {
      data.fileStream = std::make_unique<std::ofstream>(filePath, std::ios::app);
      if (!data.fileStream->is_open())
      {
        std::cerr << "[Logger] Failed to open log file: " << filePath << std::endl;
        data.fileStream.reset();
      }
    }
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

  static bool isEnabled(Level level) { return level >= getLevel(); }

  /// \brief Route every log line to \p handler instead of stderr or the file.
  static void setExternalHandler(ExternalHandler handler)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = std::move(handler);
  }

  static void clearExternalHandler()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.externalHandler = nullptr;
  }

  /// \brief Set the line layout.
  ///
  /// Placeholders: %T timestamp, %L level, %m message, %F source file,
  /// %l source line, %f function, %% a literal percent. Unknown
  /// placeholders are kept as text; an empty format is ignored.
  static void setLogFormat(const std::string &format)
  {
    if (format.empty())
    {
      return;
    }
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    data.logFormat = format;
    data.compiledFormat = compileFormat(format);
  }

  static std::string getLogFormat()
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    return data.logFormat;
  }

  static void trace(const std::string &message) { log(Level::Trace, message); }
  static void debug(const std::string &message) { log(Level::Debug, message); }
  static void info(const std::string &message) { log(Level::Info, message); }
  static void warning(const std::string &message) { log(Level::Warning, message); }
  static void error(const std::string &message) { log(Level::Error, message); }

  static void log(Level level, const std::string &message)
  {
    log(level, message, "", 0, "");
  }

  static void log(Level level, const std::string &message, const char *file, int line,
                  const char *function)
  {
    auto &data = getData();
    std::lock_guard<std::mutex> lock(data.mutex);
    if (level < data.minLevel)
    {
      return;
    }

    std::string output = formatLine(data.compiledFormat, data.timestampFormat, level, message,
                                    detail::basename(file), line, function);
    if (data.externalHandler)
    {
      data.externalHandler(level, output, message);
    }
    else if (data.fileStream)
    {
      (*data.fileStream) << output << '\n';
      data.fileStream->flush();
    }
    else
    {
      std::cerr << output << std::endl;
    }
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
    }
    return "UNKNOWN";
  }

  /// \brief Case-insensitive level name lookup; accepts "warn" and "warning".
  static std::optional<Level> levelFromString(std::string name)
  {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "trace")
      return Level::Trace;
    if (name == "debug")
      return Level::Debug;
    if (name == "info")
      return Level::Info;
    if (name == "warn" || name == "warning")
      return Level::Warning;
    if (name == "error")
      return Level::Error;
    if (name == "fatal")
      return Level::Fatal;
    return std::nullopt;
  }

private:
  enum class FormatToken
  {
    Literal,
    Timestamp,
    Level,
    Message,
    File,
    Line,
    Function
  };

  struct FormatSegment
  {
    FormatToken token;
    std::string literal;
  };

  struct LoggerData
  {
    std::mutex mutex;
    Level minLevel = Level::Info;
    std::unique_ptr<std::ofstream> fileStream;
    std::string timestampFormat = "%Y-%m-%d %H:%M:%S";
    ExternalHandler externalHandler;
    std::string logFormat = "[%T] [%L] %m";
    std::vector<FormatSegment> compiledFormat = compileFormat("[%T] [%L] %m");
  };

  static LoggerData &getData()
  {
    static LoggerData data;
    return data;
  }

  static std::vector<FormatSegment> compileFormat(const std::string &format)
  {
    std::vector<FormatSegment> segments;
    std::string literal;
    auto flushLiteral = [&]()
    {
      if (!literal.empty())
      {
        segments.push_back({FormatToken::Literal, literal});
        literal.clear();
      }
    };

    for (std::size_t i = 0; i < format.size(); ++i)
    {
      if (format[i] != '%' || i + 1 >= format.size())
      {
        literal += format[i];
        continue;
      }

      FormatToken token;
      switch (format[i + 1])
      {
      case 'T':
        token = FormatToken::Timestamp;
        break;
      case 'L':
        token = FormatToken::Level;
        break;
      case 'm':
        token = FormatToken::Message;
        break;
      case 'F':
        token = FormatToken::File;
        break;
      case 'l':
        token = FormatToken::Line;
        break;
      case 'f':
        token = FormatToken::Function;
        break;
      case '%':
        literal += '%';
        ++i;
        continue;
      default:
        literal += '%';
        continue;
      }
      flushLiteral();
      segments.push_back({token, ""});
      ++i;
    }
    flushLiteral();
    return segments;
  }

  static std::string timestamp(const std::string &timestampFormat)
  {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm{};
    localtime_r(&t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, timestampFormat.c_str());
    if (timestampFormat.find("%S") != std::string::npos)
    {
      oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    }
    return oss.str();
  }

  static std::string formatLine(const std::vector<FormatSegment> &segments,
                                const std::string &timestampFormat, Level level,
                                const std::string &message, const char *file, int line,
                                const char *function)
  {
    std::ostringstream oss;
    for (const auto &seg : segments)
    {
      switch (seg.token)
      {
      case FormatToken::Literal:
        oss << seg.literal;
        break;
      case FormatToken::Timestamp:
        oss << timestamp(timestampFormat);
        break;
      case FormatToken::Level:
        oss << levelToString(level);
        break;
      case FormatToken::Message:
        oss << message;
        break;
      case FormatToken::File:
        oss << file;
        break;
      case FormatToken::Line:
        if (line > 0)
        {
          oss << line;
        }
        break;
      case FormatToken::Function:
        oss << function;
        break;
      }
    }
    return oss.str();
  }
};

#define JSONMEND_LOG_WITH_LEVEL(level, msg)                                                        \
  do                                                                                               \
  {                                                                                                \
    if (jsonmend::core::Logger::isEnabled(jsonmend::core::Logger::Level::level))                   \
    {                                                                                              \
      std::ostringstream _oss;                                                                     \
      _oss << msg;                                                                                 \
      jsonmend::core::Logger::log(jsonmend::core::Logger::Level::level, _oss.str(), __FILE__,      \
                                  __LINE__, __func__);                                             \
    }                                                                                              \
  } while (0)

#define JSONMEND_LOG_TRACE(msg) JSONMEND_LOG_WITH_LEVEL(Trace, msg)
#define JSONMEND_LOG_DEBUG(msg) JSONMEND_LOG_WITH_LEVEL(Debug, msg)
#define JSONMEND_LOG_INFO(msg) JSONMEND_LOG_WITH_LEVEL(Info, msg)
#define JSONMEND_LOG_WARN(msg) JSONMEND_LOG_WITH_LEVEL(Warning, msg)
#define JSONMEND_LOG_ERROR(msg) JSONMEND_LOG_WITH_LEVEL(Error, msg)
#define JSONMEND_LOG_FATAL(msg) JSONMEND_LOG_WITH_LEVEL(Fatal, msg)

} // namespace core
} // namespace jsonmend
