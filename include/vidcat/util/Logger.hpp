// Repository: VidCat-media
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the decode actors.
// Copyright (c) 2025 VidCat contributors

#ifndef VIDCAT_UTIL_LOGGER_HPP_
#define VIDCAT_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace vidcat::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from the render loop, the hover worker and any number
// of playback decode threads never interleave.
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when VIDCAT_DEBUG env is set (per-request tracing)
// Warn  → stderr (degraded but recoverable: seek fallback, skipped packets)
// Error → stderr (open failures and other hard faults)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that level (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static bool DebugEnabled();

  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace vidcat::util

#endif  // VIDCAT_UTIL_LOGGER_HPP_
