#pragma once
/*
 * Logger
 *
 * Purpose: append-only debug log file; the screen belongs to curses, so
 *          nothing here ever touches stdout/stderr.
 * Usage: Logger::get().open(path, msg) once in main, then SV_LOG_* macros.
 *        Before open (tests) every call is a no-op.
 */
#include <cstdio>
#include <memory>
#include <string>

enum class LogLevel { Debug, Info, Warning, Error, Off };

const char* log_level_name(LogLevel l);
bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
  static Logger& get();

  bool open(const std::string& path, std::string& msg);

  void set_level(LogLevel l) { level_ = l; }
  LogLevel level() const { return level_; }
  bool enabled(LogLevel l) const { return fp_ && level_ != LogLevel::Off && l >= level_; }

  void write(LogLevel l, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

private:
  Logger() = default;
  struct FileCloser { void operator()(std::FILE* f) const { if (f) std::fclose(f); } };
  std::unique_ptr<std::FILE, FileCloser> fp_;
  LogLevel level_ = LogLevel::Debug;
};

#define SV_LOG_DEBUG(...) ::Logger::get().write(::LogLevel::Debug, __VA_ARGS__)
#define SV_LOG_INFO(...)  ::Logger::get().write(::LogLevel::Info, __VA_ARGS__)
#define SV_LOG_WARN(...)  ::Logger::get().write(::LogLevel::Warning, __VA_ARGS__)
#define SV_LOG_ERROR(...) ::Logger::get().write(::LogLevel::Error, __VA_ARGS__)
