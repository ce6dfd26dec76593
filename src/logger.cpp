#include "logger.hpp"
#include <cerrno>
#include <chrono>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include "text_util.hpp"

const char* log_level_name(LogLevel l) {
  switch (l) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARNING";
    case LogLevel::Error:   return "ERROR";
    case LogLevel::Off:     return "OFF";
  }
  return "UNKNOWN";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
  std::string v = to_lower(s);
  if (v == "debug") { out = LogLevel::Debug; return true; }
  if (v == "info") { out = LogLevel::Info; return true; }
  if (v == "warn" || v == "warning") { out = LogLevel::Warning; return true; }
  if (v == "error") { out = LogLevel::Error; return true; }
  if (v == "off") { out = LogLevel::Off; return true; }
  return false;
}

Logger& Logger::get() {
  static Logger inst;
  return inst;
}

bool Logger::open(const std::string& path, std::string& msg) {
  std::FILE* f = std::fopen(path.c_str(), "a");
  if (!f) {
    msg = std::string("can not open log file: ") + path + ": " + std::strerror(errno);
    return false;
  }
  fp_.reset(f);
  return true;
}

void Logger::write(LogLevel l, const char* fmt, ...) {
  if (!enabled(l)) return;

  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tmv{};
  localtime_r(&t, &tmv);
  char ts[24];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tmv);

  std::fprintf(fp_.get(), "%s,%03d - splitview - %s - ", ts, static_cast<int>(ms), log_level_name(l));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(fp_.get(), fmt, ap);
  va_end(ap);
  std::fputc('\n', fp_.get());
  std::fflush(fp_.get());
}
