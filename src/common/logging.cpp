
#include "logging.hpp"
#include "error.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace salvage {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::MalformedDescriptor:
    return "malformed descriptor";
  case ErrorCode::UnsupportedErasureType:
    return "unsupported erasure type";
  case ErrorCode::InconsistentPieceLength:
    return "inconsistent piece length";
  case ErrorCode::NotEnoughPieces:
    return "not enough pieces";
  case ErrorCode::UnsupportedCipher:
    return "unsupported cipher";
  case ErrorCode::NoContract:
    return "no contract";
  case ErrorCode::Transport:
    return "transport";
  case ErrorCode::Io:
    return "io";
  default:
    return "config";
  }
}

bool parse_log_level(const std::string &s, LogLevel &out) {
  std::string v(s);
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return (char)std::tolower(c); });
  if (v == "trace")
    out = LogLevel::TRACE;
  else if (v == "debug")
    out = LogLevel::DEBUG;
  else if (v == "info")
    out = LogLevel::INFO;
  else if (v == "warn" || v == "warning")
    out = LogLevel::WARN;
  else if (v == "error")
    out = LogLevel::ERROR;
  else
    return false;
  return true;
}

Logger &Logger::instance() {
  static Logger inst;
  return inst;
}
void Logger::set_level(LogLevel lvl) { level_ = lvl; }

void Logger::set_sink(std::FILE *sink) {
  std::lock_guard<std::mutex> lk(mtx_);
  sink_ = sink;
}

const char *Logger::level_str(LogLevel lvl) {
  switch (lvl) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  default:
    return "ERROR";
  }
}

void Logger::log(LogLevel lvl, const char *fmt, ...) {
  if (lvl < level_)
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  std::FILE *out = sink_ ? sink_ : stderr;
  using namespace std::chrono;
  auto now = system_clock::now();
  auto t = system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&t, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
  std::fprintf(out, "%s [%s] ", ts, level_str(lvl));
  va_list ap;
  va_start(ap, fmt);
  std::vfprintf(out, fmt, ap);
  va_end(ap);
  std::fprintf(out, "\n");
  std::fflush(out);
}

} // namespace salvage
