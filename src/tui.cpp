#include "tui.h"

#include <array>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <string>
#include <utility>

namespace dotres::tui {
namespace {

constexpr std::array<char const *, 4> kLevelLabels{ "DBG", "INF", "WRN", "ERR" };

struct state {
  sink_t log_sink;
  sink_t result_sink;
  std::optional<level> threshold;
  bool decorated{ false };
  bool initialized{ false };
  bool running{ false };
};

state &s() {
  static state instance;
  return instance;
}

std::string vformat(char const *fmt, va_list args) {
  va_list sizing;
  va_copy(sizing, args);
  int const n{ std::vsnprintf(nullptr, 0, fmt, sizing) };
  va_end(sizing);
  if (n <= 0) { return {}; }

  std::string out(static_cast<size_t>(n) + 1, '\0');
  std::vsnprintf(out.data(), out.size(), fmt, args);
  out.resize(static_cast<size_t>(n));
  return out;
}

// "[2024-01-31 13:05:09.042] [INF] "
std::string decoration(level severity) {
  using namespace std::chrono;
  auto const now{ system_clock::now() };
  auto const millis{ duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000 };

  std::time_t const t{ system_clock::to_time_t(now) };
  std::tm local{};
  localtime_r(&t, &local);

  char stamp[32]{};
  std::strftime(stamp, sizeof stamp, "%Y-%m-%d %H:%M:%S", &local);

  char prefix[64]{};
  std::snprintf(prefix,
                sizeof prefix,
                "[%s.%03d] [%s] ",
                stamp,
                static_cast<int>(millis),
                kLevelLabels[static_cast<size_t>(severity)]);
  return prefix;
}

void write(sink_t const &sink, std::FILE *stream, std::string_view text) {
  if (sink) {
    sink(text);
    return;
  }
  std::fwrite(text.data(), 1, text.size(), stream);
  std::fflush(stream);
}

void vlog(level severity, char const *fmt, va_list args) {
  auto const &st{ s() };
  if (!st.initialized || fmt == nullptr) { return; }
  if (st.threshold && severity < *st.threshold) { return; }

  std::string line{ st.decorated ? decoration(severity) : std::string{} };
  line += vformat(fmt, args);
  line.push_back('\n');
  write(st.log_sink, stderr, line);
}

void require_initialized(char const *fn) {
  if (!s().initialized) {
    throw std::logic_error{ std::string{ "dotres::tui::" } + fn + " called before init" };
  }
}

}  // namespace

void init() {
  if (s().initialized) { throw std::logic_error{ "dotres::tui::init called more than once" }; }
  s().initialized = true;
}

void set_output_handler(sink_t handler) {
  require_initialized("set_output_handler");
  s().log_sink = std::move(handler);
}

void set_result_handler(sink_t handler) {
  require_initialized("set_result_handler");
  s().result_sink = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  require_initialized("run");
  auto &st{ s() };
  if (st.running) { throw std::logic_error{ "dotres::tui::run called while already running" }; }

  st.threshold = threshold;
  st.decorated = decorated_logging;
  st.running = true;
}

void shutdown() {
  auto &st{ s() };
  if (!st.running) { throw std::logic_error{ "dotres::tui::shutdown called while not running" }; }

  st.threshold.reset();
  st.decorated = false;
  st.running = false;
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  vlog(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (fmt == nullptr) { return; }

  va_list args;
  va_start(args, fmt);
  std::string const text{ vformat(fmt, args) };
  va_end(args);

  write(s().result_sink, stdout, text);
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s().initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace dotres::tui
