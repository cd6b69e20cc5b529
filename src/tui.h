#pragma once

#include <functional>
#include <optional>
#include <string_view>

#if defined(__clang__) || defined(__GNUC__)
#define DOTRES_TUI_PRINTF(idx, first) __attribute__((format(printf, idx, first)))
#else
#define DOTRES_TUI_PRINTF(idx, first)
#endif

namespace dotres::tui {

enum class level { TUI_DEBUG, TUI_INFO, TUI_WARN, TUI_ERROR };

using sink_t = std::function<void(std::string_view)>;

void init();

// Log lines go to stderr and command results to stdout unless a sink is set.
// An empty sink restores the default stream.
void set_output_handler(sink_t handler);
void set_result_handler(sink_t handler);

// Applies a command run's verbosity until shutdown(). Outside a run every level is
// emitted without decoration.
void run(std::optional<level> threshold = std::nullopt, bool decorated_logging = false);
void shutdown();

void debug(char const *fmt, ...) DOTRES_TUI_PRINTF(1, 2);
void info(char const *fmt, ...) DOTRES_TUI_PRINTF(1, 2);
void warn(char const *fmt, ...) DOTRES_TUI_PRINTF(1, 2);
void error(char const *fmt, ...) DOTRES_TUI_PRINTF(1, 2);

// Command results. Never filtered or decorated.
void print_stdout(char const *fmt, ...) DOTRES_TUI_PRINTF(1, 2);

struct scope {  // raii helper
  explicit scope(std::optional<level> threshold, bool decorated_logging);
  ~scope();

 private:
  bool active{ false };
};

}  // namespace dotres::tui
