#include "tui.h"

#include "util.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>

bool scout::tui::g_trace_enabled{ false };

namespace {

using scout::tui::level;

struct log_event {
  std::chrono::system_clock::time_point timestamp;
  level severity;
  std::string message;
};

using log_entry = std::variant<log_event, scout::trace_event_t>;
using output_fn = std::function<void(std::string_view)>;

struct logger {
  std::mutex mutex;  // guards everything below except stdout_mutex
  std::condition_variable cv;
  std::queue<log_entry> queue;
  std::thread worker;
  bool stop_requested{ false };

  output_fn output_handler;
  std::optional<level> threshold;
  bool decorated{ false };
  bool initialized{ false };

  bool trace_stderr{ false };
  std::FILE *trace_file{ nullptr };
  std::string trace_file_name;

  std::mutex stdout_mutex;
} s_logger;

char const *severity_tag(level value) {
  switch (value) {
    case level::TUI_TRACE: return "TRC";
    case level::TUI_DEBUG: return "DBG";
    case level::TUI_INFO: return "INF";
    case level::TUI_WARN: return "WRN";
    case level::TUI_ERROR: return "ERR";
  }
  return "???";
}

// "[2024-05-01 12:00:00.123] [INF] "
std::string decoration(level severity, std::chrono::system_clock::time_point when) {
  auto const whole_seconds{ std::chrono::time_point_cast<std::chrono::seconds>(when) };
  auto const millis{
    std::chrono::duration_cast<std::chrono::milliseconds>(when - whole_seconds).count()
  };

  std::time_t const t{ std::chrono::system_clock::to_time_t(when) };
  std::tm local{};
  localtime_r(&t, &local);

  char clock[24]{};
  if (std::strftime(clock, sizeof clock, "%Y-%m-%d %H:%M:%S", &local) == 0) { return {}; }

  char prefix[64]{};
  std::snprintf(prefix,
                sizeof prefix,
                "[%s.%03d] [%s] ",
                clock,
                static_cast<int>(millis),
                severity_tag(severity));
  return prefix;
}

void close_trace_file() {
  if (s_logger.trace_file) { std::fclose(s_logger.trace_file); }
  s_logger.trace_file = nullptr;
  s_logger.trace_file_name.clear();
}

void write_trace_file(std::string const &line) {
  if (!s_logger.trace_file) { return; }
  if (std::fwrite(line.data(), 1, line.size(), s_logger.trace_file) == line.size() &&
      std::fflush(s_logger.trace_file) == 0) {
    return;
  }

  // Keep discovering; lose only the remaining trace output.
  std::fprintf(stderr,
               "scout: failed writing trace file %s; file tracing disabled\n",
               s_logger.trace_file_name.c_str());
  close_trace_file();
}

// Caller holds s_logger.mutex or owns the drained queue on the worker.
void deliver(log_entry const &entry) {
  auto const emit{ [](std::string const &line) {
    if (s_logger.output_handler) {
      s_logger.output_handler(line);
    } else {
      std::fwrite(line.data(), 1, line.size(), stderr);
    }
  } };

  std::visit(scout::match{
                 [&](log_event const &ev) {
                   std::string line{ s_logger.decorated ? decoration(ev.severity, ev.timestamp)
                                                        : std::string{} };
                   line.append(ev.message).push_back('\n');
                   emit(line);
                 },
                 [&](scout::trace_event_t const &ev) {
                   if (s_logger.trace_stderr) {
                     std::string line{ s_logger.decorated
                                           ? decoration(level::TUI_TRACE,
                                                        std::chrono::system_clock::now())
                                           : std::string{} };
                     line.append(scout::trace_event_to_string(ev)).push_back('\n');
                     emit(line);
                   }
                   write_trace_file(scout::trace_event_to_json(ev) + "\n");
                 },
             },
             entry);
}

void worker_loop() {
  std::unique_lock lock{ s_logger.mutex };
  for (;;) {
    s_logger.cv.wait(lock, [] { return s_logger.stop_requested || !s_logger.queue.empty(); });

    std::queue<log_entry> batch;
    batch.swap(s_logger.queue);
    bool const stopping{ s_logger.stop_requested };

    lock.unlock();
    try {
      for (; !batch.empty(); batch.pop()) { deliver(batch.front()); }
    } catch (std::exception const &e) {
      std::fprintf(stderr, "[scout logger: %s]\n", e.what());
    }
    if (!s_logger.output_handler) { std::fflush(stderr); }
    lock.lock();

    if (stopping && s_logger.queue.empty()) { return; }
  }
}

// Queue for the worker when running; otherwise deliver on the calling thread.
void submit(log_entry entry) {
  {
    std::lock_guard lock{ s_logger.mutex };
    if (!s_logger.worker.joinable()) {
      deliver(entry);
      return;
    }
    s_logger.queue.push(std::move(entry));
  }
  s_logger.cv.notify_one();
}

std::optional<std::string> vformat(char const *fmt, va_list args) {
  va_list retry;
  va_copy(retry, args);

  std::string out(256, '\0');
  int n{ std::vsnprintf(out.data(), out.size(), fmt, args) };
  if (n >= 0 && static_cast<std::size_t>(n) >= out.size()) {
    out.resize(static_cast<std::size_t>(n) + 1);
    n = std::vsnprintf(out.data(), out.size(), fmt, retry);
  }
  va_end(retry);

  if (n < 0) { return std::nullopt; }
  out.resize(static_cast<std::size_t>(n));
  return out;
}

void log_va(level severity, char const *fmt, va_list args) {
  if (!s_logger.initialized || !fmt) { return; }
  if (s_logger.threshold && severity < *s_logger.threshold) { return; }

  auto message{ vformat(fmt, args) };
  if (!message) { return; }

  submit(log_event{ .timestamp = std::chrono::system_clock::now(),
                    .severity = severity,
                    .message = std::move(*message) });
}

void require_idle(char const *what) {
  if (!s_logger.initialized) {
    throw std::logic_error{ std::string{ "scout::tui::" } + what + " called before init" };
  }
  if (s_logger.worker.joinable()) {
    throw std::logic_error{ std::string{ "scout::tui::" } + what + " called while running" };
  }
}

}  // namespace

namespace scout::tui {

void init() {
  if (s_logger.initialized) {
    throw std::logic_error{ "scout::tui::init called more than once" };
  }
  s_logger.initialized = true;
  s_logger.threshold = std::nullopt;
  s_logger.decorated = false;
  g_trace_enabled = false;
}

void configure_trace_outputs(std::vector<trace_output_spec> outputs) {
  require_idle("configure_trace_outputs");

  close_trace_file();
  s_logger.trace_stderr = false;

  for (auto const &spec : outputs) {
    switch (spec.type) {
      case trace_output_type::std_err: s_logger.trace_stderr = true; break;
      case trace_output_type::file: {
        if (!spec.file_path) { break; }
        if (s_logger.trace_file) {
          close_trace_file();
          throw std::logic_error{ "Only one trace file output supported" };
        }
        s_logger.trace_file = std::fopen(spec.file_path->string().c_str(), "w");
        if (!s_logger.trace_file) {
          throw std::runtime_error("Failed to open trace file: " + spec.file_path->string());
        }
        s_logger.trace_file_name = spec.file_path->string();
        break;
      }
    }
  }

  g_trace_enabled = s_logger.trace_stderr || s_logger.trace_file;
}

void set_output_handler(std::function<void(std::string_view)> handler) {
  require_idle("set_output_handler");
  std::lock_guard lock{ s_logger.mutex };
  s_logger.output_handler = std::move(handler);
}

void run(std::optional<level> threshold, bool decorated_logging) {
  if (!s_logger.initialized) { throw std::logic_error{ "scout::tui::run called before init" }; }
  if (s_logger.worker.joinable()) {
    throw std::logic_error{ "scout::tui::run called while already running" };
  }

  s_logger.threshold = threshold;
  s_logger.decorated = decorated_logging;
  s_logger.stop_requested = false;
  s_logger.worker = std::thread{ worker_loop };
}

void shutdown() {
  if (!s_logger.worker.joinable()) {
    throw std::logic_error{ "scout::tui::shutdown called while not running" };
  }

  {
    std::lock_guard lock{ s_logger.mutex };
    s_logger.stop_requested = true;
  }
  s_logger.cv.notify_all();
  s_logger.worker.join();

  s_logger.worker = std::thread{};
  s_logger.stop_requested = false;
  s_logger.threshold = std::nullopt;
  s_logger.decorated = false;
  s_logger.trace_stderr = false;
  close_trace_file();
  g_trace_enabled = false;
}

void trace(trace_event_t event) {
  if (!g_trace_enabled) { return; }
  submit(std::move(event));
}

void debug(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_va(level::TUI_DEBUG, fmt, args);
  va_end(args);
}

void info(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_va(level::TUI_INFO, fmt, args);
  va_end(args);
}

void warn(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_va(level::TUI_WARN, fmt, args);
  va_end(args);
}

void error(char const *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  log_va(level::TUI_ERROR, fmt, args);
  va_end(args);
}

void print_stdout(char const *fmt, ...) {
  if (!fmt) { return; }

  std::lock_guard lock{ s_logger.stdout_mutex };
  va_list args;
  va_start(args, fmt);
  int const written{ std::vprintf(fmt, args) };
  va_end(args);

  if (written > 0) { std::fflush(stdout); }
}

scope::scope(std::optional<level> threshold, bool decorated_logging) {
  if (!s_logger.initialized) { return; }
  run(threshold, decorated_logging);
  active = true;
}

scope::~scope() {
  if (active) { shutdown(); }
}

}  // namespace scout::tui
