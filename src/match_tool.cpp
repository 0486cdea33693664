#if defined(_WIN32)
#error "match_tool.cpp targets POSIX hosts"
#else

#include "match_tool.h"

#include "discovery_error.h"
#include "trace.h"
#include "tui.h"

#include "picojson.h"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace scout {
namespace {

constexpr int kChildErrorExit{ 127 };
constexpr int kSignalExitBase{ 128 };

class fd_cleanup {
 public:
  explicit fd_cleanup(int fd) : fd_{ fd } {}
  ~fd_cleanup() { release(); }

  fd_cleanup(fd_cleanup const &) = delete;
  fd_cleanup &operator=(fd_cleanup const &) = delete;

  int get() const { return fd_; }

  void release() {
    if (fd_ == -1) { return; }
    for (int attempts{ 0 }; attempts < 3 && ::close(fd_) == -1; ++attempts) {
      if (errno != EINTR) { break; }
    }
    fd_ = -1;
  }

 private:
  int fd_{ -1 };
};

[[noreturn]] void tool_failure(std::string const &message) {
  throw discovery_error(discovery_error_kind::STRUCTURAL_MATCH_TOOL_FAILURE, message);
}

int decode_status(int status) {
  if (WIFEXITED(status)) { return WEXITSTATUS(status); }
  if (WIFSIGNALED(status)) { return kSignalExitBase + WTERMSIG(status); }
  return status;
}

int wait_for_child(pid_t child) {
  int status{ 0 };
  while (::waitpid(child, &status, 0) == -1) {
    if (errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
  }
  return decode_status(status);
}

// A child can close its pipes and keep running; reap it within the same deadline.
std::optional<int> wait_for_child_until(pid_t child,
                                        std::chrono::steady_clock::time_point deadline) {
  for (;;) {
    int status{ 0 };
    pid_t const reaped{ ::waitpid(child, &status, WNOHANG) };
    if (reaped == child) { return decode_status(status); }
    if (reaped == -1 && errno != EINTR) {
      throw std::system_error(errno, std::generic_category(), "waitpid failed");
    }
    if (std::chrono::steady_clock::now() >= deadline) { return std::nullopt; }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}

[[noreturn]] void exec_child(fd_cleanup &out_read,
                             fd_cleanup &out_write,
                             fd_cleanup &err_read,
                             fd_cleanup &err_write,
                             std::vector<std::string> const &argv_strings) {
  out_read.release();
  err_read.release();

  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1) {
    std::perror("open /dev/null");
    _exit(kChildErrorExit);
  }

  std::array<std::pair<int, int>, 3> const fd_mappings{
    std::pair{ null_fd, STDIN_FILENO },
    std::pair{ out_write.get(), STDOUT_FILENO },
    std::pair{ err_write.get(), STDERR_FILENO },
  };
  for (auto const &[src, dst] : fd_mappings) {
    if (::dup2(src, dst) == -1) {
      std::perror("dup2");
      _exit(kChildErrorExit);
    }
  }

  if (null_fd != STDIN_FILENO) { ::close(null_fd); }
  out_write.release();
  err_write.release();

  std::vector<char *> argv;
  argv.reserve(argv_strings.size() + 1);
  for (auto const &arg : argv_strings) { argv.push_back(const_cast<char *>(arg.c_str())); }
  argv.push_back(nullptr);

  ::execvp(argv_strings[0].c_str(), argv.data());
  std::perror("execvp");
  _exit(kChildErrorExit);
}

// Drain both pipes until EOF. Returns false when the deadline passes first.
bool drain(std::array<fd_cleanup *, 2> fds,
           std::array<std::string *, 2> sinks,
           std::chrono::steady_clock::time_point deadline) {
  std::array<pollfd, 2> poll_fds{};
  for (size_t i{ 0 }; i < fds.size(); ++i) {
    poll_fds[i] = pollfd{ .fd = fds[i]->get(), .events = POLLIN, .revents = 0 };
  }

  std::array<char, 4096> chunk{};
  size_t open_count{ fds.size() };

  while (open_count > 0) {
    auto const remaining{ std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()) };
    if (remaining.count() <= 0) { return false; }

    int const ready{ ::poll(poll_fds.data(), poll_fds.size(), static_cast<int>(remaining.count())) };
    if (ready == -1) {
      if (errno == EINTR) { continue; }
      throw std::system_error(errno, std::generic_category(), "poll failed");
    }
    if (ready == 0) { return false; }

    for (size_t i{ 0 }; i < poll_fds.size(); ++i) {
      if (poll_fds[i].fd == -1 || poll_fds[i].revents == 0) { continue; }

      ssize_t const n{ ::read(poll_fds[i].fd, chunk.data(), chunk.size()) };
      if (n == -1) {
        if (errno == EINTR) { continue; }
        throw std::system_error(errno, std::generic_category(), "read failed");
      }
      if (n == 0) {
        poll_fds[i].fd = -1;
        --open_count;
        continue;
      }
      sinks[i]->append(chunk.data(), static_cast<size_t>(n));
    }
  }
  return true;
}

std::int64_t offset_field(picojson::object const &obj, char const *key) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<std::int64_t>() || it->second.get<std::int64_t>() < 0) {
    tool_failure(std::string{ "match output: byteOffset." } + key + " is not an offset");
  }
  return it->second.get<std::int64_t>();
}

picojson::object const &object_field(picojson::object const &obj, char const *key) {
  auto const it{ obj.find(key) };
  if (it == obj.end() || !it->second.is<picojson::object>()) {
    tool_failure(std::string{ "match output: missing object '" } + key + "'");
  }
  return it->second.get<picojson::object>();
}

}  // namespace

match_tool_output match_tool_exec(std::vector<std::string> const &argv, std::int64_t timeout_ms) {
  if (argv.empty()) { tool_failure("match tool command is empty"); }

  int out_pipe[2];
  if (::pipe(out_pipe) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup out_read{ out_pipe[0] };
  fd_cleanup out_write{ out_pipe[1] };

  int err_pipe[2];
  if (::pipe(err_pipe) == -1) {
    throw std::system_error(errno, std::generic_category(), "pipe failed");
  }
  fd_cleanup err_read{ err_pipe[0] };
  fd_cleanup err_write{ err_pipe[1] };

  auto const deadline{ std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms) };

  pid_t const child{ ::fork() };
  if (child == -1) { throw std::system_error(errno, std::generic_category(), "fork failed"); }
  if (child == 0) { exec_child(out_read, out_write, err_read, err_write, argv); }

  out_write.release();
  err_write.release();

  match_tool_output output{ .exit_code = 0, .out = {}, .err = {} };
  bool finished{ false };
  try {
    finished = drain({ &out_read, &err_read }, { &output.out, &output.err }, deadline);
  } catch (std::exception const &) {
    ::kill(child, SIGKILL);
    wait_for_child(child);
    throw;
  }

  std::optional<int> exit_code;
  if (finished) { exit_code = wait_for_child_until(child, deadline); }

  if (!exit_code) {
    ::kill(child, SIGKILL);
    wait_for_child(child);
    tool_failure(argv[0] + " timed out after " + std::to_string(timeout_ms) + " ms");
  }

  output.exit_code = *exit_code;
  return output;
}

std::vector<source_span> match_tool_parse_output(std::string const &json) {
  picojson::value root;
  if (auto const err{ picojson::parse(root, json) }; !err.empty()) {
    tool_failure("match output is not JSON: " + err);
  }
  if (!root.is<picojson::array>()) { tool_failure("match output is not a JSON array"); }

  std::vector<source_span> spans;
  for (auto const &match : root.get<picojson::array>()) {
    if (!match.is<picojson::object>()) { tool_failure("match output entry is not an object"); }

    auto const &offsets{ object_field(object_field(match.get<picojson::object>(), "range"),
                                      "byteOffset") };
    auto const begin{ offset_field(offsets, "start") };
    auto const end{ offset_field(offsets, "end") };
    if (end < begin) { tool_failure("match output span ends before it starts"); }

    spans.push_back(source_span{ .begin = static_cast<std::size_t>(begin),
                                 .end = static_cast<std::size_t>(end) });
  }
  return spans;
}

std::vector<source_span> match_tool_find(match_tool_options const &tool,
                                         std::string const &pattern,
                                         std::filesystem::path const &file) {
  auto argv{ tool.argv };
  argv.insert(argv.end(), { "--pattern", pattern, "--json=compact", file.string() });

  auto const start{ std::chrono::steady_clock::now() };
  auto const output{ match_tool_exec(argv, tool.timeout_ms) };
  auto const elapsed{ std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::steady_clock::now() - start)
                          .count() };

  SCOUT_TRACE_MATCH_TOOL_RUN(file.string(), pattern, output.exit_code, elapsed);
  tui::debug("match_tool: %s exited %d in %lld ms",
             argv[0].c_str(),
             output.exit_code,
             static_cast<long long>(elapsed));

  if (output.exit_code != 0) {
    auto const first_line{ std::string_view{ output.err }.substr(0, output.err.find('\n')) };
    tool_failure(argv[0] + " exited with " + std::to_string(output.exit_code) +
                 (first_line.empty() ? std::string{} : ": " + std::string{ first_line }));
  }

  return match_tool_parse_output(output.out);
}

}  // namespace scout

#endif  // POSIX implementation
