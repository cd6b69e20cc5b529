#if defined(_WIN32)
#error "process_posix.cpp should not be compiled on Windows builds"
#else

#include "process.h"

#include "util.h"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace dotres {
namespace {

constexpr int kExecFailedExit{ 127 };
constexpr int kSignalExitBase{ 128 };

[[noreturn]] void throw_errno(char const *what) {
  throw std::system_error(errno, std::generic_category(), what);
}

void close_fd(int &fd) {
  if (fd == -1) { return; }
  ::close(fd);
  fd = -1;
}

// One captured child stream: the pipe plus whatever partial line is buffered.
class output_pipe {
 public:
  explicit output_pipe(process_stream stream) : stream_{ stream } {
    int fds[2];
    if (::pipe(fds) == -1) { throw_errno("pipe failed"); }
    read_fd_ = fds[0];
    write_fd_ = fds[1];
  }
  ~output_pipe() {
    close_fd(read_fd_);
    close_fd(write_fd_);
  }

  output_pipe(output_pipe const &) = delete;
  output_pipe &operator=(output_pipe const &) = delete;

  int read_fd() const { return read_fd_; }
  int write_fd() const { return write_fd_; }
  void close_read() { close_fd(read_fd_); }
  void close_write() { close_fd(write_fd_); }

  void feed(std::string_view data, process_run_cfg const &cfg) {
    partial_.append(data);
    for (auto nl{ partial_.find('\n') }; nl != std::string::npos; nl = partial_.find('\n')) {
      deliver(std::string_view{ partial_ }.substr(0, nl), cfg);
      partial_.erase(0, nl + 1);
    }
  }

  void finish(process_run_cfg const &cfg) {
    if (!partial_.empty()) { deliver(partial_, cfg); }
    partial_.clear();
    close_read();
  }

 private:
  void deliver(std::string_view line, process_run_cfg const &cfg) const {
    if (line.ends_with('\r')) { line.remove_suffix(1); }
    if (cfg.on_output_line) { cfg.on_output_line(stream_, line); }
  }

  process_stream stream_;
  int read_fd_{ -1 };
  int write_fd_{ -1 };
  std::string partial_;
};

// Reads both pipes until the child has closed them.
void drain(std::array<output_pipe *, 2> const &pipes, process_run_cfg const &cfg) {
  std::array<pollfd, 2> fds{};
  for (size_t i{ 0 }; i < pipes.size(); ++i) {
    fds[i] = pollfd{ .fd = pipes[i]->read_fd(), .events = POLLIN, .revents = 0 };
  }

  std::array<char, 4096> buf{};
  size_t open{ pipes.size() };
  while (open > 0) {
    if (::poll(fds.data(), fds.size(), -1) == -1) {
      if (errno == EINTR) { continue; }
      throw_errno("poll failed");
    }

    for (size_t i{ 0 }; i < pipes.size(); ++i) {
      if (fds[i].fd == -1 || fds[i].revents == 0) { continue; }

      ssize_t const n{ ::read(fds[i].fd, buf.data(), buf.size()) };
      if (n == -1) {
        if (errno == EINTR) { continue; }
        throw_errno("read failed");
      }

      if (n == 0) {
        pipes[i]->finish(cfg);
        fds[i].fd = -1;
        --open;
      } else {
        pipes[i]->feed(std::string_view{ buf.data(), static_cast<size_t>(n) }, cfg);
      }
    }
  }
}

int wait_exit_code(pid_t child) {
  int status{ 0 };
  while (::waitpid(child, &status, 0) == -1) {
    if (errno != EINTR) { throw_errno("waitpid failed"); }
  }

  if (WIFEXITED(status)) { return WEXITSTATUS(status); }
  if (WIFSIGNALED(status)) { return kSignalExitBase + WTERMSIG(status); }
  return status;
}

[[noreturn]] void exec_child(output_pipe &out,
                             output_pipe &err,
                             std::filesystem::path const &program,
                             std::vector<char *> const &argv,
                             std::vector<char *> const &envp) {
  int const null_fd{ ::open("/dev/null", O_RDONLY) };
  if (null_fd == -1 || ::dup2(null_fd, STDIN_FILENO) == -1 ||
      ::dup2(out.write_fd(), STDOUT_FILENO) == -1 ||
      ::dup2(err.write_fd(), STDERR_FILENO) == -1) {
    std::perror("dotres: redirecting child stdio");
    _exit(kExecFailedExit);
  }
  if (null_fd != STDIN_FILENO) { ::close(null_fd); }
  for (auto *p : { &out, &err }) {
    p->close_read();
    p->close_write();
  }

  ::execve(program.c_str(), argv.data(), envp.data());
  std::perror(program.c_str());
  _exit(kExecFailedExit);
}

}  // namespace

process_env_t process_getenv() {
  process_env_t env;
  for (char **entry{ environ }; entry && *entry; ++entry) {
    std::string_view const kv{ *entry };
    if (auto const eq{ kv.find('=') }; eq != std::string_view::npos) {
      env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
    }
  }
  return env;
}

std::filesystem::path process_find_executable(std::string_view program,
                                              process_env_t const &env) {
  if (program.empty()) { throw std::runtime_error("empty program name"); }
  if (program.find('/') != std::string_view::npos) { return std::filesystem::path{ program }; }

  auto const path_it{ env.find("PATH") };
  std::string const search{ path_it == env.end() ? "/usr/bin:/bin" : path_it->second };

  for (auto const &dir : util_split(search, ':')) {
    auto const candidate{ std::filesystem::path{ dir.empty() ? "." : dir } / program };
    if (::access(candidate.c_str(), X_OK) == 0 && !std::filesystem::is_directory(candidate)) {
      return candidate;
    }
  }

  throw std::runtime_error("executable not found on PATH: " + std::string{ program });
}

int process_run(std::vector<std::string> const &argv, process_run_cfg const &cfg) {
  if (argv.empty()) { throw std::invalid_argument("process_run: argv must be non-empty"); }

  auto const program{ process_find_executable(argv.front(), cfg.env) };

  // Built before fork so the child only calls async-signal-safe functions.
  std::vector<std::string> env_strings;
  env_strings.reserve(cfg.env.size());
  for (auto const &[key, value] : cfg.env) { env_strings.push_back(key + "=" + value); }

  std::vector<char *> envp;
  for (auto &s : env_strings) { envp.push_back(s.data()); }
  envp.push_back(nullptr);

  std::vector<char *> child_argv;
  for (auto const &a : argv) { child_argv.push_back(const_cast<char *>(a.c_str())); }
  child_argv.push_back(nullptr);

  output_pipe out{ process_stream::std_out };
  output_pipe err{ process_stream::std_err };

  pid_t const child{ ::fork() };
  if (child == -1) { throw_errno("fork failed"); }
  if (child == 0) { exec_child(out, err, program, child_argv, envp); }

  out.close_write();
  err.close_write();

  try {
    drain({ &out, &err }, cfg);
  } catch (...) {
    ::kill(child, SIGKILL);
    wait_exit_code(child);
    throw;
  }

  return wait_exit_code(child);
}

}  // namespace dotres

#endif
