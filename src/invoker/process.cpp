#include "sessionrelay/invoker/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace sessionrelay::invoker {

namespace {

constexpr int SPAWN_STAGE_CHDIR = 1;
constexpr int SPAWN_STAGE_EXEC = 2;
constexpr int POLL_INTERVAL_MS = 200;

struct SpawnFailure {
  int stage = 0;
  int error = 0;
};

class Fd {
public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  Fd(const Fd &) = delete;
  Fd &operator=(const Fd &) = delete;
  ~Fd() { reset(); }

  [[nodiscard]] int get() const { return fd_; }
  [[nodiscard]] bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) {
    if (fd_ >= 0) {
      close(fd_);
    }
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

bool make_pipe(Fd &read_end, Fd &write_end) {
  int fds[2] = {-1, -1};
  if (pipe2(fds, O_CLOEXEC) != 0) {
    return false;
  }
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return true;
}

std::vector<std::string> build_environment(const ProcessSpec &spec) {
  std::vector<std::string> env;
  for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string item(*entry);
    const auto eq = item.find('=');
    const std::string name = eq == std::string::npos ? item : item.substr(0, eq);
    const bool overridden =
        std::any_of(spec.env_overrides.begin(), spec.env_overrides.end(),
                    [&name](const auto &override_pair) { return override_pair.first == name; });
    if (!overridden) {
      env.push_back(item);
    }
  }
  for (const auto &[name, value] : spec.env_overrides) {
    env.push_back(name + "=" + value);
  }
  return env;
}

std::vector<char *> to_pointer_array(std::vector<std::string> &values) {
  std::vector<char *> out;
  out.reserve(values.size() + 1);
  for (auto &value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

/// Returns false once the stream has reached EOF or failed.
bool read_available(int fd, std::string &sink, std::size_t limit, bool &truncated) {
  std::array<char, 16384> buffer{};
  while (true) {
    const ssize_t bytes = read(fd, buffer.data(), buffer.size());
    if (bytes > 0) {
      const std::size_t remaining = limit > sink.size() ? limit - sink.size() : 0;
      const std::size_t to_copy = std::min<std::size_t>(remaining, static_cast<std::size_t>(bytes));
      sink.append(buffer.data(), to_copy);
      if (to_copy < static_cast<std::size_t>(bytes)) {
        truncated = true;
      }
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void set_nonblocking(int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

[[noreturn]] void report_and_exit(int error_fd, int stage) {
  const SpawnFailure failure{.stage = stage, .error = errno};
  const ssize_t written = write(error_fd, &failure, sizeof(failure));
  (void)written;
  _exit(127);
}

void record_status(ProcessOutcome &outcome, int status) {
  if (WIFEXITED(status)) {
    outcome.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    outcome.term_signal = WTERMSIG(status);
  }
}

pid_t wait_blocking(pid_t pid, int &status) {
  while (true) {
    const pid_t done = waitpid(pid, &status, 0);
    if (done >= 0 || errno != EINTR) {
      return done;
    }
  }
}

} // namespace

ProcessOutcome run_process(const ProcessSpec &spec) {
  ProcessOutcome outcome;
  const auto started = std::chrono::steady_clock::now();
  auto finish = [&outcome, started]() {
    outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return outcome;
  };

  if (spec.argv.empty() || spec.argv.front().empty()) {
    outcome.spawn_error = "empty command";
    return finish();
  }

  // Everything the child touches is prepared before fork.
  std::vector<std::string> argv_storage = spec.argv;
  std::vector<std::string> env_storage = build_environment(spec);
  std::vector<char *> argv = to_pointer_array(argv_storage);
  std::vector<char *> envp = to_pointer_array(env_storage);
  const char *working_dir = spec.working_dir.empty() ? nullptr : spec.working_dir.c_str();

  Fd out_read;
  Fd out_write;
  Fd err_read;
  Fd err_write;
  Fd status_read;
  Fd status_write;
  if (!make_pipe(out_read, out_write) || !make_pipe(err_read, err_write) ||
      !make_pipe(status_read, status_write)) {
    outcome.spawn_error = std::string("pipe: ") + std::strerror(errno);
    return finish();
  }

  const pid_t pid = fork();
  if (pid < 0) {
    outcome.spawn_error = std::string("fork: ") + std::strerror(errno);
    return finish();
  }

  if (pid == 0) {
    setpgid(0, 0);
    const int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull >= 0) {
      dup2(devnull, STDIN_FILENO);
    }
    dup2(out_write.get(), STDOUT_FILENO);
    dup2(err_write.get(), STDERR_FILENO);
    if (working_dir != nullptr && chdir(working_dir) != 0) {
      report_and_exit(status_write.get(), SPAWN_STAGE_CHDIR);
    }
    environ = envp.data();
    execvp(argv[0], argv.data());
    report_and_exit(status_write.get(), SPAWN_STAGE_EXEC);
  }

  setpgid(pid, pid);
  out_write.reset();
  err_write.reset();
  status_write.reset();

  // The status pipe closes on a successful exec; a payload means the child never started.
  SpawnFailure failure;
  ssize_t status_bytes = 0;
  do {
    status_bytes = read(status_read.get(), &failure, sizeof(failure));
  } while (status_bytes < 0 && errno == EINTR);
  status_read.reset();

  int status = 0;
  if (status_bytes == static_cast<ssize_t>(sizeof(failure))) {
    wait_blocking(pid, status);
    if (failure.stage == SPAWN_STAGE_CHDIR) {
      outcome.spawn_error =
          "cannot enter working directory " + spec.working_dir + ": " + std::strerror(failure.error);
    } else {
      outcome.spawn_error = "cannot execute " + spec.argv.front() + ": " + std::strerror(failure.error);
    }
    return finish();
  }
  outcome.spawned = true;

  set_nonblocking(out_read.get());
  set_nonblocking(err_read.get());

  const auto deadline = started + spec.timeout;
  bool reaped = false;
  while (!reaped) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      outcome.timed_out = true;
      killpg(pid, SIGKILL);
      wait_blocking(pid, status);
      reaped = true;
      break;
    }

    const auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    const int wait_ms =
        static_cast<int>(std::min<long long>(remaining + 1, POLL_INTERVAL_MS));

    std::array<pollfd, 2> fds{};
    std::array<Fd *, 2> owners{};
    std::array<std::string *, 2> sinks{};
    nfds_t count = 0;
    if (out_read.valid()) {
      fds[count] = pollfd{.fd = out_read.get(), .events = POLLIN, .revents = 0};
      owners[count] = &out_read;
      sinks[count] = &outcome.stdout_data;
      ++count;
    }
    if (err_read.valid()) {
      fds[count] = pollfd{.fd = err_read.get(), .events = POLLIN, .revents = 0};
      owners[count] = &err_read;
      sinks[count] = &outcome.stderr_data;
      ++count;
    }

    const int ready = poll(fds.data(), count, wait_ms);
    if (ready > 0) {
      for (nfds_t i = 0; i < count; ++i) {
        if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
          continue;
        }
        if (!read_available(fds[i].fd, *sinks[i], spec.max_output_bytes, outcome.truncated)) {
          owners[i]->reset();
        }
      }
    }

    const pid_t done = waitpid(pid, &status, WNOHANG);
    if (done == pid) {
      reaped = true;
    }
  }

  // Whatever the child (or a straggling grandchild) left in the pipes.
  if (out_read.valid()) {
    (void)read_available(out_read.get(), outcome.stdout_data, spec.max_output_bytes,
                         outcome.truncated);
  }
  if (err_read.valid()) {
    (void)read_available(err_read.get(), outcome.stderr_data, spec.max_output_bytes,
                         outcome.truncated);
  }

  record_status(outcome, status);
  return finish();
}

} // namespace sessionrelay::invoker
