// Termclip Library
// Copyright (c) 2026 David Capello
//
// This file is released under the terms of the MIT license.
// Read LICENSE.txt for more information.

#include "termclip.h"
#include "termclip_common.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <thread>

namespace termclip {

namespace {

typedef std::chrono::steady_clock steady_clock;

class unique_fd {
public:
  unique_fd() : m_fd(-1) {
  }

  explicit unique_fd(int fd) : m_fd(fd) {
  }

  ~unique_fd() {
    reset();
  }

  void reset(int fd = -1) {
    if (m_fd >= 0)
      ::close(m_fd);
    m_fd = fd;
  }

  int get() const { return m_fd; }
  bool valid() const { return m_fd >= 0; }

private:
  unique_fd(const unique_fd&) = delete;
  unique_fd& operator=(const unique_fd&) = delete;

  int m_fd;
};

// SIGPIPE would kill us if the command exits without reading all its
// stdin, we want an EPIPE error instead.
class ignore_sigpipe {
public:
  ignore_sigpipe() {
    struct sigaction ignore;
    std::memset(&ignore, 0, sizeof(ignore));
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    m_restore = (sigaction(SIGPIPE, &ignore, &m_old) == 0);
  }

  ~ignore_sigpipe() {
    if (m_restore)
      sigaction(SIGPIPE, &m_old, nullptr);
  }

private:
  struct sigaction m_old;
  bool m_restore;
};

bool make_pipe(unique_fd& read_end, unique_fd& write_end) {
  int fds[2];
  if (::pipe(fds) != 0)
    return false;

  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  read_end.reset(fds[0]);
  write_end.reset(fds[1]);
  return true;
}

int remaining_ms(const steady_clock::time_point& deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
    deadline - steady_clock::now()).count();
  return (left > 0 ? (int)left: 0);
}

bool write_all(int fd, const std::string& bytes) {
  std::size_t written = 0;
  while (written < bytes.size()) {
    ssize_t n = ::write(fd, bytes.data() + written, bytes.size() - written);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      return false;
    }
    written += (std::size_t)n;
  }
  return true;
}

bool is_executable(const std::string& path) {
  struct stat st;
  return (::stat(path.c_str(), &st) == 0 &&
          S_ISREG(st.st_mode) &&
          ::access(path.c_str(), X_OK) == 0);
}

// Runs in the forked child, it never returns.
void exec_child(const std::vector<std::string>& argv,
                int stdin_fd, int stdout_fd, bool show_errors,
                int error_fd) {
  ::dup2(stdin_fd, STDIN_FILENO);

  int null_fd = ::open("/dev/null", O_RDWR);
  ::dup2(stdout_fd >= 0 ? stdout_fd: null_fd, STDOUT_FILENO);
  if (!show_errors)
    ::dup2(null_fd, STDERR_FILENO);

  std::vector<char*> args;
  for (const std::string& arg : argv)
    args.push_back(const_cast<char*>(arg.c_str()));
  args.push_back(nullptr);

  ::execvp(args[0], &args[0]);

  // Tell the parent why exec failed
  int err = errno;
  ssize_t ignored = ::write(error_fd, &err, sizeof(err));
  (void)ignored;
  ::_exit(127);
}

} // anonymous namespace

system_host::system_host(bool show_command_errors)
  : m_show_command_errors(show_command_errors) {
}

bool system_host::find_command(const std::string& name) const {
  if (name.empty())
    return false;

  if (name.find('/') != std::string::npos)
    return is_executable(name);

  const char* path = std::getenv("PATH");
  std::string dirs = (path ? path: "/usr/local/bin:/usr/bin:/bin");

  std::size_t begin = 0;
  while (begin <= dirs.size()) {
    std::size_t end = dirs.find(':', begin);
    if (end == std::string::npos)
      end = dirs.size();

    // An empty entry means the current directory
    std::string dir = dirs.substr(begin, end - begin);
    if (dir.empty())
      dir = ".";

    if (is_executable(dir + "/" + name))
      return true;

    begin = end + 1;
  }
  return false;
}

run_result system_host::run(const std::vector<std::string>& argv,
                            const payload& input,
                            payload* output,
                            int timeout_ms) {
  run_result result;
  if (argv.empty())
    return result;

  ignore_sigpipe sigpipe_guard;

  unique_fd in_read, in_write;
  unique_fd out_read, out_write;
  unique_fd err_read, err_write;
  if (!make_pipe(in_read, in_write) ||
      (output && !make_pipe(out_read, out_write)) ||
      !make_pipe(err_read, err_write)) {
    details::logger()->debug("cannot create pipes: {}", std::strerror(errno));
    return result;
  }

  pid_t pid = ::fork();
  if (pid < 0) {
    details::logger()->debug("cannot fork: {}", std::strerror(errno));
    return result;
  }
  if (pid == 0)
    exec_child(argv, in_read.get(), out_write.get(),
               m_show_command_errors, err_write.get());

  in_read.reset();
  out_write.reset();
  err_write.reset();

  // The error pipe is closed on a successful exec (FD_CLOEXEC) or
  // receives the errno of a failed exec.
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(err_read.get(), &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  if (n == (ssize_t)sizeof(exec_errno)) {
    int status;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
      ;
    details::logger()->debug("cannot execute {}: {}",
                             argv[0], std::strerror(exec_errno));
    result.status = RunStatus::NotFound;
    result.exit_code = 127;
    return result;
  }

  const steady_clock::time_point deadline =
    steady_clock::now() + std::chrono::milliseconds(timeout_ms);

  ::fcntl(in_write.get(), F_SETFL, ::fcntl(in_write.get(), F_GETFL) | O_NONBLOCK);

  std::size_t written = 0;
  if (input.empty())
    in_write.reset();

  bool timed_out = false;
  while (in_write.valid() || out_read.valid()) {
    struct pollfd fds[2];
    int nfds = 0;
    int in_index = -1, out_index = -1;
    if (in_write.valid()) {
      fds[nfds].fd = in_write.get();
      fds[nfds].events = POLLOUT;
      fds[nfds].revents = 0;
      in_index = nfds++;
    }
    if (out_read.valid()) {
      fds[nfds].fd = out_read.get();
      fds[nfds].events = POLLIN;
      fds[nfds].revents = 0;
      out_index = nfds++;
    }

    int ms = remaining_ms(deadline);
    if (ms == 0) {
      timed_out = true;
      break;
    }

    int ret = ::poll(fds, nfds, ms);
    if (ret < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (ret == 0) {
      timed_out = true;
      break;
    }

    if (in_index >= 0 && fds[in_index].revents) {
      ssize_t w = ::write(in_write.get(),
                          input.data() + written,
                          input.size() - written);
      if (w > 0)
        written += (std::size_t)w;

      // Close stdin when everything was written or the command
      // closed its end of the pipe (EPIPE).
      if (written == input.size() ||
          (w < 0 && errno != EAGAIN && errno != EINTR))
        in_write.reset();
    }

    if (out_index >= 0 && fds[out_index].revents) {
      char buf[4096];
      ssize_t r = ::read(out_read.get(), buf, sizeof(buf));
      if (r > 0)
        output->append(buf, (std::size_t)r);
      else if (r == 0 || (errno != EAGAIN && errno != EINTR))
        out_read.reset();
    }
  }
  in_write.reset();
  out_read.reset();

  int status = 0;
  bool exited = false;
  while (!timed_out) {
    pid_t r = ::waitpid(pid, &status, WNOHANG);
    if (r == pid) {
      exited = true;
      break;
    }
    if (r < 0 && errno != EINTR)
      break;
    if (remaining_ms(deadline) == 0) {
      timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  if (!exited) {
    // A command that hangs (e.g. waiting for a display) is killed
    ::kill(pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR)
      ;
    result.status = (timed_out ? RunStatus::TimedOut: RunStatus::Failed);
    return result;
  }

  if (WIFEXITED(status))
    result.exit_code = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exit_code = 128 + WTERMSIG(status);

  // The payload must be handed completely to the command
  if (result.exit_code == 0 && written == input.size())
    result.status = RunStatus::Ok;
  else
    result.status = RunStatus::Failed;
  return result;
}

bool tty_sink::write(const std::string& bytes) {
  // /dev/tty is the controlling terminal even when stdout is
  // redirected to a file or a pipe.
  unique_fd tty(::open("/dev/tty", O_WRONLY | O_NOCTTY | O_CLOEXEC));
  if (tty.valid())
    return write_all(tty.get(), bytes);

  details::logger()->debug("cannot open /dev/tty: {}", std::strerror(errno));
  if (::isatty(STDOUT_FILENO))
    return write_all(STDOUT_FILENO, bytes);

  return false;
}

} // namespace termclip
