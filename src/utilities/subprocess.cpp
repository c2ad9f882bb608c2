#include "utilities/subprocess.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace sharedict {

namespace {

std::string errnoMessage(const std::string &what) {
  return what + ": " + std::strerror(errno);
}

// Owns one file descriptor; closes on destruction.
class Fd {
public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  Fd(const Fd &) = delete;
  Fd &operator=(const Fd &) = delete;
  ~Fd() { reset(); }

  int get() const { return fd_; }
  void reset(int fd = -1) {
    if (fd_ >= 0)
      ::close(fd_);
    fd_ = fd;
  }

private:
  int fd_ = -1;
};

void makePipe(Fd &readEnd, Fd &writeEnd) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0)
    throw SubprocessError(errnoMessage("pipe2 failed"));
  readEnd.reset(fds[0]);
  writeEnd.reset(fds[1]);
}

std::once_flag sigpipeOnce;

} // namespace

SubprocessResult runSubprocess(const std::vector<std::string> &argv,
                               std::span<const std::byte> input) {
  if (argv.empty())
    throw std::invalid_argument("runSubprocess: empty argv");

  // Ignore SIGPIPE: a child exiting early must not take the process down
  std::call_once(sigpipeOnce, [] { signal(SIGPIPE, SIG_IGN); });

  Fd inRead, inWrite, outRead, outWrite, errRead, errWrite, execRead,
      execWrite;
  makePipe(inRead, inWrite);
  makePipe(outRead, outWrite);
  makePipe(errRead, errWrite);
  makePipe(execRead, execWrite);

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv)
    cargv.push_back(const_cast<char *>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0)
    throw SubprocessError(errnoMessage("fork failed"));

  if (pid == 0) {
    // Child: only async-signal-safe calls from here on.
    ::dup2(inRead.get(), STDIN_FILENO);
    ::dup2(outWrite.get(), STDOUT_FILENO);
    ::dup2(errWrite.get(), STDERR_FILENO);
    ::execvp(cargv[0], cargv.data());
    int err = errno;
    ssize_t ignored = ::write(execWrite.get(), &err, sizeof(err));
    (void)ignored;
    ::_exit(127);
  }

  inRead.reset();
  outWrite.reset();
  errWrite.reset();
  execWrite.reset();

  int execErrno = 0;
  ssize_t n = ::read(execRead.get(), &execErrno, sizeof(execErrno));
  if (n == static_cast<ssize_t>(sizeof(execErrno))) {
    ::waitpid(pid, nullptr, 0);
    errno = execErrno;
    throw SubprocessError(errnoMessage("exec " + argv[0] + " failed"));
  }

  if (::fcntl(inWrite.get(), F_SETFL, O_NONBLOCK) != 0) {
    ::kill(pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
    throw SubprocessError(errnoMessage("fcntl failed"));
  }

  SubprocessResult result;
  size_t written = 0;
  if (input.empty())
    inWrite.reset();

  char buf[64 * 1024];
  while (outRead.get() >= 0 || errRead.get() >= 0) {
    pollfd fds[3];
    nfds_t count = 0;
    int inIdx = -1, outIdx = -1, errIdx = -1;
    if (inWrite.get() >= 0) {
      inIdx = static_cast<int>(count);
      fds[count++] = pollfd{inWrite.get(), POLLOUT, 0};
    }
    if (outRead.get() >= 0) {
      outIdx = static_cast<int>(count);
      fds[count++] = pollfd{outRead.get(), POLLIN, 0};
    }
    if (errRead.get() >= 0) {
      errIdx = static_cast<int>(count);
      fds[count++] = pollfd{errRead.get(), POLLIN, 0};
    }
    if (::poll(fds, count, -1) < 0) {
      if (errno == EINTR)
        continue;
      ::kill(pid, SIGKILL);
      ::waitpid(pid, nullptr, 0);
      throw SubprocessError(errnoMessage("poll failed"));
    }

    if (inIdx >= 0 && fds[inIdx].revents != 0) {
      ssize_t w = ::write(inWrite.get(), input.data() + written,
                          input.size() - written);
      if (w > 0) {
        written += static_cast<size_t>(w);
        if (written == input.size())
          inWrite.reset();
      } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
        // Child closed its stdin (EPIPE); it decides the exit status.
        inWrite.reset();
      }
    }
    if (outIdx >= 0 && fds[outIdx].revents != 0) {
      ssize_t r = ::read(outRead.get(), buf, sizeof(buf));
      if (r > 0) {
        auto *p = reinterpret_cast<const std::byte *>(buf);
        result.out.insert(result.out.end(), p, p + r);
      } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
        outRead.reset();
      }
    }
    if (errIdx >= 0 && fds[errIdx].revents != 0) {
      ssize_t r = ::read(errRead.get(), buf, sizeof(buf));
      if (r > 0) {
        result.err.append(buf, static_cast<size_t>(r));
      } else if (r == 0 || (errno != EAGAIN && errno != EINTR)) {
        errRead.reset();
      }
    }
  }
  inWrite.reset();

  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw SubprocessError(errnoMessage("waitpid failed"));
  }
  if (WIFEXITED(status))
    result.exitStatus = WEXITSTATUS(status);
  else if (WIFSIGNALED(status))
    result.exitStatus = 128 + WTERMSIG(status);
  return result;
}

} // namespace sharedict
