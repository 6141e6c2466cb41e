///////////////////////////////////////////////////////////////////////
// File:        subprocess.cpp
// Description: Spawn the engine with piped stdio and collect its output
//              within a deadline.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
// http://www.apache.org/licenses/LICENSE-2.0
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
///////////////////////////////////////////////////////////////////////

#include "subprocess.h"

#include <tesspipe/errors.h>
#include <tesspipe/tprintf.h>

#include "errcode.h"

#include <algorithm> // for std::min
#include <cerrno>
#include <chrono>
#include <cstring> // for strerror
#include <thread>  // for std::this_thread::sleep_for

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace tesspipe {

constexpr ERRCODE CANT_CREATE_PIPE("Can't create pipe");
constexpr ERRCODE CANT_FORK("Can't fork engine process");
constexpr ERRCODE PIPE_IO_FAILED("Engine pipe I/O failed");
constexpr ERRCODE WAIT_FAILED("Can't wait for engine process");

static const size_t kPipeChunk = 65536;

// Blocks SIGPIPE for the calling thread while we write to a child that may
// exit without reading all of its input. A SIGPIPE raised meanwhile is
// consumed before the previous mask is restored.
class ScopedSigpipeBlock {
public:
  ScopedSigpipeBlock() {
    sigemptyset(&sigpipe_);
    sigaddset(&sigpipe_, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &sigpipe_, &old_);
  }
  ~ScopedSigpipeBlock() {
    if (!sigismember(&old_, SIGPIPE)) {
      sigset_t pending;
      sigemptyset(&pending);
      if (sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE)) {
        const struct timespec zero = {0, 0};
        while (sigtimedwait(&sigpipe_, nullptr, &zero) == -1 && errno == EINTR) {
        }
      }
    }
    pthread_sigmask(SIG_SETMASK, &old_, nullptr);
  }

private:
  sigset_t sigpipe_;
  sigset_t old_;
};

// Both ends are close-on-exec from the start: a fork() on another thread
// (an async call) must never inherit them.
static void MakePipe(FdHandle *read_end, FdHandle *write_end) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    CANT_CREATE_PIPE.error("Subprocess::Start", TESSTHROW, "{}", strerror(errno));
  }
  read_end->reset(fds[0]);
  write_end->reset(fds[1]);
}

static void SetNonBlocking(const FdHandle &fd) {
  int flags = ::fcntl(fd.get(), F_GETFL);
  if (flags != -1) {
    ::fcntl(fd.get(), F_SETFL, flags | O_NONBLOCK);
  }
}

static int DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return -WTERMSIG(status);
  }
  return -1;
}

std::string FormatCommandLine(const std::vector<std::string> &argv) {
  std::string line;
  for (const auto &arg : argv) {
    if (!line.empty()) {
      line += ' ';
    }
    if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
      line += '"';
      line += arg;
      line += '"';
    } else {
      line += arg;
    }
  }
  return line;
}

Subprocess::Subprocess(std::vector<std::string> argv) : argv_(std::move(argv)) {}

Subprocess::~Subprocess() {
  Kill();
}

void Subprocess::Start() {
  ASSERT_HOST(!argv_.empty());
  ASSERT_HOST(pid_ <= 0);

  FdHandle in_read, in_write;
  FdHandle out_read, out_write;
  FdHandle err_read, err_write;
  FdHandle exec_read, exec_write;
  MakePipe(&in_read, &in_write);
  MakePipe(&out_read, &out_write);
  MakePipe(&err_read, &err_write);
  MakePipe(&exec_read, &exec_write);

  // Everything the child needs is prepared before fork(): no allocation
  // happens between fork() and exec.
  std::vector<char *> args;
  args.reserve(argv_.size() + 1);
  for (auto &arg : argv_) {
    args.push_back(const_cast<char *>(arg.c_str()));
  }
  args.push_back(nullptr);

  tprintDebug("Spawning: {}\n", FormatCommandLine(argv_));

  pid_t pid = ::fork();
  if (pid == -1) {
    CANT_FORK.error("Subprocess::Start", TESSTHROW, "{}", strerror(errno));
  }

  if (pid == 0) {
    // The child. dup2() clears FD_CLOEXEC on the standard descriptors.
    sigset_t none;
    sigemptyset(&none);
    pthread_sigmask(SIG_SETMASK, &none, nullptr);
    ::signal(SIGPIPE, SIG_DFL);
    if (::dup2(in_read.get(), STDIN_FILENO) == -1 || ::dup2(out_write.get(), STDOUT_FILENO) == -1 ||
        ::dup2(err_write.get(), STDERR_FILENO) == -1) {
      int e = errno;
      (void)!::write(exec_write.get(), &e, sizeof(e));
      ::_exit(127);
    }
    ::execvp(args[0], args.data());
    int e = errno;
    (void)!::write(exec_write.get(), &e, sizeof(e));
    ::_exit(127);
  }

  // The parent.
  pid_ = pid;
  in_read.reset();
  out_write.reset();
  err_write.reset();
  exec_write.reset();

  int child_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_read.get(), &child_errno, sizeof(child_errno));
  } while (n == -1 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    // exec failed; the child has already exited with status 127.
    int status;
    while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
    }
    pid_ = -1;
    tprintError("Cannot execute {}: {}\n", argv_[0], strerror(child_errno));
    throw EngineNotFoundError(argv_[0] + ": " + strerror(child_errno) +
                              " (is tesseract installed and in your PATH?)");
  }

  stdin_ = std::move(in_write);
  stdout_ = std::move(out_read);
  stderr_ = std::move(err_read);
}

void Subprocess::Kill() {
  stdin_.reset();
  stdout_.reset();
  stderr_.reset();
  if (pid_ <= 0) {
    return;
  }
  ::kill(pid_, SIGKILL);
  int status;
  while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
  }
  pid_ = -1;
}

void Subprocess::KillOnTimeout() {
  tprintWarn("Engine process {} exceeded its deadline; killing it: {}\n", static_cast<int>(pid_),
             FormatCommandLine(argv_));
  Kill();
  throw ProcessTimeoutError();
}

int Subprocess::WaitForExit(const Deadline &deadline) {
  auto backoff = std::chrono::milliseconds(1);
  for (;;) {
    int status;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
      pid_ = -1;
      return DecodeWaitStatus(status);
    }
    if (r == -1) {
      if (errno == EINTR) {
        continue;
      }
      int e = errno;
      pid_ = -1;
      WAIT_FAILED.error("Subprocess::WaitForExit", TESSTHROW, "{}", strerror(e));
    }
    if (deadline.deadline_exceeded()) {
      KillOnTimeout();
    }
    std::this_thread::sleep_for(backoff);
    backoff = std::min(backoff * 2, std::chrono::milliseconds(20));
  }
}

CommandResult Subprocess::Communicate(const std::string &input, const Deadline &deadline) {
  ASSERT_HOST(pid_ > 0);

  ScopedSigpipeBlock sigpipe_guard;
  CommandResult result;
  size_t written = 0;

  if (input.empty()) {
    stdin_.reset();
  } else {
    SetNonBlocking(stdin_);
  }
  SetNonBlocking(stdout_);
  SetNonBlocking(stderr_);

  char buf[kPipeChunk];
  while (stdin_ || stdout_ || stderr_) {
    if (deadline.deadline_exceeded()) {
      KillOnTimeout();
    }

    struct pollfd fds[3];
    FdHandle *owners[3];
    nfds_t nfds = 0;
    if (stdin_) {
      fds[nfds] = {stdin_.get(), POLLOUT, 0};
      owners[nfds++] = &stdin_;
    }
    if (stdout_) {
      fds[nfds] = {stdout_.get(), POLLIN, 0};
      owners[nfds++] = &stdout_;
    }
    if (stderr_) {
      fds[nfds] = {stderr_.get(), POLLIN, 0};
      owners[nfds++] = &stderr_;
    }

    int rc = ::poll(fds, nfds, deadline.remaining_msecs());
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      int e = errno;
      Kill();
      PIPE_IO_FAILED.error("Subprocess::Communicate", TESSTHROW, "poll: {}", strerror(e));
    }
    if (rc == 0) {
      continue; // deadline check at the top of the loop
    }

    for (nfds_t i = 0; i < nfds; ++i) {
      if (fds[i].revents == 0) {
        continue;
      }
      FdHandle *owner = owners[i];
      if (owner == &stdin_) {
        size_t chunk = std::min(input.size() - written, kPipeChunk);
        ssize_t n = ::write(stdin_.get(), input.data() + written, chunk);
        if (n > 0) {
          written += static_cast<size_t>(n);
          if (written == input.size()) {
            stdin_.reset();
          }
        } else if (n == -1 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
          if (errno == EPIPE) {
            tprintDebug("Engine closed its stdin after {} of {} bytes\n", written, input.size());
          } else {
            tprintWarn("Writing to engine stdin failed: {}\n", strerror(errno));
          }
          stdin_.reset();
        }
      } else {
        std::string &sink = (owner == &stdout_) ? result.out : result.err;
        ssize_t n = ::read(owner->get(), buf, sizeof(buf));
        if (n > 0) {
          sink.append(buf, static_cast<size_t>(n));
        } else if (n == 0) {
          owner->reset();
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
          tprintWarn("Reading engine output failed: {}\n", strerror(errno));
          owner->reset();
        }
      }
    }
  }

  result.return_code = WaitForExit(deadline);
  tprintDebug("Engine exited with {} ({} bytes stdout, {} bytes stderr)\n", result.return_code,
              result.out.size(), result.err.size());
  return result;
}

CommandResult RunCommand(const std::vector<std::string> &argv, const std::string &input,
                         double timeout_seconds) {
  Deadline deadline = Deadline::FromSeconds(timeout_seconds);
  Subprocess proc(argv);
  proc.Start();
  return proc.Communicate(input, deadline);
}

void CheckReturnCode(const CommandResult &result) {
  if (result.return_code != 0) {
    tprintWarn("Engine failed with return code {}\n", result.return_code);
    throw TesseractRuntimeError(result.err, result.return_code);
  }
}

} // namespace tesspipe
