///////////////////////////////////////////////////////////////////////
// File:        subprocess.h
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

#ifndef TESSPIPE_API_SUBPROCESS_H_
#define TESSPIPE_API_SUBPROCESS_H_

#include <tesspipe/export.h>
#include <tesspipe/fileptr.h>

#include "deadline.h"

#include <string>
#include <sys/types.h> // for pid_t
#include <vector>

namespace tesspipe {

struct CommandResult {
  // Exit status, or the negated signal number when the child was killed
  // by a signal.
  int return_code = 0;
  std::string out; // captured standard output
  std::string err; // captured standard error
};

/**
 * One child process with its standard input, output and error connected
 * to pipes owned by this object. The child is killed and reaped when the
 * object goes out of scope while it is still running.
 */
class TESSPIPE_API Subprocess {
public:
  // argv[0] is the program; it is searched in PATH when it contains no '/'.
  explicit Subprocess(std::vector<std::string> argv);
  ~Subprocess();

  Subprocess(const Subprocess &) = delete;
  Subprocess &operator=(const Subprocess &) = delete;

  // Throws EngineNotFoundError when argv[0] cannot be executed and
  // std::runtime_error when the pipes or the fork cannot be created.
  void Start();

  /**
   * Writes `input` to the child's stdin, closes it, and collects stdout
   * and stderr until both reach EOF and the child has exited.
   *
   * When `deadline` passes first, the child is killed and reaped and
   * ProcessTimeoutError is thrown.
   */
  CommandResult Communicate(const std::string &input, const Deadline &deadline);

  // SIGKILL the child and reap it. No-op when no child is running.
  void Kill();

  bool running() const {
    return pid_ > 0;
  }
  pid_t pid() const {
    return pid_;
  }
  const std::vector<std::string> &argv() const {
    return argv_;
  }

private:
  int WaitForExit(const Deadline &deadline);
  [[noreturn]] void KillOnTimeout();

  std::vector<std::string> argv_;
  pid_t pid_ = -1;
  FdHandle stdin_;
  FdHandle stdout_;
  FdHandle stderr_;
};

// Start + Communicate. A non-positive timeout waits forever.
TESSPIPE_API CommandResult RunCommand(const std::vector<std::string> &argv,
                                      const std::string &input, double timeout_seconds);

// Throws TesseractRuntimeError carrying the captured stderr when the
// return code is nonzero.
TESSPIPE_API void CheckReturnCode(const CommandResult &result);

// Shell-like rendering of argv for log messages.
TESSPIPE_API std::string FormatCommandLine(const std::vector<std::string> &argv);

} // namespace tesspipe

#endif // TESSPIPE_API_SUBPROCESS_H_
