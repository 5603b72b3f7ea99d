// Sandbroker - Sandboxed Execution Broker
// Copyright (c) 2014 Sandstorm Development Group, Inc. and contributors
// All rights reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SANDBROKER_UTIL_H_
#define SANDBROKER_UTIL_H_
// This file contains various utility functions used in Sandbroker.

#include <kj/io.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <unistd.h>
#include <kj/function.h>

namespace sandbroker {

typedef unsigned int uint;

struct Pipe {
  kj::AutoCloseFd readEnd;
  kj::AutoCloseFd writeEnd;

  static Pipe make();
  static Pipe makeTwoWay();
  // makeTwoWay() returns a connected pair of unix stream sockets; both ends are readable and
  // writable.
};

kj::AutoCloseFd raiiOpen(kj::StringPtr name, int flags, mode_t mode = 0666);
kj::AutoCloseFd raiiOpenAt(int dirfd, kj::StringPtr name, int flags, mode_t mode = 0666);

kj::Maybe<kj::AutoCloseFd> raiiOpenIfExists(
    kj::StringPtr name, int flags, mode_t mode = 0666);
kj::Maybe<kj::AutoCloseFd> raiiOpenAtIfExists(
    int dirfd, kj::StringPtr name, int flags, mode_t mode = 0666);

kj::String trim(kj::ArrayPtr<const char> slice);
kj::ArrayPtr<const char> trimArray(kj::ArrayPtr<const char> slice);
// Remove whitespace from both ends of the char array and return what's left as a String.

kj::Maybe<uint> parseUInt(kj::StringPtr s, int base);
kj::Maybe<uint64_t> parseUInt64(kj::StringPtr s, int base);
// Try to parse an integer with strtoul(), return null if parsing fails or doesn't consume all
// input.

bool isDirectory(kj::StringPtr path);
// Follows symlinks, so a link to a directory counts as a directory.

kj::Array<kj::String> listDirectory(kj::StringPtr dirname);
// Get names of all files in the given directory except for "." and "..".

void closeFdsExcept(kj::ArrayPtr<const int> keep);
// Close every file descriptor above stderr except those listed in `keep`. Used in forked
// children, which otherwise inherit whatever the rest of the process had open at the time of
// the fork, close-on-exec or not.

kj::String readAll(int fd);
// Read entire contents of the file descirptor to a String.

kj::String readAll(kj::StringPtr name);
// Read entire contents of a named file to a String.

kj::Array<kj::String> splitLines(kj::StringPtr input);
// Split the input into lines, trimming whitespace, and ignoring blank lines or lines that start
// with #.

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> input, char delim);
// Split the char array on an arbitrary delimiter character.

kj::Vector<kj::ArrayPtr<const char>> splitSpace(kj::ArrayPtr<const char> input);
// Split the char array on whitespace. Multiple consecutive spaces make a single split -- i.e.
// none of the elements in the returned vector will be empty.

class Subprocess {
public:
  Subprocess(kj::Function<int()> func);
  // Start a fork()ed subprocess that runs the given function then exits. This does not call
  // exec()! Note that `func` is destroyed in the parent process before this returns, since it is
  // only needed in the child process. Note also that under no circumstances will destructors of
  // stack or global objects present before the fork be executed inside the child process -- the
  // child cannot unwind the stack with an exception, and exits using _exit() to avoid global
  // destructors.

  KJ_DISALLOW_COPY(Subprocess);

  inline Subprocess(Subprocess&& other): pid(other.pid) {
    other.pid = 0;
  }

  ~Subprocess() noexcept(false);
  // Kills the subprocess (with SIGKILL) and waitpid()s it if it hasn't already finished.

  void signal(int signo);
  // Sends the given signal to the child process.

  int waitForExitOrSignal() KJ_WARN_UNUSED_RESULT;
  // Waits for the child to exit or be killed by a signal. Returns an exit status that can be
  // interpreted by WIFEXITED(), WEXITSTATUS(), etc. as described in the wait(2) man page.

  pid_t getPid() {
    KJ_IREQUIRE(pid != 0, "already exited");
    return pid;
  }

  bool isRunning() {
    return pid != 0;
  }

private:
  kj::UnwindDetector unwindDetector;
  pid_t pid = 0;  // 0 = not running
};

}  // namespace sandbroker

#endif // SANDBROKER_UTIL_H_
