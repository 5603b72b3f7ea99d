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

#include "util.h"
#include <kj/test.h>
#include <sys/wait.h>
#include <signal.h>
#include <stdlib.h>

namespace sandbroker {
namespace {

KJ_TEST("Subprocess") {
  {
    Subprocess child([]() { return 0; });
    int status = child.waitForExitOrSignal();
    KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
  }

  {
    Subprocess child([]() { return 3; });
    int status = child.waitForExitOrSignal();
    KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 3, status);
    KJ_EXPECT_THROW_MESSAGE("already waited", (void)child.waitForExitOrSignal());
  }

  {
    Subprocess child([]() -> int {
      for (;;) pause();
    });
    // Will be killed by destructor.
  }

  {
    Subprocess child([]() -> int {
      for (;;) pause();
    });
    child.signal(SIGTERM);
    int status = child.waitForExitOrSignal();
    KJ_EXPECT(WIFSIGNALED(status));
    KJ_EXPECT(WTERMSIG(status) == SIGTERM);
    KJ_EXPECT(!child.isRunning());
  }

  {
    // An exception in the child is reported as a failed exit, not propagated into the parent.
    Subprocess child([]() -> int {
      KJ_FAIL_REQUIRE("boom");
    });
    KJ_EXPECT(child.waitForExitOrSignal() != 0);
  }
}

KJ_TEST("Pipe::makeTwoWay") {
  auto pair = Pipe::makeTwoWay();
  KJ_SYSCALL(write(pair.readEnd, "ab", 2));
  KJ_SYSCALL(write(pair.writeEnd, "cd", 2));
  pair.readEnd = nullptr;
  KJ_EXPECT(readAll(pair.writeEnd) == "ab");
}

KJ_TEST("closeFdsExcept") {
  auto kept = Pipe::make();
  auto closed = Pipe::make();
  int keptFd = kept.writeEnd;
  int closedFd = closed.writeEnd;

  Subprocess child([&]() -> int {
    const int keep[] = { keptFd };
    closeFdsExcept(keep);
    if (fcntl(keptFd, F_GETFD) < 0) return 1;
    if (fcntl(closedFd, F_GETFD) >= 0) return 2;
    return 0;
  });
  int status = child.waitForExitOrSignal();
  KJ_EXPECT(WIFEXITED(status) && WEXITSTATUS(status) == 0, status);
}

KJ_TEST("parseUInt") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseUInt("123", 10)) == 123);
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseUInt("ff", 16)) == 255);
  KJ_EXPECT(parseUInt("", 10) == nullptr);
  KJ_EXPECT(parseUInt("12x", 10) == nullptr);
  KJ_EXPECT(parseUInt("-1", 10) == nullptr);
  KJ_EXPECT(parseUInt("99999999999", 10) == nullptr);
  KJ_EXPECT(KJ_ASSERT_NONNULL(parseUInt64("99999999999", 10)) == 99999999999ull);
}

KJ_TEST("splitLines") {
  auto lines = splitLines("  foo = 1\n\n# comment\nbar=2 # trailing\n   \nbaz");
  KJ_ASSERT(lines.size() == 3);
  KJ_EXPECT(lines[0] == "foo = 1");
  KJ_EXPECT(lines[1] == "bar=2");
  KJ_EXPECT(lines[2] == "baz");
}

KJ_TEST("split and splitSpace") {
  auto parts = split(kj::StringPtr("a,,b"), ',');
  KJ_ASSERT(parts.size() == 3);
  KJ_EXPECT(kj::heapString(parts[0]) == "a");
  KJ_EXPECT(parts[1].size() == 0);
  KJ_EXPECT(kj::heapString(parts[2]) == "b");

  auto words = splitSpace(kj::StringPtr("  oom_kill   3\n"));
  KJ_ASSERT(words.size() == 2);
  KJ_EXPECT(kj::heapString(words[0]) == "oom_kill");
  KJ_EXPECT(kj::heapString(words[1]) == "3");
}

KJ_TEST("isDirectory") {
  KJ_EXPECT(isDirectory("/"));
  KJ_EXPECT(isDirectory("/proc/self/cwd"));  // A symlink to a directory.
  KJ_EXPECT(!isDirectory("/proc/self/status"));
}

}  // namespace
}  // namespace sandbroker
