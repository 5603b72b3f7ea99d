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

#include "cgroup2.h"
#include "limiter.h"
#include "util.h"
#include <kj/test.h>
#include <sys/wait.h>
#include <signal.h>
#include <stdlib.h>
#include <unistd.h>

namespace sandbroker {
namespace {

KJ_TEST("findCounter") {
  kj::StringPtr events = "low 0\nhigh 12\nmax 3\noom 1\noom_kill 1\noom_group_kill 0\n";
  KJ_EXPECT(KJ_ASSERT_NONNULL(findCounter(events, "oom_kill")) == 1);
  KJ_EXPECT(KJ_ASSERT_NONNULL(findCounter(events, "high")) == 12);
  KJ_EXPECT(KJ_ASSERT_NONNULL(findCounter(events, "oom_group_kill")) == 0);
  KJ_EXPECT(findCounter(events, "oom_") == nullptr);
  KJ_EXPECT(findCounter("", "max") == nullptr);

  kj::StringPtr stat = "usage_usec 123456\nuser_usec 100000\nsystem_usec 23456\n";
  KJ_EXPECT(KJ_ASSERT_NONNULL(findCounter(stat, "usage_usec")) == 123456);
}

KJ_TEST("formatCpuMax") {
  KJ_EXPECT(formatCpuMax(1) == "100000 100000");
  KJ_EXPECT(formatCpuMax(0.5) == "50000 100000");
  KJ_EXPECT(formatCpuMax(2.25) == "225000 100000");
  // The kernel's minimum quota.
  KJ_EXPECT(formatCpuMax(0.0001) == "1000 100000");
}

kj::Maybe<kj::StringPtr> testCgroupRoot() {
  const char* root = getenv("SANDBROKER_TEST_CGROUP_ROOT");
  if (root == nullptr || *root == '\0') {
    KJ_LOG(WARNING, "SANDBROKER_TEST_CGROUP_ROOT not set; skipping cgroup test");
    return nullptr;
  }
  return kj::StringPtr(root);
}

KJ_TEST("ScopedCgroup removes its directory") {
  KJ_IF_MAYBE(root, testCgroupRoot()) {
    auto name = kj::str("cgroup2-test-", getpid());
    {
      ScopedCgroup scoped(Cgroup(*root), name);
      KJ_EXPECT(!scoped.get().isPopulated());
      KJ_EXPECT(access(kj::str(*root, '/', name).cStr(), F_OK) == 0);
    }
    KJ_EXPECT(access(kj::str(*root, '/', name).cStr(), F_OK) < 0);
  }
}

KJ_TEST("ScopedCgroup kills its members on teardown") {
  KJ_IF_MAYBE(root, testCgroupRoot()) {
    ScopedCgroup scoped(Cgroup(*root), kj::str("cgroup2-test-kill-", getpid()));

    Subprocess child([]() -> int {
      for (;;) pause();
    });
    scoped.get().addPid(child.getPid());
    KJ_EXPECT(scoped.get().isPopulated());

    scoped.teardown();
    int status = child.waitForExitOrSignal();
    KJ_EXPECT(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL, status);

    // Idempotent.
    scoped.teardown();
  }
}

}  // namespace
}  // namespace sandbroker
