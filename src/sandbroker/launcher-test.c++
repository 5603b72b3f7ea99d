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

#include "launcher.h"
#include "syscall-filter.h"
#include <kj/test.h>
#include <kj/thread.h>
#include <sys/wait.h>
#include <signal.h>
#include <limits.h>

namespace sandbroker {
namespace {

// Build wait statuses the way the kernel encodes them.
int exited(int code) { return (code & 0xff) << 8; }
int signaled(int signo) { return signo & 0x7f; }

KJ_TEST("OutputBuffer caps and flags truncation") {
  OutputBuffer buffer(8);
  buffer.append(kj::StringPtr("hello"));
  KJ_EXPECT(!buffer.isTruncated());
  buffer.append(kj::StringPtr(" world"));
  KJ_EXPECT(buffer.isTruncated());
  KJ_EXPECT(buffer.size() == 8);
  buffer.append(kj::StringPtr("more"));
  KJ_EXPECT(buffer.size() == 8);

  auto data = buffer.release();
  KJ_EXPECT(kj::heapString(data) == "hello wo");
}

KJ_TEST("OutputBuffer exactly at the limit is not truncated") {
  OutputBuffer buffer(4);
  buffer.append(kj::StringPtr("abcd"));
  buffer.append(kj::StringPtr(""));
  KJ_EXPECT(!buffer.isTruncated());
}

KJ_TEST("CancelSignal") {
  CancelSignal signal;
  KJ_EXPECT(!signal.isRaised());
  signal.raise();
  KJ_EXPECT(signal.isRaised());
  signal.raise();
  KJ_EXPECT(signal.isRaised());

  CancelSignal other;
  kj::Thread([&]() { other.raise(); });
  KJ_EXPECT(other.isRaised());
}

KJ_TEST("pollTimeoutUntil") {
  auto now = kj::systemPreciseMonotonicClock().now();
  KJ_EXPECT(pollTimeoutUntil(now, now) == 0);
  KJ_EXPECT(pollTimeoutUntil(now - 1 * kj::SECONDS, now) == 0);
  KJ_EXPECT(pollTimeoutUntil(now + 1 * kj::NANOSECONDS, now) == 1);
  KJ_EXPECT(pollTimeoutUntil(now + 1500 * kj::MICROSECONDS, now) == 2);
  KJ_EXPECT(pollTimeoutUntil(now + 2 * kj::SECONDS, now) == 2000);

  // Past what an int of milliseconds can hold (about 24.8 days).
  KJ_EXPECT(pollTimeoutUntil(now + 30 * 24 * 3600 * kj::SECONDS, now) == INT_MAX);
  KJ_EXPECT(pollTimeoutUntil(now + 365 * 24 * 3600 * kj::SECONDS, now) == INT_MAX);
}

KJ_TEST("classifyExit: the command's own outcome") {
  LimitEvents none;

  auto status = classifyExit(TerminationReason::NONE, none, exited(0));
  KJ_ASSERT(status.is<Completed>());
  KJ_EXPECT(status.get<Completed>().exitCode == 0);

  status = classifyExit(TerminationReason::NONE, none, exited(3));
  KJ_ASSERT(status.is<Completed>());
  KJ_EXPECT(status.get<Completed>().exitCode == 3);

  status = classifyExit(TerminationReason::NONE, none, signaled(SIGSEGV));
  KJ_ASSERT(status.is<Crashed>());
  KJ_EXPECT(status.get<Crashed>().signal == SIGSEGV);

  status = classifyExit(TerminationReason::NONE, none, signaled(POLICY_VIOLATION_SIGNAL));
  KJ_ASSERT(status.is<PolicyViolation>());
  KJ_EXPECT(status.get<PolicyViolation>().signal == SIGSYS);
}

KJ_TEST("classifyExit: broker-initiated termination wins") {
  LimitEvents oom;
  oom.oomKilled = true;

  KJ_EXPECT(classifyExit(TerminationReason::TIMEOUT, {}, signaled(SIGTERM)).is<TimedOut>());
  KJ_EXPECT(classifyExit(TerminationReason::TIMEOUT, {}, nullptr).is<TimedOut>());
  KJ_EXPECT(classifyExit(TerminationReason::TIMEOUT, oom, nullptr).is<TimedOut>());
  KJ_EXPECT(classifyExit(TerminationReason::CANCEL, {}, exited(0)).is<Cancelled>());
  KJ_EXPECT(classifyExit(TerminationReason::CANCEL, {}, nullptr).is<Cancelled>());
}

KJ_TEST("classifyExit: resource limits") {
  LimitEvents oom;
  oom.oomKilled = true;
  LimitEvents pids;
  pids.pidsLimitHit = true;

  // The OOM group kill takes the stub down too, so there is usually no report at all.
  auto status = classifyExit(TerminationReason::NONE, oom, nullptr);
  KJ_ASSERT(status.is<LimitExceeded>());
  KJ_EXPECT(status.get<LimitExceeded>().resource == LimitExceeded::Resource::MEMORY);

  // Never reported as a crash, even with a SIGKILL status.
  status = classifyExit(TerminationReason::NONE, oom, signaled(SIGKILL));
  KJ_ASSERT(status.is<LimitExceeded>());

  status = classifyExit(TerminationReason::NONE, pids, exited(3));
  KJ_ASSERT(status.is<LimitExceeded>());
  KJ_EXPECT(status.get<LimitExceeded>().resource == LimitExceeded::Resource::PROCESSES);

  // A command that coped with a failed fork() still succeeded.
  status = classifyExit(TerminationReason::NONE, pids, exited(0));
  KJ_ASSERT(status.is<Completed>());
}

KJ_TEST("classifyExit: no report and no explanation is an error") {
  KJ_EXPECT_THROW_MESSAGE("without reporting",
                          classifyExit(TerminationReason::NONE, {}, nullptr));
}

KJ_TEST("describe") {
  ExitStatus status;
  status.init<Completed>(Completed { 7 });
  KJ_EXPECT(describe(status) == "completed with exit code 7");
  status.init<TimedOut>();
  KJ_EXPECT(describe(status) == "timed out");
  status.init<LimitExceeded>(LimitExceeded { LimitExceeded::Resource::MEMORY });
  KJ_EXPECT(describe(status) == "killed for exceeding its memory limit");
}

KJ_TEST("formatIdMap") {
  KJ_EXPECT(formatIdMap(nullptr, 1234) == "1000 1234 1\n");

  const IdMapping mappings[] = {
    { 1234, 0, 1 },
    { 100000, 1, 65536 },
  };
  KJ_EXPECT(formatIdMap(mappings, 1234) == "0 1234 1\n1 100000 65536\n");
}

}  // namespace
}  // namespace sandbroker
