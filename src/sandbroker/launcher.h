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

#ifndef SANDBROKER_LAUNCHER_H_
#define SANDBROKER_LAUNCHER_H_
// Launching the target inside a prepared sandbox and supervising it to the end.

#include <kj/one-of.h>
#include <kj/time.h>
#include <kj/vector.h>
#include "sandbox.h"
#include "limiter.h"

namespace sandbroker {

// ---------------------------------------------------------------------------------------
// How a run ended

struct Completed {
  int exitCode;
};

struct TimedOut {};

struct LimitExceeded {
  enum class Resource {
    MEMORY,
    PROCESSES
  };
  Resource resource;
};

struct Crashed {
  int signal;
  // Terminated by a signal the broker didn't send.
};

struct Cancelled {};

struct PolicyViolation {
  int signal;
  // Killed by the syscall filter.
};

typedef kj::OneOf<Completed, TimedOut, LimitExceeded, Crashed, Cancelled, PolicyViolation>
    ExitStatus;

kj::String describe(const ExitStatus& status);

// ---------------------------------------------------------------------------------------
// Lifecycle of one run

struct Created {};
struct Prepared {};
struct Running {
  kj::TimePoint startTime;
};

typedef kj::OneOf<Created, Prepared, Running, ExitStatus> RunState;

// ---------------------------------------------------------------------------------------

class OutputBuffer {
  // Accumulates one output stream up to a byte limit. Anything past the limit is counted as
  // truncation and dropped, so the writer is never left blocked on a full pipe.

public:
  explicit OutputBuffer(size_t limit): limit(limit) {}

  void append(kj::ArrayPtr<const char> data);
  bool isTruncated() const { return truncated; }
  size_t size() const { return data.size(); }
  kj::Array<char> release() { return data.releaseAsArray(); }

private:
  size_t limit;
  kj::Vector<char> data;
  bool truncated = false;
};

class CancelSignal {
  // A one-shot, thread-safe flag that a supervision loop can poll() on.

public:
  CancelSignal();
  KJ_DISALLOW_COPY(CancelSignal);

  void raise() const;
  // Idempotent. Safe to call from any thread.

  bool isRaised() const;
  int getFd() const { return fd; }

private:
  kj::AutoCloseFd fd;  // eventfd
};

enum class TerminationReason {
  NONE,
  TIMEOUT,
  CANCEL
};

ExitStatus classifyExit(TerminationReason reason, const LimitEvents& events,
                        kj::Maybe<int> waitStatus);
// Decide the outcome of a run. A termination the broker started wins; then a memory limit kill;
// then the process limit, if the target failed; then the wait status the stub reported.
// `waitStatus` is null when the stub died without reporting, which with no other explanation is
// an internal error and throws.

int pollTimeoutUntil(kj::TimePoint deadline, kj::TimePoint now);
// Milliseconds to pass to poll() to wake at `deadline`, rounded up and clamped to INT_MAX.

struct LaunchOptions {
  kj::Duration gracePeriod = 2 * kj::SECONDS;
  bool syscallFilter = true;
  size_t outputLimitBytes = DEFAULT_OUTPUT_LIMIT;
};

struct RunResult {
  ExitStatus exitStatus;
  kj::Array<char> stdoutBytes;
  kj::Array<char> stderrBytes;
  bool stdoutTruncated = false;
  bool stderrTruncated = false;
  kj::Maybe<uint64_t> peakMemoryBytes;
  kj::Duration cpuTimeUsed = 0 * kj::SECONDS;
  kj::Duration wallTimeUsed = 0 * kj::SECONDS;
  kj::Array<kj::String> teardownWarnings;
};

RunResult run(const Command& command, kj::ArrayPtr<const EnvironmentVariable> environment,
              kj::StringPtr workingDirectory, IsolatedEnvironment& env,
              kj::Maybe<kj::Duration> wallClockTimeout, const CancelSignal& cancel,
              const LaunchOptions& options);
// Launch `command` in `env` and supervise it until it and everything it started are gone, then
// tear `env` down. Teardown happens on every path, including when this throws; the warnings it
// produced stay available from env.teardown().
//
// On timeout or cancellation the sandbox's process group gets SIGTERM, then SIGKILL after
// options.gracePeriod. Note that the target is PID 1 of its pid namespace and so only sees the
// SIGTERM if it handles it.
//
// Throws if the command could not be started (for example, the executable doesn't exist).

}  // namespace sandbroker

#endif // SANDBROKER_LAUNCHER_H_
