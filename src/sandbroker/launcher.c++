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
#include <kj/debug.h>
#include <kj/io.h>
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <sandbroker/sandbox.capnp.h>
#include <sys/eventfd.h>
#include <sys/wait.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <errno.h>
#include <limits.h>

namespace sandbroker {

kj::String describe(const ExitStatus& status) {
  if (status.is<Completed>()) {
    return kj::str("completed with exit code ", status.get<Completed>().exitCode);
  } else if (status.is<TimedOut>()) {
    return kj::str("timed out");
  } else if (status.is<LimitExceeded>()) {
    switch (status.get<LimitExceeded>().resource) {
      case LimitExceeded::Resource::MEMORY:
        return kj::str("killed for exceeding its memory limit");
      case LimitExceeded::Resource::PROCESSES:
        return kj::str("failed after reaching its process limit");
    }
    KJ_UNREACHABLE;
  } else if (status.is<Crashed>()) {
    int signo = status.get<Crashed>().signal;
    return kj::str("killed by signal ", signo, " (", strsignal(signo), ")");
  } else if (status.is<Cancelled>()) {
    return kj::str("cancelled");
  } else if (status.is<PolicyViolation>()) {
    return kj::str("killed for a forbidden system call (signal ",
                   status.get<PolicyViolation>().signal, ")");
  }
  KJ_FAIL_REQUIRE("exit status not set");
}

void OutputBuffer::append(kj::ArrayPtr<const char> bytes) {
  size_t room = limit - data.size();
  if (bytes.size() > room) {
    truncated = true;
    bytes = bytes.slice(0, room);
  }
  data.addAll(bytes);
}

CancelSignal::CancelSignal() {
  int efd;
  KJ_SYSCALL(efd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK));
  fd = kj::AutoCloseFd(efd);
}

void CancelSignal::raise() const {
  // The counter is never read, so it stays readable from the first raise on.
  uint64_t one = 1;
  KJ_SYSCALL(write(fd, &one, sizeof(one)));
}

bool CancelSignal::isRaised() const {
  struct pollfd pfd = { fd.get(), POLLIN, 0 };
  int n;
  KJ_SYSCALL(n = poll(&pfd, 1, 0));
  return n > 0;
}

ExitStatus classifyExit(TerminationReason reason, const LimitEvents& events,
                        kj::Maybe<int> waitStatus) {
  ExitStatus result;

  switch (reason) {
    case TerminationReason::TIMEOUT:
      result.init<TimedOut>();
      return result;
    case TerminationReason::CANCEL:
      result.init<Cancelled>();
      return result;
    case TerminationReason::NONE:
      break;
  }

  if (events.oomKilled) {
    result.init<LimitExceeded>(LimitExceeded { LimitExceeded::Resource::MEMORY });
    return result;
  }

  bool failed = true;
  KJ_IF_MAYBE(status, waitStatus) {
    failed = *status != 0;
  }
  if (events.pidsLimitHit && failed) {
    result.init<LimitExceeded>(LimitExceeded { LimitExceeded::Resource::PROCESSES });
    return result;
  }

  int status = KJ_REQUIRE_NONNULL(waitStatus,
      "sandbox exited without reporting the command's status");
  if (WIFEXITED(status)) {
    result.init<Completed>(Completed { WEXITSTATUS(status) });
  } else if (WIFSIGNALED(status)) {
    int signo = WTERMSIG(status);
    if (signo == POLICY_VIOLATION_SIGNAL) {
      result.init<PolicyViolation>(PolicyViolation { signo });
    } else {
      result.init<Crashed>(Crashed { signo });
    }
  } else {
    KJ_FAIL_ASSERT("unexpected wait status", status);
  }
  return result;
}

int pollTimeoutUntil(kj::TimePoint deadline, kj::TimePoint now) {
  if (deadline <= now) return 0;
  // Round up, so we don't wake just short of the deadline and spin.
  int64_t ms = (deadline - now + kj::MILLISECONDS - 1 * kj::NANOSECONDS) / kj::MILLISECONDS;
  return ms > INT_MAX ? INT_MAX : int(ms);
}

// =======================================================================================

namespace {

constexpr auto DRAIN_TIMEOUT = 5 * kj::SECONDS;
// How long to keep reading output after SIGKILL. Killing PID 1 of the pid namespace takes every
// writer with it, so in practice the pipes close almost immediately.

class Supervisor {
public:
  Supervisor(IsolatedEnvironment& env, const CancelSignal& cancel, const LaunchOptions& options)
      : env(env), cancel(cancel), options(options),
        stdoutBuffer(options.outputLimitBytes), stderrBuffer(options.outputLimitBytes) {
    state.init<Created>();
  }

  RunResult run(const Command& command, kj::ArrayPtr<const EnvironmentVariable> environment,
                kj::StringPtr workingDirectory, kj::Maybe<kj::Duration> timeout) {
    KJ_REQUIRE(state.is<Created>());
    KJ_REQUIRE(env.isStubRunning(), "sandbox is not running");
    state.init<Prepared>();

    auto& clock = kj::systemPreciseMonotonicClock();
    auto startTime = clock.now();
    sendExecRequest(command, environment, workingDirectory);
    state.init<Running>(Running { startTime });

    KJ_IF_MAYBE(t, timeout) {
      termDeadline = startTime + *t;
    }
    superviseUntilClosed();

    int stubStatus = env.waitStub();
    auto wallTime = clock.now() - startTime;

    kj::Maybe<int> waitStatus;
    uint64_t maxRssKilobytes = 0;
    auto cpuTime = 0 * kj::SECONDS;
    if (controlBytes.size() > 0) {
      // A report cut short by SIGKILL is expected when we killed the stub ourselves.
      KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
        kj::ArrayInputStream input(kj::arrayPtr(
            reinterpret_cast<const kj::byte*>(controlBytes.begin()), controlBytes.size()));
        capnp::InputStreamMessageReader reader(input);
        auto report = reader.getRoot<ipc::ExitReport>();
        switch (report.which()) {
          case ipc::ExitReport::FINISHED: {
            auto finished = report.getFinished();
            waitStatus = finished.getWaitStatus();
            maxRssKilobytes = finished.getMaxRssKilobytes();
            cpuTime = int64_t(finished.getUserMicros() + finished.getSystemMicros()) *
                      kj::MICROSECONDS;
            break;
          }
          case ipc::ExitReport::LAUNCH_FAILED:
            launchError = kj::heapString(report.getLaunchFailed());
            break;
        }
      })) {
        if (reason == TerminationReason::NONE) {
          kj::throwFatalException(kj::mv(*exception));
        }
        KJ_LOG(INFO, "discarding partial exit report from killed sandbox", *exception);
      }
    }

    KJ_IF_MAYBE(error, launchError) {
      KJ_FAIL_REQUIRE("failed to launch command", command.executable, *error);
    }

    LimitEvents events;
    CgroupUsage usage;
    KJ_IF_MAYBE(group, env.getCgroup()) {
      events = readLimitEvents(*group);
      usage = readUsage(*group);
    }

    if (waitStatus == nullptr && reason == TerminationReason::NONE && !events.oomKilled &&
        !events.pidsLimitHit) {
      KJ_LOG(ERROR, "sandbox stub died without a report", stubStatus);
    }

    RunResult result;
    result.exitStatus = classifyExit(reason, events, waitStatus);
    result.stdoutTruncated = stdoutBuffer.isTruncated();
    result.stderrTruncated = stderrBuffer.isTruncated();
    result.stdoutBytes = stdoutBuffer.release();
    result.stderrBytes = stderrBuffer.release();
    result.wallTimeUsed = wallTime;
    KJ_IF_MAYBE(peak, usage.peakMemoryBytes) {
      result.peakMemoryBytes = *peak;
    } else if (maxRssKilobytes > 0) {
      result.peakMemoryBytes = maxRssKilobytes * 1024;
    }
    KJ_IF_MAYBE(cpu, usage.cpuTime) {
      result.cpuTimeUsed = *cpu;
    } else {
      result.cpuTimeUsed = cpuTime;
    }

    state.init<ExitStatus>(result.exitStatus);
    return result;
  }

private:
  IsolatedEnvironment& env;
  const CancelSignal& cancel;
  const LaunchOptions& options;

  RunState state;
  OutputBuffer stdoutBuffer;
  OutputBuffer stderrBuffer;
  kj::Vector<char> controlBytes;

  TerminationReason reason = TerminationReason::NONE;
  kj::Maybe<kj::TimePoint> termDeadline;
  kj::Maybe<kj::TimePoint> killDeadline;
  kj::Maybe<kj::TimePoint> drainDeadline;
  kj::Maybe<kj::String> launchError;

  void sendExecRequest(const Command& command,
                       kj::ArrayPtr<const EnvironmentVariable> environment,
                       kj::StringPtr workingDirectory) {
    capnp::MallocMessageBuilder message;
    auto request = message.initRoot<ipc::ExecRequest>();
    request.setExecutable(command.executable);

    auto argv = request.initArgv(command.args.size() + 1);
    argv.set(0, command.executable);
    for (auto i: kj::indices(command.args)) {
      argv.set(i + 1, command.args[i]);
    }

    auto envp = request.initEnvironment(environment.size());
    for (auto i: kj::indices(environment)) {
      envp.set(i, kj::str(environment[i].name, '=', environment[i].value));
    }

    request.setWorkingDirectory(workingDirectory);
    request.setSyscallFilter(options.syscallFilter);
    capnp::writeMessageToFd(env.getControlFd(), message);
  }

  void terminate(TerminationReason why, kj::TimePoint now) {
    if (reason != TerminationReason::NONE) return;
    reason = why;
    kj::StringPtr cause = why == TerminationReason::TIMEOUT ? "timeout" : "cancel";
    KJ_LOG(INFO, "terminating sandbox", cause, env.getStubPid());
    env.signalGroup(SIGTERM);
    killDeadline = now + options.gracePeriod;
  }

  void killHard(kj::TimePoint now) {
    env.signalGroup(SIGKILL);
    KJ_IF_MAYBE(group, env.getCgroup()) {
      group->killAll();
    }
    killDeadline = nullptr;
    drainDeadline = now + DRAIN_TIMEOUT;
  }

  bool readInto(int fd, kj::Function<void(kj::ArrayPtr<const char>)> sink) {
    // Returns false at EOF.
    char buffer[8192];
    ssize_t n;
    KJ_SYSCALL(n = read(fd, buffer, sizeof(buffer)));
    if (n == 0) return false;
    sink(kj::arrayPtr(buffer, n));
    return true;
  }

  void superviseUntilClosed() {
    auto& clock = kj::systemPreciseMonotonicClock();
    bool stdoutOpen = true, stderrOpen = true, controlOpen = true;

    while (stdoutOpen || stderrOpen || controlOpen) {
      auto now = clock.now();

      KJ_IF_MAYBE(deadline, termDeadline) {
        if (now >= *deadline) {
          termDeadline = nullptr;
          terminate(TerminationReason::TIMEOUT, now);
        }
      }
      KJ_IF_MAYBE(deadline, killDeadline) {
        if (now >= *deadline) {
          killHard(now);
        }
      }
      KJ_IF_MAYBE(deadline, drainDeadline) {
        if (now >= *deadline) {
          KJ_LOG(WARNING, "sandbox output still open after SIGKILL; giving up on it");
          break;
        }
      }

      int timeoutMs = -1;
      for (auto& deadline: { termDeadline, killDeadline, drainDeadline }) {
        KJ_IF_MAYBE(d, deadline) {
          int ms = pollTimeoutUntil(*d, now);
          if (timeoutMs < 0 || ms < timeoutMs) timeoutMs = ms;
        }
      }

      typedef struct pollfd PollFd;
      kj::Vector<PollFd> pollfds;
      if (stdoutOpen) pollfds.add(PollFd { env.getStdoutFd(), POLLIN, 0 });
      if (stderrOpen) pollfds.add(PollFd { env.getStderrFd(), POLLIN, 0 });
      if (controlOpen) pollfds.add(PollFd { env.getControlFd(), POLLIN, 0 });
      if (reason == TerminationReason::NONE) pollfds.add(PollFd { cancel.getFd(), POLLIN, 0 });

      KJ_SYSCALL_HANDLE_ERRORS(poll(pollfds.begin(), pollfds.size(), timeoutMs)) {
        case EINTR:
          continue;
        default:
          KJ_FAIL_SYSCALL("poll()", error);
      }

      for (auto& item: pollfds) {
        if (item.revents == 0) continue;

        if (item.fd == cancel.getFd()) {
          terminate(TerminationReason::CANCEL, clock.now());
        } else if (item.fd == env.getStdoutFd()) {
          stdoutOpen = readInto(item.fd, [this](kj::ArrayPtr<const char> data) {
            stdoutBuffer.append(data);
          });
        } else if (item.fd == env.getStderrFd()) {
          stderrOpen = readInto(item.fd, [this](kj::ArrayPtr<const char> data) {
            stderrBuffer.append(data);
          });
        } else if (item.fd == env.getControlFd()) {
          controlOpen = readInto(item.fd, [this](kj::ArrayPtr<const char> data) {
            controlBytes.addAll(data);
          });
        } else {
          KJ_FAIL_ASSERT("unexpected FD returned by poll()?");
        }
      }
    }
  }
};

}  // namespace

RunResult run(const Command& command, kj::ArrayPtr<const EnvironmentVariable> environment,
              kj::StringPtr workingDirectory, IsolatedEnvironment& env,
              kj::Maybe<kj::Duration> wallClockTimeout, const CancelSignal& cancel,
              const LaunchOptions& options) {
  kj::Maybe<RunResult> result;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    Supervisor supervisor(env, cancel, options);
    result = supervisor.run(command, environment, workingDirectory, wallClockTimeout);
  })) {
    env.teardown();
    kj::throwFatalException(kj::mv(*exception));
  }

  auto& finished = KJ_ASSERT_NONNULL(result);
  finished.teardownWarnings = KJ_MAP(warning, env.teardown()) { return kj::heapString(warning); };
  return kj::mv(finished);
}

}  // namespace sandbroker
