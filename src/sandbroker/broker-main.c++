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

#include <kj/main.h>
#include <kj/debug.h>
#include <kj/io.h>
#include <kj/thread.h>
#include <sys/signalfd.h>
#include <poll.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>
#include <errno.h>

#include "broker.h"

namespace sandbroker {

// Exit codes, chosen to match timeout(1) and the shell's conventions.
static constexpr int EXIT_TIMED_OUT = 124;
static constexpr int EXIT_BROKER_ERROR = 125;
static constexpr int EXIT_SIGNAL_BASE = 128;
static constexpr int EXIT_LIMIT_EXCEEDED = 128 + SIGKILL;
static constexpr int EXIT_CANCELLED = 128 + SIGINT;

class BrokerMain {
  // Runs one request file and exits with the outcome.

public:
  BrokerMain(kj::ProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Sandbroker version " SANDBROKER_VERSION,
                           "Runs the command described by <request-file> in a fresh sandbox and "
                           "relays its output. The request is a RunRequestConfig (see "
                           "policy.capnp) in Cap'n Proto text format. Exits with the command's "
                           "own exit code, 124 if it timed out, 125 if the broker failed, 128+n "
                           "if it died from signal n, 137 if it exceeded a resource limit, or "
                           "130 if it was interrupted.")
        .addOptionWithArg({'c', "config"}, KJ_BIND_METHOD(*this, setConfig), "<file>",
                          "Read broker settings (KEY=VALUE lines) from <file>.")
        .expectArg("<request-file>", KJ_BIND_METHOD(*this, run))
        .build();
  }

  kj::MainBuilder::Validity setConfig(kj::StringPtr arg) {
    configPath = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity run(kj::StringPtr requestFile) {
    int code = execute(requestFile);
    // Like a shell, pass the command's status through as our own.
    _exit(code);
  }

private:
  kj::ProcessContext& context;
  kj::Maybe<kj::String> configPath;

  int execute(kj::StringPtr requestFile) {
    BrokerConfig config;
    RunRequest request;
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      KJ_IF_MAYBE(path, configPath) {
        config = readBrokerConfig(path->cStr());
      }
      request = readRunRequest(requestFile.cStr());
    })) {
      context.warning(kj::str("sandbroker: ", exception->getDescription()));
      return EXIT_BROKER_ERROR;
    }

    Broker broker(kj::mv(config));

    // SIGINT and SIGTERM cancel the run. They're blocked here and picked up by a watcher
    // thread through a signalfd; the sandbox unblocks them again before exec.
    sigset_t sigmask;
    KJ_SYSCALL(sigemptyset(&sigmask));
    KJ_SYSCALL(sigaddset(&sigmask, SIGINT));
    KJ_SYSCALL(sigaddset(&sigmask, SIGTERM));
    KJ_SYSCALL(sigprocmask(SIG_BLOCK, &sigmask, nullptr));
    int sigfd;
    KJ_SYSCALL(sigfd = signalfd(-1, &sigmask, SFD_CLOEXEC));
    kj::AutoCloseFd signalFd(sigfd);

    CancelSignal done;
    kj::Thread watcher([&]() {
      struct pollfd fds[2] = {
        { signalFd.get(), POLLIN, 0 },
        { done.getFd(), POLLIN, 0 },
      };
      for (;;) {
        KJ_SYSCALL_HANDLE_ERRORS(poll(fds, 2, -1)) {
          case EINTR:
            continue;
          default:
            KJ_FAIL_SYSCALL("poll()", error);
        }
        if (fds[1].revents != 0) return;
        if (fds[0].revents != 0) {
          struct signalfd_siginfo siginfo;
          KJ_SYSCALL(read(signalFd, &siginfo, sizeof(siginfo)));
          context.warning(kj::str("sandbroker: ", strsignal(siginfo.ssi_signo),
                                  "; cancelling run"));
          broker.shutdown();
        }
      }
    });
    KJ_DEFER(done.raise());

    auto outcome = broker.execute(kj::mv(request));

    if (outcome.is<BrokerError>()) {
      auto& error = outcome.get<BrokerError>();
      context.warning(kj::str("sandbroker: ", error));
      for (auto& warning: error.teardownWarnings) {
        context.warning(kj::str("sandbroker: teardown: ", warning));
      }
      return error.stage == BrokerError::Stage::SUBMIT ? EXIT_CANCELLED : EXIT_BROKER_ERROR;
    }

    auto& result = outcome.get<RunResult>();
    kj::FdOutputStream(STDOUT_FILENO).write(result.stdoutBytes.begin(), result.stdoutBytes.size());
    kj::FdOutputStream(STDERR_FILENO).write(result.stderrBytes.begin(), result.stderrBytes.size());

    if (result.stdoutTruncated) {
      context.warning("sandbroker: stdout was truncated");
    }
    if (result.stderrTruncated) {
      context.warning("sandbroker: stderr was truncated");
    }
    for (auto& warning: result.teardownWarnings) {
      context.warning(kj::str("sandbroker: teardown: ", warning));
    }

    auto& status = result.exitStatus;
    if (status.is<Completed>()) {
      return status.get<Completed>().exitCode;
    }

    context.warning(kj::str("sandbroker: command ", describe(status)));
    if (status.is<TimedOut>()) {
      return EXIT_TIMED_OUT;
    } else if (status.is<LimitExceeded>()) {
      return EXIT_LIMIT_EXCEEDED;
    } else if (status.is<Crashed>()) {
      return EXIT_SIGNAL_BASE + status.get<Crashed>().signal;
    } else if (status.is<PolicyViolation>()) {
      return EXIT_SIGNAL_BASE + status.get<PolicyViolation>().signal;
    } else if (status.is<Cancelled>()) {
      return EXIT_CANCELLED;
    }
    KJ_UNREACHABLE;
  }
};

}  // namespace sandbroker

KJ_MAIN(sandbroker::BrokerMain)
