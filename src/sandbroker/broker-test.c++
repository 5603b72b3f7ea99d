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

// These tests build real sandboxes, so they need unprivileged user namespaces. Where the host
// doesn't allow them, each test logs a warning and passes vacuously. Tests of resource limits
// additionally need SANDBROKER_TEST_CGROUP_ROOT to name a cgroup v2 directory delegated to the
// current user.

#include "broker.h"
#include <kj/test.h>
#include <kj/thread.h>
#include <stdlib.h>
#include <unistd.h>
#include <signal.h>
#include <errno.h>
#include <fcntl.h>

namespace sandbroker {
namespace {

bool sandboxAvailable() {
  static int available = -1;
  if (available < 0) {
    Policy policy;
    policy.rootMounts = kj::heapArray<MountPoint>(1);
    policy.rootMounts[0] = MountPoint { kj::str("/"), kj::str("/"), true };
    BrokerConfig config;
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
      prepare(policy, config)->teardown();
    })) {
      KJ_LOG(WARNING, "can't build a sandbox on this host; skipping", *exception);
      available = 0;
    } else {
      available = 1;
    }
  }
  return available;
}

kj::Maybe<kj::StringPtr> cgroupRoot() {
  const char* root = getenv("SANDBROKER_TEST_CGROUP_ROOT");
  if (root == nullptr || *root == '\0') {
    KJ_LOG(WARNING, "SANDBROKER_TEST_CGROUP_ROOT not set; skipping resource limit test");
    return nullptr;
  }
  return kj::StringPtr(root);
}

class TempDir {
public:
  TempDir() {
    path = kj::str("/tmp/sandbroker-test-XXXXXX");
    if (mkdtemp(path.begin()) == nullptr) {
      KJ_FAIL_SYSCALL("mkdtemp()", errno, path);
    }
  }
  ~TempDir() noexcept(false) {
    for (auto& name: listDirectory(path)) {
      KJ_SYSCALL(unlink(kj::str(path, '/', name).cStr()), name);
    }
    KJ_SYSCALL(rmdir(path.cStr()), path);
  }
  KJ_DISALLOW_COPY(TempDir);

  kj::StringPtr get() { return path; }

private:
  kj::String path;
};

class TestBroker {
  // A broker with its own scratch directory and a short grace period.

  TempDir scratch;

public:
  explicit TestBroker(kj::Maybe<kj::StringPtr> cgroup = nullptr)
      : broker(makeConfig(scratch.get(), cgroup)) {}

  ~TestBroker() noexcept(false) {
    KJ_EXPECT(broker.liveRunCount() == 0);
    // Every run's scratch directory must be gone.
    auto leftovers = listDirectory(scratch.get());
    KJ_EXPECT(leftovers.size() == 0, kj::strArray(leftovers, ", "));
  }

  Broker broker;

private:
  static BrokerConfig makeConfig(kj::StringPtr scratchDir, kj::Maybe<kj::StringPtr> cgroup) {
    BrokerConfig config;
    config.scratchDir = kj::heapString(scratchDir);
    config.gracePeriod = 200 * kj::MILLISECONDS;
    KJ_IF_MAYBE(c, cgroup) {
      config.cgroupRoot = kj::heapString(*c);
    }
    return config;
  }
};

RunRequest command(kj::StringPtr executable, std::initializer_list<kj::StringPtr> args = {}) {
  RunRequest request;
  request.command.executable = kj::heapString(executable);
  auto builder = kj::heapArrayBuilder<kj::String>(args.size());
  for (auto arg: args) {
    builder.add(kj::heapString(arg));
  }
  request.command.args = builder.finish();
  request.environment = kj::heapArray<EnvironmentVariable>(1);
  request.environment[0] = EnvironmentVariable { kj::str("PATH"), kj::str("/usr/bin:/bin") };
  request.policy.rootMounts = kj::heapArray<MountPoint>(1);
  request.policy.rootMounts[0] = MountPoint { kj::str("/"), kj::str("/"), true };
  return request;
}

RunRequest probe(std::initializer_list<kj::StringPtr> args) {
  return command(SANDBROKER_PROBE_PATH, args);
}

RunResult expectResult(kj::OneOf<RunResult, BrokerError>&& outcome) {
  if (outcome.is<BrokerError>()) {
    KJ_FAIL_ASSERT("run failed", outcome.get<BrokerError>());
  }
  auto result = kj::mv(outcome.get<RunResult>());
  KJ_EXPECT(result.teardownWarnings.size() == 0,
            kj::strArray(result.teardownWarnings, "; "));
  return result;
}

BrokerError expectError(kj::OneOf<RunResult, BrokerError>&& outcome) {
  if (outcome.is<RunResult>()) {
    KJ_FAIL_ASSERT("run unexpectedly succeeded", describe(outcome.get<RunResult>().exitStatus));
  }
  return kj::mv(outcome.get<BrokerError>());
}

int exitCode(const RunResult& result) {
  KJ_ASSERT(result.exitStatus.is<Completed>(), describe(result.exitStatus));
  return result.exitStatus.get<Completed>().exitCode;
}

kj::String output(const kj::Array<char>& bytes) {
  return kj::heapString(bytes);
}

bool hasSubstring(kj::StringPtr haystack, kj::StringPtr needle) {
  if (needle.size() <= haystack.size()) {
    for (size_t i = 0; i <= haystack.size() - needle.size(); i++) {
      if (haystack.slice(i).startsWith(needle)) {
        return true;
      }
    }
  }
  return false;
}

// =======================================================================================

KJ_TEST("echo hi") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto result = expectResult(test.broker.execute(command("echo", {"hi"})));
  KJ_EXPECT(exitCode(result) == 0);
  KJ_EXPECT(output(result.stdoutBytes) == "hi\n");
  KJ_EXPECT(result.stderrBytes.size() == 0);
  KJ_EXPECT(!result.stdoutTruncated);
}

KJ_TEST("the command's exit code is reported") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto result = expectResult(test.broker.execute(command("sh", {"-c", "echo oops >&2; exit 3"})));
  KJ_EXPECT(exitCode(result) == 3);
  KJ_EXPECT(output(result.stderrBytes) == "oops\n");
}

KJ_TEST("timeout") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto request = command("sleep", {"10"});
  request.policy.wallClockTimeout = 1 * kj::SECONDS;
  auto result = expectResult(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(result.exitStatus.is<TimedOut>(), describe(result.exitStatus));
  KJ_EXPECT(result.wallTimeUsed >= 1 * kj::SECONDS);
  KJ_EXPECT(result.wallTimeUsed < 5 * kj::SECONDS);
}

KJ_TEST("nothing survives a timed-out run") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto token = kj::str("sandbroker-spin-", getpid());
  auto request = probe({"spin", token});
  request.policy.wallClockTimeout = 300 * kj::MILLISECONDS;
  auto result = expectResult(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(result.exitStatus.is<TimedOut>(), describe(result.exitStatus));
  KJ_EXPECT(output(result.stdoutBytes) == "spinning\n");

  // Look for the spinner and its child among the host's processes. Give exiting processes a
  // moment to disappear from /proc.
  auto findSpinner = [&]() -> bool {
    for (auto& name: listDirectory("/proc")) {
      if (parseUInt(name, 10) == nullptr) continue;
      KJ_IF_MAYBE(fd, raiiOpenIfExists(kj::str("/proc/", name, "/cmdline"), O_RDONLY | O_CLOEXEC)) {
        auto cmdline = readAll(*fd);
        for (auto& c: cmdline) {
          if (c == '\0') c = ' ';
        }
        if (hasSubstring(cmdline, token)) return true;
      }
    }
    return false;
  };
  bool found = true;
  for (uint i = 0; i < 100 && (found = findSpinner()); i++) {
    usleep(10000);
  }
  KJ_EXPECT(!found, "sandboxed process outlived its run");
}

KJ_TEST("no network by default") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto result = expectResult(test.broker.execute(probe({"connect", "1.1.1.1", "80"})));
  KJ_EXPECT(exitCode(result) == 2, output(result.stderrBytes));
}

KJ_TEST("hostname and ids") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto result = expectResult(test.broker.execute(probe({"hostname"})));
  KJ_EXPECT(exitCode(result) == 0);
  KJ_EXPECT(output(result.stdoutBytes) == "sandbox\n");

  result = expectResult(test.broker.execute(probe({"ids"})));
  KJ_EXPECT(exitCode(result) == 0);
  KJ_EXPECT(output(result.stdoutBytes) == "1000 1000\n");
}

KJ_TEST("read-only and writable mounts") {
  if (!sandboxAvailable()) return;
  TestBroker test;
  TempDir work;

  auto request = command("sh", {"-c", "echo data > /work/out && echo x > /etc/sandbroker-test"});
  auto mounts = kj::heapArrayBuilder<MountPoint>(2);
  mounts.add(MountPoint { kj::str("/"), kj::str("/"), true });
  mounts.add(MountPoint { kj::heapString(work.get()), kj::str("/work"), false });
  request.policy.rootMounts = mounts.finish();

  auto result = expectResult(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(exitCode(result) != 0);
  KJ_EXPECT(readAll(kj::str(work.get(), "/out")) == "data\n");
  KJ_EXPECT(access("/etc/sandbroker-test", F_OK) < 0);
  KJ_EXPECT(access("/work", F_OK) < 0);
}

KJ_TEST("mount targets that don't exist on the host") {
  if (!sandboxAvailable()) return;
  TestBroker test;
  TempDir outer;
  TempDir work;

  auto marker = kj::str(outer.get(), "/marker");
  {
    auto fd = raiiOpen(marker, O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
    kj::FdOutputStream(fd.get()).write("outer\n", 6);
  }

  // Read-only host root with a writable mount at a path the host lacks, and a writable mount
  // holding a second mount at a path the first one lacks.
  auto missingTop = kj::str("/sandbroker-missing-", getpid());
  auto request = command("sh", {"-c", kj::str(
      "echo a > ", missingTop, "/work/a && "
      "echo b > /outer/inner/work/b && "
      "cat /outer/marker && "
      "echo c > /outer/marker && "
      "! mkdir /outer/new 2>/dev/null && "
      "! mkdir /new 2>/dev/null")});
  auto mounts = kj::heapArrayBuilder<MountPoint>(4);
  mounts.add(MountPoint { kj::str("/"), kj::str("/"), true });
  mounts.add(MountPoint { kj::heapString(work.get()), kj::str(missingTop, "/work"), false });
  mounts.add(MountPoint { kj::heapString(outer.get()), kj::str("/outer"), false });
  mounts.add(MountPoint { kj::heapString(work.get()), kj::str("/outer/inner/work"), false });
  request.policy.rootMounts = mounts.finish();

  auto result = expectResult(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(exitCode(result) == 0, output(result.stderrBytes));
  KJ_EXPECT(output(result.stdoutBytes) == "outer\n");

  KJ_EXPECT(readAll(kj::str(work.get(), "/a")) == "a\n");
  KJ_EXPECT(readAll(kj::str(work.get(), "/b")) == "b\n");
  KJ_EXPECT(readAll(marker) == "c\n");

  // Nothing was created on the host to hold the mount points.
  KJ_EXPECT(access(missingTop.cStr(), F_OK) < 0);
  KJ_EXPECT(access(kj::str(outer.get(), "/inner").cStr(), F_OK) < 0);
  KJ_EXPECT(access(kj::str(outer.get(), "/new").cStr(), F_OK) < 0);
}

KJ_TEST("loopback network") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto request = probe({"loopback"});
  request.policy.networkMode = NetworkMode::LOOPBACK;
  auto result = expectResult(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(exitCode(result) == 0, output(result.stderrBytes));

  // With no network, even the loopback interface is down.
  result = expectResult(test.broker.execute(probe({"loopback"})));
  KJ_EXPECT(exitCode(result) == 2, output(result.stderrBytes));
}

KJ_TEST("full network shares the host's network namespace") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  char buffer[256];
  ssize_t n;
  KJ_SYSCALL(n = readlink("/proc/self/ns/net", buffer, sizeof(buffer) - 1));
  auto hostNamespace = kj::str(kj::arrayPtr(buffer, n), "\n");

  auto request = command("readlink", {"/proc/self/ns/net"});
  request.policy.networkMode = NetworkMode::FULL;
  auto result = expectResult(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(exitCode(result) == 0, output(result.stderrBytes));
  KJ_EXPECT(output(result.stdoutBytes) == hostNamespace);

  result = expectResult(test.broker.execute(command("readlink", {"/proc/self/ns/net"})));
  KJ_EXPECT(exitCode(result) == 0, output(result.stderrBytes));
  KJ_EXPECT(output(result.stdoutBytes) != hostNamespace);
}

KJ_TEST("mountProc shows the sandbox's own pid namespace") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto request = command("cat", {"/proc/self/stat"});
  request.policy.mountProc = true;
  auto result = expectResult(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(exitCode(result) == 0, output(result.stderrBytes));
  auto procStat = output(result.stdoutBytes);
  KJ_EXPECT(procStat.startsWith("1 (cat) "), procStat);

  // Host processes, this one included, are not listed.
  request = command("sh", {"-c", kj::str("test -e /proc/1 && ! test -e /proc/", getpid())});
  request.policy.mountProc = true;
  result = expectResult(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(exitCode(result) == 0, output(result.stderrBytes));
}

KJ_TEST("tmpfs mounts are writable and private") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto request = command("sh", {"-c", "echo x > /tmp/scratch-file && cat /tmp/scratch-file"});
  request.policy.tmpfsMounts = kj::heapArray<kj::String>(1);
  request.policy.tmpfsMounts[0] = kj::str("/tmp");

  auto result = expectResult(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(exitCode(result) == 0, output(result.stderrBytes));
  KJ_EXPECT(output(result.stdoutBytes) == "x\n");
  KJ_EXPECT(access("/tmp/scratch-file", F_OK) < 0);
}

KJ_TEST("output is truncated at the limit") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto request = command("sh", {"-c", "yes | head -c 100000"});
  request.policy.outputLimitBytes = 16;
  auto result = expectResult(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(exitCode(result) == 0);
  KJ_EXPECT(result.stdoutBytes.size() == 16);
  KJ_EXPECT(result.stdoutTruncated);
  KJ_EXPECT(!result.stderrTruncated);
}

KJ_TEST("forbidden system call is a policy violation") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto result = expectResult(test.broker.execute(probe({"syscall"})));
  KJ_ASSERT(result.exitStatus.is<PolicyViolation>(), describe(result.exitStatus));
  KJ_EXPECT(result.exitStatus.get<PolicyViolation>().signal == SIGSYS);
}

KJ_TEST("validation errors") {
  TestBroker test;

  auto request = command("true");
  request.policy.maxProcesses = 0u;
  auto error = expectError(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(error.stage == BrokerError::Stage::VALIDATE);
  KJ_EXPECT(hasSubstring(error.description, "maxProcesses"), error.description);
  KJ_EXPECT(error.cause == nullptr);
}

KJ_TEST("missing mount source") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto request = command("true");
  auto mounts = kj::heapArrayBuilder<MountPoint>(2);
  mounts.add(MountPoint { kj::str("/"), kj::str("/"), true });
  mounts.add(MountPoint { kj::str("/nonexistent/sandbroker"), kj::str("/data"), true });
  request.policy.rootMounts = mounts.finish();

  auto error = expectError(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(error.stage == BrokerError::Stage::PREPARE);
  KJ_EXPECT(hasSubstring(error.description, "mount source does not exist"), error.description);
}

KJ_TEST("executable not found") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  auto error = expectError(test.broker.execute(command("/nonexistent/program")));
  KJ_EXPECT(error.stage == BrokerError::Stage::LAUNCH);
  KJ_EXPECT(hasSubstring(error.description, "failed to launch command"), error.description);
}

KJ_TEST("cancel") {
  if (!sandboxAvailable()) return;
  TestBroker test;
  auto& broker = test.broker;

  kj::Maybe<kj::Own<kj::Thread>> canceller;
  auto result = expectResult(broker.execute(command("sleep", {"10"}),
      kj::Function<void(Broker::HandleId)>([&](Broker::HandleId id) {
    canceller = kj::heap<kj::Thread>([&broker, id]() {
      usleep(300000);
      broker.cancel(id);
      broker.cancel(id);  // Idempotent.
    });
  })));
  canceller = nullptr;

  KJ_EXPECT(result.exitStatus.is<Cancelled>(), describe(result.exitStatus));
  KJ_EXPECT(result.wallTimeUsed < 5 * kj::SECONDS);

  // Unknown and finished ids are ignored.
  broker.cancel(12345);
}

KJ_TEST("concurrent runs are independent") {
  if (!sandboxAvailable()) return;
  TestBroker test;

  constexpr uint COUNT = 4;
  kj::Maybe<RunResult> results[COUNT];
  {
    kj::Vector<kj::Own<kj::Thread>> threads;
    for (uint i = 0; i < COUNT; i++) {
      threads.add(kj::heap<kj::Thread>([&test, &results, i]() {
        auto request = command("sh", {"-c", kj::str("sleep 0.2; echo run ", i, "; exit ", i)});
        results[i] = expectResult(test.broker.execute(kj::mv(request)));
      }));
    }
  }

  for (uint i = 0; i < COUNT; i++) {
    auto& result = KJ_ASSERT_NONNULL(results[i]);
    KJ_EXPECT(exitCode(result) == int(i));
    KJ_EXPECT(output(result.stdoutBytes) == kj::str("run ", i, "\n"));
  }
}

KJ_TEST("shutdown refuses new runs") {
  TestBroker test;
  test.broker.shutdown();

  auto error = expectError(test.broker.execute(command("true")));
  KJ_EXPECT(error.stage == BrokerError::Stage::SUBMIT);
}

KJ_TEST("memory limit") {
  if (!sandboxAvailable()) return;
  KJ_IF_MAYBE(root, cgroupRoot()) {
    TestBroker test(*root);

    auto request = probe({"alloc", "256"});
    request.policy.memoryLimitBytes = uint64_t(32) << 20;
    auto result = expectResult(test.broker.execute(kj::mv(request)));
    KJ_ASSERT(result.exitStatus.is<LimitExceeded>(), describe(result.exitStatus));
    KJ_EXPECT(result.exitStatus.get<LimitExceeded>().resource ==
              LimitExceeded::Resource::MEMORY);

    // The run's cgroup is gone.
    for (auto& name: listDirectory(*root)) {
      KJ_EXPECT(!name.startsWith(kj::str("run-", getpid(), "-")), name);
    }
  }
}

KJ_TEST("memory within the limit") {
  if (!sandboxAvailable()) return;
  KJ_IF_MAYBE(root, cgroupRoot()) {
    TestBroker test(*root);

    auto request = probe({"alloc", "8"});
    request.policy.memoryLimitBytes = uint64_t(128) << 20;
    request.policy.cpuLimit = 0.5;
    auto result = expectResult(test.broker.execute(kj::mv(request)));
    KJ_EXPECT(exitCode(result) == 0);
    KJ_IF_MAYBE(peak, result.peakMemoryBytes) {
      KJ_EXPECT(*peak >= uint64_t(8) << 20, *peak);
    }
  }
}

KJ_TEST("process limit") {
  if (!sandboxAvailable()) return;
  KJ_IF_MAYBE(root, cgroupRoot()) {
    TestBroker test(*root);

    auto request = probe({"fork", "20"});
    request.policy.maxProcesses = 4u;
    auto result = expectResult(test.broker.execute(kj::mv(request)));
    KJ_ASSERT(result.exitStatus.is<LimitExceeded>(), describe(result.exitStatus));
    KJ_EXPECT(result.exitStatus.get<LimitExceeded>().resource ==
              LimitExceeded::Resource::PROCESSES);
  }
}

KJ_TEST("unusable cgroup root") {
  if (!sandboxAvailable()) return;
  TestBroker test(kj::StringPtr("/nonexistent/cgroup"));

  auto request = command("true");
  request.policy.memoryLimitBytes = uint64_t(64) << 20;
  auto error = expectError(test.broker.execute(kj::mv(request)));
  KJ_EXPECT(error.stage == BrokerError::Stage::ATTACH);
  KJ_EXPECT(hasSubstring(error.description, "cgroup root unusable"), error.description);
}

}  // namespace
}  // namespace sandbroker
