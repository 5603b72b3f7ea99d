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

#ifndef SANDBROKER_SANDBOX_H_
#define SANDBROKER_SANDBOX_H_
// Construction of the confined environment a run executes in.
//
// A run's namespaces are held open by a small "stub" process forked from the broker. The stub
// unshares, builds the mount tree, pivots into it, and then waits on a control socket for the
// command to launch. Because the namespaces belong to the stub, they disappear with it: killing
// the stub's process group is all it takes to release them.

#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>
#include "cgroup2.h"
#include "config.h"
#include "policy.h"
#include "util.h"

namespace sandbroker {

class IsolatedEnvironment {
public:
  explicit IsolatedEnvironment(kj::String scratchPath);
  // Takes ownership of an already-created, empty scratch directory. Use prepare() rather than
  // constructing one directly.

  KJ_DISALLOW_COPY(IsolatedEnvironment);
  ~IsolatedEnvironment() noexcept(false);
  // Runs teardown() if it hasn't been run, logging any warnings.

  pid_t getStubPid();
  // Also the process group id of everything in the sandbox.

  int getControlFd() { return control.get(); }
  int getStdoutFd() { return stdoutPipe.get(); }
  int getStderrFd() { return stderrPipe.get(); }
  kj::StringPtr getScratchPath() { return scratchPath; }

  void adoptCgroup(ScopedCgroup&& group);
  kj::Maybe<Cgroup&> getCgroup();

  void signalGroup(int signo);
  // Deliver a signal to every process in the sandbox's process group. A no-op once the stub has
  // been reaped.

  int waitStub();
  // Block until the stub exits and return its wait status.

  bool isStubRunning();

  kj::ArrayPtr<const kj::String> teardown();
  // Kill everything that is still alive, remove the cgroup and the scratch directory. Each
  // failure is recorded and returned rather than thrown, so one stuck step doesn't prevent the
  // others. Idempotent; later calls return the same warnings.

private:
  kj::String scratchPath;
  kj::Maybe<Subprocess> stub;
  kj::AutoCloseFd control;
  kj::AutoCloseFd stdoutPipe;
  kj::AutoCloseFd stderrPipe;
  kj::Maybe<ScopedCgroup> cgroup;
  bool tornDown = false;
  kj::Vector<kj::String> teardownWarnings;

  friend kj::Own<IsolatedEnvironment> prepare(const Policy& policy, const BrokerConfig& config);
};

kj::Own<IsolatedEnvironment> prepare(const Policy& policy, const BrokerConfig& config);
// Create the namespaces and mount tree described by `policy`. Throws if any step fails: a mount
// source that doesn't exist, user namespaces that are disabled, an id mapping the kernel
// refuses, and so on. Nothing is left behind on failure.
//
// The returned environment is idle: nothing runs in it until the launcher sends an ExecRequest.

kj::String formatIdMap(kj::ArrayPtr<const IdMapping> mappings, uint32_t ownId);
// Render the contents of /proc/<pid>/uid_map or gid_map. With no mappings, `ownId` is mapped to
// DEFAULT_SANDBOX_ID.

}  // namespace sandbroker

#endif // SANDBROKER_SANDBOX_H_
