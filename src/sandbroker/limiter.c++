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

#include "limiter.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <math.h>

namespace sandbroker {

static constexpr uint64_t CPU_PERIOD_MICROS = 100000;

kj::String formatCpuMax(double cores) {
  // The kernel refuses quotas under 1ms.
  uint64_t quota = kj::max(uint64_t(1000), uint64_t(ceil(cores * CPU_PERIOD_MICROS)));
  return kj::str(quota, " ", CPU_PERIOD_MICROS);
}

void attach(IsolatedEnvironment& env, const Policy& policy, const BrokerConfig& config,
            kj::StringPtr runName) {
  if (!policy.needsCgroup()) return;

  kj::Maybe<Cgroup> maybeRoot;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    maybeRoot = Cgroup(config.cgroupRoot);
  })) {
    KJ_FAIL_REQUIRE("cgroup root unusable; resource limits need a delegated cgroup v2 directory",
                    config.cgroupRoot, exception->getDescription());
  }
  auto& root = KJ_ASSERT_NONNULL(maybeRoot);

  kj::Vector<kj::StringPtr> controllers;
  if (policy.memoryLimitBytes != nullptr) controllers.add("memory");
  if (policy.maxProcesses != nullptr) controllers.add("pids");
  if (policy.cpuLimit != nullptr) controllers.add("cpu");
  root.enableControllers(controllers.asPtr());

  ScopedCgroup scoped(kj::mv(root), runName);
  auto& group = scoped.get();

  KJ_IF_MAYBE(bytes, policy.memoryLimitBytes) {
    group.writeFile("memory.max", kj::str(*bytes));
    // Otherwise a run under a memory limit just swaps.
    group.writeFileIfExists("memory.swap.max", "0");
    // An OOM kill takes the whole run down, not just the largest process.
    group.writeFile("memory.oom.group", "1");
  }
  KJ_IF_MAYBE(n, policy.maxProcesses) {
    // The stub lives in the same group.
    group.writeFile("pids.max", kj::str(uint64_t(*n) + 1));
  }
  KJ_IF_MAYBE(cores, policy.cpuLimit) {
    group.writeFile("cpu.max", formatCpuMax(*cores));
  }

  // Children forked from here on inherit the group.
  group.addPid(env.getStubPid());
  env.adoptCgroup(kj::mv(scoped));
}

LimitEvents readLimitEvents(Cgroup& group) {
  LimitEvents result;
  KJ_IF_MAYBE(count, group.readCounter("memory.events", "oom_kill")) {
    result.oomKilled = *count > 0;
  }
  KJ_IF_MAYBE(count, group.readCounter("pids.events", "max")) {
    result.pidsLimitHit = *count > 0;
  }
  return result;
}

CgroupUsage readUsage(Cgroup& group) {
  CgroupUsage result;
  KJ_IF_MAYBE(text, group.readFileIfExists("memory.peak")) {
    result.peakMemoryBytes = parseUInt64(trim(*text), 10);
  }
  KJ_IF_MAYBE(micros, group.readCounter("cpu.stat", "usage_usec")) {
    result.cpuTime = int64_t(*micros) * kj::MICROSECONDS;
  }
  return result;
}

}  // namespace sandbroker
