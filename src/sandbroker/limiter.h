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

#ifndef SANDBROKER_LIMITER_H_
#define SANDBROKER_LIMITER_H_

#include "sandbox.h"

namespace sandbroker {

void attach(IsolatedEnvironment& env, const Policy& policy, const BrokerConfig& config,
            kj::StringPtr runName);
// Put the sandbox under a fresh cgroup below config.cgroupRoot carrying the policy's cpu, memory
// and process limits. Does nothing when the policy sets none of them. Must be called before the
// target is launched, so that everything it forks is accounted.

kj::String formatCpuMax(double cores);
// Contents of cpu.max for the given number of cores, with a 100ms period.

struct LimitEvents {
  bool oomKilled = false;
  bool pidsLimitHit = false;
};

LimitEvents readLimitEvents(Cgroup& group);

struct CgroupUsage {
  kj::Maybe<uint64_t> peakMemoryBytes;
  // memory.peak is only available from Linux 5.19.

  kj::Maybe<kj::Duration> cpuTime;
};

CgroupUsage readUsage(Cgroup& group);

}  // namespace sandbroker

#endif // SANDBROKER_LIMITER_H_
