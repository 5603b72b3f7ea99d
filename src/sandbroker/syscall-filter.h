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

#ifndef SANDBROKER_SYSCALL_FILTER_H_
#define SANDBROKER_SYSCALL_FILTER_H_

#include <signal.h>

namespace sandbroker {

constexpr int POLICY_VIOLATION_SIGNAL = SIGSYS;
// The filter kills a process that attempts one of the calls that could affect the host as a
// whole (loading kernel modules, rebooting, ...). Such a death is reported as a policy
// violation rather than a crash.

void installSyscallFilter();
// Install a seccomp blacklist on the calling thread. Must be called last before exec(): after
// this, mount(), unshare() and friends are no longer available.

}  // namespace sandbroker

#endif // SANDBROKER_SYSCALL_FILTER_H_
