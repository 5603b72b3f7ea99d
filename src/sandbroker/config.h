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

#ifndef SANDBROKER_CONFIG_H_
#define SANDBROKER_CONFIG_H_

#include <kj/string.h>
#include <kj/time.h>
#include "policy.h"

namespace sandbroker {

struct BrokerConfig {
  kj::String scratchDir = kj::str("/tmp");
  // Each run gets a private, initially empty directory under here that becomes its root mount
  // point. Nothing is ever written into it on the host side.

  kj::String cgroupRoot = kj::str("/sys/fs/cgroup/sandbroker");
  // A cgroup v2 directory delegated to the broker's user. Only used by runs whose policy sets
  // a cpu, memory or process limit.

  kj::Duration gracePeriod = 2 * kj::SECONDS;
  // Time between SIGTERM and SIGKILL when a run is timed out or cancelled.

  bool syscallFilter = true;
};

BrokerConfig parseBrokerConfig(kj::StringPtr text);
// Parses KEY=VALUE lines. Blank lines and '#' comments are ignored. Unrecognized keys are
// logged and skipped; malformed values throw.

BrokerConfig readBrokerConfig(const char* path);

RunRequest parseRunRequest(kj::StringPtr text);
// Parses a request written in Cap'n Proto text format against RunRequestConfig (see
// policy.capnp). Throws on syntax errors and on fields the schema does not declare. The result
// still has to pass validate().
//
// A request that lists no root mounts gets the default mount set: the host's "/", read-only.

RunRequest readRunRequest(const char* path);

}  // namespace sandbroker

#endif // SANDBROKER_CONFIG_H_
