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

#ifndef SANDBROKER_POLICY_H_
#define SANDBROKER_POLICY_H_
// Description of what a single sandboxed run is allowed to see and consume.

#include <kj/string.h>
#include <kj/array.h>
#include <kj/one-of.h>
#include <kj/time.h>
#include <sys/types.h>

namespace sandbroker {

enum class NetworkMode {
  NONE,
  // Private network namespace with no interfaces up, not even loopback.

  LOOPBACK,
  // Private network namespace with only `lo` configured.

  FULL
  // Shares the host's network namespace.
};

struct MountPoint {
  kj::String hostPath;
  kj::String sandboxPath;
  bool readOnly = true;
};

struct IdMapping {
  uint32_t hostId;
  uint32_t sandboxId;
  uint32_t count = 1;
};

constexpr size_t DEFAULT_OUTPUT_LIMIT = 1u << 20;
constexpr uint32_t DEFAULT_SANDBOX_ID = 1000;

struct Policy {
  kj::Array<MountPoint> rootMounts;
  // Applied in order. The first entry must mount the sandbox's "/".

  NetworkMode networkMode = NetworkMode::NONE;

  kj::Maybe<double> cpuLimit;
  // In cores; 0.5 means half of one core.

  kj::Maybe<uint64_t> memoryLimitBytes;
  kj::Maybe<uint> maxProcesses;
  kj::Maybe<kj::Duration> wallClockTimeout;

  kj::Array<IdMapping> uidMappings;
  kj::Array<IdMapping> gidMappings;
  // Empty means the broker's own uid and gid appear as DEFAULT_SANDBOX_ID inside the sandbox.

  kj::Array<kj::String> tmpfsMounts;
  bool mountProc = false;
  kj::String hostname = kj::str("sandbox");
  size_t outputLimitBytes = DEFAULT_OUTPUT_LIMIT;
  // Per stream. Output past this point is drained and dropped.

  bool needsCgroup() const {
    return cpuLimit != nullptr || memoryLimitBytes != nullptr || maxProcesses != nullptr;
  }

  Policy clone() const;
  bool operator==(const Policy& other) const;
  bool operator!=(const Policy& other) const { return !(*this == other); }
};

struct Command {
  kj::String executable;
  // If it contains no '/', it is searched for in the PATH given by the run's environment.

  kj::Array<kj::String> args;
  // Not including argv[0], which is always `executable`.
};

struct EnvironmentVariable {
  kj::String name;
  kj::String value;
};

struct RunRequest {
  Command command;
  kj::String workingDirectory = kj::str("/");
  kj::Array<EnvironmentVariable> environment;
  Policy policy;
};

struct ValidationError {
  kj::String field;
  kj::String message;
};

kj::String KJ_STRINGIFY(const ValidationError& error);
kj::StringPtr KJ_STRINGIFY(NetworkMode mode);

kj::OneOf<Policy, ValidationError> validate(Policy&& policy);
// Checks the policy's internal consistency. Pure; touches no files or kernel state, so a mount
// source that does not exist is only discovered by prepare(). Returns the policy unchanged when
// it is valid.

kj::OneOf<RunRequest, ValidationError> validate(RunRequest&& request);
// Validates the request's own fields and its policy.

bool isNormalizedAbsolutePath(kj::StringPtr path);

}  // namespace sandbroker

#endif // SANDBROKER_POLICY_H_
