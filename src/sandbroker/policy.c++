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

#include "policy.h"
#include <kj/debug.h>
#include <kj/vector.h>
#include <math.h>
#include <set>

namespace sandbroker {

namespace {

template <typename... Params>
ValidationError invalid(kj::StringPtr field, Params&&... params) {
  return ValidationError { kj::heapString(field), kj::str(kj::fwd<Params>(params)...) };
}

template <typename T>
bool maybeEqual(const kj::Maybe<T>& a, const kj::Maybe<T>& b) {
  KJ_IF_MAYBE(x, a) {
    KJ_IF_MAYBE(y, b) {
      return *x == *y;
    }
    return false;
  }
  return b == nullptr;
}

bool mappingsEqual(kj::ArrayPtr<const IdMapping> a, kj::ArrayPtr<const IdMapping> b) {
  if (a.size() != b.size()) return false;
  for (auto i: kj::indices(a)) {
    if (a[i].hostId != b[i].hostId || a[i].sandboxId != b[i].sandboxId ||
        a[i].count != b[i].count) {
      return false;
    }
  }
  return true;
}

kj::Array<IdMapping> cloneMappings(kj::ArrayPtr<const IdMapping> mappings) {
  return KJ_MAP(m, mappings) -> IdMapping { return m; };
}

kj::Maybe<ValidationError> checkMappings(kj::StringPtr field,
                                         kj::ArrayPtr<const IdMapping> mappings) {
  for (auto i: kj::indices(mappings)) {
    auto& m = mappings[i];
    if (m.count == 0) {
      return invalid(field, "id mapping ", i, " has a count of zero");
    }
    if (uint64_t(m.hostId) + m.count > (uint64_t(1) << 32) ||
        uint64_t(m.sandboxId) + m.count > (uint64_t(1) << 32)) {
      return invalid(field, "id mapping ", i, " extends past the largest id");
    }
    for (size_t j = 0; j < i; j++) {
      auto& o = mappings[j];
      if (m.sandboxId < o.sandboxId + o.count && o.sandboxId < m.sandboxId + m.count) {
        return invalid(field, "id mappings ", j, " and ", i, " overlap inside the sandbox");
      }
      if (m.hostId < o.hostId + o.count && o.hostId < m.hostId + m.count) {
        return invalid(field, "id mappings ", j, " and ", i, " overlap on the host");
      }
    }
  }
  return nullptr;
}

bool mapsSandboxRoot(kj::ArrayPtr<const IdMapping> mappings) {
  for (auto& m: mappings) {
    if (m.sandboxId == 0) return true;
  }
  return false;
}

kj::Maybe<ValidationError> checkPolicy(const Policy& policy) {
  if (policy.rootMounts.size() == 0) {
    return invalid("rootMounts", "policy has no root mount");
  }
  if (policy.rootMounts[0].sandboxPath != "/") {
    return invalid("rootMounts", "the first mount must supply the sandbox's \"/\", got: ",
                   policy.rootMounts[0].sandboxPath);
  }

  std::set<kj::StringPtr> targets;
  for (auto& mount: policy.rootMounts) {
    if (!mount.hostPath.startsWith("/")) {
      return invalid("rootMounts", "host path must be absolute: ", mount.hostPath);
    }
    if (!isNormalizedAbsolutePath(mount.sandboxPath)) {
      return invalid("rootMounts", "sandbox path must be absolute and normalized: ",
                     mount.sandboxPath);
    }
    if (!targets.insert(mount.sandboxPath).second) {
      return invalid("rootMounts", "sandbox path is mounted more than once: ", mount.sandboxPath);
    }
  }
  for (auto& path: policy.tmpfsMounts) {
    if (!isNormalizedAbsolutePath(path) || path == "/") {
      return invalid("tmpfsMounts", "tmpfs path must be absolute, normalized, and not \"/\": ",
                     path);
    }
    if (!targets.insert(path).second) {
      return invalid("tmpfsMounts", "sandbox path is mounted more than once: ", path);
    }
  }

  KJ_IF_MAYBE(cpu, policy.cpuLimit) {
    if (!isfinite(*cpu) || *cpu <= 0) {
      return invalid("cpuLimit", "cpu limit must be a positive number of cores, got: ", *cpu);
    }
  }
  KJ_IF_MAYBE(memory, policy.memoryLimitBytes) {
    if (*memory == 0) {
      return invalid("memoryLimitBytes", "memory limit must not be zero");
    }
  }
  KJ_IF_MAYBE(processes, policy.maxProcesses) {
    if (*processes == 0) {
      return invalid("maxProcesses", "process limit must not be zero");
    }
  }
  KJ_IF_MAYBE(timeout, policy.wallClockTimeout) {
    if (*timeout <= 0 * kj::NANOSECONDS) {
      return invalid("wallClockTimeout", "timeout must be greater than zero");
    }
  }

  if ((policy.uidMappings.size() == 0) != (policy.gidMappings.size() == 0)) {
    return invalid("uidMappings", "uid and gid mappings must be given together");
  }
  KJ_IF_MAYBE(error, checkMappings("uidMappings", policy.uidMappings)) {
    return kj::mv(*error);
  }
  KJ_IF_MAYBE(error, checkMappings("gidMappings", policy.gidMappings)) {
    return kj::mv(*error);
  }

  if (policy.networkMode == NetworkMode::FULL && mapsSandboxRoot(policy.uidMappings)) {
    // Root inside a fresh user namespace holds no capabilities over the host's network
    // namespace, so whatever it expects to do with them would fail at runtime.
    return invalid("networkMode",
        "full network access cannot be combined with a mapping that makes the sandbox user root");
  }

  if (policy.hostname.size() == 0 || policy.hostname.size() > 64) {
    return invalid("hostname", "hostname must be 1 to 64 bytes long");
  }

  return nullptr;
}

}  // namespace

bool isNormalizedAbsolutePath(kj::StringPtr path) {
  if (!path.startsWith("/")) return false;
  if (path == "/") return true;
  if (path.endsWith("/")) return false;

  auto parts = kj::arrayPtr(path.begin() + 1, path.size() - 1);
  size_t start = 0;
  for (size_t i = 0; i <= parts.size(); i++) {
    if (i == parts.size() || parts[i] == '/') {
      auto part = parts.slice(start, i);
      if (part.size() == 0 ||
          (part.size() == 1 && part[0] == '.') ||
          (part.size() == 2 && part[0] == '.' && part[1] == '.')) {
        return false;
      }
      start = i + 1;
    }
  }
  return true;
}

Policy Policy::clone() const {
  Policy result;
  result.rootMounts = KJ_MAP(m, rootMounts) {
    return MountPoint { kj::heapString(m.hostPath), kj::heapString(m.sandboxPath), m.readOnly };
  };
  result.networkMode = networkMode;
  result.cpuLimit = cpuLimit;
  result.memoryLimitBytes = memoryLimitBytes;
  result.maxProcesses = maxProcesses;
  result.wallClockTimeout = wallClockTimeout;
  result.uidMappings = cloneMappings(uidMappings);
  result.gidMappings = cloneMappings(gidMappings);
  result.tmpfsMounts = KJ_MAP(p, tmpfsMounts) { return kj::heapString(p); };
  result.mountProc = mountProc;
  result.hostname = kj::heapString(hostname);
  result.outputLimitBytes = outputLimitBytes;
  return result;
}

bool Policy::operator==(const Policy& other) const {
  if (rootMounts.size() != other.rootMounts.size()) return false;
  for (auto i: kj::indices(rootMounts)) {
    auto& a = rootMounts[i];
    auto& b = other.rootMounts[i];
    if (a.hostPath != b.hostPath || a.sandboxPath != b.sandboxPath || a.readOnly != b.readOnly) {
      return false;
    }
  }

  if (tmpfsMounts.size() != other.tmpfsMounts.size()) return false;
  for (auto i: kj::indices(tmpfsMounts)) {
    if (tmpfsMounts[i] != other.tmpfsMounts[i]) return false;
  }

  return networkMode == other.networkMode &&
         maybeEqual(cpuLimit, other.cpuLimit) &&
         maybeEqual(memoryLimitBytes, other.memoryLimitBytes) &&
         maybeEqual(maxProcesses, other.maxProcesses) &&
         maybeEqual(wallClockTimeout, other.wallClockTimeout) &&
         mappingsEqual(uidMappings, other.uidMappings) &&
         mappingsEqual(gidMappings, other.gidMappings) &&
         mountProc == other.mountProc &&
         hostname == other.hostname &&
         outputLimitBytes == other.outputLimitBytes;
}

kj::String KJ_STRINGIFY(const ValidationError& error) {
  return kj::str(error.field, ": ", error.message);
}

kj::StringPtr KJ_STRINGIFY(NetworkMode mode) {
  switch (mode) {
    case NetworkMode::NONE: return "none";
    case NetworkMode::LOOPBACK: return "loopback";
    case NetworkMode::FULL: return "full";
  }
  KJ_UNREACHABLE;
}

kj::OneOf<Policy, ValidationError> validate(Policy&& policy) {
  kj::OneOf<Policy, ValidationError> result;
  KJ_IF_MAYBE(error, checkPolicy(policy)) {
    result.init<ValidationError>(kj::mv(*error));
  } else {
    result.init<Policy>(kj::mv(policy));
  }
  return result;
}

kj::OneOf<RunRequest, ValidationError> validate(RunRequest&& request) {
  kj::OneOf<RunRequest, ValidationError> result;

  auto fail = [&](ValidationError&& error) {
    result.init<ValidationError>(kj::mv(error));
    return kj::mv(result);
  };

  if (request.command.executable.size() == 0) {
    return fail(invalid("command", "executable must not be empty"));
  }
  if (!request.workingDirectory.startsWith("/")) {
    return fail(invalid("workingDirectory", "working directory must be absolute: ",
                        request.workingDirectory));
  }

  std::set<kj::StringPtr> names;
  for (auto& var: request.environment) {
    if (var.name.size() == 0 || var.name.findFirst('=') != nullptr) {
      return fail(invalid("environment", "invalid environment variable name: ", var.name));
    }
    if (!names.insert(var.name).second) {
      return fail(invalid("environment", "environment variable given twice: ", var.name));
    }
  }

  KJ_IF_MAYBE(error, checkPolicy(request.policy)) {
    return fail(kj::mv(*error));
  }

  result.init<RunRequest>(kj::mv(request));
  return result;
}

}  // namespace sandbroker
