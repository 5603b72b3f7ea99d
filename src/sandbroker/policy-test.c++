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
#include <kj/test.h>
#include <math.h>

namespace sandbroker {
namespace {

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

Policy basicPolicy() {
  Policy policy;
  policy.rootMounts = kj::heapArray<MountPoint>(2);
  policy.rootMounts[0] = MountPoint { kj::str("/"), kj::str("/"), true };
  policy.rootMounts[1] = MountPoint { kj::str("/var/tmp/work"), kj::str("/work"), false };
  return policy;
}

kj::String expectInvalid(Policy&& policy, kj::StringPtr field) {
  auto result = validate(kj::mv(policy));
  KJ_ASSERT(result.is<ValidationError>(), "expected a validation error", field);
  auto& error = result.get<ValidationError>();
  KJ_EXPECT(error.field == field, error);
  return kj::str(error);
}

KJ_TEST("validate accepts a valid policy unchanged") {
  auto policy = basicPolicy();
  policy.cpuLimit = 0.5;
  policy.memoryLimitBytes = uint64_t(64) << 20;
  policy.maxProcesses = 16u;
  policy.wallClockTimeout = 5 * kj::SECONDS;
  policy.tmpfsMounts = kj::heapArray<kj::String>(1);
  policy.tmpfsMounts[0] = kj::str("/tmp");

  auto expected = policy.clone();
  auto result = validate(kj::mv(policy));
  KJ_ASSERT(result.is<Policy>());
  KJ_EXPECT(result.get<Policy>() == expected);
}

KJ_TEST("validate is idempotent") {
  auto first = validate(basicPolicy());
  KJ_ASSERT(first.is<Policy>());
  auto copy = first.get<Policy>().clone();
  auto second = validate(kj::mv(first.get<Policy>()));
  KJ_ASSERT(second.is<Policy>());
  KJ_EXPECT(second.get<Policy>() == copy);
}

KJ_TEST("validate: root mounts") {
  {
    Policy policy;
    expectInvalid(kj::mv(policy), "rootMounts");
  }
  {
    auto policy = basicPolicy();
    policy.rootMounts[0].sandboxPath = kj::str("/work2");
    auto message = expectInvalid(kj::mv(policy), "rootMounts");
    KJ_EXPECT(hasSubstring(message, "first mount"), message);
  }
  {
    auto policy = basicPolicy();
    policy.rootMounts[1].hostPath = kj::str("relative/path");
    expectInvalid(kj::mv(policy), "rootMounts");
  }
  {
    auto policy = basicPolicy();
    policy.rootMounts[1].sandboxPath = kj::str("/work/../etc");
    expectInvalid(kj::mv(policy), "rootMounts");
  }
  {
    auto policy = basicPolicy();
    policy.rootMounts[1].sandboxPath = kj::str("/");
    auto message = expectInvalid(kj::mv(policy), "rootMounts");
    KJ_EXPECT(hasSubstring(message, "more than once"), message);
  }
}

KJ_TEST("validate: tmpfs mounts") {
  {
    auto policy = basicPolicy();
    policy.tmpfsMounts = kj::heapArray<kj::String>(1);
    policy.tmpfsMounts[0] = kj::str("/");
    expectInvalid(kj::mv(policy), "tmpfsMounts");
  }
  {
    auto policy = basicPolicy();
    policy.tmpfsMounts = kj::heapArray<kj::String>(1);
    policy.tmpfsMounts[0] = kj::str("/work");
    auto message = expectInvalid(kj::mv(policy), "tmpfsMounts");
    KJ_EXPECT(hasSubstring(message, "more than once"), message);
  }
}

KJ_TEST("validate: limits") {
  {
    auto policy = basicPolicy();
    policy.cpuLimit = 0.0;
    expectInvalid(kj::mv(policy), "cpuLimit");
  }
  {
    auto policy = basicPolicy();
    policy.cpuLimit = NAN;
    expectInvalid(kj::mv(policy), "cpuLimit");
  }
  {
    auto policy = basicPolicy();
    policy.memoryLimitBytes = uint64_t(0);
    expectInvalid(kj::mv(policy), "memoryLimitBytes");
  }
  {
    auto policy = basicPolicy();
    policy.maxProcesses = 0u;
    expectInvalid(kj::mv(policy), "maxProcesses");
  }
  {
    auto policy = basicPolicy();
    policy.wallClockTimeout = 0 * kj::SECONDS;
    expectInvalid(kj::mv(policy), "wallClockTimeout");
  }
}

KJ_TEST("validate: id mappings") {
  {
    auto policy = basicPolicy();
    policy.uidMappings = kj::heapArray<IdMapping>({ IdMapping { 1000, 0, 1 } });
    expectInvalid(kj::mv(policy), "uidMappings");  // No gid mappings.
  }
  {
    auto policy = basicPolicy();
    policy.uidMappings = kj::heapArray<IdMapping>({ IdMapping { 1000, 0, 0 } });
    policy.gidMappings = kj::heapArray<IdMapping>({ IdMapping { 1000, 0, 1 } });
    expectInvalid(kj::mv(policy), "uidMappings");
  }
  {
    auto policy = basicPolicy();
    policy.uidMappings = kj::heapArray<IdMapping>({
      IdMapping { 100000, 0, 100 }, IdMapping { 200000, 50, 10 }
    });
    policy.gidMappings = kj::heapArray<IdMapping>({ IdMapping { 1000, 0, 1 } });
    auto message = expectInvalid(kj::mv(policy), "uidMappings");
    KJ_EXPECT(hasSubstring(message, "overlap inside the sandbox"), message);
  }
  {
    auto policy = basicPolicy();
    policy.uidMappings = kj::heapArray<IdMapping>({ IdMapping { 1000, 1000, 1 } });
    policy.gidMappings = kj::heapArray<IdMapping>({ IdMapping { 0xfffffff0u, 0, 0x20 } });
    expectInvalid(kj::mv(policy), "gidMappings");
  }
  {
    auto policy = basicPolicy();
    policy.networkMode = NetworkMode::FULL;
    policy.uidMappings = kj::heapArray<IdMapping>({ IdMapping { 1000, 0, 1 } });
    policy.gidMappings = kj::heapArray<IdMapping>({ IdMapping { 1000, 0, 1 } });
    expectInvalid(kj::mv(policy), "networkMode");
  }
  {
    // The same mapping is fine with a private network.
    auto policy = basicPolicy();
    policy.uidMappings = kj::heapArray<IdMapping>({ IdMapping { 1000, 0, 1 } });
    policy.gidMappings = kj::heapArray<IdMapping>({ IdMapping { 1000, 0, 1 } });
    KJ_EXPECT(validate(kj::mv(policy)).is<Policy>());
  }
}

KJ_TEST("validate: hostname") {
  auto policy = basicPolicy();
  policy.hostname = kj::str("");
  expectInvalid(kj::mv(policy), "hostname");
}

KJ_TEST("validate: run request") {
  {
    RunRequest request;
    request.command.executable = kj::str("/bin/true");
    request.policy = basicPolicy();
    KJ_EXPECT(validate(kj::mv(request)).is<RunRequest>());
  }
  {
    RunRequest request;
    request.policy = basicPolicy();
    auto result = validate(kj::mv(request));
    KJ_ASSERT(result.is<ValidationError>());
    KJ_EXPECT(result.get<ValidationError>().field == "command");
  }
  {
    RunRequest request;
    request.command.executable = kj::str("true");
    request.workingDirectory = kj::str("work");
    request.policy = basicPolicy();
    auto result = validate(kj::mv(request));
    KJ_ASSERT(result.is<ValidationError>());
    KJ_EXPECT(result.get<ValidationError>().field == "workingDirectory");
  }
  {
    RunRequest request;
    request.command.executable = kj::str("true");
    request.environment = kj::heapArray<EnvironmentVariable>(2);
    request.environment[0] = EnvironmentVariable { kj::str("PATH"), kj::str("/bin") };
    request.environment[1] = EnvironmentVariable { kj::str("PATH"), kj::str("/usr/bin") };
    request.policy = basicPolicy();
    auto result = validate(kj::mv(request));
    KJ_ASSERT(result.is<ValidationError>());
    KJ_EXPECT(result.get<ValidationError>().field == "environment");
  }
  {
    RunRequest request;
    request.command.executable = kj::str("true");
    request.environment = kj::heapArray<EnvironmentVariable>(1);
    request.environment[0] = EnvironmentVariable { kj::str("A=B"), kj::str("c") };
    request.policy = basicPolicy();
    KJ_EXPECT(validate(kj::mv(request)).is<ValidationError>());
  }
  {
    // Policy errors surface through the request.
    RunRequest request;
    request.command.executable = kj::str("true");
    request.policy = basicPolicy();
    request.policy.maxProcesses = 0u;
    auto result = validate(kj::mv(request));
    KJ_ASSERT(result.is<ValidationError>());
    KJ_EXPECT(result.get<ValidationError>().field == "maxProcesses");
  }
}

KJ_TEST("isNormalizedAbsolutePath") {
  KJ_EXPECT(isNormalizedAbsolutePath("/"));
  KJ_EXPECT(isNormalizedAbsolutePath("/usr/lib"));
  KJ_EXPECT(isNormalizedAbsolutePath("/a/.b/c..d"));
  KJ_EXPECT(!isNormalizedAbsolutePath(""));
  KJ_EXPECT(!isNormalizedAbsolutePath("usr"));
  KJ_EXPECT(!isNormalizedAbsolutePath("/usr/"));
  KJ_EXPECT(!isNormalizedAbsolutePath("//usr"));
  KJ_EXPECT(!isNormalizedAbsolutePath("/usr/./lib"));
  KJ_EXPECT(!isNormalizedAbsolutePath("/usr/.."));
}

}  // namespace
}  // namespace sandbroker
