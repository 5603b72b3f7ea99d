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

#include "config.h"
#include <kj/test.h>

namespace sandbroker {
namespace {

KJ_TEST("parseBrokerConfig: defaults") {
  auto config = parseBrokerConfig("");
  KJ_EXPECT(config.scratchDir == "/tmp");
  KJ_EXPECT(config.cgroupRoot == "/sys/fs/cgroup/sandbroker");
  KJ_EXPECT(config.gracePeriod == 2 * kj::SECONDS);
  KJ_EXPECT(config.syscallFilter);
}

KJ_TEST("parseBrokerConfig: all keys") {
  auto config = parseBrokerConfig(
      "# Broker settings\n"
      "SCRATCH_DIR = /var/lib/sandbroker//\n"
      "CGROUP_ROOT=/sys/fs/cgroup/user.slice/broker\n"
      "\n"
      "GRACE_PERIOD_MS=250\n"
      "SYSCALL_FILTER=no\n"
      "SOMETHING_NEW=1\n");
  KJ_EXPECT(config.scratchDir == "/var/lib/sandbroker");
  KJ_EXPECT(config.cgroupRoot == "/sys/fs/cgroup/user.slice/broker");
  KJ_EXPECT(config.gracePeriod == 250 * kj::MILLISECONDS);
  KJ_EXPECT(!config.syscallFilter);
}

KJ_TEST("parseBrokerConfig: invalid values") {
  KJ_EXPECT_THROW_MESSAGE("invalid config value GRACE_PERIOD_MS",
                          parseBrokerConfig("GRACE_PERIOD_MS=soon"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value GRACE_PERIOD_MS",
                          parseBrokerConfig("GRACE_PERIOD_MS=-5"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value SCRATCH_DIR",
                          parseBrokerConfig("SCRATCH_DIR=tmp"));
  KJ_EXPECT_THROW_MESSAGE("invalid config value SYSCALL_FILTER",
                          parseBrokerConfig("SYSCALL_FILTER=maybe"));
  KJ_EXPECT_THROW_MESSAGE("Invalid config line", parseBrokerConfig("SCRATCH_DIR"));
}

KJ_TEST("parseRunRequest: minimal request gets the default mounts") {
  auto request = parseRunRequest("(command = (executable = \"true\"))");
  KJ_EXPECT(request.command.executable == "true");
  KJ_EXPECT(request.command.args.size() == 0);
  KJ_EXPECT(request.workingDirectory == "/");

  auto& policy = request.policy;
  KJ_ASSERT(policy.rootMounts.size() == 1);
  KJ_EXPECT(policy.rootMounts[0].hostPath == "/");
  KJ_EXPECT(policy.rootMounts[0].sandboxPath == "/");
  KJ_EXPECT(policy.rootMounts[0].readOnly);
  KJ_EXPECT(policy.networkMode == NetworkMode::NONE);
  KJ_EXPECT(policy.cpuLimit == nullptr);
  KJ_EXPECT(policy.memoryLimitBytes == nullptr);
  KJ_EXPECT(policy.maxProcesses == nullptr);
  KJ_EXPECT(policy.wallClockTimeout == nullptr);
  KJ_EXPECT(policy.hostname == "sandbox");
  KJ_EXPECT(policy.outputLimitBytes == DEFAULT_OUTPUT_LIMIT);
  KJ_EXPECT(!policy.needsCgroup());

  KJ_EXPECT(validate(kj::mv(request)).is<RunRequest>());
}

KJ_TEST("parseRunRequest: full request") {
  auto request = parseRunRequest(R"((
    command = (executable = "/bin/sh", args = ["-c", "echo hi"]),
    workingDirectory = "/work",
    environment = [(name = "PATH", value = "/usr/bin:/bin"), (name = "LANG", value = "C")],
    policy = (
      rootMounts = [
        (hostPath = "/", sandboxPath = "/"),
        (hostPath = "/var/tmp/job", sandboxPath = "/work", readOnly = false)
      ],
      networkMode = loopback,
      cpu = (cores = 1.5),
      memory = (bytes = 67108864),
      processes = (max = 32),
      timeout = (milliseconds = 1500),
      uidMappings = [(hostId = 1000, sandboxId = 0)],
      gidMappings = [(hostId = 1000, sandboxId = 0)],
      tmpfsMounts = ["/tmp"],
      mountProc = true,
      hostname = "builder",
      outputLimitBytes = 4096
    )
  ))");

  KJ_EXPECT(request.command.executable == "/bin/sh");
  KJ_ASSERT(request.command.args.size() == 2);
  KJ_EXPECT(request.command.args[1] == "echo hi");
  KJ_EXPECT(request.workingDirectory == "/work");
  KJ_ASSERT(request.environment.size() == 2);
  KJ_EXPECT(request.environment[0].name == "PATH");
  KJ_EXPECT(request.environment[1].value == "C");

  auto& policy = request.policy;
  KJ_ASSERT(policy.rootMounts.size() == 2);
  KJ_EXPECT(policy.rootMounts[1].hostPath == "/var/tmp/job");
  KJ_EXPECT(!policy.rootMounts[1].readOnly);
  KJ_EXPECT(policy.networkMode == NetworkMode::LOOPBACK);
  KJ_EXPECT(KJ_ASSERT_NONNULL(policy.cpuLimit) == 1.5);
  KJ_EXPECT(KJ_ASSERT_NONNULL(policy.memoryLimitBytes) == 67108864);
  KJ_EXPECT(KJ_ASSERT_NONNULL(policy.maxProcesses) == 32);
  KJ_EXPECT(KJ_ASSERT_NONNULL(policy.wallClockTimeout) == 1500 * kj::MILLISECONDS);
  KJ_ASSERT(policy.uidMappings.size() == 1);
  KJ_EXPECT(policy.uidMappings[0].hostId == 1000);
  KJ_EXPECT(policy.uidMappings[0].sandboxId == 0);
  KJ_EXPECT(policy.uidMappings[0].count == 1);
  KJ_ASSERT(policy.tmpfsMounts.size() == 1);
  KJ_EXPECT(policy.tmpfsMounts[0] == "/tmp");
  KJ_EXPECT(policy.mountProc);
  KJ_EXPECT(policy.hostname == "builder");
  KJ_EXPECT(policy.outputLimitBytes == 4096);
  KJ_EXPECT(policy.needsCgroup());

  KJ_EXPECT(validate(kj::mv(request)).is<RunRequest>());
}

KJ_TEST("parseRunRequest: rejects unknown fields and bad syntax") {
  KJ_EXPECT_THROW_MESSAGE("invalid run request",
      parseRunRequest("(command = (executable = \"true\"), priority = 5)"));
  KJ_EXPECT_THROW_MESSAGE("invalid run request",
      parseRunRequest("(command = (executable = \"true\""));
  KJ_EXPECT_THROW_MESSAGE("invalid run request",
      parseRunRequest("(policy = (networkMode = bogus))"));
}

}  // namespace
}  // namespace sandbroker
