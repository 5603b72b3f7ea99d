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
#include "util.h"
#include <kj/debug.h>
#include <capnp/message.h>
#include <capnp/serialize-text.h>
#include <capnp/dynamic.h>
#include <sandbroker/policy.capnp.h>

namespace sandbroker {

BrokerConfig parseBrokerConfig(kj::StringPtr text) {
  BrokerConfig config;

  auto lines = splitLines(text);
  for (auto& line: lines) {
    auto equalsPos = KJ_ASSERT_NONNULL(line.findFirst('='), "Invalid config line", line);
    auto key = trim(line.slice(0, equalsPos));
    auto value = trim(line.slice(equalsPos + 1));

    if (key == "SCRATCH_DIR") {
      KJ_REQUIRE(value.startsWith("/"), "invalid config value SCRATCH_DIR", value);
      // Strip trailing slashes so that paths can be built by simple concatenation.
      size_t desiredLength = value.size();
      while (desiredLength > 1 && value[desiredLength - 1] == '/') {
        desiredLength -= 1;
      }
      config.scratchDir = kj::str(value.slice(0, desiredLength));
    } else if (key == "CGROUP_ROOT") {
      KJ_REQUIRE(value.startsWith("/"), "invalid config value CGROUP_ROOT", value);
      config.cgroupRoot = kj::mv(value);
    } else if (key == "GRACE_PERIOD_MS") {
      KJ_IF_MAYBE(ms, parseUInt64(value, 10)) {
        config.gracePeriod = static_cast<int64_t>(*ms) * kj::MILLISECONDS;
      } else {
        KJ_FAIL_REQUIRE("invalid config value GRACE_PERIOD_MS", value);
      }
    } else if (key == "SYSCALL_FILTER") {
      if (value == "true" || value == "yes") {
        config.syscallFilter = true;
      } else if (value == "false" || value == "no") {
        KJ_LOG(WARNING, "SYSCALL_FILTER is disabled; sandboxed programs have the full "
                        "syscall surface of the kernel.");
        config.syscallFilter = false;
      } else {
        KJ_FAIL_REQUIRE("invalid config value SYSCALL_FILTER", value);
      }
    } else {
      KJ_LOG(WARNING, "Ignoring unrecognized config option", key);
    }
  }

  return config;
}

BrokerConfig readBrokerConfig(const char* path) {
  return parseBrokerConfig(readAll(path));
}

// =======================================================================================

namespace {

kj::Array<IdMapping> toMappings(capnp::List<config::PolicyConfig::IdMapping>::Reader list) {
  return KJ_MAP(m, list) {
    return IdMapping { m.getHostId(), m.getSandboxId(), m.getCount() };
  };
}

Policy toPolicy(config::PolicyConfig::Reader reader) {
  Policy policy;

  if (reader.hasRootMounts()) {
    policy.rootMounts = KJ_MAP(m, reader.getRootMounts()) {
      return MountPoint {
        kj::heapString(m.getHostPath()), kj::heapString(m.getSandboxPath()), m.getReadOnly()
      };
    };
  } else {
    policy.rootMounts = kj::heapArray<MountPoint>(1);
    policy.rootMounts[0] = MountPoint { kj::str("/"), kj::str("/"), true };
  }

  switch (reader.getNetworkMode()) {
    case config::PolicyConfig::NetworkMode::NONE:
      policy.networkMode = NetworkMode::NONE;
      break;
    case config::PolicyConfig::NetworkMode::LOOPBACK:
      policy.networkMode = NetworkMode::LOOPBACK;
      break;
    case config::PolicyConfig::NetworkMode::FULL:
      policy.networkMode = NetworkMode::FULL;
      break;
    default:
      KJ_FAIL_REQUIRE("unknown network mode", static_cast<uint>(reader.getNetworkMode()));
  }

  auto cpu = reader.getCpu();
  if (cpu.isCores()) policy.cpuLimit = cpu.getCores();
  auto memory = reader.getMemory();
  if (memory.isBytes()) policy.memoryLimitBytes = memory.getBytes();
  auto processes = reader.getProcesses();
  if (processes.isMax()) policy.maxProcesses = processes.getMax();
  auto timeout = reader.getTimeout();
  if (timeout.isMilliseconds()) {
    KJ_REQUIRE(timeout.getMilliseconds() < (uint64_t(1) << 43),
               "timeout is too large", timeout.getMilliseconds());
    policy.wallClockTimeout =
        static_cast<int64_t>(timeout.getMilliseconds()) * kj::MILLISECONDS;
  }

  policy.uidMappings = toMappings(reader.getUidMappings());
  policy.gidMappings = toMappings(reader.getGidMappings());
  policy.tmpfsMounts = KJ_MAP(p, reader.getTmpfsMounts()) { return kj::heapString(p); };
  policy.mountProc = reader.getMountProc();
  policy.hostname = kj::heapString(reader.getHostname());
  policy.outputLimitBytes = reader.getOutputLimitBytes();

  return policy;
}

}  // namespace

RunRequest parseRunRequest(kj::StringPtr text) {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<config::RunRequestConfig>();

  capnp::TextCodec codec;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    codec.decode(text, capnp::toDynamic(root));
  })) {
    KJ_FAIL_REQUIRE("invalid run request", exception->getDescription());
  }

  auto reader = root.asReader();
  auto command = reader.getCommand();

  RunRequest request;
  request.command.executable = kj::heapString(command.getExecutable());
  request.command.args = KJ_MAP(a, command.getArgs()) { return kj::heapString(a); };
  request.workingDirectory = kj::heapString(reader.getWorkingDirectory());
  request.environment = KJ_MAP(e, reader.getEnvironment()) {
    return EnvironmentVariable { kj::heapString(e.getName()), kj::heapString(e.getValue()) };
  };
  request.policy = toPolicy(reader.getPolicy());
  return request;
}

RunRequest readRunRequest(const char* path) {
  return parseRunRequest(readAll(path));
}

}  // namespace sandbroker
