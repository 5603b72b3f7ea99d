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

#include "broker.h"
#include <kj/debug.h>
#include <unistd.h>

namespace sandbroker {

kj::StringPtr KJ_STRINGIFY(BrokerError::Stage stage) {
  switch (stage) {
    case BrokerError::Stage::VALIDATE: return "validate";
    case BrokerError::Stage::PREPARE: return "prepare";
    case BrokerError::Stage::ATTACH: return "attach";
    case BrokerError::Stage::LAUNCH: return "launch";
    case BrokerError::Stage::SUBMIT: return "submit";
  }
  KJ_UNREACHABLE;
}

kj::String KJ_STRINGIFY(const BrokerError& error) {
  return kj::str(error.stage, " failed: ", error.description);
}

namespace {

kj::OneOf<RunResult, BrokerError> failure(
    BrokerError::Stage stage, kj::String description, kj::Maybe<kj::Exception> cause,
    kj::ArrayPtr<const kj::String> teardownWarnings) {
  KJ_LOG(WARNING, "run failed", stage, description);
  kj::OneOf<RunResult, BrokerError> result;
  result.init<BrokerError>(BrokerError {
    stage, kj::mv(description), kj::mv(cause),
    KJ_MAP(w, teardownWarnings) { return kj::heapString(w); }
  });
  return result;
}

kj::OneOf<RunResult, BrokerError> failure(
    BrokerError::Stage stage, kj::Exception&& exception,
    kj::ArrayPtr<const kj::String> teardownWarnings) {
  auto description = kj::heapString(exception.getDescription());
  return failure(stage, kj::mv(description), kj::mv(exception), teardownWarnings);
}

kj::OneOf<RunResult, BrokerError> cancelledBeforeLaunch(
    kj::ArrayPtr<const kj::String> teardownWarnings) {
  kj::OneOf<RunResult, BrokerError> result;
  auto& run = result.init<RunResult>();
  run.exitStatus.init<Cancelled>();
  run.teardownWarnings = KJ_MAP(w, teardownWarnings) { return kj::heapString(w); };
  return result;
}

}  // namespace

Broker::Broker(BrokerConfig config): config(kj::mv(config)) {}

kj::OneOf<RunResult, BrokerError> Broker::execute(
    RunRequest&& requestParam, kj::Maybe<kj::Function<void(HandleId)>> onRegistered) {
  typedef BrokerError::Stage Stage;

  auto validated = validate(kj::mv(requestParam));
  if (validated.is<ValidationError>()) {
    return failure(Stage::VALIDATE, kj::str(validated.get<ValidationError>()), nullptr, nullptr);
  }
  auto& request = validated.get<RunRequest>();

  CancelSignal cancelSignal;
  HandleId id;
  {
    auto lock = registry.lockExclusive();
    if (lock->shuttingDown) {
      return failure(Stage::SUBMIT, kj::str("broker is shutting down"), nullptr, nullptr);
    }
    id = lock->nextId++;
    lock->live.insert(std::make_pair(id, &cancelSignal));
  }
  KJ_DEFER(registry.lockExclusive()->live.erase(id));

  KJ_IF_MAYBE(callback, onRegistered) {
    (*callback)(id);
  }

  if (cancelSignal.isRaised()) {
    return cancelledBeforeLaunch(nullptr);
  }

  kj::Own<IsolatedEnvironment> env;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    env = prepare(request.policy, config);
  })) {
    return failure(Stage::PREPARE, kj::mv(*exception), nullptr);
  }

  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    attach(*env, request.policy, config, kj::str("run-", getpid(), "-", id));
  })) {
    return failure(Stage::ATTACH, kj::mv(*exception), env->teardown());
  }

  if (cancelSignal.isRaised()) {
    return cancelledBeforeLaunch(env->teardown());
  }

  LaunchOptions options;
  options.gracePeriod = config.gracePeriod;
  options.syscallFilter = config.syscallFilter;
  options.outputLimitBytes = request.policy.outputLimitBytes;

  kj::OneOf<RunResult, BrokerError> result;
  KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
    result.init<RunResult>(run(request.command, request.environment, request.workingDirectory,
                               *env, request.policy.wallClockTimeout, cancelSignal, options));
  })) {
    return failure(Stage::LAUNCH, kj::mv(*exception), env->teardown());
  }

  auto& finished = result.get<RunResult>();
  KJ_LOG(INFO, "run finished", id, describe(finished.exitStatus),
         finished.wallTimeUsed / kj::MILLISECONDS);
  return result;
}

void Broker::cancel(HandleId id) {
  // Raised under the lock, so the signal can't be destroyed underneath us.
  auto lock = registry.lockExclusive();
  auto iter = lock->live.find(id);
  if (iter != lock->live.end()) {
    iter->second->raise();
  }
}

void Broker::shutdown() {
  auto lock = registry.lockExclusive();
  lock->shuttingDown = true;
  for (auto& entry: lock->live) {
    entry.second->raise();
  }
}

size_t Broker::liveRunCount() {
  return registry.lockShared()->live.size();
}

}  // namespace sandbroker
