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

#ifndef SANDBROKER_BROKER_H_
#define SANDBROKER_BROKER_H_

#include <kj/function.h>
#include <kj/mutex.h>
#include <kj/exception.h>
#include <map>
#include "launcher.h"

namespace sandbroker {

struct BrokerError {
  enum class Stage {
    VALIDATE,
    PREPARE,
    ATTACH,
    LAUNCH,
    SUBMIT
    // The broker is shutting down and accepts no new runs.
  };

  Stage stage;
  kj::String description;
  kj::Maybe<kj::Exception> cause;
  // Null for VALIDATE and SUBMIT, which don't involve an exception.

  kj::Array<kj::String> teardownWarnings;
};

kj::StringPtr KJ_STRINGIFY(BrokerError::Stage stage);
kj::String KJ_STRINGIFY(const BrokerError& error);

class Broker {
  // Runs requests, each in its own freshly-built sandbox. execute() blocks for the duration of
  // the run and may be called from any number of threads at once; runs share nothing except
  // the registry that lets cancel() find them.

public:
  explicit Broker(BrokerConfig config);
  KJ_DISALLOW_COPY(Broker);

  typedef uint64_t HandleId;

  kj::OneOf<RunResult, BrokerError> execute(
      RunRequest&& request, kj::Maybe<kj::Function<void(HandleId)>> onRegistered = nullptr);
  // Validate, prepare, attach limits and run. `onRegistered` is called on the executing thread
  // as soon as the run can be cancelled, with the id to pass to cancel().

  void cancel(HandleId id);
  // Ask a run to stop, exactly as if its timeout had expired; the run then finishes as
  // Cancelled. Ids that are unknown or already finished are ignored.

  void shutdown();
  // Cancel every live run and refuse new ones with a SUBMIT error.

  size_t liveRunCount();

  const BrokerConfig& getConfig() { return config; }

private:
  BrokerConfig config;

  struct Registry {
    std::map<HandleId, const CancelSignal*> live;
    HandleId nextId = 1;
    bool shuttingDown = false;
  };
  kj::MutexGuarded<Registry> registry;
};

}  // namespace sandbroker

#endif // SANDBROKER_BROKER_H_
