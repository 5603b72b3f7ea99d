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

// A small program for the integration tests to run inside the sandbox. Each subcommand pokes at
// one of the walls and reports what it found through its output and exit code.

#include <kj/main.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/syscall.h>
#include <sys/mman.h>
#include <sys/wait.h>
#include <signal.h>
#include <string.h>
#include <unistd.h>
#include <errno.h>

#include "util.h"

namespace sandbroker {

class ProbeMain {
public:
  ProbeMain(kj::ProcessContext& context): context(context) {}

  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Sandbroker version " SANDBROKER_VERSION,
                           "Test helper that runs inside a sandbox.")
        .addSubCommand("connect", KJ_BIND_METHOD(*this, getConnectMain),
                       "Open a TCP connection; exit 0 on success, 2 on failure.")
        .addSubCommand("loopback", KJ_BIND_METHOD(*this, getLoopbackMain),
                       "Connect to a listener of our own on 127.0.0.1; exit 0 on success, 2 on "
                       "failure.")
        .addSubCommand("alloc", KJ_BIND_METHOD(*this, getAllocMain),
                       "Allocate and touch memory.")
        .addSubCommand("spin", KJ_BIND_METHOD(*this, getSpinMain),
                       "Wait forever, ignoring SIGTERM.")
        .addSubCommand("fork", KJ_BIND_METHOD(*this, getForkMain),
                       "Start child processes; exit 0 if all could be created, 3 otherwise.")
        .addSubCommand("syscall", KJ_BIND_METHOD(*this, getSyscallMain),
                       "Attempt a system call the sandbox forbids.")
        .addSubCommand("ids", KJ_BIND_METHOD(*this, getIdsMain),
                       "Print the real uid and gid.")
        .addSubCommand("hostname", KJ_BIND_METHOD(*this, getHostnameMain),
                       "Print the hostname.")
        .build();
  }

private:
  kj::ProcessContext& context;
  kj::String address;

  kj::MainBuilder subcommand(kj::StringPtr description) {
    return kj::MainBuilder(context, "Sandbroker version " SANDBROKER_VERSION, description);
  }

  kj::MainFunc getConnectMain() {
    return subcommand("Connect to <address>:<port> over TCP.")
        .expectArg("<address>", KJ_BIND_METHOD(*this, setAddress))
        .expectArg("<port>", KJ_BIND_METHOD(*this, doConnect))
        .build();
  }

  kj::MainBuilder::Validity setAddress(kj::StringPtr arg) {
    address = kj::heapString(arg);
    return true;
  }

  kj::MainBuilder::Validity doConnect(kj::StringPtr arg) {
    uint port;
    KJ_IF_MAYBE(p, parseUInt(arg, 10)) {
      port = *p;
    } else {
      return "invalid port";
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, address.cStr(), &addr.sin_addr) != 1) {
      return "invalid IPv4 address";
    }

    int fd;
    KJ_SYSCALL(fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    kj::AutoCloseFd sock(fd);
    if (connect(sock, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      context.warning(kj::str("connect: ", strerror(errno)));
      _exit(2);
    }
    context.exitInfo("connected");
  }

  kj::MainFunc getLoopbackMain() {
    return subcommand("Listen on 127.0.0.1, then connect to the listener.")
        .callAfterParsing(KJ_BIND_METHOD(*this, doLoopback))
        .build();
  }

  kj::MainBuilder::Validity doLoopback() {
    auto fail = [&](kj::StringPtr what) {
      context.warning(kj::str(what, ": ", strerror(errno)));
      _exit(2);
    };

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;

    int fd;
    KJ_SYSCALL(fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    kj::AutoCloseFd listener(fd);
    if (bind(listener, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      fail("bind");
    }
    if (listen(listener, 1) < 0) fail("listen");
    socklen_t addrlen = sizeof(addr);
    KJ_SYSCALL(getsockname(listener, reinterpret_cast<struct sockaddr*>(&addr), &addrlen));

    KJ_SYSCALL(fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0));
    kj::AutoCloseFd client(fd);
    if (connect(client, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      fail("connect");
    }
    int accepted;
    KJ_SYSCALL(accepted = accept4(listener, nullptr, nullptr, SOCK_CLOEXEC));
    kj::AutoCloseFd server(accepted);
    context.exitInfo(kj::str("connected to 127.0.0.1:", ntohs(addr.sin_port)));
  }

  kj::MainFunc getAllocMain() {
    return subcommand("Allocate <mib> mebibytes and write to every page.")
        .expectArg("<mib>", KJ_BIND_METHOD(*this, doAlloc))
        .build();
  }

  kj::MainBuilder::Validity doAlloc(kj::StringPtr arg) {
    uint mib;
    KJ_IF_MAYBE(m, parseUInt(arg, 10)) {
      mib = *m;
    } else {
      return "invalid size";
    }
    size_t size = size_t(mib) << 20;

    void* mem = mmap(nullptr, size, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (mem == MAP_FAILED) {
      KJ_FAIL_SYSCALL("mmap()", errno, size);
    }
    // Touch each page so that it is actually charged.
    memset(mem, 0x5a, size);
    context.exitInfo(kj::str("allocated ", mib, " MiB"));
  }

  kj::MainFunc getSpinMain() {
    return subcommand("Wait forever. <token> only serves to find this process in a listing.")
        .expectArg("<token>", KJ_BIND_METHOD(*this, doSpin))
        .build();
  }

  kj::MainBuilder::Validity doSpin(kj::StringPtr) {
    KJ_SYSCALL(signal(SIGTERM, SIG_IGN) == SIG_ERR ? -1 : 0);

    // Make the cleanup visible: a child that would outlive us if the sandbox leaked it.
    pid_t child;
    KJ_SYSCALL(child = fork());
    if (child == 0) {
      for (;;) pause();
    }

    kj::FdOutputStream(STDOUT_FILENO).write("spinning\n", 9);
    for (;;) pause();
  }

  kj::MainFunc getForkMain() {
    return subcommand("Start <count> sleeping children.")
        .expectArg("<count>", KJ_BIND_METHOD(*this, doFork))
        .build();
  }

  kj::MainBuilder::Validity doFork(kj::StringPtr arg) {
    uint count;
    KJ_IF_MAYBE(c, parseUInt(arg, 10)) {
      count = *c;
    } else {
      return "invalid count";
    }

    kj::Vector<pid_t> children;
    bool failed = false;
    for (uint i = 0; i < count; i++) {
      pid_t child = fork();
      if (child < 0) {
        context.warning(kj::str("fork: ", strerror(errno)));
        failed = true;
        break;
      } else if (child == 0) {
        sleep(30);
        _exit(0);
      }
      children.add(child);
    }

    for (pid_t child: children) {
      KJ_SYSCALL(kill(child, SIGKILL));
      int status;
      KJ_SYSCALL(waitpid(child, &status, 0));
    }

    if (failed) _exit(3);
    context.exitInfo(kj::str("forked ", children.size()));
  }

  kj::MainFunc getSyscallMain() {
    return subcommand("Call reboot(2), which the sandbox's syscall filter answers with a kill.")
        .callAfterParsing(KJ_BIND_METHOD(*this, doSyscall))
        .build();
  }

  kj::MainBuilder::Validity doSyscall() {
    // Invalid magic numbers, so that even an unfiltered, privileged call does nothing.
    if (syscall(SYS_reboot, 0, 0, 0, nullptr) < 0) {
      context.warning(kj::str("reboot: ", strerror(errno)));
    }
    _exit(4);
  }

  kj::MainFunc getIdsMain() {
    return subcommand("Print \"<uid> <gid>\".")
        .callAfterParsing(KJ_BIND_METHOD(*this, doIds))
        .build();
  }

  kj::MainBuilder::Validity doIds() {
    context.exitInfo(kj::str(getuid(), " ", getgid()));
  }

  kj::MainFunc getHostnameMain() {
    return subcommand("Print the hostname.")
        .callAfterParsing(KJ_BIND_METHOD(*this, doHostname))
        .build();
  }

  kj::MainBuilder::Validity doHostname() {
    char name[256];
    KJ_SYSCALL(gethostname(name, sizeof(name)));
    name[sizeof(name) - 1] = '\0';
    context.exitInfo(kj::heapString(name));
  }
};

}  // namespace sandbroker

KJ_MAIN(sandbroker::ProbeMain)
