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

#include "syscall-filter.h"
#include <kj/debug.h>
#include <errno.h>
#include <sched.h>
#include <sys/prctl.h>
#include <sys/socket.h>
#include <sys/ptrace.h>
#include <seccomp.h>

namespace sandbroker {

void installSyscallFilter() {
  // A rudimentary seccomp blacklist.
  // TODO(security): Change this to a whitelist.

  scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
  if (ctx == nullptr)
    KJ_FAIL_SYSCALL("seccomp_init", 0);  // No real error code
  KJ_DEFER(seccomp_release(ctx));

#define CHECK_SECCOMP(call)                   \
  do {                                        \
    if (auto result = (call)) {               \
      KJ_FAIL_SYSCALL(#call, -result);        \
    }                                         \
  } while (0)

  // Native code only for now, so there are no seccomp_arch_add calls.

  // Redundant, but this is standard and harmless.
  CHECK_SECCOMP(seccomp_attr_set(ctx, SCMP_FLTATR_CTL_NNP, 1));

  // It's easy to inadvertently issue an x32 syscall (e.g. syscall(-1)).  Such syscalls
  // should fail, but there's no need to kill the issuer.
  CHECK_SECCOMP(seccomp_attr_set(ctx, SCMP_FLTATR_ACT_BADARCH, SCMP_ACT_ERRNO(ENOSYS)));

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"  // SCMP_* macros produce these

  // Calls that act on the machine rather than on the caller. A program that tries these is not
  // misbehaving by accident, so it is killed outright and the run reported as a violation.
  const int KILL_LIST[] = {
    SCMP_SYS(kexec_load), SCMP_SYS(kexec_file_load), SCMP_SYS(init_module),
    SCMP_SYS(finit_module), SCMP_SYS(delete_module), SCMP_SYS(reboot),
    SCMP_SYS(swapon), SCMP_SYS(swapoff), SCMP_SYS(setns),
  };
  for (int call: KILL_LIST) {
    // Some of these don't exist on every architecture; libseccomp reports them as negative
    // pseudo-syscall numbers, which it refuses to filter.
    if (call < 0) continue;
    CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_KILL_PROCESS, call, 0));
  }

  // ptrace is scary
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(ptrace), 0));

  // Restrict the set of allowable network protocol families
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EAFNOSUPPORT), SCMP_SYS(socket), 1,
     SCMP_A0(SCMP_CMP_GE, AF_NETLINK + 1)));
  const int BLOCKED_FAMILIES[] = {
    AF_AX25, AF_IPX, AF_APPLETALK, AF_NETROM, AF_BRIDGE, AF_ATMPVC, AF_X25, AF_ROSE,
    AF_DECnet, AF_NETBEUI, AF_SECURITY, AF_KEY,
  };
  for (int family: BLOCKED_FAMILIES) {
    CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EAFNOSUPPORT), SCMP_SYS(socket), 1,
       SCMP_A0(SCMP_CMP_EQ, family)));
  }

  // Disallow DCCP sockets due to Linux CVE-2017-6074. The type argument may have
  // SOCK_NONBLOCK and SOCK_CLOEXEC or'd in; the kernel's SOCK_TYPE_MASK is 0x0f.
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPROTONOSUPPORT), SCMP_SYS(socket), 1,
     SCMP_A1(SCMP_CMP_MASKED_EQ, 0x0f, SOCK_DCCP)));

  const int UNSUPPORTED[] = {
    SCMP_SYS(add_key), SCMP_SYS(request_key), SCMP_SYS(keyctl), SCMP_SYS(syslog),
    SCMP_SYS(uselib), SCMP_SYS(acct),

    // 16-bit code is unnecessary in the sandbox, and modify_ldt is a historic source
    // of interesting information leaks.
    SCMP_SYS(modify_ldt),

    // Nested sandboxing could be useful but the attack surface is large.
    SCMP_SYS(unshare), SCMP_SYS(mount), SCMP_SYS(umount2), SCMP_SYS(pivot_root),
    SCMP_SYS(quotactl),

    // AIO is scary.
    SCMP_SYS(io_setup), SCMP_SYS(io_destroy), SCMP_SYS(io_getevents), SCMP_SYS(io_submit),
    SCMP_SYS(io_cancel),

    // Scary vm syscalls
    SCMP_SYS(remap_file_pages), SCMP_SYS(mbind), SCMP_SYS(get_mempolicy),
    SCMP_SYS(set_mempolicy), SCMP_SYS(migrate_pages), SCMP_SYS(move_pages),
    SCMP_SYS(vmsplice),

    // Utterly terrifying profiling operations
    SCMP_SYS(perf_event_open),

    // Seccomp filters and BPF programs run in-kernel.
    SCMP_SYS(seccomp), SCMP_SYS(bpf),

    SCMP_SYS(userfaultfd),
  };
  for (int call: UNSUPPORTED) {
    if (call < 0) continue;
    CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(ENOSYS), call, 0));
  }

  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EPERM), SCMP_SYS(clone), 1,
      SCMP_A0(SCMP_CMP_MASKED_EQ, CLONE_NEWUSER, CLONE_NEWUSER)));
  CHECK_SECCOMP(seccomp_rule_add(ctx, SCMP_ACT_ERRNO(EINVAL), SCMP_SYS(prctl), 1,
      SCMP_A0(SCMP_CMP_EQ, PR_SET_SECCOMP)));

  CHECK_SECCOMP(seccomp_load(ctx));

#pragma GCC diagnostic pop
#undef CHECK_SECCOMP
}

}  // namespace sandbroker
