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

#include "sandbox.h"
#include "syscall-filter.h"
#include <kj/debug.h>
#include <kj/io.h>
#include <capnp/message.h>
#include <capnp/serialize.h>
#include <sandbroker/sandbox.capnp.h>
#include <unistd.h>
#include <netinet/in.h> // needs to be included before sys/capability.h
#include <net/if.h>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/capability.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <linux/securebits.h>
#include <sched.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <mntent.h>
#include <errno.h>
#include <limits.h>

// In case kernel headers are old.
#ifndef SYS_mount_setattr
#define SYS_mount_setattr 442
#endif
#ifndef AT_RECURSIVE
#define AT_RECURSIVE 0x8000
#endif
#ifndef MOUNT_ATTR_RDONLY
#define MOUNT_ATTR_RDONLY 0x00000001
#endif

namespace sandbroker {

namespace {

struct StubParams {
  const Policy& policy;
  kj::StringPtr root;
  kj::Maybe<uint32_t> runAsUid;
  kj::Maybe<uint32_t> runAsGid;
  // Set when the broker's own ids are not covered by the policy's mappings, in which case the
  // target switches to the first mapped id before exec.

  int controlFd;
  int mapSyncFd;
  int stdoutFd;
  int stderrFd;
  int devNullFd;
};

kj::Maybe<uint32_t> chooseRunAsId(kj::ArrayPtr<const IdMapping> mappings, uint32_t ownId) {
  if (mappings.size() == 0) return nullptr;
  for (auto& m: mappings) {
    if (ownId >= m.hostId && ownId - m.hostId < m.count) return nullptr;
  }
  return mappings[0].sandboxId;
}

void writeProcFile(pid_t pid, kj::StringPtr name, kj::StringPtr contents) {
  // The kernel requires each map to be written with a single write().
  auto fd = raiiOpen(kj::str("/proc/", pid, "/", name), O_WRONLY | O_CLOEXEC);
  KJ_SYSCALL_HANDLE_ERRORS(write(fd, contents.begin(), contents.size())) {
    case EPERM:
      KJ_FAIL_REQUIRE("the kernel refused the id mapping; mapping ids other than your own "
                      "requires CAP_SETUID and CAP_SETGID", name, contents);
    default:
      KJ_FAIL_SYSCALL("write()", error, name, contents);
  }
}

void writeIdMaps(pid_t pid, const Policy& policy) {
  KJ_IF_MAYBE(fd, raiiOpenIfExists(kj::str("/proc/", pid, "/setgroups"), O_WRONLY | O_CLOEXEC)) {
    kj::FdOutputStream(kj::mv(*fd)).write("deny\n", 5);
  }
  writeProcFile(pid, "uid_map", formatIdMap(policy.uidMappings, getuid()));
  writeProcFile(pid, "gid_map", formatIdMap(policy.gidMappings, getgid()));
}

// =======================================================================================
// Mount helpers

void shadowDirectory(kj::StringPtr dir) {
  // Lay a private tmpfs over `dir` that carries a bind of each of its entries (symlinks are
  // copied), so that new mount points can be created in it without writing to the filesystem
  // `dir` really lives on. The caller seals the tmpfs once its mount points exist.
  auto original = raiiOpen(dir, O_PATH | O_DIRECTORY | O_CLOEXEC);
  auto entries = listDirectory(dir);

  KJ_SYSCALL(::mount("tmpfs", dir.cStr(), "tmpfs", MS_NOSUID | MS_NODEV,
                     "size=1m,mode=755"), dir);

  for (auto& name: entries) {
    auto dest = kj::str(dir, '/', name);

    struct stat stats;
    KJ_SYSCALL(fstatat(original, name.cStr(), &stats, AT_SYMLINK_NOFOLLOW), dir, name);
    if (S_ISLNK(stats.st_mode)) {
      char buffer[PATH_MAX + 1];
      ssize_t n;
      KJ_SYSCALL(n = readlinkat(original, name.cStr(), buffer, PATH_MAX), dir, name);
      buffer[n] = '\0';
      KJ_SYSCALL(symlink(buffer, dest.cStr()), dest);
      continue;
    } else if (S_ISDIR(stats.st_mode)) {
      KJ_SYSCALL(mkdir(dest.cStr(), 0755), dest);
    } else {
      KJ_SYSCALL(mknod(dest.cStr(), S_IFREG | 0644, 0), dest);
    }

    // Reach the original entry through the fd; `dir` itself now names the tmpfs.
    auto source = kj::str("/proc/self/fd/", original.get(), '/', name);
    KJ_SYSCALL(::mount(source.cStr(), dest.cStr(), nullptr, MS_BIND | MS_REC, nullptr), dest);
  }
}

void sealShadow(kj::StringPtr dir) {
  KJ_SYSCALL(::mount(nullptr, dir.cStr(), nullptr,
                     MS_REMOUNT | MS_BIND | MS_RDONLY | MS_NOSUID | MS_NODEV, nullptr), dir);
}

struct MountInfo {
  kj::String path;
  unsigned long flags = 0;
};

kj::Array<MountInfo> getAllMounts() {
  FILE* mounts = fopen("/proc/self/mounts", "re");
  if (mounts == nullptr) {
    KJ_FAIL_SYSCALL("fopen(/proc/self/mounts)", errno);
  }
  KJ_DEFER(fclose(mounts));

  kj::Vector<MountInfo> results;

  while (struct mntent* entry = getmntent(mounts)) {
    MountInfo info;
    info.path = kj::heapString(entry->mnt_dir);

    // Flags the kernel locks on mounts inherited into a user namespace have to be passed back
    // unchanged on remount, or it refuses with EPERM.
    for (auto& opt: split(kj::StringPtr(entry->mnt_opts), ',')) {
      kj::String o = kj::heapString(opt);
      if (o == "ro") {
        info.flags |= MS_RDONLY;
      } else if (o == "nosuid") {
        info.flags |= MS_NOSUID;
      } else if (o == "nodev") {
        info.flags |= MS_NODEV;
      } else if (o == "noexec") {
        info.flags |= MS_NOEXEC;
      } else if (o == "noatime") {
        info.flags |= MS_NOATIME;
      } else if (o == "nodiratime") {
        info.flags |= MS_NODIRATIME;
      } else if (o == "relatime") {
        info.flags |= MS_RELATIME;
      }
    }

    results.add(kj::mv(info));
  }

  return results.releaseAsArray();
}

void remountUnder(kj::StringPtr prefix, unsigned long flagsToAdd) {
  for (auto& mnt: getAllMounts()) {
    if ((mnt.flags & flagsToAdd) != flagsToAdd &&
        mnt.path.startsWith(prefix) &&
        (mnt.path.size() == prefix.size() || mnt.path[prefix.size()] == '/')) {
      KJ_SYSCALL(mount(nullptr, mnt.path.cStr(), nullptr,
                       MS_BIND | MS_REMOUNT | mnt.flags | flagsToAdd, nullptr),
                 mnt.path, prefix);
    }
  }
}

struct MountAttr {
  // Layout of the kernel's struct mount_attr.
  uint64_t attrSet;
  uint64_t attrClr;
  uint64_t propagation;
  uint64_t usernsFd;
};

void makeReadOnly(kj::StringPtr path) {
  // mount_setattr() (Linux 5.12) changes a whole tree in one call and leaves locked flags alone.
  // Older kernels get one remount per submount.
  MountAttr attr;
  memset(&attr, 0, sizeof(attr));
  attr.attrSet = MOUNT_ATTR_RDONLY;
  KJ_SYSCALL_HANDLE_ERRORS(syscall(SYS_mount_setattr, AT_FDCWD, path.cStr(),
                                   AT_RECURSIVE, &attr, sizeof(attr))) {
    case ENOSYS:
      remountUnder(path, MS_RDONLY);
      break;
    default:
      KJ_FAIL_SYSCALL("mount_setattr()", error, path);
  }
}

// =======================================================================================

class SandboxStub {
  // Runs in the process forked by prepare(). Builds the sandbox, then launches the target when
  // asked and reports how it ended.

public:
  explicit SandboxStub(const StubParams& params): params(params) {}

  int run() {
    KJ_SYSCALL(setsid());
    KJ_SYSCALL(prctl(PR_SET_PDEATHSIG, SIGKILL));

    // The launcher's polite SIGTERM is meant for the target; the stub must outlive it to report
    // the exit status. SIGKILL still works.
    KJ_SYSCALL(signal(SIGTERM, SIG_IGN) == SIG_ERR ? -1 : 0);
    KJ_SYSCALL(signal(SIGINT, SIG_IGN) == SIG_ERR ? -1 : 0);
    KJ_SYSCALL(signal(SIGPIPE, SIG_IGN) == SIG_ERR ? -1 : 0);

    const int keep[] = {
      params.controlFd, params.mapSyncFd, params.stdoutFd, params.stderrFd, params.devNullFd
    };
    closeFdsExcept(keep);

    KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() { setup(); })) {
      sendSetupReport(exception->getDescription());
      return 1;
    }
    sendSetupReport(nullptr);

    kj::FdInputStream rawInput(params.controlFd);
    kj::BufferedInputStreamWrapper input(rawInput);
    if (input.tryGetReadBuffer().size() == 0) {
      // The broker gave up on this run before launching anything.
      return 0;
    }

    capnp::InputStreamMessageReader reader(input);
    launch(reader.getRoot<ipc::ExecRequest>());
    return 0;
  }

private:
  const StubParams& params;
  kj::Vector<dev_t> privateLayers;
  // Filesystems (tmpfsMounts) that mount points may be created on directly.

  void setup() {
    int flags = CLONE_NEWUSER | CLONE_NEWNS | CLONE_NEWUTS | CLONE_NEWIPC | CLONE_NEWPID;
    if (params.policy.networkMode != NetworkMode::FULL) {
      flags |= CLONE_NEWNET;
    }
    KJ_SYSCALL_HANDLE_ERRORS(unshare(flags)) {
      case EPERM:
      case ENOSPC:
      case EUSERS:
        KJ_FAIL_REQUIRE("cannot create namespaces; unprivileged user namespaces may be "
                        "disabled on this host", strerror(error));
      default:
        KJ_FAIL_SYSCALL("unshare()", error);
    }

    // Only the broker, still in the parent user namespace, may write our id maps.
    waitForIdMaps();

    // Nothing we mount from here on may propagate back to the host.
    KJ_SYSCALL(mount("none", "/", nullptr, MS_REC | MS_PRIVATE, nullptr));

    KJ_SYSCALL(sethostname(params.policy.hostname.cStr(), params.policy.hostname.size()));

    if (params.policy.networkMode == NetworkMode::LOOPBACK) {
      bringUpLoopback();
    }

    buildMountTree();
    enterRoot();
    setResourceLimits();
  }

  void waitForIdMaps() {
    KJ_SYSCALL(write(params.mapSyncFd, "u", 1));
    char reply;
    ssize_t n;
    KJ_SYSCALL(n = read(params.mapSyncFd, &reply, 1));
    KJ_REQUIRE(n == 1 && reply == 'm', "broker did not map our user ids");
    KJ_SYSCALL(close(params.mapSyncFd));
  }

  void bringUpLoopback() {
    // Create a socket for our ioctls.
    int fd;
    KJ_SYSCALL(fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_IP));
    KJ_DEFER(close(fd));

    // Set the address of "lo".
    struct ifreq ifr;
    memset(&ifr, 0, sizeof(ifr));
    strcpy(ifr.ifr_ifrn.ifrn_name, "lo");
    struct sockaddr_in* addr = reinterpret_cast<struct sockaddr_in*>(&ifr.ifr_ifru.ifru_addr);
    addr->sin_family = AF_INET;
    addr->sin_addr.s_addr = htonl(0x7F000001);  // 127.0.0.1
    KJ_SYSCALL(ioctl(fd, SIOCSIFADDR, &ifr));

    // Set flags to enable "lo".
    memset(&ifr.ifr_ifru, 0, sizeof(ifr.ifr_ifru));
    ifr.ifr_ifru.ifru_flags = IFF_LOOPBACK | IFF_UP | IFF_RUNNING;
    KJ_SYSCALL(ioctl(fd, SIOCSIFFLAGS, &ifr));
  }

  kj::String targetPath(kj::StringPtr sandboxPath) {
    return sandboxPath == "/" ? kj::heapString(params.root) : kj::str(params.root, sandboxPath);
  }

  void makeMountPoint(kj::StringPtr target, bool asDirectory) {
    // Missing path components are created on a tmpfs private to this sandbox: either one from
    // tmpfsMounts, or a shadow laid over the deepest existing directory. Nothing is ever created
    // through a bind of a host directory.
    kj::String existing = kj::heapString(target);
    kj::Vector<kj::String> missing;  // innermost first
    while (access(existing.cStr(), F_OK) != 0) {
      int error = errno;
      if (error != ENOENT) {
        KJ_FAIL_SYSCALL("access()", error, existing);
      }
      size_t slashPos = KJ_ASSERT_NONNULL(existing.findLast('/'));
      missing.add(kj::heapString(existing.slice(slashPos + 1)));
      existing = kj::heapString(existing.slice(0, slashPos));
    }
    if (missing.size() == 0) return;

    struct stat stats;
    KJ_SYSCALL(stat(existing.cStr(), &stats), existing);
    KJ_REQUIRE(S_ISDIR(stats.st_mode), "mount target is inside a non-directory", target);

    bool onPrivateLayer = false;
    for (auto dev: privateLayers) {
      if (dev == stats.st_dev) onPrivateLayer = true;
    }
    if (!onPrivateLayer) {
      shadowDirectory(existing);
    }

    auto path = kj::heapString(existing);
    for (size_t i = missing.size(); i > 0; i--) {
      path = kj::str(path, '/', missing[i - 1]);
      if (i == 1 && !asDirectory) {
        KJ_SYSCALL(mknod(path.cStr(), S_IFREG | 0644, 0), path);
      } else {
        KJ_SYSCALL(mkdir(path.cStr(), 0755), path);
      }
    }

    if (!onPrivateLayer) {
      sealShadow(existing);
    }
  }

  void buildMountTree() {
    // Each read-only mount is sealed right after it is bound, before anything is mounted on top
    // of it, so that a recursive read-only flag never reaches a later writable mount.
    for (auto& mount: params.policy.rootMounts) {
      KJ_REQUIRE(access(mount.hostPath.cStr(), F_OK) == 0,
                 "mount source does not exist", mount.hostPath);
      auto target = targetPath(mount.sandboxPath);
      makeMountPoint(target, isDirectory(mount.hostPath));
      KJ_SYSCALL(::mount(mount.hostPath.cStr(), target.cStr(), nullptr, MS_BIND | MS_REC,
                         nullptr), mount.hostPath, target);
      if (mount.readOnly) {
        makeReadOnly(target);
      }
    }

    for (auto& path: params.policy.tmpfsMounts) {
      auto target = targetPath(path);
      makeMountPoint(target, true);
      KJ_SYSCALL(::mount("tmpfs", target.cStr(), "tmpfs", MS_NOSUID | MS_NODEV,
                         "size=16m,nr_inodes=4k,mode=1777"), target);
      struct stat stats;
      KJ_SYSCALL(stat(target.cStr(), &stats), target);
      privateLayers.add(stats.st_dev);
    }

    if (params.policy.mountProc) {
      // The kernel only lets us mount a fresh procfs if an unobstructed one is already visible
      // in this mount namespace. The target mounts its own on top of this one once it is PID 1
      // of the new pid namespace.
      auto target = targetPath("/proc");
      makeMountPoint(target, true);
      KJ_SYSCALL(::mount("/proc", target.cStr(), nullptr, MS_BIND | MS_REC, nullptr), target);
    }
  }

  void enterRoot() {
    // Andy's ridiculous pivot_root trick: pivot onto the new root with the old root stacked
    // underneath it, then detach the old root from the top of the stack.
    auto oldRootDir = raiiOpen("/", O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    KJ_SYSCALL(syscall(SYS_pivot_root, params.root.cStr(), params.root.cStr()), params.root);
    KJ_SYSCALL(fchdir(oldRootDir));
    KJ_SYSCALL(umount2(".", MNT_DETACH));
    KJ_SYSCALL(chdir("/"));
  }

  void setResourceLimits() {
    struct rlimit limit;
    memset(&limit, 0, sizeof(limit));
    limit.rlim_cur = 1024;
    limit.rlim_max = 4096;
    KJ_SYSCALL(setrlimit(RLIMIT_NOFILE, &limit));

    memset(&limit, 0, sizeof(limit));
    KJ_SYSCALL(setrlimit(RLIMIT_CORE, &limit));
  }

  void sendSetupReport(kj::Maybe<kj::StringPtr> error) {
    capnp::MallocMessageBuilder message;
    auto report = message.initRoot<ipc::SetupReport>();
    KJ_IF_MAYBE(e, error) {
      report.setFailed(*e);
    } else {
      report.setReady();
    }
    capnp::writeMessageToFd(params.controlFd, message);
  }

  void launch(ipc::ExecRequest::Reader request) {
    auto errorPipe = Pipe::make();

    pid_t child;
    KJ_SYSCALL(child = fork());
    if (child == 0) {
      // We are PID 1 of the sandbox's pid namespace.
      KJ_DEFER(_exit(127));  // Do not under any circumstances return from this stack frame!
      errorPipe.readEnd = nullptr;
      KJ_IF_MAYBE(exception, kj::runCatchingExceptions([&]() {
        execTarget(request);
      })) {
        // Anything written here reaches the stub only if exec() never happened, since the pipe
        // is close-on-exec.
        auto text = kj::str(exception->getDescription());
        KJ_IF_MAYBE(writeError, kj::runCatchingExceptions([&]() {
          kj::FdOutputStream(errorPipe.writeEnd.get()).write(text.begin(), text.size());
        })) {
          KJ_LOG(ERROR, "couldn't report launch failure", text, *writeError);
        }
      }
    }

    errorPipe.writeEnd = nullptr;
    KJ_SYSCALL(close(params.stdoutFd));
    KJ_SYSCALL(close(params.stderrFd));
    KJ_SYSCALL(close(params.devNullFd));

    auto launchError = readAll(errorPipe.readEnd);

    int status;
    struct rusage usage;
    memset(&usage, 0, sizeof(usage));
    KJ_SYSCALL(wait4(child, &status, 0, &usage));

    capnp::MallocMessageBuilder message;
    auto report = message.initRoot<ipc::ExitReport>();
    if (launchError.size() > 0) {
      report.setLaunchFailed(launchError);
    } else {
      auto finished = report.initFinished();
      finished.setWaitStatus(status);
      finished.setMaxRssKilobytes(usage.ru_maxrss);
      finished.setUserMicros(uint64_t(usage.ru_utime.tv_sec) * 1000000 + usage.ru_utime.tv_usec);
      finished.setSystemMicros(
          uint64_t(usage.ru_stime.tv_sec) * 1000000 + usage.ru_stime.tv_usec);
    }
    capnp::writeMessageToFd(params.controlFd, message);
  }

  void execTarget(ipc::ExecRequest::Reader request) {
    if (params.policy.mountProc) {
      KJ_SYSCALL(mount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, nullptr));
    }

    KJ_SYSCALL(dup2(params.devNullFd, STDIN_FILENO));
    KJ_SYSCALL(dup2(params.stdoutFd, STDOUT_FILENO));
    KJ_SYSCALL(dup2(params.stderrFd, STDERR_FILENO));

    // Reset all signal handlers to default.  (exec() will leave ignored signals ignored, and we
    // ignore e.g. SIGPIPE and SIGTERM.)
    for (uint i = 1; i < NSIG; i++) {
      ::signal(i, SIG_DFL);  // Only possible error is EINVAL (invalid signum); we don't care.
    }

    // Unblock all signals.  (Yes, the signal mask is inherited over exec...)
    sigset_t sigmask;
    sigemptyset(&sigmask);
    KJ_SYSCALL(sigprocmask(SIG_SETMASK, &sigmask, nullptr));

    KJ_SYSCALL(chdir(request.getWorkingDirectory().cStr()), request.getWorkingDirectory());

    dropPrivileges();
    if (request.getSyscallFilter()) {
      // Last, so that the calls made above are still available.
      installSyscallFilter();
    }

    // Make the args and environment vectors.  exec*() is not const-correct. :(
    auto args = request.getArgv();
    auto argv = kj::heapArray<char*>(args.size() + 1);
    for (auto i: kj::indices(args)) {
      argv[i] = const_cast<char*>(args[i].cStr());
    }
    argv[args.size()] = nullptr;

    auto vars = request.getEnvironment();
    auto envp = kj::heapArray<char*>(vars.size() + 1);
    for (auto i: kj::indices(vars)) {
      envp[i] = const_cast<char*>(vars[i].cStr());
    }
    envp[vars.size()] = nullptr;

    // execvp() searches the PATH of the current environment, which should be the target's.
    environ = envp.begin();
    KJ_SYSCALL(execvp(request.getExecutable().cStr(), argv.begin()), request.getExecutable());
    KJ_UNREACHABLE;
  }

  void dropPrivileges() {
    // Root inside the sandbox must not regain capabilities on exec().
    KJ_SYSCALL(prctl(PR_SET_SECUREBITS, SECBIT_NOROOT | SECBIT_NOROOT_LOCKED, 0, 0, 0));

    for (cap_value_t cap = 0;; cap++) {
      if (cap_drop_bound(cap) < 0) {
        if (errno == EINVAL) break;  // Past the last capability this kernel knows.
        KJ_FAIL_SYSCALL("cap_drop_bound()", errno, cap);
      }
    }

    KJ_IF_MAYBE(gid, params.runAsGid) {
      KJ_SYSCALL(setresgid(*gid, *gid, *gid));
    }
    KJ_IF_MAYBE(uid, params.runAsUid) {
      KJ_SYSCALL(setresuid(*uid, *uid, *uid));
    }

    // Changing the effective uid clears the parent-death signal, so set it afterwards.
    KJ_SYSCALL(prctl(PR_SET_PDEATHSIG, SIGKILL));

    cap_t empty = cap_init();
    if (empty == nullptr) {
      KJ_FAIL_SYSCALL("cap_init()", errno);
    }
    KJ_DEFER(cap_free(empty));
    KJ_SYSCALL(cap_set_proc(empty));

    KJ_SYSCALL(prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0));
  }
};

}  // namespace

// =======================================================================================

kj::String formatIdMap(kj::ArrayPtr<const IdMapping> mappings, uint32_t ownId) {
  if (mappings.size() == 0) {
    return kj::str(DEFAULT_SANDBOX_ID, " ", ownId, " 1\n");
  }
  return kj::str(kj::strArray(KJ_MAP(m, mappings) {
    return kj::str(m.sandboxId, " ", m.hostId, " ", m.count);
  }, "\n"), "\n");
}

IsolatedEnvironment::IsolatedEnvironment(kj::String scratchPath)
    : scratchPath(kj::mv(scratchPath)) {}

IsolatedEnvironment::~IsolatedEnvironment() noexcept(false) {
  // Warnings are logged by teardown() itself.
  teardown();
}

pid_t IsolatedEnvironment::getStubPid() {
  return KJ_REQUIRE_NONNULL(stub, "sandbox was never started").getPid();
}

void IsolatedEnvironment::adoptCgroup(ScopedCgroup&& group) {
  KJ_REQUIRE(cgroup == nullptr, "sandbox already has a cgroup");
  cgroup = kj::mv(group);
}

kj::Maybe<Cgroup&> IsolatedEnvironment::getCgroup() {
  KJ_IF_MAYBE(c, cgroup) {
    return c->get();
  } else {
    return nullptr;
  }
}

bool IsolatedEnvironment::isStubRunning() {
  KJ_IF_MAYBE(s, stub) {
    return s->isRunning();
  } else {
    return false;
  }
}

void IsolatedEnvironment::signalGroup(int signo) {
  if (!isStubRunning()) return;

  // An unreaped stub keeps its process group id reserved, so this can't hit a stranger.
  KJ_SYSCALL_HANDLE_ERRORS(kill(-getStubPid(), signo)) {
    case ESRCH:
      break;
    default:
      KJ_FAIL_SYSCALL("kill()", error, signo);
  }
}

int IsolatedEnvironment::waitStub() {
  return KJ_REQUIRE_NONNULL(stub, "sandbox was never started").waitForExitOrSignal();
}

kj::ArrayPtr<const kj::String> IsolatedEnvironment::teardown() {
  if (tornDown) return teardownWarnings;
  tornDown = true;

  auto& warnings = teardownWarnings;
  auto attempt = [&](kj::StringPtr step, auto&& func) {
    KJ_IF_MAYBE(exception, kj::runCatchingExceptions(kj::fwd<decltype(func)>(func))) {
      KJ_LOG(WARNING, "sandbox teardown step failed", step, *exception);
      warnings.add(kj::str(step, ": ", exception->getDescription()));
    }
  };

  attempt("kill sandbox", [&]() {
    if (isStubRunning()) {
      signalGroup(SIGKILL);
      auto& s = KJ_ASSERT_NONNULL(stub);
      s.signal(SIGKILL);
      (void)s.waitForExitOrSignal();
    }
  });

  control = nullptr;
  stdoutPipe = nullptr;
  stderrPipe = nullptr;

  KJ_IF_MAYBE(c, cgroup) {
    attempt("remove cgroup", [&]() { c->teardown(); });
  }

  attempt("remove scratch directory", [&]() {
    KJ_SYSCALL(rmdir(scratchPath.cStr()), scratchPath);
  });

  return teardownWarnings;
}

kj::Own<IsolatedEnvironment> prepare(const Policy& policy, const BrokerConfig& config) {
  auto scratch = kj::str(config.scratchDir, "/sandbroker-XXXXXX");
  if (mkdtemp(scratch.begin()) == nullptr) {
    KJ_FAIL_SYSCALL("mkdtemp()", errno, scratch);
  }
  auto env = kj::heap<IsolatedEnvironment>(kj::mv(scratch));

  auto control = Pipe::makeTwoWay();
  auto mapSync = Pipe::makeTwoWay();
  auto stdoutPipe = Pipe::make();
  auto stderrPipe = Pipe::make();
  auto devNull = raiiOpen("/dev/null", O_RDWR | O_CLOEXEC);

  StubParams params {
    policy, env->scratchPath,
    chooseRunAsId(policy.uidMappings, getuid()),
    chooseRunAsId(policy.gidMappings, getgid()),
    control.writeEnd, mapSync.writeEnd, stdoutPipe.writeEnd, stderrPipe.writeEnd, devNull
  };
  env->stub = Subprocess([&]() -> int {
    SandboxStub stub(params);
    return stub.run();
  });

  // Drop our copies of the stub's ends, so that its death shows up as EOF.
  control.writeEnd = nullptr;
  mapSync.writeEnd = nullptr;
  stdoutPipe.writeEnd = nullptr;
  stderrPipe.writeEnd = nullptr;
  devNull = nullptr;

  env->control = kj::mv(control.readEnd);
  env->stdoutPipe = kj::mv(stdoutPipe.readEnd);
  env->stderrPipe = kj::mv(stderrPipe.readEnd);

  char request;
  ssize_t n;
  KJ_SYSCALL(n = read(mapSync.readEnd, &request, 1));
  if (n == 1) {
    writeIdMaps(env->getStubPid(), policy);
    KJ_SYSCALL(write(mapSync.readEnd, "m", 1));
  }
  // Otherwise the stub failed before unsharing; its report says why.

  kj::FdInputStream rawInput(env->getControlFd());
  kj::BufferedInputStreamWrapper input(rawInput);
  if (input.tryGetReadBuffer().size() == 0) {
    int status = env->waitStub();
    KJ_FAIL_REQUIRE("sandbox setup failed: setup process exited without reporting", status);
  }

  capnp::InputStreamMessageReader reader(input);
  auto report = reader.getRoot<ipc::SetupReport>();
  if (report.isFailed()) {
    kj::StringPtr reason = report.getFailed();
    KJ_LOG(INFO, "sandbox setup failed", reason);
    KJ_FAIL_REQUIRE("sandbox setup failed", reason);
  }

  return env;
}

}  // namespace sandbroker
