#include <sandbroker/cgroup2.h>
#include <sandbroker/util.h>

#include <kj/debug.h>
#include <signal.h>
#include <string.h>
#include <time.h>

namespace sandbroker {
Cgroup::Cgroup(kj::StringPtr path)
  : dirfd(raiiOpen(path, O_DIRECTORY|O_CLOEXEC))
{}

Cgroup::Cgroup(kj::AutoCloseFd&& dirfd)
  : dirfd(kj::mv(dirfd))
{}

Cgroup Cgroup::getOrMakeChild(kj::StringPtr path) {
  KJ_SYSCALL_HANDLE_ERRORS(mkdirat(dirfd.get(), path.cStr(), 0700)) {
    case EEXIST:
      break;
    default:
      KJ_FAIL_SYSCALL("mkdirat()", error, path);
  }

  return getChild(path);
}

Cgroup Cgroup::getChild(kj::StringPtr path) {
  return Cgroup(raiiOpenAt(dirfd.get(), path, O_DIRECTORY|O_CLOEXEC));
}

void Cgroup::removeChild(kj::StringPtr path) {
  // A cgroup whose last process was just killed can report EBUSY for a short while.
  struct timespec pause = { 0, 10 * 1000 * 1000 };
  for (uint attempt = 0;; attempt++) {
    KJ_SYSCALL_HANDLE_ERRORS(unlinkat(dirfd.get(), path.cStr(), AT_REMOVEDIR)) {
      case EBUSY:
        if (attempt < 10) {
          nanosleep(&pause, nullptr);
          continue;
        }
        KJ_FAIL_SYSCALL("unlinkat()", error, path);
      default:
        KJ_FAIL_SYSCALL("unlinkat()", error, path);
    }
    return;
  }
}

void Cgroup::addPid(pid_t pid) {
  writeFile("cgroup.procs", kj::str(pid));
}

void Cgroup::enableControllers(kj::ArrayPtr<const kj::StringPtr> controllers) {
  auto current = KJ_ASSERT_NONNULL(readFileIfExists("cgroup.subtree_control"),
                                   "not a cgroup v2 directory");
  auto enabled = splitSpace(current);
  for (auto& controller: controllers) {
    bool found = false;
    for (auto& e: enabled) {
      if (e == controller.asArray()) {
        found = true;
        break;
      }
    }
    if (!found) {
      writeFile("cgroup.subtree_control", kj::str("+", controller));
    }
  }
}

void Cgroup::writeFile(kj::StringPtr name, kj::StringPtr value) {
  auto fd = raiiOpenAt(dirfd.get(), name, O_WRONLY|O_CLOEXEC);
  KJ_SYSCALL(write(fd.get(), value.begin(), value.size()), name, value);
}

bool Cgroup::writeFileIfExists(kj::StringPtr name, kj::StringPtr value) {
  KJ_IF_MAYBE(fd, raiiOpenAtIfExists(dirfd.get(), name, O_WRONLY|O_CLOEXEC)) {
    KJ_SYSCALL(write(fd->get(), value.begin(), value.size()), name, value);
    return true;
  } else {
    return false;
  }
}

kj::Maybe<kj::String> Cgroup::readFileIfExists(kj::StringPtr name) {
  KJ_IF_MAYBE(fd, raiiOpenAtIfExists(dirfd.get(), name, O_RDONLY|O_CLOEXEC)) {
    return readAll(fd->get());
  } else {
    return nullptr;
  }
}

kj::Maybe<uint64_t> Cgroup::readCounter(kj::StringPtr file, kj::StringPtr key) {
  KJ_IF_MAYBE(content, readFileIfExists(file)) {
    return findCounter(*content, key);
  } else {
    return nullptr;
  }
}

bool Cgroup::isPopulated() {
  KJ_IF_MAYBE(populated, readCounter("cgroup.events", "populated")) {
    return *populated != 0;
  }
  // No cgroup.events means this is the root cgroup, which is never empty.
  return true;
}

void Cgroup::killAll() {
  if (writeFileIfExists("cgroup.kill", "1")) {
    return;
  }

  auto frozen = freeze();
  auto procs = KJ_ASSERT_NONNULL(readFileIfExists("cgroup.procs"));
  for (auto& line: splitLines(procs)) {
    KJ_IF_MAYBE(pid, parseUInt(line, 10)) {
      KJ_SYSCALL_HANDLE_ERRORS(kill(*pid, SIGKILL)) {
        case ESRCH:
          break;
        default:
          KJ_FAIL_SYSCALL("kill()", error, *pid);
      }
    }
  }
}

kj::Maybe<Cgroup::FreezeHandle> Cgroup::freeze() {
  KJ_IF_MAYBE(freezeFd, raiiOpenAtIfExists(dirfd.get(), "cgroup.freeze", O_WRONLY|O_CLOEXEC)) {
    KJ_SYSCALL(write(freezeFd->get(), "1\n", 2));
    return Cgroup::FreezeHandle(kj::mv(*freezeFd));
  } else {
    return nullptr;
  }
}

Cgroup::FreezeHandle::FreezeHandle(kj::AutoCloseFd&& fd) : fd(kj::mv(fd)) {}

Cgroup::FreezeHandle::~FreezeHandle() noexcept(false) {
  int freezeFd = fd.get();
  if(freezeFd >= 0) {
    KJ_SYSCALL(write(freezeFd, "0\n", 2));
  }
}

kj::Maybe<uint64_t> findCounter(kj::StringPtr content, kj::StringPtr key) {
  for (auto& line: splitLines(content)) {
    auto words = splitSpace(line);
    if (words.size() == 2 && words[0] == key.asArray()) {
      return parseUInt64(kj::heapString(words[1]), 10);
    }
  }
  return nullptr;
}

// =======================================================================================

ScopedCgroup::ScopedCgroup(Cgroup&& parentParam, kj::StringPtr nameParam)
    : parent(kj::mv(parentParam)), name(kj::heapString(nameParam)),
      group(parent.getOrMakeChild(name)) {}

ScopedCgroup::ScopedCgroup(ScopedCgroup&& other)
    : parent(kj::mv(other.parent)), name(kj::mv(other.name)), group(kj::mv(other.group)),
      removed(other.removed) {
  other.removed = true;
}

ScopedCgroup::~ScopedCgroup() noexcept(false) {
  if (!removed) {
    unwindDetector.catchExceptionsIfUnwinding([this]() {
      teardown();
    });
  }
}

void ScopedCgroup::teardown() {
  if (removed) return;

  group.killAll();

  // Killed processes leave the cgroup asynchronously; cgroup.events flips once the last one is
  // gone. Give it up to about a second.
  struct timespec pause = { 0, 10 * 1000 * 1000 };
  for (uint i = 0; i < 100 && group.isPopulated(); i++) {
    nanosleep(&pause, nullptr);
  }

  parent.removeChild(name);
  removed = true;
}

}  // namespace sandbroker
