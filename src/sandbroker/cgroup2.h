#ifndef SANDBROKER_CGROUP2_H_
#define SANDBROKER_CGROUP2_H_

#include <sys/types.h>  // For pid_t
#include <kj/io.h>
#include <kj/string.h>

namespace sandbroker {
class Cgroup {
  // A Linux control group (version 2).

  public:
    class FreezeHandle {
      // A handle for a currently-frozen cgroup. When the handle is
      // destroyed, the cgroup is unfrozen.

      friend class Cgroup;
      public:
        FreezeHandle() = delete;
        KJ_DISALLOW_COPY(FreezeHandle);
        FreezeHandle(FreezeHandle&&) noexcept = default;

        ~FreezeHandle() noexcept(false);
      private:
        kj::AutoCloseFd fd;

        FreezeHandle(kj::AutoCloseFd&& fd);
    };

    Cgroup() = delete;
    KJ_DISALLOW_COPY(Cgroup);
    Cgroup(Cgroup&&) noexcept = default;

    Cgroup(kj::StringPtr path);
    // Open the cgroup corresponding to the directory `path`.

    Cgroup getOrMakeChild(kj::StringPtr path);
    // Open a cgroup that is a child of this one, creating it if it does not
    // exist.

    Cgroup getChild(kj::StringPtr path);

    void removeChild(kj::StringPtr path);
    // Delete a child of this cgroup. The child must not contain any
    // processes.

    void addPid(pid_t pid);
    // Add the given process to the cgroup.

    void enableControllers(kj::ArrayPtr<const kj::StringPtr> controllers);
    // Make the named controllers available to this cgroup's children, by
    // writing "+name" to cgroup.subtree_control. Controllers that are
    // already enabled are left alone.

    void writeFile(kj::StringPtr name, kj::StringPtr value);
    bool writeFileIfExists(kj::StringPtr name, kj::StringPtr value);
    // Interface files that belong to a controller only exist when it is
    // enabled, and some (memory.swap.max) depend on kernel configuration.

    kj::Maybe<kj::String> readFileIfExists(kj::StringPtr name);

    kj::Maybe<uint64_t> readCounter(kj::StringPtr file, kj::StringPtr key);
    // Read one entry of a flat-keyed file such as memory.events or
    // cpu.stat. Null if the file or the key is missing.

    bool isPopulated();
    // True while any process lives in this cgroup or its descendants.

    void killAll();
    // SIGKILL every process in the cgroup. Uses cgroup.kill where the
    // kernel has it (5.14+); otherwise freezes the group so nothing can
    // fork while the members are signalled one by one.

    kj::Maybe<FreezeHandle> freeze();
    // Freeze the cgroup, suspending all processes within in. The cgroup will
    // be unfrozen when the returned handle is dropped.
  private:
    Cgroup(kj::AutoCloseFd&& dirfd);
    kj::AutoCloseFd dirfd;
};

kj::Maybe<uint64_t> findCounter(kj::StringPtr content, kj::StringPtr key);
// Parse "key value" lines as found in cgroup flat-keyed files.

class ScopedCgroup {
  // A child cgroup that exists for the duration of one run. teardown()
  // kills whatever is still inside and removes the directory.

public:
  ScopedCgroup(Cgroup&& parent, kj::StringPtr name);
  KJ_DISALLOW_COPY(ScopedCgroup);
  ScopedCgroup(ScopedCgroup&& other);
  ~ScopedCgroup() noexcept(false);

  Cgroup& get() { return group; }
  kj::StringPtr getName() { return name; }

  void teardown();
  // Idempotent. Throws if the group cannot be emptied or removed.

private:
  Cgroup parent;
  kj::String name;
  Cgroup group;
  bool removed = false;
  kj::UnwindDetector unwindDetector;
};

}  // namespace sandbroker

#endif
