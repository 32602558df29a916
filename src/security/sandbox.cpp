/*
 * pvfworker C++ - Security Sandbox Implementation
 *
 * Landlock through raw syscalls (no glibc wrappers), seccomp through
 * libseccomp, namespaces through unshare(2) and pivot_root(2).
 */
#include <pvfworker/security/sandbox.hpp>
#include <pvfworker/core/logger.hpp>
#include <pvfworker/core/utils.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sched.h>
#include <sys/mount.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <linux/landlock.h>
#include <sys/syscall.h>

#include <seccomp.h>

// ============================================================================
// Landlock syscall wrappers
// ============================================================================

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif
#ifndef __NR_pivot_root
#define __NR_pivot_root 155
#endif

#ifndef LANDLOCK_CREATE_RULESET_VERSION
#define LANDLOCK_CREATE_RULESET_VERSION (1U << 0)
#endif

// Access rights of Landlock ABI v1
#define LANDLOCK_ACCESS_FS_ALL ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_WRITE_FILE       | \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         | \
    LANDLOCK_ACCESS_FS_REMOVE_DIR       | \
    LANDLOCK_ACCESS_FS_REMOVE_FILE      | \
    LANDLOCK_ACCESS_FS_MAKE_CHAR        | \
    LANDLOCK_ACCESS_FS_MAKE_DIR         | \
    LANDLOCK_ACCESS_FS_MAKE_REG         | \
    LANDLOCK_ACCESS_FS_MAKE_SOCK        | \
    LANDLOCK_ACCESS_FS_MAKE_FIFO        | \
    LANDLOCK_ACCESS_FS_MAKE_BLOCK       | \
    LANDLOCK_ACCESS_FS_MAKE_SYM         \
)

#define LANDLOCK_ACCESS_FS_READ ( \
    LANDLOCK_ACCESS_FS_EXECUTE          | \
    LANDLOCK_ACCESS_FS_READ_FILE        | \
    LANDLOCK_ACCESS_FS_READ_DIR         \
)

static inline int landlock_create_ruleset(
    const struct landlock_ruleset_attr* attr,
    size_t size, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

static inline int landlock_add_rule(
    int ruleset_fd, enum landlock_rule_type type,
    const void* attr, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_add_rule, ruleset_fd, type, attr, flags));
}

static inline int landlock_restrict_self(int ruleset_fd, __u32 flags) {
    return static_cast<int>(syscall(__NR_landlock_restrict_self, ruleset_fd, flags));
}

namespace pvfworker {

namespace {

// 0: path missing, skipped. -1: error.
int add_path_rule(int ruleset_fd, const std::string& path, __u64 access, std::string& error) {
    int dir_fd = open(path.c_str(), O_PATH | O_CLOEXEC);
    if (dir_fd < 0) {
        if (errno == ENOENT) return 0;
        error = "cannot open '" + path + "' for landlock rule: " + errno_string(errno);
        return -1;
    }

    struct stat st;
    if (fstat(dir_fd, &st) == 0 && !S_ISDIR(st.st_mode)) {
        // Directory-only rights are rejected on regular files
        access &= LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_READ_FILE;
    }

    struct landlock_path_beneath_attr path_attr;
    memset(&path_attr, 0, sizeof(path_attr));
    path_attr.allowed_access = access;
    path_attr.parent_fd = dir_fd;

    int ret = landlock_add_rule(ruleset_fd, LANDLOCK_RULE_PATH_BENEATH, &path_attr, 0);
    int saved = errno;
    close(dir_fd);
    if (ret < 0) {
        error = "cannot add landlock rule for '" + path + "': " + errno_string(saved);
        return -1;
    }
    return 1;
}

bool write_proc_file(const char* path, const std::string& content, std::string& error) {
    int fd = open(path, O_WRONLY | O_CLOEXEC);
    if (fd < 0) {
        error = std::string("cannot open ") + path + ": " + errno_string(errno);
        return false;
    }
    ssize_t n = write(fd, content.data(), content.size());
    int saved = errno;
    close(fd);
    if (n != static_cast<ssize_t>(content.size())) {
        error = std::string("cannot write ") + path + ": " + errno_string(saved);
        return false;
    }
    return true;
}

} // namespace

// ============================================================================
// Landlock
// ============================================================================

Sandbox::Sandbox()
    : landlock_active_(false)
{}

int Sandbox::landlock_abi_version() {
    int abi = landlock_create_ruleset(NULL, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return abi < 0 ? -1 : abi;
}

void Sandbox::allow_path(const std::string& path) {
    if (!landlock_active_) {
        rw_paths_.push_back(path);
    }
}

void Sandbox::allow_path_read_only(const std::string& path) {
    if (!landlock_active_) {
        ro_paths_.push_back(path);
    }
}

bool Sandbox::enable_landlock(std::string& error) {
    if (landlock_active_) return true;

    if (landlock_abi_version() < 1) {
        error = "landlock is not supported by this kernel: " + errno_string(errno);
        return false;
    }

    struct landlock_ruleset_attr ruleset_attr;
    memset(&ruleset_attr, 0, sizeof(ruleset_attr));
    ruleset_attr.handled_access_fs = LANDLOCK_ACCESS_FS_ALL;

    int ruleset_fd = landlock_create_ruleset(&ruleset_attr, sizeof(ruleset_attr), 0);
    if (ruleset_fd < 0) {
        error = "cannot create landlock ruleset: " + errno_string(errno);
        return false;
    }

    for (size_t i = 0; i < rw_paths_.size(); ++i) {
        int r = add_path_rule(ruleset_fd, rw_paths_[i], LANDLOCK_ACCESS_FS_ALL, error);
        if (r < 0) {
            close(ruleset_fd);
            return false;
        }
        if (r > 0) LOG_DEBUG("[Sandbox] Allowed R/W: %s", rw_paths_[i].c_str());
    }
    for (size_t i = 0; i < ro_paths_.size(); ++i) {
        int r = add_path_rule(ruleset_fd, ro_paths_[i], LANDLOCK_ACCESS_FS_READ, error);
        if (r < 0) {
            close(ruleset_fd);
            return false;
        }
        if (r > 0) LOG_DEBUG("[Sandbox] Allowed R/O: %s", ro_paths_[i].c_str());
    }

    // Required before restrict_self for unprivileged processes
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) < 0) {
        error = "cannot set no_new_privs: " + errno_string(errno);
        close(ruleset_fd);
        return false;
    }

    if (landlock_restrict_self(ruleset_fd, 0) < 0) {
        error = "cannot restrict self: " + errno_string(errno);
        close(ruleset_fd);
        return false;
    }

    close(ruleset_fd);
    landlock_active_ = true;
    LOG_INFO("[Sandbox] Landlock active: %zu R/W and %zu R/O path(s)", rw_paths_.size(), ro_paths_.size());
    return true;
}

// ============================================================================
// seccomp
// ============================================================================

bool Sandbox::enable_seccomp(std::string& error) {
    static const char* const BLOCKED[] = {
        "socket", "socketpair", "connect", "bind", "listen", "accept", "accept4",
        "io_uring_setup", "io_uring_enter", "io_uring_register",
        NULL
    };

    scmp_filter_ctx ctx = seccomp_init(SCMP_ACT_ALLOW);
    if (ctx == NULL) {
        error = "seccomp_init failed";
        return false;
    }

    for (int i = 0; BLOCKED[i] != NULL; ++i) {
        int nr = seccomp_syscall_resolve_name(BLOCKED[i]);
        if (nr == __NR_SCMP_ERROR) {
            // Older libseccomp without io_uring names
            LOG_DEBUG("[Sandbox] seccomp does not know syscall '%s', skipping", BLOCKED[i]);
            continue;
        }
        int rc = seccomp_rule_add(ctx, SCMP_ACT_KILL_PROCESS, nr, 0);
        if (rc < 0) {
            error = std::string("cannot add seccomp rule for ") + BLOCKED[i] + ": " + errno_string(-rc);
            seccomp_release(ctx);
            return false;
        }
    }

    int rc = seccomp_load(ctx);
    seccomp_release(ctx);
    if (rc < 0) {
        error = "cannot load seccomp filter: " + errno_string(-rc);
        return false;
    }

    LOG_INFO("[Sandbox] seccomp active: networking syscalls are fatal");
    return true;
}

// ============================================================================
// Namespaces
// ============================================================================

bool Sandbox::change_root(const std::string& worker_dir, std::string& error) {
    uid_t uid = getuid();
    gid_t gid = getgid();

    if (unshare(CLONE_NEWUSER | CLONE_NEWNS) < 0) {
        error = "unshare user and mount namespace: " + errno_string(errno);
        return false;
    }

    // Keep our ids inside the new user namespace
    if (!write_proc_file("/proc/self/setgroups", "deny", error)) return false;
    if (!write_proc_file("/proc/self/uid_map", std::to_string(uid) + " " + std::to_string(uid) + " 1\n", error)) return false;
    if (!write_proc_file("/proc/self/gid_map", std::to_string(gid) + " " + std::to_string(gid) + " 1\n", error)) return false;

    // Mount events must not propagate back to the parent namespace
    if (mount(NULL, "/", NULL, MS_REC | MS_PRIVATE, NULL) < 0) {
        error = "remount / private: " + errno_string(errno);
        return false;
    }

    // pivot_root needs a mount point
    if (mount(worker_dir.c_str(), worker_dir.c_str(), NULL,
              MS_BIND | MS_REC | MS_NOEXEC | MS_NODEV | MS_NOSUID | MS_NOATIME, NULL) < 0) {
        error = "bind mount " + worker_dir + ": " + errno_string(errno);
        return false;
    }

    if (chdir(worker_dir.c_str()) < 0) {
        error = "chdir " + worker_dir + ": " + errno_string(errno);
        return false;
    }

    if (syscall(__NR_pivot_root, ".", ".") < 0) {
        error = "pivot_root: " + errno_string(errno);
        return false;
    }

    if (umount2(".", MNT_DETACH) < 0) {
        error = "detach old root: " + errno_string(errno);
        return false;
    }

    LOG_DEBUG("[Sandbox] Root changed to %s", worker_dir.c_str());
    return true;
}

} // namespace pvfworker
