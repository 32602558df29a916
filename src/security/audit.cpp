/*
 * pvfworker C++ - Audit Violation Scanner Implementation
 */
#include <pvfworker/security/audit.hpp>
#include <pvfworker/core/logger.hpp>
#include <pvfworker/core/utils.hpp>

#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>

namespace pvfworker {

namespace {
const char* const SECCOMP_EVENT_MARKER = "type=1326";
}

std::optional<uint32_t> parse_audit_line_for_seccomp_event(const std::string& line, pid_t pid) {
    std::string pid_token = "pid=" + std::to_string(pid);

    bool is_seccomp = false;
    bool has_pid = false;
    std::optional<uint32_t> syscall_number;

    std::vector<std::string> tokens = split_whitespace(line);
    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& t = tokens[i];
        if (t == SECCOMP_EVENT_MARKER) {
            is_seccomp = true;
        } else if (t == pid_token) {
            has_pid = true;
        } else if (starts_with(t, "syscall=")) {
            const char* digits = t.c_str() + 8;
            char* end = nullptr;
            errno = 0;
            unsigned long value = strtoul(digits, &end, 10);
            if (end != digits && *end == '\0' && errno == 0 && value <= UINT32_MAX) {
                syscall_number = static_cast<uint32_t>(value);
            }
        }
    }

    if (!is_seccomp || !has_pid) return std::nullopt;
    return syscall_number;
}

// ============================================================================
// AuditHandle
// ============================================================================

AuditHandle::AuditHandle() : fd_(-1) {}

AuditHandle::~AuditHandle() {
    if (fd_ >= 0) close(fd_);
}

AuditHandle::AuditHandle(AuditHandle&& other)
    : fd_(other.fd_)
    , path_(std::move(other.path_))
    , partial_(std::move(other.partial_))
{
    other.fd_ = -1;
}

AuditHandle& AuditHandle::operator=(AuditHandle&& other) {
    if (this != &other) {
        if (fd_ >= 0) close(fd_);
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        partial_ = std::move(other.partial_);
        other.fd_ = -1;
    }
    return *this;
}

std::optional<AuditHandle> AuditHandle::acquire() {
    std::vector<std::string> paths;
    paths.push_back(AUDIT_LOG_PATH);
    paths.push_back(SYSLOG_PATH);
    return acquire_from(paths);
}

std::optional<AuditHandle> AuditHandle::acquire_from(const std::vector<std::string>& paths) {
    std::vector<std::string> failures;
    for (size_t i = 0; i < paths.size(); ++i) {
        int fd = open(paths[i].c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            failures.push_back(paths[i] + ": " + errno_string(errno));
            continue;
        }
        if (lseek(fd, 0, SEEK_END) < 0) {
            failures.push_back(paths[i] + ": " + errno_string(errno));
            close(fd);
            continue;
        }

        AuditHandle handle;
        handle.fd_ = fd;
        handle.path_ = paths[i];
        LOG_DEBUG("[Audit] Watching %s for seccomp violations", paths[i].c_str());
        return std::optional<AuditHandle>(std::move(handle));
    }

    LOG_WARN("[Audit] No audit log readable, seccomp violations will go unnoticed (%s)",
             join(failures, "; ").c_str());
    return std::nullopt;
}

std::vector<SeccompViolation> AuditHandle::scan_for(pid_t pid) {
    std::vector<SeccompViolation> violations;
    if (fd_ < 0) return violations;

    std::string data;
    data.swap(partial_);
    char buf[8192];
    for (;;) {
        ssize_t n = read(fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) {
            LOG_WARN("[Audit] Cannot read %s: %s", path_.c_str(), errno_string(errno).c_str());
            break;
        }
        if (n == 0) break;
        data.append(buf, static_cast<size_t>(n));
    }

    size_t start = 0;
    for (;;) {
        size_t nl = data.find('\n', start);
        if (nl == std::string::npos) break;
        std::optional<uint32_t> syscall_number =
            parse_audit_line_for_seccomp_event(data.substr(start, nl - start), pid);
        if (syscall_number) {
            SeccompViolation v;
            v.syscall_number = *syscall_number;
            violations.push_back(v);
        }
        start = nl + 1;
    }
    partial_ = data.substr(start);

    if (!violations.empty()) {
        LOG_WARN("[Audit] Worker %d triggered %zu seccomp violation(s)",
                 static_cast<int>(pid), violations.size());
    }
    return violations;
}

} // namespace pvfworker
