/*
 * pvfworker C++ - Audit Violation Scanner
 *
 * Detects seccomp violations of a worker after the fact. The kernel logs a
 * SECCOMP audit record (type=1326) when a filter action fires; records for a
 * given pid are collected from the audit log, or syslog when auditd is not
 * running. Best effort: any failure reads as "no violations observed".
 */
#ifndef pvfworker_SECURITY_AUDIT_HPP
#define pvfworker_SECURITY_AUDIT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace pvfworker {

const char* const AUDIT_LOG_PATH = "/var/log/audit/audit.log";
const char* const SYSLOG_PATH = "/var/log/syslog";

struct SeccompViolation {
    uint32_t syscall_number;
};

// Syscall number of a seccomp event for `pid` in `line`, or nothing when
// the line is not one.
std::optional<uint32_t> parse_audit_line_for_seccomp_event(const std::string& line, pid_t pid);

class AuditHandle {
public:
    AuditHandle();
    ~AuditHandle();
    AuditHandle(AuditHandle&& other);
    AuditHandle& operator=(AuditHandle&& other);

    // Open the audit log, else syslog, positioned at end of file.
    static std::optional<AuditHandle> acquire();

    // Same, trying `paths` in order.
    static std::optional<AuditHandle> acquire_from(const std::vector<std::string>& paths);

    // Violations by `pid` among lines appended since acquisition or the
    // previous scan.
    std::vector<SeccompViolation> scan_for(pid_t pid);

    const std::string& path() const { return path_; }

private:
    AuditHandle(const AuditHandle&);
    AuditHandle& operator=(const AuditHandle&);

    int fd_;
    std::string path_;
    std::string partial_;   // Trailing line not yet terminated by '\n'
};

} // namespace pvfworker

#endif // pvfworker_SECURITY_AUDIT_HPP
