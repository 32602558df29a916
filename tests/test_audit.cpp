#include <pvfworker/security/audit.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace pvfworker;
using pvfworker::testing_support::TempDir;

namespace {

const char* const SECCOMP_LINE =
    "audit: type=1326 audit(1711373621.384:2389): auid=1000 uid=1000 gid=1000 ses=2 "
    "subj=unconfined pid=2559058 comm=\"polkadot-prepar\" exe=\"/usr/bin/polkadot-prepare-worker\" "
    "sig=31 arch=c000003e syscall=53 compat=0 ip=0x7f1e3d3a8cbb code=0x80000000";

void append(const std::string& path, const std::string& text) {
    std::ofstream out(path.c_str(), std::ios::app | std::ios::binary);
    out << text;
}

} // namespace

// ============================================================================
// Line parsing
// ============================================================================

TEST(AuditParse, SeccompEventForPid) {
    std::optional<uint32_t> syscall = parse_audit_line_for_seccomp_event(SECCOMP_LINE, 2559058);
    ASSERT_TRUE(syscall.has_value());
    EXPECT_EQ(53u, *syscall);
}

TEST(AuditParse, OtherPidIsIgnored) {
    EXPECT_FALSE(parse_audit_line_for_seccomp_event(SECCOMP_LINE, 2559057).has_value());
}

TEST(AuditParse, PidPrefixDoesNotMatch) {
    // pid=2559058 must not match a pid of 255905
    EXPECT_FALSE(parse_audit_line_for_seccomp_event(SECCOMP_LINE, 255905).has_value());
}

TEST(AuditParse, OtherEventTypeIsIgnored) {
    std::string line = "audit: type=1327 audit(1711373621.384:2390): pid=2559058 syscall=53";
    EXPECT_FALSE(parse_audit_line_for_seccomp_event(line, 2559058).has_value());
}

TEST(AuditParse, MissingSyscallIsIgnored) {
    std::string line = "audit: type=1326 audit(1711373621.384:2389): pid=2559058 sig=31 arch=c000003e";
    EXPECT_FALSE(parse_audit_line_for_seccomp_event(line, 2559058).has_value());
}

TEST(AuditParse, MalformedSyscallIsIgnored) {
    std::string line = "type=1326 pid=42 syscall=5x3";
    EXPECT_FALSE(parse_audit_line_for_seccomp_event(line, 42).has_value());
}

TEST(AuditParse, FieldOrderIsNotAssumed) {
    std::string line = "syscall=41 comm=\"worker\" pid=42 kernel: audit type=1326";
    std::optional<uint32_t> syscall = parse_audit_line_for_seccomp_event(line, 42);
    ASSERT_TRUE(syscall.has_value());
    EXPECT_EQ(41u, *syscall);
}

TEST(AuditParse, SyslogPrefixedLine) {
    std::string line = std::string("Mar 25 13:33:41 host kernel: [12345.678901] ") + SECCOMP_LINE;
    std::optional<uint32_t> syscall = parse_audit_line_for_seccomp_event(line, 2559058);
    ASSERT_TRUE(syscall.has_value());
    EXPECT_EQ(53u, *syscall);
}

// ============================================================================
// Handle
// ============================================================================

TEST(AuditHandle, NoReadableLogGivesNothing) {
    TempDir dir;
    std::vector<std::string> paths;
    paths.push_back(dir.file("missing-audit.log"));
    paths.push_back(dir.file("missing-syslog"));
    EXPECT_FALSE(AuditHandle::acquire_from(paths).has_value());
}

TEST(AuditHandle, FallsBackToSecondPath) {
    TempDir dir;
    append(dir.file("syslog"), "");
    std::vector<std::string> paths;
    paths.push_back(dir.file("missing-audit.log"));
    paths.push_back(dir.file("syslog"));

    std::optional<AuditHandle> handle = AuditHandle::acquire_from(paths);
    ASSERT_TRUE(handle.has_value());
    EXPECT_EQ(dir.file("syslog"), handle->path());
}

TEST(AuditHandle, NothingWrittenGivesNoViolations) {
    TempDir dir;
    append(dir.file("audit.log"), "");
    std::optional<AuditHandle> handle = AuditHandle::acquire_from(std::vector<std::string>(1, dir.file("audit.log")));
    ASSERT_TRUE(handle.has_value());
    EXPECT_TRUE(handle->scan_for(2559058).empty());
}

TEST(AuditHandle, OnlyLinesAppendedAfterAcquireAreSeen) {
    TempDir dir;
    std::string log = dir.file("audit.log");
    append(log, std::string(SECCOMP_LINE) + "\n");

    std::optional<AuditHandle> handle = AuditHandle::acquire_from(std::vector<std::string>(1, log));
    ASSERT_TRUE(handle.has_value());

    append(log, "type=1326 pid=2559058 syscall=41\n");
    append(log, "type=1326 pid=99 syscall=42\n");
    append(log, "type=1300 pid=2559058 syscall=43\n");

    std::vector<SeccompViolation> violations = handle->scan_for(2559058);
    ASSERT_EQ(1u, violations.size());
    EXPECT_EQ(41u, violations[0].syscall_number);

    // Consumed lines are not reported twice
    EXPECT_TRUE(handle->scan_for(2559058).empty());
}

TEST(AuditHandle, PartialLineIsKeptUntilComplete) {
    TempDir dir;
    std::string log = dir.file("audit.log");
    append(log, "");
    std::optional<AuditHandle> handle = AuditHandle::acquire_from(std::vector<std::string>(1, log));
    ASSERT_TRUE(handle.has_value());

    append(log, "type=1326 pid=7 sysc");
    EXPECT_TRUE(handle->scan_for(7).empty());

    append(log, "all=59\n");
    std::vector<SeccompViolation> violations = handle->scan_for(7);
    ASSERT_EQ(1u, violations.size());
    EXPECT_EQ(59u, violations[0].syscall_number);
}

TEST(AuditHandle, MoveTransfersOwnership) {
    TempDir dir;
    std::string log = dir.file("audit.log");
    append(log, "");
    std::optional<AuditHandle> handle = AuditHandle::acquire_from(std::vector<std::string>(1, log));
    ASSERT_TRUE(handle.has_value());

    AuditHandle moved(std::move(*handle));
    append(log, "type=1326 pid=7 syscall=1\n");
    EXPECT_EQ(1u, moved.scan_for(7).size());
    EXPECT_TRUE(handle->scan_for(7).empty());
}
