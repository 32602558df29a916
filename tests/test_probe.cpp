#include <pvfworker/security/probe.hpp>
#include <pvfworker/core/config.hpp>

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <dirent.h>
#include <fstream>
#include <sys/stat.h>

using namespace pvfworker;
using pvfworker::testing_support::TempDir;

namespace {

// Stand-in worker binary: each check flag exits with the given status
std::string write_fake_worker(const TempDir& dir, int landlock, int seccomp, int unshare,
                              const std::string& unshare_stderr = "") {
    std::string path = dir.file("fake-worker.sh");
    std::ofstream out(path.c_str());
    out << "#!/bin/sh\n"
        << "case \"$1\" in\n"
        << "  --check-can-enable-landlock) exit " << landlock << " ;;\n"
        << "  --check-can-enable-seccomp) exit " << seccomp << " ;;\n"
        << "  --check-can-unshare-user-namespace-and-change-root)\n"
        << "    [ \"$2\" = \"--worker-dir-path\" ] && [ -d \"$3\" ] || exit 9\n";
    if (!unshare_stderr.empty()) {
        out << "    echo '" << unshare_stderr << "' >&2\n";
    }
    out << "    exit " << unshare << " ;;\n"
        << "esac\n"
        << "exit 2\n";
    out.close();
    chmod(path.c_str(), 0755);
    return path;
}

size_t count_entries(const std::string& dir) {
    size_t n = 0;
    DIR* d = opendir(dir.c_str());
    if (!d) return 0;
    while (struct dirent* e = readdir(d)) {
        std::string name = e->d_name;
        if (name != "." && name != "..") ++n;
    }
    closedir(d);
    return n;
}

} // namespace

TEST(SecureModeError, OnlyLandlockIsAllowedInSecureMode) {
    EXPECT_TRUE(SecureModeError(SecureModeErrorKind::CannotEnableLandlock, "x").is_allowed_in_secure_mode());
    EXPECT_FALSE(SecureModeError(SecureModeErrorKind::CannotEnableSeccomp, "x").is_allowed_in_secure_mode());
    EXPECT_FALSE(SecureModeError(SecureModeErrorKind::CannotUnshareUserNamespaceAndChangeRoot, "x")
                     .is_allowed_in_secure_mode());
}

TEST(SecureModeError, MessagesNameTheFeature) {
    EXPECT_EQ("Cannot enable landlock (ABI 2), a Linux 5.13+ kernel security feature: exit status 1",
              SecureModeError(SecureModeErrorKind::CannotEnableLandlock, "exit status 1", 2).message());
    EXPECT_EQ("Cannot enable seccomp, a Linux-specific kernel security feature: exit status 1",
              SecureModeError(SecureModeErrorKind::CannotEnableSeccomp, "exit status 1").message());
    EXPECT_EQ("Cannot unshare user namespace and change root, which are Linux-specific kernel "
              "security features: denied",
              SecureModeError(SecureModeErrorKind::CannotUnshareUserNamespaceAndChangeRoot, "denied").message());
}

TEST(CheckProcess, CapturesStderrAndExitCode) {
    std::vector<std::string> args;
    args.push_back("-c");
    args.push_back("echo diagnostic >&2; exit 3");
    CheckResult r = run_check_process("/bin/sh", args);

    EXPECT_TRUE(r.spawned);
    EXPECT_FALSE(r.success());
    EXPECT_EQ(3, r.exit_code);
    EXPECT_EQ("diagnostic\n", r.stderr_output);
    EXPECT_EQ("exit status 3", r.describe());
}

TEST(CheckProcess, KilledBySignal) {
    std::vector<std::string> args;
    args.push_back("-c");
    args.push_back("kill -9 $$");
    CheckResult r = run_check_process("/bin/sh", args);

    EXPECT_FALSE(r.success());
    EXPECT_EQ(9, r.term_signal);
    EXPECT_EQ("killed by signal 9", r.describe());
}

TEST(CheckProcess, MissingProgramFails) {
    CheckResult r = run_check_process("/nonexistent/pvf-prepare-worker", std::vector<std::string>());
    EXPECT_FALSE(r.success());
    EXPECT_EQ(127, r.exit_code);
}

TEST(SecurityProbe, AllChecksPass) {
    TempDir dir;
    SecurityProbe probe(write_fake_worker(dir, 0, 0, 0), dir.path());
    SecurityProbeReport report = probe.run();

    EXPECT_TRUE(report.status.can_enable_landlock);
    EXPECT_TRUE(report.status.can_unshare_user_namespace_and_change_root);
#if defined(__x86_64__)
    EXPECT_TRUE(report.status.can_enable_seccomp);
    EXPECT_TRUE(report.errors.empty());
    EXPECT_FALSE(log_security_report(report, true));
#endif
}

TEST(SecurityProbe, SeccompFailureIsMandatory) {
    TempDir dir;
    SecurityProbe probe(write_fake_worker(dir, 0, 1, 0), dir.path());
    SecurityProbeReport report = probe.run();

    EXPECT_TRUE(report.status.can_enable_landlock);
    EXPECT_FALSE(report.status.can_enable_seccomp);
    ASSERT_EQ(1u, report.errors.size());
    EXPECT_EQ(SecureModeErrorKind::CannotEnableSeccomp, report.errors[0].kind);
    EXPECT_TRUE(report.has_mandatory_failure());

    EXPECT_TRUE(log_security_report(report, true));
    EXPECT_FALSE(log_security_report(report, false));
}

#if defined(__x86_64__)
TEST(SecurityProbe, LandlockFailureAloneIsOptional) {
    TempDir dir;
    SecurityProbe probe(write_fake_worker(dir, 1, 0, 0), dir.path());
    SecurityProbeReport report = probe.run();

    EXPECT_FALSE(report.status.can_enable_landlock);
    ASSERT_EQ(1u, report.errors.size());
    EXPECT_TRUE(report.errors[0].is_allowed_in_secure_mode());
    EXPECT_FALSE(report.has_mandatory_failure());
    EXPECT_FALSE(log_security_report(report, true));
}
#endif

TEST(SecurityProbe, UnshareFailureCarriesStderr) {
    TempDir dir;
    SecurityProbe probe(write_fake_worker(dir, 0, 0, 1, "unshare: operation not permitted"), dir.path());
    SecurityProbeReport report = probe.run();

    EXPECT_FALSE(report.status.can_unshare_user_namespace_and_change_root);
    bool found = false;
    for (size_t i = 0; i < report.errors.size(); ++i) {
        if (report.errors[i].kind == SecureModeErrorKind::CannotUnshareUserNamespaceAndChangeRoot) {
            EXPECT_EQ("unshare: operation not permitted", report.errors[i].detail);
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST(SecurityProbe, ScratchDirectoryIsRemoved) {
    TempDir dir;
    std::string worker = write_fake_worker(dir, 0, 0, 0);
    TempDir cache;
    SecurityProbe probe(worker, cache.path());
    SecurityProbeReport report = probe.run();

    // The fake worker exits 9 when handed a missing directory
    EXPECT_TRUE(report.status.can_unshare_user_namespace_and_change_root);
    EXPECT_EQ(0u, count_entries(cache.path()));
}

TEST(SecurityProbe, UnusableCachePathFailsUnshareOnly) {
    TempDir dir;
    SecurityProbe probe(write_fake_worker(dir, 0, 0, 0), "/nonexistent-pvfworker-cache");
    SecurityProbeReport report = probe.run();

    EXPECT_TRUE(report.status.can_enable_landlock);
    EXPECT_FALSE(report.status.can_unshare_user_namespace_and_change_root);
}

TEST(SecurityProbe, ConfigDrivesCachePathAndMode) {
    TempDir dir;
    std::string worker = write_fake_worker(dir, 0, 1, 0);
    Config config;
    config.set_string("security.cache_path", dir.path());

    bool error_occurred = false;
    SecurityStatus status = check_security_status(config, worker, error_occurred);
    EXPECT_FALSE(status.can_enable_seccomp);
    EXPECT_TRUE(error_occurred);

    config.set_bool("security.secure_validator_mode", false);
    check_security_status(config, worker, error_occurred);
    EXPECT_FALSE(error_occurred);
}
