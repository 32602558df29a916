#include <pvfworker/ipc/codec.hpp>
#include <pvfworker/ipc/framed.hpp>
#include <pvfworker/core/config.hpp>

#include <gtest/gtest.h>

#include <limits>
#include <sys/socket.h>
#include <unistd.h>

using namespace pvfworker;

namespace {

class SocketPair : public ::testing::Test {
protected:
    void SetUp() {
        ASSERT_EQ(0, socketpair(AF_UNIX, SOCK_STREAM, 0, fds_));
    }
    void TearDown() {
        close_end(0);
        close_end(1);
    }
    void close_end(int i) {
        if (fds_[i] >= 0) {
            close(fds_[i]);
            fds_[i] = -1;
        }
    }

    int fds_[2];
};

} // namespace

// ============================================================================
// Framing
// ============================================================================

TEST_F(SocketPair, FramesArriveInOrder) {
    std::string error;
    std::vector<uint8_t> first(3, 0xaa);
    std::vector<uint8_t> second;
    ASSERT_TRUE(framed_send(fds_[0], first, error)) << error;
    ASSERT_TRUE(framed_send(fds_[0], second, error)) << error;
    close_end(0);

    std::vector<uint8_t> got;
    ASSERT_EQ(RecvStatus::Ok, framed_recv(fds_[1], got, 1024, error));
    EXPECT_EQ(first, got);
    ASSERT_EQ(RecvStatus::Ok, framed_recv(fds_[1], got, 1024, error));
    EXPECT_TRUE(got.empty());
    EXPECT_EQ(RecvStatus::Closed, framed_recv(fds_[1], got, 1024, error));
}

TEST_F(SocketPair, OversizedFrameIsRejected) {
    std::string error;
    ASSERT_TRUE(framed_send(fds_[0], std::vector<uint8_t>(100, 1), error));

    std::vector<uint8_t> got;
    EXPECT_EQ(RecvStatus::Error, framed_recv(fds_[1], got, 99, error));
    EXPECT_NE(std::string::npos, error.find("exceeds"));
}

TEST_F(SocketPair, TruncatedFrameIsAnError) {
    std::vector<uint8_t> frame = frame_payload(std::vector<uint8_t>(10, 7));
    frame.resize(FRAME_HEADER_SIZE + 4);
    std::string error;
    ASSERT_TRUE(write_all(fds_[0], frame.data(), frame.size(), error));
    close_end(0);

    std::vector<uint8_t> got;
    EXPECT_EQ(RecvStatus::Error, framed_recv(fds_[1], got, 1024, error));
}

TEST_F(SocketPair, TruncatedHeaderIsAnError) {
    uint8_t partial[3] = { 1, 0, 0 };
    std::string error;
    ASSERT_TRUE(write_all(fds_[0], partial, sizeof(partial), error));
    close_end(0);

    std::vector<uint8_t> got;
    EXPECT_EQ(RecvStatus::Error, framed_recv(fds_[1], got, 1024, error));
}

TEST(Framing, HeaderIsLittleEndianLength) {
    std::vector<uint8_t> frame = frame_payload(std::vector<uint8_t>(0x0102, 0));
    ASSERT_EQ(FRAME_HEADER_SIZE + 0x0102, frame.size());
    EXPECT_EQ(0x02, frame[0]);
    EXPECT_EQ(0x01, frame[1]);
    for (size_t i = 2; i < FRAME_HEADER_SIZE; ++i) EXPECT_EQ(0, frame[i]);
}

// ============================================================================
// Messages
// ============================================================================

TEST(Codec, JobFieldsSurviveEncoding) {
    PrepJob job;
    job.code = std::vector<uint8_t>(5, 0x42);
    job.executor_params = std::vector<uint8_t>(2, 0x01);
    job.prep_timeout = std::chrono::milliseconds(60000);
    job.kind = JobKind::Prechecking;
    job.memory_limit = 2LL * 1024 * 1024 * 1024;

    PrepJob decoded;
    std::string error;
    ASSERT_TRUE(decode_job(encode_job(job), decoded, error)) << error;
    EXPECT_EQ(job.code, decoded.code);
    EXPECT_EQ(job.executor_params, decoded.executor_params);
    EXPECT_EQ(job.prep_timeout, decoded.prep_timeout);
    EXPECT_EQ(JobKind::Prechecking, decoded.kind);
    ASSERT_TRUE(decoded.memory_limit.has_value());
    EXPECT_EQ(*job.memory_limit, *decoded.memory_limit);
}

TEST(Codec, JobWithoutMemoryLimit) {
    PrepJob job;
    job.code = std::vector<uint8_t>(1, 0);
    PrepJob decoded;
    std::string error;
    ASSERT_TRUE(decode_job(encode_job(job), decoded, error)) << error;
    EXPECT_FALSE(decoded.memory_limit.has_value());
}

TEST(Codec, GarbageJobIsRejected) {
    std::vector<uint8_t> garbage;
    garbage.push_back(0xff);
    garbage.push_back(0x13);
    garbage.push_back(0x37);
    PrepJob job;
    std::string error;
    EXPECT_FALSE(decode_job(garbage, job, error));
    EXPECT_FALSE(error.empty());
}

TEST(Codec, JobWithUnknownKindIsRejected) {
    Json j = Json::object();
    j["code"] = Json::binary(std::vector<uint8_t>(1, 0));
    j["executor_params"] = Json::binary(std::vector<uint8_t>());
    j["prep_timeout_ms"] = 1000u;
    j["kind"] = 9u;
    j["memory_limit"] = nullptr;

    PrepJob job;
    std::string error;
    EXPECT_FALSE(decode_job(Json::to_cbor(j), job, error));
    EXPECT_NE(std::string::npos, error.find("kind"));
}

namespace {

Json job_fields(uint64_t timeout_ms) {
    Json j = Json::object();
    j["code"] = Json::binary(std::vector<uint8_t>(1, 0));
    j["executor_params"] = Json::binary(std::vector<uint8_t>());
    j["prep_timeout_ms"] = timeout_ms;
    j["kind"] = 0u;
    j["memory_limit"] = nullptr;
    return j;
}

} // namespace

TEST(Codec, TimeoutBeyondClockRangeIsRejected) {
    PrepJob job;
    std::string error;
    EXPECT_FALSE(decode_job(Json::to_cbor(job_fields(std::numeric_limits<uint64_t>::max())), job, error));
    EXPECT_NE(std::string::npos, error.find("prep_timeout_ms"));

    error.clear();
    EXPECT_FALSE(decode_job(Json::to_cbor(job_fields(1ULL << 62)), job, error));
    EXPECT_NE(std::string::npos, error.find("prep_timeout_ms"));
}

TEST(Codec, LongestRepresentableTimeoutIsAccepted) {
    std::chrono::milliseconds longest =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max());
    PrepJob job;
    std::string error;
    ASSERT_TRUE(decode_job(Json::to_cbor(job_fields(static_cast<uint64_t>(longest.count()))), job, error))
        << error;
    EXPECT_EQ(longest, job.prep_timeout);

    EXPECT_FALSE(decode_job(Json::to_cbor(job_fields(static_cast<uint64_t>(longest.count()) + 1)), job, error));
}

TEST(Codec, MemoryLimitBeyondSignedRangeIsRejected) {
    Json j = job_fields(1000);
    j["memory_limit"] = std::numeric_limits<uint64_t>::max();
    PrepJob job;
    std::string error;
    EXPECT_FALSE(decode_job(Json::to_cbor(j), job, error));
    EXPECT_NE(std::string::npos, error.find("memory_limit"));
}

TEST(Codec, SuccessOutcomeCarriesStats) {
    PrepareStats stats;
    stats.cpu_time_elapsed = std::chrono::nanoseconds(123456789);
    MemoryAllocationStats tracker;
    tracker.resident = 4096;
    tracker.allocated = 1024;
    stats.memory_stats.memory_tracker_stats = tracker;
    stats.memory_stats.peak_tracked_alloc = 2048;

    PrepareOutcome decoded;
    std::string error;
    ASSERT_TRUE(decode_outcome(encode_outcome(PrepareOutcome::ok(stats, "abcd")), decoded, error)) << error;
    ASSERT_TRUE(decoded.success);
    EXPECT_EQ(stats.cpu_time_elapsed, decoded.stats.cpu_time_elapsed);
    ASSERT_TRUE(decoded.stats.memory_stats.memory_tracker_stats.has_value());
    EXPECT_EQ(4096u, decoded.stats.memory_stats.memory_tracker_stats->resident);
    EXPECT_EQ(1024u, decoded.stats.memory_stats.memory_tracker_stats->allocated);
    EXPECT_FALSE(decoded.stats.memory_stats.max_rss.has_value());
    EXPECT_EQ(2048u, decoded.stats.memory_stats.peak_tracked_alloc);
    EXPECT_EQ("abcd", decoded.artifact_checksum);
}

TEST(Codec, ErrorOutcomeKeepsKindAndDetail) {
    PrepareOutcome decoded;
    std::string error;
    ASSERT_TRUE(decode_outcome(encode_outcome(PrepareOutcome::fail(PrepareError::preparation("bad opcode"))),
                               decoded, error)) << error;
    EXPECT_FALSE(decoded.success);
    EXPECT_EQ(PrepareErrorKind::Preparation, decoded.error.kind);
    EXPECT_EQ("bad opcode", decoded.error.detail);
    EXPECT_EQ("Preparation: bad opcode", decoded.error.to_string());
}

TEST(Codec, OutcomeWithUnknownErrorKindIsRejected) {
    Json err = Json::object();
    err["kind"] = 77u;
    err["detail"] = "";
    Json j = Json::object();
    j["err"] = err;

    PrepareOutcome decoded;
    std::string error;
    EXPECT_FALSE(decode_outcome(Json::to_cbor(j), decoded, error));
}

TEST(Codec, HandshakeCarriesSecurityStatus) {
    WorkerHandshake hs;
    hs.security_status.can_enable_landlock = true;
    hs.security_status.can_enable_seccomp = false;
    hs.security_status.can_unshare_user_namespace_and_change_root = true;

    WorkerHandshake decoded;
    std::string error;
    ASSERT_TRUE(decode_handshake(encode_handshake(hs), decoded, error)) << error;
    EXPECT_TRUE(decoded.security_status.can_enable_landlock);
    EXPECT_FALSE(decoded.security_status.can_enable_seccomp);
    EXPECT_TRUE(decoded.security_status.can_unshare_user_namespace_and_change_root);
}
