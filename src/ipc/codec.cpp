/*
 * pvfworker C++ - Message Codec Implementation
 */
#include <pvfworker/ipc/codec.hpp>
#include <pvfworker/core/config.hpp>

#include <limits>

namespace pvfworker {

namespace {

// Longest timeout whose nanosecond count still fits the CPU clock arithmetic
const uint64_t MAX_PREP_TIMEOUT_MS = static_cast<uint64_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds::max()).count());

const Json* field(const Json& obj, const char* name) {
    if (!obj.is_object()) return nullptr;
    Json::const_iterator it = obj.find(name);
    if (it == obj.end()) return nullptr;
    return &(*it);
}

bool get_binary(const Json& obj, const char* name, std::vector<uint8_t>& out, std::string& error) {
    const Json* v = field(obj, name);
    if (!v || !v->is_binary()) {
        error = std::string("missing binary field '") + name + "'";
        return false;
    }
    const Json::binary_t& bin = v->get_binary();
    out.assign(bin.begin(), bin.end());
    return true;
}

bool get_u64(const Json& obj, const char* name, uint64_t& out, std::string& error) {
    const Json* v = field(obj, name);
    if (!v || !v->is_number_unsigned()) {
        error = std::string("missing unsigned field '") + name + "'";
        return false;
    }
    out = v->get<uint64_t>();
    return true;
}

bool get_bool(const Json& obj, const char* name, bool& out, std::string& error) {
    const Json* v = field(obj, name);
    if (!v || !v->is_boolean()) {
        error = std::string("missing boolean field '") + name + "'";
        return false;
    }
    out = v->get<bool>();
    return true;
}

bool parse_cbor(const std::vector<uint8_t>& data, Json& out, std::string& error) {
    out = Json::from_cbor(data, true, false);
    if (out.is_discarded() || !out.is_object()) {
        error = "malformed message encoding";
        return false;
    }
    return true;
}

Json encode_memory_stats(const MemoryStats& m) {
    Json j = Json::object();
    if (m.memory_tracker_stats) {
        Json t = Json::object();
        t["resident"] = m.memory_tracker_stats->resident;
        t["allocated"] = m.memory_tracker_stats->allocated;
        j["tracker"] = t;
    } else {
        j["tracker"] = nullptr;
    }
    if (m.max_rss) {
        j["max_rss"] = *m.max_rss;
    } else {
        j["max_rss"] = nullptr;
    }
    j["peak_tracked_alloc"] = m.peak_tracked_alloc;
    return j;
}

bool decode_memory_stats(const Json& j, MemoryStats& m, std::string& error) {
    const Json* tracker = field(j, "tracker");
    if (tracker && tracker->is_object()) {
        MemoryAllocationStats t;
        if (!get_u64(*tracker, "resident", t.resident, error)) return false;
        if (!get_u64(*tracker, "allocated", t.allocated, error)) return false;
        m.memory_tracker_stats = t;
    } else if (tracker && !tracker->is_null()) {
        error = "field 'tracker' has the wrong type";
        return false;
    }

    const Json* max_rss = field(j, "max_rss");
    if (max_rss && max_rss->is_number_unsigned()) {
        m.max_rss = max_rss->get<uint64_t>();
    } else if (max_rss && !max_rss->is_null()) {
        error = "field 'max_rss' has the wrong type";
        return false;
    }

    return get_u64(j, "peak_tracked_alloc", m.peak_tracked_alloc, error);
}

} // namespace

// ============================================================================
// Handshake
// ============================================================================

std::vector<uint8_t> encode_handshake(const WorkerHandshake& handshake) {
    Json status = Json::object();
    status["can_enable_landlock"] = handshake.security_status.can_enable_landlock;
    status["can_enable_seccomp"] = handshake.security_status.can_enable_seccomp;
    status["can_unshare_user_namespace_and_change_root"] =
        handshake.security_status.can_unshare_user_namespace_and_change_root;

    Json j = Json::object();
    j["security_status"] = status;
    return Json::to_cbor(j);
}

bool decode_handshake(const std::vector<uint8_t>& data, WorkerHandshake& out, std::string& error) {
    Json j;
    if (!parse_cbor(data, j, error)) return false;

    const Json* status = field(j, "security_status");
    if (!status) {
        error = "missing field 'security_status'";
        return false;
    }
    WorkerHandshake hs;
    if (!get_bool(*status, "can_enable_landlock", hs.security_status.can_enable_landlock, error)) return false;
    if (!get_bool(*status, "can_enable_seccomp", hs.security_status.can_enable_seccomp, error)) return false;
    if (!get_bool(*status, "can_unshare_user_namespace_and_change_root",
                  hs.security_status.can_unshare_user_namespace_and_change_root, error)) return false;
    out = hs;
    return true;
}

// ============================================================================
// Jobs
// ============================================================================

std::vector<uint8_t> encode_job(const PrepJob& job) {
    Json j = Json::object();
    j["code"] = Json::binary(job.code);
    j["executor_params"] = Json::binary(job.executor_params);
    j["prep_timeout_ms"] = static_cast<uint64_t>(job.prep_timeout.count() < 0 ? 0 : job.prep_timeout.count());
    j["kind"] = static_cast<uint64_t>(job.kind);
    if (job.memory_limit) {
        j["memory_limit"] = *job.memory_limit;
    } else {
        j["memory_limit"] = nullptr;
    }
    return Json::to_cbor(j);
}

bool decode_job(const std::vector<uint8_t>& data, PrepJob& out, std::string& error) {
    Json j;
    if (!parse_cbor(data, j, error)) return false;

    PrepJob job;
    if (!get_binary(j, "code", job.code, error)) return false;
    if (!get_binary(j, "executor_params", job.executor_params, error)) return false;

    uint64_t timeout_ms = 0;
    if (!get_u64(j, "prep_timeout_ms", timeout_ms, error)) return false;
    if (timeout_ms > MAX_PREP_TIMEOUT_MS) {
        error = "prep_timeout_ms " + std::to_string(timeout_ms) + " is out of range";
        return false;
    }
    job.prep_timeout = std::chrono::milliseconds(static_cast<int64_t>(timeout_ms));

    uint64_t kind = 0;
    if (!get_u64(j, "kind", kind, error)) return false;
    if (kind == static_cast<uint64_t>(JobKind::Prepare)) {
        job.kind = JobKind::Prepare;
    } else if (kind == static_cast<uint64_t>(JobKind::Prechecking)) {
        job.kind = JobKind::Prechecking;
    } else {
        error = "unknown job kind " + std::to_string(kind);
        return false;
    }

    const Json* limit = field(j, "memory_limit");
    if (limit && limit->is_number_unsigned() &&
        limit->get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        error = "field 'memory_limit' is out of range";
        return false;
    } else if (limit && limit->is_number_integer()) {
        job.memory_limit = limit->get<int64_t>();
    } else if (limit && !limit->is_null()) {
        error = "field 'memory_limit' has the wrong type";
        return false;
    }

    out = job;
    return true;
}

// ============================================================================
// Outcomes
// ============================================================================

std::vector<uint8_t> encode_outcome(const PrepareOutcome& outcome) {
    Json j = Json::object();
    if (outcome.success) {
        Json ok = Json::object();
        ok["cpu_time_ns"] = static_cast<uint64_t>(
            outcome.stats.cpu_time_elapsed.count() < 0 ? 0 : outcome.stats.cpu_time_elapsed.count());
        ok["memory_stats"] = encode_memory_stats(outcome.stats.memory_stats);
        ok["checksum"] = outcome.artifact_checksum;
        j["ok"] = ok;
    } else {
        Json err = Json::object();
        err["kind"] = static_cast<uint64_t>(outcome.error.kind);
        err["detail"] = outcome.error.detail;
        j["err"] = err;
    }
    return Json::to_cbor(j);
}

bool decode_outcome(const std::vector<uint8_t>& data, PrepareOutcome& out, std::string& error) {
    Json j;
    if (!parse_cbor(data, j, error)) return false;

    const Json* ok = field(j, "ok");
    const Json* err = field(j, "err");
    if (ok && ok->is_object()) {
        PrepareStats stats;
        uint64_t cpu_ns = 0;
        if (!get_u64(*ok, "cpu_time_ns", cpu_ns, error)) return false;
        stats.cpu_time_elapsed = std::chrono::nanoseconds(static_cast<int64_t>(cpu_ns));

        const Json* mem = field(*ok, "memory_stats");
        if (!mem || !decode_memory_stats(*mem, stats.memory_stats, error)) {
            if (error.empty()) error = "missing field 'memory_stats'";
            return false;
        }

        const Json* checksum = field(*ok, "checksum");
        if (!checksum || !checksum->is_string()) {
            error = "missing string field 'checksum'";
            return false;
        }
        out = PrepareOutcome::ok(stats, checksum->get<std::string>());
        return true;
    }

    if (err && err->is_object()) {
        uint64_t kind = 0;
        if (!get_u64(*err, "kind", kind, error)) return false;
        if (kind > static_cast<uint64_t>(PrepareErrorKind::OutOfMemory)) {
            error = "unknown error kind " + std::to_string(kind);
            return false;
        }
        const Json* detail = field(*err, "detail");
        if (!detail || !detail->is_string()) {
            error = "missing string field 'detail'";
            return false;
        }
        out = PrepareOutcome::fail(PrepareError(static_cast<PrepareErrorKind>(kind),
                                                detail->get<std::string>()));
        return true;
    }

    error = "outcome is neither 'ok' nor 'err'";
    return false;
}

} // namespace pvfworker
