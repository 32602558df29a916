#include <pvfworker/core/types.hpp>

namespace pvfworker {

const char* job_kind_name(JobKind kind) {
    switch (kind) {
        case JobKind::Prepare: return "prepare";
        case JobKind::Prechecking: return "prechecking";
    }
    return "unknown";
}

const char* prepare_error_kind_name(PrepareErrorKind kind) {
    switch (kind) {
        case PrepareErrorKind::Prevalidation: return "Prevalidation";
        case PrepareErrorKind::Preparation: return "Preparation";
        case PrepareErrorKind::Panic: return "Panic";
        case PrepareErrorKind::TimedOut: return "TimedOut";
        case PrepareErrorKind::IoErr: return "IoErr";
        case PrepareErrorKind::RuntimeConstruction: return "RuntimeConstruction";
        case PrepareErrorKind::OutOfMemory: return "OutOfMemory";
    }
    return "Unknown";
}

std::string PrepareError::to_string() const {
    std::string s = prepare_error_kind_name(kind);
    if (!detail.empty()) {
        s += ": ";
        s += detail;
    }
    return s;
}

} // namespace pvfworker
