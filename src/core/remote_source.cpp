#include "remote_source.h"
#include <algorithm>
#include <cmath>

const char* sourceStatusName(SourceStatus status) {
    switch (status) {
        case SourceStatus::kOk:               return "Ok";
        case SourceStatus::kNotFound:         return "NotFound";
        case SourceStatus::kPermissionDenied: return "PermissionDenied";
        case SourceStatus::kTransient:        return "Transient";
        case SourceStatus::kMalformed:        return "Malformed";
        case SourceStatus::kCancelled:        return "Cancelled";
    }
    return "Unknown";
}

ErrorKind errorKindForStatus(SourceStatus status) {
    switch (status) {
        case SourceStatus::kNotFound:         return ErrorKind::kNotFound;
        case SourceStatus::kPermissionDenied: return ErrorKind::kPermissionDenied;
        case SourceStatus::kTransient:        return ErrorKind::kTransient;
        case SourceStatus::kMalformed:        return ErrorKind::kRenderError;
        case SourceStatus::kCancelled:        return ErrorKind::kCancelled;
        case SourceStatus::kOk:               break;
    }
    return ErrorKind::kIoError;
}

std::chrono::milliseconds retryDelay(const RetryPolicy& policy, int retry) {
    double factor = std::pow(policy.multiplier < 1.0 ? 1.0 : policy.multiplier, std::max(0, retry - 1));
    double ms = static_cast<double>(policy.base_delay.count()) * factor;
    ms = std::min(ms, static_cast<double>(policy.max_delay.count()));
    return std::chrono::milliseconds(static_cast<long long>(ms));
}
