#include "export_result.h"
#include <algorithm>
#include <sstream>

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kInvalidRequest:    return "InvalidRequest";
        case ErrorKind::kNotFound:          return "NotFound";
        case ErrorKind::kPermissionDenied:  return "PermissionDenied";
        case ErrorKind::kTransient:         return "Transient";
        case ErrorKind::kRenderError:       return "RenderError";
        case ErrorKind::kAssemblyError:     return "AssemblyError";
        case ErrorKind::kUnsupportedFormat: return "UnsupportedFormat";
        case ErrorKind::kCyclicContainer:   return "CyclicContainerError";
        case ErrorKind::kCancelled:         return "Cancelled";
        case ErrorKind::kIoError:           return "IoError";
    }
    return "Unknown";
}

std::vector<Artifact> ExportResult::artifactsFor(ExportFormat format) const {
    std::vector<Artifact> matching;
    for (const auto& artifact : artifacts) {
        if (artifact.format == format) {
            matching.push_back(artifact);
        }
    }
    std::stable_sort(matching.begin(), matching.end(), [](const Artifact& a, const Artifact& b) {
        return a.slide_index < b.slide_index;
    });
    return matching;
}

bool ExportResult::hasError(ErrorKind kind) const {
    return std::any_of(errors.begin(), errors.end(),
                       [kind](const ExportError& e) { return e.kind == kind; });
}

std::string describeError(const ExportError& error) {
    std::ostringstream oss;
    oss << errorKindName(error.kind);
    if (!error.item.empty()) {
        oss << " [" << error.item << "]";
    }
    if (error.format) {
        oss << " (" << formatName(*error.format) << ")";
    }
    oss << ": " << error.message;
    return oss.str();
}
