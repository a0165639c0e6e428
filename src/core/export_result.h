#ifndef EXPORT_RESULT_H
#define EXPORT_RESULT_H

#include "export_format.h"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Failure categories recorded in export results
enum class ErrorKind {
    kInvalidRequest,
    kNotFound,
    kPermissionDenied,
    kTransient,
    kRenderError,
    kAssemblyError,
    kUnsupportedFormat,
    kCyclicContainer,
    kCancelled,
    kIoError,
};

const char* errorKindName(ErrorKind kind);

// Structural problem with a request; fails the whole call
class InvalidRequestError : public std::invalid_argument {
public:
    explicit InvalidRequestError(const std::string& what) : std::invalid_argument(what) {}
};

// One recorded failure. item names what failed ("slide s2", "container A", ...)
struct ExportError {
    ErrorKind kind = ErrorKind::kIoError;
    std::string item;
    std::string message;
    std::optional<ExportFormat> format;
    int slide_index = -1;
};

// One produced output file
struct Artifact {
    ExportFormat format = ExportFormat::kPng;
    int slide_index = -1;            // -1 for presentation-level artifacts (mp4, json)
    std::filesystem::path path;
    std::string checksum;            // CRC-32, 8 hex digits
    int64_t last_write_time = 0;     // nanoseconds since the filesystem clock epoch
    bool from_cache = false;
};

struct ExportResult {
    std::string presentation_id;
    std::string presentation_name;
    std::string options_key;
    std::vector<Artifact> artifacts;
    std::vector<ExportError> errors;
    int remote_fetches = 0;          // slide fetch calls issued, retries included

    bool success() const { return errors.empty(); }

    // Artifacts of one format, in slide order
    std::vector<Artifact> artifactsFor(ExportFormat format) const;
    bool hasError(ErrorKind kind) const;
};

// One-line human readable description of an error
std::string describeError(const ExportError& error);

#endif // EXPORT_RESULT_H
