#ifndef PRESENTATION_EXPORTER_H
#define PRESENTATION_EXPORTER_H

#include "cancellation.h"
#include "export_request.h"
#include "export_result.h"
#include "presentation.h"
#include "remote_source.h"
#include "result_cache.h"
#include "task_pool.h"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

// Worker and network settings shared by every export in a run
struct ExporterConfig {
    size_t fetch_workers = 4;          // concurrent slide fetches
    size_t render_workers = 0;         // 0 = hardware concurrency
    RetryPolicy retry;
    std::chrono::milliseconds call_timeout{30000};
};

// Outcome of describing one presentation through the source
struct PresentationLookup {
    Presentation presentation;
    std::optional<ExportError> error;

    bool success() const { return !error.has_value(); }
};

// Build a sourced Presentation from describePresentation, with retries.
// A non-empty nameOverride replaces the remote title.
PresentationLookup resolvePresentation(
    RemoteSource& source,
    const std::string& presentationId,
    const std::vector<std::string>& parentPath,
    const RetryPolicy& retry,
    const CallContext& ctx,
    const std::string& nameOverride = ""
);

// Renders and transcodes one presentation into every requested format,
// serving formats from the cache where their artifacts are still intact.
class PresentationExporter {
public:
    PresentationExporter(RemoteSource& source, CacheStore& cache, const ExporterConfig& config);

    PresentationExporter(const PresentationExporter&) = delete;
    PresentationExporter& operator=(const PresentationExporter&) = delete;

    // Throws InvalidRequestError if the request does not validate.
    // Every other failure is recorded in the returned result.
    ExportResult exportPresentation(const ExportRequest& request, const CancellationToken* cancel = nullptr);

    RemoteSource& source() { return source_; }
    const ExporterConfig& config() const { return config_; }
    CallContext callContext(const CancellationToken* cancel) const;

private:
    RemoteSource& source_;
    CacheStore& cache_;
    ExporterConfig config_;
    TaskPool fetchPool_;
    TaskPool renderPool_;
};

#endif // PRESENTATION_EXPORTER_H
