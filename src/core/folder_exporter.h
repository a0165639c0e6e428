#ifndef FOLDER_EXPORTER_H
#define FOLDER_EXPORTER_H

#include "cancellation.h"
#include "export_request.h"
#include "export_result.h"
#include "presentation.h"
#include "presentation_exporter.h"
#include "task_pool.h"
#include <filesystem>
#include <string>
#include <vector>

// What to export in one tree run. Containers are walked recursively;
// presentation_ids and presentations are extra roots exported as given.
struct FolderExportSpec {
    bool include_root = false;                 // walk the source's "root" container
    std::vector<std::string> folder_ids;
    std::vector<std::string> presentation_ids;
    std::vector<Presentation> presentations;   // explicit compositions
    std::filesystem::path output_root;
    int max_depth = 10;                        // containers below this depth are reported, not walked
};

struct TreeExportResult {
    std::vector<ExportResult> presentations;   // in discovery order
    std::vector<ExportError> errors;           // traversal errors and presentations that could not be exported

    // No traversal error and every presentation succeeded
    bool success() const;
    size_t artifactCount() const;
    // Every error, traversal and per-presentation, in order
    std::vector<ExportError> allErrors() const;
};

// Resolves container hierarchies and fans presentations out to a PresentationExporter
class FolderExporter {
public:
    // presentationWorkers == 0 uses the hardware concurrency
    FolderExporter(PresentationExporter& exporter, size_t presentationWorkers);

    FolderExporter(const FolderExporter&) = delete;
    FolderExporter& operator=(const FolderExporter&) = delete;

    // Throws InvalidRequestError for request-level problems (no formats, invalid
    // options, no output root) before any call reaches the source.
    TreeExportResult exportTree(
        const FolderExportSpec& spec,
        const std::vector<ExportFormat>& formats,
        const RenderOptions& options,
        const CancellationToken* cancel = nullptr
    );

private:
    PresentationExporter& exporter_;
    TaskPool presentationPool_;
};

#endif // FOLDER_EXPORTER_H
