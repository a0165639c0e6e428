#ifndef OUTPUT_LAYOUT_H
#define OUTPUT_LAYOUT_H

#include "export_format.h"
#include "export_request.h"
#include "presentation.h"
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

// <root>/<parent path...>/<name-or-id>, every component sanitized
std::filesystem::path presentationDirectory(const std::filesystem::path& root, const Presentation& presentation);

// Per-slide artifact: <index>.<ext> or <name>_slide_<NN>_<slide-id>.<ext>
std::filesystem::path slideArtifactPath(
    const std::filesystem::path& root,
    const Presentation& presentation,
    int slideIndex,
    ExportFormat format,
    NamingScheme naming
);

// Presentation-level artifact (mp4, json): <dir>/<name-or-id>.<ext>
std::filesystem::path presentationArtifactPath(
    const std::filesystem::path& root,
    const Presentation& presentation,
    ExportFormat format
);

// Unique sibling name used while an artifact is being written
std::filesystem::path temporaryPathFor(const std::filesystem::path& finalPath);

// Write data to a temporary sibling and rename it over path.
// Parent directories are created. Returns false and sets error on failure;
// the temporary file never outlives the call.
bool writeFileAtomic(const std::filesystem::path& path, const void* data, size_t size, std::string& error);

// Rename a finished temporary file into place (creating parent directories)
bool commitTemporaryFile(const std::filesystem::path& tempPath, const std::filesystem::path& finalPath,
                         std::string& error);

// Remove a file, ignoring errors; used for temporary files on failure paths
void removeQuietly(const std::filesystem::path& path);

// Last write time in nanoseconds since the filesystem clock epoch, 0 if unavailable
int64_t fileTimestamp(const std::filesystem::path& path);

#endif // OUTPUT_LAYOUT_H
