#include "output_layout.h"
#include "../utils/string_utils.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

fs::path presentationDirectory(const fs::path& root, const Presentation& presentation) {
    fs::path dir = root;
    for (const auto& component : presentation.parentPath()) {
        dir /= sanitizePathComponent(component);
    }
    dir /= sanitizePathComponent(presentation.displayName());
    return dir;
}

fs::path slideArtifactPath(
    const fs::path& root,
    const Presentation& presentation,
    int slideIndex,
    ExportFormat format,
    NamingScheme naming
) {
    std::string filename;
    if (naming == NamingScheme::kNamed) {
        char number[16];
        snprintf(number, sizeof(number), "%02d", slideIndex);
        std::string slideId;
        if (slideIndex >= 0 && static_cast<size_t>(slideIndex) < presentation.slides().size()) {
            slideId = presentation.slides()[slideIndex].slide_id;
        }
        filename = sanitizePathComponent(presentation.displayName() + "_slide_" + number + "_" + slideId);
    } else {
        filename = std::to_string(slideIndex);
    }
    filename += ".";
    filename += formatExtension(format);
    return presentationDirectory(root, presentation) / filename;
}

fs::path presentationArtifactPath(const fs::path& root, const Presentation& presentation, ExportFormat format) {
    std::string filename = sanitizePathComponent(presentation.displayName());
    filename += ".";
    filename += formatExtension(format);
    return presentationDirectory(root, presentation) / filename;
}

fs::path temporaryPathFor(const fs::path& finalPath) {
    static std::atomic<unsigned long> counter{0};
    std::string suffix = ".tmp-" + std::to_string(::getpid()) + "-" + std::to_string(counter.fetch_add(1));
    fs::path temp = finalPath;
    temp += suffix;
    return temp;
}

void removeQuietly(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

bool commitTemporaryFile(const fs::path& tempPath, const fs::path& finalPath, std::string& error) {
    std::error_code ec;
    if (finalPath.has_parent_path()) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            error = "cannot create directory " + finalPath.parent_path().string() + ": " + ec.message();
            removeQuietly(tempPath);
            return false;
        }
    }
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        error = "cannot rename " + tempPath.string() + " to " + finalPath.string() + ": " + ec.message();
        removeQuietly(tempPath);
        return false;
    }
    return true;
}

bool writeFileAtomic(const fs::path& path, const void* data, size_t size, std::string& error) {
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            error = "cannot create directory " + path.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    fs::path temp = temporaryPathFor(path);
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            error = "cannot open " + temp.string() + " for writing";
            return false;
        }
        out.write(static_cast<const char*>(data), static_cast<std::streamsize>(size));
        out.flush();
        if (!out.good()) {
            error = "failed to write " + temp.string();
            out.close();
            removeQuietly(temp);
            return false;
        }
    }
    return commitTemporaryFile(temp, path, error);
}

int64_t fileTimestamp(const fs::path& path) {
    std::error_code ec;
    auto time = fs::last_write_time(path, ec);
    if (ec) {
        return 0;
    }
    return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}
