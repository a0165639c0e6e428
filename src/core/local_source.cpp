#include "local_source.h"
#include "../utils/logging.h"
#include "modules/skresources/include/SkResources.h"
#include "include/core/SkString.h"
#include <fstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace {

std::vector<std::string> readIdList(const json& j, const char* key) {
    std::vector<std::string> ids;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& item : j[key]) {
            if (item.is_string()) {
                ids.push_back(item.get<std::string>());
            }
        }
    }
    return ids;
}

// Ids become directory and file names; refuse anything that could leave the library
bool isSafeId(const std::string& id) {
    return !id.empty() && id != "." && id != ".." && id.find('/') == std::string::npos &&
           id.find('\\') == std::string::npos;
}

// Only relative paths that stay inside the presentation directory
bool isSafeRelativePath(const fs::path& path) {
    if (path.empty() || path.is_absolute()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

template<class Result>
Result failure(SourceStatus status, const std::string& message) {
    Result result;
    result.status = status;
    result.message = message;
    return result;
}

} // namespace

LocalLibrarySource::LocalLibrarySource(fs::path directory) : directory_(std::move(directory)) {}

bool LocalLibrarySource::load(std::string& error) {
    fs::path indexPath = directory_ / "library.json";
    std::ifstream f(indexPath);
    if (!f.is_open()) {
        error = "cannot open " + indexPath.string();
        return false;
    }

    try {
        json j = json::parse(f);
        containers_.clear();
        presentations_.clear();
        denied_.clear();

        if (j.contains("containers")) {
            for (auto it = j["containers"].begin(); it != j["containers"].end(); ++it) {
                ContainerRecord record;
                record.name = it.value().value("name", "");
                record.presentations = readIdList(it.value(), "presentations");
                record.containers = readIdList(it.value(), "containers");
                containers_[it.key()] = std::move(record);
            }
        }
        if (j.contains("presentations")) {
            for (auto it = j["presentations"].begin(); it != j["presentations"].end(); ++it) {
                PresentationRecord record;
                record.name = it.value().value("name", "");
                record.slides = readIdList(it.value(), "slides");
                record.metadata = it.value().contains("metadata") ? it.value()["metadata"] : json::object();
                presentations_[it.key()] = std::move(record);
            }
        }
        for (const auto& id : readIdList(j, "denied")) {
            denied_.insert(id);
        }
    } catch (const json::exception& e) {
        error = "malformed " + indexPath.string() + ": " + e.what();
        return false;
    }

    LOG_DEBUG("Library " << directory_.string() << ": " << containers_.size() << " container(s), "
              << presentations_.size() << " presentation(s)");
    return true;
}

ContainerListing LocalLibrarySource::listContainer(const std::string& containerId, const CallContext& ctx) {
    if (ctx.cancelled()) {
        return failure<ContainerListing>(SourceStatus::kCancelled, "cancelled");
    }
    if (denied_.count(containerId) > 0) {
        return failure<ContainerListing>(SourceStatus::kPermissionDenied, "access to container " + containerId + " denied");
    }
    auto it = containers_.find(containerId);
    if (it == containers_.end()) {
        return failure<ContainerListing>(SourceStatus::kNotFound, "no container " + containerId);
    }
    ContainerListing listing;
    listing.name = it->second.name;
    listing.presentation_ids = it->second.presentations;
    listing.container_ids = it->second.containers;
    return listing;
}

PresentationDescription LocalLibrarySource::describePresentation(const std::string& presentationId,
                                                                 const CallContext& ctx) {
    if (ctx.cancelled()) {
        return failure<PresentationDescription>(SourceStatus::kCancelled, "cancelled");
    }
    if (denied_.count(presentationId) > 0) {
        return failure<PresentationDescription>(SourceStatus::kPermissionDenied,
                                                "access to presentation " + presentationId + " denied");
    }
    auto it = presentations_.find(presentationId);
    if (it == presentations_.end()) {
        return failure<PresentationDescription>(SourceStatus::kNotFound, "no presentation " + presentationId);
    }
    PresentationDescription description;
    description.id = presentationId;
    description.name = it->second.name;
    description.slide_ids = it->second.slides;
    description.metadata = it->second.metadata;
    return description;
}

SlideFetch LocalLibrarySource::fetchSlideVector(const std::string& presentationId, const std::string& slideId,
                                                const CallContext& ctx) {
    if (ctx.cancelled()) {
        return failure<SlideFetch>(SourceStatus::kCancelled, "cancelled");
    }
    if (denied_.count(presentationId) > 0) {
        return failure<SlideFetch>(SourceStatus::kPermissionDenied,
                                   "access to presentation " + presentationId + " denied");
    }
    if (!isSafeId(presentationId) || !isSafeId(slideId)) {
        return failure<SlideFetch>(SourceStatus::kNotFound, "invalid slide id " + presentationId + "/" + slideId);
    }

    fs::path presentationDir = directory_ / presentationId;
    fs::path slidePath = presentationDir / (slideId + ".json");
    std::ifstream f(slidePath);
    if (!f.is_open()) {
        return failure<SlideFetch>(SourceStatus::kNotFound, "no slide file " + slidePath.string());
    }

    json j;
    try {
        j = json::parse(f);
    } catch (const json::exception& e) {
        return failure<SlideFetch>(SourceStatus::kMalformed, slidePath.string() + ": " + e.what());
    }

    auto provider = skresources::FileResourceProvider::Make(SkString(presentationDir.string().c_str()),
                                                            skresources::ImageDecodeStrategy::kLazyDecode);
    ImageResolver resolveImage = [&provider, &presentationDir](const std::string& src) -> sk_sp<SkData> {
        fs::path relative(src);
        if (!provider || !isSafeRelativePath(relative)) {
            LOG_DEBUG("Refusing image path " << src << " outside " << presentationDir.string());
            return nullptr;
        }
        std::string folder = relative.has_parent_path() ? relative.parent_path().string() : ".";
        return provider->load(folder.c_str(), relative.filename().string().c_str());
    };

    DocumentParseResult parsed = parseVectorDocument(j, resolveImage);
    if (!parsed.success()) {
        return failure<SlideFetch>(SourceStatus::kMalformed, slidePath.string() + ": " + parsed.error);
    }
    SlideFetch fetch;
    fetch.document = std::move(parsed.document);
    if (fetch.document.slide_id.empty()) {
        fetch.document.slide_id = slideId;
    }
    return fetch;
}
