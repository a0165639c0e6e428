#include "folder_exporter.h"
#include "output_layout.h"
#include "../utils/logging.h"
#include "../utils/string_utils.h"
#include <future>
#include <map>
#include <optional>
#include <set>
#include <utility>

namespace {

// A presentation found while walking, with the names of the containers above it
struct DiscoveredPresentation {
    std::string id;
    std::vector<std::string> parent_path;
};

std::string joinPath(const std::vector<std::string>& names) {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) joined += "/";
        joined += name;
    }
    return joined;
}

ExportError traversalError(ErrorKind kind, const std::string& item, const std::string& message) {
    ExportError error;
    error.kind = kind;
    error.item = item;
    error.message = message;
    return error;
}

// Depth-first walk over one export run. Listings are fetched once per
// container id for the lifetime of the walker.
class TreeWalker {
public:
    TreeWalker(RemoteSource& source, const RetryPolicy& retry, const CallContext& ctx, int maxDepth)
        : source_(source), retry_(retry), ctx_(ctx), maxDepth_(maxDepth) {}

    void walkRoot(const std::string& containerId) {
        std::set<std::string> ancestors;
        const ContainerListing* listing = list(containerId);
        if (!listing) {
            return;
        }
        // The root sentinel has no directory of its own
        std::vector<std::string> path;
        if (containerId != kRootContainerId) {
            path.push_back(listing->name.empty() ? containerId : listing->name);
        }
        visit(containerId, *listing, ancestors, path, 0);
    }

    std::vector<DiscoveredPresentation>& presentations() { return presentations_; }
    std::vector<ExportError>& errors() { return errors_; }

private:
    const ContainerListing* list(const std::string& containerId) {
        auto it = listings_.find(containerId);
        if (it == listings_.end()) {
            ContainerListing listing = callWithRetry(retry_, ctx_.cancel, [&]() {
                return source_.listContainer(containerId, ctx_);
            });
            it = listings_.emplace(containerId, std::move(listing)).first;
            if (!it->second.ok()) {
                errors_.push_back(traversalError(errorKindForStatus(it->second.status),
                                                 "container " + containerId, it->second.message));
            }
        }
        return it->second.ok() ? &it->second : nullptr;
    }

    void visit(const std::string& containerId, const ContainerListing& listing,
               std::set<std::string>& ancestors, const std::vector<std::string>& path, int depth) {
        ancestors.insert(containerId);

        for (const auto& presentationId : listing.presentation_ids) {
            std::string key = presentationId + "\n" + joinPath(path);
            if (seen_.insert(key).second) {
                presentations_.push_back({presentationId, path});
            }
        }

        for (const auto& childId : listing.container_ids) {
            if (ctx_.cancelled()) {
                break;
            }
            if (ancestors.count(childId) > 0) {
                errors_.push_back(traversalError(ErrorKind::kCyclicContainer, "container " + childId,
                                                 "container is its own ancestor under '" + joinPath(path) + "'"));
                continue;
            }
            if (depth + 1 > maxDepth_) {
                errors_.push_back(traversalError(ErrorKind::kInvalidRequest, "container " + childId,
                                                 "maximum folder depth " + std::to_string(maxDepth_) + " exceeded"));
                continue;
            }
            const ContainerListing* child = list(childId);
            if (!child) {
                continue;
            }
            std::vector<std::string> childPath = path;
            childPath.push_back(child->name.empty() ? childId : child->name);
            visit(childId, *child, ancestors, childPath, depth + 1);
        }

        ancestors.erase(containerId);
    }

    RemoteSource& source_;
    const RetryPolicy& retry_;
    const CallContext& ctx_;
    int maxDepth_;
    std::map<std::string, ContainerListing> listings_;
    std::set<std::string> seen_;
    std::vector<DiscoveredPresentation> presentations_;
    std::vector<ExportError> errors_;
};

// Outcome of one fanned-out lookup or export
struct FanOutResult {
    std::optional<Presentation> presentation;
    std::optional<ExportResult> result;
    std::optional<ExportError> error;
};

} // namespace

bool TreeExportResult::success() const {
    if (!errors.empty()) {
        return false;
    }
    for (const auto& p : presentations) {
        if (!p.success()) {
            return false;
        }
    }
    return true;
}

size_t TreeExportResult::artifactCount() const {
    size_t count = 0;
    for (const auto& p : presentations) {
        count += p.artifacts.size();
    }
    return count;
}

std::vector<ExportError> TreeExportResult::allErrors() const {
    std::vector<ExportError> all = errors;
    for (const auto& p : presentations) {
        all.insert(all.end(), p.errors.begin(), p.errors.end());
    }
    return all;
}

FolderExporter::FolderExporter(PresentationExporter& exporter, size_t presentationWorkers)
    : exporter_(exporter), presentationPool_("presentation", presentationWorkers) {}

TreeExportResult FolderExporter::exportTree(
    const FolderExportSpec& spec,
    const std::vector<ExportFormat>& formats,
    const RenderOptions& options,
    const CancellationToken* cancel
) {
    // Request-level validation, before any remote call
    validateRenderOptions(options);
    if (formats.empty()) {
        throw InvalidRequestError("no export formats requested");
    }
    const std::vector<ExportFormat> normalized = normalizeFormats(formats);
    if (spec.output_root.empty()) {
        throw InvalidRequestError("output root is empty");
    }
    if (!spec.include_root && spec.folder_ids.empty() && spec.presentation_ids.empty() && spec.presentations.empty()) {
        throw InvalidRequestError("nothing to export: no containers or presentations given");
    }

    TreeExportResult tree;
    const CallContext ctx = exporter_.callContext(cancel);
    const RetryPolicy& retry = exporter_.config().retry;

    TreeWalker walker(exporter_.source(), retry, ctx, spec.max_depth);
    if (spec.include_root) {
        walker.walkRoot(kRootContainerId);
    }
    for (const auto& folderId : spec.folder_ids) {
        if (trimCopy(folderId).empty()) {
            tree.errors.push_back(traversalError(ErrorKind::kInvalidRequest, "container", "empty container id"));
            continue;
        }
        walker.walkRoot(folderId);
    }
    tree.errors.insert(tree.errors.end(), walker.errors().begin(), walker.errors().end());
    std::vector<DiscoveredPresentation> discovered = std::move(walker.presentations());
    for (const auto& id : spec.presentation_ids) {
        discovered.push_back({id, {}});
    }
    LOG_DEBUG("Discovered " << discovered.size() << " presentation(s) and " << spec.presentations.size()
              << " explicit composition(s)");

    // Resolve sourced presentations concurrently; results keep discovery order
    std::vector<std::future<FanOutResult>> lookups;
    for (const auto& found : discovered) {
        lookups.push_back(presentationPool_.enqueue([this, &found, &ctx, &retry, cancel]() {
            FanOutResult out;
            if (cancel && cancel->isCancelled()) {
                out.error = traversalError(ErrorKind::kCancelled, "presentation " + found.id, "cancelled");
                return out;
            }
            PresentationLookup lookup = resolvePresentation(exporter_.source(), found.id, found.parent_path,
                                                            retry, ctx);
            if (!lookup.success()) {
                out.error = lookup.error;
                return out;
            }
            out.presentation = std::move(lookup.presentation);
            return out;
        }));
    }

    std::vector<Presentation> resolved;
    for (auto& future : lookups) {
        try {
            FanOutResult out = future.get();
            if (out.presentation) {
                resolved.push_back(std::move(*out.presentation));
            }
            if (out.error) {
                tree.errors.push_back(std::move(*out.error));
            }
        } catch (const std::exception& e) {
            tree.errors.push_back(traversalError(ErrorKind::kIoError, "presentation", e.what()));
        }
    }
    resolved.insert(resolved.end(), spec.presentations.begin(), spec.presentations.end());

    // Each output directory belongs to one presentation. A later presentation
    // with the same name and path gets its id appended; the same presentation
    // reached twice at one path is exported once.
    std::map<std::string, std::string> claimed;
    std::vector<Presentation> toExport;
    for (auto& presentation : resolved) {
        std::string dir = presentationDirectory(spec.output_root, presentation).lexically_normal().string();
        auto it = claimed.find(dir);
        if (it != claimed.end()) {
            if (it->second == presentation.id()) {
                LOG_DEBUG("Presentation " << presentation.id() << " already queued for " << dir);
                continue;
            }
            Presentation renamed = presentation.withName(presentation.displayName() + " (" + presentation.id() + ")");
            LOG_CERR("[WARNING] " << dir << " is already used by " << it->second << ", exporting "
                     << presentation.id() << " as '" << renamed.displayName() << "'");
            presentation = std::move(renamed);
            dir = presentationDirectory(spec.output_root, presentation).lexically_normal().string();
            if (claimed.count(dir) > 0) {
                tree.errors.push_back(traversalError(ErrorKind::kInvalidRequest, "presentation " + presentation.id(),
                                                     "output directory " + dir + " is already in use"));
                continue;
            }
        }
        claimed.emplace(dir, presentation.id());
        toExport.push_back(std::move(presentation));
    }

    std::vector<std::future<FanOutResult>> futures;
    for (const auto& presentation : toExport) {
        futures.push_back(presentationPool_.enqueue([this, &presentation, &normalized, &options, &spec, cancel]() {
            FanOutResult out;
            if (cancel && cancel->isCancelled()) {
                out.error = traversalError(ErrorKind::kCancelled, "presentation " + presentation.id(), "cancelled");
                return out;
            }
            ExportRequest request;
            request.presentation = presentation;
            request.formats = normalized;
            request.options = options;
            request.output_root = spec.output_root;
            try {
                out.result = exporter_.exportPresentation(request, cancel);
            } catch (const InvalidRequestError& e) {
                out.error = traversalError(ErrorKind::kInvalidRequest, "presentation " + presentation.id(), e.what());
            }
            return out;
        }));
    }

    for (auto& future : futures) {
        try {
            FanOutResult out = future.get();
            if (out.result) {
                tree.presentations.push_back(std::move(*out.result));
            }
            if (out.error) {
                tree.errors.push_back(std::move(*out.error));
            }
        } catch (const std::exception& e) {
            tree.errors.push_back(traversalError(ErrorKind::kIoError, "presentation", e.what()));
        }
    }

    LOG_COUT("[INFO] Exported " << tree.presentations.size() << " presentation(s), "
             << tree.artifactCount() << " artifact(s), " << tree.allErrors().size() << " error(s)");
    return tree;
}
