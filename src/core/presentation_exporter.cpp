#include "presentation_exporter.h"
#include "frame_encoder.h"
#include "options_key.h"
#include "output_layout.h"
#include "renderer.h"
#include "sequence_assembler.h"
#include "../utils/logging.h"
#include <algorithm>
#include <atomic>
#include <future>
#include <map>

namespace {

// Slide fetch outcome, indexed like the presentation's slide list
struct FetchedSlide {
    bool ok = false;
    Slide slide;
    std::optional<ExportError> error;
};

// Everything produced from one slide on the render pool
struct SlideOutput {
    std::vector<Artifact> artifacts;
    std::vector<ExportError> errors;
    sk_sp<SkImage> video_frame;
};

std::string slideItem(const SlideRef& ref) {
    return "slide " + ref.presentation_id + "/" + ref.slide_id;
}

ExportError makeError(ErrorKind kind, const std::string& item, const std::string& message,
                      std::optional<ExportFormat> format = std::nullopt, int slideIndex = -1) {
    ExportError error;
    error.kind = kind;
    error.item = item;
    error.message = message;
    error.format = format;
    error.slide_index = slideIndex;
    return error;
}

// Write bytes under their final name and describe the result.
// Returns false and fills error on failure.
bool writeArtifact(const std::filesystem::path& path, ExportFormat format, int slideIndex,
                   const sk_sp<SkData>& data, Artifact& artifact, std::string& error) {
    if (!writeFileAtomic(path, data->data(), data->size(), error)) {
        return false;
    }
    CachedArtifact described;
    if (!describeArtifactFile(path, slideIndex, described)) {
        error = "cannot read back " + path.string();
        return false;
    }
    artifact.format = format;
    artifact.slide_index = slideIndex;
    artifact.path = path;
    artifact.checksum = described.checksum;
    artifact.last_write_time = described.last_write_time;
    artifact.from_cache = false;
    return true;
}

Artifact artifactFromCache(ExportFormat format, const CachedArtifact& cached) {
    Artifact artifact;
    artifact.format = format;
    artifact.slide_index = cached.slide_index;
    artifact.path = cached.path;
    artifact.checksum = cached.checksum;
    artifact.last_write_time = cached.last_write_time;
    artifact.from_cache = true;
    return artifact;
}

CachedArtifact cachedFromArtifact(const Artifact& artifact) {
    CachedArtifact cached;
    cached.slide_index = artifact.slide_index;
    cached.path = artifact.path;
    cached.checksum = artifact.checksum;
    cached.last_write_time = artifact.last_write_time;
    return cached;
}

bool contains(const std::vector<ExportFormat>& formats, ExportFormat format) {
    return std::find(formats.begin(), formats.end(), format) != formats.end();
}

// Render (once per distinct size), transcode and write the per-slide formats of one slide
SlideOutput processSlide(
    const Slide& slide,
    const ExportRequest& request,
    const std::vector<ExportFormat>& slideFormats,
    std::optional<PixelSize> videoTarget,
    const CancellationToken* cancel
) {
    SlideOutput output;
    const std::string item = slideItem(slide.ref);
    if (cancel && cancel->isCancelled()) {
        output.errors.push_back(makeError(ErrorKind::kCancelled, item, "cancelled before rendering",
                                          std::nullopt, slide.index));
        return output;
    }

    const RenderOptions& options = request.options;
    std::map<PixelSize, RenderResult> renders;
    auto renderAt = [&](PixelSize size) -> const RenderResult& {
        auto it = renders.find(size);
        if (it == renders.end()) {
            RenderResult rendered = renderSlide(slide.document, size.width, size.height, options.fill_color);
            if (!rendered.success()) {
                output.errors.push_back(makeError(ErrorKind::kRenderError, item, rendered.error,
                                                  std::nullopt, slide.index));
            }
            it = renders.emplace(size, std::move(rendered)).first;
        }
        return it->second;
    };

    for (ExportFormat format : slideFormats) {
        EncodedArtifact encoded;
        if (format == ExportFormat::kSvg) {
            encoded = encodeSvg(slide.document);
            if (!encoded.success()) {
                output.errors.push_back(makeError(encoded.error_kind, item, encoded.error, format, slide.index));
                continue;
            }
        } else {
            PixelSize size = stillSize(options, slide.document.width, slide.document.height);
            const RenderResult& rendered = renderAt(size);
            if (!rendered.success()) {
                continue;   // reported once per size by renderAt
            }
            encoded = encodeRaster(rendered.image, format, options);
            if (!encoded.success()) {
                output.errors.push_back(makeError(encoded.error_kind, item, encoded.error, format, slide.index));
                continue;
            }
        }

        auto path = slideArtifactPath(request.output_root, request.presentation, slide.index, format, options.naming);
        Artifact artifact;
        std::string error;
        if (!writeArtifact(path, format, slide.index, encoded.data, artifact, error)) {
            output.errors.push_back(makeError(ErrorKind::kIoError, item, error, format, slide.index));
            continue;
        }
        output.artifacts.push_back(std::move(artifact));
    }

    if (videoTarget) {
        const RenderResult& rendered = renderAt(*videoTarget);
        if (rendered.success()) {
            output.video_frame = rendered.image;
        }
    }
    return output;
}

} // namespace

PresentationLookup resolvePresentation(
    RemoteSource& source,
    const std::string& presentationId,
    const std::vector<std::string>& parentPath,
    const RetryPolicy& retry,
    const CallContext& ctx,
    const std::string& nameOverride
) {
    PresentationLookup lookup;
    PresentationDescription description = callWithRetry(retry, ctx.cancel, [&]() {
        return source.describePresentation(presentationId, ctx);
    });
    if (!description.ok()) {
        lookup.error = makeError(errorKindForStatus(description.status), "presentation " + presentationId,
                                 description.message);
        return lookup;
    }

    std::vector<SlideRef> slides;
    slides.reserve(description.slide_ids.size());
    for (const auto& slideId : description.slide_ids) {
        SlideRef ref;
        ref.presentation_id = presentationId;
        ref.slide_id = slideId;
        slides.push_back(std::move(ref));
    }
    std::string name = nameOverride.empty() ? description.name : nameOverride;
    lookup.presentation = Presentation::sourced(presentationId, name, parentPath, std::move(slides),
                                                std::move(description.metadata));
    return lookup;
}

PresentationExporter::PresentationExporter(RemoteSource& source, CacheStore& cache, const ExporterConfig& config)
    : source_(source),
      cache_(cache),
      config_(config),
      fetchPool_("fetch", config.fetch_workers),
      renderPool_("render", config.render_workers) {}

CallContext PresentationExporter::callContext(const CancellationToken* cancel) const {
    CallContext ctx;
    ctx.timeout = config_.call_timeout;
    ctx.cancel = cancel;
    return ctx;
}

ExportResult PresentationExporter::exportPresentation(const ExportRequest& request, const CancellationToken* cancel) {
    // Throws InvalidRequestError before anything touches the source
    const std::string optionsKey = computeOptionsKey(request);
    const std::vector<ExportFormat> formats = normalizeFormats(request.formats);
    const Presentation& presentation = request.presentation;

    ExportResult result;
    result.presentation_id = presentation.id();
    result.presentation_name = presentation.displayName();
    result.options_key = optionsKey;

    // Serve what the cache still vouches for
    std::map<ExportFormat, std::string> formatKeys;
    std::vector<ExportFormat> missing;
    for (ExportFormat format : formats) {
        std::string key = computeFormatKey(request, format);
        formatKeys[format] = key;
        std::optional<CacheEntry> entry = cache_.get(key);
        if (entry) {
            std::string reason;
            if (verifyCacheEntry(*entry, reason)) {
                for (const auto& cached : entry->artifacts) {
                    result.artifacts.push_back(artifactFromCache(format, cached));
                }
                LOG_DEBUG("Cache hit for " << presentation.id() << " " << formatName(format) << " (" << key << ")");
                continue;
            }
            LOG_CERR("[WARNING] Cached " << formatName(format) << " for " << presentation.id()
                     << " is stale: " << reason);
            cache_.invalidate(key);
        }
        missing.push_back(format);
    }
    if (missing.empty()) {
        LOG_COUT("[INFO] " << presentation.displayName() << ": all " << formats.size() << " format(s) served from cache");
        return result;
    }
    if (cancel && cancel->isCancelled()) {
        result.errors.push_back(makeError(ErrorKind::kCancelled, "presentation " + presentation.id(),
                                          "cancelled before export"));
        return result;
    }

    // Fetch every slide in parallel; results keep declared slide order
    const auto& refs = presentation.slides();
    const std::vector<double> durations = effectiveDurations(presentation, request.options);
    const CallContext ctx = callContext(cancel);
    std::atomic<int> fetchCalls{0};

    std::vector<std::future<FetchedSlide>> fetchFutures;
    fetchFutures.reserve(refs.size());
    for (size_t i = 0; i < refs.size(); ++i) {
        fetchFutures.push_back(fetchPool_.enqueue([this, &refs, &durations, &ctx, &fetchCalls, i]() {
            FetchedSlide fetched;
            const SlideRef& ref = refs[i];
            int attempts = 0;
            SlideFetch fetch = callWithRetry(config_.retry, ctx.cancel, [&]() {
                return source_.fetchSlideVector(ref.presentation_id, ref.slide_id, ctx);
            }, &attempts);
            fetchCalls += attempts;
            if (!fetch.ok()) {
                fetched.error = makeError(errorKindForStatus(fetch.status), slideItem(ref), fetch.message,
                                          std::nullopt, static_cast<int>(i));
                return fetched;
            }
            fetched.ok = true;
            fetched.slide.index = static_cast<int>(i);
            fetched.slide.ref = ref;
            fetched.slide.duration_secs = durations[i];
            fetched.slide.document = std::move(fetch.document);
            return fetched;
        }));
    }

    std::vector<FetchedSlide> fetched(refs.size());
    for (size_t i = 0; i < fetchFutures.size(); ++i) {
        try {
            fetched[i] = fetchFutures[i].get();
        } catch (const std::exception& e) {
            fetched[i].error = makeError(ErrorKind::kTransient, slideItem(refs[i]),
                                         std::string("fetch failed: ") + e.what(), std::nullopt, static_cast<int>(i));
        }
        if (fetched[i].error) {
            result.errors.push_back(*fetched[i].error);
        }
    }
    result.remote_fetches = fetchCalls.load();
    const bool allFetched = std::all_of(fetched.begin(), fetched.end(), [](const FetchedSlide& f) { return f.ok; });
    LOG_DEBUG("Fetched " << std::count_if(fetched.begin(), fetched.end(), [](const FetchedSlide& f) { return f.ok; })
              << "/" << refs.size() << " slides of " << presentation.id() << " in " << result.remote_fetches << " call(s)");

    std::vector<ExportFormat> slideFormats;
    for (ExportFormat format : missing) {
        if (format == ExportFormat::kSvg || isRasterFormat(format)) {
            slideFormats.push_back(format);
        }
    }
    const bool wantVideo = contains(missing, ExportFormat::kMp4);

    // All video frames share one size, taken from the first slide when it is derived
    std::optional<PixelSize> videoTarget;
    if (wantVideo) {
        for (const auto& f : fetched) {
            if (f.ok) {
                videoTarget = videoSize(request.options, f.slide.document.width, f.slide.document.height);
                break;
            }
        }
    }

    // Render, transcode and write on the render pool
    std::vector<std::future<SlideOutput>> renderFutures(fetched.size());
    for (size_t i = 0; i < fetched.size(); ++i) {
        if (!fetched[i].ok) {
            continue;
        }
        renderFutures[i] = renderPool_.enqueue([&request, &slideFormats, &fetched, videoTarget, cancel, i]() {
            return processSlide(fetched[i].slide, request, slideFormats, videoTarget, cancel);
        });
    }

    std::vector<SequenceFrame> videoFrames;
    bool videoComplete = wantVideo && allFetched && !refs.empty();
    for (size_t i = 0; i < renderFutures.size(); ++i) {
        if (!renderFutures[i].valid()) {
            continue;
        }
        SlideOutput output;
        try {
            output = renderFutures[i].get();
        } catch (const std::exception& e) {
            output.errors.push_back(makeError(ErrorKind::kRenderError, slideItem(refs[i]),
                                              std::string("render failed: ") + e.what(), std::nullopt,
                                              static_cast<int>(i)));
        }
        for (auto& artifact : output.artifacts) {
            result.artifacts.push_back(std::move(artifact));
        }
        for (auto& error : output.errors) {
            result.errors.push_back(std::move(error));
        }
        if (wantVideo) {
            if (output.video_frame) {
                SequenceFrame frame;
                frame.slide_index = static_cast<int>(i);
                frame.duration_secs = fetched[i].slide.duration_secs;
                frame.image = output.video_frame;
                videoFrames.push_back(std::move(frame));
            } else {
                videoComplete = false;
            }
        }
    }

    // Presentation-level formats need every slide
    std::vector<Slide> slides;
    if (allFetched) {
        for (auto& f : fetched) {
            slides.push_back(std::move(f.slide));
        }
    }
    const std::string presentationItem = "presentation " + presentation.id();

    if (contains(missing, ExportFormat::kJson)) {
        if (!allFetched) {
            result.errors.push_back(makeError(ErrorKind::kRenderError, presentationItem,
                                              "metadata skipped because some slides could not be fetched",
                                              ExportFormat::kJson));
        } else {
            EncodedArtifact encoded = encodeMetadata(presentation, slides);
            auto path = presentationArtifactPath(request.output_root, presentation, ExportFormat::kJson);
            Artifact artifact;
            std::string error;
            if (!encoded.success()) {
                result.errors.push_back(makeError(encoded.error_kind, presentationItem, encoded.error, ExportFormat::kJson));
            } else if (!writeArtifact(path, ExportFormat::kJson, -1, encoded.data, artifact, error)) {
                result.errors.push_back(makeError(ErrorKind::kIoError, presentationItem, error, ExportFormat::kJson));
            } else {
                result.artifacts.push_back(std::move(artifact));
            }
        }
    }

    if (wantVideo) {
        if (cancel && cancel->isCancelled()) {
            result.errors.push_back(makeError(ErrorKind::kCancelled, presentationItem,
                                              "cancelled before video assembly", ExportFormat::kMp4));
        } else if (!videoComplete) {
            result.errors.push_back(makeError(ErrorKind::kAssemblyError, presentationItem,
                                              refs.empty() ? "presentation has no slides"
                                                           : "video skipped because some slides are missing",
                                              ExportFormat::kMp4));
        } else {
            auto finalPath = presentationArtifactPath(request.output_root, presentation, ExportFormat::kMp4);
            auto tempPath = temporaryPathFor(finalPath);
            std::string error;
            std::error_code ec;
            std::filesystem::create_directories(finalPath.parent_path(), ec);
            if (ec) {
                result.errors.push_back(makeError(ErrorKind::kIoError, presentationItem,
                                                  "cannot create " + finalPath.parent_path().string() + ": " + ec.message(),
                                                  ExportFormat::kMp4));
            } else {
                AssemblyResult assembled = assembleVideo(std::move(videoFrames), request.options, tempPath);
                Artifact artifact;
                CachedArtifact described;
                if (!assembled.success()) {
                    removeQuietly(tempPath);
                    result.errors.push_back(makeError(ErrorKind::kAssemblyError, presentationItem, assembled.error,
                                                      ExportFormat::kMp4));
                } else if (!commitTemporaryFile(tempPath, finalPath, error)) {
                    result.errors.push_back(makeError(ErrorKind::kIoError, presentationItem, error, ExportFormat::kMp4));
                } else if (!describeArtifactFile(finalPath, -1, described)) {
                    result.errors.push_back(makeError(ErrorKind::kIoError, presentationItem,
                                                      "cannot read back " + finalPath.string(), ExportFormat::kMp4));
                } else {
                    artifact.format = ExportFormat::kMp4;
                    artifact.slide_index = -1;
                    artifact.path = finalPath;
                    artifact.checksum = described.checksum;
                    artifact.last_write_time = described.last_write_time;
                    result.artifacts.push_back(std::move(artifact));
                    LOG_DEBUG("Video for " << presentation.id() << ": " << assembled.frame_count << " frames ("
                              << assembled.codec << ")");
                }
            }
        }
    }

    if (cancel && cancel->isCancelled() && !result.hasError(ErrorKind::kCancelled)) {
        result.errors.push_back(makeError(ErrorKind::kCancelled, presentationItem, "export cancelled"));
    }

    // Record a format only when every one of its artifacts was written
    const bool cancelled = cancel && cancel->isCancelled();
    for (ExportFormat format : missing) {
        std::vector<Artifact> written = result.artifactsFor(format);
        size_t expected = (format == ExportFormat::kJson || format == ExportFormat::kMp4) ? 1 : refs.size();
        bool failed = std::any_of(result.errors.begin(), result.errors.end(), [format](const ExportError& e) {
            return e.format == format;
        });
        if (cancelled || failed || expected == 0 || written.size() != expected) {
            continue;
        }
        CacheEntry entry;
        entry.key = formatKeys[format];
        entry.format = format;
        entry.presentation_id = presentation.id();
        for (const auto& artifact : written) {
            entry.artifacts.push_back(cachedFromArtifact(artifact));
        }
        cache_.put(entry);
    }

    std::stable_sort(result.artifacts.begin(), result.artifacts.end(), [](const Artifact& a, const Artifact& b) {
        if (a.format != b.format) return a.format < b.format;
        return a.slide_index < b.slide_index;
    });

    if (result.success()) {
        LOG_COUT("[INFO] Exported " << presentation.displayName() << ": " << result.artifacts.size()
                 << " artifact(s), " << result.remote_fetches << " slide fetch(es)");
    } else {
        LOG_CERR("[WARNING] Exported " << presentation.displayName() << " with " << result.errors.size()
                 << " error(s)");
    }
    return result;
}
